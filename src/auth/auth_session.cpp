#include "auth/auth_session.hpp"
#include "core/utils.hpp"

#include <format>

namespace vaultagent {

AuthSession::AuthSession(std::shared_ptr<ISecretStore> store,
                         AuthSessionConfig config,
                         std::shared_ptr<IClock> clock)
    : store_(std::move(store)),
      config_(std::move(config)),
      clock_(std::move(clock)) {
    if (!store_) {
        throw ConfigurationError("AuthSession requires a secret store");
    }
    if (config_.request_timeout.count() <= 0) {
        throw ConfigurationError("AuthSession request timeout must be positive");
    }
}

bool AuthSession::token_valid_locked(TimePoint now) const {
    if (state_ != AuthState::VALID) return false;
    if (lease_duration_.count() == 0) return true;
    return now < issued_at_ + lease_duration_;
}

std::string AuthSession::ensure_valid() {
    std::promise<std::string> promise;
    std::shared_future<std::string> pending;
    bool leader = false;

    {
        std::lock_guard lock(mutex_);
        if (token_valid_locked(clock_->now())) {
            return token_;
        }

        if (state_ == AuthState::REAUTHENTICATING) {
            pending = in_flight_;
        } else {
            if (state_ == AuthState::VALID) {
                utils::log::info("Auth: token lease expired, re-authenticating");
            }
            state_ = AuthState::REAUTHENTICATING;
            in_flight_ = promise.get_future().share();
            leader = true;
        }
    }

    if (!leader) {
        // Rethrows the leader's AuthenticationError
        return pending.get();
    }

    login_count_.fetch_add(1, std::memory_order_relaxed);
    auto result = StoreResult<LoginResponse>::error(StoreErrorCode::UNAVAILABLE, "login not attempted");
    try {
        result = store_->login(config_.role_id, config_.secret_id, config_.request_timeout);
    } catch (const std::exception& e) {
        // Waiters must be released and the state reset even if the store throws
        result = StoreResult<LoginResponse>::error(StoreErrorCode::UNAVAILABLE, e.what());
    }

    if (result.is_ok()) {
        auto& login = result.value();
        std::string token = login.token;
        {
            std::lock_guard lock(mutex_);
            token_ = std::move(login.token);
            issued_at_ = clock_->now();
            lease_duration_ = login.lease_duration;
            state_ = AuthState::VALID;
            in_flight_ = {};
        }
        promise.set_value(token);
        utils::log::info(std::format("Auth: authenticated, token lease {}s{}",
            login.lease_duration.count(),
            login.lease_duration.count() == 0 ? " (non-expiring)" : ""));
        return token;
    }

    const auto error = AuthenticationError(std::format("Failed to authenticate: {}", result.error_message()));
    {
        std::lock_guard lock(mutex_);
        token_.clear();
        state_ = AuthState::UNAUTHENTICATED;
        in_flight_ = {};
    }
    promise.set_exception(std::make_exception_ptr(error));
    utils::log::error(std::format("Auth: login failed ({}): {}",
        store_error_name(result.error_code()), result.error_message()));
    throw error;
}

void AuthSession::invalidate() {
    std::lock_guard lock(mutex_);
    if (state_ == AuthState::VALID) {
        state_ = AuthState::UNAUTHENTICATED;
        token_.clear();
        utils::log::info("Auth: session invalidated");
    }
}

bool AuthSession::invalidate(const std::string& rejected_token) {
    std::lock_guard lock(mutex_);
    if (state_ != AuthState::VALID || token_ != rejected_token) {
        return false;
    }
    state_ = AuthState::UNAUTHENTICATED;
    token_.clear();
    utils::log::info("Auth: token rejected by store, session invalidated");
    return true;
}

AuthState AuthSession::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

std::optional<TimePoint> AuthSession::expires_at() const {
    std::lock_guard lock(mutex_);
    if (state_ != AuthState::VALID || lease_duration_.count() == 0) {
        return std::nullopt;
    }
    return issued_at_ + lease_duration_;
}

} // namespace vaultagent
