#pragma once

#include "core/clock.hpp"
#include "store/isecret_store.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace vaultagent {

enum class AuthState {
    UNAUTHENTICATED,
    VALID,
    REAUTHENTICATING
};

inline constexpr const char* auth_state_name(AuthState state) {
    switch (state) {
        case AuthState::UNAUTHENTICATED:  return "unauthenticated";
        case AuthState::VALID:            return "valid";
        case AuthState::REAUTHENTICATING: return "reauthenticating";
    }
    return "unknown";
}

struct AuthSessionConfig {
    std::string role_id;
    std::string secret_id;
    std::chrono::milliseconds request_timeout{5000};
};

/**
 * @brief Holds the store token and re-authenticates when it lapses
 *
 * State machine:
 *   UNAUTHENTICATED --login--> VALID --expiry--> REAUTHENTICATING --ok--> VALID
 *   REAUTHENTICATING --failure--> UNAUTHENTICATED (AuthenticationError)
 *
 * At most one login is in flight. Callers arriving while it runs wait on it
 * and all receive the same token or the same AuthenticationError. Failures
 * are surfaced once per call; nothing is retried here.
 *
 * A token is valid iff state == VALID and now < issued_at + lease_duration.
 * A lease_duration of zero denotes a non-expiring token.
 */
class AuthSession {
public:
    AuthSession(std::shared_ptr<ISecretStore> store,
                AuthSessionConfig config,
                std::shared_ptr<IClock> clock = SteadyClock::shared());

    AuthSession(const AuthSession&) = delete;
    AuthSession& operator=(const AuthSession&) = delete;

    /**
     * @brief Return a valid token, logging in if needed
     * @throws AuthenticationError if the (shared) login attempt fails
     */
    [[nodiscard]] std::string ensure_valid();

    /// Force the next ensure_valid() to log in again.
    void invalidate();

    /**
     * @brief Invalidate only if rejected_token is still the current token
     * @return true if the session was invalidated
     *
     * A token rejected mid-request may already have been replaced by a
     * concurrent re-auth; invalidating then would cost an extra login.
     */
    bool invalidate(const std::string& rejected_token);

    [[nodiscard]] AuthState state() const;

    /// Expiry of the current token; nullopt if none or non-expiring.
    [[nodiscard]] std::optional<TimePoint> expires_at() const;

    /// Number of login calls sent to the store.
    [[nodiscard]] uint64_t login_count() const {
        return login_count_.load(std::memory_order_relaxed);
    }

private:
    [[nodiscard]] bool token_valid_locked(TimePoint now) const;

    std::shared_ptr<ISecretStore> store_;
    AuthSessionConfig config_;
    std::shared_ptr<IClock> clock_;

    mutable std::mutex mutex_;
    AuthState state_ = AuthState::UNAUTHENTICATED;
    std::string token_;
    TimePoint issued_at_{};
    std::chrono::seconds lease_duration_{0};
    std::shared_future<std::string> in_flight_;  // set while REAUTHENTICATING

    std::atomic<uint64_t> login_count_{0};
};

} // namespace vaultagent
