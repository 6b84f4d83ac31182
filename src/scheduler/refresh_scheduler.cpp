#include "scheduler/refresh_scheduler.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>

namespace vaultagent {

RefreshScheduler::RefreshScheduler(std::string role,
                                   CredentialBroker& broker,
                                   PoolCoordinator& coordinator,
                                   RefreshConfig config,
                                   std::shared_ptr<IClock> clock)
    : role_(std::move(role)),
      broker_(broker),
      coordinator_(coordinator),
      config_(config),
      clock_(std::move(clock)) {
    if (!(config_.refresh_buffer > 0.0 && config_.refresh_buffer <= 1.0)) {
        throw ConfigurationError(std::format("refresh_buffer must be in (0, 1], got {}",
            config_.refresh_buffer));
    }
    if (config_.check_interval.count() <= 0) {
        throw ConfigurationError("check_interval must be positive");
    }
    if (!clock_) {
        throw ConfigurationError("RefreshScheduler requires a clock");
    }
}

RefreshScheduler::~RefreshScheduler() {
    stop();
}

void RefreshScheduler::start() {
    if (running_.exchange(true)) return;
    stopped_.store(false);
    loop_thread_ = std::jthread([this](std::stop_token stop) {
        run_loop(std::move(stop));
    });
    utils::log::info(std::format("Refresh scheduler for '{}' started: every {}ms, buffer {}",
        role_, config_.check_interval.count(), config_.refresh_buffer));
}

void RefreshScheduler::stop() {
    stopped_.store(true);
    if (!running_.exchange(false)) return;
    if (loop_thread_.joinable()) {
        loop_thread_.request_stop();
        loop_thread_.join();
    }
    utils::log::info(std::format("Refresh scheduler for '{}' stopped", role_));
}

bool RefreshScheduler::is_due() const {
    const auto handle = coordinator_.current_handle(role_);
    if (!handle) {
        return true;
    }
    const Credential& current = handle->credential();
    if (current.lease_duration.count() == 0) {
        return false;  // non-expiring
    }
    return clock_->now() >= current.refresh_due_at(config_.refresh_buffer);
}

bool RefreshScheduler::tick() {
    if (stopped_.load() || !is_due()) {
        return false;
    }

    Credential fresh;
    {
        std::lock_guard lock(refresh_mutex_);
        // Re-check under the lock: stop() or another refresh may have won
        if (stopped_.load() || !is_due()) {
            return false;
        }

        try {
            fresh = refresh_locked();
        } catch (const std::exception& e) {
            record_failure(e.what());
            utils::log::warn(std::format("Refresh for '{}' failed, keeping current pool: {}",
                role_, e.what()));
            return false;
        }
    }
    notify_refreshed(fresh);
    return true;
}

Credential RefreshScheduler::refresh_now() {
    Credential fresh;
    {
        std::lock_guard lock(refresh_mutex_);
        try {
            fresh = refresh_locked();
        } catch (const std::exception& e) {
            record_failure(e.what());
            throw;
        }
    }
    notify_refreshed(fresh);
    return fresh;
}

bool RefreshScheduler::refresh_if_due() {
    if (!is_due()) {
        return false;
    }
    Credential fresh;
    {
        std::lock_guard lock(refresh_mutex_);
        if (!is_due()) {
            return false;
        }
        try {
            fresh = refresh_locked();
        } catch (const std::exception& e) {
            record_failure(e.what());
            throw;
        }
    }
    notify_refreshed(fresh);
    return true;
}

void RefreshScheduler::set_on_refresh(RefreshCallback callback) {
    std::lock_guard lock(callback_mutex_);
    on_refresh_ = std::move(callback);
}

RefreshStatus RefreshScheduler::status() const {
    std::lock_guard lock(status_mutex_);
    return status_;
}

void RefreshScheduler::run_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        tick();

        std::unique_lock lock(wait_mutex_);
        wake_cv_.wait_for(lock, stop, config_.check_interval, [] { return false; });
    }
}

Credential RefreshScheduler::refresh_locked() {
    Credential fresh = broker_.issue_credential(role_);
    coordinator_.adopt(role_, fresh);

    {
        std::lock_guard lock(status_mutex_);
        status_.last_success = clock_->now();
        status_.consecutive_failures = 0;
        status_.last_error.clear();
        ++status_.refresh_count;
    }
    utils::log::info(std::format("Role '{}' refreshed: lease {} for {}s",
        role_, fresh.lease_id, fresh.lease_duration.count()));
    return fresh;
}

void RefreshScheduler::notify_refreshed(const Credential& fresh) {
    RefreshCallback callback;
    {
        std::lock_guard lock(callback_mutex_);
        callback = on_refresh_;
    }
    if (!callback) return;
    try {
        callback(fresh);
    } catch (const std::exception& e) {
        utils::log::error(std::format("Refresh callback for '{}' threw: {}", role_, e.what()));
    }
}

void RefreshScheduler::record_failure(const std::string& error) {
    std::lock_guard lock(status_mutex_);
    status_.last_failure = clock_->now();
    status_.last_error = error;
    ++status_.consecutive_failures;
}

} // namespace vaultagent
