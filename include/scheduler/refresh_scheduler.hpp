#pragma once

#include "core/clock.hpp"
#include "core/types.hpp"
#include "pool/pool_coordinator.hpp"
#include "secrets/credential_broker.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

namespace vaultagent {

struct RefreshConfig {
    double refresh_buffer = 0.8;                         // fraction of the lease, in (0,1]
    std::chrono::milliseconds check_interval{60000};
};

/**
 * @brief Outcome history of a role's refreshes
 */
struct RefreshStatus {
    std::optional<TimePoint> last_success;
    std::optional<TimePoint> last_failure;
    std::string last_error;
    uint64_t consecutive_failures = 0;
    uint64_t refresh_count = 0;
};

/**
 * @brief Renews one role's credential before its lease runs out
 *
 * Each check compares the clock against issued_at + lease * refresh_buffer of
 * the credential behind the role's active pool. When due, a fresh credential
 * is issued and handed to the PoolCoordinator. Failures are recorded in
 * status() and retried on the next check; the current pool keeps serving.
 *
 * All refreshes for the role (timer, refresh_now(), refresh_if_due()) are
 * mutually exclusive. stop() lets an in-flight refresh finish, then joins.
 */
class RefreshScheduler {
public:
    using RefreshCallback = std::function<void(const Credential&)>;

    RefreshScheduler(std::string role,
                     CredentialBroker& broker,
                     PoolCoordinator& coordinator,
                     RefreshConfig config = {},
                     std::shared_ptr<IClock> clock = SteadyClock::shared());

    ~RefreshScheduler();

    RefreshScheduler(const RefreshScheduler&) = delete;
    RefreshScheduler& operator=(const RefreshScheduler&) = delete;

    /// Start the background check loop (no-op if running).
    void start();

    /// Stop the loop; no refresh is started by it afterwards.
    void stop();

    [[nodiscard]] bool is_running() const { return running_.load(); }

    /// True when the role has no pool or its credential passed the refresh point.
    [[nodiscard]] bool is_due() const;

    /**
     * @brief One scheduled check
     * @return true if a refresh ran and succeeded. Failures are recorded, never thrown.
     */
    bool tick();

    /**
     * @brief Refresh unconditionally
     * @throws whatever issuing or adopting the credential throws
     */
    Credential refresh_now();

    /**
     * @brief Refresh only if still due once the refresh lock is held
     * @return true if this call performed the refresh
     * @throws whatever issuing or adopting the credential throws
     */
    bool refresh_if_due();

    /// Called after each successful refresh, outside the refresh lock, so it
    /// may call back into the scheduler.
    void set_on_refresh(RefreshCallback callback);

    [[nodiscard]] RefreshStatus status() const;

    [[nodiscard]] const std::string& role() const { return role_; }
    [[nodiscard]] const RefreshConfig& config() const { return config_; }

private:
    void run_loop(std::stop_token stop);

    /// Issue + adopt; caller holds refresh_mutex_.
    Credential refresh_locked();

    /// Run a copy of on_refresh_; caller must not hold refresh_mutex_.
    void notify_refreshed(const Credential& fresh);

    void record_failure(const std::string& error);

    std::string role_;
    CredentialBroker& broker_;
    PoolCoordinator& coordinator_;
    RefreshConfig config_;
    std::shared_ptr<IClock> clock_;

    std::mutex callback_mutex_;
    RefreshCallback on_refresh_;

    std::mutex refresh_mutex_;
    mutable std::mutex status_mutex_;
    RefreshStatus status_;

    std::mutex wait_mutex_;
    std::condition_variable_any wake_cv_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};
    std::jthread loop_thread_;
};

} // namespace vaultagent
