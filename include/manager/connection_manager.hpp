#pragma once

#include "core/clock.hpp"
#include "pool/pool_coordinator.hpp"
#include "scheduler/refresh_scheduler.hpp"
#include "secrets/credential_broker.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace vaultagent {

struct ConnectionManagerOptions {
    PoolConfig pool;                       // pool.health_check_query is the validation probe
    RefreshConfig refresh;
    bool background_refresh = false;
    bool validate_on_borrow = true;
    std::function<void(const Credential&)> on_refresh;
};

/**
 * @brief Connection pool for one database role that survives credential rotation
 *
 * The constructor issues the first credential and adopts a pool for it; a
 * failure there propagates. Afterwards the credential is renewed either by
 * a background RefreshScheduler (start()/stop()) or, in on-demand mode, by
 * get_connection() itself when the credential has passed its refresh point.
 * An on-demand refresh failure keeps the current pool serving.
 */
class ConnectionManager {
public:
    ConnectionManager(std::string role,
                      CredentialBroker& broker,
                      std::shared_ptr<IPoolFactory> factory,
                      ConnectionManagerOptions options = {},
                      std::shared_ptr<IClock> clock = SteadyClock::shared());

    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief Borrow a connection, returned to its pool when the result is destroyed
     * @throws ManagerClosedError, PoolTimeoutError, ValidationError
     */
    [[nodiscard]] BorrowedConnection get_connection();

    /// Issue a new credential and swap pools now.
    Credential refresh_now();

    /// Start background refresh (background mode only).
    void start();
    void stop();

    /// Stop refreshing and drain all pools. Idempotent.
    void close();

    [[nodiscard]] bool is_closed() const { return closed_.load(); }
    [[nodiscard]] bool is_background() const { return options_.background_refresh; }

    [[nodiscard]] std::optional<Credential> current_credential() const;
    [[nodiscard]] RefreshStatus refresh_status() const { return scheduler_.status(); }
    [[nodiscard]] PoolStats pool_stats() const;

    [[nodiscard]] const std::string& role() const { return role_; }

private:
    void ensure_open() const;

    /// On-demand mode: refresh when stale, keep serving the old pool on failure.
    void refresh_if_stale();

    std::string role_;
    ConnectionManagerOptions options_;
    PoolCoordinator coordinator_;
    RefreshScheduler scheduler_;
    std::atomic<bool> closed_{false};
};

} // namespace vaultagent
