#include "manager/connection_manager.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>

namespace vaultagent {

ConnectionManager::ConnectionManager(std::string role,
                                     CredentialBroker& broker,
                                     std::shared_ptr<IPoolFactory> factory,
                                     ConnectionManagerOptions options,
                                     std::shared_ptr<IClock> clock)
    : role_(std::move(role)),
      options_(std::move(options)),
      coordinator_(std::move(factory), options_.pool),
      scheduler_(role_, broker, coordinator_, options_.refresh, std::move(clock)) {
    if (options_.on_refresh) {
        scheduler_.set_on_refresh(options_.on_refresh);
    }

    scheduler_.refresh_now();

    utils::log::info(std::format("Connection manager for '{}' ready ({} refresh)",
        role_, options_.background_refresh ? "background" : "on-demand"));
}

ConnectionManager::~ConnectionManager() {
    close();
}

BorrowedConnection ConnectionManager::get_connection() {
    ensure_open();
    if (!options_.background_refresh) {
        refresh_if_stale();
    }

    const auto timeout = options_.pool.connection_timeout;
    auto conn = coordinator_.borrow(role_, timeout);
    if (!options_.validate_on_borrow) {
        return conn;
    }
    if (conn->is_healthy(options_.pool.health_check_query)) {
        return conn;
    }

    utils::log::warn(std::format("Role '{}': borrowed connection failed validation, refreshing credentials",
        role_));
    conn.discard();
    refresh_now();

    auto retry = coordinator_.borrow(role_, timeout);
    if (retry->is_healthy(options_.pool.health_check_query)) {
        return retry;
    }
    retry.discard();
    throw ValidationError(std::format("Role '{}': connection failed validation after credential refresh",
        role_));
}

Credential ConnectionManager::refresh_now() {
    ensure_open();
    return scheduler_.refresh_now();
}

void ConnectionManager::start() {
    ensure_open();
    if (!options_.background_refresh) {
        utils::log::warn(std::format("Connection manager for '{}' is on-demand; start() ignored", role_));
        return;
    }
    scheduler_.start();
}

void ConnectionManager::stop() {
    scheduler_.stop();
}

void ConnectionManager::close() {
    if (closed_.exchange(true)) return;
    scheduler_.stop();
    coordinator_.close_all();
    utils::log::info(std::format("Connection manager for '{}' closed", role_));
}

std::optional<Credential> ConnectionManager::current_credential() const {
    const auto handle = coordinator_.current_handle(role_);
    if (!handle) {
        return std::nullopt;
    }
    return handle->credential();
}

PoolStats ConnectionManager::pool_stats() const {
    const auto handle = coordinator_.current_handle(role_);
    if (!handle) {
        return {};
    }
    return handle->pool().get_stats();
}

void ConnectionManager::ensure_open() const {
    if (closed_.load()) {
        throw ManagerClosedError(std::format("Connection manager for '{}' is closed", role_));
    }
}

void ConnectionManager::refresh_if_stale() {
    try {
        scheduler_.refresh_if_due();
    } catch (const VaultAgentError& e) {
        if (!coordinator_.current_handle(role_)) {
            throw;
        }
        utils::log::warn(std::format("Role '{}': on-demand refresh failed, using current pool: {}",
            role_, e.what()));
    }
}

} // namespace vaultagent
