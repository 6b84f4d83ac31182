#include "db/generic_connection_pool.hpp"
#include "core/utils.hpp"
#include <format>

namespace vaultagent {

GenericConnectionPool::GenericConnectionPool(
    std::string name,
    std::string connection_string,
    const PoolConfig& config,
    std::shared_ptr<IConnectionFactory> factory)
    : name_(std::move(name)),
      connection_string_(std::move(connection_string)),
      config_(config),
      factory_(std::move(factory)),
      semaphore_(static_cast<std::ptrdiff_t>(config.max_connections)) {

    for (size_t i = 0; i < config_.min_connections; ++i) {
        auto conn = create_connection();
        if (!conn) {
            utils::log::warn(std::format("Pool '{}': failed to open connection {} during warm-up", name_, i + 1));
            continue;
        }
        std::lock_guard lock(mutex_);
        idle_connections_.emplace_back(std::move(conn));
    }

    utils::log::info(std::format("Pool '{}' initialized: {} connections (min={}, max={})",
        name_, total_connections_.load(), config_.min_connections, config_.max_connections));
}

GenericConnectionPool::~GenericConnectionPool() {
    drain();
}

std::unique_ptr<PooledConnection> GenericConnectionPool::acquire(
    std::chrono::milliseconds timeout) {

    if (shutdown_.load(std::memory_order_acquire)) {
        return nullptr;
    }

    if (!semaphore_.try_acquire_for(timeout)) {
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }

    // Shutdown may have started while we waited for the slot
    if (shutdown_.load(std::memory_order_acquire)) {
        semaphore_.release();
        return nullptr;
    }

    total_acquires_.fetch_add(1, std::memory_order_relaxed);

    std::unique_ptr<IDbConnection> conn;
    ConnMeta meta{};
    {
        std::lock_guard lock(mutex_);
        if (!idle_connections_.empty()) {
            conn = std::move(idle_connections_.front());
            idle_connections_.pop_front();
            if (const auto it = meta_.find(conn.get()); it != meta_.end()) {
                meta = it->second;
            }
        }
    }

    const auto now = std::chrono::steady_clock::now();
    if (conn) {
        const bool too_old = config_.max_lifetime.count() > 0
            && now - meta.created_at > config_.max_lifetime;
        if (too_old) {
            destroy_connection(std::move(conn));
            connections_recycled_.fetch_add(1, std::memory_order_relaxed);
        } else if (now - meta.last_used > config_.idle_timeout
                   && !conn->is_healthy(config_.health_check_query)) {
            // Only long-idle connections pay for a probe round trip
            health_check_failures_.fetch_add(1, std::memory_order_relaxed);
            destroy_connection(std::move(conn));
        }
    }

    if (!conn) {
        conn = create_connection();
        if (!conn) {
            semaphore_.release();
            failed_acquires_.fetch_add(1, std::memory_order_relaxed);
            return nullptr;
        }
    }

    auto return_fn = [this](std::unique_ptr<IDbConnection> c, bool reusable) {
        this->return_connection(std::move(c), reusable);
    };
    return std::make_unique<PooledConnection>(std::move(conn), return_fn);
}

PoolStats GenericConnectionPool::get_stats() const {
    std::lock_guard lock(mutex_);

    PoolStats stats;
    stats.total_connections = total_connections_.load(std::memory_order_relaxed);
    stats.idle_connections = idle_connections_.size();
    stats.active_connections = stats.total_connections - stats.idle_connections;
    stats.total_acquires = total_acquires_.load(std::memory_order_relaxed);
    stats.total_releases = total_releases_.load(std::memory_order_relaxed);
    stats.failed_acquires = failed_acquires_.load(std::memory_order_relaxed);
    stats.health_check_failures = health_check_failures_.load(std::memory_order_relaxed);
    stats.connections_recycled = connections_recycled_.load(std::memory_order_relaxed);
    return stats;
}

void GenericConnectionPool::drain() {
    if (shutdown_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    std::deque<std::unique_ptr<IDbConnection>> idle;
    {
        std::lock_guard lock(mutex_);
        idle.swap(idle_connections_);
    }
    for (auto& conn : idle) {
        destroy_connection(std::move(conn));
    }

    utils::log::info(std::format("Pool '{}' drained ({} connection(s) still borrowed)",
        name_, total_connections_.load()));
}

std::unique_ptr<IDbConnection> GenericConnectionPool::create_connection() {
    auto conn = factory_->create(connection_string_);
    if (conn) {
        total_connections_.fetch_add(1, std::memory_order_relaxed);
        const auto now = std::chrono::steady_clock::now();
        std::lock_guard lock(mutex_);
        meta_[conn.get()] = ConnMeta{now, now};
    }
    return conn;
}

void GenericConnectionPool::destroy_connection(std::unique_ptr<IDbConnection> conn) {
    if (!conn) return;
    {
        std::lock_guard lock(mutex_);
        meta_.erase(conn.get());
    }
    conn->close();
    total_connections_.fetch_sub(1, std::memory_order_relaxed);
}

void GenericConnectionPool::return_connection(std::unique_ptr<IDbConnection> conn, bool reusable) {
    if (!conn) {
        semaphore_.release();
        return;
    }

    total_releases_.fetch_add(1, std::memory_order_relaxed);

    if (!reusable || shutdown_.load(std::memory_order_acquire)) {
        destroy_connection(std::move(conn));
        semaphore_.release();
        return;
    }

    {
        std::lock_guard lock(mutex_);
        if (const auto it = meta_.find(conn.get()); it != meta_.end()) {
            it->second.last_used = std::chrono::steady_clock::now();
        }
        idle_connections_.emplace_back(std::move(conn));
    }

    semaphore_.release();
}

} // namespace vaultagent
