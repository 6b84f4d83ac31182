#pragma once

#include "db/iconnection_pool.hpp"
#include "db/iconnection_factory.hpp"
#include "db/pooled_connection.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>
#include <unordered_map>

namespace vaultagent {

/**
 * @brief Database-agnostic bounded connection pool
 *
 * One pool is bound to one connection string, i.e. one credential; a
 * credential refresh builds a new pool rather than mutating this one.
 *
 * - max_connections enforced via counting_semaphore
 * - min_connections opened eagerly, the rest on demand
 * - Connections idle longer than idle_timeout are health-checked on acquire
 * - Connections older than max_lifetime are recycled on acquire
 * - PooledConnection returns the connection on destruction
 */
class GenericConnectionPool : public IConnectionPool {
public:
    /**
     * @param name Pool name (for logging)
     * @param connection_string Passed to the factory for every connection
     * @param config Pool configuration
     * @param factory Connection factory
     */
    GenericConnectionPool(
        std::string name,
        std::string connection_string,
        const PoolConfig& config,
        std::shared_ptr<IConnectionFactory> factory);

    ~GenericConnectionPool() override;

    GenericConnectionPool(const GenericConnectionPool&) = delete;
    GenericConnectionPool& operator=(const GenericConnectionPool&) = delete;

    std::unique_ptr<PooledConnection> acquire(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000}) override;

    PoolStats get_stats() const override;

    void drain() override;

    const std::string& name() const override { return name_; }

private:
    struct ConnMeta {
        std::chrono::steady_clock::time_point created_at;
        std::chrono::steady_clock::time_point last_used;
    };

    std::unique_ptr<IDbConnection> create_connection();

    /// Close a connection and forget its metadata.
    void destroy_connection(std::unique_ptr<IDbConnection> conn);

    /// Called by PooledConnection when the lease ends.
    void return_connection(std::unique_ptr<IDbConnection> conn, bool reusable);

    std::string name_;
    std::string connection_string_;
    PoolConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;

    std::deque<std::unique_ptr<IDbConnection>> idle_connections_;
    std::unordered_map<IDbConnection*, ConnMeta> meta_;
    mutable std::mutex mutex_;

    std::counting_semaphore<> semaphore_;

    std::atomic<size_t> total_connections_{0};
    std::atomic<size_t> total_acquires_{0};
    std::atomic<size_t> total_releases_{0};
    std::atomic<size_t> failed_acquires_{0};
    std::atomic<size_t> health_check_failures_{0};
    std::atomic<size_t> connections_recycled_{0};

    std::atomic<bool> shutdown_{false};
};

} // namespace vaultagent
