#pragma once

#include "db/pooled_connection.hpp"
#include "pool/ipool_factory.hpp"
#include "pool/pool_handle.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace vaultagent {

/**
 * @brief One connection lent from a PoolHandle
 *
 * Keeps the handle alive and counted as borrowed until destroyed, so a
 * draining pool is not retired underneath it. Move-only.
 */
class BorrowedConnection {
public:
    BorrowedConnection(std::shared_ptr<PoolHandle> handle,
                       std::unique_ptr<PooledConnection> conn);
    ~BorrowedConnection();

    BorrowedConnection(BorrowedConnection&& other) noexcept;
    BorrowedConnection& operator=(BorrowedConnection&& other) noexcept;

    BorrowedConnection(const BorrowedConnection&) = delete;
    BorrowedConnection& operator=(const BorrowedConnection&) = delete;

    IDbConnection* get() const { return conn_ ? conn_->get() : nullptr; }
    IDbConnection* operator->() const { return get(); }
    explicit operator bool() const { return get() != nullptr; }

    /**
     * @brief Credential the connection authenticated with
     * @throws VaultAgentError once the connection was moved from, discarded or returned
     */
    [[nodiscard]] const Credential& credential() const;

    /// Hand the connection back as broken; the pool closes it.
    void discard();

private:
    void finish(bool reusable);

    // Declared before conn_ so the connection is returned first
    std::shared_ptr<PoolHandle> handle_;
    std::unique_ptr<PooledConnection> conn_;
};

/**
 * @brief Owns the active pool per role and swaps it on credential refresh
 *
 * The active handle is published with an atomic shared_ptr store, so readers
 * never take a lock and never observe a half-built pool. adopt() for one
 * role is serialized; different roles adopt independently.
 */
class PoolCoordinator {
public:
    PoolCoordinator(std::shared_ptr<IPoolFactory> factory, PoolConfig options);
    ~PoolCoordinator();

    PoolCoordinator(const PoolCoordinator&) = delete;
    PoolCoordinator& operator=(const PoolCoordinator&) = delete;

    /// Active handle for role, or nullptr before the first adopt().
    [[nodiscard]] std::shared_ptr<PoolHandle> current_handle(const std::string& role) const;

    /**
     * @brief Build, validate and publish a pool for a new credential
     *
     * The previous handle (if any) starts draining only after the new one is
     * published. Adopting the lease that is already active is a no-op.
     *
     * @throws ValidationError if the pool cannot be built or fails the probe;
     *         the previous handle stays active
     */
    std::shared_ptr<PoolHandle> adopt(const std::string& role, const Credential& credential);

    /// @throws PoolTimeoutError, ValidationError (no active pool for role)
    [[nodiscard]] BorrowedConnection borrow(const std::string& role,
                                            std::chrono::milliseconds timeout);

    /// Handles of role that are still draining.
    [[nodiscard]] size_t draining_count(const std::string& role) const;

    /// Unpublish every pool and start draining them.
    void close_all();

    [[nodiscard]] const PoolConfig& options() const { return options_; }

private:
    struct RoleSlot {
        std::shared_ptr<PoolHandle> active;        // atomic_load/atomic_store only
        std::mutex adopt_mutex;                     // serializes adopt() and the draining list
        std::vector<std::shared_ptr<PoolHandle>> draining;
    };

    RoleSlot& slot(const std::string& role);
    RoleSlot* find_slot(const std::string& role) const;

    static void prune_retired(RoleSlot& slot);

    std::shared_ptr<IPoolFactory> factory_;
    PoolConfig options_;

    mutable std::mutex slots_mutex_;
    std::unordered_map<std::string, std::unique_ptr<RoleSlot>> slots_;
};

} // namespace vaultagent
