#pragma once

#include "db/idb_connection.hpp"
#include <functional>
#include <memory>

namespace vaultagent {

/**
 * @brief RAII lease of one pooled database connection
 *
 * Returns the connection to its pool on destruction (or release()).
 * discard() hands it back marked unusable so the pool closes it instead of
 * reusing it, e.g. after a failed validation probe. Move-only.
 */
class PooledConnection {
public:
    /// Second argument: true if the connection may be reused.
    using ReturnFunc = std::function<void(std::unique_ptr<IDbConnection>, bool)>;

    PooledConnection(std::unique_ptr<IDbConnection> conn, ReturnFunc return_fn);

    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    IDbConnection* get() const { return conn_.get(); }
    IDbConnection* operator->() const { return conn_.get(); }

    bool is_valid() const { return conn_ != nullptr && conn_->is_connected(); }

    /// Return to the pool now; the handle becomes empty.
    void release();

    /// Return to the pool as broken; the pool closes it.
    void discard();

private:
    void give_back(bool reusable);

    std::unique_ptr<IDbConnection> conn_;
    ReturnFunc return_fn_;
};

} // namespace vaultagent
