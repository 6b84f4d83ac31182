#include "db/pooled_connection.hpp"

namespace vaultagent {

PooledConnection::PooledConnection(std::unique_ptr<IDbConnection> conn, ReturnFunc return_fn)
    : conn_(std::move(conn)), return_fn_(std::move(return_fn)) {}

PooledConnection::~PooledConnection() {
    give_back(true);
}

PooledConnection::PooledConnection(PooledConnection&& other) noexcept
    : conn_(std::move(other.conn_)), return_fn_(std::move(other.return_fn_)) {}

PooledConnection& PooledConnection::operator=(PooledConnection&& other) noexcept {
    if (this != &other) {
        give_back(true);
        conn_ = std::move(other.conn_);
        return_fn_ = std::move(other.return_fn_);
    }
    return *this;
}

void PooledConnection::release() {
    give_back(true);
}

void PooledConnection::discard() {
    give_back(false);
}

void PooledConnection::give_back(bool reusable) {
    if (conn_ && return_fn_) {
        return_fn_(std::move(conn_), reusable);
    }
    conn_.reset();
}

} // namespace vaultagent
