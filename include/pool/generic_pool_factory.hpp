#pragma once

#include "db/iconnection_factory.hpp"
#include "pool/ipool_factory.hpp"
#include "secrets/credential_broker.hpp"
#include <memory>

namespace vaultagent {

/**
 * @brief IPoolFactory backed by GenericConnectionPool
 *
 * The credential is rendered into the connection-string template and every
 * connection of the pool is opened with the result.
 */
class GenericPoolFactory : public IPoolFactory {
public:
    GenericPoolFactory(std::shared_ptr<IConnectionFactory> connections,
                       ConnectionStringParams params = {},
                       std::chrono::milliseconds validate_timeout = std::chrono::milliseconds{5000});

    std::shared_ptr<IConnectionPool> build(
        const Credential& credential, const PoolConfig& options) override;

    /// Borrows one connection and runs probe on it.
    bool validate(IConnectionPool& pool, const std::string& probe) override;

    /// Drains the pool.
    void close(IConnectionPool& pool) override;

private:
    std::shared_ptr<IConnectionFactory> connections_;
    ConnectionStringParams params_;
    std::chrono::milliseconds validate_timeout_;
};

} // namespace vaultagent
