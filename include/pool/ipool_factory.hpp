#pragma once

#include "core/types.hpp"
#include "db/iconnection_pool.hpp"
#include <memory>
#include <string>

namespace vaultagent {

/**
 * @brief Application-supplied builder of credential-bound pools
 *
 * PoolCoordinator calls build() once per credential, validate() before the
 * new pool is made visible, and close() when a pool is discarded or retired.
 */
class IPoolFactory {
public:
    virtual ~IPoolFactory() = default;

    /**
     * @brief Build a pool whose connections authenticate with credential
     * @return New pool, or nullptr if it could not be built
     */
    [[nodiscard]] virtual std::shared_ptr<IConnectionPool> build(
        const Credential& credential, const PoolConfig& options) = 0;

    /// Run probe against at least one freshly built connection.
    [[nodiscard]] virtual bool validate(IConnectionPool& pool, const std::string& probe) = 0;

    virtual void close(IConnectionPool& pool) = 0;
};

} // namespace vaultagent
