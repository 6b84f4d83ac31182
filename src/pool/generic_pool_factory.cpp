#include "pool/generic_pool_factory.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "db/generic_connection_pool.hpp"
#include <format>

namespace vaultagent {

GenericPoolFactory::GenericPoolFactory(std::shared_ptr<IConnectionFactory> connections,
                                       ConnectionStringParams params,
                                       std::chrono::milliseconds validate_timeout)
    : connections_(std::move(connections)),
      params_(std::move(params)),
      validate_timeout_(validate_timeout) {
    if (!connections_) {
        throw ConfigurationError("GenericPoolFactory requires a connection factory");
    }
}

std::shared_ptr<IConnectionPool> GenericPoolFactory::build(
    const Credential& credential, const PoolConfig& options) {

    return std::make_shared<GenericConnectionPool>(
        std::format("{}:{}", credential.role, credential.username),
        render_connection_string(params_, credential),
        options,
        connections_);
}

bool GenericPoolFactory::validate(IConnectionPool& pool, const std::string& probe) {
    auto conn = pool.acquire(validate_timeout_);
    if (!conn || !conn->is_valid()) {
        utils::log::warn(std::format("Pool '{}': no connection available for validation", pool.name()));
        return false;
    }

    if (!conn->get()->is_healthy(probe)) {
        utils::log::warn(std::format("Pool '{}': validation probe failed", pool.name()));
        conn->discard();
        return false;
    }
    return true;
}

void GenericPoolFactory::close(IConnectionPool& pool) {
    pool.drain();
}

} // namespace vaultagent
