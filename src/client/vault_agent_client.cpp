#include "client/vault_agent_client.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "store/vault_http_store.hpp"

#include <format>

namespace vaultagent {

VaultAgentClient::VaultAgentClient(std::shared_ptr<ISecretStore> store,
                                   ClientConfig config,
                                   std::shared_ptr<IClock> clock)
    : clock_(std::move(clock)),
      store_(std::move(store)),
      cache_(SecretCache::Config{config.max_cache_size, config.cache_ttl}, clock_),
      auth_(store_,
            AuthSessionConfig{config.role_id, config.secret_id, config.request_timeout},
            clock_),
      broker_(store_, auth_, cache_,
              BrokerConfig{config.kv_mount, config.database_mount,
                           config.request_timeout, config.list_ttl},
              clock_) {
    if (config.eager_login) {
        (void)auth_.ensure_valid();
    }
    utils::log::info(std::format("Vault agent client ready (cache ttl={}s, max={})",
        config.cache_ttl.count(), config.max_cache_size));
}

VaultAgentClient::VaultAgentClient(const AgentConfig& config)
    : VaultAgentClient(std::make_shared<VaultHttpStore>(config.vault),
                       client_config(config)) {}

ClientConfig VaultAgentClient::client_config(const AgentConfig& config) {
    ClientConfig cfg;
    cfg.role_id = config.auth.role_id;
    cfg.secret_id = config.auth.secret_id;
    cfg.eager_login = config.auth.eager_login;
    cfg.request_timeout = config.request_timeout;
    cfg.cache_ttl = std::chrono::seconds(config.cache.ttl_seconds);
    cfg.max_cache_size = config.cache.max_entries;
    cfg.list_ttl = std::chrono::seconds(config.cache.list_ttl_seconds);
    cfg.kv_mount = config.vault.kv_mount;
    cfg.database_mount = config.vault.database_mount;
    return cfg;
}

SecretData VaultAgentClient::read(const std::string& path, std::optional<int> version) {
    return broker_.read(path, version);
}

std::vector<std::string> VaultAgentClient::list(const std::string& path) {
    return broker_.list(path);
}

Credential VaultAgentClient::issue_credential(const std::string& role) {
    return broker_.issue_credential(role);
}

Credential VaultAgentClient::get_static_credential(const std::string& role) {
    return broker_.get_static_credential(role);
}

std::string VaultAgentClient::connection_string(const std::string& role,
                                                const ConnectionStringParams& params) {
    return broker_.connection_string(role, params);
}

size_t VaultAgentClient::clear_database_cache(const std::optional<std::string>& role) {
    return broker_.clear_database_cache(role);
}

void VaultAgentClient::set_cache_ttl(std::chrono::seconds ttl) {
    cache_.set_default_ttl(ttl);
    utils::log::info(std::format("Cache TTL set to {}s", ttl.count()));
}

std::unique_ptr<ConnectionManager> VaultAgentClient::make_connection_manager(
    const std::string& role,
    std::shared_ptr<IPoolFactory> factory,
    ConnectionManagerOptions options) {
    return std::make_unique<ConnectionManager>(
        role, broker_, std::move(factory), std::move(options), clock_);
}

} // namespace vaultagent
