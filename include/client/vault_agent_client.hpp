#pragma once

#include "auth/auth_session.hpp"
#include "config/config_loader.hpp"
#include "core/clock.hpp"
#include "manager/connection_manager.hpp"
#include "pool/ipool_factory.hpp"
#include "secrets/credential_broker.hpp"
#include "store/isecret_store.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vaultagent {

/**
 * @brief Programmatic client settings
 */
struct ClientConfig {
    std::string role_id;
    std::string secret_id;
    bool eager_login = true;
    std::chrono::milliseconds request_timeout{5000};

    std::chrono::seconds cache_ttl{300};
    int64_t max_cache_size = 1000;
    std::chrono::seconds list_ttl{60};

    std::string kv_mount = "secret";
    std::string database_mount = "database";
};

/**
 * @brief Entry point: one store, one cache, one auth session
 *
 * Everything is owned by the instance, so several independent clients can
 * live in one process. Connection managers created here borrow the broker
 * and must not outlive the client.
 */
class VaultAgentClient {
public:
    /// @throws ConfigurationError, and AuthenticationError when eager login fails
    VaultAgentClient(std::shared_ptr<ISecretStore> store,
                     ClientConfig config,
                     std::shared_ptr<IClock> clock = SteadyClock::shared());

    /// Talks to Vault over HTTP as described by a loaded config.
    explicit VaultAgentClient(const AgentConfig& config);

    VaultAgentClient(const VaultAgentClient&) = delete;
    VaultAgentClient& operator=(const VaultAgentClient&) = delete;

    [[nodiscard]] SecretData read(const std::string& path,
                                  std::optional<int> version = std::nullopt);
    [[nodiscard]] std::vector<std::string> list(const std::string& path);
    [[nodiscard]] Credential issue_credential(const std::string& role);
    [[nodiscard]] Credential get_static_credential(const std::string& role);
    [[nodiscard]] std::string connection_string(const std::string& role,
                                                const ConnectionStringParams& params = {});

    [[nodiscard]] CacheStats cache_stats() const { return cache_.stats(); }
    void clear_cache(bool reset_stats = false) { cache_.clear(reset_stats); }
    size_t clear_database_cache(const std::optional<std::string>& role = std::nullopt);

    /// @throws ConfigurationError on a negative TTL
    void set_cache_ttl(std::chrono::seconds ttl);

    [[nodiscard]] AuthState auth_state() const { return auth_.state(); }

    [[nodiscard]] std::unique_ptr<ConnectionManager> make_connection_manager(
        const std::string& role,
        std::shared_ptr<IPoolFactory> factory,
        ConnectionManagerOptions options = {});

    [[nodiscard]] CredentialBroker& broker() { return broker_; }

private:
    static ClientConfig client_config(const AgentConfig& config);

    std::shared_ptr<IClock> clock_;
    std::shared_ptr<ISecretStore> store_;
    SecretCache cache_;
    AuthSession auth_;
    CredentialBroker broker_;
};

} // namespace vaultagent
