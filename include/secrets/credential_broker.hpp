#pragma once

#include "auth/auth_session.hpp"
#include "cache/ttl_cache.hpp"
#include "core/clock.hpp"
#include "core/single_flight.hpp"
#include "core/types.hpp"
#include "store/isecret_store.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vaultagent {

using SecretCache = TtlCache<CachedSecret>;

struct BrokerConfig {
    std::string kv_mount = "secret";
    std::string database_mount = "database";
    std::chrono::milliseconds request_timeout{5000};
    std::chrono::seconds list_ttl{60};  // capped by the cache default TTL
};

/**
 * @brief Placeholders {username}, {password}, {host}, {port}, {database}
 */
struct ConnectionStringParams {
    std::string format = "postgresql://{username}:{password}@{host}/{database}";
    std::string host = "localhost";
    int port = 5432;
    std::string database = "postgres";
};

/// Fill a connection-string template with a credential.
[[nodiscard]] std::string render_connection_string(const ConnectionStringParams& params,
                                                   const Credential& credential);

/**
 * @brief Cache-aware reads of secrets and database credentials
 *
 * - KV reads and static-role credentials go through the cache, keyed by
 *   mount + path (+ version). The configured TTL bounds staleness only.
 * - Dynamic credentials bypass the cache; concurrent issue_credential()
 *   calls for the same role share one store call.
 * - A store UNAUTHORIZED answer invalidates the session and the call is
 *   retried exactly once; a second rejection is an AuthenticationError.
 *
 * Uses the cache and session it is given; owns neither.
 */
class CredentialBroker {
public:
    CredentialBroker(std::shared_ptr<ISecretStore> store,
                     AuthSession& auth,
                     SecretCache& cache,
                     BrokerConfig config = {},
                     std::shared_ptr<IClock> clock = SteadyClock::shared());

    CredentialBroker(const CredentialBroker&) = delete;
    CredentialBroker& operator=(const CredentialBroker&) = delete;

    /// @throws SecretNotFoundError, AuthenticationError, StoreUnavailableError
    [[nodiscard]] SecretData read(const std::string& path,
                                  std::optional<int> version = std::nullopt);

    /// Keys under a KV path (cached for list_ttl).
    [[nodiscard]] std::vector<std::string> list(const std::string& path);

    /// Mint a fresh dynamic credential; never served from the cache.
    [[nodiscard]] Credential issue_credential(const std::string& role);

    /// Current static-role credential, cached like KV reads.
    [[nodiscard]] Credential get_static_credential(const std::string& role);

    /// Issue a credential for role and render it into a connection string.
    [[nodiscard]] std::string connection_string(const std::string& role,
                                                const ConnectionStringParams& params = {});

    /**
     * @brief Drop cached database credentials
     * @param role Role to clear; all database entries when nullopt
     * @return Number of cache entries removed
     */
    size_t clear_database_cache(const std::optional<std::string>& role = std::nullopt);

    [[nodiscard]] const BrokerConfig& config() const { return config_; }

private:
    static constexpr int kMaxAttempts = 2;

    /// Run call(token) with the single re-auth retry; maps failures to exceptions.
    template<typename T, typename Call>
    [[nodiscard]] T call_with_reauth(const std::string& what, Call&& call);

    [[nodiscard]] std::string kv_key(const std::string& path, std::optional<int> version) const;
    [[nodiscard]] std::string static_key(const std::string& role) const;

    std::shared_ptr<ISecretStore> store_;
    AuthSession& auth_;
    SecretCache& cache_;
    BrokerConfig config_;
    std::shared_ptr<IClock> clock_;

    SingleFlight<std::string, Credential> issue_flight_;
};

} // namespace vaultagent
