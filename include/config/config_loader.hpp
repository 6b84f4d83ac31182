#pragma once

#include "db/iconnection_pool.hpp"
#include "manager/connection_manager.hpp"
#include "scheduler/refresh_scheduler.hpp"
#include "secrets/credential_broker.hpp"
#include "store/vault_http_store.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vaultagent {

// ============================================================================
// Config sections (mirror the TOML hierarchy)
// ============================================================================

struct AuthConfig {
    std::string role_id;
    std::string secret_id;
    bool eager_login = true;
};

struct CacheConfig {
    int64_t ttl_seconds = 300;      // 0 = pass-through
    int64_t max_entries = 1000;
    int64_t list_ttl_seconds = 60;
};

struct LoggingConfig {
    std::string level = "info";
};

/**
 * @brief [pool] section as written in the file
 *
 * Integers stay signed until validate_config() has checked them.
 */
struct PoolSection {
    int64_t min_connections = 2;
    int64_t max_connections = 10;
    int64_t connection_timeout_ms = 5000;
    int64_t idle_timeout_ms = 300000;
    int64_t max_lifetime_seconds = 3600;    // 0 = never recycle
    std::string validation_query = "SELECT 1";
    bool validate_on_borrow = true;

    /// Requires a section accepted by validate_config().
    [[nodiscard]] PoolConfig pool_config() const;
};

/**
 * @brief One [[database_roles]] entry
 */
struct DatabaseRoleConfig {
    std::string name;
    std::string connection_format = ConnectionStringParams{}.format;
    std::string host = "localhost";
    int64_t port = 5432;
    std::string database = "postgres";
    bool background_refresh = false;

    /// Requires an entry accepted by validate_config().
    [[nodiscard]] ConnectionStringParams connection_params() const;
};

struct AgentConfig {
    VaultStoreConfig vault;
    std::chrono::milliseconds request_timeout{5000};
    AuthConfig auth;
    CacheConfig cache;
    RefreshConfig refresh;
    PoolSection pool;
    LoggingConfig logging;
    std::vector<DatabaseRoleConfig> database_roles;

    [[nodiscard]] const DatabaseRoleConfig* find_role(const std::string& name) const;
};

/// Manager options for one configured database role.
[[nodiscard]] ConnectionManagerOptions manager_options(const AgentConfig& config,
                                                       const DatabaseRoleConfig& role);

// ============================================================================
// ConfigLoader
// ============================================================================

/**
 * @brief Loads AgentConfig from TOML
 *
 * String values may reference environment variables as ${NAME}; unset
 * variables expand to the empty string.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        AgentConfig config;

        static LoadResult ok(AgentConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// Every bound violation, empty when valid.
    [[nodiscard]] static std::vector<std::string> validate_config(const AgentConfig& config);

private:
    static LoadResult validate_and_return(AgentConfig config);
};

} // namespace vaultagent
