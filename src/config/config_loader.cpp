#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <format>
#include <semaphore>
#include <stdexcept>

using namespace std::string_literals;

namespace vaultagent {

namespace {

// Upper bound the pool's counting semaphore can represent
constexpr int64_t kMaxPoolConnections = static_cast<int64_t>(std::counting_semaphore<>::max());

} // anonymous namespace

// ============================================================================
// TOML helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            if (const char* env_val = std::getenv(var_name.c_str())) {
                result += env_val;
            }
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            s = expand_env_vars(s.get());
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            s = expand_env_vars(s.get());
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

// ---- Section extractors ----------------------------------------------------

void extract_vault(const toml::table& root, AgentConfig& cfg) {
    const auto* vault = root["vault"].as_table();
    if (!vault) return;
    const auto& v = *vault;

    cfg.vault.addr = v["addr"].value_or(""s);
    cfg.vault.vault_namespace = v["namespace"].value_or(""s);
    cfg.vault.verify_tls = v["verify_tls"].value_or(true);
    cfg.vault.kv_mount = v["kv_mount"].value_or(cfg.vault.kv_mount);
    const auto kv_version = v["kv_version"].value_or(int64_t{0});
    if (kv_version < 0 || kv_version > 2) {
        throw std::runtime_error(std::format("vault.kv_version must be 0, 1 or 2, got {}", kv_version));
    }
    cfg.vault.kv_version = static_cast<int>(kv_version);
    cfg.vault.database_mount = v["database_mount"].value_or(cfg.vault.database_mount);
    cfg.vault.approle_mount = v["approle_mount"].value_or(cfg.vault.approle_mount);
    cfg.request_timeout = std::chrono::milliseconds(v["request_timeout_ms"].value_or(int64_t{5000}));
}

void extract_auth(const toml::table& root, AgentConfig& cfg) {
    const auto* auth = root["auth"].as_table();
    if (!auth) return;
    const auto& a = *auth;

    cfg.auth.role_id = a["role_id"].value_or(""s);
    cfg.auth.secret_id = a["secret_id"].value_or(""s);
    cfg.auth.eager_login = a["eager_login"].value_or(true);
}

void extract_cache(const toml::table& root, AgentConfig& cfg) {
    const auto* cache = root["cache"].as_table();
    if (!cache) return;
    const auto& c = *cache;

    cfg.cache.ttl_seconds = c["ttl_seconds"].value_or(cfg.cache.ttl_seconds);
    cfg.cache.max_entries = c["max_entries"].value_or(cfg.cache.max_entries);
    cfg.cache.list_ttl_seconds = c["list_ttl_seconds"].value_or(cfg.cache.list_ttl_seconds);
}

void extract_refresh(const toml::table& root, AgentConfig& cfg) {
    const auto* refresh = root["refresh"].as_table();
    if (!refresh) return;
    const auto& r = *refresh;

    cfg.refresh.refresh_buffer = r["buffer"].value_or(cfg.refresh.refresh_buffer);
    const auto interval_s = r["check_interval_seconds"].value_or(int64_t{60});
    cfg.refresh.check_interval = std::chrono::seconds(interval_s);
}

void extract_pool(const toml::table& root, AgentConfig& cfg) {
    const auto* pool = root["pool"].as_table();
    if (!pool) return;
    const auto& p = *pool;

    cfg.pool.min_connections = p["min_connections"].value_or(cfg.pool.min_connections);
    cfg.pool.max_connections = p["max_connections"].value_or(cfg.pool.max_connections);
    cfg.pool.connection_timeout_ms = p["connection_timeout_ms"].value_or(cfg.pool.connection_timeout_ms);
    cfg.pool.idle_timeout_ms = p["idle_timeout_ms"].value_or(cfg.pool.idle_timeout_ms);
    cfg.pool.max_lifetime_seconds = p["max_lifetime_seconds"].value_or(cfg.pool.max_lifetime_seconds);
    cfg.pool.validation_query = p["validation_query"].value_or(cfg.pool.validation_query);
    cfg.pool.validate_on_borrow = p["validate_on_borrow"].value_or(true);
}

void extract_logging(const toml::table& root, AgentConfig& cfg) {
    const auto* logging = root["logging"].as_table();
    if (!logging) return;
    cfg.logging.level = (*logging)["level"].value_or("info"s);
}

void extract_database_roles(const toml::table& root, AgentConfig& cfg) {
    const auto* arr = root["database_roles"].as_array();
    if (!arr) return;
    cfg.database_roles.reserve(arr->size());

    for (const auto& elem : *arr) {
        const auto* tbl = elem.as_table();
        if (!tbl) continue;
        const auto& d = *tbl;

        DatabaseRoleConfig role;
        role.name = d["name"].value_or(""s);
        role.connection_format = d["connection_format"].value_or(role.connection_format);
        role.host = d["host"].value_or(role.host);
        role.port = d["port"].value_or(role.port);
        role.database = d["database"].value_or(role.database);
        role.background_refresh = d["background_refresh"].value_or(false);
        cfg.database_roles.push_back(std::move(role));
    }
}

AgentConfig extract_all_sections(const toml::table& root) {
    AgentConfig cfg;
    extract_vault(root, cfg);
    extract_auth(root, cfg);
    extract_cache(root, cfg);
    extract_refresh(root, cfg);
    extract_pool(root, cfg);
    extract_logging(root, cfg);
    extract_database_roles(root, cfg);
    return cfg;
}

} // anonymous namespace

// ============================================================================
// AgentConfig helpers
// ============================================================================

const DatabaseRoleConfig* AgentConfig::find_role(const std::string& name) const {
    for (const auto& role : database_roles) {
        if (role.name == name) return &role;
    }
    return nullptr;
}

PoolConfig PoolSection::pool_config() const {
    PoolConfig pool;
    pool.min_connections = static_cast<size_t>(min_connections);
    pool.max_connections = static_cast<size_t>(max_connections);
    pool.connection_timeout = std::chrono::milliseconds(connection_timeout_ms);
    pool.idle_timeout = std::chrono::milliseconds(idle_timeout_ms);
    pool.max_lifetime = std::chrono::seconds(max_lifetime_seconds);
    pool.health_check_query = validation_query;
    return pool;
}

ConnectionStringParams DatabaseRoleConfig::connection_params() const {
    ConnectionStringParams params;
    params.format = connection_format;
    params.host = host;
    params.port = static_cast<int>(port);
    params.database = database;
    return params;
}

ConnectionManagerOptions manager_options(const AgentConfig& config,
                                         const DatabaseRoleConfig& role) {
    ConnectionManagerOptions options;
    options.pool = config.pool.pool_config();
    options.refresh = config.refresh;
    options.background_refresh = role.background_refresh;
    options.validate_on_borrow = config.pool.validate_on_borrow;
    return options;
}

// ============================================================================
// ConfigLoader
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::validate_and_return(AgentConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }

    if (const auto level = utils::log::parse_level(config.logging.level)) {
        utils::log::set_level(*level);
    }
    return LoadResult::ok(std::move(config));
}

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        auto tbl = toml::parse_file(config_path);
        expand_env_vars_recursive(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto tbl = toml::parse(toml_content);
        expand_env_vars_recursive(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

std::vector<std::string> ConfigLoader::validate_config(const AgentConfig& config) {
    std::vector<std::string> errors;

    if (config.vault.addr.empty()) {
        errors.emplace_back("vault.addr must not be empty");
    }
    if (config.vault.kv_version < 0 || config.vault.kv_version > 2) {
        errors.push_back(std::format("vault.kv_version must be 0, 1 or 2, got {}", config.vault.kv_version));
    }
    if (config.request_timeout.count() <= 0) {
        errors.push_back(std::format("vault.request_timeout_ms must be positive, got {}",
            config.request_timeout.count()));
    }

    if (config.auth.role_id.empty()) {
        errors.emplace_back("auth.role_id must not be empty");
    }
    if (config.auth.secret_id.empty()) {
        errors.emplace_back("auth.secret_id must not be empty");
    }

    if (config.cache.ttl_seconds < 0) {
        errors.push_back(std::format("cache.ttl_seconds must be >= 0, got {}", config.cache.ttl_seconds));
    }
    if (config.cache.max_entries <= 0) {
        errors.push_back(std::format("cache.max_entries must be > 0, got {}", config.cache.max_entries));
    }
    if (config.cache.list_ttl_seconds < 0) {
        errors.push_back(std::format("cache.list_ttl_seconds must be >= 0, got {}",
            config.cache.list_ttl_seconds));
    }

    if (!(config.refresh.refresh_buffer > 0.0 && config.refresh.refresh_buffer <= 1.0)) {
        errors.push_back(std::format("refresh.buffer must be in (0, 1], got {}",
            config.refresh.refresh_buffer));
    }
    if (config.refresh.check_interval.count() <= 0) {
        errors.emplace_back("refresh.check_interval_seconds must be > 0");
    }

    const auto& pool = config.pool;
    if (pool.max_connections <= 0 || pool.max_connections > kMaxPoolConnections) {
        errors.push_back(std::format("pool.max_connections must be 1-{}, got {}",
            kMaxPoolConnections, pool.max_connections));
    }
    if (pool.min_connections < 0) {
        errors.push_back(std::format("pool.min_connections must be >= 0, got {}", pool.min_connections));
    } else if (pool.min_connections > pool.max_connections) {
        errors.push_back(std::format("pool.min_connections ({}) > max_connections ({})",
            pool.min_connections, pool.max_connections));
    }
    if (pool.connection_timeout_ms <= 0) {
        errors.push_back(std::format("pool.connection_timeout_ms must be > 0, got {}",
            pool.connection_timeout_ms));
    }
    if (pool.idle_timeout_ms < 0) {
        errors.push_back(std::format("pool.idle_timeout_ms must be >= 0, got {}", pool.idle_timeout_ms));
    }
    if (pool.max_lifetime_seconds < 0) {
        errors.push_back(std::format("pool.max_lifetime_seconds must be >= 0, got {}",
            pool.max_lifetime_seconds));
    }
    if (pool.validation_query.empty()) {
        errors.emplace_back("pool.validation_query must not be empty");
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level '{}' is not one of debug, info, warn, error",
            config.logging.level));
    }

    for (size_t i = 0; i < config.database_roles.size(); ++i) {
        const auto& role = config.database_roles[i];
        if (role.name.empty()) {
            errors.push_back(std::format("database_roles[{}].name must not be empty", i));
        }
        if (role.port < 1 || role.port > 65535) {
            errors.push_back(std::format("database_roles[{}].port must be 1-65535, got {}",
                i, role.port));
        }
    }

    return errors;
}

} // namespace vaultagent
