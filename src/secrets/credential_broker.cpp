#include "secrets/credential_broker.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <string_view>
#include <variant>

namespace vaultagent {

std::string render_connection_string(const ConnectionStringParams& params,
                                     const Credential& credential) {
    const std::string port = std::to_string(params.port);
    const std::string_view fmt = params.format;

    // Single pass: substituted values are never scanned for placeholders
    std::string out;
    out.reserve(fmt.size() + credential.username.size() + credential.password.size());
    size_t i = 0;
    while (i < fmt.size()) {
        if (fmt[i] == '{') {
            const size_t close = fmt.find('}', i + 1);
            if (close != std::string_view::npos) {
                const std::string_view name = fmt.substr(i + 1, close - i - 1);
                const std::string* value = nullptr;
                if (name == "username") value = &credential.username;
                else if (name == "password") value = &credential.password;
                else if (name == "host") value = &params.host;
                else if (name == "port") value = &port;
                else if (name == "database") value = &params.database;

                if (value) {
                    out += *value;
                    i = close + 1;
                    continue;
                }
            }
        }
        out += fmt[i++];
    }
    return out;
}

CredentialBroker::CredentialBroker(std::shared_ptr<ISecretStore> store,
                                   AuthSession& auth,
                                   SecretCache& cache,
                                   BrokerConfig config,
                                   std::shared_ptr<IClock> clock)
    : store_(std::move(store)),
      auth_(auth),
      cache_(cache),
      config_(std::move(config)),
      clock_(std::move(clock)) {
    if (!store_) {
        throw ConfigurationError("CredentialBroker requires a secret store");
    }
    if (config_.request_timeout.count() <= 0) {
        throw ConfigurationError("CredentialBroker request timeout must be positive");
    }
    if (config_.list_ttl.count() < 0) {
        throw ConfigurationError("CredentialBroker list TTL must not be negative");
    }
}

template<typename T, typename Call>
T CredentialBroker::call_with_reauth(const std::string& what, Call&& call) {
    for (int attempt = 1; ; ++attempt) {
        const std::string token = auth_.ensure_valid();
        StoreResult<T> result = call(token);
        if (result.is_ok()) {
            return std::move(result.value());
        }

        switch (result.error_code()) {
            case StoreErrorCode::UNAUTHORIZED:
                if (attempt < kMaxAttempts) {
                    utils::log::warn(std::format("{}: token rejected, re-authenticating and retrying once", what));
                    auth_.invalidate(token);
                    continue;
                }
                throw AuthenticationError(std::format("{}: still unauthorized after re-authentication: {}",
                                                      what, result.error_message()));
            case StoreErrorCode::NOT_FOUND:
                throw SecretNotFoundError(std::format("{}: {}", what, result.error_message()));
            case StoreErrorCode::TIMEOUT:
            case StoreErrorCode::UNAVAILABLE:
            case StoreErrorCode::NONE:
                break;
        }
        throw StoreUnavailableError(std::format("{}: {} ({})", what, result.error_message(),
                                                store_error_name(result.error_code())));
    }
}

std::string CredentialBroker::kv_key(const std::string& path, std::optional<int> version) const {
    if (version) {
        return std::format("kv:{}:{}:v{}", config_.kv_mount, path, *version);
    }
    return std::format("kv:{}:{}", config_.kv_mount, path);
}

std::string CredentialBroker::static_key(const std::string& role) const {
    return std::format("db:static:{}:{}", config_.database_mount, role);
}

SecretData CredentialBroker::read(const std::string& path, std::optional<int> version) {
    const std::string key = kv_key(path, version);
    if (auto cached = cache_.get(key)) {
        if (auto* data = std::get_if<SecretData>(&*cached)) {
            utils::log::debug(std::format("Cache hit for key: {}", key));
            return std::move(*data);
        }
    }

    utils::log::debug(std::format("Cache miss for key: {}, fetching from store", key));
    auto response = call_with_reauth<ReadResponse>(
        std::format("read of '{}'", path),
        [&](const std::string& token) {
            return store_->read(token, path, version, config_.request_timeout);
        });

    cache_.put(key, response.data, std::nullopt, response.version ? response.version : version);
    return std::move(response.data);
}

std::vector<std::string> CredentialBroker::list(const std::string& path) {
    const std::string key = std::format("kv:list:{}:{}", config_.kv_mount, path);
    if (auto cached = cache_.get(key)) {
        if (auto* keys = std::get_if<std::vector<std::string>>(&*cached)) {
            return std::move(*keys);
        }
    }

    auto keys = call_with_reauth<std::vector<std::string>>(
        std::format("list of '{}'", path),
        [&](const std::string& token) {
            return store_->list(token, path, config_.request_timeout);
        });

    cache_.put(key, keys, std::min(config_.list_ttl, cache_.default_ttl()));
    return keys;
}

Credential CredentialBroker::issue_credential(const std::string& role) {
    return issue_flight_.run(role, [&]() {
        utils::log::info(std::format("Issuing database credential for role: {}", role));
        auto response = call_with_reauth<CredentialResponse>(
            std::format("credential issue for role '{}'", role),
            [&](const std::string& token) {
                return store_->issue_credential(token, role, config_.request_timeout);
            });

        Credential credential;
        credential.role = role;
        credential.lease_id = std::move(response.lease_id);
        credential.username = std::move(response.username);
        credential.password = std::move(response.password);
        credential.issued_at = clock_->now();
        credential.lease_duration = response.lease_duration;

        utils::log::info(std::format("Issued credential for role '{}': lease '{}' for {}s",
            role, credential.lease_id, credential.lease_duration.count()));
        return credential;
    });
}

Credential CredentialBroker::get_static_credential(const std::string& role) {
    const std::string key = static_key(role);
    if (auto cached = cache_.get(key)) {
        if (auto* credential = std::get_if<Credential>(&*cached)) {
            utils::log::debug(std::format("Cache hit for static database role: {}", role));
            return std::move(*credential);
        }
    }

    utils::log::debug(std::format("Cache miss for static database role: {}, fetching from store", role));
    auto response = call_with_reauth<StaticCredentialResponse>(
        std::format("static credential read for role '{}'", role),
        [&](const std::string& token) {
            return store_->read_static_credential(token, role, config_.request_timeout);
        });

    Credential credential;
    credential.role = role;
    credential.username = std::move(response.username);
    credential.password = std::move(response.password);
    credential.issued_at = clock_->now();
    credential.last_vault_rotation = std::move(response.last_vault_rotation);
    credential.rotation_period = response.rotation_period;

    cache_.put(key, credential);
    return credential;
}

std::string CredentialBroker::connection_string(const std::string& role,
                                                const ConnectionStringParams& params) {
    return render_connection_string(params, issue_credential(role));
}

size_t CredentialBroker::clear_database_cache(const std::optional<std::string>& role) {
    size_t removed = 0;
    if (role) {
        removed = cache_.invalidate(static_key(*role)) ? 1 : 0;
    } else {
        removed = cache_.invalidate_prefix("db:");
    }
    utils::log::info(std::format("Cleared {} cached database credential(s){}", removed,
        role ? std::format(" for role '{}'", *role) : std::string{}));
    return removed;
}

} // namespace vaultagent
