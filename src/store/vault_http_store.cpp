#include "store/vault_http_store.hpp"
#include "store/vault_response.hpp"
#include "core/utils.hpp"

#define CPPHTTPLIB_OPENSSL_SUPPORT
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <nlohmann/json.hpp>

#include <format>

namespace vaultagent {

namespace {

constexpr const char* kJsonContentType = "application/json";

httplib::Headers make_headers(const std::string& token, const std::string& vault_namespace) {
    httplib::Headers headers;
    if (!token.empty()) {
        headers.emplace("X-Vault-Token", token);
    }
    if (!vault_namespace.empty()) {
        headers.emplace("X-Vault-Namespace", vault_namespace);
    }
    return headers;
}

void configure_client(httplib::Client& cli, bool verify_tls, std::chrono::milliseconds timeout) {
    cli.set_connection_timeout(timeout);
    cli.set_read_timeout(timeout);
    cli.set_write_timeout(timeout);
    cli.enable_server_certificate_verification(verify_tls);
}

} // anonymous namespace

VaultHttpStore::VaultHttpStore(VaultStoreConfig config)
    : config_(std::move(config)) {
    if (config_.kv_version == 1 || config_.kv_version == 2) {
        detected_kv_version_.store(config_.kv_version);
    }
}

StoreResult<LoginResponse> VaultHttpStore::login(
    const std::string& role_id, const std::string& secret_id,
    std::chrono::milliseconds timeout) {
    const std::string path = std::format("/v1/auth/{}/login", utils::trim_slashes(config_.approle_mount));
    const nlohmann::json payload = {{"role_id", role_id}, {"secret_id", secret_id}};

    const auto reply = vault_api_post(path, "", payload.dump(), timeout);
    if (reply.status < 200 || reply.status >= 300) {
        return failure<LoginResponse>(reply, "AppRole login", false);
    }
    return vault::parse_login(reply.body);
}

StoreResult<ReadResponse> VaultHttpStore::read(
    const std::string& token, const std::string& path,
    std::optional<int> version, std::chrono::milliseconds timeout) {
    const std::string mount = utils::trim_slashes(config_.kv_mount);
    const std::string secret_path = utils::trim_slashes(path);
    const int engine = kv_version(token, timeout);

    std::string url;
    if (engine == 2) {
        url = std::format("/v1/{}/data/{}", mount, secret_path);
        if (version) {
            url += std::format("?version={}", *version);
        }
    } else {
        url = std::format("/v1/{}/{}", mount, secret_path);
    }

    const auto reply = vault_api_get(url, token, timeout);
    if (reply.status < 200 || reply.status >= 300) {
        return failure<ReadResponse>(reply, std::format("read of '{}'", secret_path), false);
    }
    return vault::parse_kv_read(reply.body, engine);
}

StoreResult<std::vector<std::string>> VaultHttpStore::list(
    const std::string& token, const std::string& path,
    std::chrono::milliseconds timeout) {
    const std::string mount = utils::trim_slashes(config_.kv_mount);
    const std::string secret_path = utils::trim_slashes(path);
    const int engine = kv_version(token, timeout);

    const std::string url = engine == 2
        ? std::format("/v1/{}/metadata/{}?list=true", mount, secret_path)
        : std::format("/v1/{}/{}?list=true", mount, secret_path);

    const auto reply = vault_api_get(url, token, timeout);
    if (reply.status < 200 || reply.status >= 300) {
        return failure<std::vector<std::string>>(reply, std::format("list of '{}'", secret_path), false);
    }
    return vault::parse_list(reply.body);
}

StoreResult<CredentialResponse> VaultHttpStore::issue_credential(
    const std::string& token, const std::string& role,
    std::chrono::milliseconds timeout) {
    const std::string url = std::format("/v1/{}/creds/{}",
        utils::trim_slashes(config_.database_mount), role);

    const auto reply = vault_api_get(url, token, timeout);
    if (reply.status < 200 || reply.status >= 300) {
        return failure<CredentialResponse>(reply, std::format("credential issue for role '{}'", role), true);
    }
    return vault::parse_credential(reply.body);
}

StoreResult<StaticCredentialResponse> VaultHttpStore::read_static_credential(
    const std::string& token, const std::string& role,
    std::chrono::milliseconds timeout) {
    const std::string url = std::format("/v1/{}/static-creds/{}",
        utils::trim_slashes(config_.database_mount), role);

    const auto reply = vault_api_get(url, token, timeout);
    if (reply.status < 200 || reply.status >= 300) {
        return failure<StaticCredentialResponse>(reply, std::format("static credential read for role '{}'", role), true);
    }
    return vault::parse_static_credential(reply.body);
}

int VaultHttpStore::kv_version(const std::string& token, std::chrono::milliseconds timeout) {
    const int known = detected_kv_version_.load();
    if (known != 0) return known;

    const auto reply = vault_api_get(
        std::format("/v1/sys/mounts/{}", utils::trim_slashes(config_.kv_mount)), token, timeout);
    if (reply.status >= 200 && reply.status < 300) {
        if (const auto version = vault::parse_mount_kv_version(reply.body)) {
            detected_kv_version_.store(*version);
            utils::log::info(std::format("Vault: mount '{}' is KV v{}", config_.kv_mount, *version));
            return *version;
        }
    }

    // An answered lookup (typically 403 for AppRole tokens) is final; a
    // transport failure is retried on the next call
    if (reply.status != 0) {
        detected_kv_version_.store(1);
    }
    utils::log::warn(std::format("Vault: could not detect KV version of mount '{}', assuming v1",
                                 config_.kv_mount));
    return 1;
}

template<typename T>
StoreResult<T> VaultHttpStore::failure(const HttpReply& reply, const std::string& what,
                                       bool credential_endpoint) const {
    if (reply.status == 0) {
        const auto code = reply.timed_out ? StoreErrorCode::TIMEOUT : StoreErrorCode::UNAVAILABLE;
        return StoreResult<T>::error(code,
            std::format("{} failed: {} ({})", what, store_error_name(code), reply.transport_error));
    }

    const auto code = vault::classify_status(reply.status, credential_endpoint);
    std::string detail = vault::error_detail(reply.body);
    if (detail.empty()) {
        detail = std::format("HTTP {}", reply.status);
    } else {
        detail = std::format("HTTP {}: {}", reply.status, detail);
    }
    return StoreResult<T>::error(code, std::format("{} failed: {}", what, detail));
}

VaultHttpStore::HttpReply VaultHttpStore::vault_api_get(
    const std::string& path, const std::string& token,
    std::chrono::milliseconds timeout) const {
    HttpReply reply;
    if (config_.addr.empty()) {
        reply.transport_error = "no Vault address configured";
        return reply;
    }

    const utils::Timer timer;
    httplib::Client cli(config_.addr);
    configure_client(cli, config_.verify_tls, timeout);

    const auto res = cli.Get(path, make_headers(token, config_.vault_namespace));
    if (!res) {
        reply.transport_error = httplib::to_string(res.error());
        reply.timed_out = timer.elapsed_ms() >= timeout;
        return reply;
    }
    reply.status = res->status;
    reply.body = res->body;
    return reply;
}

VaultHttpStore::HttpReply VaultHttpStore::vault_api_post(
    const std::string& path, const std::string& token, const std::string& body,
    std::chrono::milliseconds timeout) const {
    HttpReply reply;
    if (config_.addr.empty()) {
        reply.transport_error = "no Vault address configured";
        return reply;
    }

    const utils::Timer timer;
    httplib::Client cli(config_.addr);
    configure_client(cli, config_.verify_tls, timeout);

    const auto res = cli.Post(path, make_headers(token, config_.vault_namespace), body, kJsonContentType);
    if (!res) {
        reply.transport_error = httplib::to_string(res.error());
        reply.timed_out = timer.elapsed_ms() >= timeout;
        return reply;
    }
    reply.status = res->status;
    reply.body = res->body;
    return reply;
}

} // namespace vaultagent
