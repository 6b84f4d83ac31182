#include "store/vault_response.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <format>

namespace vaultagent::vault {

namespace {

using nlohmann::json;

template<typename T>
StoreResult<T> malformed(std::string_view what) {
    return StoreResult<T>::error(StoreErrorCode::UNAVAILABLE,
        std::format("malformed Vault response: {}", what));
}

std::optional<json> parse_body(const std::string& body) {
    auto doc = json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object()) {
        return std::nullopt;
    }
    return doc;
}

/// String values are taken verbatim; anything else keeps its JSON text.
SecretData to_secret_data(const json& obj) {
    SecretData data;
    for (const auto& [key, value] : obj.items()) {
        if (value.is_string()) {
            data.emplace(key, value.get<std::string>());
        } else {
            data.emplace(key, value.dump());
        }
    }
    return data;
}

std::optional<std::chrono::seconds> seconds_field(const json& obj, const char* key) {
    const auto it = obj.find(key);
    if (it == obj.end() || !it->is_number_integer()) {
        return std::nullopt;
    }
    return std::chrono::seconds(it->get<int64_t>());
}

std::optional<std::string> string_field(const json& obj, const char* key) {
    const auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

} // anonymous namespace

StoreErrorCode classify_status(int status, bool credential_endpoint) {
    if (status >= 200 && status < 300) return StoreErrorCode::NONE;
    if (status == 401 || status == 403) return StoreErrorCode::UNAUTHORIZED;
    if (status == 404) return StoreErrorCode::NOT_FOUND;
    if (status == 400 && credential_endpoint) return StoreErrorCode::NOT_FOUND;
    return StoreErrorCode::UNAVAILABLE;
}

std::string error_detail(const std::string& body) {
    const auto doc = parse_body(body);
    if (!doc) return {};
    const auto it = doc->find("errors");
    if (it == doc->end() || !it->is_array() || it->empty() || !(*it)[0].is_string()) {
        return {};
    }
    return (*it)[0].get<std::string>();
}

StoreResult<LoginResponse> parse_login(const std::string& body) {
    const auto doc = parse_body(body);
    if (!doc) return malformed<LoginResponse>("login body is not a JSON object");

    const auto auth = doc->find("auth");
    if (auth == doc->end() || !auth->is_object()) {
        return malformed<LoginResponse>("login response has no auth block");
    }

    auto token = string_field(*auth, "client_token");
    if (!token || token->empty()) {
        return malformed<LoginResponse>("login response has no client_token");
    }

    LoginResponse response;
    response.token = std::move(*token);
    response.lease_duration = seconds_field(*auth, "lease_duration").value_or(std::chrono::seconds{0});
    if (const auto renewable = auth->find("renewable"); renewable != auth->end() && renewable->is_boolean()) {
        response.renewable = renewable->get<bool>();
    }
    return StoreResult<LoginResponse>::ok(std::move(response));
}

StoreResult<ReadResponse> parse_kv_read(const std::string& body, int kv_version) {
    const auto doc = parse_body(body);
    if (!doc) return malformed<ReadResponse>("read body is not a JSON object");

    const auto data = doc->find("data");
    if (data == doc->end() || !data->is_object()) {
        return malformed<ReadResponse>("read response has no data block");
    }

    ReadResponse response;
    if (kv_version == 2) {
        const auto inner = data->find("data");
        if (inner == data->end() || !inner->is_object()) {
            // A soft-deleted version comes back with "data": null
            return StoreResult<ReadResponse>::error(StoreErrorCode::NOT_FOUND,
                "secret version has no data (deleted or destroyed)");
        }
        response.data = to_secret_data(*inner);
        if (const auto meta = data->find("metadata"); meta != data->end() && meta->is_object()) {
            if (const auto v = meta->find("version"); v != meta->end() && v->is_number_integer()) {
                response.version = v->get<int>();
            }
        }
    } else {
        response.data = to_secret_data(*data);
    }

    const auto lease = seconds_field(*doc, "lease_duration");
    if (lease && lease->count() > 0) {
        response.lease_duration = lease;
    }
    return StoreResult<ReadResponse>::ok(std::move(response));
}

StoreResult<std::vector<std::string>> parse_list(const std::string& body) {
    const auto doc = parse_body(body);
    if (!doc) return malformed<std::vector<std::string>>("list body is not a JSON object");

    std::vector<std::string> keys;
    const auto data = doc->find("data");
    if (data == doc->end() || !data->is_object()) {
        return StoreResult<std::vector<std::string>>::ok(std::move(keys));
    }
    if (const auto arr = data->find("keys"); arr != data->end() && arr->is_array()) {
        keys.reserve(arr->size());
        for (const auto& k : *arr) {
            if (k.is_string()) keys.emplace_back(k.get<std::string>());
        }
    }
    return StoreResult<std::vector<std::string>>::ok(std::move(keys));
}

StoreResult<CredentialResponse> parse_credential(const std::string& body) {
    const auto doc = parse_body(body);
    if (!doc) return malformed<CredentialResponse>("credential body is not a JSON object");

    const auto data = doc->find("data");
    if (data == doc->end() || !data->is_object()) {
        return malformed<CredentialResponse>("credential response has no data block");
    }
    auto username = string_field(*data, "username");
    auto password = string_field(*data, "password");
    if (!username || !password) {
        return malformed<CredentialResponse>("credential response has no username/password");
    }

    CredentialResponse response;
    response.lease_id = string_field(*doc, "lease_id").value_or("");
    response.username = std::move(*username);
    response.password = std::move(*password);
    response.lease_duration = seconds_field(*doc, "lease_duration").value_or(std::chrono::seconds{0});
    return StoreResult<CredentialResponse>::ok(std::move(response));
}

StoreResult<StaticCredentialResponse> parse_static_credential(const std::string& body) {
    const auto doc = parse_body(body);
    if (!doc) return malformed<StaticCredentialResponse>("static credential body is not a JSON object");

    const auto data = doc->find("data");
    if (data == doc->end() || !data->is_object()) {
        return malformed<StaticCredentialResponse>("static credential response has no data block");
    }
    auto username = string_field(*data, "username");
    auto password = string_field(*data, "password");
    if (!username || !password) {
        return malformed<StaticCredentialResponse>("static credential response has no username/password");
    }

    StaticCredentialResponse response;
    response.username = std::move(*username);
    response.password = std::move(*password);
    response.last_vault_rotation = string_field(*data, "last_vault_rotation");
    response.rotation_period = seconds_field(*data, "rotation_period");
    return StoreResult<StaticCredentialResponse>::ok(std::move(response));
}

std::optional<int> parse_mount_kv_version(const std::string& body) {
    const auto doc = parse_body(body);
    if (!doc) return std::nullopt;

    // sys/mounts/<mount> answers either at top level or wrapped in "data"
    const json* root = &*doc;
    if (const auto data = doc->find("data"); data != doc->end() && data->is_object()) {
        root = &*data;
    }

    const auto options = root->find("options");
    if (options == root->end() || !options->is_object()) {
        return std::nullopt;
    }
    const auto version = options->find("version");
    if (version == options->end() || !version->is_string()) {
        return std::nullopt;
    }
    const std::string v = version->get<std::string>();
    if (v == "2") return 2;
    if (v == "1") return 1;
    utils::log::warn(std::format("Vault: unrecognised KV version '{}' in mount options", v));
    return std::nullopt;
}

} // namespace vaultagent::vault
