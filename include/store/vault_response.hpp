#pragma once

#include "store/isecret_store.hpp"

#include <optional>
#include <string>
#include <vector>

/**
 * Decoding of Vault HTTP API response bodies.
 *
 * Kept apart from the transport so the mapping can be exercised without a
 * server. Every function returns UNAVAILABLE for a body that is not the JSON
 * shape Vault documents for that endpoint.
 */
namespace vaultagent::vault {

/// Map an HTTP status to a store error. 400 means "unknown role" on
/// credential endpoints and is reported as NOT_FOUND there.
[[nodiscard]] StoreErrorCode classify_status(int status, bool credential_endpoint);

/// Extract the first entry of Vault's {"errors": [...]} array, if any.
[[nodiscard]] std::string error_detail(const std::string& body);

[[nodiscard]] StoreResult<LoginResponse> parse_login(const std::string& body);

/// kv_version 2 reads data.data and data.metadata.version; 1 reads data
/// and the lease_duration.
[[nodiscard]] StoreResult<ReadResponse> parse_kv_read(const std::string& body, int kv_version);

[[nodiscard]] StoreResult<std::vector<std::string>> parse_list(const std::string& body);

[[nodiscard]] StoreResult<CredentialResponse> parse_credential(const std::string& body);

[[nodiscard]] StoreResult<StaticCredentialResponse> parse_static_credential(const std::string& body);

/// options.version of a sys/mounts/<mount> response; nullopt if absent.
[[nodiscard]] std::optional<int> parse_mount_kv_version(const std::string& body);

} // namespace vaultagent::vault
