#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace vaultagent {

struct LoginResponse {
    std::string token;
    std::chrono::seconds lease_duration{0};  // 0 = token does not expire
    bool renewable = false;
};

struct ReadResponse {
    SecretData data;
    std::optional<std::chrono::seconds> lease_duration;
    std::optional<int> version;
};

struct CredentialResponse {
    std::string lease_id;
    std::string username;
    std::string password;
    std::chrono::seconds lease_duration{0};
};

struct StaticCredentialResponse {
    std::string username;
    std::string password;
    std::optional<std::string> last_vault_rotation;
    std::optional<std::chrono::seconds> rotation_period;
};

/**
 * @brief Authenticated request interface to the remote secret store
 *
 * Every call carries a timeout; implementations must give up once it
 * elapses and report StoreErrorCode::TIMEOUT. Failures are returned, never
 * thrown: UNAUTHORIZED, NOT_FOUND, UNAVAILABLE or TIMEOUT.
 */
class ISecretStore {
public:
    virtual ~ISecretStore() = default;

    /// AppRole login.
    [[nodiscard]] virtual StoreResult<LoginResponse> login(
        const std::string& role_id, const std::string& secret_id,
        std::chrono::milliseconds timeout) = 0;

    /// KV read; version selects a KV v2 secret version.
    [[nodiscard]] virtual StoreResult<ReadResponse> read(
        const std::string& token, const std::string& path,
        std::optional<int> version, std::chrono::milliseconds timeout) = 0;

    /// KV key listing under a path.
    [[nodiscard]] virtual StoreResult<std::vector<std::string>> list(
        const std::string& token, const std::string& path,
        std::chrono::milliseconds timeout) = 0;

    /// Mint a new dynamic database credential (new lease).
    [[nodiscard]] virtual StoreResult<CredentialResponse> issue_credential(
        const std::string& token, const std::string& role,
        std::chrono::milliseconds timeout) = 0;

    /// Read the current password of a static database role.
    [[nodiscard]] virtual StoreResult<StaticCredentialResponse> read_static_credential(
        const std::string& token, const std::string& role,
        std::chrono::milliseconds timeout) = 0;
};

} // namespace vaultagent
