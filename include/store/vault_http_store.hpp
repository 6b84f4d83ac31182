#pragma once

#include "store/isecret_store.hpp"

#include <atomic>
#include <chrono>
#include <string>

namespace vaultagent {

struct VaultStoreConfig {
    std::string addr;                     // e.g., "https://vault.example.com:8200"
    std::string vault_namespace;          // Enterprise namespace (optional)
    bool verify_tls = true;
    std::string kv_mount = "secret";
    int kv_version = 0;                   // 0 = detect from sys/mounts
    std::string database_mount = "database";
    std::string approle_mount = "approle";
};

/**
 * @brief ISecretStore over the HashiCorp Vault HTTP API
 *
 * One short-lived HTTP client per call with connect/read/write timeouts set
 * from the caller's deadline. No retries here; callers own retry policy.
 */
class VaultHttpStore : public ISecretStore {
public:
    explicit VaultHttpStore(VaultStoreConfig config);

    [[nodiscard]] StoreResult<LoginResponse> login(
        const std::string& role_id, const std::string& secret_id,
        std::chrono::milliseconds timeout) override;

    [[nodiscard]] StoreResult<ReadResponse> read(
        const std::string& token, const std::string& path,
        std::optional<int> version, std::chrono::milliseconds timeout) override;

    [[nodiscard]] StoreResult<std::vector<std::string>> list(
        const std::string& token, const std::string& path,
        std::chrono::milliseconds timeout) override;

    [[nodiscard]] StoreResult<CredentialResponse> issue_credential(
        const std::string& token, const std::string& role,
        std::chrono::milliseconds timeout) override;

    [[nodiscard]] StoreResult<StaticCredentialResponse> read_static_credential(
        const std::string& token, const std::string& role,
        std::chrono::milliseconds timeout) override;

    [[nodiscard]] const VaultStoreConfig& config() const { return config_; }

private:
    struct HttpReply {
        int status = 0;           // 0 = no response
        std::string body;
        bool timed_out = false;
        std::string transport_error;
    };

    [[nodiscard]] HttpReply vault_api_get(const std::string& path, const std::string& token,
                                          std::chrono::milliseconds timeout) const;
    [[nodiscard]] HttpReply vault_api_post(const std::string& path, const std::string& token,
                                           const std::string& body,
                                           std::chrono::milliseconds timeout) const;

    /// Convert a non-2xx or failed reply into a typed error result.
    template<typename T>
    [[nodiscard]] StoreResult<T> failure(const HttpReply& reply, const std::string& what,
                                         bool credential_endpoint) const;

    /// KV engine version of the configured mount (detected once, on success).
    [[nodiscard]] int kv_version(const std::string& token, std::chrono::milliseconds timeout);

    VaultStoreConfig config_;
    std::atomic<int> detected_kv_version_{0};
};

} // namespace vaultagent
