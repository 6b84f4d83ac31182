#pragma once

#include "store/isecret_store.hpp"

#include <atomic>
#include <chrono>
#include <format>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace vaultagent::test {

// In-memory secret store that counts calls and fails on request
class MockSecretStore : public ISecretStore {
public:
    StoreResult<LoginResponse> login(const std::string& role_id, const std::string& secret_id,
                                     std::chrono::milliseconds) override {
        login_calls.fetch_add(1);
        std::this_thread::sleep_for(login_delay);

        std::lock_guard lock(mutex_);
        if (login_failure) {
            return StoreResult<LoginResponse>::error(*login_failure, "login rejected");
        }
        if (role_id != expected_role_id || secret_id != expected_secret_id) {
            return StoreResult<LoginResponse>::error(StoreErrorCode::UNAUTHORIZED, "invalid role_id or secret_id");
        }
        LoginResponse response;
        response.token = std::format("token-{}", ++tokens_issued_);
        response.lease_duration = token_lease;
        response.renewable = true;
        current_token_ = response.token;
        return StoreResult<LoginResponse>::ok(std::move(response));
    }

    StoreResult<ReadResponse> read(const std::string& token, const std::string& path,
                                   std::optional<int> version, std::chrono::milliseconds) override {
        read_calls.fetch_add(1);
        std::lock_guard lock(mutex_);
        if (auto rejected = reject(token)) {
            return StoreResult<ReadResponse>::error(*rejected, "permission denied");
        }
        if (read_failure) {
            return StoreResult<ReadResponse>::error(*read_failure, "read failed");
        }

        const std::string key = version ? std::format("{}@{}", path, *version) : path;
        const auto it = secrets.find(key);
        if (it == secrets.end()) {
            return StoreResult<ReadResponse>::error(StoreErrorCode::NOT_FOUND, std::format("no secret at {}", path));
        }
        ReadResponse response;
        response.data = it->second;
        response.version = version;
        return StoreResult<ReadResponse>::ok(std::move(response));
    }

    StoreResult<std::vector<std::string>> list(const std::string& token, const std::string& path,
                                               std::chrono::milliseconds) override {
        list_calls.fetch_add(1);
        std::lock_guard lock(mutex_);
        if (auto rejected = reject(token)) {
            return StoreResult<std::vector<std::string>>::error(*rejected, "permission denied");
        }
        const auto it = listings.find(path);
        if (it == listings.end()) {
            return StoreResult<std::vector<std::string>>::error(StoreErrorCode::NOT_FOUND, "nothing listed");
        }
        return StoreResult<std::vector<std::string>>::ok(it->second);
    }

    StoreResult<CredentialResponse> issue_credential(const std::string& token, const std::string& role,
                                                     std::chrono::milliseconds) override {
        issue_calls.fetch_add(1);
        std::this_thread::sleep_for(issue_delay);

        std::lock_guard lock(mutex_);
        if (auto rejected = reject(token)) {
            return StoreResult<CredentialResponse>::error(*rejected, "permission denied");
        }
        if (issue_failure) {
            return StoreResult<CredentialResponse>::error(*issue_failure, "issue failed");
        }
        if (role == "missing-role") {
            return StoreResult<CredentialResponse>::error(StoreErrorCode::NOT_FOUND, "unknown role");
        }
        const int n = ++leases_issued_;
        CredentialResponse response;
        response.lease_id = std::format("database/creds/{}/lease-{}", role, n);
        response.username = std::format("v-{}-{}", role, n);
        response.password = std::format("pw-{}", n);
        response.lease_duration = credential_lease;
        return StoreResult<CredentialResponse>::ok(std::move(response));
    }

    StoreResult<StaticCredentialResponse> read_static_credential(const std::string& token,
                                                                 const std::string& role,
                                                                 std::chrono::milliseconds) override {
        static_calls.fetch_add(1);
        std::lock_guard lock(mutex_);
        if (auto rejected = reject(token)) {
            return StoreResult<StaticCredentialResponse>::error(*rejected, "permission denied");
        }
        if (role == "missing-role") {
            return StoreResult<StaticCredentialResponse>::error(StoreErrorCode::NOT_FOUND, "unknown role");
        }
        StaticCredentialResponse response;
        response.username = std::format("static-{}", role);
        response.password = std::format("static-pw-{}", ++static_reads_);
        response.last_vault_rotation = "2024-01-01T00:00:00Z";
        response.rotation_period = std::chrono::seconds{86400};
        return StoreResult<StaticCredentialResponse>::ok(std::move(response));
    }

    // Reject the next n data calls as UNAUTHORIZED regardless of the token
    void reject_next(int n) {
        std::lock_guard lock(mutex_);
        forced_rejections_ = n;
    }

    // Make the token handed out by the last login unacceptable
    void revoke_current_token() {
        std::lock_guard lock(mutex_);
        revoked_.push_back(current_token_);
    }

    void set_issue_failure(std::optional<StoreErrorCode> code) {
        std::lock_guard lock(mutex_);
        issue_failure = code;
    }

    void set_login_failure(std::optional<StoreErrorCode> code) {
        std::lock_guard lock(mutex_);
        login_failure = code;
    }

    // Test configuration (set before concurrent use)
    std::string expected_role_id = "role-id";
    std::string expected_secret_id = "secret-id";
    std::chrono::seconds token_lease{3600};
    std::chrono::seconds credential_lease{100};
    std::chrono::milliseconds login_delay{0};
    std::chrono::milliseconds issue_delay{0};
    std::optional<StoreErrorCode> read_failure;
    std::map<std::string, SecretData> secrets;                    // "path" or "path@version"
    std::map<std::string, std::vector<std::string>> listings;

    std::atomic<int> login_calls{0};
    std::atomic<int> read_calls{0};
    std::atomic<int> list_calls{0};
    std::atomic<int> issue_calls{0};
    std::atomic<int> static_calls{0};

private:
    std::optional<StoreErrorCode> reject(const std::string& token) {
        if (forced_rejections_ > 0) {
            --forced_rejections_;
            return StoreErrorCode::UNAUTHORIZED;
        }
        for (const auto& revoked : revoked_) {
            if (token == revoked) return StoreErrorCode::UNAUTHORIZED;
        }
        return std::nullopt;
    }

    std::optional<StoreErrorCode> login_failure;
    std::optional<StoreErrorCode> issue_failure;

    std::mutex mutex_;
    int tokens_issued_ = 0;
    int leases_issued_ = 0;
    int static_reads_ = 0;
    int forced_rejections_ = 0;
    std::string current_token_;
    std::vector<std::string> revoked_;
};

} // namespace vaultagent::test
