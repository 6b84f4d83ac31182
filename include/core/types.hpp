#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace vaultagent {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

/// Key/value payload of a KV secret. Non-string values hold compact JSON text.
using SecretData = std::unordered_map<std::string, std::string>;

/**
 * @brief Database credential issued by the store
 *
 * Immutable once issued; a refresh produces a new Credential rather than
 * mutating this one. Static-role credentials have an empty lease_id and
 * carry rotation metadata instead.
 */
struct Credential {
    std::string role;
    std::string lease_id;
    std::string username;
    std::string password;
    TimePoint issued_at{};
    std::chrono::seconds lease_duration{0};

    // Static roles only
    std::optional<std::string> last_vault_rotation;
    std::optional<std::chrono::seconds> rotation_period;

    [[nodiscard]] TimePoint expires_at() const { return issued_at + lease_duration; }

    /// Point after which a proactive refresh is due (buffer in (0,1]).
    [[nodiscard]] TimePoint refresh_due_at(double refresh_buffer) const {
        const auto scaled = std::chrono::duration_cast<Clock::duration>(
            std::chrono::duration<double>(lease_duration) * refresh_buffer);
        return issued_at + scaled;
    }
};

/// Value stored in the secret cache.
using CachedSecret = std::variant<SecretData, Credential, std::vector<std::string>>;

struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
    size_t size = 0;
    size_t max_entries = 0;
};

} // namespace vaultagent
