#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace vaultagent {

// ============================================================================
// Exceptions surfaced by the public API
// ============================================================================

class VaultAgentError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Login or re-authentication against the store failed.
class AuthenticationError : public VaultAgentError {
public:
    using VaultAgentError::VaultAgentError;
};

/// The store has no such path or role.
class SecretNotFoundError : public VaultAgentError {
public:
    using VaultAgentError::VaultAgentError;
};

/// Network failure or timeout talking to the store.
class StoreUnavailableError : public VaultAgentError {
public:
    using VaultAgentError::VaultAgentError;
};

/// A pool or connection failed its validation probe.
class ValidationError : public VaultAgentError {
public:
    using VaultAgentError::VaultAgentError;
};

/// Invalid TTL, capacity, refresh buffer or interval.
class ConfigurationError : public VaultAgentError {
public:
    using VaultAgentError::VaultAgentError;
};

/// No pooled connection became available within the borrow timeout.
class PoolTimeoutError : public VaultAgentError {
public:
    using VaultAgentError::VaultAgentError;
};

/// Borrow attempted on a manager that has been closed.
class ManagerClosedError : public VaultAgentError {
public:
    using VaultAgentError::VaultAgentError;
};

// ============================================================================
// Store call results
// ============================================================================

/**
 * @brief Failure classes reported by a SecretStore call
 */
enum class StoreErrorCode {
    NONE,
    UNAUTHORIZED,
    NOT_FOUND,
    UNAVAILABLE,
    TIMEOUT
};

inline constexpr const char* store_error_name(StoreErrorCode code) {
    switch (code) {
        case StoreErrorCode::NONE:         return "none";
        case StoreErrorCode::UNAUTHORIZED: return "unauthorized";
        case StoreErrorCode::NOT_FOUND:    return "not_found";
        case StoreErrorCode::UNAVAILABLE:  return "unavailable";
        case StoreErrorCode::TIMEOUT:      return "timeout";
    }
    return "unknown";
}

/**
 * @brief Result type for store calls that can fail
 *
 * Carries either a value or an error code plus message. Callers branch on
 * the code; nothing is thrown across the store boundary.
 */
template<typename T>
class StoreResult {
public:
    static StoreResult ok(T value) {
        StoreResult r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static StoreResult error(StoreErrorCode code, std::string message) {
        StoreResult r;
        r.success_ = false;
        r.error_code_ = code;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    StoreErrorCode error_code() const { return error_code_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    StoreErrorCode error_code_ = StoreErrorCode::NONE;
    std::string error_message_;
};

} // namespace vaultagent
