#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace vaultagent {

/**
 * @brief Result set from a query execution
 *
 * Owns the result data (copied from native result handles).
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;

    std::vector<std::string> column_names;
    std::vector<std::vector<std::string>> rows;

    uint64_t affected_rows = 0;
    bool has_rows = false;
};

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle. Implementations are not
 * thread-safe; thread safety comes from the pool.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute a SQL query or statement
     */
    [[nodiscard]] virtual DbResultSet execute(const std::string& sql) = 0;

    /**
     * @brief Run the validation probe (e.g., "SELECT 1")
     * @return true if connection is usable
     */
    [[nodiscard]] virtual bool is_healthy(const std::string& probe) = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;

    virtual void close() = 0;
};

} // namespace vaultagent
