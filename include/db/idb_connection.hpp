#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <memory>

namespace joinscout {

// One result row; nullopt marks SQL NULL (distinct from the empty string)
using DbRow = std::vector<std::optional<std::string>>;

/**
 * @brief Result set from a query execution
 *
 * Returned by IDbConnection::execute().
 * Owns the result data (copied from native result handles).
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;
    std::string sqlstate;       // five-character SQLSTATE on failure, if the server sent one

    std::vector<std::string> column_names;
    std::vector<DbRow> rows;

    /**
     * @brief Cell text, or `fallback` for SQL NULL / out-of-range access
     */
    const std::string& text(size_t row, size_t col, const std::string& fallback = empty()) const {
        if (row >= rows.size() || col >= rows[row].size() || !rows[row][col]) {
            return fallback;
        }
        return *rows[row][col];
    }

    std::optional<std::string> optional_text(size_t row, size_t col) const {
        if (row >= rows.size() || col >= rows[row].size()) {
            return std::nullopt;
        }
        return rows[row][col];
    }

private:
    static const std::string& empty() {
        static const std::string kEmpty;
        return kEmpty;
    }
};

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle (PGconn*).
 * Implementations are not thread-safe; thread safety comes from the pool.
 *
 * Does NOT expose native handles to prevent leaking backend types.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute a SQL statement without parameters
     */
    [[nodiscard]] virtual DbResultSet execute(const std::string& sql) = 0;

    /**
     * @brief Execute a SQL statement with positional text parameters ($1, $2, ...)
     */
    [[nodiscard]] virtual DbResultSet execute_params(
        const std::string& sql, const std::vector<std::string>& params) = 0;

    /**
     * @brief Check if the connection is healthy
     * @param health_check_query SQL to run (e.g., "SELECT 1")
     */
    [[nodiscard]] virtual bool is_healthy(const std::string& health_check_query) = 0;

    /**
     * @brief Check if connection is in a valid state (connected)
     */
    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Close the connection and release resources
     */
    virtual void close() = 0;
};

} // namespace joinscout
