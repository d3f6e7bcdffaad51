#pragma once

#include "core/error.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dbsurvey {

/**
 * @brief Storage class of a fetched cell
 *
 * Decided by the connection from the native column type (PG OID, MySQL
 * field type) or, for SQLite, the per-value storage class. The bytes in
 * DbCell::data are exactly what the driver returned, except BLOB cells
 * which always hold raw bytes (PG bytea hex output is decoded).
 */
enum class CellKind : uint8_t {
    NULL_VALUE,
    INTEGER,
    REAL,
    DECIMAL,
    BOOLEAN,
    TEXT,
    BLOB,
};

struct DbCell {
    CellKind kind = CellKind::NULL_VALUE;
    std::string data;

    [[nodiscard]] bool is_null() const { return kind == CellKind::NULL_VALUE; }

    /// Text view for catalog queries; NULL yields nullopt
    [[nodiscard]] std::optional<std::string> text() const {
        if (is_null()) return std::nullopt;
        return data;
    }
};

/**
 * @brief Result set from a query execution
 *
 * Returned by IDbConnection::execute().
 * Owns the result data (copied from native result handles).
 */
struct DbResultSet {
    std::vector<std::string> column_names;
    std::vector<std::string> column_types;    // native type names, where known
    std::vector<std::vector<DbCell>> rows;

    [[nodiscard]] int column_index(std::string_view name) const {
        for (size_t i = 0; i < column_names.size(); ++i) {
            if (column_names[i] == name) return static_cast<int>(i);
        }
        return -1;
    }
};

/**
 * @brief Abstract read-only database connection
 *
 * Wraps a single native connection handle (PGconn*, MYSQL*, sqlite3*).
 * Implementations are not thread-safe; thread safety comes from the pool.
 *
 * Does NOT expose native handles to prevent leaking backend types.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute a read-only SQL query
     * @return Rows, or QUERY_TIMEOUT / INSUFFICIENT_PRIVILEGE / QUERY_FAILED
     */
    [[nodiscard]] virtual Result<DbResultSet> execute(const std::string& sql) = 0;

    /**
     * @brief Check if the connection is healthy
     * @param health_check_query SQL to run (e.g., "SELECT 1")
     */
    [[nodiscard]] virtual bool is_healthy(const std::string& health_check_query) = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Set query timeout for subsequent queries
     * @param timeout Per-statement limit (0 = no timeout)
     * @return true if timeout was set successfully
     *
     * PostgreSQL: SET statement_timeout = N
     * MySQL: SET SESSION max_execution_time = N
     * SQLite: progress-handler deadline
     */
    virtual bool set_query_timeout(std::chrono::milliseconds timeout) = 0;

    virtual void close() = 0;
};

} // namespace dbsurvey
