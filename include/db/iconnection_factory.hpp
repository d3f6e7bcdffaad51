#pragma once

#include "db/connection_params.hpp"
#include "db/idb_connection.hpp"
#include <memory>

namespace dbsurvey {

/**
 * @brief Abstract factory for creating database connections
 *
 * Each engine provides its own factory that wraps the native
 * connection function (PQconnectdb, mysql_real_connect, sqlite3_open_v2)
 * and applies the read-only session settings.
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @brief Create a new database connection
     * @return Connection, or CONNECTION_FAILED / CONNECTION_TIMEOUT with a
     *         sanitized message
     */
    [[nodiscard]] virtual Result<std::unique_ptr<IDbConnection>> create(
        const ConnectionParams& params) = 0;
};

} // namespace dbsurvey
