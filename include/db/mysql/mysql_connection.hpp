#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <mysql/mysql.h>
#include <string>

namespace dbsurvey {

/**
 * @brief MySQL connection implementing IDbConnection
 *
 * Wraps MYSQL* handle (MariaDB Connector/C or libmysqlclient).
 * All MySQL C API calls are encapsulated here.
 */
class MysqlConnection : public IDbConnection {
public:
    explicit MysqlConnection(MYSQL* conn);
    ~MysqlConnection() override;

    MysqlConnection(const MysqlConnection&) = delete;
    MysqlConnection& operator=(const MysqlConnection&) = delete;

    Result<DbResultSet> execute(const std::string& sql) override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;
    bool set_query_timeout(std::chrono::milliseconds timeout) override;
    void close() override;

    /**
     * @brief Storage class for a result field (BINARY charset means raw bytes)
     */
    [[nodiscard]] static CellKind field_cell_kind(const MYSQL_FIELD& field);

private:
    DbResultSet process_result_set(MYSQL_RES* res);
    Result<DbResultSet> error_result() const;

    MYSQL* conn_;
};

/**
 * @brief MySQL connection factory
 *
 * Creates MysqlConnection instances using mysql_real_connect, then puts
 * the session into read-only, UTC mode with the configured statement
 * timeout.
 */
class MysqlConnectionFactory : public IConnectionFactory {
public:
    Result<std::unique_ptr<IDbConnection>> create(const ConnectionParams& params) override;
};

} // namespace dbsurvey
