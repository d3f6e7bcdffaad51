#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <libpq-fe.h>
#include <string>

namespace dbsurvey {

/**
 * @brief PostgreSQL connection implementing IDbConnection
 *
 * Wraps PGconn* and provides database-agnostic interface.
 * All libpq calls are encapsulated here.
 */
class PgConnection : public IDbConnection {
public:
    /**
     * @brief Construct from existing PGconn* (takes ownership)
     */
    explicit PgConnection(PGconn* conn);

    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    Result<DbResultSet> execute(const std::string& sql) override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;
    bool set_query_timeout(std::chrono::milliseconds timeout) override;
    void close() override;

private:
    /**
     * @brief Copy a PGRES_TUPLES_OK result into owned cells
     */
    static DbResultSet process_tuples_result(PGresult* res);

    /**
     * @brief Classify a failed result by SQLSTATE
     */
    Result<DbResultSet> error_result(PGresult* res) const;

    PGconn* conn_;
};

/**
 * @brief PostgreSQL connection factory
 *
 * Opens sessions with PQconnectdbParams (no conninfo string assembly, so
 * credentials never need quoting) and pins the session to read-only
 * transactions, UTC and the configured statement timeout.
 */
class PgConnectionFactory : public IConnectionFactory {
public:
    Result<std::unique_ptr<IDbConnection>> create(const ConnectionParams& params) override;
};

} // namespace dbsurvey
