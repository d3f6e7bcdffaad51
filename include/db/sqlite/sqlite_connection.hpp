#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <sqlite3.h>
#include <chrono>
#include <string>

namespace dbsurvey {

/**
 * @brief SQLite connection implementing IDbConnection
 *
 * Wraps sqlite3* opened with SQLITE_OPEN_READONLY. Cell kinds come from
 * the per-value storage class, since SQLite columns are dynamically typed.
 * The query timeout is enforced through a progress handler that
 * interrupts the running statement once its deadline has passed.
 */
class SqliteConnection : public IDbConnection {
public:
    explicit SqliteConnection(sqlite3* db);
    ~SqliteConnection() override;

    SqliteConnection(const SqliteConnection&) = delete;
    SqliteConnection& operator=(const SqliteConnection&) = delete;

    Result<DbResultSet> execute(const std::string& sql) override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;
    bool set_query_timeout(std::chrono::milliseconds timeout) override;
    void close() override;

private:
    static int progress_callback(void* self);

    sqlite3* db_;
    std::chrono::milliseconds query_timeout_{0};
    std::chrono::steady_clock::time_point deadline_{};
};

/**
 * @brief SQLite connection factory
 *
 * Opens the file read-only (never creating it) unless read_only is off;
 * ":memory:" opens a private in-memory database.
 */
class SqliteConnectionFactory : public IConnectionFactory {
public:
    Result<std::unique_ptr<IDbConnection>> create(const ConnectionParams& params) override;
};

} // namespace dbsurvey
