#include "db/mysql/mysql_connection.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <format>

namespace dbsurvey {

namespace {

// Server error numbers (mysqld_error.h)
constexpr unsigned int kErQueryTimeout = 3024;            // ER_QUERY_TIMEOUT
constexpr unsigned int kErQueryInterrupted = 1317;        // ER_QUERY_INTERRUPTED
constexpr unsigned int kErAccessDenied = 1045;            // ER_ACCESS_DENIED_ERROR
constexpr unsigned int kErDbAccessDenied = 1044;          // ER_DBACCESS_DENIED_ERROR
constexpr unsigned int kErTableAccessDenied = 1142;       // ER_TABLEACCESS_DENIED_ERROR
constexpr unsigned int kErSpecificAccessDenied = 1227;    // ER_SPECIFIC_ACCESS_DENIED_ERROR
// Client error numbers (errmsg.h)
constexpr unsigned int kCrConnectionError = 2002;
constexpr unsigned int kCrConnHostError = 2003;
constexpr unsigned int kCrServerGone = 2006;
constexpr unsigned int kCrServerLost = 2013;

constexpr unsigned int kBinaryCharset = 63;

bool is_connection_errno(unsigned int err) {
    return err == kCrConnectionError || err == kCrConnHostError ||
           err == kCrServerGone || err == kCrServerLost;
}

bool is_privilege_errno(unsigned int err) {
    return err == kErAccessDenied || err == kErDbAccessDenied ||
           err == kErTableAccessDenied || err == kErSpecificAccessDenied;
}

} // namespace

MysqlConnection::MysqlConnection(MYSQL* conn)
    : conn_(conn) {}

MysqlConnection::~MysqlConnection() {
    close();
}

CellKind MysqlConnection::field_cell_kind(const MYSQL_FIELD& field) {
    switch (field.type) {
        case MYSQL_TYPE_TINY:
        case MYSQL_TYPE_SHORT:
        case MYSQL_TYPE_LONG:
        case MYSQL_TYPE_INT24:
        case MYSQL_TYPE_LONGLONG:
        case MYSQL_TYPE_YEAR:
            return CellKind::INTEGER;
        case MYSQL_TYPE_FLOAT:
        case MYSQL_TYPE_DOUBLE:
            return CellKind::REAL;
        case MYSQL_TYPE_DECIMAL:
        case MYSQL_TYPE_NEWDECIMAL:
            return CellKind::DECIMAL;
        case MYSQL_TYPE_BIT:
        case MYSQL_TYPE_GEOMETRY:
            return CellKind::BLOB;
        case MYSQL_TYPE_TINY_BLOB:
        case MYSQL_TYPE_MEDIUM_BLOB:
        case MYSQL_TYPE_LONG_BLOB:
        case MYSQL_TYPE_BLOB:
        case MYSQL_TYPE_STRING:
        case MYSQL_TYPE_VAR_STRING:
        case MYSQL_TYPE_VARCHAR:
            // BLOB/BINARY/VARBINARY share field types with the text family
            return field.charsetnr == kBinaryCharset ? CellKind::BLOB : CellKind::TEXT;
        default:
            return CellKind::TEXT;
    }
}

Result<DbResultSet> MysqlConnection::execute(const std::string& sql) {
    if (!conn_) {
        return Result<DbResultSet>::error(ErrorCode::CONNECTION_FAILED, "Connection is closed");
    }

    if (mysql_real_query(conn_, sql.data(), sql.size()) != 0) {
        return error_result();
    }

    // Check if the query produced a result set
    MYSQL_RES* res = mysql_store_result(conn_);
    if (res) {
        auto result = process_result_set(res);
        mysql_free_result(res);
        return Result<DbResultSet>::ok(std::move(result));
    }

    if (mysql_field_count(conn_) == 0) {
        // SET and friends: no result set expected
        return Result<DbResultSet>::ok(DbResultSet{});
    }
    return error_result();
}

DbResultSet MysqlConnection::process_result_set(MYSQL_RES* res) {
    DbResultSet result;

    // Extract column metadata
    const unsigned int num_fields = mysql_num_fields(res);
    MYSQL_FIELD* fields = mysql_fetch_fields(res);

    result.column_names.reserve(num_fields);
    result.column_types.reserve(num_fields);
    std::vector<CellKind> kinds;
    kinds.reserve(num_fields);

    for (unsigned int i = 0; i < num_fields; ++i) {
        result.column_names.emplace_back(fields[i].name);
        result.column_types.push_back(std::to_string(static_cast<int>(fields[i].type)));
        kinds.push_back(field_cell_kind(fields[i]));
    }

    // Extract rows
    MYSQL_ROW row;
    unsigned long* lengths;
    while ((row = mysql_fetch_row(res)) != nullptr) {
        lengths = mysql_fetch_lengths(res);
        std::vector<DbCell> cells;
        cells.reserve(num_fields);

        for (unsigned int i = 0; i < num_fields; ++i) {
            if (row[i]) {
                cells.push_back(DbCell{kinds[i], std::string(row[i], lengths[i])});
            } else {
                cells.push_back(DbCell{});
            }
        }

        result.rows.push_back(std::move(cells));
    }

    return result;
}

Result<DbResultSet> MysqlConnection::error_result() const {
    const unsigned int err = mysql_errno(conn_);
    std::string message = mysql_error(conn_);

    if (err == kErQueryTimeout || err == kErQueryInterrupted) {
        return Result<DbResultSet>::error(ErrorCode::QUERY_TIMEOUT, std::move(message));
    }
    if (is_privilege_errno(err)) {
        return Result<DbResultSet>::error(ErrorCode::INSUFFICIENT_PRIVILEGE, std::move(message));
    }
    if (is_connection_errno(err)) {
        return Result<DbResultSet>::error(ErrorCode::CONNECTION_FAILED, std::move(message));
    }
    return Result<DbResultSet>::error(ErrorCode::QUERY_FAILED, std::move(message));
}

bool MysqlConnection::is_healthy(const std::string& health_check_query) {
    if (!conn_) {
        return false;
    }

    // Fast ping check
    if (mysql_ping(conn_) != 0) {
        return false;
    }

    // Run health check query if provided
    if (!health_check_query.empty()) {
        if (mysql_query(conn_, health_check_query.c_str()) != 0) {
            return false;
        }
        MYSQL_RES* res = mysql_store_result(conn_);
        if (res) {
            mysql_free_result(res);
        }
    }

    return true;
}

bool MysqlConnection::is_connected() const {
    return conn_ != nullptr;
}

bool MysqlConnection::set_query_timeout(std::chrono::milliseconds timeout) {
    if (!conn_) {
        return false;
    }

    // MySQL uses SET max_execution_time (MySQL 5.7.8+)
    std::string sql = std::format("SET SESSION max_execution_time = {}", timeout.count());
    return mysql_query(conn_, sql.c_str()) == 0;
}

void MysqlConnection::close() {
    if (conn_) {
        mysql_close(conn_);
        conn_ = nullptr;
    }
}

// ============================================================================
// MysqlConnectionFactory
// ============================================================================

Result<std::unique_ptr<IDbConnection>> MysqlConnectionFactory::create(
    const ConnectionParams& params) {

    using Ret = Result<std::unique_ptr<IDbConnection>>;

    MYSQL* conn = mysql_init(nullptr);
    if (!conn) {
        return Ret::error(ErrorCode::CONNECTION_FAILED, "mysql_init failed");
    }

    const unsigned int connect_timeout = static_cast<unsigned int>(std::max<long long>(
        1, std::chrono::ceil<std::chrono::seconds>(params.connect_timeout).count()));
    mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &connect_timeout);

    // Read timeout backs up max_execution_time for statements it does not cover
    const unsigned int read_timeout = static_cast<unsigned int>(std::max<long long>(
        1, std::chrono::ceil<std::chrono::seconds>(params.query_timeout).count() + 1));
    mysql_options(conn, MYSQL_OPT_READ_TIMEOUT, &read_timeout);

    // Set character set to UTF-8
    mysql_options(conn, MYSQL_SET_CHARSET_NAME, "utf8mb4");

    MYSQL* result = mysql_real_connect(
        conn,
        params.host.c_str(),
        params.user.empty() ? nullptr : params.user.c_str(),
        params.password.empty() ? nullptr : params.password.c_str(),
        params.database.empty() ? nullptr : params.database.c_str(),
        params.effective_port(),
        nullptr,  // unix socket
        0         // client flags
    );

    if (!result) {
        const unsigned int err = mysql_errno(conn);
        std::string message = mysql_error(conn);
        mysql_close(conn);

        ErrorCode code = ErrorCode::CONNECTION_FAILED;
        if (is_privilege_errno(err)) {
            code = ErrorCode::INSUFFICIENT_PRIVILEGE;
        } else if (message.find("timed out") != std::string::npos ||
                   message.find("timeout") != std::string::npos) {
            code = ErrorCode::CONNECTION_TIMEOUT;
        }
        utils::log::warn(std::format("MySQL connect to {} failed: {}", params.display(), message));
        return Ret::error(code, std::format("Failed to connect to {}: {}", params.display(), message));
    }

    auto connection = std::make_unique<MysqlConnection>(conn);

    std::vector<std::string> session = {
        "SET time_zone = '+00:00'",
        std::format("SET SESSION max_execution_time = {}", params.query_timeout.count()),
    };
    if (params.read_only) {
        session.emplace_back("SET SESSION TRANSACTION READ ONLY");
    }
    for (const auto& stmt : session) {
        auto applied = connection->execute(stmt);
        if (applied.is_error()) {
            // MariaDB has no max_execution_time; the read timeout still applies
            utils::log::warn(std::format("MySQL session setup on {} ({}): {}",
                params.display(), stmt, applied.error_message()));
        }
    }

    return Ret::ok(std::move(connection));
}

} // namespace dbsurvey
