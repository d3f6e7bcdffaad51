#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_type_map.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <cstring>
#include <format>
#include <vector>

namespace dbsurvey {

namespace {

constexpr const char* kSqlStateQueryCanceled = "57014";
constexpr const char* kSqlStateInsufficientPrivilege = "42501";
constexpr const char* kSqlStateInvalidPassword = "28P01";
constexpr const char* kSqlStateInvalidAuthorization = "28000";

std::string trimmed_error(const char* msg) {
    return utils::trim(msg ? std::string(msg) : std::string("unknown libpq error"));
}

/**
 * @brief Decode bytea text output ("\x4142" hex format) into raw bytes
 */
std::string decode_bytea(const char* val, int len) {
    std::string_view text(val, static_cast<size_t>(len));
    if (text.starts_with("\\x")) {
        if (auto bytes = utils::hex_to_bytes(text.substr(2))) {
            return std::string(bytes->begin(), bytes->end());
        }
    }
    // Legacy escape format: let libpq handle it
    size_t out_len = 0;
    unsigned char* raw = PQunescapeBytea(reinterpret_cast<const unsigned char*>(val), &out_len);
    if (!raw) {
        return std::string(text);
    }
    std::string out(reinterpret_cast<const char*>(raw), out_len);
    PQfreemem(raw);
    return out;
}

} // namespace

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

Result<DbResultSet> PgConnection::execute(const std::string& sql) {
    if (!conn_) {
        return Result<DbResultSet>::error(ErrorCode::CONNECTION_FAILED, "Connection is closed");
    }

    PGresult* res = PQexec(conn_, sql.c_str());

    if (!res) {
        return Result<DbResultSet>::error(ErrorCode::CONNECTION_FAILED,
                                          trimmed_error(PQerrorMessage(conn_)));
    }

    const ExecStatusType status = PQresultStatus(res);

    if (status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK) {
        auto result = process_tuples_result(res);
        PQclear(res);
        return Result<DbResultSet>::ok(std::move(result));
    }

    auto err = error_result(res);
    PQclear(res);
    return err;
}

bool PgConnection::is_healthy(const std::string& health_check_query) {
    if (!conn_) {
        return false;
    }

    if (PQstatus(conn_) != CONNECTION_OK) {
        return false;
    }

    PGresult* res = PQexec(conn_, health_check_query.c_str());
    if (!res) {
        return false;
    }

    ExecStatusType status = PQresultStatus(res);
    PQclear(res);

    return (status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK);
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

bool PgConnection::set_query_timeout(std::chrono::milliseconds timeout) {
    if (!conn_) {
        return false;
    }

    std::string timeout_sql = std::format("SET statement_timeout = {}", timeout.count());

    PGresult* res = PQexec(conn_, timeout_sql.c_str());
    if (!res) {
        return false;
    }

    bool success = (PQresultStatus(res) == PGRES_COMMAND_OK);
    PQclear(res);
    return success;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

DbResultSet PgConnection::process_tuples_result(PGresult* res) {
    DbResultSet result;

    const int ncols = PQnfields(res);
    std::vector<CellKind> kinds;
    kinds.reserve(ncols);
    for (int i = 0; i < ncols; i++) {
        result.column_names.emplace_back(PQfname(res, i));
        const Oid type_oid = PQftype(res, i);
        kinds.push_back(PgTypeMap::oid_to_cell_kind(static_cast<uint32_t>(type_oid)));
        result.column_types.push_back(std::to_string(type_oid));
    }

    const int nrows = PQntuples(res);
    result.rows.reserve(nrows);

    for (int i = 0; i < nrows; i++) {
        std::vector<DbCell> row;
        row.reserve(ncols);
        for (int j = 0; j < ncols; j++) {
            if (PQgetisnull(res, i, j)) {
                row.push_back(DbCell{});
                continue;
            }
            const char* val = PQgetvalue(res, i, j);
            const int len = PQgetlength(res, i, j);
            if (kinds[j] == CellKind::BLOB) {
                row.push_back(DbCell{CellKind::BLOB, decode_bytea(val, len)});
            } else {
                row.push_back(DbCell{kinds[j], std::string(val, static_cast<size_t>(len))});
            }
        }
        result.rows.push_back(std::move(row));
    }

    return result;
}

Result<DbResultSet> PgConnection::error_result(PGresult* res) const {
    const char* sqlstate = PQresultErrorField(res, PG_DIAG_SQLSTATE);
    const char* primary = PQresultErrorField(res, PG_DIAG_MESSAGE_PRIMARY);
    std::string message = trimmed_error(primary ? primary : PQerrorMessage(conn_));

    if (sqlstate && std::strcmp(sqlstate, kSqlStateQueryCanceled) == 0) {
        return Result<DbResultSet>::error(ErrorCode::QUERY_TIMEOUT, std::move(message));
    }
    if (sqlstate && std::strcmp(sqlstate, kSqlStateInsufficientPrivilege) == 0) {
        return Result<DbResultSet>::error(ErrorCode::INSUFFICIENT_PRIVILEGE, std::move(message));
    }
    if (PQstatus(conn_) != CONNECTION_OK) {
        return Result<DbResultSet>::error(ErrorCode::CONNECTION_FAILED, std::move(message));
    }
    return Result<DbResultSet>::error(ErrorCode::QUERY_FAILED, std::move(message));
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

Result<std::unique_ptr<IDbConnection>> PgConnectionFactory::create(
    const ConnectionParams& params) {

    using Ret = Result<std::unique_ptr<IDbConnection>>;

    const auto connect_seconds = std::max<long long>(
        1, std::chrono::ceil<std::chrono::seconds>(params.connect_timeout).count());
    const std::string port = std::to_string(params.effective_port());
    const std::string timeout = std::to_string(connect_seconds);
    const std::string dbname = params.database.empty() ? "postgres" : params.database;
    const std::string options = std::format(
        "-c default_transaction_read_only={} -c statement_timeout={} -c lock_timeout={} -c TimeZone=UTC "
        "-c extra_float_digits=3",
        params.read_only ? "on" : "off", params.query_timeout.count(), params.query_timeout.count());
    const std::string sslmode = params.option("sslmode").value_or("prefer");

    std::vector<const char*> keys = {
        "host", "port", "dbname", "connect_timeout", "application_name", "options", "sslmode"};
    std::vector<const char*> values = {
        params.host.c_str(), port.c_str(), dbname.c_str(), timeout.c_str(),
        params.application_name.c_str(), options.c_str(), sslmode.c_str()};
    if (!params.user.empty()) {
        keys.push_back("user");
        values.push_back(params.user.c_str());
    }
    if (!params.password.empty()) {
        keys.push_back("password");
        values.push_back(params.password.c_str());
    }
    keys.push_back(nullptr);
    values.push_back(nullptr);

    PGconn* conn = PQconnectdbParams(keys.data(), values.data(), 0);

    if (!conn) {
        return Ret::error(ErrorCode::CONNECTION_FAILED, "Failed to allocate PGconn");
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        std::string message = trimmed_error(PQerrorMessage(conn));
        PQfinish(conn);

        ErrorCode code = ErrorCode::CONNECTION_FAILED;
        if (message.find("timeout expired") != std::string::npos) {
            code = ErrorCode::CONNECTION_TIMEOUT;
        } else if (message.find("password authentication failed") != std::string::npos ||
                   message.find("permission denied") != std::string::npos ||
                   message.find(kSqlStateInvalidPassword) != std::string::npos ||
                   message.find(kSqlStateInvalidAuthorization) != std::string::npos) {
            code = ErrorCode::INSUFFICIENT_PRIVILEGE;
        }
        utils::log::warn(std::format("PostgreSQL connect to {} failed: {}", params.display(), message));
        return Ret::error(code, std::format("Failed to connect to {}: {}", params.display(), message));
    }

    return Ret::ok(std::make_unique<PgConnection>(conn));
}

} // namespace dbsurvey
