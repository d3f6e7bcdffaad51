#include "db/sqlite/sqlite_connection.hpp"
#include "core/utils.hpp"
#include <charconv>
#include <format>

namespace dbsurvey {

namespace {

// Progress handler granularity (virtual machine instructions between checks)
constexpr int kProgressInterval = 1000;

CellKind storage_class_to_cell_kind(int type) {
    switch (type) {
        case SQLITE_INTEGER: return CellKind::INTEGER;
        case SQLITE_FLOAT: return CellKind::REAL;
        case SQLITE_BLOB: return CellKind::BLOB;
        case SQLITE_NULL: return CellKind::NULL_VALUE;
        default: return CellKind::TEXT;
    }
}

/**
 * @brief Shortest text that parses back to exactly the same double
 */
std::string format_real(double value) {
    char buf[32];
    const auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc{}) {
        return std::format("{}", value);
    }
    return std::string(buf, end);
}

/**
 * @brief RAII holder for a prepared statement
 */
class Statement {
public:
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt) {}
    ~Statement() {
        if (stmt_) sqlite3_finalize(stmt_);
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    sqlite3_stmt* get() const { return stmt_; }

private:
    sqlite3_stmt* stmt_;
};

} // namespace

SqliteConnection::SqliteConnection(sqlite3* db)
    : db_(db) {
    sqlite3_progress_handler(db_, kProgressInterval, &SqliteConnection::progress_callback, this);
}

SqliteConnection::~SqliteConnection() {
    close();
}

int SqliteConnection::progress_callback(void* self) {
    auto* conn = static_cast<SqliteConnection*>(self);
    if (conn->query_timeout_.count() <= 0) {
        return 0;
    }
    // Non-zero aborts the statement with SQLITE_INTERRUPT
    return std::chrono::steady_clock::now() > conn->deadline_ ? 1 : 0;
}

Result<DbResultSet> SqliteConnection::execute(const std::string& sql) {
    if (!db_) {
        return Result<DbResultSet>::error(ErrorCode::CONNECTION_FAILED, "Connection is closed");
    }

    deadline_ = std::chrono::steady_clock::now() + query_timeout_;

    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &raw, nullptr);
    Statement stmt(raw);
    if (rc != SQLITE_OK) {
        const ErrorCode code = rc == SQLITE_AUTH ? ErrorCode::INSUFFICIENT_PRIVILEGE
                                                 : ErrorCode::QUERY_FAILED;
        return Result<DbResultSet>::error(code, sqlite3_errmsg(db_));
    }
    if (!stmt.get()) {
        // Empty statement (whitespace or comment only)
        return Result<DbResultSet>::ok(DbResultSet{});
    }

    DbResultSet result;
    const int ncols = sqlite3_column_count(stmt.get());
    result.column_names.reserve(ncols);
    result.column_types.reserve(ncols);
    for (int i = 0; i < ncols; ++i) {
        const char* name = sqlite3_column_name(stmt.get(), i);
        const char* decl = sqlite3_column_decltype(stmt.get(), i);
        result.column_names.emplace_back(name ? name : "");
        result.column_types.emplace_back(decl ? decl : "");
    }

    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        std::vector<DbCell> row;
        row.reserve(ncols);
        for (int i = 0; i < ncols; ++i) {
            const CellKind kind = storage_class_to_cell_kind(sqlite3_column_type(stmt.get(), i));
            if (kind == CellKind::NULL_VALUE) {
                row.push_back(DbCell{});
                continue;
            }
            if (kind == CellKind::BLOB) {
                const auto* data = static_cast<const char*>(sqlite3_column_blob(stmt.get(), i));
                const int size = sqlite3_column_bytes(stmt.get(), i);
                row.push_back(DbCell{kind, data ? std::string(data, static_cast<size_t>(size)) : ""});
                continue;
            }
            if (kind == CellKind::REAL) {
                // sqlite3_column_text keeps only 15 significant digits
                row.push_back(DbCell{kind, format_real(sqlite3_column_double(stmt.get(), i))});
                continue;
            }
            const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), i));
            const int size = sqlite3_column_bytes(stmt.get(), i);
            row.push_back(DbCell{kind, text ? std::string(text, static_cast<size_t>(size)) : ""});
        }
        result.rows.push_back(std::move(row));
    }

    if (rc == SQLITE_INTERRUPT) {
        return Result<DbResultSet>::error(ErrorCode::QUERY_TIMEOUT,
            std::format("Query exceeded {}ms", query_timeout_.count()));
    }
    if (rc != SQLITE_DONE) {
        return Result<DbResultSet>::error(ErrorCode::QUERY_FAILED, sqlite3_errmsg(db_));
    }

    return Result<DbResultSet>::ok(std::move(result));
}

bool SqliteConnection::is_healthy(const std::string& health_check_query) {
    if (!db_) {
        return false;
    }
    return execute(health_check_query).is_ok();
}

bool SqliteConnection::is_connected() const {
    return db_ != nullptr;
}

bool SqliteConnection::set_query_timeout(std::chrono::milliseconds timeout) {
    if (!db_) {
        return false;
    }
    query_timeout_ = timeout;
    return true;
}

void SqliteConnection::close() {
    if (db_) {
        sqlite3_progress_handler(db_, 0, nullptr, nullptr);
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

// ============================================================================
// SqliteConnectionFactory
// ============================================================================

Result<std::unique_ptr<IDbConnection>> SqliteConnectionFactory::create(
    const ConnectionParams& params) {

    using Ret = Result<std::unique_ptr<IDbConnection>>;

    // A private in-memory database is empty unless writable; nothing else can see it
    const bool read_only = params.read_only && !params.is_in_memory();
    int flags = read_only ? SQLITE_OPEN_READONLY : SQLITE_OPEN_READWRITE;
    flags |= SQLITE_OPEN_NOMUTEX;

    sqlite3* db = nullptr;
    const int rc = sqlite3_open_v2(params.database.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        if (db) sqlite3_close_v2(db);
        const ErrorCode code = (rc == SQLITE_PERM || rc == SQLITE_AUTH)
            ? ErrorCode::INSUFFICIENT_PRIVILEGE : ErrorCode::CONNECTION_FAILED;
        utils::log::warn(std::format("SQLite open of {} failed: {}", params.display(), message));
        return Ret::error(code, std::format("Failed to open {}: {}", params.display(), message));
    }

    sqlite3_busy_timeout(db, static_cast<int>(params.connect_timeout.count()));

    auto connection = std::make_unique<SqliteConnection>(db);
    connection->set_query_timeout(params.query_timeout);
    if (read_only) {
        auto pragma = connection->execute("PRAGMA query_only = ON");
        if (pragma.is_error()) {
            utils::log::warn(std::format("SQLite query_only on {}: {}",
                params.display(), pragma.error_message()));
        }
    }
    return Ret::ok(std::move(connection));
}

} // namespace dbsurvey
