#include "db/mongodb/mongo_engine.hpp"
#include "db/mongodb/schema_inferrer.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cstring>
#include <format>
#include <mutex>
#include <type_traits>
#include <variant>

namespace dbsurvey {

namespace {

// Server error codes (error API v2 reports them in the MONGOC_ERROR_SERVER domain)
constexpr uint32_t kUnauthorized = 13;
constexpr uint32_t kAuthenticationFailed = 18;
constexpr uint32_t kMaxTimeMSExpired = 50;

std::optional<std::string> find_string(const bson_t* doc, const char* dotted_key) {
    bson_iter_t iter;
    bson_iter_t found;
    if (!bson_iter_init(&iter, doc) || !bson_iter_find_descendant(&iter, dotted_key, &found)) {
        return std::nullopt;
    }
    if (!BSON_ITER_HOLDS_UTF8(&found)) {
        return std::nullopt;
    }
    uint32_t length = 0;
    const char* text = bson_iter_utf8(&found, &length);
    return std::string(text, length);
}

std::optional<int64_t> find_number(const bson_t* doc, const char* dotted_key) {
    bson_iter_t iter;
    bson_iter_t found;
    if (!bson_iter_init(&iter, doc) || !bson_iter_find_descendant(&iter, dotted_key, &found)) {
        return std::nullopt;
    }
    if (!BSON_ITER_HOLDS_NUMBER(&found)) {
        return std::nullopt;
    }
    return bson_iter_as_int64(&found);
}

bool find_bool(const bson_t* doc, const char* key) {
    bson_iter_t iter;
    return bson_iter_init_find(&iter, doc, key) && bson_iter_as_bool(&iter);
}

/**
 * @brief Static view over an embedded document; valid while the parent lives
 */
bool find_document(const bson_t* doc, const char* key, bson_t* out) {
    bson_iter_t iter;
    if (!bson_iter_init_find(&iter, doc, key) || !BSON_ITER_HOLDS_DOCUMENT(&iter)) {
        return false;
    }
    uint32_t length = 0;
    const uint8_t* data = nullptr;
    bson_iter_document(&iter, &length, &data);
    return bson_init_static(out, data, length);
}

std::string command_name(const bson_t* command) {
    bson_iter_t iter;
    if (bson_iter_init(&iter, command) && bson_iter_next(&iter)) {
        return bson_iter_key(&iter);
    }
    return "command";
}

} // namespace

ErrorCode classify_mongo_error(const bson_error_t& error) {
    const std::string_view message(error.message);
    if (error.domain == MONGOC_ERROR_SERVER_SELECTION || error.domain == MONGOC_ERROR_STREAM) {
        return message.find("timed out") != std::string_view::npos ||
               message.find("timeout") != std::string_view::npos
            ? ErrorCode::CONNECTION_TIMEOUT
            : ErrorCode::CONNECTION_FAILED;
    }
    if (error.domain == MONGOC_ERROR_CLIENT && error.code == MONGOC_ERROR_CLIENT_AUTHENTICATE) {
        return ErrorCode::INSUFFICIENT_PRIVILEGE;
    }
    if (error.code == kUnauthorized || error.code == kAuthenticationFailed) {
        return ErrorCode::INSUFFICIENT_PRIVILEGE;
    }
    if (error.code == kMaxTimeMSExpired) {
        return ErrorCode::QUERY_TIMEOUT;
    }
    return ErrorCode::QUERY_FAILED;
}

bool MongoEngine::supports(AdapterFeature feature) const {
    switch (feature) {
        case AdapterFeature::ROUTINES:
        case AdapterFeature::TRIGGERS:
        case AdapterFeature::CUSTOM_TYPES:
        case AdapterFeature::CONNECTION_POOLING:
            return false;
        default:
            return true;
    }
}

int64_t MongoEngine::max_time_ms() const {
    return static_cast<int64_t>(params_.query_timeout.count());
}

// ============================================================================
// Connection
// ============================================================================

Result<void> MongoEngine::open(const ConnectionParams& params) {
    // libmongoc requires one process-wide init before any client exists
    static std::once_flag init_flag;
    std::call_once(init_flag, [] { mongoc_init(); });

    params_ = params;

    bson_error_t error;
    const std::string url = params_.to_url();
    MongocUriPtr uri(mongoc_uri_new_with_error(url.c_str(), &error));
    if (!uri) {
        // The parser message may quote the URI, which can carry credentials
        return Result<void>::error(ErrorCode::CONFIGURATION_ERROR,
            std::format("Invalid MongoDB connection string for {}", params_.display()));
    }

    const auto connect_ms = static_cast<int32_t>(params_.connect_timeout.count());
    mongoc_uri_set_option_as_int32(uri.get(), MONGOC_URI_CONNECTTIMEOUTMS, connect_ms);
    mongoc_uri_set_option_as_int32(uri.get(), MONGOC_URI_SERVERSELECTIONTIMEOUTMS, connect_ms);
    mongoc_uri_set_option_as_int32(uri.get(), MONGOC_URI_SOCKETTIMEOUTMS,
                                   static_cast<int32_t>(params_.query_timeout.count() + connect_ms));
    mongoc_uri_set_option_as_utf8(uri.get(), MONGOC_URI_APPNAME, params_.application_name.c_str());

    client_.reset(mongoc_client_new_from_uri_with_error(uri.get(), &error));
    if (!client_) {
        return Result<void>::error(ErrorCode::CONNECTION_FAILED,
            std::format("Could not create MongoDB client for {}: {}", params_.display(), error.message));
    }
    mongoc_client_set_error_api(client_.get(), MONGOC_ERROR_API_VERSION_2);

    // Client creation does not touch the network; prove the server and credentials
    auto pinged = ping();
    if (pinged.is_error()) {
        client_.reset();
        return pinged;
    }
    return Result<void>::ok();
}

Result<void> MongoEngine::ping() {
    BsonPtr command(BCON_NEW("ping", BCON_INT32(1)));
    auto reply = run_command("admin", command.get());
    if (reply.is_error()) {
        return Result<void>::propagate(reply);
    }
    return Result<void>::ok();
}

Result<BsonPtr> MongoEngine::run_command(const std::string& db, const bson_t* command) {
    if (!client_) {
        return Result<BsonPtr>::error(ErrorCode::CONNECTION_FAILED, "Engine is not connected");
    }
    ScopedBson reply;
    bson_error_t error;
    if (!mongoc_client_command_simple(client_.get(), db.c_str(), command, nullptr, reply.get(), &error)) {
        return Result<BsonPtr>::error(classify_mongo_error(error),
            std::format("{} on {} failed: {}", command_name(command), db, error.message));
    }
    return Result<BsonPtr>::ok(BsonPtr(bson_copy(reply.get())));
}

Result<std::vector<BsonPtr>> MongoEngine::drain(mongoc_cursor_t* cursor, std::string_view what) {
    std::vector<BsonPtr> documents;
    const bson_t* doc = nullptr;
    while (mongoc_cursor_next(cursor, &doc)) {
        documents.emplace_back(bson_copy(doc));
    }
    bson_error_t error;
    if (mongoc_cursor_error(cursor, &error)) {
        return Result<std::vector<BsonPtr>>::error(classify_mongo_error(error),
            std::format("{} failed: {}", what, error.message));
    }
    return Result<std::vector<BsonPtr>>::ok(std::move(documents));
}

Result<void> MongoEngine::require_database() const {
    if (params_.database.empty()) {
        return Result<void>::error(ErrorCode::INVALID_CONNECTION_TARGET,
                                   "No database selected on this connection");
    }
    return Result<void>::ok();
}

MongocCollectionPtr MongoEngine::collection(const std::string& name) const {
    return MongocCollectionPtr(
        mongoc_client_get_collection(client_.get(), params_.database.c_str(), name.c_str()));
}

// ============================================================================
// Server / database metadata
// ============================================================================

Result<std::vector<DatabaseInfo>> MongoEngine::enumerate_databases() {
    // authorizedDatabases lets users without the listDatabases action see theirs
    BsonPtr command(BCON_NEW("listDatabases", BCON_INT32(1),
                             "authorizedDatabases", BCON_BOOL(true),
                             "maxTimeMS", BCON_INT64(max_time_ms())));
    auto reply = run_command("admin", command.get());
    if (reply.is_error()) {
        return Result<std::vector<DatabaseInfo>>::propagate(reply);
    }

    std::vector<DatabaseInfo> databases;
    bson_iter_t iter;
    bson_iter_t entries;
    if (bson_iter_init_find(&iter, reply.value().get(), "databases") &&
        BSON_ITER_HOLDS_ARRAY(&iter) && bson_iter_recurse(&iter, &entries)) {
        while (bson_iter_next(&entries)) {
            bson_t entry;
            uint32_t length = 0;
            const uint8_t* data = nullptr;
            if (!BSON_ITER_HOLDS_DOCUMENT(&entries)) continue;
            bson_iter_document(&entries, &length, &data);
            if (!bson_init_static(&entry, data, length)) continue;

            DatabaseInfo info;
            info.name = find_string(&entry, "name").value_or("");
            if (auto size = find_number(&entry, "sizeOnDisk"); size && *size >= 0) {
                info.size_bytes = static_cast<uint64_t>(*size);
            }
            info.is_system_database = is_known_system_database(kType, info.name);
            info.access_level = AccessLevel::FULL;
            databases.push_back(std::move(info));
        }
    }

    std::sort(databases.begin(), databases.end(),
              [](const DatabaseInfo& a, const DatabaseInfo& b) { return a.name < b.name; });
    return Result<std::vector<DatabaseInfo>>::ok(std::move(databases));
}

Result<ServerInfo> MongoEngine::describe_server() {
    BsonPtr build_info(BCON_NEW("buildInfo", BCON_INT32(1)));
    auto reply = run_command("admin", build_info.get());
    if (reply.is_error()) {
        return Result<ServerInfo>::propagate(reply);
    }

    ServerInfo info;
    info.server_type = kType;
    info.version = find_string(reply.value().get(), "version").value_or("unknown");
    info.host = params_.host;
    info.port = params_.effective_port();

    BsonPtr status_cmd(BCON_NEW("connectionStatus", BCON_INT32(1)));
    auto status = run_command("admin", status_cmd.get());
    if (status.is_error()) {
        utils::log::warn(std::format("connectionStatus unavailable on {}: {}",
                                     params_.display(), status.error_message()));
        info.connection_user = params_.user;
        return Result<ServerInfo>::ok(std::move(info));
    }

    const bson_t* doc = status.value().get();
    info.connection_user = find_string(doc, "authInfo.authenticatedUsers.0.user").value_or(params_.user);

    bson_iter_t iter;
    bson_iter_t roles;
    if (bson_iter_init(&iter, doc) &&
        bson_iter_find_descendant(&iter, "authInfo.authenticatedUserRoles", &roles) &&
        BSON_ITER_HOLDS_ARRAY(&roles)) {
        bson_iter_t role;
        if (bson_iter_recurse(&roles, &role)) {
            while (bson_iter_next(&role)) {
                bson_iter_t name;
                if (bson_iter_recurse(&role, &name) && bson_iter_find(&name, "role") &&
                    BSON_ITER_HOLDS_UTF8(&name)) {
                    const std::string_view role_name(bson_iter_utf8(&name, nullptr));
                    if (role_name == "root" || role_name == "__system") {
                        info.has_superuser_privileges = true;
                    }
                }
            }
        }
    }
    return Result<ServerInfo>::ok(std::move(info));
}

Result<DatabaseInfo> MongoEngine::describe_database() {
    if (auto guard = require_database(); guard.is_error()) {
        return Result<DatabaseInfo>::propagate(guard);
    }

    BsonPtr command(BCON_NEW("dbStats", BCON_INT32(1),
                             "scale", BCON_INT32(1),
                             "maxTimeMS", BCON_INT64(max_time_ms())));
    auto reply = run_command(params_.database, command.get());
    if (reply.is_error()) {
        return Result<DatabaseInfo>::propagate(reply);
    }

    DatabaseInfo info;
    info.name = params_.database;
    info.is_system_database = is_known_system_database(kType, info.name);
    info.access_level = AccessLevel::FULL;
    const auto storage = find_number(reply.value().get(), "storageSize");
    const auto indexes = find_number(reply.value().get(), "indexSize");
    if (storage || indexes) {
        info.size_bytes = static_cast<uint64_t>(std::max<int64_t>(0, storage.value_or(0) + indexes.value_or(0)));
    }
    return Result<DatabaseInfo>::ok(std::move(info));
}

// ============================================================================
// Collections / views / indexes
// ============================================================================

Result<std::vector<BsonPtr>> MongoEngine::list_collections(std::string_view type) {
    using Ret = Result<std::vector<BsonPtr>>;
    if (auto guard = require_database(); guard.is_error()) {
        return Ret::propagate(guard);
    }

    const std::string type_name(type);
    BsonPtr opts(BCON_NEW("filter", "{", "type", BCON_UTF8(type_name.c_str()), "}",
                          "maxTimeMS", BCON_INT64(max_time_ms())));
    MongocDatabasePtr db(mongoc_client_get_database(client_.get(), params_.database.c_str()));
    MongocCursorPtr cursor(mongoc_database_find_collections_with_opts(db.get(), opts.get()));

    auto entries = drain(cursor.get(), "listCollections");
    if (entries.is_error()) {
        return entries;
    }

    std::vector<BsonPtr> kept;
    for (auto& entry : entries.value()) {
        const auto name = find_string(entry.get(), "name").value_or("");
        if (name.empty() || name.rfind("system.", 0) == 0) continue;
        kept.push_back(std::move(entry));
    }
    std::sort(kept.begin(), kept.end(), [](const BsonPtr& a, const BsonPtr& b) {
        return find_string(a.get(), "name").value_or("") < find_string(b.get(), "name").value_or("");
    });
    return Ret::ok(std::move(kept));
}

Result<std::vector<Table>> MongoEngine::load_tables() {
    auto entries = list_collections("collection");
    if (entries.is_error()) {
        return Result<std::vector<Table>>::propagate(entries);
    }

    std::vector<Table> tables;
    tables.reserve(entries.value().size());
    for (const auto& entry : entries.value()) {
        Table table;
        table.name = find_string(entry.get(), "name").value_or("");
        table.primary_key = PrimaryKey{std::string("_id_"), {"_id"}};

        BsonPtr filter(bson_new());
        BsonPtr opts(BCON_NEW("limit", BCON_INT64(static_cast<int64_t>(SchemaInferrer::kDefaultDocumentLimit)),
                              "maxTimeMS", BCON_INT64(max_time_ms())));
        auto coll = collection(table.name);
        MongocCursorPtr cursor(mongoc_collection_find_with_opts(coll.get(), filter.get(), opts.get(), nullptr));
        auto docs = drain(cursor.get(), std::format("Schema sample of {}", table.name));
        if (docs.is_ok()) {
            SchemaInferrer inferrer;
            for (const auto& doc : docs.value()) {
                inferrer.observe(doc.get());
            }
            table.columns = inferrer.columns();
        } else {
            // The collection still exists; report it without inferred fields
            utils::log::warn(docs.error_message());
        }

        table.row_count = count_rows(table);
        tables.push_back(std::move(table));
    }

    utils::log::info(std::format("Loaded {} collections from {}", tables.size(), params_.display()));
    return Result<std::vector<Table>>::ok(std::move(tables));
}

Result<std::vector<View>> MongoEngine::load_views() {
    auto entries = list_collections("view");
    if (entries.is_error()) {
        return Result<std::vector<View>>::propagate(entries);
    }

    std::vector<View> views;
    for (const auto& entry : entries.value()) {
        View view;
        view.name = find_string(entry.get(), "name").value_or("");
        // options holds {viewOn, pipeline}
        bson_t options;
        if (find_document(entry.get(), "options", &options)) {
            view.definition = bson_to_json(&options);
        }
        views.push_back(std::move(view));
    }
    return Result<std::vector<View>>::ok(std::move(views));
}

Result<std::vector<Index>> MongoEngine::load_indexes() {
    auto entries = list_collections("collection");
    if (entries.is_error()) {
        return Result<std::vector<Index>>::propagate(entries);
    }

    std::vector<Index> indexes;
    for (const auto& entry : entries.value()) {
        const std::string coll_name = find_string(entry.get(), "name").value_or("");
        auto coll = collection(coll_name);
        BsonPtr opts(BCON_NEW("maxTimeMS", BCON_INT64(max_time_ms())));
        MongocCursorPtr cursor(mongoc_collection_find_indexes_with_opts(coll.get(), opts.get()));

        auto specs = drain(cursor.get(), std::format("listIndexes on {}", coll_name));
        if (specs.is_error()) {
            return Result<std::vector<Index>>::propagate(specs);
        }

        for (const auto& spec : specs.value()) {
            Index index;
            index.name = find_string(spec.get(), "name").value_or("");
            index.table_name = coll_name;
            index.is_primary = index.name == "_id_";
            index.is_unique = index.is_primary || find_bool(spec.get(), "unique");

            bson_t key;
            bson_iter_t iter;
            if (find_document(spec.get(), "key", &key) && bson_iter_init(&iter, &key)) {
                while (bson_iter_next(&iter)) {
                    IndexColumn col;
                    col.name = bson_iter_key(&iter);
                    if (BSON_ITER_HOLDS_NUMBER(&iter)) {
                        col.direction = bson_iter_as_int64(&iter) < 0 ? SortDirection::DESCENDING
                                                                      : SortDirection::ASCENDING;
                    } else if (BSON_ITER_HOLDS_UTF8(&iter)) {
                        // "text", "hashed", "2dsphere", ...
                        index.index_type = std::string(bson_iter_utf8(&iter, nullptr));
                    }
                    index.columns.push_back(std::move(col));
                }
            }
            indexes.push_back(std::move(index));
        }
    }
    return Result<std::vector<Index>>::ok(std::move(indexes));
}

// ============================================================================
// Sampling
// ============================================================================

BsonPtr MongoEngine::build_sort_document(const OrderingStrategy& strategy) {
    return std::visit([](const auto& s) -> BsonPtr {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, ordering::Unordered>) {
            return nullptr;
        } else {
            BsonPtr sort(bson_new());
            if constexpr (std::is_same_v<T, ordering::PrimaryKey>) {
                for (const auto& column : s.columns) {
                    bson_append_int32(sort.get(), column.c_str(), -1, -1);
                }
            } else if constexpr (std::is_same_v<T, ordering::Timestamp>) {
                bson_append_int32(sort.get(), s.column.c_str(), -1,
                                  s.direction == SortDirection::ASCENDING ? 1 : -1);
            } else if constexpr (std::is_same_v<T, ordering::AutoIncrement>) {
                bson_append_int32(sort.get(), s.column.c_str(), -1, -1);
            } else {
                bson_append_int32(sort.get(), "$natural", -1, -1);
            }
            return sort;
        }
    }, strategy);
}

Result<std::vector<nlohmann::json>> MongoEngine::fetch_sample(
    const Table& table, const OrderingStrategy& strategy, const SampleRequest& request) {

    using Ret = Result<std::vector<nlohmann::json>>;
    if (auto guard = require_database(); guard.is_error()) {
        return Ret::propagate(guard);
    }

    auto coll = collection(table.name);
    MongocCursorPtr cursor;
    if (BsonPtr sort = build_sort_document(strategy)) {
        BsonPtr filter(bson_new());
        BsonPtr opts(bson_new());
        BSON_APPEND_DOCUMENT(opts.get(), "sort", sort.get());
        BSON_APPEND_INT64(opts.get(), "limit", static_cast<int64_t>(request.limit));
        BSON_APPEND_INT64(opts.get(), "maxTimeMS", static_cast<int64_t>(request.timeout.count()));
        cursor.reset(mongoc_collection_find_with_opts(coll.get(), filter.get(), opts.get(), nullptr));
    } else {
        BsonPtr pipeline(BCON_NEW("pipeline", "[",
                                  "{", "$sample", "{", "size", BCON_INT64(static_cast<int64_t>(request.limit)), "}", "}",
                                  "]"));
        BsonPtr opts(BCON_NEW("maxTimeMS", BCON_INT64(static_cast<int64_t>(request.timeout.count()))));
        cursor.reset(mongoc_collection_aggregate(coll.get(), MONGOC_QUERY_NONE,
                                                 pipeline.get(), opts.get(), nullptr));
    }

    auto docs = drain(cursor.get(), std::format("Sampling {}", table.name));
    if (docs.is_error()) {
        return Ret::propagate(docs);
    }

    std::vector<nlohmann::json> rows;
    rows.reserve(docs.value().size());
    for (const auto& doc : docs.value()) {
        auto row = nlohmann::json::parse(bson_to_json(doc.get()), nullptr, false);
        if (row.is_discarded()) {
            return Ret::error(ErrorCode::INTERNAL_ERROR,
                              std::format("Document in {} is not representable as JSON", table.name));
        }
        rows.push_back(std::move(row));
    }
    return Ret::ok(std::move(rows));
}

std::optional<uint64_t> MongoEngine::count_rows(const Table& table) {
    if (table.row_count) {
        return table.row_count;
    }
    if (!client_ || params_.database.empty()) {
        return std::nullopt;
    }
    auto coll = collection(table.name);
    BsonPtr opts(BCON_NEW("maxTimeMS", BCON_INT64(max_time_ms())));
    bson_error_t error;
    const int64_t count = mongoc_collection_estimated_document_count(coll.get(), opts.get(),
                                                                     nullptr, nullptr, &error);
    if (count < 0) {
        utils::log::warn(std::format("Could not count {}: {}", table.name, error.message));
        return std::nullopt;
    }
    return static_cast<uint64_t>(count);
}

} // namespace dbsurvey
