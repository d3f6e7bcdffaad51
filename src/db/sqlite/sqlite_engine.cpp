#include "db/sqlite/sqlite_engine.hpp"
#include "db/sqlite/sqlite_connection.hpp"
#include "core/utils.hpp"
#include "db/type_mapping.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <map>
#include <regex>

namespace dbsurvey {

namespace {

std::string upper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::string pragma(std::string_view name, std::string_view argument) {
    std::string escaped;
    escaped.reserve(argument.size());
    for (char c : argument) {
        escaped += c;
        if (c == '\'') escaped += '\'';
    }
    return std::format("PRAGMA {}('{}')", name, escaped);
}

} // namespace

Result<void> SqliteEngine::open(const ConnectionParams& params) {
    return open_pool(params, std::make_unique<SqliteConnectionFactory>());
}

bool SqliteEngine::supports(AdapterFeature feature) const {
    switch (feature) {
        case AdapterFeature::MULTI_DATABASE:
        case AdapterFeature::ROUTINES:
        case AdapterFeature::CUSTOM_TYPES:
        case AdapterFeature::SCHEMA_INFERENCE:
            return false;
        default:
            return true;
    }
}

std::string SqliteEngine::database_name() const {
    return params_.database.empty() ? std::string("main") : params_.database;
}

// ============================================================================
// Server / database metadata
// ============================================================================

Result<DatabaseInfo> SqliteEngine::describe_database() {
    DatabaseInfo info;
    info.name = database_name();
    info.access_level = AccessLevel::FULL;

    if (!params_.is_in_memory()) {
        auto pages = query("PRAGMA page_count");
        auto page_size = query("PRAGMA page_size");
        if (pages.is_error()) {
            return Result<DatabaseInfo>::propagate(pages);
        }
        if (page_size.is_error()) {
            return Result<DatabaseInfo>::propagate(page_size);
        }
        const auto& pc = pages.value();
        const auto& ps = page_size.value();
        if (!pc.rows.empty() && !ps.rows.empty()) {
            const auto count = cell_uint(pc, pc.rows.front(), "page_count").value_or(0);
            const auto size = cell_uint(ps, ps.rows.front(), "page_size").value_or(0);
            info.size_bytes = count * size;
        }
    }

    // Encoding is informational; a failure here does not fail the database
    auto encoding = query("PRAGMA encoding");
    if (encoding.is_ok() && !encoding.value().rows.empty()) {
        const auto& res = encoding.value();
        info.encoding = cell_text(res, res.rows.front(), "encoding");
    }
    return Result<DatabaseInfo>::ok(std::move(info));
}

Result<std::vector<DatabaseInfo>> SqliteEngine::enumerate_databases() {
    auto info = describe_database();
    if (info.is_error()) {
        return Result<std::vector<DatabaseInfo>>::propagate(info);
    }
    std::vector<DatabaseInfo> databases;
    databases.push_back(info.take_value());
    return Result<std::vector<DatabaseInfo>>::ok(std::move(databases));
}

Result<ServerInfo> SqliteEngine::describe_server() {
    auto rs = query("SELECT sqlite_version() AS version");
    if (rs.is_error()) {
        return Result<ServerInfo>::propagate(rs);
    }
    if (rs.value().rows.empty()) {
        return Result<ServerInfo>::error(ErrorCode::QUERY_FAILED, "sqlite_version() returned no rows");
    }

    const auto& res = rs.value();
    ServerInfo info;
    info.server_type = kType;
    info.version = std::format("SQLite {}", cell_string(res, res.rows.front(), "version"));
    info.host = database_name();
    // File access is all-or-nothing; there is no role model to report
    info.has_superuser_privileges = false;
    return Result<ServerInfo>::ok(std::move(info));
}

// ============================================================================
// Tables / columns / views
// ============================================================================

Result<std::vector<Column>> SqliteEngine::load_columns(const std::string& relation,
                                                       const std::string& create_sql,
                                                       std::optional<PrimaryKey>* primary_key) {
    auto rs = query(pragma("table_info", relation));
    if (rs.is_error()) {
        return Result<std::vector<Column>>::propagate(rs);
    }

    const auto& res = rs.value();
    size_t pk_columns = 0;
    for (const auto& row : res.rows) {
        if (cell_uint(res, row, "pk").value_or(0) > 0) ++pk_columns;
    }
    const bool declares_autoincrement = upper(create_sql).find("AUTOINCREMENT") != std::string::npos;

    std::vector<Column> columns;
    columns.reserve(res.rows.size());
    for (const auto& row : res.rows) {
        NativeTypeDescriptor native;
        native.type_name = cell_string(res, row, "type");
        native.full_type = native.type_name;

        Column col;
        col.name = cell_string(res, row, "name");
        col.native_type = native.type_name;
        col.data_type = map_type(kType, native);
        col.default_value = cell_text(res, row, "dflt_value");
        col.ordinal_position = static_cast<uint32_t>(cell_uint(res, row, "cid").value_or(0) + 1);
        col.is_primary_key = cell_uint(res, row, "pk").value_or(0) > 0;
        // PRIMARY KEY columns cannot hold NULL even where table_info says otherwise
        col.is_nullable = !cell_bool(res, row, "notnull") && !col.is_primary_key;
        // A lone INTEGER PRIMARY KEY aliases rowid and is assigned automatically
        col.is_auto_increment = col.is_primary_key && pk_columns == 1 &&
            (upper(native.type_name) == "INTEGER" || declares_autoincrement);
        columns.push_back(std::move(col));
    }

    if (primary_key) {
        // table_info's pk field is the 1-based position within the key
        std::vector<std::pair<uint64_t, std::string>> key_parts;
        for (const auto& row : res.rows) {
            if (const auto pos = cell_uint(res, row, "pk").value_or(0); pos > 0) {
                key_parts.emplace_back(pos, cell_string(res, row, "name"));
            }
        }
        if (!key_parts.empty()) {
            std::sort(key_parts.begin(), key_parts.end());
            PrimaryKey pk;
            for (auto& [pos, name] : key_parts) {
                pk.columns.push_back(std::move(name));
            }
            *primary_key = std::move(pk);
        }
    }
    return Result<std::vector<Column>>::ok(std::move(columns));
}

Result<std::vector<ForeignKey>> SqliteEngine::load_foreign_keys(const std::string& table) {
    auto rs = query(pragma("foreign_key_list", table));
    if (rs.is_error()) {
        return Result<std::vector<ForeignKey>>::propagate(rs);
    }

    const auto& res = rs.value();
    // Composite keys span several rows sharing an id; rows arrive ordered by seq
    std::map<uint64_t, ForeignKey> by_id;
    for (const auto& row : res.rows) {
        const auto id = cell_uint(res, row, "id").value_or(0);
        auto [it, inserted] = by_id.try_emplace(id);
        auto& fk = it->second;
        if (inserted) {
            fk.name = std::format("{}_fkey{}", table, id);
            fk.referenced_table = cell_string(res, row, "table");
            fk.on_update = parse_referential_action(cell_string(res, row, "on_update"));
            fk.on_delete = parse_referential_action(cell_string(res, row, "on_delete"));
        }
        fk.columns.push_back(cell_string(res, row, "from"));
        // NULL "to" means the parent's primary key
        fk.referenced_columns.push_back(cell_string(res, row, "to"));
    }

    std::vector<ForeignKey> keys;
    keys.reserve(by_id.size());
    for (auto& [id, fk] : by_id) {
        keys.push_back(std::move(fk));
    }
    return Result<std::vector<ForeignKey>>::ok(std::move(keys));
}

bool SqliteEngine::has_rowid(const Table& table) {
    auto rowid_check = query(std::format("SELECT rowid FROM {} LIMIT 1",
                                         quote_identifier(SqlDialect::SQLITE, table.name)));
    return rowid_check.is_ok();
}

Result<std::vector<Table>> SqliteEngine::load_tables() {
    static constexpr const char* TABLES_QUERY =
        "SELECT name, sql FROM sqlite_master "
        "WHERE type = 'table' AND name NOT LIKE 'sqlite_%' "
        "ORDER BY name";

    auto rs = query(TABLES_QUERY);
    if (rs.is_error()) {
        return Result<std::vector<Table>>::propagate(rs);
    }

    const auto& res = rs.value();
    std::vector<Table> tables;
    tables.reserve(res.rows.size());
    for (const auto& row : res.rows) {
        Table table;
        table.name = cell_string(res, row, "name");

        auto columns = load_columns(table.name, cell_string(res, row, "sql"), &table.primary_key);
        if (columns.is_error()) {
            return Result<std::vector<Table>>::propagate(columns);
        }
        table.columns = columns.take_value();

        auto fks = load_foreign_keys(table.name);
        if (fks.is_error()) {
            return Result<std::vector<Table>>::propagate(fks);
        }
        table.foreign_keys = fks.take_value();

        if (has_rowid(table)) {
            table.system_row_id = "rowid";
        }
        tables.push_back(std::move(table));
    }

    utils::log::info(std::format("Loaded {} tables from {}", tables.size(), params_.display()));
    loaded_tables_ = tables;
    return Result<std::vector<Table>>::ok(std::move(tables));
}

Result<std::vector<View>> SqliteEngine::load_views() {
    static constexpr const char* VIEWS_QUERY =
        "SELECT name, sql FROM sqlite_master "
        "WHERE type = 'view' AND name NOT LIKE 'sqlite_%' "
        "ORDER BY name";

    auto rs = query(VIEWS_QUERY);
    if (rs.is_error()) {
        return Result<std::vector<View>>::propagate(rs);
    }

    const auto& res = rs.value();
    std::vector<View> views;
    views.reserve(res.rows.size());
    for (const auto& row : res.rows) {
        View view;
        view.name = cell_string(res, row, "name");
        view.definition = cell_text(res, row, "sql");

        auto columns = load_columns(view.name, {});
        if (columns.is_error()) {
            // A view over a dropped table fails to resolve; keep the view itself
            utils::log::warn(std::format("Could not read columns of view {}: {}",
                                         view.name, columns.error_message()));
        } else {
            view.columns = columns.take_value();
        }
        views.push_back(std::move(view));
    }
    return Result<std::vector<View>>::ok(std::move(views));
}

// ============================================================================
// Indexes / constraints / triggers
// ============================================================================

Result<std::vector<Index>> SqliteEngine::load_indexes() {
    std::vector<std::string> table_names;
    if (loaded_tables_) {
        for (const auto& table : *loaded_tables_) {
            table_names.push_back(table.name);
        }
    } else {
        auto tables = query("SELECT name FROM sqlite_master "
                            "WHERE type = 'table' AND name NOT LIKE 'sqlite_%' ORDER BY name");
        if (tables.is_error()) {
            return Result<std::vector<Index>>::propagate(tables);
        }
        const auto& tres = tables.value();
        for (const auto& trow : tres.rows) {
            table_names.push_back(cell_string(tres, trow, "name"));
        }
    }

    std::vector<Index> indexes;
    for (const auto& table_name : table_names) {
        auto list = query(pragma("index_list", table_name));
        if (list.is_error()) {
            return Result<std::vector<Index>>::propagate(list);
        }
        const auto& lres = list.value();
        for (const auto& lrow : lres.rows) {
            Index index;
            index.name = cell_string(lres, lrow, "name");
            index.table_name = table_name;
            index.is_unique = cell_bool(lres, lrow, "unique");
            index.is_primary = cell_string(lres, lrow, "origin") == "pk";
            index.index_type = "btree";

            // index_xinfo also lists the auxiliary rowid; key = 1 marks real key columns
            auto info = query(pragma("index_xinfo", index.name));
            if (info.is_error()) {
                return Result<std::vector<Index>>::propagate(info);
            }
            const auto& ires = info.value();
            for (const auto& irow : ires.rows) {
                if (!cell_bool(ires, irow, "key")) continue;
                IndexColumn col;
                // NULL name means an expression column
                col.name = cell_text(ires, irow, "name").value_or("<expression>");
                col.direction = cell_bool(ires, irow, "desc") ? SortDirection::DESCENDING
                                                                : SortDirection::ASCENDING;
                index.columns.push_back(std::move(col));
            }
            indexes.push_back(std::move(index));
        }
    }
    loaded_indexes_ = indexes;
    return Result<std::vector<Index>>::ok(std::move(indexes));
}

Result<std::vector<Constraint>> SqliteEngine::load_constraints() {
    if (!loaded_tables_) {
        auto tables = load_tables();
        if (tables.is_error()) {
            return Result<std::vector<Constraint>>::propagate(tables);
        }
    }
    if (!loaded_indexes_) {
        auto indexes = load_indexes();
        if (indexes.is_error()) {
            return Result<std::vector<Constraint>>::propagate(indexes);
        }
    }
    return Result<std::vector<Constraint>>::ok(build_constraints(*loaded_tables_, *loaded_indexes_));
}

std::vector<Constraint> SqliteEngine::build_constraints(const std::vector<Table>& tables,
                                                        const std::vector<Index>& indexes) {
    std::vector<Constraint> constraints;
    for (const auto& table : tables) {
        if (table.primary_key) {
            Constraint pk;
            pk.name = std::format("{}_pkey", table.name);
            pk.table_name = table.name;
            pk.constraint_type = ConstraintType::PRIMARY_KEY;
            pk.columns = table.primary_key->columns;
            constraints.push_back(std::move(pk));
        }
        for (const auto& fk : table.foreign_keys) {
            Constraint con;
            con.name = fk.name.value_or(table.name + "_fkey");
            con.table_name = table.name;
            con.constraint_type = ConstraintType::FOREIGN_KEY;
            con.columns = fk.columns;
            con.referenced_table = fk.referenced_table;
            con.referenced_columns = fk.referenced_columns;
            con.on_delete = fk.on_delete;
            con.on_update = fk.on_update;
            constraints.push_back(std::move(con));
        }
    }

    // UNIQUE constraints are realized as sqlite_autoindex_* indexes
    for (const auto& index : indexes) {
        if (!index.is_unique || index.is_primary ||
            index.name.rfind("sqlite_autoindex_", 0) != 0) {
            continue;
        }
        Constraint con;
        con.name = index.name;
        con.table_name = index.table_name;
        con.constraint_type = ConstraintType::UNIQUE;
        for (const auto& col : index.columns) {
            con.columns.push_back(col.name);
        }
        constraints.push_back(std::move(con));
    }
    return constraints;
}

Trigger SqliteEngine::parse_trigger_sql(std::string_view sql) {
    static const std::regex header(
        R"(\bTRIGGER\b[\s\S]*?\b(BEFORE|AFTER|INSTEAD\s+OF)?\s*\b(INSERT|UPDATE|DELETE)\b)",
        std::regex::icase);

    Trigger trigger;
    trigger.timing = TriggerTiming::BEFORE;

    const std::string text(sql);
    std::smatch m;
    if (std::regex_search(text, m, header)) {
        if (m[1].matched) {
            const std::string timing = upper(m[1].str());
            trigger.timing = timing == "AFTER" ? TriggerTiming::AFTER
                           : timing == "BEFORE" ? TriggerTiming::BEFORE
                                                : TriggerTiming::INSTEAD_OF;
        }
        if (auto event = parse_trigger_event(upper(m[2].str()))) {
            trigger.events.push_back(*event);
        }
    }
    return trigger;
}

Result<std::vector<Trigger>> SqliteEngine::load_triggers() {
    static constexpr const char* TRIGGERS_QUERY =
        "SELECT name, tbl_name, sql FROM sqlite_master "
        "WHERE type = 'trigger' AND name NOT LIKE 'sqlite_%' "
        "ORDER BY name";

    auto rs = query(TRIGGERS_QUERY);
    if (rs.is_error()) {
        return Result<std::vector<Trigger>>::propagate(rs);
    }

    const auto& res = rs.value();
    std::vector<Trigger> triggers;
    triggers.reserve(res.rows.size());
    for (const auto& row : res.rows) {
        const std::string sql = cell_string(res, row, "sql");
        Trigger trigger = parse_trigger_sql(sql);
        trigger.name = cell_string(res, row, "name");
        trigger.table_name = cell_string(res, row, "tbl_name");
        trigger.definition = sql;
        triggers.push_back(std::move(trigger));
    }
    return Result<std::vector<Trigger>>::ok(std::move(triggers));
}

} // namespace dbsurvey
