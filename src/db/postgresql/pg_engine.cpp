#include "db/postgresql/pg_engine.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_type_map.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace dbsurvey {

namespace {

// Unit separator; catalog identifiers may contain commas
constexpr char kListSeparator = '\x1f';

constexpr const char* kExcludedSchemas =
    "('pg_catalog', 'information_schema', 'pg_toast')";

// tgtype bits (see catalog/pg_trigger.h)
constexpr int kTriggerBefore = 1 << 1;
constexpr int kTriggerInsert = 1 << 2;
constexpr int kTriggerDelete = 1 << 3;
constexpr int kTriggerUpdate = 1 << 4;
constexpr int kTriggerTruncate = 1 << 5;
constexpr int kTriggerInstead = 1 << 6;

std::vector<std::string> split_list(const std::optional<std::string>& text) {
    if (!text || text->empty()) return {};
    return utils::split(*text, kListSeparator);
}

std::optional<uint32_t> to_u32(std::optional<uint64_t> v) {
    if (!v) return std::nullopt;
    return static_cast<uint32_t>(*v);
}

ConstraintType constraint_type_from_code(const std::string& code) {
    if (code == "p") return ConstraintType::PRIMARY_KEY;
    if (code == "f") return ConstraintType::FOREIGN_KEY;
    if (code == "u") return ConstraintType::UNIQUE;
    return ConstraintType::CHECK;
}

ParameterMode parameter_mode_from_code(const std::string& code) {
    if (code == "o" || code == "t") return ParameterMode::OUT;
    if (code == "b") return ParameterMode::INOUT;
    return ParameterMode::IN;
}

UnifiedDataType map_udt(const std::string& udt_name) {
    return map_type(DatabaseType::POSTGRESQL, NativeTypeDescriptor{"", udt_name, {}, {}, {}});
}

} // namespace

Result<void> PgEngine::open(const ConnectionParams& params) {
    return open_pool(params, std::make_unique<PgConnectionFactory>());
}

bool PgEngine::supports(AdapterFeature feature) const {
    return feature != AdapterFeature::SCHEMA_INFERENCE;
}

// ============================================================================
// Server / database metadata
// ============================================================================

Result<std::vector<DatabaseInfo>> PgEngine::enumerate_databases() {
    // pg_database_size() needs CONNECT; only ask for it where we have that
    static constexpr const char* DATABASES_QUERY =
        "SELECT "
        "    d.datname AS name, "
        "    r.rolname AS owner, "
        "    pg_encoding_to_char(d.encoding) AS encoding, "
        "    d.datcollate AS collation, "
        "    d.datistemplate AS is_template, "
        "    d.datallowconn AS allows_connections, "
        "    has_database_privilege(d.datname, 'CONNECT') AS can_connect, "
        "    CASE WHEN has_database_privilege(d.datname, 'CONNECT') "
        "         THEN pg_database_size(d.datname) END AS size_bytes "
        "FROM pg_database d "
        "LEFT JOIN pg_roles r ON d.datdba = r.oid "
        "ORDER BY d.datname";

    auto rs = query(DATABASES_QUERY);
    if (rs.is_error()) {
        return Result<std::vector<DatabaseInfo>>::propagate(rs);
    }

    const auto& res = rs.value();
    std::vector<DatabaseInfo> databases;
    databases.reserve(res.rows.size());
    for (const auto& row : res.rows) {
        DatabaseInfo info;
        info.name = cell_string(res, row, "name");
        info.owner = cell_text(res, row, "owner");
        info.encoding = cell_text(res, row, "encoding");
        info.collation = cell_text(res, row, "collation");
        info.size_bytes = cell_uint(res, row, "size_bytes");

        const bool is_template = cell_bool(res, row, "is_template");
        info.is_system_database = is_template ||
            is_known_system_database(kType, info.name);

        const bool reachable = cell_bool(res, row, "allows_connections") &&
                               cell_bool(res, row, "can_connect");
        info.access_level = reachable ? AccessLevel::FULL : AccessLevel::NONE;
        databases.push_back(std::move(info));
    }
    return Result<std::vector<DatabaseInfo>>::ok(std::move(databases));
}

Result<ServerInfo> PgEngine::describe_server() {
    static constexpr const char* SERVER_QUERY =
        "SELECT "
        "    current_setting('server_version') AS version, "
        "    current_user AS connection_user, "
        "    COALESCE((SELECT rolsuper FROM pg_roles WHERE rolname = current_user), false) AS is_superuser";

    auto rs = query(SERVER_QUERY);
    if (rs.is_error()) {
        return Result<ServerInfo>::propagate(rs);
    }
    if (rs.value().rows.empty()) {
        return Result<ServerInfo>::error(ErrorCode::QUERY_FAILED, "Server information query returned no rows");
    }

    const auto& res = rs.value();
    const auto& row = res.rows.front();

    ServerInfo info;
    info.server_type = kType;
    info.version = cell_string(res, row, "version");
    info.connection_user = cell_string(res, row, "connection_user");
    info.has_superuser_privileges = cell_bool(res, row, "is_superuser");
    info.host = params_.host;
    info.port = params_.effective_port();
    return Result<ServerInfo>::ok(std::move(info));
}

Result<DatabaseInfo> PgEngine::describe_database() {
    static constexpr const char* DATABASE_QUERY =
        "SELECT "
        "    d.datname AS name, "
        "    pg_database_size(d.datname) AS size_bytes, "
        "    pg_encoding_to_char(d.encoding) AS encoding, "
        "    d.datcollate AS collation, "
        "    r.rolname AS owner, "
        "    d.datistemplate AS is_template "
        "FROM pg_database d "
        "LEFT JOIN pg_roles r ON d.datdba = r.oid "
        "WHERE d.datname = current_database()";

    auto rs = query(DATABASE_QUERY);
    if (rs.is_error()) {
        return Result<DatabaseInfo>::propagate(rs);
    }
    if (rs.value().rows.empty()) {
        return Result<DatabaseInfo>::error(ErrorCode::QUERY_FAILED, "current_database() not found in pg_database");
    }

    const auto& res = rs.value();
    const auto& row = res.rows.front();

    DatabaseInfo info;
    info.name = cell_string(res, row, "name");
    info.size_bytes = cell_uint(res, row, "size_bytes");
    info.encoding = cell_text(res, row, "encoding");
    info.collation = cell_text(res, row, "collation");
    info.owner = cell_text(res, row, "owner");
    info.is_system_database = cell_bool(res, row, "is_template") ||
        is_known_system_database(kType, info.name);
    return Result<DatabaseInfo>::ok(std::move(info));
}

// ============================================================================
// Tables / columns / views
// ============================================================================

Result<PgEngine::ColumnMap> PgEngine::load_columns() {
    static const std::string COLUMNS_QUERY = std::format(
        "SELECT "
        "    c.table_schema, "
        "    c.table_name, "
        "    c.column_name, "
        "    c.data_type, "
        "    c.udt_name, "
        "    c.character_maximum_length, "
        "    c.numeric_precision, "
        "    c.numeric_scale, "
        "    c.is_nullable, "
        "    c.column_default, "
        "    c.is_identity, "
        "    c.ordinal_position, "
        "    col_description(pc.oid, pa.attnum) AS column_comment "
        "FROM information_schema.columns c "
        "LEFT JOIN pg_namespace pn ON pn.nspname = c.table_schema "
        "LEFT JOIN pg_class pc ON pc.relname = c.table_name AND pc.relnamespace = pn.oid "
        "LEFT JOIN pg_attribute pa ON pa.attrelid = pc.oid AND pa.attname = c.column_name "
        "WHERE c.table_schema NOT IN {} "
        "ORDER BY c.table_schema, c.table_name, c.ordinal_position",
        kExcludedSchemas);

    auto rs = query(COLUMNS_QUERY);
    if (rs.is_error()) {
        return Result<ColumnMap>::propagate(rs);
    }

    const auto& res = rs.value();
    ColumnMap columns;
    for (const auto& row : res.rows) {
        NativeTypeDescriptor native;
        native.type_name = cell_string(res, row, "data_type");
        native.full_type = cell_string(res, row, "udt_name");
        native.max_length = to_u32(cell_uint(res, row, "character_maximum_length"));
        native.numeric_precision = to_u32(cell_uint(res, row, "numeric_precision"));
        native.numeric_scale = to_u32(cell_uint(res, row, "numeric_scale"));

        Column col;
        col.name = cell_string(res, row, "column_name");
        col.data_type = map_type(kType, native);
        col.native_type = native.type_name == "USER-DEFINED" || native.type_name == "ARRAY"
            ? native.full_type : native.type_name;
        col.is_nullable = cell_string(res, row, "is_nullable") == "YES";
        col.default_value = cell_text(res, row, "column_default");
        col.comment = cell_text(res, row, "column_comment");
        col.ordinal_position = static_cast<uint32_t>(cell_uint(res, row, "ordinal_position").value_or(0));
        // serial columns default to nextval(); identity columns say so directly
        col.is_auto_increment = cell_string(res, row, "is_identity") == "YES" ||
            (col.default_value && col.default_value->starts_with("nextval("));

        columns[{cell_string(res, row, "table_schema"), cell_string(res, row, "table_name")}]
            .push_back(std::move(col));
    }
    return Result<ColumnMap>::ok(std::move(columns));
}

Result<std::vector<Table>> PgEngine::load_tables() {
    static const std::string TABLES_QUERY = std::format(
        "SELECT "
        "    n.nspname AS table_schema, "
        "    c.relname AS table_name, "
        "    obj_description(c.oid, 'pg_class') AS table_comment, "
        "    CASE WHEN c.reltuples > 0 THEN c.reltuples::bigint END AS estimated_rows "
        "FROM pg_class c "
        "JOIN pg_namespace n ON n.oid = c.relnamespace "
        "WHERE c.relkind IN ('r', 'p') "
        "  AND n.nspname NOT IN {} "
        "  AND n.nspname NOT LIKE 'pg_temp%' "
        "  AND has_table_privilege(c.oid, 'SELECT') "
        "ORDER BY n.nspname, c.relname",
        kExcludedSchemas);

    auto rs = query(TABLES_QUERY);
    if (rs.is_error()) {
        return Result<std::vector<Table>>::propagate(rs);
    }

    auto columns = load_columns();
    if (columns.is_error()) {
        return Result<std::vector<Table>>::propagate(columns);
    }

    // PK and FK come from the same pg_constraint read as load_constraints()
    auto constraints = load_constraints();
    if (constraints.is_error()) {
        return Result<std::vector<Table>>::propagate(constraints);
    }

    const auto& res = rs.value();
    std::vector<Table> tables;
    tables.reserve(res.rows.size());
    for (const auto& row : res.rows) {
        Table table;
        table.schema = cell_string(res, row, "table_schema");
        table.name = cell_string(res, row, "table_name");
        table.comment = cell_text(res, row, "table_comment");
        table.row_count = cell_uint(res, row, "estimated_rows");

        if (auto it = columns.value().find({*table.schema, table.name}); it != columns.value().end()) {
            table.columns = std::move(it->second);
        }

        for (const auto& con : constraints.value()) {
            if (con.schema != table.schema || con.table_name != table.name) continue;
            if (con.constraint_type == ConstraintType::PRIMARY_KEY) {
                table.primary_key = PrimaryKey{con.name, con.columns};
                for (auto& col : table.columns) {
                    if (std::find(con.columns.begin(), con.columns.end(), col.name) != con.columns.end()) {
                        col.is_primary_key = true;
                    }
                }
            } else if (con.constraint_type == ConstraintType::FOREIGN_KEY && con.referenced_table) {
                ForeignKey fk;
                fk.name = con.name;
                fk.columns = con.columns;
                fk.referenced_table = *con.referenced_table;
                fk.referenced_columns = con.referenced_columns;
                fk.on_delete = con.on_delete;
                fk.on_update = con.on_update;
                table.foreign_keys.push_back(std::move(fk));
            }
        }
        tables.push_back(std::move(table));
    }

    utils::log::info(std::format("Loaded {} tables from {}", tables.size(), params_.display()));
    return Result<std::vector<Table>>::ok(std::move(tables));
}

Result<std::vector<View>> PgEngine::load_views() {
    static const std::string VIEWS_QUERY = std::format(
        "SELECT "
        "    n.nspname AS view_schema, "
        "    c.relname AS view_name, "
        "    pg_get_viewdef(c.oid, true) AS view_definition, "
        "    obj_description(c.oid, 'pg_class') AS view_comment "
        "FROM pg_class c "
        "JOIN pg_namespace n ON n.oid = c.relnamespace "
        "WHERE c.relkind IN ('v', 'm') "
        "  AND n.nspname NOT IN {} "
        "ORDER BY n.nspname, c.relname",
        kExcludedSchemas);

    auto rs = query(VIEWS_QUERY);
    if (rs.is_error()) {
        return Result<std::vector<View>>::propagate(rs);
    }
    auto columns = load_columns();
    if (columns.is_error()) {
        return Result<std::vector<View>>::propagate(columns);
    }

    const auto& res = rs.value();
    std::vector<View> views;
    views.reserve(res.rows.size());
    for (const auto& row : res.rows) {
        View view;
        view.schema = cell_string(res, row, "view_schema");
        view.name = cell_string(res, row, "view_name");
        view.definition = cell_text(res, row, "view_definition");
        view.comment = cell_text(res, row, "view_comment");
        if (auto it = columns.value().find({*view.schema, view.name}); it != columns.value().end()) {
            view.columns = std::move(it->second);
        }
        views.push_back(std::move(view));
    }
    return Result<std::vector<View>>::ok(std::move(views));
}

// ============================================================================
// Indexes / constraints
// ============================================================================

Result<std::vector<Index>> PgEngine::load_indexes() {
    static const std::string INDEXES_QUERY = std::format(
        "SELECT "
        "    n.nspname AS table_schema, "
        "    t.relname AS table_name, "
        "    i.relname AS index_name, "
        "    am.amname AS index_type, "
        "    ix.indisunique AS is_unique, "
        "    ix.indisprimary AS is_primary, "
        "    pg_get_indexdef(ix.indexrelid, k.ord, true) AS column_name, "
        "    (ix.indoption[k.ord - 1] & 1) = 1 AS is_descending "
        "FROM pg_index ix "
        "JOIN pg_class i ON i.oid = ix.indexrelid "
        "JOIN pg_class t ON t.oid = ix.indrelid "
        "JOIN pg_namespace n ON n.oid = t.relnamespace "
        "JOIN pg_am am ON am.oid = i.relam "
        "CROSS JOIN LATERAL generate_series(1, ix.indnkeyatts) AS k(ord) "
        "WHERE n.nspname NOT IN {} "
        "ORDER BY n.nspname, t.relname, i.relname, k.ord",
        kExcludedSchemas);

    auto rs = query(INDEXES_QUERY);
    if (rs.is_error()) {
        return Result<std::vector<Index>>::propagate(rs);
    }

    const auto& res = rs.value();
    std::vector<Index> indexes;
    for (const auto& row : res.rows) {
        const std::string schema = cell_string(res, row, "table_schema");
        const std::string name = cell_string(res, row, "index_name");

        // Rows arrive grouped by index, one per key column
        if (indexes.empty() || indexes.back().name != name || indexes.back().schema != schema) {
            Index idx;
            idx.schema = schema;
            idx.name = name;
            idx.table_name = cell_string(res, row, "table_name");
            idx.index_type = cell_text(res, row, "index_type");
            idx.is_unique = cell_bool(res, row, "is_unique");
            idx.is_primary = cell_bool(res, row, "is_primary");
            indexes.push_back(std::move(idx));
        }
        indexes.back().columns.push_back(IndexColumn{
            cell_string(res, row, "column_name"),
            cell_bool(res, row, "is_descending") ? SortDirection::DESCENDING : SortDirection::ASCENDING});
    }
    return Result<std::vector<Index>>::ok(std::move(indexes));
}

Result<std::vector<Constraint>> PgEngine::load_constraints() {
    static const std::string CONSTRAINTS_QUERY = std::format(
        "SELECT "
        "    n.nspname AS table_schema, "
        "    c.relname AS table_name, "
        "    con.conname AS constraint_name, "
        "    con.contype::text AS constraint_type, "
        "    (SELECT string_agg(a.attname, chr(31) ORDER BY k.ord) "
        "       FROM unnest(con.conkey) WITH ORDINALITY AS k(attnum, ord) "
        "       JOIN pg_attribute a ON a.attrelid = con.conrelid AND a.attnum = k.attnum) AS columns, "
        "    fc.relname AS referenced_table, "
        "    (SELECT string_agg(a.attname, chr(31) ORDER BY k.ord) "
        "       FROM unnest(con.confkey) WITH ORDINALITY AS k(attnum, ord) "
        "       JOIN pg_attribute a ON a.attrelid = con.confrelid AND a.attnum = k.attnum) AS referenced_columns, "
        "    con.confupdtype::text AS update_rule, "
        "    con.confdeltype::text AS delete_rule, "
        "    CASE WHEN con.contype = 'c' THEN pg_get_constraintdef(con.oid, true) END AS check_clause "
        "FROM pg_constraint con "
        "JOIN pg_class c ON c.oid = con.conrelid "
        "JOIN pg_namespace n ON n.oid = c.relnamespace "
        "LEFT JOIN pg_class fc ON fc.oid = con.confrelid "
        "WHERE con.contype IN ('p', 'f', 'u', 'c') "
        "  AND n.nspname NOT IN {} "
        "ORDER BY n.nspname, c.relname, con.conname",
        kExcludedSchemas);

    auto rs = query(CONSTRAINTS_QUERY);
    if (rs.is_error()) {
        return Result<std::vector<Constraint>>::propagate(rs);
    }

    const auto& res = rs.value();
    std::vector<Constraint> constraints;
    constraints.reserve(res.rows.size());
    for (const auto& row : res.rows) {
        Constraint con;
        con.schema = cell_string(res, row, "table_schema");
        con.table_name = cell_string(res, row, "table_name");
        con.name = cell_string(res, row, "constraint_name");
        con.constraint_type = constraint_type_from_code(cell_string(res, row, "constraint_type"));
        con.columns = split_list(cell_text(res, row, "columns"));
        con.check_clause = cell_text(res, row, "check_clause");
        if (con.constraint_type == ConstraintType::FOREIGN_KEY) {
            con.referenced_table = cell_text(res, row, "referenced_table");
            con.referenced_columns = split_list(cell_text(res, row, "referenced_columns"));
            con.on_update = parse_referential_action(cell_string(res, row, "update_rule"));
            con.on_delete = parse_referential_action(cell_string(res, row, "delete_rule"));
        }
        constraints.push_back(std::move(con));
    }
    return Result<std::vector<Constraint>>::ok(std::move(constraints));
}

// ============================================================================
// Routines / triggers / custom types
// ============================================================================

Result<std::vector<Routine>> PgEngine::load_routines() {
    // prokind exists from PostgreSQL 11; aggregates and window functions are skipped
    static const std::string ROUTINES_QUERY = std::format(
        "SELECT "
        "    p.oid::text AS routine_oid, "
        "    n.nspname AS routine_schema, "
        "    p.proname AS routine_name, "
        "    p.prokind::text AS routine_kind, "
        "    l.lanname AS language, "
        "    pg_get_functiondef(p.oid) AS definition, "
        "    obj_description(p.oid, 'pg_proc') AS routine_comment, "
        "    CASE WHEN p.prokind = 'f' THEN t.typname END AS return_type "
        "FROM pg_proc p "
        "JOIN pg_namespace n ON n.oid = p.pronamespace "
        "JOIN pg_language l ON l.oid = p.prolang "
        "LEFT JOIN pg_type t ON t.oid = p.prorettype "
        "WHERE p.prokind IN ('f', 'p') "
        "  AND n.nspname NOT IN {} "
        "ORDER BY n.nspname, p.proname, p.oid",
        kExcludedSchemas);

    static const std::string PARAMETERS_QUERY = std::format(
        "SELECT "
        "    p.oid::text AS routine_oid, "
        "    a.ord, "
        "    COALESCE(p.proargnames[a.ord], '') AS parameter_name, "
        "    t.typname AS parameter_type, "
        "    COALESCE(p.proargmodes[a.ord]::text, 'i') AS parameter_mode "
        "FROM pg_proc p "
        "JOIN pg_namespace n ON n.oid = p.pronamespace "
        "CROSS JOIN LATERAL unnest(COALESCE(p.proallargtypes, p.proargtypes::oid[])) "
        "    WITH ORDINALITY AS a(type_oid, ord) "
        "JOIN pg_type t ON t.oid = a.type_oid "
        "WHERE p.prokind IN ('f', 'p') "
        "  AND n.nspname NOT IN {} "
        "ORDER BY p.oid, a.ord",
        kExcludedSchemas);

    auto rs = query(ROUTINES_QUERY);
    if (rs.is_error()) {
        return Result<std::vector<Routine>>::propagate(rs);
    }
    auto params_rs = query(PARAMETERS_QUERY);
    if (params_rs.is_error()) {
        return Result<std::vector<Routine>>::propagate(params_rs);
    }

    std::map<std::string, std::vector<Parameter>> parameters;
    const auto& pres = params_rs.value();
    for (const auto& row : pres.rows) {
        Parameter param;
        param.name = cell_string(pres, row, "parameter_name");
        param.native_type = cell_string(pres, row, "parameter_type");
        param.data_type = map_udt(param.native_type);
        param.mode = parameter_mode_from_code(cell_string(pres, row, "parameter_mode"));
        parameters[cell_string(pres, row, "routine_oid")].push_back(std::move(param));
    }

    const auto& res = rs.value();
    std::vector<Routine> routines;
    routines.reserve(res.rows.size());
    for (const auto& row : res.rows) {
        Routine routine;
        routine.schema = cell_string(res, row, "routine_schema");
        routine.name = cell_string(res, row, "routine_name");
        routine.kind = cell_string(res, row, "routine_kind") == "p" ? RoutineKind::PROCEDURE
                                                                     : RoutineKind::FUNCTION;
        routine.language = cell_text(res, row, "language");
        routine.definition = cell_text(res, row, "definition");
        routine.comment = cell_text(res, row, "routine_comment");
        if (auto ret = cell_text(res, row, "return_type")) {
            routine.return_type = map_udt(*ret);
        }
        if (auto it = parameters.find(cell_string(res, row, "routine_oid")); it != parameters.end()) {
            routine.parameters = std::move(it->second);
        }
        routines.push_back(std::move(routine));
    }
    return Result<std::vector<Routine>>::ok(std::move(routines));
}

Result<std::vector<Trigger>> PgEngine::load_triggers() {
    static const std::string TRIGGERS_QUERY = std::format(
        "SELECT "
        "    n.nspname AS trigger_schema, "
        "    c.relname AS table_name, "
        "    t.tgname AS trigger_name, "
        "    t.tgtype::integer AS trigger_type, "
        "    pg_get_triggerdef(t.oid, true) AS definition "
        "FROM pg_trigger t "
        "JOIN pg_class c ON c.oid = t.tgrelid "
        "JOIN pg_namespace n ON n.oid = c.relnamespace "
        "WHERE NOT t.tgisinternal "
        "  AND n.nspname NOT IN {} "
        "ORDER BY n.nspname, c.relname, t.tgname",
        kExcludedSchemas);

    auto rs = query(TRIGGERS_QUERY);
    if (rs.is_error()) {
        return Result<std::vector<Trigger>>::propagate(rs);
    }

    const auto& res = rs.value();
    std::vector<Trigger> triggers;
    triggers.reserve(res.rows.size());
    for (const auto& row : res.rows) {
        const int type = static_cast<int>(cell_uint(res, row, "trigger_type").value_or(0));

        Trigger trigger;
        trigger.schema = cell_string(res, row, "trigger_schema");
        trigger.table_name = cell_string(res, row, "table_name");
        trigger.name = cell_string(res, row, "trigger_name");
        trigger.definition = cell_text(res, row, "definition");
        if (type & kTriggerInstead) {
            trigger.timing = TriggerTiming::INSTEAD_OF;
        } else if (type & kTriggerBefore) {
            trigger.timing = TriggerTiming::BEFORE;
        } else {
            trigger.timing = TriggerTiming::AFTER;
        }
        if (type & kTriggerInsert) trigger.events.push_back(TriggerEvent::INSERT);
        if (type & kTriggerUpdate) trigger.events.push_back(TriggerEvent::UPDATE);
        if (type & kTriggerDelete) trigger.events.push_back(TriggerEvent::DELETE);
        if (type & kTriggerTruncate) trigger.events.push_back(TriggerEvent::TRUNCATE);
        triggers.push_back(std::move(trigger));
    }
    return Result<std::vector<Trigger>>::ok(std::move(triggers));
}

Result<std::vector<CustomType>> PgEngine::load_custom_types() {
    static const std::string TYPES_QUERY = std::format(
        "SELECT "
        "    n.nspname AS type_schema, "
        "    t.typname AS type_name, "
        "    CASE t.typtype WHEN 'e' THEN 'enum' WHEN 'd' THEN 'domain' "
        "                   WHEN 'r' THEN 'range' ELSE 'composite' END AS category, "
        "    (SELECT string_agg(e.enumlabel, chr(31) ORDER BY e.enumsortorder) "
        "       FROM pg_enum e WHERE e.enumtypid = t.oid) AS enum_values, "
        "    CASE WHEN t.typtype = 'd' THEN format_type(t.typbasetype, t.typtypmod) END AS base_type "
        "FROM pg_type t "
        "JOIN pg_namespace n ON n.oid = t.typnamespace "
        "WHERE (t.typtype IN ('e', 'd', 'r') "
        "       OR (t.typtype = 'c' AND EXISTS ("
        "           SELECT 1 FROM pg_class c WHERE c.oid = t.typrelid AND c.relkind = 'c'))) "
        "  AND n.nspname NOT IN {} "
        "ORDER BY n.nspname, t.typname",
        kExcludedSchemas);

    auto rs = query(TYPES_QUERY);
    if (rs.is_error()) {
        return Result<std::vector<CustomType>>::propagate(rs);
    }

    const auto& res = rs.value();
    std::vector<CustomType> types;
    types.reserve(res.rows.size());
    for (const auto& row : res.rows) {
        CustomType type;
        type.schema = cell_string(res, row, "type_schema");
        type.name = cell_string(res, row, "type_name");
        type.category = cell_string(res, row, "category");
        type.enum_values = split_list(cell_text(res, row, "enum_values"));
        type.base_type = cell_text(res, row, "base_type");
        types.push_back(std::move(type));
    }
    return Result<std::vector<CustomType>>::ok(std::move(types));
}

// ============================================================================
// Sampling
// ============================================================================

std::optional<uint64_t> PgEngine::count_rows(const Table& table) {
    if (table.row_count) {
        return table.row_count;
    }
    return SqlEngineBase::count_rows(table);
}

} // namespace dbsurvey
