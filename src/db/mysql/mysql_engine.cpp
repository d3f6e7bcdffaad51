#include "db/mysql/mysql_engine.hpp"
#include "db/mysql/mysql_connection.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cstdint>
#include <format>

namespace dbsurvey {

namespace {

std::optional<uint32_t> to_u32(std::optional<uint64_t> v) {
    if (!v) return std::nullopt;
    return static_cast<uint32_t>(std::min<uint64_t>(*v, UINT32_MAX));
}

std::optional<std::string> non_empty(std::optional<std::string> v) {
    if (v && v->empty()) return std::nullopt;
    return v;
}

ConstraintType constraint_type_from_name(const std::string& name) {
    if (name == "PRIMARY KEY") return ConstraintType::PRIMARY_KEY;
    if (name == "FOREIGN KEY") return ConstraintType::FOREIGN_KEY;
    if (name == "UNIQUE") return ConstraintType::UNIQUE;
    return ConstraintType::CHECK;
}

ParameterMode parameter_mode_from_name(const std::string& name) {
    if (name == "OUT") return ParameterMode::OUT;
    if (name == "INOUT") return ParameterMode::INOUT;
    return ParameterMode::IN;
}

NativeTypeDescriptor native_from_row(const DbResultSet& res, const std::vector<DbCell>& row) {
    NativeTypeDescriptor native;
    native.type_name = cell_string(res, row, "data_type");
    native.full_type = cell_string(res, row, "column_type");
    native.max_length = to_u32(cell_uint(res, row, "character_maximum_length"));
    native.numeric_precision = to_u32(cell_uint(res, row, "numeric_precision"));
    native.numeric_scale = to_u32(cell_uint(res, row, "numeric_scale"));
    return native;
}

} // namespace

Result<void> MysqlEngine::open(const ConnectionParams& params) {
    return open_pool(params, std::make_unique<MysqlConnectionFactory>());
}

bool MysqlEngine::supports(AdapterFeature feature) const {
    return feature != AdapterFeature::CUSTOM_TYPES &&
           feature != AdapterFeature::SCHEMA_INFERENCE;
}

// ============================================================================
// Server / database metadata
// ============================================================================

Result<std::vector<DatabaseInfo>> MysqlEngine::enumerate_databases() {
    // SCHEMATA only lists databases the current user holds some privilege on
    static constexpr const char* DATABASES_QUERY =
        "SELECT "
        "    s.SCHEMA_NAME AS name, "
        "    s.DEFAULT_CHARACTER_SET_NAME AS encoding, "
        "    s.DEFAULT_COLLATION_NAME AS collation, "
        "    (SELECT CAST(SUM(t.DATA_LENGTH + t.INDEX_LENGTH) AS UNSIGNED) "
        "       FROM information_schema.TABLES t "
        "      WHERE t.TABLE_SCHEMA = s.SCHEMA_NAME) AS size_bytes "
        "FROM information_schema.SCHEMATA s "
        "ORDER BY s.SCHEMA_NAME";

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
        info.encoding = cell_text(res, row, "encoding");
        info.collation = cell_text(res, row, "collation");
        info.size_bytes = cell_uint(res, row, "size_bytes");
        info.is_system_database = is_known_system_database(kType, info.name);
        info.access_level = AccessLevel::FULL;
        databases.push_back(std::move(info));
    }
    return Result<std::vector<DatabaseInfo>>::ok(std::move(databases));
}

Result<ServerInfo> MysqlEngine::describe_server() {
    static constexpr const char* SERVER_QUERY =
        "SELECT "
        "    VERSION() AS version, "
        "    CURRENT_USER() AS connection_user, "
        "    (SELECT COUNT(*) FROM information_schema.USER_PRIVILEGES "
        "      WHERE PRIVILEGE_TYPE = 'SUPER' "
        "        AND GRANTEE = CONCAT('''', SUBSTRING_INDEX(CURRENT_USER(), '@', 1), "
        "                             '''@''', SUBSTRING_INDEX(CURRENT_USER(), '@', -1), '''')"
        "    ) AS super_grants";

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
    info.has_superuser_privileges = cell_uint(res, row, "super_grants").value_or(0) > 0;
    info.host = params_.host;
    info.port = params_.effective_port();
    return Result<ServerInfo>::ok(std::move(info));
}

Result<DatabaseInfo> MysqlEngine::describe_database() {
    static constexpr const char* DATABASE_QUERY =
        "SELECT "
        "    s.SCHEMA_NAME AS name, "
        "    s.DEFAULT_CHARACTER_SET_NAME AS encoding, "
        "    s.DEFAULT_COLLATION_NAME AS collation, "
        "    (SELECT CAST(SUM(t.DATA_LENGTH + t.INDEX_LENGTH) AS UNSIGNED) "
        "       FROM information_schema.TABLES t "
        "      WHERE t.TABLE_SCHEMA = s.SCHEMA_NAME) AS size_bytes "
        "FROM information_schema.SCHEMATA s "
        "WHERE s.SCHEMA_NAME = DATABASE()";

    auto rs = query(DATABASE_QUERY);
    if (rs.is_error()) {
        return Result<DatabaseInfo>::propagate(rs);
    }
    if (rs.value().rows.empty()) {
        return Result<DatabaseInfo>::error(ErrorCode::INVALID_CONNECTION_TARGET,
                                           "No database selected on this connection");
    }

    const auto& res = rs.value();
    const auto& row = res.rows.front();

    DatabaseInfo info;
    info.name = cell_string(res, row, "name");
    info.encoding = cell_text(res, row, "encoding");
    info.collation = cell_text(res, row, "collation");
    info.size_bytes = cell_uint(res, row, "size_bytes");
    info.is_system_database = is_known_system_database(kType, info.name);
    return Result<DatabaseInfo>::ok(std::move(info));
}

// ============================================================================
// Tables / columns / views
// ============================================================================

Result<MysqlEngine::ColumnMap> MysqlEngine::load_columns() {
    static constexpr const char* COLUMNS_QUERY =
        "SELECT "
        "    TABLE_NAME AS table_name, "
        "    COLUMN_NAME AS column_name, "
        "    DATA_TYPE AS data_type, "
        "    COLUMN_TYPE AS column_type, "
        "    CHARACTER_MAXIMUM_LENGTH AS character_maximum_length, "
        "    NUMERIC_PRECISION AS numeric_precision, "
        "    NUMERIC_SCALE AS numeric_scale, "
        "    IS_NULLABLE AS is_nullable, "
        "    COLUMN_DEFAULT AS column_default, "
        "    ORDINAL_POSITION AS ordinal_position, "
        "    COLUMN_COMMENT AS column_comment, "
        "    EXTRA AS extra, "
        "    COLUMN_KEY AS column_key "
        "FROM information_schema.COLUMNS "
        "WHERE TABLE_SCHEMA = DATABASE() "
        "ORDER BY TABLE_NAME, ORDINAL_POSITION";

    auto rs = query(COLUMNS_QUERY);
    if (rs.is_error()) {
        return Result<ColumnMap>::propagate(rs);
    }

    const auto& res = rs.value();
    ColumnMap columns;
    for (const auto& row : res.rows) {
        const NativeTypeDescriptor native = native_from_row(res, row);

        Column col;
        col.name = cell_string(res, row, "column_name");
        col.data_type = map_type(kType, native);
        col.native_type = native.full_type.empty() ? native.type_name : native.full_type;
        col.is_nullable = cell_string(res, row, "is_nullable") == "YES";
        col.default_value = cell_text(res, row, "column_default");
        col.comment = non_empty(cell_text(res, row, "column_comment"));
        col.ordinal_position = static_cast<uint32_t>(cell_uint(res, row, "ordinal_position").value_or(0));
        col.is_auto_increment = utils::to_lower(cell_string(res, row, "extra")).find("auto_increment")
                                != std::string::npos;
        col.is_primary_key = cell_string(res, row, "column_key") == "PRI";

        columns[cell_string(res, row, "table_name")].push_back(std::move(col));
    }
    return Result<ColumnMap>::ok(std::move(columns));
}

Result<std::vector<Table>> MysqlEngine::load_tables() {
    static constexpr const char* TABLES_QUERY =
        "SELECT "
        "    TABLE_NAME AS table_name, "
        "    TABLE_COMMENT AS table_comment, "
        "    TABLE_ROWS AS table_rows "
        "FROM information_schema.TABLES "
        "WHERE TABLE_SCHEMA = DATABASE() "
        "  AND TABLE_TYPE = 'BASE TABLE' "
        "ORDER BY TABLE_NAME";

    auto rs = query(TABLES_QUERY);
    if (rs.is_error()) {
        return Result<std::vector<Table>>::propagate(rs);
    }
    auto columns = load_columns();
    if (columns.is_error()) {
        return Result<std::vector<Table>>::propagate(columns);
    }
    auto constraints = load_constraints();
    if (constraints.is_error()) {
        return Result<std::vector<Table>>::propagate(constraints);
    }

    const auto& res = rs.value();
    std::vector<Table> tables;
    tables.reserve(res.rows.size());
    for (const auto& row : res.rows) {
        Table table;
        table.name = cell_string(res, row, "table_name");
        table.comment = non_empty(cell_text(res, row, "table_comment"));
        // InnoDB statistics estimate; exact counts come from count_rows()
        table.row_count = cell_uint(res, row, "table_rows");

        if (auto it = columns.value().find(table.name); it != columns.value().end()) {
            table.columns = std::move(it->second);
        }

        for (const auto& con : constraints.value()) {
            if (con.table_name != table.name) continue;
            if (con.constraint_type == ConstraintType::PRIMARY_KEY) {
                table.primary_key = PrimaryKey{con.name, con.columns};
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

Result<std::vector<View>> MysqlEngine::load_views() {
    static constexpr const char* VIEWS_QUERY =
        "SELECT "
        "    TABLE_NAME AS view_name, "
        "    VIEW_DEFINITION AS view_definition "
        "FROM information_schema.VIEWS "
        "WHERE TABLE_SCHEMA = DATABASE() "
        "ORDER BY TABLE_NAME";

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
        view.name = cell_string(res, row, "view_name");
        // Empty when the user lacks SHOW VIEW
        view.definition = non_empty(cell_text(res, row, "view_definition"));
        if (auto it = columns.value().find(view.name); it != columns.value().end()) {
            view.columns = std::move(it->second);
        }
        views.push_back(std::move(view));
    }
    return Result<std::vector<View>>::ok(std::move(views));
}

// ============================================================================
// Indexes / constraints
// ============================================================================

Result<std::vector<Index>> MysqlEngine::load_indexes() {
    static constexpr const char* INDEXES_QUERY =
        "SELECT "
        "    TABLE_NAME AS table_name, "
        "    INDEX_NAME AS index_name, "
        "    COLUMN_NAME AS column_name, "
        "    NON_UNIQUE AS non_unique, "
        "    INDEX_TYPE AS index_type, "
        "    COLLATION AS collation "
        "FROM information_schema.STATISTICS "
        "WHERE TABLE_SCHEMA = DATABASE() "
        "ORDER BY TABLE_NAME, INDEX_NAME, SEQ_IN_INDEX";

    auto rs = query(INDEXES_QUERY);
    if (rs.is_error()) {
        return Result<std::vector<Index>>::propagate(rs);
    }

    const auto& res = rs.value();
    std::vector<Index> indexes;
    for (const auto& row : res.rows) {
        const std::string table_name = cell_string(res, row, "table_name");
        const std::string name = cell_string(res, row, "index_name");

        if (indexes.empty() || indexes.back().name != name || indexes.back().table_name != table_name) {
            Index idx;
            idx.name = name;
            idx.table_name = table_name;
            idx.is_unique = cell_uint(res, row, "non_unique").value_or(1) == 0;
            idx.is_primary = name == "PRIMARY";
            if (auto type = cell_text(res, row, "index_type")) {
                idx.index_type = utils::to_lower(*type);
            }
            indexes.push_back(std::move(idx));
        }

        std::optional<SortDirection> direction;
        const std::string collation = cell_string(res, row, "collation");
        if (collation == "A") direction = SortDirection::ASCENDING;
        if (collation == "D") direction = SortDirection::DESCENDING;
        indexes.back().columns.push_back(IndexColumn{cell_string(res, row, "column_name"), direction});
    }
    return Result<std::vector<Index>>::ok(std::move(indexes));
}

Result<std::vector<Constraint>> MysqlEngine::load_constraints() {
    static constexpr const char* CONSTRAINTS_QUERY =
        "SELECT "
        "    tc.TABLE_NAME AS table_name, "
        "    tc.CONSTRAINT_NAME AS constraint_name, "
        "    tc.CONSTRAINT_TYPE AS constraint_type, "
        "    kcu.COLUMN_NAME AS column_name, "
        "    kcu.REFERENCED_TABLE_NAME AS referenced_table, "
        "    kcu.REFERENCED_COLUMN_NAME AS referenced_column, "
        "    rc.UPDATE_RULE AS update_rule, "
        "    rc.DELETE_RULE AS delete_rule "
        "FROM information_schema.TABLE_CONSTRAINTS tc "
        "LEFT JOIN information_schema.KEY_COLUMN_USAGE kcu "
        "    ON kcu.CONSTRAINT_SCHEMA = tc.CONSTRAINT_SCHEMA "
        "   AND kcu.CONSTRAINT_NAME = tc.CONSTRAINT_NAME "
        "   AND kcu.TABLE_NAME = tc.TABLE_NAME "
        "LEFT JOIN information_schema.REFERENTIAL_CONSTRAINTS rc "
        "    ON rc.CONSTRAINT_SCHEMA = tc.CONSTRAINT_SCHEMA "
        "   AND rc.CONSTRAINT_NAME = tc.CONSTRAINT_NAME "
        "WHERE tc.TABLE_SCHEMA = DATABASE() "
        "ORDER BY tc.TABLE_NAME, tc.CONSTRAINT_NAME, kcu.ORDINAL_POSITION";

    // CHECK_CONSTRAINTS exists from MySQL 8.0.16, the first version to report CHECK rows
    static constexpr const char* CHECKS_QUERY =
        "SELECT "
        "    CONSTRAINT_NAME AS constraint_name, "
        "    CHECK_CLAUSE AS check_clause "
        "FROM information_schema.CHECK_CONSTRAINTS "
        "WHERE CONSTRAINT_SCHEMA = DATABASE()";

    auto rs = query(CONSTRAINTS_QUERY);
    if (rs.is_error()) {
        return Result<std::vector<Constraint>>::propagate(rs);
    }

    const auto& res = rs.value();
    std::vector<Constraint> constraints;
    bool has_checks = false;
    for (const auto& row : res.rows) {
        const std::string table_name = cell_string(res, row, "table_name");
        const std::string name = cell_string(res, row, "constraint_name");

        // One row per key column
        if (constraints.empty() || constraints.back().name != name ||
            constraints.back().table_name != table_name) {
            Constraint con;
            con.name = name;
            con.table_name = table_name;
            con.constraint_type = constraint_type_from_name(cell_string(res, row, "constraint_type"));
            if (con.constraint_type == ConstraintType::FOREIGN_KEY) {
                con.referenced_table = cell_text(res, row, "referenced_table");
                con.on_update = parse_referential_action(cell_string(res, row, "update_rule"));
                con.on_delete = parse_referential_action(cell_string(res, row, "delete_rule"));
            }
            has_checks = has_checks || con.constraint_type == ConstraintType::CHECK;
            constraints.push_back(std::move(con));
        }

        auto& con = constraints.back();
        if (auto column = cell_text(res, row, "column_name")) {
            con.columns.push_back(std::move(*column));
        }
        if (auto referenced = cell_text(res, row, "referenced_column")) {
            con.referenced_columns.push_back(std::move(*referenced));
        }
    }

    if (has_checks) {
        auto checks = query(CHECKS_QUERY);
        if (checks.is_error()) {
            return Result<std::vector<Constraint>>::propagate(checks);
        }
        const auto& cres = checks.value();
        for (const auto& row : cres.rows) {
            const std::string name = cell_string(cres, row, "constraint_name");
            for (auto& con : constraints) {
                if (con.constraint_type == ConstraintType::CHECK && con.name == name) {
                    con.check_clause = cell_text(cres, row, "check_clause");
                }
            }
        }
    }
    return Result<std::vector<Constraint>>::ok(std::move(constraints));
}

// ============================================================================
// Routines / triggers
// ============================================================================

Result<std::vector<Routine>> MysqlEngine::load_routines() {
    static constexpr const char* ROUTINES_QUERY =
        "SELECT "
        "    SPECIFIC_NAME AS specific_name, "
        "    ROUTINE_NAME AS routine_name, "
        "    ROUTINE_TYPE AS routine_type, "
        "    DATA_TYPE AS data_type, "
        "    DTD_IDENTIFIER AS column_type, "
        "    ROUTINE_BODY AS language, "
        "    ROUTINE_DEFINITION AS definition, "
        "    ROUTINE_COMMENT AS routine_comment "
        "FROM information_schema.ROUTINES "
        "WHERE ROUTINE_SCHEMA = DATABASE() "
        "ORDER BY ROUTINE_NAME";

    static constexpr const char* PARAMETERS_QUERY =
        "SELECT "
        "    SPECIFIC_NAME AS specific_name, "
        "    PARAMETER_MODE AS parameter_mode, "
        "    PARAMETER_NAME AS parameter_name, "
        "    DATA_TYPE AS data_type, "
        "    DTD_IDENTIFIER AS column_type, "
        "    CHARACTER_MAXIMUM_LENGTH AS character_maximum_length, "
        "    NUMERIC_PRECISION AS numeric_precision, "
        "    NUMERIC_SCALE AS numeric_scale "
        "FROM information_schema.PARAMETERS "
        "WHERE SPECIFIC_SCHEMA = DATABASE() "
        "  AND ORDINAL_POSITION > 0 "
        "ORDER BY SPECIFIC_NAME, ORDINAL_POSITION";

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
        const NativeTypeDescriptor native = native_from_row(pres, row);
        Parameter param;
        param.name = cell_string(pres, row, "parameter_name");
        param.native_type = native.full_type.empty() ? native.type_name : native.full_type;
        param.data_type = map_type(kType, native);
        param.mode = parameter_mode_from_name(cell_string(pres, row, "parameter_mode"));
        parameters[cell_string(pres, row, "specific_name")].push_back(std::move(param));
    }

    const auto& res = rs.value();
    std::vector<Routine> routines;
    routines.reserve(res.rows.size());
    for (const auto& row : res.rows) {
        Routine routine;
        routine.name = cell_string(res, row, "routine_name");
        routine.kind = cell_string(res, row, "routine_type") == "PROCEDURE" ? RoutineKind::PROCEDURE
                                                                            : RoutineKind::FUNCTION;
        routine.language = cell_text(res, row, "language");
        // NULL unless the user created the routine or holds SHOW_ROUTINE
        routine.definition = cell_text(res, row, "definition");
        routine.comment = non_empty(cell_text(res, row, "routine_comment"));
        if (routine.kind == RoutineKind::FUNCTION) {
            if (auto data_type = cell_text(res, row, "data_type"); data_type && !data_type->empty()) {
                routine.return_type = map_type(kType, NativeTypeDescriptor{
                    *data_type, cell_string(res, row, "column_type"), {}, {}, {}});
            }
        }
        if (auto it = parameters.find(cell_string(res, row, "specific_name")); it != parameters.end()) {
            routine.parameters = std::move(it->second);
        }
        routines.push_back(std::move(routine));
    }
    return Result<std::vector<Routine>>::ok(std::move(routines));
}

Result<std::vector<Trigger>> MysqlEngine::load_triggers() {
    static constexpr const char* TRIGGERS_QUERY =
        "SELECT "
        "    TRIGGER_NAME AS trigger_name, "
        "    EVENT_OBJECT_TABLE AS table_name, "
        "    EVENT_MANIPULATION AS event, "
        "    ACTION_TIMING AS timing, "
        "    ACTION_STATEMENT AS definition "
        "FROM information_schema.TRIGGERS "
        "WHERE TRIGGER_SCHEMA = DATABASE() "
        "ORDER BY EVENT_OBJECT_TABLE, TRIGGER_NAME";

    auto rs = query(TRIGGERS_QUERY);
    if (rs.is_error()) {
        return Result<std::vector<Trigger>>::propagate(rs);
    }

    const auto& res = rs.value();
    std::vector<Trigger> triggers;
    triggers.reserve(res.rows.size());
    for (const auto& row : res.rows) {
        Trigger trigger;
        trigger.name = cell_string(res, row, "trigger_name");
        trigger.table_name = cell_string(res, row, "table_name");
        trigger.definition = cell_text(res, row, "definition");
        trigger.timing = parse_trigger_timing(cell_string(res, row, "timing")).value_or(TriggerTiming::AFTER);
        if (auto event = parse_trigger_event(cell_string(res, row, "event"))) {
            trigger.events.push_back(*event);
        }
        triggers.push_back(std::move(trigger));
    }
    return Result<std::vector<Trigger>>::ok(std::move(triggers));
}

} // namespace dbsurvey
