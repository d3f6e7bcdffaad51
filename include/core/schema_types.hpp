#pragma once

#include "core/data_type.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dbsurvey {

// ============================================================================
// Shared enums
// ============================================================================

enum class SortDirection { ASCENDING, DESCENDING };

enum class ReferentialAction { NO_ACTION, RESTRICT, CASCADE, SET_NULL, SET_DEFAULT };

enum class ConstraintType { PRIMARY_KEY, FOREIGN_KEY, UNIQUE, CHECK };

enum class RoutineKind { FUNCTION, PROCEDURE };

enum class ParameterMode { IN, OUT, INOUT };

enum class TriggerTiming { BEFORE, AFTER, INSTEAD_OF };

enum class TriggerEvent { INSERT, UPDATE, DELETE, TRUNCATE };

[[nodiscard]] std::string_view sort_direction_to_string(SortDirection d);
[[nodiscard]] std::string_view referential_action_to_string(ReferentialAction a);
[[nodiscard]] std::string_view constraint_type_to_string(ConstraintType t);
[[nodiscard]] std::string_view routine_kind_to_string(RoutineKind k);
[[nodiscard]] std::string_view parameter_mode_to_string(ParameterMode m);
[[nodiscard]] std::string_view trigger_timing_to_string(TriggerTiming t);
[[nodiscard]] std::string_view trigger_event_to_string(TriggerEvent e);

/**
 * @brief Parse catalog spellings ("CASCADE", "SET NULL", "a" for pg_constraint codes, ...)
 */
[[nodiscard]] std::optional<ReferentialAction> parse_referential_action(std::string_view s);
[[nodiscard]] std::optional<TriggerTiming> parse_trigger_timing(std::string_view s);
[[nodiscard]] std::optional<TriggerEvent> parse_trigger_event(std::string_view s);

// ============================================================================
// Schema entities
// ============================================================================

struct Column {
    std::string name;
    UnifiedDataType data_type;
    std::string native_type;                  // type name as reported by the engine
    bool is_nullable = true;
    bool is_primary_key = false;
    bool is_auto_increment = false;
    std::optional<std::string> default_value;
    std::optional<std::string> comment;
    uint32_t ordinal_position = 0;            // 1-based, declaration order
};

struct PrimaryKey {
    std::optional<std::string> name;
    std::vector<std::string> columns;         // declared key order
};

struct ForeignKey {
    std::optional<std::string> name;
    std::vector<std::string> columns;
    std::optional<std::string> referenced_schema;
    std::string referenced_table;
    std::vector<std::string> referenced_columns;
    std::optional<ReferentialAction> on_delete;
    std::optional<ReferentialAction> on_update;
};

struct IndexColumn {
    std::string name;
    std::optional<SortDirection> direction;
};

struct Index {
    std::string name;
    std::optional<std::string> schema;
    std::string table_name;
    std::vector<IndexColumn> columns;
    bool is_unique = false;
    bool is_primary = false;
    std::optional<std::string> index_type;    // btree, hash, ...
};

struct Constraint {
    std::string name;
    std::optional<std::string> schema;
    std::string table_name;
    ConstraintType constraint_type = ConstraintType::CHECK;
    std::vector<std::string> columns;
    std::optional<std::string> check_clause;
    std::optional<std::string> referenced_table;
    std::vector<std::string> referenced_columns;
    std::optional<ReferentialAction> on_delete;
    std::optional<ReferentialAction> on_update;
};

struct Table {
    std::string name;
    std::optional<std::string> schema;
    std::vector<Column> columns;
    std::optional<PrimaryKey> primary_key;
    std::vector<ForeignKey> foreign_keys;
    std::optional<std::string> comment;
    std::optional<uint64_t> row_count;        // catalog estimate, when available

    /// Engine-provided physical row identifier ("ctid", "rowid"), if any
    std::optional<std::string> system_row_id;

    [[nodiscard]] const Column* find_column(std::string_view column_name) const {
        for (const auto& col : columns) {
            if (col.name == column_name) return &col;
        }
        return nullptr;
    }

    [[nodiscard]] std::string qualified_name() const {
        return schema ? *schema + "." + name : name;
    }
};

struct View {
    std::string name;
    std::optional<std::string> schema;
    std::vector<Column> columns;
    std::optional<std::string> definition;
    std::optional<std::string> comment;
};

struct Parameter {
    std::string name;
    std::string native_type;
    UnifiedDataType data_type;
    ParameterMode mode = ParameterMode::IN;
};

struct Routine {
    std::string name;
    std::optional<std::string> schema;
    RoutineKind kind = RoutineKind::FUNCTION;
    std::vector<Parameter> parameters;
    std::optional<UnifiedDataType> return_type;
    std::optional<std::string> language;
    std::optional<std::string> definition;
    std::optional<std::string> comment;
};

struct Trigger {
    std::string name;
    std::optional<std::string> schema;
    std::string table_name;
    std::vector<TriggerEvent> events;
    TriggerTiming timing = TriggerTiming::AFTER;
    std::optional<std::string> definition;
};

/**
 * @brief Engine-defined type (PostgreSQL enum/domain/composite)
 */
struct CustomType {
    std::string name;
    std::optional<std::string> schema;
    std::string category;                     // "enum", "domain", "composite"
    std::vector<std::string> enum_values;
    std::optional<std::string> base_type;
};

} // namespace dbsurvey
