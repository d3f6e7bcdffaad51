#include "aggregator/result_serializer.hpp"
#include "core/utils.hpp"

#include <format>
#include <fstream>
#include <type_traits>
#include <variant>

namespace dbsurvey {

using nlohmann::ordered_json;

namespace {

template<typename T>
ordered_json optional_value(const std::optional<T>& v) {
    return v ? ordered_json(*v) : ordered_json(nullptr);
}

ordered_json optional_action(const std::optional<ReferentialAction>& a) {
    return a ? ordered_json(referential_action_to_string(*a)) : ordered_json(nullptr);
}

ordered_json tagged(std::string_view tag, ordered_json body) {
    ordered_json j = ordered_json::object();
    j[std::string(tag)] = std::move(body);
    return j;
}

ordered_json column_json(const Column& c) {
    ordered_json j;
    j["name"] = c.name;
    j["data_type"] = to_json(c.data_type);
    j["native_type"] = c.native_type;
    j["is_nullable"] = c.is_nullable;
    j["is_primary_key"] = c.is_primary_key;
    j["is_auto_increment"] = c.is_auto_increment;
    j["default_value"] = optional_value(c.default_value);
    j["comment"] = optional_value(c.comment);
    j["ordinal_position"] = c.ordinal_position;
    return j;
}

ordered_json columns_json(const std::vector<Column>& columns) {
    ordered_json arr = ordered_json::array();
    for (const auto& c : columns) arr.push_back(column_json(c));
    return arr;
}

ordered_json table_json(const Table& t) {
    ordered_json j;
    j["name"] = t.name;
    j["schema"] = optional_value(t.schema);
    j["columns"] = columns_json(t.columns);

    if (t.primary_key) {
        j["primary_key"] = {{"name", optional_value(t.primary_key->name)},
                            {"columns", t.primary_key->columns}};
    } else {
        j["primary_key"] = nullptr;
    }

    ordered_json fks = ordered_json::array();
    for (const auto& fk : t.foreign_keys) {
        ordered_json f;
        f["name"] = optional_value(fk.name);
        f["columns"] = fk.columns;
        f["referenced_schema"] = optional_value(fk.referenced_schema);
        f["referenced_table"] = fk.referenced_table;
        f["referenced_columns"] = fk.referenced_columns;
        f["on_delete"] = optional_action(fk.on_delete);
        f["on_update"] = optional_action(fk.on_update);
        fks.push_back(std::move(f));
    }
    j["foreign_keys"] = std::move(fks);
    j["comment"] = optional_value(t.comment);
    j["row_count"] = optional_value(t.row_count);
    return j;
}

ordered_json view_json(const View& v) {
    ordered_json j;
    j["name"] = v.name;
    j["schema"] = optional_value(v.schema);
    j["columns"] = columns_json(v.columns);
    j["definition"] = optional_value(v.definition);
    j["comment"] = optional_value(v.comment);
    return j;
}

ordered_json index_json(const Index& idx) {
    ordered_json cols = ordered_json::array();
    for (const auto& c : idx.columns) {
        cols.push_back({{"name", c.name},
                        {"direction", c.direction ? ordered_json(sort_direction_to_string(*c.direction))
                                                  : ordered_json(nullptr)}});
    }
    ordered_json j;
    j["name"] = idx.name;
    j["schema"] = optional_value(idx.schema);
    j["table_name"] = idx.table_name;
    j["columns"] = std::move(cols);
    j["is_unique"] = idx.is_unique;
    j["is_primary"] = idx.is_primary;
    j["index_type"] = optional_value(idx.index_type);
    return j;
}

ordered_json constraint_json(const Constraint& c) {
    ordered_json j;
    j["name"] = c.name;
    j["schema"] = optional_value(c.schema);
    j["table_name"] = c.table_name;
    j["constraint_type"] = constraint_type_to_string(c.constraint_type);
    j["columns"] = c.columns;
    j["check_clause"] = optional_value(c.check_clause);
    j["referenced_table"] = optional_value(c.referenced_table);
    j["referenced_columns"] = c.referenced_columns;
    j["on_delete"] = optional_action(c.on_delete);
    j["on_update"] = optional_action(c.on_update);
    return j;
}

ordered_json routine_json(const Routine& r) {
    ordered_json params = ordered_json::array();
    for (const auto& p : r.parameters) {
        ordered_json pj;
        pj["name"] = p.name;
        pj["native_type"] = p.native_type;
        pj["data_type"] = to_json(p.data_type);
        pj["mode"] = parameter_mode_to_string(p.mode);
        params.push_back(std::move(pj));
    }
    ordered_json j;
    j["name"] = r.name;
    j["schema"] = optional_value(r.schema);
    j["kind"] = routine_kind_to_string(r.kind);
    j["parameters"] = std::move(params);
    j["return_type"] = r.return_type ? to_json(*r.return_type) : ordered_json(nullptr);
    j["language"] = optional_value(r.language);
    j["definition"] = optional_value(r.definition);
    j["comment"] = optional_value(r.comment);
    return j;
}

ordered_json trigger_json(const Trigger& t) {
    ordered_json events = ordered_json::array();
    for (auto e : t.events) events.push_back(trigger_event_to_string(e));

    ordered_json j;
    j["name"] = t.name;
    j["schema"] = optional_value(t.schema);
    j["table_name"] = t.table_name;
    j["events"] = std::move(events);
    j["timing"] = trigger_timing_to_string(t.timing);
    j["definition"] = optional_value(t.definition);
    return j;
}

ordered_json custom_type_json(const CustomType& t) {
    ordered_json j;
    j["name"] = t.name;
    j["schema"] = optional_value(t.schema);
    j["category"] = t.category;
    j["enum_values"] = t.enum_values;
    j["base_type"] = optional_value(t.base_type);
    return j;
}

ordered_json sample_json(const TableSample& s) {
    ordered_json rows = ordered_json::array();
    for (const auto& row : s.rows) rows.push_back(ordered_json(row));

    ordered_json j;
    j["table_name"] = s.table_name;
    j["schema_name"] = optional_value(s.schema_name);
    j["rows"] = std::move(rows);
    j["sample_size"] = s.sample_size;
    j["total_rows"] = optional_value(s.total_rows);
    j["strategy_used"] = to_json(s.strategy_used);
    j["collected_at"] = utils::format_timestamp(s.collected_at);
    j["warnings"] = s.warnings;
    return j;
}

ordered_json quality_json(const TableQualityMetrics& q) {
    ordered_json completeness_cols = ordered_json::array();
    for (const auto& c : q.completeness.column_details) {
        completeness_cols.push_back({{"column_name", c.column_name}, {"total_count", c.total_count},
                                     {"null_count", c.null_count}, {"empty_count", c.empty_count},
                                     {"completeness", c.completeness}});
    }
    ordered_json type_issues = ordered_json::array();
    for (const auto& t : q.consistency.type_inconsistencies) {
        type_issues.push_back({{"column_name", t.column_name}, {"expected_type", t.expected_type},
                               {"found_types", t.found_types},
                               {"inconsistent_count", t.inconsistent_count}});
    }
    ordered_json format_issues = ordered_json::array();
    for (const auto& f : q.consistency.format_violations) {
        format_issues.push_back({{"column_name", f.column_name}, {"expected_format", f.expected_format},
                                 {"violation_count", f.violation_count}});
    }
    ordered_json duplicate_cols = ordered_json::array();
    for (const auto& c : q.uniqueness.columns_with_duplicates) {
        duplicate_cols.push_back({{"column_name", c.column_name}, {"total_count", c.total_count},
                                  {"duplicate_count", c.duplicate_count}, {"uniqueness", c.uniqueness}});
    }
    ordered_json anomalies = nullptr;
    if (q.anomalies) {
        ordered_json outliers = ordered_json::array();
        for (const auto& o : q.anomalies->outliers) {
            outliers.push_back({{"column_name", o.column_name}, {"outlier_count", o.outlier_count},
                                {"z_score_threshold", o.z_score_threshold}, {"mean", o.mean},
                                {"std_dev", o.std_dev}});
        }
        anomalies = {{"outlier_count", q.anomalies->total_outliers}, {"outliers", std::move(outliers)}};
    }
    ordered_json violations = ordered_json::array();
    for (const auto& v : q.threshold_violations) {
        violations.push_back({{"metric", v.metric}, {"threshold", v.threshold},
                              {"actual", v.actual}, {"severity", v.severity}});
    }

    ordered_json j;
    j["table_name"] = q.table_name;
    j["schema_name"] = optional_value(q.schema_name);
    j["completeness"] = {{"score", q.completeness.score}, {"column_details", std::move(completeness_cols)},
                         {"total_nulls", q.completeness.total_nulls},
                         {"total_empty", q.completeness.total_empty}};
    j["consistency"] = {{"score", q.consistency.score}, {"type_inconsistencies", std::move(type_issues)},
                        {"format_violations", std::move(format_issues)}};
    j["uniqueness"] = {{"score", q.uniqueness.score},
                       {"columns_with_duplicates", std::move(duplicate_cols)},
                       {"duplicate_row_count", q.uniqueness.duplicate_row_count}};
    j["anomalies"] = std::move(anomalies);
    j["quality_score"] = q.quality_score;
    j["threshold_violations"] = std::move(violations);
    j["analyzed_rows"] = q.analyzed_rows;
    j["analyzed_at"] = utils::format_timestamp(q.analyzed_at);
    return j;
}

ordered_json database_info_json(const DatabaseInfo& d) {
    ordered_json j;
    j["name"] = d.name;
    j["size_bytes"] = optional_value(d.size_bytes);
    j["owner"] = optional_value(d.owner);
    j["encoding"] = optional_value(d.encoding);
    j["collation"] = optional_value(d.collation);
    j["is_system_database"] = d.is_system_database;
    j["access_level"] = access_level_to_string(d.access_level);
    j["collection_status"] = to_json(d.collection_status);
    return j;
}

template<typename T, typename Fn>
ordered_json array_of(const std::vector<T>& items, Fn&& fn) {
    ordered_json arr = ordered_json::array();
    for (const auto& item : items) arr.push_back(fn(item));
    return arr;
}

ordered_json database_json(const DatabaseSchema& db) {
    ordered_json j;
    j["database_info"] = database_info_json(db.database_info);
    j["tables"] = array_of(db.tables, table_json);
    j["views"] = array_of(db.views, view_json);
    j["indexes"] = array_of(db.indexes, index_json);
    j["constraints"] = array_of(db.constraints, constraint_json);
    j["procedures"] = array_of(db.procedures, routine_json);
    j["functions"] = array_of(db.functions, routine_json);
    j["triggers"] = array_of(db.triggers, trigger_json);
    j["custom_types"] = array_of(db.custom_types, custom_type_json);
    j["samples"] = array_of(db.samples, sample_json);
    j["quality_metrics"] = array_of(db.quality_metrics, quality_json);
    j["warnings"] = db.warnings;
    return j;
}

ordered_json server_info_json(const ServerInfo& s) {
    const auto& mode = s.collection_mode;
    ordered_json mode_json = mode.kind == CollectionMode::Kind::SINGLE_DATABASE
        ? ordered_json("SingleDatabase")
        : tagged("MultiDatabase", {{"discovered", mode.discovered},
                                   {"collected", mode.collected},
                                   {"failed", mode.failed}});

    ordered_json j;
    j["server_type"] = database_type_to_string(s.server_type);
    j["version"] = s.version;
    j["host"] = s.host;
    j["port"] = optional_value(s.port);
    j["total_databases"] = s.total_databases;
    j["collected_databases"] = s.collected_databases;
    j["system_databases_excluded"] = s.system_databases_excluded;
    j["connection_user"] = s.connection_user;
    j["has_superuser_privileges"] = s.has_superuser_privileges;
    j["collection_mode"] = std::move(mode_json);
    return j;
}

} // namespace

ordered_json to_json(const UnifiedDataType& type) {
    return std::visit([](const auto& t) -> ordered_json {
        using T = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<T, types::Integer>) {
            return tagged("Integer", {{"bits", t.bits}, {"signed", t.is_signed}});
        } else if constexpr (std::is_same_v<T, types::Float>) {
            return tagged("Float", {{"precision", optional_value(t.precision)}});
        } else if constexpr (std::is_same_v<T, types::Decimal>) {
            return tagged("Decimal", {{"precision", optional_value(t.precision)},
                                      {"scale", optional_value(t.scale)}});
        } else if constexpr (std::is_same_v<T, types::String>) {
            return tagged("String", {{"max_length", optional_value(t.max_length)},
                                     {"fixed", t.fixed}});
        } else if constexpr (std::is_same_v<T, types::Boolean>) {
            return "Boolean";
        } else if constexpr (std::is_same_v<T, types::DateTime>) {
            return tagged("DateTime", {{"tz_aware", t.tz_aware}});
        } else if constexpr (std::is_same_v<T, types::Date>) {
            return "Date";
        } else if constexpr (std::is_same_v<T, types::Time>) {
            return "Time";
        } else if constexpr (std::is_same_v<T, types::Binary>) {
            return tagged("Binary", {{"max_length", optional_value(t.max_length)}});
        } else if constexpr (std::is_same_v<T, types::Array>) {
            return tagged("Array", {{"element_type",
                t.element_type ? to_json(*t.element_type) : ordered_json(nullptr)}});
        } else if constexpr (std::is_same_v<T, types::Object>) {
            ordered_json fields = ordered_json::array();
            for (const auto& f : t.fields) {
                fields.push_back({{"name", f.name},
                                  {"type", f.type ? to_json(*f.type) : ordered_json(nullptr)}});
            }
            return tagged("Object", {{"fields", std::move(fields)}});
        } else if constexpr (std::is_same_v<T, types::Json>) {
            return "Json";
        } else {
            return tagged("Custom", {{"type_name", t.type_name}, {"engine", t.engine}});
        }
    }, type.value);
}

ordered_json to_json(const CollectionStatus& status) {
    switch (status.kind()) {
        case CollectionStatus::Kind::SUCCESS:
            return "Success";
        case CollectionStatus::Kind::PARTIAL:
            return tagged("Partial", {{"errors", status.errors()}});
        case CollectionStatus::Kind::FAILED:
            return tagged("Failed", {{"error", status.message()}});
        case CollectionStatus::Kind::SKIPPED:
            return tagged("Skipped", {{"reason", status.message()}});
    }
    return "Success";
}

ordered_json to_json(const OrderingStrategy& strategy) {
    return std::visit([](const auto& s) -> ordered_json {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, ordering::PrimaryKey>) {
            return tagged("PrimaryKey", {{"columns", s.columns}});
        } else if constexpr (std::is_same_v<T, ordering::Timestamp>) {
            return tagged("Timestamp", {{"column", s.column},
                                        {"direction", sort_direction_to_string(s.direction)}});
        } else if constexpr (std::is_same_v<T, ordering::AutoIncrement>) {
            return tagged("AutoIncrement", {{"column", s.column}});
        } else if constexpr (std::is_same_v<T, ordering::SystemRowId>) {
            return tagged("SystemRowId", {{"column", s.column}});
        } else {
            return "Unordered";
        }
    }, strategy);
}

ordered_json to_json(const CollectionResult& result) {
    ordered_json j;
    j["format_version"] = CollectionResult::format_version;
    j["server_info"] = server_info_json(result.server_info);
    j["databases"] = array_of(result.databases, database_json);

    ordered_json failures = ordered_json::array();
    for (const auto& f : result.failures) {
        ordered_json fj;
        fj["database_name"] = f.database_name;
        fj["error_code"] = error_code_to_string(f.error_code);
        fj["error"] = f.error;
        fj["attempts"] = f.attempts;
        failures.push_back(std::move(fj));
    }
    j["failures"] = std::move(failures);

    ordered_json meta;
    meta["collected_at"] = utils::format_timestamp(result.metadata.collected_at);
    meta["duration_ms"] = result.metadata.duration_ms;
    meta["collector"] = kCollectorName;
    meta["collector_version"] = result.metadata.collector_version;
    meta["warnings"] = result.metadata.warnings;
    j["metadata"] = std::move(meta);
    return j;
}

Result<void> write_result(const CollectionResult& result, const OutputConfig& output) {
    std::ofstream file(output.path, std::ios::out | std::ios::trunc);
    if (!file) {
        return Result<void>::error(ErrorCode::INTERNAL_ERROR,
            std::format("Cannot open output file '{}'", output.path));
    }

    // Sampled values are already base64 where they were not valid UTF-8;
    // replacement only guards identifiers read from a misconfigured catalog
    file << to_json(result).dump(output.pretty ? 2 : -1, ' ', false,
                                 nlohmann::ordered_json::error_handler_t::replace);
    file << '\n';
    if (!file) {
        return Result<void>::error(ErrorCode::INTERNAL_ERROR,
            std::format("Failed writing output file '{}'", output.path));
    }
    return Result<void>::ok();
}

} // namespace dbsurvey
