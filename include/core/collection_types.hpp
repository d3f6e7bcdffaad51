#pragma once

#include "core/database_type.hpp"
#include "core/error.hpp"
#include "core/schema_types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace dbsurvey {

/// Output structure version; every serialized CollectionResult carries it.
inline constexpr std::string_view kFormatVersion = "1.0";

inline constexpr std::string_view kCollectorName = "dbsurvey";
inline constexpr std::string_view kCollectorVersion = "0.1.0";

// ============================================================================
// Access / Status
// ============================================================================

enum class AccessLevel { FULL, LIMITED, NONE };

[[nodiscard]] inline std::string_view access_level_to_string(AccessLevel a) {
    switch (a) {
        case AccessLevel::FULL: return "Full";
        case AccessLevel::LIMITED: return "Limited";
        case AccessLevel::NONE: return "None";
        default: return "None";
    }
}

/**
 * @brief Per-database collection outcome
 *
 * Partial carries the list of object classes that could not be read;
 * Failed and Skipped carry a single message.
 */
class CollectionStatus {
public:
    enum class Kind { SUCCESS, PARTIAL, FAILED, SKIPPED };

    CollectionStatus() = default;

    static CollectionStatus success() { return CollectionStatus(Kind::SUCCESS, {}); }
    static CollectionStatus partial(std::vector<std::string> errors) {
        return CollectionStatus(Kind::PARTIAL, std::move(errors));
    }
    static CollectionStatus failed(std::string error) {
        return CollectionStatus(Kind::FAILED, {std::move(error)});
    }
    static CollectionStatus skipped(std::string reason) {
        return CollectionStatus(Kind::SKIPPED, {std::move(reason)});
    }

    [[nodiscard]] Kind kind() const { return kind_; }
    [[nodiscard]] bool is_success() const { return kind_ == Kind::SUCCESS; }
    [[nodiscard]] bool is_partial() const { return kind_ == Kind::PARTIAL; }
    [[nodiscard]] bool is_failed() const { return kind_ == Kind::FAILED; }
    [[nodiscard]] bool is_skipped() const { return kind_ == Kind::SKIPPED; }

    [[nodiscard]] const std::vector<std::string>& errors() const { return messages_; }

    /// Failure error or skip reason
    [[nodiscard]] std::string message() const {
        return messages_.empty() ? std::string{} : messages_.front();
    }

    bool operator==(const CollectionStatus&) const = default;

private:
    CollectionStatus(Kind kind, std::vector<std::string> messages)
        : kind_(kind), messages_(std::move(messages)) {}

    Kind kind_ = Kind::SUCCESS;
    std::vector<std::string> messages_;
};

// ============================================================================
// Database / Server Info
// ============================================================================

struct DatabaseInfo {
    std::string name;
    std::optional<uint64_t> size_bytes;
    std::optional<std::string> owner;
    std::optional<std::string> encoding;
    std::optional<std::string> collation;
    bool is_system_database = false;          // engine flag or known system name
    AccessLevel access_level = AccessLevel::FULL;
    CollectionStatus collection_status;
};

struct CollectionMode {
    enum class Kind { SINGLE_DATABASE, MULTI_DATABASE };

    Kind kind = Kind::SINGLE_DATABASE;
    size_t discovered = 0;
    size_t collected = 0;
    size_t failed = 0;
};

struct ServerInfo {
    DatabaseType server_type = DatabaseType::POSTGRESQL;
    std::string version;
    std::string host;
    std::optional<uint16_t> port;
    size_t total_databases = 0;
    size_t collected_databases = 0;
    size_t system_databases_excluded = 0;
    std::string connection_user;
    bool has_superuser_privileges = false;
    CollectionMode collection_mode;
};

// ============================================================================
// Sampling
// ============================================================================

namespace ordering {

struct PrimaryKey {
    std::vector<std::string> columns;
    bool operator==(const PrimaryKey&) const = default;
};

struct Timestamp {
    std::string column;
    SortDirection direction = SortDirection::DESCENDING;
    bool operator==(const Timestamp&) const = default;
};

struct AutoIncrement {
    std::string column;
    bool operator==(const AutoIncrement&) const = default;
};

struct SystemRowId {
    std::string column;
    bool operator==(const SystemRowId&) const = default;
};

struct Unordered {
    bool operator==(const Unordered&) const = default;
};

} // namespace ordering

using OrderingStrategy = std::variant<
    ordering::PrimaryKey, ordering::Timestamp, ordering::AutoIncrement,
    ordering::SystemRowId, ordering::Unordered>;

[[nodiscard]] inline bool is_unordered(const OrderingStrategy& s) {
    return std::holds_alternative<ordering::Unordered>(s);
}

struct TableSample {
    std::string table_name;
    std::optional<std::string> schema_name;
    std::vector<nlohmann::json> rows;         // column name -> value, as retrieved
    uint32_t sample_size = 0;                 // requested limit
    std::optional<uint64_t> total_rows;
    OrderingStrategy strategy_used = ordering::Unordered{};
    std::chrono::system_clock::time_point collected_at{};
    std::vector<std::string> warnings;
};

// ============================================================================
// Data quality
// ============================================================================
// Only counts and ratios are reported; sampled values never leave the analyzer.

struct ColumnCompleteness {
    std::string column_name;
    uint64_t total_count = 0;
    uint64_t null_count = 0;
    uint64_t empty_count = 0;
    double completeness = 1.0;
};

struct CompletenessMetrics {
    double score = 1.0;
    std::vector<ColumnCompleteness> column_details;
    uint64_t total_nulls = 0;
    uint64_t total_empty = 0;
};

struct TypeInconsistency {
    std::string column_name;
    std::string expected_type;
    std::vector<std::string> found_types;
    uint64_t inconsistent_count = 0;
};

struct FormatViolation {
    std::string column_name;
    std::string expected_format;      // uuid, iso_datetime, iso_date, email
    uint64_t violation_count = 0;
};

struct ConsistencyMetrics {
    double score = 1.0;
    std::vector<TypeInconsistency> type_inconsistencies;
    std::vector<FormatViolation> format_violations;
};

struct ColumnUniqueness {
    std::string column_name;
    uint64_t total_count = 0;
    uint64_t duplicate_count = 0;
    double uniqueness = 1.0;
};

struct UniquenessMetrics {
    double score = 1.0;
    std::vector<ColumnUniqueness> columns_with_duplicates;
    uint64_t duplicate_row_count = 0;
};

struct ColumnOutliers {
    std::string column_name;
    uint64_t outlier_count = 0;
    double z_score_threshold = 0.0;
    double mean = 0.0;
    double std_dev = 0.0;
};

struct AnomalyMetrics {
    std::vector<ColumnOutliers> outliers;
    uint64_t total_outliers = 0;
};

struct ThresholdViolation {
    std::string metric;               // completeness, uniqueness, consistency
    double threshold = 0.0;
    double actual = 0.0;
    std::string severity;             // warning, critical
};

struct TableQualityMetrics {
    std::string table_name;
    std::optional<std::string> schema_name;
    CompletenessMetrics completeness;
    ConsistencyMetrics consistency;
    UniquenessMetrics uniqueness;
    std::optional<AnomalyMetrics> anomalies;
    double quality_score = 1.0;
    std::vector<ThresholdViolation> threshold_violations;
    uint64_t analyzed_rows = 0;
    std::chrono::system_clock::time_point analyzed_at{};
};

// ============================================================================
// Result envelope
// ============================================================================

struct DatabaseSchema {
    DatabaseInfo database_info;
    std::vector<Table> tables;
    std::vector<View> views;
    std::vector<Index> indexes;
    std::vector<Constraint> constraints;
    std::vector<Routine> procedures;
    std::vector<Routine> functions;
    std::vector<Trigger> triggers;
    std::vector<CustomType> custom_types;
    std::vector<TableSample> samples;
    std::vector<TableQualityMetrics> quality_metrics;
    std::vector<std::string> warnings;
};

struct DatabaseFailure {
    std::string database_name;
    ErrorCode error_code = ErrorCode::NONE;
    std::string error;
    uint32_t attempts = 0;
};

struct CollectionMetadata {
    std::chrono::system_clock::time_point collected_at{};
    uint64_t duration_ms = 0;
    std::string collector_version = std::string(kCollectorVersion);
    std::vector<std::string> warnings;
};

/**
 * @brief Versioned output of one collection run
 *
 * The format version is a type-level constant rather than a field so no
 * instance can be built without it.
 */
struct CollectionResult {
    static constexpr std::string_view format_version = kFormatVersion;

    ServerInfo server_info;
    std::vector<DatabaseSchema> databases;    // sorted by database name
    std::vector<DatabaseFailure> failures;
    CollectionMetadata metadata;
};

} // namespace dbsurvey
