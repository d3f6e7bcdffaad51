#pragma once

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstdint>

namespace dbsurvey {

// ============================================================================
// Configuration Types
// ============================================================================

/**
 * @brief Column-name pattern flagged as possibly sensitive
 *
 * A leading "(?i)" marks the pattern case-insensitive.
 */
struct SensitivePattern {
    std::string pattern;
    std::string description;
};

[[nodiscard]] inline std::vector<SensitivePattern> default_sensitive_patterns() {
    return {
        {"(?i)(password|passwd|pwd)", "Password field detected"},
        {"(?i)(email|mail)", "Email field detected"},
        {"(?i)(ssn|social_security)", "Social Security Number field detected"},
        {"(?i)(credit_card|card_number|cvv)", "Credit card field detected"},
        {"(?i)(api_key|apikey|secret_key)", "API key field detected"},
        {"(?i)(token|auth_token|bearer)", "Authentication token field detected"},
        {"(?i)(phone|mobile|msisdn)", "Phone number field detected"},
    };
}

[[nodiscard]] inline std::vector<std::string> default_timestamp_columns() {
    return {"created_at", "updated_at", "modified_at", "timestamp"};
}

struct SamplingConfig {
    bool enabled = true;
    uint32_t sample_size = 100;
    std::chrono::milliseconds query_timeout{30000};
    std::chrono::milliseconds throttle_delay{0};
    std::vector<std::string> timestamp_columns = default_timestamp_columns();
    std::vector<SensitivePattern> sensitive_patterns = default_sensitive_patterns();
};

/**
 * @brief Thresholds for the per-table data quality report
 *
 * Each minimum is a ratio in [0, 1]. Sensitivity maps to the z-score an
 * outlier must exceed: low 3.0, medium 2.5, high 2.0.
 */
struct QualityConfig {
    bool enabled = true;
    double completeness_min = 0.95;
    double uniqueness_min = 0.98;
    double consistency_min = 0.90;
    bool anomaly_enabled = true;
    std::string anomaly_sensitivity = "medium";
};

struct CollectionConfig {
    bool all_databases = false;
    bool include_system_databases = false;
    std::vector<std::string> exclude_databases;   // exact, glob (* ?), or "regex:<re>"
    uint32_t max_concurrent_connections = 4;
    bool continue_on_error = true;
    std::optional<std::chrono::milliseconds> deadline;
};

/**
 * @brief Bounded reconnect policy applied per database
 */
struct RetryConfig {
    uint32_t max_attempts = 3;
    std::chrono::milliseconds initial_backoff{500};
    std::chrono::milliseconds jitter_min{100};
    std::chrono::milliseconds jitter_max{300};
    std::chrono::milliseconds max_total{5000};
};

struct ConnectionConfig {
    std::string url;
    std::chrono::milliseconds connect_timeout{30000};
    std::chrono::milliseconds query_timeout{30000};
    uint32_t max_connections = 10;
    bool read_only = true;
    std::string application_name = "dbsurvey";
};

struct OutputConfig {
    std::string path = "schema.dbsurvey.json";
    bool pretty = true;
};

/**
 * @brief Complete parsed configuration for one collector run
 */
struct CollectorConfig {
    ConnectionConfig connection;
    SamplingConfig sampling;
    QualityConfig quality;
    CollectionConfig collection;
    RetryConfig retry;
    OutputConfig output;
};

} // namespace dbsurvey
