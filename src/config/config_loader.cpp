#include "config/config_loader.hpp"
#include "db/connection_params.hpp"
#include "core/utils.hpp"
#include "sampling/quality_analyzer.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <regex>
#include <stdexcept>
#include <string_view>
#include <unordered_set>
#include <utility>

using namespace std::string_literals;

namespace dbsurvey {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key.str()) && base[key.str()].is_table()) {
            merge_tables(*base[key.str()].as_table(), *val.as_table());
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

/**
 * @brief Resolve include directives in a parsed TOML table.
 */
void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > 10) {
        throw std::runtime_error("Config include depth exceeds 10, possible circular include");
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Included file is the base, the including file wins
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

std::chrono::milliseconds toml_millis(const toml::table& tbl, const std::string_view key,
                                      int64_t default_ms) {
    return std::chrono::milliseconds(tbl[key].value_or(default_ms));
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

ConnectionConfig ConfigLoader::extract_connection(const toml::table& root) {
    ConnectionConfig cfg;
    const auto* conn = root["connection"].as_table();
    if (!conn) return cfg;
    const auto& c = *conn;

    cfg.url = c["url"].value_or(""s);
    cfg.connect_timeout = toml_millis(c, "connect_timeout_ms", 30000);
    cfg.query_timeout = toml_millis(c, "query_timeout_ms", 30000);
    cfg.max_connections = static_cast<uint32_t>(c["max_connections"].value_or(10));
    cfg.read_only = c["read_only"].value_or(true);
    cfg.application_name = c["application_name"].value_or("dbsurvey"s);
    return cfg;
}

SamplingConfig ConfigLoader::extract_sampling(const toml::table& root) {
    SamplingConfig cfg;
    const auto* sampling = root["sampling"].as_table();
    if (!sampling) return cfg;
    const auto& s = *sampling;

    cfg.enabled = s["enabled"].value_or(true);
    cfg.sample_size = static_cast<uint32_t>(s["sample_size"].value_or(100));
    cfg.query_timeout = toml_millis(s, "query_timeout_ms", 30000);
    cfg.throttle_delay = toml_millis(s, "throttle_ms", 0);

    if (s["timestamp_columns"].is_array()) {
        cfg.timestamp_columns = toml_string_array(s, "timestamp_columns");
    }

    // An explicit (even empty) pattern list replaces the defaults
    if (const auto* patterns = s["sensitive_patterns"].as_array()) {
        cfg.sensitive_patterns.clear();
        for (const auto& elem : *patterns) {
            const auto* p = elem.as_table();
            if (!p) continue;
            SensitivePattern pattern;
            pattern.pattern = (*p)["pattern"].value_or(""s);
            pattern.description = (*p)["description"].value_or(""s);
            cfg.sensitive_patterns.push_back(std::move(pattern));
        }
    }
    return cfg;
}

QualityConfig ConfigLoader::extract_quality(const toml::table& root) {
    QualityConfig cfg;
    const auto* quality = root["quality"].as_table();
    if (!quality) return cfg;
    const auto& q = *quality;

    cfg.enabled = q["enabled"].value_or(true);
    cfg.completeness_min = q["completeness_min"].value_or(0.95);
    cfg.uniqueness_min = q["uniqueness_min"].value_or(0.98);
    cfg.consistency_min = q["consistency_min"].value_or(0.90);
    if (const auto* anomaly = q["anomaly"].as_table()) {
        cfg.anomaly_enabled = (*anomaly)["enabled"].value_or(true);
        cfg.anomaly_sensitivity = (*anomaly)["sensitivity"].value_or("medium"s);
    }
    return cfg;
}

CollectionConfig ConfigLoader::extract_collection(const toml::table& root) {
    CollectionConfig cfg;
    const auto* collection = root["collection"].as_table();
    if (!collection) return cfg;
    const auto& c = *collection;

    cfg.all_databases = c["all_databases"].value_or(false);
    cfg.include_system_databases = c["include_system_databases"].value_or(false);
    cfg.exclude_databases = toml_string_array(c, "exclude_databases");
    cfg.max_concurrent_connections =
        static_cast<uint32_t>(c["max_concurrent_connections"].value_or(4));
    cfg.continue_on_error = c["continue_on_error"].value_or(true);
    if (const auto deadline = c["deadline_ms"].value<int64_t>()) {
        cfg.deadline = std::chrono::milliseconds(*deadline);
    }
    return cfg;
}

RetryConfig ConfigLoader::extract_retry(const toml::table& root) {
    RetryConfig cfg;
    const auto* retry = root["retry"].as_table();
    if (!retry) return cfg;
    const auto& r = *retry;

    cfg.max_attempts = static_cast<uint32_t>(r["max_attempts"].value_or(3));
    cfg.initial_backoff = toml_millis(r, "initial_backoff_ms", 500);
    cfg.jitter_min = toml_millis(r, "jitter_min_ms", 100);
    cfg.jitter_max = toml_millis(r, "jitter_max_ms", 300);
    cfg.max_total = toml_millis(r, "max_total_ms", 5000);
    return cfg;
}

OutputConfig ConfigLoader::extract_output(const toml::table& root) {
    OutputConfig cfg;
    const auto* output = root["output"].as_table();
    if (!output) return cfg;
    const auto& o = *output;

    cfg.path = o["path"].value_or("schema.dbsurvey.json"s);
    cfg.pretty = o["pretty"].value_or(true);
    return cfg;
}

CollectorConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    CollectorConfig config;
    config.connection = extract_connection(tbl);
    config.sampling = extract_sampling(tbl);
    config.quality = extract_quality(tbl);
    config.collection = extract_collection(tbl);
    config.retry = extract_retry(tbl);
    config.output = extract_output(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(CollectorConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const CollectorConfig& config) {
    std::vector<std::string> errors;

    const auto& conn = config.connection;
    if (conn.url.empty()) {
        errors.emplace_back("connection.url must not be empty");
    } else {
        // Messages from ConnectionParams are already free of credentials
        const auto params = ConnectionParams::parse(conn.url);
        if (params.is_error()) {
            errors.push_back(std::format("connection.url: {}", params.error_message()));
        }
    }
    if (!utils::in_range<1, 100>(conn.max_connections)) {
        errors.push_back(std::format(
            "connection.max_connections must be 1-100, got {}", conn.max_connections));
    }
    if (conn.connect_timeout.count() <= 0) {
        errors.emplace_back("connection.connect_timeout_ms must be > 0");
    }

    const auto& sampling = config.sampling;
    if (sampling.sample_size == 0) {
        errors.emplace_back("sampling.sample_size must be > 0");
    }
    if (sampling.query_timeout.count() <= 0) {
        errors.emplace_back("sampling.query_timeout_ms must be > 0");
    }
    if (sampling.throttle_delay.count() < 0) {
        errors.emplace_back("sampling.throttle_ms must be >= 0");
    }
    for (size_t i = 0; i < sampling.sensitive_patterns.size(); ++i) {
        const auto& p = sampling.sensitive_patterns[i];
        if (p.pattern.empty()) {
            errors.push_back(std::format("sampling.sensitive_patterns[{}].pattern must not be empty", i));
            continue;
        }
        try {
            std::string body = p.pattern;
            if (body.starts_with("(?i)")) body.erase(0, 4);
            std::regex compiled(body);
            (void)compiled;
        } catch (const std::regex_error& e) {
            errors.push_back(std::format(
                "sampling.sensitive_patterns[{}].pattern is not a valid regex: {}", i, e.what()));
        }
    }

    const auto& quality = config.quality;
    const std::pair<std::string_view, double> minimums[] = {
        {"completeness_min", quality.completeness_min},
        {"uniqueness_min", quality.uniqueness_min},
        {"consistency_min", quality.consistency_min},
    };
    for (const auto& [name, value] : minimums) {
        if (!(value >= 0.0 && value <= 1.0)) {
            errors.push_back(std::format("quality.{} must be between 0.0 and 1.0, got {}", name, value));
        }
    }
    if (!QualityAnalyzer::z_threshold_for(quality.anomaly_sensitivity)) {
        errors.push_back(std::format(
            "quality.anomaly.sensitivity must be low, medium or high, got '{}'",
            quality.anomaly_sensitivity));
    }

    const auto& collection = config.collection;
    if (!utils::in_range<1, 50>(collection.max_concurrent_connections)) {
        errors.push_back(std::format(
            "collection.max_concurrent_connections must be 1-50, got {}",
            collection.max_concurrent_connections));
    }
    if (collection.deadline && collection.deadline->count() <= 0) {
        errors.emplace_back("collection.deadline_ms must be > 0");
    }
    for (const auto& pattern : collection.exclude_databases) {
        if (!pattern.starts_with("regex:")) continue;
        try {
            std::regex compiled(pattern.substr(6));
            (void)compiled;
        } catch (const std::regex_error& e) {
            errors.push_back(std::format(
                "collection.exclude_databases entry '{}' is not a valid regex: {}", pattern, e.what()));
        }
    }

    const auto& retry = config.retry;
    if (retry.max_attempts == 0) {
        errors.emplace_back("retry.max_attempts must be > 0");
    }
    if (retry.jitter_min > retry.jitter_max) {
        errors.emplace_back("retry.jitter_min_ms must not exceed retry.jitter_max_ms");
    }

    if (config.output.path.empty()) {
        errors.emplace_back("output.path must not be empty");
    }

    return errors;
}

} // namespace dbsurvey
