#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace dbsurvey {

// ============================================================================
// ConfigLoader - Extract typed collector config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        CollectorConfig config;

        static LoadResult ok(CollectorConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to the collector TOML file
     * @return LoadResult with parsed config or error
     *
     * Supports `include = ["other.toml"]` and ${ENV_VAR} expansion in
     * string values (used to keep credentials out of the file).
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Validate semantic constraints (ranges, required fields)
     * @return Human-readable errors; empty when valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const CollectorConfig& config);

private:
    static ConnectionConfig extract_connection(const toml::table& root);
    static SamplingConfig extract_sampling(const toml::table& root);
    static QualityConfig extract_quality(const toml::table& root);
    static CollectionConfig extract_collection(const toml::table& root);
    static RetryConfig extract_retry(const toml::table& root);
    static OutputConfig extract_output(const toml::table& root);

    static CollectorConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(CollectorConfig config);
};

} // namespace dbsurvey
