#pragma once

#include "config/config_types.hpp"
#include "core/schema_types.hpp"

#include <regex>
#include <string>
#include <vector>

namespace dbsurvey {

/**
 * @brief Flags column names that may hold sensitive data
 *
 * Detection only: looks at names, never at values, and never alters a
 * sample. Patterns with a leading "(?i)" are compiled case-insensitive.
 */
class SensitiveFieldDetector {
public:
    /**
     * @throws std::regex_error on an invalid pattern (config validation
     *         rejects these before a detector is built)
     */
    explicit SensitiveFieldDetector(const std::vector<SensitivePattern>& patterns);

    /**
     * @brief Warning for the first matching pattern, if any
     */
    [[nodiscard]] std::optional<std::string> check(const std::string& column_name) const;

    /**
     * @brief One warning per matching column, in column order
     */
    [[nodiscard]] std::vector<std::string> scan(const std::vector<Column>& columns) const;

    [[nodiscard]] size_t pattern_count() const { return patterns_.size(); }

private:
    struct CompiledPattern {
        std::regex regex;
        std::string description;
    };

    std::vector<CompiledPattern> patterns_;
};

} // namespace dbsurvey
