#include "sampling/sensitive_field_detector.hpp"

#include <format>

namespace dbsurvey {

SensitiveFieldDetector::SensitiveFieldDetector(const std::vector<SensitivePattern>& patterns) {
    patterns_.reserve(patterns.size());
    for (const auto& p : patterns) {
        std::string body = p.pattern;
        auto flags = std::regex::ECMAScript | std::regex::optimize;
        if (body.starts_with("(?i)")) {
            body.erase(0, 4);
            flags |= std::regex::icase;
        }
        patterns_.push_back({std::regex(body, flags), p.description});
    }
}

std::optional<std::string> SensitiveFieldDetector::check(const std::string& column_name) const {
    for (const auto& p : patterns_) {
        if (std::regex_search(column_name, p.regex)) {
            return std::format("Column '{}' may contain sensitive data ({})",
                               column_name, p.description);
        }
    }
    return std::nullopt;
}

std::vector<std::string> SensitiveFieldDetector::scan(const std::vector<Column>& columns) const {
    std::vector<std::string> warnings;
    for (const auto& col : columns) {
        if (auto warning = check(col.name)) {
            warnings.push_back(std::move(*warning));
        }
    }
    return warnings;
}

} // namespace dbsurvey
