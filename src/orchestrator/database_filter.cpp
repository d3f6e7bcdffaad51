#include "orchestrator/database_filter.hpp"

#include <format>

namespace dbsurvey {

bool glob_match(std::string_view pattern, std::string_view text) {
    // Iterative matcher with single-star backtracking
    size_t p = 0;
    size_t t = 0;
    size_t star = std::string_view::npos;
    size_t resume = 0;

    while (t < text.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
            ++p;
            ++t;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            resume = t;
        } else if (star != std::string_view::npos) {
            p = star + 1;
            t = ++resume;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

std::string_view filter_decision_to_string(FilterDecision d) {
    switch (d) {
        case FilterDecision::COLLECT: return "collect";
        case FilterDecision::EXCLUDE_PATTERN: return "excluded by pattern";
        case FilterDecision::EXCLUDE_SYSTEM: return "system database";
        case FilterDecision::SKIP_INACCESSIBLE: return "inaccessible";
        default: return "unknown";
    }
}

Result<DatabaseFilter> DatabaseFilter::create(const CollectionConfig& config, DatabaseType engine) {
    static constexpr std::string_view kRegexPrefix = "regex:";

    std::vector<Rule> rules;
    rules.reserve(config.exclude_databases.size());
    for (const auto& entry : config.exclude_databases) {
        Rule rule;
        if (entry.starts_with(kRegexPrefix)) {
            rule.kind = Rule::Kind::REGEX;
            rule.text = entry.substr(kRegexPrefix.size());
            try {
                rule.re = std::regex(rule.text, std::regex::ECMAScript);
            } catch (const std::regex_error& e) {
                return Result<DatabaseFilter>::error(ErrorCode::CONFIGURATION_ERROR,
                    std::format("Invalid exclude pattern '{}': {}", entry, e.what()));
            }
        } else if (entry.find_first_of("*?") != std::string::npos) {
            rule.kind = Rule::Kind::GLOB;
            rule.text = entry;
        } else {
            rule.text = entry;
        }
        rules.push_back(std::move(rule));
    }
    return Result<DatabaseFilter>::ok(
        DatabaseFilter(std::move(rules), config.include_system_databases, engine));
}

bool DatabaseFilter::is_excluded(std::string_view name) const {
    for (const auto& rule : rules_) {
        switch (rule.kind) {
            case Rule::Kind::EXACT:
                if (rule.text == name) return true;
                break;
            case Rule::Kind::GLOB:
                if (glob_match(rule.text, name)) return true;
                break;
            case Rule::Kind::REGEX:
                if (std::regex_match(name.begin(), name.end(), rule.re)) return true;
                break;
        }
    }
    return false;
}

bool DatabaseFilter::is_system(const DatabaseInfo& db) const {
    return db.is_system_database || is_known_system_database(engine_, db.name);
}

FilterDecision DatabaseFilter::decide(const DatabaseInfo& db) const {
    if (is_excluded(db.name)) {
        return FilterDecision::EXCLUDE_PATTERN;
    }
    if (!include_system_ && is_system(db)) {
        return FilterDecision::EXCLUDE_SYSTEM;
    }
    if (db.access_level == AccessLevel::NONE) {
        return FilterDecision::SKIP_INACCESSIBLE;
    }
    return FilterDecision::COLLECT;
}

} // namespace dbsurvey
