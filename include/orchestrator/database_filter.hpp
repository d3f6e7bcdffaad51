#pragma once

#include "config/config_types.hpp"
#include "core/collection_types.hpp"
#include "core/database_type.hpp"
#include "core/error.hpp"

#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace dbsurvey {

/**
 * @brief Shell-style match: '*' any run of characters, '?' exactly one
 */
[[nodiscard]] bool glob_match(std::string_view pattern, std::string_view text);

enum class FilterDecision {
    COLLECT,
    EXCLUDE_PATTERN,      // matched exclude_databases; never reported
    EXCLUDE_SYSTEM,       // system database while include_system_databases is off
    SKIP_INACCESSIBLE,    // reported as Skipped
};

[[nodiscard]] std::string_view filter_decision_to_string(FilterDecision d);

/**
 * @brief Decides, before any connection is opened, which discovered
 *        databases are collected
 *
 * Exclusion entries are exact names, globs (any entry containing '*' or
 * '?') or "regex:<ECMAScript>" patterns matched against the whole name.
 * Exclusion wins over everything, including include_system_databases.
 */
class DatabaseFilter {
public:
    /**
     * @return CONFIGURATION_ERROR when a regex: entry does not compile
     */
    [[nodiscard]] static Result<DatabaseFilter> create(const CollectionConfig& config, DatabaseType engine);

    [[nodiscard]] FilterDecision decide(const DatabaseInfo& db) const;

    /// Engine flag or a known system name
    [[nodiscard]] bool is_system(const DatabaseInfo& db) const;

    [[nodiscard]] bool is_excluded(std::string_view name) const;

private:
    struct Rule {
        enum class Kind { EXACT, GLOB, REGEX };
        Kind kind = Kind::EXACT;
        std::string text;
        std::regex re;
    };

    DatabaseFilter(std::vector<Rule> rules, bool include_system, DatabaseType engine)
        : rules_(std::move(rules)), include_system_(include_system), engine_(engine) {}

    std::vector<Rule> rules_;
    bool include_system_ = false;
    DatabaseType engine_;
};

} // namespace dbsurvey
