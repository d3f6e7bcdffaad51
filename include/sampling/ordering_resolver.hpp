#pragma once

#include "core/collection_types.hpp"
#include "core/schema_types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace dbsurvey {

inline constexpr std::string_view kUnorderedSamplingWarning =
    "No reliable ordering found - using random sampling which may not be reproducible";

/**
 * @brief Choose the row ordering used to sample a table
 *
 * First match wins:
 *   1. declared primary key (declared column order, composite keys kept)
 *   2. a date/time column whose name matches a timestamp candidate
 *      (case-insensitive, candidates tried in list order), descending
 *   3. the first auto-increment column by ordinal position
 *   4. the engine's system row identifier
 *   5. Unordered
 *
 * Pure: depends only on the table definition and the candidate list.
 */
[[nodiscard]] OrderingStrategy resolve_ordering(
    const Table& table, const std::vector<std::string>& timestamp_candidates);

/**
 * @brief Short description for logs, e.g. "primary key (id)"
 */
[[nodiscard]] std::string describe_ordering(const OrderingStrategy& strategy);

} // namespace dbsurvey
