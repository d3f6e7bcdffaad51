#pragma once

#include "db/idb_connection.hpp"

#include <nlohmann/json.hpp>

namespace dbsurvey {

/**
 * @brief Convert one fetched cell into a JSON value without altering it
 *
 * - NULL -> null
 * - INTEGER -> number when it fits int64/uint64, otherwise the original text
 * - REAL -> number when finite, otherwise the original text ("NaN", "Infinity")
 * - DECIMAL -> original text (no binary floating point rounding)
 * - BOOLEAN -> true/false
 * - BLOB -> base64 of the raw bytes
 * - TEXT -> string as retrieved
 */
[[nodiscard]] nlohmann::json encode_cell(const DbCell& cell);

/**
 * @brief Convert a result row into a {column: value} object
 */
[[nodiscard]] nlohmann::json encode_row(const std::vector<std::string>& column_names,
                                        const std::vector<DbCell>& row);

} // namespace dbsurvey
