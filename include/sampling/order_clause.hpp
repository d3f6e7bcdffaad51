#pragma once

#include "core/collection_types.hpp"
#include "core/schema_types.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace dbsurvey {

enum class SqlDialect { POSTGRESQL, MYSQL, SQLITE };

/**
 * @brief Quote an identifier for the dialect, doubling embedded quote characters
 *
 * PostgreSQL/SQLite use "ident", MySQL uses `ident`.
 */
[[nodiscard]] std::string quote_identifier(SqlDialect dialect, std::string_view ident);

/**
 * @brief Quoted, schema-qualified table reference
 */
[[nodiscard]] std::string qualified_table_name(SqlDialect dialect, const Table& table);

/**
 * @brief ORDER BY clause for a strategy
 *
 * Ordered strategies sort descending (most recent rows first); Unordered
 * becomes the dialect's random-order construct (RANDOM() / RAND()).
 */
[[nodiscard]] std::string build_order_clause(SqlDialect dialect, const OrderingStrategy& strategy);

/**
 * @brief SELECT * ... ORDER BY ... LIMIT n
 */
[[nodiscard]] std::string build_sample_query(SqlDialect dialect, const Table& table,
                                             const OrderingStrategy& strategy, uint32_t limit);

/**
 * @brief SELECT COUNT(*) over the qualified table
 */
[[nodiscard]] std::string build_count_query(SqlDialect dialect, const Table& table);

} // namespace dbsurvey
