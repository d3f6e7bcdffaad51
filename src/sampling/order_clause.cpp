#include "sampling/order_clause.hpp"

#include <format>

namespace dbsurvey {

namespace {

std::string descending_list(SqlDialect dialect, const std::vector<std::string>& columns) {
    std::string out;
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) out += ", ";
        out += quote_identifier(dialect, columns[i]);
        out += " DESC";
    }
    return out;
}

std::string_view random_function(SqlDialect dialect) {
    return dialect == SqlDialect::MYSQL ? "RAND()" : "RANDOM()";
}

} // namespace

std::string quote_identifier(SqlDialect dialect, std::string_view ident) {
    const char quote = (dialect == SqlDialect::MYSQL) ? '`' : '"';
    std::string out;
    out.reserve(ident.size() + 2);
    out += quote;
    for (const char c : ident) {
        if (c == quote) out += quote;
        out += c;
    }
    out += quote;
    return out;
}

std::string qualified_table_name(SqlDialect dialect, const Table& table) {
    if (table.schema && !table.schema->empty()) {
        return quote_identifier(dialect, *table.schema) + "." + quote_identifier(dialect, table.name);
    }
    return quote_identifier(dialect, table.name);
}

std::string build_order_clause(SqlDialect dialect, const OrderingStrategy& strategy) {
    return std::visit([dialect](const auto& s) -> std::string {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, ordering::PrimaryKey>) {
            return "ORDER BY " + descending_list(dialect, s.columns);
        } else if constexpr (std::is_same_v<T, ordering::Timestamp>) {
            return std::format("ORDER BY {} {}", quote_identifier(dialect, s.column),
                s.direction == SortDirection::DESCENDING ? "DESC" : "ASC");
        } else if constexpr (std::is_same_v<T, ordering::AutoIncrement> ||
                             std::is_same_v<T, ordering::SystemRowId>) {
            return std::format("ORDER BY {} DESC", quote_identifier(dialect, s.column));
        } else {
            return std::format("ORDER BY {}", random_function(dialect));
        }
    }, strategy);
}

std::string build_sample_query(SqlDialect dialect, const Table& table,
                               const OrderingStrategy& strategy, uint32_t limit) {
    return std::format("SELECT * FROM {} {} LIMIT {}",
        qualified_table_name(dialect, table), build_order_clause(dialect, strategy), limit);
}

std::string build_count_query(SqlDialect dialect, const Table& table) {
    return std::format("SELECT COUNT(*) FROM {}", qualified_table_name(dialect, table));
}

} // namespace dbsurvey
