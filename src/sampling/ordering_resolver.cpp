#include "sampling/ordering_resolver.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace dbsurvey {

namespace {

std::vector<const Column*> columns_by_ordinal(const Table& table) {
    std::vector<const Column*> cols;
    cols.reserve(table.columns.size());
    for (const auto& col : table.columns) {
        cols.push_back(&col);
    }
    std::stable_sort(cols.begin(), cols.end(), [](const Column* a, const Column* b) {
        return a->ordinal_position < b->ordinal_position;
    });
    return cols;
}

std::string join(const std::vector<std::string>& parts) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += ", ";
        out += parts[i];
    }
    return out;
}

} // namespace

OrderingStrategy resolve_ordering(const Table& table,
                                  const std::vector<std::string>& timestamp_candidates) {
    if (table.primary_key && !table.primary_key->columns.empty()) {
        return ordering::PrimaryKey{table.primary_key->columns};
    }

    const auto cols = columns_by_ordinal(table);

    // Some catalogs only flag key columns without a separate key definition
    std::vector<std::string> flagged_pk;
    for (const Column* col : cols) {
        if (col->is_primary_key) flagged_pk.push_back(col->name);
    }
    if (!flagged_pk.empty()) {
        return ordering::PrimaryKey{std::move(flagged_pk)};
    }

    for (const auto& candidate : timestamp_candidates) {
        for (const Column* col : cols) {
            if (utils::iequals(col->name, candidate) && col->data_type.is_date_like()) {
                return ordering::Timestamp{col->name, SortDirection::DESCENDING};
            }
        }
    }

    for (const Column* col : cols) {
        if (col->is_auto_increment) {
            return ordering::AutoIncrement{col->name};
        }
    }

    if (table.system_row_id && !table.system_row_id->empty()) {
        return ordering::SystemRowId{*table.system_row_id};
    }

    return ordering::Unordered{};
}

std::string describe_ordering(const OrderingStrategy& strategy) {
    return std::visit([](const auto& s) -> std::string {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, ordering::PrimaryKey>) {
            return std::format("primary key ({})", join(s.columns));
        } else if constexpr (std::is_same_v<T, ordering::Timestamp>) {
            return std::format("timestamp ({} {})", s.column,
                s.direction == SortDirection::DESCENDING ? "desc" : "asc");
        } else if constexpr (std::is_same_v<T, ordering::AutoIncrement>) {
            return std::format("auto-increment ({})", s.column);
        } else if constexpr (std::is_same_v<T, ordering::SystemRowId>) {
            return std::format("system row id ({})", s.column);
        } else {
            return "unordered";
        }
    }, strategy);
}

} // namespace dbsurvey
