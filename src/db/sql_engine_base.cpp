#include "db/sql_engine_base.hpp"
#include "core/utils.hpp"
#include "sampling/value_encoder.hpp"

#include <format>

namespace dbsurvey {

SqlEngineBase::~SqlEngineBase() {
    if (!pool_) {
        return;
    }
    const auto stats = pool_->get_stats();
    utils::log::info(std::format("Closing {}: {} connection(s), {} acquires, {} failed, {} unhealthy",
                                 params_.display(), stats.total_connections, stats.total_acquires,
                                 stats.failed_acquires, stats.health_check_failures));
}

PoolStats SqlEngineBase::pool_stats() const {
    return pool_ ? pool_->get_stats() : PoolStats{};
}

Result<void> SqlEngineBase::open_pool(const ConnectionParams& params,
                                      std::unique_ptr<IConnectionFactory> factory) {
    params_ = params;
    pool_ = std::make_unique<ConnectionPool>(params_, std::move(factory));

    auto lease = pool_->acquire();
    if (lease.is_error()) {
        pool_.reset();
        return Result<void>::propagate(lease);
    }
    return Result<void>::ok();
}

Result<DbResultSet> SqlEngineBase::query(const std::string& sql) {
    if (!pool_) {
        return Result<DbResultSet>::error(ErrorCode::CONNECTION_FAILED, "Engine is not connected");
    }
    auto lease = pool_->acquire();
    if (lease.is_error()) {
        return Result<DbResultSet>::propagate(lease);
    }
    return lease.value()->execute(sql);
}

Result<DbResultSet> SqlEngineBase::query(const std::string& sql,
                                         std::chrono::milliseconds timeout) {
    if (!pool_) {
        return Result<DbResultSet>::error(ErrorCode::CONNECTION_FAILED, "Engine is not connected");
    }
    auto acquired = pool_->acquire();
    if (acquired.is_error()) {
        return Result<DbResultSet>::propagate(acquired);
    }
    auto& lease = acquired.value();

    if (!lease->set_query_timeout(timeout)) {
        utils::log::warn(std::format("Could not apply {}ms query timeout on {}",
                                     timeout.count(), params_.display()));
    }
    auto result = lease->execute(sql);
    if (!lease->set_query_timeout(params_.query_timeout)) {
        utils::log::warn(std::format("Could not restore query timeout on {}", params_.display()));
    }
    return result;
}

Result<void> SqlEngineBase::ping() {
    auto rs = query("SELECT 1");
    if (rs.is_error()) {
        return Result<void>::propagate(rs);
    }
    return Result<void>::ok();
}

Result<std::vector<nlohmann::json>> SqlEngineBase::fetch_sample(
    const Table& table, const OrderingStrategy& strategy, const SampleRequest& request) {

    const std::string sql = build_sample_query(dialect_, table, strategy, request.limit);
    auto rs = query(sql, request.timeout);
    if (rs.is_error()) {
        return Result<std::vector<nlohmann::json>>::propagate(rs);
    }

    const auto& result = rs.value();
    std::vector<nlohmann::json> rows;
    rows.reserve(result.rows.size());
    for (const auto& row : result.rows) {
        rows.push_back(encode_row(result.column_names, row));
    }
    return Result<std::vector<nlohmann::json>>::ok(std::move(rows));
}

std::optional<uint64_t> SqlEngineBase::count_rows(const Table& table) {
    auto rs = query(build_count_query(dialect_, table));
    if (rs.is_error() || rs.value().rows.empty() || rs.value().rows[0].empty()) {
        return std::nullopt;
    }
    const auto& cell = rs.value().rows[0][0];
    if (cell.is_null()) {
        return std::nullopt;
    }
    return utils::try_parse_int<uint64_t>(cell.data);
}

std::string SqlEngineBase::quote_literal(std::string_view value) const {
    std::string out;
    out.reserve(value.size() + 2);
    out += '\'';
    for (const char c : value) {
        if (c == '\'') out += '\'';
        // MySQL treats backslash as an escape inside literals by default
        if (c == '\\' && dialect_ == SqlDialect::MYSQL) out += '\\';
        out += c;
    }
    out += '\'';
    return out;
}

// ============================================================================
// Catalog row helpers
// ============================================================================

std::optional<std::string> cell_text(const DbResultSet& rs,
                                     const std::vector<DbCell>& row,
                                     std::string_view column) {
    const int idx = rs.column_index(column);
    if (idx < 0 || static_cast<size_t>(idx) >= row.size()) {
        return std::nullopt;
    }
    return row[static_cast<size_t>(idx)].text();
}

std::string cell_string(const DbResultSet& rs,
                        const std::vector<DbCell>& row,
                        std::string_view column) {
    return cell_text(rs, row, column).value_or("");
}

std::optional<uint64_t> cell_uint(const DbResultSet& rs,
                                  const std::vector<DbCell>& row,
                                  std::string_view column) {
    const auto text = cell_text(rs, row, column);
    if (!text) return std::nullopt;
    // Catalog estimates may come back as "1234" or "1234.0"
    const auto dot = text->find('.');
    return utils::try_parse_int<uint64_t>(std::string_view(*text).substr(0, dot));
}

bool cell_bool(const DbResultSet& rs,
               const std::vector<DbCell>& row,
               std::string_view column) {
    const auto text = cell_text(rs, row, column);
    if (!text) return false;
    const std::string v = utils::to_lower(*text);
    return v == "t" || v == "true" || v == "yes" || v == "1" || v == "on";
}

} // namespace dbsurvey
