#pragma once

#include "core/collection_types.hpp"
#include "db/connection_pool.hpp"
#include "db/database_engine.hpp"
#include "sampling/order_clause.hpp"

#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dbsurvey {

/**
 * @brief Shared plumbing for the relational engines
 *
 * Owns the engine's connection pool and implements the parts of the
 * engine interface that differ only by dialect: pinging, sampling with
 * an ORDER BY built from the resolved strategy, and COUNT(*).
 */
class SqlEngineBase {
public:
    explicit SqlEngineBase(SqlDialect dialect) : dialect_(dialect) {}
    virtual ~SqlEngineBase();

    SqlEngineBase(const SqlEngineBase&) = delete;
    SqlEngineBase& operator=(const SqlEngineBase&) = delete;

    [[nodiscard]] Result<void> ping();

    [[nodiscard]] Result<std::vector<nlohmann::json>> fetch_sample(
        const Table& table, const OrderingStrategy& strategy, const SampleRequest& request);

    /**
     * @brief Exact COUNT(*); nullopt when the query fails
     */
    [[nodiscard]] std::optional<uint64_t> count_rows(const Table& table);

    [[nodiscard]] const ConnectionParams& params() const { return params_; }

    /**
     * @brief Pool counters; all zero before open()
     */
    [[nodiscard]] PoolStats pool_stats() const;

protected:
    /**
     * @brief Build the pool and prove the credentials with one connection
     */
    [[nodiscard]] Result<void> open_pool(const ConnectionParams& params,
                                         std::unique_ptr<IConnectionFactory> factory);

    /**
     * @brief Run a catalog query on a pooled connection
     */
    [[nodiscard]] Result<DbResultSet> query(const std::string& sql);

    /**
     * @brief Run a query under its own timeout, restoring the session default afterwards
     */
    [[nodiscard]] Result<DbResultSet> query(const std::string& sql,
                                            std::chrono::milliseconds timeout);

    [[nodiscard]] SqlDialect dialect() const { return dialect_; }

    /**
     * @brief String literal for catalog queries ('it''s')
     */
    [[nodiscard]] std::string quote_literal(std::string_view value) const;

    ConnectionParams params_;

private:
    SqlDialect dialect_;
    std::unique_ptr<ConnectionPool> pool_;
};

// ============================================================================
// Catalog row helpers
// ============================================================================

/**
 * @brief Cell text by column name; nullopt for NULL or a missing column
 */
[[nodiscard]] std::optional<std::string> cell_text(const DbResultSet& rs,
                                                   const std::vector<DbCell>& row,
                                                   std::string_view column);

/**
 * @brief Cell text by column name, empty for NULL
 */
[[nodiscard]] std::string cell_string(const DbResultSet& rs,
                                      const std::vector<DbCell>& row,
                                      std::string_view column);

[[nodiscard]] std::optional<uint64_t> cell_uint(const DbResultSet& rs,
                                                const std::vector<DbCell>& row,
                                                std::string_view column);

/**
 * @brief Boolean cell in any catalog spelling (t/f, true/false, YES/NO, 1/0)
 */
[[nodiscard]] bool cell_bool(const DbResultSet& rs,
                             const std::vector<DbCell>& row,
                             std::string_view column);

} // namespace dbsurvey
