#pragma once

#include "core/collection_types.hpp"
#include "config/config_types.hpp"
#include "db/connection_params.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace dbsurvey {

/**
 * @brief Optional capabilities an adapter may advertise
 */
enum class AdapterFeature {
    SCHEMA_COLLECTION,
    DATA_SAMPLING,
    MULTI_DATABASE,
    CONNECTION_POOLING,
    QUERY_TIMEOUT,
    READ_ONLY_MODE,
    VIEWS,
    ROUTINES,
    TRIGGERS,
    CUSTOM_TYPES,
    SCHEMA_INFERENCE,
};

/**
 * @brief Cooperative cancellation flag shared between the orchestrator and
 *        the adapters it drives
 *
 * Checked between queries; a query already in flight is bounded by the
 * per-query timeout instead.
 */
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { flag_->store(true, std::memory_order_release); }
    [[nodiscard]] bool is_cancelled() const { return flag_->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

/**
 * @brief Narrow, engine-independent adapter contract
 *
 * Every operation is read-only. Instances own exactly one connection pool
 * and are not shared between threads; the orchestrator gives each
 * per-database task its own instance via connect_to_database(), which is
 * the one operation that must be safe to call concurrently on a
 * connected adapter (it only reads the stored connection parameters).
 */
class IDatabaseAdapter {
public:
    virtual ~IDatabaseAdapter() = default;

    /**
     * @brief Open the connection described by params
     * @return CONNECTION_FAILED, CONNECTION_TIMEOUT or INSUFFICIENT_PRIVILEGE on failure
     */
    [[nodiscard]] virtual Result<void> connect(const ConnectionParams& params) = 0;

    /**
     * @brief Round-trip a trivial query over the live connection
     */
    [[nodiscard]] virtual Result<void> test_connection() = 0;

    /**
     * @brief Databases visible to the connected identity
     *
     * Each entry carries its engine system flag and access level; the
     * caller decides what to do with inaccessible ones.
     */
    [[nodiscard]] virtual Result<std::vector<DatabaseInfo>> list_databases() = 0;

    /**
     * @brief Connected adapter for a sibling database on the same server
     *
     * The name is validated against the safe-character allow-list before
     * it is used (INVALID_CONNECTION_TARGET).
     */
    [[nodiscard]] virtual Result<std::unique_ptr<IDatabaseAdapter>> connect_to_database(
        const std::string& name) = 0;

    /**
     * @brief Introspect the connected database
     *
     * Failure to enumerate tables is fatal; any other object class that
     * cannot be read is recorded in DatabaseSchema::warnings and the
     * database status becomes Partial.
     */
    [[nodiscard]] virtual Result<DatabaseSchema> collect_schema() = 0;

    /**
     * @brief Sample every table of the connected database
     */
    [[nodiscard]] virtual Result<std::vector<TableSample>> sample_data(
        const SamplingConfig& config) = 0;

    /**
     * @brief Sample the given tables (already introspected by collect_schema)
     *
     * A failing table yields a sample with no rows and a warning; the
     * others are unaffected.
     */
    [[nodiscard]] virtual Result<std::vector<TableSample>> sample_tables(
        const std::vector<Table>& tables,
        const SamplingConfig& config,
        const CancellationToken& cancel) = 0;

    [[nodiscard]] virtual Result<ServerInfo> server_info() = 0;

    [[nodiscard]] virtual DatabaseType database_type() const = 0;

    [[nodiscard]] virtual bool supports_feature(AdapterFeature feature) const = 0;

    /**
     * @brief Sanitized "engine://host:port/db" for logs (never credentials)
     */
    [[nodiscard]] virtual std::string display_name() const = 0;
};

} // namespace dbsurvey
