#pragma once

#include "aggregator/result_aggregator.hpp"
#include "config/config_types.hpp"
#include "core/collection_types.hpp"
#include "core/error.hpp"
#include "db/connection_params.hpp"
#include "db/database_adapter.hpp"
#include "orchestrator/database_filter.hpp"
#include "orchestrator/retry_policy.hpp"
#include "sampling/quality_analyzer.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dbsurvey {

/**
 * @brief Drives one collection run against one server
 *
 * In multi-database mode the discovered databases are filtered before any
 * connection is opened, then collected by at most max_concurrent_connections
 * worker threads. Each worker connects its own sibling adapter (so pools are
 * never shared), and hands its outcome back through a slot only it writes.
 * Results are assembled after all workers have joined.
 *
 * Configuration is held by value and never modified after construction.
 * An orchestrator performs a single run: once cancelled (externally, by
 * the deadline, or by a fail-fast abort) it stays cancelled.
 */
class CollectionOrchestrator {
public:
    CollectionOrchestrator(CollectionConfig collection,
                           SamplingConfig sampling,
                           RetryPolicy retry = RetryPolicy{},
                           QualityConfig quality = QualityConfig{});

    /**
     * @brief Connect the (unconnected) server adapter and collect
     *
     * Fatal errors: the initial connection, database discovery, a bad
     * exclusion pattern, or the first database failure when
     * continue_on_error is off. Anything else is reported inside the result.
     */
    [[nodiscard]] Result<CollectionResult> run(IDatabaseAdapter& adapter, const ConnectionParams& params);

    /**
     * @brief Stop scheduling new databases and cancel in-flight ones
     *
     * Safe to call from any thread. Unresolved databases are recorded as
     * Failed{"cancelled"}.
     */
    void cancel() { cancel_.cancel(); }

    [[nodiscard]] bool is_cancelled() const { return cancel_.is_cancelled(); }

private:
    /// Outcome of one per-database task; written only by the worker that ran it
    struct Outcome {
        bool resolved = false;
        std::optional<DatabaseSchema> schema;
        std::optional<DatabaseFailure> failure;
    };

    [[nodiscard]] Result<CollectionResult> run_single(IDatabaseAdapter& adapter,
                                                      const ConnectionParams& params,
                                                      ResultAggregator& aggregator);

    [[nodiscard]] Result<CollectionResult> run_multi(IDatabaseAdapter& server,
                                                     const ConnectionParams& params,
                                                     ResultAggregator& aggregator);

    /**
     * @brief Connect (with retry), introspect and sample one database
     */
    [[nodiscard]] Outcome collect_database(IDatabaseAdapter& server, const DatabaseInfo& info) const;

    /**
     * @brief Introspect and sample over an already connected adapter
     *
     * A sampling failure is a warning unless it was a cancellation. Collected
     * samples are scored for quality; each threshold violation becomes a
     * database warning.
     */
    [[nodiscard]] Result<DatabaseSchema> collect_connected(IDatabaseAdapter& adapter) const;

    [[nodiscard]] ServerInfo describe_server(IDatabaseAdapter& adapter,
                                             const ConnectionParams& params,
                                             ResultAggregator& aggregator) const;

    CollectionConfig collection_;
    SamplingConfig sampling_;
    RetryPolicy retry_;
    QualityAnalyzer quality_;
    CancellationToken cancel_;
};

/**
 * @brief Overlay what discovery knew about a database onto what introspection found
 *
 * Discovery owns the system flag and access level; introspection wins for
 * every optional attribute it managed to read.
 */
[[nodiscard]] DatabaseInfo merge_database_info(const DatabaseInfo& discovered, DatabaseInfo collected);

} // namespace dbsurvey
