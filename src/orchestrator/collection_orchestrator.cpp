#include "orchestrator/collection_orchestrator.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <format>
#include <mutex>
#include <thread>

namespace dbsurvey {

namespace {

constexpr std::string_view kCancelledError = "cancelled";

/**
 * @brief Cancels the token when the overall deadline passes
 *
 * The watcher thread exits early when the guard goes out of scope.
 */
class DeadlineGuard {
public:
    DeadlineGuard(std::optional<std::chrono::milliseconds> deadline, CancellationToken token)
        : token_(std::move(token)) {
        if (!deadline) return;
        const auto expires_at = std::chrono::steady_clock::now() + *deadline;
        watcher_ = std::thread([this, expires_at, limit = *deadline] {
            std::unique_lock lock(mutex_);
            if (!cv_.wait_until(lock, expires_at, [this] { return done_; })) {
                utils::log::warn(std::format(
                    "Collection deadline of {}ms reached, cancelling remaining work", limit.count()));
                token_.cancel();
            }
        });
    }

    ~DeadlineGuard() {
        {
            std::lock_guard lock(mutex_);
            done_ = true;
        }
        cv_.notify_all();
        if (watcher_.joinable()) {
            watcher_.join();
        }
    }

    DeadlineGuard(const DeadlineGuard&) = delete;
    DeadlineGuard& operator=(const DeadlineGuard&) = delete;

private:
    CancellationToken token_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool done_ = false;
    std::thread watcher_;
};

DatabaseFailure cancelled_failure(const std::string& name, uint32_t attempts) {
    return DatabaseFailure{name, ErrorCode::CANCELLED, std::string(kCancelledError), attempts};
}

} // namespace

DatabaseInfo merge_database_info(const DatabaseInfo& discovered, DatabaseInfo collected) {
    collected.name = discovered.name;
    if (!collected.size_bytes) collected.size_bytes = discovered.size_bytes;
    if (!collected.owner) collected.owner = discovered.owner;
    if (!collected.encoding) collected.encoding = discovered.encoding;
    if (!collected.collation) collected.collation = discovered.collation;
    collected.is_system_database = discovered.is_system_database || collected.is_system_database;
    collected.access_level = discovered.access_level;
    return collected;
}

CollectionOrchestrator::CollectionOrchestrator(CollectionConfig collection,
                                               SamplingConfig sampling,
                                               RetryPolicy retry,
                                               QualityConfig quality)
    : collection_(std::move(collection)),
      sampling_(std::move(sampling)),
      retry_(std::move(retry)),
      quality_(quality) {}

Result<CollectionResult> CollectionOrchestrator::run(IDatabaseAdapter& adapter,
                                                     const ConnectionParams& params) {
    ResultAggregator aggregator;
    DeadlineGuard deadline(collection_.deadline, cancel_);

    uint32_t attempts = 0;
    auto connected = retry_.run<void>(
        [&] { return adapter.connect(params); },
        std::format("Connecting to {}", params.display()), cancel_, attempts);
    if (connected.is_error()) {
        utils::log::error(std::format("Could not connect to {} after {} attempt(s): {}",
                                      params.display(), attempts, connected.error_message()));
        return Result<CollectionResult>::propagate(connected);
    }

    const bool multi = collection_.all_databases &&
                       adapter.supports_feature(AdapterFeature::MULTI_DATABASE);
    if (collection_.all_databases && !multi) {
        const auto warning = std::format(
            "{} does not support multi-database collection; collecting the connected database only",
            database_type_to_string(adapter.database_type()));
        utils::log::warn(warning);
        aggregator.add_warning(warning);
    }

    return multi ? run_multi(adapter, params, aggregator)
                 : run_single(adapter, params, aggregator);
}

Result<CollectionResult> CollectionOrchestrator::run_single(IDatabaseAdapter& adapter,
                                                            const ConnectionParams& params,
                                                            ResultAggregator& aggregator) {
    ServerInfo server = describe_server(adapter, params, aggregator);

    auto schema = collect_connected(adapter);
    if (schema.is_ok()) {
        aggregator.add_database(schema.take_value());
    } else {
        if (!collection_.continue_on_error && schema.error_code() != ErrorCode::CANCELLED) {
            return Result<CollectionResult>::propagate(schema);
        }
        DatabaseInfo base;
        base.name = params.database;
        auto failure = schema.error_code() == ErrorCode::CANCELLED
            ? cancelled_failure(params.database, 1)
            : DatabaseFailure{params.database, schema.error_code(), schema.error_message(), 1};
        utils::log::warn(std::format("Collection of {} failed: {}", adapter.display_name(), failure.error));
        aggregator.add_failure(std::move(base), std::move(failure));
    }

    server.total_databases = 1;
    server.collected_databases = aggregator.collected_count();
    server.collection_mode = CollectionMode{CollectionMode::Kind::SINGLE_DATABASE, 1,
                                            aggregator.collected_count(), aggregator.failed_count()};
    aggregator.set_server_info(std::move(server));
    return Result<CollectionResult>::ok(aggregator.finish());
}

Result<CollectionResult> CollectionOrchestrator::run_multi(IDatabaseAdapter& server_adapter,
                                                           const ConnectionParams& params,
                                                           ResultAggregator& aggregator) {
    auto listed = server_adapter.list_databases();
    if (listed.is_error()) {
        utils::log::error(std::format("Database discovery failed: {}", listed.error_message()));
        return Result<CollectionResult>::propagate(listed);
    }

    auto filter = DatabaseFilter::create(collection_, server_adapter.database_type());
    if (filter.is_error()) {
        return Result<CollectionResult>::propagate(filter);
    }

    // Filtering happens before any per-database connection is opened
    std::vector<DatabaseInfo> targets;
    size_t system_excluded = 0;
    for (auto db : listed.value()) {
        db.is_system_database = filter.value().is_system(db);
        switch (filter.value().decide(db)) {
            case FilterDecision::COLLECT:
                targets.push_back(std::move(db));
                break;
            case FilterDecision::EXCLUDE_PATTERN:
                utils::log::info(std::format("Excluding database '{}' (exclude_databases)", db.name));
                break;
            case FilterDecision::EXCLUDE_SYSTEM:
                ++system_excluded;
                utils::log::info(std::format("Excluding system database '{}'", db.name));
                break;
            case FilterDecision::SKIP_INACCESSIBLE:
                utils::log::info(std::format("Skipping database '{}' (no access)", db.name));
                aggregator.add_skipped(db, "Insufficient privileges to access database");
                break;
        }
    }

    ServerInfo server = describe_server(server_adapter, params, aggregator);

    const size_t worker_count = std::min<size_t>(
        std::max<uint32_t>(collection_.max_concurrent_connections, 1), targets.size());
    utils::log::info(std::format("Discovered {} database(s), collecting {} with {} worker(s)",
                                 listed.value().size(), targets.size(), worker_count));

    std::vector<Outcome> outcomes(targets.size());
    std::atomic<size_t> next{0};
    std::mutex abort_mutex;
    std::optional<DatabaseFailure> first_failure;

    auto worker = [&] {
        while (!cancel_.is_cancelled()) {
            const size_t i = next.fetch_add(1, std::memory_order_relaxed);
            if (i >= targets.size()) break;

            outcomes[i] = collect_database(server_adapter, targets[i]);

            const auto& failure = outcomes[i].failure;
            if (failure && failure->error_code != ErrorCode::CANCELLED && !collection_.continue_on_error) {
                std::lock_guard lock(abort_mutex);
                if (!first_failure) {
                    first_failure = *failure;
                    cancel_.cancel();
                }
            }
        }
    };

    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (size_t w = 0; w < worker_count; ++w) {
        workers.emplace_back(worker);
    }
    for (auto& t : workers) {
        t.join();
    }

    if (first_failure) {
        utils::log::error(std::format("Aborting collection: database '{}' failed: {}",
                                      first_failure->database_name, first_failure->error));
        return Result<CollectionResult>::error(
            first_failure->error_code,
            std::format("Database '{}': {}", first_failure->database_name, first_failure->error));
    }

    size_t unresolved = 0;
    for (size_t i = 0; i < targets.size(); ++i) {
        auto& outcome = outcomes[i];
        if (!outcome.resolved) {
            ++unresolved;
            aggregator.add_failure(targets[i], cancelled_failure(targets[i].name, 0));
        } else if (outcome.schema) {
            aggregator.add_database(std::move(*outcome.schema));
        } else if (outcome.failure) {
            aggregator.add_failure(targets[i], std::move(*outcome.failure));
        }
    }
    if (unresolved > 0) {
        aggregator.add_warning(std::format(
            "Collection cancelled before {} database(s) were started", unresolved));
    }

    server.total_databases = listed.value().size();
    server.collected_databases = aggregator.collected_count();
    server.system_databases_excluded = system_excluded;
    server.collection_mode = CollectionMode{CollectionMode::Kind::MULTI_DATABASE,
                                            listed.value().size(),
                                            aggregator.collected_count(),
                                            aggregator.failed_count()};
    utils::log::info(std::format("Collection finished: {} collected, {} failed",
                                 server.collected_databases, aggregator.failed_count()));
    aggregator.set_server_info(std::move(server));
    return Result<CollectionResult>::ok(aggregator.finish());
}

CollectionOrchestrator::Outcome CollectionOrchestrator::collect_database(
    IDatabaseAdapter& server, const DatabaseInfo& info) const {

    Outcome out;
    if (cancel_.is_cancelled()) {
        return out;
    }
    out.resolved = true;

    utils::Timer timer;
    uint32_t attempts = 0;
    auto connected = retry_.run<std::unique_ptr<IDatabaseAdapter>>(
        [&] { return server.connect_to_database(info.name); },
        std::format("Connecting to database '{}'", info.name), cancel_, attempts);
    if (connected.is_error()) {
        utils::log::warn(std::format("Database '{}' unreachable after {} attempt(s): {}",
                                     info.name, attempts, connected.error_message()));
        out.failure = DatabaseFailure{info.name, connected.error_code(),
                                      connected.error_message(), attempts};
        return out;
    }

    auto schema = collect_connected(*connected.value());
    if (schema.is_error()) {
        if (schema.error_code() == ErrorCode::CANCELLED) {
            out.failure = cancelled_failure(info.name, attempts);
        } else {
            utils::log::warn(std::format("Database '{}' failed: {}", info.name, schema.error_message()));
            out.failure = DatabaseFailure{info.name, schema.error_code(),
                                          schema.error_message(), attempts};
        }
        return out;
    }

    auto collected = schema.take_value();
    collected.database_info = merge_database_info(info, std::move(collected.database_info));
    utils::log::info(std::format("Collected database '{}' in {}ms ({} tables)",
                                 info.name, timer.elapsed_ms().count(), collected.tables.size()));
    out.schema = std::move(collected);
    return out;
}

Result<DatabaseSchema> CollectionOrchestrator::collect_connected(IDatabaseAdapter& adapter) const {
    if (cancel_.is_cancelled()) {
        return Result<DatabaseSchema>::error(ErrorCode::CANCELLED, std::string(kCancelledError));
    }

    auto schema = adapter.collect_schema();
    if (schema.is_error()) {
        return schema;
    }
    auto collected = schema.take_value();

    if (sampling_.enabled && adapter.supports_feature(AdapterFeature::DATA_SAMPLING)) {
        auto samples = adapter.sample_tables(collected.tables, sampling_, cancel_);
        if (samples.is_ok()) {
            collected.samples = samples.take_value();
            if (quality_.enabled()) {
                collected.quality_metrics = quality_.analyze_all(collected.samples);
                for (const auto& metrics : collected.quality_metrics) {
                    for (auto& warning : QualityAnalyzer::violation_warnings(metrics)) {
                        utils::log::warn(warning);
                        collected.warnings.push_back(std::move(warning));
                    }
                }
            }
        } else if (samples.error_code() == ErrorCode::CANCELLED) {
            return Result<DatabaseSchema>::error(ErrorCode::CANCELLED, std::string(kCancelledError));
        } else {
            collected.warnings.push_back(std::format("Sampling failed: {}", samples.error_message()));
        }
    }
    return Result<DatabaseSchema>::ok(std::move(collected));
}

ServerInfo CollectionOrchestrator::describe_server(IDatabaseAdapter& adapter,
                                                   const ConnectionParams& params,
                                                   ResultAggregator& aggregator) const {
    auto info = adapter.server_info();
    if (info.is_ok()) {
        return info.take_value();
    }

    const auto warning = std::format("Could not read server information: {}", info.error_message());
    utils::log::warn(warning);
    aggregator.add_warning(warning);

    ServerInfo fallback;
    fallback.server_type = adapter.database_type();
    fallback.host = params.host;
    fallback.port = params.port;
    fallback.connection_user = params.user;
    return fallback;
}

} // namespace dbsurvey
