#pragma once

#include "core/utils.hpp"
#include "db/database_adapter.hpp"
#include "db/database_engine.hpp"
#include "sampling/ordering_resolver.hpp"
#include "sampling/sensitive_field_detector.hpp"
#include "sampling/throttle.hpp"

#include <format>
#include <functional>
#include <memory>
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace dbsurvey {

/**
 * @brief Generic IDatabaseAdapter over a concrete DatabaseEngine
 *
 * The engine exposes its own rich, strongly typed operations; the bridge
 * turns them into the narrow dispatch interface the orchestrator holds in
 * heterogeneous collections. Everything engine-independent lives here:
 * database name validation, partial-failure absorption during schema
 * collection, ordering resolution, throttling, sensitive-name scanning
 * and per-table sampling isolation.
 */
template<DatabaseEngine Engine>
class AdapterBridge final : public IDatabaseAdapter {
public:
    using EngineFactory = std::function<std::unique_ptr<Engine>()>;

    explicit AdapterBridge(EngineFactory factory = [] { return std::make_unique<Engine>(); })
        : factory_(std::move(factory)), engine_(factory_()) {}

    [[nodiscard]] Result<void> connect(const ConnectionParams& params) override {
        if (params.type != Engine::kType) {
            return Result<void>::error(ErrorCode::ADAPTER_NOT_FOUND,
                std::format("{} adapter cannot open a {} connection",
                            database_type_to_string(Engine::kType),
                            database_type_to_string(params.type)));
        }
        auto opened = engine_->open(params);
        if (opened.is_error()) {
            return opened;
        }
        connected_ = true;
        utils::log::info(std::format("Connected to {}", params.display()));
        return Result<void>::ok();
    }

    [[nodiscard]] Result<void> test_connection() override {
        if (auto guard = require_connected(); guard.is_error()) return guard;
        return engine_->ping();
    }

    [[nodiscard]] Result<std::vector<DatabaseInfo>> list_databases() override {
        if (auto guard = require_connected(); guard.is_error()) {
            return Result<std::vector<DatabaseInfo>>::propagate(guard);
        }
        return engine_->enumerate_databases();
    }

    [[nodiscard]] Result<std::unique_ptr<IDatabaseAdapter>> connect_to_database(
        const std::string& name) override {

        using Ret = Result<std::unique_ptr<IDatabaseAdapter>>;
        if (auto guard = require_connected(); guard.is_error()) {
            return Ret::propagate(guard);
        }

        auto target = engine_->params().with_database(name);
        if (target.is_error()) {
            return Ret::propagate(target);
        }

        auto sibling = std::make_unique<AdapterBridge<Engine>>(factory_);
        auto connected = sibling->connect(target.value());
        if (connected.is_error()) {
            return Ret::propagate(connected);
        }
        return Ret::ok(std::move(sibling));
    }

    [[nodiscard]] Result<DatabaseSchema> collect_schema() override {
        if (auto guard = require_connected(); guard.is_error()) {
            return Result<DatabaseSchema>::propagate(guard);
        }

        DatabaseSchema schema;

        auto info = engine_->describe_database();
        if (info.is_ok()) {
            schema.database_info = info.take_value();
        } else {
            schema.database_info.name = engine_->params().database;
            schema.warnings.push_back(
                std::format("Could not read database metadata: {}", info.error_message()));
        }

        // Tables are the one object class whose absence makes the result meaningless
        auto tables = engine_->load_tables();
        if (tables.is_error()) {
            return Result<DatabaseSchema>::propagate(tables);
        }
        schema.tables = tables.take_value();

        std::vector<std::string> partial;
        absorb("views", engine_->load_views(), schema.views, partial, schema.warnings);
        absorb("indexes", engine_->load_indexes(), schema.indexes, partial, schema.warnings);
        absorb("constraints", engine_->load_constraints(), schema.constraints, partial, schema.warnings);
        absorb("triggers", engine_->load_triggers(), schema.triggers, partial, schema.warnings);
        absorb("custom types", engine_->load_custom_types(), schema.custom_types, partial, schema.warnings);

        std::vector<Routine> routines;
        absorb("routines", engine_->load_routines(), routines, partial, schema.warnings);
        for (auto& routine : routines) {
            auto& bucket = routine.kind == RoutineKind::PROCEDURE ? schema.procedures : schema.functions;
            bucket.push_back(std::move(routine));
        }

        if (partial.empty()) {
            schema.database_info.collection_status = CollectionStatus::success();
        } else {
            utils::log::warn(std::format("Partial schema collection for {}: {} object class(es) unreadable",
                                         engine_->params().display(), partial.size()));
            schema.database_info.collection_status = CollectionStatus::partial(std::move(partial));
        }
        return Result<DatabaseSchema>::ok(std::move(schema));
    }

    [[nodiscard]] Result<std::vector<TableSample>> sample_data(const SamplingConfig& config) override {
        if (!config.enabled) {
            return Result<std::vector<TableSample>>::ok({});
        }
        if (auto guard = require_connected(); guard.is_error()) {
            return Result<std::vector<TableSample>>::propagate(guard);
        }
        auto tables = engine_->load_tables();
        if (tables.is_error()) {
            return Result<std::vector<TableSample>>::propagate(tables);
        }
        return sample_tables(tables.value(), config, CancellationToken{});
    }

    [[nodiscard]] Result<std::vector<TableSample>> sample_tables(
        const std::vector<Table>& tables,
        const SamplingConfig& config,
        const CancellationToken& cancel) override {

        using Ret = Result<std::vector<TableSample>>;
        if (auto guard = require_connected(); guard.is_error()) {
            return Ret::propagate(guard);
        }
        if (!config.enabled) {
            return Ret::ok({});
        }

        std::unique_ptr<SensitiveFieldDetector> detector;
        try {
            detector = std::make_unique<SensitiveFieldDetector>(config.sensitive_patterns);
        } catch (const std::regex_error& e) {
            return Ret::error(ErrorCode::CONFIGURATION_ERROR,
                              std::format("Invalid sensitive field pattern: {}", e.what()));
        }

        Throttle throttle(config.throttle_delay);
        const SampleRequest request{config.sample_size, config.query_timeout};

        std::vector<TableSample> samples;
        samples.reserve(tables.size());
        for (const auto& table : tables) {
            if (cancel.is_cancelled()) {
                return Ret::error(ErrorCode::CANCELLED, "cancelled");
            }
            samples.push_back(sample_one(table, config, request, *detector, throttle));
        }
        return Ret::ok(std::move(samples));
    }

    [[nodiscard]] Result<ServerInfo> server_info() override {
        if (auto guard = require_connected(); guard.is_error()) {
            return Result<ServerInfo>::propagate(guard);
        }
        return engine_->describe_server();
    }

    [[nodiscard]] DatabaseType database_type() const override { return Engine::kType; }

    [[nodiscard]] bool supports_feature(AdapterFeature feature) const override {
        return engine_->supports(feature);
    }

    [[nodiscard]] std::string display_name() const override {
        return connected_ ? engine_->params().display()
                          : std::string(database_type_to_string(Engine::kType));
    }

    /// Direct access to the wrapped engine (tests, engine-specific callers)
    [[nodiscard]] Engine& engine() { return *engine_; }

private:
    Result<void> require_connected() const {
        if (!connected_) {
            return Result<void>::error(ErrorCode::CONNECTION_FAILED, "Adapter is not connected");
        }
        return Result<void>::ok();
    }

    /**
     * @brief Keep a best-effort object class, or record why it is missing
     */
    template<typename T>
    static void absorb(std::string_view what, Result<std::vector<T>> loaded,
                       std::vector<T>& into,
                       std::vector<std::string>& partial,
                       std::vector<std::string>& warnings) {
        if (loaded.is_ok()) {
            into = loaded.take_value();
            return;
        }
        partial.push_back(std::format("{}: {}", what, loaded.error_message()));
        warnings.push_back(std::format("Could not collect {}: {}", what, loaded.error_message()));
    }

    TableSample sample_one(const Table& table,
                           const SamplingConfig& config,
                           const SampleRequest& request,
                           const SensitiveFieldDetector& detector,
                           Throttle& throttle) {
        TableSample sample;
        sample.table_name = table.name;
        sample.schema_name = table.schema;
        sample.sample_size = config.sample_size;
        // Resolved once; the same strategy drives the query and the report
        sample.strategy_used = resolve_ordering(table, config.timestamp_columns);

        if (is_unordered(sample.strategy_used)) {
            sample.warnings.emplace_back(kUnorderedSamplingWarning);
        }
        for (auto& warning : detector.scan(table.columns)) {
            sample.warnings.push_back(std::move(warning));
        }

        throttle.wait();
        auto rows = engine_->fetch_sample(table, sample.strategy_used, request);
        sample.collected_at = utils::now();
        if (rows.is_ok()) {
            sample.rows = rows.take_value();
        } else {
            utils::log::warn(std::format("Sampling {} failed: {}",
                                         table.qualified_name(), rows.error_message()));
            sample.warnings.push_back(std::format("Sampling failed ({}): {}",
                error_code_to_string(rows.error_code()), rows.error_message()));
        }

        throttle.wait();
        sample.total_rows = engine_->count_rows(table);
        return sample;
    }

    EngineFactory factory_;
    std::unique_ptr<Engine> engine_;
    bool connected_ = false;
};

} // namespace dbsurvey
