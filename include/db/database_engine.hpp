#pragma once

#include "core/collection_types.hpp"
#include "db/connection_params.hpp"
#include "db/database_adapter.hpp"

#include <nlohmann/json.hpp>
#include <chrono>
#include <concepts>
#include <cstdint>
#include <optional>
#include <vector>

namespace dbsurvey {

/**
 * @brief Request for one sampling query
 */
struct SampleRequest {
    uint32_t limit = 100;
    std::chrono::milliseconds timeout{30000};
};

/**
 * @brief Rich per-engine interface wrapped by AdapterBridge
 *
 * An engine speaks its own dialect and returns unified schema entities.
 * It does not throttle, scan names, absorb partial failures or resolve
 * orderings; the bridge does all of that once for every engine.
 *
 * Catalog loaders return an error only for their own object class; the
 * bridge decides whether that is fatal (tables) or partial (the rest).
 */
template<typename E>
concept DatabaseEngine = requires(E engine, const E& cengine,
                                  const ConnectionParams& params,
                                  const Table& table,
                                  const OrderingStrategy& strategy,
                                  const SampleRequest& request,
                                  AdapterFeature feature) {
    { E::kType } -> std::convertible_to<DatabaseType>;
    { engine.open(params) } -> std::same_as<Result<void>>;
    { engine.ping() } -> std::same_as<Result<void>>;
    { engine.enumerate_databases() } -> std::same_as<Result<std::vector<DatabaseInfo>>>;
    { engine.describe_server() } -> std::same_as<Result<ServerInfo>>;
    { engine.describe_database() } -> std::same_as<Result<DatabaseInfo>>;
    { engine.load_tables() } -> std::same_as<Result<std::vector<Table>>>;
    { engine.load_views() } -> std::same_as<Result<std::vector<View>>>;
    { engine.load_indexes() } -> std::same_as<Result<std::vector<Index>>>;
    { engine.load_constraints() } -> std::same_as<Result<std::vector<Constraint>>>;
    { engine.load_routines() } -> std::same_as<Result<std::vector<Routine>>>;
    { engine.load_triggers() } -> std::same_as<Result<std::vector<Trigger>>>;
    { engine.load_custom_types() } -> std::same_as<Result<std::vector<CustomType>>>;
    { engine.fetch_sample(table, strategy, request) }
        -> std::same_as<Result<std::vector<nlohmann::json>>>;
    { engine.count_rows(table) } -> std::same_as<std::optional<uint64_t>>;
    { cengine.supports(feature) } -> std::same_as<bool>;
    { cengine.params() } -> std::convertible_to<const ConnectionParams&>;
};

} // namespace dbsurvey
