#pragma once

#include "core/collection_types.hpp"
#include "db/connection_params.hpp"
#include "db/database_engine.hpp"
#include "db/mongodb/mongo_handles.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dbsurvey {

/**
 * @brief MongoDB engine over libmongoc
 *
 * Collections are reported as tables whose columns are inferred from a
 * bounded document sample; every collection's key is _id. Commands carry
 * maxTimeMS so a slow server cannot hold a worker past its timeout.
 */
class MongoEngine {
public:
    static constexpr DatabaseType kType = DatabaseType::MONGODB;

    MongoEngine() = default;
    ~MongoEngine() = default;

    MongoEngine(const MongoEngine&) = delete;
    MongoEngine& operator=(const MongoEngine&) = delete;

    [[nodiscard]] Result<void> open(const ConnectionParams& params);
    [[nodiscard]] Result<void> ping();

    [[nodiscard]] Result<std::vector<DatabaseInfo>> enumerate_databases();
    [[nodiscard]] Result<ServerInfo> describe_server();
    [[nodiscard]] Result<DatabaseInfo> describe_database();

    [[nodiscard]] Result<std::vector<Table>> load_tables();
    [[nodiscard]] Result<std::vector<View>> load_views();
    [[nodiscard]] Result<std::vector<Index>> load_indexes();

    [[nodiscard]] Result<std::vector<Constraint>> load_constraints() {
        return Result<std::vector<Constraint>>::ok({});
    }
    [[nodiscard]] Result<std::vector<Routine>> load_routines() {
        return Result<std::vector<Routine>>::ok({});
    }
    [[nodiscard]] Result<std::vector<Trigger>> load_triggers() {
        return Result<std::vector<Trigger>>::ok({});
    }
    [[nodiscard]] Result<std::vector<CustomType>> load_custom_types() {
        return Result<std::vector<CustomType>>::ok({});
    }

    /**
     * @brief find() with a sort document, or a $sample stage when unordered
     */
    [[nodiscard]] Result<std::vector<nlohmann::json>> fetch_sample(
        const Table& table, const OrderingStrategy& strategy, const SampleRequest& request);

    /**
     * @brief Metadata-based estimatedDocumentCount; nullopt on failure
     *
     * A count already taken by load_tables() is returned without asking
     * the server again.
     */
    [[nodiscard]] std::optional<uint64_t> count_rows(const Table& table);

    [[nodiscard]] bool supports(AdapterFeature feature) const;

    [[nodiscard]] const ConnectionParams& params() const { return params_; }

    /**
     * @brief Sort document for an ordered strategy; nullptr for Unordered
     *
     * Ordered strategies sort descending (-1) so the newest documents come
     * first; SystemRowId becomes {$natural: -1}.
     */
    [[nodiscard]] static BsonPtr build_sort_document(const OrderingStrategy& strategy);

private:
    /**
     * @brief Run a command against db; the reply is returned on success
     */
    [[nodiscard]] Result<BsonPtr> run_command(const std::string& db, const bson_t* command);

    [[nodiscard]] Result<std::vector<BsonPtr>> drain(mongoc_cursor_t* cursor, std::string_view what);

    /**
     * @brief listCollections entries of one type ("collection" or "view"),
     *        skipping system.* namespaces
     */
    [[nodiscard]] Result<std::vector<BsonPtr>> list_collections(std::string_view type);

    [[nodiscard]] Result<void> require_database() const;

    [[nodiscard]] MongocCollectionPtr collection(const std::string& name) const;

    [[nodiscard]] int64_t max_time_ms() const;

    ConnectionParams params_;
    MongocClientPtr client_;
};

/**
 * @brief Map a libbson/libmongoc error to the collector's taxonomy
 */
[[nodiscard]] ErrorCode classify_mongo_error(const bson_error_t& error);

} // namespace dbsurvey
