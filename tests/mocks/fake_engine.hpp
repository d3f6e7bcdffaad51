#pragma once

#include "db/database_engine.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dbsurvey::testing {

/**
 * @brief What a FakeEngine returns, shared by every engine one factory builds
 */
struct FakeEngineScript {
    std::vector<Table> tables;
    std::vector<View> views;
    std::vector<Routine> routines;
    bool fail_open = false;
    bool fail_tables = false;
    bool fail_views = false;
    bool fail_routines = false;
    std::map<std::string, ErrorCode> fail_sample;   // by table name
    std::vector<nlohmann::json> rows = {nlohmann::json{{"id", 1}}};
    std::optional<uint64_t> row_count = 42;

    std::vector<std::string> opened_databases;
    std::vector<std::pair<std::string, OrderingStrategy>> sampled;
    std::vector<std::chrono::steady_clock::time_point> sampled_at;
};

class FakeEngine {
public:
    static constexpr DatabaseType kType = DatabaseType::POSTGRESQL;

    explicit FakeEngine(std::shared_ptr<FakeEngineScript> script) : script_(std::move(script)) {}

    Result<void> open(const ConnectionParams& params) {
        if (script_->fail_open) {
            return Result<void>::error(ErrorCode::CONNECTION_FAILED, "could not connect to server");
        }
        params_ = params;
        script_->opened_databases.push_back(params.database);
        return Result<void>::ok();
    }

    Result<void> ping() { return Result<void>::ok(); }

    Result<std::vector<DatabaseInfo>> enumerate_databases() {
        return Result<std::vector<DatabaseInfo>>::ok({DatabaseInfo{.name = params_.database}});
    }

    Result<ServerInfo> describe_server() {
        ServerInfo info;
        info.server_type = kType;
        info.version = "fake 1.0";
        return Result<ServerInfo>::ok(info);
    }

    Result<DatabaseInfo> describe_database() {
        DatabaseInfo info;
        info.name = params_.database;
        return Result<DatabaseInfo>::ok(info);
    }

    Result<std::vector<Table>> load_tables() {
        if (script_->fail_tables) {
            return Result<std::vector<Table>>::error(ErrorCode::INSUFFICIENT_PRIVILEGE,
                                                     "permission denied for relation");
        }
        return Result<std::vector<Table>>::ok(script_->tables);
    }

    Result<std::vector<View>> load_views() {
        if (script_->fail_views) {
            return Result<std::vector<View>>::error(ErrorCode::QUERY_FAILED, "views unreadable");
        }
        return Result<std::vector<View>>::ok(script_->views);
    }

    Result<std::vector<Index>> load_indexes() { return Result<std::vector<Index>>::ok({}); }
    Result<std::vector<Constraint>> load_constraints() { return Result<std::vector<Constraint>>::ok({}); }

    Result<std::vector<Routine>> load_routines() {
        if (script_->fail_routines) {
            return Result<std::vector<Routine>>::error(ErrorCode::INSUFFICIENT_PRIVILEGE,
                                                       "permission denied for pg_proc");
        }
        return Result<std::vector<Routine>>::ok(script_->routines);
    }

    Result<std::vector<Trigger>> load_triggers() { return Result<std::vector<Trigger>>::ok({}); }
    Result<std::vector<CustomType>> load_custom_types() { return Result<std::vector<CustomType>>::ok({}); }

    Result<std::vector<nlohmann::json>> fetch_sample(const Table& table,
                                                     const OrderingStrategy& strategy,
                                                     const SampleRequest& /*request*/) {
        script_->sampled.emplace_back(table.name, strategy);
        script_->sampled_at.push_back(std::chrono::steady_clock::now());
        auto it = script_->fail_sample.find(table.name);
        if (it != script_->fail_sample.end()) {
            return Result<std::vector<nlohmann::json>>::error(it->second, "canceling statement due to statement timeout");
        }
        return Result<std::vector<nlohmann::json>>::ok(script_->rows);
    }

    std::optional<uint64_t> count_rows(const Table& /*table*/) { return script_->row_count; }

    bool supports(AdapterFeature /*feature*/) const { return true; }

    const ConnectionParams& params() const { return params_; }

private:
    std::shared_ptr<FakeEngineScript> script_;
    ConnectionParams params_;
};

static_assert(DatabaseEngine<FakeEngine>);

} // namespace dbsurvey::testing
