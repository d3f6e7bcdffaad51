#include <catch2/catch_test_macros.hpp>
#include "aggregator/result_serializer.hpp"
#include "orchestrator/collection_orchestrator.hpp"
#include "mocks/mock_adapter.hpp"

#include <algorithm>
#include <chrono>

using namespace dbsurvey;
using namespace dbsurvey::testing;
using namespace std::chrono_literals;

namespace {

RetryPolicy instant_retry(RetryConfig cfg = {}) {
    return RetryPolicy(cfg,
        [](std::chrono::milliseconds) {},
        [](std::chrono::milliseconds lo, std::chrono::milliseconds) { return lo; });
}

ConnectionParams server_params() {
    auto p = ConnectionParams::parse("postgresql://surveyor@db.internal:5432/postgres");
    REQUIRE(p.is_ok());
    return p.take_value();
}

CollectionConfig multi_config(uint32_t max_concurrent = 4) {
    CollectionConfig cfg;
    cfg.all_databases = true;
    cfg.max_concurrent_connections = max_concurrent;
    return cfg;
}

std::vector<std::string> names_of(const CollectionResult& result) {
    std::vector<std::string> names;
    for (const auto& db : result.databases) names.push_back(db.database_info.name);
    return names;
}

const DatabaseSchema* find_db(const CollectionResult& result, const std::string& name) {
    for (const auto& db : result.databases) {
        if (db.database_info.name == name) return &db;
    }
    return nullptr;
}

Result<CollectionResult> run_against(const std::shared_ptr<MockServer>& server,
                                     CollectionConfig cfg,
                                     SamplingConfig sampling = {},
                                     RetryConfig retry = {},
                                     QualityConfig quality = {}) {
    CollectionOrchestrator orchestrator(std::move(cfg), std::move(sampling), instant_retry(retry),
                                        std::move(quality));
    MockAdapter adapter(server);
    return orchestrator.run(adapter, server_params());
}

} // namespace

// ============================================================================
// Discovery and filtering
// ============================================================================

TEST_CASE("Orchestrator: collects every user database", "[orchestrator]") {
    auto server = std::make_shared<MockServer>();
    server->add_database("orders");
    server->add_database("billing");
    server->add_database("analytics");

    auto result = run_against(server, multi_config());
    REQUIRE(result.is_ok());

    const auto& r = result.value();
    CHECK(names_of(r) == std::vector<std::string>{"analytics", "billing", "orders"});
    CHECK(r.failures.empty());
    CHECK(r.server_info.total_databases == 3);
    CHECK(r.server_info.collected_databases == 3);
    CHECK(r.server_info.collection_mode.kind == CollectionMode::Kind::MULTI_DATABASE);
    CHECK(r.server_info.collection_mode.discovered == 3);
    CHECK(r.server_info.collection_mode.collected == 3);
    CHECK(r.server_info.collection_mode.failed == 0);

    for (const auto& db : r.databases) {
        CHECK(db.database_info.collection_status.is_success());
        CHECK(db.tables.size() == 2);
        CHECK(db.samples.size() == 2);
        // Discovery attributes survive the merge with introspection
        CHECK(db.database_info.size_bytes == std::optional<uint64_t>(8192));
        CHECK(db.database_info.encoding == std::optional<std::string>("UTF8"));
    }
}

TEST_CASE("Orchestrator: template databases are excluded by default", "[orchestrator][filter]") {
    auto server = std::make_shared<MockServer>();
    server->add_database("postgres");
    server->add_database("template0", {}, true);
    server->add_database("template1", {}, true);
    server->add_database("app");

    auto result = run_against(server, multi_config());
    REQUIRE(result.is_ok());

    CHECK(names_of(result.value()) == std::vector<std::string>{"app", "postgres"});
    CHECK(result.value().server_info.system_databases_excluded == 2);
    CHECK_FALSE(server->was_contacted("template0"));
    CHECK_FALSE(server->was_contacted("template1"));
}

TEST_CASE("Orchestrator: include_system_databases collects templates too", "[orchestrator][filter]") {
    auto server = std::make_shared<MockServer>();
    server->add_database("template1", {}, true);
    server->add_database("app");

    auto cfg = multi_config();
    cfg.include_system_databases = true;
    auto result = run_against(server, cfg);
    REQUIRE(result.is_ok());

    REQUIRE(result.value().databases.size() == 2);
    const auto* tpl = find_db(result.value(), "template1");
    REQUIRE(tpl != nullptr);
    CHECK(tpl->database_info.is_system_database);
    CHECK(result.value().server_info.system_databases_excluded == 0);
}

TEST_CASE("Orchestrator: excluded databases are never contacted", "[orchestrator][filter]") {
    auto server = std::make_shared<MockServer>();
    server->add_database("app");
    server->add_database("scratch_1");
    server->add_database("scratch_2");
    server->add_database("tmp_42");

    auto cfg = multi_config();
    cfg.exclude_databases = {"scratch_*", "regex:^tmp_[0-9]+$"};
    auto result = run_against(server, cfg);
    REQUIRE(result.is_ok());

    CHECK(names_of(result.value()) == std::vector<std::string>{"app"});
    CHECK_FALSE(server->was_contacted("scratch_1"));
    CHECK_FALSE(server->was_contacted("tmp_42"));
}

TEST_CASE("Orchestrator: inaccessible databases are reported as Skipped", "[orchestrator][filter]") {
    auto server = std::make_shared<MockServer>();
    server->add_database("app");
    server->add_database("hr", {}, false, AccessLevel::NONE);

    auto result = run_against(server, multi_config());
    REQUIRE(result.is_ok());

    const auto* hr = find_db(result.value(), "hr");
    REQUIRE(hr != nullptr);
    CHECK(hr->database_info.collection_status.is_skipped());
    CHECK(hr->tables.empty());
    CHECK_FALSE(server->was_contacted("hr"));
    CHECK(result.value().failures.empty());
}

TEST_CASE("Orchestrator: invalid exclusion regex is fatal", "[orchestrator][filter]") {
    auto server = std::make_shared<MockServer>();
    server->add_database("app");

    auto cfg = multi_config();
    cfg.exclude_databases = {"regex:([unclosed"};
    auto result = run_against(server, cfg);
    REQUIRE(result.is_error());
    CHECK(result.error_code() == ErrorCode::CONFIGURATION_ERROR);
}

// ============================================================================
// Concurrency bound
// ============================================================================

TEST_CASE("Orchestrator: never exceeds max_concurrent_connections", "[orchestrator][concurrency]") {
    auto server = std::make_shared<MockServer>();
    for (int i = 0; i < 5; ++i) {
        server->add_database("db_" + std::to_string(i), {.latency = 50ms});
    }

    auto result = run_against(server, multi_config(2));
    REQUIRE(result.is_ok());

    CHECK(result.value().databases.size() == 5);
    CHECK(server->peak.load() <= 2);
    CHECK(server->peak.load() >= 1);
}

TEST_CASE("Orchestrator: output order does not depend on completion order", "[orchestrator][concurrency]") {
    auto server = std::make_shared<MockServer>();
    server->add_database("alpha", {.latency = 80ms});
    server->add_database("bravo", {.latency = 5ms});
    server->add_database("charlie", {.latency = 40ms});

    auto result = run_against(server, multi_config(3));
    REQUIRE(result.is_ok());

    // Completed roughly in reverse latency order, emitted by name
    CHECK(names_of(result.value()) == std::vector<std::string>{"alpha", "bravo", "charlie"});
}

// ============================================================================
// Failure isolation and retry
// ============================================================================

TEST_CASE("Orchestrator: one failing database does not affect the others", "[orchestrator][isolation]") {
    auto server = std::make_shared<MockServer>();
    server->add_database("a_first");
    server->add_database("b_second", {.connect_failures = 100});
    server->add_database("c_third");

    auto result = run_against(server, multi_config());
    REQUIRE(result.is_ok());

    const auto& r = result.value();
    REQUIRE(r.databases.size() == 3);
    CHECK(r.databases[0].database_info.collection_status.is_success());
    CHECK(r.databases[1].database_info.collection_status.is_failed());
    CHECK(r.databases[2].database_info.collection_status.is_success());

    REQUIRE(r.failures.size() == 1);
    CHECK(r.failures[0].database_name == "b_second");
    CHECK(r.failures[0].error_code == ErrorCode::CONNECTION_FAILED);
    CHECK(r.failures[0].attempts == 3);
    CHECK(r.server_info.collection_mode.failed == 1);
    CHECK(r.server_info.collected_databases == 2);

    SECTION("successful entries match a run without the failing database") {
        auto clean_server = std::make_shared<MockServer>();
        clean_server->add_database("a_first");
        clean_server->add_database("c_third");
        auto clean = run_against(clean_server, multi_config());
        REQUIRE(clean.is_ok());
        REQUIRE(clean.value().databases.size() == 2);

        CHECK(to_json(clean.value()).at("databases").at(0).dump() ==
              to_json(r).at("databases").at(0).dump());
        CHECK(to_json(clean.value()).at("databases").at(1).dump() ==
              to_json(r).at("databases").at(2).dump());
    }
}

TEST_CASE("Orchestrator: transient connection failures are retried", "[orchestrator][retry]") {
    auto server = std::make_shared<MockServer>();
    server->add_database("flaky", {.connect_failures = 2});

    auto result = run_against(server, multi_config());
    REQUIRE(result.is_ok());
    CHECK(result.value().databases[0].database_info.collection_status.is_success());
    CHECK(server->attempts_for("flaky") == 3);
}

TEST_CASE("Orchestrator: privilege errors are not retried", "[orchestrator][retry]") {
    auto server = std::make_shared<MockServer>();
    server->add_database("locked", {.connect_failures = 5,
                                    .connect_error = ErrorCode::INSUFFICIENT_PRIVILEGE});

    auto result = run_against(server, multi_config());
    REQUIRE(result.is_ok());
    CHECK(server->attempts_for("locked") == 1);
    REQUIRE(result.value().failures.size() == 1);
    CHECK(result.value().failures[0].error_code == ErrorCode::INSUFFICIENT_PRIVILEGE);
}

TEST_CASE("Orchestrator: schema failure is recorded as Failed", "[orchestrator][isolation]") {
    auto server = std::make_shared<MockServer>();
    server->add_database("broken", {.fail_schema = true});
    server->add_database("fine");

    auto result = run_against(server, multi_config());
    REQUIRE(result.is_ok());

    const auto* broken = find_db(result.value(), "broken");
    REQUIRE(broken != nullptr);
    CHECK(broken->database_info.collection_status.is_failed());
    CHECK(broken->database_info.collection_status.message().find("permission denied") != std::string::npos);
    // Discovery info is kept on the placeholder
    CHECK(broken->database_info.size_bytes == std::optional<uint64_t>(8192));
}

TEST_CASE("Orchestrator: continue_on_error=false aborts on the first failure", "[orchestrator][isolation]") {
    auto server = std::make_shared<MockServer>();
    server->add_database("a_bad", {.fail_schema = true});
    server->add_database("b_good");
    server->add_database("c_good");

    auto cfg = multi_config(1);
    cfg.continue_on_error = false;
    auto result = run_against(server, cfg);

    REQUIRE(result.is_error());
    CHECK(result.error_code() == ErrorCode::QUERY_FAILED);
    CHECK(result.error_message().find("a_bad") != std::string::npos);
    // With a single worker nothing after the failing database is started
    CHECK_FALSE(server->was_contacted("c_good"));
}

TEST_CASE("Orchestrator: server connection failure is fatal", "[orchestrator]") {
    auto server = std::make_shared<MockServer>();
    server->refuse_server_connect = true;
    server->add_database("app");

    auto result = run_against(server, multi_config());
    REQUIRE(result.is_error());
    CHECK(result.error_code() == ErrorCode::CONNECTION_FAILED);
}

// ============================================================================
// Cancellation
// ============================================================================

TEST_CASE("Orchestrator: deadline cancels unresolved databases", "[orchestrator][cancel]") {
    auto server = std::make_shared<MockServer>();
    for (int i = 0; i < 4; ++i) {
        server->add_database("db_" + std::to_string(i), {.latency = 200ms});
    }

    auto cfg = multi_config(1);
    cfg.deadline = 250ms;
    auto result = run_against(server, cfg);
    REQUIRE(result.is_ok());

    const auto& r = result.value();
    REQUIRE(r.databases.size() == 4);

    size_t cancelled = 0;
    for (const auto& db : r.databases) {
        const auto& status = db.database_info.collection_status;
        if (status.is_failed()) {
            CHECK(status.message() == "cancelled");
            ++cancelled;
        } else {
            CHECK(status.is_success());
        }
    }
    CHECK(cancelled >= 2);
    CHECK(r.failures.size() == cancelled);
}

TEST_CASE("Orchestrator: cancel before run resolves nothing", "[orchestrator][cancel]") {
    auto server = std::make_shared<MockServer>();
    server->add_database("app");
    server->add_database("billing");

    CollectionOrchestrator orchestrator(multi_config(), SamplingConfig{}, instant_retry());
    orchestrator.cancel();
    MockAdapter adapter(server);
    auto result = orchestrator.run(adapter, server_params());
    REQUIRE(result.is_ok());

    for (const auto& db : result.value().databases) {
        CHECK(db.database_info.collection_status == CollectionStatus::failed("cancelled"));
    }
    CHECK_FALSE(server->was_contacted("app"));
}

// ============================================================================
// Single-database mode
// ============================================================================

TEST_CASE("Orchestrator: single mode collects the connected database", "[orchestrator][single]") {
    auto server = std::make_shared<MockServer>();
    server->add_database("postgres");
    server->add_database("other");

    CollectionConfig cfg;   // all_databases = false
    auto result = run_against(server, cfg);
    REQUIRE(result.is_ok());

    const auto& r = result.value();
    CHECK(names_of(r) == std::vector<std::string>{"postgres"});
    CHECK(r.server_info.collection_mode.kind == CollectionMode::Kind::SINGLE_DATABASE);
    CHECK_FALSE(server->was_contacted("other"));
}

TEST_CASE("Orchestrator: all_databases falls back on single-database engines", "[orchestrator][single]") {
    auto server = std::make_shared<MockServer>();
    server->type = DatabaseType::SQLITE;
    server->multi_database = false;
    server->add_database("postgres");

    auto result = run_against(server, multi_config());
    REQUIRE(result.is_ok());
    CHECK(result.value().server_info.collection_mode.kind == CollectionMode::Kind::SINGLE_DATABASE);
    CHECK(result.value().metadata.warnings.size() == 1);
}

TEST_CASE("Orchestrator: unreadable server info is a warning", "[orchestrator]") {
    auto server = std::make_shared<MockServer>();
    server->fail_server_info = true;
    server->add_database("app");

    auto result = run_against(server, multi_config());
    REQUIRE(result.is_ok());
    CHECK(result.value().server_info.host == "db.internal");
    CHECK(result.value().server_info.connection_user == "surveyor");
    CHECK_FALSE(result.value().metadata.warnings.empty());
}

TEST_CASE("Orchestrator: sampling can be disabled", "[orchestrator]") {
    auto server = std::make_shared<MockServer>();
    server->add_database("app");

    SamplingConfig sampling;
    sampling.enabled = false;
    auto result = run_against(server, multi_config(), sampling);
    REQUIRE(result.is_ok());
    CHECK(result.value().databases[0].samples.empty());
}

TEST_CASE("Orchestrator: samples are scored for quality", "[orchestrator][quality]") {
    auto server = std::make_shared<MockServer>();
    server->add_database("clean");
    MockServer::DatabaseBehavior sparse;
    sparse.null_sample_ids = true;
    server->add_database("sparse", sparse);

    auto result = run_against(server, multi_config());
    REQUIRE(result.is_ok());

    const auto* clean = find_db(result.value(), "clean");
    REQUIRE(clean != nullptr);
    REQUIRE(clean->quality_metrics.size() == 2);
    CHECK(clean->quality_metrics[0].quality_score == 1.0);
    CHECK(clean->warnings.empty());

    const auto* sparse_db = find_db(result.value(), "sparse");
    REQUIRE(sparse_db != nullptr);
    REQUIRE(sparse_db->quality_metrics.size() == 2);
    const auto& metrics = sparse_db->quality_metrics[0];
    CHECK(metrics.completeness.score == 0.5);
    REQUIRE(metrics.threshold_violations.size() == 1);
    CHECK(metrics.threshold_violations[0].severity == "critical");
    REQUIRE(sparse_db->warnings.size() == 2);
    CHECK(sparse_db->warnings[0].starts_with("Quality violation in '" + metrics.table_name + "': completeness = 50.00%"));
}

TEST_CASE("Orchestrator: quality analysis can be disabled", "[orchestrator][quality]") {
    auto server = std::make_shared<MockServer>();
    MockServer::DatabaseBehavior sparse;
    sparse.null_sample_ids = true;
    server->add_database("sparse", sparse);

    QualityConfig quality;
    quality.enabled = false;
    auto result = run_against(server, multi_config(), {}, {}, quality);
    REQUIRE(result.is_ok());
    CHECK(result.value().databases[0].quality_metrics.empty());
    CHECK(result.value().databases[0].warnings.empty());
}
