#include <catch2/catch_test_macros.hpp>
#include "db/adapter_bridge.hpp"
#include "mocks/fake_engine.hpp"

#include <algorithm>
#include <chrono>

using namespace dbsurvey;
using namespace dbsurvey::testing;

namespace {

Column make_column(std::string name, UnifiedDataType type, uint32_t ordinal,
                   bool pk = false) {
    Column c;
    c.name = std::move(name);
    c.data_type = std::move(type);
    c.ordinal_position = ordinal;
    c.is_primary_key = pk;
    c.is_nullable = !pk;
    return c;
}

Table users_table() {
    Table t;
    t.name = "users";
    t.schema = "public";
    t.columns.push_back(make_column("id", UnifiedDataType::integer(64), 1, true));
    t.columns.push_back(make_column("email", UnifiedDataType::string(255), 2));
    t.primary_key = PrimaryKey{"users_pkey", {"id"}};
    return t;
}

Table events_table() {
    Table t;
    t.name = "events";
    t.schema = "public";
    t.columns.push_back(make_column("payload", UnifiedDataType{types::Json{}}, 1));
    return t;
}

struct BridgeFixture {
    std::shared_ptr<FakeEngineScript> script = std::make_shared<FakeEngineScript>();
    AdapterBridge<FakeEngine> bridge{[s = script] { return std::make_unique<FakeEngine>(s); }};

    BridgeFixture() {
        script->tables = {users_table(), events_table()};
    }

    ConnectionParams params(const char* url = "postgresql://surveyor@db.internal:5432/app") {
        auto p = ConnectionParams::parse(url);
        REQUIRE(p.is_ok());
        return p.take_value();
    }

    void connect() {
        REQUIRE(bridge.connect(params()).is_ok());
    }
};

} // namespace

// ============================================================================
// Connection handling
// ============================================================================

TEST_CASE("AdapterBridge: operations require a connection", "[bridge]") {
    BridgeFixture f;
    auto schema = f.bridge.collect_schema();
    REQUIRE(schema.is_error());
    CHECK(schema.error_code() == ErrorCode::CONNECTION_FAILED);
}

TEST_CASE("AdapterBridge: rejects params for another engine", "[bridge]") {
    BridgeFixture f;
    auto result = f.bridge.connect(f.params("mysql://surveyor@db.internal:3306/app"));
    REQUIRE(result.is_error());
    CHECK(result.error_code() == ErrorCode::ADAPTER_NOT_FOUND);
}

TEST_CASE("AdapterBridge: open failure propagates", "[bridge]") {
    BridgeFixture f;
    f.script->fail_open = true;
    auto result = f.bridge.connect(f.params());
    REQUIRE(result.is_error());
    CHECK(result.error_code() == ErrorCode::CONNECTION_FAILED);
}

TEST_CASE("AdapterBridge: connect_to_database opens a sibling engine", "[bridge]") {
    BridgeFixture f;
    f.connect();

    auto sibling = f.bridge.connect_to_database("analytics");
    REQUIRE(sibling.is_ok());
    REQUIRE(f.script->opened_databases.size() == 2);
    CHECK(f.script->opened_databases[1] == "analytics");
    CHECK(sibling.value()->display_name().find("analytics") != std::string::npos);
}

TEST_CASE("AdapterBridge: unsafe database names are refused before connecting", "[bridge]") {
    BridgeFixture f;
    f.connect();

    for (const char* name : {"app; DROP DATABASE app", "o'brien", "", "quoted\"name"}) {
        auto sibling = f.bridge.connect_to_database(name);
        REQUIRE(sibling.is_error());
        CHECK(sibling.error_code() == ErrorCode::INVALID_CONNECTION_TARGET);
    }
    CHECK(f.script->opened_databases.size() == 1);
}

// ============================================================================
// Schema collection
// ============================================================================

TEST_CASE("AdapterBridge: full schema collection succeeds", "[bridge][schema]") {
    BridgeFixture f;
    f.connect();

    auto schema = f.bridge.collect_schema();
    REQUIRE(schema.is_ok());
    CHECK(schema.value().tables.size() == 2);
    CHECK(schema.value().database_info.name == "app");
    CHECK(schema.value().database_info.collection_status.is_success());
    CHECK(schema.value().warnings.empty());
}

TEST_CASE("AdapterBridge: unreadable tables are fatal", "[bridge][schema]") {
    BridgeFixture f;
    f.connect();
    f.script->fail_tables = true;

    auto schema = f.bridge.collect_schema();
    REQUIRE(schema.is_error());
    CHECK(schema.error_code() == ErrorCode::INSUFFICIENT_PRIVILEGE);
}

TEST_CASE("AdapterBridge: unreadable object classes yield Partial", "[bridge][schema]") {
    BridgeFixture f;
    f.connect();
    f.script->fail_views = true;
    f.script->fail_routines = true;

    auto schema = f.bridge.collect_schema();
    REQUIRE(schema.is_ok());

    const auto& status = schema.value().database_info.collection_status;
    REQUIRE(status.is_partial());
    REQUIRE(status.errors().size() == 2);
    CHECK(status.errors()[0].starts_with("views"));
    CHECK(status.errors()[1].starts_with("routines"));

    // Everything that could be read is still there
    CHECK(schema.value().tables.size() == 2);
    CHECK(schema.value().warnings.size() == 2);
}

TEST_CASE("AdapterBridge: routines are split by kind", "[bridge][schema]") {
    BridgeFixture f;
    f.connect();

    Routine fn;
    fn.name = "total_orders";
    fn.kind = RoutineKind::FUNCTION;
    Routine proc;
    proc.name = "archive_orders";
    proc.kind = RoutineKind::PROCEDURE;
    f.script->routines = {fn, proc};

    auto schema = f.bridge.collect_schema();
    REQUIRE(schema.is_ok());
    REQUIRE(schema.value().functions.size() == 1);
    REQUIRE(schema.value().procedures.size() == 1);
    CHECK(schema.value().functions[0].name == "total_orders");
    CHECK(schema.value().procedures[0].name == "archive_orders");
}

// ============================================================================
// Sampling
// ============================================================================

TEST_CASE("AdapterBridge: each table is sampled with its resolved ordering", "[bridge][sampling]") {
    BridgeFixture f;
    f.connect();

    SamplingConfig cfg;
    cfg.sample_size = 10;
    auto samples = f.bridge.sample_tables(f.script->tables, cfg, CancellationToken{});
    REQUIRE(samples.is_ok());
    REQUIRE(samples.value().size() == 2);

    const auto& users = samples.value()[0];
    CHECK(users.table_name == "users");
    CHECK(users.sample_size == 10);
    CHECK(users.total_rows == std::optional<uint64_t>(42));
    CHECK(users.rows.size() == 1);
    CHECK(std::holds_alternative<ordering::PrimaryKey>(users.strategy_used));

    const auto& events = samples.value()[1];
    CHECK(is_unordered(events.strategy_used));
    CHECK(std::find(events.warnings.begin(), events.warnings.end(),
                    std::string(kUnorderedSamplingWarning)) != events.warnings.end());

    // The strategy reported is the one the engine was asked to use
    REQUIRE(f.script->sampled.size() == 2);
    CHECK(f.script->sampled[0].second == users.strategy_used);
}

TEST_CASE("AdapterBridge: sensitive column names produce warnings only", "[bridge][sampling]") {
    BridgeFixture f;
    f.connect();

    auto samples = f.bridge.sample_tables({users_table()}, SamplingConfig{}, CancellationToken{});
    REQUIRE(samples.is_ok());
    const auto& users = samples.value()[0];

    bool flagged = false;
    for (const auto& w : users.warnings) {
        if (w.find("'email'") != std::string::npos) flagged = true;
    }
    CHECK(flagged);
    CHECK(users.rows == f.script->rows);
}

TEST_CASE("AdapterBridge: one failing table does not affect the others", "[bridge][sampling]") {
    BridgeFixture f;
    f.connect();
    f.script->fail_sample["users"] = ErrorCode::QUERY_TIMEOUT;

    auto samples = f.bridge.sample_tables(f.script->tables, SamplingConfig{}, CancellationToken{});
    REQUIRE(samples.is_ok());

    const auto& users = samples.value()[0];
    CHECK(users.rows.empty());
    bool timeout_warning = false;
    for (const auto& w : users.warnings) {
        if (w.find("QueryTimeout") != std::string::npos) timeout_warning = true;
    }
    CHECK(timeout_warning);

    CHECK(samples.value()[1].rows.size() == 1);
}

TEST_CASE("AdapterBridge: disabled sampling returns nothing", "[bridge][sampling]") {
    BridgeFixture f;
    f.connect();

    SamplingConfig cfg;
    cfg.enabled = false;
    auto samples = f.bridge.sample_tables(f.script->tables, cfg, CancellationToken{});
    REQUIRE(samples.is_ok());
    CHECK(samples.value().empty());
    CHECK(f.script->sampled.empty());
}

TEST_CASE("AdapterBridge: cancellation stops sampling between tables", "[bridge][sampling]") {
    BridgeFixture f;
    f.connect();

    CancellationToken token;
    token.cancel();
    auto samples = f.bridge.sample_tables(f.script->tables, SamplingConfig{}, token);
    REQUIRE(samples.is_error());
    CHECK(samples.error_code() == ErrorCode::CANCELLED);
    CHECK(f.script->sampled.empty());
}

TEST_CASE("AdapterBridge: invalid sensitive pattern is a configuration error", "[bridge][sampling]") {
    BridgeFixture f;
    f.connect();

    SamplingConfig cfg;
    cfg.sensitive_patterns = {{"(unclosed", "broken"}};
    auto samples = f.bridge.sample_tables(f.script->tables, cfg, CancellationToken{});
    REQUIRE(samples.is_error());
    CHECK(samples.error_code() == ErrorCode::CONFIGURATION_ERROR);
}

TEST_CASE("AdapterBridge: throttle delay precedes every sample query", "[bridge][sampling][throttle]") {
    using namespace std::chrono_literals;
    BridgeFixture f;
    f.connect();
    Table audit = events_table();
    audit.name = "audit";
    f.script->tables.push_back(audit);

    SamplingConfig cfg;
    cfg.throttle_delay = 20ms;
    const auto started = std::chrono::steady_clock::now();
    auto samples = f.bridge.sample_tables(f.script->tables, cfg, CancellationToken{});
    REQUIRE(samples.is_ok());

    const auto& at = f.script->sampled_at;
    REQUIRE(at.size() == 3);
    // Even the first query waits the full delay
    CHECK(at[0] - started >= 20ms);
    for (size_t i = 1; i < at.size(); ++i) {
        CHECK(at[i] - at[i - 1] >= 20ms);
    }
}

TEST_CASE("AdapterBridge: zero throttle delay samples without waiting", "[bridge][sampling][throttle]") {
    using namespace std::chrono_literals;
    BridgeFixture f;
    f.connect();

    const auto started = std::chrono::steady_clock::now();
    auto samples = f.bridge.sample_tables(f.script->tables, SamplingConfig{}, CancellationToken{});
    REQUIRE(samples.is_ok());
    CHECK(f.script->sampled_at.size() == 2);
    CHECK(std::chrono::steady_clock::now() - started < 1s);
}
