#include <catch2/catch_test_macros.hpp>
#include "aggregator/result_serializer.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace dbsurvey;
using nlohmann::ordered_json;

namespace {

CollectionResult sample_result() {
    CollectionResult result;
    result.server_info.server_type = DatabaseType::POSTGRESQL;
    result.server_info.version = "16.2";
    result.server_info.host = "db.internal";
    result.server_info.port = 5432;
    result.server_info.connection_user = "surveyor";
    result.server_info.collection_mode = {CollectionMode::Kind::MULTI_DATABASE, 2, 1, 1};

    DatabaseSchema app;
    app.database_info.name = "app";
    app.database_info.encoding = "UTF8";

    Table users;
    users.name = "users";
    users.schema = "public";
    Column id;
    id.name = "id";
    id.data_type = UnifiedDataType::integer(64);
    id.native_type = "bigint";
    id.is_nullable = false;
    id.is_primary_key = true;
    id.ordinal_position = 1;
    users.columns.push_back(id);
    users.primary_key = PrimaryKey{"users_pkey", {"id"}};
    app.tables.push_back(users);

    TableSample sample;
    sample.table_name = "users";
    sample.schema_name = "public";
    sample.rows.push_back(nlohmann::json{{"id", 1}, {"email", nullptr}});
    sample.sample_size = 100;
    sample.total_rows = 1;
    sample.strategy_used = ordering::PrimaryKey{{"id"}};
    app.samples.push_back(sample);

    TableQualityMetrics quality;
    quality.table_name = "users";
    quality.schema_name = "public";
    quality.completeness.score = 0.5;
    quality.completeness.column_details.push_back({"email", 1, 1, 0, 0.0});
    quality.completeness.total_nulls = 1;
    quality.anomalies = AnomalyMetrics{};
    quality.quality_score = 0.5 / 3.0 + 2.0 / 3.0;
    quality.threshold_violations.push_back({"completeness", 0.95, 0.5, "critical"});
    quality.analyzed_rows = 1;
    app.quality_metrics.push_back(quality);
    result.databases.push_back(app);

    DatabaseSchema broken;
    broken.database_info.name = "broken";
    broken.database_info.collection_status = CollectionStatus::failed("connection refused");
    result.databases.push_back(broken);
    result.failures.push_back({"broken", ErrorCode::CONNECTION_FAILED, "connection refused", 3});
    return result;
}

} // namespace

TEST_CASE("Serializer: format version leads the document", "[serializer]") {
    const auto j = to_json(sample_result());
    REQUIRE(j.is_object());
    CHECK(j.begin().key() == "format_version");
    CHECK(j["format_version"] == "1.0");

    std::vector<std::string> keys;
    for (auto it = j.begin(); it != j.end(); ++it) keys.push_back(it.key());
    CHECK(keys == std::vector<std::string>{"format_version", "server_info", "databases",
                                           "failures", "metadata"});
}

TEST_CASE("Serializer: collection status encoding", "[serializer]") {
    CHECK(to_json(CollectionStatus::success()) == "Success");
    CHECK(to_json(CollectionStatus::partial({"views", "routines"})) ==
          ordered_json::parse(R"({"Partial": {"errors": ["views", "routines"]}})"));
    CHECK(to_json(CollectionStatus::failed("boom")) ==
          ordered_json::parse(R"({"Failed": {"error": "boom"}})"));
    CHECK(to_json(CollectionStatus::skipped("no access")) ==
          ordered_json::parse(R"({"Skipped": {"reason": "no access"}})"));
}

TEST_CASE("Serializer: ordering strategy encoding", "[serializer]") {
    CHECK(to_json(OrderingStrategy{ordering::Unordered{}}) == "Unordered");
    CHECK(to_json(OrderingStrategy{ordering::PrimaryKey{{"a", "b"}}}) ==
          ordered_json::parse(R"({"PrimaryKey": {"columns": ["a", "b"]}})"));
    const auto ts = to_json(OrderingStrategy{
        ordering::Timestamp{"created_at", SortDirection::DESCENDING}});
    REQUIRE(ts.contains("Timestamp"));
    CHECK(ts["Timestamp"]["column"] == "created_at");
    CHECK(to_json(OrderingStrategy{ordering::SystemRowId{"rowid"}}) ==
          ordered_json::parse(R"({"SystemRowId": {"column": "rowid"}})"));
}

TEST_CASE("Serializer: data type encoding", "[serializer]") {
    CHECK(to_json(UnifiedDataType{types::Boolean{}}) == "Boolean");
    CHECK(to_json(UnifiedDataType{types::Json{}}) == "Json");
    CHECK(to_json(UnifiedDataType::integer(32, false)) ==
          ordered_json::parse(R"({"Integer": {"bits": 32, "signed": false}})"));
    CHECK(to_json(UnifiedDataType::string()) ==
          ordered_json::parse(R"({"String": {"max_length": null, "fixed": false}})"));

    const auto arr = to_json(UnifiedDataType::array_of(UnifiedDataType{types::Date{}}));
    CHECK(arr == ordered_json::parse(R"({"Array": {"element_type": "Date"}})"));

    CHECK(to_json(UnifiedDataType::custom("geometry", "postgresql")) ==
          ordered_json::parse(R"({"Custom": {"type_name": "geometry", "engine": "postgresql"}})"));
}

TEST_CASE("Serializer: absent optionals are null", "[serializer]") {
    const auto j = to_json(sample_result());
    const auto& info = j["databases"][0]["database_info"];
    CHECK(info["owner"].is_null());
    CHECK(info["size_bytes"].is_null());
    CHECK(info["encoding"] == "UTF8");
    CHECK(j["databases"][0]["tables"][0]["comment"].is_null());
    CHECK(j["databases"][0]["tables"][0]["primary_key"]["name"] == "users_pkey");
}

TEST_CASE("Serializer: server info, samples and failures", "[serializer]") {
    const auto j = to_json(sample_result());

    CHECK(j["server_info"]["server_type"] == "postgresql");
    CHECK(j["server_info"]["port"] == 5432);
    CHECK(j["server_info"]["collection_mode"] ==
          ordered_json::parse(R"({"MultiDatabase": {"discovered": 2, "collected": 1, "failed": 1}})"));

    const auto& sample = j["databases"][0]["samples"][0];
    CHECK(sample["rows"][0]["id"] == 1);
    CHECK(sample["rows"][0]["email"].is_null());
    CHECK(sample["strategy_used"] == ordered_json::parse(R"({"PrimaryKey": {"columns": ["id"]}})"));

    REQUIRE(j["failures"].size() == 1);
    CHECK(j["failures"][0]["database_name"] == "broken");
    CHECK(j["failures"][0]["attempts"] == 3);
    CHECK(j["databases"][1]["database_info"]["collection_status"] ==
          ordered_json::parse(R"({"Failed": {"error": "connection refused"}})"));

    CHECK(j["metadata"]["collector"] == "dbsurvey");
    CHECK(j["metadata"]["collected_at"].get<std::string>().ends_with("Z"));
}

TEST_CASE("Serializer: quality metrics per database", "[serializer][quality]") {
    const auto j = to_json(sample_result());

    REQUIRE(j["databases"][0]["quality_metrics"].size() == 1);
    const auto& q = j["databases"][0]["quality_metrics"][0];
    CHECK(q["table_name"] == "users");
    CHECK(q["completeness"]["score"] == 0.5);
    CHECK(q["completeness"]["column_details"][0]["null_count"] == 1);
    CHECK(q["anomalies"]["outlier_count"] == 0);
    CHECK(q["threshold_violations"][0] ==
          ordered_json::parse(R"({"metric": "completeness", "threshold": 0.95, "actual": 0.5, "severity": "critical"})"));
    CHECK(q["analyzed_rows"] == 1);
    CHECK(q["analyzed_at"].get<std::string>().ends_with("Z"));

    CHECK(j["databases"][1]["quality_metrics"].empty());
}

TEST_CASE("Serializer: write_result writes parseable JSON", "[serializer]") {
    const auto path = std::filesystem::temp_directory_path() / "dbsurvey_serializer_test.json";
    OutputConfig output;
    output.path = path.string();

    SECTION("pretty") {
        output.pretty = true;
        REQUIRE(write_result(sample_result(), output).is_ok());
    }
    SECTION("compact") {
        output.pretty = false;
        REQUIRE(write_result(sample_result(), output).is_ok());
    }

    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    std::filesystem::remove(path);

    const auto parsed = ordered_json::parse(buffer.str());
    CHECK(parsed == to_json(sample_result()));
}

TEST_CASE("Serializer: unwritable path is an error", "[serializer]") {
    OutputConfig output;
    output.path = "/nonexistent-dir/dbsurvey/out.json";
    const auto result = write_result(sample_result(), output);
    REQUIRE(result.is_error());
    CHECK(result.error_code() == ErrorCode::INTERNAL_ERROR);
}
