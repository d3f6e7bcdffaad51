#include <catch2/catch_test_macros.hpp>
#include "orchestrator/database_filter.hpp"

using namespace dbsurvey;

namespace {

DatabaseInfo db(std::string name, AccessLevel access = AccessLevel::FULL, bool system = false) {
    DatabaseInfo info;
    info.name = std::move(name);
    info.access_level = access;
    info.is_system_database = system;
    return info;
}

DatabaseFilter make_filter(std::vector<std::string> exclude, bool include_system = false,
                           DatabaseType engine = DatabaseType::POSTGRESQL) {
    CollectionConfig config;
    config.exclude_databases = std::move(exclude);
    config.include_system_databases = include_system;
    auto filter = DatabaseFilter::create(config, engine);
    REQUIRE(filter.is_ok());
    return filter.take_value();
}

} // namespace

TEST_CASE("glob_match: wildcards", "[filter][glob]") {
    CHECK(glob_match("test_*", "test_orders"));
    CHECK(glob_match("test_*", "test_"));
    CHECK_FALSE(glob_match("test_*", "prod_orders"));
    CHECK(glob_match("*_archive", "sales_2023_archive"));
    CHECK(glob_match("db?", "db1"));
    CHECK_FALSE(glob_match("db?", "db10"));
    CHECK(glob_match("a*b*c", "aXXbYYc"));
    CHECK_FALSE(glob_match("a*b*c", "aXXbYY"));
    CHECK(glob_match("*", ""));
    CHECK_FALSE(glob_match("", "x"));
}

TEST_CASE("DatabaseFilter: exact, glob and regex exclusions", "[filter]") {
    const auto filter = make_filter({"scratch", "tmp_*", "regex:^qa_[0-9]+$"});

    CHECK(filter.is_excluded("scratch"));
    CHECK_FALSE(filter.is_excluded("scratch2"));
    CHECK(filter.is_excluded("tmp_import"));
    CHECK(filter.is_excluded("qa_17"));
    // Regex must match the whole name
    CHECK_FALSE(filter.is_excluded("qa_17_old"));
    CHECK_FALSE(filter.is_excluded("orders"));
}

TEST_CASE("DatabaseFilter: invalid regex is a configuration error", "[filter]") {
    CollectionConfig config;
    config.exclude_databases = {"regex:(unclosed"};
    const auto filter = DatabaseFilter::create(config, DatabaseType::POSTGRESQL);
    REQUIRE(filter.is_error());
    CHECK(filter.error_code() == ErrorCode::CONFIGURATION_ERROR);
    CHECK(filter.error_message().find("regex:(unclosed") != std::string::npos);
}

TEST_CASE("DatabaseFilter: system databases per engine", "[filter][system]") {
    SECTION("PostgreSQL templates") {
        const auto filter = make_filter({});
        CHECK(filter.is_system(db("template0")));
        CHECK(filter.is_system(db("template1")));
        CHECK_FALSE(filter.is_system(db("postgres")));
    }
    SECTION("MySQL names ignore case") {
        const auto filter = make_filter({}, false, DatabaseType::MYSQL);
        CHECK(filter.is_system(db("information_schema")));
        CHECK(filter.is_system(db("Performance_Schema")));
        CHECK(filter.is_system(db("SYS")));
        CHECK_FALSE(filter.is_system(db("shop")));
    }
    SECTION("MongoDB") {
        const auto filter = make_filter({}, false, DatabaseType::MONGODB);
        CHECK(filter.is_system(db("admin")));
        CHECK(filter.is_system(db("local")));
        CHECK_FALSE(filter.is_system(db("Admin")));
    }
    SECTION("engine flag counts even for unknown names") {
        const auto filter = make_filter({});
        CHECK(filter.is_system(db("rdsadmin", AccessLevel::FULL, true)));
    }
}

TEST_CASE("DatabaseFilter: decision order", "[filter]") {
    SECTION("system databases excluded by default") {
        const auto filter = make_filter({});
        CHECK(filter.decide(db("template1")) == FilterDecision::EXCLUDE_SYSTEM);
        CHECK(filter.decide(db("app")) == FilterDecision::COLLECT);
    }
    SECTION("include_system_databases collects them") {
        const auto filter = make_filter({}, true);
        CHECK(filter.decide(db("template1")) == FilterDecision::COLLECT);
    }
    SECTION("exclusion wins over include_system_databases") {
        const auto filter = make_filter({"template*"}, true);
        CHECK(filter.decide(db("template1")) == FilterDecision::EXCLUDE_PATTERN);
    }
    SECTION("inaccessible databases are skipped, not collected") {
        const auto filter = make_filter({});
        CHECK(filter.decide(db("locked", AccessLevel::NONE)) == FilterDecision::SKIP_INACCESSIBLE);
        CHECK(filter.decide(db("limited", AccessLevel::LIMITED)) == FilterDecision::COLLECT);
    }
    SECTION("excluded inaccessible database is never reported") {
        const auto filter = make_filter({"locked"});
        CHECK(filter.decide(db("locked", AccessLevel::NONE)) == FilterDecision::EXCLUDE_PATTERN);
    }
}

TEST_CASE("DatabaseFilter: decision names", "[filter]") {
    CHECK(filter_decision_to_string(FilterDecision::COLLECT) == "collect");
    CHECK(filter_decision_to_string(FilterDecision::SKIP_INACCESSIBLE) == "inaccessible");
}
