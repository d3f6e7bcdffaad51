#include <catch2/catch_test_macros.hpp>
#include "db/adapter_registry.hpp"
#include "mocks/mock_adapter.hpp"

using namespace dbsurvey;
using dbsurvey::testing::MockAdapter;
using dbsurvey::testing::MockServer;

TEST_CASE("AdapterRegistry: builder entries create fresh adapters", "[registry]") {
    auto server = std::make_shared<MockServer>();
    server->type = DatabaseType::MYSQL;
    int created = 0;

    const auto registry = AdapterRegistry::Builder()
        .add(DatabaseType::MYSQL, [server, &created] {
            ++created;
            return std::make_unique<MockAdapter>(server);
        })
        .build();

    CHECK(registry.has_adapter(DatabaseType::MYSQL));
    CHECK_FALSE(registry.has_adapter(DatabaseType::POSTGRESQL));

    auto first = registry.create(DatabaseType::MYSQL);
    auto second = registry.create(DatabaseType::MYSQL);
    REQUIRE(first.is_ok());
    REQUIRE(second.is_ok());
    CHECK(first.value()->database_type() == DatabaseType::MYSQL);
    CHECK(first.value().get() != second.value().get());
    CHECK(created == 2);
}

TEST_CASE("AdapterRegistry: unknown engine is ADAPTER_NOT_FOUND", "[registry]") {
    const auto registry = AdapterRegistry::Builder().build();
    auto adapter = registry.create(DatabaseType::MONGODB);

    REQUIRE(adapter.is_error());
    CHECK(adapter.error_code() == ErrorCode::ADAPTER_NOT_FOUND);
    CHECK(adapter.error_message().find("mongodb") != std::string::npos);
    CHECK(registry.available().empty());
}

TEST_CASE("AdapterRegistry: later add replaces earlier one", "[registry]") {
    auto pg = std::make_shared<MockServer>();
    auto replacement = std::make_shared<MockServer>();
    replacement->type = DatabaseType::SQLITE;

    const auto registry = AdapterRegistry::Builder()
        .add(DatabaseType::SQLITE, [pg] { return std::make_unique<MockAdapter>(pg); })
        .add(DatabaseType::SQLITE, [replacement] { return std::make_unique<MockAdapter>(replacement); })
        .build();

    auto adapter = registry.create(DatabaseType::SQLITE);
    REQUIRE(adapter.is_ok());
    CHECK(adapter.value()->database_type() == DatabaseType::SQLITE);
    CHECK(registry.available() == std::vector<DatabaseType>{DatabaseType::SQLITE});
}

TEST_CASE("AdapterRegistry: default registry holds the enabled engines", "[registry]") {
    const auto registry = make_default_registry();
    size_t expected = 0;

#ifdef DBSURVEY_ENABLE_POSTGRESQL
    ++expected;
    CHECK(registry.has_adapter(DatabaseType::POSTGRESQL));
#endif
#ifdef DBSURVEY_ENABLE_MYSQL
    ++expected;
    CHECK(registry.has_adapter(DatabaseType::MYSQL));
#endif
#ifdef DBSURVEY_ENABLE_SQLITE
    ++expected;
    REQUIRE(registry.has_adapter(DatabaseType::SQLITE));
    auto sqlite = registry.create(DatabaseType::SQLITE);
    REQUIRE(sqlite.is_ok());
    CHECK(sqlite.value()->database_type() == DatabaseType::SQLITE);
    CHECK(sqlite.value()->supports_feature(AdapterFeature::VIEWS));
    CHECK_FALSE(sqlite.value()->supports_feature(AdapterFeature::MULTI_DATABASE));
#endif
#ifdef DBSURVEY_ENABLE_MONGODB
    ++expected;
    CHECK(registry.has_adapter(DatabaseType::MONGODB));
#endif

    CHECK(registry.available().size() == expected);
}
