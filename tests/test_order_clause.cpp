#include <catch2/catch_test_macros.hpp>
#include "sampling/order_clause.hpp"

using namespace dbsurvey;

namespace {

Table table(std::optional<std::string> schema, std::string name) {
    Table t;
    t.schema = std::move(schema);
    t.name = std::move(name);
    return t;
}

} // namespace

TEST_CASE("OrderClause: identifier quoting per dialect", "[sampling][sql]") {
    CHECK(quote_identifier(SqlDialect::POSTGRESQL, "users") == "\"users\"");
    CHECK(quote_identifier(SqlDialect::SQLITE, "users") == "\"users\"");
    CHECK(quote_identifier(SqlDialect::MYSQL, "users") == "`users`");
}

TEST_CASE("OrderClause: embedded quotes are doubled", "[sampling][sql][security]") {
    CHECK(quote_identifier(SqlDialect::POSTGRESQL, "we\"ird") == "\"we\"\"ird\"");
    CHECK(quote_identifier(SqlDialect::MYSQL, "we`ird") == "`we``ird`");
    // The other dialect's quote char is harmless inside the identifier
    CHECK(quote_identifier(SqlDialect::MYSQL, "we\"ird") == "`we\"ird`");
}

TEST_CASE("OrderClause: qualified table names", "[sampling][sql]") {
    CHECK(qualified_table_name(SqlDialect::POSTGRESQL, table("public", "users")) ==
          "\"public\".\"users\"");
    CHECK(qualified_table_name(SqlDialect::MYSQL, table("shop", "orders")) == "`shop`.`orders`");
    CHECK(qualified_table_name(SqlDialect::SQLITE, table(std::nullopt, "notes")) == "\"notes\"");
    CHECK(qualified_table_name(SqlDialect::SQLITE, table(std::string{}, "notes")) == "\"notes\"");
}

TEST_CASE("OrderClause: strategies sort newest first", "[sampling][sql]") {
    const auto pg = SqlDialect::POSTGRESQL;
    CHECK(build_order_clause(pg, ordering::PrimaryKey{{"tenant", "id"}}) ==
          "ORDER BY \"tenant\" DESC, \"id\" DESC");
    CHECK(build_order_clause(pg, ordering::Timestamp{"created_at", SortDirection::DESCENDING}) ==
          "ORDER BY \"created_at\" DESC");
    CHECK(build_order_clause(pg, ordering::AutoIncrement{"seq"}) == "ORDER BY \"seq\" DESC");
    CHECK(build_order_clause(SqlDialect::SQLITE, ordering::SystemRowId{"rowid"}) ==
          "ORDER BY \"rowid\" DESC");
}

TEST_CASE("OrderClause: unordered uses the dialect's random function", "[sampling][sql]") {
    CHECK(build_order_clause(SqlDialect::POSTGRESQL, ordering::Unordered{}) == "ORDER BY RANDOM()");
    CHECK(build_order_clause(SqlDialect::SQLITE, ordering::Unordered{}) == "ORDER BY RANDOM()");
    CHECK(build_order_clause(SqlDialect::MYSQL, ordering::Unordered{}) == "ORDER BY RAND()");
}

TEST_CASE("OrderClause: sample and count queries", "[sampling][sql]") {
    const auto t = table("public", "users");
    CHECK(build_sample_query(SqlDialect::POSTGRESQL, t, ordering::PrimaryKey{{"id"}}, 100) ==
          "SELECT * FROM \"public\".\"users\" ORDER BY \"id\" DESC LIMIT 100");
    CHECK(build_sample_query(SqlDialect::MYSQL, table("shop", "cart"), ordering::Unordered{}, 5) ==
          "SELECT * FROM `shop`.`cart` ORDER BY RAND() LIMIT 5");
    CHECK(build_count_query(SqlDialect::POSTGRESQL, t) == "SELECT COUNT(*) FROM \"public\".\"users\"");
}
