#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "sampling/quality_analyzer.hpp"

using namespace dbsurvey;
using nlohmann::json;

namespace {

TableSample sample_of(std::vector<json> rows, std::string table = "users") {
    TableSample s;
    s.table_name = std::move(table);
    s.schema_name = "public";
    s.rows = std::move(rows);
    s.sample_size = 100;
    return s;
}

TableSample spiked_sample(bool as_strings = false) {
    std::vector<json> rows;
    for (int i = 0; i < 9; ++i) {
        rows.push_back(as_strings ? json{{"amount", "10"}} : json{{"amount", 10}});
    }
    rows.push_back(as_strings ? json{{"amount", "100"}} : json{{"amount", 100}});
    return sample_of(std::move(rows), "payments");
}

} // namespace

// ============================================================================
// Completeness
// ============================================================================

TEST_CASE("QualityAnalyzer: nulls and empty strings lower completeness", "[quality]") {
    const QualityAnalyzer analyzer;
    const auto m = analyzer.analyze(sample_of({
        {{"id", 1}, {"name", "a"}},
        {{"id", 2}, {"name", nullptr}},
        {{"id", 3}, {"name", ""}},
        {{"id", 4}, {"name", "d"}},
    }));

    CHECK(m.analyzed_rows == 4);
    CHECK(m.completeness.score == Catch::Approx(0.75));
    CHECK(m.completeness.total_nulls == 1);
    CHECK(m.completeness.total_empty == 1);
    REQUIRE(m.completeness.column_details.size() == 2);
    CHECK(m.completeness.column_details[0].column_name == "id");
    CHECK(m.completeness.column_details[0].completeness == 1.0);
    CHECK(m.completeness.column_details[1].column_name == "name");
    CHECK(m.completeness.column_details[1].completeness == Catch::Approx(0.5));
}

TEST_CASE("QualityAnalyzer: a missing key counts as null", "[quality]") {
    const QualityAnalyzer analyzer;
    const auto m = analyzer.analyze(sample_of({{{"a", 1}, {"b", 2}}, {{"a", 2}}}));

    REQUIRE(m.completeness.column_details.size() == 2);
    CHECK(m.completeness.column_details[1].null_count == 1);
    CHECK(m.completeness.column_details[1].completeness == Catch::Approx(0.5));
}

TEST_CASE("QualityAnalyzer: empty sample scores perfectly", "[quality]") {
    const QualityAnalyzer analyzer;
    const auto m = analyzer.analyze(sample_of({}));

    CHECK(m.analyzed_rows == 0);
    CHECK(m.quality_score == 1.0);
    CHECK(m.threshold_violations.empty());
}

// ============================================================================
// Consistency
// ============================================================================

TEST_CASE("QualityAnalyzer: mixed value types are reported against the dominant type", "[quality]") {
    const QualityAnalyzer analyzer;
    const auto m = analyzer.analyze(sample_of({{{"v", 1}}, {{"v", 2}}, {{"v", 3}}, {{"v", "x"}}}));

    REQUIRE(m.consistency.type_inconsistencies.size() == 1);
    const auto& t = m.consistency.type_inconsistencies[0];
    CHECK(t.column_name == "v");
    CHECK(t.expected_type == "number");
    CHECK(t.found_types == std::vector<std::string>{"string"});
    CHECK(t.inconsistent_count == 1);
    CHECK(m.consistency.score == Catch::Approx(0.75));
}

TEST_CASE("QualityAnalyzer: values off the dominant string format are counted", "[quality]") {
    const QualityAnalyzer analyzer;

    SECTION("email majority") {
        const auto m = analyzer.analyze(sample_of({
            {{"email", "a@x.com"}}, {{"email", "b@x.com"}}, {{"email", "c@x.com"}}, {{"email", "nope"}},
        }));
        REQUIRE(m.consistency.format_violations.size() == 1);
        CHECK(m.consistency.format_violations[0].expected_format == "email");
        CHECK(m.consistency.format_violations[0].violation_count == 1);
        CHECK(m.consistency.score == Catch::Approx(0.75));
    }

    SECTION("uuid and dates are recognized") {
        const auto m = analyzer.analyze(sample_of({
            {{"ref", "123e4567-e89b-12d3-a456-426614174000"}, {"day", "2024-01-31"}},
            {{"ref", "123e4567-e89b-12d3-a456-426614174001"}, {"day", "2024-02-01"}},
            {{"ref", "not-a-uuid"}, {"day", "2024-02-01T10:00:00Z"}},
        }));
        REQUIRE(m.consistency.format_violations.size() == 2);
        CHECK(m.consistency.format_violations[0].column_name == "day");
        CHECK(m.consistency.format_violations[0].expected_format == "iso_date");
        CHECK(m.consistency.format_violations[1].column_name == "ref");
        CHECK(m.consistency.format_violations[1].expected_format == "uuid");
    }

    SECTION("no format covers a majority") {
        const auto m = analyzer.analyze(sample_of({{{"s", "a@x.com"}}, {{"s", "x"}}, {{"s", "y"}}}));
        CHECK(m.consistency.format_violations.empty());
        CHECK(m.consistency.score == 1.0);
    }
}

// ============================================================================
// Uniqueness
// ============================================================================

TEST_CASE("QualityAnalyzer: repeated column values lower uniqueness", "[quality]") {
    const QualityAnalyzer analyzer;
    const auto m = analyzer.analyze(sample_of({
        {{"id", 1}, {"status", "open"}},
        {{"id", 2}, {"status", "open"}},
        {{"id", 3}, {"status", "closed"}},
    }));

    REQUIRE(m.uniqueness.columns_with_duplicates.size() == 1);
    CHECK(m.uniqueness.columns_with_duplicates[0].column_name == "status");
    CHECK(m.uniqueness.columns_with_duplicates[0].duplicate_count == 1);
    CHECK(m.uniqueness.duplicate_row_count == 0);
    CHECK(m.uniqueness.score == Catch::Approx(2.0 / 3.0));
}

TEST_CASE("QualityAnalyzer: identical rows are counted once per repeat", "[quality]") {
    const QualityAnalyzer analyzer;
    const auto m = analyzer.analyze(sample_of({{{"id", 1}}, {{"id", 1}}, {{"id", 2}}}));

    CHECK(m.uniqueness.duplicate_row_count == 1);
    CHECK(m.uniqueness.score == Catch::Approx(2.0 / 3.0));
}

TEST_CASE("QualityAnalyzer: nulls compare equal to each other", "[quality]") {
    const QualityAnalyzer analyzer;
    const auto m = analyzer.analyze(sample_of({
        {{"id", 1}, {"note", nullptr}},
        {{"id", 2}, {"note", nullptr}},
    }));

    REQUIRE(m.uniqueness.columns_with_duplicates.size() == 1);
    CHECK(m.uniqueness.columns_with_duplicates[0].column_name == "note");
    CHECK(m.uniqueness.columns_with_duplicates[0].duplicate_count == 1);
}

// ============================================================================
// Anomalies
// ============================================================================

TEST_CASE("QualityAnalyzer: outliers depend on sensitivity", "[quality][anomaly]") {
    // Nine 10s and one 100: mean 19, population stddev 27, z(100) = 3.0
    SECTION("medium flags the spike") {
        const QualityAnalyzer analyzer;
        const auto m = analyzer.analyze(spiked_sample());
        REQUIRE(m.anomalies.has_value());
        CHECK(m.anomalies->total_outliers == 1);
        REQUIRE(m.anomalies->outliers.size() == 1);
        const auto& o = m.anomalies->outliers[0];
        CHECK(o.column_name == "amount");
        CHECK(o.z_score_threshold == 2.5);
        CHECK(o.mean == Catch::Approx(19.0));
        CHECK(o.std_dev == Catch::Approx(27.0));
    }

    SECTION("low needs a z-score above 3.0") {
        QualityConfig cfg;
        cfg.anomaly_sensitivity = "low";
        const QualityAnalyzer analyzer(cfg);
        const auto m = analyzer.analyze(spiked_sample());
        REQUIRE(m.anomalies.has_value());
        CHECK(m.anomalies->total_outliers == 0);
        CHECK(m.anomalies->outliers.empty());
    }

    SECTION("numeric strings are included") {
        const QualityAnalyzer analyzer;
        const auto m = analyzer.analyze(spiked_sample(true));
        REQUIRE(m.anomalies.has_value());
        CHECK(m.anomalies->total_outliers == 1);
    }
}

TEST_CASE("QualityAnalyzer: constant and short columns have no outliers", "[quality][anomaly]") {
    const QualityAnalyzer analyzer;

    SECTION("constant") {
        const auto m = analyzer.analyze(sample_of({{{"n", 5}}, {{"n", 5}}, {{"n", 5}}, {{"n", 5}}}));
        REQUIRE(m.anomalies.has_value());
        CHECK(m.anomalies->outliers.empty());
    }

    SECTION("fewer than three numbers") {
        const auto m = analyzer.analyze(sample_of({{{"n", 1}}, {{"n", 1000}}, {{"n", "abc"}}}));
        REQUIRE(m.anomalies.has_value());
        CHECK(m.anomalies->outliers.empty());
    }
}

TEST_CASE("QualityAnalyzer: anomaly detection can be turned off", "[quality][anomaly]") {
    QualityConfig cfg;
    cfg.anomaly_enabled = false;
    const QualityAnalyzer analyzer(cfg);
    CHECK_FALSE(analyzer.analyze(spiked_sample()).anomalies.has_value());
}

// ============================================================================
// Thresholds
// ============================================================================

TEST_CASE("QualityAnalyzer: scores below a minimum become violations", "[quality]") {
    const std::vector<json> rows = {
        {{"id", 1}, {"name", "a"}},
        {{"id", 2}, {"name", nullptr}},
        {{"id", 3}, {"name", ""}},
        {{"id", 4}, {"name", "d"}},
    };

    SECTION("far below is critical") {
        const QualityAnalyzer analyzer;
        const auto m = analyzer.analyze(sample_of(rows));
        CHECK(m.quality_score == Catch::Approx((0.75 + 1.0 + 1.0) / 3.0));
        REQUIRE(m.threshold_violations.size() == 1);
        CHECK(m.threshold_violations[0].metric == "completeness");
        CHECK(m.threshold_violations[0].threshold == 0.95);
        CHECK(m.threshold_violations[0].severity == "critical");

        const auto warnings = QualityAnalyzer::violation_warnings(m);
        REQUIRE(warnings.size() == 1);
        CHECK(warnings[0] == "Quality violation in 'users': completeness = 75.00% (threshold: 95.00%)");
    }

    SECTION("just below is a warning") {
        QualityConfig cfg;
        cfg.completeness_min = 0.8;
        const QualityAnalyzer analyzer(cfg);
        const auto m = analyzer.analyze(sample_of(rows));
        REQUIRE(m.threshold_violations.size() == 1);
        CHECK(m.threshold_violations[0].severity == "warning");
    }
}

TEST_CASE("QualityAnalyzer: disabled analysis reports defaults", "[quality]") {
    QualityConfig cfg;
    cfg.enabled = false;
    const QualityAnalyzer analyzer(cfg);
    const auto m = analyzer.analyze(sample_of({{{"id", nullptr}}, {{"id", nullptr}}}));

    CHECK_FALSE(analyzer.enabled());
    CHECK(m.table_name == "users");
    CHECK(m.analyzed_rows == 2);
    CHECK(m.quality_score == 1.0);
    CHECK(m.threshold_violations.empty());
    CHECK_FALSE(m.anomalies.has_value());
}

TEST_CASE("QualityAnalyzer: sensitivity names map to z-scores", "[quality]") {
    CHECK(QualityAnalyzer::z_threshold_for("low") == 3.0);
    CHECK(QualityAnalyzer::z_threshold_for("medium") == 2.5);
    CHECK(QualityAnalyzer::z_threshold_for("high") == 2.0);
    CHECK_FALSE(QualityAnalyzer::z_threshold_for("extreme").has_value());
}

TEST_CASE("QualityAnalyzer: every sample gets a report", "[quality]") {
    const QualityAnalyzer analyzer;
    const auto all = analyzer.analyze_all({sample_of({{{"id", 1}}}, "a"), sample_of({{{"id", 2}}}, "b")});
    REQUIRE(all.size() == 2);
    CHECK(all[0].table_name == "a");
    CHECK(all[1].table_name == "b");
}
