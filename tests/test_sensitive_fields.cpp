#include <catch2/catch_test_macros.hpp>
#include "sampling/sensitive_field_detector.hpp"

#include <regex>

using namespace dbsurvey;

namespace {

Column named(std::string name) {
    Column c;
    c.name = std::move(name);
    return c;
}

} // namespace

TEST_CASE("SensitiveFields: default patterns flag common personal data", "[sampling][sensitive]") {
    const SensitiveFieldDetector detector(default_sensitive_patterns());

    CHECK(detector.pattern_count() == default_sensitive_patterns().size());
    CHECK(detector.check("password_hash").has_value());
    CHECK(detector.check("contact_email").has_value());
    CHECK(detector.check("ssn").has_value());
    CHECK(detector.check("card_number").has_value());
    CHECK(detector.check("api_key").has_value());
    CHECK(detector.check("mobile").has_value());
}

TEST_CASE("SensitiveFields: matching ignores case for (?i) patterns", "[sampling][sensitive]") {
    const SensitiveFieldDetector detector(default_sensitive_patterns());
    const auto warning = detector.check("UserPassword");
    REQUIRE(warning.has_value());
    CHECK(*warning == "Column 'UserPassword' may contain sensitive data (Password field detected)");
}

TEST_CASE("SensitiveFields: ordinary columns are not flagged", "[sampling][sensitive]") {
    const SensitiveFieldDetector detector(default_sensitive_patterns());
    CHECK_FALSE(detector.check("id").has_value());
    CHECK_FALSE(detector.check("created_at").has_value());
    CHECK_FALSE(detector.check("quantity").has_value());
}

TEST_CASE("SensitiveFields: scan reports one warning per column in order", "[sampling][sensitive]") {
    const SensitiveFieldDetector detector(default_sensitive_patterns());
    const auto warnings = detector.scan({named("id"), named("email"), named("name"), named("phone")});

    REQUIRE(warnings.size() == 2);
    CHECK(warnings[0].find("'email'") != std::string::npos);
    CHECK(warnings[1].find("'phone'") != std::string::npos);
}

TEST_CASE("SensitiveFields: custom patterns replace the defaults", "[sampling][sensitive]") {
    const SensitiveFieldDetector detector({{"^iban$", "Bank account"}});

    CHECK(detector.check("iban") ==
          std::optional<std::string>{"Column 'iban' may contain sensitive data (Bank account)"});
    // Without (?i) matching is case-sensitive
    CHECK_FALSE(detector.check("IBAN").has_value());
    CHECK_FALSE(detector.check("password").has_value());
}

TEST_CASE("SensitiveFields: an empty pattern list flags nothing", "[sampling][sensitive]") {
    const SensitiveFieldDetector detector({});
    CHECK(detector.scan({named("password"), named("email")}).empty());
}

TEST_CASE("SensitiveFields: invalid patterns throw", "[sampling][sensitive]") {
    CHECK_THROWS_AS(SensitiveFieldDetector({{"(?i)([a-z", "broken"}}), std::regex_error);
}
