#include <catch2/catch_test_macros.hpp>
#include "orchestrator/retry_policy.hpp"

#include <vector>

using namespace dbsurvey;
using std::chrono::milliseconds;

namespace {

// Records waits on a manual clock that only moves when slept or advanced
struct Recorder {
    std::vector<milliseconds> sleeps;
    RetryPolicy::Clock::time_point now{};

    void advance(milliseconds d) { now += d; }

    RetryPolicy policy(RetryConfig config, milliseconds jitter = milliseconds{0}) {
        return RetryPolicy(config,
            [this](milliseconds d) { sleeps.push_back(d); advance(d); },
            [jitter](milliseconds, milliseconds) { return jitter; },
            [this]() { return now; });
    }
};

RetryConfig config(uint32_t max_attempts, milliseconds initial, milliseconds max_total) {
    RetryConfig c;
    c.max_attempts = max_attempts;
    c.initial_backoff = initial;
    c.jitter_min = milliseconds{0};
    c.jitter_max = milliseconds{0};
    c.max_total = max_total;
    return c;
}

// Fails with `code` for the first `failures` calls, then succeeds
std::function<Result<int>()> flaky(int& calls, int failures,
                                   ErrorCode code = ErrorCode::CONNECTION_FAILED) {
    return [&calls, failures, code]() {
        ++calls;
        if (calls <= failures) {
            return Result<int>::error(code, "connection refused");
        }
        return Result<int>::ok(calls);
    };
}

} // namespace

TEST_CASE("RetryPolicy: backoff doubles from the initial delay", "[retry]") {
    const RetryPolicy policy(config(5, milliseconds{500}, milliseconds{60000}));
    CHECK(policy.base_backoff(0) == milliseconds{0});
    CHECK(policy.base_backoff(1) == milliseconds{500});
    CHECK(policy.base_backoff(2) == milliseconds{1000});
    CHECK(policy.base_backoff(3) == milliseconds{2000});
    // Saturates instead of overflowing
    CHECK(policy.base_backoff(100) == policy.base_backoff(21));
}

TEST_CASE("RetryPolicy: succeeds after transient failures", "[retry]") {
    Recorder rec;
    const auto policy = rec.policy(config(3, milliseconds{100}, milliseconds{5000}), milliseconds{10});
    CancellationToken cancel;
    int calls = 0;
    uint32_t attempts = 0;

    auto result = policy.run<int>(flaky(calls, 2), "Connect to app", cancel, attempts);

    REQUIRE(result.is_ok());
    CHECK(result.value() == 3);
    CHECK(attempts == 3);
    CHECK(rec.sleeps == std::vector<milliseconds>{milliseconds{110}, milliseconds{210}});
}

TEST_CASE("RetryPolicy: permanent errors are not retried", "[retry]") {
    Recorder rec;
    const auto policy = rec.policy(config(5, milliseconds{100}, milliseconds{5000}));
    CancellationToken cancel;
    int calls = 0;
    uint32_t attempts = 0;

    auto result = policy.run<int>(flaky(calls, 10, ErrorCode::INSUFFICIENT_PRIVILEGE),
                                  "Connect to app", cancel, attempts);

    REQUIRE(result.is_error());
    CHECK(result.error_code() == ErrorCode::INSUFFICIENT_PRIVILEGE);
    CHECK(attempts == 1);
    CHECK(rec.sleeps.empty());
}

TEST_CASE("RetryPolicy: gives up after max_attempts", "[retry]") {
    Recorder rec;
    const auto policy = rec.policy(config(3, milliseconds{10}, milliseconds{5000}));
    CancellationToken cancel;
    int calls = 0;
    uint32_t attempts = 0;

    auto result = policy.run<int>(flaky(calls, 10, ErrorCode::CONNECTION_TIMEOUT),
                                  "Connect to app", cancel, attempts);

    REQUIRE(result.is_error());
    CHECK(result.error_code() == ErrorCode::CONNECTION_TIMEOUT);
    CHECK(attempts == 3);
    CHECK(calls == 3);
    CHECK(rec.sleeps.size() == 2);
}

TEST_CASE("RetryPolicy: total wait is clipped to the budget", "[retry]") {
    Recorder rec;
    const auto policy = rec.policy(config(5, milliseconds{500}, milliseconds{700}));
    CancellationToken cancel;
    int calls = 0;
    uint32_t attempts = 0;

    auto result = policy.run<int>(flaky(calls, 10), "Connect to app", cancel, attempts);

    REQUIRE(result.is_error());
    CHECK(rec.sleeps == std::vector<milliseconds>{milliseconds{500}, milliseconds{200}});
    CHECK(attempts == 3);
}

TEST_CASE("RetryPolicy: slow attempts count against the budget", "[retry]") {
    Recorder rec;
    RetryConfig cfg;  // 3 attempts, 500ms initial, 5000ms ceiling
    cfg.jitter_min = milliseconds{200};
    cfg.jitter_max = milliseconds{200};
    const auto policy = rec.policy(cfg, milliseconds{200});
    CancellationToken cancel;
    uint32_t attempts = 0;

    // Every connect blocks for 3s before timing out
    auto result = policy.run<int>([&rec]() {
        rec.advance(milliseconds{3000});
        return Result<int>::error(ErrorCode::CONNECTION_TIMEOUT, "timeout expired");
    }, "Connect to app", cancel, attempts);

    REQUIRE(result.is_error());
    CHECK(result.error_code() == ErrorCode::CONNECTION_TIMEOUT);
    // 700ms wait + 3s attempt fits; a further 1200ms wait + 3s attempt would not
    CHECK(attempts == 2);
    CHECK(rec.sleeps == std::vector<milliseconds>{milliseconds{700}});
}

TEST_CASE("RetryPolicy: time from first failure stays within the ceiling", "[retry]") {
    Recorder rec;
    const auto policy = rec.policy(config(10, milliseconds{100}, milliseconds{2000}));
    CancellationToken cancel;
    uint32_t attempts = 0;
    RetryPolicy::Clock::time_point first_failure{};

    auto result = policy.run<int>([&]() {
        rec.advance(milliseconds{400});
        if (attempts == 1) first_failure = rec.now;
        return Result<int>::error(ErrorCode::CONNECTION_FAILED, "connection refused");
    }, "Connect to app", cancel, attempts);

    REQUIRE(result.is_error());
    CHECK(attempts > 1);
    CHECK(rec.now - first_failure <= milliseconds{2000});
}

TEST_CASE("RetryPolicy: cancellation stops further attempts", "[retry]") {
    Recorder rec;
    const auto policy = rec.policy(config(5, milliseconds{10}, milliseconds{5000}));
    CancellationToken cancel;
    uint32_t attempts = 0;

    auto result = policy.run<void>([&cancel]() {
        cancel.cancel();
        return Result<void>::error(ErrorCode::CONNECTION_FAILED, "connection refused");
    }, "Connect to app", cancel, attempts);

    REQUIRE(result.is_error());
    CHECK(attempts == 1);
    CHECK(rec.sleeps.empty());
}

TEST_CASE("RetryPolicy: single attempt when max_attempts is 1", "[retry]") {
    Recorder rec;
    const auto policy = rec.policy(config(1, milliseconds{10}, milliseconds{5000}));
    CancellationToken cancel;
    int calls = 0;
    uint32_t attempts = 0;

    auto result = policy.run<int>(flaky(calls, 1), "Connect to app", cancel, attempts);
    CHECK(result.is_error());
    CHECK(attempts == 1);
}
