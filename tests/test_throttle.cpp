#include <catch2/catch_test_macros.hpp>
#include "sampling/throttle.hpp"

#include <vector>

using namespace dbsurvey;
using std::chrono::milliseconds;

namespace {

// Sleeping advances a manual clock; nothing blocks
struct ManualClock {
    Throttle::Clock::time_point now{};
    std::vector<milliseconds> sleeps;

    Throttle throttle(milliseconds delay) {
        return Throttle(delay,
            [this](milliseconds d) { sleeps.push_back(d); now += d; },
            [this]() { return now; });
    }
};

} // namespace

TEST_CASE("Throttle: first query waits the full delay", "[throttle]") {
    ManualClock clock;
    auto throttle = clock.throttle(milliseconds{100});

    CHECK(throttle.wait() == milliseconds{100});
    CHECK(clock.sleeps == std::vector<milliseconds>{milliseconds{100}});
}

TEST_CASE("Throttle: back-to-back queries are spaced by the delay", "[throttle]") {
    ManualClock clock;
    auto throttle = clock.throttle(milliseconds{100});

    throttle.wait();
    throttle.wait();
    throttle.wait();
    CHECK(clock.sleeps == std::vector<milliseconds>{
        milliseconds{100}, milliseconds{100}, milliseconds{100}});
}

TEST_CASE("Throttle: time spent in a query counts toward the delay", "[throttle]") {
    ManualClock clock;
    auto throttle = clock.throttle(milliseconds{100});

    throttle.wait();
    clock.now += milliseconds{30};
    CHECK(throttle.wait() == milliseconds{70});

    clock.now += milliseconds{250};
    CHECK(throttle.wait() == milliseconds{0});
    CHECK(clock.sleeps == std::vector<milliseconds>{milliseconds{100}, milliseconds{70}});
}

TEST_CASE("Throttle: zero delay never sleeps", "[throttle]") {
    ManualClock clock;
    auto throttle = clock.throttle(milliseconds{0});

    CHECK(throttle.wait() == milliseconds{0});
    CHECK(throttle.wait() == milliseconds{0});
    CHECK(clock.sleeps.empty());
}
