#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <thread>

namespace dbsurvey {

/**
 * @brief Enforces a minimum delay between successive queries
 *
 * The first call waits the full delay, matching "wait before issuing".
 * Each adapter instance owns its own throttle; it is not thread-safe.
 */
class Throttle {
public:
    using Clock = std::chrono::steady_clock;
    using SleepFn = std::function<void(std::chrono::milliseconds)>;
    using ClockFn = std::function<Clock::time_point()>;

    explicit Throttle(std::chrono::milliseconds min_delay,
                      SleepFn sleep = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); },
                      ClockFn clock = [] { return Clock::now(); })
        : min_delay_(min_delay), sleep_(std::move(sleep)), clock_(std::move(clock)) {}

    /**
     * @brief Block until at least min_delay has passed since the previous query
     * @return Time actually slept
     */
    std::chrono::milliseconds wait() {
        if (min_delay_.count() <= 0) {
            return std::chrono::milliseconds{0};
        }

        std::chrono::milliseconds to_sleep = min_delay_;
        if (last_query_) {
            const auto since = std::chrono::duration_cast<std::chrono::milliseconds>(
                clock_() - *last_query_);
            to_sleep = since >= min_delay_ ? std::chrono::milliseconds{0} : min_delay_ - since;
        }
        if (to_sleep.count() > 0) {
            sleep_(to_sleep);
        }
        last_query_ = clock_();
        return to_sleep;
    }

private:
    std::chrono::milliseconds min_delay_;
    SleepFn sleep_;
    ClockFn clock_;
    std::optional<Clock::time_point> last_query_;
};

} // namespace dbsurvey
