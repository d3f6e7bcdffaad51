#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "db/database_adapter.hpp"

#include <chrono>
#include <cstdint>
#include <format>
#include <functional>
#include <string_view>

namespace dbsurvey {

/**
 * @brief Bounded reconnect policy for one database
 *
 * Retries only transient connection errors. The n-th wait is
 * initial_backoff * 2^(n-1) plus a uniform jitter in [jitter_min, jitter_max].
 * max_total bounds the wall time from the first failure to the end of the
 * last retry, counting both the waits and the attempts themselves. A retry
 * is only started when the wait plus the duration of the previous attempt
 * still fits in what is left of the budget.
 *
 * Sleep, jitter and clock are injectable so tests run without real delays.
 */
class RetryPolicy {
public:
    using Clock = std::chrono::steady_clock;
    using SleepFn = std::function<void(std::chrono::milliseconds)>;
    using JitterFn = std::function<std::chrono::milliseconds(std::chrono::milliseconds lo,
                                                             std::chrono::milliseconds hi)>;
    using ClockFn = std::function<Clock::time_point()>;

    explicit RetryPolicy(RetryConfig config = {}, SleepFn sleep = {}, JitterFn jitter = {},
                         ClockFn clock = {});

    /**
     * @brief Backoff before retry number `retry` (1-based), without jitter
     */
    [[nodiscard]] std::chrono::milliseconds base_backoff(uint32_t retry) const;

    [[nodiscard]] const RetryConfig& config() const { return config_; }

    /**
     * @brief Run op until it succeeds, fails permanently, or the budget runs out
     *
     * @param attempts set to the number of times op was invoked
     */
    template<typename T>
    [[nodiscard]] Result<T> run(const std::function<Result<T>()>& op,
                                std::string_view what,
                                const CancellationToken& cancel,
                                uint32_t& attempts) const {
        using std::chrono::duration_cast;
        using std::chrono::milliseconds;

        Clock::time_point first_failure{};
        for (attempts = 1;; ++attempts) {
            const auto started = clock_();
            auto result = op();
            const auto finished = clock_();
            if (result.is_ok() || !is_retryable(result.error_code()) ||
                attempts >= config_.max_attempts || cancel.is_cancelled()) {
                return result;
            }
            if (attempts == 1) {
                first_failure = finished;
            }

            // The next attempt is assumed to take as long as this one did
            const auto last_attempt = duration_cast<milliseconds>(finished - started);
            const auto elapsed = duration_cast<milliseconds>(finished - first_failure);
            const auto remaining = config_.max_total - elapsed - last_attempt;

            auto wait = base_backoff(attempts) + jitter_(config_.jitter_min, config_.jitter_max);
            if (wait > remaining) {
                wait = remaining;
            }
            if (wait <= milliseconds::zero()) {
                utils::log::warn(std::format("{} failed ({}), retry budget of {}ms exhausted",
                                             what, result.error_message(),
                                             config_.max_total.count()));
                return result;
            }

            utils::log::warn(std::format("{} failed ({}), retrying in {}ms (attempt {}/{})",
                                         what, result.error_message(), wait.count(),
                                         attempts + 1, config_.max_attempts));
            sleep_(wait);
        }
    }

private:
    RetryConfig config_;
    SleepFn sleep_;
    JitterFn jitter_;
    ClockFn clock_;
};

} // namespace dbsurvey
