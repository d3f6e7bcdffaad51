#include "orchestrator/retry_policy.hpp"

#include <algorithm>
#include <random>
#include <thread>

namespace dbsurvey {

namespace {

void sleep_for(std::chrono::milliseconds d) {
    std::this_thread::sleep_for(d);
}

std::chrono::milliseconds uniform_jitter(std::chrono::milliseconds lo, std::chrono::milliseconds hi) {
    if (hi <= lo) {
        return lo;
    }
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<int64_t> dist(lo.count(), hi.count());
    return std::chrono::milliseconds(dist(rng));
}

} // namespace

RetryPolicy::RetryPolicy(RetryConfig config, SleepFn sleep, JitterFn jitter, ClockFn clock)
    : config_(std::move(config)),
      sleep_(sleep ? std::move(sleep) : SleepFn(sleep_for)),
      jitter_(jitter ? std::move(jitter) : JitterFn(uniform_jitter)),
      clock_(clock ? std::move(clock) : ClockFn([] { return Clock::now(); })) {}

std::chrono::milliseconds RetryPolicy::base_backoff(uint32_t retry) const {
    if (retry == 0) {
        return std::chrono::milliseconds::zero();
    }
    // Doubling saturates well before overflow; the total budget caps it anyway
    const uint32_t shift = std::min<uint32_t>(retry - 1, 20);
    return config_.initial_backoff * (int64_t{1} << shift);
}

} // namespace dbsurvey
