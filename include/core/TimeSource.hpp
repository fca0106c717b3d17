#pragma once

#include <chrono>
#include <thread>

namespace core {

/**
 * Clock used by timed workers (voice throttle and staleness).
 * Tests substitute a manual clock to step time explicitly.
 */
class TimeSource {
public:
    using Clock = std::chrono::steady_clock;

    virtual ~TimeSource() = default;

    virtual Clock::time_point now() const = 0;

    /**
     * Block the calling thread until now() >= deadline
     */
    virtual void sleepUntil(Clock::time_point deadline) = 0;
};

class SteadyTimeSource : public TimeSource {
public:
    Clock::time_point now() const override { return Clock::now(); }
    void sleepUntil(Clock::time_point deadline) override { std::this_thread::sleep_until(deadline); }
};

} // namespace core
