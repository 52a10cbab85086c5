#pragma once

#include <atomic>
#include <chrono>
#include <memory>

namespace netmap {

using Duration = std::chrono::milliseconds;
using TimePoint = std::chrono::time_point<std::chrono::system_clock, Duration>;

/**
 * @brief Time source used by the cache and computation budgets
 *
 * Production code uses SystemClock; tests drive a ManualClock so TTL
 * expiry can be checked without sleeping.
 */
class Clock {
public:
    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
};

class SystemClock : public Clock {
public:
    TimePoint now() const override {
        return std::chrono::time_point_cast<Duration>(std::chrono::system_clock::now());
    }
};

class ManualClock : public Clock {
public:
    explicit ManualClock(TimePoint start = TimePoint(Duration(0))) : now_ms_(start.time_since_epoch().count()) {}

    TimePoint now() const override { return TimePoint(Duration(now_ms_.load())); }

    void advance(Duration d) { now_ms_ += d.count(); }
    void set(TimePoint t) { now_ms_ = t.time_since_epoch().count(); }

private:
    std::atomic<long long> now_ms_;
};

inline std::shared_ptr<Clock> default_clock() {
    static std::shared_ptr<Clock> clock = std::make_shared<SystemClock>();
    return clock;
}

/**
 * @brief Wall-clock deadline for a recomputation
 *
 * Engines poll expired() between iterations. A default-constructed budget
 * never expires. The budget always reads the real steady clock: manual
 * clocks only drive TTL bookkeeping.
 */
class Budget {
public:
    Budget() = default;

    static Budget unlimited() { return Budget(); }

    static Budget from_now(Duration limit) {
        Budget b;
        b.limited_ = true;
        b.deadline_ = std::chrono::steady_clock::now() + limit;
        return b;
    }

    /**
     * @brief Budget of `ms` milliseconds; zero or less never expires
     */
    static Budget from_millis(long long ms) {
        return ms > 0 ? from_now(Duration(ms)) : unlimited();
    }

    bool limited() const { return limited_; }

    bool expired() const {
        return limited_ && std::chrono::steady_clock::now() >= deadline_;
    }

private:
    bool limited_ = false;
    std::chrono::steady_clock::time_point deadline_{};
};

inline long long to_epoch_seconds(TimePoint t) {
    return std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count();
}

inline TimePoint from_epoch_seconds(long long s) {
    return TimePoint(std::chrono::duration_cast<Duration>(std::chrono::seconds(s)));
}

inline long long to_epoch_millis(TimePoint t) {
    return t.time_since_epoch().count();
}

inline TimePoint from_epoch_millis(long long ms) {
    return TimePoint(Duration(ms));
}

} // namespace netmap
