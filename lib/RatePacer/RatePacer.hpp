#pragma once

#include <chrono>
#include <mutex>

// Process-wide minimum spacing between outbound requests.
//
// The stamp is taken when a caller leaves awaitTurn() and moved forward again by
// recordCompletion() once that request has finished. Checking and stamping
// happen under one lock, so no two callers can leave within interval() of each
// other. Waiters are not served in FIFO order.
class RatePacer {
   public:
    using Clock = std::chrono::steady_clock;

    // Longer intervals are clamped to this
    static constexpr double MaxIntervalSeconds = 24 * 60 * 60;

    // interval <= 0 (or NaN) disables pacing
    explicit RatePacer(double intervalSeconds);

    void awaitTurn();

    void recordCompletion();

    double interval() const { return _intervalSeconds; }
    bool enabled() const { return _intervalSeconds > 0; }

   private:
    const double _intervalSeconds;
    const Clock::duration _interval;

    std::mutex _mutex;
    Clock::time_point _last;
    bool _started = false;
};
