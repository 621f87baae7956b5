#include "RatePacer.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <thread>

namespace {

double clampInterval(double seconds) {
    if (!(seconds > 0)) {
        return 0;
    }
    return std::min(seconds, RatePacer::MaxIntervalSeconds);
}

}  // namespace

RatePacer::RatePacer(double intervalSeconds)
    : _intervalSeconds(clampInterval(intervalSeconds)),
      _interval(std::chrono::duration_cast<Clock::duration>(
          std::chrono::duration<double>(_intervalSeconds))) {}

void RatePacer::awaitTurn() {
    if (!enabled()) {
        return;
    }
    std::unique_lock<std::mutex> lock(_mutex);
    while (_started) {
        auto ready = _last + _interval;
        auto now = Clock::now();
        if (now >= ready) {
            break;
        }
        spdlog::debug("Pacing: waiting {}ms",
                      std::chrono::duration_cast<std::chrono::milliseconds>(ready - now).count());
        // Another caller may take the turn or a completion may move the stamp; recheck after
        lock.unlock();
        std::this_thread::sleep_until(ready);
        lock.lock();
    }
    _last = Clock::now();
    _started = true;
}

void RatePacer::recordCompletion() {
    if (!enabled()) {
        return;
    }
    std::lock_guard<std::mutex> lock(_mutex);
    _last = std::max(_last, Clock::now());
    _started = true;
}
