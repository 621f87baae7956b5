#pragma once

#include <algorithm>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "ConnectionPool.hpp"
#include "HttpTransport.hpp"

// Replays canned outcomes in order; the last one repeats once the script runs out.
class ScriptedTransport : public HttpTransport {
   public:
    explicit ScriptedTransport(std::vector<TransportResult> script) : _script(std::move(script)) {}

    TransportResult perform(ConnectionPool&, const HttpRequest& request) override {
        std::lock_guard<std::mutex> lock(_mutex);
        _requests.push_back(request);
        if (onPerform) {
            onPerform(request);
        }
        size_t index = std::min(_requests.size() - 1, _script.size() - 1);
        return _script[index];
    }

    int calls() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return static_cast<int>(_requests.size());
    }

    HttpRequest lastRequest() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _requests.back();
    }

    // Runs inside perform(), e.g. to throw
    std::function<void(const HttpRequest&)> onPerform;

   private:
    std::vector<TransportResult> _script;
    mutable std::mutex _mutex;
    std::vector<HttpRequest> _requests;
};

inline TransportResult respond(int status, std::string body = "") {
    HttpResponse response;
    response.status = status;
    response.reason = reasonPhrase(status);
    response.body = std::move(body);
    return TransportResult::completed(std::move(response));
}

inline TransportResult respondRetryAfter(int status, std::chrono::seconds retryAfter) {
    TransportResult result = respond(status);
    result.response->retryAfter = retryAfter;
    return result;
}

// Records requested waits instead of sleeping.
struct SleepRecorder {
    std::vector<std::chrono::milliseconds> waits;

    ConnectionPool::Sleeper sleeper() {
        return [this](std::chrono::milliseconds wait) { waits.push_back(wait); };
    }
};

inline double secondsBetween(std::chrono::steady_clock::time_point from,
                             std::chrono::steady_clock::time_point to) {
    return std::chrono::duration<double>(to - from).count();
}
