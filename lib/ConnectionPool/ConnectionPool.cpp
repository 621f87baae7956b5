#include "ConnectionPool.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <thread>

bool RetryPolicy::isRetryableMethod(const std::string& method) const {
    std::string upper = method;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return retryableMethods.count(upper) > 0;
}

bool RetryPolicy::shouldRetryStatus(const std::string& method, int status) const {
    return isRetryableMethod(method) && retryableStatuses.count(status) > 0;
}

bool RetryPolicy::shouldRetryFailure(const std::string& method,
                                     const TransportFailure& failure) const {
    return isRetryableMethod(method) && failure.kind == FailureKind::ConnectionFailure &&
           failure.dropped;
}

std::chrono::milliseconds RetryPolicy::backoff(int retry) const {
    if (retry < 1 || backoffFactor <= 0) {
        return std::chrono::milliseconds(0);
    }
    double seconds = backoffFactor * std::pow(2.0, retry - 1);
    double cap = static_cast<double>(maxBackoff.count());
    seconds = std::min(seconds, cap);
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

std::chrono::milliseconds RetryPolicy::backoff(int retry, const HttpResponse& response) const {
    if ((response.status == 429 || response.status == 503) && response.retryAfter) {
        auto wait = std::min(*response.retryAfter, maxBackoff);
        return std::chrono::duration_cast<std::chrono::milliseconds>(wait);
    }
    return backoff(retry);
}

PooledHandle::PooledHandle(ConnectionPool* pool, std::string hostKey, CURL* handle)
    : _pool(pool), _hostKey(std::move(hostKey)), _handle(handle) {}

PooledHandle::~PooledHandle() {
    reset();
}

PooledHandle::PooledHandle(PooledHandle&& other) noexcept
    : _pool(other._pool), _hostKey(std::move(other._hostKey)), _handle(other._handle) {
    other._pool = nullptr;
    other._handle = nullptr;
}

PooledHandle& PooledHandle::operator=(PooledHandle&& other) noexcept {
    if (this != &other) {
        reset();
        _pool = other._pool;
        _hostKey = std::move(other._hostKey);
        _handle = other._handle;
        other._pool = nullptr;
        other._handle = nullptr;
    }
    return *this;
}

void PooledHandle::reset() {
    if (_handle) {
        if (_pool) {
            _pool->release(_hostKey, _handle);
        } else {
            curl_easy_cleanup(_handle);
        }
    }
    _pool = nullptr;
    _handle = nullptr;
}

ConnectionPool::ConnectionPool(PoolConfig config, RetryPolicy policy,
                               std::unique_ptr<HttpTransport> transport, Sleeper sleeper)
    : _config(config),
      _policy(std::move(policy)),
      _transport(std::move(transport)),
      _sleeper(std::move(sleeper)) {
    if (!_transport) {
        _transport = std::make_unique<CurlTransport>();
    }
    if (!_sleeper) {
        _sleeper = [](std::chrono::milliseconds wait) { std::this_thread::sleep_for(wait); };
    }
    spdlog::debug("Connection pool created: {} hosts, {} per host, {} retries",
                  _config.maxHosts, _config.maxPerHost, _policy.maxRetries);
}

ConnectionPool::~ConnectionPool() {
    std::lock_guard<std::mutex> lock(_mutex);
    for (auto& [host, entry] : _hosts) {
        for (CURL* handle : entry.idle) {
            curl_easy_cleanup(handle);
        }
    }
    _hosts.clear();
    _idleTotal = 0;
}

std::string ConnectionPool::hostKey(const std::string& url) {
    size_t schemeEnd = url.find("://");
    size_t hostStart = schemeEnd == std::string::npos ? 0 : schemeEnd + 3;
    size_t hostEnd = url.find_first_of("/?#", hostStart);
    std::string key = url.substr(0, hostEnd == std::string::npos ? url.size() : hostEnd);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return key;
}

PooledHandle ConnectionPool::acquire(const std::string& url) {
    std::string key = hostKey(url);
    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _hosts.find(key);
        if (it != _hosts.end()) {
            it->second.lastUsed = ++_useClock;
            if (!it->second.idle.empty()) {
                CURL* handle = it->second.idle.back();
                it->second.idle.pop_back();
                --_idleTotal;
                // Reset options but keep the connection cache alive
                curl_easy_reset(handle);
                return PooledHandle(this, key, handle);
            }
        }
    }
    CURL* handle = curl_easy_init();
    if (!handle) {
        spdlog::error("curl_easy_init failed for {}", key);
        return PooledHandle();
    }
    return PooledHandle(this, key, handle);
}

void ConnectionPool::release(const std::string& hostKey, CURL* handle) {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _hosts.find(hostKey);
    if (it == _hosts.end()) {
        if (_config.maxHosts == 0 || _config.maxPerHost == 0) {
            curl_easy_cleanup(handle);
            return;
        }
        if (_hosts.size() >= _config.maxHosts) {
            evictLeastRecentHost();
        }
        it = _hosts.emplace(hostKey, HostHandles{}).first;
    }
    it->second.lastUsed = ++_useClock;
    if (it->second.idle.size() >= _config.maxPerHost) {
        curl_easy_cleanup(handle);
        return;
    }
    it->second.idle.push_back(handle);
    ++_idleTotal;
}

// Caller holds _mutex
void ConnectionPool::evictLeastRecentHost() {
    auto oldest = _hosts.begin();
    for (auto it = _hosts.begin(); it != _hosts.end(); ++it) {
        if (it->second.lastUsed < oldest->second.lastUsed) {
            oldest = it;
        }
    }
    if (oldest == _hosts.end()) {
        return;
    }
    spdlog::debug("Dropping {} idle handles for {}", oldest->second.idle.size(), oldest->first);
    for (CURL* handle : oldest->second.idle) {
        curl_easy_cleanup(handle);
    }
    _idleTotal -= oldest->second.idle.size();
    _hosts.erase(oldest);
}

size_t ConnectionPool::idleCount() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _idleTotal;
}

size_t ConnectionPool::idleCount(const std::string& url) const {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _hosts.find(hostKey(url));
    return it == _hosts.end() ? 0 : it->second.idle.size();
}

size_t ConnectionPool::hostCount() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _hosts.size();
}

TransportResult ConnectionPool::send(const HttpRequest& request) {
    int retry = 0;
    while (true) {
        TransportResult result = _transport->perform(*this, request);
        if (retry >= _policy.maxRetries) {
            return result;
        }

        std::chrono::milliseconds wait{0};
        if (result.ok()) {
            if (!_policy.shouldRetryStatus(request.method, result.response->status)) {
                return result;
            }
            wait = _policy.backoff(retry + 1, *result.response);
            spdlog::warn("Retry {}/{} for {} after status {} (waiting {}ms)", retry + 1,
                         _policy.maxRetries, request.url, result.response->status, wait.count());
        } else {
            if (!_policy.shouldRetryFailure(request.method, *result.failure)) {
                return result;
            }
            wait = _policy.backoff(retry + 1);
            spdlog::warn("Retry {}/{} for {} after {} (waiting {}ms)", retry + 1,
                         _policy.maxRetries, request.url, result.failure->message, wait.count());
        }

        ++retry;
        if (wait.count() > 0) {
            _sleeper(wait);
        }
    }
}
