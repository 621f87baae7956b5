#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include <curl/curl.h>

#include "HttpTransport.hpp"

struct PoolConfig {
    // Hosts with idle handles kept; the least recently used host is dropped beyond this
    size_t maxHosts = 10;
    // Idle handles kept for any one host
    size_t maxPerHost = 20;
};

struct RetryPolicy {
    int maxRetries = 2;
    double backoffFactor = 1.0;
    std::set<int> retryableStatuses{429, 500, 502, 503, 504};
    std::set<std::string> retryableMethods{"HEAD", "GET", "OPTIONS"};
    std::chrono::seconds maxBackoff{120};

    bool isRetryableMethod(const std::string& method) const;

    bool shouldRetryStatus(const std::string& method, int status) const;

    bool shouldRetryFailure(const std::string& method, const TransportFailure& failure) const;

    // Wait before the n-th retry (n >= 1): backoffFactor * 2^(n-1), capped.
    std::chrono::milliseconds backoff(int retry) const;

    // Backoff for a retry triggered by response, honoring Retry-After on 429/503.
    std::chrono::milliseconds backoff(int retry, const HttpResponse& response) const;
};

class ConnectionPool;

// Move-only owner of a curl easy handle; returns it to the pool when destroyed.
class PooledHandle {
   public:
    PooledHandle() = default;
    PooledHandle(ConnectionPool* pool, std::string hostKey, CURL* handle);
    ~PooledHandle();

    PooledHandle(PooledHandle&& other) noexcept;
    PooledHandle& operator=(PooledHandle&& other) noexcept;
    PooledHandle(const PooledHandle&) = delete;
    PooledHandle& operator=(const PooledHandle&) = delete;

    CURL* get() const { return _handle; }
    explicit operator bool() const { return _handle != nullptr; }

   private:
    void reset();

    ConnectionPool* _pool = nullptr;
    std::string _hostKey;
    CURL* _handle = nullptr;
};

class ConnectionPool {
   public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    // A null transport selects CurlTransport; a null sleeper sleeps the calling thread.
    ConnectionPool(PoolConfig config, RetryPolicy policy,
                   std::unique_ptr<HttpTransport> transport = nullptr,
                   Sleeper sleeper = nullptr);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    // Reuses an idle handle for the url's host or creates a new one. Never blocks.
    PooledHandle acquire(const std::string& url);

    // Sends the request, retrying per the policy. Returns the final outcome.
    TransportResult send(const HttpRequest& request);

    const PoolConfig& config() const { return _config; }
    const RetryPolicy& retryPolicy() const { return _policy; }

    size_t idleCount() const;
    size_t idleCount(const std::string& url) const;
    size_t hostCount() const;

    // scheme://host[:port] of a url, lowercased
    static std::string hostKey(const std::string& url);

   private:
    friend class PooledHandle;

    struct HostHandles {
        std::vector<CURL*> idle;
        uint64_t lastUsed = 0;
    };

    void release(const std::string& hostKey, CURL* handle);
    void evictLeastRecentHost();

    PoolConfig _config;
    RetryPolicy _policy;
    std::unique_ptr<HttpTransport> _transport;
    Sleeper _sleeper;

    mutable std::mutex _mutex;
    std::map<std::string, HostHandles> _hosts;
    size_t _idleTotal = 0;
    uint64_t _useClock = 0;
};
