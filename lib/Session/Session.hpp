#pragma once

#include <memory>
#include <mutex>

#include "ConnectionPool.hpp"
#include "RatePacer.hpp"
#include "Settings.hpp"

// Shared state for every fetch in the process: settings, the pacer, and the
// connection pool. Construct one at startup and pass it by reference.
class Session {
   public:
    explicit Session(Settings settings);

    // Test hook: the pool is built with this transport and sleeper instead of curl.
    Session(Settings settings, std::unique_ptr<HttpTransport> transport,
            ConnectionPool::Sleeper sleeper = nullptr);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const Settings& settings() const { return _settings; }

    RatePacer& pacer() { return _pacer; }

    // Created on first use; the same instance for the session's lifetime.
    ConnectionPool& pool();

   private:
    const Settings _settings;
    RatePacer _pacer;

    std::once_flag _poolOnce;
    std::unique_ptr<ConnectionPool> _pool;
    std::unique_ptr<HttpTransport> _transport;
    ConnectionPool::Sleeper _sleeper;
};
