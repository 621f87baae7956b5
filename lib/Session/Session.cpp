#include "Session.hpp"

Session::Session(Settings settings) : Session(std::move(settings), nullptr) {}

Session::Session(Settings settings, std::unique_ptr<HttpTransport> transport,
                 ConnectionPool::Sleeper sleeper)
    : _settings(std::move(settings)),
      _pacer(_settings.requestRateLimit),
      _transport(std::move(transport)),
      _sleeper(std::move(sleeper)) {}

ConnectionPool& Session::pool() {
    std::call_once(_poolOnce, [this] {
        PoolConfig config;
        config.maxHosts = _settings.poolMaxHosts;
        config.maxPerHost = _settings.poolMaxPerHost;

        RetryPolicy policy;
        policy.maxRetries = _settings.requestMaxRetries;
        policy.backoffFactor = _settings.backoffFactor;

        _pool = std::make_unique<ConnectionPool>(config, std::move(policy), std::move(_transport),
                                                 std::move(_sleeper));
    });
    return *_pool;
}
