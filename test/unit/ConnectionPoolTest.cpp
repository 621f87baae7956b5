#include <gtest/gtest.h>
#include <memory>

#include "ConnectionPool.hpp"
#include "TestUtils.hpp"

using std::chrono::milliseconds;

namespace {

struct PoolFixture {
    ScriptedTransport* transport;
    SleepRecorder sleeps;
    std::unique_ptr<ConnectionPool> pool;

    PoolFixture(std::vector<TransportResult> script, int maxRetries = 2, PoolConfig config = {}) {
        auto scripted = std::make_unique<ScriptedTransport>(std::move(script));
        transport = scripted.get();
        RetryPolicy policy;
        policy.maxRetries = maxRetries;
        pool = std::make_unique<ConnectionPool>(config, policy, std::move(scripted),
                                                sleeps.sleeper());
    }
};

HttpRequest get(const std::string& url) {
    HttpRequest request;
    request.url = url;
    return request;
}

}  // namespace

TEST(ConnectionPoolTest, HostKey) {
    EXPECT_EQ(ConnectionPool::hostKey("https://www.example.com/a/b?c=d"), "https://www.example.com");
    EXPECT_EQ(ConnectionPool::hostKey("HTTP://Example.COM:8080"), "http://example.com:8080");
    EXPECT_EQ(ConnectionPool::hostKey("https://example.com?x=1"), "https://example.com");
}

TEST(ConnectionPoolTest, ReleasedHandleIsReused) {
    PoolFixture f({respond(200)});
    CURL* first = nullptr;
    {
        PooledHandle handle = f.pool->acquire("https://example.com/a");
        ASSERT_TRUE(handle);
        first = handle.get();
        EXPECT_EQ(f.pool->idleCount(), 0u);
    }
    EXPECT_EQ(f.pool->idleCount("https://example.com/other"), 1u);

    PooledHandle again = f.pool->acquire("https://example.com/b");
    EXPECT_EQ(again.get(), first);
    EXPECT_EQ(f.pool->idleCount(), 0u);
}

TEST(ConnectionPoolTest, HandlesAreKeptPerHost) {
    PoolFixture f({respond(200)});
    {
        PooledHandle a = f.pool->acquire("https://a.example.com/");
        PooledHandle b = f.pool->acquire("https://b.example.com/");
    }
    EXPECT_EQ(f.pool->idleCount("https://a.example.com/x"), 1u);
    EXPECT_EQ(f.pool->idleCount("https://b.example.com/y"), 1u);
    EXPECT_EQ(f.pool->idleCount("https://c.example.com/"), 0u);
    EXPECT_EQ(f.pool->idleCount(), 2u);
}

TEST(ConnectionPoolTest, PerHostLimit) {
    PoolConfig config;
    config.maxPerHost = 2;
    PoolFixture f({respond(200)}, 2, config);
    {
        PooledHandle h1 = f.pool->acquire("https://example.com/1");
        PooledHandle h2 = f.pool->acquire("https://example.com/2");
        PooledHandle h3 = f.pool->acquire("https://example.com/3");
        EXPECT_NE(h1.get(), h2.get());
        EXPECT_NE(h2.get(), h3.get());
    }
    EXPECT_EQ(f.pool->idleCount("https://example.com/"), 2u);
}

TEST(ConnectionPoolTest, DefaultLimits) {
    PoolConfig config;
    EXPECT_EQ(config.maxHosts, 10u);
    EXPECT_EQ(config.maxPerHost, 20u);
}

TEST(ConnectionPoolTest, HostLimitDropsLeastRecentlyUsedHost) {
    PoolConfig config;
    config.maxHosts = 2;
    config.maxPerHost = 5;
    PoolFixture f({respond(200)}, 2, config);
    {
        PooledHandle a1 = f.pool->acquire("https://a.example.com/");
        PooledHandle a2 = f.pool->acquire("https://a.example.com/");
    }
    {
        PooledHandle b = f.pool->acquire("https://b.example.com/");
    }
    {
        // a becomes the most recently used host
        PooledHandle a = f.pool->acquire("https://a.example.com/");
    }
    {
        PooledHandle c = f.pool->acquire("https://c.example.com/");
    }
    EXPECT_EQ(f.pool->hostCount(), 2u);
    EXPECT_EQ(f.pool->idleCount("https://a.example.com/"), 2u);
    EXPECT_EQ(f.pool->idleCount("https://b.example.com/"), 0u);
    EXPECT_EQ(f.pool->idleCount("https://c.example.com/"), 1u);
    EXPECT_EQ(f.pool->idleCount(), 3u);
}

TEST(ConnectionPoolTest, MovedHandleReleasesOnce) {
    PoolFixture f({respond(200)});
    {
        PooledHandle handle = f.pool->acquire("https://example.com/");
        PooledHandle moved = std::move(handle);
        EXPECT_FALSE(handle);
        EXPECT_TRUE(moved);
    }
    EXPECT_EQ(f.pool->idleCount(), 1u);
}

TEST(ConnectionPoolTest, ServiceUnavailableExhaustsRetries) {
    PoolFixture f({respond(503), respond(503), respond(503)});
    TransportResult result = f.pool->send(get("https://example.com/"));

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.response->status, 503);
    EXPECT_EQ(f.transport->calls(), 3);
    ASSERT_EQ(f.sleeps.waits.size(), 2u);
    EXPECT_EQ(f.sleeps.waits[0], milliseconds(1000));
    EXPECT_EQ(f.sleeps.waits[1], milliseconds(2000));
}

TEST(ConnectionPoolTest, RecoversAfterTransientStatus) {
    PoolFixture f({respond(502), respond(200, "ok")});
    TransportResult result = f.pool->send(get("https://example.com/"));

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.response->status, 200);
    EXPECT_EQ(result.response->body, "ok");
    EXPECT_EQ(f.transport->calls(), 2);
    EXPECT_EQ(f.sleeps.waits.size(), 1u);
}

TEST(ConnectionPoolTest, NotFoundIsNeverRetried) {
    PoolFixture f({respond(404)});
    TransportResult result = f.pool->send(get("https://example.com/missing"));

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.response->status, 404);
    EXPECT_EQ(f.transport->calls(), 1);
    EXPECT_TRUE(f.sleeps.waits.empty());
}

TEST(ConnectionPoolTest, PostIsNeverRetried) {
    PoolFixture f({respond(503)});
    HttpRequest request = get("https://example.com/");
    request.method = "POST";
    TransportResult result = f.pool->send(request);

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.response->status, 503);
    EXPECT_EQ(f.transport->calls(), 1);
}

TEST(ConnectionPoolTest, ZeroRetriesMeansOneAttempt) {
    PoolFixture f({respond(503)}, 0);
    f.pool->send(get("https://example.com/"));
    EXPECT_EQ(f.transport->calls(), 1);
    EXPECT_TRUE(f.sleeps.waits.empty());
}

TEST(ConnectionPoolTest, RetryAfterIsHonored) {
    PoolFixture f({respondRetryAfter(429, std::chrono::seconds(3)), respond(200)});
    TransportResult result = f.pool->send(get("https://example.com/"));

    EXPECT_EQ(result.response->status, 200);
    ASSERT_EQ(f.sleeps.waits.size(), 1u);
    EXPECT_EQ(f.sleeps.waits[0], milliseconds(3000));
}

TEST(ConnectionPoolTest, DroppedConnectionIsRetried) {
    PoolFixture f({TransportResult::failed(FailureKind::ConnectionFailure, "Recv failure", true),
                   respond(200)});
    TransportResult result = f.pool->send(get("https://example.com/"));

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(f.transport->calls(), 2);
}

TEST(ConnectionPoolTest, RefusedConnectionIsNotRetried) {
    PoolFixture f({TransportResult::failed(FailureKind::ConnectionFailure, "Connection refused")});
    TransportResult result = f.pool->send(get("https://example.com/"));

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.failure->kind, FailureKind::ConnectionFailure);
    EXPECT_EQ(result.failure->message, "Connection refused");
    EXPECT_EQ(f.transport->calls(), 1);
}

TEST(ConnectionPoolTest, TimeoutIsNotRetried) {
    PoolFixture f({TransportResult::failed(FailureKind::Timeout, "Operation timed out")});
    TransportResult result = f.pool->send(get("https://example.com/"));

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.failure->kind, FailureKind::Timeout);
    EXPECT_EQ(f.transport->calls(), 1);
}
