#include <gtest/gtest.h>

#include "ConnectionPool.hpp"

using std::chrono::milliseconds;
using std::chrono::seconds;

TEST(RetryPolicyTest, RetriesOnlyTransientStatuses) {
    RetryPolicy policy;
    for (int status : {429, 500, 502, 503, 504}) {
        EXPECT_TRUE(policy.shouldRetryStatus("GET", status)) << status;
    }
    for (int status : {200, 301, 400, 401, 403, 404, 501, 505}) {
        EXPECT_FALSE(policy.shouldRetryStatus("GET", status)) << status;
    }
}

TEST(RetryPolicyTest, RetriesOnlySafeMethods) {
    RetryPolicy policy;
    EXPECT_TRUE(policy.shouldRetryStatus("GET", 503));
    EXPECT_TRUE(policy.shouldRetryStatus("HEAD", 503));
    EXPECT_TRUE(policy.shouldRetryStatus("OPTIONS", 503));
    EXPECT_TRUE(policy.shouldRetryStatus("get", 503));
    for (const char* method : {"POST", "PUT", "PATCH", "DELETE"}) {
        EXPECT_FALSE(policy.shouldRetryStatus(method, 503)) << method;
    }
}

TEST(RetryPolicyTest, RetriesDroppedConnectionsOnly) {
    RetryPolicy policy;
    TransportFailure dropped{FailureKind::ConnectionFailure, "Recv failure", true};
    TransportFailure refused{FailureKind::ConnectionFailure, "Connection refused", false};
    TransportFailure timeout{FailureKind::Timeout, "Operation timed out", false};
    TransportFailure redirects{FailureKind::TooManyRedirects, "Maximum redirects followed", false};

    EXPECT_TRUE(policy.shouldRetryFailure("GET", dropped));
    EXPECT_FALSE(policy.shouldRetryFailure("POST", dropped));
    EXPECT_FALSE(policy.shouldRetryFailure("GET", refused));
    EXPECT_FALSE(policy.shouldRetryFailure("GET", timeout));
    EXPECT_FALSE(policy.shouldRetryFailure("GET", redirects));
}

TEST(RetryPolicyTest, BackoffDoublesPerRetry) {
    RetryPolicy policy;
    EXPECT_EQ(policy.backoff(1), milliseconds(1000));
    EXPECT_EQ(policy.backoff(2), milliseconds(2000));
    EXPECT_EQ(policy.backoff(3), milliseconds(4000));

    policy.backoffFactor = 0.5;
    EXPECT_EQ(policy.backoff(1), milliseconds(500));
    EXPECT_EQ(policy.backoff(2), milliseconds(1000));
}

TEST(RetryPolicyTest, BackoffIsCapped) {
    RetryPolicy policy;
    EXPECT_EQ(policy.backoff(10), milliseconds(120000));

    policy.backoffFactor = 0;
    EXPECT_EQ(policy.backoff(3), milliseconds(0));
}

TEST(RetryPolicyTest, RetryAfterReplacesBackoffFor429And503) {
    RetryPolicy policy;
    HttpResponse response;
    response.retryAfter = seconds(7);

    response.status = 503;
    EXPECT_EQ(policy.backoff(1, response), milliseconds(7000));
    response.status = 429;
    EXPECT_EQ(policy.backoff(1, response), milliseconds(7000));
    response.status = 500;
    EXPECT_EQ(policy.backoff(1, response), milliseconds(1000));

    response.status = 503;
    response.retryAfter = seconds(600);
    EXPECT_EQ(policy.backoff(1, response), milliseconds(120000));
}
