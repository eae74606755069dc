#include <gtest/gtest.h>

#include <chrono>

#include "src/rpc/client/curl_easy.hpp"
#include "src/rpc/model/model.hpp"

using namespace wttp::rpc;
using namespace std::chrono;

TEST(CurlEasyRetryTest, RetryableStatuses) {
    EXPECT_TRUE(client::CurlEasy::is_retryable_http(429));
    EXPECT_TRUE(client::CurlEasy::is_retryable_http(502));
    EXPECT_TRUE(client::CurlEasy::is_retryable_http(503));
    EXPECT_TRUE(client::CurlEasy::is_retryable_http(504));
    EXPECT_FALSE(client::CurlEasy::is_retryable_http(200));
    EXPECT_FALSE(client::CurlEasy::is_retryable_http(400));
    EXPECT_FALSE(client::CurlEasy::is_retryable_http(500));
}

TEST(CurlEasyRetryTest, RetryAfterIsHonouredAndCapped) {
    model::RetryPolicy policy;
    model::Response resp;
    resp.status_ = 429;

    resp.retry_after_ = "1";
    EXPECT_EQ(client::CurlEasy::retry_after_delay(resp, policy).value_or(milliseconds{0}), milliseconds{1000});

    resp.retry_after_ = "60";
    EXPECT_EQ(client::CurlEasy::retry_after_delay(resp, policy).value_or(milliseconds{0}), policy.max_delay_);
}

TEST(CurlEasyRetryTest, RetryAfterIgnoredWhenUnusable) {
    model::RetryPolicy policy;
    model::Response resp;
    resp.status_ = 429;

    EXPECT_FALSE(client::CurlEasy::retry_after_delay(resp, policy).has_value());
    resp.retry_after_ = "soon";
    EXPECT_FALSE(client::CurlEasy::retry_after_delay(resp, policy).has_value());
    resp.retry_after_ = "0";
    EXPECT_FALSE(client::CurlEasy::retry_after_delay(resp, policy).has_value());

    resp.status_ = 503;
    resp.retry_after_ = "1";
    EXPECT_FALSE(client::CurlEasy::retry_after_delay(resp, policy).has_value());
}

TEST(CurlEasyRetryTest, BackoffDoublesUpToTheCap) {
    model::RetryPolicy policy{.max_tries_ = 3, .base_delay_ = milliseconds{1}, .max_delay_ = milliseconds{3}};

    EXPECT_EQ(client::CurlEasy::backoff(policy, milliseconds{1}), milliseconds{2});
    EXPECT_EQ(client::CurlEasy::backoff(policy, milliseconds{2}), milliseconds{3});
}
