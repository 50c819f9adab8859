/**
 * @file RetryPolicyTest.cpp
 * @brief Unit tests for RetryPolicy
 */

#include <gtest/gtest.h>
#include "resilience/RetryPolicy.hpp"
#include "resilience/CircuitBreaker.hpp"
#include "../mocks/ManualClock.hpp"

using namespace matchmaking;
using namespace matchmaking::resilience;
using namespace matchmaking::tests;
using namespace std::chrono_literals;

class RetryPolicyTest : public ::testing::Test {
protected:
    ManualClock clock_;
    RetryPolicy retry_{RetryConfig{}, clock_.sleeper()};
};

TEST_F(RetryPolicyTest, Backoff_ExponentialWithCap) {
    EXPECT_EQ(retry_.backoffFor(1), 1000ms);
    EXPECT_EQ(retry_.backoffFor(2), 2000ms);
    EXPECT_EQ(retry_.backoffFor(3), 4000ms);
    EXPECT_EQ(retry_.backoffFor(4), 8000ms);
    EXPECT_EQ(retry_.backoffFor(5), 10000ms);
    EXPECT_EQ(retry_.backoffFor(20), 10000ms);
}

TEST_F(RetryPolicyTest, SuccessFirstTime_NoSleep) {
    int calls = 0;
    int result = retry_.execute([&calls]() { ++calls; return 5; });

    EXPECT_EQ(result, 5);
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(clock_.sleeps().empty());
}

TEST_F(RetryPolicyTest, TwoTransientFailures_ThenSuccess_InvokedThreeTimes) {
    int calls = 0;
    int result = retry_.execute([&calls]() {
        ++calls;
        if (calls < 3) {
            throw domain::TransientDependencyError("catalog", "HTTP 503");
        }
        return 9;
    });

    EXPECT_EQ(result, 9);
    EXPECT_EQ(calls, 3);

    auto sleeps = clock_.sleeps();
    ASSERT_EQ(sleeps.size(), 2u);
    EXPECT_EQ(sleeps[0], 1000ms);
    EXPECT_EQ(sleeps[1], 2000ms);
}

TEST_F(RetryPolicyTest, ExhaustedAttempts_RethrowsLastError) {
    int calls = 0;
    EXPECT_THROW(retry_.execute([&calls]() -> int {
        ++calls;
        throw domain::TransientDependencyError("catalog", "timeout");
    }), domain::TransientDependencyError);

    EXPECT_EQ(calls, 3);
    EXPECT_EQ(clock_.sleeps().size(), 2u);
}

TEST_F(RetryPolicyTest, NonRetryableError_InvokedOnce) {
    int calls = 0;
    EXPECT_THROW(retry_.execute([&calls]() {
        ++calls;
        throw domain::PermanentDependencyError("catalog", "HTTP 400");
    }), domain::PermanentDependencyError);

    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(clock_.sleeps().empty());
}

TEST_F(RetryPolicyTest, CircuitOpen_NeverRetried_EvenIfPredicateSaysYes) {
    int calls = 0;
    auto retryEverything = [](const std::exception&) { return true; };

    EXPECT_THROW(retry_.execute([&calls]() {
        ++calls;
        throw domain::CircuitOpenError("catalog");
    }, retryEverything), domain::CircuitOpenError);

    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(clock_.sleeps().empty());
}

TEST_F(RetryPolicyTest, CustomPredicate) {
    int calls = 0;
    auto retryRuntime = [](const std::exception& e) {
        return dynamic_cast<const std::runtime_error*>(&e) != nullptr;
    };

    EXPECT_THROW(retry_.execute([&calls]() {
        ++calls;
        throw std::runtime_error("flaky");
    }, retryRuntime), std::runtime_error);

    EXPECT_EQ(calls, 3);
}

TEST_F(RetryPolicyTest, RetryAroundBreaker_TripMidOperation_ShortCircuitsRemainingAttempts) {
    CircuitBreakerConfig config;
    config.failureThreshold = 2;
    CircuitBreaker breaker("notification", config, clock_.clock());

    int invocations = 0;
    EXPECT_THROW(retry_.execute([&]() {
        return breaker.call([&]() -> int {
            ++invocations;
            throw domain::TransientDependencyError("notification", "HTTP 503");
        });
    }), domain::CircuitOpenError);

    // Попытки 1 и 2 дошли до операции и открыли breaker, третья отклонена им
    EXPECT_EQ(invocations, 2);
    EXPECT_EQ(breaker.state(), CircuitState::OPEN);
}
