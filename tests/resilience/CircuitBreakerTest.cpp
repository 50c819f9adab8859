/**
 * @file CircuitBreakerTest.cpp
 * @brief Unit tests for CircuitBreaker
 */

#include <gtest/gtest.h>
#include "resilience/CircuitBreaker.hpp"
#include "../mocks/ManualClock.hpp"
#include <atomic>
#include <future>
#include <thread>
#include <vector>

using namespace matchmaking;
using namespace matchmaking::resilience;
using namespace matchmaking::tests;
using namespace std::chrono_literals;

class CircuitBreakerTest : public ::testing::Test {
protected:
    void SetUp() override {
        CircuitBreakerConfig config;
        config.failureThreshold = 5;
        config.resetTimeout = 60s;
        breaker_ = std::make_unique<CircuitBreaker>("catalog", config, clock_.clock());
    }

    void failOnce() {
        EXPECT_THROW(breaker_->call([]() -> int {
            throw domain::TransientDependencyError("catalog", "HTTP 503");
        }), domain::TransientDependencyError);
    }

    void tripOpen() {
        for (int i = 0; i < 5; ++i) {
            failOnce();
        }
        ASSERT_EQ(breaker_->state(), CircuitState::OPEN);
    }

    ManualClock clock_;
    std::unique_ptr<CircuitBreaker> breaker_;
};

// ============================================================================
// CLOSED
// ============================================================================

TEST_F(CircuitBreakerTest, Closed_SuccessReturnsValue) {
    int result = breaker_->call([]() { return 42; });

    EXPECT_EQ(result, 42);
    EXPECT_EQ(breaker_->state(), CircuitState::CLOSED);
}

TEST_F(CircuitBreakerTest, Closed_VoidOperation) {
    bool invoked = false;
    breaker_->call([&invoked]() { invoked = true; });

    EXPECT_TRUE(invoked);
}

TEST_F(CircuitBreakerTest, Closed_FailuresBelowThreshold_StayClosed) {
    for (int i = 0; i < 4; ++i) {
        failOnce();
    }

    auto health = breaker_->health();
    EXPECT_EQ(health.state, CircuitState::CLOSED);
    EXPECT_EQ(health.consecutiveFailures, 4);
    EXPECT_FALSE(health.openedAt.has_value());
}

TEST_F(CircuitBreakerTest, Closed_SuccessResetsCounter) {
    for (int i = 0; i < 4; ++i) {
        failOnce();
    }
    breaker_->call([]() { return 1; });

    EXPECT_EQ(breaker_->health().consecutiveFailures, 0);

    // Счётчик начался заново: ещё 4 ошибки не открывают
    for (int i = 0; i < 4; ++i) {
        failOnce();
    }
    EXPECT_EQ(breaker_->state(), CircuitState::CLOSED);
}

TEST_F(CircuitBreakerTest, FiveConsecutiveFailures_Opens) {
    tripOpen();

    auto health = breaker_->health();
    EXPECT_EQ(health.consecutiveFailures, 5);
    ASSERT_TRUE(health.openedAt.has_value());
    EXPECT_EQ(*health.openedAt, clock_.now());
}

TEST_F(CircuitBreakerTest, AnyExceptionCountsAsFailure) {
    for (int i = 0; i < 5; ++i) {
        EXPECT_THROW(breaker_->call([]() -> int { throw std::runtime_error("boom"); }), std::runtime_error);
    }

    EXPECT_EQ(breaker_->state(), CircuitState::OPEN);
}

// ============================================================================
// OPEN
// ============================================================================

TEST_F(CircuitBreakerTest, Open_RejectsWithoutInvoking) {
    tripOpen();

    int invocations = 0;
    for (int i = 0; i < 10; ++i) {
        EXPECT_THROW(breaker_->call([&invocations]() { ++invocations; }), domain::CircuitOpenError);
    }

    EXPECT_EQ(invocations, 0);
}

TEST_F(CircuitBreakerTest, Open_BeforeTimeout_StillRejects) {
    tripOpen();
    clock_.advance(60s);  // ровно timeout - ещё не "больше"

    int invocations = 0;
    EXPECT_THROW(breaker_->call([&invocations]() { ++invocations; }), domain::CircuitOpenError);
    EXPECT_EQ(invocations, 0);
    EXPECT_EQ(breaker_->state(), CircuitState::OPEN);
}

// ============================================================================
// HALF_OPEN
// ============================================================================

TEST_F(CircuitBreakerTest, AfterTimeout_CallBecomesProbe_SuccessCloses) {
    tripOpen();
    clock_.advance(61s);

    int result = breaker_->call([]() { return 7; });

    EXPECT_EQ(result, 7);
    auto health = breaker_->health();
    EXPECT_EQ(health.state, CircuitState::CLOSED);
    EXPECT_EQ(health.consecutiveFailures, 0);
    EXPECT_FALSE(health.probeInFlight);
}

TEST_F(CircuitBreakerTest, ProbeFailure_Reopens_WithNewOpenedAt) {
    tripOpen();
    clock_.advance(61s);
    auto probeTime = clock_.now();

    failOnce();

    auto health = breaker_->health();
    EXPECT_EQ(health.state, CircuitState::OPEN);
    ASSERT_TRUE(health.openedAt.has_value());
    EXPECT_EQ(*health.openedAt, probeTime);

    // Новый отсчёт: через 30s всё ещё OPEN
    clock_.advance(30s);
    EXPECT_THROW(breaker_->call([]() {}), domain::CircuitOpenError);
}

TEST_F(CircuitBreakerTest, HalfOpen_OnlyOneProbeInFlight) {
    tripOpen();
    clock_.advance(61s);

    std::promise<void> probeStarted;
    std::promise<void> releaseProbe;
    auto release = releaseProbe.get_future().share();

    auto probe = std::async(std::launch::async, [&]() {
        return breaker_->call([&]() {
            probeStarted.set_value();
            release.wait();
            return 1;
        });
    });

    probeStarted.get_future().wait();
    EXPECT_EQ(breaker_->state(), CircuitState::HALF_OPEN);
    EXPECT_TRUE(breaker_->health().probeInFlight);

    // Второй вызов во время пробы отклоняется так же, как в OPEN
    int invocations = 0;
    EXPECT_THROW(breaker_->call([&invocations]() { ++invocations; }), domain::CircuitOpenError);
    EXPECT_EQ(invocations, 0);

    releaseProbe.set_value();
    EXPECT_EQ(probe.get(), 1);
    EXPECT_EQ(breaker_->state(), CircuitState::CLOSED);
}

TEST_F(CircuitBreakerTest, ConcurrentCallsAfterTimeout_ExactlyOneProbe) {
    tripOpen();
    clock_.advance(61s);

    std::atomic<int> invocations{0};
    std::atomic<int> rejected{0};
    std::promise<void> go;
    auto start = go.get_future().share();
    std::promise<void> releaseProbe;
    auto release = releaseProbe.get_future().share();

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            start.wait();
            try {
                breaker_->call([&]() {
                    ++invocations;
                    release.wait();
                });
            } catch (const domain::CircuitOpenError&) {
                ++rejected;
            }
        });
    }

    go.set_value();
    // Ждём, пока все, кроме пробы, получат отказ
    while (rejected.load() < 7) {
        std::this_thread::yield();
    }
    releaseProbe.set_value();

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(invocations.load(), 1);
    EXPECT_EQ(rejected.load(), 7);
    EXPECT_EQ(breaker_->state(), CircuitState::CLOSED);
}

// ============================================================================
// CALLBACKS
// ============================================================================

TEST_F(CircuitBreakerTest, StateChangeCallback_ReportsTransitions) {
    std::vector<std::pair<CircuitState, CircuitState>> transitions;
    breaker_->onStateChange([&transitions](const std::string& name, CircuitState from, CircuitState to) {
        EXPECT_EQ(name, "catalog");
        transitions.emplace_back(from, to);
    });

    tripOpen();
    clock_.advance(61s);
    breaker_->call([]() {});

    ASSERT_EQ(transitions.size(), 3u);
    EXPECT_EQ(transitions[0], std::make_pair(CircuitState::CLOSED, CircuitState::OPEN));
    EXPECT_EQ(transitions[1], std::make_pair(CircuitState::OPEN, CircuitState::HALF_OPEN));
    EXPECT_EQ(transitions[2], std::make_pair(CircuitState::HALF_OPEN, CircuitState::CLOSED));
}

TEST(CircuitStateTest, ToString) {
    EXPECT_EQ(toString(CircuitState::CLOSED), "CLOSED");
    EXPECT_EQ(toString(CircuitState::OPEN), "OPEN");
    EXPECT_EQ(toString(CircuitState::HALF_OPEN), "HALF_OPEN");
}
