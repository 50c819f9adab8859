/**
 * @file ResilientCallOrchestratorTest.cpp
 * @brief Unit tests for ResilientCallOrchestrator
 *
 * Клиенты подменены фейками, время ручное: ретраи не спят.
 */

#include <gtest/gtest.h>
#include "application/ResilientCallOrchestrator.hpp"
#include "application/MetricsService.hpp"
#include "settings/MetricsSettings.hpp"
#include "mocks/FakeCatalogClient.hpp"
#include "mocks/RecordingNotificationClient.hpp"
#include "mocks/RecordingChatClient.hpp"
#include "mocks/ManualClock.hpp"
#include <future>
#include <mutex>
#include <set>
#include <thread>

using namespace matchmaking;
using namespace matchmaking::application;
using namespace matchmaking::tests;
using namespace std::chrono_literals;

class ResilientCallOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        catalog_ = std::make_shared<FakeCatalogClient>();
        notifications_ = std::make_shared<RecordingNotificationClient>();
        chat_ = std::make_shared<RecordingChatClient>();

        metrics_ = std::make_shared<MetricsService>(std::make_shared<settings::MetricsSettings>());

        resilience::ResilienceConfig config;
        config.callTimeout = 0ms;

        orchestrator_ = std::make_shared<ResilientCallOrchestrator>(
            catalog_, notifications_, chat_, metrics_, config, clock_.clock(), clock_.sleeper());
    }

    domain::Notification makeNotification() {
        domain::Notification n;
        n.recipientId = "alice";
        n.type = "trade_offer_accepted";
        n.title = "Trade Offer Accepted!";
        n.relatedOfferId = 7;
        n.relatedUserId = "bob";
        return n;
    }

    domain::ChatRoomRequest makeChatRoom() {
        domain::ChatRoomRequest r;
        r.offerId = 7;
        r.userAId = "alice";
        r.userBId = "bob";
        return r;
    }

    ManualClock clock_;
    std::shared_ptr<FakeCatalogClient> catalog_;
    std::shared_ptr<RecordingNotificationClient> notifications_;
    std::shared_ptr<RecordingChatClient> chat_;
    std::shared_ptr<MetricsService> metrics_;
    std::shared_ptr<ResilientCallOrchestrator> orchestrator_;
};

// ============================================
// CATALOG
// ============================================

TEST_F(ResilientCallOrchestratorTest, ValidateItems_VerdictPerIdInRequestOrder) {
    catalog_->addItem(3, "bob");
    catalog_->addItem(1, "alice", false);

    auto verdicts = orchestrator_->validateItems({1, 2, 3});

    ASSERT_EQ(verdicts.size(), 3u);
    EXPECT_EQ(verdicts[0].itemId, 1);
    EXPECT_TRUE(verdicts[0].exists);
    EXPECT_FALSE(verdicts[0].isActive);
    EXPECT_EQ(verdicts[1].itemId, 2);
    EXPECT_FALSE(verdicts[1].exists);
    EXPECT_EQ(verdicts[2].itemId, 3);
    EXPECT_EQ(verdicts[2].ownerId, "bob");
    EXPECT_EQ(catalog_->calls(), 1);
}

TEST_F(ResilientCallOrchestratorTest, ValidateItems_TransientFailureRetried) {
    catalog_->addItem(1, "alice");
    catalog_->failNext(2);

    auto verdicts = orchestrator_->validateItems({1});

    ASSERT_EQ(verdicts.size(), 1u);
    EXPECT_TRUE(verdicts[0].exists);
    EXPECT_EQ(catalog_->calls(), 3);
    EXPECT_EQ(clock_.sleeps(), (std::vector<std::chrono::milliseconds>{1000ms, 2000ms}));
}

TEST_F(ResilientCallOrchestratorTest, ValidateItems_ExhaustedRetriesAreUnavailable) {
    catalog_->failAlways();

    EXPECT_THROW(orchestrator_->validateItems({1}), domain::DependencyUnavailableError);
    EXPECT_EQ(catalog_->calls(), 3);
}

TEST_F(ResilientCallOrchestratorTest, ValidateItems_PermanentFailureNotRetried) {
    catalog_->failPermanently(true);

    EXPECT_THROW(orchestrator_->validateItems({1}), domain::DependencyUnavailableError);
    EXPECT_EQ(catalog_->calls(), 1);
}

TEST_F(ResilientCallOrchestratorTest, ValidateItems_OpenCircuitRejectsWithoutCalling) {
    catalog_->failAlways();

    // 3 + 2 неудачные попытки: на пятой breaker открывается, шестая отклонена
    EXPECT_THROW(orchestrator_->validateItems({1}), domain::DependencyUnavailableError);
    EXPECT_THROW(orchestrator_->validateItems({1}), domain::DependencyUnavailableError);
    EXPECT_EQ(catalog_->calls(), 5);

    auto health = orchestrator_->dependencyHealth(ResilientCallOrchestrator::CATALOG);
    ASSERT_TRUE(health.has_value());
    EXPECT_EQ(health->state, resilience::CircuitState::OPEN);

    catalog_->recover();
    EXPECT_THROW(orchestrator_->validateItems({1}), domain::DependencyUnavailableError);
    EXPECT_EQ(catalog_->calls(), 5);
}

TEST_F(ResilientCallOrchestratorTest, ValidateItems_ProbeAfterResetTimeoutClosesCircuit) {
    catalog_->addItem(1, "alice");
    catalog_->failAlways();
    EXPECT_THROW(orchestrator_->validateItems({1}), domain::DependencyUnavailableError);
    EXPECT_THROW(orchestrator_->validateItems({1}), domain::DependencyUnavailableError);

    catalog_->recover();
    clock_.advance(60001ms);

    auto verdicts = orchestrator_->validateItems({1});
    ASSERT_EQ(verdicts.size(), 1u);
    EXPECT_TRUE(verdicts[0].exists);
    EXPECT_EQ(orchestrator_->dependencyHealth(ResilientCallOrchestrator::CATALOG)->state,
              resilience::CircuitState::CLOSED);
}

// ============================================
// SIDE EFFECTS
// ============================================

TEST_F(ResilientCallOrchestratorTest, Notify_DeliveredReturnsTrue) {
    EXPECT_TRUE(orchestrator_->notify(makeNotification()));

    auto delivered = notifications_->delivered();
    ASSERT_EQ(delivered.size(), 1u);
    EXPECT_EQ(delivered[0].recipientId, "alice");
}

TEST_F(ResilientCallOrchestratorTest, Notify_FailureReturnsFalseAfterRetries) {
    notifications_->setFailing(true);

    EXPECT_FALSE(orchestrator_->notify(makeNotification()));
    EXPECT_EQ(notifications_->attempts(), 3);
    EXPECT_TRUE(notifications_->delivered().empty());
}

TEST_F(ResilientCallOrchestratorTest, ProvisionChatRoom_SuccessAndFailure) {
    EXPECT_TRUE(orchestrator_->provisionChatRoom(makeChatRoom()));
    ASSERT_EQ(chat_->created().size(), 1u);
    EXPECT_EQ(chat_->created()[0].offerId, 7);

    chat_->setFailing(true);
    EXPECT_FALSE(orchestrator_->provisionChatRoom(makeChatRoom()));
}

TEST_F(ResilientCallOrchestratorTest, BreakersAreIsolatedPerDependency) {
    notifications_->setFailing(true);
    EXPECT_FALSE(orchestrator_->notify(makeNotification()));
    EXPECT_FALSE(orchestrator_->notify(makeNotification()));

    EXPECT_EQ(orchestrator_->dependencyHealth(ResilientCallOrchestrator::NOTIFICATION)->state,
              resilience::CircuitState::OPEN);
    EXPECT_EQ(orchestrator_->dependencyHealth(ResilientCallOrchestrator::CHAT)->state,
              resilience::CircuitState::CLOSED);
    EXPECT_EQ(orchestrator_->dependencyHealth(ResilientCallOrchestrator::CATALOG)->state,
              resilience::CircuitState::CLOSED);

    catalog_->addItem(1, "alice");
    EXPECT_EQ(orchestrator_->validateItems({1}).size(), 1u);
    EXPECT_TRUE(orchestrator_->provisionChatRoom(makeChatRoom()));
}

// ============================================
// ДИАГНОСТИКА
// ============================================

TEST_F(ResilientCallOrchestratorTest, DependencyHealth_KnownAndUnknown) {
    auto names = orchestrator_->dependencies();
    EXPECT_EQ(names.size(), 3u);

    auto health = orchestrator_->dependencyHealth(ResilientCallOrchestrator::CHAT);
    ASSERT_TRUE(health.has_value());
    EXPECT_EQ(health->state, resilience::CircuitState::CLOSED);
    EXPECT_EQ(health->consecutiveFailures, 0);

    EXPECT_FALSE(orchestrator_->dependencyHealth("payments").has_value());
}

// ============================================
// МЕТРИКИ
// ============================================

TEST_F(ResilientCallOrchestratorTest, Metrics_CallOutcomesAndRetries) {
    catalog_->addItem(1, "alice");
    catalog_->failNext(2);

    orchestrator_->validateItems({1});

    EXPECT_EQ(metrics_->value("dependency_calls_total", {{"dependency", "catalog"}, {"outcome", "failure"}}), 2);
    EXPECT_EQ(metrics_->value("dependency_calls_total", {{"dependency", "catalog"}, {"outcome", "success"}}), 1);
    EXPECT_EQ(metrics_->value("dependency_call_duration_milliseconds_count", {{"dependency", "catalog"}}), 3);
    EXPECT_EQ(metrics_->value("retry_attempts_total", {{"dependency", "catalog"}}), 2);
    EXPECT_EQ(metrics_->value("circuit_breaker_failures_total", {{"circuit_name", "catalog"}}), 2);
    EXPECT_EQ(metrics_->value("dependency_unavailable_total", {{"dependency", "catalog"}}), 0);
}

TEST_F(ResilientCallOrchestratorTest, Metrics_BreakerStateGaugeFollowsTransitions) {
    EXPECT_EQ(metrics_->value("circuit_breaker_state", {{"circuit_name", "catalog"}}), 0);

    catalog_->addItem(1, "alice");
    catalog_->failAlways();
    EXPECT_THROW(orchestrator_->validateItems({1}), domain::DependencyUnavailableError);
    EXPECT_THROW(orchestrator_->validateItems({1}), domain::DependencyUnavailableError);

    EXPECT_EQ(metrics_->value("circuit_breaker_state", {{"circuit_name", "catalog"}}), 1);
    EXPECT_EQ(metrics_->value("circuit_breaker_state", {{"circuit_name", "chat"}}), 0);
    EXPECT_EQ(metrics_->value("dependency_unavailable_total", {{"dependency", "catalog"}}), 2);

    catalog_->recover();
    clock_.advance(60001ms);
    orchestrator_->validateItems({1});

    EXPECT_EQ(metrics_->value("circuit_breaker_state", {{"circuit_name", "catalog"}}), 0);
}

TEST_F(ResilientCallOrchestratorTest, Metrics_SideEffectFailuresCounted) {
    notifications_->setFailing(true);
    chat_->setFailing(true);

    EXPECT_FALSE(orchestrator_->notify(makeNotification()));
    EXPECT_FALSE(orchestrator_->provisionChatRoom(makeChatRoom()));

    EXPECT_EQ(metrics_->value("side_effect_failures_total", {{"dependency", "notification"}}), 1);
    EXPECT_EQ(metrics_->value("side_effect_failures_total", {{"dependency", "chat"}}), 1);
    EXPECT_EQ(metrics_->value("dependency_calls_total", {{"dependency", "notification"}, {"outcome", "failure"}}), 3);
}

// ============================================
// ПУЛ ПОТОКОВ
// ============================================

namespace {

/**
 * @brief Уведомления, которые не возвращаются до release()
 */
class HangingNotificationClient : public ports::output::INotificationClient {
public:
    HangingNotificationClient() : released_(release_.get_future().share()) {}

    void send(const domain::Notification&) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            threads_.insert(std::this_thread::get_id());
        }
        released_.wait();
    }

    void release() { release_.set_value(); }

    size_t distinctThreads() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return threads_.size();
    }

private:
    std::promise<void> release_;
    std::shared_future<void> released_;
    mutable std::mutex mutex_;
    std::set<std::thread::id> threads_;
};

} // namespace

TEST(ResilientCallOrchestratorPoolTest, HangingCallsStayWithinWorkerPool) {
    ManualClock clock;
    auto hanging = std::make_shared<HangingNotificationClient>();
    auto metrics = std::make_shared<MetricsService>(std::make_shared<settings::MetricsSettings>());

    resilience::ResilienceConfig config;
    config.callTimeout = 20ms;
    config.callWorkers = 2;
    config.breaker.failureThreshold = 1000;

    auto orchestrator = std::make_shared<ResilientCallOrchestrator>(
        std::make_shared<FakeCatalogClient>(), hanging, std::make_shared<RecordingChatClient>(),
        metrics, config, clock.clock(), clock.sleeper());

    for (int i = 0; i < 10; ++i) {
        domain::Notification n;
        n.recipientId = "alice";
        n.type = "trade_offer_accepted";
        n.relatedOfferId = i;
        EXPECT_FALSE(orchestrator->notify(n));
    }

    // 30 попыток истекли по таймауту, но выполнялись не более чем на двух потоках
    EXPECT_LE(hanging->distinctThreads(), 2u);
    EXPECT_EQ(metrics->value("dependency_calls_total", {{"dependency", "notification"}, {"outcome", "failure"}}), 30);

    // Деструктор дожидается отпущенных вызовов
    hanging->release();
    orchestrator.reset();
    EXPECT_LE(hanging->distinctThreads(), 2u);
}
