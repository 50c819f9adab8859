#pragma once

#include "ports/output/IDependencyOrchestrator.hpp"
#include "ports/output/ICatalogClient.hpp"
#include "ports/output/INotificationClient.hpp"
#include "ports/output/IChatClient.hpp"
#include "ports/input/IMetricsService.hpp"
#include "resilience/CallTimeout.hpp"
#include "resilience/CircuitBreakerRegistry.hpp"
#include "resilience/ResilienceConfig.hpp"
#include "resilience/RetryPolicy.hpp"
#include "domain/errors/DependencyErrors.hpp"
#include <boost/asio/thread_pool.hpp>
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace matchmaking::application {

/**
 * @brief Оркестратор устойчивых вызовов внешних сервисов
 *
 * На каждую зависимость (catalog, notification, chat) свой breaker из реестра
 * и общая политика ретраев. Порядок композиции для одной попытки:
 *
 *     retry( breaker( timeout( удалённый вызов ) ) )
 *
 * Breaker самый внутренний из "решающих" слоёв: каждая попытка заново
 * спрашивает у него разрешения. Попытки с таймаутом выполняются на
 * собственном пуле потоков (config.callWorkers), пул останавливается
 * и join'ится в деструкторе.
 *
 * Классификация для вызывающих:
 * - "не найдено" - не ошибка, а вердикт exists=false;
 * - Unavailable - breaker открыт или ретраи исчерпаны;
 * - Transient - наружу не выходит, повторяется внутри.
 */
class ResilientCallOrchestrator : public ports::output::IDependencyOrchestrator {
public:
    static constexpr const char* CATALOG = "catalog";
    static constexpr const char* NOTIFICATION = "notification";
    static constexpr const char* CHAT = "chat";

    ResilientCallOrchestrator(
        std::shared_ptr<ports::output::ICatalogClient> catalog,
        std::shared_ptr<ports::output::INotificationClient> notification,
        std::shared_ptr<ports::output::IChatClient> chat,
        std::shared_ptr<ports::input::IMetricsService> metrics,
        resilience::ResilienceConfig config = {},
        resilience::Clock clock = resilience::steadyNow,
        resilience::Sleeper sleeper = resilience::threadSleep
    ) : catalog_(std::move(catalog))
      , notification_(std::move(notification))
      , chat_(std::move(chat))
      , metrics_(std::move(metrics))
      , config_(config)
      , registry_(std::make_shared<resilience::CircuitBreakerRegistry>(config.breaker, std::move(clock)))
      , retry_(config.retry, std::move(sleeper))
      , pool_(static_cast<std::size_t>(std::max(1, config.callWorkers)))
    {
        // Breaker'ы создаём сразу, чтобы health и /metrics видели все зависимости
        for (const char* name : {CATALOG, NOTIFICATION, CHAT}) {
            auto breaker = registry_->get(name);
            metrics_->set("circuit_breaker_state", {{"circuit_name", name}}, stateGauge(breaker->state()));
            breaker->onStateChange([metrics = metrics_](const std::string& dependency,
                                                        resilience::CircuitState,
                                                        resilience::CircuitState to) {
                metrics->set("circuit_breaker_state", {{"circuit_name", dependency}}, stateGauge(to));
            });
        }

        std::cout << "[ResilientCallOrchestrator] Created, attempts=" << config_.retry.maxAttempts
                  << " callTimeout=" << config_.callTimeout.count() << "ms"
                  << " workers=" << std::max(1, config_.callWorkers) << std::endl;
    }

    ~ResilientCallOrchestrator() override {
        // Зависшие попытки дорабатывают, ещё не начатые отбрасываются
        pool_.stop();
        pool_.join();
    }

    ResilientCallOrchestrator(const ResilientCallOrchestrator&) = delete;
    ResilientCallOrchestrator& operator=(const ResilientCallOrchestrator&) = delete;

    // ============================================
    // CATALOG (gating)
    // ============================================

    std::vector<domain::ItemValidation> validateItems(const std::vector<domain::ItemId>& itemIds) override {
        try {
            auto verdicts = guarded(CATALOG, [client = catalog_, itemIds]() {
                return client->validateItems(itemIds);
            });
            return completeVerdicts(itemIds, verdicts);

        } catch (const domain::CircuitOpenError&) {
            std::cerr << "[ResilientCallOrchestrator] Catalog circuit is OPEN, rejecting validation" << std::endl;
            metrics_->increment("dependency_unavailable_total", {{"dependency", CATALOG}});
            throw domain::DependencyUnavailableError(CATALOG, "circuit breaker open");
        } catch (const std::exception& e) {
            std::cerr << "[ResilientCallOrchestrator] Catalog unavailable: " << e.what() << std::endl;
            metrics_->increment("dependency_unavailable_total", {{"dependency", CATALOG}});
            throw domain::DependencyUnavailableError(CATALOG, e.what());
        }
    }

    // ============================================
    // SIDE EFFECTS (best effort)
    // ============================================

    bool notify(const domain::Notification& notification) override {
        try {
            guarded(NOTIFICATION, [client = notification_, notification]() {
                client->send(notification);
            });
            std::cout << "[ResilientCallOrchestrator] Notification " << notification.type
                      << " sent to " << notification.recipientId << std::endl;
            return true;

        } catch (const std::exception& e) {
            std::cerr << "[ResilientCallOrchestrator] Notification " << notification.type
                      << " for offer " << notification.relatedOfferId
                      << " dropped: " << e.what() << std::endl;
            metrics_->increment("side_effect_failures_total", {{"dependency", NOTIFICATION}});
            return false;
        }
    }

    bool provisionChatRoom(const domain::ChatRoomRequest& request) override {
        try {
            guarded(CHAT, [client = chat_, request]() {
                client->createChatRoom(request);
            });
            std::cout << "[ResilientCallOrchestrator] Chat room created for offer " << request.offerId << std::endl;
            return true;

        } catch (const std::exception& e) {
            std::cerr << "[ResilientCallOrchestrator] Chat room for offer " << request.offerId
                      << " not created: " << e.what() << std::endl;
            metrics_->increment("side_effect_failures_total", {{"dependency", CHAT}});
            return false;
        }
    }

    // ============================================
    // ДИАГНОСТИКА
    // ============================================

    std::optional<resilience::DependencyHealth> dependencyHealth(const std::string& dependency) const {
        auto breaker = registry_->find(dependency);
        if (!breaker) {
            return std::nullopt;
        }
        return breaker->health();
    }

    std::vector<std::string> dependencies() const {
        return registry_->names();
    }

private:
    template <typename F>
    std::invoke_result_t<F&> guarded(const std::string& dependency, F operation) {
        auto breaker = registry_->get(dependency);
        resilience::CallTimeout timeout(dependency, config_.callTimeout, pool_.get_executor());
        int attempt = 0;

        return retry_.execute([&]() {
            if (++attempt > 1) {
                metrics_->increment("retry_attempts_total", {{"dependency", dependency}});
            }
            return breaker->call([&]() {
                return measured(dependency, timeout, operation);
            });
        });
    }

    /**
     * @brief Одна попытка: исход и длительность в метрики
     */
    template <typename F>
    std::invoke_result_t<F&> measured(const std::string& dependency,
                                      resilience::CallTimeout& timeout,
                                      F& operation)
    {
        using Result = std::invoke_result_t<F&>;
        const auto started = std::chrono::steady_clock::now();

        auto record = [&](const char* outcome) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started).count();
            metrics_->increment("dependency_calls_total", {{"dependency", dependency}, {"outcome", outcome}});
            metrics_->add("dependency_call_duration_milliseconds_sum", {{"dependency", dependency}}, elapsed);
            metrics_->increment("dependency_call_duration_milliseconds_count", {{"dependency", dependency}});
        };

        try {
            if constexpr (std::is_void_v<Result>) {
                timeout.run(operation);
                record("success");
            } else {
                Result result = timeout.run(operation);
                record("success");
                return result;
            }
        } catch (...) {
            record("failure");
            metrics_->increment("circuit_breaker_failures_total", {{"circuit_name", dependency}});
            throw;
        }
    }

    static int64_t stateGauge(resilience::CircuitState state) {
        switch (state) {
            case resilience::CircuitState::CLOSED: return 0;
            case resilience::CircuitState::OPEN: return 1;
            case resilience::CircuitState::HALF_OPEN: return 2;
        }
        return 0;
    }

    /**
     * @brief Вердикт для каждого запрошенного id, в порядке запроса
     *
     * Каталог может не вернуть строку для неизвестного id - такие
     * считаются exists=false.
     */
    static std::vector<domain::ItemValidation> completeVerdicts(
        const std::vector<domain::ItemId>& requested,
        const std::vector<domain::ItemValidation>& received)
    {
        std::unordered_map<domain::ItemId, domain::ItemValidation> byId;
        for (const auto& v : received) {
            byId[v.itemId] = v;
        }

        std::vector<domain::ItemValidation> result;
        result.reserve(requested.size());
        for (auto id : requested) {
            auto it = byId.find(id);
            result.push_back(it != byId.end() ? it->second : domain::ItemValidation::notFound(id));
        }
        return result;
    }

    std::shared_ptr<ports::output::ICatalogClient> catalog_;
    std::shared_ptr<ports::output::INotificationClient> notification_;
    std::shared_ptr<ports::output::IChatClient> chat_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;
    resilience::ResilienceConfig config_;
    std::shared_ptr<resilience::CircuitBreakerRegistry> registry_;
    resilience::RetryPolicy retry_;
    boost::asio::thread_pool pool_;
};

} // namespace matchmaking::application
