#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "application/ResilientCallOrchestrator.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace matchmaking::adapters::primary {

/**
 * @brief GET /health - статус сервиса и состояние breaker'ов зависимостей
 *
 * Открытый breaker не делает сервис "unhealthy": создание предложений
 * вернёт 503, остальное продолжает работать.
 */
class HealthHandler : public IHttpHandler {
public:
    explicit HealthHandler(std::shared_ptr<application::ResilientCallOrchestrator> orchestrator)
        : orchestrator_(std::move(orchestrator)) {}

    void handle(IRequest& req, IResponse& res) override {
        nlohmann::json response;
        response["status"] = "healthy";
        response["service"] = "matchmaking";
        response["version"] = "1.0.0";

        nlohmann::json dependencies = nlohmann::json::object();
        for (const auto& name : orchestrator_->dependencies()) {
            auto health = orchestrator_->dependencyHealth(name);
            if (!health) continue;

            nlohmann::json d;
            d["state"] = resilience::toString(health->state);
            d["consecutive_failures"] = health->consecutiveFailures;
            if (health->openedAtUtc) {
                d["opened_at"] = health->openedAtUtc->toString();
                d["open_for_ms"] = health->openFor.count();
            } else {
                d["opened_at"] = nullptr;
            }
            dependencies[name] = d;
        }
        response["dependencies"] = dependencies;

        res.setResult(200, "application/json", response.dump());
    }

private:
    std::shared_ptr<application::ResilientCallOrchestrator> orchestrator_;
};

} // namespace matchmaking::adapters::primary
