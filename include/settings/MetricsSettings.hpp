#pragma once

#include "IMetricsSettings.hpp"
#include <string>
#include <vector>

namespace matchmaking::settings {

/**
 * @brief Метрики Matchmaking Service
 *
 * - HTTP: запросы к endpoints (method + нормализованный path)
 * - Зависимости: вызовы catalog/notification/chat, длительность, ретраи,
 *   отказы, состояние breaker'ов
 * - Бизнес: созданные предложения и переходы по статусам
 */
class MetricsSettings : public IMetricsSettings {
public:
    std::vector<MetricDefinition> getDefinitions() const override {
        return {
            {"http_requests_total", "Total HTTP requests", "counter"},
            {"dependency_calls_total", "Remote call attempts by dependency and outcome", "counter"},
            {"dependency_call_duration_milliseconds", "Remote call attempt latency in milliseconds", "summary"},
            {"retry_attempts_total", "Remote call attempts after the first one", "counter"},
            {"dependency_unavailable_total", "Catalog validations rejected as dependency unavailable", "counter"},
            {"side_effect_failures_total", "Notifications and chat rooms dropped after retries", "counter"},
            {"circuit_breaker_state", "Circuit breaker state (0=closed, 1=open, 2=half-open)", "gauge"},
            {"circuit_breaker_failures_total", "Failures recorded by the circuit breaker", "counter"},
            {"trade_offers_created_total", "Total trade offers created", "counter"},
            {"trade_offers_accepted_total", "Total trade offers accepted", "counter"},
            {"trade_offers_rejected_total", "Total trade offers rejected", "counter"},
            {"trade_offers_cancelled_total", "Total trade offers cancelled", "counter"},
            {"trade_offers_completed_total", "Total trade offers completed", "counter"},
            {"trade_offers_deleted_total", "Total trade offers deleted", "counter"}
        };
    }

    std::vector<std::string> getAllKeys() const override {
        std::vector<std::string> keys;

        // ============================================
        // HTTP метрики (method + path)
        // ============================================
        const std::vector<std::pair<std::string, std::string>> endpoints = {
            {"GET", "/"},
            {"GET", "/health"},
            {"GET", "/metrics"},
            {"POST", "/api/v1/offers"},
            {"GET", "/api/v1/offers"},
            {"GET", "/api/v1/offers/{id}"},
            {"PATCH", "/api/v1/offers/{id}"},
            {"DELETE", "/api/v1/offers/{id}"},
            {"GET", "/api/v1/offers/sent"},
            {"GET", "/api/v1/offers/received"},
            {"GET", "/api/v1/offers/by-item"},
            {"GET", "/api/v1/statistics"}
        };
        for (const auto& [method, path] : endpoints) {
            keys.push_back(metricKey("http_requests_total", {{"method", method}, {"path", path}}));
        }

        // ============================================
        // Зависимости
        // ============================================
        for (const auto& dependency : dependencies()) {
            keys.push_back(metricKey("dependency_calls_total", {{"dependency", dependency}, {"outcome", "success"}}));
            keys.push_back(metricKey("dependency_calls_total", {{"dependency", dependency}, {"outcome", "failure"}}));
            keys.push_back(metricKey("dependency_call_duration_milliseconds_sum", {{"dependency", dependency}}));
            keys.push_back(metricKey("dependency_call_duration_milliseconds_count", {{"dependency", dependency}}));
            keys.push_back(metricKey("retry_attempts_total", {{"dependency", dependency}}));
            keys.push_back(metricKey("circuit_breaker_state", {{"circuit_name", dependency}}));
            keys.push_back(metricKey("circuit_breaker_failures_total", {{"circuit_name", dependency}}));
        }

        keys.push_back(metricKey("dependency_unavailable_total", {{"dependency", "catalog"}}));
        keys.push_back(metricKey("side_effect_failures_total", {{"dependency", "notification"}}));
        keys.push_back(metricKey("side_effect_failures_total", {{"dependency", "chat"}}));

        // ============================================
        // Бизнес метрики (без labels)
        // ============================================
        keys.push_back("trade_offers_created_total");
        keys.push_back("trade_offers_accepted_total");
        keys.push_back("trade_offers_rejected_total");
        keys.push_back("trade_offers_cancelled_total");
        keys.push_back("trade_offers_completed_total");
        keys.push_back("trade_offers_deleted_total");

        return keys;
    }

private:
    static std::vector<std::string> dependencies() {
        return {"catalog", "notification", "chat"};
    }
};

} // namespace matchmaking::settings
