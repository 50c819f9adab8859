#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace matchmaking::ports::input {

/**
 * @brief Интерфейс сервиса метрик
 *
 * Счётчики и gauge'и с опциональными labels, сериализация в формат Prometheus.
 *
 * @example
 * ```cpp
 * metrics->increment("trade_offers_created_total");
 * metrics->increment("dependency_calls_total", {{"dependency", "catalog"}, {"outcome", "failure"}});
 * metrics->set("circuit_breaker_state", {{"circuit_name", "chat"}}, 1);
 * ```
 */
class IMetricsService {
public:
    virtual ~IMetricsService() = default;

    /**
     * @brief Увеличить счётчик на 1
     *
     * Ключ метрики формируется как "name{label1=\"value1\",label2=\"value2\"}".
     */
    virtual void increment(
        const std::string& name,
        const std::map<std::string, std::string>& labels = {}
    ) = 0;

    /// Увеличить счётчик на delta (суммы длительностей)
    virtual void add(
        const std::string& name,
        const std::map<std::string, std::string>& labels,
        int64_t delta
    ) = 0;

    /// Выставить gauge
    virtual void set(
        const std::string& name,
        const std::map<std::string, std::string>& labels,
        int64_t value
    ) = 0;

    /**
     * @brief Сериализовать метрики в Prometheus text format (version 0.0.4)
     */
    virtual std::string toPrometheusFormat() const = 0;
};

} // namespace matchmaking::ports::input
