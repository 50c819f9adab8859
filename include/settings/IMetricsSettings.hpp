#pragma once

#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace matchmaking::settings {

/**
 * @brief Определение метрики для Prometheus
 */
struct MetricDefinition {
    std::string name;   ///< Имя метрики (например, "http_requests_total")
    std::string help;   ///< Описание метрики для HELP
    std::string type;   ///< Тип метрики: "counter", "gauge", "summary"
};

/**
 * @brief Ключ метрики: name или name{k1="v1",k2="v2"}, labels по алфавиту
 */
inline std::string metricKey(const std::string& name, const std::map<std::string, std::string>& labels = {}) {
    if (labels.empty()) {
        return name;
    }

    std::ostringstream oss;
    oss << name << "{";
    bool first = true;
    for (const auto& [k, v] : labels) {
        if (!first) oss << ",";
        oss << k << "=\"" << v << "\"";
        first = false;
    }
    oss << "}";
    return oss.str();
}

/**
 * @brief Интерфейс настроек метрик
 *
 * Все ключи перечисляются заранее: при старте они инициализируются нулями,
 * и /metrics отдаёт только их.
 */
class IMetricsSettings {
public:
    virtual ~IMetricsSettings() = default;

    virtual std::vector<MetricDefinition> getDefinitions() const = 0;

    /// Полный список ключей в формате "metric_name{label=\"value\"}"
    virtual std::vector<std::string> getAllKeys() const = 0;
};

} // namespace matchmaking::settings
