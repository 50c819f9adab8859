#pragma once

#include "ports/input/IMetricsService.hpp"
#include "settings/IMetricsSettings.hpp"

#include <atomic>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <sstream>
#include <string>
#include <unordered_map>

namespace matchmaking::application {

/**
 * @brief Сервис сбора и хранения метрик
 *
 * Особенности:
 * - Потокобезопасность через shared_mutex (read) / unique_lock (write)
 * - Атомарные значения для lock-free инкремента
 * - Ключи из настроек инициализируются нулями; в /metrics попадают только они
 */
class MetricsService : public ports::input::IMetricsService {
public:
    explicit MetricsService(std::shared_ptr<settings::IMetricsSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[MetricsService] Initializing..." << std::endl;

        for (const auto& key : settings_->getAllKeys()) {
            values_[key] = std::make_unique<std::atomic<int64_t>>(0);
        }

        std::cout << "[MetricsService] Initialized with "
                  << values_.size() << " metrics" << std::endl;
    }

    void increment(
        const std::string& name,
        const std::map<std::string, std::string>& labels = {}
    ) override {
        add(name, labels, 1);
    }

    void add(
        const std::string& name,
        const std::map<std::string, std::string>& labels,
        int64_t delta
    ) override {
        slot(settings::metricKey(name, labels)).fetch_add(delta, std::memory_order_relaxed);
    }

    void set(
        const std::string& name,
        const std::map<std::string, std::string>& labels,
        int64_t value
    ) override {
        slot(settings::metricKey(name, labels)).store(value, std::memory_order_relaxed);
    }

    /// Текущее значение (0 для неизвестного ключа)
    int64_t value(const std::string& name, const std::map<std::string, std::string>& labels = {}) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = values_.find(settings::metricKey(name, labels));
        return it != values_.end() ? it->second->load(std::memory_order_relaxed) : 0;
    }

    std::string toPrometheusFormat() const override {
        std::ostringstream oss;
        auto keys = settings_->getAllKeys();

        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& def : settings_->getDefinitions()) {
            oss << "# HELP " << def.name << " " << def.help << "\n";
            oss << "# TYPE " << def.name << " " << def.type << "\n";

            for (const auto& key : keys) {
                if (!belongsTo(key, def.name)) {
                    continue;
                }
                auto it = values_.find(key);
                if (it != values_.end()) {
                    oss << key << " " << it->second->load(std::memory_order_relaxed) << "\n";
                }
            }
        }

        return oss.str();
    }

private:
    std::shared_ptr<settings::IMetricsSettings> settings_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<std::atomic<int64_t>>> values_;

    std::atomic<int64_t>& slot(const std::string& key) {
        // Fast path: ключ уже существует
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = values_.find(key);
            if (it != values_.end()) {
                return *it->second;
            }
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto& value = values_[key];
        if (!value) {
            value = std::make_unique<std::atomic<int64_t>>(0);
        }
        return *value;
    }

    // summary раскладывается на name_sum и name_count
    static bool belongsTo(const std::string& key, const std::string& name) {
        if (key.compare(0, name.size(), name) != 0) {
            return false;
        }
        auto rest = key.substr(name.size());
        return rest.empty() || rest[0] == '{' ||
               rest.rfind("_sum", 0) == 0 || rest.rfind("_count", 0) == 0;
    }
};

} // namespace matchmaking::application
