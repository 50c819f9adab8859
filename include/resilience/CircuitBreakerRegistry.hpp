#pragma once

#include "resilience/CircuitBreaker.hpp"
#include <ThreadSafeMap.hpp>
#include <memory>
#include <string>
#include <vector>

namespace matchmaking::resilience {

/**
 * @brief Реестр breaker'ов: один экземпляр на имя зависимости
 *
 * Breaker'ы разных зависимостей никогда не разделяются.
 * Создаётся явно и передаётся в оркестратор (никаких глобальных синглтонов).
 */
class CircuitBreakerRegistry {
public:
    explicit CircuitBreakerRegistry(CircuitBreakerConfig config = {}, Clock clock = steadyNow)
        : config_(config)
        , clock_(std::move(clock))
    {}

    std::shared_ptr<CircuitBreaker> get(const std::string& dependency) {
        return breakers_.getOrCreate(dependency, [this, &dependency]() {
            return std::make_shared<CircuitBreaker>(dependency, config_, clock_);
        });
    }

    std::shared_ptr<CircuitBreaker> find(const std::string& dependency) const {
        return breakers_.find(dependency);
    }

    std::vector<std::string> names() const {
        return breakers_.keys();
    }

private:
    CircuitBreakerConfig config_;
    Clock clock_;
    ThreadSafeMap<std::string, CircuitBreaker> breakers_;
};

} // namespace matchmaking::resilience
