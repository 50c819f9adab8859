#pragma once

#include "resilience/CircuitBreaker.hpp"
#include "resilience/RetryPolicy.hpp"
#include <chrono>

namespace matchmaking::resilience {

/**
 * @brief Параметры устойчивости, общие для всех зависимостей
 *
 * Худшее время ожидания одного логического вызова:
 * callTimeout * maxAttempts + сумма задержек между попытками.
 */
struct ResilienceConfig {
    CircuitBreakerConfig breaker;
    RetryConfig retry;
    std::chrono::milliseconds callTimeout{5000};
    int callWorkers = 8;                                     ///< Потоков пула удалённых вызовов
};

} // namespace matchmaking::resilience
