#pragma once

#include "resilience/Clock.hpp"
#include "domain/errors/DependencyErrors.hpp"
#include <algorithm>
#include <chrono>
#include <exception>
#include <functional>
#include <iostream>
#include <string>
#include <type_traits>

namespace matchmaking::resilience {

struct RetryConfig {
    int maxAttempts = 3;                          ///< Всего попыток (1 + 2 повтора)
    std::chrono::milliseconds baseDelay{1000};
    std::chrono::milliseconds maxDelay{10000};
};

using RetryPredicate = std::function<bool(const std::exception&)>;

/// По умолчанию повторяем только транспортные сбои
inline bool isTransient(const std::exception& e) {
    return dynamic_cast<const domain::TransientDependencyError*>(&e) != nullptr;
}

/**
 * @brief Ограниченные повторы с экспоненциальной задержкой
 *
 * Оборачивает вызов breaker'а, а не наоборот: каждая попытка заново
 * проходит через breaker, поэтому если он открылся на второй попытке,
 * третья сразу получит CircuitOpenError.
 *
 * CircuitOpenError никогда не повторяется.
 */
class RetryPolicy {
public:
    explicit RetryPolicy(RetryConfig config = {}, Sleeper sleeper = threadSleep)
        : config_(config)
        , sleeper_(std::move(sleeper))
    {}

    /**
     * @brief Задержка после неудачной попытки attempt (нумерация с 1)
     *
     * min(maxDelay, baseDelay * 2^(attempt-1))
     */
    std::chrono::milliseconds backoffFor(int attempt) const {
        auto delay = config_.baseDelay;
        for (int i = 1; i < attempt && delay < config_.maxDelay; ++i) {
            delay *= 2;
        }
        return std::min(delay, config_.maxDelay);
    }

    template <typename F>
    std::invoke_result_t<F&> execute(F&& operation, const RetryPredicate& isRetryable = isTransient) {
        for (int attempt = 1;; ++attempt) {
            try {
                return operation();
            } catch (const domain::CircuitOpenError&) {
                throw;
            } catch (const std::exception& e) {
                if (attempt >= config_.maxAttempts || !isRetryable(e)) {
                    throw;
                }

                auto delay = backoffFor(attempt);
                std::cerr << "[RetryPolicy] Attempt " << attempt << "/" << config_.maxAttempts
                          << " failed: " << e.what()
                          << ", retrying in " << delay.count() << "ms" << std::endl;
                sleeper_(delay);
            }
        }
    }

    const RetryConfig& config() const { return config_; }

private:
    RetryConfig config_;
    Sleeper sleeper_;
};

} // namespace matchmaking::resilience
