#pragma once

#include "resilience/Clock.hpp"
#include "domain/errors/DependencyErrors.hpp"
#include "domain/Timestamp.hpp"
#include <chrono>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace matchmaking::resilience {

enum class CircuitState {
    CLOSED,
    OPEN,
    HALF_OPEN
};

inline std::string toString(CircuitState state) {
    switch (state) {
        case CircuitState::CLOSED: return "CLOSED";
        case CircuitState::OPEN: return "OPEN";
        case CircuitState::HALF_OPEN: return "HALF_OPEN";
    }
    return "UNKNOWN";
}

struct CircuitBreakerConfig {
    int failureThreshold = 5;                                ///< Подряд идущих ошибок до OPEN
    std::chrono::milliseconds resetTimeout{60000};           ///< Сколько ждать в OPEN до пробы
};

/**
 * @brief Снимок состояния зависимости
 */
struct DependencyHealth {
    CircuitState state = CircuitState::CLOSED;
    int consecutiveFailures = 0;
    std::optional<TimePoint> openedAt;
    std::optional<domain::Timestamp> openedAtUtc;         ///< Когда breaker открылся (wall clock)
    std::chrono::milliseconds openFor{0};                 ///< Сколько прошло с openedAt по часам breaker'а
    bool probeInFlight = false;
};

/**
 * @brief Circuit breaker для одной внешней зависимости
 *
 * CLOSED:    вызов выполняется; успех обнуляет счётчик, ошибка увеличивает.
 *            На failureThreshold ошибке -> OPEN, запоминаем openedAt.
 * OPEN:      вызов НЕ выполняется, сразу CircuitOpenError.
 *            Если с openedAt прошло больше resetTimeout -> HALF_OPEN,
 *            и именно этот вызов становится пробой.
 * HALF_OPEN: ровно одна проба. Успех -> CLOSED, ошибка -> OPEN (новый openedAt).
 *            Пока проба в полёте, остальные вызовы отклоняются как в OPEN.
 *
 * Все переходы под одним mutex; сама операция выполняется вне блокировки.
 * Любое исключение операции считается ошибкой и пробрасывается дальше.
 */
class CircuitBreaker {
public:
    using StateChangeCallback = std::function<void(const std::string& name, CircuitState from, CircuitState to)>;

    explicit CircuitBreaker(std::string name,
                            CircuitBreakerConfig config = {},
                            Clock clock = steadyNow)
        : name_(std::move(name))
        , config_(config)
        , clock_(std::move(clock))
    {
        std::cout << "[CircuitBreaker:" << name_ << "] Created, threshold="
                  << config_.failureThreshold << " resetTimeout="
                  << config_.resetTimeout.count() << "ms" << std::endl;
    }

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    template <typename F>
    std::invoke_result_t<F&> call(F&& operation) {
        using Result = std::invoke_result_t<F&>;

        const bool probe = acquire();
        try {
            if constexpr (std::is_void_v<Result>) {
                operation();
                onSuccess(probe);
            } else {
                Result result = operation();
                onSuccess(probe);
                return result;
            }
        } catch (...) {
            onFailure(probe);
            throw;
        }
    }

    DependencyHealth health() const {
        std::lock_guard<std::mutex> lock(mutex_);
        DependencyHealth h;
        h.state = state_;
        h.consecutiveFailures = consecutiveFailures_;
        h.openedAt = openedAt_;
        h.openedAtUtc = openedAtUtc_;
        if (openedAt_) {
            h.openFor = std::chrono::duration_cast<std::chrono::milliseconds>(clock_() - *openedAt_);
        }
        h.probeInFlight = probeInFlight_;
        return h;
    }

    CircuitState state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    const std::string& name() const { return name_; }

    const CircuitBreakerConfig& config() const { return config_; }

    void onStateChange(StateChangeCallback callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks_.push_back(std::move(callback));
    }

private:
    struct Transition {
        CircuitState from;
        CircuitState to;
    };

    /**
     * @brief Решение пропустить вызов
     * @return true если вызов - проба в HALF_OPEN
     * @throws domain::CircuitOpenError если вызов отклонён
     */
    bool acquire() {
        std::optional<Transition> transition;
        bool probe = false;
        bool rejected = false;

        {
            std::lock_guard<std::mutex> lock(mutex_);

            if (state_ == CircuitState::OPEN && openedAt_ &&
                clock_() - *openedAt_ > config_.resetTimeout) {
                transition = moveTo(CircuitState::HALF_OPEN);
            }

            switch (state_) {
                case CircuitState::CLOSED:
                    break;
                case CircuitState::OPEN:
                    rejected = true;
                    break;
                case CircuitState::HALF_OPEN:
                    if (probeInFlight_) {
                        rejected = true;
                    } else {
                        probeInFlight_ = true;
                        probe = true;
                    }
                    break;
            }
        }

        notify(transition);

        if (rejected) {
            throw domain::CircuitOpenError(name_);
        }
        return probe;
    }

    void onSuccess(bool probe) {
        std::optional<Transition> transition;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (probe) {
                probeInFlight_ = false;
                consecutiveFailures_ = 0;
                openedAt_.reset();
                openedAtUtc_.reset();
                transition = moveTo(CircuitState::CLOSED);
            } else if (state_ == CircuitState::CLOSED) {
                consecutiveFailures_ = 0;
            }
        }
        notify(transition);
    }

    void onFailure(bool probe) {
        std::optional<Transition> transition;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (probe) {
                probeInFlight_ = false;
                markOpened();
                transition = moveTo(CircuitState::OPEN);
            } else if (state_ == CircuitState::CLOSED) {
                ++consecutiveFailures_;
                if (consecutiveFailures_ >= config_.failureThreshold) {
                    markOpened();
                    transition = moveTo(CircuitState::OPEN);
                }
            }
            // Опоздавшие вызовы, начатые ещё в CLOSED, состояние OPEN/HALF_OPEN не меняют
        }
        notify(transition);
    }

    // Вызывается под mutex_
    void markOpened() {
        openedAt_ = clock_();
        openedAtUtc_ = domain::Timestamp::now();
    }

    // Вызывается под mutex_
    std::optional<Transition> moveTo(CircuitState next) {
        if (state_ == next) {
            return std::nullopt;
        }
        Transition t{state_, next};
        state_ = next;
        return t;
    }

    void notify(const std::optional<Transition>& transition) {
        if (!transition) {
            return;
        }

        std::cout << "[CircuitBreaker:" << name_ << "] "
                  << toString(transition->from) << " -> " << toString(transition->to) << std::endl;

        std::vector<StateChangeCallback> callbacks;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callbacks = callbacks_;
        }
        for (const auto& cb : callbacks) {
            cb(name_, transition->from, transition->to);
        }
    }

    std::string name_;
    CircuitBreakerConfig config_;
    Clock clock_;

    mutable std::mutex mutex_;
    CircuitState state_ = CircuitState::CLOSED;
    int consecutiveFailures_ = 0;
    std::optional<TimePoint> openedAt_;
    std::optional<domain::Timestamp> openedAtUtc_;
    bool probeInFlight_ = false;
    std::vector<StateChangeCallback> callbacks_;
};

} // namespace matchmaking::resilience
