#pragma once

#include <chrono>
#include <functional>
#include <thread>

namespace matchmaking::resilience {

using TimePoint = std::chrono::steady_clock::time_point;

/// Источник времени breaker'а. В тестах подменяется ручными часами.
using Clock = std::function<TimePoint()>;

/// Пауза между попытками. В тестах подменяется записью задержек без сна.
using Sleeper = std::function<void(std::chrono::milliseconds)>;

inline TimePoint steadyNow() {
    return std::chrono::steady_clock::now();
}

inline void threadSleep(std::chrono::milliseconds delay) {
    std::this_thread::sleep_for(delay);
}

} // namespace matchmaking::resilience
