#pragma once

#include <stdexcept>
#include <string>

/**
 * @file DependencyErrors.hpp
 * @brief Ошибки вызовов внешних сервисов (catalog, notification, chat)
 *
 * Иерархия:
 * - DependencyError                 база, хранит имя зависимости
 *   - TransientDependencyError      сеть, 5xx, таймаут: можно повторить
 *   - PermanentDependencyError      4xx, битый ответ: повтор бесполезен
 *   - CircuitOpenError              breaker отклонил вызов: НЕ повторяется
 *   - DependencyUnavailableError    итог для вызывающего: breaker открыт или ретраи исчерпаны
 */
namespace matchmaking::domain {

class DependencyError : public std::runtime_error {
public:
    DependencyError(const std::string& dependency, const std::string& message)
        : std::runtime_error(dependency + ": " + message)
        , dependency_(dependency) {}

    const std::string& dependency() const { return dependency_; }

private:
    std::string dependency_;
};

class TransientDependencyError : public DependencyError {
public:
    using DependencyError::DependencyError;
};

class PermanentDependencyError : public DependencyError {
public:
    using DependencyError::DependencyError;
};

class CircuitOpenError : public DependencyError {
public:
    explicit CircuitOpenError(const std::string& dependency)
        : DependencyError(dependency, "circuit breaker is open") {}
};

class DependencyUnavailableError : public DependencyError {
public:
    using DependencyError::DependencyError;
};

} // namespace matchmaking::domain
