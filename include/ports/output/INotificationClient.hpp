#pragma once

#include "domain/Notification.hpp"

namespace matchmaking::ports::output {

/**
 * @brief Транспорт к Notification Service
 *
 * Реализуется HttpNotificationClient и RabbitMQNotificationPublisher.
 * Ошибка доставки - исключение DependencyError.
 */
class INotificationClient {
public:
    virtual ~INotificationClient() = default;

    virtual void send(const domain::Notification& notification) = 0;
};

} // namespace matchmaking::ports::output
