#pragma once

#include "settings/INotificationClientSettings.hpp"
#include <cstdlib>
#include <string>

namespace matchmaking::settings {

/**
 * @brief Настройки доставки уведомлений
 *
 * Читает из ENV:
 * - NOTIFICATION_SERVICE_HOST (default: "notifications_service")
 * - NOTIFICATION_SERVICE_PORT (default: 8000)
 * - NOTIFICATION_TRANSPORT (default: "http", иначе "rabbitmq")
 */
class NotificationClientSettings : public INotificationClientSettings {
public:
    std::string getHost() const override {
        const char* host = std::getenv("NOTIFICATION_SERVICE_HOST");
        return host ? host : "notifications_service";
    }

    int getPort() const override {
        const char* port = std::getenv("NOTIFICATION_SERVICE_PORT");
        return port ? std::stoi(port) : 8000;
    }

    std::string getTransport() const override {
        const char* transport = std::getenv("NOTIFICATION_TRANSPORT");
        return transport ? transport : "http";
    }
};

} // namespace matchmaking::settings
