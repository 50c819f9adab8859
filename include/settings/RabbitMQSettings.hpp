#pragma once

#include <string>
#include <cstdlib>

namespace matchmaking::settings {

/**
 * @brief Настройки RabbitMQ (транспорт уведомлений)
 *
 * Читает из ENV:
 * - RABBITMQ_HOST (default: "rabbitmq")
 * - RABBITMQ_PORT (default: 5672)
 * - RABBITMQ_USER / RABBITMQ_PASSWORD (default: "swappo_user" / "swappo_pass")
 * - RABBITMQ_NOTIFICATION_QUEUE (default: "notifications_queue")
 */
class RabbitMQSettings {
public:
    RabbitMQSettings() {
        if (const char* host = std::getenv("RABBITMQ_HOST")) {
            host_ = host;
        }
        if (const char* port = std::getenv("RABBITMQ_PORT")) {
            port_ = std::stoi(port);
        }
        if (const char* user = std::getenv("RABBITMQ_USER")) {
            user_ = user;
        }
        if (const char* password = std::getenv("RABBITMQ_PASSWORD")) {
            password_ = password;
        }
        if (const char* queue = std::getenv("RABBITMQ_NOTIFICATION_QUEUE")) {
            notificationQueue_ = queue;
        }
    }

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    std::string getUser() const { return user_; }
    std::string getPassword() const { return password_; }
    std::string getNotificationQueue() const { return notificationQueue_; }

private:
    std::string host_ = "rabbitmq";
    int port_ = 5672;
    std::string user_ = "swappo_user";
    std::string password_ = "swappo_pass";
    std::string notificationQueue_ = "notifications_queue";
};

} // namespace matchmaking::settings
