#pragma once

#include "ports/output/INotificationClient.hpp"
#include "settings/INotificationClientSettings.hpp"
#include "adapters/secondary/HttpDependencyCall.hpp"
#include <IHttpClient.hpp>
#include <SimpleRequest.hpp>
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace matchmaking::adapters::secondary {

/**
 * @brief Формат уведомления, общий для HTTP и RabbitMQ транспорта
 */
inline nlohmann::json toNotificationJson(const domain::Notification& n) {
    return {
        {"user_id", n.recipientId},
        {"type", n.type},
        {"title", n.title},
        {"body", n.body},
        {"related_offer_id", n.relatedOfferId},
        {"related_user_id", n.relatedUserId}
    };
}

/**
 * @brief HTTP клиент к Notifications Service
 *
 * POST /api/v1/notifications, успех - 201 Created.
 */
class HttpNotificationClient : public ports::output::INotificationClient {
public:
    HttpNotificationClient(
        std::shared_ptr<IHttpClient> httpClient,
        std::shared_ptr<settings::INotificationClientSettings> settings
    ) : httpClient_(std::move(httpClient))
      , settings_(std::move(settings))
    {
        std::cout << "[HttpNotificationClient] Created, target: "
                  << settings_->getHost() << ":" << settings_->getPort() << std::endl;
    }

    void send(const domain::Notification& notification) override {
        SimpleRequest request(
            "POST",
            "/api/v1/notifications",
            toNotificationJson(notification).dump(),
            settings_->getHost(),
            settings_->getPort(),
            {{"Content-Type", "application/json"}}
        );

        auto response = sendToDependency(*httpClient_, "notification", request);
        if (response.getStatus() != 201) {
            throw domain::PermanentDependencyError(
                "notification", "unexpected status " + std::to_string(response.getStatus()));
        }
    }

private:
    std::shared_ptr<IHttpClient> httpClient_;
    std::shared_ptr<settings::INotificationClientSettings> settings_;
};

} // namespace matchmaking::adapters::secondary
