#pragma once

#include "ports/output/IChatClient.hpp"
#include "settings/IChatClientSettings.hpp"
#include "adapters/secondary/HttpDependencyCall.hpp"
#include <IHttpClient.hpp>
#include <SimpleRequest.hpp>
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace matchmaking::adapters::secondary {

/**
 * @brief HTTP клиент к Chat Service
 *
 * POST /api/v1/chat-rooms {"trade_offer_id", "user1_id", "user2_id"}, успех - 201 Created.
 */
class HttpChatClient : public ports::output::IChatClient {
public:
    HttpChatClient(
        std::shared_ptr<IHttpClient> httpClient,
        std::shared_ptr<settings::IChatClientSettings> settings
    ) : httpClient_(std::move(httpClient))
      , settings_(std::move(settings))
    {
        std::cout << "[HttpChatClient] Created, target: "
                  << settings_->getHost() << ":" << settings_->getPort() << std::endl;
    }

    void createChatRoom(const domain::ChatRoomRequest& room) override {
        nlohmann::json requestBody = {
            {"trade_offer_id", room.offerId},
            {"user1_id", room.userAId},
            {"user2_id", room.userBId}
        };

        SimpleRequest request(
            "POST",
            "/api/v1/chat-rooms",
            requestBody.dump(),
            settings_->getHost(),
            settings_->getPort(),
            {{"Content-Type", "application/json"}}
        );

        auto response = sendToDependency(*httpClient_, "chat", request);
        if (response.getStatus() != 201) {
            throw domain::PermanentDependencyError(
                "chat", "unexpected status " + std::to_string(response.getStatus()));
        }
    }

private:
    std::shared_ptr<IHttpClient> httpClient_;
    std::shared_ptr<settings::IChatClientSettings> settings_;
};

} // namespace matchmaking::adapters::secondary
