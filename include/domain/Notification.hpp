#pragma once

#include "TradeOffer.hpp"
#include <string>

namespace matchmaking::domain {

/**
 * @brief Уведомление участнику обмена
 *
 * recipientId - сторона, НЕ совершившая действие; relatedUserId - кто совершил.
 */
struct Notification {
    std::string recipientId;
    std::string type;     ///< trade_offer_accepted, trade_offer_rejected, ...
    std::string title;
    std::string body;
    OfferId relatedOfferId = 0;
    std::string relatedUserId;
};

/**
 * @brief Запрос на создание чата для принятого обмена
 */
struct ChatRoomRequest {
    OfferId offerId = 0;
    std::string userAId;
    std::string userBId;
};

} // namespace matchmaking::domain
