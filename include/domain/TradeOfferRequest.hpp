#pragma once

#include "TradeOffer.hpp"
#include <string>
#include <vector>
#include <optional>

namespace matchmaking::domain {

/**
 * @brief Запрос на создание предложения обмена
 */
struct TradeOfferRequest {
    std::string proposerId;
    std::string receiverId;
    std::vector<ItemId> offeredItemIds;
    std::vector<ItemId> requestedItemIds;
    std::optional<std::string> message;

    static constexpr size_t MAX_USER_ID_LENGTH = 100;
    static constexpr size_t MAX_MESSAGE_LENGTH = 1000;
};

} // namespace matchmaking::domain
