#pragma once

#include "Timestamp.hpp"
#include "enums/TradeOfferStatus.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace matchmaking::domain {

using ItemId = int64_t;
using OfferId = int64_t;

/**
 * @brief Предложение обмена между двумя пользователями
 *
 * id и createdAt/updatedAt проставляет хранилище.
 * status и respondedAt меняет только TradeOfferService.
 * respondedAt ставится один раз, при первом переходе PENDING -> ACCEPTED/REJECTED.
 */
struct TradeOffer {
    OfferId id = 0;
    std::string proposerId;               ///< Кто предлагает обмен
    std::string receiverId;               ///< Кому предлагают
    std::vector<ItemId> offeredItemIds;   ///< Вещи proposer'а
    std::vector<ItemId> requestedItemIds; ///< Вещи receiver'а
    TradeOfferStatus status = TradeOfferStatus::PENDING;
    std::optional<std::string> message;
    Timestamp createdAt;
    Timestamp updatedAt;
    std::optional<Timestamp> respondedAt;

    TradeOffer() = default;

    TradeOffer(const std::string& proposer,
               const std::string& receiver,
               std::vector<ItemId> offered,
               std::vector<ItemId> requested,
               std::optional<std::string> msg = std::nullopt)
        : proposerId(proposer)
        , receiverId(receiver)
        , offeredItemIds(std::move(offered))
        , requestedItemIds(std::move(requested))
        , status(TradeOfferStatus::PENDING)
        , message(std::move(msg))
    {}

    bool involves(const std::string& userId) const {
        return proposerId == userId || receiverId == userId;
    }
};

} // namespace matchmaking::domain
