#pragma once

#include "TradeOffer.hpp"
#include "enums/TradeOfferError.hpp"
#include "enums/PartyRole.hpp"
#include <string>
#include <vector>
#include <optional>

namespace matchmaking::domain {

/**
 * @brief Результат проверки вещей в каталоге
 *
 * При отказе itemIds содержит ПОЛНЫЙ список проблемных id первой
 * нарушенной категории, чтобы клиент исправил всё за один раз.
 */
struct OwnershipValidationResult {
    TradeOfferError error = TradeOfferError::NONE;
    std::vector<ItemId> itemIds;
    std::optional<PartyRole> role;  ///< Только для WRONG_OWNER
    std::string message;

    bool ok() const { return error == TradeOfferError::NONE; }

    static OwnershipValidationResult success() {
        return {};
    }

    static OwnershipValidationResult failure(TradeOfferError error,
                                             std::vector<ItemId> ids,
                                             std::string message,
                                             std::optional<PartyRole> role = std::nullopt) {
        OwnershipValidationResult r;
        r.error = error;
        r.itemIds = std::move(ids);
        r.role = role;
        r.message = std::move(message);
        return r;
    }
};

/**
 * @brief Результат операции над предложением обмена
 *
 * offer заполнен при успехе (для deleteOffer остаётся пустым).
 */
struct TradeOfferResult {
    TradeOfferError error = TradeOfferError::NONE;
    std::string message;
    std::optional<TradeOffer> offer;
    std::vector<ItemId> itemIds;
    std::optional<PartyRole> role;

    bool ok() const { return error == TradeOfferError::NONE; }

    static TradeOfferResult success(TradeOffer offer, std::string message = "") {
        TradeOfferResult r;
        r.offer = std::move(offer);
        r.message = std::move(message);
        return r;
    }

    static TradeOfferResult failure(TradeOfferError error, std::string message) {
        TradeOfferResult r;
        r.error = error;
        r.message = std::move(message);
        return r;
    }

    static TradeOfferResult fromValidation(const OwnershipValidationResult& v) {
        TradeOfferResult r;
        r.error = v.error;
        r.message = v.message;
        r.itemIds = v.itemIds;
        r.role = v.role;
        return r;
    }
};

} // namespace matchmaking::domain
