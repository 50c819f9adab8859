#pragma once

#include "TradeOffer.hpp"
#include <string>

namespace matchmaking::domain {

/**
 * @brief Вердикт каталога по одной вещи
 *
 * Строится заново на каждый вызов и нигде не хранится.
 * Если вещь не найдена: exists=false, остальные поля по умолчанию.
 */
struct ItemValidation {
    ItemId itemId = 0;
    bool exists = false;
    bool isActive = false;
    std::string ownerId;

    static ItemValidation notFound(ItemId id) {
        ItemValidation v;
        v.itemId = id;
        return v;
    }
};

} // namespace matchmaking::domain
