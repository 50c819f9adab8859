#pragma once

#include <cstdint>

namespace matchmaking::domain {

/**
 * @brief Сводка по предложениям пользователя (в любой роли)
 *
 * Отменённые предложения учитываются только в total.
 */
struct TradeOfferStatistics {
    int64_t totalOffers = 0;
    int64_t pendingOffers = 0;
    int64_t acceptedOffers = 0;
    int64_t rejectedOffers = 0;
    int64_t completedOffers = 0;
};

} // namespace matchmaking::domain
