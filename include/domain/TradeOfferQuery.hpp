#pragma once

#include "enums/TradeOfferStatus.hpp"
#include <string>
#include <optional>

namespace matchmaking::domain {

/**
 * @brief Фильтр списка предложений пользователя
 *
 * Если ни asProposer, ни asReceiver не выставлены (или выставлены оба),
 * возвращаются предложения, где пользователь любая из сторон.
 * Сортировка: новые первыми.
 */
struct TradeOfferQuery {
    std::string userId;
    std::optional<TradeOfferStatus> status;
    std::optional<bool> asProposer;
    std::optional<bool> asReceiver;
    int limit = DEFAULT_LIMIT;
    int offset = 0;

    static constexpr int DEFAULT_LIMIT = 20;
    static constexpr int MAX_LIMIT = 100;

    bool matchesProposer() const {
        return asProposer.value_or(false) || !asReceiver.value_or(false);
    }

    bool matchesReceiver() const {
        return asReceiver.value_or(false) || !asProposer.value_or(false);
    }

    bool isValid() const {
        return !userId.empty() && limit >= 1 && limit <= MAX_LIMIT && offset >= 0;
    }
};

} // namespace matchmaking::domain
