#pragma once

#include <string>

namespace matchmaking::domain {

/**
 * @brief Причина отказа операции над предложением
 *
 * NONE означает успех.
 */
enum class TradeOfferError {
    NONE,
    INVALID_REQUEST,        ///< Дубликаты, пересечение сторон, обмен с самим собой
    ITEMS_NOT_FOUND,
    ITEMS_INACTIVE,
    WRONG_OWNER,
    DEPENDENCY_UNAVAILABLE, ///< Каталог недоступен (breaker открыт или ретраи исчерпаны)
    NOT_FOUND,
    UNAUTHORIZED,
    INVALID_TRANSITION,
    INVALID_STATE
};

inline std::string toString(TradeOfferError error) {
    switch (error) {
        case TradeOfferError::NONE: return "NONE";
        case TradeOfferError::INVALID_REQUEST: return "INVALID_REQUEST";
        case TradeOfferError::ITEMS_NOT_FOUND: return "ITEMS_NOT_FOUND";
        case TradeOfferError::ITEMS_INACTIVE: return "ITEMS_INACTIVE";
        case TradeOfferError::WRONG_OWNER: return "WRONG_OWNER";
        case TradeOfferError::DEPENDENCY_UNAVAILABLE: return "DEPENDENCY_UNAVAILABLE";
        case TradeOfferError::NOT_FOUND: return "NOT_FOUND";
        case TradeOfferError::UNAUTHORIZED: return "UNAUTHORIZED";
        case TradeOfferError::INVALID_TRANSITION: return "INVALID_TRANSITION";
        case TradeOfferError::INVALID_STATE: return "INVALID_STATE";
    }
    return "UNKNOWN";
}

} // namespace matchmaking::domain
