#pragma once

#include <string>
#include <optional>

namespace matchmaking::domain {

/**
 * @brief Статус предложения обмена
 *
 * PENDING -> {ACCEPTED, REJECTED, CANCELLED}, ACCEPTED -> COMPLETED.
 * REJECTED, CANCELLED, COMPLETED терминальные.
 */
enum class TradeOfferStatus {
    PENDING,
    ACCEPTED,
    REJECTED,
    CANCELLED,
    COMPLETED
};

inline std::string toString(TradeOfferStatus status) {
    switch (status) {
        case TradeOfferStatus::PENDING: return "pending";
        case TradeOfferStatus::ACCEPTED: return "accepted";
        case TradeOfferStatus::REJECTED: return "rejected";
        case TradeOfferStatus::CANCELLED: return "cancelled";
        case TradeOfferStatus::COMPLETED: return "completed";
    }
    return "unknown";
}

/**
 * @brief Строгий парсинг: неизвестная строка -> nullopt
 *
 * Статус приходит из запроса клиента, молча подставлять PENDING нельзя.
 */
inline std::optional<TradeOfferStatus> parseTradeOfferStatus(const std::string& str) {
    if (str == "pending") return TradeOfferStatus::PENDING;
    if (str == "accepted") return TradeOfferStatus::ACCEPTED;
    if (str == "rejected") return TradeOfferStatus::REJECTED;
    if (str == "cancelled") return TradeOfferStatus::CANCELLED;
    if (str == "completed") return TradeOfferStatus::COMPLETED;
    return std::nullopt;
}

} // namespace matchmaking::domain
