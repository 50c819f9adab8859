#pragma once

#include <IRequest.hpp>
#include <IResponse.hpp>
#include "domain/TradeOffer.hpp"
#include "domain/TradeOfferResult.hpp"
#include "domain/TradeOfferStatistics.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace matchmaking::adapters::primary {

/**
 * @brief Общие для HTTP handlers сериализация и разбор параметров
 */
namespace http {

inline nlohmann::json offerToJson(const domain::TradeOffer& offer) {
    nlohmann::json j;
    j["id"] = offer.id;
    j["proposer_id"] = offer.proposerId;
    j["receiver_id"] = offer.receiverId;
    j["offered_item_ids"] = offer.offeredItemIds;
    j["requested_item_ids"] = offer.requestedItemIds;
    j["status"] = domain::toString(offer.status);
    j["message"] = offer.message ? nlohmann::json(*offer.message) : nlohmann::json(nullptr);
    j["created_at"] = offer.createdAt.toString();
    j["updated_at"] = offer.updatedAt.toString();
    j["responded_at"] = offer.respondedAt ? nlohmann::json(offer.respondedAt->toString()) : nlohmann::json(nullptr);
    return j;
}

inline nlohmann::json offersToJson(const std::vector<domain::TradeOffer>& offers) {
    auto array = nlohmann::json::array();
    for (const auto& offer : offers) {
        array.push_back(offerToJson(offer));
    }
    return array;
}

inline nlohmann::json statisticsToJson(const domain::TradeOfferStatistics& stats) {
    nlohmann::json j;
    j["total_offers"] = stats.totalOffers;
    j["pending_offers"] = stats.pendingOffers;
    j["accepted_offers"] = stats.acceptedOffers;
    j["rejected_offers"] = stats.rejectedOffers;
    j["completed_offers"] = stats.completedOffers;
    return j;
}

/**
 * @brief HTTP статус для причины отказа
 */
inline int httpStatusFor(domain::TradeOfferError error) {
    switch (error) {
        case domain::TradeOfferError::NONE:
            return 200;
        case domain::TradeOfferError::INVALID_REQUEST:
        case domain::TradeOfferError::ITEMS_INACTIVE:
        case domain::TradeOfferError::INVALID_TRANSITION:
        case domain::TradeOfferError::INVALID_STATE:
            return 400;
        case domain::TradeOfferError::UNAUTHORIZED:
        case domain::TradeOfferError::WRONG_OWNER:
            return 403;
        case domain::TradeOfferError::ITEMS_NOT_FOUND:
        case domain::TradeOfferError::NOT_FOUND:
            return 404;
        case domain::TradeOfferError::DEPENDENCY_UNAVAILABLE:
            return 503;
    }
    return 500;
}

inline void sendError(IResponse& res, int status, const std::string& message) {
    nlohmann::json error;
    error["error"] = message;
    res.setResult(status, "application/json", error.dump());
}

/**
 * @brief Ответ на неуспешный TradeOfferResult
 *
 * item_ids и role добавляются, когда сервис их вернул.
 */
inline void sendFailure(IResponse& res, const domain::TradeOfferResult& result) {
    nlohmann::json error;
    error["error"] = result.message;
    error["code"] = domain::toString(result.error);
    if (!result.itemIds.empty()) {
        error["item_ids"] = result.itemIds;
    }
    if (result.role) {
        error["role"] = domain::toString(*result.role);
    }
    res.setResult(httpStatusFor(result.error), "application/json", error.dump());
}

/**
 * @brief Путь без query string
 */
inline std::string pathOf(IRequest& req) {
    std::string path = req.getPath();
    auto q = path.find('?');
    return q == std::string::npos ? path : path.substr(0, q);
}

/**
 * @brief Сегмент пути после prefix, если он единственный
 *
 * "/api/v1/offers/sent/u1" с prefix "/api/v1/offers/sent/" -> "u1"
 */
inline std::optional<std::string> segmentAfter(const std::string& path, const std::string& prefix) {
    if (path.rfind(prefix, 0) != 0 || path.length() <= prefix.length()) {
        return std::nullopt;
    }
    std::string suffix = path.substr(prefix.length());
    if (suffix.find('/') != std::string::npos) {
        return std::nullopt;
    }
    return suffix;
}

/**
 * @brief Строгий разбор целого: "12abc" и "" -> nullopt
 */
inline std::optional<int64_t> parseInt(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    try {
        size_t pos = 0;
        long long value = std::stoll(text, &pos);
        if (pos != text.size()) {
            return std::nullopt;
        }
        return static_cast<int64_t>(value);
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

/**
 * @brief Разобрать ?status=...; пусто - фильтра нет
 * @return false если статус указан, но неизвестен
 */
inline bool parseStatusFilter(IRequest& req, std::optional<domain::TradeOfferStatus>& status) {
    auto text = req.getQueryParam("status").value_or("");
    if (text.empty()) {
        status = std::nullopt;
        return true;
    }
    status = domain::parseTradeOfferStatus(text);
    return status.has_value();
}

/**
 * @brief Разобрать ?limit=&offset= (limit 1..100, по умолчанию 20; offset >= 0)
 * @return Текст ошибки или nullopt
 */
inline std::optional<std::string> parsePaging(IRequest& req, int& limit, int& offset) {
    limit = 20;
    offset = 0;

    auto limitText = req.getQueryParam("limit").value_or("");
    if (!limitText.empty()) {
        auto value = parseInt(limitText);
        if (!value || *value < 1 || *value > 100) {
            return "limit must be between 1 and 100";
        }
        limit = static_cast<int>(*value);
    }

    auto offsetText = req.getQueryParam("offset").value_or("");
    if (!offsetText.empty()) {
        auto value = parseInt(offsetText);
        if (!value || *value < 0) {
            return "offset must be non-negative";
        }
        offset = static_cast<int>(std::min<int64_t>(*value, std::numeric_limits<int>::max()));
    }
    return std::nullopt;
}

/**
 * @brief Разобрать ?as_proposer= / ?as_receiver= ("true"/"false")
 */
inline std::optional<bool> parseFlag(IRequest& req, const std::string& name) {
    auto text = req.getQueryParam(name).value_or("");
    if (text == "true" || text == "1") return true;
    if (text == "false" || text == "0") return false;
    return std::nullopt;
}

} // namespace http

} // namespace matchmaking::adapters::primary
