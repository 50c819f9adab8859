#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ITradeOfferService.hpp"
#include "adapters/primary/TradeOfferJson.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>
#include <string>

namespace matchmaking::adapters::primary {

/**
 * @brief HTTP Handler для чтения предложений обмена
 *
 * Endpoints:
 * - GET /api/v1/offers?user_id=...&status=&as_proposer=&as_receiver=&limit=&offset=
 * - GET /api/v1/offers/{id}
 * - GET /api/v1/offers/sent/{user_id}?status=&limit=&offset=
 * - GET /api/v1/offers/received/{user_id}?status=&limit=&offset=
 * - GET /api/v1/offers/by-item/{item_id}?status=
 *
 * Маршрут выбирается по пути внутри handler'а, поэтому порядок
 * регистрации шаблонов в роутере не важен.
 */
class TradeOfferQueryHandler final : public IHttpHandler
{
public:
    explicit TradeOfferQueryHandler(std::shared_ptr<ports::input::ITradeOfferService> service)
        : service_(std::move(service))
    {
        std::cout << "[TradeOfferQueryHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        if (req.getMethod() != "GET") {
            http::sendError(res, 405, "Method not allowed");
            return;
        }

        try {
            const std::string path = http::pathOf(req);

            if (path == "/api/v1/offers") {
                handleList(req, res);
                return;
            }

            if (auto userId = http::segmentAfter(path, "/api/v1/offers/sent/")) {
                handleSent(*userId, req, res);
                return;
            }

            if (auto userId = http::segmentAfter(path, "/api/v1/offers/received/")) {
                handleReceived(*userId, req, res);
                return;
            }

            if (auto itemId = http::segmentAfter(path, "/api/v1/offers/by-item/")) {
                handleByItem(*itemId, req, res);
                return;
            }

            if (auto offerId = http::segmentAfter(path, "/api/v1/offers/")) {
                handleGetById(*offerId, res);
                return;
            }

            http::sendError(res, 404, "Not found");

        } catch (const std::exception& e) {
            std::cerr << "[TradeOfferQueryHandler] Error: " << e.what() << std::endl;
            http::sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::ITradeOfferService> service_;

    void handleList(IRequest& req, IResponse& res)
    {
        domain::TradeOfferQuery query;
        query.userId = req.getQueryParam("user_id").value_or("");
        if (query.userId.empty()) {
            http::sendError(res, 400, "user_id is required");
            return;
        }
        if (!http::parseStatusFilter(req, query.status)) {
            http::sendError(res, 400, "Unknown status");
            return;
        }
        if (auto error = http::parsePaging(req, query.limit, query.offset)) {
            http::sendError(res, 400, *error);
            return;
        }
        query.asProposer = http::parseFlag(req, "as_proposer");
        query.asReceiver = http::parseFlag(req, "as_receiver");

        auto offers = service_->listTradeOffers(query);
        res.setResult(200, "application/json", http::offersToJson(offers).dump());
    }

    void handleSent(const std::string& userId, IRequest& req, IResponse& res)
    {
        std::optional<domain::TradeOfferStatus> status;
        int limit = 0;
        int offset = 0;
        if (!http::parseStatusFilter(req, status)) {
            http::sendError(res, 400, "Unknown status");
            return;
        }
        if (auto error = http::parsePaging(req, limit, offset)) {
            http::sendError(res, 400, *error);
            return;
        }

        auto offers = service_->getSentOffers(userId, status, limit, offset);
        res.setResult(200, "application/json", http::offersToJson(offers).dump());
    }

    void handleReceived(const std::string& userId, IRequest& req, IResponse& res)
    {
        std::optional<domain::TradeOfferStatus> status;
        int limit = 0;
        int offset = 0;
        if (!http::parseStatusFilter(req, status)) {
            http::sendError(res, 400, "Unknown status");
            return;
        }
        if (auto error = http::parsePaging(req, limit, offset)) {
            http::sendError(res, 400, *error);
            return;
        }

        auto offers = service_->getReceivedOffers(userId, status, limit, offset);
        res.setResult(200, "application/json", http::offersToJson(offers).dump());
    }

    void handleByItem(const std::string& itemIdText, IRequest& req, IResponse& res)
    {
        auto itemId = http::parseInt(itemIdText);
        if (!itemId) {
            http::sendError(res, 400, "Invalid item id");
            return;
        }
        std::optional<domain::TradeOfferStatus> status;
        if (!http::parseStatusFilter(req, status)) {
            http::sendError(res, 400, "Unknown status");
            return;
        }

        auto offers = service_->getOffersByItem(*itemId, status);
        res.setResult(200, "application/json", http::offersToJson(offers).dump());
    }

    void handleGetById(const std::string& offerIdText, IResponse& res)
    {
        auto offerId = http::parseInt(offerIdText);
        if (!offerId) {
            http::sendError(res, 400, "Invalid offer id");
            return;
        }

        auto offer = service_->getTradeOffer(*offerId);
        if (!offer) {
            http::sendError(res, 404, "Trade offer with ID " + offerIdText + " not found");
            return;
        }

        res.setResult(200, "application/json", http::offerToJson(*offer).dump());
    }
};

} // namespace matchmaking::adapters::primary
