#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ITradeOfferService.hpp"
#include "adapters/primary/TradeOfferJson.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace matchmaking::adapters::primary
{

    /**
     * @brief PATCH /api/v1/offers/{id}?user_id=... - сменить статус
     *
     * Роутер регистрирует с паттерном "/api/v1/offers/*".
     * Тело: {"status": "accepted" | "rejected" | "cancelled" | "completed"}
     */
    class UpdateTradeOfferStatusHandler : public IHttpHandler
    {
    public:
        explicit UpdateTradeOfferStatusHandler(std::shared_ptr<ports::input::ITradeOfferService> service)
            : service_(std::move(service))
        {
            std::cout << "[UpdateTradeOfferStatusHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "PATCH")
            {
                http::sendError(res, 405, "Method not allowed");
                return;
            }

            auto offerId = http::parseInt(req.getPathParam(0).value_or(""));
            if (!offerId)
            {
                http::sendError(res, 400, "Invalid offer id");
                return;
            }

            auto userId = req.getQueryParam("user_id").value_or("");
            if (userId.empty())
            {
                http::sendError(res, 400, "user_id is required");
                return;
            }

            try
            {
                auto body = nlohmann::json::parse(req.getBody());
                auto status = domain::parseTradeOfferStatus(body.value("status", ""));
                if (!status)
                {
                    http::sendError(res, 400, "Unknown status");
                    return;
                }

                auto result = service_->transition(*offerId, *status, userId);
                if (!result.ok() || !result.offer)
                {
                    http::sendFailure(res, result);
                    return;
                }

                res.setResult(200, "application/json", http::offerToJson(*result.offer).dump());
            }
            catch (const nlohmann::json::exception &e)
            {
                http::sendError(res, 400, "Invalid JSON");
            }
            catch (const std::exception &e)
            {
                std::cerr << "[UpdateTradeOfferStatusHandler] Error: " << e.what() << std::endl;
                http::sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::ITradeOfferService> service_;
    };

} // namespace matchmaking::adapters::primary
