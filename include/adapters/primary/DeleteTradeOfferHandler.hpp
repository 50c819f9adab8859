#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ITradeOfferService.hpp"
#include "adapters/primary/TradeOfferJson.hpp"
#include <memory>
#include <iostream>

namespace matchmaking::adapters::primary
{

    /**
     * @brief DELETE /api/v1/offers/{id}?user_id=... - удалить предложение
     *
     * Роутер регистрирует с паттерном "/api/v1/offers/*".
     * Только proposer и только pending; 204 без тела.
     */
    class DeleteTradeOfferHandler : public IHttpHandler
    {
    public:
        explicit DeleteTradeOfferHandler(std::shared_ptr<ports::input::ITradeOfferService> service)
            : service_(std::move(service))
        {
            std::cout << "[DeleteTradeOfferHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "DELETE")
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
                auto result = service_->deleteOffer(*offerId, userId);
                if (!result.ok())
                {
                    http::sendFailure(res, result);
                    return;
                }

                res.setResult(204, "application/json", "");
            }
            catch (const std::exception &e)
            {
                std::cerr << "[DeleteTradeOfferHandler] Error: " << e.what() << std::endl;
                http::sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::ITradeOfferService> service_;
    };

} // namespace matchmaking::adapters::primary
