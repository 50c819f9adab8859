#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ITradeOfferService.hpp"
#include "adapters/primary/TradeOfferJson.hpp"
#include <memory>
#include <iostream>

namespace matchmaking::adapters::primary
{

    /**
     * @brief GET /api/v1/statistics/{user_id} - сводка по предложениям пользователя
     */
    class GetStatisticsHandler : public IHttpHandler
    {
    public:
        explicit GetStatisticsHandler(std::shared_ptr<ports::input::ITradeOfferService> service)
            : service_(std::move(service))
        {
            std::cout << "[GetStatisticsHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "GET")
            {
                http::sendError(res, 405, "Method not allowed");
                return;
            }

            auto userId = req.getPathParam(0).value_or("");
            if (userId.empty())
            {
                http::sendError(res, 400, "User ID is required");
                return;
            }

            try
            {
                auto stats = service_->getStatistics(userId);
                res.setResult(200, "application/json", http::statisticsToJson(stats).dump());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[GetStatisticsHandler] Error: " << e.what() << std::endl;
                http::sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::ITradeOfferService> service_;
    };

} // namespace matchmaking::adapters::primary
