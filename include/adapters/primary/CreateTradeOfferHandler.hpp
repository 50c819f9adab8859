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
     * @brief POST /api/v1/offers - создать предложение обмена
     *
     * Тело: {"proposer_id", "receiver_id", "offered_item_ids", "requested_item_ids", "message"?}
     * 201 - создано; 400/403/404 - отказ валидации; 503 - каталог недоступен.
     */
    class CreateTradeOfferHandler : public IHttpHandler
    {
    public:
        explicit CreateTradeOfferHandler(std::shared_ptr<ports::input::ITradeOfferService> service)
            : service_(std::move(service))
        {
            std::cout << "[CreateTradeOfferHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "POST")
            {
                http::sendError(res, 405, "Method not allowed");
                return;
            }

            try
            {
                auto body = nlohmann::json::parse(req.getBody());

                domain::TradeOfferRequest request;
                request.proposerId = body.value("proposer_id", "");
                request.receiverId = body.value("receiver_id", "");
                request.offeredItemIds = body.value("offered_item_ids", std::vector<domain::ItemId>{});
                request.requestedItemIds = body.value("requested_item_ids", std::vector<domain::ItemId>{});
                if (body.contains("message") && body["message"].is_string())
                {
                    request.message = body["message"].get<std::string>();
                }

                auto result = service_->proposeTradeOffer(request);
                if (!result.ok() || !result.offer)
                {
                    http::sendFailure(res, result);
                    return;
                }

                res.setResult(201, "application/json", http::offerToJson(*result.offer).dump());
            }
            catch (const nlohmann::json::exception &e)
            {
                http::sendError(res, 400, "Invalid JSON");
            }
            catch (const std::exception &e)
            {
                std::cerr << "[CreateTradeOfferHandler] Error: " << e.what() << std::endl;
                http::sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::ITradeOfferService> service_;
    };

} // namespace matchmaking::adapters::primary
