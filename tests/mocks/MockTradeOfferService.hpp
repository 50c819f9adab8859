#pragma once

#include "ports/input/ITradeOfferService.hpp"
#include <gmock/gmock.h>

namespace matchmaking::tests {

class MockTradeOfferService : public ports::input::ITradeOfferService
{
public:
    MOCK_METHOD(domain::TradeOfferResult, proposeTradeOffer, (const domain::TradeOfferRequest &), (override));
    MOCK_METHOD(domain::TradeOfferResult, transition,
                (domain::OfferId, domain::TradeOfferStatus, const std::string &), (override));
    MOCK_METHOD(domain::TradeOfferResult, deleteOffer, (domain::OfferId, const std::string &), (override));
    MOCK_METHOD(std::optional<domain::TradeOffer>, getTradeOffer, (domain::OfferId), (override));
    MOCK_METHOD(std::vector<domain::TradeOffer>, listTradeOffers, (const domain::TradeOfferQuery &), (override));
    MOCK_METHOD(std::vector<domain::TradeOffer>, getSentOffers,
                (const std::string &, const std::optional<domain::TradeOfferStatus> &, int, int), (override));
    MOCK_METHOD(std::vector<domain::TradeOffer>, getReceivedOffers,
                (const std::string &, const std::optional<domain::TradeOfferStatus> &, int, int), (override));
    MOCK_METHOD(std::vector<domain::TradeOffer>, getOffersByItem,
                (domain::ItemId, const std::optional<domain::TradeOfferStatus> &), (override));
    MOCK_METHOD(domain::TradeOfferStatistics, getStatistics, (const std::string &), (override));
};

/// Предложение для ответов мока
inline domain::TradeOffer sampleOffer(domain::OfferId id,
                                      domain::TradeOfferStatus status = domain::TradeOfferStatus::PENDING)
{
    domain::TradeOffer offer("alice", "bob", {1, 2}, {3}, std::string("Swap?"));
    offer.id = id;
    offer.status = status;
    return offer;
}

} // namespace matchmaking::tests
