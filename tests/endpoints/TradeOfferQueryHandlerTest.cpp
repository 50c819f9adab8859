/**
 * @file TradeOfferQueryHandlerTest.cpp
 * @brief Unit-тесты для TradeOfferQueryHandler
 *
 * GET /api/v1/offers, /api/v1/offers/{id}, /sent/{user}, /received/{user}, /by-item/{item}
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/TradeOfferQueryHandler.hpp"
#include "mocks/MockTradeOfferService.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>
#include <limits>
#include <map>

using namespace matchmaking;
using namespace matchmaking::adapters::primary;
using namespace matchmaking::tests;
using ::testing::_;
using ::testing::Eq;
using ::testing::Optional;
using ::testing::Return;

class TradeOfferQueryHandlerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        mockService_ = std::make_shared<MockTradeOfferService>();
        handler_ = std::make_unique<TradeOfferQueryHandler>(mockService_);
    }

    SimpleRequest createRequest(const std::string &path,
                                const std::map<std::string, std::string> &query = {})
    {
        SimpleRequest req;
        req.setMethod("GET");
        req.setPath(path);
        for (const auto &[key, value] : query)
        {
            req.setQueryParam(key, value);
        }
        return req;
    }

    std::shared_ptr<MockTradeOfferService> mockService_;
    std::unique_ptr<TradeOfferQueryHandler> handler_;
};

// ============================================================================
// ТЕСТЫ: GET /api/v1/offers
// ============================================================================

TEST_F(TradeOfferQueryHandlerTest, List_PassesFiltersToService)
{
    domain::TradeOfferQuery captured;
    EXPECT_CALL(*mockService_, listTradeOffers(_))
        .WillOnce([&captured](const domain::TradeOfferQuery &query) {
            captured = query;
            return std::vector<domain::TradeOffer>{sampleOffer(2), sampleOffer(1)};
        });

    auto req = createRequest("/api/v1/offers", {{"user_id", "alice"},
                                                {"status", "pending"},
                                                {"as_proposer", "true"},
                                                {"limit", "10"},
                                                {"offset", "5"}});
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(captured.userId, "alice");
    EXPECT_EQ(captured.status, domain::TradeOfferStatus::PENDING);
    EXPECT_EQ(captured.asProposer, true);
    EXPECT_FALSE(captured.asReceiver.has_value());
    EXPECT_EQ(captured.limit, 10);
    EXPECT_EQ(captured.offset, 5);

    auto json = nlohmann::json::parse(res.getBody());
    ASSERT_TRUE(json.is_array());
    ASSERT_EQ(json.size(), 2u);
    EXPECT_EQ(json[0]["id"], 2);
}

TEST_F(TradeOfferQueryHandlerTest, List_WithoutUserId_Returns400)
{
    EXPECT_CALL(*mockService_, listTradeOffers(_)).Times(0);

    auto req = createRequest("/api/v1/offers");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

TEST_F(TradeOfferQueryHandlerTest, List_LimitOutOfRange_Returns400)
{
    EXPECT_CALL(*mockService_, listTradeOffers(_)).Times(0);

    auto req = createRequest("/api/v1/offers", {{"user_id", "alice"}, {"limit", "101"}});
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(json["error"], "limit must be between 1 and 100");
}

TEST_F(TradeOfferQueryHandlerTest, List_UnknownStatus_Returns400)
{
    EXPECT_CALL(*mockService_, listTradeOffers(_)).Times(0);

    auto req = createRequest("/api/v1/offers", {{"user_id", "alice"}, {"status", "archived"}});
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

// ============================================================================
// ТЕСТЫ: GET /api/v1/offers/{id}
// ============================================================================

TEST_F(TradeOfferQueryHandlerTest, GetById_Found_Returns200)
{
    EXPECT_CALL(*mockService_, getTradeOffer(4)).WillOnce(Return(sampleOffer(4)));

    auto req = createRequest("/api/v1/offers/4");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(json["id"], 4);
    EXPECT_EQ(json["proposer_id"], "alice");
    EXPECT_EQ(json["message"], "Swap?");
}

TEST_F(TradeOfferQueryHandlerTest, GetById_Missing_Returns404)
{
    EXPECT_CALL(*mockService_, getTradeOffer(4)).WillOnce(Return(std::nullopt));

    auto req = createRequest("/api/v1/offers/4");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 404);
    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(json["error"], "Trade offer with ID 4 not found");
}

// ============================================================================
// ТЕСТЫ: sent / received / by-item
// ============================================================================

TEST_F(TradeOfferQueryHandlerTest, Sent_DefaultPaging)
{
    EXPECT_CALL(*mockService_, getSentOffers("alice", Eq(std::nullopt), 20, 0))
        .WillOnce(Return(std::vector<domain::TradeOffer>{sampleOffer(1)}));

    auto req = createRequest("/api/v1/offers/sent/alice");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(nlohmann::json::parse(res.getBody()).size(), 1u);
}

TEST_F(TradeOfferQueryHandlerTest, Sent_OffsetBeyondIntIsClamped)
{
    EXPECT_CALL(*mockService_, getSentOffers("alice", Eq(std::nullopt), 20, std::numeric_limits<int>::max()))
        .WillOnce(Return(std::vector<domain::TradeOffer>{}));

    auto req = createRequest("/api/v1/offers/sent/alice", {{"offset", "3000000000"}});
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_TRUE(nlohmann::json::parse(res.getBody()).empty());
}

TEST_F(TradeOfferQueryHandlerTest, Received_WithStatus)
{
    EXPECT_CALL(*mockService_, getReceivedOffers("bob", Optional(domain::TradeOfferStatus::ACCEPTED), 20, 0))
        .WillOnce(Return(std::vector<domain::TradeOffer>{}));

    auto req = createRequest("/api/v1/offers/received/bob", {{"status", "accepted"}});
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(res.getBody(), "[]");
}

TEST_F(TradeOfferQueryHandlerTest, ByItem_ParsesItemId)
{
    EXPECT_CALL(*mockService_, getOffersByItem(3, Eq(std::nullopt)))
        .WillOnce(Return(std::vector<domain::TradeOffer>{sampleOffer(1)}));

    auto req = createRequest("/api/v1/offers/by-item/3");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
}

TEST_F(TradeOfferQueryHandlerTest, ByItem_NonNumeric_Returns400)
{
    EXPECT_CALL(*mockService_, getOffersByItem(_, _)).Times(0);

    auto req = createRequest("/api/v1/offers/by-item/abc");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}
