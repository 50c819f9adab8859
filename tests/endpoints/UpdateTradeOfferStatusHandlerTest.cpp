/**
 * @file UpdateTradeOfferStatusHandlerTest.cpp
 * @brief Unit-тесты для UpdateTradeOfferStatusHandler
 *
 * PATCH /api/v1/offers/{id}?user_id=... - сменить статус
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/UpdateTradeOfferStatusHandler.hpp"
#include "mocks/MockTradeOfferService.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using namespace matchmaking;
using namespace matchmaking::adapters::primary;
using namespace matchmaking::tests;
using ::testing::_;
using ::testing::Return;

class UpdateTradeOfferStatusHandlerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        mockService_ = std::make_shared<MockTradeOfferService>();
        handler_ = std::make_unique<UpdateTradeOfferStatusHandler>(mockService_);
    }

    SimpleRequest createRequest(const std::string &path,
                                const std::string &body,
                                const std::string &userId = "bob")
    {
        SimpleRequest req;
        req.setMethod("PATCH");
        req.setPath(path);
        req.setPathPattern("/api/v1/offers/*");
        req.setBody(body);
        if (!userId.empty())
        {
            req.setQueryParam("user_id", userId);
        }
        return req;
    }

    std::shared_ptr<MockTradeOfferService> mockService_;
    std::unique_ptr<UpdateTradeOfferStatusHandler> handler_;
};

// ============================================================================
// ТЕСТЫ: PATCH /api/v1/offers/{id}
// ============================================================================

TEST_F(UpdateTradeOfferStatusHandlerTest, Accept_Returns200)
{
    auto accepted = sampleOffer(5, domain::TradeOfferStatus::ACCEPTED);
    accepted.respondedAt = domain::Timestamp::now();

    EXPECT_CALL(*mockService_, transition(5, domain::TradeOfferStatus::ACCEPTED, "bob"))
        .WillOnce(Return(domain::TradeOfferResult::success(accepted, "Trade offer accepted")));

    auto req = createRequest("/api/v1/offers/5", R"({"status": "accepted"})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(json["status"], "accepted");
    EXPECT_TRUE(json["responded_at"].is_string());
}

TEST_F(UpdateTradeOfferStatusHandlerTest, InvalidTransition_Returns400)
{
    EXPECT_CALL(*mockService_, transition(5, domain::TradeOfferStatus::ACCEPTED, "alice"))
        .WillOnce(Return(domain::TradeOfferResult::failure(
            domain::TradeOfferError::INVALID_TRANSITION, "Cannot change status from pending to accepted as proposer")));

    auto req = createRequest("/api/v1/offers/5", R"({"status": "accepted"})", "alice");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(json["code"], "INVALID_TRANSITION");
}

TEST_F(UpdateTradeOfferStatusHandlerTest, NotAParty_Returns403)
{
    EXPECT_CALL(*mockService_, transition(5, _, "mallory"))
        .WillOnce(Return(domain::TradeOfferResult::failure(
            domain::TradeOfferError::UNAUTHORIZED, "User is not a party of this trade offer")));

    auto req = createRequest("/api/v1/offers/5", R"({"status": "rejected"})", "mallory");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 403);
}

TEST_F(UpdateTradeOfferStatusHandlerTest, UnknownOffer_Returns404)
{
    EXPECT_CALL(*mockService_, transition(99, _, _))
        .WillOnce(Return(domain::TradeOfferResult::failure(
            domain::TradeOfferError::NOT_FOUND, "Trade offer not found")));

    auto req = createRequest("/api/v1/offers/99", R"({"status": "rejected"})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 404);
}

TEST_F(UpdateTradeOfferStatusHandlerTest, UnknownStatus_Returns400)
{
    EXPECT_CALL(*mockService_, transition(_, _, _)).Times(0);

    auto req = createRequest("/api/v1/offers/5", R"({"status": "pending-ish"})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(json["error"], "Unknown status");
}

TEST_F(UpdateTradeOfferStatusHandlerTest, MissingUserId_Returns400)
{
    EXPECT_CALL(*mockService_, transition(_, _, _)).Times(0);

    auto req = createRequest("/api/v1/offers/5", R"({"status": "accepted"})", "");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(json["error"], "user_id is required");
}

TEST_F(UpdateTradeOfferStatusHandlerTest, NonNumericId_Returns400)
{
    EXPECT_CALL(*mockService_, transition(_, _, _)).Times(0);

    auto req = createRequest("/api/v1/offers/abc", R"({"status": "accepted"})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}
