#pragma once

#include "ports/output/ITradeOfferRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace matchmaking::adapters::secondary
{

    /**
     * @brief Хранилище предложений обмена в PostgreSQL
     *
     * Смена статуса и удаление условные (WHERE status = $expected):
     * из двух конкурирующих переходов строку меняет только один.
     * responded_at пишется через COALESCE, поэтому выставляется максимум один раз.
     */
    class PostgresTradeOfferRepository : public ports::output::ITradeOfferRepository
    {
    public:
        explicit PostgresTradeOfferRepository(std::shared_ptr<settings::DbSettings> s) : settings_(std::move(s))
        {
            initSchema();
            std::cout << "[TradeOfferRepo] Initialized for " << settings_->getName() << std::endl;
        }

        domain::TradeOffer create(const domain::TradeOffer &offer) override
        {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            auto r = t.exec_params(
                "INSERT INTO trade_offers (proposer_id, receiver_id, offered_item_ids, requested_item_ids, status, message) "
                "VALUES ($1, $2, $3::bigint[], $4::bigint[], $5, $6) RETURNING " + COLUMNS,
                offer.proposerId,
                offer.receiverId,
                toPgArray(offer.offeredItemIds),
                toPgArray(offer.requestedItemIds),
                domain::toString(offer.status),
                offer.message);
            t.commit();

            auto created = parseRow(r[0]);
            std::cout << "[TradeOfferRepo] Inserted offer " << created.id << std::endl;
            return created;
        }

        std::optional<domain::TradeOffer> findById(domain::OfferId id) override
        {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            auto r = t.exec_params("SELECT " + COLUMNS + " FROM trade_offers WHERE id=$1", id);
            if (r.empty())
                return std::nullopt;
            return parseRow(r[0]);
        }

        bool updateStatus(domain::OfferId id,
                          domain::TradeOfferStatus newStatus,
                          domain::TradeOfferStatus expectedStatus,
                          const std::optional<domain::Timestamp> &respondedAt) override
        {
            std::optional<std::string> respondedAtText;
            if (respondedAt)
                respondedAtText = respondedAt->toString();

            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            auto r = t.exec_params(
                "UPDATE trade_offers SET status=$2, updated_at=NOW(), "
                "responded_at=COALESCE(responded_at, $4::timestamptz) "
                "WHERE id=$1 AND status=$3",
                id,
                domain::toString(newStatus),
                domain::toString(expectedStatus),
                respondedAtText);
            t.commit();
            return r.affected_rows() == 1;
        }

        bool deleteById(domain::OfferId id, domain::TradeOfferStatus expectedStatus) override
        {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            auto r = t.exec_params(
                "DELETE FROM trade_offers WHERE id=$1 AND status=$2",
                id,
                domain::toString(expectedStatus));
            t.commit();
            return r.affected_rows() == 1;
        }

        std::vector<domain::TradeOffer> find(const domain::TradeOfferQuery &query) override
        {
            std::optional<std::string> status;
            if (query.status)
                status = domain::toString(*query.status);

            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            auto r = t.exec_params(
                "SELECT " + COLUMNS + " FROM trade_offers "
                "WHERE (($2 AND proposer_id=$1) OR ($3 AND receiver_id=$1)) "
                "AND ($4::text IS NULL OR status=$4) "
                "ORDER BY created_at DESC, id DESC LIMIT $5 OFFSET $6",
                query.userId,
                query.matchesProposer(),
                query.matchesReceiver(),
                status,
                query.limit,
                query.offset);
            return parseRows(r);
        }

        std::vector<domain::TradeOffer> findByItem(
            domain::ItemId itemId,
            const std::optional<domain::TradeOfferStatus> &status) override
        {
            std::optional<std::string> statusText;
            if (status)
                statusText = domain::toString(*status);

            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            auto r = t.exec_params(
                "SELECT " + COLUMNS + " FROM trade_offers "
                "WHERE ($1 = ANY(offered_item_ids) OR $1 = ANY(requested_item_ids)) "
                "AND ($2::text IS NULL OR status=$2) "
                "ORDER BY created_at DESC, id DESC",
                itemId,
                statusText);
            return parseRows(r);
        }

        std::map<domain::TradeOfferStatus, int64_t> countByStatus(const std::string &userId) override
        {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            auto r = t.exec_params(
                "SELECT status, COUNT(*) FROM trade_offers "
                "WHERE proposer_id=$1 OR receiver_id=$1 GROUP BY status",
                userId);

            std::map<domain::TradeOfferStatus, int64_t> counts;
            for (const auto &row : r)
            {
                auto status = domain::parseTradeOfferStatus(row[0].as<std::string>());
                if (!status)
                {
                    std::cerr << "[TradeOfferRepo] Unknown status in table: " << row[0].as<std::string>() << std::endl;
                    continue;
                }
                counts[*status] = row[1].as<int64_t>();
            }
            return counts;
        }

    private:
        std::shared_ptr<settings::DbSettings> settings_;

        void initSchema()
        {
            try
            {
                pqxx::connection c(settings_->getConnectionString());
                pqxx::work t(c);
                t.exec(R"(
                    CREATE TABLE IF NOT EXISTS trade_offers (
                        id SERIAL PRIMARY KEY,
                        proposer_id VARCHAR(100) NOT NULL,
                        receiver_id VARCHAR(100) NOT NULL,
                        offered_item_ids BIGINT[] NOT NULL,
                        requested_item_ids BIGINT[] NOT NULL,
                        status VARCHAR(20) NOT NULL DEFAULT 'pending',
                        message TEXT,
                        created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                        updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                        responded_at TIMESTAMPTZ
                    );

                    CREATE INDEX IF NOT EXISTS idx_trade_offers_proposer ON trade_offers(proposer_id);
                    CREATE INDEX IF NOT EXISTS idx_trade_offers_receiver ON trade_offers(receiver_id);
                    CREATE INDEX IF NOT EXISTS idx_trade_offers_status ON trade_offers(status);
                )");
                t.commit();
                std::cout << "[TradeOfferRepo] Schema initialized" << std::endl;
            }
            catch (const std::exception &e)
            {
                std::cerr << "[TradeOfferRepo] initSchema error: " << e.what() << std::endl;
            }
        }

        // Временные метки читаются в UTC, без смещения
        inline static const std::string COLUMNS =
            "id, proposer_id, receiver_id, offered_item_ids::text, requested_item_ids::text, status, message, "
            "(created_at AT TIME ZONE 'UTC')::text, (updated_at AT TIME ZONE 'UTC')::text, "
            "(responded_at AT TIME ZONE 'UTC')::text";

        static std::vector<domain::TradeOffer> parseRows(const pqxx::result &r)
        {
            std::vector<domain::TradeOffer> offers;
            offers.reserve(r.size());
            for (const auto &row : r)
                offers.push_back(parseRow(row));
            return offers;
        }

        static domain::TradeOffer parseRow(const pqxx::row &row)
        {
            domain::TradeOffer offer;
            offer.id = row[0].as<domain::OfferId>();
            offer.proposerId = row[1].as<std::string>();
            offer.receiverId = row[2].as<std::string>();
            offer.offeredItemIds = parsePgArray(row[3].as<std::string>());
            offer.requestedItemIds = parsePgArray(row[4].as<std::string>());

            auto status = domain::parseTradeOfferStatus(row[5].as<std::string>());
            if (!status)
                throw std::runtime_error("Unknown trade offer status: " + row[5].as<std::string>());
            offer.status = *status;

            if (!row[6].is_null())
                offer.message = row[6].as<std::string>();
            offer.createdAt = domain::Timestamp::fromString(row[7].as<std::string>());
            offer.updatedAt = domain::Timestamp::fromString(row[8].as<std::string>());
            if (!row[9].is_null())
                offer.respondedAt = domain::Timestamp::fromString(row[9].as<std::string>());
            return offer;
        }

        static std::string toPgArray(const std::vector<domain::ItemId> &ids)
        {
            std::ostringstream ss;
            ss << "{";
            for (size_t i = 0; i < ids.size(); ++i)
            {
                if (i > 0)
                    ss << ",";
                ss << ids[i];
            }
            ss << "}";
            return ss.str();
        }

        static std::vector<domain::ItemId> parsePgArray(const std::string &text)
        {
            std::vector<domain::ItemId> ids;
            std::string inner = text;
            if (!inner.empty() && inner.front() == '{')
                inner.erase(0, 1);
            if (!inner.empty() && inner.back() == '}')
                inner.pop_back();

            std::istringstream ss(inner);
            std::string token;
            while (std::getline(ss, token, ','))
            {
                if (!token.empty())
                    ids.push_back(std::stoll(token));
            }
            return ids;
        }
    };

} // namespace matchmaking::adapters::secondary
