#pragma once

#include "ports/input/ITradeOfferService.hpp"
#include "ports/input/IMetricsService.hpp"
#include "ports/output/ITradeOfferRepository.hpp"
#include "ports/output/IDependencyOrchestrator.hpp"
#include "application/ItemOwnershipValidator.hpp"
#include "domain/TradeOfferLifecycle.hpp"
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace matchmaking::application {

/**
 * @brief Сервис предложений обмена
 *
 * Архитектура:
 * - POST (создание) → структурная валидация → каталог через оркестратор → БД
 * - PATCH (статус) → правила жизненного цикла → условная запись в БД →
 *   уведомление и чат (best effort, после коммита)
 * - DELETE → только proposer и только PENDING, условное удаление
 * - GET → чтение из БД
 */
class TradeOfferService : public ports::input::ITradeOfferService {
public:
    /// Сколько раз перечитываем предложение, если его статус изменили параллельно
    static constexpr int MAX_TRANSITION_ATTEMPTS = 3;

    TradeOfferService(
        std::shared_ptr<ports::output::ITradeOfferRepository> repository,
        std::shared_ptr<ItemOwnershipValidator> validator,
        std::shared_ptr<ports::output::IDependencyOrchestrator> dependencies,
        std::shared_ptr<ports::input::IMetricsService> metrics
    ) : repository_(std::move(repository))
      , validator_(std::move(validator))
      , dependencies_(std::move(dependencies))
      , metrics_(std::move(metrics))
    {
        std::cout << "[TradeOfferService] Created" << std::endl;
    }

    domain::TradeOfferResult proposeTradeOffer(const domain::TradeOfferRequest& request) override {
        // Структурные ошибки отсекаем до любого удалённого вызова
        auto invalid = checkRequest(request);
        if (invalid) {
            std::cout << "[TradeOfferService] REJECTED: " << *invalid << std::endl;
            return domain::TradeOfferResult::failure(domain::TradeOfferError::INVALID_REQUEST, *invalid);
        }

        auto validation = validator_->validateOwnership(
            request.offeredItemIds, request.requestedItemIds,
            request.proposerId, request.receiverId);
        if (!validation.ok()) {
            std::cout << "[TradeOfferService] REJECTED (" << domain::toString(validation.error)
                      << "): " << validation.message << std::endl;
            return domain::TradeOfferResult::fromValidation(validation);
        }

        domain::TradeOffer offer(request.proposerId, request.receiverId,
                                 request.offeredItemIds, request.requestedItemIds,
                                 request.message);
        auto created = repository_->create(offer);
        metrics_->increment("trade_offers_created_total");

        std::cout << "[TradeOfferService] Offer " << created.id << " created: "
                  << created.proposerId << " -> " << created.receiverId << std::endl;
        return domain::TradeOfferResult::success(created, "Trade offer created");
    }

    domain::TradeOfferResult transition(domain::OfferId offerId,
                                        domain::TradeOfferStatus newStatus,
                                        const std::string& actorId) override
    {
        using domain::TradeOfferLifecycle;

        for (int attempt = 1; attempt <= MAX_TRANSITION_ATTEMPTS; ++attempt) {
            auto current = repository_->findById(offerId);
            if (!current) {
                return domain::TradeOfferResult::failure(
                    domain::TradeOfferError::NOT_FOUND, "Trade offer not found");
            }

            auto role = TradeOfferLifecycle::resolveRole(*current, actorId);
            if (!role) {
                std::cout << "[TradeOfferService] User " << actorId
                          << " is not a party of offer " << offerId << std::endl;
                return domain::TradeOfferResult::failure(
                    domain::TradeOfferError::UNAUTHORIZED, "User is not a party of this trade offer");
            }

            if (!TradeOfferLifecycle::isTransitionAllowed(current->status, newStatus, *role)) {
                return domain::TradeOfferResult::failure(
                    domain::TradeOfferError::INVALID_TRANSITION,
                    "Cannot change status from " + domain::toString(current->status) +
                    " to " + domain::toString(newStatus) + " as " + domain::toString(*role));
            }

            std::optional<domain::Timestamp> respondedAt;
            if (TradeOfferLifecycle::stampsRespondedAt(current->status, newStatus)) {
                respondedAt = domain::Timestamp::now();
            }

            if (!repository_->updateStatus(offerId, newStatus, current->status, respondedAt)) {
                std::cout << "[TradeOfferService] Offer " << offerId
                          << " changed concurrently, re-evaluating (attempt " << attempt << ")" << std::endl;
                continue;
            }

            auto updated = repository_->findById(offerId);
            if (!updated) {
                return domain::TradeOfferResult::failure(
                    domain::TradeOfferError::NOT_FOUND, "Trade offer not found");
            }

            std::cout << "[TradeOfferService] Offer " << offerId << " -> "
                      << domain::toString(newStatus) << " by " << actorId << std::endl;
            metrics_->increment("trade_offers_" + domain::toString(newStatus) + "_total");

            dispatchSideEffects(*updated, newStatus, actorId);
            return domain::TradeOfferResult::success(*updated, "Trade offer " + domain::toString(newStatus));
        }

        // Все попытки проиграли гонку: отвечаем по последнему увиденному статусу
        auto latest = repository_->findById(offerId);
        if (!latest) {
            return domain::TradeOfferResult::failure(
                domain::TradeOfferError::NOT_FOUND, "Trade offer not found");
        }
        return domain::TradeOfferResult::failure(
            domain::TradeOfferError::INVALID_TRANSITION,
            "Trade offer is now " + domain::toString(latest->status));
    }

    domain::TradeOfferResult deleteOffer(domain::OfferId offerId, const std::string& actorId) override {
        auto offer = repository_->findById(offerId);
        if (!offer) {
            return domain::TradeOfferResult::failure(
                domain::TradeOfferError::NOT_FOUND, "Trade offer not found");
        }

        if (offer->proposerId != actorId) {
            return domain::TradeOfferResult::failure(
                domain::TradeOfferError::UNAUTHORIZED, "Only the proposer can delete a trade offer");
        }

        if (offer->status != domain::TradeOfferStatus::PENDING) {
            return domain::TradeOfferResult::failure(
                domain::TradeOfferError::INVALID_STATE, "Can only delete pending trade offers");
        }

        if (!repository_->deleteById(offerId, domain::TradeOfferStatus::PENDING)) {
            // Пока проверяли, предложение успели принять/отклонить или удалить
            auto latest = repository_->findById(offerId);
            if (!latest) {
                return domain::TradeOfferResult::failure(
                    domain::TradeOfferError::NOT_FOUND, "Trade offer not found");
            }
            return domain::TradeOfferResult::failure(
                domain::TradeOfferError::INVALID_STATE, "Can only delete pending trade offers");
        }

        std::cout << "[TradeOfferService] Offer " << offerId << " deleted by " << actorId << std::endl;
        metrics_->increment("trade_offers_deleted_total");
        domain::TradeOfferResult result;
        result.message = "Trade offer deleted";
        return result;
    }

    std::optional<domain::TradeOffer> getTradeOffer(domain::OfferId offerId) override {
        return repository_->findById(offerId);
    }

    std::vector<domain::TradeOffer> listTradeOffers(const domain::TradeOfferQuery& query) override {
        return repository_->find(query);
    }

    std::vector<domain::TradeOffer> getSentOffers(const std::string& userId,
                                                  const std::optional<domain::TradeOfferStatus>& status,
                                                  int limit,
                                                  int offset) override
    {
        domain::TradeOfferQuery query;
        query.userId = userId;
        query.status = status;
        query.asProposer = true;
        query.asReceiver = false;
        query.limit = limit;
        query.offset = offset;
        return repository_->find(query);
    }

    std::vector<domain::TradeOffer> getReceivedOffers(const std::string& userId,
                                                      const std::optional<domain::TradeOfferStatus>& status,
                                                      int limit,
                                                      int offset) override
    {
        domain::TradeOfferQuery query;
        query.userId = userId;
        query.status = status;
        query.asProposer = false;
        query.asReceiver = true;
        query.limit = limit;
        query.offset = offset;
        return repository_->find(query);
    }

    std::vector<domain::TradeOffer> getOffersByItem(domain::ItemId itemId,
                                                    const std::optional<domain::TradeOfferStatus>& status) override
    {
        return repository_->findByItem(itemId, status);
    }

    domain::TradeOfferStatistics getStatistics(const std::string& userId) override {
        auto counts = repository_->countByStatus(userId);

        auto countOf = [&counts](domain::TradeOfferStatus s) -> int64_t {
            auto it = counts.find(s);
            return it != counts.end() ? it->second : 0;
        };

        domain::TradeOfferStatistics stats;
        for (const auto& [status, count] : counts) {
            stats.totalOffers += count;
        }
        stats.pendingOffers = countOf(domain::TradeOfferStatus::PENDING);
        stats.acceptedOffers = countOf(domain::TradeOfferStatus::ACCEPTED);
        stats.rejectedOffers = countOf(domain::TradeOfferStatus::REJECTED);
        stats.completedOffers = countOf(domain::TradeOfferStatus::COMPLETED);
        return stats;
    }

private:
    std::shared_ptr<ports::output::ITradeOfferRepository> repository_;
    std::shared_ptr<ItemOwnershipValidator> validator_;
    std::shared_ptr<ports::output::IDependencyOrchestrator> dependencies_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;

    /**
     * @brief Уведомление и чат после коммита
     *
     * Результат оркестратора только логируется: переход уже зафиксирован.
     */
    void dispatchSideEffects(const domain::TradeOffer& offer,
                             domain::TradeOfferStatus newStatus,
                             const std::string& actorId)
    {
        auto notification = domain::TradeOfferLifecycle::notificationFor(offer, newStatus, actorId);
        if (notification && !dependencies_->notify(*notification)) {
            std::cerr << "[TradeOfferService] Notification for offer " << offer.id << " not delivered" << std::endl;
        }

        if (domain::TradeOfferLifecycle::requiresChatRoom(newStatus) &&
            !dependencies_->provisionChatRoom(domain::TradeOfferLifecycle::chatRoomFor(offer))) {
            std::cerr << "[TradeOfferService] Chat room for offer " << offer.id << " not created" << std::endl;
        }
    }

    static std::optional<std::string> checkRequest(const domain::TradeOfferRequest& request) {
        using domain::TradeOfferRequest;

        if (request.proposerId.empty() || request.proposerId.size() > TradeOfferRequest::MAX_USER_ID_LENGTH) {
            return "proposer_id must be 1-100 characters";
        }
        if (request.receiverId.empty() || request.receiverId.size() > TradeOfferRequest::MAX_USER_ID_LENGTH) {
            return "receiver_id must be 1-100 characters";
        }
        if (request.proposerId == request.receiverId) {
            return "Cannot create trade offer with yourself";
        }
        if (request.offeredItemIds.empty()) {
            return "offered_item_ids must not be empty";
        }
        if (request.requestedItemIds.empty()) {
            return "requested_item_ids must not be empty";
        }
        if (request.message && request.message->size() > TradeOfferRequest::MAX_MESSAGE_LENGTH) {
            return "message must be at most 1000 characters";
        }

        std::set<domain::ItemId> offered(request.offeredItemIds.begin(), request.offeredItemIds.end());
        if (offered.size() != request.offeredItemIds.size()) {
            return "offered_item_ids contains duplicates";
        }
        std::set<domain::ItemId> requested(request.requestedItemIds.begin(), request.requestedItemIds.end());
        if (requested.size() != request.requestedItemIds.size()) {
            return "requested_item_ids contains duplicates";
        }
        for (auto id : requested) {
            if (offered.count(id)) {
                return "Item " + std::to_string(id) + " is both offered and requested";
            }
        }
        return std::nullopt;
    }
};

} // namespace matchmaking::application
