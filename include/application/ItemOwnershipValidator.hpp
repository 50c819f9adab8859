#pragma once

#include "ports/output/IDependencyOrchestrator.hpp"
#include "domain/TradeOfferResult.hpp"
#include "domain/errors/DependencyErrors.hpp"
#include <algorithm>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

namespace matchmaking::application {

/**
 * @brief Проверка вещей обмена через каталог
 *
 * Один пакетный запрос на offered ∪ requested, затем проверки строго по порядку:
 *  1. все существуют           -> ITEMS_NOT_FOUND
 *  2. все активны              -> ITEMS_INACTIVE
 *  3. offered принадлежат proposer  -> WRONG_OWNER (role=PROPOSER)
 *  4. requested принадлежат receiver -> WRONG_OWNER (role=RECEIVER)
 *
 * Возвращается первая нарушенная категория с ПОЛНЫМ списком id.
 * Недоступность каталога -> DEPENDENCY_UNAVAILABLE, отдельно от четырёх проверок.
 */
class ItemOwnershipValidator {
public:
    explicit ItemOwnershipValidator(std::shared_ptr<ports::output::IDependencyOrchestrator> dependencies)
        : dependencies_(std::move(dependencies))
    {
        std::cout << "[ItemOwnershipValidator] Created" << std::endl;
    }

    domain::OwnershipValidationResult validateOwnership(
        const std::vector<domain::ItemId>& offeredIds,
        const std::vector<domain::ItemId>& requestedIds,
        const std::string& proposerId,
        const std::string& receiverId)
    {
        std::vector<domain::ItemId> allIds = offeredIds;
        for (auto id : requestedIds) {
            if (std::find(allIds.begin(), allIds.end(), id) == allIds.end()) {
                allIds.push_back(id);
            }
        }

        std::vector<domain::ItemValidation> verdicts;
        try {
            verdicts = dependencies_->validateItems(allIds);
        } catch (const domain::DependencyUnavailableError& e) {
            std::cerr << "[ItemOwnershipValidator] Catalog unavailable: " << e.what() << std::endl;
            return domain::OwnershipValidationResult::failure(
                domain::TradeOfferError::DEPENDENCY_UNAVAILABLE, {},
                "Catalog service unavailable");
        }

        std::unordered_map<domain::ItemId, domain::ItemValidation> byId;
        for (const auto& v : verdicts) {
            byId[v.itemId] = v;
        }
        auto verdictFor = [&byId](domain::ItemId id) {
            auto it = byId.find(id);
            return it != byId.end() ? it->second : domain::ItemValidation::notFound(id);
        };

        // 1. Существование
        std::vector<domain::ItemId> missing;
        for (auto id : allIds) {
            if (!verdictFor(id).exists) missing.push_back(id);
        }
        if (!missing.empty()) {
            return domain::OwnershipValidationResult::failure(
                domain::TradeOfferError::ITEMS_NOT_FOUND, missing,
                "Items not found: " + joinIds(missing));
        }

        // 2. Активность
        std::vector<domain::ItemId> inactive;
        for (auto id : allIds) {
            if (!verdictFor(id).isActive) inactive.push_back(id);
        }
        if (!inactive.empty()) {
            return domain::OwnershipValidationResult::failure(
                domain::TradeOfferError::ITEMS_INACTIVE, inactive,
                "Items are not active: " + joinIds(inactive));
        }

        // 3. Владелец предлагаемых вещей
        std::vector<domain::ItemId> notProposers;
        for (auto id : offeredIds) {
            if (verdictFor(id).ownerId != proposerId) notProposers.push_back(id);
        }
        if (!notProposers.empty()) {
            return domain::OwnershipValidationResult::failure(
                domain::TradeOfferError::WRONG_OWNER, notProposers,
                "Proposer does not own offered items: " + joinIds(notProposers),
                domain::PartyRole::PROPOSER);
        }

        // 4. Владелец запрашиваемых вещей
        std::vector<domain::ItemId> notReceivers;
        for (auto id : requestedIds) {
            if (verdictFor(id).ownerId != receiverId) notReceivers.push_back(id);
        }
        if (!notReceivers.empty()) {
            return domain::OwnershipValidationResult::failure(
                domain::TradeOfferError::WRONG_OWNER, notReceivers,
                "Receiver does not own requested items: " + joinIds(notReceivers),
                domain::PartyRole::RECEIVER);
        }

        std::cout << "[ItemOwnershipValidator] " << allIds.size() << " items validated" << std::endl;
        return domain::OwnershipValidationResult::success();
    }

private:
    std::shared_ptr<ports::output::IDependencyOrchestrator> dependencies_;

    static std::string joinIds(const std::vector<domain::ItemId>& ids) {
        std::ostringstream ss;
        ss << "[";
        for (size_t i = 0; i < ids.size(); ++i) {
            if (i > 0) ss << ", ";
            ss << ids[i];
        }
        ss << "]";
        return ss.str();
    }
};

} // namespace matchmaking::application
