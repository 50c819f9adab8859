#pragma once

#include "TradeOffer.hpp"
#include "Notification.hpp"
#include "enums/TradeOfferStatus.hpp"
#include "enums/PartyRole.hpp"
#include <optional>
#include <string>

namespace matchmaking::domain {

/**
 * @brief Правила жизненного цикла предложения обмена
 *
 * | Текущий  | Новый     | Кто может            |
 * |----------|-----------|----------------------|
 * | pending  | cancelled | proposer             |
 * | pending  | accepted  | receiver             |
 * | pending  | rejected  | receiver             |
 * | accepted | completed | proposer или receiver |
 *
 * Всё остальное - INVALID_TRANSITION. Switch'и без default,
 * чтобы -Wswitch ловил непокрытый статус.
 */
class TradeOfferLifecycle {
public:
    /**
     * @brief Роль пользователя в предложении; nullopt - посторонний (UNAUTHORIZED)
     */
    static std::optional<PartyRole> resolveRole(const TradeOffer& offer, const std::string& actorId) {
        if (actorId == offer.proposerId) return PartyRole::PROPOSER;
        if (actorId == offer.receiverId) return PartyRole::RECEIVER;
        return std::nullopt;
    }

    static bool isTransitionAllowed(TradeOfferStatus current, TradeOfferStatus requested, PartyRole actor) {
        switch (current) {
            case TradeOfferStatus::PENDING:
                switch (requested) {
                    case TradeOfferStatus::CANCELLED:
                        return actor == PartyRole::PROPOSER;
                    case TradeOfferStatus::ACCEPTED:
                    case TradeOfferStatus::REJECTED:
                        return actor == PartyRole::RECEIVER;
                    case TradeOfferStatus::PENDING:
                    case TradeOfferStatus::COMPLETED:
                        return false;
                }
                return false;

            case TradeOfferStatus::ACCEPTED:
                switch (requested) {
                    case TradeOfferStatus::COMPLETED:
                        return true;
                    case TradeOfferStatus::PENDING:
                    case TradeOfferStatus::ACCEPTED:
                    case TradeOfferStatus::REJECTED:
                    case TradeOfferStatus::CANCELLED:
                        return false;
                }
                return false;

            case TradeOfferStatus::REJECTED:
            case TradeOfferStatus::CANCELLED:
            case TradeOfferStatus::COMPLETED:
                return false;
        }
        return false;
    }

    static bool isTerminal(TradeOfferStatus status) {
        switch (status) {
            case TradeOfferStatus::REJECTED:
            case TradeOfferStatus::CANCELLED:
            case TradeOfferStatus::COMPLETED:
                return true;
            case TradeOfferStatus::PENDING:
            case TradeOfferStatus::ACCEPTED:
                return false;
        }
        return false;
    }

    /**
     * @brief Ставится ли respondedAt при переходе
     *
     * Только ответ receiver'а (PENDING -> ACCEPTED/REJECTED).
     * ACCEPTED -> COMPLETED respondedAt не трогает.
     */
    static bool stampsRespondedAt(TradeOfferStatus current, TradeOfferStatus requested) {
        return current == TradeOfferStatus::PENDING &&
               (requested == TradeOfferStatus::ACCEPTED || requested == TradeOfferStatus::REJECTED);
    }

    static bool requiresChatRoom(TradeOfferStatus requested) {
        return requested == TradeOfferStatus::ACCEPTED;
    }

    /**
     * @brief Уведомление второй стороне о новом статусе
     *
     * Получатель - участник, который НЕ совершал действие.
     * Для PENDING уведомления нет.
     */
    static std::optional<Notification> notificationFor(const TradeOffer& offer,
                                                       TradeOfferStatus newStatus,
                                                       const std::string& actorId) {
        Notification n;
        n.recipientId = (actorId == offer.receiverId) ? offer.proposerId : offer.receiverId;
        n.relatedOfferId = offer.id;
        n.relatedUserId = actorId;

        switch (newStatus) {
            case TradeOfferStatus::ACCEPTED:
                n.type = "trade_offer_accepted";
                n.title = "Trade Offer Accepted!";
                n.body = "Great news! Your trade offer has been accepted.";
                return n;
            case TradeOfferStatus::REJECTED:
                n.type = "trade_offer_rejected";
                n.title = "Trade Offer Declined";
                n.body = "Your trade offer was declined. Keep exploring!";
                return n;
            case TradeOfferStatus::CANCELLED:
                n.type = "trade_offer_cancelled";
                n.title = "Trade Offer Cancelled";
                n.body = "A trade offer you received has been cancelled.";
                return n;
            case TradeOfferStatus::COMPLETED:
                n.type = "trade_completed";
                n.title = "Trade Completed!";
                n.body = "Congratulations! Your trade has been completed.";
                return n;
            case TradeOfferStatus::PENDING:
                return std::nullopt;
        }
        return std::nullopt;
    }

    static ChatRoomRequest chatRoomFor(const TradeOffer& offer) {
        return ChatRoomRequest{offer.id, offer.proposerId, offer.receiverId};
    }
};

} // namespace matchmaking::domain
