#pragma once

#include "domain/TradeOffer.hpp"
#include "domain/TradeOfferRequest.hpp"
#include "domain/TradeOfferQuery.hpp"
#include "domain/TradeOfferResult.hpp"
#include "domain/TradeOfferStatistics.hpp"
#include <optional>
#include <string>
#include <vector>

namespace matchmaking::ports::input {

/**
 * @brief Интерфейс сервиса предложений обмена
 */
class ITradeOfferService {
public:
    virtual ~ITradeOfferService() = default;

    /**
     * @brief Создать предложение
     *
     * Структурная валидация -> проверка вещей в каталоге -> сохранение.
     * Ни одна запись не появляется, пока каталог не подтвердил все вещи.
     */
    virtual domain::TradeOfferResult proposeTradeOffer(const domain::TradeOfferRequest& request) = 0;

    /**
     * @brief Сменить статус предложения от имени actorId
     *
     * Ошибки: NOT_FOUND, UNAUTHORIZED, INVALID_TRANSITION.
     * Сбой уведомления/чата не влияет на результат.
     */
    virtual domain::TradeOfferResult transition(domain::OfferId offerId,
                                                domain::TradeOfferStatus newStatus,
                                                const std::string& actorId) = 0;

    /**
     * @brief Удалить предложение (только proposer и только PENDING)
     *
     * Ошибки: NOT_FOUND, UNAUTHORIZED, INVALID_STATE.
     */
    virtual domain::TradeOfferResult deleteOffer(domain::OfferId offerId, const std::string& actorId) = 0;

    virtual std::optional<domain::TradeOffer> getTradeOffer(domain::OfferId offerId) = 0;

    virtual std::vector<domain::TradeOffer> listTradeOffers(const domain::TradeOfferQuery& query) = 0;

    virtual std::vector<domain::TradeOffer> getSentOffers(const std::string& userId,
                                                          const std::optional<domain::TradeOfferStatus>& status,
                                                          int limit,
                                                          int offset) = 0;

    virtual std::vector<domain::TradeOffer> getReceivedOffers(const std::string& userId,
                                                              const std::optional<domain::TradeOfferStatus>& status,
                                                              int limit,
                                                              int offset) = 0;

    virtual std::vector<domain::TradeOffer> getOffersByItem(domain::ItemId itemId,
                                                            const std::optional<domain::TradeOfferStatus>& status) = 0;

    virtual domain::TradeOfferStatistics getStatistics(const std::string& userId) = 0;
};

} // namespace matchmaking::ports::input
