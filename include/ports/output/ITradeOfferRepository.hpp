#pragma once

#include "domain/TradeOffer.hpp"
#include "domain/TradeOfferQuery.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace matchmaking::ports::output {

/**
 * @brief Хранилище предложений обмена
 *
 * Хранилище отвечает за долговечность, id и createdAt/updatedAt.
 * Статус меняется ТОЛЬКО условной записью updateStatus - это и есть
 * построчная взаимоисключающая блокировка для конкурентных переходов.
 */
class ITradeOfferRepository {
public:
    virtual ~ITradeOfferRepository() = default;

    /**
     * @brief Сохранить новое предложение
     * @return Предложение с присвоенным id и временными метками
     */
    virtual domain::TradeOffer create(const domain::TradeOffer& offer) = 0;

    virtual std::optional<domain::TradeOffer> findById(domain::OfferId id) = 0;

    /**
     * @brief Условная смена статуса
     *
     * Пишет только если текущий статус == expectedStatus.
     * respondedAt записывается, только если ещё не был выставлен.
     * @return false - статус уже изменил кто-то другой (или записи нет)
     */
    virtual bool updateStatus(domain::OfferId id,
                              domain::TradeOfferStatus newStatus,
                              domain::TradeOfferStatus expectedStatus,
                              const std::optional<domain::Timestamp>& respondedAt) = 0;

    /**
     * @brief Условное удаление: только если статус == expectedStatus
     */
    virtual bool deleteById(domain::OfferId id, domain::TradeOfferStatus expectedStatus) = 0;

    virtual std::vector<domain::TradeOffer> find(const domain::TradeOfferQuery& query) = 0;

    virtual std::vector<domain::TradeOffer> findByItem(
        domain::ItemId itemId,
        const std::optional<domain::TradeOfferStatus>& status) = 0;

    /**
     * @brief Количество предложений пользователя (в любой роли) по статусам
     */
    virtual std::map<domain::TradeOfferStatus, int64_t> countByStatus(const std::string& userId) = 0;
};

} // namespace matchmaking::ports::output
