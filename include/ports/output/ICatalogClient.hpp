#pragma once

#include "domain/ItemValidation.hpp"
#include <vector>

namespace matchmaking::ports::output {

/**
 * @brief Транспорт к Catalog Service (без устойчивости)
 *
 * Реализация бросает TransientDependencyError / PermanentDependencyError.
 * Breaker, ретраи и таймаут навешивает ResilientCallOrchestrator.
 */
class ICatalogClient {
public:
    virtual ~ICatalogClient() = default;

    /**
     * @brief Пакетная проверка вещей
     * @return Вердикты; id, которых нет в ответе, считаются ненайденными
     */
    virtual std::vector<domain::ItemValidation> validateItems(const std::vector<domain::ItemId>& itemIds) = 0;
};

} // namespace matchmaking::ports::output
