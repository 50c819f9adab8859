#pragma once

#include "domain/ItemValidation.hpp"
#include "domain/Notification.hpp"
#include <vector>

namespace matchmaking::ports::output {

/**
 * @brief Устойчивые вызовы внешних зависимостей
 *
 * validateItems - gating-вызов: недоступность каталога пробрасывается
 * как DependencyUnavailableError, потому что от неё зависит создание предложения.
 *
 * notify / provisionChatRoom - побочные эффекты уже зафиксированного перехода:
 * ошибки только логируются, наружу возвращается false.
 */
class IDependencyOrchestrator {
public:
    virtual ~IDependencyOrchestrator() = default;

    /**
     * @return Вердикт для КАЖДОГО запрошенного id
     * @throws domain::DependencyUnavailableError
     */
    virtual std::vector<domain::ItemValidation> validateItems(const std::vector<domain::ItemId>& itemIds) = 0;

    virtual bool notify(const domain::Notification& notification) = 0;

    virtual bool provisionChatRoom(const domain::ChatRoomRequest& request) = 0;
};

} // namespace matchmaking::ports::output
