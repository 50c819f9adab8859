#pragma once

#include "domain/Notification.hpp"

namespace matchmaking::ports::output {

/**
 * @brief Транспорт к Chat Service
 */
class IChatClient {
public:
    virtual ~IChatClient() = default;

    virtual void createChatRoom(const domain::ChatRoomRequest& request) = 0;
};

} // namespace matchmaking::ports::output
