#pragma once

#include <string>

namespace matchmaking::settings {

class INotificationClientSettings {
public:
    virtual ~INotificationClientSettings() = default;

    virtual std::string getHost() const = 0;
    virtual int getPort() const = 0;

    /// "http" или "rabbitmq"
    virtual std::string getTransport() const = 0;
};

} // namespace matchmaking::settings
