#pragma once

#include <string>

namespace matchmaking::settings {

class IChatClientSettings {
public:
    virtual ~IChatClientSettings() = default;

    virtual std::string getHost() const = 0;
    virtual int getPort() const = 0;
};

} // namespace matchmaking::settings
