#pragma once

#include "settings/IChatClientSettings.hpp"
#include <cstdlib>
#include <string>

namespace matchmaking::settings {

class ChatClientSettings : public IChatClientSettings {
public:
    std::string getHost() const override {
        const char* host = std::getenv("CHAT_SERVICE_HOST");
        return host ? host : "chat_service";
    }

    int getPort() const override {
        const char* port = std::getenv("CHAT_SERVICE_PORT");
        return port ? std::stoi(port) : 8000;
    }
};

} // namespace matchmaking::settings
