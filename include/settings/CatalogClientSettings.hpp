#pragma once

#include "settings/ICatalogClientSettings.hpp"
#include <cstdlib>
#include <string>

namespace matchmaking::settings {

class CatalogClientSettings : public ICatalogClientSettings {
public:
    std::string getHost() const override {
        const char* host = std::getenv("CATALOG_SERVICE_HOST");
        return host ? host : "catalog-service";
    }

    int getPort() const override {
        const char* port = std::getenv("CATALOG_SERVICE_PORT");
        return port ? std::stoi(port) : 8000;
    }
};

} // namespace matchmaking::settings
