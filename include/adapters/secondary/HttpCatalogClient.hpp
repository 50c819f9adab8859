#pragma once

#include "ports/output/ICatalogClient.hpp"
#include "settings/ICatalogClientSettings.hpp"
#include "adapters/secondary/HttpDependencyCall.hpp"
#include <IHttpClient.hpp>
#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace matchmaking::adapters::secondary {

/**
 * @brief HTTP клиент к Catalog Service
 *
 * POST /api/v1/items/validate {"item_ids": [...]}
 *   -> {"validations": [{"item_id", "exists", "is_active", "owner_id"}, ...]}
 *
 * Ошибки не глотает: решение о ретраях принимает оркестратор.
 */
class HttpCatalogClient : public ports::output::ICatalogClient {
public:
    HttpCatalogClient(
        std::shared_ptr<IHttpClient> httpClient,
        std::shared_ptr<settings::ICatalogClientSettings> settings
    ) : httpClient_(std::move(httpClient))
      , settings_(std::move(settings))
    {
        std::cout << "[HttpCatalogClient] Created, target: "
                  << settings_->getHost() << ":" << settings_->getPort() << std::endl;
    }

    std::vector<domain::ItemValidation> validateItems(const std::vector<domain::ItemId>& itemIds) override {
        nlohmann::json requestBody = {
            {"item_ids", itemIds}
        };

        SimpleRequest request(
            "POST",
            "/api/v1/items/validate",
            requestBody.dump(),
            settings_->getHost(),
            settings_->getPort(),
            {{"Content-Type", "application/json"}}
        );

        auto response = sendToDependency(*httpClient_, "catalog", request);

        std::vector<domain::ItemValidation> result;
        try {
            auto json = nlohmann::json::parse(response.getBody());

            // Каталог может вернуть массив напрямую или объект с полем "validations"
            nlohmann::json validationsJson;
            if (json.is_array()) {
                validationsJson = json;
            } else {
                validationsJson = json.value("validations", nlohmann::json::array());
            }

            for (const auto& v : validationsJson) {
                result.push_back(parseValidation(v));
            }
        } catch (const nlohmann::json::exception& e) {
            throw domain::PermanentDependencyError("catalog", std::string("malformed response: ") + e.what());
        }

        std::cout << "[HttpCatalogClient] Validated " << result.size() << " items" << std::endl;
        return result;
    }

private:
    std::shared_ptr<IHttpClient> httpClient_;
    std::shared_ptr<settings::ICatalogClientSettings> settings_;

    static domain::ItemValidation parseValidation(const nlohmann::json& j) {
        domain::ItemValidation v;
        v.itemId = j.at("item_id").get<domain::ItemId>();
        v.exists = j.value("exists", false);
        v.isActive = j.value("is_active", false);
        if (j.contains("owner_id") && j["owner_id"].is_string()) {
            v.ownerId = j["owner_id"].get<std::string>();
        }
        return v;
    }
};

} // namespace matchmaking::adapters::secondary
