#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include <nlohmann/json.hpp>

namespace matchmaking::adapters::primary {

/**
 * @brief GET / - имя и версия сервиса
 */
class RootHandler : public IHttpHandler {
public:
    void handle(IRequest& req, IResponse& res) override {
        nlohmann::json response;
        response["service"] = "Swappo Matchmaking Service";
        response["status"] = "running";
        response["version"] = "1.0.0";

        res.setResult(200, "application/json", response.dump());
    }
};

} // namespace matchmaking::adapters::primary
