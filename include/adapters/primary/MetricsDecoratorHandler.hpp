#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "ports/input/IMetricsService.hpp"

#include <iostream>
#include <memory>
#include <string>

namespace matchmaking::adapters::primary
{

    /**
     * @brief Декоратор для подсчёта HTTP метрик
     *
     * Оборачивает любой IHttpHandler и инкрементирует
     * http_requests_total{method="...",path="..."} перед делегированием.
     *
     * Path нормализуется, чтобы id не порождали новые ключи:
     * - /api/v1/offers/42 -> /api/v1/offers/{id}
     * - /api/v1/offers/sent/alice -> /api/v1/offers/sent
     * - /api/v1/statistics/alice -> /api/v1/statistics
     */
    class MetricsDecoratorHandler : public IHttpHandler
    {
    public:
        MetricsDecoratorHandler(
            std::shared_ptr<IHttpHandler> inner,
            std::shared_ptr<ports::input::IMetricsService> metrics) : inner_(std::move(inner)), metrics_(std::move(metrics))
        {
        }

        void handle(IRequest &req, IResponse &res) override
        {
            metrics_->increment("http_requests_total", {{"method", req.getMethod()},
                                                        {"path", normalizePath(req.getPath())}});

            inner_->handle(req, res);
        }

        static std::string normalizePath(const std::string &path)
        {
            std::string cleanPath = path.substr(0, path.find('?'));

            // Более специфичные префиксы первыми
            if (cleanPath.rfind("/api/v1/offers/sent/", 0) == 0)
            {
                return "/api/v1/offers/sent";
            }
            if (cleanPath.rfind("/api/v1/offers/received/", 0) == 0)
            {
                return "/api/v1/offers/received";
            }
            if (cleanPath.rfind("/api/v1/offers/by-item/", 0) == 0)
            {
                return "/api/v1/offers/by-item";
            }
            if (cleanPath.rfind("/api/v1/offers/", 0) == 0)
            {
                return "/api/v1/offers/{id}";
            }
            if (cleanPath.rfind("/api/v1/statistics/", 0) == 0)
            {
                return "/api/v1/statistics";
            }

            return cleanPath;
        }

    private:
        std::shared_ptr<IHttpHandler> inner_;
        std::shared_ptr<ports::input::IMetricsService> metrics_;
    };

} // namespace matchmaking::adapters::primary
