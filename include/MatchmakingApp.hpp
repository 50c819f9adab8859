// include/MatchmakingApp.hpp
#pragma once

#include <BoostBeastApplication.hpp>
#include <HttpClient.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/CatalogClientSettings.hpp"
#include "settings/ChatClientSettings.hpp"
#include "settings/NotificationClientSettings.hpp"
#include "settings/RabbitMQSettings.hpp"
#include "settings/ResilienceSettings.hpp"
#include "settings/DbSettings.hpp"
#include "settings/MetricsSettings.hpp"

// Ports
#include "ports/input/ITradeOfferService.hpp"
#include "ports/input/IMetricsService.hpp"
#include "ports/output/ITradeOfferRepository.hpp"
#include "ports/output/IDependencyOrchestrator.hpp"
#include "ports/output/INotificationClient.hpp"

// Application
#include "application/MetricsService.hpp"
#include "application/ResilientCallOrchestrator.hpp"
#include "application/ItemOwnershipValidator.hpp"
#include "application/TradeOfferService.hpp"

// Secondary Adapters
#include "adapters/secondary/HttpCatalogClient.hpp"
#include "adapters/secondary/HttpChatClient.hpp"
#include "adapters/secondary/HttpNotificationClient.hpp"
#include "adapters/secondary/PostgresTradeOfferRepository.hpp"
#include "adapters/secondary/events/RabbitMQNotificationPublisher.hpp"

// Primary Adapters
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/RootHandler.hpp"
#include "adapters/primary/MetricsHandler.hpp"
#include "adapters/primary/MetricsDecoratorHandler.hpp"
#include "adapters/primary/CreateTradeOfferHandler.hpp"
#include "adapters/primary/TradeOfferQueryHandler.hpp"
#include "adapters/primary/UpdateTradeOfferStatusHandler.hpp"
#include "adapters/primary/DeleteTradeOfferHandler.hpp"
#include "adapters/primary/GetStatisticsHandler.hpp"

#include <iostream>
#include <memory>
#include <string>

namespace di = boost::di;

namespace matchmaking
{

    /**
     * @brief Matchmaking Service Application
     *
     * HTTP: CRUD предложений обмена и смена статусов.
     * Исходящие вызовы: catalog (HTTP), notifications (HTTP или RabbitMQ), chat (HTTP),
     * все через ResilientCallOrchestrator.
     */
    class MatchmakingApp : public BoostBeastApplication
    {
    public:
        MatchmakingApp() { std::cout << "[MatchmakingApp] Initializing..." << std::endl; }
        ~MatchmakingApp() override
        {
            if (notificationPublisher_)
            {
                notificationPublisher_->stop();
            }
            std::cout << "[MatchmakingApp] Shutting down..." << std::endl;
        }

    protected:
        void loadEnvironment(int argc, char *argv[]) override
        {
            BoostBeastApplication::loadEnvironment(argc, argv);
            std::cout << "[MatchmakingApp] Environment loaded" << std::endl;
        }

        void configureInjection() override
        {
            std::cout << "[MatchmakingApp] Configuring DI..." << std::endl;

            // Шаг 1: Транспорты к зависимостям
            auto clientInjector = di::make_injector(
                di::bind<IHttpClient>().to<HttpClient>().in(di::singleton),
                di::bind<settings::ICatalogClientSettings>().to<settings::CatalogClientSettings>().in(di::singleton),
                di::bind<settings::IChatClientSettings>().to<settings::ChatClientSettings>().in(di::singleton),
                di::bind<settings::INotificationClientSettings>().to<settings::NotificationClientSettings>().in(di::singleton),
                di::bind<settings::RabbitMQSettings>().in(di::singleton),
                di::bind<settings::ResilienceSettings>().in(di::singleton));

            auto catalogClient = clientInjector.create<std::shared_ptr<adapters::secondary::HttpCatalogClient>>();
            auto chatClient = clientInjector.create<std::shared_ptr<adapters::secondary::HttpChatClient>>();

            std::shared_ptr<ports::output::INotificationClient> notificationClient;
            auto notificationSettings = clientInjector.create<std::shared_ptr<settings::INotificationClientSettings>>();
            if (notificationSettings->getTransport() == "rabbitmq")
            {
                notificationPublisher_ = clientInjector.create<std::shared_ptr<adapters::secondary::RabbitMQNotificationPublisher>>();
                notificationPublisher_->start();
                notificationClient = notificationPublisher_;
            }
            else
            {
                notificationClient = clientInjector.create<std::shared_ptr<adapters::secondary::HttpNotificationClient>>();
            }
            std::cout << "[MatchmakingApp] Notification transport: " << notificationSettings->getTransport() << std::endl;

            // Шаг 2: Метрики и оркестратор собираем вручную: часы и sleeper не для DI
            metrics_ = std::make_shared<application::MetricsService>(std::make_shared<settings::MetricsSettings>());
            auto resilienceSettings = clientInjector.create<std::shared_ptr<settings::ResilienceSettings>>();
            auto orchestrator = std::make_shared<application::ResilientCallOrchestrator>(
                catalogClient, notificationClient, chatClient, metrics_, resilienceSettings->toConfig());

            // Шаг 3: Основной injector с instance binding для метрик и оркестратора
            auto injector = di::make_injector(
                di::bind<settings::DbSettings>().in(di::singleton),
                di::bind<ports::input::IMetricsService>().to(metrics_),

                di::bind<ports::output::ITradeOfferRepository>()
                    .to<adapters::secondary::PostgresTradeOfferRepository>()
                    .in(di::singleton),

                di::bind<ports::output::IDependencyOrchestrator>().to(orchestrator),
                di::bind<application::ItemOwnershipValidator>().in(di::singleton),
                di::bind<ports::input::ITradeOfferService>().to<application::TradeOfferService>().in(di::singleton));

            // Шаг 4: HTTP Handlers, каждый под счётчиком http_requests_total
            route("GET", "/", std::make_shared<adapters::primary::RootHandler>());
            route("GET", "/health", std::make_shared<adapters::primary::HealthHandler>(orchestrator));
            route("GET", "/metrics", std::make_shared<adapters::primary::MetricsHandler>(metrics_));

            route("POST", "/api/v1/offers", injector.create<std::shared_ptr<adapters::primary::CreateTradeOfferHandler>>());

            std::shared_ptr<IHttpHandler> queryHandler =
                injector.create<std::shared_ptr<adapters::primary::TradeOfferQueryHandler>>();
            route("GET", "/api/v1/offers", queryHandler);
            route("GET", "/api/v1/offers/*", queryHandler);
            route("GET", "/api/v1/offers/sent/*", queryHandler);
            route("GET", "/api/v1/offers/received/*", queryHandler);
            route("GET", "/api/v1/offers/by-item/*", queryHandler);

            route("PATCH", "/api/v1/offers/*", injector.create<std::shared_ptr<adapters::primary::UpdateTradeOfferStatusHandler>>());
            route("DELETE", "/api/v1/offers/*", injector.create<std::shared_ptr<adapters::primary::DeleteTradeOfferHandler>>());
            route("GET", "/api/v1/statistics/*", injector.create<std::shared_ptr<adapters::primary::GetStatisticsHandler>>());

            std::cout << "[MatchmakingApp] Ready" << std::endl;
        }

    private:
        std::shared_ptr<adapters::secondary::RabbitMQNotificationPublisher> notificationPublisher_;
        std::shared_ptr<ports::input::IMetricsService> metrics_;

        void route(const std::string &method, const std::string &path, std::shared_ptr<IHttpHandler> handler)
        {
            handlers_[getHandlerKey(method, path)] =
                std::make_shared<adapters::primary::MetricsDecoratorHandler>(std::move(handler), metrics_);
        }
    };

} // namespace matchmaking
