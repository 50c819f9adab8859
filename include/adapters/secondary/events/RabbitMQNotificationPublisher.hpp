#pragma once

#include "ports/output/INotificationClient.hpp"
#include "settings/RabbitMQSettings.hpp"
#include "adapters/secondary/HttpNotificationClient.hpp"
#include "domain/errors/DependencyErrors.hpp"
#include <amqpcpp.h>
#include <amqpcpp/libboostasio.h>
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <thread>

namespace matchmaking::adapters::secondary {

/**
 * @brief Доставка уведомлений через очередь RabbitMQ
 *
 * Альтернатива HttpNotificationClient (NOTIFICATION_TRANSPORT=rabbitmq).
 *
 * Архитектура:
 * - Exchange: default ("")
 * - Очередь: durable (notifications_queue), routing key = имя очереди
 * - Сообщения: JSON, persistent (delivery mode 2)
 *
 * Все операции с каналом выполняются в потоке io_context;
 * send() ставит публикацию в очередь этого потока и ждёт результат.
 */
class RabbitMQNotificationPublisher : public ports::output::INotificationClient {
public:
    explicit RabbitMQNotificationPublisher(std::shared_ptr<settings::RabbitMQSettings> settings)
        : settings_(std::move(settings))
        , running_(false)
        , ready_(false)
        , ioContext_()
        , work_(boost::asio::make_work_guard(ioContext_))
        , handler_(ioContext_)
    {
        queueName_ = settings_->getNotificationQueue();
        std::cout << "[RabbitMQNotificationPublisher] Created for "
                  << settings_->getHost() << ":" << settings_->getPort()
                  << " queue=" << queueName_ << std::endl;
    }

    ~RabbitMQNotificationPublisher() override {
        stop();
    }

    void send(const domain::Notification& notification) override {
        if (!running_ || !ready_) {
            throw domain::TransientDependencyError("notification", "RabbitMQ channel is not ready");
        }

        auto body = toNotificationJson(notification).dump();
        auto published = std::make_shared<std::promise<bool>>();
        auto result = published->get_future();

        boost::asio::post(ioContext_, [this, body, published]() {
            if (!channel_ || !ready_) {
                published->set_value(false);
                return;
            }
            AMQP::Envelope envelope(body.data(), body.size());
            envelope.setContentType("application/json");
            envelope.setDeliveryMode(2);
            published->set_value(channel_->publish("", queueName_, envelope));
        });

        if (result.wait_for(PUBLISH_TIMEOUT) != std::future_status::ready || !result.get()) {
            throw domain::TransientDependencyError("notification", "publish to " + queueName_ + " failed");
        }

        std::cout << "[RabbitMQNotificationPublisher] Published " << notification.type
                  << " for " << notification.recipientId << std::endl;
    }

    void start() {
        if (running_) return;

        running_ = true;

        workerThread_ = std::thread([this]() {
            try {
                boost::asio::post(ioContext_, [this]() { connect(); });
                ioContext_.run();
            } catch (const std::exception& e) {
                ready_ = false;
                std::cerr << "[RabbitMQNotificationPublisher] Worker error: " << e.what() << std::endl;
            }
        });

        std::cout << "[RabbitMQNotificationPublisher] Started" << std::endl;
    }

    void stop() {
        if (!running_) return;

        running_ = false;
        ready_ = false;
        work_.reset();
        ioContext_.stop();

        if (workerThread_.joinable()) {
            workerThread_.join();
        }

        channel_.reset();
        connection_.reset();

        std::cout << "[RabbitMQNotificationPublisher] Stopped" << std::endl;
    }

private:
    static constexpr std::chrono::seconds PUBLISH_TIMEOUT{5};

    void connect() {
        std::string connStr = "amqp://" + settings_->getUser() + ":" +
                              settings_->getPassword() + "@" +
                              settings_->getHost() + ":" +
                              std::to_string(settings_->getPort()) + "/";

        connection_ = std::make_unique<AMQP::TcpConnection>(&handler_,
            AMQP::Address(connStr));
        channel_ = std::make_unique<AMQP::TcpChannel>(connection_.get());

        channel_->onError([this](const char* msg) {
            ready_ = false;
            std::cerr << "[RabbitMQNotificationPublisher] Channel error: " << msg << std::endl;
        });

        channel_->declareQueue(queueName_, AMQP::durable)
            .onSuccess([this](const std::string& name, uint32_t, uint32_t) {
                ready_ = true;
                std::cout << "[RabbitMQNotificationPublisher] Queue declared: " << name << std::endl;
            })
            .onError([](const char* msg) {
                std::cerr << "[RabbitMQNotificationPublisher] Queue error: " << msg << std::endl;
            });
    }

    std::shared_ptr<settings::RabbitMQSettings> settings_;
    std::string queueName_;

    std::atomic<bool> running_;
    std::atomic<bool> ready_;
    boost::asio::io_context ioContext_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    AMQP::LibBoostAsioHandler handler_;

    std::unique_ptr<AMQP::TcpConnection> connection_;
    std::unique_ptr<AMQP::TcpChannel> channel_;

    std::thread workerThread_;
};

} // namespace matchmaking::adapters::secondary
