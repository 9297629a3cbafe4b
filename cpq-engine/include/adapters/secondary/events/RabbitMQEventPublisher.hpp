// include/adapters/secondary/events/RabbitMQEventPublisher.hpp
#pragma once

#include "ports/output/IEventPublisher.hpp"
#include "settings/RabbitMQSettings.hpp"
#include <amqpcpp.h>
#include <amqpcpp/libboostasio.h>
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace cpq::adapters::secondary {

/**
 * @brief Публикация внешних событий котировок в RabbitMQ
 *
 * Exchange: topic (cpq.events), routing keys: quote.published,
 * approval.requested, quote.sent.
 *
 * publish() бросает исключение, если канал не готов или брокер не принял
 * сообщение: QuoteService оставляет ключ идемпотентности в COMMITTED, и
 * повтор события переотправит сообщения.
 */
class RabbitMQEventPublisher : public ports::output::IEventPublisher {
public:
    explicit RabbitMQEventPublisher(std::shared_ptr<settings::RabbitMQSettings> settings)
        : settings_(std::move(settings))
        , exchangeName_(settings_->getExchange())
        , running_(false)
        , ready_(false)
        , ioContext_()
        , handler_(ioContext_)
    {
        std::cout << "[RabbitMQEventPublisher] Created for "
                  << settings_->getHost() << ":" << settings_->getPort()
                  << " exchange=" << exchangeName_ << std::endl;
        start();
    }

    ~RabbitMQEventPublisher() override {
        stop();
    }

    void publish(const std::string& routingKey, const std::string& message) override {
        if (!waitReady()) {
            throw std::runtime_error("RabbitMQ channel is not ready, cannot publish " + routingKey);
        }

        // Канал AMQP-CPP не потокобезопасен: публикуем из потока io_context
        auto done = std::make_shared<std::promise<bool>>();
        auto result = done->get_future();
        boost::asio::post(ioContext_, [this, done, routingKey, message]() {
            try {
                done->set_value(channel_ && channel_->publish(exchangeName_, routingKey, message));
            } catch (...) {
                done->set_exception(std::current_exception());
            }
        });

        if (result.wait_for(std::chrono::milliseconds(settings_->getConnectTimeoutMs())) !=
            std::future_status::ready) {
            throw std::runtime_error("RabbitMQ publish of " + routingKey + " timed out");
        }
        if (!result.get()) {
            throw std::runtime_error("RabbitMQ rejected " + routingKey);
        }
        ++publishedCount_;
        std::cout << "[RabbitMQEventPublisher] Published " << routingKey
                  << ": " << message.substr(0, 100) << std::endl;
    }

    size_t publishedCount() const { return publishedCount_; }

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

        std::cout << "[RabbitMQEventPublisher] Stopped" << std::endl;
    }

private:
    using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

    void start() {
        if (running_) return;
        running_ = true;
        work_ = std::make_unique<WorkGuard>(boost::asio::make_work_guard(ioContext_));

        workerThread_ = std::thread([this]() {
            try {
                connect();
                ioContext_.run();
            } catch (const std::exception& e) {
                std::cerr << "[RabbitMQEventPublisher] Worker error: " << e.what() << std::endl;
            }
            markReady(false);
        });

        std::cout << "[RabbitMQEventPublisher] Started" << std::endl;
    }

    void connect() {
        connection_ = std::make_unique<AMQP::TcpConnection>(&handler_, AMQP::Address(settings_->getAddress()));
        channel_ = std::make_unique<AMQP::TcpChannel>(connection_.get());

        channel_->onError([this](const char* msg) {
            std::cerr << "[RabbitMQEventPublisher] Channel error: " << msg << std::endl;
            markReady(false);
        });

        channel_->declareExchange(exchangeName_, AMQP::topic, AMQP::durable)
            .onSuccess([this]() {
                std::cout << "[RabbitMQEventPublisher] Exchange declared: " << exchangeName_ << std::endl;
                markReady(true);
            })
            .onError([this](const char* msg) {
                std::cerr << "[RabbitMQEventPublisher] Exchange error: " << msg << std::endl;
                markReady(false);
            });
    }

    void markReady(bool ready) {
        {
            std::lock_guard<std::mutex> lock(readyMutex_);
            ready_ = ready;
        }
        readyCv_.notify_all();
    }

    bool waitReady() {
        std::unique_lock<std::mutex> lock(readyMutex_);
        return readyCv_.wait_for(lock, std::chrono::milliseconds(settings_->getConnectTimeoutMs()),
                                 [this]() { return ready_.load() || !running_.load(); }) &&
               ready_;
    }

    std::shared_ptr<settings::RabbitMQSettings> settings_;
    std::string exchangeName_;

    std::atomic<bool> running_;
    std::atomic<bool> ready_;
    std::atomic<size_t> publishedCount_{0};
    std::mutex readyMutex_;
    std::condition_variable readyCv_;

    boost::asio::io_context ioContext_;
    std::unique_ptr<WorkGuard> work_;
    AMQP::LibBoostAsioHandler handler_;

    std::unique_ptr<AMQP::TcpConnection> connection_;
    std::unique_ptr<AMQP::TcpChannel> channel_;

    std::thread workerThread_;
};

} // namespace cpq::adapters::secondary
