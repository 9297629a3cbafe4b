// include/settings/RabbitMQSettings.hpp
#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace cpq::settings {

/**
 * @brief Настройки RabbitMQ для внешних событий котировок
 *
 * Читает из ENV:
 * - CPQ_RABBITMQ_HOST (default: "rabbitmq")
 * - CPQ_RABBITMQ_PORT (default: 5672)
 * - CPQ_RABBITMQ_USER / CPQ_RABBITMQ_PASSWORD (default: "guest")
 * - CPQ_RABBITMQ_EXCHANGE (default: "cpq.events")
 * - CPQ_RABBITMQ_CONNECT_TIMEOUT_MS - ожидание готовности канала (default: 5000)
 */
class RabbitMQSettings {
public:
    RabbitMQSettings() {
        if (const char* host = std::getenv("CPQ_RABBITMQ_HOST")) {
            host_ = host;
        }
        if (const char* port = std::getenv("CPQ_RABBITMQ_PORT")) {
            port_ = parsePositive("CPQ_RABBITMQ_PORT", port);
        }
        if (const char* user = std::getenv("CPQ_RABBITMQ_USER")) {
            user_ = user;
        }
        if (const char* password = std::getenv("CPQ_RABBITMQ_PASSWORD")) {
            password_ = password;
        }
        if (const char* exchange = std::getenv("CPQ_RABBITMQ_EXCHANGE")) {
            exchange_ = exchange;
        }
        if (const char* timeout = std::getenv("CPQ_RABBITMQ_CONNECT_TIMEOUT_MS")) {
            connectTimeoutMs_ = parsePositive("CPQ_RABBITMQ_CONNECT_TIMEOUT_MS", timeout);
        }
    }

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    std::string getUser() const { return user_; }
    std::string getPassword() const { return password_; }
    std::string getExchange() const { return exchange_; }
    int getConnectTimeoutMs() const { return connectTimeoutMs_; }

    std::string getAddress() const {
        return "amqp://" + user_ + ":" + password_ + "@" + host_ + ":" + std::to_string(port_) + "/";
    }

private:
    static int parsePositive(const char* name, const std::string& value) {
        size_t consumed = 0;
        int parsed = 0;
        try {
            parsed = std::stoi(value, &consumed);
        } catch (const std::exception&) {
            throw std::invalid_argument(std::string(name) + " is not a number: " + value);
        }
        if (consumed != value.size() || parsed <= 0) {
            throw std::invalid_argument(std::string(name) + " must be a positive integer: " + value);
        }
        return parsed;
    }

    std::string host_ = "rabbitmq";
    int port_ = 5672;
    std::string user_ = "guest";
    std::string password_ = "guest";
    std::string exchange_ = "cpq.events";
    int connectTimeoutMs_ = 5000;
};

} // namespace cpq::settings
