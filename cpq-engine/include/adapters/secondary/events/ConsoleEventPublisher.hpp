// include/adapters/secondary/events/ConsoleEventPublisher.hpp
#pragma once

#include "ports/output/IEventPublisher.hpp"
#include <iostream>
#include <mutex>
#include <string>
#include <vector>
#include <utility>

namespace cpq::adapters::secondary {

/**
 * @brief Публикация внешних событий в stdout
 *
 * Сообщения также накапливаются, чтобы cpq-replay мог вывести их в отчёт.
 */
class ConsoleEventPublisher : public ports::output::IEventPublisher {
public:
    ConsoleEventPublisher() {
        std::cout << "[ConsoleEventPublisher] Created" << std::endl;
    }

    void publish(const std::string& routingKey, const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << "[ConsoleEventPublisher] " << routingKey << ": " << message << std::endl;
        published_.emplace_back(routingKey, message);
    }

    std::vector<std::pair<std::string, std::string>> published() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return published_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<std::string, std::string>> published_;
};

} // namespace cpq::adapters::secondary
