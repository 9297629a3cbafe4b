// include/ports/output/IEventPublisher.hpp
#pragma once

#include <string>

namespace cpq::ports::output {

/**
 * @brief Интерфейс для публикации внешних событий
 *
 * Вызывается только после коммита перехода.
 */
class IEventPublisher {
public:
    virtual ~IEventPublisher() = default;

    /**
     * @brief Опубликовать событие
     * @param routingKey Ключ маршрутизации (например, "quote.published")
     * @param message JSON-сообщение
     */
    virtual void publish(const std::string& routingKey, const std::string& message) = 0;
};

} // namespace cpq::ports::output
