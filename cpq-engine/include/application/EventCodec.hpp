// include/application/EventCodec.hpp
#pragma once

#include "domain/FlowEvent.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace cpq::application {

/**
 * @brief Событие не прошло проверку схемы
 */
class EventDecodeException : public std::invalid_argument {
public:
    EventDecodeException(std::string field, const std::string& message)
        : std::invalid_argument(message), field_(std::move(field)) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

/**
 * @brief Разбор и сериализация событий жизненного цикла
 *
 * Схема строгая: неизвестные ключи, неверные типы, дробные числа
 * вместо десятичных строк и неизвестная версия схемы отклоняются.
 *
 * @code
 * {
 *   "schema_version": 1,
 *   "type": "DraftUpdated",
 *   "event_id": "slack-1700000000.0001",
 *   "source": "slack",
 *   "actor": "U123",
 *   "occurred_at": "2025-03-01T10:00:00Z",
 *   "payload": { "fields": { "segment": "enterprise" } }
 * }
 * @endcode
 */
class EventCodec {
public:
    /// @throws EventDecodeException
    static domain::FlowEvent decode(const nlohmann::json& j);

    /// @throws EventDecodeException (включая ошибку разбора JSON)
    static domain::FlowEvent decode(const std::string& text);

    static nlohmann::json encode(const domain::FlowEvent& event);

    /**
     * @brief Ключ идемпотентности события
     *
     * SHA-256 от котировки, источника, id события у источника, типа и
     * канонического payload (payload берётся из encode(), поэтому "15.0" и "15"
     * дают один ключ). Один и тот же id события у разных котировок даёт разные ключи.
     */
    static std::string idempotencyKey(const std::string& quoteId, const domain::FlowEvent& event);
};

} // namespace cpq::application
