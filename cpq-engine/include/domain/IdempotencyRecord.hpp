// include/domain/IdempotencyRecord.hpp
#pragma once

#include "domain/Timestamp.hpp"
#include <string>
#include <vector>
#include <stdexcept>

namespace cpq::domain {

/**
 * @brief Состояние ключа идемпотентности
 *
 * RESERVED: ключ занят, переход ещё не зафиксирован.
 * COMMITTED: переход зафиксирован, внешние эффекты могли не дойти.
 * COMPLETED: внешние эффекты отправлены.
 */
enum class IdempotencyState {
    RESERVED,
    COMMITTED,
    COMPLETED
};

inline std::string toString(IdempotencyState state) {
    switch (state) {
        case IdempotencyState::RESERVED: return "reserved";
        case IdempotencyState::COMMITTED: return "committed";
        case IdempotencyState::COMPLETED: return "completed";
        default: return "unknown";
    }
}

inline IdempotencyState idempotencyStateFromString(const std::string& str) {
    if (str == "reserved") return IdempotencyState::RESERVED;
    if (str == "committed") return IdempotencyState::COMMITTED;
    if (str == "completed") return IdempotencyState::COMPLETED;
    throw std::invalid_argument("Unknown idempotency state: " + str);
}

/// Внешнее сообщение, ожидающее отправки после коммита
struct OutboxMessage {
    std::string routingKey;
    std::string message;
};

struct IdempotencyRecord {
    std::string key;
    std::string quoteId;
    std::string operation;              ///< Тип события
    IdempotencyState state = IdempotencyState::RESERVED;
    std::string resultJson;             ///< Сохранённый ApplyResult
    std::vector<OutboxMessage> outbox;
    Timestamp createdAt;
    Timestamp updatedAt;
};

} // namespace cpq::domain
