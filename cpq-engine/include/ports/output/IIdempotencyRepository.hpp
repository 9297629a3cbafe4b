// include/ports/output/IIdempotencyRepository.hpp
#pragma once

#include "domain/IdempotencyRecord.hpp"
#include <string>
#include <optional>

namespace cpq::ports::output {

class IIdempotencyRepository {
public:
    virtual ~IIdempotencyRepository() = default;

    virtual std::optional<domain::IdempotencyRecord> find(const std::string& key) = 0;

    /**
     * @brief Занять ключ (RESERVED)
     * @return false, если ключ уже существует
     */
    virtual bool reserve(const domain::IdempotencyRecord& record) = 0;

    /// Перевести COMMITTED -> COMPLETED после отправки внешних эффектов
    virtual void complete(const std::string& key, const domain::Timestamp& at) = 0;

    /// Освободить RESERVED-ключ после неудачи без коммита
    virtual void release(const std::string& key) = 0;
};

} // namespace cpq::ports::output
