// include/ports/output/IAuditLog.hpp
#pragma once

#include "domain/AuditEvent.hpp"
#include <string>
#include <vector>
#include <optional>

namespace cpq::ports::output {

/**
 * @brief Журнал аудита: только добавление
 */
class IAuditLog {
public:
    virtual ~IAuditLog() = default;

    /**
     * @brief Добавить запись; sequence, prevHash и hash выставляет журнал
     * @return Запечатанная запись
     */
    virtual domain::AuditEvent append(domain::AuditEvent event) = 0;

    /// Все записи котировки по возрастанию sequence
    virtual std::vector<domain::AuditEvent> eventsForQuote(const std::string& quoteId) = 0;

    virtual std::vector<domain::AuditEvent> query(const std::string& quoteId, domain::AuditCategory category) = 0;

    virtual std::optional<domain::AuditEvent> lastEvent(const std::string& quoteId) = 0;
};

} // namespace cpq::ports::output
