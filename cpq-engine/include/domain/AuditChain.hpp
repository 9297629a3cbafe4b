// include/domain/AuditChain.hpp
#pragma once

#include "domain/AuditEvent.hpp"
#include <string>
#include <vector>
#include <optional>

namespace cpq::domain {

/**
 * @brief Цепочка хешей записей аудита одной котировки
 *
 * hash = SHA-256(prevHash + канонический JSON записи без hash).
 * Любое изменение записи или удаление из середины ломает цепочку.
 */
class AuditChain {
public:
    /// Канонический материал для хеширования (ключи JSON отсортированы)
    static std::string canonicalMaterial(const AuditEvent& event);

    /**
     * @brief Выставить sequence, id, prevHash и hash
     * @param previous последняя запись котировки, nullopt для первой
     */
    static AuditEvent seal(AuditEvent event, const std::optional<AuditEvent>& previous);

    /// Проверить цепочку; события должны идти по возрастанию sequence
    static AuditVerification verify(const std::vector<AuditEvent>& events);
};

} // namespace cpq::domain
