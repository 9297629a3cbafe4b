// include/domain/ConstraintRule.hpp
#pragma once

#include "domain/enums/ConstraintType.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace cpq::domain {

/**
 * @brief Версионированное правило конфигурации
 *
 * Правило, на которое ссылается трасса, не переписывается: изменение
 * создаёт новую строку с новой версией.
 */
struct ConstraintRule {
    std::string id;
    int version = 1;
    ConstraintType type = ConstraintType::REQUIRES;
    std::string sourceProductId = "*";                  ///< "*" - правило уровня котировки
    std::string condition;                              ///< JSON-условие, разбирается при оценке
    std::string messageTemplate;                        ///< Слоты {name} заполняются из котировки
    std::optional<std::string> suggestionTemplate;
    int priority = 100;
    int64_t sequence = 0;                               ///< Порядок вставки
    bool active = true;

    bool isWildcard() const { return sourceProductId == "*"; }
};

} // namespace cpq::domain
