// include/domain/DraftChanges.hpp
#pragma once

#include "domain/Decimal.hpp"
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstdint>

namespace cpq::domain {

/// Новая строка котировки
struct LineInput {
    std::string productId;
    int64_t quantity = 1;
    std::map<std::string, std::string> attributes;
    std::optional<std::string> bundleId;
    std::optional<Decimal> discountPct;
    std::optional<Decimal> discountAmount;
};

/// Изменение существующей строки; attributes сливаются с текущими
struct LineUpdate {
    std::string lineId;
    std::optional<int64_t> quantity;
    std::map<std::string, std::string> attributes;
    std::optional<Decimal> discountPct;
    std::optional<Decimal> discountAmount;
};

/**
 * @brief Структурированные изменения черновика (payload DraftUpdated)
 *
 * Порядок применения: поля, скидка, удаление, изменение, добавление строк.
 */
struct DraftChanges {
    std::map<std::string, std::string> fields;
    std::optional<Decimal> requestedDiscountPct;
    std::vector<std::string> removeLineIds;
    std::vector<LineUpdate> updateLines;
    std::vector<LineInput> addLines;

    bool empty() const {
        return fields.empty() && !requestedDiscountPct && removeLineIds.empty() &&
               updateLines.empty() && addLines.empty();
    }
};

} // namespace cpq::domain
