// include/domain/QuoteLine.hpp
#pragma once

#include "domain/Decimal.hpp"
#include "domain/Errors.hpp"
#include <string>
#include <map>
#include <optional>
#include <cstdint>

namespace cpq::domain {

/**
 * @brief Строка котировки, принадлежит ровно одной котировке
 *
 * unitPrice и subtotal отсутствуют до расчёта и записываются
 * один раз за проход ценообразования.
 */
struct QuoteLine {
    std::string id;
    std::string productId;
    int productRevision = 1;
    int64_t quantity = 1;
    std::map<std::string, std::string> attributes;
    std::optional<std::string> bundleId;
    std::optional<Decimal> discountPct;         ///< Скидка строки, перекрывает скидку котировки
    std::optional<Decimal> discountAmount;      ///< Фиксированная скидка строки
    std::optional<Decimal> unitPrice;
    std::optional<Decimal> subtotal;            ///< До скидки, округлён
    std::optional<Decimal> appliedDiscount;     ///< Фактическая скидка последнего расчёта
    int sortOrder = 0;

    bool isPriced() const { return unitPrice.has_value(); }

    void setPricing(const Decimal& price, const Decimal& lineSubtotal, const Decimal& discount) {
        if (isPriced()) {
            throw InvariantViolationException("Line " + id + " already priced in this pass");
        }
        unitPrice = price;
        subtotal = lineSubtotal;
        appliedDiscount = discount;
    }

    void clearPricing() {
        unitPrice.reset();
        subtotal.reset();
        appliedDiscount.reset();
    }
};

} // namespace cpq::domain
