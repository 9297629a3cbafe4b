// include/domain/QuotePricingSnapshot.hpp
#pragma once

#include "domain/Decimal.hpp"
#include "domain/Timestamp.hpp"
#include "domain/PricingTrace.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace cpq::domain {

/**
 * @brief Расчёт одной строки в снимке
 */
struct LinePricing {
    std::string lineId;
    std::string productId;
    std::string category;
    int64_t quantity = 0;
    std::optional<std::string> bundleId;
    std::optional<std::string> formulaId;
    Decimal listPrice;
    Decimal tierUnitPrice;
    Decimal unitPrice;                  ///< После скидки пакета
    Decimal lineAmount;                 ///< До округления
    Decimal subtotal;                   ///< До скидки, округлён half-even
    Decimal discountPct;                ///< Фактический процент (после потолка)
    Decimal discountAmount;             ///< Округлён, не больше subtotal
    Decimal taxAmount;                  ///< Округлён
    std::optional<Decimal> unitCost;

    Decimal netAmount() const { return subtotal - discountAmount + taxAmount; }
};

/**
 * @brief Неизменяемый снимок одного успешного прохода ценообразования
 *
 * Создаётся только PricingPipeline, никогда не обновляется;
 * прежние снимки хранятся для аудита.
 * Инвариант: total == subtotal - discountTotal + taxTotal,
 * subtotal == сумма line.subtotal.
 */
struct QuotePricingSnapshot {
    std::string id;                     ///< "<quoteId>-S<version>", предпросмотр "<quoteId>-preview"
    std::string quoteId;
    int64_t quoteVersion = 0;
    std::string priceBookId;
    std::string currency;
    std::vector<LinePricing> lines;
    Decimal subtotal;
    Decimal discountTotal;
    Decimal taxTotal;
    Decimal total;
    std::optional<Decimal> discountCapPct;          ///< Потолок, с которым считали
    std::vector<std::string> authorizedByApprovals; ///< Запросы, разрешившие превышение
    bool taxFinal = false;
    PricingTrace trace;
    std::string traceJson;                          ///< Сериализуется один раз
    std::string traceDigest;                        ///< SHA-256 traceJson
    Timestamp pricedAt;
    std::string pricedBy;

    const LinePricing* findLine(const std::string& lineId) const {
        for (const auto& l : lines) {
            if (l.lineId == lineId) return &l;
        }
        return nullptr;
    }

    /// Средневзвешенная скидка, %
    Decimal effectiveDiscountPct() const {
        if (subtotal.isZero()) return Decimal::zero();
        return discountTotal * Decimal::hundred() / subtotal;
    }

    nlohmann::json toJson() const;
    static QuotePricingSnapshot fromJson(const nlohmann::json& j);
};

} // namespace cpq::domain
