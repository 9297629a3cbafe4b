// include/domain/PriceBook.hpp
#pragma once

#include "domain/Decimal.hpp"
#include "domain/Timestamp.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace cpq::domain {

/**
 * @brief Прайс-лист с областью действия (сегмент/регион/валюта/период)
 *
 * "*" в segment или region подходит для любого значения.
 */
struct PriceBook {
    std::string id;
    std::string name;
    std::string segment = "*";
    std::string region = "*";
    std::string currency;
    Timestamp validFrom;
    std::optional<Timestamp> validTo;   ///< Исключительная граница
    int priority = 0;
    bool active = true;

    bool matches(const std::string& seg, const std::string& reg,
                 const std::string& cur, const Timestamp& at) const {
        if (!active) return false;
        if (segment != "*" && segment != seg) return false;
        if (region != "*" && region != reg) return false;
        if (currency != cur) return false;
        if (at < validFrom) return false;
        if (validTo && !(at < *validTo)) return false;
        return true;
    }
};

/**
 * @brief Ступень объёма: [minQuantity, maxQuantity), верхняя граница может отсутствовать
 */
struct VolumeTier {
    int64_t minQuantity = 1;
    std::optional<int64_t> maxQuantity;
    Decimal unitPrice;

    bool contains(int64_t quantity) const {
        return quantity >= minQuantity && (!maxQuantity || quantity < *maxQuantity);
    }

    std::string rangeString() const {
        return "[" + std::to_string(minQuantity) + ", " +
               (maxQuantity ? std::to_string(*maxQuantity) : std::string("inf")) + ")";
    }
};

/**
 * @brief Цена товара в конкретном прайс-листе
 */
struct PriceBookEntry {
    std::string priceBookId;
    std::string productId;
    Decimal listPrice;
    std::optional<Decimal> unitCost;        ///< Себестоимость для политик маржи
    std::optional<std::string> formulaId;
    std::vector<VolumeTier> tiers;          ///< Упорядочены по minQuantity

    /// nullptr, если количество попало в разрыв
    const VolumeTier* findTier(int64_t quantity) const {
        for (const auto& tier : tiers) {
            if (tier.contains(quantity)) return &tier;
        }
        return nullptr;
    }
};

/**
 * @brief Проверка ступеней при загрузке данных
 *
 * Ступени начинаются с 1, идут без разрывов и пересечений, последняя открыта,
 * цена за единицу не растёт с количеством.
 * @throws InvariantViolationException
 */
void validateTiers(const PriceBookEntry& entry);

} // namespace cpq::domain
