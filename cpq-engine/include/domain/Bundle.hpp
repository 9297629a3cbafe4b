// include/domain/Bundle.hpp
#pragma once

#include "domain/Decimal.hpp"
#include "domain/QuoteLine.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace cpq::domain {

/**
 * @brief Компонент пакета: количество товара в пакете в [minQuantity, maxQuantity]
 */
struct BundleComponent {
    std::string productId;
    bool required = true;
    int64_t minQuantity = 1;
    std::optional<int64_t> maxQuantity;
};

struct Bundle {
    std::string id;
    std::string name;
    Decimal discountPct;
    std::vector<BundleComponent> components;
    bool active = true;
};

enum class BundleMismatchKind {
    MISSING_REQUIRED,
    BELOW_MIN,
    ABOVE_MAX,
    UNEXPECTED_COMPONENT
};

inline std::string toString(BundleMismatchKind kind) {
    switch (kind) {
        case BundleMismatchKind::MISSING_REQUIRED: return "missing_required";
        case BundleMismatchKind::BELOW_MIN: return "below_min";
        case BundleMismatchKind::ABOVE_MAX: return "above_max";
        case BundleMismatchKind::UNEXPECTED_COMPONENT: return "unexpected_component";
        default: return "unknown";
    }
}

struct BundleMismatch {
    std::string bundleId;
    std::string productId;
    BundleMismatchKind kind;
    int64_t actualQuantity = 0;
    int64_t minQuantity = 0;
    std::optional<int64_t> maxQuantity;
};

/**
 * @brief Сверить состав пакета со строками котировки, помеченными bundleId
 *
 * Используется и проверкой конфигурации, и ценообразованием (повторная проверка).
 * Пустой результат: состав точно соответствует.
 */
std::vector<BundleMismatch> checkComposition(const Bundle& bundle, const std::vector<QuoteLine>& lines);

} // namespace cpq::domain
