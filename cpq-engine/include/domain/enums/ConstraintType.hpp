// include/domain/enums/ConstraintType.hpp
#pragma once

#include <string>
#include <stdexcept>

namespace cpq::domain {

enum class ConstraintType {
    REQUIRES,
    EXCLUDES,
    ATTRIBUTE,
    QUANTITY,
    BUNDLE,
    CROSS_PRODUCT
};

inline std::string toString(ConstraintType type) {
    switch (type) {
        case ConstraintType::REQUIRES: return "requires";
        case ConstraintType::EXCLUDES: return "excludes";
        case ConstraintType::ATTRIBUTE: return "attribute";
        case ConstraintType::QUANTITY: return "quantity";
        case ConstraintType::BUNDLE: return "bundle";
        case ConstraintType::CROSS_PRODUCT: return "cross_product";
        default: return "unknown";
    }
}

inline ConstraintType constraintTypeFromString(const std::string& str) {
    if (str == "requires") return ConstraintType::REQUIRES;
    if (str == "excludes") return ConstraintType::EXCLUDES;
    if (str == "attribute") return ConstraintType::ATTRIBUTE;
    if (str == "quantity") return ConstraintType::QUANTITY;
    if (str == "bundle") return ConstraintType::BUNDLE;
    if (str == "cross_product") return ConstraintType::CROSS_PRODUCT;
    throw std::invalid_argument("Unknown constraint type: " + str);
}

} // namespace cpq::domain
