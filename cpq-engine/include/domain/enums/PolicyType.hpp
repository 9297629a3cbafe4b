// include/domain/enums/PolicyType.hpp
#pragma once

#include <string>
#include <stdexcept>

namespace cpq::domain {

/**
 * @brief Семейство политик (threshold_type)
 */
enum class PolicyType {
    DISCOUNT_CAP,
    MARGIN_FLOOR,
    DEAL_SIZE,
    PRODUCT,
    TEMPORAL
};

inline std::string toString(PolicyType type) {
    switch (type) {
        case PolicyType::DISCOUNT_CAP: return "discount_cap";
        case PolicyType::MARGIN_FLOOR: return "margin_floor";
        case PolicyType::DEAL_SIZE: return "deal_size";
        case PolicyType::PRODUCT: return "product";
        case PolicyType::TEMPORAL: return "temporal";
        default: return "unknown";
    }
}

inline PolicyType policyTypeFromString(const std::string& str) {
    if (str == "discount_cap") return PolicyType::DISCOUNT_CAP;
    if (str == "margin_floor") return PolicyType::MARGIN_FLOOR;
    if (str == "deal_size") return PolicyType::DEAL_SIZE;
    if (str == "product") return PolicyType::PRODUCT;
    if (str == "temporal") return PolicyType::TEMPORAL;
    throw std::invalid_argument("Unknown policy type: " + str);
}

} // namespace cpq::domain
