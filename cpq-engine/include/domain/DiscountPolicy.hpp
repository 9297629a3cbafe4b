// include/domain/DiscountPolicy.hpp
#pragma once

#include "domain/Decimal.hpp"
#include <string>

namespace cpq::domain {

/**
 * @brief Потолок автоматической скидки для сегмента/категории
 */
struct DiscountPolicy {
    std::string id;
    int version = 1;
    std::string segment = "*";
    std::string category = "*";
    Decimal maxAutoDiscountPct;
    std::string approverRole;           ///< Роль, утверждающая превышение
    int approverLevel = 1;
    int priority = 100;
    bool active = true;
};

} // namespace cpq::domain
