// include/domain/ApprovalThreshold.hpp
#pragma once

#include "domain/Decimal.hpp"
#include "domain/enums/PolicyType.hpp"
#include <string>
#include <optional>

namespace cpq::domain {

/**
 * @brief Порог согласования (deal_size, margin_floor, product, temporal, discount_cap)
 */
struct ApprovalThreshold {
    std::string id;
    int version = 1;
    PolicyType type = PolicyType::DEAL_SIZE;
    std::string segment = "*";
    std::string condition;              ///< JSON-условие, формат зависит от type
    std::string approverRole;
    int approverLevel = 1;
    int priority = 100;
    bool active = true;
};

/**
 * @brief Полномочия роли согласующего
 */
struct ApproverAuthority {
    std::string role;
    int rank = 0;                               ///< Соответствует approverLevel
    std::optional<Decimal> maxDiscountPct;      ///< Отсутствует - без ограничения
};

} // namespace cpq::domain
