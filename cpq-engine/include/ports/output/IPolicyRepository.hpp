// include/ports/output/IPolicyRepository.hpp
#pragma once

#include "domain/DiscountPolicy.hpp"
#include "domain/ApprovalThreshold.hpp"
#include <string>
#include <vector>
#include <optional>

namespace cpq::ports::output {

/**
 * @brief Контракт чтения политик
 */
class IPolicyRepository {
public:
    virtual ~IPolicyRepository() = default;

    /// Активные потолки скидки для сегмента и категории (с учётом "*")
    virtual std::vector<domain::DiscountPolicy> activeDiscountPolicies(
        const std::string& segment,
        const std::string& category) = 0;

    /// Активные пороги согласования для сегмента (с учётом "*")
    virtual std::vector<domain::ApprovalThreshold> activeApprovalThresholds(const std::string& segment) = 0;

    virtual std::optional<domain::ApproverAuthority> findApproverAuthority(const std::string& role) = 0;
};

} // namespace cpq::ports::output
