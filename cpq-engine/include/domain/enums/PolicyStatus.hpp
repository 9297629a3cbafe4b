// include/domain/enums/PolicyStatus.hpp
#pragma once

#include <string>
#include <stdexcept>

namespace cpq::domain {

enum class PolicyStatus {
    AUTO_APPROVED,
    APPROVAL_REQUIRED,
    BLOCKED
};

inline std::string toString(PolicyStatus status) {
    switch (status) {
        case PolicyStatus::AUTO_APPROVED: return "AutoApproved";
        case PolicyStatus::APPROVAL_REQUIRED: return "ApprovalRequired";
        case PolicyStatus::BLOCKED: return "Blocked";
        default: return "Unknown";
    }
}

inline PolicyStatus policyStatusFromString(const std::string& str) {
    if (str == "AutoApproved") return PolicyStatus::AUTO_APPROVED;
    if (str == "ApprovalRequired") return PolicyStatus::APPROVAL_REQUIRED;
    if (str == "Blocked") return PolicyStatus::BLOCKED;
    throw std::invalid_argument("Unknown policy status: " + str);
}

} // namespace cpq::domain
