// include/domain/enums/ApprovalStatus.hpp
#pragma once

#include <string>
#include <stdexcept>

namespace cpq::domain {

enum class ApprovalStatus {
    PENDING,
    APPROVED,
    REJECTED,
    EXPIRED
};

inline std::string toString(ApprovalStatus status) {
    switch (status) {
        case ApprovalStatus::PENDING: return "pending";
        case ApprovalStatus::APPROVED: return "approved";
        case ApprovalStatus::REJECTED: return "rejected";
        case ApprovalStatus::EXPIRED: return "expired";
        default: return "unknown";
    }
}

inline ApprovalStatus approvalStatusFromString(const std::string& str) {
    if (str == "pending") return ApprovalStatus::PENDING;
    if (str == "approved") return ApprovalStatus::APPROVED;
    if (str == "rejected") return ApprovalStatus::REJECTED;
    if (str == "expired") return ApprovalStatus::EXPIRED;
    throw std::invalid_argument("Unknown approval status: " + str);
}

/// approved/rejected/expired окончательны для запроса
inline bool isFinal(ApprovalStatus status) {
    return status != ApprovalStatus::PENDING;
}

} // namespace cpq::domain
