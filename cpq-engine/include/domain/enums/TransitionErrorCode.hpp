// include/domain/enums/TransitionErrorCode.hpp
#pragma once

#include <string>
#include <stdexcept>

namespace cpq::domain {

/**
 * @brief Причина отклонения перехода
 */
enum class TransitionErrorCode {
    ILLEGAL_TRANSITION,
    TERMINAL_STATE,
    MISSING_REQUIRED_FIELDS,
    CONFIGURATION_INVALID,
    POLICY_BLOCKED,
    POLICY_NOT_EVALUATED,
    APPROVAL_NOT_PENDING,
    APPROVER_NOT_AUTHORIZED
};

inline std::string toString(TransitionErrorCode code) {
    switch (code) {
        case TransitionErrorCode::ILLEGAL_TRANSITION: return "illegal_transition";
        case TransitionErrorCode::TERMINAL_STATE: return "terminal_state";
        case TransitionErrorCode::MISSING_REQUIRED_FIELDS: return "missing_required_fields";
        case TransitionErrorCode::CONFIGURATION_INVALID: return "configuration_invalid";
        case TransitionErrorCode::POLICY_BLOCKED: return "policy_blocked";
        case TransitionErrorCode::POLICY_NOT_EVALUATED: return "policy_not_evaluated";
        case TransitionErrorCode::APPROVAL_NOT_PENDING: return "approval_not_pending";
        case TransitionErrorCode::APPROVER_NOT_AUTHORIZED: return "approver_not_authorized";
        default: return "unknown";
    }
}

inline TransitionErrorCode transitionErrorCodeFromString(const std::string& str) {
    if (str == "illegal_transition") return TransitionErrorCode::ILLEGAL_TRANSITION;
    if (str == "terminal_state") return TransitionErrorCode::TERMINAL_STATE;
    if (str == "missing_required_fields") return TransitionErrorCode::MISSING_REQUIRED_FIELDS;
    if (str == "configuration_invalid") return TransitionErrorCode::CONFIGURATION_INVALID;
    if (str == "policy_blocked") return TransitionErrorCode::POLICY_BLOCKED;
    if (str == "policy_not_evaluated") return TransitionErrorCode::POLICY_NOT_EVALUATED;
    if (str == "approval_not_pending") return TransitionErrorCode::APPROVAL_NOT_PENDING;
    if (str == "approver_not_authorized") return TransitionErrorCode::APPROVER_NOT_AUTHORIZED;
    throw std::invalid_argument("Unknown transition error code: " + str);
}

} // namespace cpq::domain
