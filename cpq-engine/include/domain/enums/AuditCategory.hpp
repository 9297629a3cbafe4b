// include/domain/enums/AuditCategory.hpp
#pragma once

#include <string>
#include <stdexcept>

namespace cpq::domain {

enum class AuditCategory {
    INGRESS,
    FLOW,
    CONSTRAINT,
    PRICING,
    POLICY,
    APPROVAL,
    PERSISTENCE,
    SYSTEM
};

enum class AuditOutcome {
    SUCCESS,
    REJECTED,
    FAILED
};

inline std::string toString(AuditCategory category) {
    switch (category) {
        case AuditCategory::INGRESS: return "ingress";
        case AuditCategory::FLOW: return "flow";
        case AuditCategory::CONSTRAINT: return "constraint";
        case AuditCategory::PRICING: return "pricing";
        case AuditCategory::POLICY: return "policy";
        case AuditCategory::APPROVAL: return "approval";
        case AuditCategory::PERSISTENCE: return "persistence";
        case AuditCategory::SYSTEM: return "system";
        default: return "unknown";
    }
}

inline AuditCategory auditCategoryFromString(const std::string& str) {
    if (str == "ingress") return AuditCategory::INGRESS;
    if (str == "flow") return AuditCategory::FLOW;
    if (str == "constraint") return AuditCategory::CONSTRAINT;
    if (str == "pricing") return AuditCategory::PRICING;
    if (str == "policy") return AuditCategory::POLICY;
    if (str == "approval") return AuditCategory::APPROVAL;
    if (str == "persistence") return AuditCategory::PERSISTENCE;
    if (str == "system") return AuditCategory::SYSTEM;
    throw std::invalid_argument("Unknown audit category: " + str);
}

inline std::string toString(AuditOutcome outcome) {
    switch (outcome) {
        case AuditOutcome::SUCCESS: return "success";
        case AuditOutcome::REJECTED: return "rejected";
        case AuditOutcome::FAILED: return "failed";
        default: return "unknown";
    }
}

inline AuditOutcome auditOutcomeFromString(const std::string& str) {
    if (str == "success") return AuditOutcome::SUCCESS;
    if (str == "rejected") return AuditOutcome::REJECTED;
    if (str == "failed") return AuditOutcome::FAILED;
    throw std::invalid_argument("Unknown audit outcome: " + str);
}

} // namespace cpq::domain
