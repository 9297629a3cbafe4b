// include/domain/PolicyDecision.hpp
#pragma once

#include "domain/Decimal.hpp"
#include "domain/JsonConversions.hpp"
#include "domain/enums/PolicyType.hpp"
#include "domain/enums/PolicyStatus.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <optional>
#include <algorithm>

namespace cpq::domain {

/**
 * @brief Сработавшая политика
 *
 * Несёт точные значения порога и факта, а также id политик,
 * проигравших при разрешении конфликта.
 */
struct PolicyViolation {
    std::string policyId;
    int policyVersion = 0;
    PolicyType policyType = PolicyType::DISCOUNT_CAP;
    std::string code;                           ///< discount_above_cap, deal_size_exceeded, ...
    Decimal thresholdValue;
    Decimal actualValue;
    std::string requiredApproverRole;           ///< Пусто для блокирующих
    int approverLevel = 0;
    bool blocking = false;
    std::optional<std::string> productId;
    std::vector<std::string> supersededPolicyIds;

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["policy_id"] = policyId;
        j["policy_version"] = policyVersion;
        j["policy_type"] = toString(policyType);
        j["code"] = code;
        j["threshold_value"] = thresholdValue;
        j["actual_value"] = actualValue;
        j["required_approver_role"] = requiredApproverRole;
        j["approver_level"] = approverLevel;
        j["blocking"] = blocking;
        putOptional(j, "product_id", productId);
        j["superseded_policy_ids"] = supersededPolicyIds;
        return j;
    }

    static PolicyViolation fromJson(const nlohmann::json& j) {
        PolicyViolation v;
        v.policyId = j.at("policy_id").get<std::string>();
        v.policyVersion = j.value("policy_version", 0);
        v.policyType = policyTypeFromString(j.at("policy_type").get<std::string>());
        v.code = j.at("code").get<std::string>();
        v.thresholdValue = j.at("threshold_value").get<Decimal>();
        v.actualValue = j.at("actual_value").get<Decimal>();
        v.requiredApproverRole = j.value("required_approver_role", "");
        v.approverLevel = j.value("approver_level", 0);
        v.blocking = j.value("blocking", false);
        v.productId = getOptional<std::string>(j, "product_id");
        v.supersededPolicyIds = j.value("superseded_policy_ids", std::vector<std::string>{});
        return v;
    }
};

/**
 * @brief Решение по политикам для оценённой котировки
 */
struct PolicyDecision {
    PolicyStatus status = PolicyStatus::AUTO_APPROVED;
    std::vector<PolicyViolation> violations;
    std::vector<std::string> autoApprovedPolicies;
    std::vector<std::string> notApplicablePolicies;
    std::optional<Decimal> discountCapPct;
    std::string snapshotId;

    bool approvalRequired() const { return status == PolicyStatus::APPROVAL_REQUIRED; }
    bool autoApproved() const { return status == PolicyStatus::AUTO_APPROVED; }
    bool blocked() const { return status == PolicyStatus::BLOCKED; }

    /// Роли согласования по возрастанию уровня, без повторов
    std::vector<std::pair<std::string, int>> requiredRoles() const {
        std::vector<std::pair<std::string, int>> roles;
        for (const auto& v : violations) {
            if (v.blocking || v.requiredApproverRole.empty()) continue;
            auto it = std::find_if(roles.begin(), roles.end(),
                                   [&](const auto& r) { return r.first == v.requiredApproverRole; });
            if (it == roles.end()) {
                roles.emplace_back(v.requiredApproverRole, v.approverLevel);
            } else if (v.approverLevel > it->second) {
                it->second = v.approverLevel;
            }
        }
        std::sort(roles.begin(), roles.end(), [](const auto& a, const auto& b) {
            return a.second != b.second ? a.second < b.second : a.first < b.first;
        });
        return roles;
    }

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["status"] = toString(status);
        j["approval_required"] = approvalRequired();
        j["auto_approved"] = autoApproved();
        j["violations"] = nlohmann::json::array();
        for (const auto& v : violations) j["violations"].push_back(v.toJson());
        j["auto_approved_policies"] = autoApprovedPolicies;
        j["not_applicable_policies"] = notApplicablePolicies;
        putOptional(j, "discount_cap_pct", discountCapPct);
        j["snapshot_id"] = snapshotId;
        return j;
    }

    static PolicyDecision fromJson(const nlohmann::json& j) {
        PolicyDecision d;
        d.status = policyStatusFromString(j.at("status").get<std::string>());
        for (const auto& item : j.at("violations")) d.violations.push_back(PolicyViolation::fromJson(item));
        d.autoApprovedPolicies = j.value("auto_approved_policies", std::vector<std::string>{});
        d.notApplicablePolicies = j.value("not_applicable_policies", std::vector<std::string>{});
        d.discountCapPct = getOptional<Decimal>(j, "discount_cap_pct");
        d.snapshotId = j.value("snapshot_id", "");
        return d;
    }
};

} // namespace cpq::domain
