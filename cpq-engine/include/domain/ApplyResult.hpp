// include/domain/ApplyResult.hpp
#pragma once

#include "domain/ConstraintResult.hpp"
#include "domain/PolicyDecision.hpp"
#include "domain/Errors.hpp"
#include "domain/enums/QuoteStatus.hpp"
#include "domain/enums/FlowEffect.hpp"
#include "domain/enums/TransitionErrorCode.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace cpq::domain {

enum class ApplyStatus {
    APPLIED,
    VERSION_CONFLICT,
    TRANSITION_ILLEGAL,
    CONFIGURATION_INVALID,
    PRICING_DATA_MISSING,
    POLICY_DATA_MALFORMED,
    CONSTRAINT_DATA_MALFORMED,
    POLICY_BLOCKED,
    INVARIANT_VIOLATION,
    NOT_FOUND,
    INVALID_EVENT,
    IN_PROGRESS
};

inline std::string toString(ApplyStatus status) {
    switch (status) {
        case ApplyStatus::APPLIED: return "APPLIED";
        case ApplyStatus::VERSION_CONFLICT: return "VERSION_CONFLICT";
        case ApplyStatus::TRANSITION_ILLEGAL: return "TRANSITION_ILLEGAL";
        case ApplyStatus::CONFIGURATION_INVALID: return "CONFIGURATION_INVALID";
        case ApplyStatus::PRICING_DATA_MISSING: return "PRICING_DATA_MISSING";
        case ApplyStatus::POLICY_DATA_MALFORMED: return "POLICY_DATA_MALFORMED";
        case ApplyStatus::CONSTRAINT_DATA_MALFORMED: return "CONSTRAINT_DATA_MALFORMED";
        case ApplyStatus::POLICY_BLOCKED: return "POLICY_BLOCKED";
        case ApplyStatus::INVARIANT_VIOLATION: return "INVARIANT_VIOLATION";
        case ApplyStatus::NOT_FOUND: return "NOT_FOUND";
        case ApplyStatus::INVALID_EVENT: return "INVALID_EVENT";
        case ApplyStatus::IN_PROGRESS: return "IN_PROGRESS";
        default: return "UNKNOWN";
    }
}

ApplyStatus applyStatusFromString(const std::string& str);

/// Структурированная ошибка ценообразования
struct PricingFailure {
    PricingErrorCode code = PricingErrorCode::NO_APPLICABLE_PRICE_BOOK;
    std::string lineId;
    std::string productId;
    std::string reference;
    bool internalConsistency = false;
};

/**
 * @brief Результат apply(quote_id, expected_version, event)
 *
 * Любой отказ несёт структурированные данные (поля, правила, id),
 * detail только для диагностики.
 */
struct ApplyResult {
    ApplyStatus status = ApplyStatus::APPLIED;
    std::string quoteId;
    std::optional<QuoteStatus> fromState;
    std::optional<QuoteStatus> toState;
    int64_t version = 0;                            ///< Версия после применения (или текущая)
    std::vector<FlowEffect> effects;
    std::optional<TransitionErrorCode> transitionError;
    std::vector<std::string> missingFields;
    std::optional<ConstraintResult> constraintResult;
    std::optional<PricingFailure> pricingFailure;
    std::optional<PolicyDecision> policyDecision;
    std::optional<std::string> snapshotId;
    std::vector<std::string> approvalRequestIds;
    std::optional<std::string> amendmentQuoteId;
    std::optional<int64_t> expectedVersion;
    std::optional<int64_t> actualVersion;
    std::string offendingId;                        ///< rule/policy/line id для ошибок данных, путь поля для INVALID_EVENT
    std::string detail;
    std::string idempotencyKey;
    bool replayed = false;

    bool ok() const { return status == ApplyStatus::APPLIED; }

    nlohmann::json toJson() const;
    static ApplyResult fromJson(const nlohmann::json& j);
};

} // namespace cpq::domain
