#include "domain/ApplyResult.hpp"
#include "domain/JsonConversions.hpp"

namespace cpq::domain {

namespace {

PricingErrorCode pricingErrorCodeFromString(const std::string& str) {
    static const PricingErrorCode all[] = {
        PricingErrorCode::NO_LINES, PricingErrorCode::NO_APPLICABLE_PRICE_BOOK,
        PricingErrorCode::MISSING_PRODUCT, PricingErrorCode::MISSING_PRICE_BOOK_ENTRY,
        PricingErrorCode::TIER_GAP, PricingErrorCode::MISSING_BUNDLE,
        PricingErrorCode::MISSING_FORMULA, PricingErrorCode::FORMULA_ERROR,
        PricingErrorCode::MISSING_INPUT
    };
    for (auto code : all) {
        if (toString(code) == str) return code;
    }
    throw std::invalid_argument("Unknown pricing error code: " + str);
}

FlowEffect flowEffectFromString(const std::string& str) {
    for (int i = 0; i <= static_cast<int>(FlowEffect::EXPIRE_PENDING_APPROVALS); ++i) {
        auto effect = static_cast<FlowEffect>(i);
        if (toString(effect) == str) return effect;
    }
    throw std::invalid_argument("Unknown flow effect: " + str);
}

} // namespace

ApplyStatus applyStatusFromString(const std::string& str) {
    for (int i = 0; i <= static_cast<int>(ApplyStatus::IN_PROGRESS); ++i) {
        auto status = static_cast<ApplyStatus>(i);
        if (toString(status) == str) return status;
    }
    throw std::invalid_argument("Unknown apply status: " + str);
}

nlohmann::json ApplyResult::toJson() const {
    nlohmann::json j;
    j["status"] = toString(status);
    j["quote_id"] = quoteId;
    if (fromState) j["from_state"] = toString(*fromState);
    if (toState) j["to_state"] = toString(*toState);
    j["version"] = version;
    j["effects"] = nlohmann::json::array();
    for (auto effect : effects) j["effects"].push_back(toString(effect));
    if (transitionError) j["transition_error"] = toString(*transitionError);
    j["missing_fields"] = missingFields;
    if (constraintResult) j["constraint_result"] = constraintResult->toJson();
    if (pricingFailure) {
        j["pricing_failure"] = {
            {"code", toString(pricingFailure->code)},
            {"line_id", pricingFailure->lineId},
            {"product_id", pricingFailure->productId},
            {"reference", pricingFailure->reference},
            {"internal_consistency", pricingFailure->internalConsistency}
        };
    }
    if (policyDecision) j["policy_decision"] = policyDecision->toJson();
    putOptional(j, "snapshot_id", snapshotId);
    j["approval_request_ids"] = approvalRequestIds;
    putOptional(j, "amendment_quote_id", amendmentQuoteId);
    putOptional(j, "expected_version", expectedVersion);
    putOptional(j, "actual_version", actualVersion);
    if (!offendingId.empty()) j["offending_id"] = offendingId;
    if (!detail.empty()) j["detail"] = detail;
    j["idempotency_key"] = idempotencyKey;
    j["replayed"] = replayed;
    return j;
}

ApplyResult ApplyResult::fromJson(const nlohmann::json& j) {
    ApplyResult r;
    r.status = applyStatusFromString(j.at("status").get<std::string>());
    r.quoteId = j.at("quote_id").get<std::string>();
    if (j.contains("from_state")) r.fromState = quoteStatusFromString(j["from_state"].get<std::string>());
    if (j.contains("to_state")) r.toState = quoteStatusFromString(j["to_state"].get<std::string>());
    r.version = j.value("version", int64_t{0});
    for (const auto& e : j.value("effects", nlohmann::json::array())) {
        r.effects.push_back(flowEffectFromString(e.get<std::string>()));
    }
    if (j.contains("transition_error")) {
        r.transitionError = transitionErrorCodeFromString(j["transition_error"].get<std::string>());
    }
    r.missingFields = j.value("missing_fields", std::vector<std::string>{});
    if (j.contains("constraint_result")) r.constraintResult = ConstraintResult::fromJson(j["constraint_result"]);
    if (j.contains("pricing_failure")) {
        const auto& pf = j["pricing_failure"];
        PricingFailure failure;
        failure.code = pricingErrorCodeFromString(pf.at("code").get<std::string>());
        failure.lineId = pf.value("line_id", "");
        failure.productId = pf.value("product_id", "");
        failure.reference = pf.value("reference", "");
        failure.internalConsistency = pf.value("internal_consistency", false);
        r.pricingFailure = failure;
    }
    if (j.contains("policy_decision")) r.policyDecision = PolicyDecision::fromJson(j["policy_decision"]);
    r.snapshotId = getOptional<std::string>(j, "snapshot_id");
    r.approvalRequestIds = j.value("approval_request_ids", std::vector<std::string>{});
    r.amendmentQuoteId = getOptional<std::string>(j, "amendment_quote_id");
    r.expectedVersion = getOptional<int64_t>(j, "expected_version");
    r.actualVersion = getOptional<int64_t>(j, "actual_version");
    r.offendingId = j.value("offending_id", "");
    r.detail = j.value("detail", "");
    r.idempotencyKey = j.value("idempotency_key", "");
    r.replayed = j.value("replayed", false);
    return r;
}

} // namespace cpq::domain
