/**
 * @file FlowEngineTest.cpp
 * @brief Unit tests for the quote lifecycle state machine
 */

#include <gtest/gtest.h>
#include "application/FlowEngine.hpp"

using namespace cpq::application;
using namespace cpq::domain;

namespace {

FlowEvent event(FlowEventType type) {
    FlowEvent e;
    e.type = type;
    e.eventId = "evt-1";
    e.source = "test";
    e.actor = "rep";
    e.occurredAt = Timestamp::fromString("2026-01-10T12:00:00Z");
    return e;
}

FlowEvent decision(const std::string& requestId, bool approve, const std::string& role) {
    auto e = event(FlowEventType::APPROVAL_DECIDED);
    e.approvalDecision = ApprovalDecision{requestId, approve, "approver-1", role, ""};
    return e;
}

FlowContext validContext() {
    FlowContext ctx;
    ctx.constraintResult = ConstraintResult{};
    return ctx;
}

PolicyDecision policy(PolicyStatus status) {
    PolicyDecision d;
    d.status = status;
    return d;
}

ApprovalChain chain(std::vector<ApprovalStep> steps) {
    return ApprovalChain::start("Q-1-C5", "Q-1", "Q-1-S4", std::move(steps), "rep",
                                Timestamp::fromString("2026-01-10T12:00:00Z"), 72);
}

} // namespace

TEST(FlowEngineTest, LegalityTable) {
    EXPECT_TRUE(FlowEngine::isLegal(QuoteStatus::DRAFT, FlowEventType::DRAFT_UPDATED));
    EXPECT_TRUE(FlowEngine::isLegal(QuoteStatus::PRICED, FlowEventType::DRAFT_UPDATED));
    EXPECT_FALSE(FlowEngine::isLegal(QuoteStatus::APPROVAL, FlowEventType::DRAFT_UPDATED));
    EXPECT_FALSE(FlowEngine::isLegal(QuoteStatus::FINALIZED, FlowEventType::DRAFT_UPDATED));

    EXPECT_FALSE(FlowEngine::isLegal(QuoteStatus::DRAFT, FlowEventType::PRICING_REQUESTED));
    EXPECT_TRUE(FlowEngine::isLegal(QuoteStatus::VALIDATED, FlowEventType::PRICING_REQUESTED));
    EXPECT_FALSE(FlowEngine::isLegal(QuoteStatus::VALIDATED, FlowEventType::FINALIZE_REQUESTED));
    EXPECT_TRUE(FlowEngine::isLegal(QuoteStatus::APPROVED, FlowEventType::FINALIZE_REQUESTED));
    EXPECT_FALSE(FlowEngine::isLegal(QuoteStatus::PRICED, FlowEventType::APPROVAL_DECIDED));
    EXPECT_FALSE(FlowEngine::isLegal(QuoteStatus::SENT, FlowEventType::QUOTE_DELIVERED));

    for (auto status : {QuoteStatus::DRAFT, QuoteStatus::APPROVAL, QuoteStatus::REJECTED, QuoteStatus::SENT}) {
        EXPECT_TRUE(FlowEngine::isLegal(status, FlowEventType::REVISE_REQUESTED));
        EXPECT_TRUE(FlowEngine::isLegal(status, FlowEventType::CANCEL_REQUESTED));
        EXPECT_TRUE(FlowEngine::isLegal(status, FlowEventType::QUOTE_EXPIRED));
    }
    for (auto status : {QuoteStatus::EXPIRED, QuoteStatus::CANCELLED, QuoteStatus::REVISED}) {
        EXPECT_FALSE(FlowEngine::isLegal(status, FlowEventType::CANCEL_REQUESTED));
    }
}

TEST(FlowEngineTest, DraftUpdateAfterPricingInvalidates) {
    auto draft = FlowEngine::apply(QuoteStatus::DRAFT, event(FlowEventType::DRAFT_UPDATED), {});
    ASSERT_TRUE(draft.ok());
    EXPECT_EQ(draft.outcome->to, QuoteStatus::DRAFT);
    EXPECT_EQ(draft.outcome->effects, std::vector<FlowEffect>{FlowEffect::APPLY_DRAFT_CHANGES});

    auto priced = FlowEngine::apply(QuoteStatus::PRICED, event(FlowEventType::DRAFT_UPDATED), {});
    ASSERT_TRUE(priced.ok());
    EXPECT_EQ(priced.outcome->to, QuoteStatus::DRAFT);
    EXPECT_EQ(priced.outcome->effects,
              (std::vector<FlowEffect>{FlowEffect::APPLY_DRAFT_CHANGES, FlowEffect::INVALIDATE_PRICING}));
}

TEST(FlowEngineTest, RequiredFieldsCollectedListsMissingFields) {
    FlowContext ctx = validContext();
    ctx.missingFields = {"region", "term_months"};

    auto result = FlowEngine::apply(QuoteStatus::DRAFT, event(FlowEventType::REQUIRED_FIELDS_COLLECTED), ctx);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->code, TransitionErrorCode::MISSING_REQUIRED_FIELDS);
    EXPECT_EQ(result.error->missingFields, (std::vector<std::string>{"region", "term_months"}));
    EXPECT_EQ(result.error->toJson()["code"], "missing_required_fields");
}

TEST(FlowEngineTest, RequiredFieldsCollectedNeedsValidConfiguration) {
    FlowContext ctx;
    ctx.constraintResult = ConstraintResult{false, {ConstraintViolation{}}};

    auto invalid = FlowEngine::apply(QuoteStatus::DRAFT, event(FlowEventType::REQUIRED_FIELDS_COLLECTED), ctx);
    ASSERT_FALSE(invalid.ok());
    EXPECT_EQ(invalid.error->code, TransitionErrorCode::CONFIGURATION_INVALID);

    auto valid = FlowEngine::apply(QuoteStatus::DRAFT, event(FlowEventType::REQUIRED_FIELDS_COLLECTED),
                                   validContext());
    ASSERT_TRUE(valid.ok());
    EXPECT_EQ(valid.outcome->to, QuoteStatus::VALIDATED);
}

TEST(FlowEngineTest, PricingRequestedRunsPricingAndPolicy) {
    auto result = FlowEngine::apply(QuoteStatus::VALIDATED, event(FlowEventType::PRICING_REQUESTED), validContext());
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.outcome->to, QuoteStatus::PRICED);
    EXPECT_EQ(result.outcome->effects,
              (std::vector<FlowEffect>{FlowEffect::RUN_PRICING, FlowEffect::EVALUATE_POLICY}));
}

TEST(FlowEngineTest, FinalizeFollowsPolicyDecision) {
    FlowContext ctx;
    auto noPolicy = FlowEngine::apply(QuoteStatus::PRICED, event(FlowEventType::FINALIZE_REQUESTED), ctx);
    ASSERT_FALSE(noPolicy.ok());
    EXPECT_EQ(noPolicy.error->code, TransitionErrorCode::POLICY_NOT_EVALUATED);

    ctx.policyDecision = policy(PolicyStatus::AUTO_APPROVED);
    auto finalized = FlowEngine::apply(QuoteStatus::PRICED, event(FlowEventType::FINALIZE_REQUESTED), ctx);
    ASSERT_TRUE(finalized.ok());
    EXPECT_EQ(finalized.outcome->to, QuoteStatus::FINALIZED);

    ctx.policyDecision = policy(PolicyStatus::APPROVAL_REQUIRED);
    auto approval = FlowEngine::apply(QuoteStatus::PRICED, event(FlowEventType::FINALIZE_REQUESTED), ctx);
    ASSERT_TRUE(approval.ok());
    EXPECT_EQ(approval.outcome->to, QuoteStatus::APPROVAL);
    EXPECT_EQ(approval.outcome->effects,
              (std::vector<FlowEffect>{FlowEffect::REQUEST_APPROVAL, FlowEffect::NOTIFY_APPROVERS}));

    ctx.policyDecision = policy(PolicyStatus::BLOCKED);
    auto blocked = FlowEngine::apply(QuoteStatus::PRICED, event(FlowEventType::FINALIZE_REQUESTED), ctx);
    ASSERT_FALSE(blocked.ok());
    EXPECT_EQ(blocked.error->code, TransitionErrorCode::POLICY_BLOCKED);
}

TEST(FlowEngineTest, FinalizeAfterApprovalReprices) {
    auto result = FlowEngine::apply(QuoteStatus::APPROVED, event(FlowEventType::FINALIZE_REQUESTED), {});
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.outcome->to, QuoteStatus::FINALIZED);
    EXPECT_EQ(result.outcome->effects.front(), FlowEffect::RUN_PRICING);
}

TEST(FlowEngineTest, ApprovalDecisionCompletesSingleStepChain) {
    FlowContext ctx;
    ctx.approvalChain = chain({{"sales_manager", 1, {"dp-enterprise-auto-10"}}});
    ctx.approverAuthority = ApproverAuthority{"sales_manager", 1, Decimal::fromInt(20)};
    ctx.requestedDiscountPct = Decimal::fromInt(15);

    auto result = FlowEngine::apply(QuoteStatus::APPROVAL, decision("Q-1-C5-R1", true, "sales_manager"), ctx);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.outcome->to, QuoteStatus::APPROVED);
}

TEST(FlowEngineTest, ApprovalDecisionAdvancesMultiStepChain) {
    FlowContext ctx;
    ctx.approvalChain = chain({{"sales_manager", 1, {}}, {"finance", 2, {}}});
    ctx.approverAuthority = ApproverAuthority{"sales_manager", 1, std::nullopt};

    auto result = FlowEngine::apply(QuoteStatus::APPROVAL, decision("Q-1-C5-R1", true, "sales_manager"), ctx);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.outcome->to, QuoteStatus::APPROVAL);
    EXPECT_EQ(result.outcome->effects[1], FlowEffect::REQUEST_NEXT_APPROVAL);
}

TEST(FlowEngineTest, RejectionEndsInRejected) {
    FlowContext ctx;
    ctx.approvalChain = chain({{"sales_manager", 1, {}}});
    ctx.approverAuthority = ApproverAuthority{"sales_manager", 1, std::nullopt};

    auto result = FlowEngine::apply(QuoteStatus::APPROVAL, decision("Q-1-C5-R1", false, "sales_manager"), ctx);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.outcome->to, QuoteStatus::REJECTED);
}

TEST(FlowEngineTest, ApprovalDecisionChecks) {
    FlowContext ctx;
    ctx.approvalChain = chain({{"vp_sales", 2, {}}});
    ctx.requestedDiscountPct = Decimal::fromInt(30);

    auto stale = FlowEngine::apply(QuoteStatus::APPROVAL, decision("Q-1-C4-R1", true, "vp_sales"), ctx);
    ASSERT_FALSE(stale.ok());
    EXPECT_EQ(stale.error->code, TransitionErrorCode::APPROVAL_NOT_PENDING);

    auto unknownRole = FlowEngine::apply(QuoteStatus::APPROVAL, decision("Q-1-C5-R1", true, "intern"), ctx);
    ASSERT_FALSE(unknownRole.ok());
    EXPECT_EQ(unknownRole.error->code, TransitionErrorCode::APPROVER_NOT_AUTHORIZED);

    ctx.approverAuthority = ApproverAuthority{"sales_manager", 1, Decimal::fromInt(20)};
    auto lowRank = FlowEngine::apply(QuoteStatus::APPROVAL, decision("Q-1-C5-R1", true, "sales_manager"), ctx);
    ASSERT_FALSE(lowRank.ok());
    EXPECT_EQ(lowRank.error->code, TransitionErrorCode::APPROVER_NOT_AUTHORIZED);

    ctx.approverAuthority = ApproverAuthority{"vp_sales", 2, Decimal::fromInt(25)};
    auto overLimit = FlowEngine::apply(QuoteStatus::APPROVAL, decision("Q-1-C5-R1", true, "vp_sales"), ctx);
    ASSERT_FALSE(overLimit.ok());
    EXPECT_EQ(overLimit.error->code, TransitionErrorCode::APPROVER_NOT_AUTHORIZED);
}

TEST(FlowEngineTest, TerminalStatesRejectEverything) {
    auto result = FlowEngine::apply(QuoteStatus::CANCELLED, event(FlowEventType::REVISE_REQUESTED), {});
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->code, TransitionErrorCode::TERMINAL_STATE);
}

TEST(FlowEngineTest, IllegalPairReportsStateAndEvent) {
    auto result = FlowEngine::apply(QuoteStatus::DRAFT, event(FlowEventType::QUOTE_DELIVERED), {});
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->code, TransitionErrorCode::ILLEGAL_TRANSITION);
    EXPECT_EQ(result.error->state, QuoteStatus::DRAFT);
    EXPECT_EQ(result.error->event, FlowEventType::QUOTE_DELIVERED);
}

TEST(FlowEngineTest, ExitEventsFromAnyLiveState) {
    auto revise = FlowEngine::apply(QuoteStatus::SENT, event(FlowEventType::REVISE_REQUESTED), {});
    ASSERT_TRUE(revise.ok());
    EXPECT_EQ(revise.outcome->to, QuoteStatus::REVISED);
    EXPECT_EQ(revise.outcome->effects, std::vector<FlowEffect>{FlowEffect::CREATE_AMENDMENT});

    auto cancel = FlowEngine::apply(QuoteStatus::APPROVAL, event(FlowEventType::CANCEL_REQUESTED), {});
    ASSERT_TRUE(cancel.ok());
    EXPECT_EQ(cancel.outcome->to, QuoteStatus::CANCELLED);

    auto expire = FlowEngine::apply(QuoteStatus::APPROVAL, event(FlowEventType::QUOTE_EXPIRED), {});
    ASSERT_TRUE(expire.ok());
    EXPECT_EQ(expire.outcome->to, QuoteStatus::EXPIRED);
    EXPECT_EQ(expire.outcome->effects, std::vector<FlowEffect>{FlowEffect::EXPIRE_PENDING_APPROVALS});
}

TEST(FlowEngineTest, SentQuoteCanExpire) {
    auto expire = FlowEngine::apply(QuoteStatus::SENT, event(FlowEventType::QUOTE_EXPIRED), {});
    ASSERT_TRUE(expire.ok());
    EXPECT_EQ(expire.outcome->from, QuoteStatus::SENT);
    EXPECT_EQ(expire.outcome->to, QuoteStatus::EXPIRED);

    EXPECT_FALSE(FlowEngine::apply(QuoteStatus::EXPIRED, event(FlowEventType::QUOTE_EXPIRED), {}).ok());
}
