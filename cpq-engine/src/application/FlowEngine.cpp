#include "application/FlowEngine.hpp"

namespace cpq::application {

using domain::FlowEffect;
using domain::FlowEventType;
using domain::QuoteStatus;
using domain::TransitionErrorCode;

namespace {

TransitionResult success(QuoteStatus from, QuoteStatus to, std::vector<FlowEffect> effects) {
    TransitionResult result;
    result.outcome = TransitionOutcome{from, to, std::move(effects)};
    return result;
}

TransitionResult failure(TransitionErrorCode code, QuoteStatus state, FlowEventType event,
                         std::string detail, std::vector<std::string> missingFields = {}) {
    TransitionError error;
    error.code = code;
    error.state = state;
    error.event = event;
    error.detail = std::move(detail);
    error.missingFields = std::move(missingFields);

    TransitionResult result;
    result.error = std::move(error);
    return result;
}

TransitionResult illegal(QuoteStatus state, FlowEventType event) {
    return failure(TransitionErrorCode::ILLEGAL_TRANSITION, state, event,
                   "Event " + domain::toString(event) + " is not allowed in state " + domain::toString(state));
}

} // namespace

bool FlowEngine::isLegal(QuoteStatus current, FlowEventType eventType) {
    if (domain::isTerminal(current)) return false;

    switch (eventType) {
        case FlowEventType::DRAFT_UPDATED:
            return current == QuoteStatus::DRAFT || current == QuoteStatus::VALIDATED ||
                   current == QuoteStatus::PRICED;
        case FlowEventType::REQUIRED_FIELDS_COLLECTED:
            return current == QuoteStatus::DRAFT;
        case FlowEventType::PRICING_REQUESTED:
            return current == QuoteStatus::VALIDATED || current == QuoteStatus::PRICED;
        case FlowEventType::FINALIZE_REQUESTED:
            return current == QuoteStatus::PRICED || current == QuoteStatus::APPROVED;
        case FlowEventType::APPROVAL_DECIDED:
            return current == QuoteStatus::APPROVAL;
        case FlowEventType::QUOTE_DELIVERED:
            return current == QuoteStatus::FINALIZED;
        case FlowEventType::REVISE_REQUESTED:
        case FlowEventType::CANCEL_REQUESTED:
        case FlowEventType::QUOTE_EXPIRED:
            return true;
        default:
            return false;
    }
}

TransitionResult FlowEngine::apply(QuoteStatus current, const domain::FlowEvent& event,
                                   const FlowContext& context) {
    const FlowEventType type = event.type;

    if (domain::isTerminal(current)) {
        return failure(TransitionErrorCode::TERMINAL_STATE, current, type,
                       "Quote is in terminal state " + domain::toString(current));
    }
    if (!isLegal(current, type)) {
        return illegal(current, type);
    }

    switch (type) {
        case FlowEventType::DRAFT_UPDATED:
            if (current == QuoteStatus::DRAFT) {
                return success(current, QuoteStatus::DRAFT, {FlowEffect::APPLY_DRAFT_CHANGES});
            }
            return success(current, QuoteStatus::DRAFT,
                           {FlowEffect::APPLY_DRAFT_CHANGES, FlowEffect::INVALIDATE_PRICING});

        case FlowEventType::REQUIRED_FIELDS_COLLECTED:
            if (!context.missingFields.empty()) {
                return failure(TransitionErrorCode::MISSING_REQUIRED_FIELDS, current, type,
                               "Required fields are missing", context.missingFields);
            }
            if (!context.constraintResult) {
                return failure(TransitionErrorCode::CONFIGURATION_INVALID, current, type,
                               "Configuration has not been evaluated");
            }
            if (!context.constraintResult->valid) {
                return failure(TransitionErrorCode::CONFIGURATION_INVALID, current, type,
                               std::to_string(context.constraintResult->violations.size()) +
                               " constraint violation(s)");
            }
            return success(current, QuoteStatus::VALIDATED, {FlowEffect::RECORD_VALIDATION});

        case FlowEventType::PRICING_REQUESTED:
            if (context.constraintResult && !context.constraintResult->valid) {
                return failure(TransitionErrorCode::CONFIGURATION_INVALID, current, type,
                               "Configuration became invalid");
            }
            return success(current, QuoteStatus::PRICED, {FlowEffect::RUN_PRICING, FlowEffect::EVALUATE_POLICY});

        case FlowEventType::FINALIZE_REQUESTED:
            if (current == QuoteStatus::APPROVED) {
                return success(current, QuoteStatus::FINALIZED,
                               {FlowEffect::RUN_PRICING, FlowEffect::FINALIZE_QUOTE, FlowEffect::PUBLISH_QUOTE});
            }
            if (!context.policyDecision) {
                return failure(TransitionErrorCode::POLICY_NOT_EVALUATED, current, type,
                               "No policy decision for the current pricing");
            }
            if (context.policyDecision->blocked()) {
                return failure(TransitionErrorCode::POLICY_BLOCKED, current, type,
                               "Policy decision is Blocked");
            }
            if (context.policyDecision->approvalRequired()) {
                return success(current, QuoteStatus::APPROVAL,
                               {FlowEffect::REQUEST_APPROVAL, FlowEffect::NOTIFY_APPROVERS});
            }
            return success(current, QuoteStatus::FINALIZED, {FlowEffect::FINALIZE_QUOTE, FlowEffect::PUBLISH_QUOTE});

        case FlowEventType::APPROVAL_DECIDED:
            return approvalDecided(current, event, context);

        case FlowEventType::QUOTE_DELIVERED:
            return success(current, QuoteStatus::SENT, {FlowEffect::MARK_QUOTE_SENT});

        case FlowEventType::REVISE_REQUESTED:
            return success(current, QuoteStatus::REVISED, {FlowEffect::CREATE_AMENDMENT});

        case FlowEventType::CANCEL_REQUESTED:
            return success(current, QuoteStatus::CANCELLED, {});

        case FlowEventType::QUOTE_EXPIRED:
            return success(current, QuoteStatus::EXPIRED, {FlowEffect::EXPIRE_PENDING_APPROVALS});

        default:
            return illegal(current, type);
    }
}

TransitionResult FlowEngine::approvalDecided(QuoteStatus current, const domain::FlowEvent& event,
                                             const FlowContext& context) {
    const FlowEventType type = event.type;

    if (!event.approvalDecision) {
        return failure(TransitionErrorCode::APPROVAL_NOT_PENDING, current, type, "Event carries no decision");
    }
    const auto& decision = *event.approvalDecision;

    const domain::ApprovalRequest* pending = context.approvalChain ? context.approvalChain->pending() : nullptr;
    if (!pending || pending->id != decision.requestId) {
        return failure(TransitionErrorCode::APPROVAL_NOT_PENDING, current, type,
                       "Approval request " + decision.requestId + " is not pending");
    }

    if (!context.approverAuthority) {
        return failure(TransitionErrorCode::APPROVER_NOT_AUTHORIZED, current, type,
                       "Role " + decision.approverRole + " has no approval authority");
    }
    if (context.approverAuthority->rank < pending->approverLevel) {
        return failure(TransitionErrorCode::APPROVER_NOT_AUTHORIZED, current, type,
                       "Role " + decision.approverRole + " (rank " + std::to_string(context.approverAuthority->rank) +
                       ") cannot decide level " + std::to_string(pending->approverLevel));
    }

    if (!decision.approve) {
        return success(current, QuoteStatus::REJECTED, {FlowEffect::RECORD_APPROVAL_DECISION});
    }

    const auto& limit = context.approverAuthority->maxDiscountPct;
    if (limit && context.requestedDiscountPct > *limit) {
        return failure(TransitionErrorCode::APPROVER_NOT_AUTHORIZED, current, type,
                       "Role " + decision.approverRole + " may approve up to " + limit->toString() +
                       "% discount, requested " + context.requestedDiscountPct.toString() + "%");
    }

    if (context.approvalChain->hasNextStep()) {
        return success(current, QuoteStatus::APPROVAL,
                       {FlowEffect::RECORD_APPROVAL_DECISION, FlowEffect::REQUEST_NEXT_APPROVAL,
                        FlowEffect::NOTIFY_APPROVERS});
    }
    return success(current, QuoteStatus::APPROVED, {FlowEffect::RECORD_APPROVAL_DECISION});
}

} // namespace cpq::application
