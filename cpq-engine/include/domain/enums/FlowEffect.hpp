// include/domain/enums/FlowEffect.hpp
#pragma once

#include <string>

namespace cpq::domain {

/**
 * @brief Описание побочного эффекта перехода
 *
 * FlowEngine только перечисляет эффекты, исполняет их QuoteService.
 */
enum class FlowEffect {
    APPLY_DRAFT_CHANGES,
    INVALIDATE_PRICING,
    RECORD_VALIDATION,
    RUN_PRICING,
    EVALUATE_POLICY,
    FINALIZE_QUOTE,
    PUBLISH_QUOTE,
    REQUEST_APPROVAL,
    REQUEST_NEXT_APPROVAL,
    NOTIFY_APPROVERS,
    RECORD_APPROVAL_DECISION,
    MARK_QUOTE_SENT,
    CREATE_AMENDMENT,
    EXPIRE_PENDING_APPROVALS
};

inline std::string toString(FlowEffect effect) {
    switch (effect) {
        case FlowEffect::APPLY_DRAFT_CHANGES: return "ApplyDraftChanges";
        case FlowEffect::INVALIDATE_PRICING: return "InvalidatePricing";
        case FlowEffect::RECORD_VALIDATION: return "RecordValidation";
        case FlowEffect::RUN_PRICING: return "RunPricing";
        case FlowEffect::EVALUATE_POLICY: return "EvaluatePolicy";
        case FlowEffect::FINALIZE_QUOTE: return "FinalizeQuote";
        case FlowEffect::PUBLISH_QUOTE: return "PublishQuote";
        case FlowEffect::REQUEST_APPROVAL: return "RequestApproval";
        case FlowEffect::REQUEST_NEXT_APPROVAL: return "RequestNextApproval";
        case FlowEffect::NOTIFY_APPROVERS: return "NotifyApprovers";
        case FlowEffect::RECORD_APPROVAL_DECISION: return "RecordApprovalDecision";
        case FlowEffect::MARK_QUOTE_SENT: return "MarkQuoteSent";
        case FlowEffect::CREATE_AMENDMENT: return "CreateAmendment";
        case FlowEffect::EXPIRE_PENDING_APPROVALS: return "ExpirePendingApprovals";
        default: return "Unknown";
    }
}

/// Эффекты, затрагивающие внешние системы; исполняются только после коммита
inline bool isExternal(FlowEffect effect) {
    return effect == FlowEffect::PUBLISH_QUOTE ||
           effect == FlowEffect::NOTIFY_APPROVERS ||
           effect == FlowEffect::MARK_QUOTE_SENT;
}

} // namespace cpq::domain
