// include/domain/enums/FlowEventType.hpp
#pragma once

#include <string>
#include <stdexcept>

namespace cpq::domain {

/**
 * @brief Закрытый набор событий жизненного цикла (схема версии 1)
 */
enum class FlowEventType {
    DRAFT_UPDATED,
    REQUIRED_FIELDS_COLLECTED,
    PRICING_REQUESTED,
    FINALIZE_REQUESTED,
    APPROVAL_DECIDED,
    QUOTE_DELIVERED,
    REVISE_REQUESTED,
    CANCEL_REQUESTED,
    QUOTE_EXPIRED
};

inline std::string toString(FlowEventType type) {
    switch (type) {
        case FlowEventType::DRAFT_UPDATED: return "DraftUpdated";
        case FlowEventType::REQUIRED_FIELDS_COLLECTED: return "RequiredFieldsCollected";
        case FlowEventType::PRICING_REQUESTED: return "PricingRequested";
        case FlowEventType::FINALIZE_REQUESTED: return "FinalizeRequested";
        case FlowEventType::APPROVAL_DECIDED: return "ApprovalDecided";
        case FlowEventType::QUOTE_DELIVERED: return "QuoteDelivered";
        case FlowEventType::REVISE_REQUESTED: return "ReviseRequested";
        case FlowEventType::CANCEL_REQUESTED: return "CancelRequested";
        case FlowEventType::QUOTE_EXPIRED: return "QuoteExpired";
        default: return "Unknown";
    }
}

inline FlowEventType flowEventTypeFromString(const std::string& str) {
    if (str == "DraftUpdated") return FlowEventType::DRAFT_UPDATED;
    if (str == "RequiredFieldsCollected") return FlowEventType::REQUIRED_FIELDS_COLLECTED;
    if (str == "PricingRequested") return FlowEventType::PRICING_REQUESTED;
    if (str == "FinalizeRequested") return FlowEventType::FINALIZE_REQUESTED;
    if (str == "ApprovalDecided") return FlowEventType::APPROVAL_DECIDED;
    if (str == "QuoteDelivered") return FlowEventType::QUOTE_DELIVERED;
    if (str == "ReviseRequested") return FlowEventType::REVISE_REQUESTED;
    if (str == "CancelRequested") return FlowEventType::CANCEL_REQUESTED;
    if (str == "QuoteExpired") return FlowEventType::QUOTE_EXPIRED;
    throw std::invalid_argument("Unknown flow event: " + str);
}

} // namespace cpq::domain
