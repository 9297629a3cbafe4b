// include/domain/enums/QuoteStatus.hpp
#pragma once

#include <string>
#include <stdexcept>

namespace cpq::domain {

/**
 * @brief Этап жизненного цикла котировки
 *
 * EXPIRED, CANCELLED и REVISED терминальные: это отметки, а не удаление.
 */
enum class QuoteStatus {
    DRAFT,
    VALIDATED,
    PRICED,
    APPROVAL,
    APPROVED,
    FINALIZED,
    SENT,
    REJECTED,
    EXPIRED,
    CANCELLED,
    REVISED
};

inline std::string toString(QuoteStatus status) {
    switch (status) {
        case QuoteStatus::DRAFT: return "draft";
        case QuoteStatus::VALIDATED: return "validated";
        case QuoteStatus::PRICED: return "priced";
        case QuoteStatus::APPROVAL: return "approval";
        case QuoteStatus::APPROVED: return "approved";
        case QuoteStatus::FINALIZED: return "finalized";
        case QuoteStatus::SENT: return "sent";
        case QuoteStatus::REJECTED: return "rejected";
        case QuoteStatus::EXPIRED: return "expired";
        case QuoteStatus::CANCELLED: return "cancelled";
        case QuoteStatus::REVISED: return "revised";
        default: return "unknown";
    }
}

inline QuoteStatus quoteStatusFromString(const std::string& str) {
    if (str == "draft") return QuoteStatus::DRAFT;
    if (str == "validated") return QuoteStatus::VALIDATED;
    if (str == "priced") return QuoteStatus::PRICED;
    if (str == "approval") return QuoteStatus::APPROVAL;
    if (str == "approved") return QuoteStatus::APPROVED;
    if (str == "finalized") return QuoteStatus::FINALIZED;
    if (str == "sent") return QuoteStatus::SENT;
    if (str == "rejected") return QuoteStatus::REJECTED;
    if (str == "expired") return QuoteStatus::EXPIRED;
    if (str == "cancelled") return QuoteStatus::CANCELLED;
    if (str == "revised") return QuoteStatus::REVISED;
    throw std::invalid_argument("Unknown quote status: " + str);
}

inline bool isTerminal(QuoteStatus status) {
    return status == QuoteStatus::EXPIRED ||
           status == QuoteStatus::CANCELLED ||
           status == QuoteStatus::REVISED;
}

/// Строки котировки можно менять только в черновике
inline bool isEditable(QuoteStatus status) {
    return status == QuoteStatus::DRAFT;
}

/// Finalized и позже: изменение только через поправку (amendment)
inline bool isFrozen(QuoteStatus status) {
    return status == QuoteStatus::FINALIZED ||
           status == QuoteStatus::SENT ||
           isTerminal(status);
}

} // namespace cpq::domain
