// include/domain/FlowEvent.hpp
#pragma once

#include "domain/Timestamp.hpp"
#include "domain/DraftChanges.hpp"
#include "domain/enums/FlowEventType.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <optional>

namespace cpq::domain {

/// Payload ApprovalDecided
struct ApprovalDecision {
    std::string requestId;
    bool approve = false;
    std::string approverId;
    std::string approverRole;
    std::string comment;
};

/**
 * @brief Типизированное событие жизненного цикла
 *
 * Создаётся только EventCodec из проверенного JSON. payload хранит
 * канонический JSON полезной нагрузки для ключа идемпотентности.
 */
struct FlowEvent {
    static constexpr int SCHEMA_VERSION = 1;

    FlowEventType type = FlowEventType::DRAFT_UPDATED;
    std::string eventId;                ///< Идентичность события у источника
    std::string source;                 ///< slack, cli, scheduler, ...
    std::string actor;
    Timestamp occurredAt;

    std::optional<DraftChanges> draftChanges;           ///< DraftUpdated
    std::optional<ApprovalDecision> approvalDecision;   ///< ApprovalDecided
    std::optional<std::string> amendmentQuoteId;        ///< ReviseRequested
    std::string reason;                                 ///< CancelRequested, ReviseRequested

    nlohmann::json payload = nlohmann::json::object();
};

} // namespace cpq::domain
