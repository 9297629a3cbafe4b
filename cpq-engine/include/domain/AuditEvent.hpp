// include/domain/AuditEvent.hpp
#pragma once

#include "domain/Timestamp.hpp"
#include "domain/JsonConversions.hpp"
#include "domain/enums/AuditCategory.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace cpq::domain {

/**
 * @brief Запись аудита: только добавление, никогда не обновляется
 *
 * Записи одной котировки связаны цепочкой хешей: prevHash равен hash
 * предыдущей записи (пусто для первой).
 */
struct AuditEvent {
    std::string id;                 ///< "<quoteId>-A<sequence>"
    std::string quoteId;
    int64_t sequence = 0;
    std::string eventType;          ///< flow.transition_applied, pricing.snapshot_created, ...
    AuditCategory category = AuditCategory::FLOW;
    AuditOutcome outcome = AuditOutcome::SUCCESS;
    std::string actor;
    std::string correlationId;      ///< Ключ идемпотентности
    std::string causationId;        ///< id входного события
    nlohmann::json payload = nlohmann::json::object();
    Timestamp occurredAt;
    std::string prevHash;
    std::string hash;

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["id"] = id;
        j["quote_id"] = quoteId;
        j["sequence"] = sequence;
        j["event_type"] = eventType;
        j["category"] = toString(category);
        j["outcome"] = toString(outcome);
        j["actor"] = actor;
        j["correlation_id"] = correlationId;
        j["causation_id"] = causationId;
        j["payload"] = payload;
        j["occurred_at"] = occurredAt;
        j["prev_hash"] = prevHash;
        j["hash"] = hash;
        return j;
    }

    static AuditEvent fromJson(const nlohmann::json& j) {
        AuditEvent e;
        e.id = j.at("id").get<std::string>();
        e.quoteId = j.at("quote_id").get<std::string>();
        e.sequence = j.at("sequence").get<int64_t>();
        e.eventType = j.at("event_type").get<std::string>();
        e.category = auditCategoryFromString(j.at("category").get<std::string>());
        e.outcome = auditOutcomeFromString(j.at("outcome").get<std::string>());
        e.actor = j.value("actor", "");
        e.correlationId = j.value("correlation_id", "");
        e.causationId = j.value("causation_id", "");
        e.payload = j.value("payload", nlohmann::json::object());
        e.occurredAt = j.at("occurred_at").get<Timestamp>();
        e.prevHash = j.value("prev_hash", "");
        e.hash = j.value("hash", "");
        return e;
    }
};

/// Результат проверки цепочки аудита
struct AuditVerification {
    bool valid = true;
    size_t eventCount = 0;
    std::optional<int64_t> brokenAtSequence;
    std::string reason;
};

} // namespace cpq::domain
