// include/domain/FlowState.hpp
#pragma once

#include "domain/Timestamp.hpp"
#include "domain/PolicyDecision.hpp"
#include "domain/JsonConversions.hpp"
#include "domain/enums/QuoteStatus.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstdint>

namespace cpq::domain {

/**
 * @brief Положение котировки в жизненном цикле (одно на котировку)
 *
 * Меняется только оркестратором по результату FlowEngine под проверкой версии.
 * version совпадает с версией котировки.
 */
struct FlowState {
    std::string quoteId;
    QuoteStatus state = QuoteStatus::DRAFT;
    int64_t version = 0;
    std::vector<std::string> requiredFields;
    std::vector<std::string> missingFields;
    std::optional<PolicyDecision> policyDecision;   ///< Решение по последнему снимку
    std::map<std::string, std::string> metadata;
    std::string lastEventType;
    std::string lastEventId;
    Timestamp updatedAt;

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["quote_id"] = quoteId;
        j["state"] = toString(state);
        j["version"] = version;
        j["required_fields"] = requiredFields;
        j["missing_fields"] = missingFields;
        if (policyDecision) j["policy_decision"] = policyDecision->toJson();
        j["metadata"] = metadata;
        j["last_event_type"] = lastEventType;
        j["last_event_id"] = lastEventId;
        j["updated_at"] = updatedAt;
        return j;
    }

    static FlowState fromJson(const nlohmann::json& j) {
        FlowState s;
        s.quoteId = j.at("quote_id").get<std::string>();
        s.state = quoteStatusFromString(j.at("state").get<std::string>());
        s.version = j.at("version").get<int64_t>();
        s.requiredFields = j.value("required_fields", std::vector<std::string>{});
        s.missingFields = j.value("missing_fields", std::vector<std::string>{});
        if (j.contains("policy_decision") && !j["policy_decision"].is_null()) {
            s.policyDecision = PolicyDecision::fromJson(j["policy_decision"]);
        }
        s.metadata = j.value("metadata", std::map<std::string, std::string>{});
        s.lastEventType = j.value("last_event_type", "");
        s.lastEventId = j.value("last_event_id", "");
        s.updatedAt = j.at("updated_at").get<Timestamp>();
        return s;
    }
};

} // namespace cpq::domain
