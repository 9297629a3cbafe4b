#include "application/EventCodec.hpp"
#include "domain/JsonConversions.hpp"
#include "domain/Quote.hpp"
#include "utils/Sha256.hpp"
#include <set>

namespace cpq::application {

using domain::Decimal;
using domain::DraftChanges;
using domain::FlowEvent;
using domain::FlowEventType;
using domain::LineInput;
using domain::LineUpdate;
using nlohmann::json;

namespace {

void rejectUnknownKeys(const json& object, const std::set<std::string>& allowed, const std::string& where) {
    for (const auto& item : object.items()) {
        if (allowed.count(item.key()) == 0) {
            throw EventDecodeException(where + item.key(), "Unknown key '" + where + item.key() + "'");
        }
    }
}

const json& requireObject(const json& parent, const std::string& key, const std::string& where) {
    auto it = parent.find(key);
    if (it == parent.end() || !it->is_object()) {
        throw EventDecodeException(where + key, "'" + where + key + "' must be an object");
    }
    return *it;
}

std::string requireString(const json& parent, const std::string& key, const std::string& where) {
    auto it = parent.find(key);
    if (it == parent.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw EventDecodeException(where + key, "'" + where + key + "' must be a non-empty string");
    }
    return it->get<std::string>();
}

std::optional<std::string> optionalString(const json& parent, const std::string& key, const std::string& where) {
    auto it = parent.find(key);
    if (it == parent.end() || it->is_null()) return std::nullopt;
    if (!it->is_string()) {
        throw EventDecodeException(where + key, "'" + where + key + "' must be a string");
    }
    return it->get<std::string>();
}

// Десятичные значения: строка или целое; числа с плавающей точкой отклоняются
std::optional<Decimal> optionalDecimal(const json& parent, const std::string& key, const std::string& where) {
    auto it = parent.find(key);
    if (it == parent.end() || it->is_null()) return std::nullopt;
    if (it->is_number_integer()) return Decimal::fromInt(it->get<int64_t>());
    if (it->is_string()) {
        try {
            return Decimal::fromString(it->get<std::string>());
        } catch (const std::invalid_argument& e) {
            throw EventDecodeException(where + key, "'" + where + key + "': " + e.what());
        }
    }
    throw EventDecodeException(where + key, "'" + where + key + "' must be a decimal string");
}

std::optional<Decimal> optionalPercent(const json& parent, const std::string& key, const std::string& where) {
    auto pct = optionalDecimal(parent, key, where);
    if (pct && (pct->isNegative() || *pct > Decimal::hundred())) {
        throw EventDecodeException(where + key, "'" + where + key + "' must be within [0, 100]: " + pct->toString());
    }
    return pct;
}

std::optional<Decimal> optionalNonNegative(const json& parent, const std::string& key, const std::string& where) {
    auto amount = optionalDecimal(parent, key, where);
    if (amount && amount->isNegative()) {
        throw EventDecodeException(where + key, "'" + where + key + "' must not be negative: " + amount->toString());
    }
    return amount;
}

std::optional<int64_t> optionalPositiveInt(const json& parent, const std::string& key, const std::string& where) {
    auto it = parent.find(key);
    if (it == parent.end() || it->is_null()) return std::nullopt;
    if (!it->is_number_integer() || it->get<int64_t>() <= 0) {
        throw EventDecodeException(where + key, "'" + where + key + "' must be a positive integer");
    }
    return it->get<int64_t>();
}

std::map<std::string, std::string> stringMap(const json& parent, const std::string& key, const std::string& where) {
    std::map<std::string, std::string> out;
    auto it = parent.find(key);
    if (it == parent.end() || it->is_null()) return out;
    if (!it->is_object()) {
        throw EventDecodeException(where + key, "'" + where + key + "' must be an object");
    }
    for (const auto& item : it->items()) {
        if (!item.value().is_string()) {
            throw EventDecodeException(where + key + "." + item.key(),
                                       "'" + where + key + "." + item.key() + "' must be a string");
        }
        out[item.key()] = item.value().get<std::string>();
    }
    return out;
}

const json* optionalArray(const json& parent, const std::string& key, const std::string& where) {
    auto it = parent.find(key);
    if (it == parent.end() || it->is_null()) return nullptr;
    if (!it->is_array()) {
        throw EventDecodeException(where + key, "'" + where + key + "' must be an array");
    }
    return &*it;
}

DraftChanges decodeDraftChanges(const json& payload) {
    rejectUnknownKeys(payload, {"fields", "requested_discount_pct", "add_lines", "update_lines", "remove_line_ids"},
                      "payload.");
    DraftChanges changes;

    changes.fields = stringMap(payload, "fields", "payload.");
    for (const auto& [name, value] : changes.fields) {
        try {
            domain::Quote::checkFieldValue(name, value);
        } catch (const std::invalid_argument& e) {
            throw EventDecodeException("payload.fields." + name, e.what());
        }
    }

    changes.requestedDiscountPct = optionalPercent(payload, "requested_discount_pct", "payload.");

    if (const json* removed = optionalArray(payload, "remove_line_ids", "payload.")) {
        for (const auto& id : *removed) {
            if (!id.is_string()) {
                throw EventDecodeException("payload.remove_line_ids", "'payload.remove_line_ids' must contain strings");
            }
            changes.removeLineIds.push_back(id.get<std::string>());
        }
    }

    if (const json* updates = optionalArray(payload, "update_lines", "payload.")) {
        for (size_t i = 0; i < updates->size(); ++i) {
            const json& item = (*updates)[i];
            std::string where = "payload.update_lines[" + std::to_string(i) + "].";
            if (!item.is_object()) {
                throw EventDecodeException(where, "'" + where + "' must be an object");
            }
            rejectUnknownKeys(item, {"line_id", "quantity", "attributes", "discount_pct", "discount_amount"}, where);

            LineUpdate update;
            update.lineId = requireString(item, "line_id", where);
            update.quantity = optionalPositiveInt(item, "quantity", where);
            update.attributes = stringMap(item, "attributes", where);
            update.discountPct = optionalPercent(item, "discount_pct", where);
            update.discountAmount = optionalNonNegative(item, "discount_amount", where);
            changes.updateLines.push_back(std::move(update));
        }
    }

    if (const json* adds = optionalArray(payload, "add_lines", "payload.")) {
        for (size_t i = 0; i < adds->size(); ++i) {
            const json& item = (*adds)[i];
            std::string where = "payload.add_lines[" + std::to_string(i) + "].";
            if (!item.is_object()) {
                throw EventDecodeException(where, "'" + where + "' must be an object");
            }
            rejectUnknownKeys(item, {"product_id", "quantity", "attributes", "bundle_id", "discount_pct",
                                     "discount_amount"}, where);

            LineInput input;
            input.productId = requireString(item, "product_id", where);
            input.quantity = optionalPositiveInt(item, "quantity", where).value_or(1);
            input.attributes = stringMap(item, "attributes", where);
            input.bundleId = optionalString(item, "bundle_id", where);
            input.discountPct = optionalPercent(item, "discount_pct", where);
            input.discountAmount = optionalNonNegative(item, "discount_amount", where);
            changes.addLines.push_back(std::move(input));
        }
    }

    return changes;
}

json encodeDraftChanges(const DraftChanges& changes) {
    json payload = json::object();
    if (!changes.fields.empty()) payload["fields"] = changes.fields;
    if (changes.requestedDiscountPct) payload["requested_discount_pct"] = *changes.requestedDiscountPct;
    if (!changes.removeLineIds.empty()) payload["remove_line_ids"] = changes.removeLineIds;

    if (!changes.updateLines.empty()) {
        payload["update_lines"] = json::array();
        for (const auto& u : changes.updateLines) {
            json item = {{"line_id", u.lineId}};
            if (u.quantity) item["quantity"] = *u.quantity;
            if (!u.attributes.empty()) item["attributes"] = u.attributes;
            if (u.discountPct) item["discount_pct"] = *u.discountPct;
            if (u.discountAmount) item["discount_amount"] = *u.discountAmount;
            payload["update_lines"].push_back(item);
        }
    }

    if (!changes.addLines.empty()) {
        payload["add_lines"] = json::array();
        for (const auto& l : changes.addLines) {
            json item = {{"product_id", l.productId}, {"quantity", l.quantity}};
            if (!l.attributes.empty()) item["attributes"] = l.attributes;
            if (l.bundleId) item["bundle_id"] = *l.bundleId;
            if (l.discountPct) item["discount_pct"] = *l.discountPct;
            if (l.discountAmount) item["discount_amount"] = *l.discountAmount;
            payload["add_lines"].push_back(item);
        }
    }
    return payload;
}

} // namespace

FlowEvent EventCodec::decode(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw EventDecodeException("", std::string("Event is not valid JSON: ") + e.what());
    }
    return decode(j);
}

FlowEvent EventCodec::decode(const json& j) {
    if (!j.is_object()) {
        throw EventDecodeException("", "Event must be a JSON object");
    }
    rejectUnknownKeys(j, {"schema_version", "type", "event_id", "source", "actor", "occurred_at", "payload"}, "");

    auto version = j.find("schema_version");
    if (version == j.end() || !version->is_number_integer() || version->get<int>() != FlowEvent::SCHEMA_VERSION) {
        throw EventDecodeException("schema_version",
                                   "Unsupported schema_version (expected " +
                                   std::to_string(FlowEvent::SCHEMA_VERSION) + ")");
    }

    FlowEvent event;
    try {
        event.type = domain::flowEventTypeFromString(requireString(j, "type", ""));
    } catch (const EventDecodeException&) {
        throw;
    } catch (const std::invalid_argument& e) {
        throw EventDecodeException("type", e.what());
    }
    event.eventId = requireString(j, "event_id", "");
    event.source = requireString(j, "source", "");
    event.actor = requireString(j, "actor", "");
    try {
        event.occurredAt = domain::Timestamp::fromString(requireString(j, "occurred_at", ""));
    } catch (const EventDecodeException&) {
        throw;
    } catch (const std::invalid_argument& e) {
        throw EventDecodeException("occurred_at", e.what());
    }

    json payload = j.contains("payload") ? requireObject(j, "payload", "") : json::object();

    switch (event.type) {
        case FlowEventType::DRAFT_UPDATED:
            event.draftChanges = decodeDraftChanges(payload);
            break;

        case FlowEventType::APPROVAL_DECIDED: {
            rejectUnknownKeys(payload, {"request_id", "decision", "approver_id", "approver_role", "comment"},
                              "payload.");
            domain::ApprovalDecision decision;
            decision.requestId = requireString(payload, "request_id", "payload.");
            std::string verdict = requireString(payload, "decision", "payload.");
            if (verdict != "approve" && verdict != "reject") {
                throw EventDecodeException("payload.decision", "'payload.decision' must be approve or reject");
            }
            decision.approve = verdict == "approve";
            decision.approverId = requireString(payload, "approver_id", "payload.");
            decision.approverRole = requireString(payload, "approver_role", "payload.");
            decision.comment = optionalString(payload, "comment", "payload.").value_or("");
            event.approvalDecision = decision;
            break;
        }

        case FlowEventType::REVISE_REQUESTED:
            rejectUnknownKeys(payload, {"amendment_quote_id", "reason"}, "payload.");
            event.amendmentQuoteId = requireString(payload, "amendment_quote_id", "payload.");
            event.reason = optionalString(payload, "reason", "payload.").value_or("");
            break;

        case FlowEventType::CANCEL_REQUESTED:
            rejectUnknownKeys(payload, {"reason"}, "payload.");
            event.reason = optionalString(payload, "reason", "payload.").value_or("");
            break;

        default:
            rejectUnknownKeys(payload, {}, "payload.");
            break;
    }

    event.payload = payload;
    return event;
}

json EventCodec::encode(const FlowEvent& event) {
    json payload = json::object();
    switch (event.type) {
        case FlowEventType::DRAFT_UPDATED:
            if (event.draftChanges) payload = encodeDraftChanges(*event.draftChanges);
            break;
        case FlowEventType::APPROVAL_DECIDED:
            if (event.approvalDecision) {
                const auto& d = *event.approvalDecision;
                payload = {{"request_id", d.requestId},
                           {"decision", d.approve ? "approve" : "reject"},
                           {"approver_id", d.approverId},
                           {"approver_role", d.approverRole}};
                if (!d.comment.empty()) payload["comment"] = d.comment;
            }
            break;
        case FlowEventType::REVISE_REQUESTED:
            if (event.amendmentQuoteId) payload["amendment_quote_id"] = *event.amendmentQuoteId;
            if (!event.reason.empty()) payload["reason"] = event.reason;
            break;
        case FlowEventType::CANCEL_REQUESTED:
            if (!event.reason.empty()) payload["reason"] = event.reason;
            break;
        default:
            break;
    }

    return {
        {"schema_version", FlowEvent::SCHEMA_VERSION},
        {"type", domain::toString(event.type)},
        {"event_id", event.eventId},
        {"source", event.source},
        {"actor", event.actor},
        {"occurred_at", event.occurredAt.toString()},
        {"payload", payload}
    };
}

std::string EventCodec::idempotencyKey(const std::string& quoteId, const FlowEvent& event) {
    json material = {
        {"quote_id", quoteId},
        {"source", event.source},
        {"event_id", event.eventId},
        {"type", domain::toString(event.type)},
        {"payload", encode(event).at("payload")}
    };
    return utils::sha256Hex(material.dump());
}

} // namespace cpq::application
