#include "domain/Quote.hpp"
#include "domain/QuotePricingSnapshot.hpp"
#include "domain/JsonConversions.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <cctype>

namespace cpq::domain {

namespace {

int parsePositiveInt(const std::string& name, const std::string& value) {
    size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(name + " must be an integer: " + value);
    }
    if (consumed != value.size() || parsed <= 0) {
        throw std::invalid_argument(name + " must be a positive integer: " + value);
    }
    return parsed;
}

void checkPercent(const std::string& what, const Decimal& pct) {
    if (pct.isNegative() || pct > Decimal::hundred()) {
        throw InvariantViolationException(what + " must be within [0, 100]: " + pct.toString());
    }
}

nlohmann::json lineToJson(const QuoteLine& line) {
    nlohmann::json j;
    j["id"] = line.id;
    j["product_id"] = line.productId;
    j["product_revision"] = line.productRevision;
    j["quantity"] = line.quantity;
    j["attributes"] = line.attributes;
    putOptional(j, "bundle_id", line.bundleId);
    putOptional(j, "discount_pct", line.discountPct);
    putOptional(j, "discount_amount", line.discountAmount);
    putOptional(j, "unit_price", line.unitPrice);
    putOptional(j, "subtotal", line.subtotal);
    putOptional(j, "applied_discount", line.appliedDiscount);
    j["sort_order"] = line.sortOrder;
    return j;
}

QuoteLine lineFromJson(const nlohmann::json& j) {
    QuoteLine line;
    line.id = j.at("id").get<std::string>();
    line.productId = j.at("product_id").get<std::string>();
    line.productRevision = j.value("product_revision", 1);
    line.quantity = j.at("quantity").get<int64_t>();
    line.attributes = j.value("attributes", std::map<std::string, std::string>{});
    line.bundleId = getOptional<std::string>(j, "bundle_id");
    line.discountPct = getOptional<Decimal>(j, "discount_pct");
    line.discountAmount = getOptional<Decimal>(j, "discount_amount");
    line.unitPrice = getOptional<Decimal>(j, "unit_price");
    line.subtotal = getOptional<Decimal>(j, "subtotal");
    line.appliedDiscount = getOptional<Decimal>(j, "applied_discount");
    line.sortOrder = j.value("sort_order", 0);
    return line;
}

} // namespace

const std::vector<std::string>& Quote::knownFields() {
    static const std::vector<std::string> fields = {
        "account_id", "currency", "segment", "region",
        "term_months", "start_date", "end_date", "valid_until"
    };
    return fields;
}

void Quote::checkFieldValue(const std::string& name, const std::string& value) {
    if (value.empty()) {
        throw std::invalid_argument("Field " + name + " must not be empty");
    }
    if (name == "term_months") {
        parsePositiveInt(name, value);
    } else if (name == "start_date" || name == "end_date" || name == "valid_until") {
        Timestamp::fromString(value);
    } else if (name == "currency") {
        bool iso = value.size() == 3 && std::all_of(value.begin(), value.end(),
            [](unsigned char c) { return std::isupper(c); });
        if (!iso) {
            throw std::invalid_argument("currency must be an ISO 4217 code: " + value);
        }
    }
}

Quote::Quote(std::string id, std::string createdBy, const Timestamp& createdAt)
    : id_(std::move(id))
    , createdBy_(std::move(createdBy))
    , createdAt_(createdAt)
    , updatedAt_(createdAt) {}

const QuoteLine* Quote::findLine(const std::string& lineId) const {
    for (const auto& line : lines_) {
        if (line.id == lineId) return &line;
    }
    return nullptr;
}

std::optional<std::string> Quote::fieldValue(const std::string& name) const {
    auto nonEmpty = [](const std::string& s) -> std::optional<std::string> {
        if (s.empty()) return std::nullopt;
        return s;
    };

    if (name == "account_id") return nonEmpty(accountId_);
    if (name == "currency") return nonEmpty(currency_);
    if (name == "segment") return nonEmpty(segment_);
    if (name == "region") return nonEmpty(region_);
    if (name == "term_months") {
        if (!termMonths_) return std::nullopt;
        return std::to_string(*termMonths_);
    }
    if (name == "start_date") {
        if (!startDate_) return std::nullopt;
        return startDate_->toDateString();
    }
    if (name == "end_date") {
        if (!endDate_) return std::nullopt;
        return endDate_->toDateString();
    }
    if (name == "valid_until") {
        if (!validUntil_) return std::nullopt;
        return validUntil_->toDateString();
    }
    if (name == "requested_discount_pct") {
        if (!requestedDiscountPct_) return std::nullopt;
        return requestedDiscountPct_->toString();
    }

    auto it = fields_.find(name);
    if (it == fields_.end()) return std::nullopt;
    return nonEmpty(it->second);
}

std::vector<std::string> Quote::missingFields(const std::vector<std::string>& required) const {
    std::vector<std::string> missing;
    for (const auto& name : required) {
        if (!fieldValue(name)) missing.push_back(name);
    }
    return missing;
}

void Quote::setField(const std::string& name, const std::string& value) {
    requireEditable("setField");
    checkFieldValue(name, value);

    if (name == "account_id") accountId_ = value;
    else if (name == "currency") currency_ = value;
    else if (name == "segment") segment_ = value;
    else if (name == "region") region_ = value;
    else if (name == "term_months") termMonths_ = parsePositiveInt(name, value);
    else if (name == "start_date") startDate_ = Timestamp::fromString(value);
    else if (name == "end_date") endDate_ = Timestamp::fromString(value);
    else if (name == "valid_until") validUntil_ = Timestamp::fromString(value);
    else fields_[name] = value;
}

void Quote::setRequestedDiscount(const std::optional<Decimal>& pct) {
    requireEditable("setRequestedDiscount");
    if (pct) checkPercent("Requested discount", *pct);
    requestedDiscountPct_ = pct;
}

std::string Quote::addLine(const LineInput& input, int productRevision) {
    requireEditable("addLine");
    if (input.productId.empty()) {
        throw InvariantViolationException("Quote line requires a product id");
    }
    if (input.quantity <= 0) {
        throw InvariantViolationException("Quote line quantity must be positive, got " +
                                          std::to_string(input.quantity));
    }
    if (input.discountPct) checkPercent("Line discount", *input.discountPct);
    if (input.discountAmount && input.discountAmount->isNegative()) {
        throw InvariantViolationException("Line discount amount must not be negative");
    }

    QuoteLine line;
    line.id = id_ + "-L" + std::to_string(nextLineNumber_);
    line.productId = input.productId;
    line.productRevision = productRevision;
    line.quantity = input.quantity;
    line.attributes = input.attributes;
    line.bundleId = input.bundleId;
    line.discountPct = input.discountPct;
    line.discountAmount = input.discountAmount;
    line.sortOrder = nextLineNumber_;
    ++nextLineNumber_;

    lines_.push_back(line);
    return line.id;
}

void Quote::updateLine(const LineUpdate& update) {
    requireEditable("updateLine");
    auto it = std::find_if(lines_.begin(), lines_.end(),
                           [&](const QuoteLine& l) { return l.id == update.lineId; });
    if (it == lines_.end()) {
        throw InvariantViolationException("Unknown line " + update.lineId + " on quote " + id_);
    }
    if (update.quantity) {
        if (*update.quantity <= 0) {
            throw InvariantViolationException("Quote line quantity must be positive, got " +
                                              std::to_string(*update.quantity));
        }
        it->quantity = *update.quantity;
    }
    for (const auto& [key, value] : update.attributes) {
        it->attributes[key] = value;
    }
    if (update.discountPct) {
        checkPercent("Line discount", *update.discountPct);
        it->discountPct = update.discountPct;
    }
    if (update.discountAmount) {
        if (update.discountAmount->isNegative()) {
            throw InvariantViolationException("Line discount amount must not be negative");
        }
        it->discountAmount = update.discountAmount;
    }
}

void Quote::removeLine(const std::string& lineId) {
    requireEditable("removeLine");
    auto it = std::find_if(lines_.begin(), lines_.end(),
                           [&](const QuoteLine& l) { return l.id == lineId; });
    if (it == lines_.end()) {
        throw InvariantViolationException("Unknown line " + lineId + " on quote " + id_);
    }
    lines_.erase(it);
}

void Quote::applyDraftChanges(const DraftChanges& changes,
                              const std::function<int(const std::string&)>& revisionOf,
                              const Timestamp& at) {
    requireEditable("applyDraftChanges");
    for (const auto& [name, value] : changes.fields) {
        setField(name, value);
    }
    if (changes.requestedDiscountPct) {
        setRequestedDiscount(changes.requestedDiscountPct);
    }
    for (const auto& lineId : changes.removeLineIds) {
        removeLine(lineId);
    }
    for (const auto& update : changes.updateLines) {
        updateLine(update);
    }
    for (const auto& input : changes.addLines) {
        addLine(input, revisionOf(input.productId));
    }
    updatedAt_ = at;
}

void Quote::applyPricing(const QuotePricingSnapshot& snapshot) {
    if (isFrozen(status_)) {
        throw InvariantViolationException("Cannot reprice frozen quote " + id_ +
                                          " in status " + toString(status_));
    }
    if (snapshot.quoteId != id_) {
        throw InvariantViolationException("Snapshot " + snapshot.id + " belongs to quote " +
                                          snapshot.quoteId + ", not " + id_);
    }

    for (auto& line : lines_) {
        line.clearPricing();
    }
    for (auto& line : lines_) {
        const LinePricing* priced = snapshot.findLine(line.id);
        if (!priced) {
            throw InvariantViolationException("Snapshot " + snapshot.id + " has no pricing for line " + line.id);
        }
        line.setPricing(priced->unitPrice, priced->subtotal, priced->discountAmount);
    }
    latestSnapshotId_ = snapshot.id;
}

void Quote::invalidatePricing() {
    for (auto& line : lines_) {
        line.clearPricing();
    }
    latestSnapshotId_.reset();
}

void Quote::transition(QuoteStatus from, QuoteStatus to, const Timestamp& at) {
    if (status_ != from) {
        throw InvariantViolationException("Quote " + id_ + " is " + toString(status_) +
                                          ", transition expected " + toString(from));
    }
    status_ = to;
    updatedAt_ = at;
}

Quote Quote::amend(const std::string& newId, const std::string& actor, const Timestamp& at) const {
    if (isTerminal(status_)) {
        throw InvariantViolationException("Cannot amend terminal quote " + id_);
    }

    Quote amendment = *this;
    amendment.id_ = newId;
    amendment.version_ = 0;
    amendment.status_ = QuoteStatus::DRAFT;
    amendment.parentQuoteId_ = id_;
    amendment.latestSnapshotId_.reset();
    amendment.createdBy_ = actor;
    amendment.createdAt_ = at;
    amendment.updatedAt_ = at;
    for (auto& line : amendment.lines_) {
        line.id = newId + "-L" + std::to_string(line.sortOrder);
        line.clearPricing();
    }
    return amendment;
}

void Quote::requireEditable(const char* operation) const {
    if (!isEditable(status_)) {
        throw InvariantViolationException(std::string(operation) + " on quote " + id_ +
                                          " in status " + toString(status_));
    }
}

nlohmann::json Quote::toJson() const {
    nlohmann::json j;
    j["id"] = id_;
    j["version"] = version_;
    j["status"] = toString(status_);
    j["account_id"] = accountId_;
    j["currency"] = currency_;
    j["segment"] = segment_;
    j["region"] = region_;
    j["created_by"] = createdBy_;
    putOptional(j, "term_months", termMonths_);
    putOptional(j, "start_date", startDate_);
    putOptional(j, "end_date", endDate_);
    putOptional(j, "valid_until", validUntil_);
    putOptional(j, "requested_discount_pct", requestedDiscountPct_);
    putOptional(j, "parent_quote_id", parentQuoteId_);
    putOptional(j, "latest_snapshot_id", latestSnapshotId_);
    j["fields"] = fields_;
    j["lines"] = nlohmann::json::array();
    for (const auto& line : lines_) j["lines"].push_back(lineToJson(line));
    j["next_line_number"] = nextLineNumber_;
    j["created_at"] = createdAt_;
    j["updated_at"] = updatedAt_;
    return j;
}

Quote Quote::fromJson(const nlohmann::json& j) {
    Quote q;
    q.id_ = j.at("id").get<std::string>();
    q.version_ = j.at("version").get<int64_t>();
    q.status_ = quoteStatusFromString(j.at("status").get<std::string>());
    q.accountId_ = j.value("account_id", "");
    q.currency_ = j.value("currency", "");
    q.segment_ = j.value("segment", "");
    q.region_ = j.value("region", "");
    q.createdBy_ = j.value("created_by", "");
    q.termMonths_ = getOptional<int>(j, "term_months");
    q.startDate_ = getOptional<Timestamp>(j, "start_date");
    q.endDate_ = getOptional<Timestamp>(j, "end_date");
    q.validUntil_ = getOptional<Timestamp>(j, "valid_until");
    q.requestedDiscountPct_ = getOptional<Decimal>(j, "requested_discount_pct");
    q.parentQuoteId_ = getOptional<std::string>(j, "parent_quote_id");
    q.latestSnapshotId_ = getOptional<std::string>(j, "latest_snapshot_id");
    q.fields_ = j.value("fields", std::map<std::string, std::string>{});
    for (const auto& item : j.at("lines")) q.lines_.push_back(lineFromJson(item));
    q.nextLineNumber_ = j.value("next_line_number", static_cast<int>(q.lines_.size()) + 1);
    q.createdAt_ = j.at("created_at").get<Timestamp>();
    q.updatedAt_ = j.at("updated_at").get<Timestamp>();
    return q;
}

} // namespace cpq::domain
