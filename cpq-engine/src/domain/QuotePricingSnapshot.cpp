#include "domain/QuotePricingSnapshot.hpp"
#include "domain/JsonConversions.hpp"

namespace cpq::domain {

namespace {

nlohmann::json lineToJson(const LinePricing& l) {
    nlohmann::json j;
    j["line_id"] = l.lineId;
    j["product_id"] = l.productId;
    j["category"] = l.category;
    j["quantity"] = l.quantity;
    putOptional(j, "bundle_id", l.bundleId);
    putOptional(j, "formula_id", l.formulaId);
    j["list_price"] = l.listPrice;
    j["tier_unit_price"] = l.tierUnitPrice;
    j["unit_price"] = l.unitPrice;
    j["line_amount"] = l.lineAmount;
    j["subtotal"] = l.subtotal;
    j["discount_pct"] = l.discountPct;
    j["discount_amount"] = l.discountAmount;
    j["tax_amount"] = l.taxAmount;
    putOptional(j, "unit_cost", l.unitCost);
    return j;
}

LinePricing lineFromJson(const nlohmann::json& j) {
    LinePricing l;
    l.lineId = j.at("line_id").get<std::string>();
    l.productId = j.at("product_id").get<std::string>();
    l.category = j.value("category", "");
    l.quantity = j.at("quantity").get<int64_t>();
    l.bundleId = getOptional<std::string>(j, "bundle_id");
    l.formulaId = getOptional<std::string>(j, "formula_id");
    l.listPrice = j.at("list_price").get<Decimal>();
    l.tierUnitPrice = j.at("tier_unit_price").get<Decimal>();
    l.unitPrice = j.at("unit_price").get<Decimal>();
    l.lineAmount = j.at("line_amount").get<Decimal>();
    l.subtotal = j.at("subtotal").get<Decimal>();
    l.discountPct = j.at("discount_pct").get<Decimal>();
    l.discountAmount = j.at("discount_amount").get<Decimal>();
    l.taxAmount = j.at("tax_amount").get<Decimal>();
    l.unitCost = getOptional<Decimal>(j, "unit_cost");
    return l;
}

} // namespace

nlohmann::json QuotePricingSnapshot::toJson() const {
    nlohmann::json j;
    j["id"] = id;
    j["quote_id"] = quoteId;
    j["quote_version"] = quoteVersion;
    j["price_book_id"] = priceBookId;
    j["currency"] = currency;
    j["lines"] = nlohmann::json::array();
    for (const auto& l : lines) j["lines"].push_back(lineToJson(l));
    j["subtotal"] = subtotal;
    j["discount_total"] = discountTotal;
    j["tax_total"] = taxTotal;
    j["total"] = total;
    putOptional(j, "discount_cap_pct", discountCapPct);
    j["authorized_by_approvals"] = authorizedByApprovals;
    j["tax_final"] = taxFinal;
    j["trace"] = traceJson;
    j["trace_digest"] = traceDigest;
    j["priced_at"] = pricedAt;
    j["priced_by"] = pricedBy;
    return j;
}

QuotePricingSnapshot QuotePricingSnapshot::fromJson(const nlohmann::json& j) {
    QuotePricingSnapshot s;
    s.id = j.at("id").get<std::string>();
    s.quoteId = j.at("quote_id").get<std::string>();
    s.quoteVersion = j.at("quote_version").get<int64_t>();
    s.priceBookId = j.at("price_book_id").get<std::string>();
    s.currency = j.at("currency").get<std::string>();
    for (const auto& item : j.at("lines")) s.lines.push_back(lineFromJson(item));
    s.subtotal = j.at("subtotal").get<Decimal>();
    s.discountTotal = j.at("discount_total").get<Decimal>();
    s.taxTotal = j.at("tax_total").get<Decimal>();
    s.total = j.at("total").get<Decimal>();
    s.discountCapPct = getOptional<Decimal>(j, "discount_cap_pct");
    s.authorizedByApprovals = j.value("authorized_by_approvals", std::vector<std::string>{});
    s.taxFinal = j.value("tax_final", false);
    s.traceJson = j.at("trace").get<std::string>();
    s.trace = PricingTrace::fromJson(nlohmann::json::parse(s.traceJson));
    s.traceDigest = j.at("trace_digest").get<std::string>();
    s.pricedAt = j.at("priced_at").get<Timestamp>();
    s.pricedBy = j.value("priced_by", "");
    return s;
}

} // namespace cpq::domain
