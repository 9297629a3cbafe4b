// src/adapters/secondary/catalog/JsonCatalogLoader.cpp
#include "adapters/secondary/catalog/JsonCatalogLoader.hpp"
#include "domain/JsonConversions.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace cpq::adapters::secondary {

namespace {

using nlohmann::json;

const json& section(const json& document, const char* name) {
    static const json empty = json::array();
    auto it = document.find(name);
    if (it == document.end()) return empty;
    if (!it->is_array()) {
        throw std::invalid_argument(std::string("Catalog section '") + name + "' must be an array");
    }
    return *it;
}

std::string requireString(const json& j, const char* key, const std::string& where) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw std::invalid_argument(where + ": '" + key + "' is required");
    }
    return it->get<std::string>();
}

/// Условие допускается объектом или уже сериализованной строкой
std::string conditionText(const json& j) {
    auto it = j.find("condition");
    if (it == j.end()) return "{}";
    return it->is_string() ? it->get<std::string>() : it->dump();
}

std::optional<domain::Timestamp> optionalTimestamp(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return domain::Timestamp::fromString(it->get<std::string>());
}

std::optional<int64_t> optionalInt(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->get<int64_t>();
}

domain::Product parseProduct(const json& j) {
    domain::Product p;
    p.id = requireString(j, "id", "product");
    p.sku = j.value("sku", p.id);
    p.name = j.value("name", p.id);
    p.category = j.value("category", "");
    p.type = domain::productTypeFromString(j.value("type", "simple"));
    p.revision = j.value("revision", 1);
    p.active = j.value("active", true);
    p.attributes = j.value("attributes", std::map<std::string, std::string>{});
    return p;
}

domain::PriceBook parsePriceBook(const json& j) {
    domain::PriceBook b;
    b.id = requireString(j, "id", "price book");
    b.name = j.value("name", b.id);
    b.segment = j.value("segment", "*");
    b.region = j.value("region", "*");
    b.currency = requireString(j, "currency", "price book " + b.id);
    b.validFrom = domain::Timestamp::fromString(requireString(j, "valid_from", "price book " + b.id));
    b.validTo = optionalTimestamp(j, "valid_to");
    b.priority = j.value("priority", 0);
    b.active = j.value("active", true);
    return b;
}

domain::PriceBookEntry parseEntry(const json& j) {
    domain::PriceBookEntry e;
    e.priceBookId = requireString(j, "price_book_id", "price book entry");
    e.productId = requireString(j, "product_id", "price book entry");
    e.listPrice = j.at("list_price").get<domain::Decimal>();
    if (j.contains("unit_cost") && !j["unit_cost"].is_null()) {
        e.unitCost = j["unit_cost"].get<domain::Decimal>();
    }
    if (j.contains("formula_id") && !j["formula_id"].is_null()) {
        e.formulaId = j["formula_id"].get<std::string>();
    }
    // Без ступеней строка считается по прейскурантной цене
    for (const auto& t : j.value("tiers", json::array())) {
        domain::VolumeTier tier;
        tier.minQuantity = t.at("min_quantity").get<int64_t>();
        tier.maxQuantity = optionalInt(t, "max_quantity");
        tier.unitPrice = t.at("unit_price").get<domain::Decimal>();
        e.tiers.push_back(tier);
    }
    return e;
}

domain::PricingFormula parseFormula(const json& j) {
    domain::PricingFormula f;
    f.id = requireString(j, "id", "formula");
    f.name = j.value("name", f.id);
    f.expression = requireString(j, "expression", "formula " + f.id);
    f.version = j.value("version", 1);
    return f;
}

domain::Bundle parseBundle(const json& j) {
    domain::Bundle b;
    b.id = requireString(j, "id", "bundle");
    b.name = j.value("name", b.id);
    b.discountPct = j.value("discount_pct", domain::Decimal::zero());
    b.active = j.value("active", true);
    for (const auto& c : j.at("components")) {
        domain::BundleComponent component;
        component.productId = requireString(c, "product_id", "bundle " + b.id);
        component.required = c.value("required", true);
        component.minQuantity = c.value("min_quantity", int64_t{1});
        component.maxQuantity = optionalInt(c, "max_quantity");
        b.components.push_back(component);
    }
    return b;
}

domain::ConstraintRule parseRule(const json& j) {
    domain::ConstraintRule r;
    r.id = requireString(j, "id", "constraint rule");
    r.version = j.value("version", 1);
    r.type = domain::constraintTypeFromString(requireString(j, "type", "constraint rule " + r.id));
    r.sourceProductId = j.value("source_product_id", "*");
    r.condition = conditionText(j);
    r.messageTemplate = j.value("message", "");
    if (j.contains("suggestion") && !j["suggestion"].is_null()) {
        r.suggestionTemplate = j["suggestion"].get<std::string>();
    }
    r.priority = j.value("priority", 100);
    r.active = j.value("active", true);
    return r;
}

domain::DiscountPolicy parseDiscountPolicy(const json& j) {
    domain::DiscountPolicy p;
    p.id = requireString(j, "id", "discount policy");
    p.version = j.value("version", 1);
    p.segment = j.value("segment", "*");
    p.category = j.value("category", "*");
    p.maxAutoDiscountPct = j.at("max_auto_discount_pct").get<domain::Decimal>();
    p.approverRole = j.value("approver_role", "");
    p.approverLevel = j.value("approver_level", 1);
    p.priority = j.value("priority", 100);
    p.active = j.value("active", true);
    return p;
}

domain::ApprovalThreshold parseThreshold(const json& j) {
    domain::ApprovalThreshold t;
    t.id = requireString(j, "id", "approval threshold");
    t.version = j.value("version", 1);
    t.type = domain::policyTypeFromString(requireString(j, "type", "approval threshold " + t.id));
    t.segment = j.value("segment", "*");
    t.condition = conditionText(j);
    t.approverRole = j.value("approver_role", "");
    t.approverLevel = j.value("approver_level", 1);
    t.priority = j.value("priority", 100);
    t.active = j.value("active", true);
    return t;
}

domain::ApproverAuthority parseAuthority(const json& j) {
    domain::ApproverAuthority a;
    a.role = requireString(j, "role", "approver authority");
    a.rank = j.at("rank").get<int>();
    if (j.contains("max_discount_pct") && !j["max_discount_pct"].is_null()) {
        a.maxDiscountPct = j["max_discount_pct"].get<domain::Decimal>();
    }
    return a;
}

} // namespace

JsonCatalogLoader::JsonCatalogLoader(std::shared_ptr<InMemoryCatalogRepository> catalog,
                                     std::shared_ptr<InMemoryPolicyRepository> policies)
    : catalog_(std::move(catalog))
    , policies_(std::move(policies)) {}

void JsonCatalogLoader::loadFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open catalog file: " + path);
    }
    nlohmann::json document;
    try {
        in >> document;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Catalog file " + path + " is not valid JSON: " + e.what());
    }
    load(document);
    std::cout << "[JsonCatalogLoader] Loaded " << path << std::endl;
}

void JsonCatalogLoader::load(const nlohmann::json& document) {
    if (!document.is_object()) {
        throw std::invalid_argument("Catalog document must be an object");
    }

    for (const auto& j : section(document, "products")) catalog_->addProduct(parseProduct(j));
    for (const auto& j : section(document, "price_books")) catalog_->addPriceBook(parsePriceBook(j));
    for (const auto& j : section(document, "formulas")) catalog_->addFormula(parseFormula(j));
    for (const auto& j : section(document, "price_book_entries")) catalog_->addPriceBookEntry(parseEntry(j));
    for (const auto& j : section(document, "bundles")) catalog_->addBundle(parseBundle(j));
    for (const auto& j : section(document, "constraint_rules")) catalog_->addConstraintRule(parseRule(j));

    for (const auto& j : section(document, "discount_policies")) policies_->addDiscountPolicy(parseDiscountPolicy(j));
    for (const auto& j : section(document, "approval_thresholds")) policies_->addApprovalThreshold(parseThreshold(j));
    for (const auto& j : section(document, "approver_authorities")) policies_->addApproverAuthority(parseAuthority(j));

    std::cout << "[JsonCatalogLoader] " << catalog_->productCount() << " products, "
              << catalog_->ruleCount() << " constraint rules" << std::endl;
}

} // namespace cpq::adapters::secondary
