#include "application/ConstraintEvaluator.hpp"
#include "domain/Bundle.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <set>

namespace cpq::application {

using domain::ConstraintResult;
using domain::ConstraintRule;
using domain::ConstraintType;
using domain::ConstraintViolation;
using domain::ConstraintDataMalformedException;
using domain::Decimal;
using domain::Quote;
using nlohmann::json;

namespace {

std::string requireString(const json& condition, const char* key, const ConstraintRule& rule) {
    auto it = condition.find(key);
    if (it == condition.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw ConstraintDataMalformedException(rule.id, std::string("'") + key + "' must be a non-empty string");
    }
    return it->get<std::string>();
}

std::optional<int64_t> optionalInt(const json& condition, const char* key, const ConstraintRule& rule) {
    auto it = condition.find(key);
    if (it == condition.end()) return std::nullopt;
    if (!it->is_number_integer()) {
        throw ConstraintDataMalformedException(rule.id, std::string("'") + key + "' must be an integer");
    }
    return it->get<int64_t>();
}

// Десятичные границы: строка или целое, без двоичной плавающей точки
std::optional<Decimal> optionalDecimal(const json& condition, const char* key, const ConstraintRule& rule) {
    auto it = condition.find(key);
    if (it == condition.end()) return std::nullopt;
    if (it->is_number_integer()) return Decimal::fromInt(it->get<int64_t>());
    if (it->is_string()) {
        try {
            return Decimal::fromString(it->get<std::string>());
        } catch (const std::invalid_argument& e) {
            throw ConstraintDataMalformedException(rule.id, std::string("'") + key + "': " + e.what());
        }
    }
    throw ConstraintDataMalformedException(rule.id, std::string("'") + key + "' must be a decimal string");
}

bool hasProduct(const Quote& quote, const std::string& productId) {
    for (const auto& line : quote.lines()) {
        if (line.productId == productId) return true;
    }
    return false;
}

int64_t sumQuantity(const Quote& quote, const std::string& productId) {
    int64_t total = 0;
    for (const auto& line : quote.lines()) {
        if (line.productId == productId) total += line.quantity;
    }
    return total;
}

bool compare(int64_t actual, const std::string& op, int64_t limit) {
    if (op == "lte") return actual <= limit;
    if (op == "gte") return actual >= limit;
    if (op == "lt") return actual < limit;
    if (op == "gt") return actual > limit;
    return actual == limit;
}

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ", ";
        out += items[i];
    }
    return out;
}

ConstraintViolation builtin(const std::string& code, const std::string& message,
                            std::vector<std::string> productIds, json details) {
    ConstraintViolation v;
    v.ruleId = "builtin:" + code;
    v.type = "builtin";
    v.productIds = std::move(productIds);
    v.message = message;
    v.details = std::move(details);
    return v;
}

} // namespace

ConstraintResult ConstraintEvaluator::evaluate(const Quote& quote) {
    ConstraintResult result;
    checkBuiltins(quote, result);

    std::set<std::string> scope;
    for (const auto& line : quote.lines()) {
        scope.insert(line.productId);
    }

    auto rules = catalog_->findConstraintRules(scope);
    std::stable_sort(rules.begin(), rules.end(), [](const ConstraintRule& a, const ConstraintRule& b) {
        if (a.priority != b.priority) return a.priority < b.priority;
        return a.sequence < b.sequence;
    });

    for (const auto& rule : rules) {
        if (!rule.active) continue;
        if (!rule.isWildcard() && scope.count(rule.sourceProductId) == 0) continue;

        json condition;
        try {
            condition = json::parse(rule.condition);
        } catch (const json::parse_error& e) {
            throw ConstraintDataMalformedException(rule.id, e.what());
        }
        if (!condition.is_object()) {
            throw ConstraintDataMalformedException(rule.id, "condition must be a JSON object");
        }

        try {
            evaluateRule(rule, condition, quote, result);
        } catch (const json::exception& e) {
            throw ConstraintDataMalformedException(rule.id, e.what());
        }
    }

    result.valid = result.violations.empty();
    return result;
}

void ConstraintEvaluator::checkBuiltins(const Quote& quote, ConstraintResult& result) {
    if (quote.lines().empty()) {
        result.violations.push_back(builtin("empty_quote", "Quote " + quote.id() + " has no lines", {},
                                            {{"quote_id", quote.id()}}));
        return;
    }

    std::set<std::string> checkedBundles;
    for (const auto& line : quote.lines()) {
        auto product = catalog_->getProduct(line.productId);
        if (!product) {
            result.violations.push_back(builtin("unknown_product", "Product " + line.productId + " is not in the catalog",
                                                {line.productId}, {{"line_id", line.id}}));
        } else if (!product->active) {
            result.violations.push_back(builtin("inactive_product", "Product " + line.productId + " is not active",
                                                {line.productId}, {{"line_id", line.id}}));
        }

        if (line.bundleId && checkedBundles.insert(*line.bundleId).second) {
            if (!catalog_->getBundle(*line.bundleId)) {
                result.violations.push_back(builtin("unknown_bundle", "Bundle " + *line.bundleId + " is not in the catalog",
                                                    {line.productId},
                                                    {{"line_id", line.id}, {"bundle_id", *line.bundleId}}));
            }
        }
    }
}

void ConstraintEvaluator::evaluateRule(const ConstraintRule& rule, const json& condition,
                                       const Quote& quote, ConstraintResult& result) {
    switch (rule.type) {
        case ConstraintType::REQUIRES: evaluateRequires(rule, condition, quote, result); break;
        case ConstraintType::EXCLUDES: evaluateExcludes(rule, condition, quote, result); break;
        case ConstraintType::ATTRIBUTE: evaluateAttribute(rule, condition, quote, result); break;
        case ConstraintType::QUANTITY: evaluateQuantity(rule, condition, quote, result); break;
        case ConstraintType::BUNDLE: evaluateBundle(rule, condition, quote, result); break;
        case ConstraintType::CROSS_PRODUCT: evaluateCrossProduct(rule, condition, quote, result); break;
        default:
            throw ConstraintDataMalformedException(rule.id, "unsupported constraint type");
    }
}

void ConstraintEvaluator::evaluateRequires(const ConstraintRule& rule, const json& condition,
                                           const Quote& quote, ConstraintResult& result) {
    if (rule.isWildcard()) {
        throw ConstraintDataMalformedException(rule.id, "requires rule needs a source product");
    }
    std::string target = requireString(condition, "target_product_id", rule);

    if (hasProduct(quote, rule.sourceProductId) && !hasProduct(quote, target)) {
        addViolation(rule, quote, {rule.sourceProductId, target},
                     {{"source_product_id", rule.sourceProductId},
                      {"source_product_name", productName(rule.sourceProductId)},
                      {"target_product_id", target},
                      {"target_product_name", productName(target)}},
                     {{"missing_product_id", target}}, result);
    }
}

void ConstraintEvaluator::evaluateExcludes(const ConstraintRule& rule, const json& condition,
                                           const Quote& quote, ConstraintResult& result) {
    if (rule.isWildcard()) {
        throw ConstraintDataMalformedException(rule.id, "excludes rule needs a source product");
    }
    std::string target = requireString(condition, "target_product_id", rule);

    if (hasProduct(quote, rule.sourceProductId) && hasProduct(quote, target)) {
        addViolation(rule, quote, {rule.sourceProductId, target},
                     {{"source_product_id", rule.sourceProductId},
                      {"source_product_name", productName(rule.sourceProductId)},
                      {"target_product_id", target},
                      {"target_product_name", productName(target)}},
                     {{"conflicting_product_id", target}}, result);
    }
}

void ConstraintEvaluator::evaluateAttribute(const ConstraintRule& rule, const json& condition,
                                            const Quote& quote, ConstraintResult& result) {
    std::string attribute = requireString(condition, "attribute", rule);
    std::string op = requireString(condition, "op", rule);

    bool required = true;
    if (condition.contains("required")) {
        if (!condition["required"].is_boolean()) {
            throw ConstraintDataMalformedException(rule.id, "'required' must be a boolean");
        }
        required = condition["required"].get<bool>();
    }

    std::string expectedValue;
    std::vector<std::string> allowed;
    std::optional<Decimal> min;
    std::optional<Decimal> max;
    std::string expected;

    if (op == "eq" || op == "neq") {
        expectedValue = requireString(condition, "value", rule);
        expected = expectedValue;
    } else if (op == "in") {
        auto it = condition.find("values");
        if (it == condition.end() || !it->is_array() || it->empty()) {
            throw ConstraintDataMalformedException(rule.id, "'values' must be a non-empty array");
        }
        for (const auto& v : *it) {
            if (!v.is_string()) {
                throw ConstraintDataMalformedException(rule.id, "'values' must contain strings");
            }
            allowed.push_back(v.get<std::string>());
        }
        expected = join(allowed);
    } else if (op == "range") {
        min = optionalDecimal(condition, "min", rule);
        max = optionalDecimal(condition, "max", rule);
        if (!min && !max) {
            throw ConstraintDataMalformedException(rule.id, "range needs 'min' or 'max'");
        }
        expected = (min ? min->toString() : std::string()) + ".." + (max ? max->toString() : std::string());
    } else {
        throw ConstraintDataMalformedException(rule.id, "unknown attribute op '" + op + "'");
    }

    for (const auto& line : quote.lines()) {
        if (!rule.isWildcard() && line.productId != rule.sourceProductId) continue;

        std::optional<std::string> value;
        auto own = line.attributes.find(attribute);
        if (own != line.attributes.end()) {
            value = own->second;
        } else if (auto product = catalog_->getProduct(line.productId)) {
            auto def = product->attributes.find(attribute);
            if (def != product->attributes.end()) value = def->second;
        }

        Slots slots = {
            {"attribute", attribute},
            {"line_id", line.id},
            {"product_id", line.productId},
            {"product_name", productName(line.productId)},
            {"expected", expected}
        };

        if (!value) {
            if (required) {
                addViolation(rule, quote, {line.productId}, slots,
                             {{"line_id", line.id}, {"attribute", attribute}, {"reason", "missing"}}, result);
            }
            continue;
        }
        slots["value"] = *value;

        bool satisfied = true;
        std::string reason = "mismatch";
        if (op == "eq") {
            satisfied = *value == expectedValue;
        } else if (op == "neq") {
            satisfied = *value != expectedValue;
        } else if (op == "in") {
            satisfied = std::find(allowed.begin(), allowed.end(), *value) != allowed.end();
        } else {
            try {
                Decimal numeric = Decimal::fromString(*value);
                satisfied = (!min || numeric >= *min) && (!max || numeric <= *max);
                if (!satisfied) reason = "out_of_range";
            } catch (const std::invalid_argument&) {
                satisfied = false;
                reason = "not_numeric";
            }
        }

        if (!satisfied) {
            addViolation(rule, quote, {line.productId}, slots,
                         {{"line_id", line.id}, {"attribute", attribute}, {"value", *value},
                          {"expected", expected}, {"reason", reason}}, result);
        }
    }
}

void ConstraintEvaluator::evaluateQuantity(const ConstraintRule& rule, const json& condition,
                                           const Quote& quote, ConstraintResult& result) {
    auto min = optionalInt(condition, "min", rule);
    auto max = optionalInt(condition, "max", rule);
    if (!min && !max) {
        throw ConstraintDataMalformedException(rule.id, "quantity rule needs 'min' or 'max'");
    }

    Slots slots;
    std::vector<std::string> productIds;
    int64_t quantity = 0;

    if (condition.contains("bundle_id")) {
        std::string bundleId = requireString(condition, "bundle_id", rule);
        std::set<std::string> products;
        for (const auto& line : quote.lines()) {
            if (line.bundleId && *line.bundleId == bundleId) {
                quantity += line.quantity;
                products.insert(line.productId);
            }
        }
        if (quantity == 0) return;
        productIds.assign(products.begin(), products.end());
        slots["bundle_id"] = bundleId;
    } else {
        if (rule.isWildcard()) {
            throw ConstraintDataMalformedException(rule.id, "quantity rule needs a source product or 'bundle_id'");
        }
        quantity = sumQuantity(quote, rule.sourceProductId);
        if (quantity == 0) return;
        productIds.push_back(rule.sourceProductId);
        slots["product_id"] = rule.sourceProductId;
        slots["product_name"] = productName(rule.sourceProductId);
    }

    slots["quantity"] = std::to_string(quantity);
    if (min) slots["min"] = std::to_string(*min);
    if (max) slots["max"] = std::to_string(*max);

    bool belowMin = min && quantity < *min;
    bool aboveMax = max && quantity > *max;
    if (belowMin || aboveMax) {
        json details = {{"quantity", quantity}, {"reason", belowMin ? "below_min" : "above_max"}};
        if (min) details["min"] = *min;
        if (max) details["max"] = *max;
        addViolation(rule, quote, productIds, slots, details, result);
    }
}

void ConstraintEvaluator::evaluateBundle(const ConstraintRule& rule, const json& condition,
                                         const Quote& quote, ConstraintResult& result) {
    std::string bundleId = requireString(condition, "bundle_id", rule);
    auto bundle = catalog_->getBundle(bundleId);
    if (!bundle) {
        throw ConstraintDataMalformedException(rule.id, "unknown bundle '" + bundleId + "'");
    }

    bool tagged = std::any_of(quote.lines().begin(), quote.lines().end(), [&](const domain::QuoteLine& l) {
        return l.bundleId && *l.bundleId == bundleId;
    });
    bool sourcePresent = !rule.isWildcard() && hasProduct(quote, rule.sourceProductId);
    if (!tagged && !sourcePresent) return;

    for (const auto& mismatch : domain::checkComposition(*bundle, quote.lines())) {
        Slots slots = {
            {"bundle_id", bundle->id},
            {"bundle_name", bundle->name},
            {"component_product_id", mismatch.productId},
            {"component_name", productName(mismatch.productId)},
            {"mismatch", domain::toString(mismatch.kind)},
            {"actual", std::to_string(mismatch.actualQuantity)},
            {"min", std::to_string(mismatch.minQuantity)}
        };
        if (mismatch.maxQuantity) slots["max"] = std::to_string(*mismatch.maxQuantity);

        json details = {
            {"bundle_id", bundle->id},
            {"component_product_id", mismatch.productId},
            {"kind", domain::toString(mismatch.kind)},
            {"actual_quantity", mismatch.actualQuantity},
            {"min_quantity", mismatch.minQuantity}
        };
        if (mismatch.maxQuantity) details["max_quantity"] = *mismatch.maxQuantity;

        addViolation(rule, quote, {mismatch.productId}, slots, details, result);
    }
}

void ConstraintEvaluator::evaluateCrossProduct(const ConstraintRule& rule, const json& condition,
                                               const Quote& quote, ConstraintResult& result) {
    auto it = condition.find("product_ids");
    if (it == condition.end() || !it->is_array() || it->empty()) {
        throw ConstraintDataMalformedException(rule.id, "'product_ids' must be a non-empty array");
    }
    std::set<std::string> productIds;
    for (const auto& id : *it) {
        if (!id.is_string()) {
            throw ConstraintDataMalformedException(rule.id, "'product_ids' must contain strings");
        }
        productIds.insert(id.get<std::string>());
    }

    std::string aggregate = requireString(condition, "aggregate", rule);
    if (aggregate != "sum_quantity" && aggregate != "line_count") {
        throw ConstraintDataMalformedException(rule.id, "unknown aggregate '" + aggregate + "'");
    }
    std::string op = requireString(condition, "op", rule);
    if (op != "lte" && op != "gte" && op != "lt" && op != "gt" && op != "eq") {
        throw ConstraintDataMalformedException(rule.id, "unknown comparison '" + op + "'");
    }
    auto limit = optionalInt(condition, "value", rule);
    if (!limit) {
        throw ConstraintDataMalformedException(rule.id, "'value' is required");
    }

    int64_t actual = 0;
    std::set<std::string> present;
    for (const auto& line : quote.lines()) {
        if (productIds.count(line.productId) == 0) continue;
        present.insert(line.productId);
        actual += aggregate == "sum_quantity" ? line.quantity : 1;
    }
    if (present.empty()) return;

    if (!compare(actual, op, *limit)) {
        addViolation(rule, quote, std::vector<std::string>(present.begin(), present.end()),
                     {{"aggregate", aggregate}, {"actual", std::to_string(actual)},
                      {"op", op}, {"value", std::to_string(*limit)}},
                     {{"aggregate", aggregate}, {"actual", actual}, {"op", op}, {"value", *limit}}, result);
    }
}

void ConstraintEvaluator::addViolation(const ConstraintRule& rule, const Quote& quote,
                                       std::vector<std::string> productIds, Slots slots,
                                       json details, ConstraintResult& result) {
    slots["quote_id"] = quote.id();
    slots["rule_id"] = rule.id;

    ConstraintViolation v;
    v.ruleId = rule.id;
    v.ruleVersion = rule.version;
    v.type = domain::toString(rule.type);
    v.productIds = std::move(productIds);
    v.message = renderTemplate(rule.messageTemplate, slots).value_or(rule.messageTemplate);
    if (rule.suggestionTemplate) {
        v.suggestedFix = renderTemplate(*rule.suggestionTemplate, slots);
    }
    v.details = std::move(details);
    result.violations.push_back(std::move(v));
}

std::string ConstraintEvaluator::productName(const std::string& productId) {
    auto product = catalog_->getProduct(productId);
    return product ? product->name : std::string();
}

std::optional<std::string> ConstraintEvaluator::renderTemplate(const std::string& tmpl,
                                                               const std::map<std::string, std::string>& slots) {
    std::string out;
    size_t pos = 0;
    while (pos < tmpl.size()) {
        size_t open = tmpl.find('{', pos);
        if (open == std::string::npos) {
            out += tmpl.substr(pos);
            break;
        }
        size_t close = tmpl.find('}', open);
        if (close == std::string::npos) return std::nullopt;

        out += tmpl.substr(pos, open - pos);
        std::string name = tmpl.substr(open + 1, close - open - 1);
        auto it = slots.find(name);
        if (it == slots.end() || it->second.empty()) return std::nullopt;
        out += it->second;
        pos = close + 1;
    }
    return out;
}

} // namespace cpq::application
