// include/domain/ConstraintResult.hpp
#pragma once

#include "domain/JsonConversions.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <optional>

namespace cpq::domain {

/**
 * @brief Нарушение конфигурации
 *
 * ruleId для встроенных проверок начинается с "builtin:".
 * suggestedFix заполняется только если шаблон полностью разрешён из котировки.
 */
struct ConstraintViolation {
    std::string ruleId;
    int ruleVersion = 0;
    std::string type;                       ///< requires, excludes, ..., builtin
    std::vector<std::string> productIds;
    std::string message;
    std::optional<std::string> suggestedFix;
    nlohmann::json details = nlohmann::json::object();

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["rule_id"] = ruleId;
        j["rule_version"] = ruleVersion;
        j["type"] = type;
        j["product_ids"] = productIds;
        j["message"] = message;
        putOptional(j, "suggested_fix", suggestedFix);
        j["details"] = details;
        return j;
    }

    static ConstraintViolation fromJson(const nlohmann::json& j) {
        ConstraintViolation v;
        v.ruleId = j.at("rule_id").get<std::string>();
        v.ruleVersion = j.value("rule_version", 0);
        v.type = j.at("type").get<std::string>();
        v.productIds = j.value("product_ids", std::vector<std::string>{});
        v.message = j.value("message", "");
        v.suggestedFix = getOptional<std::string>(j, "suggested_fix");
        v.details = j.value("details", nlohmann::json::object());
        return v;
    }
};

/**
 * @brief Полный набор нарушений (без короткого замыкания)
 */
struct ConstraintResult {
    bool valid = true;
    std::vector<ConstraintViolation> violations;

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["valid"] = valid;
        j["violations"] = nlohmann::json::array();
        for (const auto& v : violations) j["violations"].push_back(v.toJson());
        return j;
    }

    static ConstraintResult fromJson(const nlohmann::json& j) {
        ConstraintResult r;
        r.valid = j.at("valid").get<bool>();
        for (const auto& item : j.at("violations")) r.violations.push_back(ConstraintViolation::fromJson(item));
        return r;
    }
};

} // namespace cpq::domain
