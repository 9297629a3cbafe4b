// include/application/ConstraintEvaluator.hpp
#pragma once

#include "ports/output/ICatalogRepository.hpp"
#include "domain/Quote.hpp"
#include "domain/ConstraintResult.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <map>
#include <string>
#include <optional>

namespace cpq::application {

/**
 * @brief Проверка конфигурации котировки по правилам каталога
 *
 * Правила читаются через ICatalogRepository в момент оценки, сортируются
 * по priority и порядку вставки и оцениваются все: результат содержит
 * полный набор нарушений. Некорректное условие правила бросает
 * ConstraintDataMalformedException и никогда не пропускается.
 */
class ConstraintEvaluator {
public:
    explicit ConstraintEvaluator(std::shared_ptr<ports::output::ICatalogRepository> catalog)
        : catalog_(std::move(catalog)) {}

    domain::ConstraintResult evaluate(const domain::Quote& quote);

    /**
     * @brief Заполнить слоты {name} шаблона
     * @return nullopt, если хотя бы один слот не разрешён
     */
    static std::optional<std::string> renderTemplate(const std::string& tmpl,
                                                     const std::map<std::string, std::string>& slots);

private:
    using Slots = std::map<std::string, std::string>;

    void checkBuiltins(const domain::Quote& quote, domain::ConstraintResult& result);

    void evaluateRule(const domain::ConstraintRule& rule, const nlohmann::json& condition,
                      const domain::Quote& quote, domain::ConstraintResult& result);

    void evaluateRequires(const domain::ConstraintRule& rule, const nlohmann::json& condition,
                          const domain::Quote& quote, domain::ConstraintResult& result);
    void evaluateExcludes(const domain::ConstraintRule& rule, const nlohmann::json& condition,
                          const domain::Quote& quote, domain::ConstraintResult& result);
    void evaluateAttribute(const domain::ConstraintRule& rule, const nlohmann::json& condition,
                           const domain::Quote& quote, domain::ConstraintResult& result);
    void evaluateQuantity(const domain::ConstraintRule& rule, const nlohmann::json& condition,
                          const domain::Quote& quote, domain::ConstraintResult& result);
    void evaluateBundle(const domain::ConstraintRule& rule, const nlohmann::json& condition,
                        const domain::Quote& quote, domain::ConstraintResult& result);
    void evaluateCrossProduct(const domain::ConstraintRule& rule, const nlohmann::json& condition,
                              const domain::Quote& quote, domain::ConstraintResult& result);

    void addViolation(const domain::ConstraintRule& rule, const domain::Quote& quote,
                      std::vector<std::string> productIds, Slots slots,
                      nlohmann::json details, domain::ConstraintResult& result);

    std::string productName(const std::string& productId);

    std::shared_ptr<ports::output::ICatalogRepository> catalog_;
};

} // namespace cpq::application
