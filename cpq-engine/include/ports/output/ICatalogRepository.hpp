// include/ports/output/ICatalogRepository.hpp
#pragma once

#include "domain/Product.hpp"
#include "domain/PriceBook.hpp"
#include "domain/PricingFormula.hpp"
#include "domain/Bundle.hpp"
#include "domain/ConstraintRule.hpp"
#include "domain/Timestamp.hpp"
#include <string>
#include <vector>
#include <set>
#include <optional>

namespace cpq::ports::output {

/**
 * @brief Контракт чтения каталога (товары, прайс-листы, правила)
 *
 * Вычислители обращаются к нему в момент оценки и ничего не кешируют.
 */
class ICatalogRepository {
public:
    virtual ~ICatalogRepository() = default;

    virtual std::optional<domain::Product> getProduct(const std::string& productId) = 0;

    /**
     * @brief Активные правила, чей sourceProductId входит в scope или равен "*"
     * @return В порядке priority, затем sequence
     */
    virtual std::vector<domain::ConstraintRule> findConstraintRules(const std::set<std::string>& productScope) = 0;

    /**
     * @brief Прайс-лист с наибольшим приоритетом (затем меньший id) для области
     */
    virtual std::optional<domain::PriceBook> selectPriceBook(
        const std::string& segment,
        const std::string& region,
        const std::string& currency,
        const domain::Timestamp& at) = 0;

    virtual std::optional<domain::PriceBookEntry> getPriceBookEntry(
        const std::string& priceBookId,
        const std::string& productId) = 0;

    virtual std::optional<domain::PricingFormula> getFormula(const std::string& formulaId) = 0;

    virtual std::optional<domain::Bundle> getBundle(const std::string& bundleId) = 0;
};

} // namespace cpq::ports::output
