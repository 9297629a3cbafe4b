// include/adapters/secondary/catalog/InMemoryCatalogRepository.hpp
#pragma once

#include "ports/output/ICatalogRepository.hpp"
#include "domain/Errors.hpp"
#include <ThreadSafeMap.hpp>
#include <algorithm>
#include <atomic>
#include <memory>
#include <iostream>

namespace cpq::adapters::secondary {

/**
 * @brief In-memory каталог: товары, прайс-листы, формулы, пакеты, правила
 *
 * Заполняется JsonCatalogLoader или тестами. Инварианты ступеней
 * проверяются при добавлении позиции прайс-листа.
 */
class InMemoryCatalogRepository : public ports::output::ICatalogRepository {
public:
    InMemoryCatalogRepository() = default;

    // ============================================
    // Наполнение
    // ============================================

    void addProduct(const domain::Product& product) {
        products_.insert(product.id, std::make_shared<domain::Product>(product));
    }

    void addPriceBook(const domain::PriceBook& book) {
        priceBooks_.insert(book.id, std::make_shared<domain::PriceBook>(book));
    }

    /// @throws InvariantViolationException при нарушении ступеней
    void addPriceBookEntry(const domain::PriceBookEntry& entry) {
        domain::validateTiers(entry);
        entries_.insert(entryKey(entry.priceBookId, entry.productId),
                        std::make_shared<domain::PriceBookEntry>(entry));
    }

    void addFormula(const domain::PricingFormula& formula) {
        formulas_.insert(formula.id, std::make_shared<domain::PricingFormula>(formula));
    }

    void addBundle(const domain::Bundle& bundle) {
        bundles_.insert(bundle.id, std::make_shared<domain::Bundle>(bundle));
    }

    /**
     * @brief Добавить правило; sequence выставляется по порядку вставки
     * @throws InvariantViolationException если версия не больше существующей
     */
    void addConstraintRule(domain::ConstraintRule rule) {
        if (auto existing = rules_.find(rule.id)) {
            if (rule.version <= existing->version) {
                throw domain::InvariantViolationException(
                    "Constraint rule " + rule.id + " version " + std::to_string(rule.version) +
                    " does not supersede version " + std::to_string(existing->version));
            }
            rule.sequence = existing->sequence;
        } else {
            rule.sequence = nextSequence_++;
        }
        rules_.insert(rule.id, std::make_shared<domain::ConstraintRule>(rule));
    }

    // ============================================
    // ICatalogRepository
    // ============================================

    std::optional<domain::Product> getProduct(const std::string& productId) override {
        auto product = products_.find(productId);
        return product ? std::optional(*product) : std::nullopt;
    }

    std::vector<domain::ConstraintRule> findConstraintRules(const std::set<std::string>& productScope) override {
        auto found = rules_.values([&productScope](const domain::ConstraintRule& r) {
            return r.active && (r.isWildcard() || productScope.count(r.sourceProductId) > 0);
        });

        std::vector<domain::ConstraintRule> result;
        result.reserve(found.size());
        for (const auto& rule : found) {
            result.push_back(*rule);
        }
        std::sort(result.begin(), result.end(), [](const domain::ConstraintRule& a, const domain::ConstraintRule& b) {
            if (a.priority != b.priority) return a.priority < b.priority;
            return a.sequence < b.sequence;
        });
        return result;
    }

    std::optional<domain::PriceBook> selectPriceBook(const std::string& segment,
                                                     const std::string& region,
                                                     const std::string& currency,
                                                     const domain::Timestamp& at) override {
        auto candidates = priceBooks_.values([&](const domain::PriceBook& b) {
            return b.matches(segment, region, currency, at);
        });
        if (candidates.empty()) {
            return std::nullopt;
        }

        auto best = std::min_element(candidates.begin(), candidates.end(), [](const auto& a, const auto& b) {
            if (a->priority != b->priority) return a->priority > b->priority;
            return a->id < b->id;
        });
        return **best;
    }

    std::optional<domain::PriceBookEntry> getPriceBookEntry(const std::string& priceBookId,
                                                            const std::string& productId) override {
        auto entry = entries_.find(entryKey(priceBookId, productId));
        return entry ? std::optional(*entry) : std::nullopt;
    }

    std::optional<domain::PricingFormula> getFormula(const std::string& formulaId) override {
        auto formula = formulas_.find(formulaId);
        return formula ? std::optional(*formula) : std::nullopt;
    }

    std::optional<domain::Bundle> getBundle(const std::string& bundleId) override {
        auto bundle = bundles_.find(bundleId);
        return bundle ? std::optional(*bundle) : std::nullopt;
    }

    size_t productCount() const { return products_.size(); }
    size_t ruleCount() const { return rules_.size(); }

private:
    static std::string entryKey(const std::string& priceBookId, const std::string& productId) {
        return priceBookId + "/" + productId;
    }

    common::ThreadSafeMap<std::string, domain::Product> products_;
    common::ThreadSafeMap<std::string, domain::PriceBook> priceBooks_;
    common::ThreadSafeMap<std::string, domain::PriceBookEntry> entries_;
    common::ThreadSafeMap<std::string, domain::PricingFormula> formulas_;
    common::ThreadSafeMap<std::string, domain::Bundle> bundles_;
    common::ThreadSafeMap<std::string, domain::ConstraintRule> rules_;
    std::atomic<int64_t> nextSequence_{1};
};

} // namespace cpq::adapters::secondary
