// include/application/PolicyEvaluator.hpp
#pragma once

#include "ports/output/IPolicyRepository.hpp"
#include "domain/Quote.hpp"
#include "domain/QuotePricingSnapshot.hpp"
#include "domain/PolicyDecision.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include <optional>

namespace cpq::application {

/**
 * @brief Оценка политик для оценённой котировки
 *
 * Все применимые политики оцениваются без короткого замыкания. При
 * нескольких сработавших политиках одного семейства побеждает самая
 * строгая: наибольший уровень согласующего, затем наименьший порог, затем id.
 * Проигравшие попадают в supersededPolicyIds победителя.
 * Некорректное условие бросает PolicyDataMalformedException (fail closed).
 */
class PolicyEvaluator {
public:
    explicit PolicyEvaluator(std::shared_ptr<ports::output::IPolicyRepository> policies)
        : policies_(std::move(policies)) {}

    domain::PolicyDecision evaluate(const domain::Quote& quote,
                                    const domain::QuotePricingSnapshot& snapshot,
                                    const domain::Timestamp& at);

    /**
     * @brief Потолок автоматической скидки для ценообразования
     * @return Наименьший maxAutoDiscountPct среди применимых политик, nullopt если их нет
     */
    std::optional<domain::Decimal> discountCapFor(const domain::Quote& quote,
                                                  const std::set<std::string>& categories);

    /// Запрошенная скидка котировки в процентах (максимум по строкам)
    static domain::Decimal requestedDiscountPct(const domain::Quote& quote,
                                                const domain::QuotePricingSnapshot& snapshot);

private:
    struct Candidate {
        domain::PolicyViolation violation;
        domain::Decimal ceiling;    ///< Для сравнения строгости
    };

    void evaluateDiscountPolicies(const domain::Quote& quote, const domain::QuotePricingSnapshot& snapshot,
                                  domain::PolicyDecision& decision, std::vector<Candidate>& candidates);
    void evaluateThreshold(const domain::ApprovalThreshold& threshold, const nlohmann::json& condition,
                           const domain::Quote& quote, const domain::QuotePricingSnapshot& snapshot,
                           const domain::Timestamp& at, domain::PolicyDecision& decision,
                           std::vector<Candidate>& candidates);

    static void resolveConflicts(std::vector<Candidate>& candidates, domain::PolicyDecision& decision);

    std::shared_ptr<ports::output::IPolicyRepository> policies_;
};

} // namespace cpq::application
