// include/application/FlowEngine.hpp
#pragma once

#include "domain/Decimal.hpp"
#include "domain/FlowEvent.hpp"
#include "domain/ConstraintResult.hpp"
#include "domain/PolicyDecision.hpp"
#include "domain/ApprovalRequest.hpp"
#include "domain/ApprovalThreshold.hpp"
#include "domain/enums/QuoteStatus.hpp"
#include "domain/enums/FlowEffect.hpp"
#include "domain/enums/TransitionErrorCode.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <optional>

namespace cpq::application {

/**
 * @brief Факты, собранные оркестратором до вызова FlowEngine
 *
 * Движок ничего не читает сам: всё, от чего зависят условия переходов,
 * передаётся здесь.
 */
struct FlowContext {
    std::vector<std::string> missingFields;
    std::optional<domain::ConstraintResult> constraintResult;
    std::optional<domain::PolicyDecision> policyDecision;
    std::optional<domain::ApprovalChain> approvalChain;
    std::optional<domain::ApproverAuthority> approverAuthority;    ///< Полномочия approverRole события
    domain::Decimal requestedDiscountPct;
};

struct TransitionOutcome {
    domain::QuoteStatus from = domain::QuoteStatus::DRAFT;
    domain::QuoteStatus to = domain::QuoteStatus::DRAFT;
    std::vector<domain::FlowEffect> effects;
};

struct TransitionError {
    domain::TransitionErrorCode code = domain::TransitionErrorCode::ILLEGAL_TRANSITION;
    domain::QuoteStatus state = domain::QuoteStatus::DRAFT;
    domain::FlowEventType event = domain::FlowEventType::DRAFT_UPDATED;
    std::vector<std::string> missingFields;
    std::string detail;

    nlohmann::json toJson() const {
        return {
            {"code", domain::toString(code)},
            {"state", domain::toString(state)},
            {"event", domain::toString(event)},
            {"missing_fields", missingFields},
            {"detail", detail}
        };
    }
};

/**
 * @brief Результат применения события: переход либо структурированная ошибка
 */
struct TransitionResult {
    std::optional<TransitionOutcome> outcome;
    std::optional<TransitionError> error;

    bool ok() const { return outcome.has_value(); }
};

/**
 * @brief Чистая машина состояний жизненного цикла котировки
 *
 * apply() не делает ввода-вывода и не меняет аргументы: по текущему
 * состоянию, событию и контексту возвращает целевое состояние и список
 * эффектов. Недопустимая пара (состояние, событие) даёт TransitionError,
 * исключения не бросаются.
 */
class FlowEngine {
public:
    static TransitionResult apply(domain::QuoteStatus current,
                                  const domain::FlowEvent& event,
                                  const FlowContext& context);

    /// Есть ли в таблице переходов строка для пары без учёта условий
    static bool isLegal(domain::QuoteStatus current, domain::FlowEventType eventType);

private:
    static TransitionResult approvalDecided(domain::QuoteStatus current,
                                            const domain::FlowEvent& event,
                                            const FlowContext& context);
};

} // namespace cpq::application
