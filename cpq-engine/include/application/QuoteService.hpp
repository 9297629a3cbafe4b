// include/application/QuoteService.hpp
#pragma once

#include "ports/input/IQuoteService.hpp"
#include "ports/output/IQuoteStore.hpp"
#include "ports/output/IAuditLog.hpp"
#include "ports/output/IIdempotencyRepository.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "ports/output/ICatalogRepository.hpp"
#include "ports/output/IPolicyRepository.hpp"
#include "settings/EngineSettings.hpp"
#include "application/ConstraintEvaluator.hpp"
#include "application/PricingPipeline.hpp"
#include "application/PolicyEvaluator.hpp"
#include "application/FlowEngine.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace cpq::application {

/**
 * @brief Оркестратор жизненного цикла котировки
 *
 * apply():
 * 1. ключ идемпотентности; повтор отдаёт сохранённый результат
 *    (COMMITTED дополнительно переотправляет внешние эффекты);
 * 2. резерв ключа, загрузка котировки, проверка expectedVersion;
 * 3. контекст для FlowEngine (недостающие поля, проверка конфигурации,
 *    решение по политикам, цепочка согласования, полномочия);
 * 4. внутренние эффекты на копии котировки, любая ошибка отменяет всё;
 * 5. атомарный коммит через IQuoteStore;
 * 6. внешние эффекты через IEventPublisher, затем ключ COMPLETED.
 *
 * Отклонённые переходы и неудачные оценки пишутся в аудит и не
 * занимают ключ: то же событие можно повторить после исправления.
 */
class QuoteService : public ports::input::IQuoteService {
public:
    QuoteService(
        std::shared_ptr<ports::output::IQuoteStore> store,
        std::shared_ptr<ports::output::IAuditLog> auditLog,
        std::shared_ptr<ports::output::IIdempotencyRepository> idempotency,
        std::shared_ptr<ports::output::IEventPublisher> publisher,
        std::shared_ptr<ports::output::ICatalogRepository> catalog,
        std::shared_ptr<ports::output::IPolicyRepository> policies,
        std::shared_ptr<settings::EngineSettings> settings);

    domain::ApplyResult createQuote(const std::string& quoteId,
                                    const std::string& actor,
                                    const domain::Timestamp& at) override;

    domain::ApplyResult apply(const std::string& quoteId,
                              int64_t expectedVersion,
                              const domain::FlowEvent& event) override;

    std::optional<domain::QuotePricingSnapshot> previewPricing(const std::string& quoteId,
                                                               const domain::Timestamp& at) override;

    std::optional<domain::Quote> getQuote(const std::string& quoteId) override;
    std::optional<domain::FlowState> getFlowState(const std::string& quoteId) override;
    std::vector<domain::QuotePricingSnapshot> getSnapshots(const std::string& quoteId) override;
    std::optional<domain::ApprovalChain> getApprovalChain(const std::string& quoteId) override;
    std::vector<domain::AuditEvent> getAuditTrail(const std::string& quoteId) override;
    domain::AuditVerification verifyAuditTrail(const std::string& quoteId) override;

private:
    /// Рабочее состояние одного перехода до коммита
    struct Work {
        domain::Quote quote;
        domain::FlowState flow;
        ports::output::QuoteCommit commit;
        std::vector<domain::OutboxMessage> outbox;
        std::optional<domain::QuotePricingSnapshot> latestSnapshot;
        std::optional<domain::ApprovalChain> chain;
    };

    domain::ApplyResult execute(const std::string& quoteId, int64_t expectedVersion,
                                const domain::FlowEvent& event, const std::string& key);

    /**
     * @brief Проверка пользовательского ввода DraftUpdated до изменения агрегата
     * @throws EventDecodeException диапазон скидки, количество или строка не этой котировки
     */
    static void checkDraftChanges(const domain::Quote& quote, const domain::DraftChanges& changes);

    FlowContext buildContext(const domain::Quote& quote, const domain::FlowState& flow,
                             const domain::FlowEvent& event,
                             const std::optional<domain::QuotePricingSnapshot>& latestSnapshot,
                             const std::optional<domain::ApprovalChain>& chain);

    void runEffects(Work& work, const TransitionOutcome& outcome, const domain::FlowEvent& event,
                    const std::string& key, domain::ApplyResult& result);

    domain::QuotePricingSnapshot runPricing(const domain::Quote& quote, const std::string& snapshotId,
                                            int64_t version, const domain::Timestamp& at,
                                            const std::string& actor,
                                            std::vector<std::string> authorizedBy);

    void dispatch(const std::vector<domain::OutboxMessage>& outbox);

    void auditRejection(const std::string& quoteId, const domain::FlowEvent& event, const std::string& key,
                        domain::AuditCategory category, domain::AuditOutcome outcome,
                        const nlohmann::json& payload);

    static domain::AuditEvent makeAudit(const std::string& quoteId, const std::string& eventType,
                                        domain::AuditCategory category, const domain::FlowEvent& event,
                                        const std::string& key, nlohmann::json payload);

    std::shared_ptr<ports::output::IQuoteStore> store_;
    std::shared_ptr<ports::output::IAuditLog> auditLog_;
    std::shared_ptr<ports::output::IIdempotencyRepository> idempotency_;
    std::shared_ptr<ports::output::IEventPublisher> publisher_;
    std::shared_ptr<ports::output::ICatalogRepository> catalog_;
    std::shared_ptr<ports::output::IPolicyRepository> policies_;
    std::shared_ptr<settings::EngineSettings> settings_;

    ConstraintEvaluator constraints_;
    PricingPipeline pricing_;
    PolicyEvaluator policyEvaluator_;
};

} // namespace cpq::application
