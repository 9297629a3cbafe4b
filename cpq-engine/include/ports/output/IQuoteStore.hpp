// include/ports/output/IQuoteStore.hpp
#pragma once

#include "domain/Quote.hpp"
#include "domain/FlowState.hpp"
#include "domain/QuotePricingSnapshot.hpp"
#include "domain/ApprovalRequest.hpp"
#include "domain/AuditEvent.hpp"
#include "domain/IdempotencyRecord.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace cpq::ports::output {

/**
 * @brief Всё, что фиксируется одним переходом
 *
 * expectedVersion отсутствует только при создании котировки.
 */
struct QuoteCommit {
    domain::Quote quote;
    domain::FlowState flowState;
    std::optional<int64_t> expectedVersion;
    std::optional<domain::QuotePricingSnapshot> snapshot;
    std::optional<domain::ApprovalChain> approvalChain;
    std::optional<domain::Quote> amendment;
    std::optional<domain::FlowState> amendmentFlowState;
    std::vector<domain::AuditEvent> auditEvents;
    std::optional<domain::IdempotencyRecord> idempotency;   ///< Сохраняется в COMMITTED
};

/**
 * @brief Хранилище котировок с оптимистической блокировкой
 */
class IQuoteStore {
public:
    virtual ~IQuoteStore() = default;

    virtual std::optional<domain::Quote> findQuote(const std::string& quoteId) = 0;
    virtual std::optional<domain::FlowState> findFlowState(const std::string& quoteId) = 0;

    /// Все снимки котировки в порядке создания
    virtual std::vector<domain::QuotePricingSnapshot> findSnapshots(const std::string& quoteId) = 0;
    virtual std::optional<domain::QuotePricingSnapshot> findSnapshot(const std::string& snapshotId) = 0;

    /// Последняя цепочка согласования котировки
    virtual std::optional<domain::ApprovalChain> findApprovalChain(const std::string& quoteId) = 0;

    /**
     * @brief Атомарно зафиксировать переход
     * @throws VersionConflictException если хранимая версия != expectedVersion
     *         (или котировка уже существует при создании)
     * @throws StorageException при ошибке хранилища
     */
    virtual void commit(const QuoteCommit& commit) = 0;
};

} // namespace cpq::ports::output
