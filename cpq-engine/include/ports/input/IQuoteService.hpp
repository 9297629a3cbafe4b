// include/ports/input/IQuoteService.hpp
#pragma once

#include "domain/Quote.hpp"
#include "domain/FlowState.hpp"
#include "domain/FlowEvent.hpp"
#include "domain/ApplyResult.hpp"
#include "domain/QuotePricingSnapshot.hpp"
#include "domain/ApprovalRequest.hpp"
#include "domain/AuditEvent.hpp"
#include "domain/Timestamp.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace cpq::ports::input {

/**
 * @brief Входной контракт ядра CPQ
 */
class IQuoteService {
public:
    virtual ~IQuoteService() = default;

    /**
     * @brief Создать черновик котировки (версия 1)
     */
    virtual domain::ApplyResult createQuote(
        const std::string& quoteId,
        const std::string& actor,
        const domain::Timestamp& at) = 0;

    /**
     * @brief Применить событие жизненного цикла
     * @param expectedVersion версия, которую видел вызывающий
     */
    virtual domain::ApplyResult apply(
        const std::string& quoteId,
        int64_t expectedVersion,
        const domain::FlowEvent& event) = 0;

    /**
     * @brief Рассчитать цену без фиксации (предпросмотр)
     * @throws PricingDataMissingException, ConstraintDataMalformedException, PolicyDataMalformedException
     */
    virtual std::optional<domain::QuotePricingSnapshot> previewPricing(
        const std::string& quoteId,
        const domain::Timestamp& at) = 0;

    virtual std::optional<domain::Quote> getQuote(const std::string& quoteId) = 0;
    virtual std::optional<domain::FlowState> getFlowState(const std::string& quoteId) = 0;
    virtual std::vector<domain::QuotePricingSnapshot> getSnapshots(const std::string& quoteId) = 0;
    virtual std::optional<domain::ApprovalChain> getApprovalChain(const std::string& quoteId) = 0;
    virtual std::vector<domain::AuditEvent> getAuditTrail(const std::string& quoteId) = 0;
    virtual domain::AuditVerification verifyAuditTrail(const std::string& quoteId) = 0;
};

} // namespace cpq::ports::input
