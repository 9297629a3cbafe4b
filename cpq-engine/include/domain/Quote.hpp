// include/domain/Quote.hpp
#pragma once

#include "domain/Decimal.hpp"
#include "domain/Timestamp.hpp"
#include "domain/QuoteLine.hpp"
#include "domain/DraftChanges.hpp"
#include "domain/enums/QuoteStatus.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <functional>
#include <cstdint>

namespace cpq::domain {

struct QuotePricingSnapshot;

/**
 * @brief Котировка: корень агрегата
 *
 * Статус меняется только через transition(), которую вызывает оркестратор
 * по результату FlowEngine. Строки и поля меняются только в черновике,
 * иначе InvariantViolationException. Котировка не удаляется:
 * EXPIRED/CANCELLED/REVISED это терминальные отметки.
 */
class Quote {
public:
    /// Поля, которые хранятся в типизированных членах, остальные идут в fields
    static const std::vector<std::string>& knownFields();

    /**
     * @brief Проверить значение поля
     * @throws std::invalid_argument если значение не разбирается
     */
    static void checkFieldValue(const std::string& name, const std::string& value);

    Quote() = default;
    Quote(std::string id, std::string createdBy, const Timestamp& createdAt);

    const std::string& id() const { return id_; }
    int64_t version() const { return version_; }
    QuoteStatus status() const { return status_; }
    const std::string& accountId() const { return accountId_; }
    const std::string& currency() const { return currency_; }
    const std::string& segment() const { return segment_; }
    const std::string& region() const { return region_; }
    const std::string& createdBy() const { return createdBy_; }
    std::optional<int> termMonths() const { return termMonths_; }
    const std::optional<Timestamp>& startDate() const { return startDate_; }
    const std::optional<Timestamp>& endDate() const { return endDate_; }
    const std::optional<Timestamp>& validUntil() const { return validUntil_; }
    const std::optional<Decimal>& requestedDiscountPct() const { return requestedDiscountPct_; }
    const std::optional<std::string>& parentQuoteId() const { return parentQuoteId_; }
    const std::optional<std::string>& latestSnapshotId() const { return latestSnapshotId_; }
    const std::map<std::string, std::string>& fields() const { return fields_; }
    const std::vector<QuoteLine>& lines() const { return lines_; }
    const Timestamp& createdAt() const { return createdAt_; }
    const Timestamp& updatedAt() const { return updatedAt_; }

    const QuoteLine* findLine(const std::string& lineId) const;

    /// Строковое значение поля, если оно собрано
    std::optional<std::string> fieldValue(const std::string& name) const;

    /// Обязательные поля, которые ещё не собраны (в порядке required)
    std::vector<std::string> missingFields(const std::vector<std::string>& required) const;

    void setField(const std::string& name, const std::string& value);
    void setRequestedDiscount(const std::optional<Decimal>& pct);

    /// @return id новой строки ("<quoteId>-L<n>")
    std::string addLine(const LineInput& input, int productRevision);
    void updateLine(const LineUpdate& update);
    void removeLine(const std::string& lineId);

    /**
     * @brief Применить изменения черновика целиком
     * @param revisionOf ревизия товара для закрепления в новой строке
     */
    void applyDraftChanges(const DraftChanges& changes,
                           const std::function<int(const std::string&)>& revisionOf,
                           const Timestamp& at);

    /// Перенести цены строк из снимка (один раз за проход)
    void applyPricing(const QuotePricingSnapshot& snapshot);
    void invalidatePricing();

    /**
     * @brief Сменить статус
     * @throws InvariantViolationException если текущий статус не from
     */
    void transition(QuoteStatus from, QuoteStatus to, const Timestamp& at);

    void incrementVersion() { ++version_; }

    /**
     * @brief Создать поправку: новый черновик с parentQuoteId = id()
     * @throws InvariantViolationException для терминальной котировки
     */
    Quote amend(const std::string& newId, const std::string& actor, const Timestamp& at) const;

    nlohmann::json toJson() const;
    static Quote fromJson(const nlohmann::json& j);

private:
    void requireEditable(const char* operation) const;

    std::string id_;
    int64_t version_ = 0;
    QuoteStatus status_ = QuoteStatus::DRAFT;
    std::string accountId_;
    std::string currency_;
    std::string segment_;
    std::string region_;
    std::string createdBy_;
    std::optional<int> termMonths_;
    std::optional<Timestamp> startDate_;
    std::optional<Timestamp> endDate_;
    std::optional<Timestamp> validUntil_;
    std::optional<Decimal> requestedDiscountPct_;
    std::optional<std::string> parentQuoteId_;
    std::optional<std::string> latestSnapshotId_;
    std::map<std::string, std::string> fields_;
    std::vector<QuoteLine> lines_;
    int nextLineNumber_ = 1;
    Timestamp createdAt_;
    Timestamp updatedAt_;
};

} // namespace cpq::domain
