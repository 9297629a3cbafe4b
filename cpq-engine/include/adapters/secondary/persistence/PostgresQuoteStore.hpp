// include/adapters/secondary/persistence/PostgresQuoteStore.hpp
#pragma once

#include "ports/output/IQuoteStore.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>

namespace cpq::adapters::secondary
{

    /**
     * @brief Хранилище котировок в PostgreSQL
     *
     * Котировка, состояние, снимки и цепочки хранятся документами jsonb.
     * commit() - одна транзакция; версия проверяется условием
     * UPDATE ... WHERE version = expected.
     */
    class PostgresQuoteStore : public ports::output::IQuoteStore
    {
    public:
        explicit PostgresQuoteStore(std::shared_ptr<settings::DbSettings> s);

        std::optional<domain::Quote> findQuote(const std::string &quoteId) override;
        std::optional<domain::FlowState> findFlowState(const std::string &quoteId) override;
        std::vector<domain::QuotePricingSnapshot> findSnapshots(const std::string &quoteId) override;
        std::optional<domain::QuotePricingSnapshot> findSnapshot(const std::string &snapshotId) override;
        std::optional<domain::ApprovalChain> findApprovalChain(const std::string &quoteId) override;

        void commit(const ports::output::QuoteCommit &commit) override;

    private:
        std::shared_ptr<settings::DbSettings> settings_;

        static void insertQuote(pqxx::work &t, const domain::Quote &quote, const domain::FlowState &flow);
        static int64_t currentVersion(pqxx::work &t, const std::string &quoteId);
    };

} // namespace cpq::adapters::secondary
