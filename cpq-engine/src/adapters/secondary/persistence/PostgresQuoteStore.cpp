// src/adapters/secondary/persistence/PostgresQuoteStore.cpp
#include "adapters/secondary/persistence/PostgresQuoteStore.hpp"
#include "adapters/secondary/persistence/PostgresAuditLog.hpp"
#include "adapters/secondary/persistence/PostgresIdempotencyRepository.hpp"
#include "domain/Errors.hpp"
#include <iostream>

namespace cpq::adapters::secondary
{

    namespace
    {
        nlohmann::json parseDocument(const pqxx::field &field)
        {
            return nlohmann::json::parse(field.as<std::string>());
        }
    }

    PostgresQuoteStore::PostgresQuoteStore(std::shared_ptr<settings::DbSettings> s) : settings_(std::move(s))
    {
        pqxx::connection c(settings_->getConnectionString());
        std::cout << "[PostgresQuoteStore] Connected to " << settings_->describe() << std::endl;
    }

    std::optional<domain::Quote> PostgresQuoteStore::findQuote(const std::string &quoteId)
    {
        pqxx::connection c(settings_->getConnectionString());
        pqxx::work t(c);
        auto r = t.exec_params("SELECT document FROM quotes WHERE id=$1", quoteId);
        if (r.empty())
            return std::nullopt;
        return domain::Quote::fromJson(parseDocument(r[0][0]));
    }

    std::optional<domain::FlowState> PostgresQuoteStore::findFlowState(const std::string &quoteId)
    {
        pqxx::connection c(settings_->getConnectionString());
        pqxx::work t(c);
        auto r = t.exec_params("SELECT flow_state FROM quotes WHERE id=$1", quoteId);
        if (r.empty())
            return std::nullopt;
        return domain::FlowState::fromJson(parseDocument(r[0][0]));
    }

    std::vector<domain::QuotePricingSnapshot> PostgresQuoteStore::findSnapshots(const std::string &quoteId)
    {
        pqxx::connection c(settings_->getConnectionString());
        pqxx::work t(c);
        auto r = t.exec_params(
            "SELECT document FROM pricing_snapshots WHERE quote_id=$1 ORDER BY seq", quoteId);
        std::vector<domain::QuotePricingSnapshot> snapshots;
        for (const auto &row : r)
        {
            snapshots.push_back(domain::QuotePricingSnapshot::fromJson(parseDocument(row[0])));
        }
        return snapshots;
    }

    std::optional<domain::QuotePricingSnapshot> PostgresQuoteStore::findSnapshot(const std::string &snapshotId)
    {
        pqxx::connection c(settings_->getConnectionString());
        pqxx::work t(c);
        auto r = t.exec_params("SELECT document FROM pricing_snapshots WHERE id=$1", snapshotId);
        if (r.empty())
            return std::nullopt;
        return domain::QuotePricingSnapshot::fromJson(parseDocument(r[0][0]));
    }

    std::optional<domain::ApprovalChain> PostgresQuoteStore::findApprovalChain(const std::string &quoteId)
    {
        pqxx::connection c(settings_->getConnectionString());
        pqxx::work t(c);
        auto r = t.exec_params("SELECT document FROM approval_chains WHERE quote_id=$1", quoteId);
        if (r.empty())
            return std::nullopt;
        return domain::ApprovalChain::fromJson(parseDocument(r[0][0]));
    }

    void PostgresQuoteStore::commit(const ports::output::QuoteCommit &commit)
    {
        const std::string &quoteId = commit.quote.id();
        try
        {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);

            if (!commit.expectedVersion)
            {
                auto r = t.exec_params("SELECT 1 FROM quotes WHERE id=$1", quoteId);
                if (!r.empty())
                    throw domain::VersionConflictException(quoteId, 0, currentVersion(t, quoteId));
                insertQuote(t, commit.quote, commit.flowState);
            }
            else
            {
                auto r = t.exec_params(
                    "UPDATE quotes SET version=$2, status=$3, document=$4::jsonb, flow_state=$5::jsonb, "
                    "updated_at=$6 WHERE id=$1 AND version=$7",
                    quoteId,
                    commit.quote.version(),
                    domain::toString(commit.flowState.state),
                    commit.quote.toJson().dump(),
                    commit.flowState.toJson().dump(),
                    commit.flowState.updatedAt.toString(),
                    *commit.expectedVersion);
                if (r.affected_rows() != 1)
                    throw domain::VersionConflictException(quoteId, *commit.expectedVersion, currentVersion(t, quoteId));
            }

            if (commit.snapshot)
            {
                t.exec_params(
                    "INSERT INTO pricing_snapshots (id, quote_id, quote_version, document) "
                    "VALUES ($1, $2, $3, $4::jsonb)",
                    commit.snapshot->id,
                    quoteId,
                    commit.snapshot->quoteVersion,
                    commit.snapshot->toJson().dump());
            }

            if (commit.approvalChain)
            {
                t.exec_params(
                    "INSERT INTO approval_chains (quote_id, chain_id, document) VALUES ($1, $2, $3::jsonb) "
                    "ON CONFLICT (quote_id) DO UPDATE SET chain_id=EXCLUDED.chain_id, document=EXCLUDED.document",
                    quoteId,
                    commit.approvalChain->id(),
                    commit.approvalChain->toJson().dump());
            }

            if (commit.amendment && commit.amendmentFlowState)
            {
                auto r = t.exec_params("SELECT 1 FROM quotes WHERE id=$1", commit.amendment->id());
                if (!r.empty())
                    throw domain::VersionConflictException(commit.amendment->id(), 0,
                                                           currentVersion(t, commit.amendment->id()));
                insertQuote(t, *commit.amendment, *commit.amendmentFlowState);
            }

            for (const auto &event : commit.auditEvents)
            {
                PostgresAuditLog::appendIn(t, event);
            }

            if (commit.idempotency)
            {
                PostgresIdempotencyRepository::saveIn(t, *commit.idempotency);
            }

            t.commit();
            std::cout << "[PostgresQuoteStore] Committed " << quoteId << " v" << commit.quote.version() << std::endl;
        }
        catch (const domain::CpqException &)
        {
            throw;
        }
        catch (const pqxx::unique_violation &e)
        {
            std::cerr << "[PostgresQuoteStore] Concurrent commit on " << quoteId << ": " << e.what() << std::endl;
            throw domain::VersionConflictException(quoteId, commit.expectedVersion.value_or(0), -1);
        }
        catch (const std::exception &e)
        {
            std::cerr << "[PostgresQuoteStore] commit() failed: " << e.what() << std::endl;
            throw domain::StorageException(e.what());
        }
    }

    void PostgresQuoteStore::insertQuote(pqxx::work &t, const domain::Quote &quote, const domain::FlowState &flow)
    {
        t.exec_params(
            "INSERT INTO quotes (id, version, status, parent_quote_id, document, flow_state, updated_at) "
            "VALUES ($1, $2, $3, $4, $5::jsonb, $6::jsonb, $7)",
            quote.id(),
            quote.version(),
            domain::toString(flow.state),
            quote.parentQuoteId().value_or(""),
            quote.toJson().dump(),
            flow.toJson().dump(),
            flow.updatedAt.toString());
    }

    int64_t PostgresQuoteStore::currentVersion(pqxx::work &t, const std::string &quoteId)
    {
        auto r = t.exec_params("SELECT version FROM quotes WHERE id=$1", quoteId);
        return r.empty() ? 0 : r[0][0].as<int64_t>();
    }

} // namespace cpq::adapters::secondary
