// include/adapters/secondary/persistence/InMemoryQuoteStore.hpp
#pragma once

#include "ports/output/IQuoteStore.hpp"
#include "adapters/secondary/persistence/InMemoryAuditLog.hpp"
#include "adapters/secondary/persistence/InMemoryIdempotencyRepository.hpp"
#include "domain/Errors.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <iostream>

namespace cpq::adapters::secondary {

/**
 * @brief In-memory хранилище котировок
 *
 * commit() выполняется под одной блокировкой: проверка версии, котировка,
 * состояние, снимок, цепочка согласования, поправка, записи аудита и
 * результат идемпотентности видны либо все, либо ни один.
 */
class InMemoryQuoteStore : public ports::output::IQuoteStore {
public:
    InMemoryQuoteStore(std::shared_ptr<InMemoryAuditLog> auditLog,
                       std::shared_ptr<InMemoryIdempotencyRepository> idempotency)
        : auditLog_(std::move(auditLog))
        , idempotency_(std::move(idempotency)) {}

    std::optional<domain::Quote> findQuote(const std::string& quoteId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = quotes_.find(quoteId);
        return it == quotes_.end() ? std::nullopt : std::optional(it->second);
    }

    std::optional<domain::FlowState> findFlowState(const std::string& quoteId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = flows_.find(quoteId);
        return it == flows_.end() ? std::nullopt : std::optional(it->second);
    }

    std::vector<domain::QuotePricingSnapshot> findSnapshots(const std::string& quoteId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = snapshots_.find(quoteId);
        return it == snapshots_.end() ? std::vector<domain::QuotePricingSnapshot>{} : it->second;
    }

    std::optional<domain::QuotePricingSnapshot> findSnapshot(const std::string& snapshotId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [quoteId, list] : snapshots_) {
            for (const auto& snapshot : list) {
                if (snapshot.id == snapshotId) return snapshot;
            }
        }
        return std::nullopt;
    }

    std::optional<domain::ApprovalChain> findApprovalChain(const std::string& quoteId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = chains_.find(quoteId);
        return it == chains_.end() ? std::nullopt : std::optional(it->second);
    }

    void commit(const ports::output::QuoteCommit& commit) override {
        std::lock_guard<std::mutex> lock(mutex_);
        const std::string& quoteId = commit.quote.id();

        auto existing = flows_.find(quoteId);
        if (!commit.expectedVersion) {
            if (existing != flows_.end()) {
                throw domain::VersionConflictException(quoteId, 0, existing->second.version);
            }
        } else {
            int64_t actual = existing == flows_.end() ? 0 : existing->second.version;
            if (actual != *commit.expectedVersion) {
                throw domain::VersionConflictException(quoteId, *commit.expectedVersion, actual);
            }
        }
        if (commit.amendment && quotes_.count(commit.amendment->id()) > 0) {
            throw domain::VersionConflictException(commit.amendment->id(), 0,
                                                   flows_.at(commit.amendment->id()).version);
        }
        if (commit.snapshot) {
            for (const auto& stored : snapshots_[quoteId]) {
                if (stored.id == commit.snapshot->id) {
                    throw domain::InvariantViolationException("Snapshot " + stored.id + " already stored");
                }
            }
        }

        quotes_[quoteId] = commit.quote;
        flows_[quoteId] = commit.flowState;
        if (commit.snapshot) {
            snapshots_[quoteId].push_back(*commit.snapshot);
        }
        if (commit.approvalChain) {
            chains_[quoteId] = *commit.approvalChain;
        }
        if (commit.amendment && commit.amendmentFlowState) {
            quotes_[commit.amendment->id()] = *commit.amendment;
            flows_[commit.amendment->id()] = *commit.amendmentFlowState;
        }
        for (const auto& event : commit.auditEvents) {
            auditLog_->append(event);
        }
        if (commit.idempotency) {
            idempotency_->save(*commit.idempotency);
        }
    }

private:
    std::shared_ptr<InMemoryAuditLog> auditLog_;
    std::shared_ptr<InMemoryIdempotencyRepository> idempotency_;

    std::mutex mutex_;
    std::map<std::string, domain::Quote> quotes_;
    std::map<std::string, domain::FlowState> flows_;
    std::map<std::string, std::vector<domain::QuotePricingSnapshot>> snapshots_;
    std::map<std::string, domain::ApprovalChain> chains_;
};

} // namespace cpq::adapters::secondary
