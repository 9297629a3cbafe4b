/**
 * @file InMemoryQuoteStoreTest.cpp
 * @brief Tests for atomic commits, audit sealing and idempotency records
 */

#include <gtest/gtest.h>
#include "adapters/secondary/persistence/InMemoryQuoteStore.hpp"
#include "fixtures/CatalogFixture.hpp"

using namespace cpq::adapters::secondary;
using namespace cpq::domain;
using namespace cpq::tests;
using cpq::ports::output::QuoteCommit;

class InMemoryQuoteStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        auditLog = std::make_shared<InMemoryAuditLog>();
        idempotency = std::make_shared<InMemoryIdempotencyRepository>();
        store = std::make_shared<InMemoryQuoteStore>(auditLog, idempotency);
    }

    static FlowState flowFor(const Quote& quote) {
        FlowState flow;
        flow.quoteId = quote.id();
        flow.state = quote.status();
        flow.version = quote.version();
        flow.updatedAt = quote.updatedAt();
        return flow;
    }

    static AuditEvent audit(const std::string& quoteId, const std::string& type) {
        AuditEvent event;
        event.quoteId = quoteId;
        event.eventType = type;
        event.actor = "rep@acme.example";
        event.occurredAt = ts("2026-01-05T10:00:00Z");
        return event;
    }

    /// Первый коммит котировки (версия 1)
    Quote create(const std::string& quoteId) {
        Quote quote(quoteId, "rep@acme.example", ts("2026-01-05T09:00:00Z"));
        quote.incrementVersion();
        QuoteCommit commit{quote, flowFor(quote)};
        commit.auditEvents.push_back(audit(quoteId, "flow.quote_created"));
        store->commit(commit);
        return quote;
    }

    std::shared_ptr<InMemoryAuditLog> auditLog;
    std::shared_ptr<InMemoryIdempotencyRepository> idempotency;
    std::shared_ptr<InMemoryQuoteStore> store;
};

TEST_F(InMemoryQuoteStoreTest, CreateStoresQuoteFlowAndAudit) {
    create("Q-1");

    ASSERT_TRUE(store->findQuote("Q-1").has_value());
    EXPECT_EQ(store->findFlowState("Q-1")->version, 1);

    auto trail = auditLog->eventsForQuote("Q-1");
    ASSERT_EQ(trail.size(), 1u);
    EXPECT_EQ(trail[0].id, "Q-1-A1");
    EXPECT_FALSE(trail[0].hash.empty());
    EXPECT_FALSE(store->findQuote("Q-2").has_value());
}

TEST_F(InMemoryQuoteStoreTest, SecondCreateIsVersionConflict) {
    create("Q-1");

    Quote again("Q-1", "other@acme.example", ts("2026-01-06T09:00:00Z"));
    again.incrementVersion();

    try {
        store->commit(QuoteCommit{again, flowFor(again)});
        FAIL() << "Expected VersionConflictException";
    } catch (const VersionConflictException& e) {
        EXPECT_EQ(e.actual(), 1);
    }
    EXPECT_EQ(store->findQuote("Q-1")->createdBy(), "rep@acme.example");
}

TEST_F(InMemoryQuoteStoreTest, StaleCommitChangesNothing) {
    Quote quote = create("Q-1");
    quote.setField("region", "US");
    quote.incrementVersion();

    QuoteCommit commit{quote, flowFor(quote)};
    commit.expectedVersion = 7;
    commit.auditEvents.push_back(audit("Q-1", "flow.transition_applied"));

    IdempotencyRecord record;
    record.key = "k-1";
    record.quoteId = "Q-1";
    record.state = IdempotencyState::COMMITTED;
    commit.idempotency = record;

    EXPECT_THROW(store->commit(commit), VersionConflictException);

    EXPECT_EQ(store->findFlowState("Q-1")->version, 1);
    EXPECT_TRUE(store->findQuote("Q-1")->region().empty());
    EXPECT_EQ(auditLog->eventsForQuote("Q-1").size(), 1u);
    EXPECT_FALSE(idempotency->find("k-1").has_value());
}

TEST_F(InMemoryQuoteStoreTest, CommitWritesEverythingTogether) {
    create("Q-1");
    Quote priced = CatalogFixture::scenarioQuote("Q-1");

    QuotePricingSnapshot snapshot;
    snapshot.id = "Q-1-S2";
    snapshot.quoteId = "Q-1";
    snapshot.quoteVersion = 2;
    priced.incrementVersion();
    priced.incrementVersion();

    QuoteCommit commit{priced, flowFor(priced)};
    commit.expectedVersion = 1;
    commit.snapshot = snapshot;
    commit.auditEvents.push_back(audit("Q-1", "flow.transition_applied"));
    commit.auditEvents.push_back(audit("Q-1", "pricing.snapshot_created"));

    IdempotencyRecord record;
    record.key = "k-1";
    record.quoteId = "Q-1";
    record.state = IdempotencyState::COMMITTED;
    record.outbox.push_back(OutboxMessage{"quote.published", "{}"});
    commit.idempotency = record;

    store->commit(commit);

    EXPECT_EQ(store->findFlowState("Q-1")->version, 2);
    EXPECT_EQ(store->findQuote("Q-1")->lines().size(), 3u);
    ASSERT_EQ(store->findSnapshots("Q-1").size(), 1u);
    EXPECT_TRUE(store->findSnapshot("Q-1-S2").has_value());

    auto trail = auditLog->eventsForQuote("Q-1");
    ASSERT_EQ(trail.size(), 3u);
    EXPECT_EQ(trail[2].sequence, 3);
    EXPECT_EQ(trail[2].prevHash, trail[1].hash);
    EXPECT_TRUE(AuditChain::verify(trail).valid);

    auto stored = idempotency->find("k-1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->state, IdempotencyState::COMMITTED);
    EXPECT_EQ(stored->outbox.size(), 1u);
}

TEST_F(InMemoryQuoteStoreTest, DuplicateSnapshotIsRejected) {
    Quote quote = create("Q-1");

    QuotePricingSnapshot snapshot;
    snapshot.id = "Q-1-S2";
    snapshot.quoteId = "Q-1";

    quote.incrementVersion();
    QuoteCommit first{quote, flowFor(quote)};
    first.expectedVersion = 1;
    first.snapshot = snapshot;
    store->commit(first);

    quote.incrementVersion();
    QuoteCommit second{quote, flowFor(quote)};
    second.expectedVersion = 2;
    second.snapshot = snapshot;

    EXPECT_THROW(store->commit(second), InvariantViolationException);
    EXPECT_EQ(store->findFlowState("Q-1")->version, 2);
    EXPECT_EQ(store->findSnapshots("Q-1").size(), 1u);
}

TEST_F(InMemoryQuoteStoreTest, AmendmentIdMustBeFree) {
    Quote quote = create("Q-1");
    create("Q-1-rev2");

    Quote amendment("Q-1-rev2", "rep@acme.example", ts("2026-01-07T09:00:00Z"));
    amendment.incrementVersion();

    quote.incrementVersion();
    QuoteCommit commit{quote, flowFor(quote)};
    commit.expectedVersion = 1;
    commit.amendment = amendment;
    commit.amendmentFlowState = flowFor(amendment);

    EXPECT_THROW(store->commit(commit), VersionConflictException);
    EXPECT_EQ(store->findFlowState("Q-1")->version, 1);
}

TEST(InMemoryIdempotencyRepositoryTest, ReserveCompleteRelease) {
    InMemoryIdempotencyRepository repo;

    IdempotencyRecord record;
    record.key = "k-1";
    record.quoteId = "Q-1";
    record.state = IdempotencyState::RESERVED;

    EXPECT_TRUE(repo.reserve(record));
    EXPECT_FALSE(repo.reserve(record));

    // complete() действует только на COMMITTED
    repo.complete("k-1", ts("2026-01-05T10:00:00Z"));
    EXPECT_EQ(repo.find("k-1")->state, IdempotencyState::RESERVED);

    repo.release("k-1");
    EXPECT_FALSE(repo.find("k-1").has_value());

    record.state = IdempotencyState::COMMITTED;
    repo.save(record);
    repo.release("k-1");
    EXPECT_TRUE(repo.find("k-1").has_value());

    repo.complete("k-1", ts("2026-01-05T10:01:00Z"));
    auto completed = repo.find("k-1");
    EXPECT_EQ(completed->state, IdempotencyState::COMPLETED);
    EXPECT_EQ(completed->updatedAt, ts("2026-01-05T10:01:00Z"));
}

TEST(InMemoryAuditLogTest, QueryByCategoryAndLastEvent) {
    InMemoryAuditLog log;
    EXPECT_FALSE(log.lastEvent("Q-1").has_value());

    AuditEvent flow;
    flow.quoteId = "Q-1";
    flow.eventType = "flow.quote_created";
    flow.category = AuditCategory::FLOW;
    flow.occurredAt = ts("2026-01-05T09:00:00Z");
    log.append(flow);

    AuditEvent pricing = flow;
    pricing.eventType = "pricing.snapshot_created";
    pricing.category = AuditCategory::PRICING;
    auto sealed = log.append(pricing);

    EXPECT_EQ(sealed.id, "Q-1-A2");
    EXPECT_EQ(log.query("Q-1", AuditCategory::PRICING).size(), 1u);
    EXPECT_EQ(log.lastEvent("Q-1")->hash, sealed.hash);
    EXPECT_TRUE(log.eventsForQuote("Q-2").empty());
}
