/**
 * @file QuoteServiceTest.cpp
 * @brief Lifecycle orchestration tests over the in-memory adapters
 */

#include <gtest/gtest.h>
#include "application/QuoteService.hpp"
#include "application/EventCodec.hpp"
#include "adapters/secondary/persistence/InMemoryQuoteStore.hpp"
#include "adapters/secondary/persistence/InMemoryAuditLog.hpp"
#include "adapters/secondary/persistence/InMemoryIdempotencyRepository.hpp"
#include "fixtures/CatalogFixture.hpp"
#include "mocks/MockEventPublisher.hpp"

using namespace cpq::application;
using namespace cpq::domain;
using namespace cpq::tests;
using namespace cpq::adapters::secondary;
using nlohmann::json;

class QuoteServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        auditLog = std::make_shared<InMemoryAuditLog>();
        idempotency = std::make_shared<InMemoryIdempotencyRepository>();
        store = std::make_shared<InMemoryQuoteStore>(auditLog, idempotency);
        publisher = std::make_shared<MockEventPublisher>();
        service = std::make_unique<QuoteService>(store, auditLog, idempotency, publisher,
                                                 fixture.catalog, fixture.policies, CatalogFixture::settings());
    }

    FlowEvent event(const std::string& type, const std::string& eventId, json payload = json::object(),
                    const std::string& at = "2026-01-05T10:00:00Z") {
        return EventCodec::decode(json{
            {"schema_version", 1},
            {"type", type},
            {"event_id", eventId},
            {"source", "slack"},
            {"actor", "rep@acme.example"},
            {"occurred_at", at},
            {"payload", payload}
        });
    }

    /// Поля enterprise-сделки и строки Pro 150, SSO 150, Support 1
    json scenarioDraft(const std::optional<std::string>& discountPct) {
        json payload = {
            {"fields", CatalogFixture::enterpriseFields()},
            {"add_lines", json::array({
                {{"product_id", "pro_plan"}, {"quantity", 150}},
                {{"product_id", "sso_addon"}, {"quantity", 150}},
                {{"product_id", "premium_support"}, {"quantity", 1}}
            })}
        };
        if (discountPct) payload["requested_discount_pct"] = *discountPct;
        return payload;
    }

    /// Котировка в PRICED (версия 4)
    void priceScenario(const std::string& quoteId, const std::optional<std::string>& discountPct) {
        ASSERT_TRUE(service->createQuote(quoteId, "rep@acme.example", ts("2026-01-05T09:00:00Z")).ok());
        ASSERT_TRUE(service->apply(quoteId, 1, event("DraftUpdated", quoteId + "-e1",
                                                     scenarioDraft(discountPct))).ok());
        ASSERT_TRUE(service->apply(quoteId, 2, event("RequiredFieldsCollected", quoteId + "-e2")).ok());
        ASSERT_TRUE(service->apply(quoteId, 3, event("PricingRequested", quoteId + "-e3")).ok());
    }

    json decision(const std::string& requestId, const std::string& verdict, const std::string& role) {
        return {
            {"request_id", requestId},
            {"decision", verdict},
            {"approver_id", "manager@acme.example"},
            {"approver_role", role}
        };
    }

    struct LifecycleOutcome {
        std::vector<std::string> snapshots;
        std::vector<std::string> traces;
        std::string flowState;
        std::vector<std::string> auditHashes;
        std::vector<std::string> published;
    };

    /// Полный цикл со скидкой сверх лимита на отдельных адаптерах
    LifecycleOutcome runApprovalLifecycle() {
        CatalogFixture catalog;
        auto log = std::make_shared<InMemoryAuditLog>();
        auto keys = std::make_shared<InMemoryIdempotencyRepository>();
        auto quotes = std::make_shared<InMemoryQuoteStore>(log, keys);
        auto events = std::make_shared<MockEventPublisher>();
        QuoteService engine(quotes, log, keys, events, catalog.catalog, catalog.policies,
                            CatalogFixture::settings());

        engine.createQuote("Q-1", "rep@acme.example", ts("2026-01-05T09:00:00Z"));
        engine.apply("Q-1", 1, event("DraftUpdated", "Q-1-e1", scenarioDraft(std::string("15"))));
        engine.apply("Q-1", 2, event("RequiredFieldsCollected", "Q-1-e2"));
        engine.apply("Q-1", 3, event("PricingRequested", "Q-1-e3"));
        engine.apply("Q-1", 4, event("FinalizeRequested", "Q-1-e4"));
        engine.apply("Q-1", 5, event("ApprovalDecided", "Q-1-e5",
                                     decision("Q-1-C5-R1", "approve", "sales_manager")));
        engine.apply("Q-1", 6, event("FinalizeRequested", "Q-1-e6"));
        engine.apply("Q-1", 7, event("QuoteDelivered", "Q-1-e7"));

        LifecycleOutcome outcome;
        for (const auto& snapshot : engine.getSnapshots("Q-1")) {
            outcome.snapshots.push_back(snapshot.toJson().dump());
            outcome.traces.push_back(snapshot.traceJson + "/" + snapshot.traceDigest);
        }
        outcome.flowState = engine.getFlowState("Q-1")->toJson().dump();
        for (const auto& audit : engine.getAuditTrail("Q-1")) {
            outcome.auditHashes.push_back(audit.hash);
        }
        for (const auto& message : events->getPublishedMessages()) {
            outcome.published.push_back(message.routingKey + " " + message.message);
        }
        return outcome;
    }

    CatalogFixture fixture;
    std::shared_ptr<InMemoryAuditLog> auditLog;
    std::shared_ptr<InMemoryIdempotencyRepository> idempotency;
    std::shared_ptr<InMemoryQuoteStore> store;
    std::shared_ptr<MockEventPublisher> publisher;
    std::unique_ptr<QuoteService> service;
};

TEST_F(QuoteServiceTest, CreateQuoteStartsDraftAtVersionOne) {
    auto result = service->createQuote("Q-1", "rep@acme.example", ts("2026-01-05T09:00:00Z"));

    EXPECT_EQ(result.status, ApplyStatus::APPLIED);
    EXPECT_EQ(result.toState, std::optional<QuoteStatus>(QuoteStatus::DRAFT));
    EXPECT_EQ(result.version, 1);
    EXPECT_EQ(result.missingFields.size(), 6u);

    auto flow = service->getFlowState("Q-1");
    ASSERT_TRUE(flow.has_value());
    EXPECT_EQ(flow->state, QuoteStatus::DRAFT);
    EXPECT_EQ(flow->version, 1);

    auto trail = service->getAuditTrail("Q-1");
    ASSERT_EQ(trail.size(), 1u);
    EXPECT_EQ(trail[0].eventType, "flow.quote_created");
    EXPECT_EQ(trail[0].id, "Q-1-A1");
}

TEST_F(QuoteServiceTest, CreateExistingQuoteIsVersionConflict) {
    service->createQuote("Q-1", "rep@acme.example", ts("2026-01-05T09:00:00Z"));
    auto result = service->createQuote("Q-1", "other@acme.example", ts("2026-01-05T09:05:00Z"));

    EXPECT_EQ(result.status, ApplyStatus::VERSION_CONFLICT);
    EXPECT_EQ(result.actualVersion, std::optional<int64_t>(1));
    EXPECT_EQ(service->getQuote("Q-1")->createdBy(), "rep@acme.example");
}

TEST_F(QuoteServiceTest, AutoApprovedQuoteFinalizesAndIsDelivered) {
    priceScenario("Q-1", std::nullopt);

    auto priced = service->getQuote("Q-1");
    ASSERT_TRUE(priced.has_value());
    EXPECT_EQ(priced->status(), QuoteStatus::PRICED);
    EXPECT_EQ(priced->version(), 4);
    EXPECT_EQ(priced->latestSnapshotId(), std::optional<std::string>("Q-1-S4"));

    auto finalized = service->apply("Q-1", 4, event("FinalizeRequested", "Q-1-e4"));
    EXPECT_EQ(finalized.status, ApplyStatus::APPLIED);
    EXPECT_EQ(finalized.fromState, std::optional<QuoteStatus>(QuoteStatus::PRICED));
    EXPECT_EQ(finalized.toState, std::optional<QuoteStatus>(QuoteStatus::FINALIZED));
    EXPECT_EQ(finalized.version, 5);

    ASSERT_EQ(publisher->publishCallCount(), 1);
    const auto& published = publisher->getPublishedMessages()[0];
    EXPECT_EQ(published.routingKey, "quote.published");
    auto message = json::parse(published.message);
    EXPECT_EQ(message.at("snapshot_id"), "Q-1-S4");
    EXPECT_EQ(message.at("total"), "20400");

    auto sent = service->apply("Q-1", 5, event("QuoteDelivered", "Q-1-e5"));
    EXPECT_EQ(sent.toState, std::optional<QuoteStatus>(QuoteStatus::SENT));
    EXPECT_EQ(sent.version, 6);
    ASSERT_EQ(publisher->publishCallCount(), 2);
    EXPECT_EQ(publisher->getPublishedMessages()[1].routingKey, "quote.sent");

    auto snapshots = service->getSnapshots("Q-1");
    ASSERT_EQ(snapshots.size(), 1u);
    EXPECT_EQ(snapshots[0].total, dec("20400"));

    EXPECT_TRUE(service->verifyAuditTrail("Q-1").valid);
}

TEST_F(QuoteServiceTest, DiscountOverCapGoesThroughApproval) {
    priceScenario("Q-1", std::string("15"));

    auto snapshots = service->getSnapshots("Q-1");
    ASSERT_EQ(snapshots.size(), 1u);
    EXPECT_EQ(snapshots[0].discountTotal, dec("2040"));
    EXPECT_EQ(snapshots[0].total, dec("18360"));

    auto approval = service->apply("Q-1", 4, event("FinalizeRequested", "Q-1-e4"));
    EXPECT_EQ(approval.toState, std::optional<QuoteStatus>(QuoteStatus::APPROVAL));
    ASSERT_EQ(approval.approvalRequestIds.size(), 1u);
    EXPECT_EQ(approval.approvalRequestIds[0], "Q-1-C5-R1");

    ASSERT_EQ(publisher->publishCallCount(), 1);
    EXPECT_EQ(publisher->getPublishedMessages()[0].routingKey, "approval.requested");
    auto notice = json::parse(publisher->getPublishedMessages()[0].message);
    EXPECT_EQ(notice.at("approver_role"), "sales_manager");
    EXPECT_EQ(notice.at("expires_at"), "2026-01-08T10:00:00Z");

    auto approved = service->apply("Q-1", 5, event("ApprovalDecided", "Q-1-e5",
                                                   decision("Q-1-C5-R1", "approve", "sales_manager")));
    EXPECT_EQ(approved.toState, std::optional<QuoteStatus>(QuoteStatus::APPROVED));
    EXPECT_EQ(approved.version, 6);

    auto finalized = service->apply("Q-1", 6, event("FinalizeRequested", "Q-1-e6"));
    EXPECT_EQ(finalized.toState, std::optional<QuoteStatus>(QuoteStatus::FINALIZED));
    EXPECT_EQ(finalized.snapshotId, std::optional<std::string>("Q-1-S7"));

    snapshots = service->getSnapshots("Q-1");
    ASSERT_EQ(snapshots.size(), 2u);
    EXPECT_EQ(snapshots[1].discountTotal, dec("3060"));
    EXPECT_EQ(snapshots[1].total, dec("17340"));
    EXPECT_EQ(snapshots[1].authorizedByApprovals, std::vector<std::string>{"Q-1-C5-R1"});

    auto chain = service->getApprovalChain("Q-1");
    ASSERT_TRUE(chain.has_value());
    EXPECT_EQ(chain->id(), "Q-1-C5");
    EXPECT_EQ(chain->approvedRequestIds(), std::vector<std::string>{"Q-1-C5-R1"});
}

TEST_F(QuoteServiceTest, RejectedApprovalEndsInRejected) {
    priceScenario("Q-1", std::string("15"));
    service->apply("Q-1", 4, event("FinalizeRequested", "Q-1-e4"));

    auto rejected = service->apply("Q-1", 5, event("ApprovalDecided", "Q-1-e5",
                                                   decision("Q-1-C5-R1", "reject", "sales_manager")));
    EXPECT_EQ(rejected.toState, std::optional<QuoteStatus>(QuoteStatus::REJECTED));
    EXPECT_EQ(service->getQuote("Q-1")->status(), QuoteStatus::REJECTED);
}

TEST_F(QuoteServiceTest, UnauthorizedApproverIsRejected) {
    priceScenario("Q-1", std::string("15"));
    service->apply("Q-1", 4, event("FinalizeRequested", "Q-1-e4"));

    auto result = service->apply("Q-1", 5, event("ApprovalDecided", "Q-1-e5",
                                                 decision("Q-1-C5-R1", "approve", "intern")));
    EXPECT_EQ(result.status, ApplyStatus::TRANSITION_ILLEGAL);
    EXPECT_EQ(result.transitionError, std::optional<TransitionErrorCode>(TransitionErrorCode::APPROVER_NOT_AUTHORIZED));
    EXPECT_EQ(service->getFlowState("Q-1")->version, 5);
}

TEST_F(QuoteServiceTest, ReplayReturnsStoredResult) {
    service->createQuote("Q-1", "rep@acme.example", ts("2026-01-05T09:00:00Z"));
    auto draft = event("DraftUpdated", "Q-1-e1", scenarioDraft(std::nullopt));

    auto first = service->apply("Q-1", 1, draft);
    ASSERT_TRUE(first.ok());
    EXPECT_FALSE(first.replayed);
    const size_t auditSize = service->getAuditTrail("Q-1").size();

    auto second = service->apply("Q-1", 1, draft);
    EXPECT_EQ(second.status, ApplyStatus::APPLIED);
    EXPECT_TRUE(second.replayed);
    EXPECT_EQ(second.version, 2);
    EXPECT_EQ(second.idempotencyKey, first.idempotencyKey);

    EXPECT_EQ(service->getQuote("Q-1")->version(), 2);
    EXPECT_EQ(service->getQuote("Q-1")->lines().size(), 3u);
    EXPECT_EQ(service->getAuditTrail("Q-1").size(), auditSize);
}

TEST_F(QuoteServiceTest, StaleVersionIsConflict) {
    service->createQuote("Q-1", "rep@acme.example", ts("2026-01-05T09:00:00Z"));

    auto result = service->apply("Q-1", 5, event("DraftUpdated", "Q-1-e1", scenarioDraft(std::nullopt)));

    EXPECT_EQ(result.status, ApplyStatus::VERSION_CONFLICT);
    EXPECT_EQ(result.expectedVersion, std::optional<int64_t>(5));
    EXPECT_EQ(result.actualVersion, std::optional<int64_t>(1));
    EXPECT_FALSE(idempotency->find(result.idempotencyKey).has_value());

    // Ключ освобождён: то же событие проходит с верной версией
    auto retry = service->apply("Q-1", 1, event("DraftUpdated", "Q-1-e1", scenarioDraft(std::nullopt)));
    EXPECT_EQ(retry.status, ApplyStatus::APPLIED);
    EXPECT_FALSE(retry.replayed);
}

TEST_F(QuoteServiceTest, MissingFieldsBlockValidation) {
    service->createQuote("Q-1", "rep@acme.example", ts("2026-01-05T09:00:00Z"));
    service->apply("Q-1", 1, event("DraftUpdated", "Q-1-e1", {
        {"fields", {{"account_id", "ACME-001"}}},
        {"add_lines", json::array({{{"product_id", "pro_plan"}, {"quantity", 10}}})}
    }));

    auto result = service->apply("Q-1", 2, event("RequiredFieldsCollected", "Q-1-e2"));

    EXPECT_EQ(result.status, ApplyStatus::TRANSITION_ILLEGAL);
    EXPECT_EQ(result.transitionError,
              std::optional<TransitionErrorCode>(TransitionErrorCode::MISSING_REQUIRED_FIELDS));
    EXPECT_EQ(result.missingFields,
              (std::vector<std::string>{"currency", "segment", "region", "term_months", "start_date"}));
    EXPECT_EQ(service->getQuote("Q-1")->status(), QuoteStatus::DRAFT);

    auto trail = service->getAuditTrail("Q-1");
    EXPECT_EQ(trail.back().eventType, "flow.rejected");
    EXPECT_EQ(trail.back().outcome, AuditOutcome::REJECTED);
}

TEST_F(QuoteServiceTest, UnknownQuoteIsNotFound) {
    auto result = service->apply("Q-404", 1, event("CancelRequested", "Q-404-e1"));
    EXPECT_EQ(result.status, ApplyStatus::NOT_FOUND);
    EXPECT_FALSE(idempotency->find(result.idempotencyKey).has_value());
}

TEST_F(QuoteServiceTest, DraftChangeAfterPricingInvalidatesSnapshot) {
    priceScenario("Q-1", std::nullopt);

    auto result = service->apply("Q-1", 4, event("DraftUpdated", "Q-1-e4", {{"fields", {{"region", "CA"}}}}));

    EXPECT_EQ(result.toState, std::optional<QuoteStatus>(QuoteStatus::DRAFT));
    auto quote = service->getQuote("Q-1");
    EXPECT_EQ(quote->status(), QuoteStatus::DRAFT);
    EXPECT_FALSE(quote->latestSnapshotId().has_value());
    EXPECT_FALSE(service->getFlowState("Q-1")->policyDecision.has_value());
    EXPECT_EQ(service->getSnapshots("Q-1").size(), 1u);
}

TEST_F(QuoteServiceTest, ReviseCreatesAmendmentDraft) {
    priceScenario("Q-1", std::nullopt);
    service->apply("Q-1", 4, event("FinalizeRequested", "Q-1-e4"));

    auto result = service->apply("Q-1", 5, event("ReviseRequested", "Q-1-e5",
                                                 {{"amendment_quote_id", "Q-1-rev2"}, {"reason", "more seats"}}));

    EXPECT_EQ(result.toState, std::optional<QuoteStatus>(QuoteStatus::REVISED));
    EXPECT_EQ(result.amendmentQuoteId, std::optional<std::string>("Q-1-rev2"));

    auto amendment = service->getQuote("Q-1-rev2");
    ASSERT_TRUE(amendment.has_value());
    EXPECT_EQ(amendment->status(), QuoteStatus::DRAFT);
    EXPECT_EQ(amendment->version(), 1);
    EXPECT_EQ(amendment->parentQuoteId(), std::optional<std::string>("Q-1"));
    ASSERT_EQ(amendment->lines().size(), 3u);
    EXPECT_EQ(amendment->lines()[0].id, "Q-1-rev2-L1");
    EXPECT_EQ(service->getFlowState("Q-1-rev2")->metadata.at("parent_quote_id"), "Q-1");

    EXPECT_TRUE(service->verifyAuditTrail("Q-1-rev2").valid);

    auto again = service->apply("Q-1", 6, event("CancelRequested", "Q-1-e6"));
    EXPECT_EQ(again.transitionError, std::optional<TransitionErrorCode>(TransitionErrorCode::TERMINAL_STATE));
}

TEST_F(QuoteServiceTest, PublishFailureIsRedispatchedOnReplay) {
    priceScenario("Q-1", std::nullopt);
    publisher->failNext(1);

    auto finalize = event("FinalizeRequested", "Q-1-e4");
    auto first = service->apply("Q-1", 4, finalize);

    EXPECT_EQ(first.status, ApplyStatus::APPLIED);
    EXPECT_EQ(publisher->publishCallCount(), 0);
    auto record = idempotency->find(first.idempotencyKey);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->state, IdempotencyState::COMMITTED);
    EXPECT_EQ(record->outbox.size(), 1u);

    auto replay = service->apply("Q-1", 4, finalize);
    EXPECT_TRUE(replay.replayed);
    EXPECT_EQ(replay.toState, std::optional<QuoteStatus>(QuoteStatus::FINALIZED));
    ASSERT_EQ(publisher->publishCallCount(), 1);
    EXPECT_EQ(publisher->getPublishedMessages()[0].routingKey, "quote.published");
    EXPECT_EQ(idempotency->find(first.idempotencyKey)->state, IdempotencyState::COMPLETED);

    service->apply("Q-1", 4, finalize);
    EXPECT_EQ(publisher->publishCallCount(), 1);
}

TEST_F(QuoteServiceTest, PreviewDoesNotPersist) {
    service->createQuote("Q-1", "rep@acme.example", ts("2026-01-05T09:00:00Z"));
    service->apply("Q-1", 1, event("DraftUpdated", "Q-1-e1", scenarioDraft(std::nullopt)));

    auto first = service->previewPricing("Q-1", ts("2026-01-06T00:00:00Z"));
    auto second = service->previewPricing("Q-1", ts("2026-01-06T00:00:00Z"));

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->id, "Q-1-preview");
    EXPECT_EQ(first->total, dec("20400"));
    EXPECT_EQ(first->traceDigest, second->traceDigest);

    EXPECT_TRUE(service->getSnapshots("Q-1").empty());
    EXPECT_EQ(service->getQuote("Q-1")->version(), 2);
    EXPECT_FALSE(service->previewPricing("Q-404", ts("2026-01-06T00:00:00Z")).has_value());
}

TEST_F(QuoteServiceTest, AuditTrailDetectsTampering) {
    priceScenario("Q-1", std::nullopt);

    auto verification = service->verifyAuditTrail("Q-1");
    EXPECT_TRUE(verification.valid);
    EXPECT_GT(verification.eventCount, 4u);

    auto trail = service->getAuditTrail("Q-1");
    trail[1].payload["fields"]["region"] = "EU";
    auto tampered = AuditChain::verify(trail);
    EXPECT_FALSE(tampered.valid);
    EXPECT_EQ(tampered.brokenAtSequence, std::optional<int64_t>(2));
}

TEST_F(QuoteServiceTest, SameEventIdOnTwoQuotesAppliesToEach) {
    service->createQuote("Q-1", "rep@acme.example", ts("2026-01-05T09:00:00Z"));
    service->createQuote("Q-2", "rep@acme.example", ts("2026-01-05T09:00:00Z"));

    auto first = service->apply("Q-1", 1, event("CancelRequested", "evt-1"));
    auto second = service->apply("Q-2", 1, event("CancelRequested", "evt-1"));

    EXPECT_EQ(first.status, ApplyStatus::APPLIED);
    EXPECT_EQ(second.status, ApplyStatus::APPLIED);
    EXPECT_FALSE(second.replayed);
    EXPECT_EQ(second.quoteId, "Q-2");
    EXPECT_NE(first.idempotencyKey, second.idempotencyKey);

    auto flow = service->getFlowState("Q-2");
    EXPECT_EQ(flow->state, QuoteStatus::CANCELLED);
    EXPECT_EQ(flow->version, 2);
}

TEST_F(QuoteServiceTest, OutOfRangeDiscountIsInvalidEvent) {
    service->createQuote("Q-1", "rep@acme.example", ts("2026-01-05T09:00:00Z"));

    // Событие собрано в обход кодека
    auto draft = event("DraftUpdated", "Q-1-e1");
    draft.draftChanges->requestedDiscountPct = dec("150");

    auto result = service->apply("Q-1", 1, draft);

    EXPECT_EQ(result.status, ApplyStatus::INVALID_EVENT);
    EXPECT_EQ(result.offendingId, "payload.requested_discount_pct");
    EXPECT_EQ(service->getFlowState("Q-1")->version, 1);
    EXPECT_FALSE(service->getQuote("Q-1")->requestedDiscountPct().has_value());
    EXPECT_FALSE(idempotency->find(result.idempotencyKey).has_value());

    auto trail = service->getAuditTrail("Q-1");
    EXPECT_EQ(trail.back().eventType, "ingress.rejected");
    EXPECT_EQ(trail.back().outcome, AuditOutcome::REJECTED);
}

TEST_F(QuoteServiceTest, UnknownLineIdIsInvalidEvent) {
    service->createQuote("Q-1", "rep@acme.example", ts("2026-01-05T09:00:00Z"));
    ASSERT_TRUE(service->apply("Q-1", 1, event("DraftUpdated", "Q-1-e1", scenarioDraft(std::nullopt))).ok());

    auto removed = service->apply("Q-1", 2, event("DraftUpdated", "Q-1-e2",
                                                  {{"remove_line_ids", json::array({"nope"})}}));
    EXPECT_EQ(removed.status, ApplyStatus::INVALID_EVENT);
    EXPECT_EQ(removed.offendingId, "payload.remove_line_ids[0]");

    auto updated = service->apply("Q-1", 2, event("DraftUpdated", "Q-1-e3", {
        {"update_lines", json::array({{{"line_id", "Q-1-L9"}, {"quantity", 5}}})}
    }));
    EXPECT_EQ(updated.status, ApplyStatus::INVALID_EVENT);
    EXPECT_EQ(updated.offendingId, "payload.update_lines[0].line_id");

    // Строка удаляется раньше, чем изменяется
    auto removedThenUpdated = service->apply("Q-1", 2, event("DraftUpdated", "Q-1-e4", {
        {"remove_line_ids", json::array({"Q-1-L1"})},
        {"update_lines", json::array({{{"line_id", "Q-1-L1"}, {"quantity", 5}}})}
    }));
    EXPECT_EQ(removedThenUpdated.status, ApplyStatus::INVALID_EVENT);
    EXPECT_EQ(removedThenUpdated.offendingId, "payload.update_lines[0].line_id");

    auto negative = event("DraftUpdated", "Q-1-e5", {
        {"update_lines", json::array({{{"line_id", "Q-1-L1"}, {"quantity", 5}}})}
    });
    negative.draftChanges->updateLines[0].discountAmount = dec("-1");
    auto amount = service->apply("Q-1", 2, negative);
    EXPECT_EQ(amount.status, ApplyStatus::INVALID_EVENT);
    EXPECT_EQ(amount.offendingId, "payload.update_lines[0].discount_amount");

    EXPECT_EQ(service->getFlowState("Q-1")->version, 2);
    EXPECT_EQ(service->getQuote("Q-1")->lines().size(), 3u);
    EXPECT_EQ(service->getQuote("Q-1")->lines()[0].quantity, 150);
}

TEST_F(QuoteServiceTest, ReplayingLifecycleOnFreshStoresIsIdentical) {
    auto first = runApprovalLifecycle();
    auto second = runApprovalLifecycle();

    ASSERT_EQ(first.snapshots.size(), 2u);
    EXPECT_EQ(json::parse(first.flowState).at("state"), "sent");
    EXPECT_EQ(first.published.size(), 3u);

    EXPECT_EQ(first.snapshots, second.snapshots);
    EXPECT_EQ(first.traces, second.traces);
    EXPECT_EQ(first.flowState, second.flowState);
    EXPECT_EQ(first.auditHashes, second.auditHashes);
    EXPECT_EQ(first.published, second.published);
}
