/**
 * @file QuoteTest.cpp
 * @brief Unit tests for the Quote aggregate
 */

#include <gtest/gtest.h>
#include "domain/Quote.hpp"
#include "domain/QuotePricingSnapshot.hpp"
#include "domain/Errors.hpp"
#include "fixtures/CatalogFixture.hpp"

using namespace cpq::domain;
using cpq::tests::CatalogFixture;
using cpq::tests::dec;
using cpq::tests::ts;

namespace {

const std::vector<std::string> kRequired = {"account_id", "currency", "segment", "region", "term_months", "start_date"};

QuotePricingSnapshot snapshotFor(const Quote& quote) {
    QuotePricingSnapshot snapshot;
    snapshot.id = quote.id() + "-S2";
    snapshot.quoteId = quote.id();
    for (const auto& line : quote.lines()) {
        LinePricing lp;
        lp.lineId = line.id;
        lp.unitPrice = dec("1.00");
        lp.subtotal = Decimal::fromInt(line.quantity);
        snapshot.lines.push_back(lp);
    }
    return snapshot;
}

} // namespace

TEST(QuoteTest, NewQuoteIsEmptyDraft) {
    Quote quote("Q-1", "rep", ts("2026-01-05T09:00:00Z"));
    EXPECT_EQ(quote.status(), QuoteStatus::DRAFT);
    EXPECT_EQ(quote.version(), 0);
    EXPECT_TRUE(quote.lines().empty());
    EXPECT_EQ(quote.missingFields(kRequired), kRequired);
}

TEST(QuoteTest, DraftChangesFillFieldsAndLines) {
    auto quote = CatalogFixture::scenarioQuote("Q-1");

    EXPECT_TRUE(quote.missingFields(kRequired).empty());
    EXPECT_EQ(quote.segment(), "enterprise");
    ASSERT_TRUE(quote.termMonths().has_value());
    EXPECT_EQ(*quote.termMonths(), 12);
    ASSERT_EQ(quote.lines().size(), 3u);
    EXPECT_EQ(quote.lines()[0].id, "Q-1-L1");
    EXPECT_EQ(quote.lines()[2].id, "Q-1-L3");
    EXPECT_EQ(quote.lines()[2].sortOrder, 3);
}

TEST(QuoteTest, UnknownFieldsKeptAsFreeForm) {
    Quote quote("Q-1", "rep", ts("2026-01-05T09:00:00Z"));
    quote.setField("opportunity_id", "OPP-7");
    EXPECT_EQ(quote.fieldValue("opportunity_id"), std::optional<std::string>("OPP-7"));
    EXPECT_EQ(quote.fields().count("opportunity_id"), 1u);
}

TEST(QuoteTest, FieldValuesAreChecked) {
    Quote quote("Q-1", "rep", ts("2026-01-05T09:00:00Z"));
    EXPECT_THROW(quote.setField("term_months", "twelve"), std::invalid_argument);
    EXPECT_THROW(quote.setField("term_months", "0"), std::invalid_argument);
    EXPECT_THROW(quote.setField("currency", "usd"), std::invalid_argument);
    EXPECT_THROW(quote.setField("start_date", "01/02/2026"), std::invalid_argument);
    EXPECT_THROW(quote.setField("region", ""), std::invalid_argument);
}

TEST(QuoteTest, LineInvariants) {
    Quote quote("Q-1", "rep", ts("2026-01-05T09:00:00Z"));
    EXPECT_THROW(quote.addLine({"pro_plan", 0, {}, std::nullopt, std::nullopt, std::nullopt}, 1),
                 InvariantViolationException);
    EXPECT_THROW(quote.addLine({"pro_plan", 1, {}, std::nullopt, dec("101"), std::nullopt}, 1),
                 InvariantViolationException);
    EXPECT_THROW(quote.setRequestedDiscount(dec("-1")), InvariantViolationException);
    EXPECT_THROW(quote.removeLine("Q-1-L9"), InvariantViolationException);
}

TEST(QuoteTest, LineNumbersNotReusedAfterRemoval) {
    Quote quote("Q-1", "rep", ts("2026-01-05T09:00:00Z"));
    auto first = quote.addLine({"pro_plan", 1, {}, std::nullopt, std::nullopt, std::nullopt}, 1);
    quote.removeLine(first);
    auto second = quote.addLine({"pro_plan", 1, {}, std::nullopt, std::nullopt, std::nullopt}, 1);
    EXPECT_EQ(second, "Q-1-L2");
}

TEST(QuoteTest, UpdateLineMergesAttributes) {
    Quote quote("Q-1", "rep", ts("2026-01-05T09:00:00Z"));
    auto id = quote.addLine({"pro_plan", 5, {{"deployment", "cloud"}, {"tier", "a"}},
                             std::nullopt, std::nullopt, std::nullopt}, 1);
    LineUpdate update;
    update.lineId = id;
    update.quantity = 7;
    update.attributes = {{"deployment", "on_prem"}};
    quote.updateLine(update);

    const auto* line = quote.findLine(id);
    ASSERT_NE(line, nullptr);
    EXPECT_EQ(line->quantity, 7);
    EXPECT_EQ(line->attributes.at("deployment"), "on_prem");
    EXPECT_EQ(line->attributes.at("tier"), "a");
}

TEST(QuoteTest, EditingOutsideDraftIsRejected) {
    auto quote = CatalogFixture::scenarioQuote("Q-1");
    quote.transition(QuoteStatus::DRAFT, QuoteStatus::VALIDATED, ts("2026-01-05T10:00:00Z"));
    EXPECT_THROW(quote.setField("region", "EU"), InvariantViolationException);
    EXPECT_THROW(quote.addLine({"sso_addon", 1, {}, std::nullopt, std::nullopt, std::nullopt}, 1),
                 InvariantViolationException);
}

TEST(QuoteTest, TransitionChecksCurrentStatus) {
    Quote quote("Q-1", "rep", ts("2026-01-05T09:00:00Z"));
    EXPECT_THROW(quote.transition(QuoteStatus::PRICED, QuoteStatus::FINALIZED, ts("2026-01-05T10:00:00Z")),
                 InvariantViolationException);
}

TEST(QuoteTest, ApplyPricingCopiesLinePrices) {
    auto quote = CatalogFixture::scenarioQuote("Q-1");
    quote.applyPricing(snapshotFor(quote));

    EXPECT_EQ(quote.latestSnapshotId(), std::optional<std::string>("Q-1-S2"));
    for (const auto& line : quote.lines()) {
        EXPECT_TRUE(line.isPriced());
    }

    quote.invalidatePricing();
    EXPECT_FALSE(quote.latestSnapshotId().has_value());
    EXPECT_FALSE(quote.lines()[0].isPriced());
}

TEST(QuoteTest, FrozenQuoteCannotBeRepriced) {
    auto quote = CatalogFixture::scenarioQuote("Q-1");
    auto snapshot = snapshotFor(quote);
    quote.transition(QuoteStatus::DRAFT, QuoteStatus::FINALIZED, ts("2026-01-05T10:00:00Z"));
    EXPECT_THROW(quote.applyPricing(snapshot), InvariantViolationException);
}

TEST(QuoteTest, AmendmentIsFreshDraftLinkedToParent) {
    auto quote = CatalogFixture::scenarioQuote("Q-1");
    quote.incrementVersion();
    quote.applyPricing(snapshotFor(quote));
    quote.transition(QuoteStatus::DRAFT, QuoteStatus::SENT, ts("2026-01-05T10:00:00Z"));

    auto amendment = quote.amend("Q-1-rev2", "manager", ts("2026-01-06T10:00:00Z"));
    EXPECT_EQ(amendment.id(), "Q-1-rev2");
    EXPECT_EQ(amendment.parentQuoteId(), std::optional<std::string>("Q-1"));
    EXPECT_EQ(amendment.status(), QuoteStatus::DRAFT);
    EXPECT_EQ(amendment.version(), 0);
    EXPECT_FALSE(amendment.latestSnapshotId().has_value());
    ASSERT_EQ(amendment.lines().size(), 3u);
    EXPECT_EQ(amendment.lines()[0].id, "Q-1-rev2-L1");
    EXPECT_FALSE(amendment.lines()[0].isPriced());
    EXPECT_EQ(amendment.segment(), "enterprise");
}

TEST(QuoteTest, TerminalQuoteCannotBeAmended) {
    auto quote = CatalogFixture::scenarioQuote("Q-1");
    quote.transition(QuoteStatus::DRAFT, QuoteStatus::CANCELLED, ts("2026-01-05T10:00:00Z"));
    EXPECT_THROW(quote.amend("Q-2", "rep", ts("2026-01-06T10:00:00Z")), InvariantViolationException);
}

TEST(QuoteTest, JsonRoundTripPreservesState) {
    auto quote = CatalogFixture::scenarioQuote("Q-1", dec("15"));
    quote.incrementVersion();

    auto restored = Quote::fromJson(quote.toJson());
    EXPECT_EQ(restored.toJson(), quote.toJson());
    EXPECT_EQ(restored.requestedDiscountPct(), std::optional<Decimal>(dec("15")));

    // Нумерация строк продолжается после восстановления
    auto id = restored.addLine({"pro_plan", 1, {}, std::nullopt, std::nullopt, std::nullopt}, 1);
    EXPECT_EQ(id, "Q-1-L4");
}
