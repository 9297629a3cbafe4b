/**
 * @file PriceBookTest.cpp
 * @brief Unit tests for price book matching and volume tier validation
 */

#include <gtest/gtest.h>
#include "domain/PriceBook.hpp"
#include "domain/Errors.hpp"

using namespace cpq::domain;

namespace {

PriceBookEntry entryWithTiers(std::vector<VolumeTier> tiers) {
    PriceBookEntry entry;
    entry.priceBookId = "pb";
    entry.productId = "pro_plan";
    entry.listPrice = Decimal::fromString("8.00");
    entry.tiers = std::move(tiers);
    return entry;
}

} // namespace

TEST(PriceBookTest, MatchesScopeAndWindow) {
    PriceBook book;
    book.id = "pb";
    book.segment = "enterprise";
    book.currency = "USD";
    book.validFrom = Timestamp::fromString("2026-01-01");
    book.validTo = Timestamp::fromString("2027-01-01");

    auto at = Timestamp::fromString("2026-06-01T00:00:00Z");
    EXPECT_TRUE(book.matches("enterprise", "US", "USD", at));
    EXPECT_TRUE(book.matches("enterprise", "EU", "USD", at));
    EXPECT_FALSE(book.matches("smb", "US", "USD", at));
    EXPECT_FALSE(book.matches("enterprise", "US", "EUR", at));
    EXPECT_FALSE(book.matches("enterprise", "US", "USD", Timestamp::fromString("2025-12-31T23:59:59Z")));
    // validTo исключительная
    EXPECT_FALSE(book.matches("enterprise", "US", "USD", Timestamp::fromString("2027-01-01")));

    book.active = false;
    EXPECT_FALSE(book.matches("enterprise", "US", "USD", at));
}

TEST(PriceBookTest, FindTierUsesHalfOpenRanges) {
    auto entry = entryWithTiers({{1, 100, Decimal::fromString("8.00")},
                                 {100, std::nullopt, Decimal::fromString("6.00")}});
    ASSERT_NE(entry.findTier(99), nullptr);
    EXPECT_EQ(entry.findTier(99)->unitPrice, Decimal::fromString("8.00"));
    ASSERT_NE(entry.findTier(100), nullptr);
    EXPECT_EQ(entry.findTier(100)->unitPrice, Decimal::fromString("6.00"));
    EXPECT_EQ(entry.findTier(100000)->unitPrice, Decimal::fromString("6.00"));
    EXPECT_EQ(entry.findTier(0), nullptr);
}

TEST(PriceBookTest, ValidTiersPass) {
    EXPECT_NO_THROW(validateTiers(entryWithTiers({})));
    EXPECT_NO_THROW(validateTiers(entryWithTiers({{1, 10, Decimal::fromString("8")},
                                                  {10, 100, Decimal::fromString("7")},
                                                  {100, std::nullopt, Decimal::fromString("6")}})));
}

TEST(PriceBookTest, TierGapRejected) {
    auto entry = entryWithTiers({{1, 10, Decimal::fromString("8")},
                                 {11, std::nullopt, Decimal::fromString("7")}});
    EXPECT_THROW(validateTiers(entry), InvariantViolationException);
}

TEST(PriceBookTest, TierOverlapRejected) {
    auto entry = entryWithTiers({{1, 10, Decimal::fromString("8")},
                                 {5, std::nullopt, Decimal::fromString("7")}});
    EXPECT_THROW(validateTiers(entry), InvariantViolationException);
}

TEST(PriceBookTest, FirstTierMustStartAtOne) {
    auto entry = entryWithTiers({{2, std::nullopt, Decimal::fromString("8")}});
    EXPECT_THROW(validateTiers(entry), InvariantViolationException);
}

TEST(PriceBookTest, LastTierMustBeOpen) {
    auto entry = entryWithTiers({{1, 10, Decimal::fromString("8")}});
    EXPECT_THROW(validateTiers(entry), InvariantViolationException);
}

TEST(PriceBookTest, PriceMustNotIncreaseWithQuantity) {
    auto entry = entryWithTiers({{1, 10, Decimal::fromString("6")},
                                 {10, std::nullopt, Decimal::fromString("8")}});
    EXPECT_THROW(validateTiers(entry), InvariantViolationException);
}
