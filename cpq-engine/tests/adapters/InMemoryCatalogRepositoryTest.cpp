/**
 * @file InMemoryCatalogRepositoryTest.cpp
 * @brief Unit tests for the in-memory catalog and policy repositories
 */

#include <gtest/gtest.h>
#include "adapters/secondary/catalog/InMemoryCatalogRepository.hpp"
#include "adapters/secondary/catalog/InMemoryPolicyRepository.hpp"
#include "fixtures/CatalogFixture.hpp"

using namespace cpq::adapters::secondary;
using namespace cpq::domain;
using namespace cpq::tests;

namespace {

PriceBook book(const std::string& id, const std::string& segment, int priority,
               const std::string& validFrom, const std::optional<std::string>& validTo = std::nullopt) {
    PriceBook b;
    b.id = id;
    b.name = id;
    b.segment = segment;
    b.currency = "USD";
    b.validFrom = ts(validFrom);
    if (validTo) b.validTo = ts(*validTo);
    b.priority = priority;
    return b;
}

ConstraintRule rule(const std::string& id, const std::string& source, int priority, int version = 1) {
    ConstraintRule r;
    r.id = id;
    r.version = version;
    r.type = ConstraintType::QUANTITY;
    r.sourceProductId = source;
    r.condition = R"({"min": 1})";
    r.priority = priority;
    return r;
}

} // namespace

TEST(InMemoryCatalogRepositoryTest, SelectsHighestPriorityMatchingBook) {
    InMemoryCatalogRepository repo;
    repo.addPriceBook(book("pb-global", "*", 0, "2025-01-01"));
    repo.addPriceBook(book("pb-enterprise", "enterprise", 10, "2026-01-01", std::string("2027-01-01")));

    auto selected = repo.selectPriceBook("enterprise", "US", "USD", ts("2026-06-01"));
    ASSERT_TRUE(selected.has_value());
    EXPECT_EQ(selected->id, "pb-enterprise");

    auto smb = repo.selectPriceBook("smb", "US", "USD", ts("2026-06-01"));
    ASSERT_TRUE(smb.has_value());
    EXPECT_EQ(smb->id, "pb-global");
}

TEST(InMemoryCatalogRepositoryTest, ValidityWindowIsHalfOpen) {
    InMemoryCatalogRepository repo;
    repo.addPriceBook(book("pb-2026", "*", 0, "2026-01-01", std::string("2027-01-01")));

    EXPECT_TRUE(repo.selectPriceBook("smb", "US", "USD", ts("2026-01-01")).has_value());
    EXPECT_FALSE(repo.selectPriceBook("smb", "US", "USD", ts("2025-12-31T23:59:59Z")).has_value());
    EXPECT_FALSE(repo.selectPriceBook("smb", "US", "USD", ts("2027-01-01")).has_value());
    EXPECT_FALSE(repo.selectPriceBook("smb", "US", "EUR", ts("2026-06-01")).has_value());
}

TEST(InMemoryCatalogRepositoryTest, EqualPriorityBreaksTieById) {
    InMemoryCatalogRepository repo;
    repo.addPriceBook(book("pb-b", "*", 5, "2026-01-01"));
    repo.addPriceBook(book("pb-a", "*", 5, "2026-01-01"));

    EXPECT_EQ(repo.selectPriceBook("smb", "US", "USD", ts("2026-06-01"))->id, "pb-a");
}

TEST(InMemoryCatalogRepositoryTest, InactiveBookIsNeverSelected) {
    InMemoryCatalogRepository repo;
    auto retired = book("pb-retired", "*", 100, "2026-01-01");
    retired.active = false;
    repo.addPriceBook(retired);

    EXPECT_FALSE(repo.selectPriceBook("smb", "US", "USD", ts("2026-06-01")).has_value());
}

TEST(InMemoryCatalogRepositoryTest, RejectsEntryWithBrokenTiers) {
    InMemoryCatalogRepository repo;
    PriceBookEntry entry;
    entry.priceBookId = "pb";
    entry.productId = "pro_plan";
    entry.listPrice = dec("8.00");
    entry.tiers = {{5, std::nullopt, dec("8.00")}};

    EXPECT_THROW(repo.addPriceBookEntry(entry), InvariantViolationException);
    EXPECT_FALSE(repo.getPriceBookEntry("pb", "pro_plan").has_value());
}

TEST(InMemoryCatalogRepositoryTest, RulesFilteredByScopeAndOrdered) {
    InMemoryCatalogRepository repo;
    repo.addConstraintRule(rule("late", "pro_plan", 50));
    repo.addConstraintRule(rule("wildcard", "*", 10));
    repo.addConstraintRule(rule("early", "pro_plan", 10));
    repo.addConstraintRule(rule("other", "sso_addon", 1));

    auto rules = repo.findConstraintRules({"pro_plan"});

    ASSERT_EQ(rules.size(), 3u);
    EXPECT_EQ(rules[0].id, "wildcard");
    EXPECT_EQ(rules[1].id, "early");
    EXPECT_EQ(rules[2].id, "late");
}

TEST(InMemoryCatalogRepositoryTest, NewerRuleVersionKeepsInsertionOrder) {
    InMemoryCatalogRepository repo;
    repo.addConstraintRule(rule("first", "pro_plan", 10));
    repo.addConstraintRule(rule("second", "pro_plan", 10));
    repo.addConstraintRule(rule("first", "pro_plan", 10, 2));

    auto rules = repo.findConstraintRules({"pro_plan"});

    ASSERT_EQ(rules.size(), 2u);
    EXPECT_EQ(rules[0].id, "first");
    EXPECT_EQ(rules[0].version, 2);
    EXPECT_EQ(repo.ruleCount(), 2u);

    EXPECT_THROW(repo.addConstraintRule(rule("first", "pro_plan", 10, 2)), InvariantViolationException);
}

TEST(InMemoryPolicyRepositoryTest, DiscountPoliciesMatchSegmentAndCategory) {
    CatalogFixture fixture;

    DiscountPolicy software;
    software.id = "dp-software-12";
    software.segment = "*";
    software.category = "software";
    software.maxAutoDiscountPct = dec("12");
    software.priority = 5;
    fixture.policies->addDiscountPolicy(software);

    auto forSoftware = fixture.policies->activeDiscountPolicies("enterprise", "software");
    ASSERT_EQ(forSoftware.size(), 2u);
    EXPECT_EQ(forSoftware[0].id, "dp-software-12");
    EXPECT_EQ(forSoftware[1].id, "dp-enterprise-auto-10");

    auto forServices = fixture.policies->activeDiscountPolicies("smb", "services");
    EXPECT_TRUE(forServices.empty());
}

TEST(InMemoryPolicyRepositoryTest, ApproverAuthorityLookup) {
    CatalogFixture fixture;

    auto manager = fixture.policies->findApproverAuthority("sales_manager");
    ASSERT_TRUE(manager.has_value());
    EXPECT_EQ(manager->rank, 1);
    EXPECT_EQ(manager->maxDiscountPct, std::optional<Decimal>(dec("20")));

    auto finance = fixture.policies->findApproverAuthority("finance");
    ASSERT_TRUE(finance.has_value());
    EXPECT_FALSE(finance->maxDiscountPct.has_value());

    EXPECT_FALSE(fixture.policies->findApproverAuthority("intern").has_value());
}
