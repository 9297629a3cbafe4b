/**
 * @file PolicyEvaluatorTest.cpp
 * @brief Unit tests for discount and approval policy evaluation
 */

#include <gtest/gtest.h>
#include "application/PolicyEvaluator.hpp"
#include "application/PricingPipeline.hpp"
#include "domain/Errors.hpp"
#include "fixtures/CatalogFixture.hpp"

using namespace cpq::application;
using namespace cpq::domain;
using cpq::tests::CatalogFixture;
using cpq::tests::dec;
using cpq::tests::ts;

class PolicyEvaluatorTest : public ::testing::Test {
protected:
    CatalogFixture fixture;
    PolicyEvaluator evaluator{fixture.policies};
    Timestamp at = ts("2026-01-10T00:00:00Z");

    QuotePricingSnapshot priced(const Quote& quote) {
        PricingPipeline pipeline(fixture.catalog, CatalogFixture::settings());
        PricingRequest request;
        request.snapshotId = quote.id() + "-S4";
        request.quoteVersion = 4;
        request.at = at;
        request.actor = "rep";
        request.discountCapPct = dec("10");
        return pipeline.price(quote, request);
    }

    PolicyDecision decide(const Quote& quote) {
        return evaluator.evaluate(quote, priced(quote), at);
    }
};

TEST_F(PolicyEvaluatorTest, DiscountWithinCapAutoApproves) {
    auto decision = decide(CatalogFixture::scenarioQuote("Q-1", dec("5")));

    EXPECT_TRUE(decision.autoApproved());
    EXPECT_TRUE(decision.violations.empty());
    EXPECT_EQ(decision.autoApprovedPolicies, std::vector<std::string>{"dp-enterprise-auto-10"});
    EXPECT_EQ(decision.discountCapPct, std::optional<Decimal>(dec("10")));
    EXPECT_EQ(decision.snapshotId, "Q-1-S4");
}

TEST_F(PolicyEvaluatorTest, DiscountAboveCapRequiresSalesManager) {
    auto decision = decide(CatalogFixture::scenarioQuote("Q-1", dec("15")));

    ASSERT_TRUE(decision.approvalRequired());
    ASSERT_EQ(decision.violations.size(), 1u);
    const auto& v = decision.violations[0];
    EXPECT_EQ(v.policyId, "dp-enterprise-auto-10");
    EXPECT_EQ(v.policyType, PolicyType::DISCOUNT_CAP);
    EXPECT_EQ(v.code, "discount_above_cap");
    EXPECT_EQ(v.thresholdValue, dec("10"));
    EXPECT_EQ(v.actualValue, dec("15"));
    EXPECT_EQ(v.requiredApproverRole, "sales_manager");
    EXPECT_EQ(v.approverLevel, 1);
    EXPECT_FALSE(v.blocking);

    auto roles = decision.requiredRoles();
    ASSERT_EQ(roles.size(), 1u);
    EXPECT_EQ(roles[0].first, "sales_manager");
}

TEST_F(PolicyEvaluatorTest, LowestCapWinsWithHighestApproverInDiscountFamily) {
    DiscountPolicy software;
    software.id = "dp-software-12";
    software.category = "software";
    software.maxAutoDiscountPct = dec("12");
    software.approverRole = "vp_sales";
    software.approverLevel = 2;
    fixture.policies->addDiscountPolicy(software);

    auto decision = decide(CatalogFixture::scenarioQuote("Q-1", dec("15")));

    ASSERT_EQ(decision.violations.size(), 1u);
    EXPECT_EQ(decision.violations[0].policyId, "dp-enterprise-auto-10");
    EXPECT_EQ(decision.violations[0].supersededPolicyIds, std::vector<std::string>{"dp-software-12"});
    EXPECT_EQ(decision.violations[0].thresholdValue, dec("10"));
    EXPECT_EQ(decision.violations[0].requiredApproverRole, "vp_sales");
    EXPECT_EQ(decision.violations[0].approverLevel, 2);
    EXPECT_EQ(decision.discountCapPct, std::optional<Decimal>(dec("10")));
}

TEST_F(PolicyEvaluatorTest, UntriggeredHigherCapDoesNotRaiseApprover) {
    DiscountPolicy software;
    software.id = "dp-software-20";
    software.category = "software";
    software.maxAutoDiscountPct = dec("20");
    software.approverRole = "vp_sales";
    software.approverLevel = 2;
    fixture.policies->addDiscountPolicy(software);

    auto decision = decide(CatalogFixture::scenarioQuote("Q-1", dec("15")));

    ASSERT_EQ(decision.violations.size(), 1u);
    EXPECT_EQ(decision.violations[0].policyId, "dp-enterprise-auto-10");
    EXPECT_EQ(decision.violations[0].requiredApproverRole, "sales_manager");
    EXPECT_EQ(decision.violations[0].approverLevel, 1);
}

TEST_F(PolicyEvaluatorTest, DealSizeAddsSecondRole) {
    fixture.addThreshold("th-deal-size-18k", PolicyType::DEAL_SIZE, R"({"min_total":"18000"})", "vp_sales", 2);

    auto decision = decide(CatalogFixture::scenarioQuote("Q-1", dec("1")));

    ASSERT_TRUE(decision.approvalRequired());
    ASSERT_EQ(decision.violations.size(), 1u);
    EXPECT_EQ(decision.violations[0].code, "deal_size_exceeded");
    EXPECT_EQ(decision.violations[0].actualValue, dec("20196"));

    auto both = decide(CatalogFixture::scenarioQuote("Q-2", dec("15")));
    auto roles = both.requiredRoles();
    ASSERT_EQ(roles.size(), 2u);
    EXPECT_EQ(roles[0], std::make_pair(std::string("sales_manager"), 1));
    EXPECT_EQ(roles[1], std::make_pair(std::string("vp_sales"), 2));
}

TEST_F(PolicyEvaluatorTest, DealBelowThresholdAutoApproves) {
    fixture.addThreshold("th-deal-size-100k", PolicyType::DEAL_SIZE, R"({"min_total":"100000"})", "vp_sales", 2);

    auto decision = decide(CatalogFixture::scenarioQuote("Q-1"));
    EXPECT_TRUE(decision.autoApproved());
    EXPECT_NE(std::find(decision.autoApprovedPolicies.begin(), decision.autoApprovedPolicies.end(),
                        "th-deal-size-100k"), decision.autoApprovedPolicies.end());
}

TEST_F(PolicyEvaluatorTest, MarginFloorUsesUnitCost) {
    // Себестоимость сценария 6900 при выручке 20400: маржа 66.18%
    fixture.addThreshold("th-margin-70", PolicyType::MARGIN_FLOOR, R"({"min_margin_pct":70})", "finance", 2);

    auto decision = decide(CatalogFixture::scenarioQuote("Q-1"));
    ASSERT_EQ(decision.violations.size(), 1u);
    EXPECT_EQ(decision.violations[0].code, "margin_below_floor");
    EXPECT_EQ(decision.violations[0].thresholdValue, dec("70"));
    EXPECT_EQ(decision.violations[0].actualValue, dec("66.18"));
    EXPECT_EQ(decision.violations[0].requiredApproverRole, "finance");
}

TEST_F(PolicyEvaluatorTest, MarginBelowBlockLimitBlocks) {
    fixture.addThreshold("th-margin-block", PolicyType::MARGIN_FLOOR,
                         R"({"min_margin_pct":"80","block_below_pct":"70"})", "finance", 2);

    auto decision = decide(CatalogFixture::scenarioQuote("Q-1"));
    EXPECT_TRUE(decision.blocked());
    ASSERT_EQ(decision.violations.size(), 1u);
    EXPECT_TRUE(decision.violations[0].blocking);
    EXPECT_TRUE(decision.violations[0].requiredApproverRole.empty());
    EXPECT_TRUE(decision.requiredRoles().empty());
}

TEST_F(PolicyEvaluatorTest, ProductThresholdNamesProduct) {
    fixture.addThreshold("th-support", PolicyType::PRODUCT, R"({"product_id":"premium_support"})", "vp_sales", 2);
    fixture.addThreshold("th-legacy", PolicyType::PRODUCT, R"({"product_id":"legacy_plan"})", "vp_sales", 2);

    auto decision = decide(CatalogFixture::scenarioQuote("Q-1"));
    ASSERT_EQ(decision.violations.size(), 1u);
    EXPECT_EQ(decision.violations[0].code, "product_requires_approval");
    EXPECT_EQ(decision.violations[0].productId, std::optional<std::string>("premium_support"));
    EXPECT_EQ(decision.notApplicablePolicies, std::vector<std::string>{"th-legacy"});
}

TEST_F(PolicyEvaluatorTest, ValidityWindowTooLong) {
    fixture.addThreshold("th-validity-60d", PolicyType::TEMPORAL, R"({"max_validity_days":60})", "sales_manager", 1);

    auto decision = decide(CatalogFixture::scenarioQuote("Q-1"));
    ASSERT_EQ(decision.violations.size(), 1u);
    EXPECT_EQ(decision.violations[0].code, "validity_too_long");
    EXPECT_EQ(decision.violations[0].actualValue, dec("80"));
}

TEST_F(PolicyEvaluatorTest, ExpiredQuoteIsBlocked) {
    auto quote = CatalogFixture::scenarioQuote("Q-1");
    auto snapshot = priced(quote);

    auto decision = evaluator.evaluate(quote, snapshot, ts("2026-04-02T00:00:00Z"));
    EXPECT_TRUE(decision.blocked());
    ASSERT_EQ(decision.violations.size(), 1u);
    EXPECT_EQ(decision.violations[0].policyId, "builtin:quote_expired");
}

TEST_F(PolicyEvaluatorTest, MalformedThresholdFailsClosed) {
    fixture.addThreshold("th-broken", PolicyType::DEAL_SIZE, R"({"min":"100"})", "vp_sales", 2);

    try {
        decide(CatalogFixture::scenarioQuote("Q-1"));
        FAIL() << "Expected PolicyDataMalformedException";
    } catch (const PolicyDataMalformedException& e) {
        EXPECT_EQ(e.policyId(), "th-broken");
    }
}

TEST_F(PolicyEvaluatorTest, UnparsableConditionFailsClosed) {
    fixture.addThreshold("th-garbage", PolicyType::TEMPORAL, "max_validity_days=90", "sales_manager", 1);
    EXPECT_THROW(decide(CatalogFixture::scenarioQuote("Q-1")), PolicyDataMalformedException);
}

TEST_F(PolicyEvaluatorTest, FloatingPointBoundsRejected) {
    fixture.addThreshold("th-float", PolicyType::DEAL_SIZE, R"({"min_total":1000.5})", "vp_sales", 2);
    EXPECT_THROW(decide(CatalogFixture::scenarioQuote("Q-1")), PolicyDataMalformedException);
}

TEST_F(PolicyEvaluatorTest, DiscountCapForSegment) {
    auto quote = CatalogFixture::scenarioQuote("Q-1");
    EXPECT_EQ(evaluator.discountCapFor(quote, {"software", "services"}), std::optional<Decimal>(dec("10")));

    Quote smb("Q-2", "rep", at);
    smb.setField("segment", "smb");
    EXPECT_FALSE(evaluator.discountCapFor(smb, {"software"}).has_value());
}
