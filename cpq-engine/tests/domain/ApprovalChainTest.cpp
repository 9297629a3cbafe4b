/**
 * @file ApprovalChainTest.cpp
 * @brief Unit tests for sequential approval chains
 */

#include <gtest/gtest.h>
#include "domain/ApprovalRequest.hpp"
#include "domain/Errors.hpp"

using namespace cpq::domain;

class ApprovalChainTest : public ::testing::Test {
protected:
    Timestamp at = Timestamp::fromString("2026-01-10T12:00:00Z");

    ApprovalChain twoSteps() {
        return ApprovalChain::start("Q-1-C5", "Q-1", "Q-1-S4",
            {{"sales_manager", 1, {"dp-enterprise-auto-10"}}, {"finance", 2, {"th-margin-floor"}}},
            "rep", at, 72);
    }
};

TEST_F(ApprovalChainTest, StartCreatesFirstPendingRequest) {
    auto chain = twoSteps();

    ASSERT_EQ(chain.requests().size(), 1u);
    const auto& first = chain.requests()[0];
    EXPECT_EQ(first.id, "Q-1-C5-R1");
    EXPECT_EQ(first.sequence, 1);
    EXPECT_EQ(first.approverRole, "sales_manager");
    EXPECT_EQ(first.snapshotId, "Q-1-S4");
    EXPECT_EQ(first.status, ApprovalStatus::PENDING);
    ASSERT_TRUE(first.expiresAt.has_value());
    EXPECT_EQ(*first.expiresAt, at.addHours(72));
    EXPECT_TRUE(chain.isOpen());
    EXPECT_TRUE(chain.hasNextStep());
}

TEST_F(ApprovalChainTest, EmptyStepsRejected) {
    EXPECT_THROW(ApprovalChain::start("Q-1-C5", "Q-1", "Q-1-S4", {}, "rep", at, 72),
                 InvariantViolationException);
}

TEST_F(ApprovalChainTest, StepsCompleteInOrder) {
    auto chain = twoSteps();
    chain.recordDecision("Q-1-C5-R1", true, "manager-7", "ok", at);
    EXPECT_FALSE(chain.isComplete());
    EXPECT_FALSE(chain.isOpen());

    const auto& second = chain.spawnNext("rep", at, 0);
    EXPECT_EQ(second.id, "Q-1-C5-R2");
    EXPECT_EQ(second.approverRole, "finance");
    EXPECT_FALSE(second.expiresAt.has_value());
    EXPECT_FALSE(chain.hasNextStep());

    chain.recordDecision("Q-1-C5-R2", true, "cfo", "", at);
    EXPECT_TRUE(chain.isComplete());
    EXPECT_EQ(chain.approvedRequestIds(), (std::vector<std::string>{"Q-1-C5-R1", "Q-1-C5-R2"}));
}

TEST_F(ApprovalChainTest, DecisionIsFinal) {
    auto chain = twoSteps();
    chain.recordDecision("Q-1-C5-R1", false, "manager-7", "too deep", at);
    EXPECT_TRUE(chain.isRejected());
    EXPECT_THROW(chain.recordDecision("Q-1-C5-R1", true, "manager-7", "", at),
                 InvariantViolationException);
}

TEST_F(ApprovalChainTest, UnknownRequestRejected) {
    auto chain = twoSteps();
    EXPECT_THROW(chain.recordDecision("Q-1-C5-R9", true, "manager-7", "", at),
                 InvariantViolationException);
}

TEST_F(ApprovalChainTest, NextStepWaitsForPendingDecision) {
    auto chain = twoSteps();
    EXPECT_THROW(chain.spawnNext("rep", at, 72), InvariantViolationException);
}

TEST_F(ApprovalChainTest, ExpirePendingMarksOpenRequests) {
    auto chain = twoSteps();
    auto expired = chain.expirePending(at.addHours(80));

    EXPECT_EQ(expired, std::vector<std::string>{"Q-1-C5-R1"});
    EXPECT_EQ(chain.requests()[0].status, ApprovalStatus::EXPIRED);
    EXPECT_FALSE(chain.isOpen());
    EXPECT_TRUE(chain.expirePending(at.addHours(90)).empty());
}

TEST_F(ApprovalChainTest, JsonRoundTrip) {
    auto chain = twoSteps();
    chain.recordDecision("Q-1-C5-R1", true, "manager-7", "ok", at);

    auto restored = ApprovalChain::fromJson(chain.toJson());
    EXPECT_EQ(restored.toJson(), chain.toJson());
    EXPECT_EQ(restored.nextStep()->role, "finance");
}
