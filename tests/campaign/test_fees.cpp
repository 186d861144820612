// CROWDFUND - Fee Tests
// Copyright (c) 2024 CROWDFUND Developers
// MIT License

#include "campaign_fixture.h"

namespace crowdfund {
namespace campaign {
namespace test {

class FeeTest : public CampaignTest {};

TEST_F(FeeTest, UpfrontFeeSplitsSettlement) {
    FundAndSettle(FeeConfig(100, 0));

    EXPECT_EQ(Wallet(recipient_), 297 * UNIT / 100);
    EXPECT_EQ(Wallet(collector_), 3 * UNIT / 100);
    EXPECT_EQ(campaign_.UpfrontFeePaid(), 3 * UNIT / 100);
    EXPECT_EQ(transport_.Holdings(), 0);

    // Shares still reflect the gross pool
    EXPECT_EQ(campaign_.DepositTotal(), 3 * UNIT);

    ASSERT_EQ(CountEvents(EventType::FeePaid), 1u);
    const CampaignEvent& fee = campaign_.GetEvents().back();
    EXPECT_EQ(fee.type, EventType::FeePaid);
    EXPECT_EQ(fee.account, collector_);
    EXPECT_EQ(fee.amount, 3 * UNIT / 100);
}

TEST_F(FeeTest, PayoutFeeSplitsYieldWithdrawal) {
    FundAndSettle(FeeConfig(0, 1000));
    ASSERT_TRUE(campaign_.DepositYield(sponsor_, 3 * UNIT));

    CampaignResult result = campaign_.Withdraw(alice_);
    ASSERT_TRUE(result) << result.ToString();
    EXPECT_EQ(result.amount, 9 * UNIT / 10);

    EXPECT_EQ(Wallet(alice_), WALLET - UNIT + 9 * UNIT / 10);
    EXPECT_EQ(Wallet(collector_), UNIT / 10);
    EXPECT_EQ(campaign_.WithdrawnOf(alice_), UNIT);
    EXPECT_EQ(campaign_.PayoutFeesTotal(), UNIT / 10);
    EXPECT_EQ(campaign_.YieldBalanceOf(alice_), 0);
    EXPECT_EQ(CountEvents(EventType::FeePaid), 1u);
}

TEST_F(FeeTest, PayoutFeeRoundsDown) {
    FundAndSettle(FeeConfig(0, 1250));
    ASSERT_TRUE(campaign_.DepositYield(sponsor_, 30));

    // Due 10, fee floor(10 * 1250 / 10000) = 1
    CampaignResult result = campaign_.Withdraw(bob_);
    ASSERT_TRUE(result);
    EXPECT_EQ(result.amount, 9);
    EXPECT_EQ(Wallet(collector_), 1);
    EXPECT_EQ(campaign_.WithdrawnOf(bob_), 10);
}

TEST_F(FeeTest, BothFeesTogether) {
    FundAndSettle(FeeConfig(250, 500));
    EXPECT_EQ(Wallet(recipient_), 3 * UNIT - 75 * UNIT / 1000);
    EXPECT_EQ(Wallet(collector_), 75 * UNIT / 1000);

    ASSERT_TRUE(campaign_.DepositYield(sponsor_, 3 * UNIT));
    ASSERT_TRUE(campaign_.Withdraw(carol_));
    EXPECT_EQ(Wallet(collector_), 75 * UNIT / 1000 + UNIT / 20);
    EXPECT_EQ(campaign_.PayoutFeesTotal(), UNIT / 20);
}

TEST_F(FeeTest, RefundsAreNotCharged) {
    Init(FeeConfig(1000, 1000));
    Contribute(alice_, UNIT);
    clock_.Set(END);
    ASSERT_TRUE(campaign_.ReleaseFailed());

    CampaignResult refund = campaign_.Withdraw(alice_);
    ASSERT_TRUE(refund);
    EXPECT_EQ(refund.amount, UNIT);
    EXPECT_EQ(Wallet(alice_), WALLET);
    EXPECT_EQ(Wallet(collector_), 0);
    EXPECT_EQ(CountEvents(EventType::FeePaid), 0u);
}

TEST_F(FeeTest, FeeLegFailureRevertsPayout) {
    FundAndSettle(FeeConfig(0, 1000));
    ASSERT_TRUE(campaign_.DepositYield(sponsor_, 3 * UNIT));
    transport_.FailTransfersTo(collector_);

    EXPECT_EQ(campaign_.Withdraw(alice_).error, CampaignError::Transport);
    EXPECT_EQ(Wallet(alice_), WALLET - UNIT);
    EXPECT_EQ(campaign_.WithdrawnOf(alice_), 0);
    EXPECT_EQ(campaign_.PayoutFeesTotal(), 0);
    EXPECT_EQ(transport_.Holdings(), 3 * UNIT);
}

TEST_F(FeeTest, FeeScheduleLimits) {
    EXPECT_TRUE(ValidateConfig(FeeConfig(MAX_FEE_BIPS, MAX_FEE_BIPS)));
    EXPECT_EQ(ValidateConfig(FeeConfig(MAX_FEE_BIPS + 1, 0)).error, CampaignError::Config);
    EXPECT_EQ(ValidateConfig(FeeConfig(0, MAX_FEE_BIPS + 1)).error, CampaignError::Config);
    EXPECT_EQ(ValidateConfig(FeeConfig(-1, 100)).error, CampaignError::Config);

    // A collector needs a fee, and a fee needs a collector
    EXPECT_EQ(ValidateConfig(FeeConfig(0, 0)).error, CampaignError::Config);
    CampaignConfig noCollector = DefaultConfig();
    noCollector.upfrontFeeBips = 100;
    EXPECT_EQ(campaign_.Initialize(noCollector).error, CampaignError::Config);
}

TEST_F(FeeTest, FeeScheduleQuery) {
    Init(FeeConfig(100, 250));
    FeeSchedule schedule = campaign_.GetFeeSchedule();
    EXPECT_EQ(schedule.collector, collector_);
    EXPECT_EQ(schedule.upfrontBips, 100);
    EXPECT_EQ(schedule.payoutBips, 250);
}

} // namespace test
} // namespace campaign
} // namespace crowdfund
