// CROWDFUND - Share Ledger Tests
// Copyright (c) 2024 CROWDFUND Developers
// MIT License

#include <gtest/gtest.h>

#include "crowdfund/campaign/ledger.h"
#include "crowdfund/crypto/sha256.h"

#include <map>

namespace crowdfund {
namespace campaign {
namespace test {

class LedgerTest : public ::testing::Test {
protected:
    ShareLedger ledger_;
    Address alice_ = AddressFromLabel("alice");
    Address bob_ = AddressFromLabel("bob");
    Address carol_ = AddressFromLabel("carol");
};

// ============================================================================
// Mint / Burn / Withdrawal History
// ============================================================================

TEST_F(LedgerTest, MintAndBurn) {
    ASSERT_TRUE(ledger_.Mint(alice_, 100));
    ASSERT_TRUE(ledger_.Mint(bob_, 50));
    EXPECT_EQ(ledger_.BalanceOf(alice_), 100);
    EXPECT_EQ(ledger_.TotalShares(), 150);
    EXPECT_EQ(ledger_.AccountCount(), 2u);

    ASSERT_TRUE(ledger_.Burn(alice_, 100));
    EXPECT_EQ(ledger_.BalanceOf(alice_), 0);
    EXPECT_EQ(ledger_.TotalShares(), 50);

    // Emptied accounts stay on the ledger
    EXPECT_TRUE(ledger_.HasAccount(alice_));
    EXPECT_FALSE(ledger_.HasAccount(carol_));
    EXPECT_EQ(ledger_.BalanceOf(carol_), 0);
}

TEST_F(LedgerTest, MintAndBurnRejections) {
    EXPECT_EQ(ledger_.Mint(alice_, -1).error, CampaignError::Bounds);
    EXPECT_TRUE(ledger_.Mint(alice_, 0));

    ASSERT_TRUE(ledger_.Mint(alice_, MAX_AMOUNT));
    CampaignResult overflow = ledger_.Mint(bob_, 1);
    EXPECT_EQ(overflow.error, CampaignError::Bounds);
    EXPECT_EQ(overflow.reason, Reason::AMOUNT_OVERFLOW);
    EXPECT_EQ(ledger_.TotalShares(), MAX_AMOUNT);

    CampaignResult shortBurn = ledger_.Burn(bob_, 1);
    EXPECT_EQ(shortBurn.error, CampaignError::Balance);
    EXPECT_EQ(shortBurn.reason, Reason::INSUFFICIENT_BALANCE);
}

TEST_F(LedgerTest, RecordWithdrawal) {
    ASSERT_TRUE(ledger_.Mint(alice_, 10));
    ASSERT_TRUE(ledger_.RecordWithdrawal(alice_, 3));
    ASSERT_TRUE(ledger_.RecordWithdrawal(alice_, 4));
    EXPECT_EQ(ledger_.WithdrawnOf(alice_), 7);
    EXPECT_EQ(ledger_.TotalWithdrawn(), 7);
    EXPECT_EQ(ledger_.RecordWithdrawal(alice_, -1).error, CampaignError::Bounds);
}

// ============================================================================
// Transfers
// ============================================================================

TEST_F(LedgerTest, TransferMovesProportionalHistory) {
    ASSERT_TRUE(ledger_.Mint(alice_, 3));
    ASSERT_TRUE(ledger_.RecordWithdrawal(alice_, 10));

    // floor(10 * 2 / 3) = 6
    ASSERT_TRUE(ledger_.Transfer(alice_, bob_, 2, 0));
    EXPECT_EQ(ledger_.BalanceOf(alice_), 1);
    EXPECT_EQ(ledger_.WithdrawnOf(alice_), 4);
    EXPECT_EQ(ledger_.BalanceOf(bob_), 2);
    EXPECT_EQ(ledger_.WithdrawnOf(bob_), 6);

    EXPECT_EQ(ledger_.TotalShares(), 3);
    EXPECT_EQ(ledger_.TotalWithdrawn(), 10);
}

TEST_F(LedgerTest, TransferAddsToExistingHistory) {
    ASSERT_TRUE(ledger_.Mint(alice_, 4));
    ASSERT_TRUE(ledger_.Mint(bob_, 4));
    ASSERT_TRUE(ledger_.RecordWithdrawal(alice_, 8));
    ASSERT_TRUE(ledger_.RecordWithdrawal(bob_, 1));

    ASSERT_TRUE(ledger_.Transfer(alice_, bob_, 4, 0));
    EXPECT_EQ(ledger_.WithdrawnOf(alice_), 0);
    EXPECT_EQ(ledger_.WithdrawnOf(bob_), 9);
    EXPECT_EQ(ledger_.BalanceOf(bob_), 8);
}

TEST_F(LedgerTest, TransferLargeValuesDoNotOverflow) {
    Amount shares = 4 * UNIT;
    Amount withdrawn = 3 * UNIT;
    ASSERT_TRUE(ledger_.Mint(alice_, shares));
    ASSERT_TRUE(ledger_.RecordWithdrawal(alice_, withdrawn));

    ASSERT_TRUE(ledger_.Transfer(alice_, bob_, shares / 2, 0));
    EXPECT_EQ(ledger_.WithdrawnOf(bob_), withdrawn / 2);
    EXPECT_EQ(ledger_.WithdrawnOf(alice_), withdrawn / 2);
}

TEST_F(LedgerTest, TransferRejections) {
    ASSERT_TRUE(ledger_.Mint(alice_, 5));

    CampaignResult nullTarget = ledger_.Transfer(alice_, Address(), 1, 0);
    EXPECT_EQ(nullTarget.error, CampaignError::Balance);
    EXPECT_EQ(nullTarget.reason, Reason::INVALID_RECIPIENT);

    EXPECT_EQ(ledger_.Transfer(alice_, bob_, -1, 0).error, CampaignError::Bounds);

    CampaignResult tooMuch = ledger_.Transfer(alice_, bob_, 6, 0);
    EXPECT_EQ(tooMuch.reason, Reason::INSUFFICIENT_BALANCE);

    // Self transfers still require the balance
    EXPECT_EQ(ledger_.Transfer(alice_, alice_, 6, 0).reason, Reason::INSUFFICIENT_BALANCE);
    EXPECT_EQ(ledger_.BalanceOf(alice_), 5);
    EXPECT_FALSE(ledger_.HasAccount(bob_));
}

TEST_F(LedgerTest, SelfAndZeroTransfersAreNoOps) {
    ASSERT_TRUE(ledger_.Mint(alice_, 5));
    ASSERT_TRUE(ledger_.RecordWithdrawal(alice_, 2));

    EXPECT_TRUE(ledger_.Transfer(alice_, alice_, 5, 0));
    EXPECT_TRUE(ledger_.Transfer(alice_, bob_, 0, 0));
    EXPECT_EQ(ledger_.BalanceOf(alice_), 5);
    EXPECT_EQ(ledger_.WithdrawnOf(alice_), 2);
    EXPECT_FALSE(ledger_.HasAccount(bob_));
}

// ============================================================================
// Yield Offsets
// ============================================================================

TEST_F(LedgerTest, EarnedFollowsShares) {
    EXPECT_EQ(ledger_.EarnedOf(alice_, 10), 0);

    ASSERT_TRUE(ledger_.Mint(alice_, 2));
    ASSERT_TRUE(ledger_.Mint(bob_, 1));
    EXPECT_EQ(ledger_.EarnedOf(alice_, 10), 6);
    EXPECT_EQ(ledger_.EarnedOf(bob_, 10), 3);
    EXPECT_EQ(ledger_.EarnedOf(carol_, 10), 0);
    EXPECT_EQ(ledger_.EarnedOf(alice_, 0), 0);
}

TEST_F(LedgerTest, TransferWithoutYieldKeepsOffsetsZero) {
    ASSERT_TRUE(ledger_.Mint(alice_, 3));
    ASSERT_TRUE(ledger_.RecordWithdrawal(alice_, 10));
    ASSERT_TRUE(ledger_.Transfer(alice_, bob_, 2, 0));

    EXPECT_EQ(ledger_.YieldOffsetOf(alice_), 0);
    EXPECT_EQ(ledger_.YieldOffsetOf(bob_), 0);
}

TEST_F(LedgerTest, ProportionalTransferNeedsNoOffset) {
    ASSERT_TRUE(ledger_.Mint(alice_, 4));
    ASSERT_TRUE(ledger_.Mint(bob_, 4));

    // Pending 4 of 8 yield moves exactly with half of alice's shares
    ASSERT_TRUE(ledger_.Transfer(alice_, carol_, 2, 8));
    EXPECT_EQ(ledger_.YieldOffsetOf(alice_), 0);
    EXPECT_EQ(ledger_.YieldOffsetOf(carol_), 0);
    EXPECT_EQ(ledger_.EarnedOf(alice_, 8), 2);
    EXPECT_EQ(ledger_.EarnedOf(carol_, 8), 2);
}

TEST_F(LedgerTest, TransferOfWithdrawnSharesShiftsOffsets) {
    // 6 shares earned all 4 units of yield and withdrew them
    ASSERT_TRUE(ledger_.Mint(alice_, 6));
    ASSERT_TRUE(ledger_.RecordWithdrawal(alice_, 4));

    // floor(4 * 4 / 6) = 2 withdrawn moves, but nothing is pending
    ASSERT_TRUE(ledger_.Transfer(alice_, carol_, 4, 4));
    EXPECT_EQ(ledger_.WithdrawnOf(alice_), 2);
    EXPECT_EQ(ledger_.WithdrawnOf(carol_), 2);
    EXPECT_EQ(ledger_.YieldOffsetOf(alice_), -4);
    EXPECT_EQ(ledger_.YieldOffsetOf(carol_), 4);
    EXPECT_EQ(ledger_.EarnedOf(alice_, 4), 2);
    EXPECT_EQ(ledger_.EarnedOf(carol_, 4), 2);

    ASSERT_TRUE(ledger_.Transfer(carol_, bob_, 3, 4));
    EXPECT_EQ(ledger_.WithdrawnOf(carol_), 1);
    EXPECT_EQ(ledger_.WithdrawnOf(bob_), 1);
    EXPECT_EQ(ledger_.YieldOffsetOf(carol_), -2);
    EXPECT_EQ(ledger_.YieldOffsetOf(bob_), 6);
    EXPECT_EQ(ledger_.EarnedOf(carol_, 4), 1);
    EXPECT_EQ(ledger_.EarnedOf(bob_, 4), 1);
    EXPECT_EQ(ledger_.TotalWithdrawn(), 4);

    // Two more units of yield: bob's 3 shares earn 1 of them
    EXPECT_EQ(ledger_.EarnedOf(alice_, 6), 2);
    EXPECT_EQ(ledger_.EarnedOf(carol_, 6), 1);
    EXPECT_EQ(ledger_.EarnedOf(bob_, 6), 2);
}

TEST_F(LedgerTest, EarnedFloorsNegativeNumerators) {
    std::map<Address, AccountState> accounts;
    accounts[alice_] = AccountState{1, 0, 5};
    accounts[bob_] = AccountState{1, 0, -5};
    ASSERT_TRUE(ledger_.Restore(accounts, {}));

    // floor((2 - 5) / 2) and floor((2 + 5) / 2)
    EXPECT_EQ(ledger_.EarnedOf(alice_, 2), -2);
    EXPECT_EQ(ledger_.EarnedOf(bob_, 2), 3);
}

TEST_F(LedgerTest, RollbackRestoresOffsets) {
    ASSERT_TRUE(ledger_.Mint(alice_, 6));
    ASSERT_TRUE(ledger_.RecordWithdrawal(alice_, 4));

    ledger_.Begin();
    ASSERT_TRUE(ledger_.Transfer(alice_, carol_, 4, 4));
    ledger_.Rollback();

    EXPECT_EQ(ledger_.YieldOffsetOf(alice_), 0);
    EXPECT_FALSE(ledger_.HasAccount(carol_));
    EXPECT_EQ(ledger_.EarnedOf(alice_, 4), 4);
}

// ============================================================================
// Allowances
// ============================================================================

TEST_F(LedgerTest, Allowances) {
    EXPECT_EQ(ledger_.Allowance(alice_, bob_), 0);

    ledger_.SetAllowance(alice_, bob_, 10);
    EXPECT_EQ(ledger_.Allowance(alice_, bob_), 10);
    EXPECT_EQ(ledger_.Allowance(bob_, alice_), 0);

    ASSERT_TRUE(ledger_.SpendAllowance(alice_, bob_, 4));
    EXPECT_EQ(ledger_.Allowance(alice_, bob_), 6);

    CampaignResult over = ledger_.SpendAllowance(alice_, bob_, 7);
    EXPECT_EQ(over.error, CampaignError::Balance);
    EXPECT_EQ(over.reason, Reason::INSUFFICIENT_ALLOWANCE);
    EXPECT_EQ(ledger_.Allowance(alice_, bob_), 6);

    ledger_.SetAllowance(alice_, bob_, 1);
    EXPECT_EQ(ledger_.Allowance(alice_, bob_), 1);
}

// ============================================================================
// Journals
// ============================================================================

TEST_F(LedgerTest, RollbackRestoresTouchedEntries) {
    ASSERT_TRUE(ledger_.Mint(alice_, 10));
    ledger_.SetAllowance(alice_, bob_, 5);

    ledger_.Begin();
    EXPECT_EQ(ledger_.JournalDepth(), 1u);
    ASSERT_TRUE(ledger_.Transfer(alice_, bob_, 4, 0));
    ASSERT_TRUE(ledger_.Mint(carol_, 3));
    ASSERT_TRUE(ledger_.SpendAllowance(alice_, bob_, 4));
    ledger_.SetAllowance(carol_, alice_, 9);
    ASSERT_TRUE(ledger_.RecordWithdrawal(alice_, 2));
    ledger_.Rollback();

    EXPECT_EQ(ledger_.JournalDepth(), 0u);
    EXPECT_EQ(ledger_.BalanceOf(alice_), 10);
    EXPECT_EQ(ledger_.WithdrawnOf(alice_), 0);
    EXPECT_FALSE(ledger_.HasAccount(bob_));
    EXPECT_FALSE(ledger_.HasAccount(carol_));
    EXPECT_EQ(ledger_.TotalShares(), 10);
    EXPECT_EQ(ledger_.TotalWithdrawn(), 0);
    EXPECT_EQ(ledger_.Allowance(alice_, bob_), 5);
    EXPECT_EQ(ledger_.GetAllowances().size(), 1u);
}

TEST_F(LedgerTest, CommitKeepsChanges) {
    ledger_.Begin();
    ASSERT_TRUE(ledger_.Mint(alice_, 10));
    ledger_.Commit();

    EXPECT_EQ(ledger_.JournalDepth(), 0u);
    EXPECT_EQ(ledger_.BalanceOf(alice_), 10);
}

TEST_F(LedgerTest, InnerCommitIsUndoneByOuterRollback) {
    ASSERT_TRUE(ledger_.Mint(alice_, 10));

    ledger_.Begin();
    ASSERT_TRUE(ledger_.Transfer(alice_, bob_, 2, 0));

    ledger_.Begin();
    ASSERT_TRUE(ledger_.Transfer(alice_, carol_, 3, 0));
    ASSERT_TRUE(ledger_.Transfer(bob_, carol_, 1, 0));
    ledger_.Commit();
    EXPECT_EQ(ledger_.BalanceOf(carol_), 4);

    ledger_.Rollback();
    EXPECT_EQ(ledger_.BalanceOf(alice_), 10);
    EXPECT_FALSE(ledger_.HasAccount(bob_));
    EXPECT_FALSE(ledger_.HasAccount(carol_));
    EXPECT_EQ(ledger_.TotalShares(), 10);
}

TEST_F(LedgerTest, InnerRollbackKeepsOuterChanges) {
    ASSERT_TRUE(ledger_.Mint(alice_, 10));

    ledger_.Begin();
    ASSERT_TRUE(ledger_.Transfer(alice_, bob_, 2, 0));

    ledger_.Begin();
    ASSERT_TRUE(ledger_.Transfer(alice_, bob_, 3, 0));
    ASSERT_TRUE(ledger_.Mint(carol_, 1));
    ledger_.Rollback();

    EXPECT_EQ(ledger_.BalanceOf(alice_), 8);
    EXPECT_EQ(ledger_.BalanceOf(bob_), 2);
    EXPECT_FALSE(ledger_.HasAccount(carol_));
    EXPECT_EQ(ledger_.TotalShares(), 10);

    ledger_.Commit();
    EXPECT_EQ(ledger_.JournalDepth(), 0u);
    EXPECT_EQ(ledger_.BalanceOf(bob_), 2);
}

TEST_F(LedgerTest, UnbalancedJournalCallsAreIgnored) {
    ASSERT_TRUE(ledger_.Mint(alice_, 1));
    ledger_.Commit();
    ledger_.Rollback();
    EXPECT_EQ(ledger_.BalanceOf(alice_), 1);
    EXPECT_EQ(ledger_.JournalDepth(), 0u);
}

// ============================================================================
// Restore
// ============================================================================

TEST_F(LedgerTest, RestoreReplacesContents) {
    ASSERT_TRUE(ledger_.Mint(carol_, 99));

    std::map<Address, AccountState> accounts;
    accounts[alice_] = AccountState{7, 2, -3};
    accounts[bob_] = AccountState{3, 0, 3};
    std::map<AllowanceKey, Amount> allowances;
    allowances[{alice_, bob_}] = 4;

    ASSERT_TRUE(ledger_.Restore(accounts, allowances));
    EXPECT_EQ(ledger_.TotalShares(), 10);
    EXPECT_EQ(ledger_.TotalWithdrawn(), 2);
    EXPECT_FALSE(ledger_.HasAccount(carol_));
    EXPECT_EQ(ledger_.Allowance(alice_, bob_), 4);
    EXPECT_EQ(ledger_.GetAccounts(), accounts);
}

TEST_F(LedgerTest, RestoreRejections) {
    std::map<Address, AccountState> negative;
    negative[alice_] = AccountState{-1, 0};
    EXPECT_FALSE(ledger_.Restore(negative, {}));

    std::map<Address, AccountState> overflow;
    overflow[alice_] = AccountState{MAX_AMOUNT, 0};
    overflow[bob_] = AccountState{1, 0};
    EXPECT_FALSE(ledger_.Restore(overflow, {}));

    std::map<Address, AccountState> unbalanced;
    unbalanced[alice_] = AccountState{1, 0, 3};
    unbalanced[bob_] = AccountState{1, 0, -2};
    EXPECT_FALSE(ledger_.Restore(unbalanced, {}));

    std::map<Address, AccountState> extreme;
    extreme[alice_] = AccountState{1, 0, -MAX_AMOUNT - 1};
    EXPECT_FALSE(ledger_.Restore(extreme, {}));

    ledger_.Begin();
    EXPECT_FALSE(ledger_.Restore({}, {}));
    ledger_.Rollback();
    EXPECT_TRUE(ledger_.Restore({}, {}));
}

} // namespace test
} // namespace campaign
} // namespace crowdfund
