// CROWDFUND - Value Transport Tests
// Copyright (c) 2024 CROWDFUND Developers
// MIT License

#include <gtest/gtest.h>

#include "crowdfund/campaign/transport.h"
#include "crowdfund/crypto/sha256.h"

#include <vector>

namespace crowdfund {
namespace campaign {
namespace test {

// ============================================================================
// Asset Book
// ============================================================================

class AssetBookTest : public ::testing::Test {
protected:
    MemoryAssetBook book_;
    Denomination native_ = Denomination::Native();
    Denomination token_ = Denomination::ExternalFungible(AddressFromLabel("usd"));
    Address alice_ = AddressFromLabel("alice");
    Address bob_ = AddressFromLabel("bob");
};

TEST_F(AssetBookTest, MintAndMove) {
    ASSERT_TRUE(book_.Mint(native_, alice_, 100));
    EXPECT_EQ(book_.BalanceOf(native_, alice_), 100);
    EXPECT_FALSE(book_.Mint(native_, alice_, -1));

    ASSERT_TRUE(book_.Move(native_, alice_, bob_, 40));
    EXPECT_EQ(book_.BalanceOf(native_, alice_), 60);
    EXPECT_EQ(book_.BalanceOf(native_, bob_), 40);

    EXPECT_FALSE(book_.Move(native_, alice_, bob_, 61));
    EXPECT_FALSE(book_.Move(native_, alice_, bob_, -1));
    EXPECT_EQ(book_.TotalSupply(native_), 100);
}

TEST_F(AssetBookTest, ZeroAndSelfMoves) {
    ASSERT_TRUE(book_.Mint(native_, alice_, 10));
    EXPECT_TRUE(book_.Move(native_, alice_, bob_, 0));
    EXPECT_TRUE(book_.Move(native_, alice_, alice_, 10));
    EXPECT_FALSE(book_.Move(native_, alice_, alice_, 11));
    EXPECT_EQ(book_.BalanceOf(native_, alice_), 10);
}

TEST_F(AssetBookTest, MoveRejectsOverflow) {
    ASSERT_TRUE(book_.Mint(native_, alice_, 10));
    ASSERT_TRUE(book_.Mint(native_, bob_, MAX_AMOUNT));
    EXPECT_FALSE(book_.Move(native_, alice_, bob_, 1));
    EXPECT_EQ(book_.BalanceOf(native_, alice_), 10);
    EXPECT_FALSE(book_.Mint(native_, bob_, 1));
}

TEST_F(AssetBookTest, DenominationsAreSeparate) {
    ASSERT_TRUE(book_.Mint(native_, alice_, 5));
    ASSERT_TRUE(book_.Mint(token_, alice_, 7));
    EXPECT_EQ(book_.BalanceOf(native_, alice_), 5);
    EXPECT_EQ(book_.BalanceOf(token_, alice_), 7);

    Denomination other = Denomination::ExternalFungible(AddressFromLabel("eur"));
    EXPECT_EQ(book_.BalanceOf(other, alice_), 0);

    ASSERT_TRUE(book_.Burn(token_, alice_, 3));
    EXPECT_FALSE(book_.Burn(token_, alice_, 5));
    EXPECT_EQ(book_.TotalSupply(token_), 4);
    EXPECT_EQ(book_.TotalSupply(native_), 5);
}

TEST_F(AssetBookTest, RevertUndoesMovements) {
    ASSERT_TRUE(book_.Mint(native_, alice_, 100));

    size_t id = book_.Checkpoint();
    EXPECT_EQ(book_.OpenCheckpoints(), 1u);
    ASSERT_TRUE(book_.Move(native_, alice_, bob_, 30));
    ASSERT_TRUE(book_.Mint(native_, bob_, 5));
    book_.Revert(id);

    EXPECT_EQ(book_.OpenCheckpoints(), 0u);
    EXPECT_EQ(book_.BalanceOf(native_, alice_), 100);
    EXPECT_EQ(book_.BalanceOf(native_, bob_), 0);
}

TEST_F(AssetBookTest, NestedReleaseIsUndoneByOuterRevert) {
    ASSERT_TRUE(book_.Mint(native_, alice_, 100));

    size_t outer = book_.Checkpoint();
    ASSERT_TRUE(book_.Move(native_, alice_, bob_, 10));

    size_t inner = book_.Checkpoint();
    EXPECT_NE(inner, outer);
    ASSERT_TRUE(book_.Move(native_, alice_, bob_, 20));
    book_.Release(inner);
    EXPECT_EQ(book_.BalanceOf(native_, bob_), 30);

    book_.Revert(outer);
    EXPECT_EQ(book_.BalanceOf(native_, alice_), 100);
    EXPECT_EQ(book_.BalanceOf(native_, bob_), 0);
}

TEST_F(AssetBookTest, NestedRevertKeepsOuterMovements) {
    ASSERT_TRUE(book_.Mint(native_, alice_, 100));

    size_t outer = book_.Checkpoint();
    ASSERT_TRUE(book_.Move(native_, alice_, bob_, 10));

    size_t inner = book_.Checkpoint();
    ASSERT_TRUE(book_.Move(native_, alice_, bob_, 20));
    book_.Revert(inner);
    EXPECT_EQ(book_.BalanceOf(native_, bob_), 10);

    book_.Release(outer);
    EXPECT_EQ(book_.OpenCheckpoints(), 0u);
    EXPECT_EQ(book_.BalanceOf(native_, bob_), 10);
    EXPECT_EQ(book_.BalanceOf(native_, alice_), 90);
}

TEST_F(AssetBookTest, OutOfOrderCloseIsIgnored) {
    ASSERT_TRUE(book_.Mint(native_, alice_, 100));
    size_t outer = book_.Checkpoint();
    book_.Checkpoint();
    ASSERT_TRUE(book_.Move(native_, alice_, bob_, 10));

    book_.Revert(outer);
    EXPECT_EQ(book_.OpenCheckpoints(), 2u);
    EXPECT_EQ(book_.BalanceOf(native_, bob_), 10);
}

// ============================================================================
// Memory Transport
// ============================================================================

class TransportTest : public ::testing::Test {
protected:
    TransportTest()
        : custody_(AddressFromLabel("campaign")),
          native_(book_, Denomination::Native(), custody_),
          token_(book_, Denomination::ExternalFungible(AddressFromLabel("usd")), custody_) {}

    void SetUp() override {
        ASSERT_TRUE(book_.Mint(native_.GetDenomination(), alice_, 1000));
        ASSERT_TRUE(book_.Mint(token_.GetDenomination(), alice_, 1000));
    }

    MemoryAssetBook book_;
    Address custody_;
    MemoryTransport native_;
    MemoryTransport token_;
    Address alice_ = AddressFromLabel("alice");
    Address bob_ = AddressFromLabel("bob");
};

TEST_F(TransportTest, TransferInMovesToCustody) {
    auto received = native_.TransferIn(alice_, 300);
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(*received, 300);
    EXPECT_EQ(native_.Holdings(), 300);
    EXPECT_EQ(native_.BalanceOf(alice_), 700);
    EXPECT_EQ(native_.GetCustody(), custody_);

    // The token ledger is untouched
    EXPECT_EQ(token_.Holdings(), 0);
}

TEST_F(TransportTest, TransferInRejections) {
    EXPECT_FALSE(native_.TransferIn(alice_, 0).has_value());
    EXPECT_FALSE(native_.TransferIn(alice_, -5).has_value());
    EXPECT_FALSE(native_.TransferIn(alice_, 1001).has_value());
    EXPECT_FALSE(native_.TransferIn(bob_, 1).has_value());

    native_.FailTransfersFrom(alice_);
    EXPECT_FALSE(native_.TransferIn(alice_, 1).has_value());
    native_.ClearFailures();
    EXPECT_TRUE(native_.TransferIn(alice_, 1).has_value());
}

TEST_F(TransportTest, TransferOutRejections) {
    ASSERT_TRUE(native_.TransferIn(alice_, 100).has_value());

    EXPECT_FALSE(native_.TransferOut(bob_, 0));
    EXPECT_FALSE(native_.TransferOut(bob_, 101));
    EXPECT_FALSE(native_.TransferOut(Address(), 10));

    native_.FailTransfersTo(bob_);
    EXPECT_FALSE(native_.TransferOut(bob_, 10));
    EXPECT_EQ(native_.Holdings(), 100);

    native_.ClearFailures();
    EXPECT_TRUE(native_.TransferOut(bob_, 10));
    EXPECT_EQ(native_.BalanceOf(bob_), 10);
    EXPECT_EQ(native_.Holdings(), 90);
}

TEST_F(TransportTest, TokenTransferFeeIsBurned) {
    token_.SetTransferFeeBips(100);
    EXPECT_EQ(token_.GetTransferFeeBips(), 100);

    auto received = token_.TransferIn(alice_, 1000);
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(*received, 990);
    EXPECT_EQ(token_.Holdings(), 990);
    EXPECT_EQ(book_.TotalSupply(token_.GetDenomination()), 990);

    // Outbound transfers are not charged
    ASSERT_TRUE(token_.TransferOut(bob_, 990));
    EXPECT_EQ(token_.BalanceOf(bob_), 990);
}

TEST_F(TransportTest, NativeIgnoresTransferFee) {
    native_.SetTransferFeeBips(100);
    auto received = native_.TransferIn(alice_, 1000);
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(*received, 1000);
}

TEST_F(TransportTest, HookRunsAfterCredit) {
    ASSERT_TRUE(native_.TransferIn(alice_, 100).has_value());

    std::vector<Amount> seen;
    native_.SetOutboundHook([&](const Address& to, Amount amount) {
        EXPECT_EQ(to, bob_);
        seen.push_back(native_.BalanceOf(to));
        seen.push_back(amount);
    });

    ASSERT_TRUE(native_.TransferOut(bob_, 25));
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], 25);
    EXPECT_EQ(seen[1], 25);

    // No hook call for a rejected transfer
    EXPECT_FALSE(native_.TransferOut(bob_, 1000));
    EXPECT_EQ(seen.size(), 2u);
}

TEST_F(TransportTest, CheckpointsRevertTransfers) {
    ValueTransport& transport = native_;

    auto id = transport.Checkpoint();
    ASSERT_TRUE(transport.TransferIn(alice_, 400).has_value());
    ASSERT_TRUE(transport.TransferOut(bob_, 100));
    transport.Revert(id);

    EXPECT_EQ(transport.Holdings(), 0);
    EXPECT_EQ(transport.BalanceOf(alice_), 1000);
    EXPECT_EQ(transport.BalanceOf(bob_), 0);

    id = transport.Checkpoint();
    ASSERT_TRUE(transport.TransferIn(alice_, 400).has_value());
    transport.Release(id);
    EXPECT_EQ(transport.Holdings(), 400);
}

} // namespace test
} // namespace campaign
} // namespace crowdfund
