// CROWDFUND - Value Transport
// Copyright (c) 2024 CROWDFUND Developers
// MIT License
//
// Moves the campaign denomination between participants and the campaign's
// custody. The campaign only depends on the ValueTransport contract; the
// in-memory implementation backs tests and the simulator.

#ifndef CROWDFUND_CAMPAIGN_TRANSPORT_H
#define CROWDFUND_CAMPAIGN_TRANSPORT_H

#include "crowdfund/campaign/params.h"
#include "crowdfund/core/types.h"

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <utility>
#include <vector>

namespace crowdfund {
namespace campaign {

// ============================================================================
// Transport Contract
// ============================================================================

/**
 * Value transport used by a campaign.
 *
 * Inbound transfers may deliver less than requested (fee-on-transfer
 * tokens), so TransferIn reports the amount actually received. Outbound
 * transfers may run foreign code at the destination before returning.
 *
 * Checkpoints nest: Revert(id) undoes every movement since the matching
 * Checkpoint(), Release(id) keeps them.
 */
class ValueTransport {
public:
    using CheckpointId = size_t;

    virtual ~ValueTransport() = default;

    virtual Denomination GetDenomination() const = 0;

    /// Pull `amount` from `from` into custody; nullopt on failure
    virtual std::optional<Amount> TransferIn(const Address& from, Amount amount) = 0;

    /// Send `amount` from custody to `to`
    virtual bool TransferOut(const Address& to, Amount amount) = 0;

    /// Balance of an external holder
    virtual Amount BalanceOf(const Address& holder) const = 0;

    /// Amount currently held in custody
    virtual Amount Holdings() const = 0;

    virtual CheckpointId Checkpoint() = 0;
    virtual void Revert(CheckpointId id) = 0;
    virtual void Release(CheckpointId id) = 0;
};

// ============================================================================
// In-Memory Asset Book
// ============================================================================

/**
 * Balances of every denomination for every holder, with an undo log.
 *
 * Several transports (one per campaign) may share a book.
 */
class MemoryAssetBook {
public:
    Amount BalanceOf(const Denomination& denom, const Address& holder) const;

    /// Create units out of thin air (funding test accounts)
    bool Mint(const Denomination& denom, const Address& holder, Amount amount);

    /// Move units; false if the source is short or the target would overflow
    bool Move(const Denomination& denom, const Address& from, const Address& to, Amount amount);

    /// Destroy units held by `holder` (token transfer fees)
    bool Burn(const Denomination& denom, const Address& holder, Amount amount);

    /// Sum of all balances in a denomination
    Amount TotalSupply(const Denomination& denom) const;

    size_t Checkpoint();
    void Revert(size_t id);
    void Release(size_t id);
    size_t OpenCheckpoints() const { return marks_.size(); }

private:
    using Key = std::pair<Address, Address>;   // (token reference, holder)

    static Key MakeKey(const Denomination& denom, const Address& holder);
    void SetBalance(const Key& key, Amount value);

    std::map<Key, Amount> balances_;
    std::vector<std::pair<Key, Amount>> undo_;   // (key, previous balance)
    std::vector<size_t> marks_;                  // undo_ size at each open checkpoint
};

// ============================================================================
// In-Memory Transport
// ============================================================================

/**
 * ValueTransport over a MemoryAssetBook.
 *
 * Custody is the campaign's own address in the book. External tokens may
 * charge a fee on inbound transfers (burned from the delivered amount).
 */
class MemoryTransport : public ValueTransport {
public:
    /// Called after an outbound transfer has been credited
    using OutboundHook = std::function<void(const Address& to, Amount amount)>;

    MemoryTransport(MemoryAssetBook& book, const Denomination& denom, const Address& custody);

    Denomination GetDenomination() const override { return denom_; }
    std::optional<Amount> TransferIn(const Address& from, Amount amount) override;
    bool TransferOut(const Address& to, Amount amount) override;
    Amount BalanceOf(const Address& holder) const override;
    Amount Holdings() const override;

    CheckpointId Checkpoint() override { return book_.Checkpoint(); }
    void Revert(CheckpointId id) override { book_.Revert(id); }
    void Release(CheckpointId id) override { book_.Release(id); }

    const Address& GetCustody() const { return custody_; }

    /// Fee-on-transfer for inbound token transfers (ignored for native)
    void SetTransferFeeBips(int bips) { transferFeeBips_ = bips; }
    int GetTransferFeeBips() const { return transferFeeBips_; }

    /// Make every transfer to `to` fail
    void FailTransfersTo(const Address& to) { failingDestinations_.insert(to); }

    /// Make every transfer from `from` fail
    void FailTransfersFrom(const Address& from) { failingSources_.insert(from); }

    void ClearFailures();

    void SetOutboundHook(OutboundHook hook) { hook_ = std::move(hook); }

private:
    MemoryAssetBook& book_;
    Denomination denom_;
    Address custody_;
    int transferFeeBips_{0};
    std::set<Address> failingDestinations_;
    std::set<Address> failingSources_;
    OutboundHook hook_;
};

} // namespace campaign
} // namespace crowdfund

#endif // CROWDFUND_CAMPAIGN_TRANSPORT_H
