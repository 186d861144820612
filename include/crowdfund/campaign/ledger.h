// CROWDFUND - Share Ledger
// Copyright (c) 2024 CROWDFUND Developers
// MIT License
//
// Per-account share balances and yield withdrawal history, with
// transfer-aware rebalancing and nested undo journals.

#ifndef CROWDFUND_CAMPAIGN_LEDGER_H
#define CROWDFUND_CAMPAIGN_LEDGER_H

#include "crowdfund/campaign/errors.h"
#include "crowdfund/core/types.h"

#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace crowdfund {
namespace campaign {

/// Ledger entry of one account
struct AccountState {
    /// Shares held (1 share per unit contributed)
    Amount shares{0};

    /// Yield already paid out, rescaled on every share move
    Amount withdrawn{0};

    /**
     * Correction in yield * share units. The account has earned
     * floor((shares * yieldTotal - yieldOffset) / totalShares). Share moves
     * adjust it so the pending claim moves with the shares; offsets of all
     * accounts sum to zero.
     */
    Amount yieldOffset{0};

    bool operator==(const AccountState& other) const {
        return shares == other.shares && withdrawn == other.withdrawn &&
               yieldOffset == other.yieldOffset;
    }
};

/// (owner, spender)
using AllowanceKey = std::pair<Address, Address>;

/**
 * Share ledger of a single campaign.
 *
 * Invariants: the sum of all share balances equals TotalShares(), the sum
 * of all withdrawn values equals TotalWithdrawn(), the yield offsets sum to
 * zero. Accounts are never removed; a zero entry is a valid terminal state.
 *
 * Mutations can be grouped in journals: Begin() opens one, Commit() keeps
 * its changes (folding them into the enclosing journal, if any) and
 * Rollback() restores every entry it touched.
 */
class ShareLedger {
public:
    // ========================================================================
    // Queries
    // ========================================================================

    Amount BalanceOf(const Address& account) const;
    Amount WithdrawnOf(const Address& account) const;
    Amount YieldOffsetOf(const Address& account) const;

    /**
     * Yield the account has earned out of `yieldTotal`, withdrawals
     * included: floor((shares * yieldTotal - yieldOffset) / TotalShares()).
     * 0 when no shares are outstanding.
     */
    Amount EarnedOf(const Address& account, Amount yieldTotal) const;
    Amount TotalShares() const { return totalShares_; }
    Amount TotalWithdrawn() const { return totalWithdrawn_; }
    size_t AccountCount() const { return accounts_.size(); }
    bool HasAccount(const Address& account) const { return accounts_.count(account) > 0; }

    const std::map<Address, AccountState>& GetAccounts() const { return accounts_; }
    const std::map<AllowanceKey, Amount>& GetAllowances() const { return allowances_; }

    // ========================================================================
    // Mutations
    // ========================================================================

    /// Create shares for `account`. Only valid while no yield exists.
    CampaignResult Mint(const Address& account, Amount amount);

    /// Destroy shares of `account`. Only valid while no yield exists.
    CampaignResult Burn(const Address& account, Amount amount);

    /// Add to the account's withdrawal history
    CampaignResult RecordWithdrawal(const Address& account, Amount amount);

    /**
     * Move shares and a proportional part of the withdrawal history:
     * moved = floor(withdrawn[from] * amount / shares[from]).
     * The yield offsets are shifted so the sender's pending claim out of
     * `yieldTotal` shrinks by the moved share fraction (rounded down) and
     * the receiver's grows by the same amount. No account is left owing.
     * Self and zero transfers leave the ledger unchanged.
     */
    CampaignResult Transfer(const Address& from, const Address& to, Amount amount,
                            Amount yieldTotal);

    Amount Allowance(const Address& owner, const Address& spender) const;
    void SetAllowance(const Address& owner, const Address& spender, Amount amount);

    /// Decrease an allowance; Balance failure if it is short
    CampaignResult SpendAllowance(const Address& owner, const Address& spender, Amount amount);

    /// Replace the whole ledger (restoring from storage); no journal may be
    /// open and the stored totals must be consistent
    bool Restore(const std::map<Address, AccountState>& accounts,
                 const std::map<AllowanceKey, Amount>& allowances);

    // ========================================================================
    // Journals
    // ========================================================================

    void Begin();
    void Commit();
    void Rollback();
    size_t JournalDepth() const { return journals_.size(); }

private:
    struct Journal {
        std::map<Address, std::optional<AccountState>> accounts;
        std::map<AllowanceKey, std::optional<Amount>> allowances;
        Amount totalShares{0};
        Amount totalWithdrawn{0};
    };

    AccountState& Touch(const Address& account);
    void TouchAllowance(const AllowanceKey& key);

    std::map<Address, AccountState> accounts_;
    std::map<AllowanceKey, Amount> allowances_;
    Amount totalShares_{0};
    Amount totalWithdrawn_{0};

    std::vector<Journal> journals_;
};

} // namespace campaign
} // namespace crowdfund

#endif // CROWDFUND_CAMPAIGN_LEDGER_H
