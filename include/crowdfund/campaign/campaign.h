// CROWDFUND - Campaign
// Copyright (c) 2024 CROWDFUND Developers
// MIT License
//
// A fundraising campaign:
// - Collects contributions inside a time window, bounded per account
// - Resolves to Funded (pool sent to the recipient) or Failed (refunds)
// - Pays later yield to share holders pro rata, across share transfers
// - Splits upfront and payout fees to a fee collector

#ifndef CROWDFUND_CAMPAIGN_CAMPAIGN_H
#define CROWDFUND_CAMPAIGN_CAMPAIGN_H

#include "crowdfund/campaign/errors.h"
#include "crowdfund/campaign/events.h"
#include "crowdfund/campaign/ledger.h"
#include "crowdfund/campaign/params.h"
#include "crowdfund/campaign/transport.h"
#include "crowdfund/core/types.h"
#include "crowdfund/util/time.h"

#include <map>
#include <string>
#include <vector>

namespace crowdfund {
namespace campaign {

// ============================================================================
// Campaign State
// ============================================================================

enum class CampaignState {
    /// Accepting contributions
    Funding,

    /// Pool released to the recipient; yield is distributed
    Funded,

    /// Goal missed or funds went stale; contributions are refundable
    Failed
};

const char* CampaignStateToString(CampaignState state);

/// Per-account contribution bounds; (0, 0) when nothing can be contributed
struct ContributionRange {
    Amount min{0};
    Amount max{0};

    bool IsOpen() const { return max > 0; }
};

/// Fee configuration as seen by observers
struct FeeSchedule {
    Address collector;
    int upfrontBips{0};
    int payoutBips{0};
};

/// Campaign-wide counters outside the share ledger
struct CampaignTotals {
    CampaignState state{CampaignState::Funding};
    bool processed{false};

    /// Cumulative yield received after settlement
    Amount yieldTotal{0};

    /// Cumulative payout fees charged on yield withdrawals
    Amount payoutFeesTotal{0};

    /// Fee taken from the pool at settlement
    Amount upfrontFeePaid{0};
};

/**
 * Complete persistent state of a campaign.
 */
struct CampaignSnapshot {
    CampaignConfig config;
    CampaignTotals totals;
    std::map<Address, AccountState> accounts;
    std::map<AllowanceKey, Amount> allowances;
};

// ============================================================================
// Campaign
// ============================================================================

/**
 * Ledger and state machine of one fundraising campaign.
 *
 * Every mutating operation is all-or-nothing: ledger and transport changes
 * are rolled back when any step fails, and events are published only after
 * the outermost operation commits. Ledger effects always precede outbound
 * transfers, so a call re-entering from a transport callback sees the
 * updated balances.
 *
 * Not thread-safe; callers serialize access. The transport and clock must
 * outlive the campaign.
 */
class Campaign {
public:
    Campaign(ValueTransport& transport, const util::Clock& clock);
    ~Campaign();

    Campaign(const Campaign&) = delete;
    Campaign& operator=(const Campaign&) = delete;

    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * Apply the configuration. Allowed once; emits FeeScheduleApplied
     * when a fee collector is configured.
     */
    CampaignResult Initialize(const CampaignConfig& config);

    bool IsInitialized() const { return initialized_; }
    const CampaignConfig& GetConfig() const { return config_; }

    // ========================================================================
    // State Queries
    // ========================================================================

    CampaignState GetState() const { return totals_.state; }
    bool IsProcessed() const { return totals_.processed; }
    const CampaignTotals& GetTotals() const { return totals_; }

    /// Total shares outstanding (sum of all share balances)
    Amount DepositTotal() const { return ledger_.TotalShares(); }
    Amount YieldTotal() const { return totals_.yieldTotal; }
    Amount WithdrawnTotal() const { return ledger_.TotalWithdrawn(); }
    Amount PayoutFeesTotal() const { return totals_.payoutFeesTotal; }
    Amount UpfrontFeePaid() const { return totals_.upfrontFeePaid; }

    bool IsContributionAllowed() const;
    bool IsGoalMinMet() const;
    bool IsGoalMaxMet() const;
    bool IsSettlementAllowed() const;
    bool IsFailureUnlockAllowed() const;

    /// Window end plus the stale-funds period
    Timestamp ExpiresAt() const { return config_.ExpiresAt(); }

    FeeSchedule GetFeeSchedule() const;

    // ========================================================================
    // Contribution
    // ========================================================================

    /// Bounds for the next contribution of `account`
    ContributionRange ContributionRangeFor(const Address& account) const;

    /// Contribute `amount`; on success the result carries the net shares
    CampaignResult Contribute(const Address& account, Amount amount);

    // ========================================================================
    // Resolution
    // ========================================================================

    /// Send the pool (minus the upfront fee) to the recipient
    CampaignResult Settle();

    /// Mark the campaign failed so contributors can withdraw their stake
    CampaignResult ReleaseFailed();

    // ========================================================================
    // Yield and Withdrawal
    // ========================================================================

    /// Accept surplus for distribution (Funded only)
    CampaignResult DepositYield(const Address& from, Amount amount);

    /// floor(shares * yieldTotal / depositTotal) - withdrawn, never negative
    Amount YieldBalanceOf(const Address& account) const;

    /**
     * Failed: refund the account's stake and burn its shares.
     * Funded: pay the account's yield balance minus the payout fee.
     * On success the result carries the amount sent to the account.
     */
    CampaignResult Withdraw(const Address& account);

    // ========================================================================
    // Shares
    // ========================================================================

    Amount ShareBalanceOf(const Address& account) const { return ledger_.BalanceOf(account); }
    Amount WithdrawnOf(const Address& account) const { return ledger_.WithdrawnOf(account); }

    /// Whether the account holds a claim (proof-of-contribution predicate)
    bool HasClaim(const Address& account) const { return ledger_.BalanceOf(account) > 0; }

    CampaignResult Transfer(const Address& from, const Address& to, Amount amount);
    CampaignResult Approve(const Address& owner, const Address& spender, Amount amount);
    Amount Allowance(const Address& owner, const Address& spender) const;
    CampaignResult TransferFrom(const Address& spender, const Address& from,
                                const Address& to, Amount amount);

    const ShareLedger& GetLedger() const { return ledger_; }

    // ========================================================================
    // Events
    // ========================================================================

    /// Register an observer; returns an id for Unsubscribe
    size_t Subscribe(EventCallback callback);
    void Unsubscribe(size_t id);

    /// Every published event, oldest first
    const std::vector<CampaignEvent>& GetEvents() const { return events_; }

    // ========================================================================
    // Persistence
    // ========================================================================

    CampaignSnapshot Snapshot() const;

    /// Load a snapshot into an uninitialized campaign
    CampaignResult Restore(const CampaignSnapshot& snapshot);

private:
    class OperationScope;

    CampaignResult Reject(const char* op, CampaignError error, const std::string& reason) const;
    CampaignResult RequireInitialized(const char* op) const;

    /// Pull funds in and validate the delivered amount
    CampaignResult ReceiveFunds(const Address& from, Amount amount);

    /// Buffer an event until the outermost operation commits
    void Emit(CampaignEvent event);
    void Emit(EventType type, const Address& account, Amount amount,
              const Address& counterparty = Address());
    void Publish();

    CampaignResult DoTransfer(const Address& from, const Address& to, Amount amount);

    ValueTransport& transport_;
    const util::Clock& clock_;

    CampaignConfig config_;
    bool initialized_{false};
    CampaignTotals totals_;
    ShareLedger ledger_;

    std::vector<CampaignEvent> pending_;
    std::vector<CampaignEvent> events_;
    std::map<size_t, EventCallback> subscribers_;
    size_t nextSubscriberId_{1};
    int depth_{0};
};

} // namespace campaign
} // namespace crowdfund

#endif // CROWDFUND_CAMPAIGN_CAMPAIGN_H
