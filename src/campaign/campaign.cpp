// CROWDFUND - Campaign Implementation
// Copyright (c) 2024 CROWDFUND Developers
// MIT License

#include "crowdfund/campaign/campaign.h"
#include "crowdfund/core/arith.h"
#include "crowdfund/util/logging.h"

#include <algorithm>
#include <utility>

namespace crowdfund {
namespace campaign {

const char* CampaignStateToString(CampaignState state) {
    switch (state) {
        case CampaignState::Funding: return "Funding";
        case CampaignState::Funded:  return "Funded";
        case CampaignState::Failed:  return "Failed";
        default:                     return "Unknown";
    }
}

// ============================================================================
// Operation Scope
// ============================================================================

/**
 * Groups the effects of one operation. Destroyed without Commit(), it
 * reverts transport movements, ledger entries, campaign totals and the
 * events buffered since it opened.
 */
class Campaign::OperationScope {
public:
    explicit OperationScope(Campaign& campaign)
        : campaign_(campaign),
          savedTotals_(campaign.totals_),
          firstPending_(campaign.pending_.size()) {
        campaign_.ledger_.Begin();
        checkpoint_ = campaign_.transport_.Checkpoint();
        ++campaign_.depth_;
    }

    ~OperationScope() {
        if (committed_) {
            return;
        }
        campaign_.transport_.Revert(checkpoint_);
        campaign_.ledger_.Rollback();
        campaign_.totals_ = savedTotals_;
        campaign_.pending_.resize(firstPending_);
        --campaign_.depth_;
    }

    OperationScope(const OperationScope&) = delete;
    OperationScope& operator=(const OperationScope&) = delete;

    CampaignResult Commit(CampaignResult result) {
        campaign_.transport_.Release(checkpoint_);
        campaign_.ledger_.Commit();
        committed_ = true;
        if (--campaign_.depth_ == 0) {
            campaign_.Publish();
        }
        return result;
    }

private:
    Campaign& campaign_;
    CampaignTotals savedTotals_;
    size_t firstPending_;
    ValueTransport::CheckpointId checkpoint_{0};
    bool committed_{false};
};

// ============================================================================
// Construction
// ============================================================================

Campaign::Campaign(ValueTransport& transport, const util::Clock& clock)
    : transport_(transport), clock_(clock) {}

Campaign::~Campaign() = default;

CampaignResult Campaign::Reject(const char* op, CampaignError error,
                                const std::string& reason) const {
    LOG_WARN(util::LogCategory::CAMPAIGN) << op << " rejected: "
                                          << CampaignErrorToString(error) << ": " << reason;
    return CampaignResult::Failure(error, reason);
}

CampaignResult Campaign::RequireInitialized(const char* op) const {
    if (!initialized_) {
        return Reject(op, CampaignError::State, Reason::NOT_INITIALIZED);
    }
    return CampaignResult::Success();
}

CampaignResult Campaign::Initialize(const CampaignConfig& config) {
    if (initialized_) {
        return Reject("initialize", CampaignError::State, Reason::ALREADY_INITIALIZED);
    }

    CampaignResult valid = ValidateConfig(config);
    if (!valid) {
        return Reject("initialize", CampaignError::Config, valid.reason);
    }

    if (transport_.GetDenomination() != config.denomination) {
        return Reject("initialize", CampaignError::Config,
                      "transport denomination " + transport_.GetDenomination().ToString() +
                      " does not match " + config.denomination.ToString());
    }

    OperationScope scope(*this);
    config_ = config;
    initialized_ = true;

    if (config_.HasFeeCollector()) {
        CampaignEvent event;
        event.type = EventType::FeeScheduleApplied;
        event.account = config_.feeCollector;
        event.upfrontBips = config_.upfrontFeeBips;
        event.payoutBips = config_.payoutFeeBips;
        Emit(event);
    }

    LOG_INFO(util::LogCategory::CAMPAIGN)
        << "Campaign initialized: recipient " << config_.recipient.ToString()
        << ", goal " << FormatAmount(config_.goalMin) << " - " << FormatAmount(config_.goalMax)
        << ", window " << util::FormatISO8601(config_.startsAt) << " to "
        << util::FormatISO8601(config_.endsAt) << ", " << config_.denomination.ToString();

    return scope.Commit(CampaignResult::Success());
}

// ============================================================================
// State Queries
// ============================================================================

bool Campaign::IsContributionAllowed() const {
    if (!initialized_ || totals_.state != CampaignState::Funding) {
        return false;
    }
    Timestamp now = clock_.Now();
    return now >= config_.startsAt && now < config_.endsAt && !IsGoalMaxMet();
}

bool Campaign::IsGoalMinMet() const {
    return initialized_ && DepositTotal() >= config_.goalMin;
}

bool Campaign::IsGoalMaxMet() const {
    return initialized_ && DepositTotal() >= config_.goalMax;
}

bool Campaign::IsSettlementAllowed() const {
    if (!initialized_ || totals_.state != CampaignState::Funding) {
        return false;
    }
    return IsGoalMaxMet() || (clock_.Now() >= config_.endsAt && IsGoalMinMet());
}

bool Campaign::IsFailureUnlockAllowed() const {
    if (!initialized_ || totals_.state != CampaignState::Funding) {
        return false;
    }
    Timestamp now = clock_.Now();
    return (now >= config_.endsAt && !IsGoalMinMet()) || now >= ExpiresAt();
}

FeeSchedule Campaign::GetFeeSchedule() const {
    return {config_.feeCollector, config_.upfrontFeeBips, config_.payoutFeeBips};
}

// ============================================================================
// Contribution
// ============================================================================

ContributionRange Campaign::ContributionRangeFor(const Address& account) const {
    if (!IsContributionAllowed()) {
        return {};
    }

    Amount balance = ledger_.BalanceOf(account);
    Amount remaining = config_.goalMax - DepositTotal();
    Amount personal = std::max<Amount>(config_.contributionMax - balance, 0);

    ContributionRange range;
    range.max = std::min(personal, remaining);
    range.min = config_.contributionMin - balance > 0 ? config_.contributionMin - balance : 1;
    if (remaining < config_.contributionMin) {
        range.min = 1;
    }

    if (range.min > range.max) {
        return {};
    }
    return range;
}

CampaignResult Campaign::ReceiveFunds(const Address& from, Amount amount) {
    auto received = transport_.TransferIn(from, amount);
    if (!received || *received < 0) {
        return CampaignResult::Failure(CampaignError::Transport, Reason::TRANSPORT_FAILED);
    }
    if (*received > amount) {
        return CampaignResult::Failure(CampaignError::Transport, Reason::OVER_DELIVERY);
    }
    if (config_.denomination.IsNative() && *received < amount) {
        return CampaignResult::Failure(CampaignError::Transport, Reason::SHORT_DELIVERY);
    }
    return CampaignResult::Success(*received);
}

CampaignResult Campaign::Contribute(const Address& account, Amount amount) {
    CampaignResult init = RequireInitialized("contribute");
    if (!init) {
        return init;
    }
    if (!IsContributionAllowed()) {
        return Reject("contribute", CampaignError::Window, Reason::WINDOW_CLOSED);
    }
    if (amount <= 0) {
        return Reject("contribute", CampaignError::Bounds, Reason::NON_POSITIVE);
    }

    Amount remaining = config_.goalMax - DepositTotal();
    if (amount > remaining) {
        return Reject("contribute", CampaignError::Bounds, Reason::GOAL_MAX_EXCEEDED);
    }

    ContributionRange range = ContributionRangeFor(account);
    if (amount > range.max) {
        return Reject("contribute", CampaignError::Bounds, Reason::ABOVE_MAXIMUM);
    }
    if (amount < range.min) {
        return Reject("contribute", CampaignError::Bounds, Reason::BELOW_MINIMUM);
    }

    OperationScope scope(*this);

    CampaignResult received = ReceiveFunds(account, amount);
    if (!received) {
        return Reject("contribute", received.error, received.reason);
    }
    Amount net = received.amount;

    // Bounds apply to what actually arrived
    Amount newBalance = ledger_.BalanceOf(account) + net;
    if (newBalance > config_.contributionMax) {
        return Reject("contribute", CampaignError::Bounds, Reason::ABOVE_MAXIMUM);
    }
    if (net <= 0 ||
        (newBalance < config_.contributionMin && remaining >= config_.contributionMin)) {
        return Reject("contribute", CampaignError::Bounds, Reason::BELOW_MINIMUM);
    }

    CampaignResult minted = ledger_.Mint(account, net);
    if (!minted) {
        return Reject("contribute", minted.error, minted.reason);
    }

    Emit(EventType::ContributionAccepted, account, net);

    LOG_INFO(util::LogCategory::CAMPAIGN) << "Contribution of " << FormatAmount(net) << " from "
                                          << account.ToString() << " (total "
                                          << FormatAmount(DepositTotal()) << ")";
    return scope.Commit(CampaignResult::Success(net));
}

// ============================================================================
// Resolution
// ============================================================================

CampaignResult Campaign::Settle() {
    CampaignResult init = RequireInitialized("settle");
    if (!init) {
        return init;
    }
    if (totals_.state != CampaignState::Funding) {
        return Reject("settle", CampaignError::State, Reason::NOT_FUNDING);
    }
    if (!IsSettlementAllowed()) {
        return Reject("settle", CampaignError::Window, Reason::SETTLEMENT_CLOSED);
    }

    Amount pool = DepositTotal();
    auto fee = ApplyBips(pool, config_.upfrontFeeBips);
    if (!fee) {
        return Reject("settle", CampaignError::Bounds, Reason::AMOUNT_OVERFLOW);
    }
    Amount net = pool - *fee;

    OperationScope scope(*this);

    totals_.state = CampaignState::Funded;
    totals_.processed = true;
    totals_.upfrontFeePaid = *fee;

    Emit(EventType::Settled, config_.recipient, net);
    if (*fee > 0) {
        Emit(EventType::FeePaid, config_.feeCollector, *fee);
    }

    if (!transport_.TransferOut(config_.recipient, net)) {
        return Reject("settle", CampaignError::Transport, Reason::TRANSPORT_FAILED);
    }
    if (*fee > 0 && !transport_.TransferOut(config_.feeCollector, *fee)) {
        return Reject("settle", CampaignError::Transport, Reason::TRANSPORT_FAILED);
    }

    LOG_INFO(util::LogCategory::CAMPAIGN) << "Settled: " << FormatAmount(net) << " to "
                                          << config_.recipient.ToString() << ", upfront fee "
                                          << FormatAmount(*fee);
    return scope.Commit(CampaignResult::Success(net));
}

CampaignResult Campaign::ReleaseFailed() {
    CampaignResult init = RequireInitialized("release");
    if (!init) {
        return init;
    }
    if (totals_.state != CampaignState::Funding) {
        return Reject("release", CampaignError::State, Reason::NOT_FUNDING);
    }
    if (!IsFailureUnlockAllowed()) {
        return Reject("release", CampaignError::Window, Reason::UNLOCK_CLOSED);
    }

    OperationScope scope(*this);

    totals_.state = CampaignState::Failed;
    totals_.processed = true;
    Emit(EventType::Failed, Address(), 0);

    LOG_INFO(util::LogCategory::CAMPAIGN) << "Campaign failed with "
                                          << FormatAmount(DepositTotal()) << " refundable";
    return scope.Commit(CampaignResult::Success());
}

// ============================================================================
// Yield and Withdrawal
// ============================================================================

CampaignResult Campaign::DepositYield(const Address& from, Amount amount) {
    CampaignResult init = RequireInitialized("deposit-yield");
    if (!init) {
        return init;
    }
    if (totals_.state != CampaignState::Funded) {
        return Reject("deposit-yield", CampaignError::State, Reason::NOT_FUNDED);
    }
    if (amount <= 0) {
        return Reject("deposit-yield", CampaignError::Bounds, Reason::NON_POSITIVE);
    }

    OperationScope scope(*this);

    CampaignResult received = ReceiveFunds(from, amount);
    if (!received) {
        return Reject("deposit-yield", received.error, received.reason);
    }
    if (received.amount == 0) {
        return Reject("deposit-yield", CampaignError::Bounds, Reason::NON_POSITIVE);
    }

    auto total = CheckedAdd(totals_.yieldTotal, received.amount);
    if (!total) {
        return Reject("deposit-yield", CampaignError::Bounds, Reason::AMOUNT_OVERFLOW);
    }
    totals_.yieldTotal = *total;

    Emit(EventType::YieldDeposited, from, received.amount);

    LOG_INFO(util::LogCategory::CAMPAIGN) << "Yield of " << FormatAmount(received.amount)
                                          << " deposited (total " << FormatAmount(*total) << ")";
    return scope.Commit(CampaignResult::Success(received.amount));
}

Amount Campaign::YieldBalanceOf(const Address& account) const {
    // Offsets keep the sum of earned amounts within yieldTotal after transfers
    Amount due = ledger_.EarnedOf(account, totals_.yieldTotal) - ledger_.WithdrawnOf(account);
    return due > 0 ? due : 0;
}

CampaignResult Campaign::Withdraw(const Address& account) {
    CampaignResult init = RequireInitialized("withdraw");
    if (!init) {
        return init;
    }

    if (totals_.state == CampaignState::Funding) {
        return Reject("withdraw", CampaignError::State, Reason::STILL_FUNDING);
    }

    if (totals_.state == CampaignState::Failed) {
        Amount refund = ledger_.BalanceOf(account);
        if (refund == 0) {
            return Reject("withdraw", CampaignError::Balance, Reason::NO_BALANCE);
        }

        OperationScope scope(*this);

        CampaignResult burned = ledger_.Burn(account, refund);
        if (!burned) {
            return Reject("withdraw", burned.error, burned.reason);
        }
        Emit(EventType::Withdrawn, account, refund);

        if (!transport_.TransferOut(account, refund)) {
            return Reject("withdraw", CampaignError::Transport, Reason::TRANSPORT_FAILED);
        }

        LOG_INFO(util::LogCategory::CAMPAIGN) << "Refunded " << FormatAmount(refund) << " to "
                                              << account.ToString();
        return scope.Commit(CampaignResult::Success(refund));
    }

    Amount due = YieldBalanceOf(account);
    if (due == 0) {
        return Reject("withdraw", CampaignError::Balance, Reason::NO_BALANCE);
    }

    auto fee = ApplyBips(due, config_.payoutFeeBips);
    if (!fee) {
        return Reject("withdraw", CampaignError::Bounds, Reason::AMOUNT_OVERFLOW);
    }
    Amount payout = due - *fee;

    OperationScope scope(*this);

    CampaignResult recorded = ledger_.RecordWithdrawal(account, due);
    if (!recorded) {
        return Reject("withdraw", recorded.error, recorded.reason);
    }
    auto feesTotal = CheckedAdd(totals_.payoutFeesTotal, *fee);
    if (!feesTotal) {
        return Reject("withdraw", CampaignError::Bounds, Reason::AMOUNT_OVERFLOW);
    }
    totals_.payoutFeesTotal = *feesTotal;

    Emit(EventType::Withdrawn, account, payout);
    if (*fee > 0) {
        Emit(EventType::FeePaid, config_.feeCollector, *fee);
    }

    // Ledger is final before any value leaves custody
    if (!transport_.TransferOut(account, payout)) {
        return Reject("withdraw", CampaignError::Transport, Reason::TRANSPORT_FAILED);
    }
    if (*fee > 0 && !transport_.TransferOut(config_.feeCollector, *fee)) {
        return Reject("withdraw", CampaignError::Transport, Reason::TRANSPORT_FAILED);
    }

    LOG_INFO(util::LogCategory::CAMPAIGN) << "Paid yield " << FormatAmount(payout) << " to "
                                          << account.ToString() << " (fee "
                                          << FormatAmount(*fee) << ")";
    return scope.Commit(CampaignResult::Success(payout));
}

// ============================================================================
// Shares
// ============================================================================

CampaignResult Campaign::DoTransfer(const Address& from, const Address& to, Amount amount) {
    CampaignResult moved = ledger_.Transfer(from, to, amount, totals_.yieldTotal);
    if (!moved) {
        return moved;
    }
    Emit(EventType::ShareTransfer, from, amount, to);
    return moved;
}

CampaignResult Campaign::Transfer(const Address& from, const Address& to, Amount amount) {
    CampaignResult init = RequireInitialized("transfer");
    if (!init) {
        return init;
    }

    OperationScope scope(*this);

    CampaignResult moved = DoTransfer(from, to, amount);
    if (!moved) {
        return Reject("transfer", moved.error, moved.reason);
    }

    LOG_DEBUG(util::LogCategory::CAMPAIGN) << "Transferred " << FormatAmount(amount)
                                           << " shares from " << from.ToString() << " to "
                                           << to.ToString();
    return scope.Commit(moved);
}

CampaignResult Campaign::Approve(const Address& owner, const Address& spender, Amount amount) {
    CampaignResult init = RequireInitialized("approve");
    if (!init) {
        return init;
    }
    if (spender.IsNull()) {
        return Reject("approve", CampaignError::Balance, Reason::INVALID_RECIPIENT);
    }
    if (amount < 0) {
        return Reject("approve", CampaignError::Bounds, Reason::NON_POSITIVE);
    }

    OperationScope scope(*this);
    ledger_.SetAllowance(owner, spender, amount);
    Emit(EventType::Approval, owner, amount, spender);
    return scope.Commit(CampaignResult::Success(amount));
}

Amount Campaign::Allowance(const Address& owner, const Address& spender) const {
    return ledger_.Allowance(owner, spender);
}

CampaignResult Campaign::TransferFrom(const Address& spender, const Address& from,
                                      const Address& to, Amount amount) {
    CampaignResult init = RequireInitialized("transfer-from");
    if (!init) {
        return init;
    }
    if (amount < 0) {
        return Reject("transfer-from", CampaignError::Bounds, Reason::NON_POSITIVE);
    }

    OperationScope scope(*this);

    CampaignResult spent = ledger_.SpendAllowance(from, spender, amount);
    if (!spent) {
        return Reject("transfer-from", spent.error, spent.reason);
    }

    CampaignResult moved = DoTransfer(from, to, amount);
    if (!moved) {
        return Reject("transfer-from", moved.error, moved.reason);
    }

    return scope.Commit(moved);
}

// ============================================================================
// Events
// ============================================================================

void Campaign::Emit(CampaignEvent event) {
    event.time = clock_.Now();
    pending_.push_back(std::move(event));
}

void Campaign::Emit(EventType type, const Address& account, Amount amount,
                    const Address& counterparty) {
    CampaignEvent event;
    event.type = type;
    event.account = account;
    event.counterparty = counterparty;
    event.amount = amount;
    Emit(std::move(event));
}

void Campaign::Publish() {
    std::vector<CampaignEvent> batch;
    batch.swap(pending_);

    for (const auto& event : batch) {
        events_.push_back(event);
        LOG_DEBUG(util::LogCategory::CAMPAIGN) << "Event " << event.ToString();

        // Copy: a subscriber may subscribe or unsubscribe while notified
        auto subscribers = subscribers_;
        for (const auto& entry : subscribers) {
            entry.second(event);
        }
    }
}

size_t Campaign::Subscribe(EventCallback callback) {
    size_t id = nextSubscriberId_++;
    subscribers_.emplace(id, std::move(callback));
    return id;
}

void Campaign::Unsubscribe(size_t id) {
    subscribers_.erase(id);
}

// ============================================================================
// Persistence
// ============================================================================

CampaignSnapshot Campaign::Snapshot() const {
    CampaignSnapshot snapshot;
    snapshot.config = config_;
    snapshot.totals = totals_;
    snapshot.accounts = ledger_.GetAccounts();
    snapshot.allowances = ledger_.GetAllowances();
    return snapshot;
}

CampaignResult Campaign::Restore(const CampaignSnapshot& snapshot) {
    if (initialized_) {
        return Reject("restore", CampaignError::State, Reason::ALREADY_INITIALIZED);
    }

    CampaignResult valid = ValidateConfig(snapshot.config);
    if (!valid) {
        return Reject("restore", CampaignError::Config, valid.reason);
    }
    if (transport_.GetDenomination() != snapshot.config.denomination) {
        return Reject("restore", CampaignError::Config, "transport denomination mismatch");
    }

    const CampaignTotals& t = snapshot.totals;
    bool consistent = t.yieldTotal >= 0 && t.payoutFeesTotal >= 0 && t.upfrontFeePaid >= 0 &&
                      t.processed == (t.state != CampaignState::Funding) &&
                      (t.state == CampaignState::Funded || t.yieldTotal == 0);
    ShareLedger staged;
    if (!consistent || !staged.Restore(snapshot.accounts, snapshot.allowances)) {
        return Reject("restore", CampaignError::Config, "inconsistent snapshot");
    }
    // Nobody may have been paid more than they earned
    bool covered = staged.TotalWithdrawn() <= t.yieldTotal;
    for (const auto& [account, state] : snapshot.accounts) {
        covered = covered && staged.EarnedOf(account, t.yieldTotal) >= state.withdrawn;
    }
    if (!covered || ledger_.JournalDepth() != 0) {
        return Reject("restore", CampaignError::Config, "inconsistent snapshot");
    }
    ledger_ = std::move(staged);

    config_ = snapshot.config;
    totals_ = snapshot.totals;
    initialized_ = true;

    LOG_INFO(util::LogCategory::CAMPAIGN) << "Restored campaign in state "
                                          << CampaignStateToString(totals_.state) << " with "
                                          << ledger_.AccountCount() << " accounts";
    return CampaignResult::Success();
}

} // namespace campaign
} // namespace crowdfund
