// CROWDFUND - Share Ledger Implementation
// Copyright (c) 2024 CROWDFUND Developers
// MIT License

#include "crowdfund/campaign/ledger.h"
#include "crowdfund/core/arith.h"
#include "crowdfund/util/logging.h"

#include <optional>
#include <tuple>
#include <utility>

namespace crowdfund {
namespace campaign {

namespace {

CampaignResult Overflow() {
    return CampaignResult::Failure(CampaignError::Bounds, Reason::AMOUNT_OVERFLOW);
}

/// quot = floor(num / div) for div > 0; BN_div truncates toward zero
bool FloorDiv(BIGNUM* quot, const BIGNUM* num, const BIGNUM* div, BN_CTX* ctx) {
    BIGNUM* rem = BN_CTX_get(ctx);
    if (rem == nullptr || BN_div(quot, rem, num, div, ctx) != 1) {
        return false;
    }
    if (!BN_is_zero(rem) && BN_is_negative(rem)) {
        return BN_sub_word(quot, 1) == 1;
    }
    return true;
}

/// out = shares * yieldTotal - withdrawn * totalShares - offset
bool PendingScaled(BIGNUM* out, const AccountState& state, const BIGNUM* yieldTotal,
                   const BIGNUM* totalShares, BN_CTX* ctx) {
    BIGNUM* shares = BN_CTX_get(ctx);
    BIGNUM* withdrawn = BN_CTX_get(ctx);
    BIGNUM* offset = BN_CTX_get(ctx);
    return offset != nullptr &&
           AmountToBN(state.shares, shares) && AmountToBN(state.withdrawn, withdrawn) &&
           AmountToBN(state.yieldOffset, offset) &&
           BN_mul(out, shares, yieldTotal, ctx) == 1 &&
           BN_mul(withdrawn, withdrawn, totalShares, ctx) == 1 &&
           BN_sub(out, out, withdrawn) == 1 &&
           BN_sub(out, out, offset) == 1;
}

/**
 * Offset shift for a share move. With P the sender's scaled pending claim,
 * the receiver takes floor(P * amount / shares) of it:
 *   shift = floor(P * amount / shares) + moved * totalShares - amount * yieldTotal
 * The sender's offset grows by the shift and the receiver's shrinks by it.
 */
std::optional<std::pair<Amount, Amount>> ShiftOffsets(const AccountState& from,
                                                      const AccountState& to,
                                                      Amount amount, Amount moved,
                                                      Amount yieldTotal, Amount totalShares) {
    BN_CTX* ctx = BN_CTX_new();
    if (ctx == nullptr) {
        return std::nullopt;
    }
    BN_CTX_start(ctx);

    BIGNUM* y = BN_CTX_get(ctx);
    BIGNUM* total = BN_CTX_get(ctx);
    BIGNUM* pending = BN_CTX_get(ctx);
    BIGNUM* a = BN_CTX_get(ctx);
    BIGNUM* b = BN_CTX_get(ctx);
    BIGNUM* shift = BN_CTX_get(ctx);
    BIGNUM* tmp = BN_CTX_get(ctx);
    BIGNUM* fromOffset = BN_CTX_get(ctx);
    BIGNUM* toOffset = BN_CTX_get(ctx);

    std::optional<std::pair<Amount, Amount>> result;

    bool ok = toOffset != nullptr &&
              AmountToBN(yieldTotal, y) && AmountToBN(totalShares, total) &&
              AmountToBN(amount, a) && AmountToBN(from.shares, b) &&
              PendingScaled(pending, from, y, total, ctx);
    if (ok && BN_is_negative(pending)) {
        // Never produced by this ledger; nothing to hand over
        BN_zero(pending);
    }
    ok = ok &&
         BN_mul(pending, pending, a, ctx) == 1 &&
         FloorDiv(shift, pending, b, ctx) &&
         AmountToBN(moved, tmp) && BN_mul(tmp, tmp, total, ctx) == 1 &&
         BN_add(shift, shift, tmp) == 1 &&
         BN_mul(tmp, a, y, ctx) == 1 &&
         BN_sub(shift, shift, tmp) == 1 &&
         AmountToBN(from.yieldOffset, fromOffset) && AmountToBN(to.yieldOffset, toOffset) &&
         BN_add(fromOffset, fromOffset, shift) == 1 &&
         BN_sub(toOffset, toOffset, shift) == 1;

    if (ok) {
        auto newFrom = AmountFromBN(fromOffset);
        auto newTo = AmountFromBN(toOffset);
        if (newFrom && newTo) {
            result = std::make_pair(*newFrom, *newTo);
        }
    }

    BN_CTX_end(ctx);
    BN_CTX_free(ctx);
    return result;
}

} // namespace

// ============================================================================
// Queries
// ============================================================================

Amount ShareLedger::BalanceOf(const Address& account) const {
    auto it = accounts_.find(account);
    return it == accounts_.end() ? 0 : it->second.shares;
}

Amount ShareLedger::WithdrawnOf(const Address& account) const {
    auto it = accounts_.find(account);
    return it == accounts_.end() ? 0 : it->second.withdrawn;
}

Amount ShareLedger::YieldOffsetOf(const Address& account) const {
    auto it = accounts_.find(account);
    return it == accounts_.end() ? 0 : it->second.yieldOffset;
}

Amount ShareLedger::EarnedOf(const Address& account, Amount yieldTotal) const {
    auto it = accounts_.find(account);
    if (it == accounts_.end() || totalShares_ <= 0 || yieldTotal <= 0) {
        return 0;
    }
    const AccountState& state = it->second;
    if (state.yieldOffset == 0) {
        return MulDiv(state.shares, yieldTotal, totalShares_).value_or(0);
    }

    BN_CTX* ctx = BN_CTX_new();
    if (ctx == nullptr) {
        return 0;
    }
    BN_CTX_start(ctx);

    BIGNUM* num = BN_CTX_get(ctx);
    BIGNUM* y = BN_CTX_get(ctx);
    BIGNUM* offset = BN_CTX_get(ctx);
    BIGNUM* total = BN_CTX_get(ctx);
    BIGNUM* quot = BN_CTX_get(ctx);

    Amount earned = 0;
    if (quot != nullptr &&
        AmountToBN(state.shares, num) && AmountToBN(yieldTotal, y) &&
        AmountToBN(state.yieldOffset, offset) && AmountToBN(totalShares_, total) &&
        BN_mul(num, num, y, ctx) == 1 &&
        BN_sub(num, num, offset) == 1 &&
        FloorDiv(quot, num, total, ctx)) {
        earned = AmountFromBN(quot).value_or(0);
    }

    BN_CTX_end(ctx);
    BN_CTX_free(ctx);
    return earned;
}

Amount ShareLedger::Allowance(const Address& owner, const Address& spender) const {
    auto it = allowances_.find({owner, spender});
    return it == allowances_.end() ? 0 : it->second;
}

// ============================================================================
// Journal Bookkeeping
// ============================================================================

AccountState& ShareLedger::Touch(const Address& account) {
    auto it = accounts_.find(account);
    if (!journals_.empty()) {
        std::optional<AccountState> before;
        if (it != accounts_.end()) {
            before = it->second;
        }
        // First touch in this journal keeps the before-image
        journals_.back().accounts.emplace(account, before);
    }
    if (it == accounts_.end()) {
        it = accounts_.emplace(account, AccountState{}).first;
    }
    return it->second;
}

void ShareLedger::TouchAllowance(const AllowanceKey& key) {
    if (journals_.empty()) {
        return;
    }
    std::optional<Amount> before;
    auto it = allowances_.find(key);
    if (it != allowances_.end()) {
        before = it->second;
    }
    journals_.back().allowances.emplace(key, before);
}

void ShareLedger::Begin() {
    Journal journal;
    journal.totalShares = totalShares_;
    journal.totalWithdrawn = totalWithdrawn_;
    journals_.push_back(std::move(journal));
}

void ShareLedger::Commit() {
    if (journals_.empty()) {
        LOG_ERROR(util::LogCategory::LEDGER) << "Commit without an open journal";
        return;
    }

    Journal top = std::move(journals_.back());
    journals_.pop_back();

    if (!journals_.empty()) {
        // Entries the outer journal has not seen yet carry their
        // before-image upward so an outer rollback still restores them.
        Journal& outer = journals_.back();
        for (auto& entry : top.accounts) {
            outer.accounts.emplace(entry.first, entry.second);
        }
        for (auto& entry : top.allowances) {
            outer.allowances.emplace(entry.first, entry.second);
        }
    }
}

void ShareLedger::Rollback() {
    if (journals_.empty()) {
        LOG_ERROR(util::LogCategory::LEDGER) << "Rollback without an open journal";
        return;
    }

    Journal& top = journals_.back();
    for (const auto& [account, before] : top.accounts) {
        if (before) {
            accounts_[account] = *before;
        } else {
            accounts_.erase(account);
        }
    }
    for (const auto& [key, before] : top.allowances) {
        if (before) {
            allowances_[key] = *before;
        } else {
            allowances_.erase(key);
        }
    }
    totalShares_ = top.totalShares;
    totalWithdrawn_ = top.totalWithdrawn;

    LOG_TRACE(util::LogCategory::LEDGER) << "Rolled back " << top.accounts.size()
                                         << " account entries";
    journals_.pop_back();
}

// ============================================================================
// Mutations
// ============================================================================

CampaignResult ShareLedger::Mint(const Address& account, Amount amount) {
    if (amount < 0) {
        return CampaignResult::Failure(CampaignError::Bounds, Reason::NON_POSITIVE);
    }

    auto total = CheckedAdd(totalShares_, amount);
    auto balance = CheckedAdd(BalanceOf(account), amount);
    if (!total || !balance) {
        return Overflow();
    }

    Touch(account).shares = *balance;
    totalShares_ = *total;
    return CampaignResult::Success(amount);
}

CampaignResult ShareLedger::Burn(const Address& account, Amount amount) {
    if (amount < 0) {
        return CampaignResult::Failure(CampaignError::Bounds, Reason::NON_POSITIVE);
    }

    auto balance = CheckedSub(BalanceOf(account), amount);
    if (!balance) {
        return CampaignResult::Failure(CampaignError::Balance, Reason::INSUFFICIENT_BALANCE);
    }

    Touch(account).shares = *balance;
    totalShares_ -= amount;
    return CampaignResult::Success(amount);
}

CampaignResult ShareLedger::RecordWithdrawal(const Address& account, Amount amount) {
    if (amount < 0) {
        return CampaignResult::Failure(CampaignError::Bounds, Reason::NON_POSITIVE);
    }

    auto withdrawn = CheckedAdd(WithdrawnOf(account), amount);
    auto total = CheckedAdd(totalWithdrawn_, amount);
    if (!withdrawn || !total) {
        return Overflow();
    }

    Touch(account).withdrawn = *withdrawn;
    totalWithdrawn_ = *total;
    return CampaignResult::Success(amount);
}

CampaignResult ShareLedger::Transfer(const Address& from, const Address& to, Amount amount,
                                     Amount yieldTotal) {
    if (to.IsNull()) {
        return CampaignResult::Failure(CampaignError::Balance, Reason::INVALID_RECIPIENT);
    }
    if (amount < 0) {
        return CampaignResult::Failure(CampaignError::Bounds, Reason::NON_POSITIVE);
    }

    Amount fromShares = BalanceOf(from);
    if (amount > fromShares) {
        return CampaignResult::Failure(CampaignError::Balance, Reason::INSUFFICIENT_BALANCE);
    }
    if (amount == 0 || from == to) {
        return CampaignResult::Success(amount);
    }

    AccountState source;
    AccountState target;
    if (auto it = accounts_.find(from); it != accounts_.end()) {
        source = it->second;
    }
    if (auto it = accounts_.find(to); it != accounts_.end()) {
        target = it->second;
    }

    auto moved = MulDiv(source.withdrawn, amount, fromShares);
    auto toShares = CheckedAdd(target.shares, amount);
    if (!moved || !toShares) {
        return Overflow();
    }
    auto toWithdrawn = CheckedAdd(target.withdrawn, *moved);
    if (!toWithdrawn) {
        return Overflow();
    }

    Amount fromOffset = source.yieldOffset;
    Amount toOffset = target.yieldOffset;
    if (yieldTotal > 0) {
        auto offsets = ShiftOffsets(source, target, amount, *moved, yieldTotal, totalShares_);
        if (!offsets) {
            return Overflow();
        }
        std::tie(fromOffset, toOffset) = *offsets;
    }

    AccountState& sender = Touch(from);
    sender.shares = fromShares - amount;
    sender.withdrawn = source.withdrawn - *moved;
    sender.yieldOffset = fromOffset;

    AccountState& receiver = Touch(to);
    receiver.shares = *toShares;
    receiver.withdrawn = *toWithdrawn;
    receiver.yieldOffset = toOffset;

    LOG_TRACE(util::LogCategory::LEDGER) << "Moved " << FormatAmount(amount) << " shares and "
                                         << FormatAmount(*moved) << " withdrawn from "
                                         << from.ToString() << " to " << to.ToString();
    return CampaignResult::Success(amount);
}

void ShareLedger::SetAllowance(const Address& owner, const Address& spender, Amount amount) {
    AllowanceKey key{owner, spender};
    TouchAllowance(key);
    allowances_[key] = amount;
}

CampaignResult ShareLedger::SpendAllowance(const Address& owner, const Address& spender,
                                           Amount amount) {
    Amount current = Allowance(owner, spender);
    if (amount > current) {
        return CampaignResult::Failure(CampaignError::Balance, Reason::INSUFFICIENT_ALLOWANCE);
    }
    SetAllowance(owner, spender, current - amount);
    return CampaignResult::Success(amount);
}

bool ShareLedger::Restore(const std::map<Address, AccountState>& accounts,
                          const std::map<AllowanceKey, Amount>& allowances) {
    if (!journals_.empty()) {
        return false;
    }

    Amount shares = 0;
    Amount withdrawn = 0;
    Amount credits = 0;
    Amount debits = 0;
    for (const auto& [account, state] : accounts) {
        if (state.shares < 0 || state.withdrawn < 0) {
            return false;
        }
        auto s = CheckedAdd(shares, state.shares);
        auto w = CheckedAdd(withdrawn, state.withdrawn);
        if (!s || !w) {
            return false;
        }
        shares = *s;
        withdrawn = *w;

        // Offsets only move between accounts, so they must cancel out
        if (state.yieldOffset == -MAX_AMOUNT - 1) {
            return false;
        }
        Amount& side = state.yieldOffset >= 0 ? credits : debits;
        auto o = CheckedAdd(side, state.yieldOffset >= 0 ? state.yieldOffset : -state.yieldOffset);
        if (!o) {
            return false;
        }
        side = *o;
    }
    if (credits != debits) {
        return false;
    }

    accounts_ = accounts;
    allowances_ = allowances;
    totalShares_ = shares;
    totalWithdrawn_ = withdrawn;
    return true;
}

} // namespace campaign
} // namespace crowdfund
