// CROWDFUND - Value Transport Implementation
// Copyright (c) 2024 CROWDFUND Developers
// MIT License

#include "crowdfund/campaign/transport.h"
#include "crowdfund/core/arith.h"
#include "crowdfund/util/logging.h"

namespace crowdfund {
namespace campaign {

// ============================================================================
// MemoryAssetBook
// ============================================================================

MemoryAssetBook::Key MemoryAssetBook::MakeKey(const Denomination& denom, const Address& holder) {
    return {denom.IsNative() ? NullAddress() : denom.reference, holder};
}

void MemoryAssetBook::SetBalance(const Key& key, Amount value) {
    auto it = balances_.find(key);
    Amount previous = (it == balances_.end()) ? 0 : it->second;
    if (!marks_.empty()) {
        undo_.emplace_back(key, previous);
    }
    balances_[key] = value;
}

Amount MemoryAssetBook::BalanceOf(const Denomination& denom, const Address& holder) const {
    auto it = balances_.find(MakeKey(denom, holder));
    return it == balances_.end() ? 0 : it->second;
}

bool MemoryAssetBook::Mint(const Denomination& denom, const Address& holder, Amount amount) {
    if (amount < 0) {
        return false;
    }
    auto sum = CheckedAdd(BalanceOf(denom, holder), amount);
    if (!sum) {
        return false;
    }
    SetBalance(MakeKey(denom, holder), *sum);
    return true;
}

bool MemoryAssetBook::Move(const Denomination& denom, const Address& from,
                           const Address& to, Amount amount) {
    if (amount < 0) {
        return false;
    }
    if (amount == 0 || from == to) {
        return BalanceOf(denom, from) >= amount;
    }

    auto fromBalance = CheckedSub(BalanceOf(denom, from), amount);
    auto toBalance = CheckedAdd(BalanceOf(denom, to), amount);
    if (!fromBalance || !toBalance) {
        return false;
    }

    SetBalance(MakeKey(denom, from), *fromBalance);
    SetBalance(MakeKey(denom, to), *toBalance);
    return true;
}

bool MemoryAssetBook::Burn(const Denomination& denom, const Address& holder, Amount amount) {
    if (amount < 0) {
        return false;
    }
    auto remaining = CheckedSub(BalanceOf(denom, holder), amount);
    if (!remaining) {
        return false;
    }
    SetBalance(MakeKey(denom, holder), *remaining);
    return true;
}

Amount MemoryAssetBook::TotalSupply(const Denomination& denom) const {
    Address token = denom.IsNative() ? NullAddress() : denom.reference;
    Amount total = 0;
    for (const auto& [key, balance] : balances_) {
        if (key.first == token) {
            total += balance;
        }
    }
    return total;
}

size_t MemoryAssetBook::Checkpoint() {
    marks_.push_back(undo_.size());
    return marks_.size();
}

void MemoryAssetBook::Revert(size_t id) {
    if (id == 0 || id != marks_.size()) {
        LOG_ERROR(util::LogCategory::TRANSPORT) << "Revert of checkpoint " << id
                                                << " out of order (open " << marks_.size() << ")";
        return;
    }

    size_t mark = marks_.back();
    while (undo_.size() > mark) {
        const auto& entry = undo_.back();
        balances_[entry.first] = entry.second;
        undo_.pop_back();
    }
    marks_.pop_back();
}

void MemoryAssetBook::Release(size_t id) {
    if (id == 0 || id != marks_.size()) {
        LOG_ERROR(util::LogCategory::TRANSPORT) << "Release of checkpoint " << id
                                                << " out of order (open " << marks_.size() << ")";
        return;
    }

    marks_.pop_back();
    // Entries stay until the outermost checkpoint closes; an outer Revert
    // still needs them.
    if (marks_.empty()) {
        undo_.clear();
    }
}

// ============================================================================
// MemoryTransport
// ============================================================================

MemoryTransport::MemoryTransport(MemoryAssetBook& book, const Denomination& denom,
                                 const Address& custody)
    : book_(book), denom_(denom), custody_(custody) {}

std::optional<Amount> MemoryTransport::TransferIn(const Address& from, Amount amount) {
    if (amount <= 0 || failingSources_.count(from)) {
        LOG_DEBUG(util::LogCategory::TRANSPORT) << "Inbound transfer from " << from.ToString()
                                                << " rejected";
        return std::nullopt;
    }

    if (!book_.Move(denom_, from, custody_, amount)) {
        LOG_DEBUG(util::LogCategory::TRANSPORT) << "Inbound transfer of " << FormatAmount(amount)
                                                << " from " << from.ToString()
                                                << " failed: insufficient funds";
        return std::nullopt;
    }

    Amount fee = 0;
    if (!denom_.IsNative() && transferFeeBips_ > 0) {
        fee = ApplyBips(amount, transferFeeBips_).value_or(0);
        if (fee > 0 && !book_.Burn(denom_, custody_, fee)) {
            return std::nullopt;
        }
    }

    return amount - fee;
}

bool MemoryTransport::TransferOut(const Address& to, Amount amount) {
    if (amount <= 0 || to.IsNull() || failingDestinations_.count(to)) {
        LOG_DEBUG(util::LogCategory::TRANSPORT) << "Outbound transfer to " << to.ToString()
                                                << " rejected";
        return false;
    }

    if (!book_.Move(denom_, custody_, to, amount)) {
        LOG_WARN(util::LogCategory::TRANSPORT) << "Outbound transfer of " << FormatAmount(amount)
                                               << " exceeds custody holdings";
        return false;
    }

    if (hook_) {
        hook_(to, amount);
    }
    return true;
}

Amount MemoryTransport::BalanceOf(const Address& holder) const {
    return book_.BalanceOf(denom_, holder);
}

Amount MemoryTransport::Holdings() const {
    return book_.BalanceOf(denom_, custody_);
}

void MemoryTransport::ClearFailures() {
    failingDestinations_.clear();
    failingSources_.clear();
}

} // namespace campaign
} // namespace crowdfund
