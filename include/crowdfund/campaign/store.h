// CROWDFUND - Campaign Store
// Copyright (c) 2024 CROWDFUND Developers
// MIT License
//
// Persists campaign snapshots in the key-value database.
//
// Layout (id = length-prefixed campaign id):
//   'V'                          -> format version
//   'c' + id                     -> CampaignConfig
//   's' + id                     -> CampaignTotals
//   'a' + id + address           -> AccountState
//   'w' + id + owner + spender   -> allowance

#ifndef CROWDFUND_CAMPAIGN_STORE_H
#define CROWDFUND_CAMPAIGN_STORE_H

#include "crowdfund/campaign/campaign.h"
#include "crowdfund/core/serialize.h"
#include "crowdfund/db/database.h"

#include <ios>
#include <string>

namespace crowdfund {
namespace campaign {

// ============================================================================
// Serialization
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const Denomination& denom) {
    crowdfund::Serialize(s, static_cast<uint8_t>(denom.kind));
    crowdfund::Serialize(s, denom.reference);
}

template<typename Stream>
void Unserialize(Stream& s, Denomination& denom) {
    uint8_t kind;
    crowdfund::Unserialize(s, kind);
    if (kind > static_cast<uint8_t>(Denomination::Kind::ExternalFungible)) {
        throw std::ios_base::failure("invalid denomination kind");
    }
    denom.kind = static_cast<Denomination::Kind>(kind);
    crowdfund::Unserialize(s, denom.reference);
}

template<typename Stream>
void Serialize(Stream& s, const CampaignConfig& config) {
    crowdfund::Serialize(s, config.recipient);
    crowdfund::Serialize(s, config.feeCollector);
    crowdfund::Serialize(s, static_cast<int32_t>(config.upfrontFeeBips));
    crowdfund::Serialize(s, static_cast<int32_t>(config.payoutFeeBips));
    crowdfund::Serialize(s, config.goalMin);
    crowdfund::Serialize(s, config.goalMax);
    crowdfund::Serialize(s, config.contributionMin);
    crowdfund::Serialize(s, config.contributionMax);
    crowdfund::Serialize(s, config.startsAt);
    crowdfund::Serialize(s, config.endsAt);
    Serialize(s, config.denomination);
}

template<typename Stream>
void Unserialize(Stream& s, CampaignConfig& config) {
    int32_t upfront;
    int32_t payout;
    crowdfund::Unserialize(s, config.recipient);
    crowdfund::Unserialize(s, config.feeCollector);
    crowdfund::Unserialize(s, upfront);
    crowdfund::Unserialize(s, payout);
    config.upfrontFeeBips = upfront;
    config.payoutFeeBips = payout;
    crowdfund::Unserialize(s, config.goalMin);
    crowdfund::Unserialize(s, config.goalMax);
    crowdfund::Unserialize(s, config.contributionMin);
    crowdfund::Unserialize(s, config.contributionMax);
    crowdfund::Unserialize(s, config.startsAt);
    crowdfund::Unserialize(s, config.endsAt);
    Unserialize(s, config.denomination);
}

template<typename Stream>
void Serialize(Stream& s, const CampaignTotals& totals) {
    crowdfund::Serialize(s, static_cast<uint8_t>(totals.state));
    crowdfund::Serialize(s, totals.processed);
    crowdfund::Serialize(s, totals.yieldTotal);
    crowdfund::Serialize(s, totals.payoutFeesTotal);
    crowdfund::Serialize(s, totals.upfrontFeePaid);
}

template<typename Stream>
void Unserialize(Stream& s, CampaignTotals& totals) {
    uint8_t state;
    crowdfund::Unserialize(s, state);
    if (state > static_cast<uint8_t>(CampaignState::Failed)) {
        throw std::ios_base::failure("invalid campaign state");
    }
    totals.state = static_cast<CampaignState>(state);
    crowdfund::Unserialize(s, totals.processed);
    crowdfund::Unserialize(s, totals.yieldTotal);
    crowdfund::Unserialize(s, totals.payoutFeesTotal);
    crowdfund::Unserialize(s, totals.upfrontFeePaid);
}

template<typename Stream>
void Serialize(Stream& s, const AccountState& account) {
    crowdfund::Serialize(s, account.shares);
    crowdfund::Serialize(s, account.withdrawn);
    crowdfund::Serialize(s, account.yieldOffset);
}

template<typename Stream>
void Unserialize(Stream& s, AccountState& account) {
    crowdfund::Unserialize(s, account.shares);
    crowdfund::Unserialize(s, account.withdrawn);
    crowdfund::Unserialize(s, account.yieldOffset);
}

// ============================================================================
// CampaignStore
// ============================================================================

/**
 * Campaign state in a Database, keyed by campaign id.
 *
 * Save() writes a complete snapshot in one batch, replacing whatever was
 * stored under the id before. Several campaigns may share a database.
 */
class CampaignStore {
public:
    /// Store format version; 2 widened amounts to 16 bytes and added yield offsets
    static constexpr uint32_t FORMAT_VERSION = 2;

    CampaignStore(db::Database& db, const std::string& campaignId);

    const std::string& GetId() const { return id_; }

    /// Whether a campaign is stored under this id
    bool Exists();

    db::Status Save(const Campaign& campaign);
    db::Status Save(const CampaignSnapshot& snapshot);

    /**
     * Read the stored snapshot.
     * @return NotFound if nothing is stored, Corruption on undecodable data
     */
    db::Status Load(CampaignSnapshot& out);

    /// Remove every key of this campaign
    db::Status Erase();

private:
    std::string ConfigKey() const;
    std::string StateKey() const;
    std::string AccountKey(const Address& account) const;
    std::string AllowanceEntryKey(const Address& owner, const Address& spender) const;

    /// Queue deletes for every key under prefix + id; adds the number queued to `count`
    db::Status DeleteRange(char prefix, db::WriteBatch& batch, size_t& count);

    db::Database& db_;
    std::string id_;

    /// Serialized id shared by every key of this campaign
    std::string keyId_;
};

} // namespace campaign
} // namespace crowdfund

#endif // CROWDFUND_CAMPAIGN_STORE_H
