// CROWDFUND - Campaign Store Implementation
// Copyright (c) 2024 CROWDFUND Developers
// MIT License

#include "crowdfund/campaign/store.h"
#include "crowdfund/util/logging.h"

namespace crowdfund {
namespace campaign {

namespace {

std::string AddressBytes(const Address& address) {
    return std::string(reinterpret_cast<const char*>(address.data()), Address::SIZE);
}

Address AddressAt(const db::Slice& key, size_t offset) {
    return Address(Hash160(reinterpret_cast<const Byte*>(key.data() + offset), Hash160::SIZE));
}

} // namespace

// ============================================================================
// Construction and Keys
// ============================================================================

CampaignStore::CampaignStore(db::Database& db, const std::string& campaignId)
    : db_(db), id_(campaignId) {
    DataStream ss;
    crowdfund::Serialize(ss, id_);
    keyId_ = ss.str();
}

std::string CampaignStore::ConfigKey() const {
    return db::MakeKey(db::prefix::CONFIG, keyId_);
}

std::string CampaignStore::StateKey() const {
    return db::MakeKey(db::prefix::STATE, keyId_);
}

std::string CampaignStore::AccountKey(const Address& account) const {
    return db::MakeKey(db::prefix::ACCOUNT, keyId_ + AddressBytes(account));
}

std::string CampaignStore::AllowanceEntryKey(const Address& owner, const Address& spender) const {
    return db::MakeKey(db::prefix::ALLOWANCE,
                       keyId_ + AddressBytes(owner) + AddressBytes(spender));
}

bool CampaignStore::Exists() {
    return db_.Exists(ConfigKey());
}

db::Status CampaignStore::DeleteRange(char prefix, db::WriteBatch& batch, size_t& count) {
    return db::ScanPrefix(db_, db::MakeKey(prefix, keyId_),
                          [&](const db::Slice& key, const db::Slice&) {
                              batch.Delete(key);
                              ++count;
                              return true;
                          });
}

// ============================================================================
// Save
// ============================================================================

db::Status CampaignStore::Save(const Campaign& campaign) {
    if (!campaign.IsInitialized()) {
        return db::Status::InvalidArgument("campaign not initialized");
    }
    return Save(campaign.Snapshot());
}

db::Status CampaignStore::Save(const CampaignSnapshot& snapshot) {
    db::WriteBatch batch;

    // Stale entries go first; the puts below override any key they share
    size_t stale = 0;
    db::Status s = DeleteRange(db::prefix::ACCOUNT, batch, stale);
    if (s.ok()) {
        s = DeleteRange(db::prefix::ALLOWANCE, batch, stale);
    }
    if (!s.ok()) {
        return s;
    }

    batch.Put(db::MakeKey(db::prefix::VERSION), db::SerializeToString(FORMAT_VERSION));
    batch.Put(ConfigKey(), db::SerializeToString(snapshot.config));
    batch.Put(StateKey(), db::SerializeToString(snapshot.totals));

    for (const auto& [account, state] : snapshot.accounts) {
        batch.Put(AccountKey(account), db::SerializeToString(state));
    }
    for (const auto& [key, amount] : snapshot.allowances) {
        batch.Put(AllowanceEntryKey(key.first, key.second), db::SerializeToString(amount));
    }

    db::WriteOptions opts;
    opts.sync = true;
    s = db_.Write(opts, &batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::STORE) << "Failed to save campaign '" << id_
                                            << "': " << s.ToString();
        return s;
    }

    LOG_DEBUG(util::LogCategory::STORE) << "Saved campaign '" << id_ << "' ("
                                        << snapshot.accounts.size() << " accounts, "
                                        << snapshot.allowances.size() << " allowances, "
                                        << stale << " entries rewritten)";
    return s;
}

// ============================================================================
// Load
// ============================================================================

db::Status CampaignStore::Load(CampaignSnapshot& out) {
    std::string value;

    db::Status s = db_.Get(db::MakeKey(db::prefix::VERSION), &value);
    if (s.IsNotFound()) {
        return db::Status::NotFound("no campaign store");
    }
    if (!s.ok()) {
        return s;
    }
    uint32_t version = 0;
    if (!db::DeserializeFromString(value, version) || version != FORMAT_VERSION) {
        return db::Status::Corruption("unsupported store format version");
    }

    CampaignSnapshot snapshot;

    s = db_.Get(ConfigKey(), &value);
    if (!s.ok()) {
        return s.IsNotFound() ? db::Status::NotFound("campaign '" + id_ + "' not stored") : s;
    }
    if (!db::DeserializeFromString(value, snapshot.config)) {
        return db::Status::Corruption("undecodable config of campaign '" + id_ + "'");
    }

    s = db_.Get(StateKey(), &value);
    if (!s.ok()) {
        return s.IsNotFound() ? db::Status::Corruption("missing state of campaign '" + id_ + "'")
                              : s;
    }
    if (!db::DeserializeFromString(value, snapshot.totals)) {
        return db::Status::Corruption("undecodable state of campaign '" + id_ + "'");
    }

    db::ReadOptions scan;
    scan.verify_checksums = true;
    scan.fill_cache = false;

    const size_t accountKeySize = 1 + keyId_.size() + Address::SIZE;
    db::Status decode = db::Status::Ok();
    s = db::ScanPrefix(db_, db::MakeKey(db::prefix::ACCOUNT, keyId_),
                       [&](const db::Slice& key, const db::Slice& value) {
                           AccountState state;
                           if (key.size() != accountKeySize) {
                               decode = db::Status::Corruption("malformed account key");
                           } else if (!db::DeserializeFromString(value.ToString(), state)) {
                               decode = db::Status::Corruption("undecodable account entry");
                           } else {
                               snapshot.accounts.emplace(
                                   AddressAt(key, accountKeySize - Address::SIZE), state);
                           }
                           return decode.ok();
                       },
                       scan);
    if (!s.ok()) {
        return s;
    }
    if (!decode.ok()) {
        return decode;
    }

    const size_t allowanceKeySize = 1 + keyId_.size() + 2 * Address::SIZE;
    s = db::ScanPrefix(db_, db::MakeKey(db::prefix::ALLOWANCE, keyId_),
                       [&](const db::Slice& key, const db::Slice& value) {
                           Amount amount = 0;
                           if (key.size() != allowanceKeySize) {
                               decode = db::Status::Corruption("malformed allowance key");
                           } else if (!db::DeserializeFromString(value.ToString(), amount)) {
                               decode = db::Status::Corruption("undecodable allowance entry");
                           } else {
                               size_t owner = allowanceKeySize - 2 * Address::SIZE;
                               snapshot.allowances.emplace(
                                   AllowanceKey{AddressAt(key, owner),
                                                AddressAt(key, owner + Address::SIZE)},
                                   amount);
                           }
                           return decode.ok();
                       },
                       scan);
    if (!s.ok()) {
        return s;
    }
    if (!decode.ok()) {
        return decode;
    }

    LOG_DEBUG(util::LogCategory::STORE) << "Loaded campaign '" << id_ << "' in state "
                                        << CampaignStateToString(snapshot.totals.state);
    out = std::move(snapshot);
    return db::Status::Ok();
}

db::Status CampaignStore::Erase() {
    db::WriteBatch batch;
    batch.Delete(ConfigKey());
    batch.Delete(StateKey());
    size_t entries = 0;
    db::Status s = DeleteRange(db::prefix::ACCOUNT, batch, entries);
    if (s.ok()) {
        s = DeleteRange(db::prefix::ALLOWANCE, batch, entries);
    }
    if (!s.ok()) {
        return s;
    }

    s = db_.Write(&batch);
    if (s.ok()) {
        LOG_INFO(util::LogCategory::STORE) << "Erased campaign '" << id_ << "' ("
                                           << entries << " entries)";
    }
    return s;
}

} // namespace campaign
} // namespace crowdfund
