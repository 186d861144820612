// CROWDFUND - Campaign Parameters Implementation
// Copyright (c) 2024 CROWDFUND Developers
// MIT License

#include "crowdfund/campaign/params.h"
#include "crowdfund/core/arith.h"
#include "crowdfund/crypto/sha256.h"
#include "crowdfund/util/config.h"
#include "crowdfund/util/logging.h"
#include "crowdfund/util/time.h"

namespace crowdfund {
namespace campaign {

namespace {

CampaignResult Invalid(const std::string& reason) {
    return CampaignResult::Failure(CampaignError::Config, reason);
}

} // namespace

std::string Denomination::ToString() const {
    if (IsNative()) {
        return "native";
    }
    return "token:" + reference.ToString();
}

bool ParseDenomination(const std::string& str, Denomination& out) {
    std::string value = util::ConfigManager::Trim(str);
    if (value == "native") {
        out = Denomination::Native();
        return true;
    }

    const std::string tokenPrefix = "token:";
    if (value.compare(0, tokenPrefix.size(), tokenPrefix) == 0) {
        std::string ref = value.substr(tokenPrefix.size());
        if (ref.empty()) {
            return false;
        }
        out = Denomination::ExternalFungible(ResolveAddress(ref));
        return true;
    }

    return false;
}

// ============================================================================
// Validation
// ============================================================================

CampaignResult ValidateConfig(const CampaignConfig& c) {
    if (c.recipient.IsNull()) {
        return Invalid("recipient must be set");
    }

    if (c.upfrontFeeBips < 0 || c.upfrontFeeBips > MAX_FEE_BIPS) {
        return Invalid("upfront fee exceeds " + std::to_string(MAX_FEE_BIPS) + " bips");
    }
    if (c.payoutFeeBips < 0 || c.payoutFeeBips > MAX_FEE_BIPS) {
        return Invalid("payout fee exceeds " + std::to_string(MAX_FEE_BIPS) + " bips");
    }

    if (!c.HasFeeCollector()) {
        if (c.upfrontFeeBips != 0 || c.payoutFeeBips != 0) {
            return Invalid("fees require a fee collector");
        }
    } else if (c.upfrontFeeBips == 0 && c.payoutFeeBips == 0) {
        return Invalid("fee collector requires a non-zero fee");
    }

    if (c.goalMin <= 0 || c.goalMax <= 0) {
        return Invalid("goals must be positive");
    }
    if (c.goalMin > c.goalMax) {
        return Invalid("goal-min exceeds goal-max");
    }

    if (c.contributionMin < 1) {
        return Invalid("contribution-min must be at least 1");
    }
    if (c.contributionMin > c.contributionMax) {
        return Invalid("contribution-min exceeds contribution-max");
    }
    if (c.contributionMin > c.goalMax) {
        return Invalid("contribution-min exceeds goal-max");
    }
    // Otherwise the last slot below goal-max could be unreachable
    if (!(c.contributionMin < c.goalMax - c.goalMin || c.contributionMin == 1)) {
        return Invalid("contribution-min must be below goal-max minus goal-min");
    }

    if (c.startsAt >= c.endsAt) {
        return Invalid("start must precede end");
    }
    if (c.endsAt - c.startsAt > MAX_CAMPAIGN_DURATION) {
        return Invalid("campaign longer than 90 days");
    }

    if (!c.denomination.IsNative() && c.denomination.reference.IsNull()) {
        return Invalid("token denomination requires a token reference");
    }

    return CampaignResult::Success();
}

// ============================================================================
// Loading
// ============================================================================

CampaignResult LoadCampaignConfig(const util::ConfigManager& conf,
                                  const std::string& section,
                                  CampaignConfig& out) {
    using namespace util::ConfigKeys;

    CampaignConfig c;

    auto recipient = conf.TryGetString(RECIPIENT, section);
    if (!recipient || recipient->empty()) {
        return Invalid(std::string("missing key ") + RECIPIENT);
    }
    c.recipient = ResolveAddress(*recipient);
    c.feeCollector = ResolveAddress(conf.GetString(FEE_COLLECTOR, "", section));

    struct BipsKey {
        const char* name;
        int* target;
    };
    BipsKey fees[] = {{UPFRONT_FEE_BIPS, &c.upfrontFeeBips}, {PAYOUT_FEE_BIPS, &c.payoutFeeBips}};

    for (const auto& key : fees) {
        if (!conf.HasKey(key.name, section)) {
            continue;
        }
        auto value = conf.TryGetInt(key.name, section);
        if (!value) {
            return Invalid(std::string("invalid integer for ") + key.name);
        }
        if (*value < 0 || *value > BIPS_DENOMINATOR) {
            return Invalid("fee bips out of range");
        }
        *key.target = static_cast<int>(*value);
    }

    // Amounts may exceed 64 bits, so they are parsed here rather than by TryGetInt
    struct AmountKey {
        const char* name;
        Amount* target;
        bool required;
    };
    AmountKey amounts[] = {
        {GOAL_MIN, &c.goalMin, true},
        {GOAL_MAX, &c.goalMax, true},
        {CONTRIBUTION_MIN, &c.contributionMin, false},
        {CONTRIBUTION_MAX, &c.contributionMax, true},
    };

    for (const auto& key : amounts) {
        auto raw = conf.TryGetString(key.name, section);
        if (!raw) {
            if (key.required) {
                return Invalid(std::string("missing key ") + key.name);
            }
            continue;
        }
        auto value = ParseAmount(util::ConfigManager::Trim(*raw));
        if (!value) {
            return Invalid(std::string("invalid amount for ") + key.name);
        }
        *key.target = *value;
    }

    struct TimeKey {
        const char* name;
        Timestamp* target;
    };
    TimeKey times[] = {{STARTS_AT, &c.startsAt}, {ENDS_AT, &c.endsAt}};

    for (const auto& key : times) {
        auto raw = conf.TryGetString(key.name, section);
        if (!raw) {
            return Invalid(std::string("missing key ") + key.name);
        }
        auto ts = util::ParseTimestamp(*raw);
        if (!ts) {
            return Invalid(std::string("invalid time for ") + key.name + ": " + *raw);
        }
        *key.target = *ts;
    }

    std::string denom = conf.GetString(DENOMINATION, "native", section);
    if (!ParseDenomination(denom, c.denomination)) {
        return Invalid("invalid denomination: " + denom);
    }

    LOG_DEBUG(util::LogCategory::CONFIG)
        << "Loaded campaign [" << section << "] recipient " << c.recipient.ToString()
        << " goal " << FormatAmount(c.goalMin) << ".." << FormatAmount(c.goalMax)
        << " window " << util::FormatISO8601(c.startsAt)
        << " - " << util::FormatISO8601(c.endsAt);

    out = c;
    return CampaignResult::Success();
}

} // namespace campaign
} // namespace crowdfund
