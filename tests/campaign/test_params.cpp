// CROWDFUND - Campaign Parameter Tests
// Copyright (c) 2024 CROWDFUND Developers
// MIT License

#include <gtest/gtest.h>

#include "crowdfund/campaign/params.h"
#include "crowdfund/crypto/sha256.h"
#include "crowdfund/util/config.h"

#include <string>
#include <vector>

namespace crowdfund {
namespace campaign {
namespace test {

namespace {

CampaignConfig ValidConfig() {
    CampaignConfig config;
    config.recipient = AddressFromLabel("recipient");
    config.goalMin = 2 * UNIT;
    config.goalMax = 5 * UNIT;
    config.contributionMin = UNIT / 5;
    config.contributionMax = UNIT;
    config.startsAt = 1700000000;
    config.endsAt = 1700000000 + 30 * SECONDS_PER_DAY;
    return config;
}

std::string RejectionOf(const CampaignConfig& config) {
    CampaignResult result = ValidateConfig(config);
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error, CampaignError::Config);
    return result.reason;
}

const char* CAMPAIGN_CONF =
    "[campaign]\n"
    "recipient = recipient\n"
    "fee_collector = collector\n"
    "upfront_fee_bips = 100\n"
    "payout_fee_bips = 250\n"
    "goal_min = 2000000000000000000\n"
    "goal_max = 5000000000000000000\n"
    "contribution_min = 200000000000000000\n"
    "contribution_max = 1000000000000000000\n"
    "starts_at = 2024-01-01\n"
    "ends_at = 1706745600\n";

} // namespace

// ============================================================================
// Validation
// ============================================================================

TEST(ValidateConfigTest, AcceptsValidConfig) {
    EXPECT_TRUE(ValidateConfig(ValidConfig()));

    CampaignConfig single = ValidConfig();
    single.goalMin = single.goalMax;
    single.contributionMin = 1;
    EXPECT_TRUE(ValidateConfig(single));
}

TEST(ValidateConfigTest, RecipientRequired) {
    CampaignConfig config = ValidConfig();
    config.recipient = Address();
    EXPECT_EQ(RejectionOf(config), "recipient must be set");
}

TEST(ValidateConfigTest, FeesAndCollectorGoTogether) {
    CampaignConfig config = ValidConfig();
    config.payoutFeeBips = 10;
    EXPECT_EQ(RejectionOf(config), "fees require a fee collector");

    config = ValidConfig();
    config.feeCollector = AddressFromLabel("collector");
    EXPECT_EQ(RejectionOf(config), "fee collector requires a non-zero fee");

    config.upfrontFeeBips = 1;
    EXPECT_TRUE(ValidateConfig(config));
}

TEST(ValidateConfigTest, GoalRules) {
    CampaignConfig config = ValidConfig();
    config.goalMin = 0;
    EXPECT_EQ(RejectionOf(config), "goals must be positive");

    config = ValidConfig();
    config.goalMin = config.goalMax + 1;
    EXPECT_EQ(RejectionOf(config), "goal-min exceeds goal-max");
}

TEST(ValidateConfigTest, ContributionRules) {
    CampaignConfig config = ValidConfig();
    config.contributionMin = 0;
    EXPECT_EQ(RejectionOf(config), "contribution-min must be at least 1");

    config = ValidConfig();
    config.contributionMin = config.contributionMax + 1;
    EXPECT_EQ(RejectionOf(config), "contribution-min exceeds contribution-max");

    config = ValidConfig();
    config.contributionMax = 10 * UNIT;
    config.contributionMin = 6 * UNIT;
    EXPECT_EQ(RejectionOf(config), "contribution-min exceeds goal-max");

    // Minimum must fit inside the gap between the goals
    config = ValidConfig();
    config.contributionMin = 3 * UNIT;
    config.contributionMax = 3 * UNIT;
    EXPECT_EQ(RejectionOf(config), "contribution-min must be below goal-max minus goal-min");
}

TEST(ValidateConfigTest, WindowRules) {
    CampaignConfig config = ValidConfig();
    config.endsAt = config.startsAt;
    EXPECT_EQ(RejectionOf(config), "start must precede end");

    config = ValidConfig();
    config.endsAt = config.startsAt + MAX_CAMPAIGN_DURATION;
    EXPECT_TRUE(ValidateConfig(config));
    config.endsAt += 1;
    EXPECT_EQ(RejectionOf(config), "campaign longer than 90 days");
}

TEST(ValidateConfigTest, TokenDenominationNeedsReference) {
    CampaignConfig config = ValidConfig();
    config.denomination = Denomination::ExternalFungible(Address());
    EXPECT_EQ(RejectionOf(config), "token denomination requires a token reference");

    config.denomination = Denomination::ExternalFungible(AddressFromLabel("usd"));
    EXPECT_TRUE(ValidateConfig(config));
}

TEST(ValidateConfigTest, ExpiryFollowsWindowEnd) {
    CampaignConfig config = ValidConfig();
    EXPECT_EQ(config.ExpiresAt(), config.endsAt + 90 * SECONDS_PER_DAY);
}

// ============================================================================
// Denomination
// ============================================================================

TEST(DenominationTest, ParseAndFormat) {
    Denomination denom;
    ASSERT_TRUE(ParseDenomination(" native ", denom));
    EXPECT_TRUE(denom.IsNative());
    EXPECT_EQ(denom.ToString(), "native");

    ASSERT_TRUE(ParseDenomination("token:usd", denom));
    EXPECT_FALSE(denom.IsNative());
    EXPECT_EQ(denom.reference, AddressFromLabel("usd"));
    EXPECT_EQ(denom.ToString(), "token:" + AddressFromLabel("usd").ToString());

    Address hex = AddressFromLabel("token");
    ASSERT_TRUE(ParseDenomination("token:" + hex.ToHex(), denom));
    EXPECT_EQ(denom.reference, hex);

    EXPECT_FALSE(ParseDenomination("token:", denom));
    EXPECT_FALSE(ParseDenomination("erc20", denom));
}

TEST(DenominationTest, Equality) {
    EXPECT_EQ(Denomination::Native(), Denomination::Native());
    EXPECT_NE(Denomination::Native(), Denomination::ExternalFungible(AddressFromLabel("usd")));
    EXPECT_NE(Denomination::ExternalFungible(AddressFromLabel("usd")),
              Denomination::ExternalFungible(AddressFromLabel("eur")));
}

// ============================================================================
// Loading
// ============================================================================

TEST(LoadCampaignConfigTest, LoadsSection) {
    util::ConfigManager conf;
    ASSERT_TRUE(conf.ParseString(CAMPAIGN_CONF).success);

    CampaignConfig config;
    CampaignResult result = LoadCampaignConfig(conf, "campaign", config);
    ASSERT_TRUE(result) << result.ToString();

    EXPECT_EQ(config.recipient, AddressFromLabel("recipient"));
    EXPECT_EQ(config.feeCollector, AddressFromLabel("collector"));
    EXPECT_EQ(config.upfrontFeeBips, 100);
    EXPECT_EQ(config.payoutFeeBips, 250);
    EXPECT_EQ(config.goalMin, 2 * UNIT);
    EXPECT_EQ(config.goalMax, 5 * UNIT);
    EXPECT_EQ(config.contributionMin, UNIT / 5);
    EXPECT_EQ(config.contributionMax, UNIT);
    EXPECT_EQ(config.startsAt, 1704067200);
    EXPECT_EQ(config.endsAt, 1706745600);
    EXPECT_TRUE(config.denomination.IsNative());
    EXPECT_TRUE(ValidateConfig(config));
}

TEST(LoadCampaignConfigTest, OptionalKeysDefault) {
    util::ConfigManager conf;
    ASSERT_TRUE(conf.ParseString(
        "[campaign]\n"
        "recipient = 0x00000000000000000000000000000000000000aa\n"
        "goal_min = 10\n"
        "goal_max = 20\n"
        "contribution_max = 5\n"
        "starts_at = 100\n"
        "ends_at = 200\n"
        "denomination = token:usd\n").success);

    CampaignConfig config;
    ASSERT_TRUE(LoadCampaignConfig(conf, "campaign", config));

    Address expected;
    ASSERT_TRUE(Address::TryParse("00000000000000000000000000000000000000aa", expected));
    EXPECT_EQ(config.recipient, expected);
    EXPECT_TRUE(config.feeCollector.IsNull());
    EXPECT_EQ(config.upfrontFeeBips, 0);
    EXPECT_EQ(config.contributionMin, 1);
    EXPECT_EQ(config.denomination, Denomination::ExternalFungible(AddressFromLabel("usd")));
}

TEST(LoadCampaignConfigTest, Rejections) {
    struct Case {
        std::string content;
        std::string reason;
    };
    const std::string base =
        "[campaign]\n"
        "recipient = r\n"
        "goal_min = 10\n"
        "goal_max = 20\n"
        "contribution_max = 5\n";

    std::vector<Case> cases = {
        {"[campaign]\ngoal_min = 1\n", "missing key recipient"},
        {"[campaign]\nrecipient = r\ngoal_max = 2\n", "missing key goal_min"},
        {base + "ends_at = 200\n", "missing key starts_at"},
        {base + "starts_at = 100\nends_at = 200\ngoal_min = ten\n", "invalid amount for goal_min"},
        {base + "starts_at = 100\nends_at = 200\npayout_fee_bips = x\n", "invalid integer for payout_fee_bips"},
        {base + "starts_at = 100\nends_at = 200\nupfront_fee_bips = 10001\n", "fee bips out of range"},
        {base + "starts_at = 100\nends_at = soon\n", "invalid time for ends_at: soon"},
        {base + "starts_at = 100\nends_at = 200\ndenomination = gold\n", "invalid denomination: gold"},
    };

    for (const auto& c : cases) {
        util::ConfigManager conf;
        ASSERT_TRUE(conf.ParseString(c.content).success) << c.content;

        CampaignConfig config;
        CampaignResult result = LoadCampaignConfig(conf, "campaign", config);
        EXPECT_EQ(result.error, CampaignError::Config) << c.content;
        EXPECT_EQ(result.reason, c.reason) << c.content;
    }
}

TEST(LoadCampaignConfigTest, AmountsBeyondSixtyFourBits) {
    util::ConfigManager conf;
    ASSERT_TRUE(conf.ParseString(
        "[campaign]\n"
        "recipient = r\n"
        "goal_min = 20e18\n"
        "goal_max = 50000000000000000000000\n"
        "contribution_min = 1.5e18\n"
        "contribution_max = 25e18\n"
        "starts_at = 100\n"
        "ends_at = 200\n").success);

    CampaignConfig config;
    ASSERT_TRUE(LoadCampaignConfig(conf, "campaign", config));
    EXPECT_EQ(config.goalMin, 20 * UNIT);
    EXPECT_EQ(config.goalMax, 50000 * UNIT);
    EXPECT_EQ(config.contributionMin, 3 * UNIT / 2);
    EXPECT_EQ(config.contributionMax, 25 * UNIT);
    EXPECT_TRUE(ValidateConfig(config));
}

TEST(LoadCampaignConfigTest, ReadsNamedSection) {
    util::ConfigManager conf;
    ASSERT_TRUE(conf.ParseString(
        "[other]\n"
        "recipient = r\n"
        "goal_min = 1\n"
        "goal_max = 2\n"
        "contribution_max = 1\n"
        "starts_at = 1\n"
        "ends_at = 2\n").success);

    CampaignConfig config;
    EXPECT_EQ(LoadCampaignConfig(conf, "campaign", config).reason, "missing key recipient");
    EXPECT_TRUE(LoadCampaignConfig(conf, "other", config));
    EXPECT_EQ(config.goalMax, 2);
}

} // namespace test
} // namespace campaign
} // namespace crowdfund
