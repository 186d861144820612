// CROWDFUND Campaign Simulator
// Copyright (c) 2024 CROWDFUND Developers
// MIT License
//
// Command-line campaign simulator.
// Supports:
// - Loading a campaign configuration and funded accounts from a config file
// - Replaying an operation script against a mock clock
// - Printing results and emitted events
// - Persisting the campaign after every successful command

#include <crowdfund/campaign/campaign.h>
#include <crowdfund/campaign/store.h>
#include <crowdfund/campaign/transport.h>
#include <crowdfund/core/arith.h>
#include <crowdfund/crypto/sha256.h>
#include <crowdfund/db/database.h>
#include <crowdfund/util/config.h>
#include <crowdfund/util/logging.h>
#include <crowdfund/util/time.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace crowdfund;
using namespace crowdfund::campaign;

// ============================================================================
// Constants
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CUSTODY_LABEL = "campaign";
constexpr const char* STORE_DIRNAME = "store";
constexpr const char* STORE_ID = "campaign";

// ============================================================================
// Parsing Utilities
// ============================================================================

/// Parse "90", "30s", "15m", "2h" or "7d" into seconds
std::optional<int64_t> ParseDuration(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }
    int64_t unit = 1;
    std::string number = str;
    switch (str.back()) {
        case 's': unit = 1; number.pop_back(); break;
        case 'm': unit = util::SECONDS_PER_MINUTE; number.pop_back(); break;
        case 'h': unit = util::SECONDS_PER_HOUR; number.pop_back(); break;
        case 'd': unit = SECONDS_PER_DAY; number.pop_back(); break;
        default: break;
    }
    if (number.empty() || number.size() > 12 ||
        number.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    return std::stoll(number) * unit;
}

std::vector<std::string> SplitWords(const std::string& line) {
    std::vector<std::string> words;
    std::istringstream iss(line);
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    return words;
}

// ============================================================================
// Simulation
// ============================================================================

/**
 * Campaign wired to an in-memory asset book and a mock clock.
 */
class Simulation {
public:
    Simulation(const Denomination& denom, Timestamp start)
        : custody_(AddressFromLabel(CUSTODY_LABEL)),
          transport_(book_, denom, custody_),
          clock_(start),
          campaign_(transport_, clock_) {
        campaign_.Subscribe([](const CampaignEvent& event) {
            std::cout << "  event: " << event.ToString() << "\n";
        });
    }

    MemoryAssetBook& Book() { return book_; }
    MemoryTransport& Transport() { return transport_; }
    Campaign& GetCampaign() { return campaign_; }

    /// Run one script line; false on a malformed command
    bool Execute(const std::vector<std::string>& words, CampaignResult& result);

private:
    void PrintStatus() const;
    void PrintBalance(const Address& account) const;

    MemoryAssetBook book_;
    Address custody_;
    MemoryTransport transport_;
    util::MockClock clock_;
    Campaign campaign_;
};

void Simulation::PrintStatus() const {
    const CampaignConfig& config = campaign_.GetConfig();
    std::cout << "  time:        " << util::FormatISO8601(clock_.Now()) << "\n"
              << "  state:       " << CampaignStateToString(campaign_.GetState()) << "\n"
              << "  deposits:    " << FormatAmount(campaign_.DepositTotal()) << " (goal "
              << FormatAmount(config.goalMin) << " - " << FormatAmount(config.goalMax) << ")\n"
              << "  yield:       " << FormatAmount(campaign_.YieldTotal()) << "\n"
              << "  withdrawn:   " << FormatAmount(campaign_.WithdrawnTotal()) << "\n"
              << "  payout fees: " << FormatAmount(campaign_.PayoutFeesTotal()) << "\n"
              << "  custody:     " << FormatAmount(transport_.Holdings()) << "\n"
              << "  accounts:    " << campaign_.GetLedger().AccountCount() << "\n";
    if (campaign_.GetState() == CampaignState::Funding) {
        Timestamp now = clock_.Now();
        if (now < config.endsAt) {
            std::cout << "  window ends: in " << util::FormatDuration(config.endsAt - now) << "\n";
        }
        std::cout << "  expires:     " << util::FormatISO8601(campaign_.ExpiresAt()) << "\n";
    }
}

void Simulation::PrintBalance(const Address& account) const {
    std::cout << "  shares:      " << FormatAmount(campaign_.ShareBalanceOf(account)) << "\n"
              << "  withdrawn:   " << FormatAmount(campaign_.WithdrawnOf(account)) << "\n"
              << "  yield due:   " << FormatAmount(campaign_.YieldBalanceOf(account)) << "\n"
              << "  wallet:      " << FormatAmount(transport_.BalanceOf(account)) << "\n";
}

bool Simulation::Execute(const std::vector<std::string>& words, CampaignResult& result) {
    const std::string& cmd = words[0];
    size_t args = words.size() - 1;
    result = CampaignResult::Success();

    auto amountAt = [&words](size_t i) { return ParseAmount(words[i]); };

    if (cmd == "advance" && args == 1) {
        auto seconds = ParseDuration(words[1]);
        if (!seconds) {
            return false;
        }
        clock_.Advance(*seconds);
        std::cout << "  now " << util::FormatISO8601(clock_.Now()) << "\n";
    } else if (cmd == "at" && args == 1) {
        const CampaignConfig& config = campaign_.GetConfig();
        std::optional<Timestamp> t;
        if (words[1] == "start") {
            t = config.startsAt;
        } else if (words[1] == "end") {
            t = config.endsAt;
        } else if (words[1] == "expiry") {
            t = campaign_.ExpiresAt();
        } else {
            t = util::ParseTimestamp(words[1]);
        }
        if (!t) {
            return false;
        }
        clock_.Set(*t);
        std::cout << "  now " << util::FormatISO8601(clock_.Now()) << "\n";
    } else if (cmd == "contribute" && args == 2) {
        auto amount = amountAt(2);
        if (!amount) {
            return false;
        }
        result = campaign_.Contribute(ResolveAddress(words[1]), *amount);
    } else if (cmd == "range" && args == 1) {
        ContributionRange range = campaign_.ContributionRangeFor(ResolveAddress(words[1]));
        std::cout << "  range: " << FormatAmount(range.min) << " - "
                  << FormatAmount(range.max) << "\n";
    } else if (cmd == "settle" && args == 0) {
        result = campaign_.Settle();
    } else if (cmd == "fail" && args == 0) {
        result = campaign_.ReleaseFailed();
    } else if (cmd == "yield" && args == 2) {
        auto amount = amountAt(2);
        if (!amount) {
            return false;
        }
        result = campaign_.DepositYield(ResolveAddress(words[1]), *amount);
    } else if (cmd == "withdraw" && args == 1) {
        result = campaign_.Withdraw(ResolveAddress(words[1]));
    } else if (cmd == "transfer" && args == 3) {
        auto amount = amountAt(3);
        if (!amount) {
            return false;
        }
        result = campaign_.Transfer(ResolveAddress(words[1]), ResolveAddress(words[2]), *amount);
    } else if (cmd == "approve" && args == 3) {
        auto amount = amountAt(3);
        if (!amount) {
            return false;
        }
        result = campaign_.Approve(ResolveAddress(words[1]), ResolveAddress(words[2]), *amount);
    } else if (cmd == "transfer-from" && args == 4) {
        auto amount = amountAt(4);
        if (!amount) {
            return false;
        }
        result = campaign_.TransferFrom(ResolveAddress(words[1]), ResolveAddress(words[2]),
                                        ResolveAddress(words[3]), *amount);
    } else if (cmd == "status" && args == 0) {
        PrintStatus();
    } else if (cmd == "balance" && args == 1) {
        PrintBalance(ResolveAddress(words[1]));
    } else {
        return false;
    }
    return true;
}

// ============================================================================
// Setup
// ============================================================================

void SetupLogging(const util::ConfigManager& conf) {
    auto& logger = util::Logger::Instance();
    logger.Initialize();
    logger.ClearSinks();

    bool debug = conf.GetBool(util::ConfigKeys::DEBUG, false);
    util::LogLevel level = debug ? util::LogLevel::Debug
                                 : util::LogLevelFromString(
                                       conf.GetString(util::ConfigKeys::LOGLEVEL, "warn"));
    logger.SetLevel(level);

    std::istringstream categories(conf.GetString(util::ConfigKeys::LOGCATEGORIES, ""));
    for (std::string name; std::getline(categories, name, ',');) {
        name = util::ConfigManager::Trim(name);
        if (!name.empty()) {
            logger.EnableCategory(name);
        }
    }

    util::ConsoleSink::Config consoleConfig;
    consoleConfig.level = level;
    consoleConfig.useStderr = true;
    consoleConfig.showTimestamp = false;
    logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));

    std::string logFile = conf.GetPath(util::ConfigKeys::LOGFILE);
    if (!logFile.empty()) {
        util::FileSink::Config fileConfig;
        fileConfig.path = logFile;
        fileConfig.level = util::LogLevel::Debug;
        auto fileSink = std::make_shared<util::FileSink>(fileConfig);
        if (fileSink->IsOpen()) {
            logger.AddSink(fileSink);
            logger.SetLevel(util::LogLevel::Debug);
        } else {
            std::cerr << "Warning: cannot open log file " << logFile << "\n";
        }
    }
}

/// Mint the [accounts] balances into the asset book
bool FundAccounts(const util::ConfigManager& conf, Simulation& sim, const Denomination& denom) {
    for (const auto& entry : conf.GetEntries(util::ConfigKeys::ACCOUNTS_SECTION)) {
        auto amount = ParseAmount(entry.value);
        if (!amount) {
            std::cerr << "Error: invalid balance for account '" << entry.key << "': "
                      << entry.value << "\n";
            return false;
        }
        Address account = ResolveAddress(entry.key);
        if (!sim.Book().Mint(denom, account, *amount)) {
            std::cerr << "Error: cannot fund account '" << entry.key << "'\n";
            return false;
        }
        LOG_DEBUG(util::LogCategory::DEFAULT) << "Funded " << entry.key << " ("
                                              << account.ToString() << ") with "
                                              << FormatAmount(*amount);
    }
    return true;
}

// ============================================================================
// Command Line
// ============================================================================

void PrintUsage() {
    std::cout << "CROWDFUND Campaign Simulator v" << VERSION << "\n\n"
              << "Usage: crowdfund-sim --conf=<file> --script=<file> [options]\n\n"
              << "Options:\n"
              << "  --conf=<file>      Campaign configuration ([campaign], [accounts], [transport])\n"
              << "  --script=<file>    Operation script, one command per line\n"
              << "  --datadir=<dir>    Persist the campaign after every successful command\n"
              << "  --debug            Debug logging\n"
              << "  --loglevel=<lvl>   trace, debug, info, warn, error (default: warn)\n"
              << "  --logfile=<path>   Also log to a file\n"
              << "  --logcategories=<list>  Only log these categories (campaign,ledger,\n"
              << "                     transport,store,config,db)\n"
              << "  -h, --help         Show this help\n"
              << "  -v, --version      Show version\n\n"
              << "Script commands:\n"
              << "  advance <secs|Ns|Nm|Nh|Nd>        at <time|start|end|expiry>\n"
              << "  contribute <account> <amount>     range <account>\n"
              << "  settle                            fail\n"
              << "  yield <from> <amount>             withdraw <account>\n"
              << "  transfer <from> <to> <amount>     approve <owner> <spender> <amount>\n"
              << "  transfer-from <spender> <from> <to> <amount>\n"
              << "  status                            balance <account>\n\n"
              << "Accounts are labels or 40-character hex addresses. Amounts are\n"
              << "base units, optionally with an exponent (3e17, 1.5e18).\n";
}

void PrintVersion() {
    std::cout << "crowdfund-sim v" << VERSION << "\n";
}

struct Options {
    std::string confPath;
    std::string scriptPath;
    std::string dataDir;
    bool help = false;
    bool version = false;
};

Options ParseArgs(const util::ConfigManager& conf) {
    Options opts;
    opts.help = conf.GetBool("help", false) || conf.GetBool("h", false);
    opts.version = conf.GetBool("version", false) || conf.GetBool("v", false);
    opts.confPath = conf.GetPath(util::ConfigKeys::CONF);
    opts.scriptPath = conf.GetPath(util::ConfigKeys::SCRIPT);
    opts.dataDir = conf.GetPath(util::ConfigKeys::DATADIR);
    return opts;
}

int main(int argc, char* argv[]) {
    util::ConfigManager conf;
    util::ConfigParseResult parsed = conf.ParseCommandLine(argc, argv);
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.ToString() << "\n";
        return 1;
    }

    Options opts = ParseArgs(conf);
    if (opts.version) {
        PrintVersion();
        return 0;
    }
    if (opts.help || opts.confPath.empty() || opts.scriptPath.empty()) {
        PrintUsage();
        return opts.help ? 0 : 1;
    }

    // File first, then the command line again so it takes precedence
    parsed = conf.ParseFile(opts.confPath);
    if (parsed.success) {
        parsed = conf.ParseCommandLine(argc, argv);
    }
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.ToString() << "\n";
        return 1;
    }

    SetupLogging(conf);

    CampaignConfig config;
    CampaignResult loaded = LoadCampaignConfig(conf, util::ConfigKeys::CAMPAIGN_SECTION, config);
    if (!loaded) {
        std::cerr << "Error: " << loaded.ToString() << "\n";
        return 1;
    }

    Simulation sim(config.denomination, config.startsAt);
    sim.Transport().SetTransferFeeBips(static_cast<int>(
        conf.GetInt(util::ConfigKeys::TRANSFER_FEE_BIPS, 0, util::ConfigKeys::TRANSPORT_SECTION)));

    if (!FundAccounts(conf, sim, config.denomination)) {
        return 1;
    }

    CampaignResult init = sim.GetCampaign().Initialize(config);
    if (!init) {
        std::cerr << "Error: " << init.ToString() << "\n";
        return 1;
    }

    std::unique_ptr<db::Database> database;
    std::unique_ptr<CampaignStore> store;
    if (!opts.dataDir.empty()) {
        auto [status, opened] = db::OpenDatabase(fs::path(opts.dataDir) / STORE_DIRNAME);
        if (!status.ok()) {
            std::cerr << "Error: cannot open store in " << opts.dataDir << ": "
                      << status.ToString() << "\n";
            return 1;
        }
        database = std::move(opened);
        store = std::make_unique<CampaignStore>(*database, STORE_ID);
        if (store->Exists()) {
            LOG_WARN(util::LogCategory::STORE) << "Replacing stored campaign in " << opts.dataDir;
        }
        db::Status saved = store->Save(sim.GetCampaign());
        if (!saved.ok()) {
            std::cerr << "Error: " << saved.ToString() << "\n";
            return 1;
        }
    }

    std::ifstream script(opts.scriptPath);
    if (!script) {
        std::cerr << "Error: cannot open script " << opts.scriptPath << "\n";
        return 1;
    }

    int lineNum = 0;
    int rejected = 0;
    std::string line;
    while (std::getline(script, line)) {
        ++lineNum;
        size_t hash = line.find('#');
        if (hash != std::string::npos) {
            line.erase(hash);
        }
        std::vector<std::string> words = SplitWords(line);
        if (words.empty()) {
            continue;
        }

        std::cout << "> " << util::ConfigManager::Trim(line) << "\n";

        CampaignResult result;
        if (!sim.Execute(words, result)) {
            std::cerr << opts.scriptPath << ":" << lineNum << ": invalid command: " << line << "\n";
            util::Logger::Instance().Shutdown();
            return 1;
        }

        if (!result) {
            ++rejected;
            std::cout << "  rejected: " << result.ToString() << "\n";
            continue;
        }
        if (result.amount != 0) {
            std::cout << "  ok: " << FormatAmount(result.amount) << "\n";
        }

        if (store) {
            db::Status saved = store->Save(sim.GetCampaign());
            if (!saved.ok()) {
                std::cerr << "Error: " << saved.ToString() << "\n";
                util::Logger::Instance().Shutdown();
                return 1;
            }
        }
    }

    std::cout << lineNum << " lines, " << rejected << " rejected\n";
    util::Logger::Instance().Shutdown();
    return 0;
}
