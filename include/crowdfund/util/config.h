// CROWDFUND - Configuration
// Copyright (c) 2024 CROWDFUND Developers
// MIT License
//
// INI-style settings for the simulator and the campaigns it runs:
//
//   # comment            ; comment
//   [campaign]
//   recipient = alice
//   goal_min  = 5000000000000000000
//   label     = "quoted value"
//   logfile   = ${HOME}/crowdfund.log
//
// Keys before the first header belong to the global section. Command-line
// options (--key=value, --flag, --noflag) always land in the global section.

#ifndef CROWDFUND_UTIL_CONFIG_H
#define CROWDFUND_UTIL_CONFIG_H

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace crowdfund {
namespace util {

/// Files larger than this are refused
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

constexpr size_t MAX_LINE_LENGTH = 4096;

/// One key=value setting and where it came from
struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;
    std::string source;    // file path, "<command-line>", "<default>", ...
    int line{0};
};

struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};

    static ConfigParseResult Success() { return {true, "", "", 0}; }
    static ConfigParseResult Error(const std::string& msg, const std::string& file = "",
                                   int line = 0) {
        return {false, msg, file, line};
    }

    /// "file:line: message", leaving out whatever is unknown
    std::string ToString() const;
};

/**
 * Settings gathered from any number of sources. A later source replaces
 * an earlier value for the same section and key; SetDefault never does.
 */
class ConfigManager {
public:
    ConfigParseResult ParseFile(const std::string& filePath);
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    /// argv[0] is skipped. Arguments not starting with '-' are positional.
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);
    const std::vector<std::string>& GetPositionalArgs() const { return positional_; }

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;
    std::string GetString(const std::string& key, const std::string& defaultValue,
                          const std::string& section = "") const;

    /// nullopt when absent or not a whole decimal number
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;
    int64_t GetInt(const std::string& key, int64_t defaultValue,
                   const std::string& section = "") const;

    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;
    bool GetBool(const std::string& key, bool defaultValue,
                 const std::string& section = "") const;

    /// String value after ~ and ${VAR} expansion
    std::string GetPath(const std::string& key, const std::string& defaultValue = "",
                        const std::string& section = "") const;

    void Set(const std::string& key, const std::string& value, const std::string& section = "");
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    /// Named sections holding at least one key, sorted
    std::vector<std::string> GetSections() const;

    /// Entries of one section sorted by key
    std::vector<ConfigEntry> GetEntries(const std::string& section = "") const;

    void Clear();
    size_t Size() const;

    /// Replace ${NAME} with the environment variable (empty when unset)
    static std::string ExpandEnvVars(const std::string& value);

    /// Replace a leading "~" or "~/" with the home directory
    static std::string ExpandTilde(const std::string& path);

    /// true/yes/on/1 and false/no/off/0, any case
    static std::optional<bool> ParseBool(const std::string& str);

    static std::string Trim(const std::string& str);

private:
    ConfigParseResult ParseStream(std::istream& in, const std::string& source);
    const ConfigEntry* Find(const std::string& key, const std::string& section) const;
    void Store(ConfigEntry entry);

    // section -> key -> entry
    std::map<std::string, std::map<std::string, ConfigEntry>> sections_;
    std::vector<std::string> positional_;
};

namespace ConfigKeys {
    // Simulator
    constexpr const char* CONF = "conf";
    constexpr const char* SCRIPT = "script";
    constexpr const char* DATADIR = "datadir";
    constexpr const char* DEBUG = "debug";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* LOGCATEGORIES = "logcategories";

    // [campaign]
    constexpr const char* CAMPAIGN_SECTION = "campaign";
    constexpr const char* RECIPIENT = "recipient";
    constexpr const char* FEE_COLLECTOR = "fee_collector";
    constexpr const char* UPFRONT_FEE_BIPS = "upfront_fee_bips";
    constexpr const char* PAYOUT_FEE_BIPS = "payout_fee_bips";
    constexpr const char* GOAL_MIN = "goal_min";
    constexpr const char* GOAL_MAX = "goal_max";
    constexpr const char* CONTRIBUTION_MIN = "contribution_min";
    constexpr const char* CONTRIBUTION_MAX = "contribution_max";
    constexpr const char* STARTS_AT = "starts_at";
    constexpr const char* ENDS_AT = "ends_at";
    constexpr const char* DENOMINATION = "denomination";

    // [accounts]: <label-or-hex> = <opening balance>
    constexpr const char* ACCOUNTS_SECTION = "accounts";

    // [transport]
    constexpr const char* TRANSPORT_SECTION = "transport";
    constexpr const char* TRANSFER_FEE_BIPS = "transfer_fee_bips";
}

} // namespace util
} // namespace crowdfund

#endif // CROWDFUND_UTIL_CONFIG_H
