// CROWDFUND - Configuration Implementation
// Copyright (c) 2024 CROWDFUND Developers
// MIT License

#include "crowdfund/util/config.h"
#include "crowdfund/util/logging.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <initializer_list>
#include <sstream>
#include <tuple>
#include <utility>

#include <pwd.h>
#include <unistd.h>

namespace crowdfund {
namespace util {

namespace {

constexpr const char* COMMAND_LINE = "<command-line>";

bool IsKeyChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.';
}

/// First character of `key` that may not appear in a key, or '\0'
char BadKeyChar(const std::string& key) {
    auto it = std::find_if_not(key.begin(), key.end(), IsKeyChar);
    return it == key.end() ? '\0' : *it;
}

/// "flag" -> (flag, true), "noflag" -> (flag, false)
std::pair<std::string, std::string> BareFlag(const std::string& word) {
    if (word.size() > 2 && word.compare(0, 2, "no") == 0 &&
        std::islower(static_cast<unsigned char>(word[2]))) {
        return {word.substr(2), "false"};
    }
    return {word, "true"};
}

/// Strip matching quotes. Single-quoted text is taken literally; anything
/// else has ${VAR} references expanded.
std::string DecodeValue(const std::string& raw) {
    if (raw.size() >= 2 && raw.front() == '\'' && raw.back() == '\'') {
        return raw.substr(1, raw.size() - 2);
    }
    if (raw.size() >= 2 && raw.front() == '"' && raw.back() == '"') {
        return ConfigManager::ExpandEnvVars(raw.substr(1, raw.size() - 2));
    }
    return ConfigManager::ExpandEnvVars(raw);
}

std::string HomeDirectory() {
    if (const char* home = std::getenv("HOME")) {
        return home;
    }
    if (const passwd* pw = getpwuid(getuid())) {
        return pw->pw_dir;
    }
    return "";
}

} // namespace

std::string ConfigParseResult::ToString() const {
    if (success) {
        return "ok";
    }
    std::string out;
    if (!errorFile.empty()) {
        out = errorFile + (errorLine > 0 ? ":" + std::to_string(errorLine) : "") + ": ";
    }
    return out + errorMessage;
}

// ============================================================================
// Helpers
// ============================================================================

std::string ConfigManager::Trim(const std::string& str) {
    static const char* const blanks = " \t\r\n";
    size_t first = str.find_first_not_of(blanks);
    if (first == std::string::npos) {
        return "";
    }
    return str.substr(first, str.find_last_not_of(blanks) - first + 1);
}

std::optional<bool> ConfigManager::ParseBool(const std::string& str) {
    std::string word = Trim(str);
    std::transform(word.begin(), word.end(), word.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const char* yes : {"true", "yes", "on", "1"}) {
        if (word == yes) return true;
    }
    for (const char* no : {"false", "no", "off", "0"}) {
        if (word == no) return false;
    }
    return std::nullopt;
}

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string out;
    size_t pos = 0;
    while (pos < value.size()) {
        size_t open = value.find("${", pos);
        size_t close = open == std::string::npos ? open : value.find('}', open + 2);
        if (close == std::string::npos) {
            out.append(value, pos, std::string::npos);
            break;
        }
        out.append(value, pos, open - pos);
        std::string name = value.substr(open + 2, close - open - 2);
        if (const char* env = std::getenv(name.c_str())) {
            out += env;
        }
        pos = close + 1;
    }
    return out;
}

std::string ConfigManager::ExpandTilde(const std::string& path) {
    if (path.empty() || path[0] != '~' || (path.size() > 1 && path[1] != '/')) {
        return path;
    }
    std::string home = HomeDirectory();
    return home.empty() ? path : home + path.substr(1);
}

// ============================================================================
// Parsing
// ============================================================================

void ConfigManager::Store(ConfigEntry entry) {
    std::string key = entry.key;
    sections_[entry.section][key] = std::move(entry);
}

ConfigParseResult ConfigManager::ParseStream(std::istream& in, const std::string& source) {
    std::string section;
    std::string raw;
    int lineNo = 0;

    while (std::getline(in, raw)) {
        ++lineNo;
        if (raw.size() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "line longer than " + std::to_string(MAX_LINE_LENGTH) + " characters",
                source, lineNo);
        }

        std::string line = Trim(raw);
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line[0] == '[') {
            if (line.back() != ']') {
                return ConfigParseResult::Error("unterminated section header", source, lineNo);
            }
            section = Trim(line.substr(1, line.size() - 2));
            if (char bad = BadKeyChar(section)) {
                return ConfigParseResult::Error(
                    std::string("invalid character '") + bad + "' in section name", source,
                    lineNo);
            }
            continue;
        }

        ConfigEntry entry;
        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            std::tie(entry.key, entry.value) = BareFlag(line);
        } else {
            entry.key = Trim(line.substr(0, eq));
            entry.value = DecodeValue(Trim(line.substr(eq + 1)));
        }

        if (entry.key.empty()) {
            return ConfigParseResult::Error("missing key before '='", source, lineNo);
        }
        if (char bad = BadKeyChar(entry.key)) {
            return ConfigParseResult::Error(
                std::string("invalid character '") + bad + "' in key", source, lineNo);
        }

        entry.section = section;
        entry.source = source;
        entry.line = lineNo;
        Store(std::move(entry));
    }

    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    std::string path = ExpandEnvVars(ExpandTilde(filePath));

    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return ConfigParseResult::Error("cannot open " + path);
    }
    if (static_cast<size_t>(file.tellg()) > MAX_CONFIG_SIZE) {
        return ConfigParseResult::Error(
            "file exceeds " + std::to_string(MAX_CONFIG_SIZE) + " bytes", path);
    }
    file.seekg(0);

    ConfigParseResult result = ParseStream(file, path);
    if (result.success) {
        LogDebugF(LogCategory::CONFIG, "Read %s (%zu settings)", path.c_str(), Size());
    } else {
        LogWarnF(LogCategory::CONFIG, "%s", result.ToString().c_str());
    }
    return result;
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream in(content);
    return ParseStream(in, sourceName);
}

ConfigParseResult ConfigManager::ParseCommandLine(int argc, const char* const argv[]) {
    positional_.clear();
    bool optionsDone = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (optionsDone || arg.size() < 2 || arg[0] != '-') {
            positional_.push_back(arg);
            continue;
        }
        if (arg == "--") {
            optionsDone = true;
            continue;
        }

        size_t start = arg.find_first_not_of('-');
        if (start == std::string::npos) {
            return ConfigParseResult::Error("invalid option " + arg, COMMAND_LINE);
        }
        std::string option = arg.substr(start);
        ConfigEntry entry;
        size_t eq = option.find('=');
        if (eq == std::string::npos) {
            std::tie(entry.key, entry.value) = BareFlag(option);
        } else {
            entry.key = option.substr(0, eq);
            entry.value = option.substr(eq + 1);
        }
        if (entry.key.empty() || BadKeyChar(entry.key) != '\0') {
            return ConfigParseResult::Error("invalid option " + arg, COMMAND_LINE);
        }
        entry.source = COMMAND_LINE;
        Store(std::move(entry));
    }

    return ConfigParseResult::Success();
}

// ============================================================================
// Lookup
// ============================================================================

const ConfigEntry* ConfigManager::Find(const std::string& key,
                                       const std::string& section) const {
    auto sec = sections_.find(section);
    if (sec == sections_.end()) {
        return nullptr;
    }
    auto entry = sec->second.find(key);
    return entry == sec->second.end() ? nullptr : &entry->second;
}

bool ConfigManager::HasKey(const std::string& key, const std::string& section) const {
    return Find(key, section) != nullptr;
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key,
                                                       const std::string& section) const {
    if (const ConfigEntry* entry = Find(key, section)) {
        return entry->value;
    }
    return std::nullopt;
}

std::string ConfigManager::GetString(const std::string& key, const std::string& defaultValue,
                                     const std::string& section) const {
    return TryGetString(key, section).value_or(defaultValue);
}

std::optional<int64_t> ConfigManager::TryGetInt(const std::string& key,
                                                const std::string& section) const {
    const ConfigEntry* entry = Find(key, section);
    if (!entry) {
        return std::nullopt;
    }
    std::string text = Trim(entry->value);
    int64_t value = 0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (text.empty() || ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return value;
}

int64_t ConfigManager::GetInt(const std::string& key, int64_t defaultValue,
                              const std::string& section) const {
    return TryGetInt(key, section).value_or(defaultValue);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key,
                                              const std::string& section) const {
    const ConfigEntry* entry = Find(key, section);
    return entry ? ParseBool(entry->value) : std::nullopt;
}

bool ConfigManager::GetBool(const std::string& key, bool defaultValue,
                            const std::string& section) const {
    return TryGetBool(key, section).value_or(defaultValue);
}

std::string ConfigManager::GetPath(const std::string& key, const std::string& defaultValue,
                                   const std::string& section) const {
    return ExpandEnvVars(ExpandTilde(GetString(key, defaultValue, section)));
}

// ============================================================================
// Updates and Enumeration
// ============================================================================

void ConfigManager::Set(const std::string& key, const std::string& value,
                        const std::string& section) {
    Store({key, value, section, "<programmatic>", 0});
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value,
                               const std::string& section) {
    if (!HasKey(key, section)) {
        Store({key, value, section, "<default>", 0});
    }
}

std::vector<std::string> ConfigManager::GetSections() const {
    std::vector<std::string> names;
    for (const auto& [name, entries] : sections_) {
        if (!name.empty() && !entries.empty()) {
            names.push_back(name);
        }
    }
    return names;
}

std::vector<ConfigEntry> ConfigManager::GetEntries(const std::string& section) const {
    std::vector<ConfigEntry> out;
    auto sec = sections_.find(section);
    if (sec != sections_.end()) {
        for (const auto& [key, entry] : sec->second) {
            out.push_back(entry);
        }
    }
    return out;
}

void ConfigManager::Clear() {
    sections_.clear();
    positional_.clear();
}

size_t ConfigManager::Size() const {
    size_t count = 0;
    for (const auto& [name, entries] : sections_) {
        count += entries.size();
    }
    return count;
}

} // namespace util
} // namespace crowdfund
