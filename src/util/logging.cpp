// CROWDFUND - Logging Implementation
// Copyright (c) 2024 CROWDFUND Developers
// MIT License

#include "crowdfund/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <utility>

#include <unistd.h>

namespace crowdfund {
namespace util {

namespace {

struct LevelName {
    LogLevel level;
    const char* name;
    const char* color;
};

constexpr LevelName LEVEL_NAMES[] = {
    {LogLevel::Trace, "TRACE", "\033[90m"},
    {LogLevel::Debug, "DEBUG", "\033[36m"},
    {LogLevel::Info,  "INFO",  "\033[32m"},
    {LogLevel::Warn,  "WARN",  "\033[33m"},
    {LogLevel::Error, "ERROR", "\033[31m"},
    {LogLevel::Fatal, "FATAL", "\033[35;1m"},
    {LogLevel::Off,   "OFF",   "\033[0m"},
};

const LevelName* FindLevel(LogLevel level) {
    for (const auto& entry : LEVEL_NAMES) {
        if (entry.level == level) {
            return &entry;
        }
    }
    return nullptr;
}

} // namespace

// ============================================================================
// Levels
// ============================================================================

const char* LogLevelToString(LogLevel level) {
    const LevelName* entry = FindLevel(level);
    return entry ? entry->name : "UNKNOWN";
}

LogLevel LogLevelFromString(const std::string& str) {
    std::string upper(str.size(), '\0');
    std::transform(str.begin(), str.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "WARNING") {
        return LogLevel::Warn;
    }
    if (upper == "NONE") {
        return LogLevel::Off;
    }
    for (const auto& entry : LEVEL_NAMES) {
        if (upper == entry.name) {
            return entry.level;
        }
    }
    return LogLevel::Info;
}

// ============================================================================
// Formatting
// ============================================================================

std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      tp.time_since_epoch()).count() % 1000;

    std::tm local;
    localtime_r(&seconds, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis;
    return oss.str();
}

std::string GetBasename(const std::string& path) {
    size_t slash = path.find_last_of("/\\");
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string FormatLogLine(const LogEntry& entry, const LineFormat& format) {
    std::ostringstream oss;
    if (format.timestamp) {
        oss << FormatLogTimestamp(entry.timestamp) << ' ';
    }
    oss << '[' << std::left << std::setw(5) << LogLevelToString(entry.level) << "] ";
    if (format.category && !entry.category.empty() && entry.category != LogCategory::DEFAULT) {
        oss << '[' << entry.category << "] ";
    }
    if (format.location && !entry.file.empty()) {
        oss << GetBasename(entry.file) << ':' << entry.line << ' ';
    }
    oss << entry.message;
    return oss.str();
}

// ============================================================================
// ConsoleSink
// ============================================================================

void ConsoleSink::Write(const LogEntry& entry) {
    if (entry.level < config_.level) {
        return;
    }

    LineFormat format;
    format.timestamp = config_.showTimestamp;
    format.category = config_.showCategory;
    std::string line = FormatLogLine(entry, format);

    std::lock_guard<std::mutex> lock(mutex_);
    FILE* out = (config_.useStderr && entry.level >= LogLevel::Error) ? stderr : stdout;
    const LevelName* level = FindLevel(entry.level);
    if (config_.useColors && level && isatty(fileno(out))) {
        std::fprintf(out, "%s%s\033[0m\n", level->color, line.c_str());
    } else {
        std::fprintf(out, "%s\n", line.c_str());
    }
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(stdout);
    std::fflush(stderr);
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const Config& config) : config_(config) {
    Open(config_.append ? std::ios::app : std::ios::trunc);
}

FileSink::~FileSink() {
    std::lock_guard<std::mutex> lock(mutex_);
    out_.flush();
}

void FileSink::Open(std::ios::openmode mode) {
    written_ = 0;
    if (config_.path.empty()) {
        return;
    }
    out_.open(config_.path, std::ios::out | mode);
    if (out_.is_open()) {
        std::error_code ec;
        auto size = std::filesystem::file_size(config_.path, ec);
        written_ = ec ? 0 : static_cast<size_t>(size);
    }
}

void FileSink::Rotate() {
    namespace fs = std::filesystem;

    out_.close();
    std::error_code ec;
    if (config_.maxFiles > 0) {
        auto numbered = [this](size_t n) { return config_.path + "." + std::to_string(n); };
        fs::remove(numbered(config_.maxFiles), ec);
        for (size_t n = config_.maxFiles; n > 1; --n) {
            fs::rename(numbered(n - 1), numbered(n), ec);
        }
        fs::rename(config_.path, numbered(1), ec);
    }
    Open(std::ios::trunc);
}

void FileSink::Write(const LogEntry& entry) {
    if (entry.level < config_.level) {
        return;
    }

    LineFormat format;
    format.location = true;
    std::string line = FormatLogLine(entry, format) + "\n";

    std::lock_guard<std::mutex> lock(mutex_);
    if (!out_.is_open()) {
        return;
    }
    if (config_.maxSize > 0 && written_ + line.size() > config_.maxSize) {
        Rotate();
        if (!out_.is_open()) {
            return;
        }
    }

    out_ << line;
    written_ += line.size();
    if (config_.autoFlush) {
        out_.flush();
    }
}

void FileSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    out_.flush();
}

// ============================================================================
// CallbackSink
// ============================================================================

void CallbackSink::Write(const LogEntry& entry) {
    if (callback_ && entry.level >= level_) {
        callback_(entry);
    }
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    Shutdown();
}

void Logger::Initialize() {
    if (!initialized_.exchange(true)) {
        AddSink(std::make_shared<ConsoleSink>());
    }
}

void Logger::Shutdown() {
    Flush();
    ClearSinks();
    initialized_.store(false);
}

void Logger::AddSink(std::shared_ptr<ILogSink> sink) {
    if (sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks_.push_back(std::move(sink));
    }
}

void Logger::RemoveSink(const std::shared_ptr<ILogSink>& sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void Logger::ClearSinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

size_t Logger::SinkCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sinks_.size();
}

void Logger::EnableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(mutex_);
    restricted_ = true;
    categories_.insert(category);
}

void Logger::DisableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(mutex_);
    categories_.erase(category);
}

bool Logger::IsCategoryEnabled(const std::string& category) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !restricted_ || categories_.count(category) > 0;
}

void Logger::EnableAllCategories() {
    std::lock_guard<std::mutex> lock(mutex_);
    restricted_ = false;
    categories_.clear();
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    if (level == LogLevel::Off || level < level_.load()) {
        return false;
    }
    return IsCategoryEnabled(category);
}

void Logger::Log(LogLevel level, const std::string& category, const std::string& message,
                 const char* file, int line, const char* function) {
    if (!WillLog(level, category)) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.category = category;
    entry.message = message;
    entry.file = file ? file : "";
    entry.line = line;
    entry.function = function ? function : "";
    entry.timestamp = std::chrono::system_clock::now();

    // Sinks run unlocked so one may log or remove itself
    std::vector<std::shared_ptr<ILogSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks = sinks_;
    }
    for (const auto& sink : sinks) {
        sink->Write(entry);
    }
}

void Logger::LogF(LogLevel level, const std::string& category,
                  const char* file, int line, const char* function,
                  const char* format, ...) {
    if (!WillLog(level, category)) {
        return;
    }

    va_list args;
    va_start(args, format);
    va_list sizing;
    va_copy(sizing, args);
    int needed = std::vsnprintf(nullptr, 0, format, sizing);
    va_end(sizing);

    std::string message;
    if (needed > 0) {
        message.resize(static_cast<size_t>(needed) + 1);
        std::vsnprintf(&message[0], message.size(), format, args);
        message.resize(static_cast<size_t>(needed));
    }
    va_end(args);

    Log(level, category, message, file, line, function);
}

void Logger::Flush() {
    std::vector<std::shared_ptr<ILogSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks = sinks_;
    }
    for (const auto& sink : sinks) {
        sink->Flush();
    }
}

// ============================================================================
// LogStream
// ============================================================================

LogStream::~LogStream() {
    Logger::Instance().Log(level_, category_, buffer_.str(), file_, line_, function_);
}

} // namespace util
} // namespace crowdfund
