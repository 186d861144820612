// CROWDFUND - Logging System
// Copyright (c) 2024 CROWDFUND Developers
// MIT License
//
// Process-wide leveled logging. Every entry carries a category naming the
// subsystem that wrote it (campaign, ledger, transport, store, config, db);
// sinks decide where entries go and may filter by level on their own.

#ifndef CROWDFUND_UTIL_LOGGING_H
#define CROWDFUND_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace crowdfund {
namespace util {

// ============================================================================
// Levels and Categories
// ============================================================================

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6
};

/// "TRACE" .. "FATAL", "OFF"
const char* LogLevelToString(LogLevel level);

/// Case-insensitive; accepts "warning" and "none". Unknown strings give Info.
LogLevel LogLevelFromString(const std::string& str);

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* CAMPAIGN = "campaign";
    constexpr const char* LEDGER = "ledger";
    constexpr const char* TRANSPORT = "transport";
    constexpr const char* STORE = "store";
    constexpr const char* CONFIG = "config";
    constexpr const char* DB = "db";
}

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    std::string file;
    int line{0};
    std::string function;
    std::chrono::system_clock::time_point timestamp;
};

/// Which parts of an entry a sink prints before the message
struct LineFormat {
    bool timestamp{true};
    bool category{true};
    bool location{false};
};

/// "2024-01-01 12:00:00.000 [INFO ] [campaign] file.cpp:42 message"
std::string FormatLogLine(const LogEntry& entry, const LineFormat& format);

// ============================================================================
// Sinks
// ============================================================================

class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;
    virtual void SetLevel(LogLevel level) = 0;
    virtual LogLevel GetLevel() const = 0;
};

/// Writes to stdout, or stderr for errors when configured
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};
        bool useStderr{false};
        bool showTimestamp{true};
        bool showCategory{true};
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink() = default;
    explicit ConsoleSink(const Config& config) : config_(config) {}

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

private:
    Config config_;
    std::mutex mutex_;
};

/**
 * Appends to a file. When the next line would push the file past maxSize
 * it is renamed to path.1 (older copies shift up to path.maxFiles) and a
 * fresh file is started.
 */
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path;
        bool append{true};
        bool autoFlush{false};
        size_t maxSize{10 * 1024 * 1024};
        size_t maxFiles{5};
        LogLevel level{LogLevel::Debug};
    };

    explicit FileSink(const Config& config);
    ~FileSink() override;

    bool IsOpen() const { return out_.is_open(); }
    size_t GetCurrentSize() const { return written_; }

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

private:
    void Open(std::ios::openmode mode);
    void Rotate();

    Config config_;
    std::ofstream out_;
    size_t written_{0};
    std::mutex mutex_;
};

/// Hands every entry at or above its level to a callback
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info)
        : callback_(std::move(callback)), level_(level) {}

    void Write(const LogEntry& entry) override;
    void Flush() override {}
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    Callback callback_;
    LogLevel level_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    /// Install a console sink the first time it is called
    void Initialize();

    /// Flush and drop all sinks
    void Shutdown();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /**
     * Category filter. By default every category is logged; once a
     * category is enabled only enabled categories are.
     */
    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    bool IsCategoryEnabled(const std::string& category) const;
    void EnableAllCategories();

    bool WillLog(LogLevel level, const std::string& category) const;

    void Log(LogLevel level, const std::string& category, const std::string& message,
             const char* file = nullptr, int line = 0, const char* function = nullptr);

    void LogF(LogLevel level, const std::string& category,
              const char* file, int line, const char* function,
              const char* format, ...);

    void Flush();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::atomic<bool> initialized_{false};

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<ILogSink>> sinks_;
    std::set<std::string> categories_;
    bool restricted_{false};
};

/// Collects a message through operator<< and logs it when destroyed
class LogStream {
public:
    LogStream(LogLevel level, const char* category, const char* file, int line,
              const char* function)
        : level_(level), category_(category), file_(file), line_(line), function_(function) {}
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        buffer_ << value;
        return *this;
    }

private:
    std::ostringstream buffer_;
    LogLevel level_;
    const char* category_;
    const char* file_;
    int line_;
    const char* function_;
};

// ============================================================================
// Macros
// ============================================================================

#define CROWDFUND_LOGGER ::crowdfund::util::Logger::Instance()

#define CROWDFUND_LOG_ENABLED(level, category) \
    CROWDFUND_LOGGER.WillLog(::crowdfund::util::LogLevel::level, category)

// Arguments are not evaluated when the entry is filtered out
#define CROWDFUND_LOG(level, category) \
    if (!CROWDFUND_LOG_ENABLED(level, category)) {} else \
        ::crowdfund::util::LogStream(::crowdfund::util::LogLevel::level, category, \
                                     __FILE__, __LINE__, __func__)

#define LOG_TRACE(category)   CROWDFUND_LOG(Trace, category)
#define LOG_DEBUG(category)   CROWDFUND_LOG(Debug, category)
#define LOG_INFO(category)    CROWDFUND_LOG(Info, category)
#define LOG_WARN(category)    CROWDFUND_LOG(Warn, category)
#define LOG_ERROR(category)   CROWDFUND_LOG(Error, category)

#define CROWDFUND_LOGF(level, category, ...) \
    do { \
        if (CROWDFUND_LOG_ENABLED(level, category)) { \
            CROWDFUND_LOGGER.LogF(::crowdfund::util::LogLevel::level, category, \
                                  __FILE__, __LINE__, __func__, __VA_ARGS__); \
        } \
    } while (0)

#define LogDebugF(category, ...)  CROWDFUND_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   CROWDFUND_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   CROWDFUND_LOGF(Warn, category, __VA_ARGS__)
#define LogErrorF(category, ...)  CROWDFUND_LOGF(Error, category, __VA_ARGS__)

// ============================================================================
// Helpers
// ============================================================================

/// Local time as "YYYY-MM-DD HH:MM:SS.mmm"
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Last path component of a source file name
std::string GetBasename(const std::string& path);

} // namespace util
} // namespace crowdfund

#endif // CROWDFUND_UTIL_LOGGING_H
