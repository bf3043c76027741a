// PAMTALK - Logging System
// Copyright (c) 2024 PAMTALK Developers
// MIT License
//
// Leveled, categorized logging with pluggable sinks:
// - Levels TRACE through FATAL, plus OFF
// - Per-component categories (ledger, governance, reward, ...)
// - Console, file and callback sinks
// - Stream-style macros: LOG_INFO(LogCategory::LEDGER) << "minted " << n;

#ifndef PAMTALK_UTIL_LOGGING_H
#define PAMTALK_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

namespace pamtalk {
namespace util {

// ============================================================================
// Log Levels
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

/// Convert log level to string
const char* LogLevelToString(LogLevel level);

/// Parse log level from string (case-insensitive, defaults to Info)
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* LEDGER = "ledger";
    constexpr const char* GOVERNANCE = "governance";
    constexpr const char* REWARD = "reward";
    constexpr const char* SETTLEMENT = "settlement";
    constexpr const char* ESCROW = "escrow";
    constexpr const char* CONFIG = "config";
}

// ============================================================================
// Log Entry
// ============================================================================

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    std::string file;
    int line{0};
    std::chrono::system_clock::time_point timestamp;
};

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;

    virtual void SetLevel(LogLevel level) = 0;
    virtual LogLevel GetLevel() const = 0;
};

/// Log sink that writes to stdout (errors optionally to stderr)
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};
        bool useStderr{false};
        bool showTimestamp{true};
        bool showCategory{true};
        bool showLocation{false};
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    std::mutex mutex_;

    std::string Format(const LogEntry& entry) const;
};

/// Log sink that appends to a file
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& path, LogLevel level = LogLevel::Debug);
    ~FileSink() override;

    bool IsOpen() const;

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    std::string path_;
    std::ofstream file_;
    std::mutex mutex_;
    LogLevel level_;
};

/// Log sink that forwards entries to a callback
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    CallbackSink() = default;
    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info);

    void Write(const LogEntry& entry) override;
    void Flush() override {}
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    Callback callback_;
    LogLevel level_{LogLevel::Info};
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    /// Install the default console sink (idempotent)
    void Initialize();

    /// Flush and drop all sinks
    void Shutdown();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level);
    LogLevel GetLevel() const { return level_.load(); }

    /// Restrict output to explicitly enabled categories
    void EnableCategory(const std::string& category);
    /// Silence one category; wins over EnableAllCategories until reset
    void DisableCategory(const std::string& category);
    bool IsCategoryEnabled(const std::string& category) const;
    void EnableAllCategories();

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0);

    bool WillLog(LogLevel level, const std::string& category) const;

    void Flush();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::unordered_set<std::string> enabledCategories_;
    std::unordered_set<std::string> disabledCategories_;
    mutable std::mutex categoriesMutex_;
    bool allCategoriesEnabled_{true};

    std::atomic<bool> initialized_{false};
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects a message and hands it to the logger on destruction
class LogStream {
public:
    LogStream(LogLevel level, const std::string& category,
              const char* file, int line);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        if (active_) {
            stream_ << value;
        }
        return *this;
    }

private:
    std::ostringstream stream_;
    LogLevel level_;
    std::string category_;
    const char* file_;
    int line_;
    bool active_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define PAMTALK_LOGGER ::pamtalk::util::Logger::Instance()

#define PAMTALK_LOG_ENABLED(level, category) \
    PAMTALK_LOGGER.WillLog(::pamtalk::util::LogLevel::level, category)

#define PAMTALK_LOG(level, category) \
    if (PAMTALK_LOG_ENABLED(level, category)) \
        ::pamtalk::util::LogStream(::pamtalk::util::LogLevel::level, category, \
                                   __FILE__, __LINE__)

#define LOG_TRACE(category)   PAMTALK_LOG(Trace, category)
#define LOG_DEBUG(category)   PAMTALK_LOG(Debug, category)
#define LOG_INFO(category)    PAMTALK_LOG(Info, category)
#define LOG_WARN(category)    PAMTALK_LOG(Warn, category)
#define LOG_ERROR(category)   PAMTALK_LOG(Error, category)

// ============================================================================
// Utility Functions
// ============================================================================

/// Format timestamp for logging
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Get basename from file path
std::string GetBasename(const std::string& path);

} // namespace util
} // namespace pamtalk

#endif // PAMTALK_UTIL_LOGGING_H
