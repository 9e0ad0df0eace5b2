// VINDEX - Logging System
// Copyright (c) 2024 VINDEX Developers
// MIT License
//
// Leveled, category-filtered logging with pluggable sinks.
// Stream-style (LOG_INFO(cat) << ...) and printf-style (LogInfoF) front ends.

#ifndef VINDEX_UTIL_LOGGING_H
#define VINDEX_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

namespace vindex {
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

/// Parse log level from string (case-insensitive, Info on unknown input)
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* LEDGER = "ledger";
    constexpr const char* MEMPOOL = "mempool";
    constexpr const char* STAKING = "staking";
    constexpr const char* SWAP = "swap";
    constexpr const char* VALIDATION = "validation";
    constexpr const char* MINING = "mining";
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
    /// Wall-clock milliseconds (follows the mock clock when enabled)
    int64_t timestampMs{0};
};

// ============================================================================
// Sinks
// ============================================================================

/// Output destination for log entries
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

protected:
    std::atomic<LogLevel> level_{LogLevel::Trace};
};

/// Writes formatted lines to stdout (errors optionally to stderr)
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};       // ANSI colours when attached to a terminal
        bool useStderr{true};       // Error and Fatal go to stderr
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);

    void Write(const LogEntry& entry) override;
    void Flush() override;

private:
    Config config_;
    std::mutex mutex_;

    static const char* GetColorCode(LogLevel level);
};

/// Appends formatted lines to a file
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& path, bool autoFlush = false);
    ~FileSink() override;

    bool IsOpen() const { return file_.is_open(); }
    const std::string& GetPath() const { return path_; }

    void Write(const LogEntry& entry) override;
    void Flush() override;

private:
    std::string path_;
    bool autoFlush_;
    std::ofstream file_;
    std::mutex mutex_;
};

/// Forwards entries to a callback (used by tests to capture output)
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback);

    void Write(const LogEntry& entry) override;
    void Flush() override {}

private:
    Callback callback_;
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

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Restrict output to the named categories
    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    void EnableAllCategories();
    bool IsCategoryEnabled(const std::string& category) const;

    bool WillLog(LogLevel level, const std::string& category) const;

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0);

    void LogF(LogLevel level, const std::string& category,
              const char* file, int line, const char* format, ...);

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
    bool allCategoriesEnabled_{true};
    mutable std::mutex categoriesMutex_;

    std::atomic<bool> initialized_{false};
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects a message and hands it to the Logger on destruction
class LogStream {
public:
    LogStream(LogLevel level, const char* category, const char* file, int line);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    std::ostringstream stream_;
    LogLevel level_;
    const char* category_;
    const char* file_;
    int line_;
};

/// Format a log entry as "2024-01-02T03:04:05.678Z [INFO ] [ledger] msg"
std::string FormatLogEntry(const LogEntry& entry);

// ============================================================================
// Logging Macros
// ============================================================================

#define VINDEX_LOGGER ::vindex::util::Logger::Instance()

#define VINDEX_LOG(level, category) \
    if (VINDEX_LOGGER.WillLog(::vindex::util::LogLevel::level, category)) \
        ::vindex::util::LogStream(::vindex::util::LogLevel::level, category, \
                                  __FILE__, __LINE__)

#define LOG_TRACE(category)   VINDEX_LOG(Trace, category)
#define LOG_DEBUG(category)   VINDEX_LOG(Debug, category)
#define LOG_INFO(category)    VINDEX_LOG(Info, category)
#define LOG_WARN(category)    VINDEX_LOG(Warn, category)
#define LOG_ERROR(category)   VINDEX_LOG(Error, category)
#define LOG_FATAL(category)   VINDEX_LOG(Fatal, category)

#define VINDEX_LOGF(level, category, ...) \
    do { \
        if (VINDEX_LOGGER.WillLog(::vindex::util::LogLevel::level, category)) { \
            VINDEX_LOGGER.LogF(::vindex::util::LogLevel::level, category, \
                               __FILE__, __LINE__, __VA_ARGS__); \
        } \
    } while (0)

#define LogDebugF(category, ...)  VINDEX_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   VINDEX_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   VINDEX_LOGF(Warn, category, __VA_ARGS__)
#define LogErrorF(category, ...)  VINDEX_LOGF(Error, category, __VA_ARGS__)

} // namespace util
} // namespace vindex

#endif // VINDEX_UTIL_LOGGING_H
