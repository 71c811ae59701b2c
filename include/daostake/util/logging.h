// DAOSTAKE - Logging System
// Copyright (c) 2024 DAOSTAKE Developers
// MIT License
//
// Leveled, categorized logging with console, file and callback sinks.
// When a block source is installed every entry is stamped with the host
// chain's current block, so engine logs line up with settlement heights.

#ifndef DAOSTAKE_UTIL_LOGGING_H
#define DAOSTAKE_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdint>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

namespace daostake {
namespace util {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace = 0,   // Very detailed debugging
    Debug = 1,   // Debug information
    Info = 2,    // General information
    Warn = 3,    // Warnings
    Error = 4,   // Errors
    Fatal = 5,   // Fatal errors
    Off = 6      // Disable logging
};

/// Convert log level to string
const char* LogLevelToString(LogLevel level);

/// Parse log level from string
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

/// Predefined log categories
namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* FARM = "farm";
    constexpr const char* POOL = "pool";
    constexpr const char* LEDGER = "ledger";
    constexpr const char* TOKEN = "token";
    constexpr const char* ADMIN = "admin";
    constexpr const char* DB = "db";
    constexpr const char* CONFIG = "config";
    constexpr const char* SIM = "sim";
}

// ============================================================================
// Log Entry
// ============================================================================

/// A single log entry
struct LogEntry {
    LogLevel level;
    std::string category;
    std::string message;
    std::string file;
    int line;
    std::string function;
    std::chrono::system_clock::time_point timestamp;
    std::optional<uint64_t> block;   // Host block when the entry was made

    LogEntry() : level(LogLevel::Info), line(0) {}
};

// ============================================================================
// Log Sink Interface
// ============================================================================

/// Abstract base class for log output destinations
class ILogSink {
public:
    virtual ~ILogSink() = default;

    /// Write a log entry
    virtual void Write(const LogEntry& entry) = 0;

    /// Flush any buffered output
    virtual void Flush() = 0;

    /// Set minimum log level for this sink
    virtual void SetLevel(LogLevel level) = 0;

    /// Get minimum log level for this sink
    virtual LogLevel GetLevel() const = 0;
};

// ============================================================================
// Console Sink
// ============================================================================

/// Log sink that writes to console (stdout/stderr)
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};           // Use ANSI color codes
        bool useStderr{true};           // Write to stderr (stdout carries results)
        bool showTimestamp{true};       // Include timestamp
        bool showLevel{true};           // Include log level
        bool showCategory{true};        // Include category
        bool showBlock{true};           // Include #block when known
        bool showLocation{false};       // Include file:line
        LogLevel level{LogLevel::Info}; // Minimum level
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

    const char* GetColorCode(LogLevel level) const;
};

// ============================================================================
// File Sink
// ============================================================================

/// Log sink that appends to a file
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path;               // Log file path
        bool append{true};              // Append to existing file
        bool autoFlush{false};          // Flush after each write
        bool showLocation{true};
        LogLevel level{LogLevel::Debug};
    };

    explicit FileSink(const Config& config);
    ~FileSink() override;

    /// Check if file is open
    bool IsOpen() const;

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

private:
    Config config_;
    std::ofstream file_;
    std::mutex mutex_;

    std::string Format(const LogEntry& entry) const;
};

// ============================================================================
// Callback Sink
// ============================================================================

/// Log sink that calls a callback function
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

/// Main logger class
class Logger {
public:
    /// Supplies the current block number for new entries
    using BlockSource = std::function<uint64_t()>;

    /// Get the singleton instance
    static Logger& Instance();

    /// Install the default console sink (idempotent)
    void Initialize(const ConsoleSink::Config& console = ConsoleSink::Config());

    /// Flush and drop all sinks
    void Shutdown();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    /// Set global minimum log level
    void SetLevel(LogLevel level);

    /// Get global minimum log level
    LogLevel GetLevel() const { return level_.load(); }

    /// Restrict output to the enabled categories
    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    bool IsCategoryEnabled(const std::string& category) const;
    void EnableAllCategories();

    /// Log a message
    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0,
             const char* function = nullptr);

    /// Log with printf-style formatting
    void LogF(LogLevel level, const std::string& category,
              const char* file, int line, const char* function,
              const char* format, ...);

    /// Stamp entries with `source()`; an empty source stops stamping
    void SetBlockSource(BlockSource source);
    void ClearBlockSource() { SetBlockSource(nullptr); }

    /// Check if a message would be logged
    bool WillLog(LogLevel level, const std::string& category) const;

    /// Flush all sinks
    void Flush();

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::unordered_set<std::string> enabledCategories_;
    mutable std::mutex categoriesMutex_;
    std::atomic<bool> allCategoriesEnabled_{true};

    BlockSource blockSource_;
    mutable std::mutex blockSourceMutex_;

    std::atomic<bool> initialized_{false};
};

// ============================================================================
// Log Stream
// ============================================================================

/// Stream-style logging helper
class LogStream {
public:
    LogStream(LogLevel level, const std::string& category,
              const char* file, int line, const char* function);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;
    LogStream(LogStream&& other) noexcept;
    LogStream& operator=(LogStream&& other) = delete;

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
    const char* function_;
    bool active_;
};

// ============================================================================
// Logging Macros
// ============================================================================

/// Get logger instance
#define DAOSTAKE_LOGGER ::daostake::util::Logger::Instance()

/// Check if logging is enabled
#define DAOSTAKE_LOG_ENABLED(level, category) \
    DAOSTAKE_LOGGER.WillLog(::daostake::util::LogLevel::level, category)

/// Log with level and category
#define DAOSTAKE_LOG(level, category) \
    if (DAOSTAKE_LOG_ENABLED(level, category)) \
        ::daostake::util::LogStream(::daostake::util::LogLevel::level, category, \
                                    __FILE__, __LINE__, __func__)

#define LOG_TRACE(category)   DAOSTAKE_LOG(Trace, category)
#define LOG_DEBUG(category)   DAOSTAKE_LOG(Debug, category)
#define LOG_INFO(category)    DAOSTAKE_LOG(Info, category)
#define LOG_WARN(category)    DAOSTAKE_LOG(Warn, category)
#define LOG_ERROR(category)   DAOSTAKE_LOG(Error, category)

/// Printf-style logging
#define DAOSTAKE_LOGF(level, category, ...) \
    do { \
        if (DAOSTAKE_LOG_ENABLED(level, category)) { \
            DAOSTAKE_LOGGER.LogF(::daostake::util::LogLevel::level, category, \
                                 __FILE__, __LINE__, __func__, __VA_ARGS__); \
        } \
    } while(0)

#define LogDebugF(category, ...)  DAOSTAKE_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   DAOSTAKE_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   DAOSTAKE_LOGF(Warn, category, __VA_ARGS__)
#define LogErrorF(category, ...)  DAOSTAKE_LOGF(Error, category, __VA_ARGS__)

// ============================================================================
// Utility Functions
// ============================================================================

/// Format timestamp for logging
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Truncate or pad string to fixed width
std::string FixedWidth(const std::string& str, size_t width, char pad = ' ');

/// Get basename from file path
std::string GetBasename(const std::string& path);

} // namespace util
} // namespace daostake

#endif // DAOSTAKE_UTIL_LOGGING_H
