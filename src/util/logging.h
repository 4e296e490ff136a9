// Copyright (c) 2025 The Trustmesh Core developers
// Distributed under the MIT software license

#ifndef TRUSTMESH_UTIL_LOGGING_H
#define TRUSTMESH_UTIL_LOGGING_H

#include <string>
#include <fstream>
#include <mutex>
#include <atomic>
#include <memory>
#include <cstdint>

/**
 * Category/level logging for the federation core
 *
 * Features:
 * - Log categories (REGISTRY, HANDSHAKE, DRIFT, etc.)
 * - Log levels (ERROR, WARN, INFO, DEBUG)
 * - File and console output
 * - Size-based log rotation
 */

/**
 * Log categories
 */
enum class LogCategory : uint32_t {
    NONE = 0,
    FEDERATION = (1 << 0),    // Similarity engine / general federation
    REGISTRY = (1 << 1),      // Peer registry and status transitions
    HANDSHAKE = (1 << 2),     // Handshake protocol and channels
    DRIFT = (1 << 3),         // High-precision drift sweeps
    STORAGE = (1 << 4),       // LevelDB persistence
    CONFIG = (1 << 5),        // Configuration loading
    ALL = 0xFFFFFFFF          // All categories
};

/**
 * Log levels
 * Note: Using LVL_ prefix to avoid conflicts with Windows ERROR macro
 */
enum class LogLevel {
    LVL_ERROR = 0,
    LVL_WARN = 1,
    LVL_INFO = 2,
    LVL_DEBUG = 3
};

/** Parse "error" / "warn" / "info" / "debug" (case-insensitive). */
bool ParseLogLevel(const std::string& str, LogLevel& level);

/** Parse a category name such as "registry"; "all" and "none" are accepted. */
bool ParseLogCategory(const std::string& str, LogCategory& category);

const char* LogLevelName(LogLevel level);
const char* LogCategoryName(LogCategory category);

/**
 * Logging configuration
 */
class CLoggingConfig {
public:
    static CLoggingConfig& GetInstance();

    // Enable/disable categories
    void EnableCategory(LogCategory category);
    void DisableCategory(LogCategory category);
    bool IsCategoryEnabled(LogCategory category) const;

    void SetLogLevel(LogLevel level);
    LogLevel GetLogLevel() const;

    // File logging
    void SetLogFile(const std::string& path);
    std::string GetLogFile() const;
    bool IsFileLoggingEnabled() const;

    // Console logging
    void SetConsoleLogging(bool enable);
    bool IsConsoleLoggingEnabled() const { return m_consoleLogging; }

    // Log rotation
    void SetMaxLogSize(size_t maxSize);
    size_t GetMaxLogSize() const;
    void SetMaxLogFiles(size_t maxFiles);
    size_t GetMaxLogFiles() const;

private:
    CLoggingConfig();
    ~CLoggingConfig() = default;

    std::atomic<uint32_t> m_enabledCategories{static_cast<uint32_t>(LogCategory::ALL)};
    std::atomic<LogLevel> m_logLevel{LogLevel::LVL_INFO};
    std::string m_logFile;
    std::atomic<bool> m_consoleLogging{true};
    size_t m_maxLogSize{10 * 1024 * 1024};  // 10 MB default
    size_t m_maxLogFiles{5};
    mutable std::mutex m_configMutex;
};

/**
 * Main logging class
 */
class CLogger {
public:
    static CLogger& GetInstance();

    // Open the configured log file (or <datadir>/federation.log)
    bool Initialize(const std::string& datadir);

    void Shutdown();

    void Log(LogCategory category, LogLevel level, const std::string& message);

    void LogPrintFormat(LogCategory category, LogLevel level, const char* format, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 4, 5)))
#endif
        ;

private:
    CLogger();
    ~CLogger();

    void RotateLogIfNeeded();
    void WriteToFile(const std::string& message);
    void WriteToConsole(LogLevel level, const std::string& message);

    // Format log message (not FormatMessage to avoid Windows API conflict)
    std::string FormatLogMsg(LogCategory category, LogLevel level, const std::string& message);

    std::unique_ptr<std::ofstream> m_logFile;
    std::string m_logPath;
    std::mutex m_logMutex;
    std::atomic<bool> m_initialized{false};
    size_t m_currentLogSize{0};
};

#define LogPrintf(category, level, format, ...) \
    CLogger::GetInstance().LogPrintFormat(LogCategory::category, LogLevel::LVL_##level, format, ##__VA_ARGS__)

// Category-specific macros (with format string)
#define LogPrintFederation(level, format, ...) LogPrintf(FEDERATION, level, format, ##__VA_ARGS__)
#define LogPrintRegistry(level, format, ...) LogPrintf(REGISTRY, level, format, ##__VA_ARGS__)
#define LogPrintHandshake(level, format, ...) LogPrintf(HANDSHAKE, level, format, ##__VA_ARGS__)
#define LogPrintDrift(level, format, ...) LogPrintf(DRIFT, level, format, ##__VA_ARGS__)
#define LogPrintStorage(level, format, ...) LogPrintf(STORAGE, level, format, ##__VA_ARGS__)
#define LogPrintConfig(level, format, ...) LogPrintf(CONFIG, level, format, ##__VA_ARGS__)

#endif // TRUSTMESH_UTIL_LOGGING_H
