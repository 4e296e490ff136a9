// Copyright (c) 2025 The Trustmesh Core developers
// Distributed under the MIT software license

#include <util/logging.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {

std::string ToLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

} // namespace

bool ParseLogLevel(const std::string& str, LogLevel& level) {
    const std::string s = ToLower(str);
    if (s == "error") { level = LogLevel::LVL_ERROR; return true; }
    if (s == "warn" || s == "warning") { level = LogLevel::LVL_WARN; return true; }
    if (s == "info") { level = LogLevel::LVL_INFO; return true; }
    if (s == "debug") { level = LogLevel::LVL_DEBUG; return true; }
    return false;
}

bool ParseLogCategory(const std::string& str, LogCategory& category) {
    const std::string s = ToLower(str);
    if (s == "federation") { category = LogCategory::FEDERATION; return true; }
    if (s == "registry") { category = LogCategory::REGISTRY; return true; }
    if (s == "handshake") { category = LogCategory::HANDSHAKE; return true; }
    if (s == "drift") { category = LogCategory::DRIFT; return true; }
    if (s == "storage") { category = LogCategory::STORAGE; return true; }
    if (s == "config") { category = LogCategory::CONFIG; return true; }
    if (s == "all" || s == "1") { category = LogCategory::ALL; return true; }
    if (s == "none" || s == "0") { category = LogCategory::NONE; return true; }
    return false;
}

const char* LogLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::LVL_ERROR: return "ERROR";
        case LogLevel::LVL_WARN: return "WARN";
        case LogLevel::LVL_INFO: return "INFO";
        case LogLevel::LVL_DEBUG: return "DEBUG";
    }
    return "";
}

const char* LogCategoryName(LogCategory category) {
    switch (category) {
        case LogCategory::FEDERATION: return "FEDERATION";
        case LogCategory::REGISTRY: return "REGISTRY";
        case LogCategory::HANDSHAKE: return "HANDSHAKE";
        case LogCategory::DRIFT: return "DRIFT";
        case LogCategory::STORAGE: return "STORAGE";
        case LogCategory::CONFIG: return "CONFIG";
        default: return "";
    }
}

// CLoggingConfig implementation
CLoggingConfig& CLoggingConfig::GetInstance() {
    static CLoggingConfig instance;
    return instance;
}

CLoggingConfig::CLoggingConfig() {
    m_enabledCategories = static_cast<uint32_t>(LogCategory::ALL);
    m_logLevel = LogLevel::LVL_INFO;
}

void CLoggingConfig::EnableCategory(LogCategory category) {
    m_enabledCategories.fetch_or(static_cast<uint32_t>(category));
}

void CLoggingConfig::DisableCategory(LogCategory category) {
    m_enabledCategories.fetch_and(~static_cast<uint32_t>(category));
}

bool CLoggingConfig::IsCategoryEnabled(LogCategory category) const {
    uint32_t cat = static_cast<uint32_t>(category);
    return (m_enabledCategories.load() & cat) != 0;
}

void CLoggingConfig::SetLogLevel(LogLevel level) {
    m_logLevel.store(level);
}

LogLevel CLoggingConfig::GetLogLevel() const {
    return m_logLevel.load();
}

void CLoggingConfig::SetLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(m_configMutex);
    m_logFile = path;
}

std::string CLoggingConfig::GetLogFile() const {
    std::lock_guard<std::mutex> lock(m_configMutex);
    return m_logFile;
}

bool CLoggingConfig::IsFileLoggingEnabled() const {
    std::lock_guard<std::mutex> lock(m_configMutex);
    return !m_logFile.empty();
}

void CLoggingConfig::SetConsoleLogging(bool enable) {
    m_consoleLogging.store(enable);
}

void CLoggingConfig::SetMaxLogSize(size_t maxSize) {
    std::lock_guard<std::mutex> lock(m_configMutex);
    m_maxLogSize = maxSize;
}

size_t CLoggingConfig::GetMaxLogSize() const {
    std::lock_guard<std::mutex> lock(m_configMutex);
    return m_maxLogSize;
}

void CLoggingConfig::SetMaxLogFiles(size_t maxFiles) {
    std::lock_guard<std::mutex> lock(m_configMutex);
    m_maxLogFiles = maxFiles;
}

size_t CLoggingConfig::GetMaxLogFiles() const {
    std::lock_guard<std::mutex> lock(m_configMutex);
    return m_maxLogFiles;
}

// CLogger implementation
CLogger& CLogger::GetInstance() {
    static CLogger instance;
    return instance;
}

CLogger::CLogger() {
}

CLogger::~CLogger() {
    Shutdown();
}

bool CLogger::Initialize(const std::string& datadir) {
    std::lock_guard<std::mutex> lock(m_logMutex);

    if (m_initialized.load()) {
        return true;  // Already initialized
    }

    CLoggingConfig& config = CLoggingConfig::GetInstance();

    std::string logPath = config.GetLogFile();
    if (logPath.empty() && !datadir.empty()) {
        logPath = datadir + "/federation.log";
    }

    if (!logPath.empty()) {
        m_logFile = std::make_unique<std::ofstream>(logPath, std::ios::app);
        if (!m_logFile->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << logPath << std::endl;
            m_logFile.reset();
            return false;
        }

        m_logFile->seekp(0, std::ios::end);
        m_currentLogSize = static_cast<size_t>(m_logFile->tellp());
        m_logPath = logPath;
    }

    m_initialized.store(true);
    return true;
}

void CLogger::Shutdown() {
    std::lock_guard<std::mutex> lock(m_logMutex);

    if (m_logFile && m_logFile->is_open()) {
        m_logFile->flush();
        m_logFile->close();
    }
    m_logFile.reset();
    m_logPath.clear();
    m_currentLogSize = 0;

    m_initialized.store(false);
}

void CLogger::Log(LogCategory category, LogLevel level, const std::string& message) {
    CLoggingConfig& config = CLoggingConfig::GetInstance();

    if (!config.IsCategoryEnabled(category)) {
        return;
    }

    if (level > config.GetLogLevel()) {
        return;
    }

    std::string formatted = FormatLogMsg(category, level, message);

    std::lock_guard<std::mutex> lock(m_logMutex);

    if (config.IsConsoleLoggingEnabled()) {
        WriteToConsole(level, formatted);
    }

    if (m_initialized.load() && m_logFile && m_logFile->is_open()) {
        WriteToFile(formatted);
    }
}

void CLogger::LogPrintFormat(LogCategory category, LogLevel level, const char* format, ...) {
    char buffer[4096];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    Log(category, level, std::string(buffer));
}

void CLogger::RotateLogIfNeeded() {
    CLoggingConfig& config = CLoggingConfig::GetInstance();

    const size_t maxSize = config.GetMaxLogSize();
    if (maxSize == 0 || m_currentLogSize < maxSize) {
        return;
    }

    if (!m_logFile || !m_logFile->is_open() || m_logPath.empty()) {
        return;
    }

    m_logFile->flush();
    m_logFile->close();

    // federation.log.N-1 -> federation.log.N, oldest one is overwritten
    const size_t maxFiles = std::max<size_t>(1, config.GetMaxLogFiles());
    for (size_t i = maxFiles - 1; i > 0; i--) {
        std::string oldFile = m_logPath + "." + std::to_string(i);
        std::string newFile = m_logPath + "." + std::to_string(i + 1);

        // ENOENT is expected until every slot has been used once
        if (std::rename(oldFile.c_str(), newFile.c_str()) != 0 && errno != ENOENT) {
            std::cerr << "[Logger] Warning: Failed to rotate log file " << oldFile
                      << " to " << newFile << " (" << std::strerror(errno) << ")" << std::endl;
        }
    }

    std::string rotatedFile = m_logPath + ".1";
    if (std::rename(m_logPath.c_str(), rotatedFile.c_str()) != 0) {
        std::cerr << "[Logger] Warning: Failed to rotate current log file to " << rotatedFile
                  << " (" << std::strerror(errno) << ")" << std::endl;
    }

    m_logFile = std::make_unique<std::ofstream>(m_logPath, std::ios::trunc);
    m_currentLogSize = 0;
}

void CLogger::WriteToFile(const std::string& message) {
    if (!m_logFile || !m_logFile->is_open()) {
        return;
    }

    RotateLogIfNeeded();
    if (!m_logFile || !m_logFile->is_open()) {
        return;
    }

    *m_logFile << message << std::endl;
    m_currentLogSize += message.size() + 1;  // +1 for newline
}

void CLogger::WriteToConsole(LogLevel level, const std::string& message) {
    std::ostream& stream = (level <= LogLevel::LVL_WARN) ? std::cerr : std::cout;
    stream << message << std::endl;
}

std::string CLogger::FormatLogMsg(LogCategory category, LogLevel level, const std::string& message) {
    std::ostringstream oss;

    std::time_t now = std::time(nullptr);
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &now);
#else
    localtime_r(&now, &tm_buf);
#endif
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");

    oss << " [" << LogLevelName(level) << "]";

    const char* catStr = LogCategoryName(category);
    if (catStr[0] != '\0') {
        oss << " [" << catStr << "]";
    }

    oss << " " << message;

    return oss.str();
}
