// Copyright (c) 2025 The Trustmesh Core developers
// Distributed under the MIT software license

#include <util/config.h>
#include <util/logging.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

#ifdef _WIN32
    #include <windows.h>
    #include <shlobj.h>
#else
    #include <unistd.h>
    #include <pwd.h>
    #include <sys/stat.h>
#endif

namespace {

const char* const ENV_PREFIX = "TRUSTMESH_";

std::string ToLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::string ToEnvKey(const std::string& key) {
    std::string env_key = ENV_PREFIX + key;
    std::transform(env_key.begin(), env_key.end(), env_key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return env_key;
}

} // namespace

CConfigParser::CConfigParser() : m_loaded(false) {
}

CConfigParser::~CConfigParser() {
}

std::string CConfigParser::Trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, (last - first + 1));
}

bool CConfigParser::ParseLine(const std::string& line, std::string& key, std::string& value) {
    std::string clean_line = line;
    size_t comment_pos = clean_line.find_first_of("#;");
    if (comment_pos != std::string::npos) {
        clean_line = clean_line.substr(0, comment_pos);
    }

    clean_line = Trim(clean_line);
    if (clean_line.empty()) {
        return false;
    }

    // Section headers are accepted but carry no meaning yet
    if (clean_line[0] == '[' && clean_line.back() == ']') {
        return false;
    }

    size_t eq_pos = clean_line.find('=');
    if (eq_pos == std::string::npos) {
        return false;
    }

    key = Trim(clean_line.substr(0, eq_pos));
    value = Trim(clean_line.substr(eq_pos + 1));

    if (value.length() >= 2 && value[0] == '"' && value.back() == '"') {
        value = value.substr(1, value.length() - 2);
    }

    return !key.empty();
}

std::optional<std::string> CConfigParser::GetEnv(const std::string& name) {
    const char* env_value = std::getenv(name.c_str());
    if (env_value == nullptr) {
        return std::nullopt;
    }
    return std::string(env_value);
}

bool CConfigParser::LoadConfigFile(const std::string& file_path) {
    m_config_file_path = file_path;
    m_settings.clear();
    m_multiSettings.clear();
    m_loaded = false;

#ifndef _WIN32
    struct stat file_stat;
    if (lstat(file_path.c_str(), &file_stat) == 0) {
        if (S_ISLNK(file_stat.st_mode)) {
            LogPrintConfig(WARN, "Config file %s is a symlink", file_path.c_str());
        }
        if (file_stat.st_mode & (S_IWGRP | S_IWOTH)) {
            LogPrintConfig(WARN, "Config file %s is writable by group or others (mode %o)",
                           file_path.c_str(), static_cast<unsigned>(file_stat.st_mode & 0777));
        }
    }
#endif

    std::ifstream file(file_path);
    if (!file.is_open()) {
        // Missing file is fine, defaults apply
        LogPrintConfig(DEBUG, "Config file not found: %s (using defaults)", file_path.c_str());
        m_loaded = true;
        return true;
    }

    std::string line;
    int line_num = 0;
    while (std::getline(file, line)) {
        line_num++;
        std::string key, value;
        if (ParseLine(line, key, value)) {
            key = ToLower(key);
            m_settings[key] = value;
            m_multiSettings[key].push_back(value);
            LogPrintConfig(DEBUG, "Config: %s = %s (line %d)", key.c_str(), value.c_str(), line_num);
        }
    }

    if (file.bad()) {
        LogPrintConfig(ERROR, "Error while reading config file %s", file_path.c_str());
        return false;
    }

    m_loaded = true;
    if (!m_settings.empty()) {
        LogPrintConfig(INFO, "Loaded configuration from %s (%zu settings)",
                       file_path.c_str(), m_settings.size());
    }
    return true;
}

std::string CConfigParser::GetString(const std::string& key, const std::string& default_value) const {
    const std::string key_lower = ToLower(key);

    // Priority 1: Environment variable (TRUSTMESH_*)
    auto env_value = GetEnv(ToEnvKey(key_lower));
    if (env_value.has_value()) {
        LogPrintConfig(DEBUG, "Config: %s = %s (from environment)",
                       key_lower.c_str(), env_value->c_str());
        return *env_value;
    }

    // Priority 2: Config file
    auto it = m_settings.find(key_lower);
    if (it != m_settings.end()) {
        return it->second;
    }

    return default_value;
}

int64_t CConfigParser::GetInt64(const std::string& key, int64_t default_value) const {
    std::string value = GetString(key, "");
    if (value.empty()) {
        return default_value;
    }

    try {
        size_t pos = 0;
        int64_t parsed = std::stoll(value, &pos);
        if (pos != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return parsed;
    } catch (const std::exception&) {
        LogPrintConfig(WARN, "Config: Invalid integer value for %s: %s (using default: %lld)",
                       key.c_str(), value.c_str(), static_cast<long long>(default_value));
        return default_value;
    }
}

double CConfigParser::GetDouble(const std::string& key, double default_value) const {
    std::string value = GetString(key, "");
    if (value.empty()) {
        return default_value;
    }

    try {
        size_t pos = 0;
        double parsed = std::stod(value, &pos);
        if (pos != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return parsed;
    } catch (const std::exception&) {
        LogPrintConfig(WARN, "Config: Invalid number for %s: %s (using default: %g)",
                       key.c_str(), value.c_str(), default_value);
        return default_value;
    }
}

bool CConfigParser::GetBool(const std::string& key, bool default_value) const {
    std::string value = ToLower(GetString(key, ""));
    if (value.empty()) {
        return default_value;
    }

    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        return false;
    }

    LogPrintConfig(WARN, "Config: Invalid boolean value for %s: %s (using default: %s)",
                   key.c_str(), value.c_str(), default_value ? "true" : "false");
    return default_value;
}

std::vector<std::string> CConfigParser::GetList(const std::string& key) const {
    std::vector<std::string> result;
    const std::string key_lower = ToLower(key);

    // Environment override is comma-separated
    auto env_value = GetEnv(ToEnvKey(key_lower));
    if (env_value.has_value()) {
        std::stringstream ss(*env_value);
        std::string item;
        while (std::getline(ss, item, ',')) {
            item = Trim(item);
            if (!item.empty()) {
                result.push_back(item);
            }
        }
        return result;
    }

    auto it = m_multiSettings.find(key_lower);
    if (it != m_multiSettings.end()) {
        result = it->second;
    }
    return result;
}

bool CConfigParser::IsSet(const std::string& key) const {
    const std::string key_lower = ToLower(key);
    return GetEnv(ToEnvKey(key_lower)).has_value() || m_settings.count(key_lower) > 0;
}

std::string GetDefaultDataDir() {
#ifdef _WIN32
    char path[MAX_PATH];
    if (SHGetFolderPathA(NULL, CSIDL_APPDATA, NULL, SHGFP_TYPE_CURRENT, path) == S_OK) {
        return std::string(path) + "\\.trustmesh";
    }
    return ".trustmesh";
#else
    const char* home = std::getenv("HOME");
    if (home == nullptr) {
        struct passwd* pwd = getpwuid(getuid());
        if (pwd != nullptr) {
            home = pwd->pw_dir;
        }
    }

    if (home != nullptr) {
        return std::string(home) + "/.trustmesh";
    }

    return ".trustmesh";
#endif
}

std::string GetConfigFilePath(const std::string& datadir) {
    std::string dir = datadir.empty() ? GetDefaultDataDir() : datadir;

#ifdef _WIN32
    return dir + "\\trustmesh.conf";
#else
    return dir + "/trustmesh.conf";
#endif
}
