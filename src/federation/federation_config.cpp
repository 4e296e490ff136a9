// Copyright (c) 2025 The Trustmesh Core developers
// Distributed under the MIT software license

#include "federation_config.h"

#include "drift_detector.h"

#include <util/config.h>

#include <cmath>

namespace trustmesh {

FederationConfig::FederationConfig() : drift_threshold(DEFAULT_DRIFT_THRESHOLD) {}

FederationConfig LoadFederationConfig(const CConfigParser& parser, const std::string& datadir) {
    FederationConfig config;

    config.data_dir = parser.GetString("datadir", datadir);
    config.local_peer_id = parser.GetString("peerid", config.local_peer_id);
    config.local_display_name = parser.GetString("peername", config.local_display_name);

    if (config.local_peer_id.empty()) {
        LogPrintConfig(WARN, "Config: peerid is empty (using default: local)");
        config.local_peer_id = "local";
    }

    double threshold = parser.GetDouble("driftthreshold", DEFAULT_DRIFT_THRESHOLD);
    if (!std::isfinite(threshold) || threshold <= 0.0 || threshold >= 1.0) {
        LogPrintConfig(WARN, "Config: driftthreshold %g out of range (0, 1) (using default: %g)",
                       threshold, DEFAULT_DRIFT_THRESHOLD);
        threshold = DEFAULT_DRIFT_THRESHOLD;
    }
    config.drift_threshold = threshold;

    if (parser.IsSet("loglevel")) {
        const std::string level = parser.GetString("loglevel");
        if (!ParseLogLevel(level, config.log_level)) {
            LogPrintConfig(WARN, "Config: Unknown loglevel %s (using default: info)", level.c_str());
            config.log_level = LogLevel::LVL_INFO;
        }
    }

    config.log_file = parser.GetString("logfile", "");
    config.log_console = parser.GetBool("printtoconsole", config.log_console);

    int64_t max_size_mb = parser.GetInt64("logmaxsize", static_cast<int64_t>(config.log_max_size >> 20));
    if (max_size_mb < 1) {
        LogPrintConfig(WARN, "Config: logmaxsize must be at least 1 MB (using default: 10)");
    } else {
        config.log_max_size = static_cast<size_t>(max_size_mb) << 20;
    }

    int64_t max_files = parser.GetInt64("logmaxfiles", static_cast<int64_t>(config.log_max_files));
    if (max_files < 1) {
        LogPrintConfig(WARN, "Config: logmaxfiles must be at least 1 (using default: 5)");
    } else {
        config.log_max_files = static_cast<size_t>(max_files);
    }

    const std::vector<std::string> categories = parser.GetList("debug");
    if (!categories.empty()) {
        uint32_t mask = 0;
        bool any_valid = false;
        for (const std::string& name : categories) {
            LogCategory category;
            if (!ParseLogCategory(name, category)) {
                LogPrintConfig(WARN, "Config: Unknown debug category %s (ignored)", name.c_str());
                continue;
            }
            mask |= static_cast<uint32_t>(category);
            any_valid = true;
        }
        if (any_valid) {
            config.log_categories = mask;
        }
    }

    LogPrintConfig(DEBUG, "Federation config: datadir=%s peerid=%s driftthreshold=%g loglevel=%s",
                   config.data_dir.c_str(), config.local_peer_id.c_str(), config.drift_threshold,
                   LogLevelName(config.log_level));
    return config;
}

void ApplyLoggingConfig(const FederationConfig& config) {
    CLoggingConfig& logging = CLoggingConfig::GetInstance();

    logging.SetLogLevel(config.log_level);
    logging.DisableCategory(LogCategory::ALL);
    logging.EnableCategory(static_cast<LogCategory>(config.log_categories));
    logging.SetConsoleLogging(config.log_console);
    logging.SetMaxLogSize(config.log_max_size);
    logging.SetMaxLogFiles(config.log_max_files);

    if (!config.log_file.empty()) {
        logging.SetLogFile(config.log_file);
    }
}

} // namespace trustmesh
