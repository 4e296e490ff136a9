// Copyright (c) 2025 The Trustmesh Core developers
// Distributed under the MIT software license

#ifndef TRUSTMESH_FEDERATION_FEDERATION_CONFIG_H
#define TRUSTMESH_FEDERATION_FEDERATION_CONFIG_H

#include <util/logging.h>

#include <cstddef>
#include <cstdint>
#include <string>

class CConfigParser;

namespace trustmesh {

/**
 * Node settings read from trustmesh.conf / TRUSTMESH_* environment.
 *
 *   datadir=<path>            registry store location (empty: memory-only)
 *   peerid=<id>               local peer id used on channels
 *   peername=<name>           local display name
 *   driftthreshold=<0..1>     high-precision drift threshold
 *   loglevel=error|warn|info|debug
 *   logfile=<path>            defaults to <datadir>/federation.log
 *   debug=<category>          repeatable; restricts logging to these categories
 *   printtoconsole=0|1        also log to stdout/stderr (default 1)
 *   logmaxsize=<MB>           rotate the log file past this size (default 10)
 *   logmaxfiles=<n>           rotated files kept (default 5)
 */
struct FederationConfig {
    std::string data_dir;
    std::string local_peer_id = "local";
    std::string local_display_name = "Trustmesh Node";
    double drift_threshold;
    LogLevel log_level = LogLevel::LVL_INFO;
    std::string log_file;
    uint32_t log_categories = static_cast<uint32_t>(LogCategory::ALL);
    bool log_console = true;
    size_t log_max_size = 10 * 1024 * 1024;
    size_t log_max_files = 5;

    FederationConfig();
};

/**
 * Build a FederationConfig. Bad values are logged and replaced by their
 * defaults; this never fails.
 *
 * @param datadir Data directory used when the config has no datadir key
 */
FederationConfig LoadFederationConfig(const CConfigParser& parser, const std::string& datadir);

/** Push level, categories, log file, console and rotation settings into CLoggingConfig. */
void ApplyLoggingConfig(const FederationConfig& config);

} // namespace trustmesh

#endif // TRUSTMESH_FEDERATION_FEDERATION_CONFIG_H
