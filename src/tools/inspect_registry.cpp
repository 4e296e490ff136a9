// Copyright (c) 2025 The Trustmesh Core developers
// Distributed under the MIT software license
// Registry inspection tool for debugging

#include <federation/federation_config.h>
#include <federation/registry.h>
#include <util/config.h>
#include <util/logging.h>

#include <filesystem>
#include <iostream>
#include <string>

using namespace trustmesh;

int main(int argc, char* argv[]) {
    if (argc > 2) {
        std::cerr << "Usage: " << argv[0] << " [datadir]" << std::endl;
        return 1;
    }

    const std::string datadir = argc == 2 ? argv[1] : GetDefaultDataDir();

    CConfigParser parser;
    if (!parser.LoadConfigFile(GetConfigFilePath(datadir))) {
        std::cerr << "Failed to read " << parser.GetConfigFilePath() << std::endl;
        return 1;
    }

    FederationConfig config = LoadFederationConfig(parser, datadir);
    ApplyLoggingConfig(config);
    // INFO and DEBUG lines share stdout with the JSON dump
    CLoggingConfig::GetInstance().SetLogLevel(LogLevel::LVL_WARN);
    if (!config.log_file.empty() && !CLogger::GetInstance().Initialize(config.data_dir)) {
        std::cerr << "Warning: file logging disabled" << std::endl;
    }

    std::cerr << "======================================" << std::endl;
    std::cerr << "Trustmesh Registry Inspector" << std::endl;
    std::cerr << "======================================" << std::endl;
    std::cerr << "Data directory: " << config.data_dir << std::endl;
    std::cerr << "Local peer: " << config.local_peer_id << " (" << config.local_display_name << ")" << std::endl;
    std::cerr << "Drift threshold: " << config.drift_threshold << std::endl << std::endl;

    const std::string store = (std::filesystem::path(config.data_dir) / "federation_registry").string();
    if (config.data_dir.empty() || !std::filesystem::is_directory(store)) {
        std::cerr << "No registry store at: " << store << std::endl;
        return 1;
    }

    // The local vector is not persisted; stored overlaps are shown as recorded
    FederationRegistry registry(config.data_dir, TrustVector());
    if (!registry.is_persistent()) {
        std::cerr << "Failed to open registry store under: " << config.data_dir << std::endl;
        return 1;
    }

    RegistryStats stats = registry.get_stats();
    std::cerr << "Store: " << registry.store_path() << std::endl;
    std::cerr << "  Peers: " << stats.total << std::endl;
    std::cerr << "  Trusted: " << stats.trusted << std::endl;
    std::cerr << "  Unknown: " << stats.unknown << std::endl;
    std::cerr << "  Quarantined: " << stats.quarantined << std::endl << std::endl;

    std::cout << registry.to_json() << std::endl;
    return 0;
}
