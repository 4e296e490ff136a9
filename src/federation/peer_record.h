// Copyright (c) 2025 The Trustmesh Core developers
// Distributed under the MIT software license

#ifndef TRUSTMESH_FEDERATION_PEER_RECORD_H
#define TRUSTMESH_FEDERATION_PEER_RECORD_H

#include "peer_status.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace trustmesh {

/**
 * Persisted registry entry for one federated peer.
 * Timestamps are Unix milliseconds.
 */
struct PeerRecord {
    std::string id;
    std::string display_name;
    int64_t last_seen = 0;
    std::string geometry_hash;
    double overlap = 0.0;
    PeerStatus status = PeerStatus::UNKNOWN;
    std::string quarantine_reason;   // set iff status == QUARANTINED
    int64_t registered_at = 0;       // set once, on first registration

    bool is_quarantined() const { return status == PeerStatus::QUARANTINED; }

    std::string to_json() const;

    // Serialization for LevelDB storage
    static constexpr uint8_t SERIALIZATION_VERSION = 1;
    std::vector<uint8_t> serialize() const;
    static std::optional<PeerRecord> deserialize(const std::vector<uint8_t>& data);
};

} // namespace trustmesh

#endif // TRUSTMESH_FEDERATION_PEER_RECORD_H
