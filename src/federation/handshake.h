// Copyright (c) 2025 The Trustmesh Core developers
// Distributed under the MIT software license

#ifndef TRUSTMESH_FEDERATION_HANDSHAKE_H
#define TRUSTMESH_FEDERATION_HANDSHAKE_H

/**
 * Federation Handshake Protocol
 *
 * Decides whether an inbound peer may federate and keeps the in-memory
 * channel table in step with the registry:
 *
 *   no channel --[handshake, overlap >= 0.8]--> open (trusted)
 *   open --[recheck, 0.6 <= overlap < 0.8]--> open (unknown)
 *   open --[recheck < 0.6, or close_channel()]--> no channel
 *   open --[re-handshake rejected]--> open (unknown) or no channel
 *   open --[peer quarantined in the registry]--> no channel
 *
 * Transport is the caller's problem: requests and responses are plain
 * values here. No operation throws on normal input.
 */

#include "federation_config.h"
#include "registry.h"
#include "tensor_overlap.h"
#include "trust_vector.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace trustmesh {

static const char* const FEDERATION_PROTOCOL_VERSION = "1.0.0";

struct HandshakeRequest {
    std::string peer_id;
    std::string display_name;
    TrustVector vector;
    int64_t timestamp = 0;     // sender clock, Unix ms
    std::string version = FEDERATION_PROTOCOL_VERSION;
};

struct HandshakeResponse {
    bool accepted = false;
    double overlap = 0.0;
    double threshold = TRUST_THRESHOLD;
    std::vector<TrustCategory> aligned;
    std::vector<TrustCategory> divergent;
    PeerStatus status = PeerStatus::UNKNOWN;
    std::string message;       // e.g. "Handshake rejected: 0.652 < 0.800"
    int64_t timestamp = 0;
};

/** In-memory record of an accepted trust relationship. */
struct Channel {
    std::string local_peer_id;
    std::string remote_peer_id;
    std::string remote_display_name;
    double overlap = 0.0;
    PeerStatus status = PeerStatus::TRUSTED;
    int64_t opened_at = 0;
    int64_t last_seen = 0;
};

struct HandshakeStats {
    size_t active_channels = 0;
    size_t registered_peers = 0;
    size_t trusted = 0;
    size_t quarantined = 0;
    size_t unknown = 0;
};

class FederationHandshake {
public:
    /**
     * The registry must outlive the handshake. The handshake listens for
     * registry quarantines and drops the peer's channel.
     */
    FederationHandshake(const std::string& local_peer_id,
                        const std::string& local_display_name,
                        FederationRegistry& registry);
    /** Local identity taken from peerid / peername. */
    FederationHandshake(const FederationConfig& config, FederationRegistry& registry);
    ~FederationHandshake();

    FederationHandshake(const FederationHandshake&) = delete;
    FederationHandshake& operator=(const FederationHandshake&) = delete;

    /**
     * Evaluate an inbound handshake. The peer is registered whether or not
     * it is accepted; an accepted peer gets a fresh channel. A rejected peer
     * that already has a channel keeps it only while not quarantined, with
     * overlap and status taken from the registry.
     */
    HandshakeResponse initiate_handshake(const HandshakeRequest& request);

    /** Log the outcome of a handshake we sent. No state change. */
    void receive_handshake(const HandshakeResponse& response) const;

    /**
     * Registry drift check for a channel's peer. A quarantined peer loses
     * its channel; otherwise the channel's overlap/status/last_seen follow
     * the registry.
     */
    DriftCheck check_channel_drift(const std::string& peer_id, const TrustVector& new_vector);

    std::optional<Channel> get_channel(const std::string& peer_id) const;
    std::vector<Channel> list_channels() const;

    /**
     * Tear down a channel and quarantine its peer, whatever its overlap.
     * @return false if no channel is open for peer_id
     */
    bool close_channel(const std::string& peer_id, const std::string& reason);

    HandshakeStats get_stats() const;

    const std::string& local_peer_id() const { return local_peer_id_; }
    const std::string& local_display_name() const { return local_display_name_; }
    FederationRegistry& registry() { return registry_; }
    const FederationRegistry& registry() const { return registry_; }

private:
    std::string local_peer_id_;
    std::string local_display_name_;
    FederationRegistry& registry_;
    std::map<std::string, Channel> channels_;
    size_t quarantine_callback_;

    void on_peer_quarantined(const PeerRecord& record);
};

} // namespace trustmesh

#endif // TRUSTMESH_FEDERATION_HANDSHAKE_H
