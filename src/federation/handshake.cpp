// Copyright (c) 2025 The Trustmesh Core developers
// Distributed under the MIT software license

#include "handshake.h"

#include <util/logging.h>
#include <util/strencodings.h>
#include <util/time.h>

namespace trustmesh {

namespace {

std::string join_categories(const std::vector<TrustCategory>& categories) {
    std::string out;
    for (TrustCategory category : categories) {
        if (!out.empty()) out += ", ";
        out += category_name(category);
    }
    return out;
}

} // namespace

FederationHandshake::FederationHandshake(const std::string& local_peer_id,
                                         const std::string& local_display_name,
                                         FederationRegistry& registry)
    : local_peer_id_(local_peer_id),
      local_display_name_(local_display_name),
      registry_(registry) {
    quarantine_callback_ = registry_.register_quarantine_callback(
        [this](const PeerRecord& record) { on_peer_quarantined(record); });
}

FederationHandshake::FederationHandshake(const FederationConfig& config, FederationRegistry& registry)
    : FederationHandshake(config.local_peer_id, config.local_display_name, registry) {}

FederationHandshake::~FederationHandshake() {
    registry_.unregister_quarantine_callback(quarantine_callback_);
}

void FederationHandshake::on_peer_quarantined(const PeerRecord& record) {
    auto it = channels_.find(record.id);
    if (it == channels_.end()) return;

    channels_.erase(it);
    LogPrintHandshake(WARN, "Channel closed: %s quarantined (%s)",
                      record.id.c_str(), record.quarantine_reason.c_str());
}

HandshakeResponse FederationHandshake::initiate_handshake(const HandshakeRequest& request) {
    if (request.version != FEDERATION_PROTOCOL_VERSION) {
        LogPrintHandshake(WARN, "Peer %s speaks protocol %s (local %s)",
                          request.peer_id.c_str(), request.version.c_str(), FEDERATION_PROTOCOL_VERSION);
    }

    const OverlapResult overlap = compute_overlap(registry_.local_geometry(), request.vector);
    const bool accepted = overlap.overlap >= TRUST_THRESHOLD;

    // Rejected attempts are registered too, so they leave an audit trail
    const PeerRecord record = registry_.register_peer(request.peer_id, request.display_name,
                                                      request.vector);

    const int64_t now = GetTimeMillis();

    if (accepted) {
        Channel channel;
        channel.local_peer_id = local_peer_id_;
        channel.remote_peer_id = request.peer_id;
        channel.remote_display_name = request.display_name;
        channel.overlap = overlap.overlap;
        channel.status = record.status;
        channel.opened_at = now;
        channel.last_seen = request.timestamp != 0 ? request.timestamp : now;
        channels_[request.peer_id] = channel;

        LogPrintHandshake(INFO, "Channel opened: %s <-> %s (overlap=%.3f)",
                          local_peer_id_.c_str(), request.peer_id.c_str(), overlap.overlap);
    } else {
        // A quarantined peer's channel is already gone via on_peer_quarantined
        auto it = channels_.find(request.peer_id);
        if (it != channels_.end()) {
            Channel& channel = it->second;
            channel.remote_display_name = record.display_name;
            channel.overlap = record.overlap;
            channel.status = record.status;
            channel.last_seen = record.last_seen;
            LogPrintHandshake(INFO, "Channel to %s kept with status %s (overlap=%.3f)",
                              request.peer_id.c_str(), status_name(record.status), record.overlap);
        }
    }

    HandshakeResponse response;
    response.accepted = accepted;
    response.overlap = overlap.overlap;
    response.threshold = TRUST_THRESHOLD;
    response.aligned = overlap.aligned;
    response.divergent = overlap.divergent;
    response.status = record.status;
    response.message = accepted
        ? strprintf("Handshake accepted: %.3f >= %.3f", overlap.overlap, TRUST_THRESHOLD)
        : strprintf("Handshake rejected: %.3f < %.3f", overlap.overlap, TRUST_THRESHOLD);
    response.timestamp = now;

    CLogger::GetInstance().LogPrintFormat(LogCategory::HANDSHAKE,
                                          accepted ? LogLevel::LVL_INFO : LogLevel::LVL_WARN,
                                          "Peer %s (%s): %s", request.peer_id.c_str(),
                                          request.display_name.c_str(), response.message.c_str());
    return response;
}

void FederationHandshake::receive_handshake(const HandshakeResponse& response) const {
    if (!response.accepted) {
        LogPrintHandshake(INFO, "Federation rejected: %s", response.message.c_str());
        return;
    }

    LogPrintHandshake(INFO, "Federation channel opened: overlap=%.3f", response.overlap);
    LogPrintHandshake(INFO, "Aligned categories: %s", join_categories(response.aligned).c_str());
    if (!response.divergent.empty()) {
        LogPrintHandshake(INFO, "Divergent categories: %s", join_categories(response.divergent).c_str());
    }
}

DriftCheck FederationHandshake::check_channel_drift(const std::string& peer_id,
                                                    const TrustVector& new_vector) {
    DriftCheck drift = registry_.check_drift(peer_id, new_vector);

    auto it = channels_.find(peer_id);
    if (it == channels_.end()) {
        return drift;
    }

    auto record = registry_.get_peer(peer_id);
    if (!record || record->is_quarantined()) {
        channels_.erase(it);
        LogPrintHandshake(WARN, "Channel closed due to drift: %s", peer_id.c_str());
        return drift;
    }

    Channel& channel = it->second;
    channel.overlap = record->overlap;
    channel.status = record->status;
    channel.last_seen = record->last_seen;
    return drift;
}

std::optional<Channel> FederationHandshake::get_channel(const std::string& peer_id) const {
    auto it = channels_.find(peer_id);
    if (it == channels_.end()) return std::nullopt;
    return it->second;
}

std::vector<Channel> FederationHandshake::list_channels() const {
    std::vector<Channel> result;
    result.reserve(channels_.size());
    for (const auto& [id, channel] : channels_) {
        result.push_back(channel);
    }
    return result;
}

bool FederationHandshake::close_channel(const std::string& peer_id, const std::string& reason) {
    auto it = channels_.find(peer_id);
    if (it == channels_.end()) return false;

    channels_.erase(it);
    registry_.quarantine_peer(peer_id, reason);

    LogPrintHandshake(INFO, "Channel closed: %s (%s)", peer_id.c_str(), reason.c_str());
    return true;
}

HandshakeStats FederationHandshake::get_stats() const {
    const RegistryStats registry_stats = registry_.get_stats();

    HandshakeStats stats;
    stats.active_channels = channels_.size();
    stats.registered_peers = registry_stats.total;
    stats.trusted = registry_stats.trusted;
    stats.quarantined = registry_stats.quarantined;
    stats.unknown = registry_stats.unknown;
    return stats;
}

} // namespace trustmesh
