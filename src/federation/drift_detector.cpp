// Copyright (c) 2025 The Trustmesh Core developers
// Distributed under the MIT software license

#include "drift_detector.h"

#include "tensor_overlap.h"

#include <util/logging.h>
#include <util/strencodings.h>
#include <util/time.h>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace trustmesh {

std::string DriftEvent::to_json() const {
    std::ostringstream oss;
    oss << std::setprecision(17);
    oss << "{";
    oss << "\"botId\": \"" << JsonEscape(peer_id) << "\", ";
    oss << "\"botName\": \"" << JsonEscape(display_name) << "\", ";
    oss << "\"timestamp\": \"" << FormatISO8601(timestamp) << "\", ";
    oss << "\"oldOverlap\": " << old_overlap << ", ";
    oss << "\"newOverlap\": " << new_overlap << ", ";
    oss << "\"delta\": " << delta << ", ";
    oss << "\"quarantined\": " << (quarantined ? "true" : "false") << ", ";
    oss << "\"reason\": \"" << JsonEscape(reason) << "\"";
    oss << "}";
    return oss.str();
}

std::string DriftStats::to_json() const {
    std::ostringstream oss;
    oss << std::setprecision(17);
    oss << "{";
    oss << "\"totalChecks\": " << total_checks << ", ";
    oss << "\"driftsDetected\": " << drifts_detected << ", ";
    oss << "\"botsQuarantined\": " << peers_quarantined << ", ";
    oss << "\"averageDelta\": " << average_delta << ", ";
    oss << "\"maxDelta\": " << max_delta << ", ";
    oss << "\"recentEvents\": [";
    for (size_t i = 0; i < recent_events.size(); i++) {
        if (i > 0) oss << ", ";
        oss << recent_events[i].to_json();
    }
    oss << "]}";
    return oss.str();
}

DriftDetector::DriftDetector(FederationRegistry& registry, double default_threshold)
    : registry_(registry), default_threshold_(default_threshold) {}

DriftDetectionResult DriftDetector::check_peer(const std::string& peer_id, const TrustVector& new_vector,
                                               std::optional<double> threshold_override) {
    const double threshold = threshold_override.value_or(default_threshold_);
    checks_++;

    DriftDetectionResult result;
    result.peer_id = peer_id;
    result.threshold = threshold;
    result.new_hash = geometry_hash(new_vector);
    result.timestamp = GetTimeMillis();

    auto peer = registry_.get_peer(peer_id);
    if (!peer) {
        result.reason = "Bot not registered";
        return result;
    }

    result.old_overlap = peer->overlap;
    result.old_hash = peer->geometry_hash;
    result.new_overlap = compute_overlap(registry_.local_geometry(), new_vector).overlap;
    result.delta = std::abs(result.new_overlap - result.old_overlap);

    const bool geometry_changed = result.old_hash != result.new_hash;

    if (!geometry_changed) {
        result.reason = "No geometry change detected";
        return result;
    }

    if (result.delta <= threshold) {
        result.reason = strprintf("Geometry changed but within tolerance: delta=%.6f <= %g",
                                  result.delta, threshold);
        return result;
    }

    result.drifted = true;
    drifts_++;
    total_delta_ += result.delta;
    max_delta_ = std::max(max_delta_, result.delta);

    if (!peer->is_quarantined()) {
        std::string quarantine_reason = strprintf(
            "High-precision drift detected: delta=%.6f > %g (overlap %.6f -> %.6f)",
            result.delta, threshold, result.old_overlap, result.new_overlap);
        result.quarantined = registry_.quarantine_peer(peer_id, quarantine_reason);
        if (result.quarantined) quarantines_++;
        result.reason = strprintf("Auto-quarantined: drift delta=%.6f exceeds threshold %g",
                                  result.delta, threshold);
    } else {
        result.reason = strprintf("Drift detected: delta=%.6f > %g (already quarantined)",
                                  result.delta, threshold);
    }

    DriftEvent event;
    event.peer_id = peer_id;
    event.display_name = peer->display_name;
    event.timestamp = result.timestamp;
    event.old_overlap = result.old_overlap;
    event.new_overlap = result.new_overlap;
    event.delta = result.delta;
    event.quarantined = result.quarantined;
    event.reason = result.reason;
    record_event(event);

    LogPrintDrift(WARN, "Peer %s: %s", peer_id.c_str(), result.reason.c_str());
    return result;
}

std::vector<DriftDetectionResult> DriftDetector::check_batch(
    const std::vector<std::pair<std::string, TrustVector>>& checks, std::optional<double> threshold) {
    std::vector<DriftDetectionResult> results;
    results.reserve(checks.size());
    for (const auto& [peer_id, vector] : checks) {
        results.push_back(check_peer(peer_id, vector, threshold));
    }
    return results;
}

std::vector<DriftDetectionResult> DriftDetector::monitor_all(
    const std::map<std::string, TrustVector>& vectors, std::optional<double> threshold) {
    std::vector<DriftDetectionResult> results;

    for (const PeerRecord& peer : registry_.list_peers()) {
        auto it = vectors.find(peer.id);
        if (it == vectors.end()) continue;
        results.push_back(check_peer(peer.id, it->second, threshold));
    }

    size_t drifted = std::count_if(results.begin(), results.end(),
                                   [](const DriftDetectionResult& r) { return r.drifted; });
    LogPrintDrift(INFO, "Drift sweep: %zu peers checked, %zu drifted", results.size(), drifted);
    return results;
}

DriftStats DriftDetector::get_stats() const {
    DriftStats stats;
    stats.total_checks = checks_;
    stats.drifts_detected = drifts_;
    stats.peers_quarantined = quarantines_;
    stats.average_delta = drifts_ > 0 ? total_delta_ / static_cast<double>(drifts_) : 0.0;
    stats.max_delta = max_delta_;

    size_t start = events_.size() > STATS_RECENT_EVENTS ? events_.size() - STATS_RECENT_EVENTS : 0;
    stats.recent_events.assign(events_.begin() + start, events_.end());
    return stats;
}

std::vector<DriftEvent> DriftDetector::get_recent_events(size_t limit) const {
    size_t count = std::min(limit, events_.size());
    return std::vector<DriftEvent>(events_.rbegin(), events_.rbegin() + count);
}

void DriftDetector::reset() {
    checks_ = 0;
    drifts_ = 0;
    quarantines_ = 0;
    total_delta_ = 0.0;
    max_delta_ = 0.0;
    events_.clear();
}

std::string DriftDetector::export_events() const {
    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"exported\": \"" << FormatISO8601(GetTimeMillis()) << "\",\n";
    oss << "  \"stats\": " << get_stats().to_json() << ",\n";
    oss << "  \"events\": [";
    for (size_t i = 0; i < events_.size(); i++) {
        oss << (i == 0 ? "\n    " : ",\n    ") << events_[i].to_json();
    }
    oss << (events_.empty() ? "]\n" : "\n  ]\n");
    oss << "}";
    return oss.str();
}

void DriftDetector::record_event(const DriftEvent& event) {
    events_.push_back(event);
    if (events_.size() > MAX_EVENTS) {
        events_.pop_front();
    }
}

} // namespace trustmesh
