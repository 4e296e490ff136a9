// Copyright (c) 2025 The Trustmesh Core developers
// Distributed under the MIT software license

#ifndef TRUSTMESH_FEDERATION_DRIFT_DETECTOR_H
#define TRUSTMESH_FEDERATION_DRIFT_DETECTOR_H

/**
 * High-precision drift detection
 *
 * Out-of-band sweep that catches slow, incremental changes to a peer's
 * declared vector that stay inside the registry's 0.15 warning band.
 * A peer has drifted only if its geometry hash changed AND the overlap
 * moved by more than the threshold (default 0.003, ~50x stricter than the
 * registry). Drifting peers are quarantined through the registry.
 *
 * The registry's stored overlap/hash is the baseline and is never
 * rewritten here. Counters and the event log are in-memory only.
 */

#include "registry.h"
#include "trust_vector.h"

#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace trustmesh {

static constexpr double DEFAULT_DRIFT_THRESHOLD = 0.003;

struct DriftEvent {
    std::string peer_id;
    std::string display_name;
    int64_t timestamp = 0;
    double old_overlap = 0.0;
    double new_overlap = 0.0;
    double delta = 0.0;
    bool quarantined = false;   // this check quarantined the peer
    std::string reason;

    std::string to_json() const;
};

struct DriftDetectionResult {
    std::string peer_id;
    bool drifted = false;
    bool quarantined = false;
    double old_overlap = 0.0;
    double new_overlap = 0.0;
    double delta = 0.0;
    double threshold = DEFAULT_DRIFT_THRESHOLD;
    std::string old_hash;
    std::string new_hash;
    std::string reason;
    int64_t timestamp = 0;
};

struct DriftStats {
    uint64_t total_checks = 0;
    uint64_t drifts_detected = 0;
    uint64_t peers_quarantined = 0;
    double average_delta = 0.0;    // over declared drifts
    double max_delta = 0.0;
    std::vector<DriftEvent> recent_events;   // last 10, oldest first

    std::string to_json() const;
};

class DriftDetector {
public:
    static constexpr size_t MAX_EVENTS = 100;
    static constexpr size_t STATS_RECENT_EVENTS = 10;

    /**
     * The registry must outlive the detector.
     * @param default_threshold Used by checks that pass no threshold of their own
     */
    explicit DriftDetector(FederationRegistry& registry,
                           double default_threshold = DEFAULT_DRIFT_THRESHOLD);

    DriftDetectionResult check_peer(const std::string& peer_id, const TrustVector& new_vector,
                                    std::optional<double> threshold = std::nullopt);

    std::vector<DriftDetectionResult> check_batch(
        const std::vector<std::pair<std::string, TrustVector>>& checks,
        std::optional<double> threshold = std::nullopt);

    /** Sweep registered peers that have an entry in `vectors`; others are skipped. */
    std::vector<DriftDetectionResult> monitor_all(const std::map<std::string, TrustVector>& vectors,
                                                  std::optional<double> threshold = std::nullopt);

    DriftStats get_stats() const;

    /** Newest first. */
    std::vector<DriftEvent> get_recent_events(size_t limit = STATS_RECENT_EVENTS) const;

    void reset();

    /** {"exported": ..., "stats": {...}, "events": [...]} */
    std::string export_events() const;

    double default_threshold() const { return default_threshold_; }

private:
    FederationRegistry& registry_;
    double default_threshold_;

    std::deque<DriftEvent> events_;
    uint64_t checks_ = 0;
    uint64_t drifts_ = 0;
    uint64_t quarantines_ = 0;
    double total_delta_ = 0.0;
    double max_delta_ = 0.0;

    void record_event(const DriftEvent& event);
};

} // namespace trustmesh

#endif // TRUSTMESH_FEDERATION_DRIFT_DETECTOR_H
