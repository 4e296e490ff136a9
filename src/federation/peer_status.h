// Copyright (c) 2025 The Trustmesh Core developers
// Distributed under the MIT software license

#ifndef TRUSTMESH_FEDERATION_PEER_STATUS_H
#define TRUSTMESH_FEDERATION_PEER_STATUS_H

/**
 * Peer status machine
 *
 *   UNKNOWN      0.6 <= overlap < 0.8 at the last recompute
 *   TRUSTED      overlap >= 0.8 at the last recompute
 *   QUARANTINED  overlap < 0.6, or manual quarantine
 *
 * Quarantine is sticky: a drift recheck never lifts it, only a full
 * re-registration does. Every transition rule lives in apply_status_event().
 */

#include <cstdint>
#include <optional>
#include <string>

namespace trustmesh {

static constexpr double QUARANTINE_THRESHOLD = 0.6;

enum class PeerStatus : uint8_t {
    UNKNOWN = 0,
    TRUSTED = 1,
    QUARANTINED = 2,
};

/** "unknown" / "trusted" / "quarantined" */
const char* status_name(PeerStatus status);
std::optional<PeerStatus> parse_status(const std::string& name);

struct StatusEvent {
    enum Trigger {
        REGISTRATION,       // full recompute from a (re-)registration
        DRIFT_RECHECK,      // periodic recompute of a known peer
        MANUAL_QUARANTINE,  // operator / channel closure
    };

    Trigger trigger = REGISTRATION;
    double overlap = 0.0;           // new overlap (REGISTRATION, DRIFT_RECHECK)
    double previous_overlap = 0.0;  // stored overlap (DRIFT_RECHECK)
    std::string reason;             // MANUAL_QUARANTINE only

    static StatusEvent registration(double overlap);
    static StatusEvent drift_recheck(double previous_overlap, double overlap);
    static StatusEvent manual_quarantine(const std::string& reason);
};

struct StatusTransition {
    PeerStatus status = PeerStatus::UNKNOWN;
    std::string quarantine_reason;   // non-empty iff status == QUARANTINED
    bool auto_quarantined = false;   // quarantine decided by overlap, not by a caller
};

StatusTransition apply_status_event(PeerStatus current,
                                    const std::string& current_reason,
                                    const StatusEvent& event);

} // namespace trustmesh

#endif // TRUSTMESH_FEDERATION_PEER_STATUS_H
