// Copyright (c) 2025 The Trustmesh Core developers
// Distributed under the MIT software license

#include "peer_status.h"

#include "tensor_overlap.h"

#include <util/strencodings.h>

namespace trustmesh {

const char* status_name(PeerStatus status) {
    switch (status) {
        case PeerStatus::TRUSTED: return "trusted";
        case PeerStatus::QUARANTINED: return "quarantined";
        default: return "unknown";
    }
}

std::optional<PeerStatus> parse_status(const std::string& name) {
    if (name == "unknown") return PeerStatus::UNKNOWN;
    if (name == "trusted") return PeerStatus::TRUSTED;
    if (name == "quarantined") return PeerStatus::QUARANTINED;
    return std::nullopt;
}

StatusEvent StatusEvent::registration(double overlap) {
    StatusEvent event;
    event.trigger = REGISTRATION;
    event.overlap = overlap;
    return event;
}

StatusEvent StatusEvent::drift_recheck(double previous_overlap, double overlap) {
    StatusEvent event;
    event.trigger = DRIFT_RECHECK;
    event.previous_overlap = previous_overlap;
    event.overlap = overlap;
    return event;
}

StatusEvent StatusEvent::manual_quarantine(const std::string& reason) {
    StatusEvent event;
    event.trigger = MANUAL_QUARANTINE;
    event.reason = reason;
    return event;
}

StatusTransition apply_status_event(PeerStatus current,
                                    const std::string& current_reason,
                                    const StatusEvent& event) {
    StatusTransition next;

    switch (event.trigger) {
        case StatusEvent::MANUAL_QUARANTINE:
            next.status = PeerStatus::QUARANTINED;
            next.quarantine_reason = event.reason.empty() ? "Manual quarantine" : event.reason;
            return next;

        case StatusEvent::DRIFT_RECHECK:
            if (current == PeerStatus::QUARANTINED) {
                next.status = PeerStatus::QUARANTINED;
                next.quarantine_reason = current_reason;
                return next;
            }
            if (event.overlap < QUARANTINE_THRESHOLD) {
                next.status = PeerStatus::QUARANTINED;
                next.quarantine_reason = strprintf(
                    "Drift detected: overlap dropped to %.3f < %.1f (was %.3f)",
                    event.overlap, QUARANTINE_THRESHOLD, event.previous_overlap);
                next.auto_quarantined = true;
                return next;
            }
            break;

        case StatusEvent::REGISTRATION:
            if (event.overlap < QUARANTINE_THRESHOLD) {
                next.status = PeerStatus::QUARANTINED;
                next.quarantine_reason = strprintf("Low overlap: %.3f < %.1f",
                                                   event.overlap, QUARANTINE_THRESHOLD);
                next.auto_quarantined = true;
                return next;
            }
            break;
    }

    next.status = event.overlap >= TRUST_THRESHOLD ? PeerStatus::TRUSTED : PeerStatus::UNKNOWN;
    return next;
}

} // namespace trustmesh
