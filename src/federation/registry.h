// Copyright (c) 2025 The Trustmesh Core developers
// Distributed under the MIT software license

#ifndef TRUSTMESH_FEDERATION_REGISTRY_H
#define TRUSTMESH_FEDERATION_REGISTRY_H

/**
 * Federation Registry - LevelDB-backed table of known peers
 *
 * Tracks each peer's last geometry hash, overlap against the local
 * vector, and status. Owns the auto-quarantine rule and the coarse drift
 * check used at handshake time.
 *
 * Key format:
 *   "peer:" + id        -> serialized PeerRecord
 *   "meta:version"      -> registry format version ("1.0.0")
 *   "meta:lastupdated"  -> Unix ms of the last mutation
 *
 * Every mutation is written through immediately. A missing or corrupted
 * store falls back to an empty table; an empty data_dir runs memory-only.
 *
 * Not thread-safe: callers serialize access to one instance.
 */

#include "peer_record.h"
#include "tensor_overlap.h"
#include "trust_vector.h"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace leveldb {
class DB;
}

namespace trustmesh {

static constexpr double DRIFT_WARNING_THRESHOLD = 0.15;

struct RegistryStats {
    size_t total = 0;
    size_t trusted = 0;
    size_t quarantined = 0;
    size_t unknown = 0;
};

/** Outcome of the coarse, handshake-time drift check. */
struct DriftCheck {
    bool drifted = false;
    double old_overlap = 0.0;
    double new_overlap = 0.0;
    PeerStatus status = PeerStatus::UNKNOWN;   // status after the check
    std::optional<std::string> reason;
};

class FederationRegistry {
public:
    static const std::string FORMAT_VERSION;

    /** Invoked with the stored record whenever an operation leaves a peer quarantined. */
    using QuarantineCallback = std::function<void(const PeerRecord&)>;

    /**
     * @param data_dir Directory holding the "federation_registry" LevelDB
     *                 store; empty for a memory-only registry
     * @param local_geometry Baseline vector every peer is compared against
     */
    FederationRegistry(const std::string& data_dir, const TrustVector& local_geometry);
    ~FederationRegistry();

    FederationRegistry(const FederationRegistry&) = delete;
    FederationRegistry& operator=(const FederationRegistry&) = delete;

    /**
     * Register a new peer or refresh an existing one.
     * Status: trusted (>= 0.8), quarantined (< 0.6), otherwise unknown.
     * registered_at survives re-registration; everything else is replaced.
     */
    PeerRecord register_peer(const std::string& id, const std::string& display_name,
                             const TrustVector& vector);

    std::optional<PeerRecord> get_peer(const std::string& id) const;

    /** All peers, ordered by id. */
    std::vector<PeerRecord> list_peers() const;

    /**
     * Quarantine regardless of current overlap.
     * @return false if id is not registered
     */
    bool quarantine_peer(const std::string& id, const std::string& reason);

    /**
     * Recompute overlap for a registered peer.
     *
     * drifted when |new - old| > DRIFT_WARNING_THRESHOLD or new < 0.6.
     * Auto-quarantines below 0.6 unless already quarantined. The stored
     * hash, overlap and last_seen are refreshed in every case.
     */
    DriftCheck check_drift(const std::string& id, const TrustVector& new_vector);

    bool remove_peer(const std::string& id);

    /**
     * Replace the local baseline. Stored overlaps are NOT recomputed; each
     * peer picks up the new baseline at its next registration or check.
     */
    void set_local_geometry(const TrustVector& geometry);
    const TrustVector& local_geometry() const { return local_geometry_; }

    RegistryStats get_stats() const;

    /** {"bots": [...], "version": ..., "lastUpdated": ...} */
    std::string to_json() const;

    /** @return handle for unregister_quarantine_callback() */
    size_t register_quarantine_callback(QuarantineCallback callback);
    void unregister_quarantine_callback(size_t handle);

    bool is_persistent() const { return db_ != nullptr; }
    int64_t last_updated() const { return last_updated_; }
    const std::string& store_path() const { return path_; }

private:
    std::unique_ptr<leveldb::DB> db_;
    std::string path_;

    std::map<std::string, PeerRecord> peers_;
    TrustVector local_geometry_;
    int64_t last_updated_;

    std::map<size_t, QuarantineCallback> quarantine_callbacks_;
    size_t next_callback_handle_ = 0;

    static const std::string KEY_PREFIX;       // "peer:"
    static const std::string KEY_VERSION;      // "meta:version"
    static const std::string KEY_LAST_UPDATED; // "meta:lastupdated"

    bool open_store(const std::string& data_dir);
    void load_store();
    void reset_store();

    // Write-through helpers; failures are logged, never thrown
    void persist(const PeerRecord& record);
    void persist_removal(const std::string& id);

    void apply_transition(PeerRecord& record, const StatusEvent& event);
    void notify_quarantined(const PeerRecord& record);
};

} // namespace trustmesh

#endif // TRUSTMESH_FEDERATION_REGISTRY_H
