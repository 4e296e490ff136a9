// Copyright (c) 2025 The Trustmesh Core developers
// Distributed under the MIT software license

#include "registry.h"

#include <util/logging.h>
#include <util/strencodings.h>
#include <util/time.h>

#include <leveldb/db.h>
#include <leveldb/iterator.h>
#include <leveldb/options.h>
#include <leveldb/write_batch.h>

#include <algorithm>
#include <cmath>
#include <exception>
#include <filesystem>
#include <sstream>
#include <system_error>
#include <utility>

namespace trustmesh {

const std::string FederationRegistry::FORMAT_VERSION = "1.0.0";
const std::string FederationRegistry::KEY_PREFIX = "peer:";
const std::string FederationRegistry::KEY_VERSION = "meta:version";
const std::string FederationRegistry::KEY_LAST_UPDATED = "meta:lastupdated";

FederationRegistry::FederationRegistry(const std::string& data_dir, const TrustVector& local_geometry)
    : local_geometry_(local_geometry), last_updated_(GetTimeMillis()) {
    if (data_dir.empty()) {
        LogPrintRegistry(INFO, "Federation registry running memory-only");
        return;
    }

    if (open_store(data_dir)) {
        load_store();
    }
}

FederationRegistry::~FederationRegistry() {
    db_.reset();
}

// --- Store lifecycle ---

bool FederationRegistry::open_store(const std::string& data_dir) {
    std::error_code ec;
    std::filesystem::create_directories(data_dir, ec);
    if (ec) {
        LogPrintStorage(WARN, "Cannot create data directory %s: %s (registry is memory-only)",
                        data_dir.c_str(), ec.message().c_str());
        return false;
    }

    path_ = (std::filesystem::path(data_dir) / "federation_registry").string();

    leveldb::Options options;
    options.create_if_missing = true;

    leveldb::DB* raw_db = nullptr;
    leveldb::Status status = leveldb::DB::Open(options, path_, &raw_db);

    if (status.IsCorruption()) {
        LogPrintStorage(WARN, "Registry store %s is corrupted (%s), starting with an empty table",
                        path_.c_str(), status.ToString().c_str());
        leveldb::Status destroyed = leveldb::DestroyDB(path_, options);
        if (!destroyed.ok()) {
            LogPrintStorage(WARN, "Failed to discard corrupted store: %s", destroyed.ToString().c_str());
        }
        raw_db = nullptr;
        status = leveldb::DB::Open(options, path_, &raw_db);
    }

    if (!status.ok()) {
        LogPrintStorage(WARN, "Failed to open registry store %s: %s (registry is memory-only)",
                        path_.c_str(), status.ToString().c_str());
        return false;
    }

    db_.reset(raw_db);
    return true;
}

void FederationRegistry::load_store() {
    if (!db_) return;

    peers_.clear();

    std::string version;
    leveldb::Status status = db_->Get(leveldb::ReadOptions(), KEY_VERSION, &version);
    if (status.ok() && version != FORMAT_VERSION) {
        LogPrintStorage(WARN, "Registry format %s is not supported (expected %s), starting with an empty table",
                        version.c_str(), FORMAT_VERSION.c_str());
        reset_store();
        return;
    }
    if (!status.ok() && !status.IsNotFound()) {
        LogPrintStorage(WARN, "Failed to read registry version: %s", status.ToString().c_str());
    }

    std::string last_updated;
    if (db_->Get(leveldb::ReadOptions(), KEY_LAST_UPDATED, &last_updated).ok()) {
        try {
            last_updated_ = std::stoll(last_updated);
        } catch (const std::exception&) {
            last_updated_ = 0;
        }
    }

    size_t skipped = 0;
    std::unique_ptr<leveldb::Iterator> it(db_->NewIterator(leveldb::ReadOptions()));
    for (it->Seek(KEY_PREFIX); it->Valid(); it->Next()) {
        std::string key = it->key().ToString();
        if (key.compare(0, KEY_PREFIX.size(), KEY_PREFIX) != 0) break;

        std::string value = it->value().ToString();
        std::vector<uint8_t> data(value.begin(), value.end());
        auto record = PeerRecord::deserialize(data);
        if (!record || KEY_PREFIX + record->id != key) {
            LogPrintStorage(WARN, "Skipping unreadable registry entry %s", key.c_str());
            skipped++;
            continue;
        }
        peers_[record->id] = *record;
    }

    if (!it->status().ok()) {
        LogPrintStorage(WARN, "Registry scan stopped early: %s", it->status().ToString().c_str());
    }

    if (status.IsNotFound()) {
        // Fresh store: stamp the format version
        leveldb::Status put = db_->Put(leveldb::WriteOptions(), KEY_VERSION, FORMAT_VERSION);
        if (!put.ok()) {
            LogPrintStorage(WARN, "Failed to write registry version: %s", put.ToString().c_str());
        }
    }

    LogPrintRegistry(INFO, "Loaded %zu federated peers from %s (%zu skipped)",
                     peers_.size(), path_.c_str(), skipped);
}

void FederationRegistry::reset_store() {
    peers_.clear();
    if (!db_) return;

    leveldb::WriteBatch batch;
    std::unique_ptr<leveldb::Iterator> it(db_->NewIterator(leveldb::ReadOptions()));
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        batch.Delete(it->key());
    }
    batch.Put(KEY_VERSION, FORMAT_VERSION);

    leveldb::Status status = db_->Write(leveldb::WriteOptions(), &batch);
    if (!status.ok()) {
        LogPrintStorage(WARN, "Failed to reset registry store: %s", status.ToString().c_str());
    }
}

void FederationRegistry::persist(const PeerRecord& record) {
    last_updated_ = GetTimeMillis();
    if (!db_) return;

    auto data = record.serialize();

    leveldb::WriteBatch batch;
    batch.Put(KEY_PREFIX + record.id, std::string(data.begin(), data.end()));
    batch.Put(KEY_LAST_UPDATED, std::to_string(last_updated_));

    leveldb::Status status = db_->Write(leveldb::WriteOptions(), &batch);
    if (!status.ok()) {
        LogPrintStorage(ERROR, "Failed to persist peer %s: %s",
                        record.id.c_str(), status.ToString().c_str());
    }
}

void FederationRegistry::persist_removal(const std::string& id) {
    last_updated_ = GetTimeMillis();
    if (!db_) return;

    leveldb::WriteBatch batch;
    batch.Delete(KEY_PREFIX + id);
    batch.Put(KEY_LAST_UPDATED, std::to_string(last_updated_));

    leveldb::Status status = db_->Write(leveldb::WriteOptions(), &batch);
    if (!status.ok()) {
        LogPrintStorage(ERROR, "Failed to remove peer %s from store: %s",
                        id.c_str(), status.ToString().c_str());
    }
}

void FederationRegistry::apply_transition(PeerRecord& record, const StatusEvent& event) {
    PeerStatus before = record.status;
    StatusTransition next = apply_status_event(record.status, record.quarantine_reason, event);

    record.status = next.status;
    record.quarantine_reason = next.quarantine_reason;

    if (before != next.status) {
        LogPrintRegistry(INFO, "Peer %s: %s -> %s%s%s", record.id.c_str(),
                         status_name(before), status_name(next.status),
                         next.quarantine_reason.empty() ? "" : " (",
                         next.quarantine_reason.empty() ? "" : (next.quarantine_reason + ")").c_str());
    }
}

void FederationRegistry::notify_quarantined(const PeerRecord& record) {
    // Callbacks may unregister themselves
    const std::map<size_t, QuarantineCallback> callbacks = quarantine_callbacks_;
    for (const auto& [handle, callback] : callbacks) {
        try {
            callback(record);
        } catch (const std::exception& e) {
            LogPrintRegistry(ERROR, "Quarantine callback %zu failed for peer %s: %s",
                             handle, record.id.c_str(), e.what());
        }
    }
}

size_t FederationRegistry::register_quarantine_callback(QuarantineCallback callback) {
    const size_t handle = next_callback_handle_++;
    quarantine_callbacks_[handle] = std::move(callback);
    LogPrintRegistry(DEBUG, "Registered quarantine callback (total: %zu)", quarantine_callbacks_.size());
    return handle;
}

void FederationRegistry::unregister_quarantine_callback(size_t handle) {
    quarantine_callbacks_.erase(handle);
}

// --- Operations ---

PeerRecord FederationRegistry::register_peer(const std::string& id, const std::string& display_name,
                                             const TrustVector& vector) {
    const int64_t now = GetTimeMillis();
    const OverlapResult overlap = compute_overlap(local_geometry_, vector);

    auto it = peers_.find(id);
    const bool existing = it != peers_.end();

    PeerRecord record;
    record.id = id;
    record.registered_at = existing ? it->second.registered_at : now;
    if (existing) {
        // Previous status only matters for the transition log line
        record.status = it->second.status;
        record.quarantine_reason = it->second.quarantine_reason;
    }
    record.display_name = display_name;
    record.last_seen = now;
    record.geometry_hash = geometry_hash(vector);
    record.overlap = overlap.overlap;

    apply_transition(record, StatusEvent::registration(overlap.overlap));

    peers_[id] = record;
    persist(record);

    if (record.is_quarantined()) {
        notify_quarantined(record);
    }

    LogPrintRegistry(DEBUG, "%s peer %s (%s): overlap=%.3f status=%s",
                     existing ? "Refreshed" : "Registered", id.c_str(), display_name.c_str(),
                     record.overlap, status_name(record.status));

    return record;
}

std::optional<PeerRecord> FederationRegistry::get_peer(const std::string& id) const {
    auto it = peers_.find(id);
    if (it == peers_.end()) return std::nullopt;
    return it->second;
}

std::vector<PeerRecord> FederationRegistry::list_peers() const {
    std::vector<PeerRecord> result;
    result.reserve(peers_.size());
    for (const auto& [id, record] : peers_) {
        result.push_back(record);
    }
    return result;
}

bool FederationRegistry::quarantine_peer(const std::string& id, const std::string& reason) {
    auto it = peers_.find(id);
    if (it == peers_.end()) return false;

    PeerRecord& record = it->second;
    apply_transition(record, StatusEvent::manual_quarantine(reason));
    record.last_seen = GetTimeMillis();

    persist(record);
    LogPrintRegistry(WARN, "Peer %s quarantined: %s", id.c_str(), record.quarantine_reason.c_str());

    notify_quarantined(record);
    return true;
}

DriftCheck FederationRegistry::check_drift(const std::string& id, const TrustVector& new_vector) {
    DriftCheck result;

    auto it = peers_.find(id);
    if (it == peers_.end()) {
        result.reason = "Bot not registered";
        return result;
    }

    PeerRecord& record = it->second;
    const bool was_quarantined = record.is_quarantined();

    result.old_overlap = record.overlap;
    result.new_overlap = compute_overlap(local_geometry_, new_vector).overlap;
    const double delta = std::abs(result.new_overlap - result.old_overlap);

    apply_transition(record, StatusEvent::drift_recheck(result.old_overlap, result.new_overlap));

    record.geometry_hash = geometry_hash(new_vector);
    record.overlap = result.new_overlap;
    record.last_seen = GetTimeMillis();
    persist(record);

    result.status = record.status;

    if (result.new_overlap < QUARANTINE_THRESHOLD) {
        result.drifted = true;
        result.reason = was_quarantined
            ? strprintf("Overlap below quarantine floor: %.3f < %.1f (already quarantined)",
                        result.new_overlap, QUARANTINE_THRESHOLD)
            : strprintf("Auto-quarantined due to low overlap: %.3f < %.1f",
                        result.new_overlap, QUARANTINE_THRESHOLD);
    } else if (delta > DRIFT_WARNING_THRESHOLD) {
        result.drifted = true;
        result.reason = strprintf("Significant overlap change: %.3f -> %.3f",
                                  result.old_overlap, result.new_overlap);
    }

    if (result.drifted) {
        LogPrintRegistry(WARN, "Drift on peer %s: %s", id.c_str(), result.reason->c_str());
    }

    if (record.is_quarantined()) {
        notify_quarantined(record);
    }

    return result;
}

bool FederationRegistry::remove_peer(const std::string& id) {
    auto it = peers_.find(id);
    if (it == peers_.end()) return false;

    peers_.erase(it);
    persist_removal(id);

    LogPrintRegistry(INFO, "Removed peer %s", id.c_str());
    return true;
}

void FederationRegistry::set_local_geometry(const TrustVector& geometry) {
    local_geometry_ = geometry;
    if (geometry.is_zero()) {
        LogPrintRegistry(WARN, "Local geometry is the zero vector; every peer will score overlap 0");
    }
    if (!peers_.empty()) {
        LogPrintRegistry(INFO, "Local geometry replaced; %zu stored overlaps are stale until their next check",
                         peers_.size());
    }
}

RegistryStats FederationRegistry::get_stats() const {
    RegistryStats stats;
    stats.total = peers_.size();
    for (const auto& [id, record] : peers_) {
        switch (record.status) {
            case PeerStatus::TRUSTED: stats.trusted++; break;
            case PeerStatus::QUARANTINED: stats.quarantined++; break;
            case PeerStatus::UNKNOWN: stats.unknown++; break;
        }
    }
    return stats;
}

std::string FederationRegistry::to_json() const {
    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"bots\": [";
    bool first = true;
    for (const auto& [id, record] : peers_) {
        oss << (first ? "\n    " : ",\n    ") << record.to_json();
        first = false;
    }
    oss << (peers_.empty() ? "],\n" : "\n  ],\n");
    oss << "  \"version\": \"" << FORMAT_VERSION << "\",\n";
    oss << "  \"lastUpdated\": \"" << FormatISO8601(last_updated_) << "\"\n";
    oss << "}";
    return oss.str();
}

} // namespace trustmesh
