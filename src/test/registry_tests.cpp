// Copyright (c) 2025 The Trustmesh Core developers
// Distributed under the MIT software license

/**
 * Federation Registry Tests
 *
 * Test Categories:
 * 1. Registration and status assignment
 * 2. Coarse drift checks and quarantine
 * 3. LevelDB persistence and recovery
 */

#include <boost/test/unit_test.hpp>

#include <federation/registry.h>
#include <util/time.h>

#include <leveldb/db.h>
#include <leveldb/options.h>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace trustmesh;

namespace {

const TrustVector LOCAL = TrustVector::uniform(0.8);

// overlap 1.0 against LOCAL
const TrustVector PARALLEL = TrustVector::uniform(0.82);

// overlap 1/sqrt(2) against LOCAL
TrustVector HalfVector() {
    std::vector<double> half(20, 0.0);
    for (size_t i = 0; i < 10; i++) half[i] = 1.0;
    return TrustVector::from_array(half);
}

// overlap 1/sqrt(20) against LOCAL
const TrustVector SINGLE = TrustVector::from_sparse({{"security", 1.0}});

/**
 * Create a unique temporary data directory, removed on destruction
 */
struct TempDataDir {
    std::string path;

    TempDataDir() {
        static int counter = 0;
        path = (std::filesystem::temp_directory_path() /
                ("trustmesh_registry_test_" + std::to_string(GetTimeMillis()) + "_" +
                 std::to_string(counter++))).string();
        std::filesystem::create_directories(path);
    }

    ~TempDataDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::string store() const { return path + "/federation_registry"; }
};

void PutRaw(const std::string& store, const std::string& key, const std::string& value) {
    leveldb::DB* raw = nullptr;
    leveldb::Options options;
    leveldb::Status status = leveldb::DB::Open(options, store, &raw);
    BOOST_REQUIRE_MESSAGE(status.ok(), status.ToString());
    std::unique_ptr<leveldb::DB> db(raw);
    BOOST_REQUIRE(db->Put(leveldb::WriteOptions(), key, value).ok());
}

} // namespace

BOOST_AUTO_TEST_SUITE(registry_tests)

// ============================================================================
// Registration
// ============================================================================

BOOST_AUTO_TEST_CASE(memory_only_registry) {
    FederationRegistry registry("", LOCAL);
    BOOST_CHECK(!registry.is_persistent());
    BOOST_CHECK(registry.store_path().empty());

    PeerRecord record = registry.register_peer("bot-a", "Bot A", PARALLEL);
    BOOST_CHECK(record.status == PeerStatus::TRUSTED);
    BOOST_CHECK(registry.get_peer("bot-a").has_value());
}

BOOST_AUTO_TEST_CASE(registration_assigns_status) {
    FederationRegistry registry("", LOCAL);

    PeerRecord trusted = registry.register_peer("trusted", "T", PARALLEL);
    BOOST_CHECK(trusted.status == PeerStatus::TRUSTED);
    BOOST_CHECK_CLOSE(trusted.overlap, 1.0, 1e-9);
    BOOST_CHECK_EQUAL(trusted.geometry_hash, geometry_hash(PARALLEL));
    BOOST_CHECK(trusted.quarantine_reason.empty());

    PeerRecord unknown = registry.register_peer("unknown", "U", HalfVector());
    BOOST_CHECK(unknown.status == PeerStatus::UNKNOWN);

    PeerRecord quarantined = registry.register_peer("low", "L", SINGLE);
    BOOST_CHECK(quarantined.status == PeerStatus::QUARANTINED);
    BOOST_CHECK_EQUAL(quarantined.quarantine_reason, "Low overlap: 0.224 < 0.6");

    RegistryStats stats = registry.get_stats();
    BOOST_CHECK_EQUAL(stats.total, 3U);
    BOOST_CHECK_EQUAL(stats.trusted, 1U);
    BOOST_CHECK_EQUAL(stats.unknown, 1U);
    BOOST_CHECK_EQUAL(stats.quarantined, 1U);
}

BOOST_AUTO_TEST_CASE(reregistration_is_idempotent) {
    FederationRegistry registry("", LOCAL);

    PeerRecord first = registry.register_peer("bot-a", "Bot A", PARALLEL);
    PeerRecord second = registry.register_peer("bot-a", "Bot A", PARALLEL);

    BOOST_CHECK(second.status == first.status);
    BOOST_CHECK_EQUAL(second.registered_at, first.registered_at);
    BOOST_CHECK_EQUAL(second.overlap, first.overlap);
    BOOST_CHECK_EQUAL(second.geometry_hash, first.geometry_hash);
    BOOST_CHECK(second.last_seen >= first.last_seen);
    BOOST_CHECK_EQUAL(registry.get_stats().total, 1U);
}

BOOST_AUTO_TEST_CASE(reregistration_replaces_name_and_lifts_quarantine) {
    FederationRegistry registry("", LOCAL);

    registry.register_peer("bot-a", "Old", PARALLEL);
    BOOST_CHECK(registry.quarantine_peer("bot-a", "Operator request"));

    PeerRecord record = registry.register_peer("bot-a", "New", PARALLEL);
    BOOST_CHECK_EQUAL(record.display_name, "New");
    BOOST_CHECK(record.status == PeerStatus::TRUSTED);
    BOOST_CHECK(record.quarantine_reason.empty());
}

BOOST_AUTO_TEST_CASE(get_and_list_peers) {
    FederationRegistry registry("", LOCAL);
    BOOST_CHECK(!registry.get_peer("missing").has_value());
    BOOST_CHECK(registry.list_peers().empty());

    registry.register_peer("charlie", "C", PARALLEL);
    registry.register_peer("alpha", "A", PARALLEL);
    registry.register_peer("bravo", "B", PARALLEL);

    std::vector<PeerRecord> peers = registry.list_peers();
    BOOST_REQUIRE_EQUAL(peers.size(), 3U);
    BOOST_CHECK_EQUAL(peers[0].id, "alpha");
    BOOST_CHECK_EQUAL(peers[1].id, "bravo");
    BOOST_CHECK_EQUAL(peers[2].id, "charlie");
}

BOOST_AUTO_TEST_CASE(quarantine_and_remove) {
    FederationRegistry registry("", LOCAL);
    BOOST_CHECK(!registry.quarantine_peer("missing", "reason"));
    BOOST_CHECK(!registry.remove_peer("missing"));

    registry.register_peer("bot-a", "Bot A", PARALLEL);
    BOOST_CHECK(registry.quarantine_peer("bot-a", "Operator request"));

    auto record = registry.get_peer("bot-a");
    BOOST_REQUIRE(record.has_value());
    BOOST_CHECK(record->is_quarantined());
    BOOST_CHECK_EQUAL(record->quarantine_reason, "Operator request");
    BOOST_CHECK_CLOSE(record->overlap, 1.0, 1e-9);

    BOOST_CHECK(registry.remove_peer("bot-a"));
    BOOST_CHECK(!registry.get_peer("bot-a").has_value());
    BOOST_CHECK_EQUAL(registry.get_stats().total, 0U);
}

BOOST_AUTO_TEST_CASE(quarantine_callbacks) {
    FederationRegistry registry("", LOCAL);

    std::vector<std::string> seen;
    size_t handle = registry.register_quarantine_callback([&seen](const PeerRecord& record) {
        BOOST_CHECK(record.is_quarantined());
        seen.push_back(record.id);
    });

    registry.register_peer("bot-a", "Bot A", PARALLEL);
    registry.register_peer("bot-b", "Bot B", HalfVector());
    BOOST_CHECK(seen.empty());

    registry.register_peer("bot-c", "Bot C", SINGLE);   // auto-quarantine
    registry.quarantine_peer("bot-a", "Operator request");
    registry.check_drift("bot-b", SINGLE);               // drift below the floor
    BOOST_REQUIRE_EQUAL(seen.size(), 3U);
    BOOST_CHECK_EQUAL(seen[0], "bot-c");
    BOOST_CHECK_EQUAL(seen[1], "bot-a");
    BOOST_CHECK_EQUAL(seen[2], "bot-b");

    registry.unregister_quarantine_callback(handle);
    registry.quarantine_peer("bot-a", "again");
    BOOST_CHECK_EQUAL(seen.size(), 3U);
}

BOOST_AUTO_TEST_CASE(throwing_quarantine_callback_is_contained) {
    FederationRegistry registry("", LOCAL);

    int calls = 0;
    registry.register_quarantine_callback([](const PeerRecord&) {
        throw std::runtime_error("listener failure");
    });
    registry.register_quarantine_callback([&calls](const PeerRecord&) { calls++; });

    registry.register_peer("bot-a", "Bot A", PARALLEL);
    BOOST_CHECK(registry.quarantine_peer("bot-a", "Operator request"));
    BOOST_CHECK_EQUAL(calls, 1);
    BOOST_CHECK(registry.get_peer("bot-a")->is_quarantined());
}

// ============================================================================
// Drift checks
// ============================================================================

BOOST_AUTO_TEST_CASE(check_drift_unknown_peer) {
    FederationRegistry registry("", LOCAL);
    DriftCheck result = registry.check_drift("ghost", PARALLEL);

    BOOST_CHECK(!result.drifted);
    BOOST_REQUIRE(result.reason.has_value());
    BOOST_CHECK_EQUAL(*result.reason, "Bot not registered");
    BOOST_CHECK(!registry.get_peer("ghost").has_value());
}

BOOST_AUTO_TEST_CASE(check_drift_small_change) {
    FederationRegistry registry("", LOCAL);
    registry.register_peer("bot-a", "Bot A", PARALLEL);

    TrustVector nudged = PARALLEL.with(TrustCategory::TESTING, 0.7);
    DriftCheck result = registry.check_drift("bot-a", nudged);

    BOOST_CHECK(!result.drifted);
    BOOST_CHECK(!result.reason.has_value());
    BOOST_CHECK(result.status == PeerStatus::TRUSTED);

    // Baseline follows the latest observation
    auto record = registry.get_peer("bot-a");
    BOOST_REQUIRE(record.has_value());
    BOOST_CHECK_EQUAL(record->geometry_hash, geometry_hash(nudged));
    BOOST_CHECK_EQUAL(record->overlap, result.new_overlap);
}

BOOST_AUTO_TEST_CASE(check_drift_significant_change) {
    FederationRegistry registry("", LOCAL);
    registry.register_peer("bot-a", "Bot A", PARALLEL);

    DriftCheck result = registry.check_drift("bot-a", HalfVector());
    BOOST_CHECK(result.drifted);
    BOOST_CHECK(result.status == PeerStatus::UNKNOWN);
    BOOST_CHECK_CLOSE(result.old_overlap, 1.0, 1e-9);
    BOOST_CHECK_CLOSE(result.new_overlap, 0.70710678, 1e-6);
    BOOST_REQUIRE(result.reason.has_value());
    BOOST_CHECK_EQUAL(*result.reason, "Significant overlap change: 1.000 -> 0.707");
}

BOOST_AUTO_TEST_CASE(check_drift_auto_quarantine) {
    FederationRegistry registry("", LOCAL);
    registry.register_peer("bot-a", "Bot A", PARALLEL);

    DriftCheck result = registry.check_drift("bot-a", SINGLE);
    BOOST_CHECK(result.drifted);
    BOOST_CHECK(result.status == PeerStatus::QUARANTINED);
    BOOST_REQUIRE(result.reason.has_value());
    BOOST_CHECK_EQUAL(*result.reason, "Auto-quarantined due to low overlap: 0.224 < 0.6");

    auto record = registry.get_peer("bot-a");
    BOOST_REQUIRE(record.has_value());
    BOOST_CHECK(record->is_quarantined());
    BOOST_CHECK(!record->quarantine_reason.empty());

    // Second check below the floor reports, but does not re-quarantine
    DriftCheck again = registry.check_drift("bot-a", SINGLE);
    BOOST_CHECK(again.drifted);
    BOOST_REQUIRE(again.reason.has_value());
    BOOST_CHECK_EQUAL(*again.reason, "Overlap below quarantine floor: 0.224 < 0.6 (already quarantined)");
}

BOOST_AUTO_TEST_CASE(check_drift_keeps_manual_quarantine) {
    FederationRegistry registry("", LOCAL);
    registry.register_peer("bot-a", "Bot A", PARALLEL);
    registry.quarantine_peer("bot-a", "Operator request");

    DriftCheck result = registry.check_drift("bot-a", PARALLEL);
    BOOST_CHECK(!result.drifted);
    BOOST_CHECK(result.status == PeerStatus::QUARANTINED);
    BOOST_CHECK_EQUAL(registry.get_peer("bot-a")->quarantine_reason, "Operator request");
}

BOOST_AUTO_TEST_CASE(local_geometry_change_is_lazy) {
    FederationRegistry registry("", LOCAL);
    registry.register_peer("bot-a", "Bot A", PARALLEL);

    registry.set_local_geometry(SINGLE);
    BOOST_CHECK(registry.local_geometry() == SINGLE);

    // Stored overlap is stale until the next check
    BOOST_CHECK_CLOSE(registry.get_peer("bot-a")->overlap, 1.0, 1e-9);

    DriftCheck result = registry.check_drift("bot-a", PARALLEL);
    BOOST_CHECK_CLOSE(result.new_overlap, 1.0 / std::sqrt(20.0), 1e-6);
    BOOST_CHECK(registry.get_peer("bot-a")->is_quarantined());
}

BOOST_AUTO_TEST_CASE(json_export) {
    FederationRegistry registry("", LOCAL);
    std::string empty = registry.to_json();
    BOOST_CHECK(empty.find("\"bots\": []") != std::string::npos);
    BOOST_CHECK(empty.find("\"version\": \"1.0.0\"") != std::string::npos);
    BOOST_CHECK(empty.find("\"lastUpdated\"") != std::string::npos);

    registry.register_peer("bot-a", "Bot A", PARALLEL);
    registry.register_peer("bot-b", "Bot B", SINGLE);
    std::string json = registry.to_json();
    BOOST_CHECK(json.find("\"id\": \"bot-a\"") != std::string::npos);
    BOOST_CHECK(json.find("\"quarantineReason\"") != std::string::npos);
    BOOST_CHECK(json.find("\"id\": \"bot-a\"") < json.find("\"id\": \"bot-b\""));
}

// ============================================================================
// Persistence
// ============================================================================

BOOST_AUTO_TEST_CASE(persistence_across_reopen) {
    TempDataDir dir;
    PeerRecord original;
    {
        FederationRegistry registry(dir.path, LOCAL);
        BOOST_REQUIRE(registry.is_persistent());
        BOOST_CHECK_EQUAL(registry.store_path(), dir.store());

        original = registry.register_peer("bot-a", "Bot A", PARALLEL);
        registry.register_peer("bot-b", "Bot B", PARALLEL);
        registry.register_peer("bot-c", "Bot C", PARALLEL);
        registry.quarantine_peer("bot-b", "Operator request");
        registry.remove_peer("bot-c");
    }

    FederationRegistry reopened(dir.path, LOCAL);
    BOOST_REQUIRE(reopened.is_persistent());
    BOOST_CHECK_EQUAL(reopened.get_stats().total, 2U);

    auto a = reopened.get_peer("bot-a");
    BOOST_REQUIRE(a.has_value());
    BOOST_CHECK_EQUAL(a->display_name, original.display_name);
    BOOST_CHECK_EQUAL(a->geometry_hash, original.geometry_hash);
    BOOST_CHECK_EQUAL(a->overlap, original.overlap);
    BOOST_CHECK_EQUAL(a->registered_at, original.registered_at);
    BOOST_CHECK(a->status == PeerStatus::TRUSTED);

    auto b = reopened.get_peer("bot-b");
    BOOST_REQUIRE(b.has_value());
    BOOST_CHECK(b->is_quarantined());
    BOOST_CHECK_EQUAL(b->quarantine_reason, "Operator request");

    BOOST_CHECK(!reopened.get_peer("bot-c").has_value());
}

BOOST_AUTO_TEST_CASE(corrupted_store_starts_empty) {
    TempDataDir dir;
    {
        FederationRegistry registry(dir.path, LOCAL);
        registry.register_peer("bot-a", "Bot A", PARALLEL);
    }

    {
        std::ofstream current(dir.store() + "/CURRENT", std::ios::trunc);
        current << "garbage";
    }

    FederationRegistry recovered(dir.path, LOCAL);
    BOOST_CHECK(recovered.is_persistent());
    BOOST_CHECK_EQUAL(recovered.get_stats().total, 0U);

    // Store is usable again
    recovered.register_peer("bot-b", "Bot B", PARALLEL);
    BOOST_CHECK(recovered.get_peer("bot-b").has_value());
}

BOOST_AUTO_TEST_CASE(unreadable_record_is_skipped) {
    TempDataDir dir;
    {
        FederationRegistry registry(dir.path, LOCAL);
        registry.register_peer("bot-a", "Bot A", PARALLEL);
    }

    PutRaw(dir.store(), "peer:broken", "not a record");

    FederationRegistry reopened(dir.path, LOCAL);
    BOOST_CHECK_EQUAL(reopened.get_stats().total, 1U);
    BOOST_CHECK(reopened.get_peer("bot-a").has_value());
    BOOST_CHECK(!reopened.get_peer("broken").has_value());
}

BOOST_AUTO_TEST_CASE(unsupported_version_resets_store) {
    TempDataDir dir;
    {
        FederationRegistry registry(dir.path, LOCAL);
        registry.register_peer("bot-a", "Bot A", PARALLEL);
    }

    PutRaw(dir.store(), "meta:version", "0.9.0");

    {
        FederationRegistry reset(dir.path, LOCAL);
        BOOST_CHECK(reset.is_persistent());
        BOOST_CHECK_EQUAL(reset.get_stats().total, 0U);
        reset.register_peer("bot-b", "Bot B", PARALLEL);
    }

    // Reset stamped the current version, so the next open keeps its data
    FederationRegistry reopened(dir.path, LOCAL);
    BOOST_CHECK_EQUAL(reopened.get_stats().total, 1U);
    BOOST_CHECK(reopened.get_peer("bot-b").has_value());
}

BOOST_AUTO_TEST_CASE(unusable_data_dir_runs_memory_only) {
    TempDataDir dir;
    const std::string blocker = dir.path + "/not_a_dir";
    {
        std::ofstream file(blocker);
        file << "x";
    }

    FederationRegistry registry(blocker + "/sub", LOCAL);
    BOOST_CHECK(!registry.is_persistent());

    registry.register_peer("bot-a", "Bot A", PARALLEL);
    BOOST_CHECK(registry.get_peer("bot-a").has_value());
}

BOOST_AUTO_TEST_SUITE_END()
