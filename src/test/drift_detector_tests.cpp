// Copyright (c) 2025 The Trustmesh Core developers
// Distributed under the MIT software license

/**
 * High-precision drift detector tests
 */

#include <boost/test/unit_test.hpp>

#include <federation/drift_detector.h>
#include <federation/registry.h>

#include <algorithm>
#include <map>
#include <string>
#include <utility>
#include <vector>

using namespace trustmesh;

namespace {

// Local baseline: only security and reliability matter
const TrustVector LOCAL = TrustVector::from_sparse({{"security", 1.0}, {"reliability", 1.0}});

// overlap ~0.971 (trusted)
const TrustVector HIGH = TrustVector::from_sparse(
    {{"security", 0.8}, {"reliability", 0.6}, {"data_integrity", 0.2}});

// overlap ~0.618 (unknown, just above the quarantine floor)
const TrustVector EDGE = TrustVector::from_sparse(
    {{"security", 0.5}, {"reliability", 0.5}, {"data_integrity", 0.9}});

struct DriftSetup {
    FederationRegistry registry{"", LOCAL};
    DriftDetector detector{registry};

    DriftSetup() {
        registry.register_peer("high", "High Bot", HIGH);
        registry.register_peer("edge", "Edge Bot", EDGE);
    }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(drift_detector_tests, DriftSetup)

BOOST_AUTO_TEST_CASE(setup_statuses) {
    BOOST_CHECK(registry.get_peer("high")->status == PeerStatus::TRUSTED);
    BOOST_CHECK(registry.get_peer("edge")->status == PeerStatus::UNKNOWN);
}

BOOST_AUTO_TEST_CASE(unchanged_vector_never_drifts) {
    for (int i = 0; i < 2; i++) {
        DriftDetectionResult result = detector.check_peer("high", HIGH);
        BOOST_CHECK(!result.drifted);
        BOOST_CHECK(!result.quarantined);
        BOOST_CHECK_EQUAL(result.delta, 0.0);
        BOOST_CHECK_EQUAL(result.old_hash, result.new_hash);
        BOOST_CHECK_EQUAL(result.reason, "No geometry change detected");
    }

    DriftStats stats = detector.get_stats();
    BOOST_CHECK_EQUAL(stats.total_checks, 2U);
    BOOST_CHECK_EQUAL(stats.drifts_detected, 0U);
    BOOST_CHECK(stats.recent_events.empty());
}

BOOST_AUTO_TEST_CASE(unregistered_peer) {
    DriftDetectionResult result = detector.check_peer("ghost", HIGH);
    BOOST_CHECK(!result.drifted);
    BOOST_CHECK_EQUAL(result.reason, "Bot not registered");
    BOOST_CHECK(!registry.get_peer("ghost").has_value());
    BOOST_CHECK_EQUAL(detector.get_stats().total_checks, 1U);
}

BOOST_AUTO_TEST_CASE(change_within_tolerance) {
    DriftDetectionResult result = detector.check_peer("high", HIGH.with(TrustCategory::DATA_INTEGRITY, 0.2001));

    BOOST_CHECK(!result.drifted);
    BOOST_CHECK(result.old_hash != result.new_hash);
    BOOST_CHECK(result.delta > 0.0 && result.delta <= DEFAULT_DRIFT_THRESHOLD);
    BOOST_CHECK(result.reason.find("within tolerance") != std::string::npos);
    BOOST_CHECK(registry.get_peer("high")->status == PeerStatus::TRUSTED);
}

BOOST_AUTO_TEST_CASE(drift_above_floor_quarantines) {
    DriftDetectionResult result = detector.check_peer("high", HIGH.with(TrustCategory::DATA_INTEGRITY, 0.25));

    BOOST_CHECK(result.drifted);
    BOOST_CHECK(result.quarantined);
    BOOST_CHECK_CLOSE(result.delta, 0.010333, 0.01);
    BOOST_CHECK(result.new_overlap > QUARANTINE_THRESHOLD);

    auto record = registry.get_peer("high");
    BOOST_REQUIRE(record.has_value());
    BOOST_CHECK(record->is_quarantined());
    BOOST_CHECK(record->quarantine_reason.find("High-precision drift detected") == 0);

    // Registry baseline is untouched
    BOOST_CHECK_EQUAL(record->geometry_hash, geometry_hash(HIGH));
    BOOST_CHECK_EQUAL(record->overlap, result.old_overlap);
}

BOOST_AUTO_TEST_CASE(drift_across_floor_quarantines_once) {
    const TrustVector mutated = EDGE.with(TrustCategory::DATA_INTEGRITY, 0.95);

    DriftDetectionResult first = detector.check_peer("edge", mutated);
    BOOST_CHECK(first.drifted);
    BOOST_CHECK(first.quarantined);
    BOOST_CHECK(first.old_overlap > QUARANTINE_THRESHOLD);
    BOOST_CHECK(first.new_overlap < QUARANTINE_THRESHOLD);
    BOOST_CHECK(first.delta > DEFAULT_DRIFT_THRESHOLD);
    BOOST_CHECK_EQUAL(detector.get_recent_events().size(), 1U);

    // Already quarantined: reported again, not quarantined again
    DriftDetectionResult second = detector.check_peer("edge", mutated);
    BOOST_CHECK(second.drifted);
    BOOST_CHECK(!second.quarantined);
    BOOST_CHECK(second.reason.find("already quarantined") != std::string::npos);

    DriftStats stats = detector.get_stats();
    BOOST_CHECK_EQUAL(stats.total_checks, 2U);
    BOOST_CHECK_EQUAL(stats.drifts_detected, 2U);
    BOOST_CHECK_EQUAL(stats.peers_quarantined, 1U);
    BOOST_REQUIRE_EQUAL(stats.recent_events.size(), 2U);
    BOOST_CHECK(stats.recent_events[0].quarantined);
    BOOST_CHECK(!stats.recent_events[1].quarantined);
    BOOST_CHECK_EQUAL(stats.recent_events[0].display_name, "Edge Bot");
}

BOOST_AUTO_TEST_CASE(custom_threshold) {
    const TrustVector mutated = HIGH.with(TrustCategory::DATA_INTEGRITY, 0.25);

    DriftDetectionResult loose = detector.check_peer("high", mutated, 0.05);
    BOOST_CHECK(!loose.drifted);
    BOOST_CHECK_EQUAL(loose.threshold, 0.05);

    DriftDetectionResult strict = detector.check_peer("high", mutated, 0.001);
    BOOST_CHECK(strict.drifted);
}

BOOST_AUTO_TEST_CASE(configured_default_threshold) {
    DriftDetector loose(registry, 0.02);
    BOOST_CHECK_EQUAL(loose.default_threshold(), 0.02);
    BOOST_CHECK_EQUAL(detector.default_threshold(), DEFAULT_DRIFT_THRESHOLD);

    const TrustVector mutated = HIGH.with(TrustCategory::DATA_INTEGRITY, 0.25);
    DriftDetectionResult result = loose.check_peer("high", mutated);
    BOOST_CHECK(!result.drifted);
    BOOST_CHECK_EQUAL(result.threshold, 0.02);

    std::vector<DriftDetectionResult> swept = loose.monitor_all({{"high", mutated}});
    BOOST_REQUIRE_EQUAL(swept.size(), 1U);
    BOOST_CHECK(!swept[0].drifted);

    // An explicit threshold still wins
    BOOST_CHECK(loose.check_peer("high", mutated, 0.005).drifted);
}

BOOST_AUTO_TEST_CASE(batch_and_sweep) {
    std::vector<std::pair<std::string, TrustVector>> checks = {
        {"high", HIGH},
        {"edge", EDGE.with(TrustCategory::DATA_INTEGRITY, 0.95)},
        {"ghost", HIGH},
    };
    std::vector<DriftDetectionResult> results = detector.check_batch(checks);
    BOOST_REQUIRE_EQUAL(results.size(), 3U);
    BOOST_CHECK(!results[0].drifted);
    BOOST_CHECK(results[1].drifted);
    BOOST_CHECK(!results[2].drifted);
    BOOST_CHECK_EQUAL(results[2].reason, "Bot not registered");

    detector.reset();

    // Peers without a supplied vector are skipped
    std::map<std::string, TrustVector> vectors = {
        {"high", HIGH.with(TrustCategory::DATA_INTEGRITY, 0.25)},
        {"ghost", HIGH},
    };
    std::vector<DriftDetectionResult> swept = detector.monitor_all(vectors);
    BOOST_REQUIRE_EQUAL(swept.size(), 1U);
    BOOST_CHECK_EQUAL(swept[0].peer_id, "high");
    BOOST_CHECK(swept[0].drifted);
    BOOST_CHECK_EQUAL(detector.get_stats().total_checks, 1U);
}

BOOST_AUTO_TEST_CASE(stats_average_and_max) {
    DriftDetectionResult a = detector.check_peer("high", HIGH.with(TrustCategory::DATA_INTEGRITY, 0.25));
    DriftDetectionResult b = detector.check_peer("edge", EDGE.with(TrustCategory::DATA_INTEGRITY, 0.95));

    DriftStats stats = detector.get_stats();
    BOOST_CHECK_CLOSE(stats.average_delta, (a.delta + b.delta) / 2.0, 1e-9);
    BOOST_CHECK_EQUAL(stats.max_delta, std::max(a.delta, b.delta));
}

BOOST_AUTO_TEST_CASE(event_log_is_bounded) {
    const TrustVector mutated = EDGE.with(TrustCategory::DATA_INTEGRITY, 0.95);
    for (int i = 0; i < 105; i++) {
        detector.check_peer("edge", mutated);
    }

    DriftStats stats = detector.get_stats();
    BOOST_CHECK_EQUAL(stats.drifts_detected, 105U);
    BOOST_CHECK_EQUAL(stats.peers_quarantined, 1U);
    BOOST_CHECK_EQUAL(stats.recent_events.size(), DriftDetector::STATS_RECENT_EVENTS);

    BOOST_CHECK_EQUAL(detector.get_recent_events(1000).size(), DriftDetector::MAX_EVENTS);
    BOOST_CHECK_EQUAL(detector.get_recent_events().size(), 10U);
    BOOST_CHECK_EQUAL(detector.get_recent_events(3).size(), 3U);

    // The quarantining event has been evicted
    for (const DriftEvent& event : detector.get_recent_events(1000)) {
        BOOST_CHECK(!event.quarantined);
    }
}

BOOST_AUTO_TEST_CASE(recent_events_newest_first) {
    detector.check_peer("high", HIGH.with(TrustCategory::DATA_INTEGRITY, 0.25));
    detector.check_peer("edge", EDGE.with(TrustCategory::DATA_INTEGRITY, 0.95));

    std::vector<DriftEvent> events = detector.get_recent_events();
    BOOST_REQUIRE_EQUAL(events.size(), 2U);
    BOOST_CHECK_EQUAL(events[0].peer_id, "edge");
    BOOST_CHECK_EQUAL(events[1].peer_id, "high");
}

BOOST_AUTO_TEST_CASE(reset_clears_state) {
    detector.check_peer("high", HIGH.with(TrustCategory::DATA_INTEGRITY, 0.25));
    detector.reset();

    DriftStats stats = detector.get_stats();
    BOOST_CHECK_EQUAL(stats.total_checks, 0U);
    BOOST_CHECK_EQUAL(stats.drifts_detected, 0U);
    BOOST_CHECK_EQUAL(stats.peers_quarantined, 0U);
    BOOST_CHECK_EQUAL(stats.average_delta, 0.0);
    BOOST_CHECK_EQUAL(stats.max_delta, 0.0);
    BOOST_CHECK(detector.get_recent_events().empty());

    // Reset does not touch the registry
    BOOST_CHECK(registry.get_peer("high")->is_quarantined());
}

BOOST_AUTO_TEST_CASE(export_json) {
    std::string empty = detector.export_events();
    BOOST_CHECK(empty.find("\"exported\"") != std::string::npos);
    BOOST_CHECK(empty.find("\"events\": []") != std::string::npos);

    detector.check_peer("edge", EDGE.with(TrustCategory::DATA_INTEGRITY, 0.95));
    std::string json = detector.export_events();
    BOOST_CHECK(json.find("\"stats\": {\"totalChecks\": 1") != std::string::npos);
    BOOST_CHECK(json.find("\"botId\": \"edge\"") != std::string::npos);
    BOOST_CHECK(json.find("\"quarantined\": true") != std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
