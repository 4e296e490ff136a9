// Copyright (c) 2025 The Trustmesh Core developers
// Distributed under the MIT software license

#include "trust_vector.h"

#include <util/logging.h>

#include <algorithm>
#include <cmath>

namespace trustmesh {

namespace {

const char* const CATEGORY_NAMES[NUM_TRUST_CATEGORIES] = {
    "security", "reliability", "data_integrity", "process_adherence",
    "code_quality", "testing", "documentation", "communication",
    "time_management", "resource_efficiency", "risk_assessment", "compliance",
    "innovation", "collaboration", "accountability", "transparency",
    "adaptability", "domain_expertise", "user_focus", "ethical_alignment",
};

std::array<TrustCategory, NUM_TRUST_CATEGORIES> make_category_list() {
    std::array<TrustCategory, NUM_TRUST_CATEGORIES> list{};
    for (size_t i = 0; i < NUM_TRUST_CATEGORIES; i++) {
        list[i] = static_cast<TrustCategory>(i);
    }
    return list;
}

} // namespace

const char* category_name(TrustCategory category) {
    size_t idx = category_index(category);
    if (idx >= NUM_TRUST_CATEGORIES) return "unknown";
    return CATEGORY_NAMES[idx];
}

std::optional<TrustCategory> parse_category(const std::string& name) {
    for (size_t i = 0; i < NUM_TRUST_CATEGORIES; i++) {
        if (name == CATEGORY_NAMES[i]) {
            return static_cast<TrustCategory>(i);
        }
    }
    return std::nullopt;
}

const std::array<TrustCategory, NUM_TRUST_CATEGORIES>& all_categories() {
    static const std::array<TrustCategory, NUM_TRUST_CATEGORIES> categories = make_category_list();
    return categories;
}

// ============ DimensionError ============

DimensionError::DimensionError(size_t expected, size_t actual)
    : std::invalid_argument("Invalid geometry dimensions: expected " + std::to_string(expected) +
                            ", got " + std::to_string(actual)),
      expected_(expected),
      actual_(actual) {}

// ============ TrustVector ============

TrustVector::TrustVector() {
    scores_.fill(0.0);
}

TrustVector::TrustVector(const Scores& scores) {
    for (size_t i = 0; i < NUM_TRUST_CATEGORIES; i++) {
        scores_[i] = sanitize(scores[i]);
    }
}

double TrustVector::sanitize(double value) {
    if (std::isnan(value)) return 0.0;
    value = std::max(0.0, std::min(1.0, value));
    // Collapse -0.0 so the canonical bytes (and the geometry hash) agree
    return value == 0.0 ? 0.0 : value;
}

TrustVector TrustVector::from_sparse(const std::map<std::string, double>& scores) {
    Scores dense;
    dense.fill(0.0);

    for (const auto& [name, value] : scores) {
        auto category = parse_category(name);
        if (!category) {
            LogPrintFederation(DEBUG, "Ignoring unknown trust category '%s'", name.c_str());
            continue;
        }
        dense[category_index(*category)] = value;
    }

    return TrustVector(dense);
}

TrustVector TrustVector::from_array(const std::vector<double>& scores) {
    if (scores.size() != NUM_TRUST_CATEGORIES) {
        throw DimensionError(NUM_TRUST_CATEGORIES, scores.size());
    }

    Scores dense;
    std::copy(scores.begin(), scores.end(), dense.begin());
    return TrustVector(dense);
}

TrustVector TrustVector::uniform(double value) {
    Scores dense;
    dense.fill(value);
    return TrustVector(dense);
}

TrustVector TrustVector::with(TrustCategory category, double value) const {
    Scores copy = scores_;
    copy[category_index(category)] = value;
    return TrustVector(copy);
}

bool TrustVector::is_zero() const {
    return std::all_of(scores_.begin(), scores_.end(), [](double s) { return s == 0.0; });
}

std::map<std::string, double> TrustVector::to_sparse() const {
    std::map<std::string, double> sparse;
    for (size_t i = 0; i < NUM_TRUST_CATEGORIES; i++) {
        if (scores_[i] != 0.0) {
            sparse[CATEGORY_NAMES[i]] = scores_[i];
        }
    }
    return sparse;
}

} // namespace trustmesh
