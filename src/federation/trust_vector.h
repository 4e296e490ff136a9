// Copyright (c) 2025 The Trustmesh Core developers
// Distributed under the MIT software license

#ifndef TRUSTMESH_FEDERATION_TRUST_VECTOR_H
#define TRUSTMESH_FEDERATION_TRUST_VECTOR_H

/**
 * Trust Vector - 20-dimensional self-reported trust profile
 *
 * Each federated peer declares one score in [0,1] per behavioral category.
 * The category set is closed and ordered; every vector is held in its
 * canonical dense form (category order, missing categories = 0.0), so a
 * sparse map and an equivalent 20-element array are the same value.
 *
 * Vectors come from an external trust-profile pipeline and are treated as
 * opaque beyond the category domain and the numeric range.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace trustmesh {

static constexpr size_t NUM_TRUST_CATEGORIES = 20;

enum class TrustCategory : uint8_t {
    SECURITY = 0,
    RELIABILITY,
    DATA_INTEGRITY,
    PROCESS_ADHERENCE,
    CODE_QUALITY,
    TESTING,
    DOCUMENTATION,
    COMMUNICATION,
    TIME_MANAGEMENT,
    RESOURCE_EFFICIENCY,
    RISK_ASSESSMENT,
    COMPLIANCE,
    INNOVATION,
    COLLABORATION,
    ACCOUNTABILITY,
    TRANSPARENCY,
    ADAPTABILITY,
    DOMAIN_EXPERTISE,
    USER_FOCUS,
    ETHICAL_ALIGNMENT,
};

/** Wire name of a category, e.g. "data_integrity". */
const char* category_name(TrustCategory category);

/** Inverse of category_name(); nullopt for names outside the closed set. */
std::optional<TrustCategory> parse_category(const std::string& name);

/** All categories in canonical order. */
const std::array<TrustCategory, NUM_TRUST_CATEGORIES>& all_categories();

inline size_t category_index(TrustCategory category) {
    return static_cast<size_t>(category);
}

/**
 * Raised when a dense vector does not have exactly NUM_TRUST_CATEGORIES
 * entries. Indicates a caller bug; never recovered internally.
 */
class DimensionError : public std::invalid_argument {
public:
    DimensionError(size_t expected, size_t actual);

    size_t expected() const { return expected_; }
    size_t actual() const { return actual_; }

private:
    size_t expected_;
    size_t actual_;
};

class TrustVector {
public:
    using Scores = std::array<double, NUM_TRUST_CATEGORIES>;

    /** The all-zero vector. */
    TrustVector();

    /**
     * Build from a sparse category-name map. Missing categories default to
     * 0.0; names outside the closed set are ignored.
     */
    static TrustVector from_sparse(const std::map<std::string, double>& scores);

    /**
     * Build from a dense array in canonical order.
     * @throws DimensionError if scores.size() != NUM_TRUST_CATEGORIES
     */
    static TrustVector from_array(const std::vector<double>& scores);

    static TrustVector uniform(double value);

    /** Copy with one category replaced (clamped like every other input). */
    TrustVector with(TrustCategory category, double value) const;

    double operator[](TrustCategory category) const { return scores_[category_index(category)]; }
    const Scores& scores() const { return scores_; }

    bool is_zero() const;

    /** Sparse view: only non-zero categories, keyed by wire name. */
    std::map<std::string, double> to_sparse() const;

    bool operator==(const TrustVector& other) const { return scores_ == other.scores_; }
    bool operator!=(const TrustVector& other) const { return !(*this == other); }

private:
    explicit TrustVector(const Scores& scores);

    // Clamp into [0,1]; NaN becomes 0.0 and -0.0 becomes +0.0
    static double sanitize(double value);

    Scores scores_;
};

} // namespace trustmesh

#endif // TRUSTMESH_FEDERATION_TRUST_VECTOR_H
