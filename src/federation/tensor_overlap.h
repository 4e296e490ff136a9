// Copyright (c) 2025 The Trustmesh Core developers
// Distributed under the MIT software license

#ifndef TRUSTMESH_FEDERATION_TENSOR_OVERLAP_H
#define TRUSTMESH_FEDERATION_TENSOR_OVERLAP_H

/**
 * Tensor Overlap - geometric similarity between two trust vectors
 *
 *   overlap = |A . B| / (||A|| * ||B||)      (0.0 if either norm is 0)
 *
 * Per-category partition on |a_i - b_i|:
 *   aligned    diff <= ALIGNMENT_THRESHOLD   (0.2)
 *   divergent  diff >  DIVERGENCE_THRESHOLD  (0.4)
 *   neither    (0.2, 0.4]
 *
 * All functions are pure.
 */

#include "trust_vector.h"

#include <string>
#include <vector>

namespace trustmesh {

static constexpr double ALIGNMENT_THRESHOLD = 0.2;
static constexpr double DIVERGENCE_THRESHOLD = 0.4;
static constexpr double TRUST_THRESHOLD = 0.8;

struct OverlapResult {
    double overlap = 0.0;                    // [0.0, 1.0]
    std::vector<TrustCategory> aligned;      // canonical order
    std::vector<TrustCategory> divergent;    // canonical order
};

OverlapResult compute_overlap(const TrustVector& a, const TrustVector& b);

/** compute_overlap(a, b).overlap >= threshold */
bool is_compatible(const TrustVector& a, const TrustVector& b, double threshold = TRUST_THRESHOLD);

/**
 * SHA-256 (lowercase hex, 64 chars) over the canonical dense form:
 * NUM_TRUST_CATEGORIES little-endian IEEE-754 doubles in category order.
 */
std::string geometry_hash(const TrustVector& v);

/** Categories that are neither aligned nor divergent. */
std::vector<TrustCategory> neutral_categories(const OverlapResult& result);

/** Wire names of the given categories, in the given order. */
std::vector<std::string> category_names(const std::vector<TrustCategory>& categories);

} // namespace trustmesh

#endif // TRUSTMESH_FEDERATION_TENSOR_OVERLAP_H
