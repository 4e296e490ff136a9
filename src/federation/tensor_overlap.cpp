// Copyright (c) 2025 The Trustmesh Core developers
// Distributed under the MIT software license

#include "tensor_overlap.h"

#include <util/strencodings.h>

#include <openssl/evp.h>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <memory>
#include <stdexcept>

namespace trustmesh {

OverlapResult compute_overlap(const TrustVector& a, const TrustVector& b) {
    OverlapResult result;

    const auto& sa = a.scores();
    const auto& sb = b.scores();

    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;
    for (size_t i = 0; i < NUM_TRUST_CATEGORIES; i++) {
        dot += sa[i] * sb[i];
        norm_a += sa[i] * sa[i];
        norm_b += sb[i] * sb[i];

        double diff = std::abs(sa[i] - sb[i]);
        if (diff <= ALIGNMENT_THRESHOLD) {
            result.aligned.push_back(static_cast<TrustCategory>(i));
        } else if (diff > DIVERGENCE_THRESHOLD) {
            result.divergent.push_back(static_cast<TrustCategory>(i));
        }
    }

    norm_a = std::sqrt(norm_a);
    norm_b = std::sqrt(norm_b);
    if (norm_a == 0.0 || norm_b == 0.0) {
        result.overlap = 0.0;
        return result;
    }

    // Rounding can push |cos| a hair past 1.0
    double cosine = std::abs(dot) / (norm_a * norm_b);
    result.overlap = std::max(0.0, std::min(1.0, cosine));
    return result;
}

bool is_compatible(const TrustVector& a, const TrustVector& b, double threshold) {
    return compute_overlap(a, b).overlap >= threshold;
}

std::string geometry_hash(const TrustVector& v) {
    std::vector<uint8_t> canonical;
    canonical.reserve(NUM_TRUST_CATEGORIES * 8);

    for (double score : v.scores()) {
        uint64_t bits;
        std::memcpy(&bits, &score, sizeof(double));
        for (int i = 0; i < 8; i++)
            canonical.push_back(static_cast<uint8_t>(bits >> (i * 8)));
    }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("geometry_hash: EVP_MD_CTX_new failed");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), canonical.data(), canonical.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        throw std::runtime_error("geometry_hash: SHA-256 digest failed");
    }

    return HexStr(digest, digest_len);
}

std::vector<TrustCategory> neutral_categories(const OverlapResult& result) {
    std::vector<TrustCategory> neutral;
    for (TrustCategory category : all_categories()) {
        bool in_aligned = std::find(result.aligned.begin(), result.aligned.end(), category) !=
                          result.aligned.end();
        bool in_divergent = std::find(result.divergent.begin(), result.divergent.end(), category) !=
                            result.divergent.end();
        if (!in_aligned && !in_divergent) {
            neutral.push_back(category);
        }
    }
    return neutral;
}

std::vector<std::string> category_names(const std::vector<TrustCategory>& categories) {
    std::vector<std::string> names;
    names.reserve(categories.size());
    for (TrustCategory category : categories) {
        names.emplace_back(category_name(category));
    }
    return names;
}

} // namespace trustmesh
