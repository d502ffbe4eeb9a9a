// =============================================================================
// spice.hpp — Relationship-preference ("spice") alignment and rank blending.
//
// Each partner may state a preference on a 1–10 scale.  The alignment score
// falls off with the distance between the two (normalised) levels:
//
//   distance   0     1     2     3     4     >=5
//   score      1.0   0.85  0.65  0.35  0.15  0.0
//
// The final rank score blends total_guna / 36 with that alignment using
// caller weights (0.8 / 0.2 by default).
// =============================================================================
#pragma once

#include "koota.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdlib>
#include <optional>

namespace gunamilan {

inline constexpr int    kSpiceMin     = 1;
inline constexpr int    kSpiceMax     = 10;
inline constexpr int    kSpiceDefault = 5;   // absent or non-finite input
inline constexpr double kWeightVedic  = 0.8;
inline constexpr double kWeightSpice  = 0.2;

namespace detail {

inline constexpr std::array<double, 5> kSpiceByDistance = {1.0, 0.85, 0.65, 0.35, 0.15};

}  // namespace detail

/// Round half up and clamp to [1, 10]; absent or non-finite becomes 5.
[[nodiscard]] inline int normalize_spice_level(std::optional<double> level) {
    if (!level || !std::isfinite(*level)) return kSpiceDefault;
    const double clamped = std::clamp(*level, static_cast<double>(kSpiceMin),
                                      static_cast<double>(kSpiceMax));
    return static_cast<int>(std::floor(clamped + 0.5));
}

[[nodiscard]] constexpr double spice_alignment_from_distance(int distance) noexcept {
    if (distance < 0) distance = -distance;
    if (distance >= static_cast<int>(detail::kSpiceByDistance.size())) return 0.0;
    return detail::kSpiceByDistance[static_cast<std::size_t>(distance)];
}

struct SpiceAlignment {
    int    level_a  = kSpiceDefault;
    int    level_b  = kSpiceDefault;
    int    distance = 0;
    double score    = 1.0;
};

[[nodiscard]] inline SpiceAlignment
spice_alignment(std::optional<double> a, std::optional<double> b) {
    SpiceAlignment s;
    s.level_a  = normalize_spice_level(a);
    s.level_b  = normalize_spice_level(b);
    s.distance = std::abs(s.level_a - s.level_b);
    s.score    = spice_alignment_from_distance(s.distance);
    return s;
}

/// total_guna / 36, clamped to [0, 1].
[[nodiscard]] constexpr double vedic_rank_score(int total_guna) noexcept {
    return std::clamp(static_cast<double>(total_guna) / kMaxGuna, 0.0, 1.0);
}

/// Weighted blend; the weights are normalised to sum to one.  Non-positive
/// total weight falls back to 0.8 / 0.2.
[[nodiscard]] constexpr double
combined_rank_score(double vedic, double spice,
                    double weight_vedic = kWeightVedic,
                    double weight_spice = kWeightSpice) noexcept {
    const double total = weight_vedic + weight_spice;
    const double wv = total > 0 ? weight_vedic / total : kWeightVedic;
    const double ws = total > 0 ? weight_spice / total : kWeightSpice;
    return vedic * wv + spice * ws;
}

}  // namespace gunamilan
