// =============================================================================
// concepts.hpp — C++20 concepts for the pluggable parts of batch matching.
//
// Concepts defined:
//   CandidateFilter   — early-rejection predicate (subject, candidate) -> bool
//   MatchSink         — callable that consumes one ranked result
// =============================================================================
#pragma once

#include "types.hpp"

#include <concepts>

namespace gunamilan {

struct RankedMatch;

// ─────────────────────────────────────────────────────────────────────────────
// CandidateFilter — true means "reject this candidate before scoring".
// Must be pure: it may be called from several worker threads at once.
// ─────────────────────────────────────────────────────────────────────────────
template <typename F>
concept CandidateFilter = requires(const F f, const PersonVector& subject,
                                   const PersonVector& candidate) {
    { f(subject, candidate) } -> std::convertible_to<bool>;
};

// ─────────────────────────────────────────────────────────────────────────────
// MatchSink — receives ranked results in order (see for_each_ranked).
// ─────────────────────────────────────────────────────────────────────────────
template <typename S>
concept MatchSink = requires(S s, const RankedMatch& m) {
    { s(m) };
};

}  // namespace gunamilan
