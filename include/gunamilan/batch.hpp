// =============================================================================
// batch.hpp — Score one subject against many candidates and rank them.
//
// Per call:
//   1. Validate the subject and every candidate (no scoring on failure).
//   2. Run the early-rejection predicates.
//   3. Score the surviving candidates (and, in RankLast mode, the rejected
//      ones too), optionally across several worker threads.
//   4. Attach the preference-scale alignment and blended rank score.
//   5. Filter, sort, truncate.
//
// Workers write into disjoint, pre-sized result slots; sorting runs on the
// calling thread once every worker has joined, so the ranking does not
// depend on the thread count.
// =============================================================================
#pragma once

#include "concepts.hpp"
#include "match.hpp"
#include "spice.hpp"
#include "types.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace gunamilan {

struct Candidate {
    std::string           id;
    PersonVector          person;
    std::optional<double> relationship_preference_scale;   // 1–10
};

/// What happens to a candidate that an early-rejection predicate fires on.
enum class RejectionMode : std::uint8_t {
    Exclude,    // dropped without scoring
    RankLast    // fully scored, placed after every accepted candidate
};

using RejectionPredicate =
    std::function<bool(const PersonVector& subject, const PersonVector& candidate)>;

// ── Built-in predicates ─────────────────────────────────────────────────────
[[nodiscard]] inline bool reject_same_nadi(const PersonVector& subject,
                                           const PersonVector& candidate) {
    return same_nadi(subject.moon_nakshatra, candidate.moon_nakshatra);
}

[[nodiscard]] inline bool reject_bhakoot_dosha(const PersonVector& subject,
                                               const PersonVector& candidate) {
    return bhakoot_dosha(subject.moon_rashi, candidate.moon_rashi) !=
           BhakootDosha::None;
}

/// Primary sort key among accepted (and among rejected) candidates.
enum class RankOrder : std::uint8_t {
    TotalGuna,        // total_guna, then Manglik mismatch, Nadi dosha, id
    FinalRankScore    // blended Vedic/spice score, then total_guna, id
};

// ── Configuration ───────────────────────────────────────────────────────────

/// The rejection mode has no default and must be named at construction.
/// `min_total_guna` and `include_ineligible` only filter accepted candidates;
/// in RankLast mode the rejected tail is always kept.
struct BatchConfig {
    explicit BatchConfig(RejectionMode mode) : rejection_mode{mode} {}

    RejectionMode                   rejection_mode;
    std::vector<RejectionPredicate> reject_if;
    MatchOptions                    match_options{};
    std::optional<int>              min_total_guna;
    bool                            include_ineligible = true;
    std::optional<std::size_t>      max_results;
    std::size_t                     threads = 1;

    RankOrder                       order = RankOrder::TotalGuna;
    std::optional<double>           subject_preference_scale;
    double                          weight_vedic = kWeightVedic;
    double                          weight_spice = kWeightSpice;

    template <CandidateFilter F>
    BatchConfig& reject_when(F filter) {
        reject_if.emplace_back(std::move(filter));
        return *this;
    }
};

// ── Results ─────────────────────────────────────────────────────────────────
struct RankedMatch {
    std::string    candidate_id;
    std::size_t    candidate_index = 0;   // position in the input vector
    bool           rejected        = false;
    MatchResult    result;
    SpiceAlignment spice;
    double         vedic_rank_score = 0.0;
    double         final_rank_score = 0.0;
};

struct BatchResult {
    std::vector<RankedMatch> pairs;
    std::size_t total_pairs      = 0;   // candidates supplied
    std::size_t early_rejections = 0;   // candidates any predicate fired on
};

namespace detail {

/// No < Unknown < Yes.
[[nodiscard]] constexpr int mismatch_rank(Flag f) noexcept {
    switch (f) {
        case Flag::No:  return 0;
        case Flag::Unknown: return 1;
        default:        return 2;
    }
}

[[nodiscard]] inline bool ranks_before(const RankedMatch& x, const RankedMatch& y,
                                       RankOrder order) {
    if (x.rejected != y.rejected) return !x.rejected;
    const int tx = x.result.total_guna();
    const int ty = y.result.total_guna();
    if (order == RankOrder::FinalRankScore) {
        if (x.final_rank_score != y.final_rank_score)
            return x.final_rank_score > y.final_rank_score;
        if (tx != ty) return tx > ty;
    } else {
        if (tx != ty) return tx > ty;
        const int mx = mismatch_rank(x.result.dosha.manglik);
        const int my = mismatch_rank(y.result.dosha.manglik);
        if (mx != my) return mx < my;
        const bool nx = x.result.dosha.nadi == Flag::Yes;
        const bool ny = y.result.dosha.nadi == Flag::Yes;
        if (nx != ny) return !nx;
    }
    if (x.candidate_id != y.candidate_id) return x.candidate_id < y.candidate_id;
    return x.candidate_index < y.candidate_index;
}

/// Run `work(i)` for every i in [0, n), partitioned across `threads`
/// workers.  The first exception thrown by any worker is rethrown here.
template <typename Work>
void parallel_for(std::size_t n, std::size_t threads, Work&& work) {
    threads = std::max<std::size_t>(1, std::min(threads, n));
    if (threads <= 1) {
        for (std::size_t i = 0; i < n; ++i) work(i);
        return;
    }

    std::vector<std::exception_ptr> errors(threads);
    std::vector<std::thread> pool;
    pool.reserve(threads);
    const std::size_t chunk = (n + threads - 1) / threads;

    for (std::size_t t = 0; t < threads; ++t) {
        const std::size_t begin = t * chunk;
        const std::size_t end   = std::min(n, begin + chunk);
        pool.emplace_back([&, t, begin, end] {
            try {
                for (std::size_t i = begin; i < end; ++i) work(i);
            } catch (...) {
                errors[t] = std::current_exception();
            }
        });
    }
    for (auto& th : pool) th.join();
    for (auto& e : errors)
        if (e) std::rethrow_exception(e);
}

}  // namespace detail

// ── compute_batch ───────────────────────────────────────────────────────────

/// Rank `candidates` against `subject`.  Throws ValidationError naming
/// "subject.<field>" or "candidates[i].<field>" before any scoring.
[[nodiscard]] inline BatchResult
compute_batch(const PersonVector& subject,
              const std::vector<Candidate>& candidates,
              const BatchConfig& config)
{
    validate_person(subject, "subject");
    for (std::size_t i = 0; i < candidates.size(); ++i)
        validate_person(candidates[i].person,
                        "candidates[" + std::to_string(i) + "]");

    BatchResult out;
    out.total_pairs = candidates.size();

    // ── Early rejection ─────────────────────────────────────────────────────
    std::vector<char> rejected(candidates.size(), 0);
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        for (const auto& pred : config.reject_if) {
            if (pred(subject, candidates[i].person)) {
                rejected[i] = 1;
                ++out.early_rejections;
                break;
            }
        }
    }

    std::vector<std::size_t> to_score;
    to_score.reserve(candidates.size());
    for (std::size_t i = 0; i < candidates.size(); ++i)
        if (!rejected[i] || config.rejection_mode == RejectionMode::RankLast)
            to_score.push_back(i);

    // ── Scoring ─────────────────────────────────────────────────────────────
    std::vector<RankedMatch> slots(to_score.size());
    detail::parallel_for(to_score.size(), config.threads, [&](std::size_t k) {
        const std::size_t i = to_score[k];
        const Candidate& c = candidates[i];
        RankedMatch& m = slots[k];
        m.candidate_id    = c.id;
        m.candidate_index = i;
        m.rejected        = rejected[i] != 0;
        m.result = compute_match(subject, c.person, config.match_options,
                                 "subject",
                                 "candidates[" + std::to_string(i) + "]");

        m.spice = spice_alignment(config.subject_preference_scale,
                                  c.relationship_preference_scale);
        m.vedic_rank_score = vedic_rank_score(m.result.total_guna());
        m.final_rank_score = combined_rank_score(m.vedic_rank_score, m.spice.score,
                                                 config.weight_vedic,
                                                 config.weight_spice);
    });

    // ── Filter, sort, truncate ──────────────────────────────────────────────
    std::size_t ineligible = 0;
    out.pairs.reserve(slots.size());
    for (auto& m : slots) {
        if (!m.rejected) {
            if (config.min_total_guna &&
                m.result.total_guna() < *config.min_total_guna)
                continue;
            if (!config.include_ineligible && !m.result.eligibility.eligible) {
                ++ineligible;
                continue;
            }
        }
        out.pairs.push_back(std::move(m));
    }
    std::sort(out.pairs.begin(), out.pairs.end(),
              [&](const RankedMatch& x, const RankedMatch& y) {
                  return detail::ranks_before(x, y, config.order);
              });
    if (config.max_results && out.pairs.size() > *config.max_results)
        out.pairs.resize(*config.max_results);

    spdlog::debug("compute_batch: {} candidates, {} rejected early ({}), "
                  "{} scored, {} ineligible dropped, {} ranked, {} thread(s)",
                  out.total_pairs, out.early_rejections,
                  config.rejection_mode == RejectionMode::Exclude ? "excluded"
                                                                  : "ranked last",
                  slots.size(), ineligible, out.pairs.size(),
                  std::max<std::size_t>(1, config.threads));
    return out;
}

/// Feed ranked results to `sink` in rank order.
template <MatchSink S>
void for_each_ranked(const BatchResult& r, S&& sink) {
    for (const auto& m : r.pairs) sink(m);
}

}  // namespace gunamilan
