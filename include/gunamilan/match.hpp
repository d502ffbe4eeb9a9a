// =============================================================================
// match.hpp — Validation and the single-pair match orchestrator.
//
// compute_match() is the library's main entry point:
//
//   validate A, validate B ──► eight kootas ──► total + verdict
//       ──► Nadi cancellation ──► Manglik ──► dasha sync
//       ──► eligibility gate ──► MatchResult
//
// The result is a value: it is never mutated after construction and two
// calls with equal inputs produce equal results.  Nothing here logs or
// touches I/O.
// =============================================================================
#pragma once

#include "dasha.hpp"
#include "guna.hpp"
#include "koota.hpp"
#include "manglik.hpp"
#include "types.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace gunamilan {

// ─────────────────────────────────────────────────────────────────────────────
// Options
// ─────────────────────────────────────────────────────────────────────────────

struct MatchOptions {
    ManglikPolicy        manglik_policy          = ManglikPolicy::LagnaOnly;
    bool                 allow_nadi_cancellation = true;
    NadiCancellationRule nadi_cancellation_rule  = NadiCancellationRule::SignAndStar;
    int                  minimum_viable_score    = kAcceptableMin;
    bool                 apply_manglik_gate      = true;
};

// ─────────────────────────────────────────────────────────────────────────────
// Result records
// ─────────────────────────────────────────────────────────────────────────────

struct DoshaFlags {
    Flag manglik = Flag::Unknown;   // post-cancellation statuses differ
    Flag nadi    = Flag::No;        // Nadi scored zero
    Flag bhakoot = Flag::No;        // Bhakoot scored zero
};

struct CompatibilityFlags {
    bool sexual_incompatibility = false;   // enemy yonis
    bool severe_nadi_dosha      = false;   // Nadi zero and not cancelled
    Flag dasha_conflict         = Flag::Unknown;
    Flag dasha_growth           = Flag::Unknown;
};

enum class IneligibilityReason : std::uint8_t {
    BelowMinimumScore,
    UncancelledNadiDosha,
    ManglikMismatch
};

[[nodiscard]] constexpr const char* reason_name(IneligibilityReason r) noexcept {
    switch (r) {
        case IneligibilityReason::BelowMinimumScore:    return "below_minimum_score";
        case IneligibilityReason::UncancelledNadiDosha: return "uncancelled_nadi_dosha";
        case IneligibilityReason::ManglikMismatch:      return "manglik_mismatch";
    }
    return "?";
}

struct Eligibility {
    bool eligible = true;
    std::vector<IneligibilityReason> reasons;
};

struct MatchResult {
    KootaScoreVector    scores;
    Verdict             verdict = Verdict::Unfavorable;
    DoshaFlags          dosha;
    CompatibilityFlags  compatibility;

    // Explanation detail.
    TaraCategory        tara         = TaraCategory::Janma;
    YoniRelation        yoni         = YoniRelation::Same;
    GrahaMaitriRelation graha_maitri = GrahaMaitriRelation::SameLord;
    BhakootDosha        bhakoot      = BhakootDosha::None;
    NadiCancellation    nadi_cancellation = NadiCancellation::None;
    ManglikMatch        manglik;
    DashaReport         dasha;
    Eligibility         eligibility;

    std::vector<IncompleteInputWarning> warnings;

    [[nodiscard]] int total_guna() const noexcept { return scores.total_guna(); }
};

// ─────────────────────────────────────────────────────────────────────────────
// Validation
// ─────────────────────────────────────────────────────────────────────────────

/// Throw ValidationError naming the first out-of-domain field, in declaration
/// order.  Absent optionals are not errors.
inline void validate_person(const PersonVector& p, std::string_view prefix) {
    const auto fail = [&](const char* name) {
        throw ValidationError(std::string(prefix) + "." + name);
    };

    if (!is_valid(p.moon_nakshatra)) fail("moon_nakshatra");
    if (!is_valid(p.moon_rashi))     fail("moon_rashi");
    if (!is_valid(p.ascendant))      fail("ascendant");

    if (p.mars_house    && !is_valid(*p.mars_house))    fail("mars_house");
    if (p.mars_rashi    && !is_valid(*p.mars_rashi))    fail("mars_rashi");
    if (p.jupiter_house && !is_valid(*p.jupiter_house)) fail("jupiter_house");
    if (p.venus_house   && !is_valid(*p.venus_house))   fail("venus_house");
    if (p.saturn_house  && !is_valid(*p.saturn_house))  fail("saturn_house");
    if (p.dasha_lord     && !is_valid(*p.dasha_lord))     fail("dasha_lord");
    if (p.sub_dasha_lord && !is_valid(*p.sub_dasha_lord)) fail("sub_dasha_lord");
}

// ─────────────────────────────────────────────────────────────────────────────
// Eligibility
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] inline Eligibility
evaluate_eligibility(const MatchResult& r, const MatchOptions& opts) {
    Eligibility e;
    if (r.total_guna() < opts.minimum_viable_score)
        e.reasons.push_back(IneligibilityReason::BelowMinimumScore);
    if (r.compatibility.severe_nadi_dosha)
        e.reasons.push_back(IneligibilityReason::UncancelledNadiDosha);
    if (opts.apply_manglik_gate && r.dosha.manglik == Flag::Yes)
        e.reasons.push_back(IneligibilityReason::ManglikMismatch);
    e.eligible = e.reasons.empty();
    return e;
}

// ─────────────────────────────────────────────────────────────────────────────
// compute_match
// ─────────────────────────────────────────────────────────────────────────────

/// Score one pairing.  `a` takes the groom-analog role for Varna and Tara.
/// Validation errors and warnings name fields under `prefix_a` / `prefix_b`
/// ("person_a.moon_rashi" style); validation runs before any scoring.
[[nodiscard]] inline MatchResult
compute_match(const PersonVector& a, const PersonVector& b,
              const MatchOptions& opts,
              std::string_view prefix_a, std::string_view prefix_b)
{
    validate_person(a, prefix_a);
    validate_person(b, prefix_b);

    MatchResult r;

    // ── Kootas ──────────────────────────────────────────────────────────────
    r.scores       = score_kootas(a, b);
    r.verdict      = verdict_for(r.scores.total_guna());
    r.tara         = tara_category(a.moon_nakshatra, b.moon_nakshatra);
    r.yoni         = yoni_relation(a.moon_nakshatra, b.moon_nakshatra);
    r.graha_maitri = graha_maitri_relation(a.moon_rashi, b.moon_rashi);
    r.bhakoot      = bhakoot_dosha(a.moon_rashi, b.moon_rashi);

    if (r.scores.nadi == 0 && opts.allow_nadi_cancellation)
        r.nadi_cancellation =
            nadi_cancellation(a, b, r.scores, opts.nadi_cancellation_rule);

    r.dosha.nadi    = to_flag(r.scores.nadi == 0);
    r.dosha.bhakoot = to_flag(r.scores.bhakoot == 0);

    r.compatibility.sexual_incompatibility = r.yoni == YoniRelation::Enemy;
    r.compatibility.severe_nadi_dosha =
        severe_nadi_dosha(r.scores, r.nadi_cancellation);

    // ── Manglik ─────────────────────────────────────────────────────────────
    const auto ma = manglik_status(a, opts.manglik_policy, prefix_a, r.warnings);
    const auto mb = manglik_status(b, opts.manglik_policy, prefix_b, r.warnings);
    r.manglik = match_manglik(ma, mb);
    r.dosha.manglik = manglik_mismatch(ma.final_status, mb.final_status);

    // ── Dasha ───────────────────────────────────────────────────────────────
    r.dasha = analyze_dasha(a, b, prefix_a, prefix_b, r.warnings);
    r.compatibility.dasha_conflict = r.dasha.conflict;
    r.compatibility.dasha_growth   = r.dasha.growth;

    r.eligibility = evaluate_eligibility(r, opts);
    return r;
}

[[nodiscard]] inline MatchResult
compute_match(const PersonVector& a, const PersonVector& b,
              const MatchOptions& opts = {})
{
    return compute_match(a, b, opts, "person_a", "person_b");
}

}  // namespace gunamilan
