// =============================================================================
// manglik.hpp — Manglik (Kuja) dosha detection, cancellation and matching.
//
// Pipeline for one chart:
//
//   mars_house ──► per-reference checks (Lagna, Moon, Venus)
//              ──► raw status under a ManglikPolicy
//              ──► mars_cancellation(house, mars sign, lagna sign)
//              ──► final status + severity
//
// Two charts are Manglik-compatible when their final statuses agree.  An
// absent mars_house makes the status Unknown; it is never treated as "not
// Manglik".
// =============================================================================
#pragma once

#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace gunamilan {

inline constexpr int kManglikMismatchPenalty = 4;

/// How the per-reference checks combine into the raw status.
enum class ManglikPolicy : std::uint8_t {
    LagnaOnly,      // house counted from the ascendant only
    AnyReference,   // Lagna OR Moon OR Venus
    Majority        // at least two of the available references
};

enum class MarsCancellation : std::uint8_t {
    None,
    OwnSign,        // Mars in Aries or Scorpio
    Exalted,        // Mars in Capricorn
    LagnaSign,      // Mars in the first house, in the lagna sign
    Debilitated     // Mars in Cancer: softens, does not cancel
};

enum class ManglikSeverity : std::uint8_t { None, Mild, Full };

// ── House arithmetic ────────────────────────────────────────────────────────
[[nodiscard]] constexpr bool is_manglik_house(House h) noexcept {
    switch (h) {
        case House::First:  case House::Second: case House::Fourth:
        case House::Seventh: case House::Eighth: case House::Twelfth:
            return true;
        default:
            return false;
    }
}

/// House of `mars` counted with `ref` as the first house.
[[nodiscard]] constexpr House relative_house(House mars, House ref) noexcept {
    const std::size_t m = index_of(mars);
    const std::size_t r = index_of(ref);
    return static_cast<House>((m + kHouseCount - r) % kHouseCount + 1);
}

[[nodiscard]] constexpr bool relative_manglik(House mars, House ref) noexcept {
    return is_manglik_house(relative_house(mars, ref));
}

/// Whole-sign house occupied by the Moon, counted from the ascendant.
[[nodiscard]] constexpr House moon_house(const PersonVector& p) noexcept {
    const std::size_t d =
        (index_of(p.moon_rashi) + kRashiCount - index_of(p.ascendant)) % kRashiCount;
    return static_cast<House>(d + 1);
}

// ── Cancellation ────────────────────────────────────────────────────────────
[[nodiscard]] constexpr MarsCancellation
mars_cancellation(House mars_house, Rashi mars_rashi, Rashi lagna) noexcept {
    if (mars_rashi == Rashi::Aries || mars_rashi == Rashi::Scorpio)
        return MarsCancellation::OwnSign;
    if (mars_rashi == Rashi::Capricorn)
        return MarsCancellation::Exalted;
    if (mars_house == House::First && mars_rashi == lagna)
        return MarsCancellation::LagnaSign;
    if (mars_rashi == Rashi::Cancer)
        return MarsCancellation::Debilitated;
    return MarsCancellation::None;
}

[[nodiscard]] constexpr bool manglik_cancelled(MarsCancellation c) noexcept {
    return c == MarsCancellation::OwnSign || c == MarsCancellation::Exalted ||
           c == MarsCancellation::LagnaSign;
}

[[nodiscard]] constexpr bool manglik_cancelled(House mars_house, Rashi mars_rashi,
                                               Rashi lagna) noexcept {
    return manglik_cancelled(mars_cancellation(mars_house, mars_rashi, lagna));
}

// ── Per-chart status ────────────────────────────────────────────────────────

/// Per-reference results; Unknown where the reference could not be computed.
struct ManglikReferences {
    Flag lagna = Flag::Unknown;
    Flag moon  = Flag::Unknown;
    Flag venus = Flag::Unknown;
};

struct ManglikStatus {
    ManglikReferences references;
    Flag              raw          = Flag::Unknown;
    MarsCancellation  cancellation = MarsCancellation::None;
    Flag              final_status = Flag::Unknown;
    ManglikSeverity   severity     = ManglikSeverity::None;
};

namespace detail {

[[nodiscard]] constexpr Flag combine_references(const ManglikReferences& r,
                                                ManglikPolicy policy) noexcept {
    if (policy == ManglikPolicy::LagnaOnly) return r.lagna;

    std::size_t yes = 0;
    std::size_t known = 0;
    for (Flag f : {r.lagna, r.moon, r.venus}) {
        if (!is_known(f)) continue;
        ++known;
        if (f == Flag::Yes) ++yes;
    }
    if (known == 0) return Flag::Unknown;
    if (policy == ManglikPolicy::AnyReference) return to_flag(yes >= 1);
    return to_flag(yes >= 2);
}

}  // namespace detail

/// Evaluate one chart.  Missing inputs are appended to `warnings` under
/// `prefix` (e.g. "person_a").
[[nodiscard]] inline ManglikStatus
manglik_status(const PersonVector& p, ManglikPolicy policy,
               std::string_view prefix,
               std::vector<IncompleteInputWarning>& warnings)
{
    const auto field = [&](const char* name) {
        return std::string(prefix) + "." + name;
    };

    ManglikStatus s;
    if (!p.mars_house) {
        warnings.push_back({field("mars_house")});
        return s;
    }

    const House mars = *p.mars_house;
    s.references.lagna = to_flag(relative_manglik(mars, House::First));
    s.references.moon  = to_flag(relative_manglik(mars, moon_house(p)));
    if (p.venus_house) {
        s.references.venus = to_flag(relative_manglik(mars, *p.venus_house));
    } else if (policy != ManglikPolicy::LagnaOnly) {
        warnings.push_back({field("venus_house")});
    }

    s.raw = detail::combine_references(s.references, policy);
    if (s.raw != Flag::Yes) {
        s.final_status = s.raw;
        return s;
    }

    if (p.mars_rashi) {
        s.cancellation = mars_cancellation(mars, *p.mars_rashi, p.ascendant);
    } else {
        warnings.push_back({field("mars_rashi")});
    }

    if (manglik_cancelled(s.cancellation)) {
        s.final_status = Flag::No;
    } else {
        s.final_status = Flag::Yes;
        s.severity = s.cancellation == MarsCancellation::Debilitated
                         ? ManglikSeverity::Mild
                         : ManglikSeverity::Full;
    }
    return s;
}

// ── Pair matching ───────────────────────────────────────────────────────────

/// Both statuses known and different.
[[nodiscard]] constexpr Flag manglik_mismatch(Flag a, Flag b) noexcept {
    if (!is_known(a) || !is_known(b)) return Flag::Unknown;
    return to_flag(a != b);
}

[[nodiscard]] constexpr int manglik_penalty(Flag a, Flag b) noexcept {
    return manglik_mismatch(a, b) == Flag::Yes ? kManglikMismatchPenalty : 0;
}

struct ManglikMatch {
    ManglikStatus a;
    ManglikStatus b;
    Flag          compatible = Flag::Unknown;
    int           penalty    = 0;
};

[[nodiscard]] inline ManglikMatch
match_manglik(const ManglikStatus& a, const ManglikStatus& b) noexcept {
    ManglikMatch m{a, b};
    const Flag mismatch = manglik_mismatch(a.final_status, b.final_status);
    m.compatible = is_known(mismatch) ? to_flag(mismatch == Flag::No)
                                      : Flag::Unknown;
    m.penalty = manglik_penalty(a.final_status, b.final_status);
    return m;
}

}  // namespace gunamilan
