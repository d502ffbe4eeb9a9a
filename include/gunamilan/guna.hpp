// =============================================================================
// guna.hpp — Guna total, verdict bands and Nadi dosha cancellation.
// =============================================================================
#pragma once

#include "koota.hpp"
#include "types.hpp"

#include <cstdint>

namespace gunamilan {

enum class Verdict : std::uint8_t { Unfavorable, Acceptable, Good, Excellent };

inline constexpr int kAcceptableMin = 18;
inline constexpr int kGoodMin       = 25;
inline constexpr int kExcellentMin  = 33;

static_assert(0 < kAcceptableMin && kAcceptableMin < kGoodMin &&
              kGoodMin < kExcellentMin && kExcellentMin <= kMaxGuna);

/// Step function over [0, 36].
[[nodiscard]] constexpr Verdict verdict_for(int total_guna) noexcept {
    if (total_guna >= kExcellentMin)  return Verdict::Excellent;
    if (total_guna >= kGoodMin)       return Verdict::Good;
    if (total_guna >= kAcceptableMin) return Verdict::Acceptable;
    return Verdict::Unfavorable;
}

[[nodiscard]] constexpr const char* verdict_name(Verdict v) noexcept {
    switch (v) {
        case Verdict::Unfavorable: return "Unfavorable";
        case Verdict::Acceptable:  return "Acceptable";
        case Verdict::Good:        return "Good";
        case Verdict::Excellent:   return "Excellent";
    }
    return "?";
}

// ── Nadi cancellation ───────────────────────────────────────────────────────
// Two rule sets decide whether a zero Nadi score is exempt from dosha:
//
//   SignAndStar  same rashi with different nakshatras, or the same nakshatra
//                with different rashis.  Identical charts are never exempt.
//   StrongMatch  total_guna >= 28, or Graha Maitri at its maximum, or the
//                same nakshatra.  Checked in that order.

enum class NadiCancellationRule : std::uint8_t { SignAndStar, StrongMatch };

enum class NadiCancellation : std::uint8_t {
    None,
    SameRashiDifferentNakshatra,
    SameNakshatraDifferentRashi,
    HighTotal,
    GrahaMaitriFriendship,
    SameNakshatra
};

inline constexpr int kNadiCancelMinTotal = 28;

static_assert(kNadiCancelMinTotal <= kMaxGuna - kNadiMax);

/// Reason a same-Nadi pairing is exempt from dosha, or None.  Only
/// meaningful when the two nakshatras share a Nadi.
[[nodiscard]] constexpr NadiCancellation
nadi_cancellation(const PersonVector& a, const PersonVector& b) noexcept {
    const bool same_rashi = a.moon_rashi == b.moon_rashi;
    const bool same_nak   = a.moon_nakshatra == b.moon_nakshatra;
    if (same_rashi && !same_nak) return NadiCancellation::SameRashiDifferentNakshatra;
    if (same_nak && !same_rashi) return NadiCancellation::SameNakshatraDifferentRashi;
    return NadiCancellation::None;
}

[[nodiscard]] constexpr NadiCancellation
nadi_cancellation(const PersonVector& a, const PersonVector& b,
                  const KootaScoreVector& s, NadiCancellationRule rule) noexcept {
    if (rule == NadiCancellationRule::SignAndStar) return nadi_cancellation(a, b);

    if (s.total_guna() >= kNadiCancelMinTotal) return NadiCancellation::HighTotal;
    if (s.graha_maitri >= kGrahaMaitriMax)     return NadiCancellation::GrahaMaitriFriendship;
    if (a.moon_nakshatra == b.moon_nakshatra)  return NadiCancellation::SameNakshatra;
    return NadiCancellation::None;
}

/// Nadi scored zero and no cancellation rule rescues it.
[[nodiscard]] constexpr bool severe_nadi_dosha(const KootaScoreVector& s,
                                               NadiCancellation c) noexcept {
    return s.nadi == 0 && c == NadiCancellation::None;
}

}  // namespace gunamilan
