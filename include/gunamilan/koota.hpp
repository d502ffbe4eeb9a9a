// =============================================================================
// koota.hpp — The eight Ashtakoota scorers.
//
// Each scorer is a pure constexpr function of two chart attributes.  Person A
// takes the groom-analog role; only Varna and Tara are direction-sensitive,
// every other factor is symmetric in its arguments.
//
//   Koota          input        max
//   ─────────────  ───────────  ───
//   Varna          moon rashi    1
//   Vashya         moon rashi    2
//   Tara           nakshatra     3
//   Yoni           nakshatra     4
//   Graha Maitri   moon rashi    5
//   Gana           nakshatra     6
//   Bhakoot        moon rashi    7
//   Nadi           nakshatra     8
// =============================================================================
#pragma once

#include "domain_tables.hpp"
#include "types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>

namespace gunamilan {

inline constexpr int kVarnaMax       = 1;
inline constexpr int kVashyaMax      = 2;
inline constexpr int kTaraMax        = 3;
inline constexpr int kYoniMax        = 4;
inline constexpr int kGrahaMaitriMax = 5;
inline constexpr int kGanaMax        = 6;
inline constexpr int kBhakootMax     = 7;
inline constexpr int kNadiMax        = 8;
inline constexpr int kMaxGuna        = 36;

static_assert(kVarnaMax + kVashyaMax + kTaraMax + kYoniMax + kGrahaMaitriMax +
              kGanaMax + kBhakootMax + kNadiMax == kMaxGuna);

// ── Explanation enums ───────────────────────────────────────────────────────

/// Position of B's nakshatra counted from A's, modulo nine.
enum class TaraCategory : std::uint8_t {
    Janma = 0, Sampat, Vipat, Kshema, Pratyak,
    Sadhaka, Naidhana, Mitra, ParamaMitra
};

/// Yoni relation; the enumerator value is the score.
enum class YoniRelation : std::uint8_t {
    Enemy = 0, Unfriendly = 1, Neutral = 2, Friendly = 3, Same = 4
};

enum class GrahaMaitriRelation : std::uint8_t {
    SameLord, MutualFriend, OneSided, MutualNeutral, Mixed, MutualEnemy
};

enum class BhakootDosha : std::uint8_t {
    None,
    Dwirdwadasha,   // 2/12 placement
    Shadashtaka     // 6/8 placement
};

namespace detail {

// ── Vashya, symmetric 12 × 12 ───────────────────────────────────────────────
inline constexpr std::array<std::array<std::uint8_t, kRashiCount>,
                            kRashiCount> kVashya = {{
    /*          Ar Ta Ge Cn Le Vi Li Sc Sg Cp Aq Pi */
    /* Ar */   {2, 1, 0, 0, 0, 1, 0, 0, 1, 1, 0, 0},
    /* Ta */   {1, 2, 1, 0, 1, 1, 0, 0, 0, 1, 0, 0},
    /* Ge */   {0, 1, 2, 1, 0, 1, 1, 0, 0, 0, 1, 0},
    /* Cn */   {0, 0, 1, 2, 0, 0, 1, 0, 0, 0, 0, 1},
    /* Le */   {0, 1, 0, 0, 2, 1, 0, 1, 0, 0, 0, 0},
    /* Vi */   {1, 1, 1, 0, 1, 2, 1, 0, 0, 1, 0, 0},
    /* Li */   {0, 0, 1, 1, 0, 1, 2, 0, 0, 0, 1, 0},
    /* Sc */   {0, 0, 0, 0, 1, 0, 0, 2, 1, 0, 0, 0},
    /* Sg */   {1, 0, 0, 0, 0, 0, 0, 1, 2, 1, 0, 0},
    /* Cp */   {1, 1, 0, 0, 0, 1, 0, 0, 1, 2, 0, 0},
    /* Aq */   {0, 0, 1, 0, 0, 0, 1, 0, 0, 0, 2, 1},
    /* Pi */   {0, 0, 0, 1, 0, 0, 0, 0, 0, 0, 1, 2},
}};

// ── Yoni, symmetric 14 × 14 ─────────────────────────────────────────────────
inline constexpr std::array<std::array<std::uint8_t, kYoniCount>,
                            kYoniCount> kYoni = {{
    /*           Ho El Sh Se Do Ca Ra Co Bu Ti De Mo Mg Li */
    /* Horse  */ {4, 2, 2, 3, 2, 2, 2, 1, 0, 1, 3, 3, 2, 1},
    /* Eleph. */ {2, 4, 3, 3, 2, 2, 2, 2, 3, 1, 2, 3, 2, 0},
    /* Sheep  */ {2, 3, 4, 2, 1, 2, 1, 3, 3, 1, 2, 0, 3, 1},
    /* Serp.  */ {3, 3, 2, 4, 2, 1, 1, 1, 1, 2, 2, 2, 0, 2},
    /* Dog    */ {2, 2, 1, 2, 4, 2, 1, 2, 2, 1, 0, 2, 1, 1},
    /* Cat    */ {2, 2, 2, 1, 2, 4, 0, 2, 2, 1, 3, 3, 2, 1},
    /* Rat    */ {2, 2, 1, 1, 1, 0, 4, 2, 2, 2, 2, 2, 1, 2},
    /* Cow    */ {1, 2, 3, 1, 2, 2, 2, 4, 3, 0, 3, 2, 2, 1},
    /* Buff.  */ {0, 3, 3, 1, 2, 2, 2, 3, 4, 1, 2, 2, 2, 1},
    /* Tiger  */ {1, 1, 1, 2, 1, 1, 2, 0, 1, 4, 1, 1, 2, 1},
    /* Deer   */ {3, 2, 2, 2, 0, 3, 2, 3, 2, 1, 4, 2, 2, 1},
    /* Monkey */ {3, 3, 0, 2, 2, 3, 2, 2, 2, 1, 2, 4, 3, 2},
    /* Mong.  */ {2, 2, 3, 0, 1, 2, 1, 2, 2, 2, 2, 3, 4, 2},
    /* Lion   */ {1, 0, 1, 2, 1, 1, 2, 1, 1, 1, 1, 2, 2, 4},
}};

// ── Gana, symmetric 3 × 3 ───────────────────────────────────────────────────
inline constexpr std::array<std::array<std::uint8_t, kGanaCount>,
                            kGanaCount> kGana = {{
    /*             De Ma Ra */
    /* Deva     */ {6, 5, 1},
    /* Manushya */ {5, 6, 1},
    /* Rakshasa */ {1, 1, 6},
}};

inline constexpr std::array<bool, 9> kTaraAuspicious = {
    false, true, false, true, false, true, false, true, true,
};

template <std::size_t M>
constexpr bool is_symmetric(
    const std::array<std::array<std::uint8_t, M>, M>& t) {
    for (std::size_t i = 0; i < M; ++i)
        for (std::size_t j = 0; j < M; ++j)
            if (t[i][j] != t[j][i]) return false;
    return true;
}

template <std::size_t M>
constexpr bool max_only_on_diagonal(
    const std::array<std::array<std::uint8_t, M>, M>& t, std::uint8_t top) {
    for (std::size_t i = 0; i < M; ++i)
        for (std::size_t j = 0; j < M; ++j)
            if ((t[i][j] == top) != (i == j)) return false;
    return true;
}

template <std::size_t M>
constexpr bool cells_at_most(
    const std::array<std::array<std::uint8_t, M>, M>& t, std::uint8_t top) {
    for (const auto& row : t)
        for (auto v : row)
            if (v > top) return false;
    return true;
}

static_assert(is_symmetric(kVashya) && cells_at_most(kVashya, kVashyaMax));
static_assert(is_symmetric(kYoni) && cells_at_most(kYoni, kYoniMax));
static_assert(max_only_on_diagonal(kYoni, kYoniMax),
              "Same relation is reserved for identical yonis");
static_assert(is_symmetric(kGana) && cells_at_most(kGana, kGanaMax));

}  // namespace detail

// ── Varna ───────────────────────────────────────────────────────────────────
[[nodiscard]] constexpr int varna_score(Rashi a, Rashi b) noexcept {
    return index_of(varna_of(a)) >= index_of(varna_of(b)) ? kVarnaMax : 0;
}

// ── Vashya ──────────────────────────────────────────────────────────────────
[[nodiscard]] constexpr int vashya_score(Rashi a, Rashi b) noexcept {
    return detail::kVashya[index_of(a)][index_of(b)];
}

// ── Tara ────────────────────────────────────────────────────────────────────
[[nodiscard]] constexpr TaraCategory tara_category(Nakshatra a,
                                                   Nakshatra b) noexcept {
    const std::size_t d =
        (index_of(a) + kNakshatraCount - index_of(b)) % kNakshatraCount;
    return static_cast<TaraCategory>(d % 9);
}

[[nodiscard]] constexpr int tara_score(Nakshatra a, Nakshatra b) noexcept {
    return detail::kTaraAuspicious[index_of(tara_category(a, b))] ? kTaraMax : 0;
}

// ── Yoni ────────────────────────────────────────────────────────────────────
[[nodiscard]] constexpr YoniRelation yoni_relation(Yoni a, Yoni b) noexcept {
    return static_cast<YoniRelation>(detail::kYoni[index_of(a)][index_of(b)]);
}

[[nodiscard]] constexpr YoniRelation yoni_relation(Nakshatra a,
                                                   Nakshatra b) noexcept {
    return yoni_relation(yoni_of(a), yoni_of(b));
}

[[nodiscard]] constexpr int yoni_score(Nakshatra a, Nakshatra b) noexcept {
    return static_cast<int>(yoni_relation(a, b));
}

// ── Graha Maitri ────────────────────────────────────────────────────────────
[[nodiscard]] constexpr GrahaMaitriRelation
graha_maitri_relation(Rashi a, Rashi b) noexcept {
    const Planet la = lord_of(a);
    const Planet lb = lord_of(b);
    if (la == lb) return GrahaMaitriRelation::SameLord;

    const auto ab = natural_relation(la, lb);
    const auto ba = natural_relation(lb, la);
    const int friends = (ab == PlanetRelation::Friend) + (ba == PlanetRelation::Friend);
    const int enemies = (ab == PlanetRelation::Enemy) + (ba == PlanetRelation::Enemy);

    if (friends == 2) return GrahaMaitriRelation::MutualFriend;
    if (enemies == 2) return GrahaMaitriRelation::MutualEnemy;
    if (enemies == 1) return GrahaMaitriRelation::Mixed;
    if (friends == 1) return GrahaMaitriRelation::OneSided;
    return GrahaMaitriRelation::MutualNeutral;
}

[[nodiscard]] constexpr int graha_maitri_score(Rashi a, Rashi b) noexcept {
    switch (graha_maitri_relation(a, b)) {
        case GrahaMaitriRelation::SameLord:
        case GrahaMaitriRelation::MutualFriend:  return 5;
        case GrahaMaitriRelation::OneSided:      return 4;
        case GrahaMaitriRelation::MutualNeutral: return 3;
        case GrahaMaitriRelation::Mixed:         return 1;
        case GrahaMaitriRelation::MutualEnemy:   return 0;
    }
    return 0;
}

// ── Gana ────────────────────────────────────────────────────────────────────
[[nodiscard]] constexpr int gana_score(Gana a, Gana b) noexcept {
    return detail::kGana[index_of(a)][index_of(b)];
}

[[nodiscard]] constexpr int gana_score(Nakshatra a, Nakshatra b) noexcept {
    return gana_score(gana_of(a), gana_of(b));
}

// ── Bhakoot ─────────────────────────────────────────────────────────────────
[[nodiscard]] constexpr BhakootDosha bhakoot_dosha(Rashi a, Rashi b) noexcept {
    const std::size_t d = (index_of(a) + kRashiCount - index_of(b)) % kRashiCount;
    if (d == 1 || d == 11) return BhakootDosha::Dwirdwadasha;
    if (d == 5 || d == 7)  return BhakootDosha::Shadashtaka;
    return BhakootDosha::None;
}

[[nodiscard]] constexpr int bhakoot_score(Rashi a, Rashi b) noexcept {
    return bhakoot_dosha(a, b) == BhakootDosha::None ? kBhakootMax : 0;
}

// ── Nadi ────────────────────────────────────────────────────────────────────
[[nodiscard]] constexpr bool same_nadi(Nakshatra a, Nakshatra b) noexcept {
    return nadi_of(a) == nadi_of(b);
}

[[nodiscard]] constexpr int nadi_score(Nakshatra a, Nakshatra b) noexcept {
    return same_nadi(a, b) ? 0 : kNadiMax;
}

// ── Score vector ────────────────────────────────────────────────────────────

/// The eight subscores of one pairing.  The total is always derived.
struct KootaScoreVector {
    int varna        = 0;
    int vashya       = 0;
    int tara         = 0;
    int yoni         = 0;
    int graha_maitri = 0;
    int gana         = 0;
    int bhakoot      = 0;
    int nadi         = 0;

    [[nodiscard]] constexpr int total_guna() const noexcept {
        return varna + vashya + tara + yoni + graha_maitri + gana + bhakoot +
               nadi;
    }

    friend bool operator==(const KootaScoreVector&,
                           const KootaScoreVector&) = default;
};

/// Run all eight scorers.  Inputs must already be validated.
[[nodiscard]] constexpr KootaScoreVector
score_kootas(const PersonVector& a, const PersonVector& b) noexcept {
    KootaScoreVector s;
    s.varna        = varna_score(a.moon_rashi, b.moon_rashi);
    s.vashya       = vashya_score(a.moon_rashi, b.moon_rashi);
    s.tara         = tara_score(a.moon_nakshatra, b.moon_nakshatra);
    s.yoni         = yoni_score(a.moon_nakshatra, b.moon_nakshatra);
    s.graha_maitri = graha_maitri_score(a.moon_rashi, b.moon_rashi);
    s.gana         = gana_score(a.moon_nakshatra, b.moon_nakshatra);
    s.bhakoot      = bhakoot_score(a.moon_rashi, b.moon_rashi);
    s.nadi         = nadi_score(a.moon_nakshatra, b.moon_nakshatra);
    return s;
}

}  // namespace gunamilan
