// =============================================================================
// domain_tables.hpp — Frozen attribute tables for nakshatras, rashis and
// planets.
//
// Every table is a constexpr std::array owned by this header and reachable
// only through the accessor functions below.  Completeness and range of each
// table are checked with static_assert, so a missing or out-of-range entry
// fails the build instead of surfacing at runtime.
//
// Tables:
//   kNakshatraGana / kNakshatraNadi / kNakshatraYoni   — 27 entries each
//   kRashiVarna / kRashiLord                            — 12 entries each
//   kNaturalRelation                                    — 9 × 9, directional
// =============================================================================
#pragma once

#include "types.hpp"

#include <array>
#include <cassert>
#include <cstddef>

namespace gunamilan {

// ── Attribute records ───────────────────────────────────────────────────────
struct NakshatraAttributes {
    Gana gana;
    Nadi nadi;
    Yoni yoni;
};

struct RashiAttributes {
    Varna  varna;
    Planet lord;
};

/// Natural (naisargika) relation of one planet towards another.
enum class PlanetRelation : std::uint8_t { Enemy = 0, Neutral = 1, Friend = 2 };

namespace detail {

using G = Gana;
using Y = Yoni;

// ── Nakshatra → Gana ────────────────────────────────────────────────────────
inline constexpr std::array<Gana, kNakshatraCount> kNakshatraGana = {
    G::Deva,     G::Manushya, G::Rakshasa,   // Ashwini  Bharani   Krittika
    G::Manushya, G::Deva,     G::Manushya,   // Rohini   Mrigashira Ardra
    G::Deva,     G::Deva,     G::Rakshasa,   // Punarvasu Pushya   Ashlesha
    G::Rakshasa, G::Manushya, G::Manushya,   // Magha    P.Phalguni U.Phalguni
    G::Deva,     G::Rakshasa, G::Deva,       // Hasta    Chitra    Swati
    G::Rakshasa, G::Deva,     G::Rakshasa,   // Vishakha Anuradha  Jyeshtha
    G::Rakshasa, G::Manushya, G::Manushya,   // Mula     P.Ashadha U.Ashadha
    G::Deva,     G::Rakshasa, G::Rakshasa,   // Shravana Dhanishta Shatabhisha
    G::Manushya, G::Manushya, G::Deva,       // P.Bhadra U.Bhadra  Revati
};

// ── Nakshatra → Nadi ────────────────────────────────────────────────────────
// Aadi, Madhya, Antya repeat in nakshatra order.
[[nodiscard]] constexpr std::array<Nadi, kNakshatraCount> make_nadi_table() {
    std::array<Nadi, kNakshatraCount> t{};
    for (std::size_t i = 0; i < kNakshatraCount; ++i)
        t[i] = static_cast<Nadi>(i % kNadiCount);
    return t;
}
inline constexpr std::array<Nadi, kNakshatraCount> kNakshatraNadi =
    make_nadi_table();

// ── Nakshatra → Yoni ────────────────────────────────────────────────────────
inline constexpr std::array<Yoni, kNakshatraCount> kNakshatraYoni = {
    Y::Horse,   Y::Elephant, Y::Sheep,       // Ashwini  Bharani   Krittika
    Y::Serpent, Y::Serpent,  Y::Dog,         // Rohini   Mrigashira Ardra
    Y::Cat,     Y::Sheep,    Y::Cat,         // Punarvasu Pushya   Ashlesha
    Y::Rat,     Y::Rat,      Y::Cow,         // Magha    P.Phalguni U.Phalguni
    Y::Buffalo, Y::Tiger,    Y::Buffalo,     // Hasta    Chitra    Swati
    Y::Tiger,   Y::Deer,     Y::Deer,        // Vishakha Anuradha  Jyeshtha
    Y::Dog,     Y::Monkey,   Y::Mongoose,    // Mula     P.Ashadha U.Ashadha
    Y::Monkey,  Y::Lion,     Y::Horse,       // Shravana Dhanishta Shatabhisha
    Y::Lion,    Y::Cow,      Y::Elephant,    // P.Bhadra U.Bhadra  Revati
};

// ── Rashi → Varna (water=Brahmin, fire=Kshatriya, earth=Vaishya, air=Shudra)
inline constexpr std::array<Varna, kRashiCount> kRashiVarna = {
    Varna::Kshatriya, Varna::Vaishya, Varna::Shudra,    // Aries Taurus Gemini
    Varna::Brahmin,   Varna::Kshatriya, Varna::Vaishya, // Cancer Leo Virgo
    Varna::Shudra,    Varna::Brahmin, Varna::Kshatriya, // Libra Scorpio Sagittarius
    Varna::Vaishya,   Varna::Shudra,  Varna::Brahmin,   // Capricorn Aquarius Pisces
};

// ── Rashi → ruling planet ───────────────────────────────────────────────────
inline constexpr std::array<Planet, kRashiCount> kRashiLord = {
    Planet::Mars,    Planet::Venus,   Planet::Mercury,  // Aries Taurus Gemini
    Planet::Moon,    Planet::Sun,     Planet::Mercury,  // Cancer Leo Virgo
    Planet::Venus,   Planet::Mars,    Planet::Jupiter,  // Libra Scorpio Sagittarius
    Planet::Saturn,  Planet::Saturn,  Planet::Jupiter,  // Capricorn Aquarius Pisces
};

// ── Natural planetary relations, row = "from", column = "towards" ──────────
// Rahu follows the Saturn-like and Ketu the Mars-like convention.
inline constexpr auto F = PlanetRelation::Friend;
inline constexpr auto N = PlanetRelation::Neutral;
inline constexpr auto E = PlanetRelation::Enemy;

inline constexpr std::array<std::array<PlanetRelation, kPlanetCount>,
                            kPlanetCount> kNaturalRelation = {{
    /*            Su Mo Ma Me Ju Ve Sa Ra Ke */
    /* Sun     */ {F, F, F, N, F, E, E, E, E},
    /* Moon    */ {F, F, N, F, N, N, N, E, E},
    /* Mars    */ {F, F, F, E, F, N, N, E, F},
    /* Mercury */ {F, E, N, F, N, F, N, F, N},
    /* Jupiter */ {F, F, F, E, F, E, N, N, F},
    /* Venus   */ {E, E, N, F, N, F, F, F, N},
    /* Saturn  */ {E, E, E, F, N, F, F, F, N},
    /* Rahu    */ {E, E, E, F, N, F, F, F, E},
    /* Ketu    */ {E, E, F, N, F, N, N, E, F},
}};

// ── Build-time table checks ─────────────────────────────────────────────────
template <typename T, std::size_t M>
constexpr bool all_below(const std::array<T, M>& t, std::size_t limit) {
    for (auto v : t)
        if (static_cast<std::size_t>(v) >= limit) return false;
    return true;
}

template <typename T, std::size_t M>
constexpr std::size_t count_of(const std::array<T, M>& t, T value) {
    std::size_t n = 0;
    for (auto v : t)
        if (v == value) ++n;
    return n;
}

template <typename T, std::size_t M>
constexpr bool every_value_used(const std::array<T, M>& t, std::size_t limit) {
    for (std::size_t v = 0; v < limit; ++v)
        if (count_of(t, static_cast<T>(v)) == 0) return false;
    return true;
}

constexpr bool self_relation_is_friend() {
    for (std::size_t p = 0; p < kPlanetCount; ++p)
        if (kNaturalRelation[p][p] != PlanetRelation::Friend) return false;
    return true;
}

static_assert(all_below(kNakshatraGana, kGanaCount));
static_assert(count_of(kNakshatraGana, Gana::Deva)     == 9 &&
              count_of(kNakshatraGana, Gana::Manushya) == 9 &&
              count_of(kNakshatraGana, Gana::Rakshasa) == 9,
              "each gana governs nine nakshatras");
static_assert(all_below(kNakshatraNadi, kNadiCount));
static_assert(all_below(kNakshatraYoni, kYoniCount));
static_assert(every_value_used(kNakshatraYoni, kYoniCount),
              "every yoni must be reachable from some nakshatra");
static_assert(all_below(kRashiVarna, kVarnaCount));
static_assert(count_of(kRashiVarna, Varna::Brahmin) == 3 &&
              count_of(kRashiVarna, Varna::Shudra)  == 3);
static_assert(all_below(kRashiLord, kSignLordCount),
              "sign lords are restricted to the seven visible planets");
static_assert(self_relation_is_friend());

}  // namespace detail

// ── Accessors ───────────────────────────────────────────────────────────────

[[nodiscard]] constexpr NakshatraAttributes
nakshatra_attributes(Nakshatra n) noexcept {
    assert(is_valid(n));
    const auto i = index_of(n);
    return {detail::kNakshatraGana[i], detail::kNakshatraNadi[i],
            detail::kNakshatraYoni[i]};
}

[[nodiscard]] constexpr RashiAttributes rashi_attributes(Rashi r) noexcept {
    assert(is_valid(r));
    const auto i = index_of(r);
    return {detail::kRashiVarna[i], detail::kRashiLord[i]};
}

[[nodiscard]] constexpr Gana gana_of(Nakshatra n) noexcept {
    return nakshatra_attributes(n).gana;
}
[[nodiscard]] constexpr Nadi nadi_of(Nakshatra n) noexcept {
    return nakshatra_attributes(n).nadi;
}
[[nodiscard]] constexpr Yoni yoni_of(Nakshatra n) noexcept {
    return nakshatra_attributes(n).yoni;
}
[[nodiscard]] constexpr Varna varna_of(Rashi r) noexcept {
    return rashi_attributes(r).varna;
}
[[nodiscard]] constexpr Planet lord_of(Rashi r) noexcept {
    return rashi_attributes(r).lord;
}

/// How `from` regards `towards`.  Directional: Moon is a friend of Mercury
/// while Mercury treats the Moon as an enemy.
[[nodiscard]] constexpr PlanetRelation
natural_relation(Planet from, Planet towards) noexcept {
    assert(is_valid(from) && is_valid(towards));
    return detail::kNaturalRelation[index_of(from)][index_of(towards)];
}

}  // namespace gunamilan
