// =============================================================================
// types.hpp — Core enums, records and error types for the Guna Milan engine.
//
// Every finite domain (nakshatra, rashi, gana, …) is an enum class with a
// fixed 8-bit underlying type.  Values outside the declared range can only be
// produced by a cast from raw integers; such values are rejected by
// validate_person() before any table lookup happens.
// =============================================================================
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace gunamilan {

// ── Lunar mansions (0–26) ───────────────────────────────────────────────────
enum class Nakshatra : std::uint8_t {
    Ashwini = 0, Bharani, Krittika,
    Rohini, Mrigashira, Ardra,
    Punarvasu, Pushya, Ashlesha,
    Magha, PurvaPhalguni, UttaraPhalguni,
    Hasta, Chitra, Swati,
    Vishakha, Anuradha, Jyeshtha,
    Mula, PurvaAshadha, UttaraAshadha,
    Shravana, Dhanishta, Shatabhisha,
    PurvaBhadrapada, UttaraBhadrapada, Revati
};
inline constexpr std::size_t kNakshatraCount = 27;

// ── Zodiac signs (0–11) ─────────────────────────────────────────────────────
enum class Rashi : std::uint8_t {
    Aries = 0, Taurus, Gemini, Cancer, Leo, Virgo,
    Libra, Scorpio, Sagittarius, Capricorn, Aquarius, Pisces
};
inline constexpr std::size_t kRashiCount = 12;

// ── Temperament (0–2) ───────────────────────────────────────────────────────
enum class Gana : std::uint8_t { Deva = 0, Manushya = 1, Rakshasa = 2 };
inline constexpr std::size_t kGanaCount = 3;

// ── Pulse / humor (0–2) ─────────────────────────────────────────────────────
enum class Nadi : std::uint8_t { Aadi = 0, Madhya = 1, Antya = 2 };
inline constexpr std::size_t kNadiCount = 3;

// ── Varna, ordered by rank: Shudra < Vaishya < Kshatriya < Brahmin ──────────
enum class Varna : std::uint8_t {
    Shudra = 0, Vaishya = 1, Kshatriya = 2, Brahmin = 3
};
inline constexpr std::size_t kVarnaCount = 4;

// ── Yoni animal natures (0–13) ──────────────────────────────────────────────
enum class Yoni : std::uint8_t {
    Horse = 0, Elephant, Sheep, Serpent, Dog, Cat, Rat,
    Cow, Buffalo, Tiger, Deer, Monkey, Mongoose, Lion
};
inline constexpr std::size_t kYoniCount = 14;

// ── Navagraha (0–8) ─────────────────────────────────────────────────────────
// The first seven are the classical sign lords; Rahu and Ketu only appear as
// dasha lords.
enum class Planet : std::uint8_t {
    Sun = 0, Moon, Mars, Mercury, Jupiter, Venus, Saturn, Rahu, Ketu
};
inline constexpr std::size_t kPlanetCount     = 9;
inline constexpr std::size_t kSignLordCount   = 7;

// ── House position relative to the ascendant (1–12) ─────────────────────────
enum class House : std::uint8_t {
    First = 1, Second, Third, Fourth, Fifth, Sixth,
    Seventh, Eighth, Ninth, Tenth, Eleventh, Twelfth
};
inline constexpr std::size_t kHouseCount = 12;

// ── Tri-state flag ──────────────────────────────────────────────────────────
// Unknown means "required optional input was absent"; it is never folded
// into No.
enum class Flag : std::uint8_t { No = 0, Yes = 1, Unknown = 2 };

[[nodiscard]] constexpr Flag to_flag(bool b) noexcept {
    return b ? Flag::Yes : Flag::No;
}

[[nodiscard]] constexpr bool is_known(Flag f) noexcept {
    return f != Flag::Unknown;
}

// ── Domain checks ───────────────────────────────────────────────────────────
[[nodiscard]] constexpr bool is_valid(Nakshatra n) noexcept {
    return static_cast<std::size_t>(n) < kNakshatraCount;
}
[[nodiscard]] constexpr bool is_valid(Rashi r) noexcept {
    return static_cast<std::size_t>(r) < kRashiCount;
}
[[nodiscard]] constexpr bool is_valid(Planet p) noexcept {
    return static_cast<std::size_t>(p) < kPlanetCount;
}
[[nodiscard]] constexpr bool is_valid(House h) noexcept {
    const auto v = static_cast<std::size_t>(h);
    return v >= 1 && v <= kHouseCount;
}

/// Underlying index of any domain enum.
template <typename E>
[[nodiscard]] constexpr std::size_t index_of(E e) noexcept {
    return static_cast<std::size_t>(e);
}

// ── PersonVector ────────────────────────────────────────────────────────────
/// Chart indices for one person, as produced by the ephemeris collaborator.
/// Only the first three members are mandatory; every optional that is absent
/// downgrades the flags that depend on it to Flag::Unknown.
struct PersonVector {
    Nakshatra moon_nakshatra = Nakshatra::Ashwini;
    Rashi     moon_rashi     = Rashi::Aries;
    Rashi     ascendant      = Rashi::Aries;   // lagna sign

    std::optional<House>  mars_house;
    std::optional<Rashi>  mars_rashi;          // enables sign-based cancellation
    std::optional<House>  jupiter_house;
    std::optional<House>  venus_house;
    std::optional<House>  saturn_house;

    std::optional<Planet> dasha_lord;          // current maha dasha
    std::optional<Planet> sub_dasha_lord;      // current antar dasha
};

// ── Errors and warnings ─────────────────────────────────────────────────────

/// A mandatory (or present optional) field holds a value outside its domain.
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(std::string field)
        : std::invalid_argument("value out of domain: " + field),
          field_(std::move(field))
    {}

    [[nodiscard]] const std::string& field() const noexcept { return field_; }

private:
    std::string field_;
};

/// An optional input needed by some derived flag was absent.
struct IncompleteInputWarning {
    std::string field;

    friend bool operator==(const IncompleteInputWarning&,
                           const IncompleteInputWarning&) = default;
};

}  // namespace gunamilan
