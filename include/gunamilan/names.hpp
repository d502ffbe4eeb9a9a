// =============================================================================
// names.hpp — Canonical display names and name → index parsing.
//
// The ephemeris layer and the TSV reader exchange charts either as indices or
// as canonical names ("Purva Phalguni", "Scorpio", "Rahu").  Parsing ignores
// case, spaces, '-' and '_', and also accepts a plain decimal index.
// =============================================================================
#pragma once

#include "domain_tables.hpp"
#include "types.hpp"

#include <array>
#include <cctype>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace gunamilan {

namespace detail {

inline constexpr std::array<std::string_view, kNakshatraCount> kNakshatraNames = {
    "Ashwini", "Bharani", "Krittika", "Rohini", "Mrigashira", "Ardra",
    "Punarvasu", "Pushya", "Ashlesha", "Magha", "Purva Phalguni",
    "Uttara Phalguni", "Hasta", "Chitra", "Swati", "Vishakha", "Anuradha",
    "Jyeshtha", "Mula", "Purva Ashadha", "Uttara Ashadha", "Shravana",
    "Dhanishta", "Shatabhisha", "Purva Bhadrapada", "Uttara Bhadrapada",
    "Revati",
};

inline constexpr std::array<std::string_view, kRashiCount> kRashiNames = {
    "Aries", "Taurus", "Gemini", "Cancer", "Leo", "Virgo",
    "Libra", "Scorpio", "Sagittarius", "Capricorn", "Aquarius", "Pisces",
};

inline constexpr std::array<std::string_view, kPlanetCount> kPlanetNames = {
    "Sun", "Moon", "Mars", "Mercury", "Jupiter", "Venus", "Saturn",
    "Rahu", "Ketu",
};

inline constexpr std::array<std::string_view, kGanaCount> kGanaNames = {
    "Deva", "Manushya", "Rakshasa",
};

inline constexpr std::array<std::string_view, kNadiCount> kNadiNames = {
    "Aadi", "Madhya", "Antya",
};

inline constexpr std::array<std::string_view, kVarnaCount> kVarnaNames = {
    "Shudra", "Vaishya", "Kshatriya", "Brahmin",
};

inline constexpr std::array<std::string_view, kYoniCount> kYoniNames = {
    "Horse", "Elephant", "Sheep", "Serpent", "Dog", "Cat", "Rat",
    "Cow", "Buffalo", "Tiger", "Deer", "Monkey", "Mongoose", "Lion",
};

/// Lower-case and drop separators so "Purva Phalguni" == "purva_phalguni".
inline std::string fold_name(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == ' ' || c == '-' || c == '_' || c == '\t') continue;
        out.push_back(static_cast<char>(
            std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

inline std::optional<std::size_t> parse_index(std::string_view s) {
    if (s.empty() || s.size() > 3) return std::nullopt;
    std::size_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return std::nullopt;
        v = v * 10 + static_cast<std::size_t>(c - '0');
    }
    return v;
}

template <std::size_t M>
std::optional<std::size_t>
lookup_name(const std::array<std::string_view, M>& names, std::string_view s) {
    if (auto idx = parse_index(s)) {
        if (*idx < M) return idx;
        return std::nullopt;
    }
    const std::string key = fold_name(s);
    for (std::size_t i = 0; i < M; ++i)
        if (fold_name(names[i]) == key) return i;
    return std::nullopt;
}

}  // namespace detail

// ── Display names ───────────────────────────────────────────────────────────
[[nodiscard]] constexpr std::string_view name(Nakshatra n) noexcept {
    return is_valid(n) ? detail::kNakshatraNames[index_of(n)] : "?";
}
[[nodiscard]] constexpr std::string_view name(Rashi r) noexcept {
    return is_valid(r) ? detail::kRashiNames[index_of(r)] : "?";
}
[[nodiscard]] constexpr std::string_view name(Planet p) noexcept {
    return is_valid(p) ? detail::kPlanetNames[index_of(p)] : "?";
}
[[nodiscard]] constexpr std::string_view name(Gana g) noexcept {
    return detail::kGanaNames[index_of(g)];
}
[[nodiscard]] constexpr std::string_view name(Nadi n) noexcept {
    return detail::kNadiNames[index_of(n)];
}
[[nodiscard]] constexpr std::string_view name(Varna v) noexcept {
    return detail::kVarnaNames[index_of(v)];
}
[[nodiscard]] constexpr std::string_view name(Yoni y) noexcept {
    return detail::kYoniNames[index_of(y)];
}
[[nodiscard]] constexpr std::string_view name(Flag f) noexcept {
    switch (f) {
        case Flag::No:  return "no";
        case Flag::Yes: return "yes";
        default:        return "unknown";
    }
}

// ── Parsing ─────────────────────────────────────────────────────────────────
[[nodiscard]] inline std::optional<Nakshatra> parse_nakshatra(std::string_view s) {
    if (auto i = detail::lookup_name(detail::kNakshatraNames, s))
        return static_cast<Nakshatra>(*i);
    return std::nullopt;
}

[[nodiscard]] inline std::optional<Rashi> parse_rashi(std::string_view s) {
    if (auto i = detail::lookup_name(detail::kRashiNames, s))
        return static_cast<Rashi>(*i);
    return std::nullopt;
}

[[nodiscard]] inline std::optional<Planet> parse_planet(std::string_view s) {
    if (auto i = detail::lookup_name(detail::kPlanetNames, s))
        return static_cast<Planet>(*i);
    return std::nullopt;
}

/// Houses are always numeric, 1–12.
[[nodiscard]] inline std::optional<House> parse_house(std::string_view s) {
    auto v = detail::parse_index(s);
    if (!v || *v < 1 || *v > kHouseCount) return std::nullopt;
    return static_cast<House>(*v);
}

}  // namespace gunamilan
