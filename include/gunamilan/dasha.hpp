// =============================================================================
// dasha.hpp — Alignment of the two partners' current planetary periods.
//
// The maha dasha lords decide the flags; the antar (sub) dasha relation is
// reported alongside for explanation only.
// =============================================================================
#pragma once

#include "domain_tables.hpp"
#include "types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gunamilan {

enum class DashaSync : std::uint8_t {
    Harmonious,    // same lord or mutual friends
    Supportive,    // friend on one side, neutral on the other
    Neutral,       // mutual neutrality
    Conflicting    // at least one side sees an enemy
};

[[nodiscard]] constexpr DashaSync dasha_sync(Planet a, Planet b) noexcept {
    if (a == b) return DashaSync::Harmonious;
    const auto ab = natural_relation(a, b);
    const auto ba = natural_relation(b, a);
    if (ab == PlanetRelation::Enemy || ba == PlanetRelation::Enemy)
        return DashaSync::Conflicting;
    if (ab == PlanetRelation::Friend && ba == PlanetRelation::Friend)
        return DashaSync::Harmonious;
    if (ab == PlanetRelation::Friend || ba == PlanetRelation::Friend)
        return DashaSync::Supportive;
    return DashaSync::Neutral;
}

struct DashaReport {
    std::optional<DashaSync> maha;
    std::optional<DashaSync> sub;
    Flag conflict = Flag::Unknown;
    Flag growth   = Flag::Unknown;
};

/// Missing maha dasha lords are appended to `warnings` as
/// "<prefix>.dasha_lord".
[[nodiscard]] inline DashaReport
analyze_dasha(const PersonVector& a, const PersonVector& b,
              std::string_view prefix_a, std::string_view prefix_b,
              std::vector<IncompleteInputWarning>& warnings)
{
    DashaReport r;
    if (a.sub_dasha_lord && b.sub_dasha_lord)
        r.sub = dasha_sync(*a.sub_dasha_lord, *b.sub_dasha_lord);

    if (!a.dasha_lord) warnings.push_back({std::string(prefix_a) + ".dasha_lord"});
    if (!b.dasha_lord) warnings.push_back({std::string(prefix_b) + ".dasha_lord"});
    if (!a.dasha_lord || !b.dasha_lord) return r;

    r.maha = dasha_sync(*a.dasha_lord, *b.dasha_lord);
    r.conflict = to_flag(*r.maha == DashaSync::Conflicting);
    r.growth   = to_flag(*r.maha == DashaSync::Harmonious ||
                         *r.maha == DashaSync::Supportive);
    return r;
}

[[nodiscard]] inline DashaReport
analyze_dasha(const PersonVector& a, const PersonVector& b,
              std::vector<IncompleteInputWarning>& warnings)
{
    return analyze_dasha(a, b, "person_a", "person_b", warnings);
}

}  // namespace gunamilan
