#include "gunamilan/manglik.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <vector>

using namespace gunamilan;

namespace {

PersonVector chart(Rashi asc, Rashi moon = Rashi::Aries) {
    PersonVector p;
    p.moon_nakshatra = Nakshatra::Ashwini;
    p.moon_rashi     = moon;
    p.ascendant      = asc;
    return p;
}

}  // namespace

TEST(Manglik, ManglikHouses) {
    const bool expected[] = {true, true, false, true, false, false,
                             true, true, false, false, false, true};
    for (std::size_t h = 1; h <= kHouseCount; ++h)
        EXPECT_EQ(is_manglik_house(static_cast<House>(h)), expected[h - 1])
            << "house " << h;
}

TEST(Manglik, RelativeHouse) {
    EXPECT_EQ(relative_house(House::First, House::First), House::First);
    EXPECT_EQ(relative_house(House::Fourth, House::Seventh), House::Tenth);
    EXPECT_EQ(relative_house(House::Seventh, House::Fourth), House::Fourth);
    EXPECT_EQ(relative_house(House::Twelfth, House::First), House::Twelfth);
    EXPECT_TRUE(relative_manglik(House::Third, House::Twelfth));   // 4th from ref
    EXPECT_FALSE(relative_manglik(House::Third, House::Fifth));    // 11th from ref
}

TEST(Manglik, MoonHouseIsWholeSignFromAscendant) {
    EXPECT_EQ(moon_house(chart(Rashi::Aries, Rashi::Aries)), House::First);
    EXPECT_EQ(moon_house(chart(Rashi::Aries, Rashi::Taurus)), House::Second);
    EXPECT_EQ(moon_house(chart(Rashi::Pisces, Rashi::Aries)), House::Second);
    EXPECT_EQ(moon_house(chart(Rashi::Aries, Rashi::Pisces)), House::Twelfth);
}

TEST(Manglik, CancellationPriority) {
    EXPECT_EQ(mars_cancellation(House::First, Rashi::Aries, Rashi::Aries),
              MarsCancellation::OwnSign);
    EXPECT_EQ(mars_cancellation(House::Eighth, Rashi::Scorpio, Rashi::Gemini),
              MarsCancellation::OwnSign);
    EXPECT_EQ(mars_cancellation(House::Fifth, Rashi::Capricorn, Rashi::Virgo),
              MarsCancellation::Exalted);
    EXPECT_EQ(mars_cancellation(House::First, Rashi::Leo, Rashi::Leo),
              MarsCancellation::LagnaSign);
    EXPECT_EQ(mars_cancellation(House::First, Rashi::Cancer, Rashi::Cancer),
              MarsCancellation::LagnaSign);
    EXPECT_EQ(mars_cancellation(House::Seventh, Rashi::Cancer, Rashi::Capricorn),
              MarsCancellation::Debilitated);
    EXPECT_EQ(mars_cancellation(House::Seventh, Rashi::Leo, Rashi::Aquarius),
              MarsCancellation::None);
}

TEST(Manglik, DebilitationDoesNotCancel) {
    EXPECT_TRUE(manglik_cancelled(House::First, Rashi::Aries, Rashi::Aries));
    EXPECT_TRUE(manglik_cancelled(MarsCancellation::Exalted));
    EXPECT_TRUE(manglik_cancelled(MarsCancellation::LagnaSign));
    EXPECT_FALSE(manglik_cancelled(MarsCancellation::Debilitated));
    EXPECT_FALSE(manglik_cancelled(MarsCancellation::None));
}

TEST(Manglik, MarsInFirstOwnSignIsCancelled) {
    auto a = chart(Rashi::Aries);
    a.mars_house = House::First;
    a.mars_rashi = Rashi::Aries;
    auto b = chart(Rashi::Aries);
    b.mars_house = House::Sixth;

    std::vector<IncompleteInputWarning> warnings;
    const auto sa = manglik_status(a, ManglikPolicy::LagnaOnly, "person_a", warnings);
    const auto sb = manglik_status(b, ManglikPolicy::LagnaOnly, "person_b", warnings);

    EXPECT_EQ(sa.raw, Flag::Yes);
    EXPECT_EQ(sa.cancellation, MarsCancellation::OwnSign);
    EXPECT_EQ(sa.final_status, Flag::No);
    EXPECT_EQ(sb.raw, Flag::No);
    EXPECT_EQ(sb.final_status, Flag::No);
    EXPECT_TRUE(warnings.empty());

    const auto m = match_manglik(sa, sb);
    EXPECT_EQ(m.compatible, Flag::Yes);
    EXPECT_EQ(m.penalty, 0);
}

TEST(Manglik, MissingMarsHouseIsUnknown) {
    std::vector<IncompleteInputWarning> warnings;
    const auto s = manglik_status(chart(Rashi::Aries), ManglikPolicy::LagnaOnly,
                                  "person_a", warnings);
    EXPECT_EQ(s.raw, Flag::Unknown);
    EXPECT_EQ(s.final_status, Flag::Unknown);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].field, "person_a.mars_house");
}

TEST(Manglik, MissingMarsRashiLeavesDoshaStanding) {
    auto p = chart(Rashi::Aries);
    p.mars_house = House::Seventh;

    std::vector<IncompleteInputWarning> warnings;
    const auto s = manglik_status(p, ManglikPolicy::LagnaOnly, "person_b", warnings);
    EXPECT_EQ(s.final_status, Flag::Yes);
    EXPECT_EQ(s.severity, ManglikSeverity::Full);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].field, "person_b.mars_rashi");
}

TEST(Manglik, DebilitatedMarsIsMild) {
    auto p = chart(Rashi::Capricorn);
    p.mars_house = House::Seventh;
    p.mars_rashi = Rashi::Cancer;

    std::vector<IncompleteInputWarning> warnings;
    const auto s = manglik_status(p, ManglikPolicy::LagnaOnly, "person_a", warnings);
    EXPECT_EQ(s.cancellation, MarsCancellation::Debilitated);
    EXPECT_EQ(s.final_status, Flag::Yes);
    EXPECT_EQ(s.severity, ManglikSeverity::Mild);
}

TEST(Manglik, ReferencePolicies) {
    // Mars in the 3rd: clean from the lagna, 4th from the Moon (Pisces,
    // 12th house), and 11th from Venus in the 5th.
    auto p = chart(Rashi::Aries, Rashi::Pisces);
    p.mars_house  = House::Third;
    p.mars_rashi  = Rashi::Gemini;
    p.venus_house = House::Fifth;

    std::vector<IncompleteInputWarning> warnings;
    const auto lagna = manglik_status(p, ManglikPolicy::LagnaOnly, "p", warnings);
    const auto any   = manglik_status(p, ManglikPolicy::AnyReference, "p", warnings);
    const auto maj   = manglik_status(p, ManglikPolicy::Majority, "p", warnings);

    EXPECT_EQ(lagna.references.lagna, Flag::No);
    EXPECT_EQ(lagna.references.moon, Flag::Yes);
    EXPECT_EQ(lagna.references.venus, Flag::No);

    EXPECT_EQ(lagna.final_status, Flag::No);
    EXPECT_EQ(any.final_status, Flag::Yes);
    EXPECT_EQ(maj.final_status, Flag::No);

    p.venus_house = House::Ninth;   // Mars 7th from Venus
    const auto maj2 = manglik_status(p, ManglikPolicy::Majority, "p", warnings);
    EXPECT_EQ(maj2.references.venus, Flag::Yes);
    EXPECT_EQ(maj2.final_status, Flag::Yes);
    EXPECT_TRUE(warnings.empty());
}

TEST(Manglik, VenusPolicyWarnsWhenVenusMissing) {
    auto p = chart(Rashi::Aries);
    p.mars_house = House::Third;

    std::vector<IncompleteInputWarning> warnings;
    const auto s = manglik_status(p, ManglikPolicy::AnyReference, "person_a", warnings);
    EXPECT_EQ(s.references.venus, Flag::Unknown);
    EXPECT_EQ(s.raw, Flag::No);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].field, "person_a.venus_house");

    warnings.clear();
    (void)manglik_status(p, ManglikPolicy::LagnaOnly, "person_a", warnings);
    EXPECT_TRUE(warnings.empty());
}

TEST(Manglik, PenaltyOnlyForKnownMismatch) {
    EXPECT_EQ(manglik_penalty(Flag::Yes, Flag::No), kManglikMismatchPenalty);
    EXPECT_EQ(manglik_penalty(Flag::No, Flag::Yes), kManglikMismatchPenalty);
    EXPECT_EQ(manglik_penalty(Flag::Yes, Flag::Yes), 0);
    EXPECT_EQ(manglik_penalty(Flag::Unknown, Flag::Yes), 0);
    EXPECT_EQ(manglik_mismatch(Flag::No, Flag::Unknown), Flag::Unknown);
}

TEST(Manglik, UnknownSideMakesCompatibilityUnknown) {
    ManglikStatus known;
    known.raw = known.final_status = Flag::No;
    const ManglikStatus unknown;
    const auto m = match_manglik(known, unknown);
    EXPECT_EQ(m.compatible, Flag::Unknown);
    EXPECT_EQ(m.penalty, 0);
}
