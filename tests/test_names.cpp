#include "gunamilan/names.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <string>

using namespace gunamilan;

TEST(Names, DisplayNames) {
    EXPECT_EQ(name(Nakshatra::PurvaPhalguni), "Purva Phalguni");
    EXPECT_EQ(name(Nakshatra::Revati), "Revati");
    EXPECT_EQ(name(Rashi::Sagittarius), "Sagittarius");
    EXPECT_EQ(name(Planet::Ketu), "Ketu");
    EXPECT_EQ(name(Gana::Rakshasa), "Rakshasa");
    EXPECT_EQ(name(Nadi::Madhya), "Madhya");
    EXPECT_EQ(name(Varna::Brahmin), "Brahmin");
    EXPECT_EQ(name(Yoni::Mongoose), "Mongoose");
    EXPECT_EQ(name(Flag::Unknown), "unknown");
}

TEST(Names, OutOfDomainValuesRenderAsPlaceholder) {
    EXPECT_EQ(name(static_cast<Nakshatra>(40)), "?");
    EXPECT_EQ(name(static_cast<Rashi>(12)), "?");
}

TEST(Names, ParseIgnoresCaseAndSeparators) {
    EXPECT_EQ(parse_nakshatra("Purva Phalguni"), Nakshatra::PurvaPhalguni);
    EXPECT_EQ(parse_nakshatra("purva_phalguni"), Nakshatra::PurvaPhalguni);
    EXPECT_EQ(parse_nakshatra("PURVAPHALGUNI"), Nakshatra::PurvaPhalguni);
    EXPECT_EQ(parse_rashi("scorpio"), Rashi::Scorpio);
    EXPECT_EQ(parse_planet("RAHU"), Planet::Rahu);
}

TEST(Names, ParseAcceptsIndices) {
    EXPECT_EQ(parse_nakshatra("0"), Nakshatra::Ashwini);
    EXPECT_EQ(parse_nakshatra("26"), Nakshatra::Revati);
    EXPECT_EQ(parse_rashi("11"), Rashi::Pisces);
    EXPECT_EQ(parse_planet("8"), Planet::Ketu);
}

TEST(Names, ParseRejectsUnknownText) {
    EXPECT_FALSE(parse_nakshatra("27").has_value());
    EXPECT_FALSE(parse_nakshatra("Pluto").has_value());
    EXPECT_FALSE(parse_nakshatra("").has_value());
    EXPECT_FALSE(parse_rashi("12").has_value());
    EXPECT_FALSE(parse_rashi("-1").has_value());
    EXPECT_FALSE(parse_planet("Uranus").has_value());
}

TEST(Names, ParseHouse) {
    EXPECT_EQ(parse_house("1"), House::First);
    EXPECT_EQ(parse_house("12"), House::Twelfth);
    EXPECT_FALSE(parse_house("0").has_value());
    EXPECT_FALSE(parse_house("13").has_value());
    EXPECT_FALSE(parse_house("first").has_value());
}

TEST(Names, EveryNakshatraNameParsesBack) {
    for (std::size_t i = 0; i < kNakshatraCount; ++i) {
        const auto n = static_cast<Nakshatra>(i);
        EXPECT_EQ(parse_nakshatra(name(n)), n) << name(n);
    }
    for (std::size_t i = 0; i < kRashiCount; ++i) {
        const auto r = static_cast<Rashi>(i);
        EXPECT_EQ(parse_rashi(name(r)), r) << name(r);
    }
}
