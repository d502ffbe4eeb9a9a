#include "gunamilan/domain_tables.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cstddef>

using namespace gunamilan;

TEST(DomainTables, EveryNakshatraHasValidAttributes) {
    for (std::size_t i = 0; i < kNakshatraCount; ++i) {
        const auto attr = nakshatra_attributes(static_cast<Nakshatra>(i));
        EXPECT_LT(index_of(attr.gana), kGanaCount) << "nakshatra " << i;
        EXPECT_LT(index_of(attr.nadi), kNadiCount) << "nakshatra " << i;
        EXPECT_LT(index_of(attr.yoni), kYoniCount) << "nakshatra " << i;
    }
}

TEST(DomainTables, EveryRashiHasValidAttributes) {
    for (std::size_t i = 0; i < kRashiCount; ++i) {
        const auto attr = rashi_attributes(static_cast<Rashi>(i));
        EXPECT_LT(index_of(attr.varna), kVarnaCount) << "rashi " << i;
        EXPECT_LT(index_of(attr.lord), kSignLordCount) << "rashi " << i;
    }
}

TEST(DomainTables, KnownNakshatraAttributes) {
    EXPECT_EQ(gana_of(Nakshatra::Ashwini), Gana::Deva);
    EXPECT_EQ(nadi_of(Nakshatra::Ashwini), Nadi::Aadi);
    EXPECT_EQ(yoni_of(Nakshatra::Ashwini), Yoni::Horse);

    EXPECT_EQ(gana_of(Nakshatra::Bharani), Gana::Manushya);
    EXPECT_EQ(nadi_of(Nakshatra::Bharani), Nadi::Madhya);
    EXPECT_EQ(yoni_of(Nakshatra::Bharani), Yoni::Elephant);

    EXPECT_EQ(gana_of(Nakshatra::Krittika), Gana::Rakshasa);
    EXPECT_EQ(nadi_of(Nakshatra::Krittika), Nadi::Antya);

    EXPECT_EQ(gana_of(Nakshatra::Revati), Gana::Deva);
    EXPECT_EQ(nadi_of(Nakshatra::Revati), Nadi::Antya);
    EXPECT_EQ(yoni_of(Nakshatra::Revati), Yoni::Elephant);

    EXPECT_EQ(yoni_of(Nakshatra::Hasta), Yoni::Buffalo);
    EXPECT_EQ(yoni_of(Nakshatra::Shatabhisha), Yoni::Horse);
}

TEST(DomainTables, NadiRepeatsEveryThirdNakshatra) {
    for (std::size_t i = 0; i < kNakshatraCount; ++i)
        EXPECT_EQ(index_of(nadi_of(static_cast<Nakshatra>(i))), i % 3);
}

TEST(DomainTables, YoniOccurrences) {
    std::array<int, kYoniCount> seen{};
    for (std::size_t i = 0; i < kNakshatraCount; ++i)
        ++seen[index_of(yoni_of(static_cast<Nakshatra>(i)))];

    for (std::size_t y = 0; y < kYoniCount; ++y) {
        if (static_cast<Yoni>(y) == Yoni::Mongoose)
            EXPECT_EQ(seen[y], 1);
        else
            EXPECT_EQ(seen[y], 2) << "yoni " << y;
    }
}

TEST(DomainTables, KnownRashiAttributes) {
    EXPECT_EQ(varna_of(Rashi::Aries), Varna::Kshatriya);
    EXPECT_EQ(lord_of(Rashi::Aries), Planet::Mars);
    EXPECT_EQ(varna_of(Rashi::Cancer), Varna::Brahmin);
    EXPECT_EQ(lord_of(Rashi::Cancer), Planet::Moon);
    EXPECT_EQ(lord_of(Rashi::Leo), Planet::Sun);
    EXPECT_EQ(varna_of(Rashi::Capricorn), Varna::Vaishya);
    EXPECT_EQ(lord_of(Rashi::Capricorn), Planet::Saturn);
    EXPECT_EQ(varna_of(Rashi::Aquarius), Varna::Shudra);
    EXPECT_EQ(lord_of(Rashi::Aquarius), Planet::Saturn);
    EXPECT_EQ(lord_of(Rashi::Pisces), Planet::Jupiter);
}

TEST(DomainTables, NaturalRelationIsDirectional) {
    EXPECT_EQ(natural_relation(Planet::Moon, Planet::Mercury), PlanetRelation::Friend);
    EXPECT_EQ(natural_relation(Planet::Mercury, Planet::Moon), PlanetRelation::Enemy);
    EXPECT_EQ(natural_relation(Planet::Mars, Planet::Saturn), PlanetRelation::Neutral);
    EXPECT_EQ(natural_relation(Planet::Saturn, Planet::Mars), PlanetRelation::Enemy);
    EXPECT_EQ(natural_relation(Planet::Sun, Planet::Saturn), PlanetRelation::Enemy);
}

TEST(DomainTables, AccessorsAreConstexpr) {
    static_assert(gana_of(Nakshatra::Pushya) == Gana::Deva);
    static_assert(lord_of(Rashi::Scorpio) == Planet::Mars);
    static_assert(natural_relation(Planet::Jupiter, Planet::Sun) ==
                  PlanetRelation::Friend);
    SUCCEED();
}
