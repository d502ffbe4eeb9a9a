#include "gunamilan/report.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstddef>
#include <sstream>
#include <string>
#include <vector>

using namespace gunamilan;

namespace {

PersonVector chart(Nakshatra n, Rashi r) {
    PersonVector p;
    p.moon_nakshatra = n;
    p.moon_rashi     = r;
    p.ascendant      = r;
    return p;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

}  // namespace

TEST(Report, TextReportShowsEveryKoota) {
    const auto p = chart(Nakshatra::Ashwini, Rashi::Aries);
    const auto r = compute_match(p, p);

    ReportOptions opts;
    opts.label_a = "Asha";
    opts.label_b = "Ravi";
    std::ostringstream out;
    write_match_report(out, r, opts);
    const std::string text = out.str();

    EXPECT_TRUE(contains(text, "Asha x Ravi"));
    for (const char* koota : {"Varna", "Vashya", "Tara", "Yoni", "Graha Maitri",
                              "Gana", "Bhakoot", "Nadi"})
        EXPECT_TRUE(contains(text, koota)) << koota;
    EXPECT_TRUE(contains(text, "25 / 36"));
    EXPECT_TRUE(contains(text, "Good"));
    EXPECT_TRUE(contains(text, "Janma"));
    EXPECT_TRUE(contains(text, "severe nadi dosha"));
    EXPECT_TRUE(contains(text, "uncancelled_nadi_dosha"));
    EXPECT_TRUE(contains(text, "Warning: missing person_a.mars_house"));
}

TEST(Report, TextReportOptionsHideDetail) {
    const auto p = chart(Nakshatra::Ashwini, Rashi::Aries);
    const auto r = compute_match(p, p);

    ReportOptions opts;
    opts.show_explanation = false;
    opts.show_warnings    = false;
    std::ostringstream out;
    write_match_report(out, r, opts);

    EXPECT_FALSE(contains(out.str(), "Warning:"));
    EXPECT_FALSE(contains(out.str(), "Janma"));
    EXPECT_FALSE(contains(out.str(), "Manglik (compatible"));
}

TEST(Report, JsonCarriesScoresFlagsAndWarnings) {
    const auto p = chart(Nakshatra::Ashwini, Rashi::Aries);
    const auto r = compute_match(p, p);

    std::ostringstream out;
    write_match_json(out, r);
    const auto j = nlohmann::json::parse(out.str());

    EXPECT_EQ(j.at("total_guna"), 25);
    EXPECT_EQ(j.at("verdict"), "Good");
    EXPECT_EQ(j.at("scores").at("nadi"), 0);
    EXPECT_EQ(j.at("scores").at("graha_maitri"), 5);
    EXPECT_TRUE(j.at("dosha").at("manglik").is_null());
    EXPECT_EQ(j.at("dosha").at("nadi"), true);
    EXPECT_EQ(j.at("dosha").at("bhakoot"), false);
    EXPECT_EQ(j.at("flags").at("severe_nadi_dosha"), true);
    EXPECT_TRUE(j.at("flags").at("dasha_conflict").is_null());
    EXPECT_EQ(j.at("explanation").at("tara"), "Janma");
    EXPECT_EQ(j.at("eligible"), false);
    EXPECT_EQ(j.at("reasons").at(0), "uncancelled_nadi_dosha");
    EXPECT_EQ(j.at("warnings").at(0), "person_a.mars_house");
}

TEST(Report, JsonFlagsForKnownManglik) {
    auto a = chart(Nakshatra::Ashwini, Rashi::Aries);
    a.mars_house = House::Third;
    auto b = chart(Nakshatra::Bharani, Rashi::Aries);
    b.mars_house = House::Seventh;
    b.mars_rashi = Rashi::Leo;

    const auto j = match_to_json(compute_match(a, b));
    EXPECT_EQ(j.at("dosha").at("manglik"), true);
    EXPECT_EQ(j.at("explanation").at("manglik_compatible"), false);
    EXPECT_EQ(j.at("explanation").at("manglik_penalty"), kManglikMismatchPenalty);
}

TEST(Report, BatchJsonEscapesIdsAndCarriesRankScores) {
    const auto subject = chart(Nakshatra::Ashwini, Rashi::Aries);
    const std::vector<Candidate> candidates = {
        {"quote\"tab\tnl\n", chart(Nakshatra::Bharani, Rashi::Aries), 7.0},
        {"plain", chart(Nakshatra::Magha, Rashi::Leo)},
    };
    BatchConfig config{RejectionMode::Exclude};
    config.subject_preference_scale = 5.0;
    const auto batch = compute_batch(subject, candidates, config);

    std::ostringstream out;
    write_batch_json(out, batch);
    const auto j = nlohmann::json::parse(out.str());

    EXPECT_EQ(j.at("total_pairs"), 2);
    ASSERT_EQ(j.at("pairs").size(), batch.pairs.size());
    for (std::size_t i = 0; i < batch.pairs.size(); ++i) {
        const auto& entry = j.at("pairs").at(i);
        const auto& m = batch.pairs[i];
        EXPECT_EQ(entry.at("rank"), i + 1);
        EXPECT_EQ(entry.at("id").get<std::string>(), m.candidate_id);
        EXPECT_DOUBLE_EQ(entry.at("final_rank_score").get<double>(), m.final_rank_score);
        EXPECT_EQ(entry.at("spice").at("distance"), m.spice.distance);
        EXPECT_EQ(entry.at("match").at("total_guna"), m.result.total_guna());
    }
}

TEST(Report, BatchTsvHasHeaderAndOneRowPerPair) {
    const auto subject = chart(Nakshatra::Ashwini, Rashi::Aries);
    const std::vector<Candidate> candidates = {
        {"c1", chart(Nakshatra::Bharani, Rashi::Aries)},
        {"c2", chart(Nakshatra::Rohini, Rashi::Taurus)},
        {"c3", chart(Nakshatra::Magha, Rashi::Leo)},
    };
    BatchConfig config{RejectionMode::RankLast};
    config.reject_when(reject_same_nadi);
    const auto batch = compute_batch(subject, candidates, config);

    std::ostringstream out;
    write_batch_tsv(out, batch);

    std::istringstream in(out.str());
    std::vector<std::string> lines;
    for (std::string line; std::getline(in, line);) lines.push_back(line);

    ASSERT_EQ(lines.size(), batch.pairs.size() + 1);
    EXPECT_EQ(lines[0].rfind("rank\tid\ttotal\tverdict", 0), 0u);
    EXPECT_EQ(lines[1].rfind("1\t" + batch.pairs[0].candidate_id + "\t", 0), 0u);
    EXPECT_TRUE(contains(lines.back(), "c2"));
    EXPECT_TRUE(contains(lines.back(), "\tyes\t1.0000\t"));   // rejected, spice
    for (const auto& line : lines)
        EXPECT_EQ(std::count(line.begin(), line.end(), '\t'), 18);
}
