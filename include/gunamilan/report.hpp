// =============================================================================
// report.hpp — Text, TSV and JSON renderings of match results.
//
//   write_match_report   — human-readable breakdown of one MatchResult
//   write_batch_tsv      — one row per ranked candidate, with a header line
//   match_to_json        — nlohmann::json document for one MatchResult
//   batch_to_json        — array of ranked candidates, each with its match
//   write_match_json / write_batch_json — dump() of the above
//
// All writers take a caller-supplied std::ostream; none of them opens files.
// Tri-state flags become true, false or null in JSON.
// =============================================================================
#pragma once

#include "batch.hpp"
#include "match.hpp"
#include "names.hpp"
#include "types.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>

namespace gunamilan {

struct ReportOptions {
    std::string label_a          = "A";
    std::string label_b          = "B";
    bool        show_explanation = true;
    bool        show_warnings    = true;
};

// ── Names of explanation enums ──────────────────────────────────────────────
[[nodiscard]] constexpr std::string_view name(TaraCategory t) noexcept {
    switch (t) {
        case TaraCategory::Janma:       return "Janma";
        case TaraCategory::Sampat:      return "Sampat";
        case TaraCategory::Vipat:       return "Vipat";
        case TaraCategory::Kshema:      return "Kshema";
        case TaraCategory::Pratyak:     return "Pratyak";
        case TaraCategory::Sadhaka:     return "Sadhaka";
        case TaraCategory::Naidhana:    return "Naidhana";
        case TaraCategory::Mitra:       return "Mitra";
        case TaraCategory::ParamaMitra: return "Parama Mitra";
    }
    return "?";
}

[[nodiscard]] constexpr std::string_view name(YoniRelation y) noexcept {
    switch (y) {
        case YoniRelation::Enemy:      return "enemy";
        case YoniRelation::Unfriendly: return "unfriendly";
        case YoniRelation::Neutral:    return "neutral";
        case YoniRelation::Friendly:   return "friendly";
        case YoniRelation::Same:       return "same";
    }
    return "?";
}

[[nodiscard]] constexpr std::string_view name(GrahaMaitriRelation g) noexcept {
    switch (g) {
        case GrahaMaitriRelation::SameLord:      return "same lord";
        case GrahaMaitriRelation::MutualFriend:  return "mutual friends";
        case GrahaMaitriRelation::OneSided:      return "one-sided friendship";
        case GrahaMaitriRelation::MutualNeutral: return "mutually neutral";
        case GrahaMaitriRelation::Mixed:         return "mixed";
        case GrahaMaitriRelation::MutualEnemy:   return "mutual enemies";
    }
    return "?";
}

[[nodiscard]] constexpr std::string_view name(BhakootDosha b) noexcept {
    switch (b) {
        case BhakootDosha::None:         return "none";
        case BhakootDosha::Dwirdwadasha: return "dwirdwadasha (2/12)";
        case BhakootDosha::Shadashtaka:  return "shadashtaka (6/8)";
    }
    return "?";
}

[[nodiscard]] constexpr std::string_view name(NadiCancellation c) noexcept {
    switch (c) {
        case NadiCancellation::None:                        return "none";
        case NadiCancellation::SameRashiDifferentNakshatra: return "same rashi, different nakshatra";
        case NadiCancellation::SameNakshatraDifferentRashi: return "same nakshatra, different rashi";
        case NadiCancellation::HighTotal:                   return "high total";
        case NadiCancellation::GrahaMaitriFriendship:       return "graha maitri friendship";
        case NadiCancellation::SameNakshatra:               return "same nakshatra";
    }
    return "?";
}

[[nodiscard]] constexpr std::string_view name(MarsCancellation c) noexcept {
    switch (c) {
        case MarsCancellation::None:        return "none";
        case MarsCancellation::OwnSign:     return "own sign";
        case MarsCancellation::Exalted:     return "exalted";
        case MarsCancellation::LagnaSign:   return "lagna sign";
        case MarsCancellation::Debilitated: return "debilitated";
    }
    return "?";
}

[[nodiscard]] constexpr std::string_view name(ManglikSeverity s) noexcept {
    switch (s) {
        case ManglikSeverity::None: return "none";
        case ManglikSeverity::Mild: return "mild";
        case ManglikSeverity::Full: return "full";
    }
    return "?";
}

[[nodiscard]] constexpr std::string_view name(DashaSync d) noexcept {
    switch (d) {
        case DashaSync::Harmonious:  return "harmonious";
        case DashaSync::Supportive:  return "supportive";
        case DashaSync::Neutral:     return "neutral";
        case DashaSync::Conflicting: return "conflicting";
    }
    return "?";
}

namespace detail {

inline void write_koota_row(std::ostream& out, std::string_view label,
                            int score, int max, std::string_view note = {}) {
    out << "  " << std::left << std::setw(14) << label << std::right
        << std::setw(2) << score << " / " << max;
    if (!note.empty()) out << "   " << note;
    out << '\n';
}

inline void write_manglik_side(std::ostream& out, std::string_view label,
                               const ManglikStatus& s) {
    out << "  " << label << ": final " << name(s.final_status)
        << " (raw " << name(s.raw)
        << ", lagna " << name(s.references.lagna)
        << ", moon " << name(s.references.moon)
        << ", venus " << name(s.references.venus)
        << ", cancellation " << name(s.cancellation)
        << ", severity " << name(s.severity) << ")\n";
}

[[nodiscard]] inline nlohmann::json json_flag(Flag f) {
    if (!is_known(f)) return nullptr;
    return f == Flag::Yes;
}

}  // namespace detail

// ─────────────────────────────────────────────────────────────────────────────
// Text report
// ─────────────────────────────────────────────────────────────────────────────

inline void write_match_report(std::ostream& out, const MatchResult& r,
                               const ReportOptions& opts = {})
{
    out << "Guna Milan: " << opts.label_a << " x " << opts.label_b << '\n';

    const bool ex = opts.show_explanation;
    detail::write_koota_row(out, "Varna",  r.scores.varna,  kVarnaMax);
    detail::write_koota_row(out, "Vashya", r.scores.vashya, kVashyaMax);
    detail::write_koota_row(out, "Tara",   r.scores.tara,   kTaraMax,
                            ex ? name(r.tara) : std::string_view{});
    detail::write_koota_row(out, "Yoni",   r.scores.yoni,   kYoniMax,
                            ex ? name(r.yoni) : std::string_view{});
    detail::write_koota_row(out, "Graha Maitri", r.scores.graha_maitri,
                            kGrahaMaitriMax,
                            ex ? name(r.graha_maitri) : std::string_view{});
    detail::write_koota_row(out, "Gana",    r.scores.gana,    kGanaMax);
    detail::write_koota_row(out, "Bhakoot", r.scores.bhakoot, kBhakootMax,
                            ex ? name(r.bhakoot) : std::string_view{});
    detail::write_koota_row(out, "Nadi",    r.scores.nadi,    kNadiMax,
                            ex && r.scores.nadi == 0 ? name(r.nadi_cancellation)
                                                     : std::string_view{});
    out << "  " << std::string(24, '-') << '\n';
    detail::write_koota_row(out, "Total", r.total_guna(), kMaxGuna,
                            verdict_name(r.verdict));

    out << "Dosha: manglik " << name(r.dosha.manglik)
        << ", nadi " << name(r.dosha.nadi)
        << ", bhakoot " << name(r.dosha.bhakoot)
        << (r.compatibility.severe_nadi_dosha ? " (severe nadi dosha)" : "")
        << '\n';

    if (ex) {
        out << "Manglik (compatible " << name(r.manglik.compatible)
            << ", penalty " << r.manglik.penalty << "):\n";
        detail::write_manglik_side(out, opts.label_a, r.manglik.a);
        detail::write_manglik_side(out, opts.label_b, r.manglik.b);
    }

    out << "Dasha: ";
    if (r.dasha.maha) out << name(*r.dasha.maha);
    else              out << "unknown";
    if (r.dasha.sub) out << " (sub " << name(*r.dasha.sub) << ')';
    out << ", conflict " << name(r.compatibility.dasha_conflict)
        << ", growth " << name(r.compatibility.dasha_growth) << '\n';

    if (r.compatibility.sexual_incompatibility)
        out << "Yoni: enemy animals\n";

    out << "Eligible: " << (r.eligibility.eligible ? "yes" : "no");
    for (std::size_t i = 0; i < r.eligibility.reasons.size(); ++i)
        out << (i == 0 ? " (" : ", ") << reason_name(r.eligibility.reasons[i]);
    if (!r.eligibility.reasons.empty()) out << ')';
    out << '\n';

    if (opts.show_warnings) {
        for (const auto& w : r.warnings)
            out << "Warning: missing " << w.field << '\n';
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// TSV export of a ranked batch
// ─────────────────────────────────────────────────────────────────────────────
// Columns:
//   rank id total verdict varna vashya tara yoni graha_maitri gana bhakoot
//   nadi manglik_mismatch nadi_dosha severe_nadi eligible rejected
//   spice_alignment final_rank_score

inline void write_batch_tsv(std::ostream& out, const BatchResult& batch)
{
    out << "rank\tid\ttotal\tverdict\tvarna\tvashya\ttara\tyoni\t"
           "graha_maitri\tgana\tbhakoot\tnadi\tmanglik_mismatch\t"
           "nadi_dosha\tsevere_nadi\teligible\trejected\t"
           "spice_alignment\tfinal_rank_score\n";

    const auto saved_flags     = out.flags();
    const auto saved_precision = out.precision();
    out << std::fixed << std::setprecision(4);

    std::size_t rank = 0;
    for_each_ranked(batch, [&](const RankedMatch& m) {
        const auto& r = m.result;
        const auto& s = r.scores;
        out << ++rank << '\t' << m.candidate_id << '\t'
            << r.total_guna() << '\t' << verdict_name(r.verdict) << '\t'
            << s.varna << '\t' << s.vashya << '\t' << s.tara << '\t'
            << s.yoni << '\t' << s.graha_maitri << '\t' << s.gana << '\t'
            << s.bhakoot << '\t' << s.nadi << '\t'
            << name(r.dosha.manglik) << '\t' << name(r.dosha.nadi) << '\t'
            << (r.compatibility.severe_nadi_dosha ? "yes" : "no") << '\t'
            << (r.eligibility.eligible ? "yes" : "no") << '\t'
            << (m.rejected ? "yes" : "no") << '\t'
            << m.spice.score << '\t' << m.final_rank_score << '\n';
    });

    out.flags(saved_flags);
    out.precision(saved_precision);
}

// ─────────────────────────────────────────────────────────────────────────────
// JSON export
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] inline nlohmann::json match_to_json(const MatchResult& r)
{
    using json = nlohmann::json;
    using detail::json_flag;
    const auto& s = r.scores;

    json scores;
    scores["varna"]        = s.varna;
    scores["vashya"]       = s.vashya;
    scores["tara"]         = s.tara;
    scores["yoni"]         = s.yoni;
    scores["graha_maitri"] = s.graha_maitri;
    scores["gana"]         = s.gana;
    scores["bhakoot"]      = s.bhakoot;
    scores["nadi"]         = s.nadi;

    json dosha;
    dosha["manglik"] = json_flag(r.dosha.manglik);
    dosha["nadi"]    = json_flag(r.dosha.nadi);
    dosha["bhakoot"] = json_flag(r.dosha.bhakoot);

    json flags;
    flags["sexual_incompatibility"] = r.compatibility.sexual_incompatibility;
    flags["severe_nadi_dosha"]      = r.compatibility.severe_nadi_dosha;
    flags["dasha_conflict"]         = json_flag(r.compatibility.dasha_conflict);
    flags["dasha_growth"]           = json_flag(r.compatibility.dasha_growth);

    json explanation;
    explanation["tara"]               = std::string(name(r.tara));
    explanation["yoni"]               = std::string(name(r.yoni));
    explanation["graha_maitri"]       = std::string(name(r.graha_maitri));
    explanation["bhakoot"]            = std::string(name(r.bhakoot));
    explanation["nadi_cancellation"]  = std::string(name(r.nadi_cancellation));
    explanation["manglik_compatible"] = json_flag(r.manglik.compatible);
    explanation["manglik_penalty"]    = r.manglik.penalty;

    json reasons = json::array();
    for (auto reason : r.eligibility.reasons)
        reasons.push_back(reason_name(reason));

    json warnings = json::array();
    for (const auto& w : r.warnings)
        warnings.push_back(w.field);

    json j;
    j["scores"]      = std::move(scores);
    j["total_guna"]  = r.total_guna();
    j["verdict"]     = verdict_name(r.verdict);
    j["dosha"]       = std::move(dosha);
    j["flags"]       = std::move(flags);
    j["explanation"] = std::move(explanation);
    j["eligible"]    = r.eligibility.eligible;
    j["reasons"]     = std::move(reasons);
    j["warnings"]    = std::move(warnings);
    return j;
}

[[nodiscard]] inline nlohmann::json batch_to_json(const BatchResult& batch)
{
    using json = nlohmann::json;

    json ranked = json::array();
    std::size_t rank = 0;
    for_each_ranked(batch, [&](const RankedMatch& m) {
        json spice;
        spice["level_a"]  = m.spice.level_a;
        spice["level_b"]  = m.spice.level_b;
        spice["distance"] = m.spice.distance;
        spice["score"]    = m.spice.score;

        json entry;
        entry["rank"]             = ++rank;
        entry["id"]               = m.candidate_id;
        entry["rejected"]         = m.rejected;
        entry["spice"]            = std::move(spice);
        entry["vedic_rank_score"] = m.vedic_rank_score;
        entry["final_rank_score"] = m.final_rank_score;
        entry["match"]            = match_to_json(m.result);
        ranked.push_back(std::move(entry));
    });

    json j;
    j["total_pairs"]      = batch.total_pairs;
    j["early_rejections"] = batch.early_rejections;
    j["pairs"]            = std::move(ranked);
    return j;
}

inline void write_match_json(std::ostream& out, const MatchResult& r)
{
    out << match_to_json(r).dump();
}

inline void write_batch_json(std::ostream& out, const BatchResult& batch,
                             int indent = -1)
{
    out << batch_to_json(batch).dump(indent);
}

}  // namespace gunamilan
