// =============================================================================
// person_io.hpp — Read person vectors from tab-separated text.
//
// Format (one chart per line, tab-separated, up to 12 columns):
//
//   id  moon_nakshatra  moon_rashi  ascendant  mars_house  mars_rashi
//       jupiter_house  venus_house  saturn_house  dasha_lord  sub_dasha_lord
//       preference_scale
//
// Nakshatras, rashis and planets may be given by name or by index; houses
// are 1–12; preference_scale is a decimal number (see spice.hpp).  "." or an
// empty cell marks an absent optional.  Blank lines and lines starting with
// '#' are skipped.  The first remaining line is a header, and skipped, when
// its first cell is "id"; later rows with that id are data.
//
// Values that parse but fall outside a domain cannot occur here: unparseable
// cells are reported as std::runtime_error with the 1-based line number.
// =============================================================================
#pragma once

#include "batch.hpp"
#include "names.hpp"
#include "types.hpp"

#include <charconv>
#include <cmath>
#include <cstddef>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace gunamilan {

inline constexpr std::size_t kPersonColumns = 12;

namespace detail {

[[nodiscard]] inline std::vector<std::string_view> split_tabs(std::string_view line) {
    std::vector<std::string_view> cells;
    std::size_t start = 0;
    while (true) {
        const std::size_t tab = line.find('\t', start);
        if (tab == std::string_view::npos) {
            cells.push_back(line.substr(start));
            break;
        }
        cells.push_back(line.substr(start, tab - start));
        start = tab + 1;
    }
    return cells;
}

[[nodiscard]] inline std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\r')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\r')) s.remove_suffix(1);
    return s;
}

[[nodiscard]] inline bool is_absent(std::string_view cell) {
    return cell.empty() || cell == ".";
}

[[nodiscard]] inline std::optional<double> parse_scale(std::string_view cell) {
    double v = 0.0;
    const auto [end, ec] = std::from_chars(cell.data(), cell.data() + cell.size(), v);
    if (ec != std::errc{} || end != cell.data() + cell.size() || !std::isfinite(v))
        return std::nullopt;
    return v;
}

[[noreturn]] inline void bad_cell(std::size_t line_no, std::string_view column,
                                  std::string_view cell) {
    throw std::runtime_error("line " + std::to_string(line_no) + ": invalid " +
                             std::string(column) + " '" + std::string(cell) + "'");
}

/// Parse a mandatory cell with `parse`, or throw.
template <typename Parse>
auto required_cell(std::string_view cell, std::size_t line_no,
                   std::string_view column, Parse parse) {
    if (is_absent(cell)) bad_cell(line_no, column, cell);
    auto v = parse(cell);
    if (!v) bad_cell(line_no, column, cell);
    return *v;
}

/// Parse an optional cell: absent stays nullopt, unparseable throws.
template <typename Parse>
auto optional_cell(std::string_view cell, std::size_t line_no,
                   std::string_view column, Parse parse) -> decltype(parse(cell)) {
    if (is_absent(cell)) return std::nullopt;
    auto v = parse(cell);
    if (!v) bad_cell(line_no, column, cell);
    return v;
}

}  // namespace detail

/// Parse one data line.  `line_no` is only used in error messages.
[[nodiscard]] inline Candidate parse_person_line(std::string_view line,
                                                 std::size_t line_no)
{
    auto cells = detail::split_tabs(line);
    for (auto& c : cells) c = detail::trim(c);
    if (cells.size() < 4 || cells.size() > kPersonColumns) {
        throw std::runtime_error("line " + std::to_string(line_no) +
                                 ": expected 4 to " +
                                 std::to_string(kPersonColumns) +
                                 " columns, found " +
                                 std::to_string(cells.size()));
    }
    cells.resize(kPersonColumns);   // missing trailing optionals are absent

    if (detail::is_absent(cells[0]))
        detail::bad_cell(line_no, "id", cells[0]);

    using detail::optional_cell;
    using detail::required_cell;

    Candidate c;
    c.id = std::string(cells[0]);
    PersonVector& p = c.person;
    p.moon_nakshatra = required_cell(cells[1], line_no, "moon_nakshatra", parse_nakshatra);
    p.moon_rashi     = required_cell(cells[2], line_no, "moon_rashi", parse_rashi);
    p.ascendant      = required_cell(cells[3], line_no, "ascendant", parse_rashi);
    p.mars_house     = optional_cell(cells[4], line_no, "mars_house", parse_house);
    p.mars_rashi     = optional_cell(cells[5], line_no, "mars_rashi", parse_rashi);
    p.jupiter_house  = optional_cell(cells[6], line_no, "jupiter_house", parse_house);
    p.venus_house    = optional_cell(cells[7], line_no, "venus_house", parse_house);
    p.saturn_house   = optional_cell(cells[8], line_no, "saturn_house", parse_house);
    p.dasha_lord     = optional_cell(cells[9], line_no, "dasha_lord", parse_planet);
    p.sub_dasha_lord = optional_cell(cells[10], line_no, "sub_dasha_lord", parse_planet);
    c.relationship_preference_scale =
        optional_cell(cells[11], line_no, "preference_scale", detail::parse_scale);
    return c;
}

/// Read every chart in `in`, in file order.
[[nodiscard]] inline std::vector<Candidate> read_person_tsv(std::istream& in)
{
    std::vector<Candidate> out;
    std::string line;
    std::size_t line_no = 0;
    bool first = true;
    while (std::getline(in, line)) {
        ++line_no;
        const std::string_view view = detail::trim(line);
        if (view.empty() || view.front() == '#') continue;
        const bool header = first && (view.substr(0, 3) == "id\t" || view == "id");
        first = false;
        if (header) continue;
        out.push_back(parse_person_line(view, line_no));
    }
    if (in.bad())
        throw std::runtime_error("read error after line " + std::to_string(line_no));
    return out;
}

/// Open `filename` and read it with read_person_tsv().
[[nodiscard]] inline std::vector<Candidate>
read_person_tsv_file(const std::string& filename)
{
    std::ifstream ifs(filename);
    if (!ifs) throw std::runtime_error("cannot open " + filename);
    return read_person_tsv(ifs);
}

}  // namespace gunamilan
