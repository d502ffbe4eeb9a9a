// =============================================================================
// main.cpp — Command-line driver for the Guna Milan engine.
//
// Usage:
//   gunamilan demo
//   gunamilan rank <charts.tsv> [exclude|rank-last] [threads] [guna|blended]
//
// `demo` scores a few built-in pairs and prints the text and JSON reports.
// `rank` reads charts (see person_io.hpp), treats the first row as the
// subject and ranks every other row against it, rejecting same-Nadi
// candidates early.  `blended` orders by the Vedic/preference-scale blend
// instead of total_guna.  The ranking is written as TSV to stdout.
//
// Logging goes to stderr through spdlog; set GUNAMILAN_LOG_LEVEL to
// trace/debug/info/warn/err/off to change the level (default info).
// =============================================================================

#include "gunamilan/gunamilan.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstddef>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

void configure_logging()
{
    auto logger = spdlog::stderr_color_mt("gunamilan");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    spdlog::level::level_enum level = spdlog::level::info;
    if (const char* env = std::getenv("GUNAMILAN_LOG_LEVEL"))
        level = spdlog::level::from_str(env);
    spdlog::set_level(level);
}

void print_usage()
{
    std::cerr << "usage:\n"
              << "  gunamilan demo\n"
              << "  gunamilan rank <charts.tsv> [exclude|rank-last] [threads]"
                 " [guna|blended]\n";
}

// =====================================================================
// demo
// =====================================================================
int run_demo()
{
    using namespace gunamilan;

    struct DemoPair {
        const char*  label_a;
        PersonVector a;
        const char*  label_b;
        PersonVector b;
    };

    PersonVector ashwini;
    ashwini.moon_nakshatra = Nakshatra::Ashwini;
    ashwini.moon_rashi     = Rashi::Aries;
    ashwini.ascendant      = Rashi::Aries;

    PersonVector kuja = ashwini;
    kuja.mars_house = House::First;
    kuja.mars_rashi = Rashi::Aries;
    kuja.dasha_lord = Planet::Jupiter;

    PersonVector rohini;
    rohini.moon_nakshatra = Nakshatra::Rohini;
    rohini.moon_rashi     = Rashi::Taurus;
    rohini.ascendant      = Rashi::Libra;
    rohini.mars_house     = House::Sixth;
    rohini.mars_rashi     = Rashi::Pisces;
    rohini.dasha_lord     = Planet::Moon;

    PersonVector hasta;
    hasta.moon_nakshatra = Nakshatra::Hasta;
    hasta.moon_rashi     = Rashi::Virgo;
    hasta.ascendant      = Rashi::Gemini;
    hasta.mars_house     = House::Seventh;
    hasta.mars_rashi     = Rashi::Sagittarius;
    hasta.dasha_lord     = Planet::Mercury;
    hasta.sub_dasha_lord = Planet::Venus;

    const std::vector<DemoPair> pairs = {
        {"Ashwini/Aries", ashwini, "Ashwini/Aries", ashwini},
        {"Ashwini/Aries (Mars 1st)", kuja, "Rohini/Taurus", rohini},
        {"Hasta/Virgo", hasta, "Rohini/Taurus", rohini},
    };

    for (const auto& p : pairs) {
        spdlog::debug("scoring {} x {}", p.label_a, p.label_b);
        const MatchResult r = compute_match(p.a, p.b);

        ReportOptions opts;
        opts.label_a = p.label_a;
        opts.label_b = p.label_b;
        write_match_report(std::cout, r, opts);
        write_match_json(std::cout, r);
        std::cout << "\n\n";
    }
    spdlog::info("demo: {} pairs scored", pairs.size());
    return EXIT_SUCCESS;
}

// =====================================================================
// rank
// =====================================================================
int run_rank(int argc, char* argv[])
{
    using namespace gunamilan;

    if (argc < 3) {
        print_usage();
        return EXIT_FAILURE;
    }
    const std::string path = argv[2];

    RejectionMode mode = RejectionMode::Exclude;
    if (argc >= 4) {
        const std::string_view m = argv[3];
        if (m == "exclude") {
            mode = RejectionMode::Exclude;
        } else if (m == "rank-last") {
            mode = RejectionMode::RankLast;
        } else {
            spdlog::error("unknown rejection mode '{}'", m);
            print_usage();
            return EXIT_FAILURE;
        }
    }

    BatchConfig config{mode};
    config.reject_when(reject_same_nadi);
    if (argc >= 5) {
        const long t = std::atol(argv[4]);
        if (t < 1) {
            spdlog::error("threads must be a positive integer, got '{}'", argv[4]);
            return EXIT_FAILURE;
        }
        config.threads = static_cast<std::size_t>(t);
    }
    if (argc >= 6) {
        const std::string_view o = argv[5];
        if (o == "blended") {
            config.order = RankOrder::FinalRankScore;
        } else if (o != "guna") {
            spdlog::error("unknown rank order '{}'", o);
            print_usage();
            return EXIT_FAILURE;
        }
    }

    const auto charts = read_person_tsv_file(path);
    if (charts.empty()) {
        spdlog::error("{}: no charts found", path);
        return EXIT_FAILURE;
    }
    spdlog::info("{}: subject '{}' against {} candidate(s)",
                 path, charts.front().id, charts.size() - 1);
    config.subject_preference_scale = charts.front().relationship_preference_scale;

    const std::vector<Candidate> candidates(charts.begin() + 1, charts.end());
    const BatchResult result =
        compute_batch(charts.front().person, candidates, config);

    write_batch_tsv(std::cout, result);
    spdlog::info("ranked {} of {} candidate(s), {} rejected early",
                 result.pairs.size(), result.total_pairs,
                 result.early_rejections);
    return EXIT_SUCCESS;
}

}  // namespace

// =====================================================================
// main
// =====================================================================
int main(int argc, char* argv[])
{
    configure_logging();

    const std::string_view command = argc >= 2 ? argv[1] : "demo";
    try {
        if (command == "demo") return run_demo();
        if (command == "rank") return run_rank(argc, argv);
    } catch (const gunamilan::ValidationError& e) {
        spdlog::error("invalid chart: {} (field {})", e.what(), e.field());
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::error("unknown command '{}'", command);
    print_usage();
    return EXIT_FAILURE;
}
