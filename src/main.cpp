/// @file src/main.cpp
/// @brief seqa CLI entry point.
///
/// Usage:
///   seqa streaks <csv> --time F (--category F [--domain a,b] | --winner F --first F --second F)
///                [--entity F] [--players a,b] [--threshold N] [--longest CAT [--top N]]
///   seqa trend   <csv> --time F --value F [--series F] [--lag N]
///                [--peak series|global|to-date] [--precision N]
///   seqa h2h     <csv> --first F --second F --winner F --time F
///                [--min-games N] [--players a,b] [--both] [--factor X] [--dedup F]
///   seqa --help
///
/// Common flags: --verbose (stage counts on stderr).

#include "seqa/data_loader.hpp"
#include "seqa/engine.hpp"
#include "seqa/errors.hpp"

#include <fmt/core.h>

#include <charconv>
#include <cstdlib>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace {

using Options = std::map<std::string, std::string>;

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  seqa streaks <csv> --time F (--category F [--domain a,b] | --winner F --first F --second F)\n"
        "               [--entity F] [--players a,b] [--threshold N] [--longest CAT [--top N]]\n"
        "  seqa trend   <csv> --time F --value F [--series F] [--lag N]\n"
        "               [--peak series|global|to-date] [--precision N]\n"
        "  seqa h2h     <csv> --first F --second F --winner F --time F\n"
        "               [--min-games N] [--players a,b] [--both] [--factor X] [--dedup F]\n"
        "  seqa --help\n"
        "\n"
        "Flags: --verbose prints per-stage row counts to stderr.\n"
    );
}

/// Flags that take no value.
bool is_switch(const std::string& name) {
    return name == "--both" || name == "--verbose";
}

/// Parse `--name value` pairs following the CSV path.
/// Returns nullopt (after printing the reason) on a malformed argument list.
std::optional<Options> parse_options(int argc, char* argv[], int first) {
    Options opts;
    for (int i = first; i < argc; ++i) {
        const std::string name(argv[i]);
        if (name.rfind("--", 0) != 0) {
            fmt::print(stderr, "Error: unexpected argument '{}'\n", name);
            return std::nullopt;
        }
        if (is_switch(name)) {
            opts[name] = "1";
            continue;
        }
        if (i + 1 >= argc) {
            fmt::print(stderr, "Error: {} requires a value\n", name);
            return std::nullopt;
        }
        opts[name] = argv[++i];
    }
    return opts;
}

std::optional<std::string> get(const Options& opts, const std::string& name) {
    const auto it = opts.find(name);
    if (it == opts.end()) return std::nullopt;
    return it->second;
}

std::optional<std::size_t> parse_count(const std::string& text) {
    std::size_t out = 0;
    const auto* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), last, out);
    if (ec != std::errc{} || ptr != last) return std::nullopt;
    return out;
}

std::optional<double> parse_real(const std::string& text) {
    char* end = nullptr;
    const double v = std::strtod(text.c_str(), &end);
    if (text.empty() || end != text.c_str() + text.size()) return std::nullopt;
    return v;
}

std::vector<std::string> split_list(const std::string& text) {
    std::vector<std::string> out;
    std::string item;
    for (char c : text) {
        if (c == ',') {
            if (!item.empty()) out.push_back(item);
            item.clear();
        } else {
            item += c;
        }
    }
    if (!item.empty()) out.push_back(item);
    return out;
}

/// Read a numeric option into `target`; false (after printing) if malformed.
bool read_count(const Options& opts, const std::string& name, std::size_t& target) {
    const auto raw = get(opts, name);
    if (!raw) return true;
    const auto v = parse_count(*raw);
    if (!v) {
        fmt::print(stderr, "Error: {} expects a non-negative integer, got '{}'\n", name, *raw);
        return false;
    }
    target = *v;
    return true;
}

bool require(const Options& opts, std::initializer_list<const char*> names) {
    for (const char* n : names) {
        if (!get(opts, n)) {
            fmt::print(stderr, "Error: missing required option {}\n", n);
            return false;
        }
    }
    return true;
}

// ─── streaks ──────────────────────────────────────────────────────────────────

int run_streaks(const std::vector<seqa::ingest::RawRecord>& records, const Options& opts) {
    using seqa::ingest::CategorySource;

    if (!require(opts, {"--time"})) return 1;

    seqa::core::EngineConfig cfg;
    cfg.verbose           = get(opts, "--verbose").has_value();
    cfg.schema.time_field = *get(opts, "--time");
    if (auto f = get(opts, "--entity")) cfg.schema.entity_field = *f;

    if (auto winner = get(opts, "--winner")) {
        if (!require(opts, {"--first", "--second"})) return 1;
        cfg.schema.category_source = CategorySource::Winner;
        cfg.schema.winner_field    = *winner;
        cfg.schema.first_field     = *get(opts, "--first");
        cfg.schema.second_field    = *get(opts, "--second");
    } else {
        if (!require(opts, {"--category"})) return 1;
        cfg.schema.category_field = *get(opts, "--category");
        if (auto d = get(opts, "--domain")) cfg.schema.domain = split_list(*d);
    }
    if (auto players = get(opts, "--players")) {
        cfg.runs.allow_list = seqa::AllowList(split_list(*players));
    }
    if (!read_count(opts, "--threshold", cfg.streak_threshold)) return 1;

    std::size_t top = 15;
    if (!read_count(opts, "--top", top)) return 1;

    const seqa::core::Engine engine(cfg);
    const auto report = engine.streak_report(records);
    fmt::print("{}", report.to_string());

    if (auto category = get(opts, "--longest")) {
        fmt::print("\nLongest '{}' runs:\n", *category);
        for (const auto& run : seqa::runs::RunDetector::longest(report.runs, *category, top)) {
            fmt::print("  {}\n", run.to_string());
        }
    }
    return 0;
}

// ─── trend ────────────────────────────────────────────────────────────────────

int run_trend(const std::vector<seqa::ingest::RawRecord>& records, const Options& opts) {
    using seqa::temporal::PeakScope;

    if (!require(opts, {"--time", "--value"})) return 1;

    seqa::core::EngineConfig cfg;
    cfg.verbose                = get(opts, "--verbose").has_value();
    cfg.schema.time_field      = *get(opts, "--time");
    cfg.schema.value_field     = *get(opts, "--value");
    cfg.schema.category_source = seqa::ingest::CategorySource::ValueRule;
    cfg.schema.value_rule      = seqa::temporal::LabelClassifier({}, std::string("observed"));
    if (auto f = get(opts, "--series")) cfg.schema.entity_field = *f;

    if (!read_count(opts, "--lag", cfg.temporal.lag)) return 1;
    std::size_t precision = static_cast<std::size_t>(cfg.temporal.precision);
    if (!read_count(opts, "--precision", precision)) return 1;
    cfg.temporal.precision = static_cast<int>(precision);

    if (auto peak = get(opts, "--peak")) {
        if      (*peak == "series")  cfg.temporal.peak_scope = PeakScope::Series;
        else if (*peak == "global")  cfg.temporal.peak_scope = PeakScope::Global;
        else if (*peak == "to-date") cfg.temporal.peak_scope = PeakScope::ToDate;
        else {
            fmt::print(stderr, "Error: unknown --peak '{}'\n", *peak);
            return 1;
        }
    }

    const seqa::core::Engine engine(cfg);
    for (const auto& point : engine.trend_report(records)) {
        fmt::print("{}\n", point.to_string(cfg.temporal.precision));
    }
    return 0;
}

// ─── h2h ──────────────────────────────────────────────────────────────────────

int run_h2h(const std::vector<seqa::ingest::RawRecord>& records, const Options& opts) {
    if (!require(opts, {"--first", "--second", "--winner", "--time"})) return 1;

    seqa::core::EngineConfig cfg;
    cfg.verbose                = get(opts, "--verbose").has_value();
    cfg.schema.time_field      = *get(opts, "--time");
    cfg.schema.first_field     = *get(opts, "--first");
    cfg.schema.second_field    = *get(opts, "--second");
    cfg.schema.winner_field    = *get(opts, "--winner");
    cfg.schema.category_source = seqa::ingest::CategorySource::Winner;
    if (auto f = get(opts, "--dedup")) cfg.schema.dedup_field = *f;

    if (!read_count(opts, "--min-games", cfg.matchup.min_games)) return 1;
    if (auto players = get(opts, "--players")) {
        cfg.matchup.allow_list = seqa::AllowList(split_list(*players));
    }
    if (get(opts, "--both")) cfg.matchup.allow_mode = seqa::matchup::AllowMode::Both;
    if (auto factor = get(opts, "--factor")) {
        const auto v = parse_real(*factor);
        if (!v || *v <= 0.0) {
            fmt::print(stderr, "Error: --factor expects a positive number, got '{}'\n", *factor);
            return 1;
        }
        cfg.matchup.dominance_factor = *v;
    }

    const seqa::core::Engine engine(cfg);
    for (const auto& agg : engine.head_to_head_report(records)) {
        const auto status = seqa::matchup::classify_dominance(agg, cfg.matchup.dominance_factor);
        fmt::print("{}  {}\n", agg.to_string(), seqa::matchup::describe(agg, status));
    }
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    if (mode != "streaks" && mode != "trend" && mode != "h2h") {
        fmt::print(stderr, "Unknown command: {}\n", mode);
        print_usage();
        return 1;
    }

    if (argc < 3) {
        fmt::print(stderr, "Error: {} requires a CSV file path\n", mode);
        print_usage();
        return 1;
    }

    const std::string filepath(argv[2]);
    const auto opts = parse_options(argc, argv, 3);
    if (!opts) {
        print_usage();
        return 1;
    }

    const auto records = seqa::core::DataLoader::load_csv(filepath);
    if (!records) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", filepath);
        return 1;
    }
    if (get(*opts, "--verbose")) {
        fmt::print(stderr, "[seqa] loaded {} records from '{}'\n", records->size(), filepath);
    }

    try {
        if (mode == "streaks") return run_streaks(*records, *opts);
        if (mode == "trend")   return run_trend(*records, *opts);
        return run_h2h(*records, *opts);
    } catch (const seqa::ValidationError& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    }
}
