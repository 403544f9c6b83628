/// @file src/main.cpp
/// @brief runstream CLI entry point.
///
/// Usage:
///   runstream --analyze <csv_file> [options]   Analyze one run, print JSON
///   runstream --help                           Print usage

#include "runstream/data_loader.hpp"
#include "runstream/engine.hpp"
#include "runstream/serialize.hpp"

#include <fmt/core.h>

#include <cmath>
#include <optional>
#include <string>

namespace {

constexpr int EXIT_USAGE_OR_ANALYSIS = 1;
constexpr int EXIT_UNREADABLE_FILE   = 2;

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  runstream --analyze <csv_file> [options]   Analyze one run\n"
        "  runstream --help                           Show this help\n"
        "\n"
        "Physiology:\n"
        "  --threshold-hr <bpm>      Lactate threshold heart rate\n"
        "  --resting-hr <bpm>        Resting heart rate\n"
        "  --max-hr <bpm>            Maximum heart rate\n"
        "  --threshold-pace <s/km>   Threshold pace\n"
        "\n"
        "Plan:\n"
        "  --plan-duration <min>     Planned duration\n"
        "  --plan-distance <km>      Planned distance\n"
        "  --plan-pace <s/km>        Planned pace\n"
        "  --plan-intervals <n>      Planned work interval count\n"
        "  --require-plan            Fail when no plan is given\n"
        "\n"
        "  --verbose                 Stage diagnostics on stderr\n"
        "\n"
        "CSV format (header required, time_s mandatory):\n"
        "  time_s,distance_m,heartrate_bpm,cadence_spm,altitude_m,velocity_mps,grade_pct\n"
    );
}

std::optional<double> parse_number(const std::string& text) noexcept {
    try {
        std::size_t pos = 0;
        const double val = std::stod(text, &pos);
        if (pos != text.size() || !std::isfinite(val)) return std::nullopt;
        return val;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

struct CliOptions {
    std::string                         csv_path;
    runstream::AnalysisRequest          request;
    bool                                verbose = false;
};

/// Parse argv into options. Returns `nullopt` after printing the problem.
std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    runstream::AthletePhysiologyContext physio{};
    runstream::PlannedWorkout plan{};
    bool has_physio = false;
    bool has_plan = false;

    for (int i = 1; i < argc; ++i) {
        const std::string flag(argv[i]);

        if (flag == "--require-plan") { opts.request.require_plan = true; continue; }
        if (flag == "--verbose")      { opts.verbose = true; continue; }

        if (i + 1 >= argc) {
            fmt::print(stderr, "Error: {} requires a value\n", flag);
            return std::nullopt;
        }
        const std::string value(argv[++i]);

        if (flag == "--analyze") {
            opts.csv_path = value;
            continue;
        }

        const auto number = parse_number(value);
        if (!number) {
            fmt::print(stderr, "Error: {} expects a number, got '{}'\n", flag, value);
            return std::nullopt;
        }

        if (flag == "--threshold-hr")        { physio.threshold_hr = *number;            has_physio = true; }
        else if (flag == "--resting-hr")     { physio.resting_hr = *number;              has_physio = true; }
        else if (flag == "--max-hr")         { physio.max_hr = *number;                  has_physio = true; }
        else if (flag == "--threshold-pace") { physio.threshold_pace_s_per_km = *number; has_physio = true; }
        else if (flag == "--plan-duration")  { plan.duration_min = *number;              has_plan = true; }
        else if (flag == "--plan-distance")  { plan.distance_km = *number;               has_plan = true; }
        else if (flag == "--plan-pace")      { plan.pace_s_km = *number;                 has_plan = true; }
        else if (flag == "--plan-intervals") {
            if (*number < 0.0 || std::floor(*number) != *number) {
                fmt::print(stderr, "Error: --plan-intervals expects a whole number\n");
                return std::nullopt;
            }
            plan.interval_count = static_cast<int>(*number);
            has_plan = true;
        } else {
            fmt::print(stderr, "Unknown option: {}\n", flag);
            return std::nullopt;
        }
    }

    if (opts.csv_path.empty()) {
        fmt::print(stderr, "Error: --analyze requires a CSV file path\n");
        return std::nullopt;
    }
    if (has_physio) opts.request.physiology = physio;
    if (has_plan)   opts.request.plan = plan;
    return opts;
}

/// Load the CSV, run the engine and print the outcome as JSON.
int run_analyze(const CliOptions& opts) {
    auto loaded = runstream::DataLoader::load_csv(opts.csv_path);
    if (!loaded) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", opts.csv_path);
        return EXIT_UNREADABLE_FILE;
    }

    if (opts.verbose) {
        fmt::print(stderr, "[runstream] loaded {} points from '{}' ({} rows skipped)\n",
                   loaded->points.size(), opts.csv_path, loaded->skipped_rows);
    }

    // Only channels named in the header are declared by the source.
    auto request = opts.request;
    request.declared_channels = loaded->columns;

    const runstream::Engine engine(runstream::EngineConfig{.verbose = opts.verbose});
    const auto outcome = engine.analyze(loaded->points, request);

    fmt::print("{}\n", runstream::serialize::to_json(outcome));
    return outcome.ok() ? 0 : EXIT_USAGE_OR_ANALYSIS;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return EXIT_USAGE_OR_ANALYSIS;
    }

    const std::string mode(argv[1]);
    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    const auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage();
        return EXIT_USAGE_OR_ANALYSIS;
    }
    return run_analyze(*opts);
}
