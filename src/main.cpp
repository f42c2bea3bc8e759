/// @file src/main.cpp
/// @brief pairsel CLI entry point.
///
/// Usage:
///   pairsel --input <csv_file> [options]   Select pairs from a price table
///   pairsel --help                         Print usage

#include "pairsel/errors.hpp"
#include "pairsel/pipeline.hpp"
#include "pairsel/price_loader.hpp"

#include <fmt/core.h>

#include <charconv>
#include <optional>
#include <string>
#include <string_view>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  pairsel --input <csv_file> [options]\n"
        "  pairsel --help\n"
        "\n"
        "Options:\n"
        "  --features N        PCA components per asset      (default 10)\n"
        "  --pvalue P          max cointegration p-value     (default 0.01)\n"
        "  --hurst H           Hurst exponent upper bound    (default 0.5)\n"
        "  --crossovers C      min mean crossings per year   (default 12)\n"
        "  --min-samples M     OPTICS neighbourhood size     (default 5)\n"
        "  --xi X              OPTICS steepness              (default 0.05)\n"
        "  --window-years Y    OU test window in years       (default 2)\n"
        "  --verbose           per-stage diagnostics on stderr\n"
        "\n"
        "CSV format (header required):\n"
        "  date,<asset>,<asset>,...\n"
        "  2020-01-02,101.5,55.2,...\n"
    );
}

template <typename T>
[[nodiscard]] std::optional<T> parse_number(std::string_view text) {
    T value{};
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

/// Run the selection on one CSV file.
/// Returns 0 on success, 1 on error.
int run_selection(const std::string& filepath, const pairsel::pipeline::SelectorConfig& config) {
    auto prices = pairsel::core::PriceLoader::load_csv(filepath);
    if (!prices) {
        fmt::print(stderr, "Error: cannot read a price table from '{}'\n", filepath);
        return 1;
    }
    if (prices->rows() == 0) {
        fmt::print(stderr, "Error: no valid price rows loaded from '{}'\n", filepath);
        return 1;
    }

    fmt::print("Loaded {} observations of {} assets from '{}'\n",
               prices->rows(), prices->cols(), filepath);

    try {
        const pairsel::pipeline::PairsSelector selector(config);
        const auto result = selector.run(std::move(*prices));

        fmt::print("\n{}", pairsel::pipeline::summarize(result).to_string());
        fmt::print("\nSelected pairs:\n");
        for (const auto& pair : result.final_pairs()) {
            fmt::print("  {}\n", pair.label());
        }
    } catch (const pairsel::PipelineError& e) {
        fmt::print(stderr, "Error [{}]: {}\n", pairsel::to_string(e.kind()), e.what());
        return 1;
    }
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    pairsel::pipeline::SelectorConfig config;
    std::optional<std::string> input;

    for (int i = 1; i < argc; ++i) {
        const std::string_view flag(argv[i]);

        if (flag == "--help" || flag == "-h") {
            print_usage();
            return 0;
        }
        if (flag == "--verbose") {
            config.verbose = true;
            continue;
        }

        if (i + 1 >= argc) {
            fmt::print(stderr, "Error: {} requires a value\n", flag);
            print_usage();
            return 1;
        }
        const std::string_view value(argv[++i]);

        bool ok = true;
        if (flag == "--input") {
            input = std::string(value);
        } else if (flag == "--features") {
            const auto v = parse_number<std::size_t>(value);
            ok = v.has_value();
            if (ok) config.num_features = *v;
        } else if (flag == "--pvalue") {
            const auto v = parse_number<double>(value);
            ok = v.has_value();
            if (ok) config.pvalue_threshold = *v;
        } else if (flag == "--hurst") {
            const auto v = parse_number<double>(value);
            ok = v.has_value();
            if (ok) config.hurst_threshold = *v;
        } else if (flag == "--crossovers") {
            const auto v = parse_number<double>(value);
            ok = v.has_value();
            if (ok) config.min_crossovers_per_year = *v;
        } else if (flag == "--min-samples") {
            const auto v = parse_number<std::size_t>(value);
            ok = v.has_value();
            if (ok) config.optics.min_samples = *v;
        } else if (flag == "--xi") {
            const auto v = parse_number<double>(value);
            ok = v.has_value();
            if (ok) config.optics.xi = *v;
        } else if (flag == "--window-years") {
            const auto v = parse_number<int>(value);
            ok = v.has_value();
            if (ok) config.test_window_years = *v;
        } else {
            fmt::print(stderr, "Unknown option: {}\n", flag);
            print_usage();
            return 1;
        }

        if (!ok) {
            fmt::print(stderr, "Error: invalid value '{}' for {}\n", value, flag);
            return 1;
        }
    }

    if (!input) {
        fmt::print(stderr, "Error: --input is required\n");
        print_usage();
        return 1;
    }
    return run_selection(*input, config);
}
