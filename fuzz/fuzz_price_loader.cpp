/**
 * @file  fuzz_price_loader.cpp
 * @brief libFuzzer target for PriceLoader::parse_csv_string
 *
 * Build:
 *   cmake -DPAIRSEL_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_price_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_price_loader -max_total_time=60
 *
 * The invariants below are plain asserts. The build compiles this file with
 * -UNDEBUG, and the guard after the includes rejects any build that would
 * compile them out.
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort.
 *   2. If a panel is returned, its value matrix matches index × columns.
 *   3. Asset names are non-empty and unique.
 *   4. Dates are strictly increasing.
 *   5. Every price is NaN or a finite non-negative number.
 *
 * Fuzzer strategy:
 *   The input bytes are handed over verbatim as CSV text, so the fuzzer
 *   explores delimiters, line endings, comment lines, malformed dates and
 *   numeric edge cases (exponents, signs, "nan", overflow).
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <set>
#include <string>

#include "pairsel/price_loader.hpp"

#ifdef NDEBUG
#error "fuzz_price_loader must be built with assertions enabled (-UNDEBUG)"
#endif

using pairsel::core::PriceLoader;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string text(reinterpret_cast<const char*>(data), size);
    const auto panel = PriceLoader::parse_csv_string(text);
    if (!panel) {
        return 0;
    }

    // Invariant 2: shape
    assert(panel->values.rows() == static_cast<Eigen::Index>(panel->rows()));
    assert(panel->values.cols() == static_cast<Eigen::Index>(panel->cols()));

    // Invariant 3: asset names
    std::set<std::string> names;
    for (const auto& name : panel->columns) {
        assert(!name.empty());
        assert(names.insert(name).second);
    }

    // Invariant 4: strictly increasing dates
    for (std::size_t t = 1; t < panel->rows(); ++t) {
        assert(panel->index[t - 1] < panel->index[t]);
    }

    // Invariant 5: prices
    for (Eigen::Index t = 0; t < panel->values.rows(); ++t) {
        for (Eigen::Index j = 0; j < panel->values.cols(); ++j) {
            const double v = panel->values(t, j);
            assert(std::isnan(v) || (std::isfinite(v) && v >= 0.0));
        }
    }
    return 0;
}
