/// @file src/core/price_loader.cpp
/// @brief CSV PriceLoader for wide daily price tables.

#include "pairsel/price_loader.hpp"

#include <charconv>
#include <cmath>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>
#include <vector>

namespace pairsel::core {

namespace {

[[nodiscard]] std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

[[nodiscard]] std::vector<std::string_view> split(std::string_view line) {
    std::vector<std::string_view> fields;
    std::size_t start = 0;
    while (true) {
        const auto comma = line.find(',', start);
        if (comma == std::string_view::npos) {
            fields.push_back(trim(line.substr(start)));
            break;
        }
        fields.push_back(trim(line.substr(start, comma - start)));
        start = comma + 1;
    }
    return fields;
}

/// NaN for a missing cell, nullopt for an invalid one.
[[nodiscard]] std::optional<double> parse_price(std::string_view cell) noexcept {
    if (cell.empty() || cell == "nan" || cell == "NaN" || cell == "NA") {
        return std::numeric_limits<double>::quiet_NaN();
    }
    double value = 0.0;
    const auto [ptr, ec] = std::from_chars(cell.data(), cell.data() + cell.size(), value);
    if (ec != std::errc{} || ptr != cell.data() + cell.size()) {
        return std::nullopt;  // trailing garbage or not a number
    }
    if (!std::isfinite(value) || value < 0.0) {
        return std::nullopt;
    }
    return value;
}

[[nodiscard]] bool skippable(std::string_view line) noexcept {
    const auto t = trim(line);
    return t.empty() || t.front() == '#';
}

}  // anonymous namespace

// ─── PriceLoader::parse_date ──────────────────────────────────────────────────

std::optional<TimePoint> PriceLoader::parse_date(std::string_view text) noexcept {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    auto number = [&](std::size_t pos, std::size_t len) -> std::optional<int> {
        int v = 0;
        const char* begin = text.data() + pos;
        const auto [ptr, ec] = std::from_chars(begin, begin + len, v);
        if (ec != std::errc{} || ptr != begin + len) return std::nullopt;
        return v;
    };
    const auto y = number(0, 4);
    const auto m = number(5, 2);
    const auto d = number(8, 2);
    if (!y || !m || !d || *m < 1 || *d < 1) {
        return std::nullopt;
    }

    const std::chrono::year_month_day ymd{std::chrono::year{*y},
                                          std::chrono::month{static_cast<unsigned>(*m)},
                                          std::chrono::day{static_cast<unsigned>(*d)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    return TimePoint{ymd};
}

// ─── PriceLoader::parse_csv_string ────────────────────────────────────────────

std::optional<PricePanel>
PriceLoader::parse_csv_string(const std::string& csv_content) noexcept {
    std::istringstream stream(csv_content);
    std::string line;

    // Header.
    std::vector<std::string> assets;
    bool have_header = false;
    while (std::getline(stream, line)) {
        if (skippable(line)) continue;
        const auto fields = split(line);
        if (fields.size() < 2) {
            return std::nullopt;
        }
        std::set<std::string_view> seen;
        for (std::size_t i = 1; i < fields.size(); ++i) {
            if (fields[i].empty() || !seen.insert(fields[i]).second) {
                return std::nullopt;
            }
            assets.emplace_back(fields[i]);
        }
        have_header = true;
        break;
    }
    if (!have_header) {
        return std::nullopt;
    }

    // Data rows.
    std::vector<TimePoint> dates;
    std::vector<double> flat;  // row-major
    std::vector<double> row(assets.size());
    while (std::getline(stream, line)) {
        if (skippable(line)) continue;
        const auto fields = split(line);
        if (fields.size() != assets.size() + 1) continue;

        const auto date = parse_date(fields[0]);
        if (!date) continue;
        if (!dates.empty() && *date <= dates.back()) continue;

        bool valid = true;
        for (std::size_t j = 0; j < assets.size(); ++j) {
            const auto price = parse_price(fields[j + 1]);
            if (!price) {
                valid = false;
                break;
            }
            row[j] = *price;
        }
        if (!valid) continue;

        dates.push_back(*date);
        flat.insert(flat.end(), row.begin(), row.end());
    }

    PricePanel panel;
    panel.columns = std::move(assets);
    panel.index = std::move(dates);
    panel.values.resize(static_cast<Eigen::Index>(panel.index.size()),
                        static_cast<Eigen::Index>(panel.columns.size()));
    for (std::size_t t = 0; t < panel.index.size(); ++t) {
        for (std::size_t j = 0; j < panel.columns.size(); ++j) {
            panel.values(static_cast<Eigen::Index>(t), static_cast<Eigen::Index>(j)) =
                flat[t * panel.columns.size() + j];
        }
    }
    return panel;
}

// ─── PriceLoader::load_csv ────────────────────────────────────────────────────

std::optional<PricePanel> PriceLoader::load_csv(const std::string& filepath) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_csv_string(contents.str());
}

}  // namespace pairsel::core
