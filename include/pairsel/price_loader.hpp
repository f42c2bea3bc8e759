#pragma once

/// @file include/pairsel/price_loader.hpp
/// @brief CSV loader for wide daily price tables.
///
/// # Module: PriceLoader
///
/// ## Responsibility
/// Parse a CSV file with one date column followed by one column per asset
/// into a `PricePanel`. Bad rows are skipped; the loader never throws.
///
/// ## Expected CSV Format
/// ```
/// date,AAA,BBB,CCC
/// 2020-01-02,101.5,55.2,
/// 2020-01-03,102.0,55.9,17.4
/// ```
/// The first non-empty line not starting with '#' is the header. Its first
/// field names the date column; the rest are asset identifiers. An empty
/// cell, `nan`, `NaN` or `NA` is a missing price (NaN).
///
/// ## Row Rejection
/// A data row is skipped when:
/// - its date is not a valid `YYYY-MM-DD` calendar date
/// - its field count differs from the header's
/// - a price is unparsable, infinite or negative
/// - its date is not strictly after the previous accepted row
///
/// ## Guarantees
/// - Never throws; returns `nullopt` on unrecoverable errors
/// - The returned panel satisfies the PricePanel invariants (strictly
///   increasing index, unique columns)

#include "pairsel/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace pairsel::core {

class PriceLoader {
public:
    /// Load a price panel from a CSV file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened or has no usable header
    /// - A panel with zero rows if no data row is valid
    [[nodiscard]] static std::optional<PricePanel>
    load_csv(const std::string& filepath) noexcept;

    /// Parse a price panel from CSV text (same format as `load_csv`).
    ///
    /// # Returns
    /// `nullopt` if there is no header, the header names no asset, or an
    /// asset identifier is empty or repeated.
    [[nodiscard]] static std::optional<PricePanel>
    parse_csv_string(const std::string& csv_content) noexcept;

    /// Parse a `YYYY-MM-DD` date. `nullopt` for anything else.
    [[nodiscard]] static std::optional<TimePoint>
    parse_date(std::string_view text) noexcept;
};

}  // namespace pairsel::core
