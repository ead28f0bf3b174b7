#pragma once

/// @file include/votecast/data_loader.hpp
/// @brief CSV loader for historical per-party vote tallies.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Parse CSV files of historical tallies into `std::vector<HistoricalDataPoint>`
/// for the in-memory data source. Malformed rows are skipped; the loader never
/// crashes on bad input.
///
/// ## Expected CSV Format
/// ```
/// year,party,region,position,total_votes,candidate_count
/// 2018,PT,SP,governor,5200000,1
/// 2018,PSDB,,governor,5000000,1
/// ```
/// The first line is treated as a header and skipped. Empty region or
/// position fields are read as absent.
///
/// ## Guarantees
/// - Never throws; returns `nullopt` only when the file cannot be opened
/// - Skips individual bad rows rather than failing the entire load
/// - Does not modify any file or external state

#include "votecast/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace votecast::core {

class DataLoader {
public:
    /// Load tallies from a CSV file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - Empty vector if the file has a header but no valid data rows
    /// - Parsed rows otherwise, skipping malformed ones
    [[nodiscard]] static std::optional<std::vector<HistoricalDataPoint>>
    load_csv(const std::string& filepath) noexcept;

    /// Parse tallies from CSV text (header line first).
    [[nodiscard]] static std::vector<HistoricalDataPoint>
    parse_csv_string(std::string_view csv_content) noexcept;

    /// A row is valid if year > 0, the party is non-empty and both counts
    /// are non-negative.
    [[nodiscard]] static bool validate_point(const HistoricalDataPoint& point) noexcept;

    /// Parse one data row. `nullopt` if malformed or invalid.
    [[nodiscard]] static std::optional<HistoricalDataPoint>
    parse_row(std::string_view line) noexcept;
};

}  // namespace votecast::core
