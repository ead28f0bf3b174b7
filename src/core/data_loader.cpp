/// @file src/core/data_loader.cpp
/// @brief CSV DataLoader for historical vote tallies.

#include "votecast/data_loader.hpp"

#include "text_detail.hpp"

#include <fmt/core.h>

#include <fstream>
#include <sstream>

namespace votecast::core {

using detail::parse_full;
using detail::trim;

namespace {

[[nodiscard]] std::optional<std::string> optional_field(std::string_view field) {
    if (field.empty()) return std::nullopt;
    return std::string(field);
}

}  // namespace

// ─── DataLoader::validate_point ───────────────────────────────────────────────

bool DataLoader::validate_point(const HistoricalDataPoint& point) noexcept {
    if (point.year <= 0)            return false;
    if (point.party.empty())        return false;
    if (point.total_votes < 0)      return false;
    if (point.candidate_count < 0)  return false;
    return true;
}

// ─── DataLoader::parse_row ────────────────────────────────────────────────────

std::optional<HistoricalDataPoint> DataLoader::parse_row(std::string_view line) noexcept {
    // Skip blank lines and comment lines.
    if (line.empty() || line.front() == '#') {
        return std::nullopt;
    }

    std::string_view fields[6];
    std::size_t count = 0;
    std::size_t start = 0;
    while (true) {
        const auto comma = line.find(',', start);
        if (count == 6) {
            return std::nullopt;  // too many columns
        }
        fields[count++] = trim(line.substr(start, comma == std::string_view::npos
                                                      ? std::string_view::npos
                                                      : comma - start));
        if (comma == std::string_view::npos) break;
        start = comma + 1;
    }

    if (count != 6) {
        return std::nullopt;
    }

    const auto year       = parse_full<int>(fields[0]);
    const auto votes      = parse_full<std::int64_t>(fields[4]);
    const auto candidates = parse_full<std::int64_t>(fields[5]);
    if (!year || !votes || !candidates) {
        return std::nullopt;
    }

    HistoricalDataPoint point{
        .year            = *year,
        .party           = std::string(fields[1]),
        .region          = optional_field(fields[2]),
        .position        = optional_field(fields[3]),
        .total_votes     = *votes,
        .candidate_count = *candidates,
    };
    if (!validate_point(point)) {
        return std::nullopt;
    }
    return point;
}

// ─── DataLoader::parse_csv_string ─────────────────────────────────────────────

std::vector<HistoricalDataPoint>
DataLoader::parse_csv_string(std::string_view csv_content) noexcept {
    std::vector<HistoricalDataPoint> points;
    bool header_skipped = false;
    std::size_t skipped = 0;

    std::size_t start = 0;
    while (start <= csv_content.size()) {
        const auto nl = csv_content.find('\n', start);
        std::string_view line = csv_content.substr(
            start, nl == std::string_view::npos ? std::string_view::npos : nl - start);
        start = nl == std::string_view::npos ? csv_content.size() + 1 : nl + 1;

        // Trim carriage return.
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        if (!header_skipped) {
            // First non-empty, non-comment line is the header.
            if (!line.empty() && line.front() != '#') {
                header_skipped = true;
            }
            continue;
        }

        if (line.empty() || line.front() == '#') {
            continue;
        }

        auto point = parse_row(line);
        if (point) {
            points.push_back(std::move(*point));
        } else {
            ++skipped;
        }
    }

    if (skipped > 0) {
        fmt::print(stderr, "[data-loader] skipped {} malformed row(s)\n", skipped);
    }
    return points;
}

// ─── DataLoader::load_csv ─────────────────────────────────────────────────────

std::optional<std::vector<HistoricalDataPoint>>
DataLoader::load_csv(const std::string& filepath) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_csv_string(contents.str());
}

}  // namespace votecast::core
