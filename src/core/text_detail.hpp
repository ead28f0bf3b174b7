#pragma once
/**
 * @file  text_detail.hpp
 * @brief Internal text helpers shared by the CSV loader, parameter
 *        overrides and the CLI.
 *
 * Module:  src/core/  (internal, not included from public headers)
 *
 * Both helpers are noexcept and never allocate. parse_full<T> accepts only
 * a complete match: trailing characters, overflow and empty input all
 * yield nullopt.
 */

#include <charconv>
#include <optional>
#include <string_view>
#include <system_error>

namespace votecast::detail {

/// Strip leading and trailing spaces, tabs, CR and LF.
[[nodiscard]] inline std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

/// Parse the whole of `text` as T.
template <typename T>
[[nodiscard]] std::optional<T> parse_full(std::string_view text) noexcept {
    T value{};
    const char* first = text.data();
    const char* last  = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

}  // namespace votecast::detail
