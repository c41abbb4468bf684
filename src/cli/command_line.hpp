#pragma once

/// @file src/cli/command_line.hpp
/// @brief Command-line splitting for the charmcp executable.
///
/// `--verbose` is a flag accepted in any position; every other argument is
/// positional, the first one naming the mode.

#include <charconv>
#include <optional>
#include <string_view>
#include <system_error>
#include <vector>

namespace charmcp::cli {

struct CommandLine {
    bool                          verbose = false;
    std::vector<std::string_view> positional;

    /// First positional argument, empty if there is none.
    [[nodiscard]] std::string_view mode() const noexcept {
        return positional.empty() ? std::string_view{} : positional.front();
    }
};

[[nodiscard]] inline CommandLine parse_command_line(int argc, const char* const* argv) {
    CommandLine cl;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg(argv[i]);
        if (arg == "--verbose") {
            cl.verbose = true;
        } else {
            cl.positional.push_back(arg);
        }
    }
    return cl;
}

/// Strictly positive decimal integer, nullopt for anything else.
[[nodiscard]] inline std::optional<int> parse_point_count(std::string_view text) noexcept {
    int points = 0;
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), points);
    if (ec != std::errc{} || end != text.data() + text.size() || points <= 0) {
        return std::nullopt;
    }
    return points;
}

} // namespace charmcp::cli
