// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

// ANSI escape sequences used to colorize log lines, and TTY detection.

#pragma once

#include <ostream>
#include <string_view>

namespace chordwire::terminal {

namespace color {
    inline constexpr std::string_view kReset{"\x1b[0m"};
    inline constexpr std::string_view kGrey{"\x1b[90m"};
    inline constexpr std::string_view kWhite{"\x1b[97m"};
    inline constexpr std::string_view kRed{"\x1b[91m"};
    inline constexpr std::string_view kGreen{"\x1b[32m"};
    inline constexpr std::string_view kCyan{"\x1b[96m"};
    inline constexpr std::string_view kBoldYellow{"\x1b[1;33m"};
    inline constexpr std::string_view kOnRed{"\x1b[101m"};
    inline constexpr std::string_view kOnPurple{"\x1b[105m"};
}  // namespace color

//! True only for std::cout or std::cerr attached to a terminal
bool is_tty(const std::ostream& out);

}  // namespace chordwire::terminal
