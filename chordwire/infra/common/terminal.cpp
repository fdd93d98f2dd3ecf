// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "terminal.hpp"

#include <cstdio>
#include <iostream>

#include <unistd.h>

namespace chordwire::terminal {

bool is_tty(const std::ostream& out) {
    if (&out == &std::cout) {
        return isatty(fileno(stdout)) != 0;
    }
    if (&out == &std::cerr) {
        return isatty(fileno(stderr)) != 0;
    }
    return false;
}

}  // namespace chordwire::terminal
