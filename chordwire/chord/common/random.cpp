// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "random.hpp"

#include <cstdint>
#include <random>

namespace chordwire::chord {

Bytes random_bytes(Bytes::size_type size) {
    std::random_device random_device;
    std::uniform_int_distribution<uint16_t> random_distribution{0, UINT8_MAX};

    Bytes data(size, 0);
    for (auto& d : data) {
        d = static_cast<uint8_t>(random_distribution(random_device));
    }
    return data;
}

}  // namespace chordwire::chord
