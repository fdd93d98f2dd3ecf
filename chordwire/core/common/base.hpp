// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// Sizes of the fixed parts of the Chord wire format.

#include <cstddef>
#include <cstdint>

namespace chordwire {

//! Size of the length prefix preceding every variable-length field on the wire
inline constexpr size_t kLengthPrefixSize{sizeof(uint32_t)};

//! Size of the message type tag leading every message buffer
inline constexpr size_t kMessageTypeSize{sizeof(uint8_t)};

}  // namespace chordwire
