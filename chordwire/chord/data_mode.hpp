// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string_view>

#include <chordwire/core/codec/decode.hpp>
#include <chordwire/core/common/bytes.hpp>
#include <chordwire/core/common/decoding_result.hpp>

namespace chordwire::chord {

//! Downstream intent of a node lookup, one byte on the wire
enum class DataMode : uint8_t {
    kNone = 0,
    kGet = 10,
    kStore = 20,
};

std::string_view data_mode_name(DataMode mode) noexcept;

void encode(Bytes& to, DataMode mode);

inline size_t length(DataMode) noexcept {
    return sizeof(DataMode);
}

//! Fails with kInvalidDataMode on any byte other than a DataMode value
DecodingResult decode(ByteView& from, DataMode& to, codec::Leftover mode = codec::Leftover::kProhibit) noexcept;

}  // namespace chordwire::chord
