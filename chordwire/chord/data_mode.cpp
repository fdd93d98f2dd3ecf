// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "data_mode.hpp"

#include <magic_enum.hpp>

#include <chordwire/core/codec/encode.hpp>

namespace chordwire::chord {

std::string_view data_mode_name(DataMode mode) noexcept {
    std::string_view name{magic_enum::enum_name(mode)};
    if (!name.empty()) {
        name.remove_prefix(1);  // 'k'
    }
    return name;
}

void encode(Bytes& to, DataMode mode) {
    codec::encode(to, static_cast<uint8_t>(mode));
}

DecodingResult decode(ByteView& from, DataMode& to, codec::Leftover mode) noexcept {
    ByteView view{from};
    uint8_t value{0};
    if (DecodingResult res{codec::decode(view, value, codec::Leftover::kAllow)}; !res) {
        return res;
    }
    const auto data_mode{magic_enum::enum_cast<DataMode>(value)};
    if (!data_mode) {
        return tl::unexpected{DecodingError::kInvalidDataMode};
    }
    to = *data_mode;
    from = view;
    if (mode != codec::Leftover::kAllow && !from.empty()) {
        return tl::unexpected{DecodingError::kInputTooLong};
    }
    return {};
}

}  // namespace chordwire::chord
