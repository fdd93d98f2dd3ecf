// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <chordwire/core/common/base.hpp>
#include <chordwire/core/common/bytes.hpp>

namespace chordwire {

inline bool has_hex_prefix(std::string_view s) {
    return s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X');
}

//! \brief Returns a string representing the hex form of provided string of bytes
std::string to_hex(ByteView bytes, bool with_prefix = false);

//! \brief Abridges a string to given length and eventually adds an ellipsis if input length is gt required length
std::string abridge(std::string_view input, size_t length);

std::optional<uint8_t> decode_hex_digit(char ch) noexcept;

//! \brief Parses a hex string (with or without 0x prefix) into bytes
//! \remarks An odd number of digits is accepted and treated as if left-padded with a zero
std::optional<Bytes> from_hex(std::string_view hex) noexcept;

//! \brief Checks whether the provided bytes are a well-formed UTF-8 sequence
//! \remarks Overlong forms, surrogates and code points above U+10FFFF are rejected
bool is_valid_utf8(ByteView data) noexcept;

}  // namespace chordwire
