// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

// Binary field encoding functions.
// Variable-length fields (opaque blobs and UTF-8 strings) are written as a
// 4-byte big endian length prefix followed by the raw bytes.
// Integers are fixed-width big endian, booleans and bytes take exactly one byte.

#pragma once

#include <string_view>

#include <chordwire/core/common/base.hpp>
#include <chordwire/core/common/bytes.hpp>

namespace chordwire::codec {

inline constexpr uint8_t kFalseCode{0x00};
inline constexpr uint8_t kTrueCode{0x01};

//! Appends a length-prefixed opaque blob
void encode(Bytes& to, ByteView blob);

//! Appends a length-prefixed UTF-8 string
//! \throws std::invalid_argument if str is not well-formed UTF-8
void encode(Bytes& to, std::string_view str);

// Prevent string literals from binding to the bool overload
inline void encode(Bytes& to, const char* str) {
    encode(to, std::string_view{str});
}

void encode(Bytes& to, uint32_t n);

void encode(Bytes& to, uint8_t b);

//! Booleans are always written canonically as 0x00 or 0x01
void encode(Bytes& to, bool b);

//! Encodes multiple fields one after another in the given order
template <typename Arg1, typename Arg2, typename... Args>
void encode(Bytes& to, const Arg1& arg1, const Arg2& arg2, const Args&... args) {
    encode(to, arg1);
    encode(to, arg2);
    (encode(to, args), ...);
}

Bytes encode_blob(ByteView blob);

Bytes encode_string(std::string_view str);

size_t length(ByteView blob) noexcept;

size_t length(std::string_view str) noexcept;

inline size_t length(uint32_t) noexcept {
    return sizeof(uint32_t);
}

inline size_t length(uint8_t) noexcept {
    return sizeof(uint8_t);
}

inline size_t length(bool) noexcept {
    return 1;
}

}  // namespace chordwire::codec
