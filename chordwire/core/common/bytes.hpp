// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

// Byte containers shared by the codec and the message layer, and casts between text and bytes.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <evmc/bytes.hpp>

namespace chordwire {

//! Owned byte buffer, e.g. an encoded message
using Bytes = evmc::bytes;

//! Non-owning view over a byte buffer, used as decoding cursor
class ByteView : public evmc::bytes_view {
  public:
    constexpr ByteView() noexcept = default;

    // NOLINTNEXTLINE(google-explicit-constructor, hicpp-explicit-conversions)
    constexpr ByteView(const evmc::bytes_view& other) noexcept
        : evmc::bytes_view{other.data(), other.size()} {}

    // NOLINTNEXTLINE(google-explicit-constructor, hicpp-explicit-conversions)
    ByteView(const Bytes& str) noexcept : evmc::bytes_view{str.data(), str.size()} {}

    constexpr ByteView(const uint8_t* data, size_type size) noexcept
        : evmc::bytes_view{data, size} {}

  private:
    // Use size() instead
    using evmc::bytes_view::length;
};

inline const char* byte_ptr_cast(const uint8_t* ptr) { return reinterpret_cast<const char*>(ptr); }
inline const uint8_t* byte_ptr_cast(const char* ptr) { return reinterpret_cast<const uint8_t*>(ptr); }

inline Bytes string_to_bytes(std::string_view s) { return {byte_ptr_cast(s.data()), s.size()}; }
inline ByteView string_view_to_byte_view(std::string_view v) { return {byte_ptr_cast(v.data()), v.size()}; }
inline std::string_view byte_view_to_string_view(ByteView v) { return {byte_ptr_cast(v.data()), v.size()}; }

}  // namespace chordwire
