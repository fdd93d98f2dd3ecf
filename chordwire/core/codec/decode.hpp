// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

// Binary field decoding functions, the counterpart of encode.hpp.
// Every function consumes its field from the front of the input view, so that
// decoding a message is a strict left-to-right walk with no backtracking.

#pragma once

#include <string>
#include <utility>

#include <chordwire/core/common/base.hpp>
#include <chordwire/core/common/bytes.hpp>
#include <chordwire/core/common/decoding_result.hpp>
#include <chordwire/core/codec/encode.hpp>

namespace chordwire::codec {

// Whether to allow or prohibit trailing characters in an input after decoding.
// If prohibited and the input does contain extra characters, decode() returns DecodingError::kInputTooLong.
enum class Leftover {
    kProhibit,
    kAllow,
};

//! Consumes the 4-byte length prefix of a variable-length field and checks that the payload is available
tl::expected<size_t, DecodingError> decode_length(ByteView& from) noexcept;

DecodingResult decode(ByteView& from, Bytes& to, Leftover mode = Leftover::kProhibit) noexcept;

//! Decodes a length-prefixed string, failing with kInvalidString if it is not valid UTF-8
DecodingResult decode(ByteView& from, std::string& to, Leftover mode = Leftover::kProhibit) noexcept;

DecodingResult decode(ByteView& from, uint32_t& to, Leftover mode = Leftover::kProhibit) noexcept;

DecodingResult decode(ByteView& from, uint8_t& to, Leftover mode = Leftover::kProhibit) noexcept;

//! Any non-zero byte decodes as true
DecodingResult decode(ByteView& from, bool& to, Leftover mode = Leftover::kProhibit) noexcept;

template <typename Arg>
DecodingResult decode_items(ByteView& from, Arg& arg) noexcept {
    return decode(from, arg, Leftover::kAllow);
}

template <typename Arg1, typename Arg2, typename... Args>
DecodingResult decode_items(ByteView& from, Arg1& arg1, Arg2& arg2, Args&... args) noexcept {
    if (DecodingResult res{decode(from, arg1, Leftover::kAllow)}; !res) {
        return res;
    }
    return decode_items(from, arg2, args...);
}

//! Decodes a fixed sequence of fields with various types, in order
template <typename Arg1, typename... Args>
DecodingResult decode_fields(ByteView& from, Leftover mode, Arg1& arg1, Args&... args) noexcept {
    if (DecodingResult res{decode_items(from, arg1, args...)}; !res) {
        return res;
    }
    if (mode != Leftover::kAllow && !from.empty()) {
        return tl::unexpected{DecodingError::kInputTooLong};
    }
    return {};
}

//! Decodes a length-prefixed blob from the front of data
//! \return The number of bytes consumed and the blob
tl::expected<std::pair<size_t, Bytes>, DecodingError> decode_blob(ByteView data) noexcept;

//! Decodes a length-prefixed UTF-8 string from the front of data
//! \return The number of bytes consumed and the string
tl::expected<std::pair<size_t, std::string>, DecodingError> decode_string(ByteView data) noexcept;

}  // namespace chordwire::codec
