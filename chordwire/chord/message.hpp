// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

// Common envelope of all Chord messages: a single tag byte followed by the
// message payload fields, each encoded with the binary field codec.

#pragma once

#include <chordwire/core/codec/decode.hpp>
#include <chordwire/core/codec/encode.hpp>
#include <chordwire/core/common/base.hpp>
#include <chordwire/core/common/bytes.hpp>
#include <chordwire/core/common/decoding_result.hpp>

#include "message_type.hpp"

namespace chordwire::chord {

//! \brief Reads the tag byte of a message buffer without consuming it
//! \return The raw tag or kInputTooShort on an empty buffer
tl::expected<uint8_t, DecodingError> peek_type(ByteView data) noexcept;

void encode_type(Bytes& to, MessageType type);

//! \brief Consumes the tag byte and checks it against the expected type
//! \return kInputTooShort on an empty buffer, kUnexpectedMessageType on a tag mismatch
DecodingResult decode_type(ByteView& from, MessageType expected) noexcept;

//! Encodes the tag followed by the given payload fields
template <typename... Fields>
Bytes encode_fields(MessageType type, const Fields&... fields) {
    using codec::encode;
    Bytes to;
    encode_type(to, type);
    (encode(to, fields), ...);
    return to;
}

//! Decodes the tag, checking it against the expected type, then the given payload fields in order
template <typename Field, typename... Fields>
DecodingResult decode_fields(ByteView& from, MessageType expected, codec::Leftover mode, Field& field, Fields&... fields) noexcept {
    if (DecodingResult res{decode_type(from, expected)}; !res) {
        return res;
    }
    return codec::decode_fields(from, mode, field, fields...);
}

}  // namespace chordwire::chord
