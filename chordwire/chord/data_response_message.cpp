// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "data_response_message.hpp"

#include <chordwire/infra/common/decoding_exception.hpp>

#include "message.hpp"

namespace chordwire::chord {

Bytes DataResponseMessage::encode() const {
    return encode_fields(kType, data_id, data);
}

DataResponseMessage DataResponseMessage::decode(ByteView encoded) {
    DataResponseMessage message;
    success_or_throw(chord::decode(encoded, message), "Failed to decode DataResponseMessage");
    return message;
}

DecodingResult decode(ByteView& from, DataResponseMessage& to, codec::Leftover mode) noexcept {
    return decode_fields(from, DataResponseMessage::kType, mode, to.data_id, to.data);
}

}  // namespace chordwire::chord
