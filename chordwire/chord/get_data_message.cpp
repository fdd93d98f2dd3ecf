// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "get_data_message.hpp"

#include <chordwire/infra/common/decoding_exception.hpp>

#include "message.hpp"

namespace chordwire::chord {

Bytes GetDataMessage::encode() const {
    return encode_fields(kType, data_id);
}

GetDataMessage GetDataMessage::decode(ByteView data) {
    GetDataMessage message;
    success_or_throw(chord::decode(data, message), "Failed to decode GetDataMessage");
    return message;
}

DecodingResult decode(ByteView& from, GetDataMessage& to, codec::Leftover mode) noexcept {
    return decode_fields(from, GetDataMessage::kType, mode, to.data_id);
}

}  // namespace chordwire::chord
