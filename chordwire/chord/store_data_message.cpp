// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "store_data_message.hpp"

#include <chordwire/infra/common/decoding_exception.hpp>

#include "message.hpp"

namespace chordwire::chord {

Bytes StoreDataMessage::encode() const {
    return encode_fields(kType, data_id, data);
}

StoreDataMessage StoreDataMessage::decode(ByteView encoded) {
    StoreDataMessage message;
    success_or_throw(chord::decode(encoded, message), "Failed to decode StoreDataMessage");
    return message;
}

DecodingResult decode(ByteView& from, StoreDataMessage& to, codec::Leftover mode) noexcept {
    return decode_fields(from, StoreDataMessage::kType, mode, to.data_id, to.data);
}

}  // namespace chordwire::chord
