// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "data_stored_message.hpp"

#include <chordwire/infra/common/decoding_exception.hpp>

#include "message.hpp"

namespace chordwire::chord {

Bytes DataStoredMessage::encode() const {
    return encode_fields(kType, stored);
}

DataStoredMessage DataStoredMessage::decode(ByteView data) {
    DataStoredMessage message;
    success_or_throw(chord::decode(data, message), "Failed to decode DataStoredMessage");
    return message;
}

DecodingResult decode(ByteView& from, DataStoredMessage& to, codec::Leftover mode) noexcept {
    return decode_fields(from, DataStoredMessage::kType, mode, to.stored);
}

}  // namespace chordwire::chord
