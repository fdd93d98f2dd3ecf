// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "data_presence_message.hpp"

#include <chordwire/infra/common/decoding_exception.hpp>

#include "message.hpp"

namespace chordwire::chord {

Bytes DataPresenceMessage::encode() const {
    return encode_fields(kType, data_present);
}

DataPresenceMessage DataPresenceMessage::decode(ByteView data) {
    DataPresenceMessage message;
    success_or_throw(chord::decode(data, message), "Failed to decode DataPresenceMessage");
    return message;
}

DecodingResult decode(ByteView& from, DataPresenceMessage& to, codec::Leftover mode) noexcept {
    return decode_fields(from, DataPresenceMessage::kType, mode, to.data_present);
}

}  // namespace chordwire::chord
