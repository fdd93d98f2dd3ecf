// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "storage_interest_message.hpp"

#include <chordwire/infra/common/decoding_exception.hpp>

#include "message.hpp"

namespace chordwire::chord {

Bytes StorageInterestMessage::encode() const {
    return encode_fields(kType, will_store);
}

StorageInterestMessage StorageInterestMessage::decode(ByteView data) {
    StorageInterestMessage message;
    success_or_throw(chord::decode(data, message), "Failed to decode StorageInterestMessage");
    return message;
}

DecodingResult decode(ByteView& from, StorageInterestMessage& to, codec::Leftover mode) noexcept {
    return decode_fields(from, StorageInterestMessage::kType, mode, to.will_store);
}

}  // namespace chordwire::chord
