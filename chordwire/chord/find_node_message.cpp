// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "find_node_message.hpp"

#include <chordwire/infra/common/decoding_exception.hpp>

#include "message.hpp"

namespace chordwire::chord {

Bytes FindNodeMessage::encode() const {
    return encode_fields(kType, node_id, data_mode);
}

FindNodeMessage FindNodeMessage::decode(ByteView data) {
    FindNodeMessage message;
    success_or_throw(chord::decode(data, message), "Failed to decode FindNodeMessage");
    return message;
}

DecodingResult decode(ByteView& from, FindNodeMessage& to, codec::Leftover mode) noexcept {
    return decode_fields(from, FindNodeMessage::kType, mode, to.node_id, to.data_mode);
}

}  // namespace chordwire::chord
