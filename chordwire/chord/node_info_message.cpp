// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "node_info_message.hpp"

#include <chordwire/infra/common/decoding_exception.hpp>

#include "message.hpp"

namespace chordwire::chord {

Bytes NodeInfoMessage::encode() const {
    return encode_fields(kType, sender_address);
}

NodeInfoMessage NodeInfoMessage::decode(ByteView data) {
    NodeInfoMessage message;
    success_or_throw(chord::decode(data, message), "Failed to decode NodeInfoMessage");
    return message;
}

DecodingResult decode(ByteView& from, NodeInfoMessage& to, codec::Leftover mode) noexcept {
    return decode_fields(from, NodeInfoMessage::kType, mode, to.sender_address);
}

}  // namespace chordwire::chord
