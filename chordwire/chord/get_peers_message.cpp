// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "get_peers_message.hpp"

#include <chordwire/infra/common/decoding_exception.hpp>

#include "message.hpp"

namespace chordwire::chord {

Bytes GetPeersMessage::encode() const {
    return encode_fields(kType, sender_port);
}

GetPeersMessage GetPeersMessage::decode(ByteView data) {
    GetPeersMessage message;
    success_or_throw(chord::decode(data, message), "Failed to decode GetPeersMessage");
    return message;
}

DecodingResult decode(ByteView& from, GetPeersMessage& to, codec::Leftover mode) noexcept {
    return decode_fields(from, GetPeersMessage::kType, mode, to.sender_port);
}

}  // namespace chordwire::chord
