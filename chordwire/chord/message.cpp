// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "message.hpp"

namespace chordwire::chord {

tl::expected<uint8_t, DecodingError> peek_type(ByteView data) noexcept {
    if (data.empty()) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    return data[0];
}

void encode_type(Bytes& to, MessageType type) {
    to.push_back(static_cast<uint8_t>(type));
}

DecodingResult decode_type(ByteView& from, MessageType expected) noexcept {
    const auto tag{peek_type(from)};
    if (!tag) {
        return tl::unexpected{tag.error()};
    }
    if (*tag != static_cast<uint8_t>(expected)) {
        return tl::unexpected{DecodingError::kUnexpectedMessageType};
    }
    from.remove_prefix(kMessageTypeSize);
    return {};
}

}  // namespace chordwire::chord
