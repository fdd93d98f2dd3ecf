// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "relay_message.hpp"

#include <limits>
#include <string>
#include <utility>
#include <vector>

#include <chordwire/core/codec/encode.hpp>
#include <chordwire/infra/common/decoding_exception.hpp>
#include <chordwire/infra/common/ensure.hpp>
#include <chordwire/infra/common/log.hpp>

#include "message.hpp"

namespace chordwire::chord {

Bytes RelayMessage::encode() const {
    ensure(packets.size() <= std::numeric_limits<uint32_t>::max(),
           [&]() { return "RelayMessage: too many packets: " + std::to_string(packets.size()); });
    Bytes to{encode_fields(kType, index, static_cast<uint32_t>(packets.size()))};
    for (const auto& packet : packets) {
        codec::encode(to, ByteView{packet});
    }
    return to;
}

RelayMessage RelayMessage::decode(ByteView data) {
    RelayMessage message;
    success_or_throw(chord::decode(data, message), "Failed to decode RelayMessage");
    CHORD_TRACE_M("RelayMessage::decode", {"index", std::to_string(message.index), "packets", std::to_string(message.packets.size())});
    return message;
}

// On failure neither from nor to is modified
DecodingResult decode(ByteView& from, RelayMessage& to, codec::Leftover mode) noexcept {
    ByteView cursor{from};
    uint32_t index{0};
    uint32_t count{0};
    if (DecodingResult res{decode_fields(cursor, RelayMessage::kType, codec::Leftover::kAllow, index, count)}; !res) {
        return res;
    }
    // Each entry takes at least its length prefix
    if (count > cursor.size() / kLengthPrefixSize) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }

    std::vector<Bytes> packets;
    packets.reserve(count);
    for (uint32_t i{0}; i < count; ++i) {
        Bytes packet;
        if (DecodingResult res{codec::decode(cursor, packet, codec::Leftover::kAllow)}; !res) {
            return res;
        }
        packets.emplace_back(std::move(packet));
    }

    if (mode != codec::Leftover::kAllow && !cursor.empty()) {
        return tl::unexpected{DecodingError::kInputTooLong};
    }
    to.index = index;
    to.packets = std::move(packets);
    from = cursor;
    return {};
}

}  // namespace chordwire::chord
