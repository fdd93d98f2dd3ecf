// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include <chordwire/core/codec/decode.hpp>
#include <chordwire/core/common/base.hpp>
#include <chordwire/core/common/bytes.hpp>
#include <chordwire/core/common/decoding_result.hpp>

#include "message_type.hpp"

namespace chordwire::chord {

//! Envelope forwarding already encoded messages through intermediate nodes.
//! Entries stay opaque; see decode_relay_packets in any_message.hpp to decode them.
struct RelayMessage {
    Bytes encode() const;
    static RelayMessage decode(ByteView data);

    //! Builds a relay holding the encoded form of each message
    template <typename... Messages>
    static RelayMessage wrap(uint32_t index, const Messages&... messages) {
        return RelayMessage{index, {messages.encode()...}};
    }

    //! Hop counter
    uint32_t index{0};
    std::vector<Bytes> packets;

    static constexpr MessageType kType{MessageType::kRelay};

    friend bool operator==(const RelayMessage&, const RelayMessage&) = default;
};

DecodingResult decode(ByteView& from, RelayMessage& to, codec::Leftover mode = codec::Leftover::kProhibit) noexcept;

}  // namespace chordwire::chord
