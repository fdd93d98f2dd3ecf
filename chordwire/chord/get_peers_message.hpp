// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chordwire/core/codec/decode.hpp>
#include <chordwire/core/common/base.hpp>
#include <chordwire/core/common/bytes.hpp>
#include <chordwire/core/common/decoding_result.hpp>

#include "message_type.hpp"

namespace chordwire::chord {

//! Asks a node for its known peers, answered with a PeerListMessage
struct GetPeersMessage {
    Bytes encode() const;
    static GetPeersMessage decode(ByteView data);

    //! Port the sender accepts connections on
    uint32_t sender_port{0};

    static constexpr MessageType kType{MessageType::kGetPeers};

    friend bool operator==(const GetPeersMessage&, const GetPeersMessage&) = default;
};

DecodingResult decode(ByteView& from, GetPeersMessage& to, codec::Leftover mode = codec::Leftover::kProhibit) noexcept;

}  // namespace chordwire::chord
