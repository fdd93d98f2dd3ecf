// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include <chordwire/core/codec/decode.hpp>
#include <chordwire/core/common/base.hpp>
#include <chordwire/core/common/bytes.hpp>
#include <chordwire/core/common/decoding_result.hpp>

#include "message_type.hpp"
#include "peer_record.hpp"

namespace chordwire::chord {

//! Answer to GetPeersMessage
struct PeerListMessage {
    Bytes encode() const;
    static PeerListMessage decode(ByteView data);

    //! Decoded lists only hold PeerRecord entries
    std::vector<PeerEntry> peers;

    static constexpr MessageType kType{MessageType::kPeerList};

    friend bool operator==(const PeerListMessage&, const PeerListMessage&) = default;
};

DecodingResult decode(ByteView& from, PeerListMessage& to, codec::Leftover mode = codec::Leftover::kProhibit) noexcept;

}  // namespace chordwire::chord
