// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include <chordwire/core/codec/decode.hpp>
#include <chordwire/core/common/base.hpp>
#include <chordwire/core/common/bytes.hpp>
#include <chordwire/core/common/decoding_result.hpp>

#include "message_type.hpp"

namespace chordwire::chord {

//! Announces the address the sender can be reached at
struct NodeInfoMessage {
    Bytes encode() const;
    static NodeInfoMessage decode(ByteView data);

    std::string sender_address;

    static constexpr MessageType kType{MessageType::kNodeInfo};

    friend bool operator==(const NodeInfoMessage&, const NodeInfoMessage&) = default;
};

DecodingResult decode(ByteView& from, NodeInfoMessage& to, codec::Leftover mode = codec::Leftover::kProhibit) noexcept;

}  // namespace chordwire::chord
