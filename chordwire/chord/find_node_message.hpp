// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chordwire/core/codec/decode.hpp>
#include <chordwire/core/common/base.hpp>
#include <chordwire/core/common/bytes.hpp>
#include <chordwire/core/common/decoding_result.hpp>

#include "data_mode.hpp"
#include "message_type.hpp"

namespace chordwire::chord {

//! Lookup of the node closest to node_id.
//! data_mode tells the receiver whether the lookup will be followed by a data request or a store.
struct FindNodeMessage {
    Bytes encode() const;
    static FindNodeMessage decode(ByteView data);

    Bytes node_id;
    DataMode data_mode{DataMode::kNone};

    static constexpr MessageType kType{MessageType::kFindNode};

    friend bool operator==(const FindNodeMessage&, const FindNodeMessage&) = default;
};

DecodingResult decode(ByteView& from, FindNodeMessage& to, codec::Leftover mode = codec::Leftover::kProhibit) noexcept;

}  // namespace chordwire::chord
