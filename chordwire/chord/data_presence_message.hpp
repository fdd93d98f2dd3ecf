// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chordwire/core/codec/decode.hpp>
#include <chordwire/core/common/base.hpp>
#include <chordwire/core/common/bytes.hpp>
#include <chordwire/core/common/decoding_result.hpp>

#include "message_type.hpp"

namespace chordwire::chord {

//! Answers whether the receiver holds the data asked for
struct DataPresenceMessage {
    Bytes encode() const;
    static DataPresenceMessage decode(ByteView data);

    bool data_present{false};

    static constexpr MessageType kType{MessageType::kDataPresence};

    friend bool operator==(const DataPresenceMessage&, const DataPresenceMessage&) = default;
};

DecodingResult decode(ByteView& from, DataPresenceMessage& to, codec::Leftover mode = codec::Leftover::kProhibit) noexcept;

}  // namespace chordwire::chord
