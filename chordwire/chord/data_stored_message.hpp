// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chordwire/core/codec/decode.hpp>
#include <chordwire/core/common/base.hpp>
#include <chordwire/core/common/bytes.hpp>
#include <chordwire/core/common/decoding_result.hpp>

#include "message_type.hpp"

namespace chordwire::chord {

//! Reply to a StoreDataMessage
struct DataStoredMessage {
    Bytes encode() const;
    static DataStoredMessage decode(ByteView data);

    bool stored{false};

    static constexpr MessageType kType{MessageType::kDataStored};

    friend bool operator==(const DataStoredMessage&, const DataStoredMessage&) = default;
};

DecodingResult decode(ByteView& from, DataStoredMessage& to, codec::Leftover mode = codec::Leftover::kProhibit) noexcept;

}  // namespace chordwire::chord
