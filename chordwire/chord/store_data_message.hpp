// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chordwire/core/codec/decode.hpp>
#include <chordwire/core/common/base.hpp>
#include <chordwire/core/common/bytes.hpp>
#include <chordwire/core/common/decoding_result.hpp>

#include "message_type.hpp"

namespace chordwire::chord {

//! Asks the receiver to store data under data_id, answered with a DataStoredMessage
struct StoreDataMessage {
    Bytes encode() const;
    static StoreDataMessage decode(ByteView encoded);

    //! Hash of the hash of data
    Bytes data_id;
    Bytes data;

    static constexpr MessageType kType{MessageType::kStoreData};

    friend bool operator==(const StoreDataMessage&, const StoreDataMessage&) = default;
};

DecodingResult decode(ByteView& from, StoreDataMessage& to, codec::Leftover mode = codec::Leftover::kProhibit) noexcept;

}  // namespace chordwire::chord
