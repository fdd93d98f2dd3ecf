// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chordwire/core/codec/decode.hpp>
#include <chordwire/core/common/base.hpp>
#include <chordwire/core/common/bytes.hpp>
#include <chordwire/core/common/decoding_result.hpp>

#include "message_type.hpp"

namespace chordwire::chord {

//! Reply to a GetDataMessage carrying the stored content
struct DataResponseMessage {
    Bytes encode() const;
    static DataResponseMessage decode(ByteView encoded);

    Bytes data_id;
    Bytes data;

    static constexpr MessageType kType{MessageType::kDataResponse};

    friend bool operator==(const DataResponseMessage&, const DataResponseMessage&) = default;
};

DecodingResult decode(ByteView& from, DataResponseMessage& to, codec::Leftover mode = codec::Leftover::kProhibit) noexcept;

}  // namespace chordwire::chord
