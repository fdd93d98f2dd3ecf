// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chordwire/core/codec/decode.hpp>
#include <chordwire/core/common/base.hpp>
#include <chordwire/core/common/bytes.hpp>
#include <chordwire/core/common/decoding_result.hpp>

#include "message_type.hpp"

namespace chordwire::chord {

struct GetDataMessage {
    Bytes encode() const;
    static GetDataMessage decode(ByteView data);

    Bytes data_id;

    static constexpr MessageType kType{MessageType::kGetData};

    friend bool operator==(const GetDataMessage&, const GetDataMessage&) = default;
};

DecodingResult decode(ByteView& from, GetDataMessage& to, codec::Leftover mode = codec::Leftover::kProhibit) noexcept;

}  // namespace chordwire::chord
