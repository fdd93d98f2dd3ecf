// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chordwire/core/codec/decode.hpp>
#include <chordwire/core/common/base.hpp>
#include <chordwire/core/common/bytes.hpp>
#include <chordwire/core/common/decoding_result.hpp>

#include "message_type.hpp"

namespace chordwire::chord {

struct StorageInterestMessage {
    Bytes encode() const;
    static StorageInterestMessage decode(ByteView data);

    bool will_store{false};

    static constexpr MessageType kType{MessageType::kStorageInterest};

    friend bool operator==(const StorageInterestMessage&, const StorageInterestMessage&) = default;
};

DecodingResult decode(ByteView& from, StorageInterestMessage& to, codec::Leftover mode = codec::Leftover::kProhibit) noexcept;

}  // namespace chordwire::chord
