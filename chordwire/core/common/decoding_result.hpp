// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <tl/expected.hpp>

namespace chordwire {

// Error codes for binary field and message decoding
enum class [[nodiscard]] DecodingError {
    kInputTooShort,          // a field declares more bytes than remain in the input
    kInputTooLong,           // trailing bytes after a complete message
    kUnexpectedMessageType,  // tag byte differs from the one expected by the caller
    kUnknownMessageType,     // tag byte not in the message registry
    kInvalidDataMode,        // data mode byte outside of DataMode values
    kInvalidString,          // string field is not valid UTF-8
    kRelayTooDeep,           // relay nesting exceeds the caller's depth limit
};

// TODO(C++23) Switch to std::expected
using DecodingResult = tl::expected<void, DecodingError>;

}  // namespace chordwire
