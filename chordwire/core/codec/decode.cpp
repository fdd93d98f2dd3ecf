// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "decode.hpp"

#include <chordwire/core/common/bytes.hpp>
#include <chordwire/core/common/endian.hpp>
#include <chordwire/core/common/util.hpp>

namespace chordwire::codec {

static DecodingResult check_leftover(const ByteView& from, Leftover mode) noexcept {
    if (mode != Leftover::kAllow && !from.empty()) {
        return tl::unexpected{DecodingError::kInputTooLong};
    }
    return {};
}

tl::expected<size_t, DecodingError> decode_length(ByteView& from) noexcept {
    if (from.size() < kLengthPrefixSize) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    const size_t payload_length{endian::load_big_u32(from.data())};
    if (from.size() - kLengthPrefixSize < payload_length) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    from.remove_prefix(kLengthPrefixSize);
    return payload_length;
}

DecodingResult decode(ByteView& from, Bytes& to, Leftover mode) noexcept {
    const auto payload_length{decode_length(from)};
    if (!payload_length) {
        return tl::unexpected{payload_length.error()};
    }
    to = from.substr(0, *payload_length);
    from.remove_prefix(*payload_length);
    return check_leftover(from, mode);
}

DecodingResult decode(ByteView& from, std::string& to, Leftover mode) noexcept {
    ByteView view{from};
    const auto payload_length{decode_length(view)};
    if (!payload_length) {
        return tl::unexpected{payload_length.error()};
    }
    const ByteView payload{view.substr(0, *payload_length)};
    if (!is_valid_utf8(payload)) {
        return tl::unexpected{DecodingError::kInvalidString};
    }
    to = byte_view_to_string_view(payload);
    view.remove_prefix(*payload_length);
    from = view;
    return check_leftover(from, mode);
}

DecodingResult decode(ByteView& from, uint32_t& to, Leftover mode) noexcept {
    if (from.size() < sizeof(uint32_t)) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    to = endian::load_big_u32(from.data());
    from.remove_prefix(sizeof(uint32_t));
    return check_leftover(from, mode);
}

DecodingResult decode(ByteView& from, uint8_t& to, Leftover mode) noexcept {
    if (from.empty()) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    to = from[0];
    from.remove_prefix(1);
    return check_leftover(from, mode);
}

DecodingResult decode(ByteView& from, bool& to, Leftover mode) noexcept {
    uint8_t b{0};
    if (DecodingResult res{decode(from, b, mode)}; !res) {
        return res;
    }
    to = (b != kFalseCode);
    return {};
}

tl::expected<std::pair<size_t, Bytes>, DecodingError> decode_blob(ByteView data) noexcept {
    const size_t initial_size{data.size()};
    Bytes blob;
    if (DecodingResult res{decode(data, blob, Leftover::kAllow)}; !res) {
        return tl::unexpected{res.error()};
    }
    return std::make_pair(initial_size - data.size(), std::move(blob));
}

tl::expected<std::pair<size_t, std::string>, DecodingError> decode_string(ByteView data) noexcept {
    const size_t initial_size{data.size()};
    std::string str;
    if (DecodingResult res{decode(data, str, Leftover::kAllow)}; !res) {
        return tl::unexpected{res.error()};
    }
    return std::make_pair(initial_size - data.size(), std::move(str));
}

}  // namespace chordwire::codec
