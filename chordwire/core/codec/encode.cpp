// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "encode.hpp"

#include <limits>
#include <stdexcept>

#include <chordwire/core/common/bytes.hpp>
#include <chordwire/core/common/endian.hpp>
#include <chordwire/core/common/util.hpp>

namespace chordwire::codec {

void encode(Bytes& to, ByteView blob) {
    if (blob.size() > std::numeric_limits<uint32_t>::max()) {
        throw std::length_error("codec::encode: field does not fit a 4-byte length prefix");
    }
    to.reserve(to.size() + length(blob));
    endian::append_big_u32(to, static_cast<uint32_t>(blob.size()));
    to.append(blob);
}

void encode(Bytes& to, std::string_view str) {
    const ByteView bytes{string_view_to_byte_view(str)};
    if (!is_valid_utf8(bytes)) {
        throw std::invalid_argument("codec::encode: string field is not valid UTF-8");
    }
    encode(to, bytes);
}

void encode(Bytes& to, uint32_t n) {
    endian::append_big_u32(to, n);
}

void encode(Bytes& to, uint8_t b) {
    to.push_back(b);
}

void encode(Bytes& to, bool b) {
    to.push_back(b ? kTrueCode : kFalseCode);
}

Bytes encode_blob(ByteView blob) {
    Bytes to;
    encode(to, blob);
    return to;
}

Bytes encode_string(std::string_view str) {
    Bytes to;
    encode(to, str);
    return to;
}

size_t length(ByteView blob) noexcept {
    return kLengthPrefixSize + blob.size();
}

size_t length(std::string_view str) noexcept {
    return kLengthPrefixSize + str.size();
}

}  // namespace chordwire::codec
