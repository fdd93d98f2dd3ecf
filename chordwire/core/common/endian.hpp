// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/*
Facilities to deal with byte order/endianness
All multi-byte integers on the Chord wire are big endian
See https://en.wikipedia.org/wiki/Endianness
*/

#include <cstdint>

#include <intx/intx.hpp>

#include <chordwire/core/common/bytes.hpp>

namespace chordwire::endian {

// NOLINTBEGIN(readability-identifier-naming)

// Similar to boost::endian::load_big_u32
const auto load_big_u32 = intx::be::unsafe::load<uint32_t>;

// Similar to boost::endian::store_big_u32
const auto store_big_u32 = intx::be::unsafe::store<uint32_t>;

// NOLINTEND(readability-identifier-naming)

//! \brief Appends the big endian form of a uint32_t to a byte string
//! \param [in] to : the byte string to append to
//! \param [in] value : the value to be appended
inline void append_big_u32(Bytes& to, uint32_t value) {
    uint8_t buffer[sizeof(uint32_t)];
    store_big_u32(buffer, value);
    to.append(buffer, sizeof(uint32_t));
}

}  // namespace chordwire::endian
