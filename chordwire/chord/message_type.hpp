// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

#include <magic_enum.hpp>

namespace chordwire::chord {

//! Tag byte leading every Chord message buffer.
//! Numeric values are part of the wire format and must never change.
enum class MessageType : uint8_t {
    kRelay = 100,
    kNodeInfo = 110,
    kGetPeers = 115,
    kPeerList = 120,
    kFindNode = 150,
    kGetData = 160,
    kDataResponse = 162,
    kDataPresence = 165,
    kStoreData = 170,
    kDataStored = 172,
    kStorageInterest = 175,
};

inline constexpr std::array kMessageTypes{
    MessageType::kRelay,
    MessageType::kNodeInfo,
    MessageType::kGetPeers,
    MessageType::kPeerList,
    MessageType::kFindNode,
    MessageType::kGetData,
    MessageType::kDataResponse,
    MessageType::kDataPresence,
    MessageType::kStoreData,
    MessageType::kDataStored,
    MessageType::kStorageInterest,
};

//! Maps a tag byte read from the wire to a known message type
std::optional<MessageType> message_type_from_tag(uint8_t tag) noexcept;

//! Returns the message name without prefix, e.g. "GetPeers"
std::string_view message_type_name(MessageType type) noexcept;

//! Parses a message name as returned by message_type_name (case insensitive)
std::optional<MessageType> message_type_from_name(std::string_view name) noexcept;

}  // namespace chordwire::chord

// Tags lie outside of the default magic_enum range [-128, 128]
template <>
struct magic_enum::customize::enum_range<chordwire::chord::MessageType> {
    static constexpr int min = 0;
    static constexpr int max = UINT8_MAX;
};
