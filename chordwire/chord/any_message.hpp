// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

// Closed set of Chord messages and the dispatching entry points working on it.

#pragma once

#include <string>
#include <variant>
#include <vector>

#include <chordwire/core/codec/decode.hpp>
#include <chordwire/core/common/base.hpp>
#include <chordwire/core/common/bytes.hpp>
#include <chordwire/core/common/decoding_result.hpp>

#include "data_presence_message.hpp"
#include "data_response_message.hpp"
#include "data_stored_message.hpp"
#include "find_node_message.hpp"
#include "get_data_message.hpp"
#include "get_peers_message.hpp"
#include "message_type.hpp"
#include "node_info_message.hpp"
#include "peer_list_message.hpp"
#include "relay_message.hpp"
#include "storage_interest_message.hpp"
#include "store_data_message.hpp"

namespace chordwire::chord {

using AnyMessage = std::variant<
    RelayMessage,
    NodeInfoMessage,
    GetPeersMessage,
    PeerListMessage,
    FindNodeMessage,
    GetDataMessage,
    DataResponseMessage,
    DataPresenceMessage,
    StoreDataMessage,
    DataStoredMessage,
    StorageInterestMessage>;

static_assert(std::variant_size_v<AnyMessage> == kMessageTypes.size());

MessageType message_type(const AnyMessage& message);

Bytes encode_message(const AnyMessage& message);

//! \brief Decodes a message of any type, dispatching on its tag byte
//! \return kInputTooShort on an empty buffer, kUnknownMessageType on an unregistered tag
//! or the error of the matching message decoder
tl::expected<AnyMessage, DecodingError> decode_message(ByteView data, codec::Leftover mode = codec::Leftover::kProhibit) noexcept;

//! One relay entry decoded, with the entries of its own relay if it is one
struct DecodedPacket {
    AnyMessage message;
    std::vector<DecodedPacket> nested;
};

inline constexpr size_t kDefaultRelayMaxDepth{8};

//! \brief Decodes every entry of a relay, recursing into nested relays
//! \param max_depth number of nested relay levels accepted below the given relay
//! \return kRelayTooDeep when nesting goes beyond max_depth, or the first entry decoding error
tl::expected<std::vector<DecodedPacket>, DecodingError> decode_relay_packets(
    const RelayMessage& relay, size_t max_depth = kDefaultRelayMaxDepth) noexcept;

//! One-line human-readable rendering, e.g. "GetPeers sender_port=4000"
std::string describe(const AnyMessage& message);

}  // namespace chordwire::chord
