// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "any_message.hpp"

#include <string_view>
#include <type_traits>
#include <utility>

#include <absl/strings/str_format.h>

#include <chordwire/core/common/overloaded.hpp>
#include <chordwire/core/common/util.hpp>
#include <chordwire/infra/common/ensure.hpp>

#include "message.hpp"

namespace chordwire::chord {

MessageType message_type(const AnyMessage& message) {
    ensure(!message.valueless_by_exception(), "message_type: empty message");
    return std::visit([](const auto& m) { return std::decay_t<decltype(m)>::kType; }, message);
}

Bytes encode_message(const AnyMessage& message) {
    ensure(!message.valueless_by_exception(), "encode_message: empty message");
    return std::visit([](const auto& m) { return m.encode(); }, message);
}

template <typename T>
static tl::expected<AnyMessage, DecodingError> decode_as(ByteView data, codec::Leftover mode) noexcept {
    T message;
    if (DecodingResult res{decode(data, message, mode)}; !res) {
        return tl::unexpected{res.error()};
    }
    return AnyMessage{std::move(message)};
}

tl::expected<AnyMessage, DecodingError> decode_message(ByteView data, codec::Leftover mode) noexcept {
    const auto tag{peek_type(data)};
    if (!tag) {
        return tl::unexpected{tag.error()};
    }
    const auto type{message_type_from_tag(*tag)};
    if (!type) {
        return tl::unexpected{DecodingError::kUnknownMessageType};
    }

    switch (*type) {
        case MessageType::kRelay:
            return decode_as<RelayMessage>(data, mode);
        case MessageType::kNodeInfo:
            return decode_as<NodeInfoMessage>(data, mode);
        case MessageType::kGetPeers:
            return decode_as<GetPeersMessage>(data, mode);
        case MessageType::kPeerList:
            return decode_as<PeerListMessage>(data, mode);
        case MessageType::kFindNode:
            return decode_as<FindNodeMessage>(data, mode);
        case MessageType::kGetData:
            return decode_as<GetDataMessage>(data, mode);
        case MessageType::kDataResponse:
            return decode_as<DataResponseMessage>(data, mode);
        case MessageType::kDataPresence:
            return decode_as<DataPresenceMessage>(data, mode);
        case MessageType::kStoreData:
            return decode_as<StoreDataMessage>(data, mode);
        case MessageType::kDataStored:
            return decode_as<DataStoredMessage>(data, mode);
        case MessageType::kStorageInterest:
            return decode_as<StorageInterestMessage>(data, mode);
    }
    return tl::unexpected{DecodingError::kUnknownMessageType};
}

tl::expected<std::vector<DecodedPacket>, DecodingError> decode_relay_packets(const RelayMessage& relay, size_t max_depth) noexcept {
    std::vector<DecodedPacket> packets;
    packets.reserve(relay.packets.size());
    for (const auto& packet : relay.packets) {
        auto message{decode_message(packet)};
        if (!message) {
            return tl::unexpected{message.error()};
        }
        DecodedPacket decoded{std::move(*message), {}};
        if (const auto* nested_relay = std::get_if<RelayMessage>(&decoded.message)) {
            if (max_depth == 0) {
                return tl::unexpected{DecodingError::kRelayTooDeep};
            }
            auto nested{decode_relay_packets(*nested_relay, max_depth - 1)};
            if (!nested) {
                return tl::unexpected{nested.error()};
            }
            decoded.nested = std::move(*nested);
        }
        packets.emplace_back(std::move(decoded));
    }
    return packets;
}

static std::string_view bool_name(bool b) {
    return b ? "true" : "false";
}

static std::string abridged_hex(ByteView data) {
    return abridge(to_hex(data), 32);
}

std::string describe(const AnyMessage& message) {
    ensure(!message.valueless_by_exception(), "describe: empty message");
    const auto name{message_type_name(message_type(message))};
    const std::string details{std::visit(
        Overloaded{
            [](const RelayMessage& m) {
                return absl::StrFormat("index=%u packets=%u", m.index, m.packets.size());
            },
            [](const NodeInfoMessage& m) {
                return absl::StrFormat("sender_address=%s", m.sender_address);
            },
            [](const GetPeersMessage& m) {
                return absl::StrFormat("sender_port=%u", m.sender_port);
            },
            [](const PeerListMessage& m) {
                std::string out{absl::StrFormat("peers=%u", m.peers.size())};
                for (const auto& peer : m.peers) {
                    const PeerRecord record{to_record(peer)};
                    out += absl::StrFormat(" [%s %s]", record.address, abridged_hex(record.node_id));
                }
                return out;
            },
            [](const FindNodeMessage& m) {
                return absl::StrFormat("node_id=%s data_mode=%s", abridged_hex(m.node_id), data_mode_name(m.data_mode));
            },
            [](const GetDataMessage& m) {
                return absl::StrFormat("data_id=%s", abridged_hex(m.data_id));
            },
            [](const DataResponseMessage& m) {
                return absl::StrFormat("data_id=%s data_size=%u", abridged_hex(m.data_id), m.data.size());
            },
            [](const DataPresenceMessage& m) {
                return absl::StrFormat("data_present=%s", bool_name(m.data_present));
            },
            [](const StoreDataMessage& m) {
                return absl::StrFormat("data_id=%s data_size=%u", abridged_hex(m.data_id), m.data.size());
            },
            [](const DataStoredMessage& m) {
                return absl::StrFormat("stored=%s", bool_name(m.stored));
            },
            [](const StorageInterestMessage& m) {
                return absl::StrFormat("will_store=%s", bool_name(m.will_store));
            },
        },
        message)};
    return absl::StrFormat("%s %s", name, details);
}

}  // namespace chordwire::chord
