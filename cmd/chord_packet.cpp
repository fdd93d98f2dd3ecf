// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <CLI/CLI.hpp>

#include <chordwire/chord/any_message.hpp>
#include <chordwire/chord/common/ecc_key_pair.hpp>
#include <chordwire/chord/message.hpp>
#include <chordwire/core/common/bytes.hpp>
#include <chordwire/core/common/util.hpp>
#include <chordwire/infra/cli/common.hpp>
#include <chordwire/infra/common/decoding_exception.hpp>
#include <chordwire/infra/common/log.hpp>

using namespace chordwire;
using namespace chordwire::chord;

//! The Chord packet tools
enum class PacketTool {
    kDecode,
    kPeek,
    kSample,
};

//! The overall settings for the Chord packet inspector
struct PacketInspectorSettings {
    log::Settings log_settings;
    PacketTool tool{PacketTool::kDecode};
    //! Hex-encoded packet, optionally 0x-prefixed
    std::string packet_hex;
    //! Message name as printed by peek, e.g. "FindNode"
    std::string sample_name;
    size_t relay_max_depth{kDefaultRelayMaxDepth};
};

//! Parse the command-line arguments into the packet inspector settings
void parse_command_line(int argc, char* argv[], CLI::App& app, PacketInspectorSettings& settings) {
    cmd::common::add_logging_options(app, settings.log_settings);
    app.require_subcommand(1);

    auto decode_cmd = app.add_subcommand("decode", "Decode a packet and print its content");
    decode_cmd->add_option("packet", settings.packet_hex, "The hex-encoded packet")->required();
    decode_cmd->add_option("--relay.max_depth", settings.relay_max_depth, "Max number of nested relay levels to decode")
        ->capture_default_str()
        ->check(CLI::Range(0, 64));

    auto peek_cmd = app.add_subcommand("peek", "Print the message type of a packet");
    peek_cmd->add_option("packet", settings.packet_hex, "The hex-encoded packet")->required();

    auto sample_cmd = app.add_subcommand("sample", "Print the hex encoding of a sample message");
    sample_cmd->add_option("name", settings.sample_name, "The message name, e.g. GetPeers")->required();

    app.parse(argc, argv);

    if (*decode_cmd) {
        settings.tool = PacketTool::kDecode;
    } else if (*peek_cmd) {
        settings.tool = PacketTool::kPeek;
    } else if (*sample_cmd) {
        settings.tool = PacketTool::kSample;
    }
}

Bytes parse_packet(std::string_view hex) {
    auto packet{from_hex(hex)};
    if (!packet) {
        throw std::invalid_argument{"invalid hex packet: " + std::string{hex}};
    }
    return std::move(*packet);
}

void print_packets(const std::vector<DecodedPacket>& packets, size_t depth) {
    for (const auto& packet : packets) {
        std::cout << std::string(2 * depth, ' ') << describe(packet.message) << "\n";
        print_packets(packet.nested, depth + 1);
    }
}

int decode_packet(const PacketInspectorSettings& settings) {
    const Bytes packet{parse_packet(settings.packet_hex)};
    const auto message{decode_message(packet)};
    if (!message) {
        CHORD_ERROR_M("Cannot decode packet", {"size", std::to_string(packet.size()),
                                               "error", std::string{decoding_error_name(message.error())}});
        return -1;
    }
    std::cout << describe(*message) << "\n";

    if (const auto* relay = std::get_if<RelayMessage>(&*message)) {
        const auto packets{decode_relay_packets(*relay, settings.relay_max_depth)};
        if (!packets) {
            CHORD_ERROR_M("Cannot decode relayed packets", {"index", std::to_string(relay->index),
                                                            "error", std::string{decoding_error_name(packets.error())}});
            return -1;
        }
        print_packets(*packets, 1);
    }
    return 0;
}

int peek_packet(const PacketInspectorSettings& settings) {
    const Bytes packet{parse_packet(settings.packet_hex)};
    const auto tag{peek_type(packet)};
    if (!tag) {
        CHORD_ERROR_M("Cannot peek packet", {"error", std::string{decoding_error_name(tag.error())}});
        return -1;
    }
    const auto type{message_type_from_tag(*tag)};
    if (!type) {
        CHORD_ERROR_M("Unknown message type", {"tag", std::to_string(*tag)});
        return -1;
    }
    std::cout << std::to_string(*tag) << " " << message_type_name(*type) << "\n";
    return 0;
}

AnyMessage make_sample(MessageType type) {
    const Bytes node_id(20, 0xab);
    const Bytes data_id(20, 0xcd);
    switch (type) {
        case MessageType::kRelay:
            return RelayMessage::wrap(7, GetPeersMessage{4000}, FindNodeMessage{node_id, DataMode::kGet});
        case MessageType::kNodeInfo:
            return NodeInfoMessage{"127.0.0.1:4000"};
        case MessageType::kGetPeers:
            return GetPeersMessage{4000};
        case MessageType::kPeerList:
            return PeerListMessage{{LocalPeer{"127.0.0.1:4001", node_id, EccKeyPair{}}}};
        case MessageType::kFindNode:
            return FindNodeMessage{node_id, DataMode::kStore};
        case MessageType::kGetData:
            return GetDataMessage{data_id};
        case MessageType::kDataResponse:
            return DataResponseMessage{data_id, string_to_bytes("chord")};
        case MessageType::kDataPresence:
            return DataPresenceMessage{true};
        case MessageType::kStoreData:
            return StoreDataMessage{data_id, string_to_bytes("chord")};
        case MessageType::kDataStored:
            return DataStoredMessage{true};
        case MessageType::kStorageInterest:
            return StorageInterestMessage{false};
    }
    throw std::invalid_argument{"unknown message type: " + std::to_string(static_cast<int>(type))};
}

int sample_packet(const PacketInspectorSettings& settings) {
    const auto type{message_type_from_name(settings.sample_name)};
    if (!type) {
        CHORD_ERROR_M("Unknown message name", {"name", settings.sample_name});
        return -1;
    }
    const AnyMessage message{make_sample(*type)};
    CHORD_DEBUG_M("Sample message", {"message", describe(message)});
    std::cout << to_hex(encode_message(message)) << "\n";
    return 0;
}

int main(int argc, char* argv[]) {
    CLI::App app{"Chord packet inspector"};

    try {
        PacketInspectorSettings settings;
        parse_command_line(argc, argv, app, settings);

        log::init(settings.log_settings);

        switch (settings.tool) {
            case PacketTool::kDecode:
                return decode_packet(settings);
            case PacketTool::kPeek:
                return peek_packet(settings);
            case PacketTool::kSample:
                return sample_packet(settings);
        }
        return 0;
    } catch (const CLI::ParseError& pe) {
        return app.exit(pe);
    } catch (const std::exception& e) {
        CHORD_CRIT << "Chord packet inspector exiting due to exception: " << e.what();
        return -2;
    }
}
