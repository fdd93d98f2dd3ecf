// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "message_type.hpp"

#include <set>

#include <catch2/catch.hpp>

#include "message.hpp"

namespace chordwire::chord {

TEST_CASE("MessageType tags", "[chordwire][chord][message_type]") {
    CHECK(static_cast<uint8_t>(MessageType::kRelay) == 100);
    CHECK(static_cast<uint8_t>(MessageType::kNodeInfo) == 110);
    CHECK(static_cast<uint8_t>(MessageType::kGetPeers) == 115);
    CHECK(static_cast<uint8_t>(MessageType::kPeerList) == 120);
    CHECK(static_cast<uint8_t>(MessageType::kFindNode) == 150);
    CHECK(static_cast<uint8_t>(MessageType::kGetData) == 160);
    CHECK(static_cast<uint8_t>(MessageType::kDataResponse) == 162);
    CHECK(static_cast<uint8_t>(MessageType::kDataPresence) == 165);
    CHECK(static_cast<uint8_t>(MessageType::kStoreData) == 170);
    CHECK(static_cast<uint8_t>(MessageType::kDataStored) == 172);
    CHECK(static_cast<uint8_t>(MessageType::kStorageInterest) == 175);

    std::set<uint8_t> tags;
    for (const auto type : kMessageTypes) {
        tags.insert(static_cast<uint8_t>(type));
    }
    CHECK(tags.size() == kMessageTypes.size());
}

TEST_CASE("message_type_from_tag", "[chordwire][chord][message_type]") {
    for (const auto type : kMessageTypes) {
        CHECK(message_type_from_tag(static_cast<uint8_t>(type)) == type);
    }
    CHECK_FALSE(message_type_from_tag(0));
    CHECK_FALSE(message_type_from_tag(101));
    CHECK_FALSE(message_type_from_tag(255));
}

TEST_CASE("message_type_name", "[chordwire][chord][message_type]") {
    CHECK(message_type_name(MessageType::kRelay) == "Relay");
    CHECK(message_type_name(MessageType::kStorageInterest) == "StorageInterest");

    CHECK(message_type_from_name("GetPeers") == MessageType::kGetPeers);
    CHECK(message_type_from_name("getpeers") == MessageType::kGetPeers);
    CHECK(message_type_from_name("DATASTORED") == MessageType::kDataStored);
    CHECK_FALSE(message_type_from_name("GetPeer"));
    CHECK_FALSE(message_type_from_name(""));
}

TEST_CASE("Message envelope", "[chordwire][chord][message_type]") {
    SECTION("peek_type") {
        const Bytes data{0x73, 0x00};
        CHECK(peek_type(data) == 0x73);
        CHECK(peek_type(ByteView{}).error() == DecodingError::kInputTooShort);
    }

    SECTION("decode_type") {
        const Bytes data{0x73, 0x00};
        ByteView view{data};
        CHECK(decode_type(view, MessageType::kNodeInfo).error() == DecodingError::kUnexpectedMessageType);
        CHECK(view.size() == 2);
        CHECK(decode_type(view, MessageType::kGetPeers));
        CHECK(view.size() == 1);

        ByteView empty;
        CHECK(decode_type(empty, MessageType::kGetPeers).error() == DecodingError::kInputTooShort);
    }

    SECTION("encode_fields") {
        CHECK(encode_fields(MessageType::kGetPeers, uint32_t{4000}) == Bytes{0x73, 0x00, 0x00, 0x0f, 0xa0});
    }
}

}  // namespace chordwire::chord
