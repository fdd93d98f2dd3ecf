// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include <stdexcept>
#include <type_traits>
#include <vector>

#include <catch2/catch.hpp>

#include <chordwire/core/common/util.hpp>
#include <chordwire/infra/common/decoding_exception.hpp>

#include "any_message.hpp"
#include "message.hpp"

namespace chordwire::chord {

static Bytes operator""_hex(const char* in, std::size_t n) {
    return *from_hex(std::string_view{in, n});
}

static std::vector<AnyMessage> sample_messages() {
    return {
        RelayMessage::wrap(7, GetPeersMessage{4000}),
        NodeInfoMessage{"10.0.0.1:4000"},
        NodeInfoMessage{""},
        GetPeersMessage{4000},
        PeerListMessage{{PeerRecord{"10.0.0.2:4000", "0102"_hex, "aabbcc"_hex}}},
        PeerListMessage{},
        FindNodeMessage{"00112233445566778899aabbccddeeff00112233"_hex, DataMode::kGet},
        FindNodeMessage{{}, DataMode::kStore},
        GetDataMessage{"cafe"_hex},
        DataResponseMessage{"cafe"_hex, "0123456789"_hex},
        DataResponseMessage{{}, {}},
        DataPresenceMessage{true},
        StoreDataMessage{"beef"_hex, "00"_hex},
        DataStoredMessage{false},
        StorageInterestMessage{true},
    };
}

TEST_CASE("Message wire format", "[chordwire][chord][messages]") {
    CHECK(to_hex(GetPeersMessage{4000}.encode()) == "7300000fa0");
    CHECK(to_hex(NodeInfoMessage{"ab"}.encode()) == "6e000000026162");
    CHECK(to_hex(FindNodeMessage{"aabb"_hex, DataMode::kGet}.encode()) == "9600000002aabb0a");
    CHECK(to_hex(GetDataMessage{"01"_hex}.encode()) == "a00000000101");
    CHECK(to_hex(DataResponseMessage{"01"_hex, "0203"_hex}.encode()) == "a20000000101000000020203");
    CHECK(to_hex(DataPresenceMessage{true}.encode()) == "a501");
    CHECK(to_hex(StoreDataMessage{"01"_hex, {}}.encode()) == "aa000000010100000000");
    CHECK(to_hex(DataStoredMessage{false}.encode()) == "ac00");
    CHECK(to_hex(StorageInterestMessage{true}.encode()) == "af01");
}

TEST_CASE("Message round trip", "[chordwire][chord][messages]") {
    for (const auto& message : sample_messages()) {
        const Bytes encoded{encode_message(message)};
        REQUIRE(!encoded.empty());
        const auto tag{peek_type(encoded)};
        REQUIRE(tag);
        CHECK(*tag == static_cast<uint8_t>(message_type(message)));

        const auto decoded{decode_message(encoded)};
        REQUIRE(decoded);
        CHECK(*decoded == message);

        std::visit(
            [&](const auto& m) {
                using Message = std::decay_t<decltype(m)>;
                CHECK(Message::decode(encoded) == m);
            },
            message);
    }
}

TEST_CASE("Message type mismatch", "[chordwire][chord][messages]") {
    const auto samples{sample_messages()};
    for (const auto& actual : samples) {
        const Bytes encoded{encode_message(actual)};
        for (const auto& expected : samples) {
            if (message_type(actual) == message_type(expected)) {
                continue;
            }
            std::visit(
                [&](const auto& m) {
                    std::decay_t<decltype(m)> decoded;
                    ByteView view{encoded};
                    const DecodingResult res{decode(view, decoded)};
                    REQUIRE(!res);
                    CHECK(res.error() == DecodingError::kUnexpectedMessageType);
                },
                expected);
        }
    }
}

TEST_CASE("Message truncation", "[chordwire][chord][messages]") {
    for (const auto& message : sample_messages()) {
        const Bytes encoded{encode_message(message)};
        for (size_t size{0}; size < encoded.size(); ++size) {
            const auto decoded{decode_message(ByteView{encoded.data(), size})};
            REQUIRE(!decoded);
            CHECK(decoded.error() == DecodingError::kInputTooShort);
        }
    }
}

TEST_CASE("Message trailing bytes", "[chordwire][chord][messages]") {
    const Bytes encoded{"a50100"_hex};
    CHECK(decode_message(encoded).error() == DecodingError::kInputTooLong);

    ByteView view{encoded};
    DataPresenceMessage message;
    CHECK(decode(view, message, codec::Leftover::kAllow));
    CHECK(message.data_present);
    CHECK(view.size() == 1);
}

TEST_CASE("Boolean fields", "[chordwire][chord][messages]") {
    SECTION("any non-zero byte is true") {
        CHECK(DataPresenceMessage::decode("a5ff"_hex).data_present);
        CHECK(DataStoredMessage::decode("ac02"_hex).stored);
        CHECK_FALSE(StorageInterestMessage::decode("af00"_hex).will_store);
    }

    SECTION("encoding is canonical") {
        const auto message{DataPresenceMessage::decode("a5ff"_hex)};
        CHECK(to_hex(message.encode()) == "a501");
    }
}

TEST_CASE("FindNodeMessage data mode", "[chordwire][chord][messages]") {
    CHECK(FindNodeMessage::decode("960000000000"_hex).data_mode == DataMode::kNone);
    CHECK(FindNodeMessage::decode("96000000000a"_hex).data_mode == DataMode::kGet);
    CHECK(FindNodeMessage::decode("960000000014"_hex).data_mode == DataMode::kStore);

    for (const auto invalid : {"960000000001"_hex, "960000000015"_hex, "9600000000ff"_hex}) {
        CHECK(decode_message(invalid).error() == DecodingError::kInvalidDataMode);
    }

    CHECK(data_mode_name(DataMode::kStore) == "Store");
}

TEST_CASE("String fields must be UTF-8", "[chordwire][chord][messages]") {
    CHECK(decode_message("6e00000002c328"_hex).error() == DecodingError::kInvalidString);
    CHECK(NodeInfoMessage::decode("6e00000002c3a9"_hex).sender_address == "\xc3\xa9");

    SECTION("encoding rejects what decoding would reject") {
        CHECK_THROWS_AS(NodeInfoMessage{"\xff\xfe"}.encode(), std::invalid_argument);
        CHECK_THROWS_AS(encode_message(NodeInfoMessage{"10.0.0.1:\xc3"}), std::invalid_argument);

        const PeerListMessage peers{{PeerRecord{"\xff\xfe", "0102"_hex, {}}}};
        CHECK_THROWS_AS(peers.encode(), std::invalid_argument);
        CHECK_THROWS_AS(RelayMessage::wrap(0, peers), std::invalid_argument);
    }

    SECTION("valid multi-byte addresses round trip") {
        const NodeInfoMessage info{"n\xc5\x93ud:4000"};
        CHECK(NodeInfoMessage::decode(info.encode()) == info);

        const PeerListMessage peers{{PeerRecord{"\xe2\x82\xac:4000", "0102"_hex, {}}}};
        CHECK(PeerListMessage::decode(peers.encode()) == peers);
    }
}

TEST_CASE("decode_message dispatch", "[chordwire][chord][messages]") {
    CHECK(decode_message(ByteView{}).error() == DecodingError::kInputTooShort);
    CHECK(decode_message("01"_hex).error() == DecodingError::kUnknownMessageType);
    CHECK(decode_message("6500000000"_hex).error() == DecodingError::kUnknownMessageType);

    const auto decoded{decode_message("7300000fa0"_hex)};
    REQUIRE(decoded);
    REQUIRE(std::holds_alternative<GetPeersMessage>(*decoded));
    CHECK(std::get<GetPeersMessage>(*decoded).sender_port == 4000);
}

TEST_CASE("Throwing decode", "[chordwire][chord][messages]") {
    const Bytes encoded{NodeInfoMessage{"a"}.encode()};
    try {
        [[maybe_unused]] const auto message{GetPeersMessage::decode(encoded)};
        FAIL("expected DecodingException");
    } catch (const DecodingException& ex) {
        CHECK(ex.err() == DecodingError::kUnexpectedMessageType);
    }
    CHECK_THROWS_AS(GetDataMessage::decode("a0000000"_hex), DecodingException);
}

TEST_CASE("describe", "[chordwire][chord][messages]") {
    CHECK(describe(GetPeersMessage{4000}) == "GetPeers sender_port=4000");
    CHECK(describe(NodeInfoMessage{"10.0.0.1:4000"}) == "NodeInfo sender_address=10.0.0.1:4000");
    CHECK(describe(FindNodeMessage{"aabb"_hex, DataMode::kGet}) == "FindNode node_id=aabb data_mode=Get");
    CHECK(describe(DataPresenceMessage{true}) == "DataPresence data_present=true");
    CHECK(describe(DataStoredMessage{false}) == "DataStored stored=false");
    CHECK(describe(DataResponseMessage{"01"_hex, "0203"_hex}) == "DataResponse data_id=01 data_size=2");
    CHECK(describe(RelayMessage::wrap(3, GetPeersMessage{1}, GetPeersMessage{2})) == "Relay index=3 packets=2");
    CHECK(describe(PeerListMessage{{PeerRecord{"h:1", "0102"_hex, {}}}}) == "PeerList peers=1 [h:1 0102]");
}

}  // namespace chordwire::chord
