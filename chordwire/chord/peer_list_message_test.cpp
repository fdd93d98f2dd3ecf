// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "peer_list_message.hpp"

#include <stdexcept>
#include <string>

#include <catch2/catch.hpp>

#include <chordwire/core/common/util.hpp>
#include <chordwire/infra/common/decoding_exception.hpp>
#include <chordwire/infra/common/log.hpp>
#include <chordwire/infra/test_util/log.hpp>

namespace chordwire::chord {

static const Bytes kPrivateKey{*from_hex("289c2857d4598e37fb9647507e47a309d6133539bf21a8b9cb6df88fd5232032")};

TEST_CASE("PeerListMessage wire format", "[chordwire][chord][peer_list]") {
    SECTION("empty") {
        const PeerListMessage message;
        CHECK(to_hex(message.encode()) == "7800000000");
        CHECK(PeerListMessage::decode(*from_hex("7800000000")).peers.empty());
    }

    SECTION("one record") {
        const PeerListMessage message{{PeerRecord{"a", *from_hex("01"), *from_hex("02")}}};
        CHECK(to_hex(message.encode()) == "7800000001000000016100000001010000000102");
    }
}

TEST_CASE("PeerListMessage peer adapter", "[chordwire][chord][peer_list]") {
    const EccKeyPair node_key{kPrivateKey};
    const LocalPeer local{"10.0.0.1:4000", *from_hex("aa55"), node_key};
    const PeerRecord record{"10.0.0.1:4000", *from_hex("aa55"), node_key.public_key().serialized()};

    SECTION("local peer is written with its derived public key") {
        CHECK(local.signing_public_bytes().size() == 64);
        CHECK(to_hex(local.signing_public_bytes()) == node_key.public_key().hex());

        const Bytes from_local{PeerListMessage{{local}}.encode()};
        const Bytes from_record{PeerListMessage{{record}}.encode()};
        CHECK(from_local == from_record);
        CHECK(to_record(local) == record);
        CHECK(length(local) == length(record));
    }

    SECTION("decoding always yields peer records") {
        const auto decoded{PeerListMessage::decode(PeerListMessage{{local, record}}.encode())};
        REQUIRE(decoded.peers.size() == 2);
        for (const auto& peer : decoded.peers) {
            REQUIRE(std::holds_alternative<PeerRecord>(peer));
            CHECK(std::get<PeerRecord>(peer) == record);
        }
    }

    SECTION("decoded public key parses back into the node key") {
        const auto decoded{PeerListMessage::decode(PeerListMessage{{local}}.encode())};
        const auto& public_key{std::get<PeerRecord>(decoded.peers.at(0)).public_key};
        CHECK(EccPublicKey::deserialize(public_key) == node_key.public_key());
    }

    SECTION("stored key bytes are written as-is") {
        const PeerRecord odd{"b", {}, *from_hex("0102030405")};
        const auto decoded{PeerListMessage::decode(PeerListMessage{{odd}}.encode())};
        CHECK(std::get<PeerRecord>(decoded.peers.at(0)).public_key == odd.public_key);
    }
}

TEST_CASE("PeerListMessage rejects unsupported peer entries", "[chordwire][chord][peer_list]") {
    struct ThrowingKey {
        operator EccKeyPair() const { throw std::runtime_error("no key"); }
    };

    PeerEntry entry{PeerRecord{"a", {}, {}}};
    CHECK_THROWS_AS(entry.emplace<LocalPeer>(std::string{"a"}, Bytes{}, ThrowingKey{}), std::runtime_error);
    REQUIRE(entry.valueless_by_exception());

    const PeerListMessage message{{entry}};
    CHECK_THROWS_AS(message.encode(), std::logic_error);
    CHECK_THROWS_AS(to_record(entry), std::logic_error);
}

TEST_CASE("PeerListMessage decoding errors", "[chordwire][chord][peer_list]") {
    SECTION("declared count larger than the payload") {
        CHECK_THROWS_AS(PeerListMessage::decode(*from_hex("78ffffffff")), DecodingException);

        PeerListMessage message;
        const Bytes data{*from_hex("780000000200000001610000000000000000")};
        ByteView view{data};
        CHECK(decode(view, message).error() == DecodingError::kInputTooShort);
    }

    SECTION("invalid address") {
        PeerListMessage message;
        const Bytes data{*from_hex("780000000100000001ff0000000000000000")};
        ByteView view{data};
        CHECK(decode(view, message).error() == DecodingError::kInvalidString);
    }

    SECTION("failed decoding leaves message and input untouched") {
        const PeerListMessage original{{PeerRecord{"10.0.0.3:4000", *from_hex("03"), {}}}};
        PeerListMessage message{original};
        const Bytes data{*from_hex("780000000200000001610000000000000000" "00000001ff0000000000000000")};
        ByteView view{data};
        CHECK(decode(view, message).error() == DecodingError::kInvalidString);
        CHECK(message == original);
        CHECK(view.size() == data.size());
    }

    SECTION("trailing bytes") {
        PeerListMessage message;
        const Bytes data{*from_hex("780000000000")};
        ByteView view{data};
        CHECK(decode(view, message).error() == DecodingError::kInputTooLong);
    }
}

TEST_CASE("PeerListMessage logs decoded peers", "[chordwire][chord][peer_list]") {
    test_util::VerbosityGuard guard{log::Level::kTrace};
    test_util::OutputCapture output;

    const PeerListMessage message{{PeerRecord{"10.0.0.9:4000", *from_hex("aa"), {}}}};
    [[maybe_unused]] const auto decoded{PeerListMessage::decode(message.encode())};

    CHECK((output.out() + output.err()).find("10.0.0.9:4000") != std::string::npos);
}

}  // namespace chordwire::chord
