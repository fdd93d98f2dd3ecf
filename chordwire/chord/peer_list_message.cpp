// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "peer_list_message.hpp"

#include <limits>
#include <string>
#include <utility>
#include <vector>

#include <chordwire/core/codec/encode.hpp>
#include <chordwire/core/common/util.hpp>
#include <chordwire/infra/common/decoding_exception.hpp>
#include <chordwire/infra/common/ensure.hpp>
#include <chordwire/infra/common/log.hpp>

#include "message.hpp"

namespace chordwire::chord {

// address, node_id and public key prefixes
static constexpr size_t kMinPeerRecordSize{3 * kLengthPrefixSize};

Bytes PeerListMessage::encode() const {
    ensure(peers.size() <= std::numeric_limits<uint32_t>::max(),
           [&]() { return "PeerListMessage: too many peers: " + std::to_string(peers.size()); });
    Bytes to;
    encode_type(to, kType);
    codec::encode(to, static_cast<uint32_t>(peers.size()));
    for (const auto& peer : peers) {
        chord::encode(to, peer);
    }
    return to;
}

PeerListMessage PeerListMessage::decode(ByteView data) {
    PeerListMessage message;
    success_or_throw(chord::decode(data, message), "Failed to decode PeerListMessage");
    for (const auto& peer : message.peers) {
        const auto& record{std::get<PeerRecord>(peer)};
        CHORD_TRACE_M("PeerListMessage::decode", {"address", record.address, "node_id", to_hex(record.node_id)});
    }
    return message;
}

// On failure neither from nor to is modified
DecodingResult decode(ByteView& from, PeerListMessage& to, codec::Leftover mode) noexcept {
    ByteView cursor{from};
    uint32_t count{0};
    if (DecodingResult res{decode_fields(cursor, PeerListMessage::kType, codec::Leftover::kAllow, count)}; !res) {
        return res;
    }
    if (count > cursor.size() / kMinPeerRecordSize) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }

    std::vector<PeerEntry> peers;
    peers.reserve(count);
    for (uint32_t i{0}; i < count; ++i) {
        PeerRecord record;
        if (DecodingResult res{decode(cursor, record, codec::Leftover::kAllow)}; !res) {
            return res;
        }
        peers.emplace_back(std::move(record));
    }

    if (mode != codec::Leftover::kAllow && !cursor.empty()) {
        return tl::unexpected{DecodingError::kInputTooLong};
    }
    to.peers = std::move(peers);
    from = cursor;
    return {};
}

}  // namespace chordwire::chord
