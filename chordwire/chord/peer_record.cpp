// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "peer_record.hpp"

#include <chordwire/core/codec/encode.hpp>
#include <chordwire/core/common/overloaded.hpp>
#include <chordwire/infra/common/ensure.hpp>

namespace chordwire::chord {

Bytes LocalPeer::signing_public_bytes() const {
    return node_key.public_key().serialized();
}

PeerRecord to_record(const PeerEntry& peer) {
    ensure(!peer.valueless_by_exception(), "to_record: unsupported peer entry");
    return std::visit(
        Overloaded{
            [](const PeerRecord& record) { return record; },
            [](const LocalPeer& local) {
                return PeerRecord{local.address, local.node_id, local.signing_public_bytes()};
            },
        },
        peer);
}

void encode(Bytes& to, const PeerEntry& peer) {
    ensure(!peer.valueless_by_exception(), "encode: unsupported peer entry");
    std::visit(
        Overloaded{
            [&to](const PeerRecord& record) {
                codec::encode(to, record.address, record.node_id, record.stored_public_bytes());
            },
            [&to](const LocalPeer& local) {
                codec::encode(to, local.address, local.node_id, local.signing_public_bytes());
            },
        },
        peer);
}

size_t length(const PeerEntry& peer) {
    const PeerRecord record{to_record(peer)};
    return codec::length(record.address) + codec::length(record.node_id) + codec::length(record.public_key);
}

DecodingResult decode(ByteView& from, PeerRecord& to, codec::Leftover mode) noexcept {
    return codec::decode_fields(from, mode, to.address, to.node_id, to.public_key);
}

}  // namespace chordwire::chord
