// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

// Peer entries carried by PeerListMessage.
// Two representations share one wire form (address, node_id, public key):
// - PeerRecord: a peer known from the directory, public key stored as raw bytes;
// - LocalPeer: a peer managed locally, public key derived from its secp256k1 key pair.
// Decoding always produces a PeerRecord.

#pragma once

#include <string>
#include <variant>

#include <chordwire/core/codec/decode.hpp>
#include <chordwire/core/common/base.hpp>
#include <chordwire/core/common/bytes.hpp>
#include <chordwire/core/common/decoding_result.hpp>

#include "common/ecc_key_pair.hpp"

namespace chordwire::chord {

struct PeerRecord {
    std::string address;
    Bytes node_id;
    Bytes public_key;

    ByteView stored_public_bytes() const { return public_key; }

    friend bool operator==(const PeerRecord&, const PeerRecord&) = default;
};

struct LocalPeer {
    std::string address;
    Bytes node_id;
    EccKeyPair node_key;

    //! Raw 64-byte public key derived from node_key
    Bytes signing_public_bytes() const;

    friend bool operator==(const LocalPeer&, const LocalPeer&) = default;
};

using PeerEntry = std::variant<PeerRecord, LocalPeer>;

//! Returns the wire form of any peer entry
//! \throws std::logic_error if the entry holds no value
PeerRecord to_record(const PeerEntry& peer);

//! Appends address, node_id and public key of the peer
//! \throws std::logic_error if the entry holds no value
void encode(Bytes& to, const PeerEntry& peer);

size_t length(const PeerEntry& peer);

DecodingResult decode(ByteView& from, PeerRecord& to, codec::Leftover mode = codec::Leftover::kProhibit) noexcept;

}  // namespace chordwire::chord
