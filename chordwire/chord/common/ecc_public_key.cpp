// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "ecc_public_key.hpp"

#include <cstring>
#include <stdexcept>

#include <chordwire/core/common/util.hpp>
#include <chordwire/infra/common/ensure.hpp>
#include <chordwire/infra/common/secp256k1_context.hpp>

namespace chordwire::chord {

static secp256k1_pubkey to_secp256k1(ByteView data) {
    secp256k1_pubkey public_key;
    ensure(data.size() == sizeof(public_key.data), "EccPublicKey: bad internal key size");
    std::memcpy(public_key.data, data.data(), sizeof(public_key.data));
    return public_key;
}

Bytes EccPublicKey::serialized_std(bool is_compressed) const {
    const SecP256K1Context ctx;
    return ctx.serialize_public_key(to_secp256k1(data_), is_compressed);
}

Bytes EccPublicKey::serialized() const {
    return serialized_std(/* is_compressed = */ false).substr(1);
}

std::string EccPublicKey::hex() const {
    return to_hex(serialized());
}

EccPublicKey EccPublicKey::deserialize_std(ByteView serialized_data) {
    const SecP256K1Context ctx;
    const auto public_key{ctx.parse_public_key(serialized_data)};
    if (!public_key) {
        throw std::invalid_argument("EccPublicKey: not a valid secp256k1 public key");
    }
    return EccPublicKey{Bytes{public_key->data, sizeof(public_key->data)}};
}

EccPublicKey EccPublicKey::deserialize(ByteView serialized_data) {
    if (serialized_data.size() != SecP256K1Context::kPublicKeySizeRaw) {
        throw std::invalid_argument("EccPublicKey: raw public key must be 64 bytes");
    }
    Bytes data{SECP256K1_TAG_PUBKEY_UNCOMPRESSED};
    data += serialized_data;
    return deserialize_std(data);
}

EccPublicKey EccPublicKey::deserialize_hex(std::string_view hex) {
    const auto data{from_hex(hex)};
    if (!data) {
        throw std::invalid_argument("EccPublicKey: invalid hex public key");
    }
    return deserialize(*data);
}

}  // namespace chordwire::chord
