// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "secp256k1_context.hpp"

#include <stdexcept>

namespace chordwire {

SecP256K1Context::SecP256K1Context(unsigned int capabilities)
    : context_{secp256k1_context_create(capabilities)} {
    if (!context_) {
        throw std::runtime_error("SecP256K1Context: secp256k1_context_create failed");
    }
}

SecP256K1Context::~SecP256K1Context() {
    secp256k1_context_destroy(context_);
}

bool SecP256K1Context::is_valid_private_key(ByteView private_key) const {
    return private_key.size() == kPrivateKeySize && secp256k1_ec_seckey_verify(context_, private_key.data()) == 1;
}

std::optional<secp256k1_pubkey> SecP256K1Context::derive_public_key(ByteView private_key) const {
    if (!is_valid_private_key(private_key)) {
        return std::nullopt;
    }
    secp256k1_pubkey public_key;
    if (!secp256k1_ec_pubkey_create(context_, &public_key, private_key.data())) {
        return std::nullopt;
    }
    return public_key;
}

Bytes SecP256K1Context::serialize_public_key(const secp256k1_pubkey& public_key, bool is_compressed) const {
    size_t size{is_compressed ? kPublicKeySizeCompressed : kPublicKeySizeUncompressed};
    Bytes data(size, 0);
    const unsigned int flags{is_compressed ? SECP256K1_EC_COMPRESSED : SECP256K1_EC_UNCOMPRESSED};
    secp256k1_ec_pubkey_serialize(context_, data.data(), &size, &public_key, flags);
    data.resize(size);
    return data;
}

std::optional<secp256k1_pubkey> SecP256K1Context::parse_public_key(ByteView data) const {
    secp256k1_pubkey public_key;
    if (!secp256k1_ec_pubkey_parse(context_, &public_key, data.data(), data.size())) {
        return std::nullopt;
    }
    return public_key;
}

}  // namespace chordwire
