// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "ecc_key_pair.hpp"

#include <stdexcept>
#include <utility>

#include <chordwire/core/common/util.hpp>
#include <chordwire/infra/common/secp256k1_context.hpp>

#include "random.hpp"

namespace chordwire::chord {

EccKeyPair::EccKeyPair() {
    const SecP256K1Context ctx;
    // Almost every 32-byte string is a valid key, retry on the rare miss
    do {
        private_key_ = random_bytes(SecP256K1Context::kPrivateKeySize);
    } while (!ctx.is_valid_private_key(private_key_));
}

EccKeyPair::EccKeyPair(Bytes private_key_data) : private_key_(std::move(private_key_data)) {
    const SecP256K1Context ctx;
    if (!ctx.is_valid_private_key(private_key_)) {
        throw std::invalid_argument("EccKeyPair: invalid private key");
    }
}

EccPublicKey EccKeyPair::public_key() const {
    const SecP256K1Context ctx{SecP256K1Context::kSign};
    const auto public_key{ctx.derive_public_key(private_key_)};
    if (!public_key) {
        throw std::runtime_error("EccKeyPair: cannot derive the public key");
    }
    return EccPublicKey{Bytes{public_key->data, sizeof(public_key->data)}};
}

std::string EccKeyPair::private_key_hex() const {
    return to_hex(private_key_);
}

}  // namespace chordwire::chord
