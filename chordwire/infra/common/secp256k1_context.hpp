// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <secp256k1.h>

#include <gsl/pointers>

#include <chordwire/core/common/base.hpp>
#include <chordwire/core/common/bytes.hpp>

namespace chordwire {

//! RAII owner of a libsecp256k1 context
class SecP256K1Context final {
  public:
    static constexpr size_t kPrivateKeySize{32};
    static constexpr size_t kPublicKeySizeCompressed{33};
    //! SEC1 uncompressed point: 0x04 || X || Y
    static constexpr size_t kPublicKeySizeUncompressed{65};
    //! Uncompressed point without its SEC1 prefix byte
    static constexpr size_t kPublicKeySizeRaw{64};

    //! Operations the context is prepared for
    enum Capability : unsigned int {
        kVerify = SECP256K1_CONTEXT_VERIFY,
        kSign = SECP256K1_CONTEXT_SIGN,
    };

    explicit SecP256K1Context(unsigned int capabilities = kVerify);
    ~SecP256K1Context();

    SecP256K1Context(const SecP256K1Context&) = delete;
    SecP256K1Context& operator=(const SecP256K1Context&) = delete;

    bool is_valid_private_key(ByteView private_key) const;

    //! \return std::nullopt if the private key is invalid
    std::optional<secp256k1_pubkey> derive_public_key(ByteView private_key) const;

    //! \return The SEC1 form of the key, 33 or 65 bytes long
    Bytes serialize_public_key(const secp256k1_pubkey& public_key, bool is_compressed) const;

    //! \return std::nullopt if the data is not a SEC1 encoded point on the curve
    std::optional<secp256k1_pubkey> parse_public_key(ByteView data) const;

  private:
    gsl::owner<secp256k1_context*> context_;
};

}  // namespace chordwire
