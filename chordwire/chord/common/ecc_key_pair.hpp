// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include <chordwire/core/common/base.hpp>
#include <chordwire/core/common/bytes.hpp>

#include "ecc_public_key.hpp"

namespace chordwire::chord {

//! Signing key material of a node managed locally
class EccKeyPair {
  public:
    //! Generates a random valid private key
    EccKeyPair();
    explicit EccKeyPair(Bytes private_key_data);

    EccPublicKey public_key() const;

    ByteView private_key() const { return private_key_; }

    std::string private_key_hex() const;

    friend bool operator==(const EccKeyPair&, const EccKeyPair&) = default;

  private:
    Bytes private_key_;
};

}  // namespace chordwire::chord
