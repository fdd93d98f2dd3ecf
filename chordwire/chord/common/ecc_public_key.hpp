// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <chordwire/core/common/base.hpp>
#include <chordwire/core/common/bytes.hpp>

namespace chordwire::chord {

//! secp256k1 public key of a Chord node
class EccPublicKey {
  public:
    //! \param data the libsecp256k1 internal representation (64 bytes, not the wire form)
    explicit EccPublicKey(Bytes data) : data_(std::move(data)) {}

    //! SEC1 form: 0x04 || X || Y, or the 33-byte compressed form
    Bytes serialized_std(bool is_compressed = false) const;

    //! Wire form carried in peer records: X || Y, 64 bytes
    Bytes serialized() const;
    std::string hex() const;

    //! \throws std::invalid_argument if the data is not a valid key
    static EccPublicKey deserialize_std(ByteView serialized_data);
    //! \throws std::invalid_argument if the data is not a valid 64-byte wire key
    static EccPublicKey deserialize(ByteView serialized_data);
    static EccPublicKey deserialize_hex(std::string_view hex);

    friend bool operator==(const EccPublicKey&, const EccPublicKey&) = default;

  private:
    Bytes data_;
};

}  // namespace chordwire::chord
