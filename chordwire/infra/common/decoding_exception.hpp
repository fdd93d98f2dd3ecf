// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include <chordwire/core/common/decoding_result.hpp>

namespace chordwire {

class DecodingException : public std::runtime_error {
  public:
    explicit DecodingException(DecodingError err, const std::string& message = "");

    DecodingError err() const noexcept { return err_; }

  private:
    DecodingError err_;
};

//! \brief Returns the symbolic name of a decoding error, e.g. "kInputTooShort"
std::string_view decoding_error_name(DecodingError err) noexcept;

//! Throws DecodingException carrying the error of a failed DecodingResult
inline void success_or_throw(const DecodingResult& res, const std::string& error_message = "") {
    if (!res) {
        throw DecodingException(res.error(), error_message);
    }
}

}  // namespace chordwire
