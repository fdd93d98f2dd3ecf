// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "decoding_exception.hpp"

#include <magic_enum.hpp>

namespace chordwire {

DecodingException::DecodingException(DecodingError err, const std::string& message)
    : std::runtime_error{
          message.empty() ? "Decoding error : " + std::string{decoding_error_name(err)}
                          : message + " : " + std::string{decoding_error_name(err)}},
      err_{err} {}

std::string_view decoding_error_name(DecodingError err) noexcept {
    return magic_enum::enum_name(err);
}

}  // namespace chordwire
