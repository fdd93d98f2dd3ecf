// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "decoding_exception.hpp"

#include <string>

#include <catch2/catch.hpp>

namespace chordwire {

TEST_CASE("decoding_error_name", "[chordwire][infra][decoding_exception]") {
    CHECK(decoding_error_name(DecodingError::kInputTooShort) == "kInputTooShort");
    CHECK(decoding_error_name(DecodingError::kUnexpectedMessageType) == "kUnexpectedMessageType");
    CHECK(decoding_error_name(DecodingError::kRelayTooDeep) == "kRelayTooDeep");
}

TEST_CASE("DecodingException", "[chordwire][infra][decoding_exception]") {
    const DecodingException plain{DecodingError::kInvalidDataMode};
    CHECK(plain.err() == DecodingError::kInvalidDataMode);
    CHECK(std::string{plain.what()} == "Decoding error : kInvalidDataMode");

    const DecodingException with_message{DecodingError::kInputTooLong, "Failed to decode GetPeersMessage"};
    CHECK(std::string{with_message.what()} == "Failed to decode GetPeersMessage : kInputTooLong");
}

TEST_CASE("success_or_throw", "[chordwire][infra][decoding_exception]") {
    CHECK_NOTHROW(success_or_throw(DecodingResult{}));
    CHECK_THROWS_AS(success_or_throw(DecodingResult{tl::unexpected{DecodingError::kInvalidString}}), DecodingException);

    CHECK_THROWS_MATCHES(success_or_throw(DecodingResult{tl::unexpected{DecodingError::kInputTooShort}}, "peek"),
                         DecodingException,
                         Catch::Matchers::Message("peek : kInputTooShort"));
}

}  // namespace chordwire
