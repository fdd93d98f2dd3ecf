// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "util.hpp"

namespace chordwire {

std::string to_hex(ByteView bytes, bool with_prefix) {
    static const char* kHexDigits{"0123456789abcdef"};
    std::string out(bytes.size() * 2 + (with_prefix ? 2 : 0), '\0');
    char* dest{&out[0]};
    if (with_prefix) {
        *dest++ = '0';
        *dest++ = 'x';
    }
    for (const auto& b : bytes) {
        *dest++ = kHexDigits[b >> 4];    // Hi
        *dest++ = kHexDigits[b & 0x0f];  // Lo
    }
    return out;
}

std::string abridge(std::string_view input, size_t length) {
    if (input.size() <= length) {
        return std::string(input);
    }
    return std::string(input.substr(0, length)) + "...";
}

std::optional<uint8_t> decode_hex_digit(char ch) noexcept {
    if (ch >= '0' && ch <= '9') {
        return static_cast<uint8_t>(ch - '0');
    }
    if (ch >= 'a' && ch <= 'f') {
        return static_cast<uint8_t>(ch - 'a' + 10);
    }
    if (ch >= 'A' && ch <= 'F') {
        return static_cast<uint8_t>(ch - 'A' + 10);
    }
    return std::nullopt;
}

std::optional<Bytes> from_hex(std::string_view hex) noexcept {
    if (has_hex_prefix(hex)) {
        hex.remove_prefix(2);
    }
    if (hex.empty()) {
        return Bytes{};
    }

    size_t pos(hex.size() & 1);  // "[0x]1" is legit and has to be treated as "[0x]01"
    Bytes out((hex.size() + pos) / 2, '\0');
    uint8_t* dst{&out[0]};

    if (pos) {
        const auto lo{decode_hex_digit(hex[0])};
        if (!lo) {
            return std::nullopt;
        }
        *dst++ = *lo;
    }

    for (size_t i{pos}; i < hex.size(); i += 2) {
        const auto hi{decode_hex_digit(hex[i])};
        const auto lo{decode_hex_digit(hex[i + 1])};
        if (!hi || !lo) {
            return std::nullopt;
        }
        *dst++ = static_cast<uint8_t>((*hi << 4) | *lo);
    }
    return out;
}

bool is_valid_utf8(ByteView data) noexcept {
    size_t i{0};
    while (i < data.size()) {
        const uint8_t lead{data[i]};
        size_t extra{0};
        uint32_t code_point{0};
        uint32_t min_code_point{0};
        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            code_point = lead & 0x1F;
            min_code_point = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            code_point = lead & 0x0F;
            min_code_point = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            code_point = lead & 0x07;
            min_code_point = 0x10000;
        } else {
            return false;
        }
        if (data.size() - i <= extra) {
            return false;
        }
        for (size_t k{1}; k <= extra; ++k) {
            const uint8_t continuation{data[i + k]};
            if ((continuation & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (continuation & 0x3F);
        }
        if (code_point < min_code_point || code_point > 0x10FFFF) {
            return false;
        }
        if (code_point >= 0xD800 && code_point <= 0xDFFF) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

}  // namespace chordwire
