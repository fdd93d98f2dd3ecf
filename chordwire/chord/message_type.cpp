// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "message_type.hpp"

#include <algorithm>
#include <cctype>

namespace chordwire::chord {

static_assert(magic_enum::enum_count<MessageType>() == kMessageTypes.size());

std::optional<MessageType> message_type_from_tag(uint8_t tag) noexcept {
    return magic_enum::enum_cast<MessageType>(tag);
}

std::string_view message_type_name(MessageType type) noexcept {
    std::string_view name{magic_enum::enum_name(type)};
    if (!name.empty()) {
        name.remove_prefix(1);  // 'k'
    }
    return name;
}

std::optional<MessageType> message_type_from_name(std::string_view name) noexcept {
    const auto equals_ignore_case = [](std::string_view a, std::string_view b) {
        return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
            return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
        });
    };
    const auto it{std::ranges::find_if(kMessageTypes, [&](MessageType type) {
        return equals_ignore_case(message_type_name(type), name);
    })};
    if (it == kMessageTypes.end()) {
        return std::nullopt;
    }
    return *it;
}

}  // namespace chordwire::chord
