// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chordwire/core/common/bytes.hpp>

namespace chordwire::chord {

Bytes random_bytes(Bytes::size_type size);

}  // namespace chordwire::chord
