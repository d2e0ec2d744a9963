// This file is part of DYNSHA.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <dynsha/common/bytes.h>
#include <array>
#include <cstdint>

namespace dynsha::openssl {

/// \cond PRIVATE
// raw access to the SHA-256 chaining value, below the EVP layer
void sha256_transform(std::array<uint32_t, 8>& state, BytesView block);

auto sha256_absorb(BytesView blocks) -> std::array<uint32_t, 8>;
/// \endcond

} // namespace dynsha::openssl
