// This file is part of DYNSHA.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <dynsha/core/result.h>
#include <dynsha/crypto/hash/hash.h>
#include <dynsha/crypto/openssl/message_digest.h>
#include <array>

namespace dynsha::crypto {

/// \brief generates sha256 hash
/// \ingroup crypto
struct Sha256 : public Hash<Sha256>, openssl::MessageDigest {
  using Hash::final;

  auto init() -> Sha256&;
  auto update(BytesView in) -> Sha256&;
  void final(BytesViewMut out);

  auto digest_size() const -> size_t;
};

/// \brief applies the sha256 compression function to one 64-byte block
/// \param state chaining value, updated in place
/// \param block message block, must be 64 bytes
/// \ingroup crypto
void sha256_compress(std::array<uint32_t, 8>& state, BytesView block);

/// \brief returns the raw chaining value after absorbing a block-aligned prefix
///
/// No padding or length encoding is applied, so the result is an intermediate
/// state from which hashing can be resumed, not a digest.
/// \ingroup crypto
auto sha256_midstate(BytesView prefix) -> Result<std::array<uint32_t, 8>>;

} // namespace dynsha::crypto
