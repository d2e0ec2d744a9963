// This file is part of DYNSHA.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <dynsha/core/basic_errors.h>
#include <dynsha/crypto/hash/sha2.h>
#include <dynsha/crypto/openssl/sha256_block.h>

namespace dynsha::crypto {

auto Sha256::init() -> Sha256& {
  MessageDigest::init(EVP_sha256());
  return *this;
}

auto Sha256::update(BytesView in) -> Sha256& {
  if (!ctx) {
    init();
  }
  MessageDigest::update(in);
  return *this;
}

void Sha256::final(BytesViewMut out) {
  if (!ctx) {
    init();
  }
  MessageDigest::final(out);
}

auto Sha256::digest_size() const -> size_t {
  return MessageDigest::digest_size(EVP_sha256());
}

void sha256_compress(std::array<uint32_t, 8>& state, BytesView block) {
  openssl::sha256_transform(state, block);
}

auto sha256_midstate(BytesView prefix) -> Result<std::array<uint32_t, 8>> {
  if (prefix.size() % 64) {
    return err_malformed_length.with("prefix length must be a multiple of 64: {}", prefix.size());
  }
  return openssl::sha256_absorb(prefix);
}

} // namespace dynsha::crypto
