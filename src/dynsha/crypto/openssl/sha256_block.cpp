// This file is part of DYNSHA.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
// SHA256_Transform and SHA256_CTX are deprecated in OpenSSL 3 but remain the only
// public way to apply the compression function to a caller-supplied chaining value.
#define OPENSSL_SUPPRESS_DEPRECATED
#include <dynsha/common/check.h>
#include <dynsha/crypto/openssl/sha256_block.h>
#include <openssl/sha.h>
#include <algorithm>

namespace dynsha::openssl {

void sha256_transform(std::array<uint32_t, 8>& state, BytesView block) {
  check(block.size() == SHA256_CBLOCK, "invalid block size: {}", block.size());
  SHA256_CTX ctx;
  SHA256_Init(&ctx);
  std::copy(state.begin(), state.end(), ctx.h);
  SHA256_Transform(&ctx, block.data());
  std::copy(ctx.h, ctx.h + 8, state.begin());
}

auto sha256_absorb(BytesView blocks) -> std::array<uint32_t, 8> {
  check(blocks.size() % SHA256_CBLOCK == 0, "input is not block aligned: {}", blocks.size());
  SHA256_CTX ctx;
  SHA256_Init(&ctx);
  SHA256_Update(&ctx, blocks.data(), blocks.size());
  std::array<uint32_t, 8> state{};
  std::copy(ctx.h, ctx.h + 8, state.begin());
  return state;
}

} // namespace dynsha::openssl
