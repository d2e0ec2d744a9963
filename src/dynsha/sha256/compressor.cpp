// This file is part of DYNSHA.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <dynsha/common/bit.h>
#include <dynsha/crypto/hash/sha2.h>
#include <dynsha/sha256/compressor.h>

namespace dynsha::sha256 {

auto OpenSslCompressor::compress(const HashState& state, const MessageBlock& block) const -> HashState {
  std::array<unsigned char, block_size> bytes;
  for (size_t i = 0; i < block.size(); ++i) {
    store_be32(bytes.data() + i * bytes_per_word, block[i]);
  }
  auto next = state;
  crypto::sha256_compress(next, bytes);
  return next;
}

auto default_compressor() -> const Compressor& {
  static const OpenSslCompressor compressor{};
  return compressor;
}

} // namespace dynsha::sha256
