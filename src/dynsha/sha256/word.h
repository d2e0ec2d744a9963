// This file is part of DYNSHA.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <dynsha/common/bytes_n.h>
#include <dynsha/core/result.h>
#include <array>
#include <cstdint>
#include <span>
#include <vector>

/// \defgroup sha256 Oblivious SHA-256
/// \brief fixed-cost SHA-256 over variable-length messages

namespace dynsha::sha256 {

/// \addtogroup sha256
/// \{

/// \brief 32-bit word; range is enforced by the type rather than re-proven per operation
using Word = uint32_t;

/// \brief position inside a flattened word sequence, supplied by the caller
using Index = uint32_t;

constexpr size_t bytes_per_word = 4;
constexpr size_t words_per_block = 16;
constexpr size_t words_per_state = 8;
constexpr size_t block_size = bytes_per_word * words_per_block;
constexpr size_t digest_size = bytes_per_word * words_per_state;

/// \brief 512-bit message block
using MessageBlock = std::array<Word, words_per_block>;

/// \brief 256-bit chaining value
using HashState = std::array<Word, words_per_state>;

/// \brief 32-byte digest or precomputed chaining value
using Digest = Bytes32;

/// \brief standard SHA-256 initialization vector
constexpr HashState initial_state = {
  0x6a09e667,
  0xbb67ae85,
  0x3c6ef372,
  0xa54ff53a,
  0x510e527f,
  0x9b05688c,
  0x1f83d9ab,
  0x5be0cd19,
};

/// \brief groups bytes 4-at-a-time into big-endian words
/// \return malformed_length if the byte count is not a multiple of 4
auto bytes_to_words(BytesView bytes) -> Result<std::vector<Word>>;

/// \brief serializes each word as 4 big-endian bytes
auto words_to_bytes(std::span<const Word> words) -> Bytes;

/// \brief splits a padded buffer into 512-bit message blocks
/// \return malformed_length if the byte count is not a multiple of 64
auto split_into_blocks(BytesView bytes) -> Result<std::vector<MessageBlock>>;

/// \brief interprets a precomputed 32-byte chaining value as a hash state
///
/// The value is taken as is; nothing here can tell whether it really is the
/// chaining value of some prefix.
auto to_hash_state(const Digest& precomputed) -> HashState;

auto to_digest(const HashState& state) -> Digest;

/// \brief concatenates fixed-size word groups into one flat sequence
template<size_t N>
auto flatten(const std::vector<std::array<Word, N>>& groups) -> std::vector<Word> {
  std::vector<Word> flat;
  flat.reserve(groups.size() * N);
  for (const auto& group : groups) {
    flat.insert(flat.end(), group.begin(), group.end());
  }
  return flat;
}

/// \}

} // namespace dynsha::sha256
