// This file is part of DYNSHA.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <dynsha/common/bit.h>
#include <dynsha/core/basic_errors.h>
#include <dynsha/sha256/word.h>
#include <algorithm>

namespace dynsha::sha256 {

auto bytes_to_words(BytesView bytes) -> Result<std::vector<Word>> {
  if (bytes.size() % bytes_per_word) {
    return err_malformed_length.with("byte length must be a multiple of {}: {}", bytes_per_word, bytes.size());
  }
  std::vector<Word> words(bytes.size() / bytes_per_word);
  for (size_t i = 0; i < words.size(); ++i) {
    words[i] = load_be32(bytes.data() + i * bytes_per_word);
  }
  return words;
}

auto words_to_bytes(std::span<const Word> words) -> Bytes {
  Bytes bytes(words.size() * bytes_per_word);
  for (size_t i = 0; i < words.size(); ++i) {
    store_be32(bytes.data() + i * bytes_per_word, words[i]);
  }
  return bytes;
}

auto split_into_blocks(BytesView bytes) -> Result<std::vector<MessageBlock>> {
  if (bytes.size() % block_size) {
    return err_malformed_length.with("array length must be a multiple of {} words: {} bytes", words_per_block,
      bytes.size());
  }
  auto words = bytes_to_words(bytes);
  if (!words) {
    return words.error();
  }
  std::vector<MessageBlock> blocks(bytes.size() / block_size);
  for (size_t i = 0; i < blocks.size(); ++i) {
    std::copy_n(words.value().begin() + i * words_per_block, words_per_block, blocks[i].begin());
  }
  return blocks;
}

auto to_hash_state(const Digest& precomputed) -> HashState {
  HashState state;
  for (size_t i = 0; i < state.size(); ++i) {
    state[i] = load_be32(precomputed.data() + i * bytes_per_word);
  }
  return state;
}

auto to_digest(const HashState& state) -> Digest {
  Digest digest;
  for (size_t i = 0; i < state.size(); ++i) {
    store_be32(digest.data() + i * bytes_per_word, state[i]);
  }
  return digest;
}

} // namespace dynsha::sha256
