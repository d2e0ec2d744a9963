// This file is part of DYNSHA.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <dynsha/core/basic_errors.h>
#include <dynsha/sha256/padding.h>

namespace dynsha::sha256 {

auto verify_zero_padding(std::span<const Word> message_words, Index digest_index, Cost* cost) -> Result<void> {
  auto start = padding_start(digest_index);
  uint64_t violations = 0;
  size_t first = 0;
  for (size_t i = 0; i < message_words.size(); ++i) {
    auto violation = static_cast<uint64_t>(i >= start) & static_cast<uint64_t>(message_words[i] != 0);
    auto take = violation & static_cast<uint64_t>(violations == 0);
    first = take ? i : first;
    violations += violation;
  }
  if (cost) {
    cost->padding_words += message_words.size();
  }
  if (violations) {
    return err_padding_violation.with("padding error at index {}: expected zero", first);
  }
  return success();
}

auto verify_terminal_block(std::span<const Word> message_words, Index digest_index, Cost* cost) -> Result<void> {
  auto end = padding_start(digest_index);
  auto begin = end - words_per_block;
  Word acc = 0;
  for (size_t i = 0; i < message_words.size(); ++i) {
    auto in_block = static_cast<Word>(i >= begin) & static_cast<Word>(i < end);
    acc |= message_words[i] & (Word(0) - in_block);
  }
  if (cost) {
    cost->padding_words += message_words.size();
  }
  if (!acc) {
    return err_padding_violation.with("padding error at index {}: final content block is empty", begin);
  }
  return success();
}

} // namespace dynsha::sha256
