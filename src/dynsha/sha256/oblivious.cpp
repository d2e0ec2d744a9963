// This file is part of DYNSHA.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <dynsha/sha256/oblivious.h>
#include <bit>

namespace dynsha::sha256 {

auto select_run(std::span<const Word> sequence, Index start, size_t run_length, Cost* cost)
  -> Result<std::vector<Word>> {
  auto size = sequence.size();
  if (run_length > size) {
    return err_malformed_length.with("run length {} exceeds sequence length {}", run_length, size);
  }
  if (start == 0) {
    return err_invalid_index.with("start index 0 is reserved");
  }
  if (start >= size) {
    return err_invalid_index.with("start index {} out of range for sequence length {}", start, size);
  }

  std::vector<Word> current(sequence.begin(), sequence.end());
  std::vector<Word> next(size);
  auto passes = static_cast<size_t>(std::bit_width(size - 1));
  for (size_t j = 0; j < passes; ++j) {
    auto shift = (size_t(1) << j) % size;
    // all-ones when bit j of start is set
    auto mask = Word(0) - static_cast<Word>((uint64_t(start) >> j) & 1);
    for (size_t i = 0; i < size; ++i) {
      next[i] = (current[(i + shift) % size] & mask) | (current[i] & ~mask);
    }
    std::swap(current, next);
  }
  if (cost) {
    cost->blend_ops += passes * size;
  }

  current.resize(run_length);
  uint64_t zeros = 0;
  size_t first_zero = run_length;
  for (size_t i = 0; i < run_length; ++i) {
    auto is_zero = static_cast<uint64_t>(current[i] == 0);
    auto take = is_zero & static_cast<uint64_t>(zeros == 0);
    first_zero = take ? i : first_zero;
    zeros += is_zero;
  }
  if (zeros) {
    return err_null_in_selection.with("null byte in selection at offset {}", first_zero);
  }
  return current;
}

} // namespace dynsha::sha256
