// This file is part of DYNSHA.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <dynsha/common/concepts.h>
#include <dynsha/core/basic_errors.h>
#include <dynsha/sha256/cost.h>
#include <dynsha/sha256/word.h>

namespace dynsha::sha256 {

/// \addtogroup sha256
/// \{

/// \brief reads `sequence[index]` without branching on \p index
///
/// Every position contributes `(index == i) * sequence[i]` to the result and
/// `(index == i)` to a hit counter. The read is valid only if exactly one
/// position was hit; anything else (most notably an out-of-range index) is
/// reported as invalid_index rather than silently yielding zero.
/// \param sequence values to select from
/// \param index position to read
/// \param cost accumulates one selection term per position, if given
template<UnsignedIntegral T>
auto select_word(std::span<const T> sequence, uint64_t index, Cost* cost = nullptr) -> Result<T> {
  static_assert(sizeof(T) <= sizeof(uint64_t));
  uint64_t value = 0;
  uint64_t hits = 0;
  for (size_t i = 0; i < sequence.size(); ++i) {
    auto eq = static_cast<uint64_t>(index == i);
    value += eq * sequence[i];
    hits += eq;
  }
  if (cost) {
    cost->selection_terms += sequence.size();
  }
  if (hits != 1) {
    return err_invalid_index.with(
      "invalid index {}: matched {} of {} positions, expected exactly one", index, hits, sequence.size());
  }
  return static_cast<T>(value);
}

/// \brief reads N consecutive values starting at \p start, one oblivious read each
template<size_t N, UnsignedIntegral T>
auto select_n(std::span<const T> sequence, uint64_t start, Cost* cost = nullptr) -> Result<std::array<T, N>> {
  std::array<T, N> out;
  for (size_t k = 0; k < N; ++k) {
    auto v = select_word(sequence, start + k, cost);
    if (!v) {
      return v.error();
    }
    out[k] = v.value();
  }
  return out;
}

/// \brief reads the 8-word digest that starts at \p digest_index
inline auto select_digest(std::span<const Word> sequence, uint64_t digest_index, Cost* cost = nullptr)
  -> Result<HashState> {
  return select_n<words_per_state>(sequence, digest_index, cost);
}

/// \brief extracts `sequence[start, start + run_length)` by rotation, without branching on \p start
///
/// One conditional rotate pass per bit of \p start: at bit j every position is
/// blended with the one 2^j ahead (cyclically). After all passes position i
/// holds `sequence[(i + start) % size]`. Index 0 is reserved and rejected, and
/// the selected run must not contain a zero word.
/// \param sequence values to select from
/// \param start first position of the run, 0 < start < sequence.size()
/// \param run_length number of values returned, at most sequence.size()
/// \param cost accumulates one blend operation per position per pass, if given
auto select_run(std::span<const Word> sequence, Index start, size_t run_length, Cost* cost = nullptr)
  -> Result<std::vector<Word>>;

/// \}

} // namespace dynsha::sha256
