// This file is part of DYNSHA.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <dynsha/sha256/cost.h>
#include <dynsha/sha256/word.h>

namespace dynsha::sha256 {

/// \addtogroup sha256
/// \{

/// \brief word offset in the message where zero filler begins
///
/// \p digest_index addresses the post-compression states, 8 words per block,
/// so the content spans `digest_index / 8 + 1` blocks of 16 message words.
constexpr uint64_t padding_start(Index digest_index) noexcept {
  return (uint64_t(digest_index) + words_per_state) * 2;
}

/// \brief checks that every message word past the padding boundary is zero
///
/// All words are inspected whatever the boundary. On failure the error names
/// the first offending word.
/// \param message_words the padded message as flat words
/// \param digest_index claimed digest position
/// \param cost accumulates one padding word per inspected word, if given
auto verify_zero_padding(std::span<const Word> message_words, Index digest_index, Cost* cost = nullptr)
  -> Result<void>;

/// \brief checks that the last content block claimed by \p digest_index is not empty
///
/// A standard-padded final block always carries the 0x80 marker or a non-zero
/// bit length, so an all-zero block means the index points past the content.
auto verify_terminal_block(std::span<const Word> message_words, Index digest_index, Cost* cost = nullptr)
  -> Result<void>;

/// \}

} // namespace dynsha::sha256
