// This file is part of DYNSHA.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <dynsha/sha256/word.h>
#include <optional>
#include <string_view>

/// \defgroup host Input preparation
/// \brief builds engine inputs outside the fixed-cost computation

namespace dynsha::host {

/// \brief padded buffer and the digest position the engine expects
/// \ingroup host
struct PaddedInput {
  Bytes padded;
  sha256::Index digest_index = 0;
};

/// \brief inputs for resuming a hash over the suffix of a message
/// \ingroup host
struct PartialInput {
  sha256::Digest precomputed_hash;
  Bytes remaining;
  sha256::Index digest_index = 0;
};

/// \brief length of \p message_size bytes after standard sha256 padding
constexpr size_t padded_length(size_t message_size) noexcept {
  // 0x80 marker and 64-bit length, rounded up to a block
  return (message_size + 9 + sha256::block_size - 1) / sha256::block_size * sha256::block_size;
}

/// \brief applies standard sha256 padding, then zero filler up to \p capacity
/// \ingroup host
/// \return malformed_length if capacity is not a multiple of 64,
///         capacity_exceeded if the padded message does not fit
auto standard_pad(BytesView message, size_t capacity) -> Result<PaddedInput>;

/// \brief splits a message at a block boundary before \p selector
///
/// The prefix up to the last 64-byte boundary not after the first occurrence
/// of \p selector is absorbed with a trusted sha256 implementation, and the
/// rest of the padded message is zero-filled to \p capacity. Without a
/// selector nothing is precomputed and the precomputed hash is the IV.
/// \ingroup host
/// \return selector_not_found if \p selector does not occur in the padded message,
///         capacity_exceeded if the remainder does not fit
auto split_at_selector(BytesView message, size_t capacity, std::optional<std::string_view> selector = std::nullopt)
  -> Result<PartialInput>;

} // namespace dynsha::host
