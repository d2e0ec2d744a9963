// This file is part of DYNSHA.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <dynsha/sha256/pipeline.h>

namespace dynsha::sha256 {

/// \brief SHA-256 of variable-length content inside a fixed-capacity buffer
///
/// The cost of a call depends only on the buffer capacity. The caller supplies
/// where the digest sits; the engine proves that claim through the padding
/// checks and fails rather than returning a digest of anything else.
/// \ingroup sha256
class DynamicSha256 {
public:
  /// \brief \p compressor is not copied and must outlive the hasher
  explicit DynamicSha256(const Compressor& compressor = default_compressor()): pipeline_(compressor) {}
  explicit DynamicSha256(const Compressor&&) = delete;

  /// \brief hashes the content of a padded buffer
  /// \param padded content, standard padding and zero filler; length a multiple of 64
  /// \param digest_index `(padded content length - 64) / 8`
  /// \param seed initial state, the standard IV unless resuming a partial hash
  /// \return 32-byte digest, or malformed_length, padding_violation, invalid_index
  auto hash(BytesView padded, Index digest_index, const HashState& seed = initial_state) -> Result<Digest>;

  /// \brief resumes a hash computed elsewhere over a block-aligned prefix
  ///
  /// Equivalent to hash() seeded with to_hash_state(precomputed). A precomputed
  /// value that is not a genuine chaining value yields a wrong digest, not an error.
  auto partial(const Digest& precomputed, BytesView remaining, Index digest_index) -> Result<Digest>;

  /// \brief work done by the most recent call
  auto cost() const -> const Cost& {
    return cost_;
  }

private:
  CompressionPipeline pipeline_;
  Cost cost_;
};

/// \brief hashes with the default compressor
/// \ingroup sha256
auto dynamic_sha256(BytesView padded, Index digest_index, const HashState& seed = initial_state) -> Result<Digest>;

/// \brief resumes a partial hash with the default compressor
/// \ingroup sha256
auto partial_sha256(const Digest& precomputed, BytesView remaining, Index digest_index) -> Result<Digest>;

} // namespace dynsha::sha256
