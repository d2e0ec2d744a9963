// This file is part of DYNSHA.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <dynsha/sha256/compressor.h>
#include <dynsha/sha256/cost.h>

namespace dynsha::sha256 {

/// \brief runs the compression primitive once per block
/// \ingroup sha256
class CompressionPipeline {
public:
  /// \brief keeps a reference to \p compressor, which must outlive the pipeline
  explicit CompressionPipeline(const Compressor& compressor = default_compressor()): compressor_(compressor) {}
  explicit CompressionPipeline(const Compressor&&) = delete;

  /// \brief computes every intermediate state
  ///
  /// All blocks are compressed, including pure filler, since the pipeline does
  /// not know where the content ends.
  /// \param seed state[0], the IV or a precomputed chaining value
  /// \param blocks message blocks
  /// \param cost accumulates the number of compressions, if given
  /// \return blocks.size() + 1 states, seed first
  auto run(const HashState& seed, const std::vector<MessageBlock>& blocks, Cost* cost = nullptr) const
    -> std::vector<HashState>;

private:
  const Compressor& compressor_;
};

} // namespace dynsha::sha256
