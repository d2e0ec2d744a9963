// This file is part of DYNSHA.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <dynsha/sha256/pipeline.h>

namespace dynsha::sha256 {

auto CompressionPipeline::run(const HashState& seed, const std::vector<MessageBlock>& blocks, Cost* cost) const
  -> std::vector<HashState> {
  std::vector<HashState> states;
  states.reserve(blocks.size() + 1);
  states.push_back(seed);
  for (const auto& block : blocks) {
    states.push_back(compressor_.compress(states.back(), block));
  }
  if (cost) {
    cost->compressions += blocks.size();
  }
  return states;
}

} // namespace dynsha::sha256
