// This file is part of DYNSHA.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <dynsha/host/prepare.h>
#include <dynsha/log/setup.h>
#include <dynsha/sha256/dynamic_sha256.h>

namespace dynsha::host {

auto prepare(BytesView message, const config::HashConfig& config) -> Result<PartialInput> {
  if (auto ok = config.validate(); !ok) {
    return ok.error();
  }
  log::set_level(config.log_level);
  if (config.selector) {
    return split_at_selector(message, config.capacity, *config.selector);
  }
  auto padded = standard_pad(message, config.capacity);
  if (!padded) {
    return padded.error();
  }
  return PartialInput{
    .precomputed_hash = sha256::to_digest(sha256::initial_state),
    .remaining = std::move(padded.value().padded),
    .digest_index = padded.value().digest_index,
  };
}

auto hash_message(BytesView message, const config::HashConfig& config) -> Result<sha256::Digest> {
  auto input = prepare(message, config);
  if (!input) {
    return input.error();
  }
  auto& in = input.value();
  return sha256::partial_sha256(in.precomputed_hash, in.remaining, in.digest_index);
}

} // namespace dynsha::host
