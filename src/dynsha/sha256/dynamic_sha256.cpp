// This file is part of DYNSHA.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <dynsha/log/log.h>
#include <dynsha/sha256/dynamic_sha256.h>
#include <dynsha/sha256/oblivious.h>
#include <dynsha/sha256/padding.h>

namespace dynsha::sha256 {

namespace {
  auto rejected(const Error& err) -> Error {
    wlog("rejected padded input: {}", err.message());
    return err;
  }
} // namespace

auto DynamicSha256::hash(BytesView padded, Index digest_index, const HashState& seed) -> Result<Digest> {
  cost_ = {};

  auto blocks = split_into_blocks(padded);
  if (!blocks) {
    return rejected(blocks.error());
  }
  dlog("dynamic sha256: capacity={} blocks={}", padded.size(), blocks.value().size());

  auto states = pipeline_.run(seed, blocks.value(), &cost_);
  // every state but the seed is a digest candidate
  states.erase(states.begin());
  auto candidates = flatten(states);
  auto message_words = flatten(blocks.value());

  if (auto ok = verify_zero_padding(message_words, digest_index, &cost_); !ok) {
    return rejected(ok.error());
  }

  auto digest = select_digest(candidates, digest_index, &cost_);
  if (!digest) {
    return rejected(digest.error());
  }
  if (digest_index % words_per_state) {
    return rejected(err_invalid_index.with("digest index {} is not aligned to a state boundary", digest_index));
  }

  if (auto ok = verify_terminal_block(message_words, digest_index, &cost_); !ok) {
    return rejected(ok.error());
  }
  return to_digest(digest.value());
}

auto DynamicSha256::partial(const Digest& precomputed, BytesView remaining, Index digest_index) -> Result<Digest> {
  return hash(remaining, digest_index, to_hash_state(precomputed));
}

auto dynamic_sha256(BytesView padded, Index digest_index, const HashState& seed) -> Result<Digest> {
  return DynamicSha256().hash(padded, digest_index, seed);
}

auto partial_sha256(const Digest& precomputed, BytesView remaining, Index digest_index) -> Result<Digest> {
  return DynamicSha256().partial(precomputed, remaining, digest_index);
}

} // namespace dynsha::sha256
