// This file is part of DYNSHA.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <dynsha/common/bit.h>
#include <dynsha/core/basic_errors.h>
#include <dynsha/crypto/hash/sha2.h>
#include <dynsha/host/pad.h>
#include <dynsha/log/log.h>
#include <algorithm>

namespace dynsha::host {

using namespace sha256;

namespace {
  auto digest_index_of(size_t padded_size) -> Index {
    return static_cast<Index>((padded_size - block_size) / bytes_per_word / 2);
  }

  // standard padding only, without filler
  auto pad_message(BytesView message) -> Bytes {
    Bytes padded(padded_length(message.size()), 0);
    std::copy(message.begin(), message.end(), padded.begin());
    padded[message.size()] = 0x80;
    store_be64(padded.data() + padded.size() - 8, uint64_t(message.size()) * 8);
    return padded;
  }
} // namespace

auto standard_pad(BytesView message, size_t capacity) -> Result<PaddedInput> {
  if (capacity % block_size) {
    return err_malformed_length.with("capacity must be a multiple of {}: {}", block_size, capacity);
  }
  auto padded = pad_message(message);
  if (padded.size() > capacity) {
    return err_capacity_exceeded.with(
      "padded message is {} bytes long but capacity is {}", padded.size(), capacity);
  }
  auto digest_index = digest_index_of(padded.size());
  padded.resize(capacity, 0);
  return PaddedInput{.padded = std::move(padded), .digest_index = digest_index};
}

auto split_at_selector(BytesView message, size_t capacity, std::optional<std::string_view> selector)
  -> Result<PartialInput> {
  if (capacity % block_size) {
    return err_malformed_length.with("capacity must be a multiple of {}: {}", block_size, capacity);
  }
  auto padded = pad_message(message);

  size_t cutoff = 0;
  if (selector) {
    auto needle = bytes_view(*selector);
    auto it = std::search(padded.begin(), padded.end(), needle.begin(), needle.end());
    if (it == padded.end()) {
      return err_selector_not_found.with("SHA precompute selector not found in the body");
    }
    cutoff = static_cast<size_t>(it - padded.begin()) / block_size * block_size;
  }

  auto remaining_size = padded.size() - cutoff;
  if (remaining_size > capacity) {
    return err_capacity_exceeded.with(
      "remaining body is {} bytes long but capacity is {}", remaining_size, capacity);
  }

  auto midstate = crypto::sha256_midstate(BytesView{padded}.first(cutoff));
  if (!midstate) {
    return midstate.error();
  }
  dlog("split at selector: prefix={} remaining={} capacity={}", cutoff, remaining_size, capacity);

  Bytes remaining(padded.begin() + cutoff, padded.end());
  remaining.resize(capacity, 0);
  return PartialInput{
    .precomputed_hash = to_digest(midstate.value()),
    .remaining = std::move(remaining),
    .digest_index = digest_index_of(remaining_size),
  };
}

} // namespace dynsha::host
