// This file is part of DYNSHA.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <dynsha/config/hash_config.h>
#include <dynsha/core/basic_errors.h>
#include <dynsha/sha256/word.h>

namespace dynsha::config {

void HashConfig::bind(CLI::App& root) {
  auto hash = root.add_option_group("hash", "Dynamic SHA-256 options");
  hash->add_option("--capacity", capacity, R"(
# Maximum size of the padded message in bytes.
# Must be a multiple of 64; the cost of every call is fixed by this value.)")
    ->capture_default_str();
  hash->add_option("--selector", selector, R"(
# Precompute selector. When set, the message prefix up to the block
# containing the first occurrence is hashed outside the engine.)");
  hash->add_option("--log-level", log_level, "Log level (trace, debug, info, warn, error)")->capture_default_str();
}

auto HashConfig::validate() const -> Result<void> {
  if (!capacity || capacity % sha256::block_size) {
    return err_malformed_length.with("capacity must be a positive multiple of {}: {}", sha256::block_size, capacity);
  }
  if (selector && selector->empty()) {
    return err_selector_not_found.with("selector must not be empty");
  }
  return success();
}

} // namespace dynsha::config
