// This file is part of DYNSHA.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <dynsha/core/result.h>
#include <CLI/CLI11.hpp>
#include <optional>
#include <string>

namespace dynsha::config {

/// \brief call-site settings of the hashing engine
struct HashConfig {
  // declared maximum size of the padded buffer, in bytes
  size_t capacity;
  // precompute selector; the prefix before it is hashed outside the engine
  std::optional<std::string> selector;
  std::string log_level;

  HashConfig() {
    capacity = 1024;
    log_level = "info";
  }

  void bind(CLI::App& root);

  auto validate() const -> Result<void>;
};

} // namespace dynsha::config
