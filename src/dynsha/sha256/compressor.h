// This file is part of DYNSHA.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <dynsha/sha256/word.h>

namespace dynsha::sha256 {

/// \brief trusted SHA-256 compression primitive
///
/// Expands the block into the 64-word message schedule and runs the 64 rounds
/// against the given state. Implementations must be pure and deterministic.
/// \ingroup sha256
class Compressor {
public:
  virtual ~Compressor() = default;

  virtual auto compress(const HashState& state, const MessageBlock& block) const -> HashState = 0;
};

/// \brief compressor backed by OpenSSL's block transform
/// \ingroup sha256
class OpenSslCompressor : public Compressor {
public:
  auto compress(const HashState& state, const MessageBlock& block) const -> HashState override;
};

/// \brief returns the process-wide OpenSSL compressor
auto default_compressor() -> const Compressor&;

} // namespace dynsha::sha256
