// This file is part of DYNSHA.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <cstddef>

namespace dynsha::sha256 {

/// \brief work performed by one engine call
///
/// For a fixed capacity every field is the same regardless of where the content
/// ends, which is what keeps the true length from showing through the cost.
/// \ingroup sha256
struct Cost {
  size_t compressions = 0;
  size_t selection_terms = 0;
  size_t blend_ops = 0;
  size_t padding_words = 0;

  bool operator==(const Cost&) const = default;
};

} // namespace dynsha::sha256
