// This file is part of DYNSHA.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <dynsha/common/concepts.h>
#include <span>
#include <string_view>
#include <vector>

namespace dynsha {

// variable-length byte sequence
using Bytes = std::vector<unsigned char>;

// not-owned readonly byte sequence
using BytesView = std::span<const unsigned char>;

// not-owned mutable byte sequence
using BytesViewMut = std::span<unsigned char>;

auto byte_pointer_cast(Pointer auto pointer) {
  if constexpr (ConstPointer<decltype(pointer)>) {
    return reinterpret_cast<const unsigned char*>(pointer);
  } else {
    return reinterpret_cast<unsigned char*>(pointer);
  }
}

auto bytes_view(const ByteSequence auto& bytes) -> BytesView {
  return {byte_pointer_cast(bytes.data()), bytes.size()};
}

inline auto bytes_view(std::string_view s) -> BytesView {
  return {byte_pointer_cast(s.data()), s.size()};
}

} // namespace dynsha
