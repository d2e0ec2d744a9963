// This file is part of DYNSHA.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <dynsha/common/bytes.h>
#include <dynsha/common/check.h>
#include <dynsha/common/hex.h>
#include <algorithm>
#include <array>

namespace dynsha {

/// \brief fixed-length byte array, e.g. a 32-byte digest
template<size_t N>
class BytesN {
public:
  constexpr BytesN() = default;

  /// \brief parses a hex string of exactly 2 * N digits, with or without 0x
  BytesN(std::string_view s) {
    auto size = from_hex(s, data_);
    check(size == N, "invalid bytes length: expected({}), actual({})", N, size);
  }

  /// \brief copies a byte sequence of exactly N bytes
  BytesN(BytesView bytes) {
    check(bytes.size() == N, "invalid bytes length: expected({}), actual({})", N, bytes.size());
    std::copy(bytes.begin(), bytes.end(), data_.begin());
  }

  constexpr unsigned char* data() noexcept {
    return data_.data();
  }
  constexpr const unsigned char* data() const noexcept {
    return data_.data();
  }
  constexpr size_t size() const noexcept {
    return N;
  }

  constexpr auto begin() const noexcept {
    return data_.begin();
  }
  constexpr auto end() const noexcept {
    return data_.end();
  }

  std::string to_string() const {
    return to_hex(data_);
  }

  Bytes to_bytes() const {
    return {data_.begin(), data_.end()};
  }

  constexpr BytesView to_span() const {
    return data_;
  }

  constexpr bool operator==(const BytesN&) const = default;

private:
  std::array<unsigned char, N> data_{};
};

using Bytes32 = BytesN<32>;

} // namespace dynsha
