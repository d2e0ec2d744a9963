// This file is part of DYNSHA.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <dynsha/common/check.h>
#include <dynsha/common/hex.h>

namespace dynsha {

namespace {
  std::string_view strip_prefix(std::string_view s) {
    if (s.starts_with("0x") || s.starts_with("0X")) {
      s.remove_prefix(2);
    }
    return s;
  }
} // namespace

std::string to_hex(BytesView s) {
  return hex::encode(s.data(), s.size());
}

size_t from_hex(std::string_view s, BytesViewMut out) {
  s = strip_prefix(s);
  check(hex::decoded_max_size(s.size()) <= out.size(), "hex string too long: {} characters for {} bytes", s.size(),
    out.size());
  return hex::decode(out.data(), out.size(), s.data(), s.size());
}

Bytes from_hex(std::string_view s) {
  s = strip_prefix(s);
  return hex::decode(s.data(), s.size());
}

} // namespace dynsha
