// This file is part of DYNSHA.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <dynsha/common/bytes.h>

/// \brief crypto namespace
/// \ingroup crypto
namespace dynsha::crypto {

/// \brief abstracts hash function interface
template<typename Derived>
struct Hash {
  /// \brief calculates and returns the hash value of input data
  /// \param in input data
  /// \return byte array containing hash
  auto operator()(const ByteSequence auto& in) -> Bytes {
    auto derived = static_cast<Derived*>(this);
    return derived->init().update(bytes_view(in)).final();
  }

  auto operator()(std::string_view in) -> Bytes {
    auto derived = static_cast<Derived*>(this);
    return derived->init().update(bytes_view(in)).final();
  }

  /// \brief returns hash value
  /// \return byte array containing hash
  auto final() -> Bytes {
    auto derived = static_cast<Derived*>(this);
    Bytes out(derived->digest_size());
    derived->final(BytesViewMut{out});
    return out;
  }

protected:
  Hash() = default;
};

} // namespace dynsha::crypto
