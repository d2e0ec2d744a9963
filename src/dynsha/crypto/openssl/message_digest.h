// This file is part of DYNSHA.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <dynsha/common/bytes.h>
#include <openssl/evp.h>

namespace dynsha::openssl {

/// \cond PRIVATE
struct MessageDigest {
  MessageDigest() = default;
  MessageDigest(const MessageDigest&) = delete;
  MessageDigest& operator=(const MessageDigest&) = delete;
  ~MessageDigest();

  void init(const EVP_MD* type);
  void update(BytesView in);
  void final(BytesViewMut out);
  size_t digest_size(const EVP_MD* type) const;

protected:
  EVP_MD_CTX* ctx = nullptr;
};
/// \endcond

} // namespace dynsha::openssl
