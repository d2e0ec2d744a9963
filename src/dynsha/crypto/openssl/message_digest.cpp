// This file is part of DYNSHA.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <dynsha/common/check.h>
#include <dynsha/crypto/openssl/message_digest.h>

namespace dynsha::openssl {

MessageDigest::~MessageDigest() {
  if (ctx) {
    EVP_MD_CTX_free(ctx);
  }
}

void MessageDigest::init(const EVP_MD* type) {
  if (!ctx) {
    ctx = EVP_MD_CTX_new();
    check(ctx != nullptr, "failed to allocate digest context");
  }
  check(EVP_DigestInit_ex(ctx, type, nullptr) == 1, "failed to initialize digest");
}

void MessageDigest::update(BytesView in) {
  check(EVP_DigestUpdate(ctx, in.data(), in.size()) == 1, "failed to update digest");
}

void MessageDigest::final(BytesViewMut out) {
  check(out.size() >= static_cast<size_t>(EVP_MD_CTX_size(ctx)), "digest buffer too small: {}", out.size());
  check(EVP_DigestFinal_ex(ctx, out.data(), nullptr) == 1, "failed to finalize digest");
}

auto MessageDigest::digest_size(const EVP_MD* type) const -> size_t {
  return EVP_MD_size(type);
}

} // namespace dynsha::openssl
