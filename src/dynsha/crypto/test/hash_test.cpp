// This file is part of DYNSHA.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <catch2/catch_all.hpp>
#include <dynsha/common/hex.h>
#include <dynsha/core/basic_errors.h>
#include <dynsha/crypto/hash/sha2.h>

using namespace dynsha;
using namespace dynsha::crypto;

TEST_CASE("hash: sha256", "[dynsha][crypto]") {
  auto tests = std::to_array<std::pair<std::string, Bytes>>({
    {"", from_hex("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855")},
    {"abc", from_hex("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad")},
    {"The quick brown fox jumps over the lazy dog",
      from_hex("d7a8fbb307d7809469ca9abcb0082e4f8d5651e46d3cdb762d02d0bf37c9e592")},
  });

  std::for_each(tests.begin(), tests.end(), [&](auto& t) {
    CHECK(Sha256()(t.first) == t.second);
  });

  {
    auto hash = Sha256();
    for (const auto& test : tests) {
      hash.update(bytes_view(test.first));
      CHECK(hash.final() == test.second);
      hash.init();
    }
  }
}

TEST_CASE("hash: sha256 compression", "[dynsha][crypto]") {
  const std::array<uint32_t, 8> iv = {
    0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a, 0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19};

  SECTION("single padded block gives the digest") {
    // "abc" with standard padding
    Bytes block(64, 0);
    block[0] = 'a';
    block[1] = 'b';
    block[2] = 'c';
    block[3] = 0x80;
    block[63] = 0x18;

    auto state = iv;
    sha256_compress(state, block);
    CHECK(state[0] == 0xba7816bf);
    CHECK(state[7] == 0xf20015ad);
  }

  SECTION("midstate matches repeated compression") {
    Bytes prefix(128);
    for (size_t i = 0; i < prefix.size(); ++i) {
      prefix[i] = static_cast<unsigned char>(i * 7 + 1);
    }
    auto state = iv;
    sha256_compress(state, BytesView{prefix}.first(64));
    sha256_compress(state, BytesView{prefix}.subspan(64));

    auto midstate = sha256_midstate(prefix);
    REQUIRE(midstate);
    CHECK(midstate.value() == state);
  }

  SECTION("empty prefix is the initialization vector") {
    auto midstate = sha256_midstate({});
    REQUIRE(midstate);
    CHECK(midstate.value() == iv);
  }

  SECTION("unaligned prefix") {
    auto midstate = sha256_midstate(Bytes(65));
    REQUIRE(!midstate);
    CHECK(midstate.error().is(err_malformed_length));
  }

  SECTION("block size is enforced") {
    auto state = iv;
    CHECK_THROWS(sha256_compress(state, Bytes(63)));
  }
}
