// This file is part of DYNSHA.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <catch2/catch_all.hpp>
#include <dynsha/common/bit.h>
#include <dynsha/common/bytes_n.h>

using namespace dynsha;

TEST_CASE("bytes: fixed-length byte sequence", "[dynsha][common]") {
  Bytes32 hash{"e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"};

  SECTION("construction & conversion") {
    CHECK(hash.to_string() == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    CHECK(Bytes32{"0xe3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"} == hash);

    auto from_span = Bytes32(hash.to_span());
    CHECK(from_span == hash);

    auto bytes = hash.to_bytes();
    CHECK(bytes.size() == 32);
    CHECK(Bytes32(bytes) == hash);

    auto copied = hash;
    copied.data()[31] &= 0xf0;
    CHECK(copied.to_string() == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b850");
    CHECK(copied != hash);
  }

  SECTION("invalid length") {
    CHECK_THROWS_WITH(Bytes32("e3b0c442"), "invalid bytes length: expected(32), actual(4)");
    CHECK_THROWS(Bytes32(Bytes(33)));
    CHECK_THROWS_WITH(Bytes32(std::string(66, 'a')), "hex string too long: 66 characters for 32 bytes");
  }
}

TEST_CASE("bytes: hex", "[dynsha][common]") {
  auto tests = std::to_array<std::pair<const char*, Bytes>>({
    {"", {}},
    {"00", {0x00}},
    {"0x80", {0x80}},
    {"deadbeef", {0xde, 0xad, 0xbe, 0xef}},
  });

  std::for_each(tests.begin(), tests.end(), [](const auto& t) {
    CHECK(from_hex(t.first) == t.second);
  });
  CHECK(to_hex(Bytes{0xde, 0xad, 0xbe, 0xef}) == "deadbeef");
  CHECK_THROWS(from_hex("zz"));
}

TEST_CASE("bytes: big-endian words", "[dynsha][common]") {
  unsigned char buf[8] = {};
  store_be32(buf, 0x61626380);
  CHECK(buf[0] == 0x61);
  CHECK(buf[3] == 0x80);
  CHECK(load_be32(buf) == 0x61626380);

  store_be64(buf, 0x18);
  CHECK(load_be32(buf) == 0);
  CHECK(load_be32(buf + 4) == 0x18);
}
