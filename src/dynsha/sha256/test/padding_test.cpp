// This file is part of DYNSHA.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <catch2/catch_all.hpp>
#include <dynsha/core/basic_errors.h>
#include <dynsha/sha256/padding.h>
#include <algorithm>
#include <limits>

using namespace dynsha;
using namespace dynsha::sha256;

TEST_CASE("padding: boundary", "[dynsha][sha256]") {
  CHECK(padding_start(0) == 16);
  CHECK(padding_start(16) == 48);
  CHECK(padding_start(15) == 46);
  CHECK(padding_start(std::numeric_limits<Index>::max()) == (uint64_t(1) << 33) + 14);
}

TEST_CASE("padding: zero filler", "[dynsha][sha256]") {
  // three content blocks followed by five filler blocks
  std::vector<Word> words(128, 0);
  std::fill(words.begin(), words.begin() + 48, 0xabababab);

  SECTION("clean filler") {
    CHECK(verify_zero_padding(words, 16));
    CHECK(verify_terminal_block(words, 16));
  }

  SECTION("first filler word") {
    words[48] = 1;
    auto ok = verify_zero_padding(words, 16);
    REQUIRE(!ok);
    CHECK(ok.error().is(err_padding_violation));
    CHECK(ok.error().message() == "padding error at index 48: expected zero");
  }

  SECTION("non-zero word after the boundary") {
    words[100] = 1;
    words[120] = 1;
    auto ok = verify_zero_padding(words, 16);
    REQUIRE(!ok);
    CHECK(ok.error().is(err_padding_violation));
    CHECK(ok.error().message() == "padding error at index 100: expected zero");
  }

  SECTION("boundary claimed too early") {
    auto ok = verify_zero_padding(words, 8);
    REQUIRE(!ok);
    CHECK(ok.error().message() == "padding error at index 32: expected zero");
  }

  SECTION("boundary claimed too late") {
    CHECK(verify_zero_padding(words, 24));
    auto ok = verify_terminal_block(words, 24);
    REQUIRE(!ok);
    CHECK(ok.error().is(err_padding_violation));
    CHECK(ok.error().message() == "padding error at index 48: final content block is empty");
  }

  SECTION("cost does not depend on the boundary") {
    Cost a, b;
    REQUIRE(verify_zero_padding(words, 16, &a));
    REQUIRE(verify_zero_padding(words, 56, &b));
    CHECK(a == b);
    CHECK(a.padding_words == 128);
  }
}
