// This file is part of DYNSHA.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <catch2/catch_all.hpp>
#include <dynsha/sha256/oblivious.h>
#include <numeric>

using namespace dynsha;
using namespace dynsha::sha256;

namespace {
auto iota_words(size_t size, Word first = 1) -> std::vector<Word> {
  std::vector<Word> words(size);
  std::iota(words.begin(), words.end(), first);
  return words;
}
} // namespace

TEST_CASE("oblivious: single word selection", "[dynsha][sha256]") {
  auto words = iota_words(24, 100);
  auto seq = std::span<const Word>{words};

  SECTION("every position") {
    for (uint64_t i = 0; i < words.size(); ++i) {
      auto v = select_word(seq, i);
      REQUIRE(v);
      CHECK(v.value() == words[i]);
    }
  }

  SECTION("zero is a valid value") {
    std::vector<Word> zeros(8, 0);
    auto v = select_word(std::span<const Word>{zeros}, 3);
    REQUIRE(v);
    CHECK(v.value() == 0);
  }

  SECTION("out of range") {
    for (uint64_t i : {uint64_t(24), uint64_t(25), uint64_t(1) << 40}) {
      auto v = select_word(seq, i);
      REQUIRE(!v);
      CHECK(v.error().is(err_invalid_index));
    }
    auto v = select_word(std::span<const Word>{}, 0);
    CHECK(!v);
  }

  SECTION("cost does not depend on the index") {
    Cost a, b;
    REQUIRE(select_word(seq, 0, &a));
    REQUIRE(select_word(seq, 23, &b));
    CHECK(a == b);
    CHECK(a.selection_terms == 24);
  }
}

TEST_CASE("oblivious: digest selection", "[dynsha][sha256]") {
  auto words = iota_words(32);
  auto seq = std::span<const Word>{words};

  SECTION("eight words from the index") {
    auto digest = select_digest(seq, 16);
    REQUIRE(digest);
    CHECK(digest.value() == HashState{17, 18, 19, 20, 21, 22, 23, 24});
  }

  SECTION("last full digest") {
    auto digest = select_digest(seq, 24);
    REQUIRE(digest);
    CHECK(digest.value()[7] == 32);
  }

  SECTION("digest running past the end") {
    auto digest = select_digest(seq, 25);
    REQUIRE(!digest);
    CHECK(digest.error().is(err_invalid_index));
  }

  SECTION("generic width") {
    auto pair = select_n<2>(seq, 30);
    REQUIRE(pair);
    CHECK(pair.value() == std::array<Word, 2>{31, 32});
  }
}

TEST_CASE("oblivious: subarray selection", "[dynsha][sha256]") {
  SECTION("every start of a power-of-two sequence") {
    auto words = iota_words(16);
    for (Index start = 1; start < 16; ++start) {
      auto run = select_run(words, start, 16);
      REQUIRE(run);
      for (size_t i = 0; i < 16; ++i) {
        CHECK(run.value()[i] == words[(i + start) % 16]);
      }
    }
  }

  SECTION("non-power-of-two sequence") {
    auto words = iota_words(13);
    for (Index start = 1; start < 13; ++start) {
      auto run = select_run(words, start, 5);
      REQUIRE(run);
      REQUIRE(run.value().size() == 5);
      for (size_t i = 0; i < 5; ++i) {
        CHECK(run.value()[i] == words[(i + start) % 13]);
      }
    }
  }

  SECTION("excerpt from the middle") {
    auto words = iota_words(64);
    Cost cost;
    auto run = select_run(words, 20, 10, &cost);
    REQUIRE(run);
    CHECK(run.value() == std::vector<Word>{21, 22, 23, 24, 25, 26, 27, 28, 29, 30});
    // log2(64) passes over 64 positions
    CHECK(cost.blend_ops == 6 * 64);
  }

  SECTION("start 0 is reserved") {
    auto words = iota_words(8);
    auto run = select_run(words, 0, 4);
    REQUIRE(!run);
    CHECK(run.error().is(err_invalid_index));
  }

  SECTION("start out of range") {
    auto words = iota_words(8);
    auto run = select_run(words, 8, 4);
    REQUIRE(!run);
    CHECK(run.error().is(err_invalid_index));
  }

  SECTION("run longer than the sequence") {
    auto words = iota_words(8);
    auto run = select_run(words, 1, 9);
    REQUIRE(!run);
    CHECK(run.error().is(err_malformed_length));
  }

  SECTION("zero word inside the run") {
    auto words = iota_words(16);
    words[6] = 0;
    auto run = select_run(words, 4, 8);
    REQUIRE(!run);
    CHECK(run.error().is(err_null_in_selection));
    CHECK(run.error().message() == "null byte in selection at offset 2");

    // the same zero outside the run is fine
    CHECK(select_run(words, 7, 8));
  }
}
