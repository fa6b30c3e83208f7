// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <algorithm>
#include <array>
#include <catch2/catch_template_test_macros.hpp>
#include <catch2/catch_test_macros.hpp>
#include <cstdint>
#include <limits>
#include <random>
#include <sortedvec/sortable_encoding.hpp>
#include <sortedvec/sorted_vector.hpp>
#include <vector>

using namespace kressler::sortedvec;

namespace {

template <typename T>
bool bytes_less(const T& a, const T& b) {
  return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end());
}

// Check that the encoding order of consecutive values matches their order
template <typename T>
void require_order_preserved(std::vector<T> values) {
  std::sort(values.begin(), values.end());
  for (std::size_t i = 1; i < values.size(); ++i) {
    const auto lo = encode_sortable(values[i - 1]);
    const auto hi = encode_sortable(values[i]);
    if (values[i - 1] < values[i]) {
      REQUIRE(bytes_less(lo, hi));
    } else {
      REQUIRE(lo == hi);
    }
  }
}

}  // namespace

TEMPLATE_TEST_CASE("encode_sortable preserves integer order",
                   "[sortable_encoding]", std::int8_t, std::uint8_t,
                   std::int16_t, std::uint16_t, std::int32_t, std::uint32_t,
                   std::int64_t, std::uint64_t) {
  using limits = std::numeric_limits<TestType>;
  std::vector<TestType> values = {limits::min(), limits::max(),
                                  static_cast<TestType>(0),
                                  static_cast<TestType>(1),
                                  static_cast<TestType>(limits::max() / 2)};
  if constexpr (std::is_signed_v<TestType>) {
    values.push_back(static_cast<TestType>(-1));
    values.push_back(static_cast<TestType>(limits::min() / 2));
  }

  std::mt19937_64 rng(17);
  for (int i = 0; i < 500; ++i) {
    values.push_back(static_cast<TestType>(rng()));
  }

  require_order_preserved(values);

  SECTION("Decoding restores the value") {
    for (const auto v : values) {
      REQUIRE(decode_sortable<TestType>(encode_sortable(v)) == v);
    }
  }

  SECTION("Encoding has the width of the type") {
    REQUIRE(encode_sortable(static_cast<TestType>(0)).size() ==
            sizeof(TestType));
  }
}

TEMPLATE_TEST_CASE("encode_sortable preserves floating point order",
                   "[sortable_encoding]", float, double) {
  using limits = std::numeric_limits<TestType>;
  std::vector<TestType> values = {-limits::infinity(),
                                  limits::lowest(),
                                  static_cast<TestType>(-1.5),
                                  -limits::denorm_min(),
                                  static_cast<TestType>(0.0),
                                  limits::denorm_min(),
                                  limits::min(),
                                  static_cast<TestType>(1.0),
                                  static_cast<TestType>(3.25),
                                  limits::max(),
                                  limits::infinity()};

  std::mt19937 rng(3);
  std::uniform_real_distribution<TestType> dist(static_cast<TestType>(-1e6),
                                                static_cast<TestType>(1e6));
  for (int i = 0; i < 500; ++i) {
    values.push_back(dist(rng));
  }

  require_order_preserved(values);

  SECTION("Negative zero sorts immediately before positive zero") {
    const auto neg = encode_sortable(static_cast<TestType>(-0.0));
    const auto pos = encode_sortable(static_cast<TestType>(0.0));
    REQUIRE(bytes_less(neg, pos));
    REQUIRE(bytes_less(encode_sortable(-limits::denorm_min()), neg));
  }

  SECTION("Decoding restores the value") {
    for (const auto v : values) {
      REQUIRE(decode_sortable<TestType>(encode_sortable(v)) == v);
    }
  }
}

TEST_CASE("encode_sortable_tuple orders by components", "[sortable_encoding]") {
  const auto a = encode_sortable_tuple(std::int32_t{-5}, std::uint16_t{9});
  const auto b = encode_sortable_tuple(std::int32_t{-5}, std::uint16_t{10});
  const auto c = encode_sortable_tuple(std::int32_t{3}, std::uint16_t{0});

  REQUIRE(a.size() == sizeof(std::int32_t) + sizeof(std::uint16_t));
  REQUIRE(bytes_less(a, b));
  REQUIRE(bytes_less(b, c));
  REQUIRE(bytes_less(a, c));

  const auto first = encode_sortable(std::int32_t{-5});
  REQUIRE(std::equal(first.begin(), first.end(), a.begin()));
}

TEST_CASE("encoded keys drive a sorted_slice_vector", "[sortable_encoding]") {
  struct Trade {
    std::array<std::uint8_t, 12> key;
    double price;
  };
  auto key = [](const Trade& t) -> const std::array<std::uint8_t, 12>& {
    return t.key;
  };

  sorted_slice_vector<Trade, decltype(key)> trades(key);
  trades.insert({encode_sortable_tuple(std::int32_t{7}, std::int64_t{300}), 3.0});
  trades.insert({encode_sortable_tuple(std::int32_t{-2}, std::int64_t{100}), 1.0});
  trades.insert({encode_sortable_tuple(std::int32_t{7}, std::int64_t{-50}), 2.0});

  REQUIRE(trades[0].price == 1.0);
  REQUIRE(trades[1].price == 2.0);
  REQUIRE(trades[2].price == 3.0);

  const auto lookup = encode_sortable_tuple(std::int32_t{7}, std::int64_t{300});
  REQUIRE(trades.find(lookup)->price == 3.0);
  REQUIRE(!trades.contains(
      encode_sortable_tuple(std::int32_t{7}, std::int64_t{301})));
}
