// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <benchmark/benchmark.h>

#include <cstdint>
#include <random>
#include <span>
#include <string>
#include <vector>

#include <sortedvec/slice_compare.hpp>
#include <sortedvec/sorted_vector.hpp>

using namespace kressler::sortedvec;

static void SharedPrefixLengths(benchmark::internal::Benchmark* b) {
  for (const int len : {0, 7, 8, 31, 32, 100, 512, 4096}) {
    b->Arg(len);
  }
}

// Two byte sequences sharing exactly `shared` leading bytes
static std::pair<std::vector<std::uint8_t>, std::vector<std::uint8_t>>
MakePair(std::size_t shared) {
  std::mt19937 rng(42);
  std::uniform_int_distribution<int> dist(0, 255);
  std::vector<std::uint8_t> a(shared + 16);
  for (auto& byte : a) {
    byte = static_cast<std::uint8_t>(dist(rng));
  }
  auto b = a;
  b[shared] = static_cast<std::uint8_t>(a[shared] + 1);
  return {std::move(a), std::move(b)};
}

// ============================================================================
// Comparator strategies on a single pair
// ============================================================================

template <typename Comparator>
static void BM_Compare(benchmark::State& state) {
  const auto [a, b] = MakePair(static_cast<std::size_t>(state.range(0)));
  const std::span<const std::uint8_t> lhs(a);
  const std::span<const std::uint8_t> rhs(b);
  const Comparator comp;

  for (auto _ : state) {
    auto result = comp(lhs, rhs);
    benchmark::DoNotOptimize(result);
  }
  state.SetBytesProcessed(state.iterations() *
                          static_cast<std::int64_t>(state.range(0)));
}

BENCHMARK(BM_Compare<generic_slice_comparator>)->Apply(SharedPrefixLengths);
BENCHMARK(BM_Compare<word_slice_comparator>)->Apply(SharedPrefixLengths);
BENCHMARK(BM_Compare<simd_slice_comparator>)->Apply(SharedPrefixLengths);

// ============================================================================
// Prefix-aware search vs whole-key comparison over keys with a long common
// prefix (URL-like)
// ============================================================================

constexpr std::size_t kKeyCount = 10000;

static std::vector<std::string> MakePrefixedKeys(std::size_t prefix_len) {
  std::mt19937 rng(7);
  std::uniform_int_distribution<int> dist('a', 'z');
  const std::string prefix(prefix_len, '/');
  std::vector<std::string> keys;
  keys.reserve(kKeyCount);
  for (std::size_t i = 0; i < kKeyCount; ++i) {
    std::string key = prefix;
    for (int j = 0; j < 12; ++j) {
      key.push_back(static_cast<char>(dist(rng)));
    }
    keys.push_back(std::move(key));
  }
  return keys;
}

template <typename Comparator>
static void BM_PrefixedKeys_SliceSearch(benchmark::State& state) {
  const auto keys = MakePrefixedKeys(static_cast<std::size_t>(state.range(0)));
  const sorted_slice_vector<std::string, identity_key, Comparator> sv(keys);

  std::size_t idx = 0;
  for (auto _ : state) {
    auto it = sv.find(keys[idx % keys.size()]);
    benchmark::DoNotOptimize(it);
    ++idx;
  }
  state.SetItemsProcessed(state.iterations());
}

static void BM_PrefixedKeys_ScalarSearch(benchmark::State& state) {
  const auto keys = MakePrefixedKeys(static_cast<std::size_t>(state.range(0)));
  const auto sv = make_sorted_vector(keys);

  std::size_t idx = 0;
  for (auto _ : state) {
    auto it = sv.find(keys[idx % keys.size()]);
    benchmark::DoNotOptimize(it);
    ++idx;
  }
  state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_PrefixedKeys_ScalarSearch)->Apply(SharedPrefixLengths);
BENCHMARK(BM_PrefixedKeys_SliceSearch<generic_slice_comparator>)
    ->Apply(SharedPrefixLengths);
BENCHMARK(BM_PrefixedKeys_SliceSearch<word_slice_comparator>)
    ->Apply(SharedPrefixLengths);
BENCHMARK(BM_PrefixedKeys_SliceSearch<simd_slice_comparator>)
    ->Apply(SharedPrefixLengths);

BENCHMARK_MAIN();
