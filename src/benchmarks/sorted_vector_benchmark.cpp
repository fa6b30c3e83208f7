// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <absl/container/btree_map.h>
#include <ankerl/unordered_dense.h>
#include <benchmark/benchmark.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <format>
#include <random>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <sortedvec/sorted_vector.hpp>

using namespace kressler::sortedvec;

// Table sizes for the small-table benchmarks
static void SmallTableSizes(benchmark::internal::Benchmark* b) {
  for (const int size : {2, 6, 10, 50, 100, 500, 1000}) {
    b->Arg(size);
  }
}

// Set sizes for the DNA primer benchmarks
static void PrimerSetSizes(benchmark::internal::Benchmark* b) {
  for (const int size : {10, 100, 1000, 10000, 100000, 1000000}) {
    b->Arg(size);
  }
}

// ============================================================================
// Key generators
// ============================================================================

struct IntKeys {
  using key_type = std::uint32_t;
  static key_type make(std::uint32_t x) { return x; }
};

struct StringKeys {
  using key_type = std::string;
  static key_type make(std::uint32_t x) { return std::format("{:04}", x); }
};

template <typename Keys>
std::vector<typename Keys::key_type> GenerateKeys(std::size_t count) {
  std::vector<typename Keys::key_type> keys;
  keys.reserve(count);
  for (std::uint32_t i = 0; i < count; ++i) {
    keys.push_back(Keys::make(i));
  }
  return keys;
}

// The element just below the middle of the table
template <typename Keys>
typename Keys::key_type Pivot(std::size_t count) {
  const std::uint32_t mid = static_cast<std::uint32_t>(count / 2);
  return Keys::make(mid == 0 ? 0 : mid - 1);
}

// ============================================================================
// Small-table lookups: integer and 4-digit string keys
// ============================================================================

template <typename Keys>
static void BM_Find_LinearVector(benchmark::State& state) {
  const auto count = static_cast<std::size_t>(state.range(0));
  const auto keys = GenerateKeys<Keys>(count);
  const auto pivot = Pivot<Keys>(count);

  for (auto _ : state) {
    auto it = std::find(keys.begin(), keys.end(), pivot);
    benchmark::DoNotOptimize(it);
  }
  state.SetItemsProcessed(state.iterations());
}

template <typename Keys>
static void BM_Find_UnorderedDense(benchmark::State& state) {
  const auto count = static_cast<std::size_t>(state.range(0));
  const auto keys = GenerateKeys<Keys>(count);
  const auto pivot = Pivot<Keys>(count);

  ankerl::unordered_dense::map<typename Keys::key_type, std::uint32_t> map;
  for (std::uint32_t i = 0; i < keys.size(); ++i) {
    map.emplace(keys[i], i);
  }

  for (auto _ : state) {
    auto it = map.find(pivot);
    benchmark::DoNotOptimize(it);
  }
  state.SetItemsProcessed(state.iterations());
}

template <typename Keys>
static void BM_Find_AbslBtree(benchmark::State& state) {
  const auto count = static_cast<std::size_t>(state.range(0));
  const auto keys = GenerateKeys<Keys>(count);
  const auto pivot = Pivot<Keys>(count);

  absl::btree_map<typename Keys::key_type, std::uint32_t> map;
  for (std::uint32_t i = 0; i < keys.size(); ++i) {
    map.emplace(keys[i], i);
  }

  for (auto _ : state) {
    auto it = map.find(pivot);
    benchmark::DoNotOptimize(it);
  }
  state.SetItemsProcessed(state.iterations());
}

template <typename Keys>
static void BM_Find_SortedVector(benchmark::State& state) {
  const auto count = static_cast<std::size_t>(state.range(0));
  const auto sv = make_sorted_vector(GenerateKeys<Keys>(count));
  const auto pivot = Pivot<Keys>(count);

  for (auto _ : state) {
    auto it = sv.find(pivot);
    benchmark::DoNotOptimize(it);
  }
  state.SetItemsProcessed(state.iterations());
}

template <typename Comparator>
static void BM_Find_SortedSliceVector(benchmark::State& state) {
  const auto count = static_cast<std::size_t>(state.range(0));
  const sorted_slice_vector<std::string, identity_key, Comparator> sv(
      GenerateKeys<StringKeys>(count));
  const auto pivot = Pivot<StringKeys>(count);

  for (auto _ : state) {
    auto it = sv.find(pivot);
    benchmark::DoNotOptimize(it);
  }
  state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_Find_LinearVector<IntKeys>)->Apply(SmallTableSizes);
BENCHMARK(BM_Find_UnorderedDense<IntKeys>)->Apply(SmallTableSizes);
BENCHMARK(BM_Find_AbslBtree<IntKeys>)->Apply(SmallTableSizes);
BENCHMARK(BM_Find_SortedVector<IntKeys>)->Apply(SmallTableSizes);

BENCHMARK(BM_Find_LinearVector<StringKeys>)->Apply(SmallTableSizes);
BENCHMARK(BM_Find_UnorderedDense<StringKeys>)->Apply(SmallTableSizes);
BENCHMARK(BM_Find_AbslBtree<StringKeys>)->Apply(SmallTableSizes);
BENCHMARK(BM_Find_SortedVector<StringKeys>)->Apply(SmallTableSizes);
BENCHMARK(BM_Find_SortedSliceVector<generic_slice_comparator>)
    ->Apply(SmallTableSizes);
BENCHMARK(BM_Find_SortedSliceVector<word_slice_comparator>)
    ->Apply(SmallTableSizes);
BENCHMARK(BM_Find_SortedSliceVector<simd_slice_comparator>)
    ->Apply(SmallTableSizes);

// ============================================================================
// DNA primer lookups: short sequences over a 4-letter alphabet
// ============================================================================

enum class Nucleobase : std::uint8_t { Adenine, Cytosine, Guanine, Thymine };

struct Primer {
  std::uint8_t length;
  std::array<Nucleobase, 31> sequence;

  std::span<const std::uint8_t> bases() const {
    return std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(sequence.data()), length);
  }

  friend bool operator==(const Primer& a, const Primer& b) {
    return std::ranges::equal(a.bases(), b.bases());
  }

  friend bool operator<(const Primer& a, const Primer& b) {
    return std::ranges::lexicographical_compare(a.bases(), b.bases());
  }
};
static_assert(sizeof(Primer) == 32);

struct PrimerBases {
  std::span<const std::uint8_t> operator()(const Primer& p) const {
    return p.bases();
  }
};

struct PrimerHash {
  using is_avalanching = void;

  std::uint64_t operator()(const Primer& p) const noexcept {
    const auto bases = p.bases();
    return ankerl::unordered_dense::hash<std::string_view>{}(std::string_view(
        reinterpret_cast<const char*>(bases.data()), bases.size()));
  }
};

// Primers 22-25 bases long, each base drawn from a distribution that depends
// on its predecessor
static Primer RandomPrimer(std::mt19937& rng) {
  // Cumulative thresholds out of 256 for the next base, indexed by the
  // previous base
  static constexpr std::array<std::array<int, 3>, 4> kTransitions = {{
      {129, 171, 241},  // after Adenine
      {81, 101, 201},   // after Cytosine
      {61, 81, 181},    // after Guanine
      {31, 121, 255},   // after Thymine
  }};

  std::uniform_int_distribution<int> byte_dist(0, 255);
  Primer p{};
  p.length = static_cast<std::uint8_t>(22 + byte_dist(rng) % 4);
  auto prev = Nucleobase::Adenine;
  for (std::size_t i = 0; i < p.length; ++i) {
    const int roll = byte_dist(rng);
    const auto& thresholds = kTransitions[static_cast<std::size_t>(prev)];
    std::uint8_t next = 3;
    for (std::uint8_t b = 0; b < 3; ++b) {
      if (roll < thresholds[b]) {
        next = b;
        break;
      }
    }
    prev = static_cast<Nucleobase>(next);
    p.sequence[i] = prev;
  }
  return p;
}

static std::vector<Primer> GeneratePrimers(std::size_t count) {
  std::mt19937 rng(42);
  std::vector<Primer> primers;
  primers.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    primers.push_back(RandomPrimer(rng));
  }
  return primers;
}

// Whole-element comparison through Primer::operator<
static void BM_Primer_SortedVector(benchmark::State& state) {
  const auto count = static_cast<std::size_t>(state.range(0));
  const auto dataset = make_sorted_vector(GeneratePrimers(count));
  const Primer target = dataset[count / 2 - 1];

  for (auto _ : state) {
    auto it = dataset.find(target);
    benchmark::DoNotOptimize(it);
  }
  state.SetItemsProcessed(state.iterations());
}

// Prefix-aware search over the base sequence
static void BM_Primer_SortedSliceVector(benchmark::State& state) {
  const auto count = static_cast<std::size_t>(state.range(0));
  const auto dataset =
      make_sorted_slice_vector(GeneratePrimers(count), PrimerBases{});
  const Primer target = dataset[count / 2 - 1];

  for (auto _ : state) {
    auto it = dataset.find(target.bases());
    benchmark::DoNotOptimize(it);
  }
  state.SetItemsProcessed(state.iterations());
}

static void BM_Primer_UnorderedDense(benchmark::State& state) {
  const auto count = static_cast<std::size_t>(state.range(0));
  const auto primers = GeneratePrimers(count);
  ankerl::unordered_dense::set<Primer, PrimerHash> dataset(primers.begin(),
                                                           primers.end());
  const Primer target = primers[count / 2 - 1];

  for (auto _ : state) {
    auto it = dataset.find(target);
    benchmark::DoNotOptimize(it);
  }
  state.SetItemsProcessed(state.iterations());
}

static void BM_Primer_AbslBtree(benchmark::State& state) {
  const auto count = static_cast<std::size_t>(state.range(0));
  const auto primers = GeneratePrimers(count);
  absl::btree_map<Primer, std::size_t> dataset;
  for (std::size_t i = 0; i < primers.size(); ++i) {
    dataset.emplace(primers[i], i);
  }
  const Primer target = primers[count / 2 - 1];

  for (auto _ : state) {
    auto it = dataset.find(target);
    benchmark::DoNotOptimize(it);
  }
  state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_Primer_SortedVector)->Apply(PrimerSetSizes);
BENCHMARK(BM_Primer_SortedSliceVector)->Apply(PrimerSetSizes);
BENCHMARK(BM_Primer_UnorderedDense)->Apply(PrimerSetSizes);
BENCHMARK(BM_Primer_AbslBtree)->Apply(PrimerSetSizes);

// ============================================================================
// Mutation: remove + insert cycle on a table of the given size
// ============================================================================

template <typename Keys>
static void BM_RemoveInsert_SortedVector(benchmark::State& state) {
  const auto count = static_cast<std::size_t>(state.range(0));
  auto sv = make_sorted_vector(GenerateKeys<Keys>(count));
  const auto pivot = Pivot<Keys>(count);

  for (auto _ : state) {
    auto removed = sv.remove(pivot);
    sv.insert(std::move(*removed));
    benchmark::DoNotOptimize(sv);
  }
  state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_RemoveInsert_SortedVector<IntKeys>)->Apply(SmallTableSizes);
BENCHMARK(BM_RemoveInsert_SortedVector<StringKeys>)->Apply(SmallTableSizes);

BENCHMARK_MAIN();
