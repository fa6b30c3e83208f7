// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <algorithm>
#include <bit>
#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <ranges>
#include <span>
#include <string_view>
#include <type_traits>

#ifdef __AVX2__
#include <immintrin.h>
#endif

namespace kressler::sortedvec {

/**
 * Outcome of comparing two sequences: the ordering of the first sequence
 * relative to the second, together with the length of their shared leading
 * prefix.
 *
 * Invariants:
 *   - prefix_len <= min(a.size(), b.size())
 *   - ordering == equivalent implies prefix_len == a.size() == b.size()
 */
struct slice_compare_result {
  std::size_t prefix_len;
  std::weak_ordering ordering;

  bool operator==(const slice_compare_result&) const = default;
};

// Elements that can make up a sequence key
template <typename E>
concept SliceElement = std::totally_ordered<E> && std::copyable<E>;

// Single-byte element types eligible for the word and SIMD fast paths
template <typename E>
concept ByteLike =
    sizeof(E) == 1 && std::is_trivially_copyable_v<E> &&
    !std::is_same_v<std::remove_cv_t<E>, bool> &&
    (std::is_integral_v<E> || std::is_same_v<std::remove_cv_t<E>, std::byte>);

// Character types for which a std::basic_string_view lookup key is accepted
template <typename E>
concept CharLike =
    std::is_same_v<E, char> || std::is_same_v<E, wchar_t> ||
    std::is_same_v<E, char8_t> || std::is_same_v<E, char16_t> ||
    std::is_same_v<E, char32_t>;

// A comparator strategy usable on sequences of E
template <typename C, typename E>
concept SliceComparator =
    std::is_default_constructible_v<C> &&
    requires(const C& comp, std::span<const E> a, std::span<const E> b) {
      { comp(a, b) } -> std::same_as<slice_compare_result>;
    };

/**
 * View any contiguous sequence of E as a span. Character strings convertible
 * to std::basic_string_view<E> (including string literals) are viewed
 * without their terminating null character.
 */
template <typename E, typename R>
constexpr std::span<const E> to_slice(const R& range) {
  if constexpr (CharLike<E>) {
    if constexpr (std::is_convertible_v<const R&, std::basic_string_view<E>>) {
      const std::basic_string_view<E> view = range;
      return std::span<const E>(view.data(), view.size());
    } else {
      return std::span<const E>(range);
    }
  } else {
    static_assert(std::ranges::contiguous_range<const R&> &&
                      std::ranges::sized_range<const R&>,
                  "Sequence keys must be contiguous, sized ranges");
    return std::span<const E>(range);
  }
}

namespace detail {

template <typename E>
constexpr std::weak_ordering element_order(const E& a, const E& b) {
  if (a < b) {
    return std::weak_ordering::less;
  }
  if (b < a) {
    return std::weak_ordering::greater;
  }
  return std::weak_ordering::equivalent;
}

// Reads sizeof(uint64_t) bytes starting at p. Caller guarantees bounds.
template <ByteLike E>
inline std::uint64_t load_word(const E* p) {
  std::uint64_t word;
  std::memcpy(&word, p, sizeof(word));
  return word;
}

// Index of the first (lowest-addressed) nonzero byte of a nonzero XOR word
inline std::size_t first_differing_byte(std::uint64_t xor_word) {
  if constexpr (std::endian::native == std::endian::little) {
    return static_cast<std::size_t>(std::countr_zero(xor_word)) / 8;
  } else {
    return static_cast<std::size_t>(std::countl_zero(xor_word)) / 8;
  }
}

/**
 * Completes a byte comparison once the common prefix is known: the ordering
 * comes from the first differing element, or from the lengths when one
 * sequence is a prefix of the other.
 */
template <ByteLike E>
constexpr slice_compare_result finish_compare(std::span<const E> a,
                                              std::span<const E> b,
                                              std::size_t prefix_len) {
  if (prefix_len < std::min(a.size(), b.size())) {
    return {prefix_len, element_order(a[prefix_len], b[prefix_len])};
  }
  return {prefix_len, a.size() <=> b.size()};
}

}  // namespace detail

// ============================================================================
// Common prefix length
// ============================================================================

/**
 * Length of the common prefix of two sequences, one element at a time.
 */
template <SliceElement E>
constexpr std::size_t generic_common_prefix_len(std::span<const E> a,
                                                std::span<const E> b) {
  const std::size_t shared_len = std::min(a.size(), b.size());
  std::size_t i = 0;
  while (i < shared_len && a[i] == b[i]) {
    ++i;
  }
  return i;
}

/**
 * Length of the common prefix of two byte sequences, 8 bytes at a time.
 *
 * Chunks are XORed and the first nonzero result is resolved with a bit scan.
 * The last, possibly incomplete chunk is read as the final full chunk of the
 * shared region, shifted backwards, so no read leaves either sequence.
 * Regions shorter than one word use the element-by-element loop.
 */
template <ByteLike E>
inline std::size_t word_common_prefix_len(std::span<const E> a,
                                          std::span<const E> b) {
  constexpr std::size_t width = sizeof(std::uint64_t);
  const std::size_t shared_len = std::min(a.size(), b.size());
  if (shared_len < width) {
    return generic_common_prefix_len(a.first(shared_len),
                                     b.first(shared_len));
  }

  const std::size_t last_chunk = shared_len - width;
  std::size_t i = 0;
  for (; i < last_chunk; i += width) {
    const std::uint64_t diff =
        detail::load_word(a.data() + i) ^ detail::load_word(b.data() + i);
    if (diff != 0) {
      return i + detail::first_differing_byte(diff);
    }
  }

  const std::uint64_t diff = detail::load_word(a.data() + last_chunk) ^
                             detail::load_word(b.data() + last_chunk);
  if (diff != 0) {
    return last_chunk + detail::first_differing_byte(diff);
  }
  return shared_len;
}

// ============================================================================
// SIMD common prefix length (AVX2)
// ============================================================================

#ifdef __AVX2__
#include "slice_compare_simd.ipp"
#else
inline constexpr bool simd_prefix_available = false;
inline constexpr std::size_t simd_lane_width = sizeof(std::uint64_t);

/**
 * Without AVX2 the vectorized prefix scan is the word scan.
 */
template <ByteLike E>
inline std::size_t simd_common_prefix_len(std::span<const E> a,
                                          std::span<const E> b) {
  return word_common_prefix_len(a, b);
}
#endif

// ============================================================================
// Comparator strategies
// ============================================================================

/**
 * Element-by-element comparison for any totally ordered element type.
 */
struct generic_slice_comparator {
  template <SliceElement E>
  constexpr slice_compare_result operator()(std::span<const E> a,
                                            std::span<const E> b) const {
    const std::size_t shared_len = std::min(a.size(), b.size());
    for (std::size_t i = 0; i < shared_len; ++i) {
      if (a[i] < b[i]) {
        return {i, std::weak_ordering::less};
      }
      if (b[i] < a[i]) {
        return {i, std::weak_ordering::greater};
      }
    }
    return {shared_len, a.size() <=> b.size()};
  }
};

/**
 * Byte comparison using 64-bit word XOR prefix detection.
 */
struct word_slice_comparator {
  template <ByteLike E>
  slice_compare_result operator()(std::span<const E> a,
                                  std::span<const E> b) const {
    return detail::finish_compare(a, b, word_common_prefix_len(a, b));
  }
};

/**
 * Byte comparison using SIMD lanes where the target supports them, falling
 * back to the word comparator otherwise.
 */
struct simd_slice_comparator {
  template <ByteLike E>
  slice_compare_result operator()(std::span<const E> a,
                                  std::span<const E> b) const {
    return detail::finish_compare(a, b, simd_common_prefix_len(a, b));
  }
};

/**
 * Strategy chosen for elements of type E: the SIMD comparator for
 * single-byte elements, the generic comparator for everything else.
 */
template <SliceElement E>
using default_slice_comparator_t =
    std::conditional_t<ByteLike<E>, simd_slice_comparator,
                       generic_slice_comparator>;

/**
 * Default strategy, dispatching on the element type through
 * default_slice_comparator_t at compile time.
 */
struct default_slice_comparator {
  template <SliceElement E>
  slice_compare_result operator()(std::span<const E> a,
                                  std::span<const E> b) const {
    return default_slice_comparator_t<E>{}(a, b);
  }
};

/**
 * Convenience wrapper comparing two contiguous ranges with a strategy.
 *
 * @code
 * auto [prefix, order] = compare_slices<char>("prefix-a", "prefix-b");
 * // prefix == 7, order == std::weak_ordering::less
 * @endcode
 */
template <SliceElement E, typename Comparator = default_slice_comparator,
          typename A, typename B>
  requires SliceComparator<Comparator, E>
slice_compare_result compare_slices(const A& a, const B& b,
                                    const Comparator& comp = Comparator()) {
  return comp(to_slice<E>(a), to_slice<E>(b));
}

}  // namespace kressler::sortedvec
