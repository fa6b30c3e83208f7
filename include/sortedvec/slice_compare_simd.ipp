// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

// slice_compare_simd.ipp - AVX2 common prefix scan
// This file is included from slice_compare.hpp when __AVX2__ is defined
// DO NOT include this file directly

inline constexpr bool simd_prefix_available = true;
inline constexpr std::size_t simd_lane_width = 32;

/**
 * Length of the common prefix of two byte sequences, 32 bytes at a time.
 *
 * Each lane pair is compared with _mm256_cmpeq_epi8; the movemask has one bit
 * per equal byte, so the first differing byte is the number of trailing ones.
 * Loads are unaligned and never cross the end of the shared region. The tail
 * (fewer than 32 bytes) is finished by the word scan.
 */
template <ByteLike E>
inline std::size_t simd_common_prefix_len(std::span<const E> a,
                                          std::span<const E> b) {
  const std::size_t shared_len = std::min(a.size(), b.size());

  std::size_t i = 0;
  for (; i + simd_lane_width <= shared_len; i += simd_lane_width) {
    const __m256i a_vec =
        _mm256_loadu_si256(reinterpret_cast<const __m256i*>(a.data() + i));
    const __m256i b_vec =
        _mm256_loadu_si256(reinterpret_cast<const __m256i*>(b.data() + i));

    const auto equal_mask = static_cast<std::uint32_t>(
        _mm256_movemask_epi8(_mm256_cmpeq_epi8(a_vec, b_vec)));
    if (equal_mask != 0xFFFFFFFFu) {
      return i + static_cast<std::size_t>(std::countr_one(equal_mask));
    }
  }

  return i + word_common_prefix_len(a.subspan(i, shared_len - i),
                                    b.subspan(i, shared_len - i));
}
