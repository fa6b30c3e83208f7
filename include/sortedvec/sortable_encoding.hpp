// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace kressler::sortedvec {

/**
 * @brief Encodings of numeric values into byte arrays whose lexicographic
 * order matches the numeric order.
 *
 * Encoded keys can be stored in an element and used as sequence keys, which
 * puts numeric and composite keys on the byte fast path of
 * sorted_slice_vector.
 *
 * Example:
 * @code
 * struct Trade {
 *   std::array<std::uint8_t, 12> key;  // encode_sortable_tuple(symbol, ts)
 *   double price;
 * };
 * auto key = [](const Trade& t) -> const auto& { return t.key; };
 * sorted_slice_vector<Trade, decltype(key)> trades(key);
 * trades.insert(Trade{encode_sortable_tuple(std::int32_t{7}, 1700000000L),
 *                     101.5});
 * @endcode
 */

template <typename T>
concept SortableScalar =
    (std::is_integral_v<T> && !std::is_same_v<T, bool>) ||
    std::is_same_v<T, float> || std::is_same_v<T, double>;

template <SortableScalar T>
using sortable_bytes = std::array<std::uint8_t, sizeof(T)>;

namespace detail {

template <typename T>
struct sortable_bits {
  using type = std::make_unsigned_t<T>;
};

template <>
struct sortable_bits<float> {
  using type = std::uint32_t;
};

template <>
struct sortable_bits<double> {
  using type = std::uint64_t;
};

template <typename T>
using sortable_bits_t = typename sortable_bits<T>::type;

template <typename U>
constexpr U sign_bit() {
  return static_cast<U>(U{1} << (sizeof(U) * 8 - 1));
}

template <typename U>
constexpr U to_big_endian(U bits) {
  if constexpr (sizeof(U) > 1 && std::endian::native == std::endian::little) {
    return std::byteswap(bits);
  } else {
    return bits;
  }
}

}  // namespace detail

/**
 * @brief Encode a value as a big-endian byte array that sorts like the value.
 *
 * - Unsigned integers: big-endian bytes.
 * - Signed integers: sign bit flipped, so negative values sort first.
 * - Floating point: positive values get the sign bit flipped, negative values
 *   get every bit flipped. -0.0 sorts immediately before +0.0; NaNs sort
 *   beyond the infinities of their sign.
 *
 * @param value The value to encode
 * @return Byte array of sizeof(T) bytes
 */
template <SortableScalar T>
constexpr sortable_bytes<T> encode_sortable(T value) {
  using U = detail::sortable_bits_t<T>;
  constexpr U sign = detail::sign_bit<U>();

  auto bits = std::bit_cast<U>(value);
  if constexpr (std::is_floating_point_v<T>) {
    bits = (bits & sign) != 0 ? static_cast<U>(~bits)
                              : static_cast<U>(bits ^ sign);
  } else if constexpr (std::is_signed_v<T>) {
    bits = static_cast<U>(bits ^ sign);
  }
  return std::bit_cast<sortable_bytes<T>>(detail::to_big_endian(bits));
}

/**
 * @brief Decode a byte array produced by encode_sortable<T>.
 */
template <SortableScalar T>
constexpr T decode_sortable(const sortable_bytes<T>& encoded) {
  using U = detail::sortable_bits_t<T>;
  constexpr U sign = detail::sign_bit<U>();

  auto bits = detail::to_big_endian(std::bit_cast<U>(encoded));
  if constexpr (std::is_floating_point_v<T>) {
    bits = (bits & sign) != 0 ? static_cast<U>(bits ^ sign)
                              : static_cast<U>(~bits);
  } else if constexpr (std::is_signed_v<T>) {
    bits = static_cast<U>(bits ^ sign);
  }
  return std::bit_cast<T>(bits);
}

/**
 * @brief Concatenate the encodings of several values into one composite key.
 *
 * The byte order of the result equals the lexicographic order of the tuple
 * (first value most significant), since every component has a fixed width.
 */
template <SortableScalar... Ts>
constexpr std::array<std::uint8_t, (sizeof(Ts) + ... + 0)>
encode_sortable_tuple(Ts... values) {
  std::array<std::uint8_t, (sizeof(Ts) + ... + 0)> result{};
  std::size_t offset = 0;
  auto append = [&](const auto& bytes) {
    for (const std::uint8_t byte : bytes) {
      result[offset++] = byte;
    }
  };
  (append(encode_sortable(values)), ...);
  return result;
}

}  // namespace kressler::sortedvec
