// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <functional>
#include <ranges>
#include <span>
#include <type_traits>
#include <utility>

#include "slice_compare.hpp"

namespace kressler::sortedvec {

/**
 * Key function returning the element itself.
 */
struct identity_key {
  template <typename T>
  constexpr const T& operator()(const T& value) const noexcept {
    return value;
  }
};

template <typename KeyFn, typename T>
using key_result_t = std::invoke_result_t<const KeyFn&, const T&>;

/**
 * Requirements on a key policy P for elements of type T.
 *
 * A key policy derives keys from elements and knows how to order and search
 * them:
 *   - key(value): the key of an element
 *   - less(a, b): strict weak ordering of elements by key
 *   - equivalent(a, b): neither element's key orders before the other
 *   - locate(elements, key): over sorted elements, {index, true} for an
 *     element with an equal key, or {insertion point, false}
 */
template <typename P, typename T>
concept KeyPolicyFor =
    std::copy_constructible<P> &&
    requires(const P& policy, const T& a, std::span<const T> elements) {
      policy.key(a);
      { policy.less(a, a) } -> std::convertible_to<bool>;
      { policy.equivalent(a, a) } -> std::convertible_to<bool>;
      {
        policy.locate(elements, policy.key(a))
      } -> std::same_as<std::pair<std::size_t, bool>>;
    };

// ============================================================================
// Scalar keys
// ============================================================================

/**
 * Key policy for scalar or tuple keys ordered by a comparison function.
 * Lookups use a standard binary search over the derived keys.
 *
 * @tparam KeyFn Pure function (or member pointer) from const T& to a key.
 *         It may return the key by value or by reference.
 * @tparam Compare Strict weak ordering over keys (defaults to std::less<>)
 */
template <typename KeyFn = identity_key, typename Compare = std::less<>>
class scalar_key {
 public:
  using key_function = KeyFn;
  using key_compare = Compare;

  scalar_key()
    requires std::default_initializable<KeyFn> &&
                 std::default_initializable<Compare>
      : key_fn_(), comp_() {}

  scalar_key(KeyFn key_fn, Compare comp = Compare())
      : key_fn_(std::move(key_fn)), comp_(std::move(comp)) {}

  template <typename T>
  decltype(auto) key(const T& value) const {
    return std::invoke(key_fn_, value);
  }

  template <typename T>
  bool less(const T& a, const T& b) const {
    return comp_(key(a), key(b));
  }

  template <typename T>
  bool equivalent(const T& a, const T& b) const {
    return !comp_(key(a), key(b)) && !comp_(key(b), key(a));
  }

  /**
   * Binary search for a key over sorted elements.
   *
   * With duplicate keys the first element of the run is reported. Callers
   * must not rely on which of several equal-key elements is found.
   */
  template <typename T, typename K>
  std::pair<std::size_t, bool> locate(std::span<const T> elements,
                                      const K& target) const {
    const auto it = std::lower_bound(
        elements.begin(), elements.end(), target,
        [this](const T& element, const K& k) { return comp_(key(element), k); });
    const auto idx = static_cast<std::size_t>(it - elements.begin());
    const bool found = it != elements.end() && !comp_(target, key(*it));
    return {idx, found};
  }

  const KeyFn& key_fn() const { return key_fn_; }
  const Compare& key_comp() const { return comp_; }

 private:
  [[no_unique_address]] KeyFn key_fn_;
  [[no_unique_address]] Compare comp_;
};

// ============================================================================
// Sequence keys
// ============================================================================

/**
 * Key policy for keys that are contiguous sequences (strings, byte arrays,
 * spans) ordered lexicographically. A sequence that is a strict prefix of
 * another orders before it.
 *
 * Lookups use a prefix-aware binary search: the lengths of the prefixes
 * already proven equal to the target at the lower and upper bounds of the
 * search range are tracked, and every comparison skips the smaller of the two.
 * For keys with long shared prefixes (URLs, paths, identifiers) this avoids
 * re-comparing the same leading bytes at each step.
 *
 * @tparam KeyFn Pure function from const T& to a reference or borrowed view
 *         (const std::string&, std::string_view, std::span<const E>, ...)
 *         into the element. Returning an owning temporary is rejected at
 *         compile time.
 * @tparam Comparator Slice comparator strategy (see slice_compare.hpp)
 */
template <typename KeyFn = identity_key,
          typename Comparator = default_slice_comparator>
class slice_key {
 public:
  using key_function = KeyFn;
  using comparator_type = Comparator;

  template <typename T>
  using element_type = std::remove_cv_t<
      std::ranges::range_value_t<key_result_t<KeyFn, T>>>;

  slice_key()
    requires std::default_initializable<KeyFn>
      : key_fn_(), comp_() {}

  slice_key(KeyFn key_fn, Comparator comp = Comparator())
      : key_fn_(std::move(key_fn)), comp_(std::move(comp)) {}

  template <typename T>
  std::span<const element_type<T>> key(const T& value) const {
    using result = key_result_t<KeyFn, T>;
    static_assert(std::is_lvalue_reference_v<result> ||
                      std::ranges::borrowed_range<result>,
                  "slice_key: the key function must return a reference or a "
                  "view into the element, not a temporary sequence");
    static_assert(SliceComparator<Comparator, element_type<T>>,
                  "slice_key: comparator does not support this element type");
    return to_slice<element_type<T>>(std::invoke(key_fn_, value));
  }

  template <typename T>
  bool less(const T& a, const T& b) const {
    return comp_(key(a), key(b)).ordering < 0;
  }

  template <typename T>
  bool equivalent(const T& a, const T& b) const {
    return comp_(key(a), key(b)).ordering == 0;
  }

  /**
   * Prefix-aware binary search for a sequence key over sorted elements.
   *
   * @param elements Elements sorted by key
   * @param target Any contiguous sequence of the key's element type
   * @return {index of an element with an equal key, true}, or
   *         {index at which the target would be inserted, false}
   *
   * Complexity: O(log n) comparisons; each one only compares the part of the
   * key beyond the prefix shared with both current bounds.
   */
  template <typename T, typename K>
  std::pair<std::size_t, bool> locate(std::span<const T> elements,
                                      const K& target) const {
    using E = element_type<T>;
    const std::span<const E> needle = to_slice<E>(target);

    std::size_t size = elements.size();
    if (size == 0) {
      return {0, false};
    }

    std::size_t base = 0;
    std::size_t lower_shared = 0;
    std::size_t upper_shared = 0;
    while (size > 1) {
      const std::size_t half = size / 2;
      const std::size_t mid = base + half;
      // Every key between the bounds starts with the first `skip` elements
      // of the target.
      const std::size_t skip = std::min(lower_shared, upper_shared);
      const auto [prefix_len, order] =
          comp_(key(elements[mid]).subspan(skip), needle.subspan(skip));
      if (order > 0) {
        upper_shared = skip + prefix_len;
      } else if (order < 0) {
        lower_shared = skip + prefix_len;
        base = mid;
      } else {
        return {mid, true};
      }
      size -= half;
    }

    const std::size_t skip = std::min(lower_shared, upper_shared);
    const auto [prefix_len, order] =
        comp_(key(elements[base]).subspan(skip), needle.subspan(skip));
    if (order == 0) {
      return {base, true};
    }
    // The last candidate may order before the target
    return {order < 0 ? base + 1 : base, false};
  }

  const KeyFn& key_fn() const { return key_fn_; }
  const Comparator& comparator() const { return comp_; }

 private:
  [[no_unique_address]] KeyFn key_fn_;
  [[no_unique_address]] Comparator comp_;
};

}  // namespace kressler::sortedvec
