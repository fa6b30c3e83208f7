// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <algorithm>
#include <cassert>
#include <concepts>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <optional>
#include <ranges>
#include <span>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "key_policy.hpp"
#include "slice_compare.hpp"

namespace kressler::sortedvec {

/**
 * A vector whose elements are kept sorted by a key derived from each element.
 *
 * Lookups are binary searches, O(log n); insertions and removals shift
 * elements, O(n). Elements are stored contiguously, which makes iteration
 * and small-table lookups cheap compared to node-based maps and hash tables.
 * Intended for lookup tables that are read often and modified rarely.
 *
 * Invariant: for all adjacent elements a, b: !key_policy().less(b, a).
 * Elements with equal keys may appear in any relative order (sorting is not
 * stable).
 *
 * The key function must be pure: the key of an element must not change while
 * the element is stored. Debug builds re-check sortedness after construction,
 * insertion and sorting; in release builds an impure key function leaves the
 * container in an unspecified (but memory-safe) order.
 *
 * Elements are only reachable through const references, since modifying a
 * key in place would break the ordering. Use remove() + insert() to update.
 *
 * Not thread-safe for concurrent modification. Concurrent readers need
 * external synchronization against writers.
 *
 * @tparam T The element type
 * @tparam KeyPolicy Key extraction and search strategy (scalar_key or
 *         slice_key, or any type modelling KeyPolicyFor<KeyPolicy, T>)
 * @tparam Allocator Allocator for the underlying std::vector
 */
template <typename T, typename KeyPolicy, typename Allocator = std::allocator<T>>
  requires KeyPolicyFor<KeyPolicy, T>
class basic_sorted_vector {
 public:
  using value_type = T;
  using key_policy_type = KeyPolicy;
  using allocator_type = Allocator;
  using container_type = std::vector<T, Allocator>;
  using size_type = typename container_type::size_type;
  using difference_type = typename container_type::difference_type;
  using reference = const T&;
  using const_reference = const T&;
  using pointer = const T*;
  using const_pointer = const T*;

  // Only const iteration is offered
  using iterator = typename container_type::const_iterator;
  using const_iterator = typename container_type::const_iterator;
  using reverse_iterator = std::reverse_iterator<const_iterator>;
  using const_reverse_iterator = std::reverse_iterator<const_iterator>;

  /**
   * Default constructor - an empty container with a default key policy
   */
  basic_sorted_vector() = default;

  /**
   * Creates an empty container using the given key policy. Key functions
   * convert implicitly to the policy:
   *
   * @code
   * auto key = [](const Account& a) { return a.id; };
   * sorted_vector<Account, decltype(key)> accounts(key);
   * @endcode
   */
  explicit basic_sorted_vector(KeyPolicy policy,
                               const Allocator& alloc = Allocator())
      : inner_(alloc), policy_(std::move(policy)) {}

  /**
   * Creates a container from an unsorted vector. The elements are sorted
   * once. Complexity: O(n log n)
   */
  basic_sorted_vector(container_type unsorted, KeyPolicy policy = KeyPolicy());

  /**
   * Creates a container from an unsorted iterator range.
   * Complexity: O(n log n)
   */
  template <std::input_iterator InputIt>
  basic_sorted_vector(InputIt first, InputIt last,
                      KeyPolicy policy = KeyPolicy());

  /**
   * Creates a container from an unsorted initializer list.
   */
  basic_sorted_vector(std::initializer_list<T> init,
                      KeyPolicy policy = KeyPolicy());

  /**
   * Named form of the unsorted-vector constructor.
   */
  static basic_sorted_vector from_unsorted(container_type unsorted,
                                           KeyPolicy policy = KeyPolicy()) {
    return basic_sorted_vector(std::move(unsorted), std::move(policy));
  }

  // ==========================================================================
  // Lookup
  // ==========================================================================

  /**
   * Binary search for a key.
   *
   * @param key The key to search for. For sequence keys any contiguous range
   *        of the key's element type is accepted (std::string_view,
   *        std::string, std::span, std::array, string literals, ...)
   * @return {index of an element with this key, true}, or
   *         {index where such an element would be inserted, false}
   *
   * Complexity: O(log n)
   */
  template <typename K>
  std::pair<size_type, bool> locate(const K& key) const {
    return policy_.locate(std::span<const T>(inner_), key);
  }

  /**
   * Find an element by key.
   *
   * If several elements share the key, which one is returned is unspecified.
   *
   * @param key The key to search for
   * @return Iterator to an element with this key, or end() if none exists
   */
  template <typename K>
  const_iterator find(const K& key) const;

  /**
   * Check whether an element with the given key exists. O(log n)
   */
  template <typename K>
  bool contains(const K& key) const {
    return locate(key).second;
  }

  // ==========================================================================
  // Modifiers
  // ==========================================================================

  /**
   * Insert an element at its ordered position. Elements with an equal key
   * are kept; the new element is placed next to them.
   *
   * @param value The element to insert
   * @return Iterator to the inserted element
   *
   * Complexity: O(log n) search + O(n) shift
   */
  const_iterator insert(T value);

  /**
   * Construct an element from args and insert it at its ordered position.
   */
  template <typename... Args>
  const_iterator emplace(Args&&... args) {
    return insert(T(std::forward<Args>(args)...));
  }

  /**
   * Remove one element with the given key.
   *
   * @param key The key to remove
   * @return The removed element, or std::nullopt if no element has the key
   *
   * Complexity: O(log n) search + O(n) shift
   */
  template <typename K>
  std::optional<T> remove(const K& key);

  /**
   * Remove and return the element at position index.
   *
   * @throws std::out_of_range if index >= size()
   */
  T remove_at(size_type index);

  /**
   * Erase the element at pos.
   *
   * @return Iterator to the element following the erased one
   */
  const_iterator erase(const_iterator pos) { return inner_.erase(pos); }

  /**
   * Erase the elements in [first, last).
   */
  const_iterator erase(const_iterator first, const_iterator last) {
    return inner_.erase(first, last);
  }

  /**
   * Remove and return the element with the greatest key, or std::nullopt if
   * the container is empty. O(1)
   */
  std::optional<T> pop();

  /**
   * Collapse every run of consecutive elements with equal keys to its first
   * element. Applying it twice is the same as applying it once. O(n)
   */
  void dedup_by_key();

  /**
   * Split the container in two at the given index.
   *
   * Elements [0, index) remain in this container, elements [index, size())
   * are moved to the returned container, which gets a copy of the key policy.
   * Both halves stay sorted.
   *
   * @throws std::out_of_range if index > size()
   *
   * Complexity: O(size() - index)
   */
  basic_sorted_vector split_at(size_type index);

  /**
   * Append all elements of a range, then sort once.
   *
   * Bulk insertion costs O((n + m) log(n + m)) instead of m shifting
   * inserts. Elements of an rvalue range that owns them (a std::vector
   * passed with std::move) are moved; views and lvalue ranges are copied and
   * left unchanged. The range may refer to this container.
   */
  template <std::ranges::input_range R>
  void extend(R&& range);

  /**
   * Append copies of the elements of [first, last), then sort once. The
   * iterators may point into this container.
   */
  template <std::input_iterator InputIt>
  void extend(InputIt first, InputIt last);

  void extend(std::initializer_list<T> init) {
    extend(init.begin(), init.end());
  }

  /**
   * Keep only the first len elements. No effect if len >= size().
   */
  void truncate(size_type len);

  void clear() noexcept { inner_.clear(); }
  void reserve(size_type capacity) { inner_.reserve(capacity); }
  void shrink_to_fit() { inner_.shrink_to_fit(); }

  void swap(basic_sorted_vector& other) noexcept {
    using std::swap;
    swap(inner_, other.inner_);
    swap(policy_, other.policy_);
  }

  // ==========================================================================
  // Element access
  // ==========================================================================

  const_reference operator[](size_type index) const { return inner_[index]; }

  /**
   * Bounds-checked element access.
   *
   * @throws std::out_of_range if index >= size()
   */
  const_reference at(size_type index) const;

  const_reference front() const { return inner_.front(); }
  const_reference back() const { return inner_.back(); }
  const_pointer data() const noexcept { return inner_.data(); }

  // Iterators
  const_iterator begin() const noexcept { return inner_.begin(); }
  const_iterator end() const noexcept { return inner_.end(); }
  const_iterator cbegin() const noexcept { return inner_.cbegin(); }
  const_iterator cend() const noexcept { return inner_.cend(); }
  const_reverse_iterator rbegin() const noexcept {
    return const_reverse_iterator(end());
  }
  const_reverse_iterator rend() const noexcept {
    return const_reverse_iterator(begin());
  }
  const_reverse_iterator crbegin() const noexcept { return rbegin(); }
  const_reverse_iterator crend() const noexcept { return rend(); }

  // Utility methods
  size_type size() const noexcept { return inner_.size(); }
  bool empty() const noexcept { return inner_.empty(); }
  size_type capacity() const noexcept { return inner_.capacity(); }
  allocator_type get_allocator() const { return inner_.get_allocator(); }

  // ==========================================================================
  // Conversion
  // ==========================================================================

  /**
   * The underlying vector, sorted by key.
   */
  const container_type& as_vector() const& noexcept { return inner_; }

  std::span<const T> as_span() const noexcept { return inner_; }

  /**
   * Release the underlying vector. The returned vector is sorted by key, but
   * the ordering is no longer maintained. This container is left empty.
   */
  container_type into_vector() &&;

  // ==========================================================================
  // Keys
  // ==========================================================================

  const KeyPolicy& key_policy() const noexcept { return policy_; }

  /**
   * The key of an element, as seen by this container.
   */
  decltype(auto) key_of(const T& value) const { return policy_.key(value); }

  /**
   * Check the sortedness invariant. Always true unless the key function is
   * impure. O(n)
   */
  bool is_sorted() const;

  friend bool operator==(const basic_sorted_vector& lhs,
                         const basic_sorted_vector& rhs) {
    return lhs.inner_ == rhs.inner_;
  }

 private:
  struct already_sorted_t {};

  // Adopts a vector that is already in key order
  basic_sorted_vector(already_sorted_t, container_type sorted,
                      KeyPolicy policy)
      : inner_(std::move(sorted)), policy_(std::move(policy)) {
    assert(is_sorted() && "Adopted vector is not sorted by key");
  }

  // Restore the invariant after bulk modification
  void sort();

  // Move elements that do not alias inner_ to the back, then sort once
  void append_and_sort(container_type incoming);

  container_type inner_;
  [[no_unique_address]] KeyPolicy policy_;
};

template <typename T, typename KeyPolicy, typename Allocator>
void swap(basic_sorted_vector<T, KeyPolicy, Allocator>& lhs,
          basic_sorted_vector<T, KeyPolicy, Allocator>& rhs) noexcept {
  lhs.swap(rhs);
}

// ============================================================================
// Container types
// ============================================================================

/**
 * Sorted vector with a scalar (or tuple) key.
 *
 * @code
 * struct A {
 *   double val;
 *   uint32_t key;
 * };
 *
 * sorted_vector<A, decltype(&A::key)> sv(&A::key);
 * sv.insert(A{3.14, 0});
 * sv.insert(A{0.00, 10});
 * sv.insert(A{5.00, 4});
 *
 * assert(sv.find(5u) == sv.end());
 * assert(sv.find(4u)->val == 5.00);
 * @endcode
 */
template <typename T, typename KeyFn = identity_key,
          typename Compare = std::less<>,
          typename Allocator = std::allocator<T>>
using sorted_vector =
    basic_sorted_vector<T, scalar_key<KeyFn, Compare>, Allocator>;

/**
 * Sorted vector with a sequence key (string, byte array, span), using the
 * prefix-aware binary search. Single-byte keys use the SIMD/word comparator
 * by default.
 *
 * @code
 * sorted_slice_vector<std::string> names(
 *     std::vector<std::string>{"abc", "aaa", "bcd", "a", "bda", "aacb"});
 * assert(names.contains("abc"));
 * assert(!names.contains("aa"));
 * @endcode
 */
template <typename T, typename KeyFn = identity_key,
          typename Comparator = default_slice_comparator,
          typename Allocator = std::allocator<T>>
using sorted_slice_vector =
    basic_sorted_vector<T, slice_key<KeyFn, Comparator>, Allocator>;

/**
 * Build a scalar-key sorted vector from an unsorted vector and a key
 * function.
 */
template <typename T, typename Allocator, typename KeyFn = identity_key>
sorted_vector<T, KeyFn, std::less<>, Allocator> make_sorted_vector(
    std::vector<T, Allocator> unsorted, KeyFn key_fn = KeyFn()) {
  return sorted_vector<T, KeyFn, std::less<>, Allocator>(
      std::move(unsorted), scalar_key<KeyFn>(std::move(key_fn)));
}

/**
 * Build a sequence-key sorted vector from an unsorted vector and a key
 * function.
 */
template <typename T, typename Allocator, typename KeyFn = identity_key>
sorted_slice_vector<T, KeyFn, default_slice_comparator, Allocator>
make_sorted_slice_vector(std::vector<T, Allocator> unsorted,
                         KeyFn key_fn = KeyFn()) {
  return sorted_slice_vector<T, KeyFn, default_slice_comparator, Allocator>(
      std::move(unsorted), slice_key<KeyFn>(std::move(key_fn)));
}

}  // namespace kressler::sortedvec

namespace std {

/**
 * Hash of the element sequence, for containers whose elements are hashable.
 * Equal containers (operator==) hash equally.
 */
template <typename T, typename KeyPolicy, typename Allocator>
  requires requires(const T& value) {
    { std::hash<T>{}(value) } -> std::convertible_to<std::size_t>;
  }
struct hash<kressler::sortedvec::basic_sorted_vector<T, KeyPolicy, Allocator>> {
  std::size_t operator()(
      const kressler::sortedvec::basic_sorted_vector<T, KeyPolicy, Allocator>&
          sv) const {
    std::size_t seed = sv.size();
    for (const T& value : sv) {
      seed ^= std::hash<T>{}(value) + 0x9e3779b97f4a7c15ULL + (seed << 6) +
              (seed >> 2);
    }
    return seed;
  }
};

}  // namespace std

// Include implementation
#include "sorted_vector.ipp"
