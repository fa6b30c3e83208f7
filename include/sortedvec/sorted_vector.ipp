// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

// sorted_vector.ipp - Implementation details for basic_sorted_vector
// This file is included at the end of sorted_vector.hpp
// DO NOT include this file directly

namespace kressler::sortedvec {

// ============================================================================
// Constructors
// ============================================================================

template <typename T, typename KeyPolicy, typename Allocator>
  requires KeyPolicyFor<KeyPolicy, T>
basic_sorted_vector<T, KeyPolicy, Allocator>::basic_sorted_vector(
    container_type unsorted, KeyPolicy policy)
    : inner_(std::move(unsorted)), policy_(std::move(policy)) {
  sort();
}

template <typename T, typename KeyPolicy, typename Allocator>
  requires KeyPolicyFor<KeyPolicy, T>
template <std::input_iterator InputIt>
basic_sorted_vector<T, KeyPolicy, Allocator>::basic_sorted_vector(
    InputIt first, InputIt last, KeyPolicy policy)
    : inner_(first, last), policy_(std::move(policy)) {
  sort();
}

template <typename T, typename KeyPolicy, typename Allocator>
  requires KeyPolicyFor<KeyPolicy, T>
basic_sorted_vector<T, KeyPolicy, Allocator>::basic_sorted_vector(
    std::initializer_list<T> init, KeyPolicy policy)
    : inner_(init), policy_(std::move(policy)) {
  sort();
}

// ============================================================================
// Lookup
// ============================================================================

template <typename T, typename KeyPolicy, typename Allocator>
  requires KeyPolicyFor<KeyPolicy, T>
template <typename K>
typename basic_sorted_vector<T, KeyPolicy, Allocator>::const_iterator
basic_sorted_vector<T, KeyPolicy, Allocator>::find(const K& key) const {
  const auto [idx, found] = locate(key);
  if (!found) {
    return end();
  }
  return begin() + static_cast<difference_type>(idx);
}

template <typename T, typename KeyPolicy, typename Allocator>
  requires KeyPolicyFor<KeyPolicy, T>
typename basic_sorted_vector<T, KeyPolicy, Allocator>::const_reference
basic_sorted_vector<T, KeyPolicy, Allocator>::at(size_type index) const {
  if (index >= inner_.size()) {
    throw std::out_of_range("sorted_vector::at: index " +
                            std::to_string(index) + " >= size " +
                            std::to_string(inner_.size()));
  }
  return inner_[index];
}

// ============================================================================
// Insert and Remove Operations
// ============================================================================

template <typename T, typename KeyPolicy, typename Allocator>
  requires KeyPolicyFor<KeyPolicy, T>
typename basic_sorted_vector<T, KeyPolicy, Allocator>::const_iterator
basic_sorted_vector<T, KeyPolicy, Allocator>::insert(T value) {
  // Found or not, idx is a position that keeps the order
  const size_type idx = locate(policy_.key(value)).first;
  const auto pos =
      inner_.insert(inner_.begin() + static_cast<difference_type>(idx),
                    std::move(value));

  assert(is_sorted() && "Insertion broke the ordering; is the key function "
                        "pure and the comparison a strict weak ordering?");
  return pos;
}

template <typename T, typename KeyPolicy, typename Allocator>
  requires KeyPolicyFor<KeyPolicy, T>
template <typename K>
std::optional<T> basic_sorted_vector<T, KeyPolicy, Allocator>::remove(
    const K& key) {
  const auto [idx, found] = locate(key);
  if (!found) {
    return std::nullopt;
  }
  const auto pos = inner_.begin() + static_cast<difference_type>(idx);
  std::optional<T> removed(std::move(*pos));
  inner_.erase(pos);
  return removed;
}

template <typename T, typename KeyPolicy, typename Allocator>
  requires KeyPolicyFor<KeyPolicy, T>
T basic_sorted_vector<T, KeyPolicy, Allocator>::remove_at(size_type index) {
  if (index >= inner_.size()) {
    throw std::out_of_range("sorted_vector::remove_at: index " +
                            std::to_string(index) + " >= size " +
                            std::to_string(inner_.size()));
  }
  const auto pos = inner_.begin() + static_cast<difference_type>(index);
  T removed(std::move(*pos));
  inner_.erase(pos);
  return removed;
}

template <typename T, typename KeyPolicy, typename Allocator>
  requires KeyPolicyFor<KeyPolicy, T>
std::optional<T> basic_sorted_vector<T, KeyPolicy, Allocator>::pop() {
  if (inner_.empty()) {
    return std::nullopt;
  }
  std::optional<T> last(std::move(inner_.back()));
  inner_.pop_back();
  return last;
}

template <typename T, typename KeyPolicy, typename Allocator>
  requires KeyPolicyFor<KeyPolicy, T>
void basic_sorted_vector<T, KeyPolicy, Allocator>::dedup_by_key() {
  const auto new_end =
      std::unique(inner_.begin(), inner_.end(), [this](const T& a, const T& b) {
        return policy_.equivalent(a, b);
      });
  inner_.erase(new_end, inner_.end());
}

template <typename T, typename KeyPolicy, typename Allocator>
  requires KeyPolicyFor<KeyPolicy, T>
void basic_sorted_vector<T, KeyPolicy, Allocator>::truncate(size_type len) {
  if (len < inner_.size()) {
    inner_.erase(inner_.begin() + static_cast<difference_type>(len),
                 inner_.end());
  }
}

// ============================================================================
// Split and Extend
// ============================================================================

template <typename T, typename KeyPolicy, typename Allocator>
  requires KeyPolicyFor<KeyPolicy, T>
basic_sorted_vector<T, KeyPolicy, Allocator>
basic_sorted_vector<T, KeyPolicy, Allocator>::split_at(size_type index) {
  if (index > inner_.size()) {
    throw std::out_of_range("sorted_vector::split_at: index " +
                            std::to_string(index) + " > size " +
                            std::to_string(inner_.size()));
  }

  const auto split_pos = inner_.begin() + static_cast<difference_type>(index);
  container_type tail(std::make_move_iterator(split_pos),
                      std::make_move_iterator(inner_.end()),
                      inner_.get_allocator());
  inner_.erase(split_pos, inner_.end());

  // A contiguous run of a sorted sequence is sorted
  return basic_sorted_vector(already_sorted_t{}, std::move(tail), policy_);
}

template <typename T, typename KeyPolicy, typename Allocator>
  requires KeyPolicyFor<KeyPolicy, T>
template <std::ranges::input_range R>
void basic_sorted_vector<T, KeyPolicy, Allocator>::extend(R&& range) {
  // Only an rvalue that owns its elements may give them up; views refer to
  // someone else's storage
  constexpr bool owns_elements = !std::is_lvalue_reference_v<R> &&
                                 !std::ranges::view<std::remove_cvref_t<R>>;

  // The range may alias this container, so gather it before growing
  container_type incoming(inner_.get_allocator());
  if constexpr (std::ranges::sized_range<R>) {
    incoming.reserve(static_cast<size_type>(std::ranges::size(range)));
  }
  for (auto&& value : range) {
    if constexpr (owns_elements) {
      incoming.push_back(std::move(value));
    } else {
      incoming.push_back(value);
    }
  }
  append_and_sort(std::move(incoming));
}

template <typename T, typename KeyPolicy, typename Allocator>
  requires KeyPolicyFor<KeyPolicy, T>
template <std::input_iterator InputIt>
void basic_sorted_vector<T, KeyPolicy, Allocator>::extend(InputIt first,
                                                          InputIt last) {
  // [first, last) may point into this container, so copy out before growing
  append_and_sort(container_type(first, last, inner_.get_allocator()));
}

template <typename T, typename KeyPolicy, typename Allocator>
  requires KeyPolicyFor<KeyPolicy, T>
void basic_sorted_vector<T, KeyPolicy, Allocator>::append_and_sort(
    container_type incoming) {
  inner_.reserve(inner_.size() + incoming.size());
  std::move(incoming.begin(), incoming.end(), std::back_inserter(inner_));
  sort();
}

// ============================================================================
// Conversion and Invariant
// ============================================================================

template <typename T, typename KeyPolicy, typename Allocator>
  requires KeyPolicyFor<KeyPolicy, T>
typename basic_sorted_vector<T, KeyPolicy, Allocator>::container_type
basic_sorted_vector<T, KeyPolicy, Allocator>::into_vector() && {
  container_type released(std::move(inner_));
  inner_.clear();
  return released;
}

template <typename T, typename KeyPolicy, typename Allocator>
  requires KeyPolicyFor<KeyPolicy, T>
bool basic_sorted_vector<T, KeyPolicy, Allocator>::is_sorted() const {
  return std::is_sorted(inner_.begin(), inner_.end(),
                        [this](const T& a, const T& b) {
                          return policy_.less(a, b);
                        });
}

template <typename T, typename KeyPolicy, typename Allocator>
  requires KeyPolicyFor<KeyPolicy, T>
void basic_sorted_vector<T, KeyPolicy, Allocator>::sort() {
  std::sort(inner_.begin(), inner_.end(), [this](const T& a, const T& b) {
    return policy_.less(a, b);
  });

  assert(is_sorted() && "Sorting did not establish the ordering; is the key "
                        "function pure and the comparison a strict weak "
                        "ordering?");
}

}  // namespace kressler::sortedvec
