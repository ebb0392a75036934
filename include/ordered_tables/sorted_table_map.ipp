// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

// sorted_table_map.ipp - Implementation details for sorted_table_map
// This file is included at the end of sorted_table_map.hpp
// DO NOT include this file directly

namespace kressler::ordered_tables {

// ============================================================================
// Constructors
// ============================================================================

template <typename Key, typename Value, typename Compare>
  requires ComparatorCompatible<Key, Compare>
sorted_table_map<Key, Value, Compare>::sorted_table_map(
    std::initializer_list<value_type> init)
    : sorted_table_map(init.begin(), init.end()) {}

template <typename Key, typename Value, typename Compare>
  requires ComparatorCompatible<Key, Compare>
template <typename InputIt>
sorted_table_map<Key, Value, Compare>::sorted_table_map(InputIt first,
                                                        InputIt last) {
  for (; first != last; ++first) {
    const value_type& kv = *first;
    insert(kv.first, kv.second);
  }
}

// ============================================================================
// Locator
// ============================================================================

/**
 * Iterative binary search over [low, high_end). Probes the floor midpoint of
 * the inclusive bound [low, high_end - 1] and narrows to the half that can
 * still hold the boundary.
 */
template <typename Key, typename Value, typename Compare>
  requires ComparatorCompatible<Key, Compare>
typename sorted_table_map<Key, Value, Compare>::size_type
sorted_table_map<Key, Value, Compare>::locate(const Key& key, size_type low,
                                              size_type high_end) const {
  assert(high_end <= size());
  while (low < high_end) {
    const size_type mid = low + (high_end - 1 - low) / 2;
    const Key& probe = entries_[mid].key;
    if (comp_(key, probe)) {
      high_end = mid;
    } else if (comp_(probe, key)) {
      low = mid + 1;
    } else {
      // Exact match (unique keys)
      return mid;
    }
  }
  return low;
}

// ============================================================================
// Exact Match Operations
// ============================================================================

template <typename Key, typename Value, typename Compare>
  requires ComparatorCompatible<Key, Compare>
void sorted_table_map<Key, Value, Compare>::throw_key_not_found(
    const char* operation) {
  throw key_not_found(std::string("sorted_table_map::") + operation +
                      ": key not found");
}

template <typename Key, typename Value, typename Compare>
  requires ComparatorCompatible<Key, Compare>
Value& sorted_table_map<Key, Value, Compare>::at(const Key& key) {
  const size_type idx = locate(key);
  if (!holds(idx, key)) {
    throw_key_not_found("at");
  }
  return entries_[idx].value;
}

template <typename Key, typename Value, typename Compare>
  requires ComparatorCompatible<Key, Compare>
const Value& sorted_table_map<Key, Value, Compare>::at(const Key& key) const {
  const size_type idx = locate(key);
  if (!holds(idx, key)) {
    throw_key_not_found("at");
  }
  return entries_[idx].value;
}

template <typename Key, typename Value, typename Compare>
  requires ComparatorCompatible<Key, Compare>
typename sorted_table_map<Key, Value, Compare>::iterator
sorted_table_map<Key, Value, Compare>::find(const Key& key) {
  const size_type idx = locate(key);
  return holds(idx, key) ? iterator(this, idx) : end();
}

template <typename Key, typename Value, typename Compare>
  requires ComparatorCompatible<Key, Compare>
typename sorted_table_map<Key, Value, Compare>::const_iterator
sorted_table_map<Key, Value, Compare>::find(const Key& key) const {
  const size_type idx = locate(key);
  return holds(idx, key) ? const_iterator(this, idx) : end();
}

// ============================================================================
// Insert and Erase Operations
// ============================================================================

template <typename Key, typename Value, typename Compare>
  requires ComparatorCompatible<Key, Compare>
std::pair<typename sorted_table_map<Key, Value, Compare>::iterator, bool>
sorted_table_map<Key, Value, Compare>::insert(const Key& key,
                                              const Value& value) {
  const size_type idx = locate(key);
  if (holds(idx, key)) {
    return {iterator(this, idx), false};
  }

  // Shifts [idx, size) one slot right
  entries_.insert(entries_.begin() + static_cast<difference_type>(idx),
                  entry{key, value});
  return {iterator(this, idx), true};
}

/**
 * insert_or_assign - inserts a new element or assigns to an existing one.
 * Key difference from insert(): overwrites existing values instead of leaving
 * them unchanged. The key itself is never rewritten.
 */
template <typename Key, typename Value, typename Compare>
  requires ComparatorCompatible<Key, Compare>
template <typename M>
std::pair<typename sorted_table_map<Key, Value, Compare>::iterator, bool>
sorted_table_map<Key, Value, Compare>::insert_or_assign(const Key& key,
                                                        M&& value) {
  const size_type idx = locate(key);
  if (holds(idx, key)) {
    entries_[idx].value = std::forward<M>(value);
    return {iterator(this, idx), false};  // false = assignment, not insertion
  }

  entries_.insert(entries_.begin() + static_cast<difference_type>(idx),
                  entry{key, Value(std::forward<M>(value))});
  return {iterator(this, idx), true};
}

template <typename Key, typename Value, typename Compare>
  requires ComparatorCompatible<Key, Compare>
void sorted_table_map<Key, Value, Compare>::remove(const Key& key) {
  const size_type idx = locate(key);
  if (!holds(idx, key)) {
    throw_key_not_found("remove");
  }
  erase(const_iterator(this, idx));
}

template <typename Key, typename Value, typename Compare>
  requires ComparatorCompatible<Key, Compare>
typename sorted_table_map<Key, Value, Compare>::size_type
sorted_table_map<Key, Value, Compare>::erase(const Key& key) {
  const size_type idx = locate(key);
  if (!holds(idx, key)) {
    return 0;
  }
  erase(const_iterator(this, idx));
  return 1;
}

/**
 * Erase an element by iterator. Shifts [pos + 1, size) one slot left, so the
 * returned iterator has the same index as pos.
 */
template <typename Key, typename Value, typename Compare>
  requires ComparatorCompatible<Key, Compare>
typename sorted_table_map<Key, Value, Compare>::iterator
sorted_table_map<Key, Value, Compare>::erase(const_iterator pos) {
  assert(pos.table_ == this && "Iterator does not belong to this table");
  assert(pos.index_ < size() && "Cannot erase end iterator");

  const size_type idx = pos.index_;
  entries_.erase(entries_.begin() + static_cast<difference_type>(idx));
  return iterator(this, idx);
}

// ============================================================================
// Ordered Queries
// ============================================================================

template <typename Key, typename Value, typename Compare>
  requires ComparatorCompatible<Key, Compare>
std::optional<typename sorted_table_map<Key, Value, Compare>::value_type>
sorted_table_map<Key, Value, Compare>::find_min() const {
  if (empty()) {
    return std::nullopt;
  }
  return entry_at(0);
}

template <typename Key, typename Value, typename Compare>
  requires ComparatorCompatible<Key, Compare>
std::optional<typename sorted_table_map<Key, Value, Compare>::value_type>
sorted_table_map<Key, Value, Compare>::find_max() const {
  if (empty()) {
    return std::nullopt;
  }
  return entry_at(size() - 1);
}

template <typename Key, typename Value, typename Compare>
  requires ComparatorCompatible<Key, Compare>
std::optional<typename sorted_table_map<Key, Value, Compare>::value_type>
sorted_table_map<Key, Value, Compare>::find_ge(const Key& key) const {
  const size_type idx = locate(key);
  if (idx < size()) {
    return entry_at(idx);
  }
  return std::nullopt;
}

template <typename Key, typename Value, typename Compare>
  requires ComparatorCompatible<Key, Compare>
std::optional<typename sorted_table_map<Key, Value, Compare>::value_type>
sorted_table_map<Key, Value, Compare>::find_lt(const Key& key) const {
  // Everything left of the locator index is < key
  const size_type idx = locate(key);
  if (idx > 0) {
    return entry_at(idx - 1);
  }
  return std::nullopt;
}

template <typename Key, typename Value, typename Compare>
  requires ComparatorCompatible<Key, Compare>
std::optional<typename sorted_table_map<Key, Value, Compare>::value_type>
sorted_table_map<Key, Value, Compare>::find_gt(const Key& key) const {
  const size_type idx = index_after(key);
  if (idx < size()) {
    return entry_at(idx);
  }
  return std::nullopt;
}

template <typename Key, typename Value, typename Compare>
  requires ComparatorCompatible<Key, Compare>
std::pair<typename sorted_table_map<Key, Value, Compare>::size_type,
          typename sorted_table_map<Key, Value, Compare>::size_type>
sorted_table_map<Key, Value, Compare>::range_bounds(
    const std::optional<Key>& start, const std::optional<Key>& stop) const {
  const size_type first = start ? locate(*start) : 0;
  // Search for stop only at or after first. If stop < start every key in
  // that bound is >= stop and the range collapses to [first, first).
  const size_type last = stop ? locate(*stop, first, size()) : size();
  return {first, last};
}

template <typename Key, typename Value, typename Compare>
  requires ComparatorCompatible<Key, Compare>
typename sorted_table_map<Key, Value, Compare>::range
sorted_table_map<Key, Value, Compare>::find_range(
    const std::optional<Key>& start, const std::optional<Key>& stop) {
  const auto [first, last] = range_bounds(start, stop);
  return range(iterator(this, first), iterator(this, last));
}

template <typename Key, typename Value, typename Compare>
  requires ComparatorCompatible<Key, Compare>
typename sorted_table_map<Key, Value, Compare>::const_range
sorted_table_map<Key, Value, Compare>::find_range(
    const std::optional<Key>& start, const std::optional<Key>& stop) const {
  const auto [first, last] = range_bounds(start, stop);
  return const_range(const_iterator(this, first), const_iterator(this, last));
}

}  // namespace kressler::ordered_tables
