// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <cassert>
#include <concepts>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace kressler::ordered_tables {

// Concept to enforce that a comparator is compatible with a key type
template <typename Key, typename Compare>
concept ComparatorCompatible = requires(Compare comp, Key a, Key b) {
  { comp(a, b) } -> std::convertible_to<bool>;
} && std::is_default_constructible_v<Compare>;

/**
 * Thrown by the exact-match operations (at, remove) when the key is absent.
 * The table is left unchanged.
 */
class key_not_found : public std::out_of_range {
 public:
  using std::out_of_range::out_of_range;
};

/**
 * A pair of iterators over a contiguous run of a sorted_table_map.
 * Borrows the table: any insertion or removal invalidates it.
 */
template <typename Iterator>
class table_range {
 public:
  using iterator = Iterator;
  using size_type = std::size_t;

  table_range(Iterator first, Iterator last) : first_(first), last_(last) {}

  Iterator begin() const { return first_; }
  Iterator end() const { return last_; }

  [[nodiscard]] bool empty() const { return first_ == last_; }
  [[nodiscard]] size_type size() const {
    return static_cast<size_type>(last_ - first_);
  }

 private:
  Iterator first_;
  Iterator last_;
};

/**
 * A map backed by a single contiguous vector of entries kept sorted by key.
 *
 * Invariants:
 *   - keys are strictly ascending under Compare (no duplicates)
 *   - entries are dense: size() equals the number of stored keys
 *
 * Lookups are O(log n) binary searches. Insertion and removal shift the
 * tail of the vector and are O(n) in the worst case.
 *
 * Not thread safe. Iterators and ranges are invalidated by insert, remove
 * and erase.
 *
 * @tparam Key The key type (must be strictly totally ordered by Compare)
 * @tparam Value The value type
 * @tparam Compare The comparison function object type (must be
 * default-constructible)
 */
template <typename Key, typename Value, typename Compare = std::less<Key>>
  requires ComparatorCompatible<Key, Compare>
class sorted_table_map {
 private:
  // Forward declare iterator class
  template <bool IsConst>
  class sorted_table_iterator;

  // One stored record. Ordering and equality are by key only.
  struct entry {
    Key key;
    Value value;
  };

 public:
  using key_type = Key;
  using mapped_type = Value;
  using value_type = std::pair<Key, Value>;
  using size_type = std::size_t;
  using difference_type = std::ptrdiff_t;
  using key_compare = Compare;

  using iterator = sorted_table_iterator<false>;
  using const_iterator = sorted_table_iterator<true>;
  using reverse_iterator = std::reverse_iterator<iterator>;
  using const_reverse_iterator = std::reverse_iterator<const_iterator>;

  using range = table_range<iterator>;
  using const_range = table_range<const_iterator>;

  /**
   * Default constructor - creates an empty table
   */
  sorted_table_map() = default;

  /**
   * Constructs the table from an initializer list.
   * When a key repeats, the first occurrence wins.
   * Complexity: O(n^2) worst case, O(n log n) for sorted input
   */
  sorted_table_map(std::initializer_list<value_type> init);

  /**
   * Constructs the table from a range of key-value pairs.
   * When a key repeats, the first occurrence wins.
   */
  template <typename InputIt>
  sorted_table_map(InputIt first, InputIt last);

  sorted_table_map(const sorted_table_map& other) = default;
  sorted_table_map(sorted_table_map&& other) noexcept = default;
  sorted_table_map& operator=(const sorted_table_map& other) = default;
  sorted_table_map& operator=(sorted_table_map&& other) noexcept = default;

  /**
   * Returns the number of entries.
   * Complexity: O(1)
   */
  [[nodiscard]] size_type size() const { return entries_.size(); }

  /**
   * Returns true if the table holds no entries.
   * Complexity: O(1)
   */
  [[nodiscard]] bool empty() const { return entries_.empty(); }

  key_compare key_comp() const { return comp_; }

  void reserve(size_type n) { entries_.reserve(n); }
  void clear() { entries_.clear(); }

  void swap(sorted_table_map& other) noexcept {
    using std::swap;
    entries_.swap(other.entries_);
    swap(comp_, other.comp_);
  }

  /**
   * Returns a reference to the value stored under key.
   *
   * @throws key_not_found if the key is absent
   * Complexity: O(log n)
   */
  Value& at(const Key& key);

  /**
   * Returns a const reference to the value stored under key.
   *
   * @throws key_not_found if the key is absent
   * Complexity: O(log n)
   */
  const Value& at(const Key& key) const;

  /**
   * Inserts a new entry if the key does not exist. Existing values are left
   * untouched.
   *
   * @return Pair of iterator to the inserted/existing element and bool
   * indicating whether insertion took place
   */
  std::pair<iterator, bool> insert(const Key& key, const Value& value);

  /**
   * Inserts a new entry, or assigns to the value of an existing one in place.
   * The position of an existing key never changes.
   *
   * @return Pair of iterator to the inserted/updated element and bool
   * indicating insertion (true) vs assignment (false)
   */
  template <typename M>
  std::pair<iterator, bool> insert_or_assign(const Key& key, M&& value);

  /**
   * Removes the entry stored under key.
   *
   * @throws key_not_found if the key is absent (the table is unchanged)
   */
  void remove(const Key& key);

  /**
   * Removes the entry stored under key if present.
   *
   * @return The number of elements erased (0 or 1)
   */
  size_type erase(const Key& key);

  /**
   * Erase an element by iterator.
   *
   * @param pos Iterator to the element to erase (must not be end())
   * @return Iterator to the element following the erased element
   */
  iterator erase(const_iterator pos);

  iterator find(const Key& key);
  const_iterator find(const Key& key) const;

  [[nodiscard]] bool contains(const Key& key) const {
    return find(key) != end();
  }
  size_type count(const Key& key) const { return contains(key) ? 1 : 0; }

  /**
   * Returns an iterator to the first element not less than key, or end().
   */
  iterator lower_bound(const Key& key) {
    return iterator(this, locate(key));
  }
  const_iterator lower_bound(const Key& key) const {
    return const_iterator(this, locate(key));
  }

  /**
   * Returns an iterator to the first element greater than key, or end().
   */
  iterator upper_bound(const Key& key) {
    return iterator(this, index_after(key));
  }
  const_iterator upper_bound(const Key& key) const {
    return const_iterator(this, index_after(key));
  }

  /**
   * Smallest entry, or std::nullopt if the table is empty.
   * Complexity: O(1)
   */
  std::optional<value_type> find_min() const;

  /**
   * Largest entry, or std::nullopt if the table is empty.
   * Complexity: O(1)
   */
  std::optional<value_type> find_max() const;

  /**
   * Entry with the least key greater than or equal to key.
   */
  std::optional<value_type> find_ge(const Key& key) const;

  /**
   * Entry with the greatest key strictly less than key.
   */
  std::optional<value_type> find_lt(const Key& key) const;

  /**
   * Entry with the least key strictly greater than key.
   */
  std::optional<value_type> find_gt(const Key& key) const;

  /**
   * All entries with start <= key < stop, in ascending order.
   * An unset start begins at the minimum key, an unset stop runs through the
   * maximum key. When start > stop the range is empty.
   *
   * Complexity: O(log n) to build, O(k) to walk
   */
  range find_range(const std::optional<Key>& start,
                   const std::optional<Key>& stop);
  const_range find_range(const std::optional<Key>& start,
                         const std::optional<Key>& stop) const;

  // Iterator methods
  iterator begin() { return iterator(this, 0); }
  iterator end() { return iterator(this, size()); }
  const_iterator begin() const { return const_iterator(this, 0); }
  const_iterator end() const { return const_iterator(this, size()); }
  const_iterator cbegin() const { return const_iterator(this, 0); }
  const_iterator cend() const { return const_iterator(this, size()); }

  // Reverse iterator methods
  reverse_iterator rbegin() { return reverse_iterator(end()); }
  reverse_iterator rend() { return reverse_iterator(begin()); }
  const_reverse_iterator rbegin() const {
    return const_reverse_iterator(end());
  }
  const_reverse_iterator rend() const {
    return const_reverse_iterator(begin());
  }
  const_reverse_iterator crbegin() const {
    return const_reverse_iterator(end());
  }
  const_reverse_iterator crend() const {
    return const_reverse_iterator(begin());
  }

 private:
  /**
   * Locator: index j in [low, high_end] such that every entry in [low, j)
   * has a key less than key and every entry in [j, high_end) has a key not
   * less than key. Returns high_end when nothing in the bound qualifies.
   *
   * An exact match returns immediately without looking for an equal key
   * further left. That is only the leftmost match because keys are unique.
   */
  size_type locate(const Key& key, size_type low, size_type high_end) const;

  size_type locate(const Key& key) const { return locate(key, 0, size()); }

  // Index of the first entry whose key is strictly greater than key
  size_type index_after(const Key& key) const {
    size_type idx = locate(key);
    if (holds(idx, key)) {
      ++idx;
    }
    return idx;
  }

  // Index bounds [first, last) of find_range(start, stop)
  std::pair<size_type, size_type> range_bounds(
      const std::optional<Key>& start, const std::optional<Key>& stop) const;

  bool equivalent(const Key& a, const Key& b) const {
    return !comp_(a, b) && !comp_(b, a);
  }

  // True when idx is in bounds and holds key
  bool holds(size_type idx, const Key& key) const {
    return idx < size() && equivalent(entries_[idx].key, key);
  }

  value_type entry_at(size_type idx) const {
    return {entries_[idx].key, entries_[idx].value};
  }

  [[noreturn]] static void throw_key_not_found(const char* operation);

  std::vector<entry> entries_;
  [[no_unique_address]] Compare comp_{};

  // Proxy class to represent a key-value pair reference
  template <bool IsConst>
  class pair_proxy {
   public:
    // Key is always const to prevent breaking sorted order invariant
    using key_ref_type = const Key&;
    using value_ref_type = std::conditional_t<IsConst, const Value&, Value&>;

    pair_proxy(key_ref_type k, value_ref_type v) : first(k), second(v) {}

    // Allow conversion to std::pair for compatibility
    operator std::pair<Key, Value>() const { return {first, second}; }

    key_ref_type first;
    value_ref_type second;
  };

  template <bool IsConst>
  class sorted_table_iterator {
   public:
    struct arrow_proxy {
      pair_proxy<IsConst> ref;
      arrow_proxy(pair_proxy<IsConst> r) : ref(r) {}
      pair_proxy<IsConst>* operator->() { return &ref; }
    };

    using iterator_category = std::random_access_iterator_tag;
    using value_type = std::pair<Key, Value>;
    using difference_type = std::ptrdiff_t;
    using pointer = arrow_proxy;
    using reference = pair_proxy<IsConst>;

    using table_ptr_type = std::conditional_t<IsConst, const sorted_table_map*,
                                              sorted_table_map*>;

    sorted_table_iterator() : table_(nullptr), index_(0) {}

    sorted_table_iterator(table_ptr_type table, size_type idx)
        : table_(table), index_(idx) {}

    // Allow conversion from non-const to const iterator
    template <bool WasConst = IsConst, typename = std::enable_if_t<WasConst>>
    sorted_table_iterator(const sorted_table_iterator<false>& other)
        : table_(other.table_), index_(other.index_) {}

    reference operator*() const {
      assert(index_ < table_->size() && "Dereferencing end iterator");
      auto& e = table_->entries_[index_];
      return reference(e.key, e.value);
    }

    arrow_proxy operator->() const { return arrow_proxy(operator*()); }

    sorted_table_iterator& operator++() {
      ++index_;
      return *this;
    }

    sorted_table_iterator operator++(int) {
      auto tmp = *this;
      ++index_;
      return tmp;
    }

    sorted_table_iterator& operator--() {
      --index_;
      return *this;
    }

    sorted_table_iterator operator--(int) {
      auto tmp = *this;
      --index_;
      return tmp;
    }

    sorted_table_iterator& operator+=(difference_type n) {
      index_ += n;
      return *this;
    }

    sorted_table_iterator& operator-=(difference_type n) {
      index_ -= n;
      return *this;
    }

    sorted_table_iterator operator+(difference_type n) const {
      return sorted_table_iterator(table_, index_ + n);
    }

    friend sorted_table_iterator operator+(difference_type n,
                                           const sorted_table_iterator& it) {
      return it + n;
    }

    sorted_table_iterator operator-(difference_type n) const {
      return sorted_table_iterator(table_, index_ - n);
    }

    difference_type operator-(const sorted_table_iterator& other) const {
      return static_cast<difference_type>(index_) -
             static_cast<difference_type>(other.index_);
    }

    reference operator[](difference_type n) const { return *(*this + n); }

    bool operator==(const sorted_table_iterator& other) const {
      return table_ == other.table_ && index_ == other.index_;
    }

    bool operator!=(const sorted_table_iterator& other) const {
      return !(*this == other);
    }

    bool operator<(const sorted_table_iterator& other) const {
      return index_ < other.index_;
    }

    bool operator>(const sorted_table_iterator& other) const {
      return index_ > other.index_;
    }

    bool operator<=(const sorted_table_iterator& other) const {
      return index_ <= other.index_;
    }

    bool operator>=(const sorted_table_iterator& other) const {
      return index_ >= other.index_;
    }

    size_type index() const { return index_; }

   private:
    table_ptr_type table_;
    size_type index_;

    friend class sorted_table_map;
    template <bool>
    friend class sorted_table_iterator;
  };
};

template <typename Key, typename Value, typename Compare>
void swap(sorted_table_map<Key, Value, Compare>& lhs,
          sorted_table_map<Key, Value, Compare>& rhs) noexcept {
  lhs.swap(rhs);
}

}  // namespace kressler::ordered_tables

// Include implementation
#include "sorted_table_map.ipp"
