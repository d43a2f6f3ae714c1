#pragma once

#include "bits/_base-trie.hpp"

#include <initializer_list>
#include <iterator>
#include <type_traits>

namespace champ {

template <typename ItemType,                           //
          typename Hash = std::hash<ItemType>,         //
          typename KeyEqual = std::equal_to<ItemType>, //
          bool IsThreadSafe = true>
class transient_trie_set;

// ----------------------------------------------------------------------------- persistent_trie_set

/**
 * An immutable set. Every "modifying" operation returns a new set that shares all unchanged
 * sub-tries with this one; when nothing changes, the same set is returned.
 */
template <typename ItemType,                           // Type of item to store
          typename Hash = std::hash<ItemType>,         // Hash function for item
          typename KeyEqual = std::equal_to<ItemType>, // Equality comparision for Item
          bool IsThreadSafe = true                     // True if Set is threadsafe
          >
class persistent_trie_set {
private:
  using trie_type = detail::base_trie<ItemType, Hash, KeyEqual, IsThreadSafe>;
  using transient_type = transient_trie_set<ItemType, Hash, KeyEqual, IsThreadSafe>;
  trie_type trie_;

  friend transient_type;

  explicit persistent_trie_set(trie_type trie) : trie_{std::move(trie)} {}

public:
  using item_type = typename trie_type::item_type;
  using value_type = item_type;
  using size_type = typename trie_type::size_type;
  using hash_type = typename trie_type::hash_type;
  using hasher = typename trie_type::hasher;
  using key_equal = typename trie_type::key_equal;
  using reference = typename trie_type::reference;
  using const_reference = typename trie_type::const_reference;
  using iterator = typename trie_type::iterator;
  using const_iterator = typename trie_type::const_iterator;
  static constexpr bool is_thread_safe = IsThreadSafe;

  //@{ Construction/Destruction
  persistent_trie_set() = default;
  persistent_trie_set(const persistent_trie_set& other) = default;
  persistent_trie_set(persistent_trie_set&& other) noexcept = default;
  ~persistent_trie_set() = default;

  template <typename InputIt> persistent_trie_set(InputIt first, InputIt last) {
    const auto edit = detail::make_edit_token(); // dropped once built
    for (; first != last; ++first)
      trie_.add(edit, *first);
    trie_.trim(edit);
  }

  persistent_trie_set(std::initializer_list<item_type> ilist)
      : persistent_trie_set(std::begin(ilist), std::end(ilist)) {}

  template <typename... Args> static persistent_trie_set of(Args&&... args) {
    persistent_trie_set result;
    const auto edit = detail::make_edit_token();
    (result.trie_.add(edit, std::forward<Args>(args)), ...);
    result.trie_.trim(edit);
    return result;
  }

  template <typename Range> static persistent_trie_set copy_of(const Range& range) {
    if constexpr (std::is_same<Range, persistent_trie_set>::value) {
      return range;
    } else {
      return persistent_trie_set{std::begin(range), std::end(range)};
    }
  }

  /**
   * The shared empty set of this instantiation
   */
  static const persistent_trie_set& empty_set() {
    static const persistent_trie_set instance;
    return instance;
  }
  //@}

  //@{ Assignment
  persistent_trie_set& operator=(const persistent_trie_set& other) = default;
  persistent_trie_set& operator=(persistent_trie_set&& other) noexcept = default;
  //@}

  //@{ Iterators
  const_iterator begin() const { return trie_.begin(); }
  const_iterator cbegin() const { return trie_.begin(); }
  const_iterator end() const { return trie_.end(); }
  const_iterator cend() const { return trie_.end(); }
  //@}

  //@{ Capacity
  bool empty() const { return trie_.empty(); }
  size_type size() const { return trie_.size(); }
  hash_type hash_code() const { return trie_.hash_code(); }
  //@}

  //@{ Lookup
  bool contains(const item_type& key) const { return trie_.contains(key); }
  size_type count(const item_type& key) const { return contains(key) ? 1 : 0; }
  //@}

  //@{ Copy-on-write modifiers
  template <typename Key> persistent_trie_set copy_add(Key&& key) const {
    auto copy = trie_;
    return copy.add(detail::NoEdit, std::forward<Key>(key)) ? persistent_trie_set{std::move(copy)}
                                                            : *this;
  }

  persistent_trie_set copy_remove(const item_type& key) const {
    auto copy = trie_;
    return copy.remove(detail::NoEdit, key) ? persistent_trie_set{std::move(copy)} : *this;
  }

  template <typename Range> persistent_trie_set copy_add_all(const Range& range) const {
    if constexpr (std::is_same<Range, persistent_trie_set>::value) {
      auto copy = trie_;
      return copy.add_all(detail::NoEdit, range.trie_) ? persistent_trie_set{std::move(copy)}
                                                       : *this;
    } else {
      auto transient = to_transient();
      return transient.add_all(range) ? transient.to_persistent() : *this;
    }
  }

  /**
   * Freezes `builder`, and merges the snapshot like any persistent set
   */
  persistent_trie_set copy_add_all(transient_type& builder) const {
    return copy_add_all(builder.to_persistent());
  }

  template <typename Range> persistent_trie_set copy_remove_all(const Range& range) const {
    if (empty() || std::begin(range) == std::end(range))
      return *this;
    if constexpr (std::is_same<Range, persistent_trie_set>::value) {
      if (trie_.is_same_root(range.trie_))
        return empty_set();
    }
    auto transient = to_transient();
    return transient.remove_all(range) ? transient.to_persistent() : *this;
  }

  /**
   * Keeps the elements for which `set.count(element)` is non-zero
   */
  template <typename Set> persistent_trie_set copy_retain_all(const Set& set) const {
    if (empty())
      return *this;
    if (set.size() == 0)
      return empty_set();
    auto transient = to_transient();
    return transient.retain_all(set) ? transient.to_persistent() : *this;
  }

  template <typename Predicate> persistent_trie_set copy_remove_if(Predicate&& predicate) const {
    auto transient = to_transient();
    bool changed = false;
    for (const auto& item : *this) {
      if (predicate(item))
        changed = transient.remove(item) || changed;
    }
    return changed ? transient.to_persistent() : *this;
  }

  persistent_trie_set copy_clear() const { return empty_set(); }

  transient_type to_transient() const { return transient_type{*this}; }
  //@}

  //@{ Equality
  /**
   * Equality with any sized, iterable set of the same elements
   */
  template <typename Set> bool equals(const Set& other) const {
    if (static_cast<size_type>(other.size()) != size())
      return false;
    for (const auto& item : other) {
      if (!contains(item))
        return false;
    }
    return true;
  }

  friend bool operator==(const persistent_trie_set& lhs, const persistent_trie_set& rhs) {
    return lhs.trie_ == rhs.trie_;
  }

  friend bool operator!=(const persistent_trie_set& lhs, const persistent_trie_set& rhs) {
    return !(lhs == rhs);
  }
  //@}

  //@{ Observers
  static hasher hash_function() { return hasher{}; }
  static key_equal key_eq() { return key_equal{}; }
  //@}
};

} // namespace champ

namespace std {
template <typename ItemType, typename Hash, typename KeyEqual, bool IsThreadSafe>
struct hash<champ::persistent_trie_set<ItemType, Hash, KeyEqual, IsThreadSafe>> {
  std::size_t
  operator()(const champ::persistent_trie_set<ItemType, Hash, KeyEqual, IsThreadSafe>& set) const {
    return static_cast<std::size_t>(set.hash_code());
  }
};
} // namespace std

#include "transient-trie-set.hpp"
