#pragma once

#include "persistent-trie-set.hpp"

namespace champ {

// ------------------------------------------------------------------------------ transient_trie_set

/**
 * A single-owner builder for `persistent_trie_set`. Nodes created by a builder are tagged with
 * its edit token, and are updated in place by later operations of the same builder. Not
 * thread-safe.
 */
template <typename ItemType, typename Hash, typename KeyEqual, bool IsThreadSafe>
class transient_trie_set {
private:
  using trie_type = detail::base_trie<ItemType, Hash, KeyEqual, IsThreadSafe>;
  using persistent_type = persistent_trie_set<ItemType, Hash, KeyEqual, IsThreadSafe>;
  trie_type trie_;
  detail::edit_type edit_{detail::make_edit_token()};

public:
  using item_type = typename trie_type::item_type;
  using value_type = item_type;
  using size_type = typename trie_type::size_type;
  using hash_type = typename trie_type::hash_type;
  using hasher = typename trie_type::hasher;
  using key_equal = typename trie_type::key_equal;
  using const_iterator = typename trie_type::const_iterator;
  static constexpr bool is_thread_safe = IsThreadSafe;

  //@{ Construction/Destruction
  transient_trie_set() = default;
  explicit transient_trie_set(const persistent_type& set) : trie_{set.trie_} {}
  transient_trie_set(const transient_trie_set&) = delete;

  // The moved-from builder gets a fresh token, so the two never share editable nodes
  transient_trie_set(transient_trie_set&& other) noexcept
      : trie_{std::move(other.trie_)},
        edit_{std::exchange(other.edit_, detail::make_edit_token())} {}

  ~transient_trie_set() = default;
  //@}

  //@{ Assignment
  transient_trie_set& operator=(const transient_trie_set&) = delete;
  transient_trie_set& operator=(transient_trie_set&& other) noexcept {
    trie_ = std::move(other.trie_);
    edit_ = std::exchange(other.edit_, detail::make_edit_token());
    return *this;
  }
  //@}

  //@{ Iterators
  const_iterator begin() const { return trie_.begin(); }
  const_iterator end() const { return trie_.end(); }
  //@}

  //@{ Capacity
  bool empty() const { return trie_.empty(); }
  size_type size() const { return trie_.size(); }
  hash_type hash_code() const { return trie_.hash_code(); }
  //@}

  //@{ Lookup
  bool contains(const item_type& key) const { return trie_.contains(key); }
  //@}

  //@{ Modifiers
  /**
   * @return true if the builder changed
   */
  template <typename Key> bool add(Key&& key) { return trie_.add(edit_, std::forward<Key>(key)); }

  bool remove(const item_type& key) { return trie_.remove(edit_, key); }

  template <typename Range> bool add_all(const Range& range) {
    if constexpr (std::is_same<Range, persistent_type>::value) {
      return trie_.add_all(edit_, range.trie_);
    } else {
      bool changed = false;
      for (const auto& item : range)
        changed = add(item) || changed;
      return changed;
    }
  }

  /**
   * Freezes `other`, and merges the snapshot in bulk
   */
  bool add_all(transient_trie_set& other) { return add_all(other.to_persistent()); }

  template <typename Range> bool remove_all(const Range& range) {
    bool changed = false;
    for (const auto& item : range) {
      if (empty())
        break;
      changed = remove(item) || changed;
    }
    return changed;
  }

  /**
   * Removes every element for which `set.count(element)` is zero
   */
  template <typename Set> bool retain_all(const Set& set) {
    if (empty())
      return false;
    if (set.size() == 0) {
      trie_.clear();
      return true;
    }

    // Collected first, since removal updates the trie under the iterator
    std::vector<item_type> doomed;
    for (const auto& item : trie_) {
      if (set.count(item) == 0)
        doomed.push_back(item);
    }
    for (const auto& item : doomed)
      remove(item);
    return !doomed.empty();
  }

  void clear() { trie_.clear(); }

  /**
   * A persistent snapshot of the builder. The builder takes a new edit token, so that the
   * snapshot is never modified by later operations of this builder.
   */
  persistent_type to_persistent() {
    edit_ = detail::make_edit_token();
    return persistent_type{trie_};
  }
  //@}
};

} // namespace champ
