#pragma once

#include "_node-data.hpp"
#include "_base-node-ops.hpp"
#include "_node-ops.hpp"
#include "_iterator.hpp"

#include <utility>

namespace champ::detail {

// --------------------------------------------------------------------------------------- base_trie

/**
 * Owns one reference to a root node, along with the size and aggregate hash of the elements
 * beneath it. Both the persistent set and the transient builder are views over a `base_trie`;
 * they differ only in the edit token they pass down.
 */
template <typename ItemType,                           // Type of item to store
          typename Hash = std::hash<ItemType>,         // Hash function for item
          typename KeyEqual = std::equal_to<ItemType>, // Equality comparision for Item
          bool IsThreadSafe = true                     // True if reference counts are atomic
          >
class base_trie {
private:
  using Ops = NodeOps<ItemType, Hash, KeyEqual, IsThreadSafe>;
  using node_type = typename Ops::node_type;
  using node_ptr_type = typename Ops::node_ptr_type;
  using node_const_ptr_type = typename Ops::node_const_ptr_type;

public:
  //@{
  using item_type = typename Ops::item_type;
  using size_type = typename Ops::size_type;
  using hash_type = typename Ops::hash_type;
  using hasher = Hash;
  using key_equal = KeyEqual;
  using reference = const item_type&;
  using const_reference = const item_type&;
  using iterator = Iterator<Ops>;
  using const_iterator = Iterator<Ops>;
  static constexpr bool is_thread_safe = IsThreadSafe;
  //@}

private:
  node_ptr_type root_{Ops::make_empty_ref()}; //!< Never null
  size_type size_{0};
  hash_type hash_{0}; //!< Wrapping sum of the hashes of all elements

public:
  //@{ Construction/Destruction
  base_trie() = default;
  base_trie(const base_trie& other) : root_{other.root_}, size_{other.size_}, hash_{other.hash_} {
    Ops::add_ref(root_);
  }
  base_trie(base_trie&& other) noexcept : base_trie() { swap(other); }
  ~base_trie() { Ops::dec_ref(root_); }
  //@}

  //@{ Assignment
  base_trie& operator=(const base_trie& other) {
    Ops::add_ref(other.root_); // before dec_ref, for self assignment
    Ops::dec_ref(root_);
    root_ = other.root_;
    size_ = other.size_;
    hash_ = other.hash_;
    return *this;
  }

  base_trie& operator=(base_trie&& other) noexcept {
    swap(other);
    return *this;
  }
  //@}

  //@{ Iterators
  const_iterator begin() const { return const_iterator{root_, typename iterator::MakeBeginTag{}}; }
  const_iterator end() const { return const_iterator{root_, typename iterator::MakeEndTag{}}; }
  //@}

  //@{ Capacity
  bool empty() const { return size_ == 0; }
  size_type size() const { return size_; }
  hash_type hash_code() const { return hash_; }
  //@}

  //@{ Lookup
  bool contains(const item_type& key) const {
    return Ops::contains(root_, key, Ops::calculate_hash(key), 0);
  }

  bool is_same_root(const base_trie& other) const { return root_ == other.root_; }
  //@}

  //@{ Modifiers
  template <typename Key> bool add(edit_type edit, Key&& key) {
    const auto key_hash = Ops::calculate_hash(key);
    ChangeEvent change;
    auto* new_root = Ops::updated(root_, edit, std::forward<Key>(key), key_hash, 0, change);
    if (!change.is_modified)
      return false;

    replace_root_(new_root);
    ++size_;
    hash_ += key_hash;
    return true;
  }

  bool remove(edit_type edit, const item_type& key) {
    const auto key_hash = Ops::calculate_hash(key);
    ChangeEvent change;
    auto* new_root = Ops::removed(root_, edit, key, key_hash, 0, change);
    if (!change.is_modified)
      return false;

    if (size_ == 1) { // the canonical empty root, rather than a fresh empty node
      Ops::dec_ref(new_root);
      new_root = Ops::make_empty_ref();
    }
    replace_root_(new_root);
    --size_;
    hash_ -= key_hash;
    return true;
  }

  /**
   * Bulk union with `that`, sharing the sub-tries of `that` wherever possible
   */
  bool add_all(edit_type edit, const base_trie& that) {
    if (is_same_root(that) || that.empty())
      return false;

    if (empty()) {
      *this = that;
      return true;
    }

    BulkChangeEvent bulk_change{static_cast<std::ptrdiff_t>(that.size_), that.hash_};
    auto* new_root = Ops::copy_add_all(root_, that.root_, 0, edit, bulk_change);
    if (new_root == root_)
      return false;

    replace_root_(new_root);
    size_ = static_cast<size_type>(static_cast<std::ptrdiff_t>(size_) + bulk_change.size_change);
    hash_ += bulk_change.hash_change;
    return true;
  }

  void trim(edit_type edit) { Ops::trim(root_, edit); }

  void clear() { *this = base_trie{}; }

  void swap(base_trie& other) noexcept {
    std::swap(root_, other.root_);
    std::swap(size_, other.size_);
    std::swap(hash_, other.hash_);
  }
  //@}

  //@{ Friends
  friend bool operator==(const base_trie& lhs, const base_trie& rhs) {
    if (lhs.root_ == rhs.root_)
      return true;
    if (lhs.size_ != rhs.size_ || lhs.hash_ != rhs.hash_)
      return false;
    return Ops::equivalent(lhs.root_, rhs.root_);
  }

  friend bool operator!=(const base_trie& lhs, const base_trie& rhs) { return !(lhs == rhs); }
  //@}

private:
  node_ptr_type get_root_() { return root_; }

  // Takes over the reference carried by `new_root`
  void replace_root_(node_ptr_type new_root) {
    Ops::dec_ref(root_);
    root_ = new_root;
  }
};

} // namespace champ::detail
