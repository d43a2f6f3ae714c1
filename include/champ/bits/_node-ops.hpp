#pragma once

#include "_base-node-ops.hpp"

#include <array>
#include <stdexcept>
#include <string>
#include <vector>

namespace champ::detail {

// ----------------------------------------------------------------------------------------- NodeOps

template <typename ItemType,                           //
          typename Hash = std::hash<ItemType>,         //
          typename KeyEqual = std::equal_to<ItemType>, //
          bool IsThreadSafe = true>
struct NodeOps {
  using item_type = ItemType;
  using node_type = NodeData<IsThreadSafe>;
  using node_ptr_type = node_type*;
  using node_const_ptr_type = const node_type*;
  using size_type = std::size_t;
  using hash_type = ::champ::detail::hash_type;
  using ref_count_type = typename node_type::ref_count_type;
  using hasher = Hash;
  using key_equal = KeyEqual;

  using Bitmap = BitmapNodeOps<item_type, IsThreadSafe>;
  using Collision = CollisionNodeOps<item_type, IsThreadSafe>;

  static constexpr bool is_thread_safe = IsThreadSafe;

  // Reference passing: a node returned from `updated`, `removed`, `copy_add_all` and
  // `merge_two_keys` carries a new reference for the caller, except when the operation left the
  // node unchanged, in which case the argument node itself is returned without one.

  //@{ Destruction
  static constexpr void destroy(node_ptr_type node_ptr) {
    if (node_ptr == nullptr) {
      return;
    }

    if (node_ptr->type() == NodeType::Bitmap) {
      node_ptr_type* iterator = Bitmap::nodes_begin(node_ptr);
      node_ptr_type* end = iterator + Bitmap::node_arity(node_ptr);
      while (iterator != end) {
        dec_ref(*iterator++);
      }
      Bitmap::free(node_ptr);
    } else {
      Collision::free(node_ptr);
    }
  }
  //@}

  //@{ Reference counting
  static constexpr void add_ref(node_const_ptr_type node) {
    if (node != nullptr)
      node->add_ref();
  }
  static constexpr void dec_ref(node_const_ptr_type node) {
    if (node != nullptr && node->dec_ref() == 0)
      destroy(const_cast<node_ptr_type>(node));
  }
  static constexpr ref_count_type ref_count(node_const_ptr_type node) {
    return (node == nullptr) ? 0 : node->ref_count();
  }
  //@}

  /**
   * The canonical empty node. Never destroyed: the function-local static holds a reference.
   */
  static node_ptr_type empty_node() {
    static node_ptr_type node = Bitmap::make_empty();
    return node;
  }

  static node_ptr_type make_empty_ref() {
    auto* node = empty_node();
    node->add_ref();
    return node;
  }

  template <typename Key> static constexpr hash_type calculate_hash(const Key& key) {
    hasher hash_func;
    const auto hash = static_cast<std::size_t>(hash_func(key));
    if constexpr (sizeof(std::size_t) > sizeof(hash_type)) {
      return static_cast<hash_type>(hash ^ (hash >> 32)); // fold to 32 bits
    } else {
      return static_cast<hash_type>(hash);
    }
  }

  static constexpr bool calculate_equals(const item_type& lhs, const item_type& rhs) {
    key_equal equal_func;
    return equal_func(lhs, rhs);
  }

  //@{ Getters
  static constexpr NodeType type(node_const_ptr_type node) { return node->type(); }

  static bool has_nodes(node_const_ptr_type node) {
    return type(node) == NodeType::Bitmap && Bitmap::node_map(node) != 0;
  }

  static bool has_payload(node_const_ptr_type node) {
    return type(node) == NodeType::Collision || Bitmap::data_map(node) != 0;
  }

  static uint32_t node_arity(node_const_ptr_type node) {
    return (type(node) == NodeType::Bitmap) ? Bitmap::node_arity(node) : 0;
  }

  static uint32_t payload_arity(node_const_ptr_type node) {
    return (type(node) == NodeType::Bitmap) ? Bitmap::payload_arity(node)
                                            : Collision::size(node);
  }

  /**
   * Unchecked access to the `index`th inline key
   */
  static const item_type& key_at(node_const_ptr_type node, uint32_t index) {
    assert(index < payload_arity(node));
    return (type(node) == NodeType::Bitmap) ? *Bitmap::key_ptr_at(node, index)
                                            : *Collision::key_ptr_at(node, index);
  }

  static const item_type& get_key(node_const_ptr_type node, uint32_t index) {
    if (index >= payload_arity(node))
      throw std::out_of_range("key index " + std::to_string(index) + " out of range for arity " +
                              std::to_string(payload_arity(node)));
    return key_at(node, index);
  }

  static node_ptr_type get_node(node_const_ptr_type node, uint32_t index) {
    if (type(node) == NodeType::Collision)
      throw std::logic_error("a hash collision node has no sub-nodes");
    if (index >= Bitmap::node_arity(node))
      throw std::out_of_range("node index " + std::to_string(index) + " out of range for arity " +
                              std::to_string(Bitmap::node_arity(node)));
    return *Bitmap::node_ptr_at(node, index);
  }

  static SizeClass size_predicate(node_const_ptr_type node) {
    if (type(node) == NodeType::Collision || Bitmap::node_arity(node) != 0)
      return SizeClass::MoreThanOne;
    switch (Bitmap::payload_arity(node)) {
    case 0:
      return SizeClass::Empty;
    case 1:
      return SizeClass::One;
    default:
      return SizeClass::MoreThanOne;
    }
  }
  //@}

  //@{ Lookup
  static bool contains(node_const_ptr_type node, const item_type& key, hash_type key_hash,
                       uint32_t shift) {
    while (type(node) == NodeType::Bitmap) {
      const auto bit = bitpos(mask(key_hash, shift));
      if ((Bitmap::data_map(node) & bit) != 0)
        return calculate_equals(*Bitmap::key_ptr_at(node, Bitmap::data_index(node, bit)), key);
      if ((Bitmap::node_map(node) & bit) == 0)
        return false;
      node = *Bitmap::node_ptr_at(node, Bitmap::node_index(node, bit));
      shift += BitPartitionSize;
    }

    if (Collision::hash(node) != key_hash)
      return false;
    return std::any_of(Collision::begin(node), Collision::end(node),
                       [&key](const item_type& item) { return calculate_equals(item, key); });
  }
  //@}

  //@{ Insertion
  template <typename Key>
  static node_ptr_type updated(node_ptr_type node, edit_type edit, Key&& key, hash_type key_hash,
                               uint32_t shift, ChangeEvent& change) {
    return (type(node) == NodeType::Bitmap)
               ? bitmap_updated(node, edit, std::forward<Key>(key), key_hash, shift, change)
               : collision_updated(node, edit, std::forward<Key>(key), key_hash, change);
  }

  template <typename Key>
  static node_ptr_type bitmap_updated(node_ptr_type node, edit_type edit, Key&& key,
                                      hash_type key_hash, uint32_t shift, ChangeEvent& change) {
    const auto bit = bitpos(mask(key_hash, shift));

    if ((Bitmap::data_map(node) & bit) != 0) { // inplace value
      const auto& current_key = *Bitmap::key_ptr_at(node, Bitmap::data_index(node, bit));
      if (calculate_equals(current_key, key))
        return node;

      auto* sub_node_new =
          merge_two_keys(edit, current_key, calculate_hash(current_key), std::forward<Key>(key),
                         key_hash, shift + BitPartitionSize);
      change.is_modified = true;
      return Bitmap::copy_and_migrate_from_inline_to_node(node, edit, bit, sub_node_new);
    }

    if ((Bitmap::node_map(node) & bit) != 0) { // sub-node
      auto* sub_node = *Bitmap::node_ptr_at(node, Bitmap::node_index(node, bit));
      auto* sub_node_new =
          updated(sub_node, edit, std::forward<Key>(key), key_hash, shift + BitPartitionSize, change);
      // Cannot diff `sub_node` and `sub_node_new`, they are the same when edited in place
      return change.is_modified ? copy_and_set_node(node, edit, bit, sub_node_new) : node;
    }

    change.is_modified = true;
    return Bitmap::copy_and_insert_value(node, edit, bit, std::forward<Key>(key));
  }

  template <typename Key>
  static node_ptr_type collision_updated(node_ptr_type node, edit_type edit, Key&& key,
                                         hash_type key_hash, ChangeEvent& change) {
    assert(Collision::hash(node) == key_hash);
    for (auto* iterator = Collision::begin(node); iterator != Collision::end(node); ++iterator) {
      if (calculate_equals(*iterator, key))
        return node;
    }

    change.is_modified = true;
    if (is_allowed_to_edit(node->edit(), edit) && Collision::size(node) < Collision::capacity(node)) {
      Collision::append_in_place(node, std::forward<Key>(key));
      node->add_ref();
      return node;
    }
    return Collision::copy_append(node, edit, std::forward<Key>(key));
  }

  /**
   * Replaces the sub-node at `bitpos` with `child` (whose reference is taken over), in place if
   * `edit` owns `node`
   */
  static node_ptr_type copy_and_set_node(node_ptr_type node, edit_type edit, uint32_t bit,
                                         node_ptr_type child) {
    if (is_allowed_to_edit(node->edit(), edit)) {
      auto* slot = Bitmap::node_ptr_at(node, Bitmap::node_index(node, bit));
      auto* previous = *slot;
      *slot = child;
      dec_ref(previous); // may be `child` itself, which then still holds the new reference
      node->add_ref();
      return node;
    }
    return Bitmap::copy_and_replace_node(node, edit, bit, child);
  }

  /**
   * Drops the spare room of the collision nodes owned by `edit`, for when no builder will ever
   * append to them again. Only sub-tries owned by `edit` are visited.
   */
  static void trim(node_ptr_type node, edit_type edit) {
    if (type(node) != NodeType::Bitmap || !is_allowed_to_edit(node->edit(), edit))
      return;
    for (auto i = 0u; i < Bitmap::node_arity(node); ++i) {
      auto* slot = Bitmap::node_ptr_at(node, i);
      auto* child = *slot;
      if (type(child) == NodeType::Bitmap) {
        trim(child, edit);
      } else if (is_allowed_to_edit(child->edit(), edit) &&
                 Collision::size(child) < Collision::capacity(child)) {
        *slot = Collision::duplicate(child, edit);
        dec_ref(child);
      }
    }
  }

  /**
   * Builds the smallest sub-trie holding two distinct keys. `key0` is copied, `key1` forwarded.
   */
  template <typename Key>
  static node_ptr_type merge_two_keys(edit_type edit, const item_type& key0, hash_type key_hash0,
                                      Key&& key1, hash_type key_hash1, uint32_t shift) {
    assert(!calculate_equals(key0, key1));

    if (shift >= HashCodeLength) {
      assert(key_hash0 == key_hash1);
      return Collision::make_two(edit, key_hash0, key0, std::forward<Key>(key1));
    }

    const auto mask0 = mask(key_hash0, shift);
    const auto mask1 = mask(key_hash1, shift);

    if (mask0 != mask1) { // both keys fit on this level
      const auto data_map = bitpos(mask0) | bitpos(mask1);
      return (mask0 < mask1) ? Bitmap::make_two(edit, data_map, key0, std::forward<Key>(key1))
                             : Bitmap::make_two(edit, data_map, std::forward<Key>(key1), key0);
    }

    // keys fit on a deeper level
    auto* node = merge_two_keys(edit, key0, key_hash0, std::forward<Key>(key1), key_hash1,
                                shift + BitPartitionSize);
    return Bitmap::make_one_node(edit, bitpos(mask0), node);
  }
  //@}

  //@{ Removal
  static node_ptr_type removed(node_ptr_type node, edit_type edit, const item_type& key,
                               hash_type key_hash, uint32_t shift, ChangeEvent& change) {
    return (type(node) == NodeType::Bitmap)
               ? bitmap_removed(node, edit, key, key_hash, shift, change)
               : collision_removed(node, edit, key, key_hash, change);
  }

  static node_ptr_type bitmap_removed(node_ptr_type node, edit_type edit, const item_type& key,
                                      hash_type key_hash, uint32_t shift, ChangeEvent& change) {
    const auto bit = bitpos(mask(key_hash, shift));

    if ((Bitmap::data_map(node) & bit) != 0) { // inplace value
      const auto data_index = Bitmap::data_index(node, bit);
      if (!calculate_equals(*Bitmap::key_ptr_at(node, data_index), key))
        return node;

      change.is_modified = true;
      if (Bitmap::payload_arity(node) == 2 && Bitmap::node_arity(node) == 0) {
        // The remaining key either becomes the new root, or is inlined into the parent on the
        // way back up. Below the root, the bit position is that of level 0.
        const auto new_data_map =
            (shift == 0) ? (Bitmap::data_map(node) ^ bit) : bitpos(mask(key_hash, 0));
        const auto& remaining = *Bitmap::key_ptr_at(node, (data_index == 0) ? 1 : 0);
        return Bitmap::make_one(edit, new_data_map, remaining);
      }
      return Bitmap::copy_and_remove_value(node, edit, bit);
    }

    if ((Bitmap::node_map(node) & bit) != 0) { // sub-node
      auto* sub_node = *Bitmap::node_ptr_at(node, Bitmap::node_index(node, bit));
      auto* sub_node_new =
          removed(sub_node, edit, key, key_hash, shift + BitPartitionSize, change);
      if (!change.is_modified)
        return node;

      switch (size_predicate(sub_node_new)) {
      case SizeClass::Empty:
        dec_ref(sub_node_new);
        throw std::logic_error("a modifying removal left an empty sub-node");
      case SizeClass::One:
        if (Bitmap::payload_arity(node) == 0 && Bitmap::node_arity(node) == 1) {
          return sub_node_new; // escalate the singleton
        } else {
          auto* node_new = Bitmap::copy_and_migrate_from_node_to_inline(
              node, edit, bit, *Bitmap::key_ptr_at(sub_node_new, 0));
          dec_ref(sub_node_new);
          return node_new;
        }
      case SizeClass::MoreThanOne:
        break;
      }
      return copy_and_set_node(node, edit, bit, sub_node_new);
    }

    return node;
  }

  static node_ptr_type collision_removed(node_ptr_type node, edit_type edit, const item_type& key,
                                         hash_type key_hash, ChangeEvent& change) {
    const auto sz = Collision::size(node);
    for (auto idx = 0u; idx < sz; ++idx) {
      if (!calculate_equals(*Collision::key_ptr_at(node, idx), key))
        continue;

      change.is_modified = true;
      if (sz == 1) {
        return make_empty_ref();
      } else if (sz == 2) {
        // Singleton, either the new root, or inlined on the way back up
        const auto& other_key = *Collision::key_ptr_at(node, (idx == 0) ? 1 : 0);
        return Bitmap::make_one(edit, bitpos(mask(key_hash, 0)), other_key);
      } else if (is_allowed_to_edit(node->edit(), edit)) {
        Collision::remove_in_place(node, idx);
        node->add_ref();
        return node;
      }
      return Collision::copy_remove(node, edit, idx);
    }
    return node;
  }
  //@}

  //@{ Bulk union
  /**
   * Adds every element of the sub-trie `that` into the sub-trie `node`. Elements already in
   * `node` are recorded as duplicates in `bulk_change`.
   */
  static node_ptr_type copy_add_all(node_ptr_type node, node_ptr_type that, uint32_t shift,
                                    edit_type edit, BulkChangeEvent& bulk_change) {
    if (node == that) {
      record_duplicates(that, bulk_change);
      return node;
    }
    assert(type(node) == type(that));
    return (type(node) == NodeType::Bitmap)
               ? bitmap_copy_add_all(node, that, shift, edit, bulk_change)
               : collision_copy_add_all(node, that, edit, bulk_change);
  }

  static void record_duplicates(node_const_ptr_type node, BulkChangeEvent& bulk_change) {
    for (auto i = 0u; i < payload_arity(node); ++i)
      bulk_change.record_duplicate(calculate_hash(key_at(node, i)));
    for (auto i = 0u; i < node_arity(node); ++i)
      record_duplicates(*Bitmap::node_ptr_at(node, i), bulk_change);
  }

  static node_ptr_type bitmap_copy_add_all(node_ptr_type node, node_ptr_type that, uint32_t shift,
                                           edit_type edit, BulkChangeEvent& bulk_change) {
    // Given the same bit-position in node and that:
    // case                   node.data  node.nodes   that.data  that.nodes
    // ---------------------------------------------------------------------
    //  1    keep "a"             "a"        -            -          -
    //  2    keep x               -          x            -          -
    //  4    adopt "b"            -          -            "b"        -
    //  5.1  keep "a"             "a"        -            "a"        -     duplicate
    //  5.2  {"a","b"} as node    "a"        -            "b"        -
    //  6    x ∪ {"b"}            -          x            "b"        -
    //  8    adopt y              -          -            -          y
    //  9    {"a"} ∪ y            "a"        -            -          y
    // 10    x ∪ y                -          x            -          y
    // Data and node bits of one node are disjoint, so no other combination exists.

    const auto node_data_map = Bitmap::data_map(node);
    const auto node_node_map = Bitmap::node_map(node);
    const auto that_data_map = Bitmap::data_map(that);
    const auto that_node_map = Bitmap::node_map(that);

    // Sparse by slot; every entry of `nodes_new` holds a reference
    std::array<const item_type*, 32> data_new{};
    std::array<node_ptr_type, 32> nodes_new{};
    uint32_t data_map_new = node_data_map | that_data_map;
    uint32_t node_map_new = node_node_map | that_node_map;
    uint32_t node_map_to_do = node_node_map;
    uint32_t that_map_to_do = that_node_map;
    bool changed = false;

    auto key_in = [](node_const_ptr_type n, uint32_t bit) -> const item_type& {
      return *Bitmap::key_ptr_at(n, Bitmap::data_index(n, bit));
    };
    auto node_in = [](node_const_ptr_type n, uint32_t bit) -> node_ptr_type {
      return *Bitmap::node_ptr_at(n, Bitmap::node_index(n, bit));
    };

    // Step 1: merge the inline keys, possibly into sub-nodes
    for (auto map_to_do = data_map_new; map_to_do != 0; map_to_do &= map_to_do - 1) {
      const auto slot = lowest_slot(map_to_do);
      const auto bit = bitpos(slot);
      const bool node_has_data = (node_data_map & bit) != 0;
      const bool that_has_data = (that_data_map & bit) != 0;

      if (node_has_data && that_has_data) {
        const auto& node_key = key_in(node, bit);
        const auto& that_key = key_in(that, bit);
        if (calculate_equals(node_key, that_key)) { // 5.1
          data_new[slot] = &node_key;
          bulk_change.record_duplicate(calculate_hash(that_key));
        } else { // 5.2
          data_map_new ^= bit;
          node_map_new |= bit;
          nodes_new[slot] = merge_two_keys(edit, node_key, calculate_hash(node_key), that_key,
                                           calculate_hash(that_key), shift + BitPartitionSize);
          changed = true;
        }
      } else if (node_has_data) {
        const auto& node_key = key_in(node, bit);
        if ((that_node_map & bit) != 0) { // 9
          data_map_new ^= bit;
          that_map_to_do ^= bit;
          const auto node_key_hash = calculate_hash(node_key);
          ChangeEvent change;
          auto* sub_node = node_in(that, bit);
          auto* sub_node_new = updated(sub_node, edit, node_key, node_key_hash,
                                       shift + BitPartitionSize, change);
          if (!change.is_modified) {
            bulk_change.record_duplicate(node_key_hash);
            sub_node->add_ref();
          }
          nodes_new[slot] = sub_node_new;
          changed = true;
        } else { // 1
          data_new[slot] = &node_key;
        }
      } else {
        assert(that_has_data);
        const auto& that_key = key_in(that, bit);
        if ((node_node_map & bit) != 0) { // 6
          data_map_new ^= bit;
          node_map_to_do ^= bit;
          const auto that_key_hash = calculate_hash(that_key);
          ChangeEvent change;
          auto* sub_node = node_in(node, bit);
          auto* sub_node_new = updated(sub_node, edit, that_key, that_key_hash,
                                       shift + BitPartitionSize, change);
          if (change.is_modified) {
            changed = true;
          } else {
            bulk_change.record_duplicate(that_key_hash);
            sub_node->add_ref();
          }
          nodes_new[slot] = sub_node_new;
        } else { // 4
          data_new[slot] = &that_key;
          changed = true;
        }
      }
    }

    // Step 2: merge the remaining sub-nodes
    for (auto map_to_do = node_map_to_do | that_map_to_do; map_to_do != 0;
         map_to_do &= map_to_do - 1) {
      const auto slot = lowest_slot(map_to_do);
      const auto bit = bitpos(slot);
      const bool node_has_node = (node_map_to_do & bit) != 0;
      const bool that_has_node = (that_map_to_do & bit) != 0;

      if (node_has_node && that_has_node) { // 10
        auto* sub_node = node_in(node, bit);
        auto* sub_node_new = copy_add_all(sub_node, node_in(that, bit),
                                          shift + BitPartitionSize, edit, bulk_change);
        if (sub_node_new == sub_node)
          sub_node->add_ref();
        else
          changed = true;
        nodes_new[slot] = sub_node_new;
      } else if (that_has_node) { // 8
        nodes_new[slot] = node_in(that, bit);
        nodes_new[slot]->add_ref();
        changed = true;
      } else { // 2
        assert(node_has_node);
        nodes_new[slot] = node_in(node, bit);
        nodes_new[slot]->add_ref();
      }
    }

    if (!changed) {
      for (auto map = node_map_new; map != 0; map &= map - 1)
        dec_ref(nodes_new[lowest_slot(map)]);
      return node;
    }

    // Step 3: a new node, compacting the sparse slots
    return Bitmap::make(
        edit, node_map_new, data_map_new,
        [&](item_type* dst) {
          for (auto map = data_map_new; map != 0; map &= map - 1)
            Bitmap::Item::construct_at(dst++, *data_new[lowest_slot(map)]);
        },
        [&](node_ptr_type* dst) {
          for (auto map = node_map_new; map != 0; map &= map - 1)
            *dst++ = nodes_new[lowest_slot(map)];
        });
  }

  static node_ptr_type collision_copy_add_all(node_ptr_type node, node_ptr_type that,
                                              edit_type edit, BulkChangeEvent& bulk_change) {
    assert(Collision::hash(node) == Collision::hash(that));
    const auto node_size = Collision::size(node);
    const auto that_size = Collision::size(that);
    const auto hash = Collision::hash(node);

    // Quadratic, but buckets are tiny. Keys of `node` already matched are not compared again.
    std::vector<bool> matched(node_size, false);
    std::vector<const item_type*> additions;
    for (auto j = 0u; j < that_size; ++j) {
      const auto& that_key = *Collision::key_ptr_at(that, j);
      bool is_duplicate = false;
      for (auto i = 0u; i < node_size && !is_duplicate; ++i) {
        if (!matched[i] && calculate_equals(*Collision::key_ptr_at(node, i), that_key)) {
          matched[i] = true;
          is_duplicate = true;
        }
      }
      if (is_duplicate)
        bulk_change.record_duplicate(hash);
      else
        additions.push_back(&that_key);
    }

    if (additions.empty())
      return node;

    const auto size_new = node_size + static_cast<uint32_t>(additions.size());
    auto* ptr =
        Collision::make_uninitialized(edit, hash, size_new, Collision::capacity_for(edit, size_new));
    Collision::Item::copy_n(Collision::begin(node), node_size, Collision::begin(ptr));
    auto* dst = Collision::key_ptr_at(ptr, node_size);
    for (const auto* key : additions)
      Collision::Item::construct_at(dst++, *key);
    return ptr;
  }
  //@}

  //@{ Equivalence
  /**
   * Deep structural equivalence. Collision buckets are compared irrespective of order.
   */
  static bool equivalent(node_const_ptr_type lhs, node_const_ptr_type rhs) {
    if (lhs == rhs)
      return true;
    if (type(lhs) != type(rhs))
      return false;

    if (type(lhs) == NodeType::Collision) {
      if (Collision::hash(lhs) != Collision::hash(rhs) ||
          Collision::size(lhs) != Collision::size(rhs))
        return false;
      return std::all_of(Collision::begin(rhs), Collision::end(rhs), [lhs](const item_type& key) {
        return std::any_of(Collision::begin(lhs), Collision::end(lhs),
                           [&key](const item_type& item) { return calculate_equals(item, key); });
      });
    }

    if (Bitmap::node_map(lhs) != Bitmap::node_map(rhs) ||
        Bitmap::data_map(lhs) != Bitmap::data_map(rhs))
      return false;

    const auto payload = Bitmap::payload_arity(lhs);
    for (auto i = 0u; i < payload; ++i)
      if (!calculate_equals(*Bitmap::key_ptr_at(lhs, i), *Bitmap::key_ptr_at(rhs, i)))
        return false;

    const auto arity = Bitmap::node_arity(lhs);
    for (auto i = 0u; i < arity; ++i)
      if (!equivalent(*Bitmap::node_ptr_at(lhs, i), *Bitmap::node_ptr_at(rhs, i)))
        return false;

    return true;
  }
  //@}
};

} // namespace champ::detail
