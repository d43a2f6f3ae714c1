#pragma once

#include "_node-data.hpp"

#include <new>

namespace champ::detail {

// ----------------------------------------------------------------------------------------- ItemOps

template <typename T> struct ItemOps {
  using item_type = T;

  template <typename P> static void construct_at(item_type* dst, P&& src) {
    if constexpr (std::is_trivially_copyable<item_type>::value &&
                  std::is_same<std::decay_t<P>, item_type>::value) {
      std::memcpy(static_cast<void*>(dst), &src, sizeof(item_type));
    } else {
      static_assert(std::is_constructible<item_type, P&&>::value);
      new (dst) item_type(std::forward<P>(src));
    }
  }

  static void copy_n(const item_type* src, std::size_t count, item_type* dst) {
    if constexpr (std::is_trivially_copyable<item_type>::value) {
      if (count > 0)
        std::memcpy(static_cast<void*>(dst), src, count * sizeof(item_type));
    } else {
      for (auto i = 0u; i < count; ++i)
        construct_at(dst + i, src[i]);
    }
  }

  static void destroy_n(item_type* ptr, std::size_t count) {
    if constexpr (!std::is_trivially_destructible<item_type>::value) {
      for (auto i = 0u; i < count; ++i)
        std::destroy_at(ptr + i);
    }
  }
};

// ----------------------------------------------------------------------------------- BitmapNodeOps

template <typename T, bool IsThreadSafe = true> struct BitmapNodeOps {

  using node_type = NodeData<IsThreadSafe>;
  using header_type = BitmapNodeData<IsThreadSafe>;
  using node_ptr_type = node_type*;
  using node_const_ptr_type = const node_type*;
  using item_type = T;
  using Item = ItemOps<T>;

  static constexpr std::size_t LogicalSize{calculate_logical_size<item_type>()};
  static constexpr std::size_t AlignOf{
      std::max({alignof(item_type), alignof(header_type), alignof(node_ptr_type)})};

  // Keys start here
  static constexpr std::size_t offset() { return align_up(sizeof(header_type), alignof(item_type)); }

  // Sub-node pointers start here
  static constexpr std::size_t nodes_offset(uint32_t payload_arity) {
    return align_up(offset() + LogicalSize * payload_arity, alignof(node_ptr_type));
  }

  static constexpr std::size_t storage_size(uint32_t payload_arity, uint32_t node_arity) {
    return align_up(nodes_offset(payload_arity) + sizeof(node_ptr_type) * node_arity, AlignOf);
  }

  //@{ Member access
  static header_type* header(node_ptr_type node) {
    assert(node->type() == NodeType::Bitmap);
    return static_cast<header_type*>(node);
  }

  static const header_type* header(node_const_ptr_type node) {
    assert(node->type() == NodeType::Bitmap);
    return static_cast<const header_type*>(node);
  }

  static uint32_t node_map(node_const_ptr_type node) { return header(node)->node_map_; }
  static uint32_t data_map(node_const_ptr_type node) { return header(node)->data_map_; }
  static uint32_t payload_arity(node_const_ptr_type node) { return popcount(data_map(node)); }
  static uint32_t node_arity(node_const_ptr_type node) { return popcount(node_map(node)); }

  static uint32_t data_index(node_const_ptr_type node, uint32_t bitpos) {
    return index(data_map(node), bitpos);
  }

  static uint32_t node_index(node_const_ptr_type node, uint32_t bitpos) {
    return index(node_map(node), bitpos);
  }

  static item_type* key_ptr_at(node_const_ptr_type node, uint32_t dense_index) {
    auto ptr_idx = reinterpret_cast<uintptr_t>(node) + offset() + LogicalSize * dense_index;
    assert(ptr_idx % alignof(item_type) == 0); // never unaligned access
    return reinterpret_cast<item_type*>(ptr_idx);
  }

  static node_ptr_type* node_ptr_at(node_const_ptr_type node, uint32_t dense_index) {
    auto ptr_idx = reinterpret_cast<uintptr_t>(node) + nodes_offset(payload_arity(node)) +
                   sizeof(node_ptr_type) * dense_index;
    assert(ptr_idx % alignof(node_ptr_type) == 0);
    return reinterpret_cast<node_ptr_type*>(ptr_idx);
  }

  static item_type* keys_begin(node_const_ptr_type node) { return key_ptr_at(node, 0); }
  static node_ptr_type* nodes_begin(node_const_ptr_type node) { return node_ptr_at(node, 0); }
  //@}

  //@{ Utility
  static node_ptr_type make_uninitialized(edit_type edit, uint32_t node_map, uint32_t data_map) {
    const auto size = storage_size(popcount(data_map), popcount(node_map));
    auto* ptr = static_cast<header_type*>(std::aligned_alloc(AlignOf, size));
    if (ptr == nullptr)
      throw std::bad_alloc{};
    new (ptr) header_type{edit, node_map, data_map};
    return ptr;
  }

  /**
   * Allocates a node and fills it. `init_keys` must construct every key, and `init_nodes` must
   * store every sub-node pointer, each carrying a reference owned by the new node.
   */
  template <typename InitKeys, typename InitNodes>
  static node_ptr_type make(edit_type edit, uint32_t node_map, uint32_t data_map,
                            InitKeys&& init_keys, InitNodes&& init_nodes) {
    auto* ptr = make_uninitialized(edit, node_map, data_map);
    init_keys(keys_begin(ptr));
    init_nodes(nodes_begin(ptr));
    return ptr;
  }

  static void copy_nodes(const node_ptr_type* src, uint32_t count, node_ptr_type* dst) {
    for (auto i = 0u; i < count; ++i) {
      dst[i] = src[i];
      dst[i]->add_ref();
    }
  }

  static void free(node_ptr_type node) {
    Item::destroy_n(keys_begin(node), payload_arity(node));
    auto* ptr = header(node);
    ptr->~header_type();
    std::free(ptr);
  }
  //@}

  //@{ Factory
  static node_ptr_type make_empty() {
    return make_uninitialized(NoEdit, 0, 0);
  }

  template <typename Key> static node_ptr_type make_one(edit_type edit, uint32_t data_map, Key&& key) {
    assert(popcount(data_map) == 1);
    return make(
        edit, 0, data_map,
        [&](item_type* dst) { Item::construct_at(dst, std::forward<Key>(key)); },
        [](node_ptr_type*) {});
  }

  /**
   * Two inline keys; `key0` must belong to the lower slot
   */
  template <typename Key0, typename Key1>
  static node_ptr_type make_two(edit_type edit, uint32_t data_map, Key0&& key0, Key1&& key1) {
    assert(popcount(data_map) == 2);
    return make(
        edit, 0, data_map,
        [&](item_type* dst) {
          Item::construct_at(dst + 0, std::forward<Key0>(key0));
          Item::construct_at(dst + 1, std::forward<Key1>(key1));
        },
        [](node_ptr_type*) {});
  }

  /**
   * A node with a single sub-node, taking over the caller's reference to `child`
   */
  static node_ptr_type make_one_node(edit_type edit, uint32_t node_map, node_ptr_type child) {
    assert(popcount(node_map) == 1);
    return make(
        edit, node_map, 0, [](item_type*) {}, [&](node_ptr_type* dst) { dst[0] = child; });
  }
  //@}

  //@{ Copy-on-write
  template <typename Key>
  static node_ptr_type copy_and_insert_value(node_const_ptr_type src, edit_type edit,
                                             uint32_t bitpos, Key&& key) {
    assert((data_map(src) & bitpos) == 0);
    const auto idx = data_index(src, bitpos);
    const auto payload = payload_arity(src);
    return make(
        edit, node_map(src), data_map(src) | bitpos,
        [&](item_type* dst) {
          Item::copy_n(keys_begin(src), idx, dst);
          Item::construct_at(dst + idx, std::forward<Key>(key));
          Item::copy_n(keys_begin(src) + idx, payload - idx, dst + idx + 1);
        },
        [&](node_ptr_type* dst) { copy_nodes(nodes_begin(src), node_arity(src), dst); });
  }

  static node_ptr_type copy_and_remove_value(node_const_ptr_type src, edit_type edit,
                                             uint32_t bitpos) {
    assert((data_map(src) & bitpos) != 0);
    const auto idx = data_index(src, bitpos);
    const auto payload = payload_arity(src);
    return make(
        edit, node_map(src), data_map(src) ^ bitpos,
        [&](item_type* dst) {
          Item::copy_n(keys_begin(src), idx, dst);
          Item::copy_n(keys_begin(src) + idx + 1, payload - idx - 1, dst + idx);
        },
        [&](node_ptr_type* dst) { copy_nodes(nodes_begin(src), node_arity(src), dst); });
  }

  /**
   * Copy of `src` with the sub-node at `bitpos` replaced by `child`, taking over the caller's
   * reference to `child`
   */
  static node_ptr_type copy_and_replace_node(node_const_ptr_type src, edit_type edit,
                                             uint32_t bitpos, node_ptr_type child) {
    assert((node_map(src) & bitpos) != 0);
    const auto idx = node_index(src, bitpos);
    const auto arity = node_arity(src);
    return make(
        edit, node_map(src), data_map(src),
        [&](item_type* dst) { Item::copy_n(keys_begin(src), payload_arity(src), dst); },
        [&](node_ptr_type* dst) {
          copy_nodes(nodes_begin(src), idx, dst);
          dst[idx] = child;
          copy_nodes(nodes_begin(src) + idx + 1, arity - idx - 1, dst + idx + 1);
        });
  }

  /**
   * The inline key at `bitpos` is replaced by the sub-node `child` (reference taken over)
   */
  static node_ptr_type copy_and_migrate_from_inline_to_node(node_const_ptr_type src,
                                                            edit_type edit, uint32_t bitpos,
                                                            node_ptr_type child) {
    assert((data_map(src) & bitpos) != 0);
    const auto data_idx = data_index(src, bitpos);
    const auto node_idx = node_index(src, bitpos);
    const auto payload = payload_arity(src);
    const auto arity = node_arity(src);
    return make(
        edit, node_map(src) | bitpos, data_map(src) ^ bitpos,
        [&](item_type* dst) {
          Item::copy_n(keys_begin(src), data_idx, dst);
          Item::copy_n(keys_begin(src) + data_idx + 1, payload - data_idx - 1, dst + data_idx);
        },
        [&](node_ptr_type* dst) {
          copy_nodes(nodes_begin(src), node_idx, dst);
          dst[node_idx] = child;
          copy_nodes(nodes_begin(src) + node_idx, arity - node_idx, dst + node_idx + 1);
        });
  }

  /**
   * The sub-node at `bitpos` is replaced by the inline `key`
   */
  static node_ptr_type copy_and_migrate_from_node_to_inline(node_const_ptr_type src,
                                                            edit_type edit, uint32_t bitpos,
                                                            const item_type& key) {
    assert((node_map(src) & bitpos) != 0);
    const auto data_idx = data_index(src, bitpos);
    const auto node_idx = node_index(src, bitpos);
    const auto payload = payload_arity(src);
    const auto arity = node_arity(src);
    return make(
        edit, node_map(src) ^ bitpos, data_map(src) | bitpos,
        [&](item_type* dst) {
          Item::copy_n(keys_begin(src), data_idx, dst);
          Item::construct_at(dst + data_idx, key);
          Item::copy_n(keys_begin(src) + data_idx, payload - data_idx, dst + data_idx + 1);
        },
        [&](node_ptr_type* dst) {
          copy_nodes(nodes_begin(src), node_idx, dst);
          copy_nodes(nodes_begin(src) + node_idx + 1, arity - node_idx - 1, dst + node_idx);
        });
  }
  //@}
};

// -------------------------------------------------------------------------------- CollisionNodeOps

template <typename T, bool IsThreadSafe = true> struct CollisionNodeOps {

  using node_type = NodeData<IsThreadSafe>;
  using header_type = CollisionNodeData<IsThreadSafe>;
  using node_ptr_type = node_type*;
  using node_const_ptr_type = const node_type*;
  using item_type = T;
  using Item = ItemOps<T>;

  static constexpr std::size_t LogicalSize{calculate_logical_size<item_type>()};
  static constexpr std::size_t AlignOf{std::max(alignof(item_type), alignof(header_type))};

  static constexpr std::size_t offset() { return align_up(sizeof(header_type), alignof(item_type)); }

  static constexpr std::size_t storage_size(uint32_t capacity) {
    return align_up(offset() + LogicalSize * capacity, AlignOf);
  }

  // Builders leave room to append in place
  static constexpr uint32_t capacity_for(edit_type edit, uint32_t size) {
    return (edit == NoEdit) ? size : 2 * size;
  }

  //@{ Member access
  static header_type* header(node_ptr_type node) {
    assert(node->type() == NodeType::Collision);
    return static_cast<header_type*>(node);
  }

  static const header_type* header(node_const_ptr_type node) {
    assert(node->type() == NodeType::Collision);
    return static_cast<const header_type*>(node);
  }

  static hash_type hash(node_const_ptr_type node) { return header(node)->hash_; }
  static uint32_t size(node_const_ptr_type node) { return header(node)->size_; }
  static uint32_t capacity(node_const_ptr_type node) { return header(node)->capacity_; }

  static item_type* key_ptr_at(node_const_ptr_type node, uint32_t index) {
    auto ptr_idx = reinterpret_cast<uintptr_t>(node) + offset() + LogicalSize * index;
    assert(ptr_idx % alignof(item_type) == 0); // never unaligned access
    return reinterpret_cast<item_type*>(ptr_idx);
  }

  static item_type* begin(node_const_ptr_type node) { return key_ptr_at(node, 0); }
  static item_type* end(node_const_ptr_type node) { return key_ptr_at(node, size(node)); }
  //@}

  //@{ Utility
  static node_ptr_type make_uninitialized(edit_type edit, hash_type hash, uint32_t size,
                                          uint32_t capacity) {
    auto* ptr = static_cast<header_type*>(std::aligned_alloc(AlignOf, storage_size(capacity)));
    if (ptr == nullptr)
      throw std::bad_alloc{};
    new (ptr) header_type{edit, hash, size, capacity};
    return ptr;
  }

  static void free(node_ptr_type node) {
    Item::destroy_n(begin(node), size(node));
    auto* ptr = header(node);
    ptr->~header_type();
    std::free(ptr);
  }
  //@}

  //@{ Factory
  template <typename Key0, typename Key1>
  static node_ptr_type make_two(edit_type edit, hash_type hash, Key0&& key0, Key1&& key1) {
    auto* ptr = make_uninitialized(edit, hash, 2, capacity_for(edit, 2));
    Item::construct_at(key_ptr_at(ptr, 0), std::forward<Key0>(key0));
    Item::construct_at(key_ptr_at(ptr, 1), std::forward<Key1>(key1));
    return ptr;
  }

  /**
   * Creates a new collision node, with keys copied, and `key` at the end
   */
  template <typename Key>
  static node_ptr_type copy_append(node_const_ptr_type src, edit_type edit, Key&& key) {
    const auto sz = size(src);
    auto* ptr = make_uninitialized(edit, hash(src), sz + 1, capacity_for(edit, sz + 1));
    Item::copy_n(begin(src), sz, begin(ptr));
    Item::construct_at(key_ptr_at(ptr, sz), std::forward<Key>(key));
    return ptr;
  }

  /**
   * Duplicates a collision node, omitting the key at `index_to_skip`
   */
  static node_ptr_type copy_remove(node_const_ptr_type src, edit_type edit,
                                   uint32_t index_to_skip) {
    const auto sz = size(src);
    assert(index_to_skip < sz);
    auto* ptr = make_uninitialized(edit, hash(src), sz - 1, capacity_for(edit, sz - 1));
    Item::copy_n(begin(src), index_to_skip, begin(ptr));
    Item::copy_n(begin(src) + index_to_skip + 1, sz - index_to_skip - 1,
                 key_ptr_at(ptr, index_to_skip));
    return ptr;
  }

  /**
   * Duplicates a collision node without spare room
   */
  static node_ptr_type duplicate(node_const_ptr_type src, edit_type edit) {
    const auto sz = size(src);
    auto* ptr = make_uninitialized(edit, hash(src), sz, sz);
    Item::copy_n(begin(src), sz, begin(ptr));
    return ptr;
  }

  template <typename Key> static void append_in_place(node_ptr_type node, Key&& key) {
    auto* ptr = header(node);
    assert(ptr->size_ < ptr->capacity_);
    Item::construct_at(key_ptr_at(node, ptr->size_), std::forward<Key>(key));
    ++ptr->size_;
  }

  static void remove_in_place(node_ptr_type node, uint32_t index) {
    auto* ptr = header(node);
    assert(index < ptr->size_);
    auto* keys = begin(node);
    for (auto i = index; i + 1 < ptr->size_; ++i) {
      Item::destroy_n(keys + i, 1);
      Item::construct_at(keys + i, std::move(keys[i + 1]));
    }
    Item::destroy_n(keys + ptr->size_ - 1, 1);
    --ptr->size_;
  }
  //@}
};

} // namespace champ::detail
