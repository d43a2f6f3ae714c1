#pragma once

#include "_node-ops.hpp"

#include <iterator>

namespace champ::detail {

/**
 * Depth-first, pre-order walk of a trie: the inline keys of a node are visited before its
 * sub-nodes, and sub-nodes in ascending slot order. Only nodes with sub-nodes are pushed on the
 * stack, so `MaxTrieDepth` entries suffice.
 *
 * The iterator does not hold references to nodes; the set it came from must outlive it.
 */
template <typename NodeOps> class Iterator {
public:
  using iterator_category = std::forward_iterator_tag;
  using item_type = typename NodeOps::item_type;
  using value_type = item_type;
  using difference_type = std::ptrdiff_t;
  using reference_type = const item_type&;
  using pointer_type = const item_type*;
  using reference = reference_type;
  using pointer = pointer_type;
  using node_type = typename NodeOps::node_type;
  using node_ptr_type = node_type*;
  using node_const_ptr_type = const node_type*;

private:
  std::array<node_const_ptr_type, MaxTrieDepth> nodes_{};
  std::array<uint32_t, MaxTrieDepth * 2> cursors_and_lengths_{}; // (cursor, length) per level
  int depth_{-1};

  node_const_ptr_type value_node_{nullptr}; // nullptr at the end
  uint32_t value_cursor_{0};
  uint32_t value_length_{0};

public:
  struct MakeBeginTag {};
  struct MakeEndTag {};

  Iterator() = default;

  Iterator(node_const_ptr_type root, MakeBeginTag) {
    if (NodeOps::has_nodes(root))
      push_node_(root);
    if (NodeOps::has_payload(root)) {
      value_node_ = root;
      value_cursor_ = 0;
      value_length_ = NodeOps::payload_arity(root);
    }
    normalize_();
  }

  Iterator(node_const_ptr_type, MakeEndTag) {}

  bool operator==(const Iterator& other) const {
    return value_node_ == other.value_node_ && value_cursor_ == other.value_cursor_;
  }

  bool operator!=(const Iterator& other) const { return !(*this == other); }

  Iterator& operator++() {
    if (value_node_ != nullptr) {
      ++value_cursor_;
      normalize_();
    }
    return *this;
  }

  Iterator operator++(int) {
    Iterator tmp = *this;
    ++(*this);
    return tmp;
  }

  reference_type operator*() const { return *operator->(); }

  pointer_type operator->() const {
    assert(value_node_ != nullptr);
    assert(value_cursor_ < value_length_);
    return &NodeOps::key_at(value_node_, value_cursor_);
  }

  //@{ Java-style traversal
  bool has_next() const { return value_node_ != nullptr; }

  reference_type next() {
    if (!has_next())
      throw std::out_of_range("iteration exhausted");
    reference_type result = **this;
    ++(*this);
    return result;
  }
  //@}

private:
  void push_node_(node_const_ptr_type node) {
    ++depth_;
    assert(depth_ < static_cast<int>(MaxTrieDepth));
    nodes_[depth_] = node;
    cursors_and_lengths_[2 * depth_] = 0;
    cursors_and_lengths_[2 * depth_ + 1] = NodeOps::node_arity(node);
  }

  // Leaves the iterator on a key, or at the end
  void normalize_() {
    if (value_node_ != nullptr && value_cursor_ < value_length_)
      return;
    if (!search_next_value_node_()) {
      value_node_ = nullptr;
      value_cursor_ = 0;
      value_length_ = 0;
    }
  }

  bool search_next_value_node_() {
    while (depth_ >= 0) {
      auto& cursor = cursors_and_lengths_[2 * depth_];
      const auto length = cursors_and_lengths_[2 * depth_ + 1];

      if (cursor < length) {
        node_const_ptr_type next_node = NodeOps::get_node(nodes_[depth_], cursor++);
        if (NodeOps::has_nodes(next_node))
          push_node_(next_node);
        if (NodeOps::has_payload(next_node)) {
          value_node_ = next_node;
          value_cursor_ = 0;
          value_length_ = NodeOps::payload_arity(next_node);
          return true;
        }
      } else {
        --depth_;
      }
    }
    return false;
  }
};

} // namespace champ::detail
