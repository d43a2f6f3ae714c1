#pragma once

#include <catch2/catch.hpp>

#include "champ/persistent-trie-set.hpp"

#include <fmt/format.h>

#include <fstream>
#include <string>
#include <vector>

namespace champ::test {

// -------------------------------------------------------------------------------------- TracedItem

/**
 * Counts live instances in `counter`, so tests can check that every element copied into a node
 * is destroyed with it
 */
class TracedItem {
private:
  uint32_t* counter_;
  std::size_t value_{0};

public:
  TracedItem(uint32_t& counter, std::size_t value) : counter_{&counter}, value_{value} {
    ++*counter_;
  }
  TracedItem(const TracedItem& o) : counter_{o.counter_}, value_{o.value_} { ++*counter_; }
  TracedItem(TracedItem&& o) noexcept : counter_{o.counter_}, value_{o.value_} { ++*counter_; }
  ~TracedItem() { --*counter_; }
  TracedItem& operator=(const TracedItem&) = delete;
  TracedItem& operator=(TracedItem&&) = delete;

  std::size_t value() const { return value_; }
  bool operator==(const TracedItem& o) const { return o.value() == value(); }

  struct Hasher {
    std::size_t operator()(const TracedItem& item) const {
      return static_cast<std::size_t>(item.value() & static_cast<std::size_t>(0xffffffffu));
    }
  };
};

/**
 * Many distinct values share a hash, which forces collision nodes
 */
template <std::size_t Modulus> struct ModuloHasher {
  std::size_t operator()(int value) const { return static_cast<std::size_t>(value) % Modulus; }
};

template <typename Set>
using OpsFor = detail::NodeOps<typename Set::item_type, typename Set::hasher,
                               typename Set::key_equal, Set::is_thread_safe>;

// ---------------------------------------------------------------------------------- Trie Traversal

template <typename NodeOps, typename Function>
void for_each_node(const typename NodeOps::node_type* node, uint32_t shift, Function f) {
  f(node, shift);
  for (auto i = 0u; i < NodeOps::node_arity(node); ++i)
    for_each_node<NodeOps>(NodeOps::get_node(node, i), shift + detail::BitPartitionSize, f);
}

/**
 * Writes the trie as a Graphviz digraph, handy when a test fails
 */
template <typename NodeOps>
void dot_graph(const std::string& filename, const typename NodeOps::node_type* root) {
  using Bitmap = typename NodeOps::Bitmap;
  using Collision = typename NodeOps::Collision;
  auto node_name = [](const typename NodeOps::node_type* node) -> std::string {
    return fmt::format("{:c}0x{:08x}",
                       (NodeOps::type(node) == detail::NodeType::Bitmap ? 'B' : 'C'),
                       reinterpret_cast<uintptr_t>(node));
  };

  std::ofstream out;
  out.open(filename);
  out << "digraph {\n";
  for_each_node<NodeOps>(root, 0, [&](const typename NodeOps::node_type* node, uint32_t) {
    if (NodeOps::type(node) == detail::NodeType::Collision) {
      out << fmt::format("   {}[label=\"hash=0x{:08x} size={}\"]\n", node_name(node),
                         Collision::hash(node), Collision::size(node));
      return;
    }
    out << fmt::format("   {}[label=\"data=0x{:08x} nodes=0x{:08x}\"]\n", node_name(node),
                       Bitmap::data_map(node), Bitmap::node_map(node));
    for (auto slot = 0u; slot < 32; ++slot) {
      const auto bit = detail::bitpos(slot);
      if ((Bitmap::node_map(node) & bit) != 0) {
        auto* other = *Bitmap::node_ptr_at(node, Bitmap::node_index(node, bit));
        out << fmt::format("   {} -> {}[label=\"{}\"]\n", node_name(node), node_name(other), slot);
      }
    }
  });
  out << "}\n";
  out.close();
}

/**
 * Checks the shape of the trie under `root`, and that it holds `size` elements whose hashes
 * sum to `hash_code`
 */
template <typename NodeOps>
void check_trie_invariants(const typename NodeOps::node_type* root, std::size_t size,
                           detail::hash_type hash_code) {
  using Bitmap = typename NodeOps::Bitmap;
  using Collision = typename NodeOps::Collision;
  using NodeType = detail::NodeType;

  std::size_t element_count = 0;
  detail::hash_type hash_sum = 0;

  for_each_node<NodeOps>(root, 0, [&](const typename NodeOps::node_type* node, uint32_t shift) {
    CATCH_REQUIRE(NodeOps::ref_count(node) > 0);

    if (NodeOps::type(node) == NodeType::Collision) {
      CATCH_REQUIRE(shift >= detail::HashCodeLength); // only below the last bitmap level
      CATCH_REQUIRE(Collision::size(node) >= 2);
      CATCH_REQUIRE(Collision::size(node) <= Collision::capacity(node));
      for (auto i = 0u; i < Collision::size(node); ++i) {
        const auto& key = NodeOps::key_at(node, i);
        CATCH_REQUIRE(NodeOps::calculate_hash(key) == Collision::hash(node));
        for (auto j = i + 1; j < Collision::size(node); ++j)
          CATCH_REQUIRE(!NodeOps::calculate_equals(key, NodeOps::key_at(node, j)));
        ++element_count;
        hash_sum += Collision::hash(node);
      }
      return;
    }

    CATCH_REQUIRE(shift < detail::HashCodeLength);
    CATCH_REQUIRE((Bitmap::data_map(node) & Bitmap::node_map(node)) == 0);
    if (node != root) { // only the root may hold a lone element
      CATCH_REQUIRE(NodeOps::size_predicate(node) == detail::SizeClass::MoreThanOne);
    }

    for (auto slot = 0u; slot < 32; ++slot) {
      const auto bit = detail::bitpos(slot);
      if ((Bitmap::data_map(node) & bit) != 0) {
        const auto& key = *Bitmap::key_ptr_at(node, Bitmap::data_index(node, bit));
        const auto key_hash = NodeOps::calculate_hash(key);
        CATCH_REQUIRE(detail::mask(key_hash, shift) == slot); // key sits in its own slot
        ++element_count;
        hash_sum += key_hash;
      }
    }
  });

  CATCH_REQUIRE(element_count == size);
  CATCH_REQUIRE(hash_sum == hash_code);
}

/**
 * The elements visited by iteration, in iteration order
 */
template <typename Set> auto collect(const Set& set) {
  std::vector<typename Set::item_type> result;
  for (const auto& item : set)
    result.push_back(item);
  return result;
}

} // namespace champ::test
