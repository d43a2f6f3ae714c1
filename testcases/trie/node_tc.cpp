#include "test-utils.hpp"

#include <array>
#include <stdexcept>

namespace champ::test {

CATCH_TEST_CASE("max_trie_depth", "[max_trie_depth]") {
  const auto chunk_bits = detail::BitPartitionSize;
  CATCH_REQUIRE(chunk_bits * detail::MaxTrieDepth >= detail::HashCodeLength);      // 5 * 7 = 35
  CATCH_REQUIRE(chunk_bits * (detail::MaxTrieDepth - 1) < detail::HashCodeLength); // 5 * 6 = 30
}

CATCH_TEST_CASE("popcount", "[popcount]") {
  auto test_popcount = [](uint32_t x, int count) {
    CATCH_REQUIRE(detail::popcount(x) == count);
    CATCH_REQUIRE(detail::branch_free_popcount(x) == count);
  };
  test_popcount(0x00000000u, 0);
  test_popcount(0x01010101u, 4);
  test_popcount(0x11010101u, 5);
  test_popcount(0xf1010101u, 8);
  test_popcount(0xffffffffu, 32);
}

CATCH_TEST_CASE("mask_bitpos_index", "[mask_bitpos_index]") {
  const detail::hash_type hash = 0x02000c47u;
  CATCH_REQUIRE(detail::mask(hash, 0) == 7u);
  CATCH_REQUIRE(detail::mask(hash, 5) == 2u);
  CATCH_REQUIRE(detail::mask(hash, 10) == 3u);
  CATCH_REQUIRE(detail::mask(hash, 15) == 0u);
  CATCH_REQUIRE(detail::mask(hash, 25) == 1u);
  CATCH_REQUIRE(detail::mask(0xc0000000u, 30) == 3u); // last level only has 2 bits

  const uint32_t bitmap = (1u << 0) | (1u << 7) | (1u << 16) | (1u << 22) | (1u << 31);
  CATCH_REQUIRE(detail::index(bitmap, detail::bitpos(0)) == 0);
  CATCH_REQUIRE(detail::index(bitmap, detail::bitpos(7)) == 1);
  CATCH_REQUIRE(detail::index(bitmap, detail::bitpos(16)) == 2);
  CATCH_REQUIRE(detail::index(bitmap, detail::bitpos(22)) == 3);
  CATCH_REQUIRE(detail::index(bitmap, detail::bitpos(31)) == 4);
  CATCH_REQUIRE(detail::index(bitmap, detail::bitpos(8)) == 2); // insertion point

  CATCH_REQUIRE(detail::lowest_slot(bitmap) == 0);
  CATCH_REQUIRE(detail::lowest_slot(bitmap & (bitmap - 1)) == 7);
  CATCH_REQUIRE(detail::lowest_slot(detail::bitpos(31)) == 31);
}

CATCH_TEST_CASE("edit_tokens", "[edit_tokens]") {
  const auto a = detail::make_edit_token();
  const auto b = detail::make_edit_token();
  CATCH_REQUIRE(a != detail::NoEdit);
  CATCH_REQUIRE(b != detail::NoEdit);
  CATCH_REQUIRE(a != b);
  CATCH_REQUIRE(detail::is_allowed_to_edit(a, a));
  CATCH_REQUIRE(!detail::is_allowed_to_edit(a, b));
  CATCH_REQUIRE(!detail::is_allowed_to_edit(detail::NoEdit, detail::NoEdit));
}

CATCH_TEST_CASE("node_data_add_dec_ref", "[node_data_add_dec_ref]") {
  auto test_node = [](auto& node, detail::NodeType type) {
    CATCH_REQUIRE(node.type() == type);
    CATCH_REQUIRE(node.ref_count() == 1);
    CATCH_REQUIRE(node.add_ref() == 2);
    CATCH_REQUIRE(node.type() == type); // the count never touches the tag
    CATCH_REQUIRE(node.dec_ref() == 1);
    CATCH_REQUIRE(node.dec_ref() == 0);
  };
  auto n1 = detail::NodeData<true>{detail::NodeType::Bitmap, 0};
  auto n2 = detail::NodeData<false>{detail::NodeType::Bitmap, 0};
  auto n3 = detail::NodeData<true>{detail::NodeType::Collision, 7};
  auto n4 = detail::NodeData<false>{detail::NodeType::Collision, 7};

  test_node(n1, detail::NodeType::Bitmap);
  test_node(n2, detail::NodeType::Bitmap);
  test_node(n3, detail::NodeType::Collision);
  test_node(n4, detail::NodeType::Collision);
  CATCH_REQUIRE(n3.edit() == 7);
}

template <typename T> void test_node_layout() {
  using Ops = detail::NodeOps<T, std::hash<T>, std::equal_to<T>, true>;
  using Bitmap = typename Ops::Bitmap;
  using Collision = typename Ops::Collision;

  { // keys first, then sub-node pointers, each aligned
    const uint32_t data_map = 0x00000101u;
    const uint32_t node_map = 0x00010000u;
    auto* node = Bitmap::make_uninitialized(detail::NoEdit, node_map, data_map);
    CATCH_REQUIRE(Ops::type(node) == detail::NodeType::Bitmap);
    CATCH_REQUIRE(Ops::payload_arity(node) == 2);
    CATCH_REQUIRE(Ops::node_arity(node) == 1);
    const auto base = reinterpret_cast<uintptr_t>(node);
    const auto key_0 = reinterpret_cast<uintptr_t>(Bitmap::key_ptr_at(node, 0));
    const auto key_1 = reinterpret_cast<uintptr_t>(Bitmap::key_ptr_at(node, 1));
    const auto node_0 = reinterpret_cast<uintptr_t>(Bitmap::node_ptr_at(node, 0));
    CATCH_REQUIRE(key_0 >= base + sizeof(typename Bitmap::header_type));
    CATCH_REQUIRE(key_0 % alignof(T) == 0);
    CATCH_REQUIRE(key_1 >= key_0 + sizeof(T));
    CATCH_REQUIRE(node_0 >= key_1 + sizeof(T));
    CATCH_REQUIRE(node_0 % alignof(void*) == 0);
    CATCH_REQUIRE(Ops::ref_count(node) == 1);
    *Bitmap::node_ptr_at(node, 0) = nullptr; // nothing to release
    Bitmap::free(node);
  }

  {
    auto* node = Collision::make_uninitialized(detail::NoEdit, 42u, 0, 3);
    CATCH_REQUIRE(Ops::type(node) == detail::NodeType::Collision);
    CATCH_REQUIRE(Collision::hash(node) == 42u);
    CATCH_REQUIRE(Collision::capacity(node) == 3);
    const auto key_0 = reinterpret_cast<uintptr_t>(Collision::key_ptr_at(node, 0));
    CATCH_REQUIRE(key_0 >= reinterpret_cast<uintptr_t>(node) + sizeof(typename Collision::header_type));
    CATCH_REQUIRE(key_0 % alignof(T) == 0);
    Collision::free(node);
  }
}

CATCH_TEST_CASE("node_layout", "[node_layout]") {
  test_node_layout<char>();
  test_node_layout<int16_t>();
  test_node_layout<int32_t>();
  test_node_layout<int64_t>();
  test_node_layout<void*>();

  struct alignas(16) Wide {
    int64_t a;
    char b;
    bool operator==(const Wide&) const = default;
  };
  struct WideHash {
    std::size_t operator()(const Wide& w) const { return static_cast<std::size_t>(w.a); }
  };
  using Ops = detail::NodeOps<Wide, WideHash>;
  auto* node = Ops::Bitmap::make_two(detail::NoEdit, 0x3u, Wide{1, 'a'}, Wide{2, 'b'});
  CATCH_REQUIRE(reinterpret_cast<uintptr_t>(Ops::Bitmap::key_ptr_at(node, 1)) % 16 == 0);
  CATCH_REQUIRE(Ops::key_at(node, 1).a == 2);
  Ops::dec_ref(node);
}

CATCH_TEST_CASE("node_accessors", "[node_accessors]") {
  using Ops = detail::NodeOps<int>;
  using Bitmap = Ops::Bitmap;
  using Collision = Ops::Collision;

  auto* leaf = Bitmap::make_two(detail::NoEdit, detail::bitpos(1) | detail::bitpos(4), 1, 4);
  CATCH_REQUIRE(Ops::has_payload(leaf));
  CATCH_REQUIRE(!Ops::has_nodes(leaf));
  CATCH_REQUIRE(Ops::get_key(leaf, 0) == 1);
  CATCH_REQUIRE(Ops::get_key(leaf, 1) == 4);
  CATCH_REQUIRE_THROWS_AS(Ops::get_key(leaf, 2), std::out_of_range);
  CATCH_REQUIRE_THROWS_AS(Ops::get_node(leaf, 0), std::out_of_range);
  CATCH_REQUIRE(Ops::size_predicate(leaf) == detail::SizeClass::MoreThanOne);

  auto* parent = Bitmap::make_one_node(detail::NoEdit, detail::bitpos(9), leaf);
  CATCH_REQUIRE(Ops::has_nodes(parent));
  CATCH_REQUIRE(!Ops::has_payload(parent));
  CATCH_REQUIRE(Ops::get_node(parent, 0) == leaf);
  CATCH_REQUIRE(Ops::size_predicate(parent) == detail::SizeClass::MoreThanOne);

  auto* bucket = Collision::make_two(detail::NoEdit, 5u, 10, 20);
  CATCH_REQUIRE(Ops::payload_arity(bucket) == 2);
  CATCH_REQUIRE(Ops::node_arity(bucket) == 0);
  CATCH_REQUIRE(Ops::get_key(bucket, 1) == 20);
  CATCH_REQUIRE_THROWS_AS(Ops::get_key(bucket, 2), std::out_of_range);
  CATCH_REQUIRE_THROWS_AS(Ops::get_node(bucket, 0), std::logic_error);

  auto* single = Bitmap::make_one(detail::NoEdit, detail::bitpos(3), 3);
  CATCH_REQUIRE(Ops::size_predicate(single) == detail::SizeClass::One);
  CATCH_REQUIRE(Ops::size_predicate(Ops::empty_node()) == detail::SizeClass::Empty);

  Ops::dec_ref(parent); // releases `leaf` too
  Ops::dec_ref(bucket);
  Ops::dec_ref(single);
}

CATCH_TEST_CASE("removal_rejects_empty_sub_node", "[removal_rejects_empty_sub_node]") {
  using Ops = detail::NodeOps<int>;
  using Bitmap = Ops::Bitmap;

  // A lone key below the root, which no trie operation ever builds
  auto* lone = Bitmap::make_one(detail::NoEdit, detail::bitpos(1), 33);
  auto* root = Bitmap::make_one_node(detail::NoEdit, detail::bitpos(1), lone);

  detail::ChangeEvent change;
  CATCH_REQUIRE_THROWS_AS(
      Ops::removed(root, detail::NoEdit, 33, Ops::calculate_hash(33), 0, change),
      std::logic_error);
  CATCH_REQUIRE(Ops::ref_count(root) == 1);
  CATCH_REQUIRE(Ops::ref_count(lone) == 1);
  Ops::dec_ref(root);
}

CATCH_TEST_CASE("merge_two_keys", "[merge_two_keys]") {
  using Ops = detail::NodeOps<int>;

  { // differ on the first level: ordered by slot
    auto* node = Ops::merge_two_keys(detail::NoEdit, 9, 9u, 2, 2u, 0);
    CATCH_REQUIRE(Ops::Bitmap::data_map(node) == (detail::bitpos(2) | detail::bitpos(9)));
    CATCH_REQUIRE(Ops::get_key(node, 0) == 2);
    CATCH_REQUIRE(Ops::get_key(node, 1) == 9);
    Ops::dec_ref(node);
  }

  { // same first partition: one sub-node per shared level
    auto* node = Ops::merge_two_keys(detail::NoEdit, 1, 1u, 33, 33u, 0);
    CATCH_REQUIRE(Ops::Bitmap::node_map(node) == detail::bitpos(1));
    auto* child = Ops::get_node(node, 0);
    CATCH_REQUIRE(Ops::Bitmap::data_map(child) == (detail::bitpos(0) | detail::bitpos(1)));
    Ops::dec_ref(node);
  }

  { // identical hashes end in a collision node below the last bitmap level
    auto* node = Ops::merge_two_keys(detail::NoEdit, 1, 7u, 2, 7u, 0);
    auto* current = node;
    for (auto level = 0u; level < detail::MaxTrieDepth; ++level) {
      CATCH_REQUIRE(Ops::type(current) == detail::NodeType::Bitmap);
      CATCH_REQUIRE(Ops::node_arity(current) == 1);
      current = Ops::get_node(current, 0);
    }
    CATCH_REQUIRE(Ops::type(current) == detail::NodeType::Collision);
    CATCH_REQUIRE(Ops::Collision::hash(current) == 7u);
    CATCH_REQUIRE(Ops::Collision::capacity(current) == 2); // persistent: no spare room
    Ops::dec_ref(node);
  }
}

CATCH_TEST_CASE("collision_node_edits", "[collision_node_edits]") {
  uint32_t counter = 0;
  using Ops = detail::NodeOps<TracedItem, TracedItem::Hasher>;
  using Collision = Ops::Collision;

  {
    const auto edit = detail::make_edit_token();
    auto* node =
        Collision::make_two(edit, 0u, TracedItem{counter, 0}, TracedItem{counter, 0x100000000});
    CATCH_REQUIRE(Collision::capacity(node) == 4); // builders reserve room
    CATCH_REQUIRE(counter == 2);

    Collision::append_in_place(node, TracedItem{counter, 1});
    CATCH_REQUIRE(Collision::size(node) == 3);
    CATCH_REQUIRE(counter == 3);

    auto* copy = Collision::copy_remove(node, detail::NoEdit, 0);
    CATCH_REQUIRE(Collision::size(copy) == 2);
    CATCH_REQUIRE(Collision::capacity(copy) == 2);
    CATCH_REQUIRE(Collision::key_ptr_at(copy, 1)->value() == 1);
    CATCH_REQUIRE(counter == 5);

    Collision::remove_in_place(node, 1);
    CATCH_REQUIRE(Collision::size(node) == 2);
    CATCH_REQUIRE(Collision::key_ptr_at(node, 1)->value() == 1);
    CATCH_REQUIRE(counter == 4);

    Ops::dec_ref(node);
    Ops::dec_ref(copy);
  }

  CATCH_REQUIRE(counter == 0);
}

CATCH_TEST_CASE("copy_and_set_node_respects_edit", "[copy_and_set_node_respects_edit]") {
  using Ops = detail::NodeOps<int>;
  const auto edit = detail::make_edit_token();

  auto* child_a = Ops::merge_two_keys(edit, 1, 1u, 33, 33u, 5);
  auto* child_b = Ops::merge_two_keys(edit, 2, 2u, 34, 34u, 5);
  auto* parent = Ops::Bitmap::make_one_node(edit, detail::bitpos(0), child_a);

  { // owned: updated in place, and the old child is released
    child_b->add_ref();
    auto* result = Ops::copy_and_set_node(parent, edit, detail::bitpos(0), child_b);
    CATCH_REQUIRE(result == parent);
    CATCH_REQUIRE(Ops::ref_count(parent) == 2);
    CATCH_REQUIRE(Ops::get_node(parent, 0) == child_b);
    Ops::dec_ref(result);
  }

  { // not owned: copied, the original untouched
    auto* result = Ops::copy_and_set_node(parent, detail::NoEdit, detail::bitpos(0), child_b);
    CATCH_REQUIRE(result != parent);
    CATCH_REQUIRE(Ops::get_node(result, 0) == child_b);
    CATCH_REQUIRE(Ops::get_node(parent, 0) == child_b);
    CATCH_REQUIRE(Ops::ref_count(child_b) == 2);
    Ops::dec_ref(result);
  }

  Ops::dec_ref(parent);
}

CATCH_TEST_CASE("empty_node_is_shared", "[empty_node_is_shared]") {
  using Ops = detail::NodeOps<int>;
  auto* a = Ops::make_empty_ref();
  auto* b = Ops::make_empty_ref();
  CATCH_REQUIRE(a == b);
  CATCH_REQUIRE(a == Ops::empty_node());
  CATCH_REQUIRE(Ops::ref_count(a) >= 3);
  Ops::dec_ref(a);
  Ops::dec_ref(b);
  CATCH_REQUIRE(Ops::ref_count(Ops::empty_node()) >= 1);
}

} // namespace champ::test
