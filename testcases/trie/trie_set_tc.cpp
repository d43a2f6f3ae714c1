#include "test-utils.hpp"

#include <numeric>
#include <set>
#include <unordered_set>

namespace champ::test {

using IntSetType = persistent_trie_set<int>;
using CollidingSetType = persistent_trie_set<int, ModuloHasher<4>>;
using TracedItemSetType = persistent_trie_set<TracedItem, TracedItem::Hasher>;

template <typename Set>
using TrieTypeFor = detail::base_trie<typename Set::item_type, typename Set::hasher,
                                      typename Set::key_equal, Set::is_thread_safe>;

namespace private_hack {
template <typename Tag> struct result {
  using type = typename Tag::type;
  static type ptr;
};
template <typename Tag> typename result<Tag>::type result<Tag>::ptr;

template <typename Tag, typename Tag::type p> struct rob : result<Tag> {
  struct filler {
    filler() { result<Tag>::ptr = p; }
  };
  static filler filler_obj;
};
template <typename Tag, typename Tag::type p> typename rob<Tag, p>::filler rob<Tag, p>::filler_obj;

template <typename T> struct Bf { using type = detail::NodeData<T::is_thread_safe>* (T::*)(); };

template struct rob<Bf<TrieTypeFor<IntSetType>>, &TrieTypeFor<IntSetType>::get_root_>;
template struct rob<Bf<TrieTypeFor<CollidingSetType>>, &TrieTypeFor<CollidingSetType>::get_root_>;
template struct rob<Bf<TrieTypeFor<TracedItemSetType>>,
                    &TrieTypeFor<TracedItemSetType>::get_root_>;

template <typename T> auto get_root1(T& trie) { return (trie.*result<Bf<T>>::ptr)(); }

// The set's only member is its trie
template <typename Set> auto get_root(const Set& set) {
  using trie_type = TrieTypeFor<Set>;
  return get_root1(*reinterpret_cast<trie_type*>(const_cast<Set*>(&set)));
}
} // namespace private_hack

template <typename Set> void check_set(const Set& set) {
  check_trie_invariants<OpsFor<Set>>(private_hack::get_root(set), set.size(), set.hash_code());
}

template <typename Set, typename Values> void check_iteration(const Set& set, const Values& values) {
  std::size_t counter = 0;
  for (auto ii = set.begin(); ii != set.end(); ++ii) {
    CATCH_REQUIRE(set.contains(*ii));
    CATCH_REQUIRE(std::find(std::begin(values), std::end(values), *ii) != std::end(values));
    ++counter;
  }
  CATCH_REQUIRE(counter == set.size());
  CATCH_REQUIRE(set.equals(values));
}

static detail::hash_type hash_sum(const std::vector<int>& values) {
  return std::accumulate(std::begin(values), std::end(values), detail::hash_type{0},
                         [](detail::hash_type sum, int value) {
                           return sum + OpsFor<IntSetType>::calculate_hash(value);
                         });
}

static std::vector<int> make_range(int first, int last) {
  std::vector<int> values(static_cast<std::size_t>(last - first));
  std::iota(std::begin(values), std::end(values), first);
  return values;
}

// ---------------------------------------------------------------------------------- Construction

CATCH_TEST_CASE("trie_set_default_construct", "[trie_set_default_construct]") {
  IntSetType set;
  CATCH_REQUIRE(set.size() == 0);
  CATCH_REQUIRE(set.empty());
  CATCH_REQUIRE(set.hash_code() == 0);
  CATCH_REQUIRE(set.begin() == set.end());
  CATCH_REQUIRE(!set.contains(0));

  // Every empty set shares the one empty root
  IntSetType other;
  CATCH_REQUIRE(private_hack::get_root(set) == private_hack::get_root(other));
  CATCH_REQUIRE(private_hack::get_root(set) ==
                private_hack::get_root(IntSetType::empty_set()));
  CATCH_REQUIRE(set == other);
}

CATCH_TEST_CASE("trie_set_construct", "[trie_set_construct]") {
  const std::vector<int> values{{1, 2, 3, 2, 1}};

  IntSetType from_range{std::begin(values), std::end(values)};
  IntSetType from_ilist{{3, 2, 1}};
  auto from_of = IntSetType::of(1, 2, 3, 3);
  auto from_copy = IntSetType::copy_of(values);

  for (const auto& set : {from_range, from_ilist, from_of, from_copy}) {
    CATCH_REQUIRE(set.size() == 3);
    CATCH_REQUIRE(set.contains(1));
    CATCH_REQUIRE(set.contains(2));
    CATCH_REQUIRE(set.contains(3));
    CATCH_REQUIRE(set.hash_code() == hash_sum({1, 2, 3}));
    CATCH_REQUIRE(set == from_ilist);
    check_set(set);
  }

  // copy_of a trie set is that set
  auto same = IntSetType::copy_of(from_of);
  CATCH_REQUIRE(private_hack::get_root(same) == private_hack::get_root(from_of));
}

// ----------------------------------------------------------------------------------- Point Edits

CATCH_TEST_CASE("trie_set_scenario", "[trie_set_scenario]") {
  const auto set = IntSetType{}.copy_add(1).copy_add(2).copy_add(3);
  CATCH_REQUIRE(set.size() == 3);
  CATCH_REQUIRE(set.contains(1));
  CATCH_REQUIRE(set.contains(2));
  CATCH_REQUIRE(set.contains(3));
  CATCH_REQUIRE(!set.contains(4));

  const auto removed = set.copy_remove(2);
  CATCH_REQUIRE(removed.size() == 2);
  CATCH_REQUIRE(removed == IntSetType{{1, 3}});
  CATCH_REQUIRE(set.size() == 3); // untouched

  const auto merged = set.copy_add_all(IntSetType{{3, 4, 5}});
  CATCH_REQUIRE(merged == IntSetType{{1, 2, 3, 4, 5}});
  CATCH_REQUIRE(merged.hash_code() == hash_sum({1, 2, 3, 4, 5}));
  check_set(merged);
}

CATCH_TEST_CASE("trie_set_idempotent_add", "[trie_set_idempotent_add]") {
  const auto set = IntSetType::copy_of(make_range(0, 200));
  const auto once = set.copy_add(1000);
  const auto twice = once.copy_add(1000);
  CATCH_REQUIRE(once == twice);
  CATCH_REQUIRE(private_hack::get_root(once) == private_hack::get_root(twice));

  // Adding an element already there, or removing one that is not, changes nothing
  CATCH_REQUIRE(private_hack::get_root(set.copy_add(17)) == private_hack::get_root(set));
  CATCH_REQUIRE(private_hack::get_root(set.copy_remove(5000)) == private_hack::get_root(set));
}

CATCH_TEST_CASE("trie_set_add_remove_inverse", "[trie_set_add_remove_inverse]") {
  const auto values = make_range(0, 2000);
  const auto set = IntSetType::copy_of(values);
  check_set(set);

  for (int value : {-1, 2000, 5000, 1 << 20, 0x7fffffff}) {
    const auto added = set.copy_add(value);
    CATCH_REQUIRE(added.size() == set.size() + 1);
    CATCH_REQUIRE(added.hash_code() ==
                  set.hash_code() + OpsFor<IntSetType>::calculate_hash(value));
    const auto restored = added.copy_remove(value);
    CATCH_REQUIRE(restored == set);
    CATCH_REQUIRE(restored.hash_code() == set.hash_code());
    check_set(restored);
  }
}

CATCH_TEST_CASE("trie_set_remove_every_element", "[trie_set_remove_every_element]") {
  auto values = make_range(0, 300);
  auto set = IntSetType::copy_of(values);

  // Remove in an order that collapses sub-nodes from both ends
  std::vector<int> order;
  for (auto lo = 0, hi = 299; lo <= hi; ++lo, --hi) {
    order.push_back(lo);
    if (lo != hi)
      order.push_back(hi);
  }

  std::set<int> remaining{std::begin(values), std::end(values)};
  for (int value : order) {
    const auto next = set.copy_remove(value);
    remaining.erase(value);
    CATCH_REQUIRE(!next.contains(value));
    CATCH_REQUIRE(next.size() == remaining.size());
    CATCH_REQUIRE(next.equals(remaining));
    check_set(next);
    set = next;
  }

  // Removing the last element yields the shared empty set
  CATCH_REQUIRE(set.empty());
  CATCH_REQUIRE(private_hack::get_root(set) ==
                private_hack::get_root(IntSetType::empty_set()));
}

CATCH_TEST_CASE("trie_set_structural_sharing", "[trie_set_structural_sharing]") {
  using Ops = OpsFor<IntSetType>;
  const auto set = IntSetType::copy_of(make_range(0, 4096));
  const auto added = set.copy_add(5000);
  const auto restored = added.copy_remove(5000);
  CATCH_REQUIRE(restored == set);

  // Only the sub-trie on the path of 5000 is copied
  const auto path_bit = detail::bitpos(detail::mask(Ops::calculate_hash(5000), 0));
  auto* root = private_hack::get_root(set);
  for (const auto* other : {&added, &restored}) {
    auto* other_root = private_hack::get_root(*other);
    CATCH_REQUIRE(root != other_root);
    CATCH_REQUIRE(Ops::Bitmap::node_map(root) == Ops::Bitmap::node_map(other_root));

    std::size_t shared = 0;
    for (auto slot = 0u; slot < 32; ++slot) {
      const auto bit = detail::bitpos(slot);
      if ((Ops::Bitmap::node_map(root) & bit) == 0)
        continue;
      auto* before = *Ops::Bitmap::node_ptr_at(root, Ops::Bitmap::node_index(root, bit));
      auto* after = *Ops::Bitmap::node_ptr_at(other_root, Ops::Bitmap::node_index(other_root, bit));
      if (bit == path_bit) {
        CATCH_REQUIRE(before != after);
      } else {
        CATCH_REQUIRE(before == after);
        CATCH_REQUIRE(Ops::ref_count(before) >= 2);
        ++shared;
      }
    }
    CATCH_REQUIRE(shared == 31);
  }
}

// ------------------------------------------------------------------------------------- Collisions

CATCH_TEST_CASE("trie_set_collisions", "[trie_set_collisions]") {
  using Ops = OpsFor<CollidingSetType>;
  const auto values = make_range(0, 40); // 4 hashes, 10 elements each
  auto set = CollidingSetType::copy_of(values);
  CATCH_REQUIRE(set.size() == 40);
  check_set(set);
  check_iteration(set, values);
  dot_graph<Ops>("/tmp/champ_collisions.dot", private_hack::get_root(set));

  std::size_t buckets = 0;
  for_each_node<Ops>(private_hack::get_root(set), 0,
                     [&buckets](const Ops::node_type* node, uint32_t shift) {
                       if (Ops::type(node) == detail::NodeType::Collision) {
                         CATCH_REQUIRE(shift == 35u);
                         CATCH_REQUIRE(Ops::Collision::size(node) == 10);
                         ++buckets;
                       }
                     });
  CATCH_REQUIRE(buckets == 4);

  for (int value : values)
    CATCH_REQUIRE(set.contains(value));
  CATCH_REQUIRE(!set.contains(40)); // same hash as 0, not in the bucket
}

CATCH_TEST_CASE("trie_set_collision_collapse", "[trie_set_collision_collapse]") {
  using Ops = OpsFor<CollidingSetType>;

  // 1 and 5 share hash 1
  const auto pair = CollidingSetType{{1, 5}};
  auto* root = private_hack::get_root(pair);
  CATCH_REQUIRE(Ops::node_arity(root) == 1);
  CATCH_REQUIRE(Ops::payload_arity(root) == 0);
  check_set(pair);

  // Down to one element: back to a single inline key at the root
  const auto single = pair.copy_remove(5);
  CATCH_REQUIRE(single.size() == 1);
  CATCH_REQUIRE(single.contains(1));
  CATCH_REQUIRE(!single.contains(5));
  root = private_hack::get_root(single);
  CATCH_REQUIRE(Ops::node_arity(root) == 0);
  CATCH_REQUIRE(Ops::payload_arity(root) == 1);
  CATCH_REQUIRE(Ops::Bitmap::data_map(root) == detail::bitpos(1));
  check_set(single);

  const auto none = single.copy_remove(1);
  CATCH_REQUIRE(none.empty());
  CATCH_REQUIRE(none == CollidingSetType{});

  // A bucket sharing the root with other keys is inlined beside them
  const auto mixed = CollidingSetType{{0, 1, 5, 2}};
  const auto inlined = mixed.copy_remove(1);
  root = private_hack::get_root(inlined);
  CATCH_REQUIRE(Ops::node_arity(root) == 0);
  CATCH_REQUIRE(Ops::payload_arity(root) == 3);
  CATCH_REQUIRE(inlined == CollidingSetType{{0, 5, 2}});
  check_set(inlined);
}

CATCH_TEST_CASE("trie_set_collision_union", "[trie_set_collision_union]") {
  const auto a = CollidingSetType::copy_of(make_range(0, 20));
  const auto b = CollidingSetType::copy_of(make_range(10, 30));
  const auto merged = a.copy_add_all(b);
  CATCH_REQUIRE(merged.size() == 30);
  CATCH_REQUIRE(merged == CollidingSetType::copy_of(make_range(0, 30)));
  check_set(merged);
}

CATCH_TEST_CASE("trie_set_collision_capacity", "[trie_set_collision_capacity]") {
  using Ops = OpsFor<CollidingSetType>;
  auto count_tight_buckets = [](const CollidingSetType& set) {
    std::size_t buckets = 0;
    for_each_node<Ops>(private_hack::get_root(set), 0, [&](const auto* node, uint32_t) {
      if (Ops::type(node) == detail::NodeType::Collision) {
        CATCH_REQUIRE(Ops::Collision::capacity(node) == Ops::Collision::size(node));
        ++buckets;
      }
    });
    return buckets;
  };

  // Sets built in one go keep no room for appends
  CATCH_REQUIRE(count_tight_buckets(CollidingSetType::copy_of(make_range(0, 40))) == 4);
  CATCH_REQUIRE(count_tight_buckets(CollidingSetType{{3, 7, 11}}) == 1);
  CATCH_REQUIRE(count_tight_buckets(CollidingSetType::of(0, 4, 8, 12, 1)) == 1);
  CATCH_REQUIRE(count_tight_buckets(CollidingSetType{{2, 6}}.copy_add(10)) == 1);
}

// ------------------------------------------------------------------------------------------ Union

CATCH_TEST_CASE("trie_set_union", "[trie_set_union]") {
  const auto a = IntSetType::copy_of(make_range(0, 1000));
  const auto b = IntSetType::copy_of(make_range(500, 1500));
  const auto merged = a.copy_add_all(b);
  CATCH_REQUIRE(merged.size() == 1500);
  CATCH_REQUIRE(merged.hash_code() == hash_sum(make_range(0, 1500)));
  CATCH_REQUIRE(merged == IntSetType::copy_of(make_range(0, 1500)));
  CATCH_REQUIRE(merged == b.copy_add_all(a));
  check_set(merged);

  // Operands are untouched
  CATCH_REQUIRE(a.size() == 1000);
  CATCH_REQUIRE(b.size() == 1000);
  check_set(a);
  check_set(b);
}

CATCH_TEST_CASE("trie_set_union_identity", "[trie_set_union_identity]") {
  const auto a = IntSetType::copy_of(make_range(0, 1000));
  const auto empty = IntSetType{};

  CATCH_REQUIRE(private_hack::get_root(a.copy_add_all(a)) == private_hack::get_root(a));
  CATCH_REQUIRE(private_hack::get_root(a.copy_add_all(empty)) == private_hack::get_root(a));
  CATCH_REQUIRE(private_hack::get_root(a.copy_add_all(std::vector<int>{})) ==
                private_hack::get_root(a));
  CATCH_REQUIRE(private_hack::get_root(empty.copy_add_all(a)) == private_hack::get_root(a));

  // A superset sharing most sub-tries: every shared element counts once
  const auto bigger = a.copy_add(5000).copy_add(5001);
  const auto merged = a.copy_add_all(bigger);
  CATCH_REQUIRE(merged.size() == 1002);
  CATCH_REQUIRE(merged.hash_code() == bigger.hash_code());
  CATCH_REQUIRE(merged == bigger);
  check_set(merged);

  const auto unchanged = bigger.copy_add_all(a);
  CATCH_REQUIRE(private_hack::get_root(unchanged) == private_hack::get_root(bigger));
  CATCH_REQUIRE(unchanged.size() == 1002);
}

CATCH_TEST_CASE("trie_set_union_any_range", "[trie_set_union_any_range]") {
  const auto a = IntSetType{{1, 2, 3}};
  const auto merged = a.copy_add_all(std::vector<int>{3, 4, 5});
  CATCH_REQUIRE(merged == IntSetType{{1, 2, 3, 4, 5}});
  CATCH_REQUIRE(private_hack::get_root(a.copy_add_all(std::vector<int>{1, 2})) ==
                private_hack::get_root(a));
}

CATCH_TEST_CASE("trie_set_union_branches", "[trie_set_union_branches]") {
  using Ops = OpsFor<IntSetType>;
  auto sub_node = [](const IntSetType& set, uint32_t slot) {
    auto* root = private_hack::get_root(set);
    const auto bit = detail::bitpos(slot);
    CATCH_REQUIRE((Ops::Bitmap::node_map(root) & bit) != 0);
    return *Ops::Bitmap::node_ptr_at(root, Ops::Bitmap::node_index(root, bit));
  };

  { // sub-nodes on one side only are adopted as they are
    const auto a = IntSetType{{1, 33}};
    const auto b = IntSetType{{2, 34}};
    const auto merged = a.copy_add_all(b);
    CATCH_REQUIRE(merged.size() == 4);
    CATCH_REQUIRE(merged == IntSetType{{1, 2, 33, 34}});
    CATCH_REQUIRE(sub_node(merged, 1) == sub_node(a, 1));
    CATCH_REQUIRE(sub_node(merged, 2) == sub_node(b, 2));
    check_set(merged);
  }

  { // an inline key pushed into an existing sub-node
    const auto a = IntSetType{{1, 33}};
    const auto merged = a.copy_add_all(IntSetType{{65}});
    CATCH_REQUIRE(merged.size() == 3);
    CATCH_REQUIRE(merged.hash_code() == hash_sum({1, 33, 65}));
    CATCH_REQUIRE(merged == IntSetType{{1, 33, 65}});
    CATCH_REQUIRE(sub_node(merged, 1) != sub_node(a, 1));
    CATCH_REQUIRE(a.size() == 2);
    check_set(merged);
    check_set(a);
  }

  { // a collision bucket that gains nothing
    const auto a = CollidingSetType{{0, 4, 8, 1}};
    const auto merged = a.copy_add_all(CollidingSetType{{4, 0, 1}});
    CATCH_REQUIRE(merged.size() == 4);
    CATCH_REQUIRE(merged == a);
    CATCH_REQUIRE(private_hack::get_root(merged) == private_hack::get_root(a));
    check_set(merged);
  }
}

CATCH_TEST_CASE("trie_set_union_with_builder", "[trie_set_union_with_builder]") {
  const auto a = IntSetType::copy_of(make_range(0, 100));
  auto builder = IntSetType::copy_of(make_range(50, 150)).to_transient();
  builder.add(1000);

  const auto merged = a.copy_add_all(builder);
  CATCH_REQUIRE(merged == IntSetType::copy_of(make_range(0, 150)).copy_add(1000));
  check_set(merged);

  // The builder is frozen first, so its later edits never reach the union
  builder.remove(120);
  builder.remove(1000);
  builder.add(2000);
  CATCH_REQUIRE(merged.size() == 151);
  CATCH_REQUIRE(merged.contains(120));
  CATCH_REQUIRE(merged.contains(1000));
  CATCH_REQUIRE(!merged.contains(2000));
  check_set(merged);

  // Merged as a trie: the empty set takes the builder's root as it is
  const auto taken = IntSetType{}.copy_add_all(builder);
  CATCH_REQUIRE(private_hack::get_root(taken) == private_hack::get_root(builder.to_persistent()));
  CATCH_REQUIRE(taken.size() == 100);
}

// ------------------------------------------------------------------------------- Bulk Removal

CATCH_TEST_CASE("trie_set_remove_all", "[trie_set_remove_all]") {
  const auto a = IntSetType::copy_of(make_range(0, 100));

  const auto odd = a.copy_remove_if([](int value) { return value % 2 == 1; });
  CATCH_REQUIRE(odd.size() == 50);
  for (int value = 0; value < 100; ++value)
    CATCH_REQUIRE(odd.contains(value) == (value % 2 == 0));
  check_set(odd);

  const auto low = a.copy_remove_all(make_range(50, 200));
  CATCH_REQUIRE(low == IntSetType::copy_of(make_range(0, 50)));
  check_set(low);

  CATCH_REQUIRE(a.copy_remove_all(a).empty());
  CATCH_REQUIRE(private_hack::get_root(a.copy_remove_all(std::vector<int>{})) ==
                private_hack::get_root(a));
  CATCH_REQUIRE(private_hack::get_root(a.copy_remove_all(std::vector<int>{500, 600})) ==
                private_hack::get_root(a));
  CATCH_REQUIRE(private_hack::get_root(a.copy_remove_if([](int) { return false; })) ==
                private_hack::get_root(a));
  CATCH_REQUIRE(a.copy_clear().empty());
}

CATCH_TEST_CASE("trie_set_retain_all", "[trie_set_retain_all]") {
  const auto a = IntSetType::copy_of(make_range(0, 100));

  const auto kept = a.copy_retain_all(std::unordered_set<int>{5, 50, 500});
  CATCH_REQUIRE(kept == IntSetType{{5, 50}});
  check_set(kept);

  const auto also_kept = a.copy_retain_all(IntSetType::copy_of(make_range(90, 110)));
  CATCH_REQUIRE(also_kept == IntSetType::copy_of(make_range(90, 100)));

  CATCH_REQUIRE(a.copy_retain_all(std::set<int>{}).empty());
  CATCH_REQUIRE(private_hack::get_root(a.copy_retain_all(a)) == private_hack::get_root(a));
  CATCH_REQUIRE(IntSetType{}.copy_retain_all(a).empty());
}

// --------------------------------------------------------------------------------------- Iterator

CATCH_TEST_CASE("trie_set_iterator", "[trie_set_iterator]") {
  for (int size : {0, 1, 2, 31, 32, 33, 1000, 5000}) {
    const auto values = make_range(0, size);
    const auto set = IntSetType::copy_of(values);
    check_iteration(set, values);

    const auto visited = collect(set);
    std::set<int> distinct{std::begin(visited), std::end(visited)};
    CATCH_REQUIRE(distinct.size() == visited.size());

    std::size_t post_increment = 0;
    for (auto ii = set.cbegin(); ii != set.cend(); ii++)
      ++post_increment;
    CATCH_REQUIRE(post_increment == set.size());
  }
}

CATCH_TEST_CASE("trie_set_iterator_next", "[trie_set_iterator_next]") {
  const auto set = IntSetType::copy_of(make_range(0, 100));
  auto ii = set.begin();
  std::size_t counter = 0;
  while (ii.has_next()) {
    CATCH_REQUIRE(set.contains(ii.next()));
    ++counter;
  }
  CATCH_REQUIRE(counter == 100);
  CATCH_REQUIRE(ii == set.end());
  CATCH_REQUIRE_THROWS_AS(ii.next(), std::out_of_range);

  const IntSetType empty;
  auto empty_ii = empty.begin();
  CATCH_REQUIRE(!empty_ii.has_next());
  CATCH_REQUIRE_THROWS_AS(empty_ii.next(), std::out_of_range);
}

CATCH_TEST_CASE("trie_set_iterator_order", "[trie_set_iterator_order]") {
  // Inline keys of a node come before its sub-nodes
  const auto set = IntSetType{{33, 1, 2}}; // 1 and 33 share slot 1 of the root
  const auto visited = collect(set);
  CATCH_REQUIRE(visited == std::vector<int>{2, 1, 33});
}

// --------------------------------------------------------------------------------------- Equality

CATCH_TEST_CASE("trie_set_equality", "[trie_set_equality]") {
  const auto values = make_range(0, 500);
  const auto a = IntSetType::copy_of(values);

  std::vector<int> reversed{values.rbegin(), values.rend()};
  const auto b = IntSetType::copy_of(reversed);
  CATCH_REQUIRE(a == b);
  CATCH_REQUIRE(!(a != b));
  CATCH_REQUIRE(private_hack::get_root(a) != private_hack::get_root(b));
  CATCH_REQUIRE(std::hash<IntSetType>{}(a) == std::hash<IntSetType>{}(b));
  CATCH_REQUIRE(std::hash<IntSetType>{}(a) == a.hash_code());

  CATCH_REQUIRE(a != a.copy_remove(7));
  CATCH_REQUIRE(a != a.copy_remove(7).copy_add(9999));

  const std::unordered_set<int> std_set{std::begin(values), std::end(values)};
  CATCH_REQUIRE(a.equals(std_set));
  CATCH_REQUIRE(!a.equals(std::unordered_set<int>{1, 2, 3}));
  CATCH_REQUIRE(!a.copy_remove(0).copy_add(-1).equals(std_set));

  // Sets of sets hash by content
  std::unordered_set<IntSetType> set_of_sets{a, b, IntSetType{{1}}};
  CATCH_REQUIRE(set_of_sets.size() == 2);
}

CATCH_TEST_CASE("trie_set_collision_equality", "[trie_set_collision_equality]") {
  // Buckets compare irrespective of insertion order
  const auto a = CollidingSetType{{0, 4, 8, 12}};
  const auto b = CollidingSetType{{12, 8, 4, 0}};
  CATCH_REQUIRE(a == b);
  CATCH_REQUIRE(a != CollidingSetType{{0, 4, 8, 16}});
}

// -------------------------------------------------------------------------------- Element Lifetime

CATCH_TEST_CASE("trie_set_element_lifetime", "[trie_set_element_lifetime]") {
  uint32_t counter = 0;
  {
    std::vector<TracedItem> items;
    for (std::size_t value = 0; value < 200; ++value)
      items.emplace_back(counter, value);
    // Same low 32 bits as 0 and 1: these collide
    items.emplace_back(counter, 0x100000000ull);
    items.emplace_back(counter, 0x100000001ull);
    CATCH_REQUIRE(counter == items.size());

    const auto a = TracedItemSetType::copy_of(items);
    check_set(a);
    const auto b = a.copy_remove(items[0]).copy_remove(items[200]).copy_add(items[0]);
    const auto c = TracedItemSetType{std::begin(items) + 100, std::end(items)};
    const auto d = b.copy_add_all(c);
    const auto e = d.copy_retain_all(c);
    CATCH_REQUIRE(d.size() == items.size());
    CATCH_REQUIRE(e == c);
    check_set(d);
    check_set(e);

    auto transient = e.to_transient();
    transient.add_all(a);
    transient.remove(items[1]);
    const auto f = transient.to_persistent();
    CATCH_REQUIRE(f.size() == items.size() - 1);
    check_set(f);
  }
  CATCH_REQUIRE(counter == 0);
}

} // namespace champ::test
