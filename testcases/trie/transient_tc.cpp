#include "test-utils.hpp"

#include <numeric>
#include <unordered_set>

namespace champ::test {

using IntSetType = persistent_trie_set<int>;
using IntTransientType = transient_trie_set<int>;

CATCH_TEST_CASE("transient_add_remove", "[transient_add_remove]") {
  IntTransientType builder;
  CATCH_REQUIRE(builder.empty());

  CATCH_REQUIRE(builder.add(1));
  CATCH_REQUIRE(builder.add(2));
  CATCH_REQUIRE(!builder.add(2));
  CATCH_REQUIRE(builder.size() == 2);
  CATCH_REQUIRE(builder.contains(1));
  CATCH_REQUIRE(builder.hash_code() == 3u);

  CATCH_REQUIRE(builder.remove(1));
  CATCH_REQUIRE(!builder.remove(1));
  CATCH_REQUIRE(builder.size() == 1);

  const auto set = builder.to_persistent();
  CATCH_REQUIRE(set == IntSetType{{2}});
}

CATCH_TEST_CASE("transient_many_edits", "[transient_many_edits]") {
  IntTransientType builder;
  std::unordered_set<int> reference;
  for (int value = 0; value < 5000; ++value) {
    builder.add(value * 7);
    reference.insert(value * 7);
  }
  for (int value = 0; value < 5000; value += 3) {
    builder.remove(value * 7);
    reference.erase(value * 7);
  }
  CATCH_REQUIRE(builder.size() == reference.size());

  const auto set = builder.to_persistent();
  CATCH_REQUIRE(set.equals(reference));
  std::size_t counter = 0;
  for (const auto& value : builder) {
    CATCH_REQUIRE(reference.count(value) == 1);
    ++counter;
  }
  CATCH_REQUIRE(counter == reference.size());
}

CATCH_TEST_CASE("transient_leaves_source_untouched", "[transient_leaves_source_untouched]") {
  std::vector<int> values(1000);
  std::iota(std::begin(values), std::end(values), 0);
  const auto source = IntSetType::copy_of(values);

  auto builder = source.to_transient();
  CATCH_REQUIRE(builder.size() == source.size());
  for (int value = 0; value < 1000; value += 2)
    builder.remove(value);
  builder.add(-5);

  CATCH_REQUIRE(source.size() == 1000);
  CATCH_REQUIRE(source.equals(values));
  CATCH_REQUIRE(builder.size() == 501);
  CATCH_REQUIRE(!builder.contains(0));
  CATCH_REQUIRE(builder.contains(1));
}

CATCH_TEST_CASE("transient_frozen_snapshot", "[transient_frozen_snapshot]") {
  IntTransientType builder;
  for (int value = 0; value < 100; ++value)
    builder.add(value);

  // Later edits through the builder never reach the snapshot
  const auto snapshot = builder.to_persistent();
  for (int value = 0; value < 100; value += 2)
    builder.remove(value);
  for (int value = 100; value < 200; ++value)
    builder.add(value);

  CATCH_REQUIRE(snapshot.size() == 100);
  for (int value = 0; value < 100; ++value)
    CATCH_REQUIRE(snapshot.contains(value));
  CATCH_REQUIRE(!snapshot.contains(150));

  const auto second = builder.to_persistent();
  CATCH_REQUIRE(second.size() == 150);
  CATCH_REQUIRE(snapshot.size() == 100);
}

CATCH_TEST_CASE("transient_collision_edits", "[transient_collision_edits]") {
  // Two hashes: every key lands in one of two buckets, edited in place
  transient_trie_set<int, ModuloHasher<2>> builder;
  for (int value = 0; value < 50; ++value)
    builder.add(value);
  const auto snapshot = builder.to_persistent();

  for (int value = 0; value < 50; value += 5)
    builder.remove(value);
  builder.add(100);

  CATCH_REQUIRE(snapshot.size() == 50);
  CATCH_REQUIRE(builder.size() == 41);
  const auto set = builder.to_persistent();
  for (int value = 0; value < 50; ++value) {
    CATCH_REQUIRE(snapshot.contains(value));
    CATCH_REQUIRE(set.contains(value) == (value % 5 != 0));
  }
  CATCH_REQUIRE(set.contains(100));
}

CATCH_TEST_CASE("transient_bulk_operations", "[transient_bulk_operations]") {
  const auto evens = IntSetType::of(0, 2, 4, 6, 8);
  const auto odds = IntSetType::of(1, 3, 5, 7, 9);

  IntTransientType builder;
  CATCH_REQUIRE(builder.add_all(evens));
  CATCH_REQUIRE(builder.add_all(odds));
  CATCH_REQUIRE(!builder.add_all(odds));
  CATCH_REQUIRE(builder.size() == 10);
  CATCH_REQUIRE(builder.hash_code() == 45u);

  CATCH_REQUIRE(builder.add_all(std::vector<int>{9, 10, 11}));
  CATCH_REQUIRE(builder.size() == 12);

  CATCH_REQUIRE(builder.remove_all(std::vector<int>{10, 11, 12}));
  CATCH_REQUIRE(!builder.remove_all(std::vector<int>{10, 11, 12}));
  CATCH_REQUIRE(builder.size() == 10);

  CATCH_REQUIRE(builder.retain_all(evens));
  CATCH_REQUIRE(!builder.retain_all(evens));
  CATCH_REQUIRE(builder.to_persistent() == evens);

  // Bulk union into a builder must not modify its argument
  CATCH_REQUIRE(builder.add_all(odds));
  CATCH_REQUIRE(builder.remove(1));
  CATCH_REQUIRE(odds.contains(1));
  CATCH_REQUIRE(odds.size() == 5);

  CATCH_REQUIRE(builder.retain_all(std::unordered_set<int>{}));
  CATCH_REQUIRE(builder.empty());
}

CATCH_TEST_CASE("transient_add_all_builder", "[transient_add_all_builder]") {
  IntTransientType other;
  for (int value = 20; value < 60; ++value)
    other.add(value);

  IntTransientType builder;
  builder.add(1);
  CATCH_REQUIRE(builder.add_all(other));
  CATCH_REQUIRE(builder.size() == 41);
  CATCH_REQUIRE(!builder.add_all(other));
  CATCH_REQUIRE(!builder.add_all(builder));

  // `other` was frozen by the merge, and no longer edits nodes it shares with `builder`
  CATCH_REQUIRE(other.remove(20));
  other.add(100);
  CATCH_REQUIRE(builder.contains(20));
  CATCH_REQUIRE(!builder.contains(100));
  CATCH_REQUIRE(builder.size() == 41);

  CATCH_REQUIRE(builder.remove(21));
  CATCH_REQUIRE(other.contains(21));
  CATCH_REQUIRE(other.size() == 40);
}

CATCH_TEST_CASE("transient_move", "[transient_move]") {
  IntTransientType builder;
  builder.add(1);
  builder.add(2);

  IntTransientType other = std::move(builder);
  CATCH_REQUIRE(other.size() == 2);
  other.add(3);

  IntTransientType third;
  third = std::move(other);
  CATCH_REQUIRE(third.size() == 3);
  CATCH_REQUIRE(third.to_persistent() == IntSetType{{1, 2, 3}});
}

CATCH_TEST_CASE("transient_element_lifetime", "[transient_element_lifetime]") {
  uint32_t counter = 0;
  {
    transient_trie_set<TracedItem, TracedItem::Hasher> builder;
    for (std::size_t value = 0; value < 300; ++value)
      builder.add(TracedItem{counter, value});
    builder.add(TracedItem{counter, 0x100000000ull}); // collides with 0
    builder.add(TracedItem{counter, 0x200000000ull});
    const auto snapshot = builder.to_persistent();

    for (std::size_t value = 0; value < 300; value += 3)
      builder.remove(TracedItem{counter, value});
    builder.remove(TracedItem{counter, 0x100000000ull});
    CATCH_REQUIRE(builder.size() == 201);
    CATCH_REQUIRE(snapshot.size() == 302);
  }
  CATCH_REQUIRE(counter == 0);
}

} // namespace champ::test
