#include "champ/persistent-trie-set.hpp"

#include <fmt/format.h>

#include <array>
#include <chrono>
#include <fstream>
#include <functional>
#include <iostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <vector>

#include <cassert>

using namespace std::string_literals;

using ticktock_type = std::chrono::time_point<std::chrono::steady_clock>;

static ticktock_type tick() { return std::chrono::steady_clock::now(); }
static std::chrono::microseconds tock(const ticktock_type& whence) {
  auto now = std::chrono::steady_clock::now();
  return std::chrono::duration_cast<std::chrono::microseconds>(now - whence);
}

constexpr std::size_t ColumnCount{5};

struct Data {
  std::string label;
  std::size_t size;
  std::array<std::string, ColumnCount> columns;
  std::array<uint64_t, ColumnCount> insert_times;
  std::array<uint64_t, ColumnCount> iterate_times;
  std::array<uint64_t, ColumnCount> find_times;
  std::array<uint64_t, ColumnCount> delete_times;
  std::array<uint64_t, ColumnCount> union_times;
  std::size_t volatile_data = 0; // to prevent optimizing away
};

template <typename T> T generate(std::size_t counter) {
  if constexpr (std::is_integral<T>::value) {
    return static_cast<T>(counter);
  } else if constexpr (std::is_same<T, std::string>::value) {
    return fmt::format("{0}:{1}:{0}:{2}", counter, 10 * counter, 437 * counter * 12345667);
  } else {
    assert(false);
  }
}

template <typename T> std::vector<T> generate_items(std::size_t first, std::size_t count) {
  std::vector<T> items;
  items.reserve(count);
  for (auto i = first; i < first + count; ++i)
    items.push_back(generate<T>(i));
  return items;
}

template <typename T> std::size_t weight(const T& item) {
  if constexpr (std::is_integral<T>::value) {
    return static_cast<std::size_t>(item);
  } else {
    return item.size();
  }
}

template <typename item_type> Data run_items(std::string label, const std::size_t size,
                                             const uint32_t sample_size) {
  using vector_type = std::vector<item_type>;
  using std_set_type = std::unordered_set<item_type>;
  using atomic_trie_type = champ::persistent_trie_set<item_type>;
  using non_atomic_trie_type =
      champ::persistent_trie_set<item_type, std::hash<item_type>, std::equal_to<item_type>, false>;

  const vector_type items = generate_items<item_type>(0, size);
  const vector_type others = generate_items<item_type>(size / 2, size); // half overlapping

  // 1. unordered_set (with reserve)
  // 2. unordered_set (without reserve)
  // 3. persistent_trie_set (with atomics), one copy_add per item
  // 4. persistent_trie_set (without atomics), one copy_add per item
  // 5. transient_trie_set (with atomics), frozen at the end

  Data data;
  data.label = label;
  data.size = size;
  data.columns = decltype(data.columns){
      {"std-set-reserve"s, "std-set"s, "atomic-trie"s, "na-trie"s, "transient"s}};

  std_set_type std_set_w_res;      // 1.
  std_set_type std_set_wo_res;     // 2.
  atomic_trie_type atomic_trie;    // 3.
  non_atomic_trie_type na_trie;    // 4.
  atomic_trie_type transient_trie; // 5.

  const auto start = std::begin(items);
  const auto finish = std::end(items);

  auto profile = [sample_size](std::string_view label, auto thunk) {
    uint64_t total_us = 0;
    for (auto i = 0u; i < sample_size; ++i) {
      const auto reference = tick();
      thunk();
      total_us += tock(reference).count();
    }
    const auto average_us = uint64_t(total_us / double(sample_size));
    const auto seconds = average_us / 1000000;
    std::cout << fmt::format("             {:15s} = {}.{:06d}s\n", label, seconds,
                             average_us % 1000000);
    return average_us;
  };

  { // Insert
    std::cout << fmt::format("{}({}) -- INSERT\n", label, size);
    data.insert_times[0] = profile(data.columns[0], [&]() {
      std_set_w_res = std_set_type{};
      std_set_w_res.reserve(size);
      std_set_w_res.insert(start, finish);
    });
    data.insert_times[1] = profile(data.columns[1], [&]() {
      std_set_wo_res = std_set_type{};
      std_set_wo_res.insert(start, finish);
    });
    data.insert_times[2] = profile(data.columns[2], [&]() {
      atomic_trie = atomic_trie_type{};
      for (const auto& item : items)
        atomic_trie = atomic_trie.copy_add(item);
    });
    data.insert_times[3] = profile(data.columns[3], [&]() {
      na_trie = non_atomic_trie_type{};
      for (const auto& item : items)
        na_trie = na_trie.copy_add(item);
    });
    data.insert_times[4] = profile(data.columns[4], [&]() {
      auto builder = atomic_trie_type{}.to_transient();
      for (const auto& item : items)
        builder.add(item);
      transient_trie = builder.to_persistent();
    });
  }

  { // Iterate
    std::cout << fmt::format("{}({}) -- ITERATE\n", label, size);
    std::size_t counter = 0;
    auto iterate = [&counter](const auto& set) {
      return [&counter, &set]() {
        for (const auto& item : set)
          counter += weight(item);
      };
    };
    data.iterate_times[0] = profile(data.columns[0], iterate(std_set_w_res));
    data.iterate_times[1] = profile(data.columns[1], iterate(std_set_wo_res));
    data.iterate_times[2] = profile(data.columns[2], iterate(atomic_trie));
    data.iterate_times[3] = profile(data.columns[3], iterate(na_trie));
    data.iterate_times[4] = profile(data.columns[4], iterate(transient_trie));
    data.volatile_data += counter;
  }

  { // Find
    std::cout << fmt::format("{}({}) -- FIND\n", label, size);
    std::size_t counter = 0;
    auto find = [&counter, &items](const auto& set) {
      return [&counter, &items, &set]() {
        for (const auto& item : items)
          counter += set.count(item);
      };
    };
    data.find_times[0] = profile(data.columns[0], find(std_set_w_res));
    data.find_times[1] = profile(data.columns[1], find(std_set_wo_res));
    data.find_times[2] = profile(data.columns[2], find(atomic_trie));
    data.find_times[3] = profile(data.columns[3], find(na_trie));
    data.find_times[4] = profile(data.columns[4], find(transient_trie));
    data.volatile_data += counter;
  }

  { // Union with a half-overlapping set of the same size
    std::cout << fmt::format("{}({}) -- UNION\n", label, size);
    std::size_t counter = 0;
    const atomic_trie_type atomic_others = atomic_trie_type::copy_of(others);
    const non_atomic_trie_type na_others = non_atomic_trie_type::copy_of(others);
    data.union_times[0] = profile(data.columns[0], [&]() {
      auto copy = std_set_w_res;
      copy.insert(std::begin(others), std::end(others));
      counter += copy.size();
    });
    data.union_times[1] = profile(data.columns[1], [&]() {
      auto copy = std_set_wo_res;
      copy.insert(std::begin(others), std::end(others));
      counter += copy.size();
    });
    data.union_times[2] = profile(data.columns[2], [&]() {
      counter += atomic_trie.copy_add_all(atomic_others).size();
    });
    data.union_times[3] =
        profile(data.columns[3], [&]() { counter += na_trie.copy_add_all(na_others).size(); });
    data.union_times[4] = profile(data.columns[4], [&]() {
      auto builder = transient_trie.to_transient();
      builder.add_all(atomic_others);
      counter += builder.size();
    });
    data.volatile_data += counter;
  }

  { // Delete
    std::cout << fmt::format("{}({}) -- DELETE\n", label, size);
    data.delete_times[0] = profile(data.columns[0], [&]() {
      auto copy = std_set_w_res;
      for (const auto& item : items)
        copy.erase(item);
    });
    data.delete_times[1] = profile(data.columns[1], [&]() {
      auto copy = std_set_wo_res;
      for (const auto& item : items)
        copy.erase(item);
    });
    data.delete_times[2] = profile(data.columns[2], [&]() {
      auto set = atomic_trie;
      for (const auto& item : items)
        set = set.copy_remove(item);
    });
    data.delete_times[3] = profile(data.columns[3], [&]() {
      auto set = na_trie;
      for (const auto& item : items)
        set = set.copy_remove(item);
    });
    data.delete_times[4] = profile(data.columns[4], [&]() {
      auto builder = transient_trie.to_transient();
      for (const auto& item : items)
        builder.remove(item);
    });
  }

  std::cout << "\n";

  return data;
}

template <typename item_type>
void run_types(std::ostream& os, std::string label, std::size_t size0, std::size_t max_size,
               uint32_t sample_size) {
  // collect all the data
  std::vector<Data> data;
  for (std::size_t size = size0; size <= max_size; size *= 2)
    data.push_back(run_items<item_type>(label, size, sample_size));

  auto output = [&](std::string op_type, auto fn) {
    os << fmt::format("{}_{}\t{}\n", label, op_type, fmt::join(data[0].columns, "\t"));
    for (const auto& datum : data)
      os << fmt::format("{}\t{}\n", datum.size, fmt::join(fn(datum), "\t"));
    os << "\n";
  };

  output("insert", std::mem_fn(&Data::insert_times));
  output("iterate", std::mem_fn(&Data::iterate_times));
  output("find", std::mem_fn(&Data::find_times));
  output("union", std::mem_fn(&Data::union_times));
  output("delete", std::mem_fn(&Data::delete_times));
}

void run_benchmark(std::string filename) {
  const std::size_t min_size = 1000;
  const std::size_t max_size = 1024000;
  const uint32_t sample_size = 10;
  std::fstream file(filename, file.out);
  if (!file.is_open()) {
    std::cerr << fmt::format("failed to open file '{}'\n", filename);
    std::exit(1);
  }

  run_types<int>(file, "integer", min_size, max_size, sample_size);
  run_types<std::string>(file, "string", min_size, max_size, sample_size);

  file.close();
  std::cout << fmt::format("Benchmark results collated in '{}'\n", filename);
}

int main(int argc, char* argv[]) {
  run_benchmark(argc > 1 ? argv[1] : "/tmp/champ-benchmark-data.tsv");
  return 0;
}
