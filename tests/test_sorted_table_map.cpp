// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <algorithm>
#include <catch2/catch_template_test_macros.hpp>
#include <catch2/catch_test_macros.hpp>
#include <map>
#include <optional>
#include <ordered_tables/sorted_table_map.hpp>
#include <random>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

using namespace kressler::ordered_tables;

namespace {

template <typename Table>
std::vector<typename Table::key_type> keys_of(const Table& table) {
  std::vector<typename Table::key_type> keys;
  for (const auto& entry : table) {
    keys.push_back(entry.first);
  }
  return keys;
}

template <typename Range>
std::vector<int> range_keys(const Range& range) {
  std::vector<int> keys;
  for (const auto& entry : range) {
    keys.push_back(entry.first);
  }
  return keys;
}

using entry_type = std::pair<int, std::string>;

}  // namespace

TEST_CASE("sorted_table_map basic construction", "[sorted_table_map]") {
  sorted_table_map<int, std::string> table;

  REQUIRE(table.size() == 0);
  REQUIRE(table.empty());
  REQUIRE(table.begin() == table.end());
}

TEST_CASE("sorted_table_map empty table queries", "[sorted_table_map]") {
  const sorted_table_map<int, std::string> table{};

  REQUIRE(table.size() == 0);
  REQUIRE(table.find_min() == std::nullopt);
  REQUIRE(table.find_max() == std::nullopt);
  REQUIRE(table.find_ge(0) == std::nullopt);
  REQUIRE(table.find_ge(42) == std::nullopt);
  REQUIRE(table.find_lt(42) == std::nullopt);
  REQUIRE(table.find_gt(42) == std::nullopt);
  REQUIRE(table.find_range(std::nullopt, std::nullopt).empty());
  REQUIRE(table.find_range(1, 10).empty());
  REQUIRE_THROWS_AS(table.at(42), key_not_found);
  REQUIRE(table.find(42) == table.end());
  REQUIRE(table.rbegin() == table.rend());
}

TEST_CASE("sorted_table_map insert operations", "[sorted_table_map]") {
  sorted_table_map<int, std::string> table;

  SECTION("Insert single element") {
    auto [it, inserted] = table.insert(5, "five");
    REQUIRE(inserted);
    REQUIRE(table.size() == 1);
    REQUIRE(!table.empty());
    REQUIRE(it->first == 5);
    REQUIRE(it->second == "five");
  }

  SECTION("Insert multiple elements in sorted order") {
    table.insert(3, "three");
    table.insert(1, "one");
    table.insert(5, "five");
    table.insert(2, "two");
    table.insert(4, "four");

    REQUIRE(table.size() == 5);
    REQUIRE(keys_of(table) == std::vector<int>{1, 2, 3, 4, 5});
  }

  SECTION("Insert returns false when key already exists") {
    auto [it1, inserted1] = table.insert(3, "three");
    REQUIRE(inserted1 == true);

    auto [it2, inserted2] = table.insert(3, "tres");
    REQUIRE(inserted2 == false);
    REQUIRE(it2->second == "three");  // Value should be unchanged
    REQUIRE(it1 == it2);
    REQUIRE(table.size() == 1);
  }
}

TEST_CASE("sorted_table_map insert_or_assign", "[sorted_table_map]") {
  sorted_table_map<int, std::string> table;

  SECTION("Round trip") {
    table.insert_or_assign(7, "seven");
    REQUIRE(table.at(7) == "seven");
  }

  SECTION("Overwrite keeps size and position") {
    table.insert_or_assign(1, "one");
    table.insert_or_assign(2, "two");
    table.insert_or_assign(3, "three");

    auto [it, inserted] = table.insert_or_assign(2, "deux");
    REQUIRE(!inserted);
    REQUIRE(it.index() == 1);
    REQUIRE(table.size() == 3);
    REQUIRE(table.at(2) == "deux");
    REQUIRE(keys_of(table) == std::vector<int>{1, 2, 3});
  }

  SECTION("Last writer wins") {
    table.insert_or_assign(4, "a");
    table.insert_or_assign(4, "b");
    table.insert_or_assign(4, "c");
    REQUIRE(table.size() == 1);
    REQUIRE(table.at(4) == "c");
  }

  SECTION("Rvalue value is forwarded") {
    std::string value(100, 'x');
    table.insert_or_assign(1, std::move(value));
    REQUIRE(table.at(1) == std::string(100, 'x'));
  }
}

TEST_CASE("sorted_table_map at", "[sorted_table_map]") {
  sorted_table_map<int, std::string> table{
      {10, "ten"}, {20, "twenty"}, {30, "thirty"}};

  SECTION("Returns a mutable reference") {
    table.at(20) = "TWENTY";
    REQUIRE(table.at(20) == "TWENTY");
  }

  SECTION("Missing key throws key_not_found") {
    REQUIRE_THROWS_AS(table.at(25), key_not_found);
    REQUIRE_THROWS_AS(table.at(5), key_not_found);
    REQUIRE_THROWS_AS(table.at(35), key_not_found);
  }

  SECTION("key_not_found is an out_of_range") {
    REQUIRE_THROWS_AS(table.at(25), std::out_of_range);
  }

  SECTION("Const access") {
    const auto& const_table = table;
    REQUIRE(const_table.at(30) == "thirty");
    REQUIRE_THROWS_AS(const_table.at(31), key_not_found);
  }
}

TEST_CASE("sorted_table_map remove operations", "[sorted_table_map]") {
  sorted_table_map<int, std::string> table{
      {10, "ten"}, {20, "twenty"}, {30, "thirty"}, {40, "forty"}};

  SECTION("Remove existing key") {
    table.remove(20);
    REQUIRE(table.size() == 3);
    REQUIRE_THROWS_AS(table.at(20), key_not_found);
    REQUIRE(keys_of(table) == std::vector<int>{10, 30, 40});
  }

  SECTION("Remove first and last") {
    table.remove(10);
    table.remove(40);
    REQUIRE(keys_of(table) == std::vector<int>{20, 30});
  }

  SECTION("Remove missing key throws and leaves table unchanged") {
    REQUIRE_THROWS_AS(table.remove(25), key_not_found);
    REQUIRE(table.size() == 4);
    REQUIRE(keys_of(table) == std::vector<int>{10, 20, 30, 40});
    REQUIRE(table.at(30) == "thirty");
  }

  SECTION("Remove from empty table throws") {
    sorted_table_map<int, std::string> empty;
    REQUIRE_THROWS_AS(empty.remove(1), key_not_found);
    REQUIRE(empty.empty());
  }

  SECTION("Erase by key returns count") {
    REQUIRE(table.erase(30) == 1);
    REQUIRE(table.erase(30) == 0);
    REQUIRE(table.size() == 3);
  }

  SECTION("Erase by iterator returns the following element") {
    auto it = table.erase(table.find(20));
    REQUIRE(it != table.end());
    REQUIRE(it->first == 30);

    it = table.erase(table.find(40));
    REQUIRE(it == table.end());
    REQUIRE(keys_of(table) == std::vector<int>{10, 30});
  }
}

TEST_CASE("sorted_table_map find and bounds", "[sorted_table_map]") {
  sorted_table_map<int, std::string> table{
      {10, "ten"}, {20, "twenty"}, {30, "thirty"}, {40, "forty"}};

  SECTION("Find existing and missing elements") {
    REQUIRE(table.find(10)->second == "ten");
    REQUIRE(table.find(40)->second == "forty");
    REQUIRE(table.find(25) == table.end());
    REQUIRE(table.find(5) == table.end());
    REQUIRE(table.find(100) == table.end());
  }

  SECTION("contains and count") {
    REQUIRE(table.contains(20));
    REQUIRE(!table.contains(21));
    REQUIRE(table.count(30) == 1);
    REQUIRE(table.count(31) == 0);
  }

  SECTION("lower_bound and upper_bound") {
    REQUIRE(table.lower_bound(20)->first == 20);
    REQUIRE(table.lower_bound(21)->first == 30);
    REQUIRE(table.lower_bound(41) == table.end());
    REQUIRE(table.upper_bound(20)->first == 30);
    REQUIRE(table.upper_bound(5)->first == 10);
    REQUIRE(table.upper_bound(40) == table.end());
  }
}

TEST_CASE("sorted_table_map boundary queries", "[sorted_table_map]") {
  const sorted_table_map<int, std::string> table{
      {1, "one"}, {3, "three"}, {5, "five"}};

  REQUIRE(table.find_min() == entry_type{1, "one"});
  REQUIRE(table.find_max() == entry_type{5, "five"});

  REQUIRE(table.find_ge(3) == entry_type{3, "three"});
  REQUIRE(table.find_ge(4) == entry_type{5, "five"});
  REQUIRE(table.find_ge(0) == entry_type{1, "one"});
  REQUIRE(table.find_ge(6) == std::nullopt);

  REQUIRE(table.find_lt(3) == entry_type{1, "one"});
  REQUIRE(table.find_lt(4) == entry_type{3, "three"});
  REQUIRE(table.find_lt(100) == entry_type{5, "five"});
  REQUIRE(table.find_lt(1) == std::nullopt);

  REQUIRE(table.find_gt(3) == entry_type{5, "five"});
  REQUIRE(table.find_gt(2) == entry_type{3, "three"});
  REQUIRE(table.find_gt(0) == entry_type{1, "one"});
  REQUIRE(table.find_gt(5) == std::nullopt);
}

TEST_CASE("sorted_table_map boundary results are copies",
          "[sorted_table_map]") {
  sorted_table_map<int, std::string> table{{1, "one"}, {2, "two"}};

  const auto min = table.find_min();
  table.remove(1);
  table.insert_or_assign(0, "zero");

  REQUIRE(min == entry_type{1, "one"});
  REQUIRE(table.find_min() == entry_type{0, "zero"});
}

TEST_CASE("sorted_table_map find_range", "[sorted_table_map]") {
  sorted_table_map<int, std::string> table{
      {10, "ten"}, {20, "twenty"}, {30, "thirty"}, {40, "forty"}};

  SECTION("Bounded range is half open") {
    REQUIRE(range_keys(table.find_range(15, 35)) == std::vector<int>{20, 30});
    REQUIRE(range_keys(table.find_range(20, 40)) == std::vector<int>{20, 30});
    REQUIRE(range_keys(table.find_range(10, 11)) == std::vector<int>{10});
  }

  SECTION("Unset start begins at the minimum") {
    REQUIRE(range_keys(table.find_range(std::nullopt, 25)) ==
            std::vector<int>{10, 20});
  }

  SECTION("Unset stop runs through the maximum") {
    REQUIRE(range_keys(table.find_range(25, std::nullopt)) ==
            std::vector<int>{30, 40});
  }

  SECTION("Both unset covers the whole table") {
    REQUIRE(range_keys(table.find_range(std::nullopt, std::nullopt)) ==
            std::vector<int>{10, 20, 30, 40});
  }

  SECTION("Start after stop is empty") {
    const auto range = table.find_range(50, 10);
    REQUIRE(range.empty());
    REQUIRE(range.size() == 0);
    REQUIRE(range_keys(table.find_range(35, 15)).empty());
    REQUIRE(range_keys(table.find_range(30, 30)).empty());
  }

  SECTION("Range outside the keys is empty") {
    REQUIRE(table.find_range(41, 100).empty());
    REQUIRE(table.find_range(0, 10).empty());
  }

  SECTION("Range is restartable") {
    const auto range = table.find_range(15, std::nullopt);
    REQUIRE(range_keys(range) == std::vector<int>{20, 30, 40});
    REQUIRE(range_keys(range) == std::vector<int>{20, 30, 40});
    REQUIRE(range.size() == 3);
  }

  SECTION("Values are writable through a non-const range") {
    for (auto entry : table.find_range(20, 40)) {
      entry.second += "!";
    }
    REQUIRE(table.at(10) == "ten");
    REQUIRE(table.at(20) == "twenty!");
    REQUIRE(table.at(30) == "thirty!");
    REQUIRE(table.at(40) == "forty");
  }

  SECTION("Const range") {
    const auto& const_table = table;
    std::vector<std::string> values;
    for (const auto& entry : const_table.find_range(20, std::nullopt)) {
      values.push_back(entry.second);
    }
    REQUIRE(values == std::vector<std::string>{"twenty", "thirty", "forty"});
  }
}

TEST_CASE("sorted_table_map iterator support", "[sorted_table_map]") {
  sorted_table_map<int, std::string> table;
  table.insert(5, "five");
  table.insert(3, "three");
  table.insert(7, "seven");
  table.insert(1, "one");

  SECTION("Forward iteration") {
    REQUIRE(keys_of(table) == std::vector<int>{1, 3, 5, 7});
  }

  SECTION("Const iterator") {
    const auto& const_table = table;
    std::vector<int> keys;
    for (auto it = const_table.cbegin(); it != const_table.cend(); ++it) {
      keys.push_back(it->first);
    }

    REQUIRE(keys == std::vector<int>{1, 3, 5, 7});
  }

  SECTION("Modify through iterator") {
    for (auto pair : table) {
      pair.second += "!";
    }

    REQUIRE(table.find(1)->second == "one!");
    REQUIRE(table.find(7)->second == "seven!");
  }

  SECTION("Random access") {
    auto it = table.begin();
    REQUIRE((it + 2)->first == 5);
    REQUIRE(it[3].first == 7);
    REQUIRE(table.end() - table.begin() == 4);
    it += 3;
    --it;
    REQUIRE(it->first == 5);
  }

  SECTION("Conversion to value_type") {
    std::pair<int, std::string> copy = *table.begin();
    REQUIRE(copy == entry_type{1, "one"});
  }
}

TEST_CASE("sorted_table_map reverse iterator support", "[sorted_table_map]") {
  sorted_table_map<int, std::string> table{
      {5, "five"}, {3, "three"}, {7, "seven"}, {1, "one"}};

  SECTION("Reverse iteration") {
    std::vector<int> keys;
    for (auto it = table.rbegin(); it != table.rend(); ++it) {
      keys.push_back(it->first);
    }

    REQUIRE(keys == std::vector<int>{7, 5, 3, 1});
  }

  SECTION("Const reverse iterator") {
    const auto& const_table = table;
    std::vector<int> keys;
    for (auto it = const_table.crbegin(); it != const_table.crend(); ++it) {
      keys.push_back(it->first);
    }

    REQUIRE(keys == std::vector<int>{7, 5, 3, 1});
  }

  SECTION("Descending is the exact reverse of ascending") {
    auto ascending = keys_of(table);
    std::vector<int> descending;
    for (auto it = table.crbegin(); it != table.crend(); ++it) {
      descending.push_back(it->first);
    }
    std::reverse(ascending.begin(), ascending.end());
    REQUIRE(descending == ascending);
  }
}

TEST_CASE("sorted_table_map construction from pairs", "[sorted_table_map]") {
  SECTION("Initializer list keeps the first duplicate") {
    sorted_table_map<int, std::string> table{
        {3, "c"}, {1, "a"}, {3, "dup"}, {2, "b"}};
    REQUIRE(table.size() == 3);
    REQUIRE(table.at(3) == "c");
    REQUIRE(keys_of(table) == std::vector<int>{1, 2, 3});
  }

  SECTION("Iterator range") {
    std::map<int, std::string> source{{2, "two"}, {1, "one"}, {3, "three"}};
    sorted_table_map<int, std::string> table(source.begin(), source.end());
    REQUIRE(keys_of(table) == std::vector<int>{1, 2, 3});
    REQUIRE(table.at(2) == "two");
  }
}

TEST_CASE("sorted_table_map copy, move and swap", "[sorted_table_map]") {
  sorted_table_map<int, std::string> original{{1, "one"}, {2, "two"}};

  SECTION("Copy is independent") {
    auto copy = original;
    copy.insert_or_assign(1, "uno");
    copy.insert(3, "three");
    REQUIRE(original.at(1) == "one");
    REQUIRE(original.size() == 2);
    REQUIRE(copy.size() == 3);
  }

  SECTION("Move transfers contents") {
    auto moved = std::move(original);
    REQUIRE(moved.size() == 2);
    REQUIRE(moved.at(2) == "two");
  }

  SECTION("Swap exchanges contents") {
    sorted_table_map<int, std::string> other{{9, "nine"}};
    swap(original, other);
    REQUIRE(original.size() == 1);
    REQUIRE(original.at(9) == "nine");
    REQUIRE(other.size() == 2);
  }

  SECTION("Clear") {
    original.clear();
    REQUIRE(original.empty());
    REQUIRE(original.find(1) == original.end());
  }
}

TEST_CASE("sorted_table_map with different types", "[sorted_table_map]") {
  SECTION("String keys and int values") {
    sorted_table_map<std::string, int> table;
    table.insert("apple", 1);
    table.insert("zebra", 26);
    table.insert("banana", 2);
    table.insert("mango", 13);

    REQUIRE(keys_of(table) ==
            std::vector<std::string>{"apple", "banana", "mango", "zebra"});
    REQUIRE(table.find_ge("c")->first == "mango");
    REQUIRE(table.find_lt("apple") == std::nullopt);
  }

  SECTION("Tuple keys order field by field") {
    using key = std::tuple<std::string, std::string, int>;
    sorted_table_map<key, int> table;
    table.insert_or_assign(key{"LAX", "SFO", 900}, 1);
    table.insert_or_assign(key{"JFK", "LAX", 1200}, 2);
    table.insert_or_assign(key{"LAX", "SFO", 700}, 3);

    const auto range = table.find_range(key{"LAX", "SFO", 0},
                                        key{"LAX", "SFO", 2400});
    std::vector<int> values;
    for (const auto& entry : range) {
      values.push_back(entry.second);
    }
    REQUIRE(values == std::vector<int>{3, 1});
  }
}

TEST_CASE("sorted_table_map with std::greater (descending order)",
          "[sorted_table_map][comparator]") {
  sorted_table_map<int, std::string, std::greater<int>> table;
  table.insert(5, "five");
  table.insert(10, "ten");
  table.insert(3, "three");
  table.insert(7, "seven");
  table.insert(1, "one");

  REQUIRE(keys_of(table) == std::vector<int>{10, 7, 5, 3, 1});

  // Ordered queries follow the comparator, so "min" is the largest integer
  REQUIRE(table.find_min()->first == 10);
  REQUIRE(table.find_max()->first == 1);
  REQUIRE(table.find_ge(6)->first == 5);
  REQUIRE(table.find_lt(6)->first == 7);
  REQUIRE(range_keys(table.find_range(8, 2)) == std::vector<int>{7, 5, 3});

  table.remove(7);
  REQUIRE(keys_of(table) == std::vector<int>{10, 5, 3, 1});
}

TEST_CASE("sorted_table_map locator agrees with std::lower_bound",
          "[sorted_table_map][locator]") {
  // Even keys only, so odd probes always fall between entries
  for (int n = 0; n <= 17; ++n) {
    sorted_table_map<int, int> table;
    std::vector<int> keys;
    for (int i = 0; i < n; ++i) {
      table.insert(2 * i, i);
      keys.push_back(2 * i);
    }

    for (int probe = -1; probe <= 2 * n + 1; ++probe) {
      const auto expected = static_cast<std::size_t>(
          std::lower_bound(keys.begin(), keys.end(), probe) - keys.begin());
      REQUIRE(table.lower_bound(probe).index() == expected);
    }
  }
}

TEMPLATE_TEST_CASE("sorted_table_map invariants under random operations",
                   "[sorted_table_map][random]", std::less<int>,
                   std::greater<int>) {
  sorted_table_map<int, int, TestType> table;
  std::map<int, int, TestType> reference;
  std::mt19937 rng(12345);
  std::uniform_int_distribution<int> key_dist(0, 500);
  std::uniform_int_distribution<int> op_dist(0, 2);

  for (int step = 0; step < 5000; ++step) {
    const int key = key_dist(rng);
    switch (op_dist(rng)) {
      case 0:
      case 1:
        table.insert_or_assign(key, step);
        reference.insert_or_assign(key, step);
        break;
      default:
        if (reference.erase(key) == 1) {
          table.remove(key);
        } else {
          REQUIRE_THROWS_AS(table.remove(key), key_not_found);
        }
        break;
    }
  }

  REQUIRE(table.size() == reference.size());

  // Strictly ordered under the comparator, with no duplicates
  const TestType comp;
  for (auto it = table.begin(); it + 1 < table.end(); ++it) {
    REQUIRE(comp(it->first, (it + 1)->first));
  }

  auto ref_it = reference.begin();
  for (const auto& entry : table) {
    REQUIRE(entry.first == ref_it->first);
    REQUIRE(entry.second == ref_it->second);
    ++ref_it;
  }
}
