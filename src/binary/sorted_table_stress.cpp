// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <limits>
#include <lyra/lyra.hpp>
#include <map>
#include <optional>
#include <ordered_tables/sorted_table_map.hpp>
#include <random>
#include <unordered_set>
#include <utility>

using kressler::ordered_tables::sorted_table_map;

namespace {

using reference_map = std::map<int, int>;
using table_type = sorted_table_map<int, int>;

std::optional<std::pair<int, int>> as_optional(reference_map::const_iterator it,
                                               const reference_map& ref) {
  if (it == ref.end()) {
    return std::nullopt;
  }
  return std::pair<int, int>{it->first, it->second};
}

[[noreturn]] void fail(const char* what, int key) {
  std::cout << "Mismatch in " << what << " for key " << key << std::endl;
  exit(1);
}

}  // namespace

int main(int argc, char** argv) {
  bool show_help = false;
  uint64_t seed = static_cast<uint64_t>(
      std::chrono::steady_clock::now().time_since_epoch().count());
  size_t target_iterations = 100;
  size_t min_keys = 1000;
  size_t max_keys = 20000;
  size_t batches = 20;
  size_t batch_size = 500;

  // Define command line interface
  auto cli =
      lyra::cli() | lyra::help(show_help) |
      lyra::opt(seed, "seed")["-d"]["--seed"](
          "Random seed (defaults to time since epoch)") |
      lyra::opt(target_iterations,
                "iterations")["-i"]["--iterations"]("Iterations to run") |
      lyra::opt(min_keys,
                "min_keys")["--min-keys"]("Minimum keys to target in table") |
      lyra::opt(max_keys,
                "max_keys")["--max-keys"]("Maximum keys to target in table") |
      lyra::opt(batches, "batches")["-b"]["--batches"](
          "Number of erase/insert batches to run") |
      lyra::opt(batch_size, "batch_size")["-s"]["--batch-size"](
          "Size of an erase/insert batch");

  // Parse command line
  auto result = cli.parse({argc, argv});
  if (!result) {
    std::cerr << "Error in command line: " << result.message() << std::endl;
    exit(1);
  }

  // Show help if requested
  if (show_help) {
    std::cout << cli << std::endl;
    return 0;
  }

  if (min_keys > max_keys) {
    std::cerr << "--min-keys must not exceed --max-keys" << std::endl;
    exit(1);
  }

  std::uniform_int_distribution<size_t> num_key_dist(min_keys, max_keys);
  for (size_t iter = 0; iter < target_iterations; ++iter) {
    std::mt19937 rng(iter + seed);
    // Narrow key space so probes hit both present and absent keys
    const int key_space = static_cast<int>(max_keys) * 4;
    std::uniform_int_distribution<int> key_dist(-key_space, key_space);
    std::uniform_int_distribution<int> val_dist(
        std::numeric_limits<int>::min(), std::numeric_limits<int>::max());

    size_t num_keys = num_key_dist(rng);
    std::cout << "Iteration " << iter << " using " << num_keys << " keys, seed "
              << iter + seed << std::endl;

    reference_map ordered_map;
    table_type table;
    std::unordered_set<int> seen;

    auto insert = [&]() -> void {
      int key = key_dist(rng);
      int val = val_dist(rng);
      ordered_map.insert_or_assign(key, val);
      table.insert_or_assign(key, val);
      seen.insert(key);
    };

    auto remove = [&]() -> void {
      auto key = *seen.begin();
      seen.erase(key);
      ordered_map.erase(key);
      table.remove(key);
    };

    auto validate = [&]() -> void {
      if (table.size() != ordered_map.size()) {
        std::cout << "Size mismatch: " << table.size()
                  << " != " << ordered_map.size() << std::endl;
        exit(1);
      }

      auto it = ordered_map.begin();
      auto table_it = table.begin();
      while (it != ordered_map.end() && table_it != table.end()) {
        if (it->first != table_it->first || it->second != table_it->second) {
          std::cout << "Mismatch at key " << it->first
                    << " != " << table_it->first << std::endl;
          exit(1);
        }
        ++it;
        ++table_it;
      }

      // Descending order must be the exact reverse
      auto rit = ordered_map.rbegin();
      for (auto table_rit = table.rbegin(); table_rit != table.rend();
           ++table_rit, ++rit) {
        if (rit->first != table_rit->first) {
          fail("descending iteration", rit->first);
        }
      }

      if (table.find_min() != as_optional(ordered_map.begin(), ordered_map)) {
        fail("find_min", 0);
      }
      if (table.find_max() !=
          (ordered_map.empty()
               ? std::nullopt
               : as_optional(std::prev(ordered_map.end()), ordered_map))) {
        fail("find_max", 0);
      }

      // Probe ordered queries at random keys
      for (int probe = 0; probe < 64; ++probe) {
        const int key = key_dist(rng);
        if (table.find_ge(key) !=
            as_optional(ordered_map.lower_bound(key), ordered_map)) {
          fail("find_ge", key);
        }
        if (table.find_gt(key) !=
            as_optional(ordered_map.upper_bound(key), ordered_map)) {
          fail("find_gt", key);
        }
        auto lb = ordered_map.lower_bound(key);
        if (table.find_lt(key) !=
            (lb == ordered_map.begin()
                 ? std::nullopt
                 : as_optional(std::prev(lb), ordered_map))) {
          fail("find_lt", key);
        }
        if (table.contains(key) != ordered_map.contains(key)) {
          fail("contains", key);
        }

        const int stop = key_dist(rng);
        const auto range = table.find_range(key, stop);
        size_t expected = 0;
        if (key < stop) {
          auto first = ordered_map.lower_bound(key);
          auto last = ordered_map.lower_bound(stop);
          expected = static_cast<size_t>(std::distance(first, last));
          auto range_it = range.begin();
          for (; first != last && range_it != range.end();
               ++first, ++range_it) {
            if (first->first != range_it->first) {
              fail("find_range", key);
            }
          }
        }
        if (range.size() != expected) {
          fail("find_range size", key);
        }
      }
    };

    // Build up the initial table/map
    while (ordered_map.size() < num_keys) {
      insert();
    }
    validate();

    // Run erase/insert batches
    for (size_t batch = 0; batch < batches; ++batch) {
      for (size_t i = 0; i < batch_size && !seen.empty(); ++i) {
        remove();
      }
      for (size_t i = 0; i < batch_size; ++i) {
        insert();
      }
      validate();
    }

    // Empty out the table/map
    while (!seen.empty()) {
      remove();
    }
    validate();
  }
  return 0;
}
