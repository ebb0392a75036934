// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <absl/container/btree_map.h>
#include <benchmark/benchmark.h>

#include <map>
#include <random>
#include <unordered_set>
#include <vector>

#include <ordered_tables/sorted_table_map.hpp>

using namespace kressler::ordered_tables;

// Generate unique random keys for benchmarking
std::vector<int> GenerateUniqueKeys(std::size_t size) {
  std::mt19937 rng(42);
  std::uniform_int_distribution<int> dist(1, 100000000);
  std::unordered_set<int> unique_keys;

  // Keep generating until we have enough unique keys
  while (unique_keys.size() < size) {
    unique_keys.insert(dist(rng));
  }

  return std::vector<int>(unique_keys.begin(), unique_keys.end());
}

template <typename Map>
Map Populate(const std::vector<int>& keys) {
  Map map;
  for (std::size_t i = 0; i < keys.size(); ++i) {
    map.insert_or_assign(keys[i], static_cast<int>(i));
  }
  return map;
}

template <typename Map>
static void BM_Find(benchmark::State& state) {
  const auto size = static_cast<std::size_t>(state.range(0));
  const auto keys = GenerateUniqueKeys(size);
  const auto map = Populate<Map>(keys);

  std::size_t idx = 0;
  for (auto _ : state) {
    auto it = map.find(keys[idx % size]);
    benchmark::DoNotOptimize(it);
    ++idx;
  }
  state.SetItemsProcessed(state.iterations());
}

// Remove + reinsert one key so the container size stays fixed
template <typename Map>
static void BM_EraseInsert(benchmark::State& state) {
  const auto size = static_cast<std::size_t>(state.range(0));
  const auto keys = GenerateUniqueKeys(size);
  auto map = Populate<Map>(keys);

  std::size_t idx = 0;
  for (auto _ : state) {
    const int key = keys[idx % size];
    map.erase(key);
    map.insert_or_assign(key, key);
    benchmark::DoNotOptimize(map);
    ++idx;
  }
  state.SetItemsProcessed(state.iterations());
}

// Scan 64 entries starting at a random key
template <typename Map>
static void BM_RangeScan(benchmark::State& state) {
  const auto size = static_cast<std::size_t>(state.range(0));
  const auto keys = GenerateUniqueKeys(size);
  const auto map = Populate<Map>(keys);

  std::size_t idx = 0;
  for (auto _ : state) {
    long sum = 0;
    int count = 0;
    for (auto it = map.lower_bound(keys[idx % size]);
         it != map.end() && count < 64; ++it, ++count) {
      sum += it->second;
    }
    benchmark::DoNotOptimize(sum);
    ++idx;
  }
  state.SetItemsProcessed(state.iterations());
}

static void BM_SortedTable_FindRange(benchmark::State& state) {
  const auto size = static_cast<std::size_t>(state.range(0));
  const auto keys = GenerateUniqueKeys(size);
  const auto table = Populate<sorted_table_map<int, int>>(keys);

  std::size_t idx = 0;
  for (auto _ : state) {
    const int start = keys[idx % size];
    long sum = 0;
    for (const auto& entry : table.find_range(start, start + 1000000)) {
      sum += entry.second;
    }
    benchmark::DoNotOptimize(sum);
    ++idx;
  }
  state.SetItemsProcessed(state.iterations());
}

using SortedTable = sorted_table_map<int, int>;
using StdMap = std::map<int, int>;
using AbslBtree = absl::btree_map<int, int>;

BENCHMARK(BM_Find<SortedTable>)->RangeMultiplier(8)->Range(64, 1 << 18);
BENCHMARK(BM_Find<StdMap>)->RangeMultiplier(8)->Range(64, 1 << 18);
BENCHMARK(BM_Find<AbslBtree>)->RangeMultiplier(8)->Range(64, 1 << 18);

BENCHMARK(BM_EraseInsert<SortedTable>)->RangeMultiplier(8)->Range(64, 1 << 18);
BENCHMARK(BM_EraseInsert<StdMap>)->RangeMultiplier(8)->Range(64, 1 << 18);
BENCHMARK(BM_EraseInsert<AbslBtree>)->RangeMultiplier(8)->Range(64, 1 << 18);

BENCHMARK(BM_RangeScan<SortedTable>)->RangeMultiplier(8)->Range(64, 1 << 18);
BENCHMARK(BM_RangeScan<StdMap>)->RangeMultiplier(8)->Range(64, 1 << 18);
BENCHMARK(BM_RangeScan<AbslBtree>)->RangeMultiplier(8)->Range(64, 1 << 18);

BENCHMARK(BM_SortedTable_FindRange)->RangeMultiplier(8)->Range(64, 1 << 18);

BENCHMARK_MAIN();
