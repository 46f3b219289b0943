// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include <any>
#include <utility>

#include <benchmark/benchmark.h>
#include <boost/type_index.hpp>
#include <boost/unordered/unordered_flat_map.hpp>

#include "benchmarks.type_map.hpp"

namespace {

  using any_map =
    boost::unordered_flat_map<boost::typeindex::type_index, std::any>;

  template <std::size_t... Is>
  auto populate_any(any_map& map, std::index_sequence<Is...>) -> void
  {
    (map.emplace(
       boost::typeindex::type_id<bench::bench_key<Is>>(), static_cast<int>(Is)),
      ...);
  }

  // Sum over a spread of keys so every lookup lands on a different slot.
  template <std::size_t... Is>
  auto sum_any(const any_map& map, std::index_sequence<Is...>) -> int
  {
    auto lookup = [&map]<std::size_t I>() {
      auto it = map.find(boost::typeindex::type_id<bench::bench_key<I * 8>>());
      return it != map.end() ? *std::any_cast<int>(&it->second) : 0;
    };
    return (lookup.template operator()<Is>() + ...);
  }

  template <std::size_t... Is>
  auto sum_typed(const typemap::type_map& map, std::index_sequence<Is...>)
    -> int
  {
    auto lookup = [&map]<std::size_t I>() {
      auto const* ptr = map.get<bench::bench_key<I * 8>>();
      return ptr ? *ptr : 0;
    };
    return (lookup.template operator()<Is>() + ...);
  }

  constexpr auto lookups = std::make_index_sequence<bench::key_count / 8>{};

} // namespace

/**
 * @brief Baseline: a flat map from type index to std::any.
 * Every read pays for the any_cast type check.
 */
static void BM_AnyMap_Lookup(benchmark::State& state)
{
  auto map = any_map{};
  populate_any(map, std::make_index_sequence<bench::key_count>{});

  for (auto _ : state) {
    auto sum = sum_any(map, lookups);
    benchmark::DoNotOptimize(sum);
    benchmark::ClobberMemory();
  }
}

/**
 * @brief Typed lookups; the downcast is unchecked in release builds.
 */
static void BM_TypeMap_Lookup(benchmark::State& state)
{
  const auto map = bench::get_opaque_map();

  for (auto _ : state) {
    auto sum = sum_typed(map, lookups);
    benchmark::DoNotOptimize(sum);
    benchmark::ClobberMemory();
  }
}

static void BM_TypeMap_InsertRemove(benchmark::State& state)
{
  auto map = bench::get_opaque_map();

  for (auto _ : state) {
    auto previous = map.remove<bench::bench_key<0>>();
    benchmark::DoNotOptimize(previous);
    map.insert<bench::bench_key<0>>(previous.value_or(0) + 1);
    benchmark::ClobberMemory();
  }
}

static void BM_TypeMap_Entry(benchmark::State& state)
{
  auto map = bench::get_opaque_map();

  for (auto _ : state) {
    auto& counter = map.entry<bench::bench_key<1>>().or_insert(0);
    ++counter;
    benchmark::DoNotOptimize(counter);
  }
}

BENCHMARK(BM_AnyMap_Lookup)->Unit(benchmark::kNanosecond);
BENCHMARK(BM_TypeMap_Lookup)->Unit(benchmark::kNanosecond);
BENCHMARK(BM_TypeMap_InsertRemove)->Unit(benchmark::kNanosecond);
BENCHMARK(BM_TypeMap_Entry)->Unit(benchmark::kNanosecond);

BENCHMARK_MAIN();
