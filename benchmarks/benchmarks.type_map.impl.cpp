// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include <utility>

#include "benchmarks.type_map.hpp"

namespace bench {

  namespace {
    template <std::size_t... Is>
    auto populate(typemap::type_map& map, std::index_sequence<Is...>) -> void
    {
      (map.insert<bench_key<Is>>(static_cast<int>(Is)), ...);
    }
  } // namespace

  auto get_opaque_map() -> typemap::type_map
  {
    auto map = typemap::type_map{};
    map.reserve(key_count);
    populate(map, std::make_index_sequence<key_count>{});
    return map;
  }

} // namespace bench
