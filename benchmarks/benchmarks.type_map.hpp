// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef TYPEMAP_BENCHMARKS_TYPE_MAP_HPP
#define TYPEMAP_BENCHMARKS_TYPE_MAP_HPP

#include <cstddef>

#include <typemap/aliases.hpp>

namespace bench {

  template <std::size_t I> struct bench_key {
    using typemap_value = int;
  };

  /// Number of distinct key types populated by the factories.
  inline constexpr std::size_t key_count = 64;

  /**
   * @brief Factory that fills a container with key_count entries.
   * * The implementation is hidden in a separate .cpp file so lookups
   * cannot be folded against the insertions.
   */
  [[nodiscard]] auto get_opaque_map() -> typemap::type_map;

} // namespace bench

#endif // TYPEMAP_BENCHMARKS_TYPE_MAP_HPP
