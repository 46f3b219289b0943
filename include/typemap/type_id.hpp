// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef TYPEMAP_TYPE_ID_HPP
#define TYPEMAP_TYPE_ID_HPP

#include <cstddef>

#include <boost/type_index.hpp>

namespace typemap {

  /**
   * @brief Opaque, process-wide identifier of a type.
   * * Equal iff produced from the same type. Usable as a hash map key
   * through type_id_hash.
   */
  using type_id = boost::typeindex::type_index;

  template <typename T> [[nodiscard]] inline auto type_id_of() noexcept -> type_id
  {
    return boost::typeindex::type_id<T>();
  }

  struct type_id_hash {
    [[nodiscard]] auto operator()(const type_id& id) const noexcept
      -> std::size_t
    {
      return id.hash_code();
    }
  };

} // namespace typemap

#endif // TYPEMAP_TYPE_ID_HPP
