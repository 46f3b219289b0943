// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef TYPEMAP_ALIASES_HPP
#define TYPEMAP_ALIASES_HPP

#include <typemap/bundle.hpp>
#include <typemap/type_map.hpp>

// Convenience aliases for the common bundles

namespace typemap {

  /// Accepts any storable value.
  using type_map = basic_type_map<bundles::plain>;

  /**
   * @brief Containers that may be handed to another thread, read from
   * several threads at once, or both.
   */
  using send_type_map      = basic_type_map<bundles::send>;
  using sync_type_map      = basic_type_map<bundles::sync>;
  using send_sync_type_map = basic_type_map<bundles::send_sync>;

  /**
   * @brief Copyable containers; a copy clones every stored value.
   */
  using clone_type_map           = basic_type_map<bundles::clone>;
  using clone_send_sync_type_map = basic_type_map<bundles::clone_send_sync>;

  /**
   * @brief Containers that render through fmt (see typemap/format.hpp).
   */
  using print_type_map           = basic_type_map<bundles::print>;
  using print_send_sync_type_map = basic_type_map<bundles::print_send_sync>;

} // namespace typemap

#endif // TYPEMAP_ALIASES_HPP
