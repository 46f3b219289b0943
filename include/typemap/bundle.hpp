// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef TYPEMAP_BUNDLE_HPP
#define TYPEMAP_BUNDLE_HPP

#include <concepts>
#include <type_traits>

#include <typemap/concepts.hpp>

namespace typemap {

  // =============================================================================
  // Capabilities
  // =============================================================================

  enum class capability : unsigned {
    none  = 0,
    send  = 1u << 0, ///< Value may be moved to another thread.
    sync  = 1u << 1, ///< Value may be read from several threads at once.
    clone = 1u << 2, ///< Value may be duplicated.
    print = 1u << 3, ///< Value has a human-readable rendering.
  };

  [[nodiscard]] constexpr auto operator|(capability lhs, capability rhs) noexcept
    -> capability
  {
    return static_cast<capability>(
      static_cast<unsigned>(lhs) | static_cast<unsigned>(rhs));
  }

  [[nodiscard]] constexpr auto includes(capability set, capability c) noexcept
    -> bool
  {
    return (static_cast<unsigned>(set) & static_cast<unsigned>(c))
      == static_cast<unsigned>(c);
  }

  /**
   * @brief The set of capabilities every value in a container must have.
   * * Bundles are pure compile-time tags; they are never instantiated.
   */
  template <capability Caps> struct bundle {
    static constexpr capability capabilities = Caps;

    static constexpr bool thread_transferable = includes(Caps, capability::send);
    static constexpr bool thread_shareable    = includes(Caps, capability::sync);
    static constexpr bool cloneable           = includes(Caps, capability::clone);
    static constexpr bool printable           = includes(Caps, capability::print);
  };

  namespace bundles {
    using plain     = bundle<capability::none>;
    using send      = bundle<capability::send>;
    using sync      = bundle<capability::sync>;
    using send_sync = bundle<capability::send | capability::sync>;
    using clone     = bundle<capability::clone>;
    using clone_send_sync =
      bundle<capability::clone | capability::send | capability::sync>;
    using print = bundle<capability::print>;
    using print_send_sync =
      bundle<capability::print | capability::send | capability::sync>;
  } // namespace bundles

  // =============================================================================
  // Admission
  // =============================================================================

  namespace concepts {

    template <typename B>
    concept capability_bundle = requires {
      { B::capabilities } -> std::convertible_to<capability>;
      { B::thread_transferable } -> std::convertible_to<bool>;
      { B::thread_shareable } -> std::convertible_to<bool>;
      { B::cloneable } -> std::convertible_to<bool>;
      { B::printable } -> std::convertible_to<bool>;
    };

    /**
     * @brief V may be boxed into a container whose bundle is B.
     * * Checked at every insertion point; a value that fails it is a
     * compile error, never a runtime one.
     */
    template <typename V, typename B>
    concept admits = capability_bundle<B> && storable<V>
      && (!B::thread_transferable || thread_transferable<V>)
      && (!B::thread_shareable || thread_shareable<V>)
      && (!B::cloneable || cloneable<V>) && (!B::printable || printable<V>);

  } // namespace concepts

} // namespace typemap

#endif // TYPEMAP_BUNDLE_HPP
