// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef TYPEMAP_CONCEPTS_HPP
#define TYPEMAP_CONCEPTS_HPP

#include <concepts>
#include <type_traits>

#include <fmt/format.h>

#include <typemap/traits.hpp>

namespace typemap::concepts {

  /**
   * @brief A type that can live in an erased box.
   * * Boxes heap-allocate a single object and hand it back by move, so
   * arrays, cv-qualified and immovable types are excluded.
   */
  template <typename V>
  concept storable = std::is_object_v<V> && !std::is_array_v<V>
    && std::same_as<V, std::remove_cv_t<V>> && std::move_constructible<V>
    && std::destructible<V>;

  /**
   * @brief A tag type with a declared, storable value type.
   */
  template <typename K>
  concept key = std::same_as<K, std::remove_cvref_t<K>>
    && requires { typename traits::key_traits<K>::value_type; }
    && storable<typename traits::key_traits<K>::value_type>;

  template <typename T>
  concept thread_transferable = traits::is_thread_transferable<T>::value;

  template <typename T>
  concept thread_shareable = traits::is_thread_shareable<T>::value;

  template <typename T>
  concept cloneable = std::copy_constructible<T>;

  template <typename T>
  concept printable = fmt::is_formattable<T>::value;

} // namespace typemap::concepts

namespace typemap {

  /// The value type associated with key type K.
  template <concepts::key K>
  using value_t = typename traits::key_traits<K>::value_type;

} // namespace typemap

#endif // TYPEMAP_CONCEPTS_HPP
