// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef TYPEMAP_TRAITS_HPP
#define TYPEMAP_TRAITS_HPP

#include <array>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace typemap::traits {

  // --- Key to Value Association ---
  //
  // A key type names its value type once, either with a member alias
  //
  //   struct session_id { using typemap_value = std::uint64_t; };
  //
  // or by specializing key_traits for a key it cannot modify. A nested
  // value_type is not a declaration: std::string and friends are not keys.
  template <typename K> struct key_traits {};

  template <typename K>
    requires requires { typename K::typemap_value; }
  struct key_traits<K> {
    using value_type = typename K::typemap_value;
  };

  // --- Thread Capabilities ---
  //
  // C++ has no language-level notion of a type being safe to move to, or
  // share between, threads. These traits carry that information. The
  // defaults treat raw pointers and standard views (reference_wrapper,
  // span, string_view) as neither, propagate through standard wrappers
  // and aggregates, and honor two opt-out tags:
  //
  //   using thread_affine  = void; // must stay on the creating thread
  //   using unsynchronized = void; // must not be read from several threads
  //
  // Users specialize the traits for anything the defaults get wrong.

  template <typename T>
  struct is_thread_transferable
      : std::bool_constant<
          !std::is_pointer_v<T> && !requires { typename T::thread_affine; }> {
  };

  template <typename T>
  struct is_thread_shareable
      : std::bool_constant<
          !std::is_pointer_v<T> && !requires { typename T::unsynchronized; }> {
  };

  // --- Owning Wrappers: propagate from the element ---

  template <typename T, typename D>
  struct is_thread_transferable<std::unique_ptr<T, D>>
      : std::bool_constant<is_thread_transferable<T>::value
                           && is_thread_transferable<D>::value> {};

  template <typename T, typename D>
  struct is_thread_shareable<std::unique_ptr<T, D>>
      : std::bool_constant<is_thread_shareable<T>::value
                           && is_thread_shareable<D>::value> {};

  template <typename T>
  struct is_thread_transferable<std::optional<T>>
      : is_thread_transferable<T> {};

  template <typename T>
  struct is_thread_shareable<std::optional<T>> : is_thread_shareable<T> {};

  template <typename T, typename A>
  struct is_thread_transferable<std::vector<T, A>>
      : is_thread_transferable<T> {};

  template <typename T, typename A>
  struct is_thread_shareable<std::vector<T, A>> : is_thread_shareable<T> {};

  // --- Aggregates: every member must qualify ---

  template <typename T1, typename T2>
  struct is_thread_transferable<std::pair<T1, T2>>
      : std::bool_constant<is_thread_transferable<T1>::value
                           && is_thread_transferable<T2>::value> {};

  template <typename T1, typename T2>
  struct is_thread_shareable<std::pair<T1, T2>>
      : std::bool_constant<is_thread_shareable<T1>::value
                           && is_thread_shareable<T2>::value> {};

  template <typename... Ts>
  struct is_thread_transferable<std::tuple<Ts...>>
      : std::bool_constant<(is_thread_transferable<Ts>::value && ...)> {};

  template <typename... Ts>
  struct is_thread_shareable<std::tuple<Ts...>>
      : std::bool_constant<(is_thread_shareable<Ts>::value && ...)> {};

  template <typename... Ts>
  struct is_thread_transferable<std::variant<Ts...>>
      : std::bool_constant<(is_thread_transferable<Ts>::value && ...)> {};

  template <typename... Ts>
  struct is_thread_shareable<std::variant<Ts...>>
      : std::bool_constant<(is_thread_shareable<Ts>::value && ...)> {};

  template <typename T, std::size_t N>
  struct is_thread_transferable<std::array<T, N>>
      : is_thread_transferable<T> {};

  template <typename T, std::size_t N>
  struct is_thread_shareable<std::array<T, N>> : is_thread_shareable<T> {};

  // --- Non-owning Views: treated like raw pointers ---

  template <typename T>
  struct is_thread_transferable<std::reference_wrapper<T>> : std::false_type {
  };

  template <typename T>
  struct is_thread_shareable<std::reference_wrapper<T>> : std::false_type {};

  template <typename T, std::size_t Extent>
  struct is_thread_transferable<std::span<T, Extent>> : std::false_type {};

  template <typename T, std::size_t Extent>
  struct is_thread_shareable<std::span<T, Extent>> : std::false_type {};

  template <typename CharT, typename Traits>
  struct is_thread_transferable<std::basic_string_view<CharT, Traits>>
      : std::false_type {};

  template <typename CharT, typename Traits>
  struct is_thread_shareable<std::basic_string_view<CharT, Traits>>
      : std::false_type {};

  // --- Shared Ownership ---
  //
  // Moving a shared_ptr to another thread shares the pointee with it, so
  // both capabilities require the pointee to be transferable and shareable.

  template <typename T>
  struct is_thread_transferable<std::shared_ptr<T>>
      : std::bool_constant<is_thread_transferable<T>::value
                           && is_thread_shareable<T>::value> {};

  template <typename T>
  struct is_thread_shareable<std::shared_ptr<T>>
      : std::bool_constant<is_thread_transferable<T>::value
                           && is_thread_shareable<T>::value> {};

} // namespace typemap::traits

#endif // TYPEMAP_TRAITS_HPP
