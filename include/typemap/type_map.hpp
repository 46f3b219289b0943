// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef TYPEMAP_TYPE_MAP_HPP
#define TYPEMAP_TYPE_MAP_HPP

#include <concepts>
#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include <typemap/bundle.hpp>
#include <typemap/concepts.hpp>
#include <typemap/entry.hpp>
#include <typemap/erased_box.hpp>
#include <typemap/traits.hpp>
#include <typemap/type_id.hpp>

namespace typemap {

  /**
   * @brief Result of an insertion that may find the slot already filled.
   * * Uses a raw pointer to avoid exposing storage iterators.
   */
  template <typename V> struct insert_result {
    V*   ptr;      ///< Pointer to the inserted or existing value.
    bool inserted; ///< True if a new value was inserted.
  };

  // =============================================================================
  // basic_type_map
  // =============================================================================

  /**
   * @brief A map keyed by types, holding at most one value per key type.
   * *
   * * Each key type K declares its value type value_t<K> once (see
   * * traits::key_traits); every operation names only K. Values are boxed
   * * behind Bundle, and inserting a value that lacks one of Bundle's
   * * capabilities does not compile.
   * *
   * * Lookups never check types at runtime: a slot under K can only have
   * * been filled with a value_t<K>, so reads downcast without checking.
   */
  template <concepts::capability_bundle Bundle> class basic_type_map {
  public:
    using bundle_type  = Bundle;
    using box_type     = erased_box<Bundle>;
    using storage_type = box_storage<Bundle>;
    using size_type    = std::size_t;

    template <concepts::key K> using entry_type = typemap::entry<K, Bundle>;

    // --- Construction ---

    [[nodiscard]] basic_type_map() = default;

    [[nodiscard]] basic_type_map(const basic_type_map&)
      requires Bundle::cloneable
    = default;

    [[nodiscard]] basic_type_map(basic_type_map&&) noexcept = default;

    auto operator=(const basic_type_map&) -> basic_type_map&
      requires Bundle::cloneable
    = default;

    auto operator=(basic_type_map&&) noexcept -> basic_type_map& = default;

    ~basic_type_map() = default;

    // --- Insertion ---

    /**
     * @brief Stores value under K.
     * * The new box is built and the previous value moved out before the
     * * slot changes, so a throwing allocation or move constructor leaves
     * * the container as it was.
     * * @return The value previously stored under K, if any.
     */
    template <concepts::key K>
      requires concepts::admits<value_t<K>, Bundle>
    auto insert(value_t<K> value) -> std::optional<value_t<K>>
    {
      using V  = value_t<K>;
      auto box = embed<Bundle>(std::move(value));

      if (auto it = storage_.find(type_id_of<K>()); it != storage_.end()) {
        auto previous = std::optional<V>{
          std::in_place, std::move(it->second.template unchecked_get<V>())};
        it->second = std::move(box);
        return previous;
      }

      storage_.emplace(type_id_of<K>(), std::move(box));
      return std::nullopt;
    }

    /// Constructs the value under K in place, replacing any previous one.
    template <concepts::key K, typename... Args>
      requires concepts::admits<value_t<K>, Bundle>
      && std::constructible_from<value_t<K>, Args...>
    auto emplace(Args&&... args) -> value_t<K>&
    {
      auto box = make_box<Bundle, value_t<K>>(std::forward<Args>(args)...);
      auto it =
        storage_.insert_or_assign(type_id_of<K>(), std::move(box)).first;
      return it->second.template unchecked_get<value_t<K>>();
    }

    /// Constructs the value under K in place only if K is absent.
    template <concepts::key K, typename... Args>
      requires concepts::admits<value_t<K>, Bundle>
      && std::constructible_from<value_t<K>, Args...>
    auto try_emplace(Args&&... args) -> insert_result<value_t<K>>
    {
      auto it = storage_.find(type_id_of<K>());
      auto inserted = it == storage_.end();

      if (inserted) {
        it = storage_
               .emplace(type_id_of<K>(),
                 make_box<Bundle, value_t<K>>(std::forward<Args>(args)...))
               .first;
      }

      return {std::addressof(it->second.template unchecked_get<value_t<K>>()),
        inserted};
    }

    // --- Lookup ---

    template <concepts::key K>
      requires concepts::admits<value_t<K>, Bundle>
    [[nodiscard]] auto get() const -> const value_t<K>*
    {
      auto it = storage_.find(type_id_of<K>());
      return (it != storage_.end())
        ? std::addressof(it->second.template unchecked_get<value_t<K>>())
        : nullptr;
    }

    template <concepts::key K>
      requires concepts::admits<value_t<K>, Bundle>
    [[nodiscard]] auto get() -> value_t<K>*
    {
      auto it = storage_.find(type_id_of<K>());
      return (it != storage_.end())
        ? std::addressof(it->second.template unchecked_get<value_t<K>>())
        : nullptr;
    }

    template <concepts::key K>
      requires concepts::admits<value_t<K>, Bundle>
    [[nodiscard]] auto at() const -> const value_t<K>&
    {
      if (auto const* ptr = get<K>()) {
        return *ptr;
      }
      throw std::out_of_range("type_map::at - key not present");
    }

    template <concepts::key K>
      requires concepts::admits<value_t<K>, Bundle>
    [[nodiscard]] auto at() -> value_t<K>&
    {
      if (auto* ptr = get<K>()) {
        return *ptr;
      }
      throw std::out_of_range("type_map::at - key not present");
    }

    template <concepts::key K> [[nodiscard]] auto contains() const -> bool
    {
      return storage_.contains(type_id_of<K>());
    }

    // --- Removal ---

    /// Moves the value out before erasing; a throwing move keeps the slot.
    template <concepts::key K>
      requires concepts::admits<value_t<K>, Bundle>
    auto remove() -> std::optional<value_t<K>>
    {
      using V = value_t<K>;
      auto it = storage_.find(type_id_of<K>());
      if (it == storage_.end()) {
        return std::nullopt;
      }

      auto removed = std::optional<V>{
        std::in_place, std::move(it->second.template unchecked_get<V>())};
      storage_.erase(it);
      return removed;
    }

    auto clear() noexcept -> void { storage_.clear(); }

    // --- In-place Manipulation ---

    template <concepts::key K>
      requires concepts::admits<value_t<K>, Bundle>
    [[nodiscard]] auto entry() -> entry_type<K>
    {
      using occupied_type = typename entry_type<K>::occupied_type;
      using vacant_type   = typename entry_type<K>::vacant_type;

      if (auto it = storage_.find(type_id_of<K>()); it != storage_.end()) {
        return entry_type<K>{occupied_type{storage_, it}};
      }
      return entry_type<K>{vacant_type{storage_}};
    }

    // --- Capacity ---

    [[nodiscard]] auto size() const noexcept -> size_type
    {
      return storage_.size();
    }

    [[nodiscard]] auto empty() const noexcept -> bool
    {
      return storage_.empty();
    }

    auto reserve(size_type n) -> void { storage_.reserve(n); }

    auto swap(basic_type_map& other) noexcept -> void
    {
      storage_.swap(other.storage_);
    }

    friend auto swap(basic_type_map& lhs, basic_type_map& rhs) noexcept
      -> void
    {
      lhs.swap(rhs);
    }

    // --- Raw Storage ---
    //
    // Callers may read, iterate, erase, clear, reserve and move boxes out.
    // A slot may only be written with a box whose type() is value_t<K> for
    // the key K whose type_id the slot carries; anything else breaks every
    // later read of that key.

    [[nodiscard]] auto unsafe_raw() const noexcept -> const storage_type&
    {
      return storage_;
    }

    [[nodiscard]] auto unsafe_raw_mut() noexcept -> storage_type&
    {
      return storage_;
    }

  private:
    storage_type storage_;
  };

} // namespace typemap

namespace typemap::traits {

  template <concepts::capability_bundle Bundle>
  struct is_thread_transferable<basic_type_map<Bundle>>
      : std::bool_constant<Bundle::thread_transferable> {};

  template <concepts::capability_bundle Bundle>
  struct is_thread_shareable<basic_type_map<Bundle>>
      : std::bool_constant<Bundle::thread_shareable> {};

} // namespace typemap::traits

#endif // TYPEMAP_TYPE_MAP_HPP
