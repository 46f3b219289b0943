// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef TYPEMAP_ENTRY_HPP
#define TYPEMAP_ENTRY_HPP

#include <cassert>
#include <concepts>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>
#include <variant>

#include <typemap/bundle.hpp>
#include <typemap/concepts.hpp>
#include <typemap/erased_box.hpp>
#include <typemap/type_id.hpp>

namespace typemap {

  template <concepts::capability_bundle Bundle> class basic_type_map;

  // =============================================================================
  // Entry Views
  // =============================================================================
  //
  // Entries are short-lived, non-owning views into one slot of a container.
  // The container must not be modified through any other path while an
  // entry is alive. Consuming operations are rvalue-qualified.

  template <concepts::key K, concepts::capability_bundle Bundle>
    requires concepts::admits<value_t<K>, Bundle>
  class [[nodiscard]] occupied_entry {
  public:
    using key_type    = K;
    using value_type  = value_t<K>;
    using bundle_type = Bundle;

    [[nodiscard]] auto get() const -> const value_type&
    {
      return it_->second.template unchecked_get<value_type>();
    }

    [[nodiscard]] auto get() -> value_type&
    {
      return it_->second.template unchecked_get<value_type>();
    }

    /// Returns a reference that lives as long as the value stays in the map.
    [[nodiscard]] auto into_mut() && -> value_type&
    {
      return it_->second.template unchecked_get<value_type>();
    }

    /// Replaces the value and returns the previous one.
    auto insert(value_type value) -> value_type
    {
      auto box      = embed<Bundle>(std::move(value));
      auto previous = value_type(std::move(get()));
      it_->second   = std::move(box);
      return previous;
    }

    /// Moves the value out of the map, erasing the slot.
    auto remove() && -> value_type
    {
      auto removed = value_type(std::move(get()));
      storage_->erase(it_);
      return removed;
    }

  private:
    using storage_type = box_storage<Bundle>;
    using iterator     = typename storage_type::iterator;

    friend class basic_type_map<Bundle>;

    occupied_entry(storage_type& storage, iterator it) noexcept
        : storage_{std::addressof(storage)}
        , it_{it}
    {}

    storage_type* storage_;
    iterator      it_;
  };

  template <concepts::key K, concepts::capability_bundle Bundle>
    requires concepts::admits<value_t<K>, Bundle>
  class [[nodiscard]] vacant_entry {
  public:
    using key_type    = K;
    using value_type  = value_t<K>;
    using bundle_type = Bundle;

    /// Installs the value and returns a reference tied to the map.
    auto insert(value_type value) && -> value_type&
    {
      return std::move(*this).emplace(std::move(value));
    }

    /// Constructs the value in place.
    template <typename... Args>
      requires std::constructible_from<value_type, Args...>
    auto emplace(Args&&... args) && -> value_type&
    {
      [[maybe_unused]] auto [it, inserted] = storage_->emplace(type_id_of<K>(),
        make_box<Bundle, value_type>(std::forward<Args>(args)...));
      assert(inserted && "vacant_entry used after its slot was filled");
      return it->second.template unchecked_get<value_type>();
    }

  private:
    using storage_type = box_storage<Bundle>;

    friend class basic_type_map<Bundle>;

    explicit vacant_entry(storage_type& storage) noexcept
        : storage_{std::addressof(storage)}
    {}

    storage_type* storage_;
  };

  /**
   * @brief A view onto the slot of key K, either occupied or vacant.
   */
  template <concepts::key K, concepts::capability_bundle Bundle>
    requires concepts::admits<value_t<K>, Bundle>
  class [[nodiscard]] entry {
  public:
    using key_type      = K;
    using value_type    = value_t<K>;
    using bundle_type   = Bundle;
    using occupied_type = occupied_entry<K, Bundle>;
    using vacant_type   = vacant_entry<K, Bundle>;

    explicit entry(occupied_type occupied) noexcept
        : state_{std::in_place_type<occupied_type>, std::move(occupied)}
    {}

    explicit entry(vacant_type vacant) noexcept
        : state_{std::in_place_type<vacant_type>, std::move(vacant)}
    {}

    [[nodiscard]] auto is_occupied() const noexcept -> bool
    {
      return std::holds_alternative<occupied_type>(state_);
    }

    [[nodiscard]] auto is_vacant() const noexcept -> bool
    {
      return std::holds_alternative<vacant_type>(state_);
    }

    /// Throws std::bad_variant_access when the slot is vacant.
    [[nodiscard]] auto occupied() && -> occupied_type
    {
      return std::get<occupied_type>(std::move(state_));
    }

    /// Throws std::bad_variant_access when the slot is occupied.
    [[nodiscard]] auto vacant() && -> vacant_type
    {
      return std::get<vacant_type>(std::move(state_));
    }

    /// Invokes f with the occupied_type or vacant_type view.
    template <typename F> decltype(auto) visit(F&& f) &&
    {
      return std::visit(std::forward<F>(f), std::move(state_));
    }

    auto or_insert(value_type value) && -> value_type&
    {
      if (auto* occupied = std::get_if<occupied_type>(&state_)) {
        return std::move(*occupied).into_mut();
      }
      return std::get<vacant_type>(std::move(state_)).insert(std::move(value));
    }

    /// The producer runs only when the slot is vacant.
    template <std::invocable F>
      requires std::convertible_to<std::invoke_result_t<F>, value_type>
    auto or_insert_with(F&& producer) && -> value_type&
    {
      if (auto* occupied = std::get_if<occupied_type>(&state_)) {
        return std::move(*occupied).into_mut();
      }
      return std::get<vacant_type>(std::move(state_))
        .emplace(std::invoke(std::forward<F>(producer)));
    }

  private:
    std::variant<occupied_type, vacant_type> state_;
  };

} // namespace typemap

#endif // TYPEMAP_ENTRY_HPP
