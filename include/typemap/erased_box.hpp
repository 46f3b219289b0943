// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef TYPEMAP_ERASED_BOX_HPP
#define TYPEMAP_ERASED_BOX_HPP

#include <concepts>
#include <iterator>
#include <memory>
#include <utility>

#include <boost/unordered/unordered_flat_map.hpp>
#include <fmt/format.h>

#include <typemap/bundle.hpp>
#include <typemap/config.hpp>
#include <typemap/type_id.hpp>

namespace typemap {

  namespace detail {
    /**
     * @brief Logs a failed coherence check and terminates.
     * * Only reachable when TYPEMAP_CHECK_COHERENCE is on and a box was
     * placed under the wrong key through the raw storage accessors.
     */
    [[noreturn]] void report_coherence_violation(
      const type_id& stored, const type_id& requested) noexcept;
  } // namespace detail

  // =============================================================================
  // erased_box
  // =============================================================================

  /**
   * @brief An owning heap cell whose concrete type is hidden behind Bundle.
   * *
   * * The box is move-only unless Bundle is cloneable, in which case copying
   * * it clones the hidden value. Reading the value back requires the caller
   * * to name its type; the unchecked accessors trust that name.
   */
  template <concepts::capability_bundle Bundle> class [[nodiscard]] erased_box {
  public:
    using bundle_type = Bundle;

    erased_box() noexcept = default;

    /**
     * @brief Constructs a V in place inside a new box.
     * * Propagates std::bad_alloc and any exception thrown by V's
     * constructor; nothing is leaked in either case.
     */
    template <typename V, typename... Args>
      requires concepts::admits<V, Bundle> && std::constructible_from<V, Args...>
    [[nodiscard]] static auto make(Args&&... args) -> erased_box
    {
      return erased_box{
        new V(std::forward<Args>(args)...), &vtable_storage<V>};
    }

    erased_box(erased_box&& other) noexcept
        : ptr_{std::exchange(other.ptr_, nullptr)}
        , vtable_ptr_{std::exchange(other.vtable_ptr_, nullptr)}
    {}

    erased_box(const erased_box& other)
      requires Bundle::cloneable
        : ptr_{other.ptr_ ? other.vtable_ptr_->clone(other.ptr_) : nullptr}
        , vtable_ptr_{other.vtable_ptr_}
    {}

    auto operator=(erased_box&& other) noexcept -> erased_box&
    {
      if (this != std::addressof(other)) {
        reset();
        ptr_        = std::exchange(other.ptr_, nullptr);
        vtable_ptr_ = std::exchange(other.vtable_ptr_, nullptr);
      }
      return *this;
    }

    auto operator=(const erased_box& other) -> erased_box&
      requires Bundle::cloneable
    {
      if (this != std::addressof(other)) {
        auto copy = erased_box{other};
        swap(copy);
      }
      return *this;
    }

    ~erased_box() { reset(); }

    [[nodiscard]] auto has_value() const noexcept -> bool
    {
      return ptr_ != nullptr;
    }

    /// Identifier of the hidden type; type_id_of<void>() when empty.
    [[nodiscard]] auto type() const noexcept -> type_id
    {
      return vtable_ptr_ ? vtable_ptr_->type() : type_id_of<void>();
    }

    /// Checked query, never used on the container's read paths.
    template <typename V> [[nodiscard]] auto holds() const noexcept -> bool
    {
      return has_value() && type() == type_id_of<V>();
    }

    // --- Unchecked Downcasts ---
    //
    // Precondition: has_value() and the hidden type is exactly V.

    template <typename V> [[nodiscard]] auto unchecked_get() noexcept -> V&
    {
      verify<V>();
      return *static_cast<V*>(ptr_);
    }

    template <typename V>
    [[nodiscard]] auto unchecked_get() const noexcept -> const V&
    {
      verify<V>();
      return *static_cast<const V*>(ptr_);
    }

    /**
     * @brief Moves the hidden value out and leaves the box empty.
     *
     * If V's move constructor throws, the box still owns the value.
     */
    template <typename V> [[nodiscard]] auto unchecked_take() && -> V
    {
      verify<V>();
      auto value = V(std::move(*static_cast<V*>(ptr_)));
      reset();
      return value;
    }

    /// Appends the rendering of the hidden value to out.
    auto format_to(fmt::memory_buffer& out) const -> void
      requires Bundle::printable
    {
      if (!ptr_) {
        fmt::format_to(std::back_inserter(out), "<empty>");
        return;
      }
      vtable_ptr_->format(ptr_, out);
    }

    auto swap(erased_box& other) noexcept -> void
    {
      std::swap(ptr_, other.ptr_);
      std::swap(vtable_ptr_, other.vtable_ptr_);
    }

    friend auto swap(erased_box& lhs, erased_box& rhs) noexcept -> void
    {
      lhs.swap(rhs);
    }

  private:
    struct vtable {
      void (*destroy)(void*) noexcept;
      type_id (*type)() noexcept;
      void* (*clone)(const void*);
      void (*format)(const void*, fmt::memory_buffer&);
    };

    template <typename V>
    static constexpr auto clone_entry() noexcept -> void* (*)(const void*)
    {
      if constexpr (Bundle::cloneable) {
        return [](const void* ptr) -> void* {
          return new V(*static_cast<const V*>(ptr));
        };
      } else {
        return nullptr;
      }
    }

    template <typename V>
    static constexpr auto format_entry() noexcept
      -> void (*)(const void*, fmt::memory_buffer&)
    {
      if constexpr (Bundle::printable) {
        return [](const void* ptr, fmt::memory_buffer& out) {
          fmt::format_to(
            std::back_inserter(out), "{}", *static_cast<const V*>(ptr));
        };
      } else {
        return nullptr;
      }
    }

    template <typename V>
    static constexpr auto vtable_storage = vtable{
      .destroy = [](void* ptr) noexcept { delete static_cast<V*>(ptr); },
      .type    = []() noexcept { return type_id_of<V>(); },
      .clone   = clone_entry<V>(),
      .format  = format_entry<V>()};

    erased_box(void* ptr, const vtable* vtable_ptr) noexcept
        : ptr_{ptr}
        , vtable_ptr_{vtable_ptr}
    {}

    template <typename V> auto verify() const noexcept -> void
    {
#if TYPEMAP_CHECK_COHERENCE
      if (!ptr_ || vtable_ptr_->type() != type_id_of<V>()) [[unlikely]] {
        detail::report_coherence_violation(type(), type_id_of<V>());
      }
#endif
    }

    auto reset() noexcept -> void
    {
      if (ptr_) {
        vtable_ptr_->destroy(ptr_);
        ptr_        = nullptr;
        vtable_ptr_ = nullptr;
      }
    }

    void*         ptr_{nullptr};
    const vtable* vtable_ptr_{nullptr};
  };

  // =============================================================================
  // Admission
  // =============================================================================

  template <concepts::capability_bundle Bundle, typename V, typename... Args>
    requires concepts::admits<V, Bundle> && std::constructible_from<V, Args...>
  [[nodiscard]] auto make_box(Args&&... args) -> erased_box<Bundle>
  {
    return erased_box<Bundle>::template make<V>(std::forward<Args>(args)...);
  }

  /// Boxes an existing value.
  template <concepts::capability_bundle Bundle, typename V>
    requires concepts::admits<V, Bundle>
  [[nodiscard]] auto embed(V value) -> erased_box<Bundle>
  {
    return make_box<Bundle, V>(std::move(value));
  }

  /// Underlying storage of a container whose bundle is Bundle.
  template <concepts::capability_bundle Bundle>
  using box_storage =
    boost::unordered_flat_map<type_id, erased_box<Bundle>, type_id_hash>;

} // namespace typemap

#endif // TYPEMAP_ERASED_BOX_HPP
