// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef TYPEMAP_FORMAT_HPP
#define TYPEMAP_FORMAT_HPP

#include <iterator>

#include <fmt/format.h>

#include <typemap/erased_box.hpp>
#include <typemap/type_map.hpp>

// Renderings exist only for printable bundles.

template <typemap::concepts::capability_bundle Bundle>
  requires Bundle::printable
struct fmt::formatter<typemap::erased_box<Bundle>>
    : fmt::formatter<fmt::string_view> {
  template <typename FormatContext>
  auto format(const typemap::erased_box<Bundle>& box, FormatContext& ctx) const
    -> decltype(ctx.out())
  {
    auto buffer = fmt::memory_buffer{};
    box.format_to(buffer);
    return fmt::formatter<fmt::string_view>::format(
      fmt::string_view{buffer.data(), buffer.size()}, ctx);
  }
};

/**
 * @brief Renders as {Key: value, ...}; key names come from the type id.
 * * Entry order follows the underlying hash map and is unspecified.
 */
template <typemap::concepts::capability_bundle Bundle>
  requires Bundle::printable
struct fmt::formatter<typemap::basic_type_map<Bundle>>
    : fmt::formatter<fmt::string_view> {
  template <typename FormatContext>
  auto format(const typemap::basic_type_map<Bundle>& map,
    FormatContext&                                   ctx) const -> decltype(ctx.out())
  {
    auto buffer = fmt::memory_buffer{};
    auto out    = std::back_inserter(buffer);

    fmt::format_to(out, "{{");
    auto first = true;
    for (const auto& [id, box] : map.unsafe_raw()) {
      fmt::format_to(out, "{}{}: ", first ? "" : ", ", id.pretty_name());
      box.format_to(buffer);
      first = false;
    }
    fmt::format_to(out, "}}");

    return fmt::formatter<fmt::string_view>::format(
      fmt::string_view{buffer.data(), buffer.size()}, ctx);
  }
};

#endif // TYPEMAP_FORMAT_HPP
