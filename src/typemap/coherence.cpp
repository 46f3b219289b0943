// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include <exception>

#include <spdlog/spdlog.h>

#include <typemap/erased_box.hpp>
#include <typemap/type_id.hpp>

namespace typemap::detail {

  void report_coherence_violation(
    const type_id& stored, const type_id& requested) noexcept
  {
    spdlog::critical(
      "type_map coherence violated: slot holds '{}' but was read as '{}'",
      stored.pretty_name(),
      requested.pretty_name());
    spdlog::default_logger()->flush();
    std::terminate();
  }

} // namespace typemap::detail
