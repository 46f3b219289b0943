// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

// Writes a box of the wrong type through the raw accessor and reads it
// back with coherence checking forced on. The read must be reported
// through spdlog before the process terminates.

#include <cstdlib>
#include <exception>
#include <string>

#include <typemap/aliases.hpp>

namespace {
  struct counter {
    using typemap_value = int;
  };
} // namespace

auto main() -> int
{
  std::set_terminate([] { std::_Exit(EXIT_FAILURE); });

  typemap::type_map map;
  map.insert<counter>(1);
  map.unsafe_raw_mut().insert_or_assign(typemap::type_id_of<counter>(),
    typemap::embed<typemap::bundles::plain>(std::string{"not an int"}));

  return *map.get<counter>();
}
