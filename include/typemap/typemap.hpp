// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef TYPEMAP_TYPEMAP_HPP
#define TYPEMAP_TYPEMAP_HPP

#include <typemap/aliases.hpp>
#include <typemap/bundle.hpp>
#include <typemap/concepts.hpp>
#include <typemap/entry.hpp>
#include <typemap/erased_box.hpp>
#include <typemap/format.hpp>
#include <typemap/traits.hpp>
#include <typemap/type_id.hpp>
#include <typemap/type_map.hpp>

#endif // TYPEMAP_TYPEMAP_HPP
