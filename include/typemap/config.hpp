// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef TYPEMAP_CONFIG_HPP
#define TYPEMAP_CONFIG_HPP

// When non-zero, every unchecked downcast verifies the hidden type of the
// box against the requested type and reports a mismatch before anything
// is read. Defaults to on in builds without NDEBUG.
#ifndef TYPEMAP_CHECK_COHERENCE
#  ifdef NDEBUG
#    define TYPEMAP_CHECK_COHERENCE 0
#  else
#    define TYPEMAP_CHECK_COHERENCE 1
#  endif
#endif

#endif // TYPEMAP_CONFIG_HPP
