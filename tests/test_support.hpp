#pragma once

// Test support helpers.
//
// Release builds usually define NDEBUG, which compiles <cassert>'s assert()
// away and turns tests into no-ops. Tests include this header and keep using
// assert(expr); the macro is replaced by an always-on check that fails fast
// with a message on stderr.

#include <cassert>  // bring in the standard macro (and its header guard)

#include <cstdlib>
#include <iostream>

namespace eegmon_test {

inline void fail(const char* expr, const char* file, int line) {
  std::cerr << "Test assertion failed: " << expr << " (" << file << ":" << line << ")\n";
  std::exit(1);
}

} // namespace eegmon_test

#ifndef EEGMON_TEST_ASSERT
#define EEGMON_TEST_ASSERT(expr) \
  (static_cast<bool>(expr) ? (void)0 : ::eegmon_test::fail(#expr, __FILE__, __LINE__))
#endif

#ifdef assert
#undef assert
#endif
#define assert(expr) EEGMON_TEST_ASSERT(expr)

#ifndef TEST_CHECK
#define TEST_CHECK(expr) EEGMON_TEST_ASSERT(expr)
#endif
