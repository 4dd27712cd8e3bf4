/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file platform.hpp
 * @brief The few portability macros apl relies on.
 *
 *   APL_PLATFORM_LINUX / APL_PLATFORM_MACOS  POSIX clock and file APIs exist
 *   APL_UNLIKELY(x)                          cold-path hint for fatal checks
 *   APL_PRINTF_FORMAT(f, a)                  printf checking for LogWrite
 *   APL_ASSERT(cond)                         debug-only precondition check
 */

#ifndef APL_PLATFORM_HPP_
#define APL_PLATFORM_HPP_

#include <cstdio>
#include <cstdlib>

#if defined(__linux__)
#define APL_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define APL_PLATFORM_MACOS 1
#endif

#if defined(__GNUC__) || defined(__clang__)
#define APL_UNLIKELY(x) __builtin_expect(!!(x), 0)
#define APL_PRINTF_FORMAT(f, a) __attribute__((format(printf, f, a)))
#else
#define APL_UNLIKELY(x) (x)
#define APL_PRINTF_FORMAT(f, a)
#endif

namespace apl {
namespace detail {

/// Report a broken precondition with its location and abort.
[[noreturn]] inline void AssertFail(const char* cond, const char* file,
                                    int line) {
  (void)std::fprintf(stderr, "APL_ASSERT(%s) failed at %s:%d\n", cond, file,
                     line);
  std::abort();
}

}  // namespace detail
}  // namespace apl

// Compiled out under NDEBUG; never a substitute for an error return.
#ifdef NDEBUG
#define APL_ASSERT(cond) ((void)0)
#else
#define APL_ASSERT(cond) \
  ((cond) ? ((void)0) : ::apl::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

#endif  // APL_PLATFORM_HPP_
