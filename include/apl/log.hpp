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
 * @file log.hpp
 * @brief Synchronous printf-style logging with runtime and compile-time
 *        level filtering.
 *
 * Output format (one line per call, written to stderr):
 *   [YYYY-MM-DD HH:MM:SS.mmm] [LEVEL] [category] message (file:line)
 *
 * The (file:line) suffix is omitted in NDEBUG builds.
 *
 * Compile-time configuration:
 *   APL_LOG_MIN_LEVEL -- 0=DEBUG .. 4=FATAL; calls below it compile to nothing
 *                        (default 0 in debug builds, 1 with NDEBUG).
 *
 * Usage:
 * @code
 *   apl::log::SetLevel(apl::log::Level::kInfo);
 *   APL_LOG_INFO("Service", "app %s activated", uuid.c_str());
 * @endcode
 */

#ifndef APL_LOG_HPP_
#define APL_LOG_HPP_

#include "apl/platform.hpp"

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>

#ifndef APL_LOG_MIN_LEVEL
#ifdef NDEBUG
#define APL_LOG_MIN_LEVEL 1
#else
#define APL_LOG_MIN_LEVEL 0
#endif
#endif

namespace apl {
namespace log {

// ============================================================================
// Level
// ============================================================================

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5
};

namespace detail {

inline Level& LogLevelRef() noexcept {
#ifdef NDEBUG
  static Level level = Level::kInfo;
#else
  static Level level = Level::kDebug;
#endif
  return level;
}

inline bool& InitializedRef() noexcept {
  static bool initialized = false;
  return initialized;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug: return "DEBUG";
    case Level::kInfo:  return "INFO";
    case Level::kWarn:  return "WARN";
    case Level::kError: return "ERROR";
    case Level::kFatal: return "FATAL";
    default:            return "OFF";
  }
}

inline const char* Basename(const char* path) noexcept {
  if (path == nullptr) return "";
  const char* slash = nullptr;
  for (const char* p = path; *p != '\0'; ++p) {
    if (*p == '/' || *p == '\\') slash = p;
  }
  return (slash != nullptr) ? slash + 1 : path;
}

inline bool CaseEqual(const char* a, const char* b) noexcept {
  while (*a != '\0' && *b != '\0') {
    char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
    char lb = (*b >= 'A' && *b <= 'Z') ? static_cast<char>(*b + 32) : *b;
    if (la != lb) return false;
    ++a; ++b;
  }
  return *a == *b;
}

/// @brief Format the current wall-clock into "YYYY-MM-DD HH:MM:SS.mmm".
inline void FormatNow(char* buf, size_t bufsz) noexcept {
#if defined(APL_PLATFORM_LINUX) || defined(APL_PLATFORM_MACOS)
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  struct tm tm_local;
  localtime_r(&ts.tv_sec, &tm_local);
  (void)std::snprintf(buf, bufsz, "%04d-%02d-%02d %02d:%02d:%02d.%03u",
                      tm_local.tm_year + 1900, tm_local.tm_mon + 1,
                      tm_local.tm_mday, tm_local.tm_hour, tm_local.tm_min,
                      tm_local.tm_sec,
                      static_cast<unsigned>(ts.tv_nsec / 1000000L));
#else
  std::time_t t = std::time(nullptr);
  struct std::tm* tm_local = std::localtime(&t);
  if (tm_local != nullptr) {
    (void)std::snprintf(buf, bufsz, "%04d-%02d-%02d %02d:%02d:%02d.000",
                        tm_local->tm_year + 1900, tm_local->tm_mon + 1,
                        tm_local->tm_mday, tm_local->tm_hour,
                        tm_local->tm_min, tm_local->tm_sec);
  } else {
    (void)std::snprintf(buf, bufsz, "0000-00-00 00:00:00.000");
  }
#endif
}

}  // namespace detail

// ============================================================================
// Runtime Control
// ============================================================================

inline void SetLevel(Level level) noexcept { detail::LogLevelRef() = level; }

inline Level GetLevel() noexcept { return detail::LogLevelRef(); }

inline void Init() noexcept { detail::InitializedRef() = true; }

inline void Shutdown() noexcept {
  (void)std::fflush(stderr);
  detail::InitializedRef() = false;
}

inline bool IsInitialized() noexcept { return detail::InitializedRef(); }

/**
 * @brief Parse a level name (DEBUG, INFO, WARN, ERROR, FATAL, OFF).
 *
 * Case-insensitive. Returns @p fallback for nullptr or unknown names.
 */
inline Level ParseLevel(const char* name, Level fallback = Level::kInfo) noexcept {
  if (name == nullptr) return fallback;
  if (detail::CaseEqual(name, "debug")) return Level::kDebug;
  if (detail::CaseEqual(name, "info")) return Level::kInfo;
  if (detail::CaseEqual(name, "warn") || detail::CaseEqual(name, "warning"))
    return Level::kWarn;
  if (detail::CaseEqual(name, "error")) return Level::kError;
  if (detail::CaseEqual(name, "fatal")) return Level::kFatal;
  if (detail::CaseEqual(name, "off")) return Level::kOff;
  return fallback;
}

// ============================================================================
// LogWrite
// ============================================================================

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  // FATAL bypasses the runtime gate: it always precedes abort().
  if (level != Level::kFatal &&
      static_cast<uint8_t>(level) <
          static_cast<uint8_t>(detail::LogLevelRef())) {
    return;
  }

  char message[512];
  (void)std::vsnprintf(message, sizeof(message), fmt, args);

  char ts_buf[32];
  detail::FormatNow(ts_buf, sizeof(ts_buf));

#ifdef NDEBUG
  (void)file;
  (void)line;
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s\n", ts_buf,
                     detail::LevelTag(level),
                     category != nullptr ? category : "", message);
#else
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts_buf,
                     detail::LevelTag(level),
                     category != nullptr ? category : "", message,
                     detail::Basename(file), line);
#endif

  if (static_cast<uint8_t>(level) >= static_cast<uint8_t>(Level::kError)) {
    (void)std::fflush(stderr);
  }
}

APL_PRINTF_FORMAT(5, 6)
inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace apl

// ============================================================================
// Macros
// ============================================================================

#define APL_LOG_DEBUG(cat, fmt, ...)                                       \
  do {                                                                     \
    if (APL_LOG_MIN_LEVEL <= 0) {                                          \
      ::apl::log::LogWrite(::apl::log::Level::kDebug, cat, __FILE__,       \
                           __LINE__, fmt, ##__VA_ARGS__);                  \
    }                                                                      \
  } while (0)

#define APL_LOG_INFO(cat, fmt, ...)                                        \
  do {                                                                     \
    if (APL_LOG_MIN_LEVEL <= 1) {                                          \
      ::apl::log::LogWrite(::apl::log::Level::kInfo, cat, __FILE__,        \
                           __LINE__, fmt, ##__VA_ARGS__);                  \
    }                                                                      \
  } while (0)

#define APL_LOG_WARN(cat, fmt, ...)                                        \
  do {                                                                     \
    if (APL_LOG_MIN_LEVEL <= 2) {                                          \
      ::apl::log::LogWrite(::apl::log::Level::kWarn, cat, __FILE__,        \
                           __LINE__, fmt, ##__VA_ARGS__);                  \
    }                                                                      \
  } while (0)

#define APL_LOG_ERROR(cat, fmt, ...)                                       \
  do {                                                                     \
    if (APL_LOG_MIN_LEVEL <= 3) {                                          \
      ::apl::log::LogWrite(::apl::log::Level::kError, cat, __FILE__,       \
                           __LINE__, fmt, ##__VA_ARGS__);                  \
    }                                                                      \
  } while (0)

/// Logs unconditionally, then aborts. Reserved for programming errors.
#define APL_LOG_FATAL(cat, fmt, ...)                                       \
  do {                                                                     \
    ::apl::log::LogWrite(::apl::log::Level::kFatal, cat, __FILE__,         \
                         __LINE__, fmt, ##__VA_ARGS__);                    \
    std::abort();                                                          \
  } while (0)

#endif  // APL_LOG_HPP_
