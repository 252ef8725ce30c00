/**
 * @file log.hpp
 * @brief Synchronous printf-style logging with runtime and compile-time
 *        level filtering.
 *
 * Output format:
 *   [2026-10-19 14:03:07.412] [INFO] [Session] Connected to /dev/ttyUSB0
 *
 * Debug builds append "(file:line)". The output stream defaults to stderr so
 * it never interleaves with the console sink on stdout.
 *
 * Compile-time floor: SCON_LOG_MIN_LEVEL (0=DEBUG .. 4=FATAL, 5=OFF).
 */

#ifndef SCON_LOG_HPP_
#define SCON_LOG_HPP_

#include "scon/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>

#if defined(SCON_PLATFORM_POSIX)
#include <sys/time.h>
#endif

#ifndef SCON_LOG_MIN_LEVEL
#ifdef NDEBUG
#define SCON_LOG_MIN_LEVEL 1
#else
#define SCON_LOG_MIN_LEVEL 0
#endif
#endif

namespace scon {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5,
};

namespace detail {

struct LogState {
#ifdef NDEBUG
  std::atomic<Level> level{Level::kInfo};
#else
  std::atomic<Level> level{Level::kDebug};
#endif
  std::atomic<bool> initialized{false};
  std::atomic<FILE*> stream{nullptr};
};

inline LogState& State() noexcept {
  static LogState state;
  return state;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
    case Level::kFatal:
      return "FATAL";
    default:
      return "OFF";
  }
}

/// @brief Strip directories so debug builds print "session.hpp:120".
inline const char* Basename(const char* path) noexcept {
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

inline void FormatTimestamp(char* buf, size_t size) noexcept {
#if defined(SCON_PLATFORM_POSIX)
  struct timeval tv;
  ::gettimeofday(&tv, nullptr);
  struct tm tm_buf;
  const time_t sec = tv.tv_sec;
  ::localtime_r(&sec, &tm_buf);
  (void)std::snprintf(buf, size, "%04d-%02d-%02d %02d:%02d:%02d.%03d",
                      tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
                      tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                      static_cast<int>(tv.tv_usec / 1000));
#else
  (void)std::snprintf(buf, size, "%ld", static_cast<long>(std::time(nullptr)));
#endif
}

}  // namespace detail

// ============================================================================
// Runtime Control
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::State().level.store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return detail::State().level.load(std::memory_order_relaxed);
}

/// @brief Redirect output. nullptr restores stderr.
inline void SetStream(FILE* stream) noexcept {
  detail::State().stream.store(stream, std::memory_order_release);
}

inline void Init(Level level = GetLevel()) noexcept {
  SetLevel(level);
  detail::State().initialized.store(true, std::memory_order_release);
}

inline void Shutdown() noexcept {
  FILE* out = detail::State().stream.load(std::memory_order_acquire);
  (void)std::fflush(out != nullptr ? out : stderr);
  detail::State().initialized.store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::State().initialized.load(std::memory_order_acquire);
}

/**
 * @brief Parse "debug", "info", "warn"/"warning", "error", "fatal", "off"
 *        (case-insensitive). Unknown names return the fallback.
 */
inline Level ParseLevel(const char* name, Level fallback) noexcept {
  if (name == nullptr) {
    return fallback;
  }
  char lower[16] = {};
  for (uint32_t i = 0U; i < sizeof(lower) - 1U && name[i] != '\0'; ++i) {
    const char c = name[i];
    lower[i] = (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c;
  }
  if (std::strcmp(lower, "debug") == 0) return Level::kDebug;
  if (std::strcmp(lower, "info") == 0) return Level::kInfo;
  if (std::strcmp(lower, "warn") == 0 || std::strcmp(lower, "warning") == 0) {
    return Level::kWarn;
  }
  if (std::strcmp(lower, "error") == 0) return Level::kError;
  if (std::strcmp(lower, "fatal") == 0) return Level::kFatal;
  if (std::strcmp(lower, "off") == 0) return Level::kOff;
  return fallback;
}

// ============================================================================
// LogWrite
// ============================================================================

inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) SCON_PRINTF_FMT(5, 6);

inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) {
  if (level < GetLevel() || GetLevel() == Level::kOff) {
    return;
  }

  char msg[512];
  va_list args;
  va_start(args, fmt);
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);
  va_end(args);

  char ts[32];
  detail::FormatTimestamp(ts, sizeof(ts));

  FILE* out = detail::State().stream.load(std::memory_order_acquire);
  if (out == nullptr) {
    out = stderr;
  }

#ifdef NDEBUG
  (void)file;
  (void)line;
  (void)std::fprintf(out, "[%s] [%s] [%s] %s\n", ts, detail::LevelTag(level),
                     category, msg);
#else
  (void)std::fprintf(out, "[%s] [%s] [%s] %s (%s:%d)\n", ts,
                     detail::LevelTag(level), category, msg,
                     detail::Basename(file), line);
#endif

  if (level >= Level::kError) {
    (void)std::fflush(out);
  }
}

}  // namespace log
}  // namespace scon

// ============================================================================
// Macros
// ============================================================================

#define SCON_LOG_DEBUG(cat, fmt, ...)                                     \
  do {                                                                    \
    if (SCON_LOG_MIN_LEVEL <= 0) {                                        \
      ::scon::log::LogWrite(::scon::log::Level::kDebug, cat, __FILE__,    \
                            __LINE__, fmt, ##__VA_ARGS__);                \
    }                                                                     \
  } while (0)

#define SCON_LOG_INFO(cat, fmt, ...)                                      \
  do {                                                                    \
    if (SCON_LOG_MIN_LEVEL <= 1) {                                        \
      ::scon::log::LogWrite(::scon::log::Level::kInfo, cat, __FILE__,     \
                            __LINE__, fmt, ##__VA_ARGS__);                \
    }                                                                     \
  } while (0)

#define SCON_LOG_WARN(cat, fmt, ...)                                      \
  do {                                                                    \
    if (SCON_LOG_MIN_LEVEL <= 2) {                                        \
      ::scon::log::LogWrite(::scon::log::Level::kWarn, cat, __FILE__,     \
                            __LINE__, fmt, ##__VA_ARGS__);                \
    }                                                                     \
  } while (0)

#define SCON_LOG_ERROR(cat, fmt, ...)                                     \
  do {                                                                    \
    if (SCON_LOG_MIN_LEVEL <= 3) {                                        \
      ::scon::log::LogWrite(::scon::log::Level::kError, cat, __FILE__,    \
                            __LINE__, fmt, ##__VA_ARGS__);                \
    }                                                                     \
  } while (0)

#define SCON_LOG_FATAL(cat, fmt, ...)                                     \
  do {                                                                    \
    ::scon::log::LogWrite(::scon::log::Level::kFatal, cat, __FILE__,      \
                          __LINE__, fmt, ##__VA_ARGS__);                  \
    std::abort();                                                         \
  } while (0)

#endif  // SCON_LOG_HPP_
