/**
 * @file line_framer.hpp
 * @brief Inbound '\n' line decoder and hex formatter.
 *
 * LineFramer buffers partial data across chunks and emits one trimmed line per
 * '\n'. A line that outgrows the buffer is emitted in SCON_LINE_MAX pieces.
 * Empty lines (after trimming) are still emitted.
 */

#ifndef SCON_LINE_FRAMER_HPP_
#define SCON_LINE_FRAMER_HPP_

#include "scon/platform.hpp"

#include <cstddef>
#include <cstdint>

#ifndef SCON_LINE_MAX
#define SCON_LINE_MAX 4096U
#endif

namespace scon {

/// @brief Receives one trimmed line. @p line is not null-terminated.
using LineFn = void (*)(const char* line, uint32_t len, void* ctx);

// ============================================================================
// LineFramer
// ============================================================================

class LineFramer final {
 public:
  LineFramer() noexcept = default;

  LineFramer(const LineFramer&) = delete;
  LineFramer& operator=(const LineFramer&) = delete;

  /**
   * @brief Append a raw chunk, emitting every line it completes.
   * @return Number of lines emitted.
   */
  uint32_t Feed(const uint8_t* data, uint32_t len, LineFn fn, void* ctx) {
    uint32_t emitted = 0U;
    for (uint32_t i = 0U; i < len; ++i) {
      const char c = static_cast<char>(data[i]);
      if (c == '\n') {
        Emit(fn, ctx);
        ++emitted;
        continue;
      }
      if (size_ == SCON_LINE_MAX) {
        Emit(fn, ctx);
        ++emitted;
      }
      buf_[size_++] = c;
    }
    return emitted;
  }

  /**
   * @brief Emit buffered partial data as a final line, if any.
   * @return true if a line was emitted.
   */
  bool Flush(LineFn fn, void* ctx) {
    if (size_ == 0U) {
      return false;
    }
    Emit(fn, ctx);
    return true;
  }

  void Reset() noexcept { size_ = 0U; }

  uint32_t Pending() const noexcept { return size_; }

 private:
  static bool IsSpace(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\r' || c == '\v' || c == '\f';
  }

  void Emit(LineFn fn, void* ctx) {
    uint32_t begin = 0U;
    uint32_t end = size_;
    while (begin < end && IsSpace(buf_[begin])) {
      ++begin;
    }
    while (end > begin && IsSpace(buf_[end - 1U])) {
      --end;
    }
    size_ = 0U;
    if (fn != nullptr) {
      fn(buf_ + begin, end - begin, ctx);
    }
  }

  char buf_[SCON_LINE_MAX];
  uint32_t size_ = 0U;
};

// ============================================================================
// Hex formatting
// ============================================================================

/// @brief Output capacity needed for @p len bytes (incl. terminator).
constexpr uint32_t HexTextCapacity(uint32_t len) noexcept {
  return (len == 0U) ? 1U : len * 3U;
}

/**
 * @brief "48 65 0A": uppercase pairs separated by single spaces.
 *
 * Output is null-terminated and truncated on a byte boundary when @p out is
 * too small.
 * @return Characters written, excluding the terminator.
 */
inline uint32_t FormatHex(const uint8_t* data, uint32_t len, char* out,
                          uint32_t out_size) noexcept {
  static constexpr char kDigits[] = "0123456789ABCDEF";
  if (out == nullptr || out_size == 0U) {
    return 0U;
  }
  uint32_t pos = 0U;
  for (uint32_t i = 0U; i < len; ++i) {
    const uint32_t need = (i == 0U) ? 2U : 3U;
    if (pos + need + 1U > out_size) {
      break;
    }
    if (i != 0U) {
      out[pos++] = ' ';
    }
    out[pos++] = kDigits[(data[i] >> 4U) & 0x0FU];
    out[pos++] = kDigits[data[i] & 0x0FU];
  }
  out[pos] = '\0';
  return pos;
}

}  // namespace scon

#endif  // SCON_LINE_FRAMER_HPP_
