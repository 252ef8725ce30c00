/**
 * @file line_ending.hpp
 * @brief Outbound line-ending modes. Inbound framing always splits on '\n'.
 */

#ifndef SCON_LINE_ENDING_HPP_
#define SCON_LINE_ENDING_HPP_

#include "scon/vocabulary.hpp"

#include <cstdint>

namespace scon {

enum class LineEnding : uint8_t { kLf = 0, kCr, kCrLf };

inline const char* LineEndingBytes(LineEnding mode) noexcept {
  switch (mode) {
    case LineEnding::kCr:
      return "\r";
    case LineEnding::kCrLf:
      return "\r\n";
    case LineEnding::kLf:
    default:
      return "\n";
  }
}

inline uint32_t LineEndingSize(LineEnding mode) noexcept {
  return (mode == LineEnding::kCrLf) ? 2U : 1U;
}

inline const char* LineEndingName(LineEnding mode) noexcept {
  switch (mode) {
    case LineEnding::kCr:
      return "CR";
    case LineEnding::kCrLf:
      return "CRLF";
    case LineEnding::kLf:
    default:
      return "LF";
  }
}

/// @brief LF -> CR -> CRLF -> LF.
inline LineEnding NextLineEnding(LineEnding mode) noexcept {
  switch (mode) {
    case LineEnding::kLf:
      return LineEnding::kCr;
    case LineEnding::kCr:
      return LineEnding::kCrLf;
    case LineEnding::kCrLf:
    default:
      return LineEnding::kLf;
  }
}

/// @brief Case-insensitive "LF" / "CR" / "CRLF".
inline optional<LineEnding> ParseLineEnding(const char* name) noexcept {
  if (name == nullptr) {
    return {};
  }
  char up[8] = {};
  for (uint32_t i = 0U; i < sizeof(up) - 1U && name[i] != '\0'; ++i) {
    const char c = name[i];
    up[i] = (c >= 'a' && c <= 'z') ? static_cast<char>(c - 32) : c;
  }
  if (std::strcmp(up, "LF") == 0) return LineEnding::kLf;
  if (std::strcmp(up, "CR") == 0) return LineEnding::kCr;
  if (std::strcmp(up, "CRLF") == 0) return LineEnding::kCrLf;
  return {};
}

}  // namespace scon

#endif  // SCON_LINE_ENDING_HPP_
