/**
 * @file message_filter.hpp
 * @brief Case-insensitive substring filter for inbound lines.
 */

#ifndef SCON_MESSAGE_FILTER_HPP_
#define SCON_MESSAGE_FILTER_HPP_

#include "scon/vocabulary.hpp"

#include <cstdint>
#include <cstring>

#ifndef SCON_FILTER_MAX_LEN
#define SCON_FILTER_MAX_LEN 63U
#endif

namespace scon {

/// @brief Filter text and its enabled flag (enabled iff text is non-empty).
struct FilterConfig {
  FixedString<SCON_FILTER_MAX_LEN> text;
  bool enabled = false;
};

class MessageFilter final {
 public:
  MessageFilter() noexcept = default;

  /// @brief True when @p text fits SCON_FILTER_MAX_LEN (nullptr fits).
  static bool Fits(const char* text) noexcept {
    return text == nullptr || std::strlen(text) <= SCON_FILTER_MAX_LEN;
  }

  /**
   * @brief Replace the filter text. Empty text disables filtering.
   * @return false when @p text does not fit; the filter is left unchanged.
   */
  bool Set(const char* text) noexcept {
    if (!Fits(text)) {
      return false;
    }
    cfg_.text.assign(TruncateToCapacity, text);
    cfg_.enabled = !cfg_.text.empty();
    return true;
  }

  const FilterConfig& Config() const noexcept { return cfg_; }
  bool Enabled() const noexcept { return cfg_.enabled; }

  /// @brief True when @p line should reach the sink.
  bool Accepts(const char* line, uint32_t len) const noexcept {
    if (!cfg_.enabled) {
      return true;
    }
    return ContainsIgnoreCase(line, len, cfg_.text.c_str(), cfg_.text.size());
  }

  static bool ContainsIgnoreCase(const char* hay, uint32_t hay_len,
                                 const char* needle,
                                 uint32_t needle_len) noexcept {
    if (needle_len == 0U) {
      return true;
    }
    if (hay == nullptr || hay_len < needle_len) {
      return false;
    }
    for (uint32_t i = 0U; i + needle_len <= hay_len; ++i) {
      uint32_t j = 0U;
      while (j < needle_len && ToLower(hay[i + j]) == ToLower(needle[j])) {
        ++j;
      }
      if (j == needle_len) {
        return true;
      }
    }
    return false;
  }

 private:
  static char ToLower(char c) noexcept {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c;
  }

  FilterConfig cfg_;
};

}  // namespace scon

#endif  // SCON_MESSAGE_FILTER_HPP_
