/**
 * @file backoff.hpp
 * @brief Deterministic exponential reconnect backoff.
 *
 *   delay(n) = min(base * 2^min(n - 1, cap_exponent), max)     n >= 1
 *
 * With the defaults the sequence is 1s, 2s, 4s, 8s, 16s, 30s, 30s, ...
 * No jitter: identical inputs always yield identical delays.
 */

#ifndef SCON_BACKOFF_HPP_
#define SCON_BACKOFF_HPP_

#include "scon/platform.hpp"

#include <cstdint>

namespace scon {

struct BackoffPolicy {
  uint32_t base_delay_ms = 1000U;
  uint32_t cap_exponent = 5U;  ///< Growth plateaus at base * 2^cap_exponent.
  uint32_t max_delay_ms = 30000U;
};

class Backoff final {
 public:
  constexpr Backoff() noexcept = default;
  constexpr explicit Backoff(const BackoffPolicy& policy) noexcept
      : policy_(policy) {}

  /**
   * @brief Delay before reconnect attempt @p attempt.
   * @param attempt 1-based attempt ordinal. 0 is treated as 1.
   */
  constexpr uint32_t DelayMs(uint32_t attempt) const noexcept {
    const uint32_t n = (attempt == 0U) ? 1U : attempt;
    uint32_t exponent = n - 1U;
    if (exponent > policy_.cap_exponent) {
      exponent = policy_.cap_exponent;
    }
    // 64-bit shift keeps base * 2^exponent exact for any sane exponent.
    if (exponent > 32U) {
      exponent = 32U;
    }
    const uint64_t raw = static_cast<uint64_t>(policy_.base_delay_ms) << exponent;
    return (raw > policy_.max_delay_ms) ? policy_.max_delay_ms
                                        : static_cast<uint32_t>(raw);
  }

  /**
   * @brief Milliseconds left of a countdown started at @p start_ms.
   * @return delay - (now - start), floored at 0.
   */
  static constexpr uint64_t RemainingMs(uint32_t delay_ms, uint64_t start_ms,
                                        uint64_t now_ms) noexcept {
    if (now_ms < start_ms) {
      return delay_ms;
    }
    const uint64_t elapsed = now_ms - start_ms;
    return (elapsed >= delay_ms) ? 0U : (delay_ms - elapsed);
  }

  /// @brief Whole seconds left, rounded up (what a countdown shows).
  static constexpr uint32_t RemainingSeconds(uint32_t delay_ms,
                                             uint64_t start_ms,
                                             uint64_t now_ms) noexcept {
    return static_cast<uint32_t>(
        (RemainingMs(delay_ms, start_ms, now_ms) + 999U) / 1000U);
  }

  constexpr const BackoffPolicy& Policy() const noexcept { return policy_; }

 private:
  BackoffPolicy policy_{};
};

}  // namespace scon

#endif  // SCON_BACKOFF_HPP_
