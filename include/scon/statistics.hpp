/**
 * @file statistics.hpp
 * @brief Cumulative session traffic counters with on-demand derived rates.
 *
 * Counters cover the whole session: they survive reconnects and are never
 * reset. Derived values (uptime, rates) are computed from a caller-supplied
 * monotonic "now" and never stored.
 */

#ifndef SCON_STATISTICS_HPP_
#define SCON_STATISTICS_HPP_

#include <cstdint>

namespace scon {

struct Statistics {
  uint64_t bytes_received = 0U;
  uint64_t bytes_sent = 0U;
  uint64_t messages_received = 0U;
  uint64_t session_start_ms = 0U;  ///< Monotonic, set once per session.
};

class StatisticsAggregator final {
 public:
  explicit StatisticsAggregator(uint64_t session_start_ms) noexcept {
    stats_.session_start_ms = session_start_ms;
  }

  void AddReceived(uint32_t bytes) noexcept { stats_.bytes_received += bytes; }
  void AddSent(uint32_t bytes) noexcept { stats_.bytes_sent += bytes; }
  void AddMessage() noexcept { ++stats_.messages_received; }

  const Statistics& Get() const noexcept { return stats_; }

  /// @brief Whole seconds since session start (floored).
  uint64_t UptimeSeconds(uint64_t now_ms) const noexcept {
    return (now_ms > stats_.session_start_ms)
               ? (now_ms - stats_.session_start_ms) / 1000U
               : 0U;
  }

  /// @brief bytes_received / max(1, uptime) in bytes per second.
  double RxRate(uint64_t now_ms) const noexcept {
    return static_cast<double>(stats_.bytes_received) /
           static_cast<double>(RateDivisor(now_ms));
  }

  /// @brief bytes_sent / max(1, uptime) in bytes per second.
  double TxRate(uint64_t now_ms) const noexcept {
    return static_cast<double>(stats_.bytes_sent) /
           static_cast<double>(RateDivisor(now_ms));
  }

 private:
  uint64_t RateDivisor(uint64_t now_ms) const noexcept {
    const uint64_t up = UptimeSeconds(now_ms);
    return (up < 1U) ? 1U : up;
  }

  Statistics stats_;
};

}  // namespace scon

#endif  // SCON_STATISTICS_HPP_
