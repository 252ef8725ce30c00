/**
 * @file sink_event.hpp
 * @brief What the Session hands to its presentation layer.
 *
 * The sink is a plain function pointer plus context. Every pointer inside a
 * SinkEvent is valid only for the duration of the call.
 */

#ifndef SCON_SINK_EVENT_HPP_
#define SCON_SINK_EVENT_HPP_

#include "scon/line_ending.hpp"
#include "scon/message_filter.hpp"
#include "scon/serial_port.hpp"
#include "scon/statistics.hpp"
#include "scon/vocabulary.hpp"

#include <cstdint>

namespace scon {

// ============================================================================
// Session state values
// ============================================================================

enum class ConnectionState : uint8_t {
  kDisconnected = 0,
  kConnecting,
  kConnected,
  kReconnecting,
  kPermanentlyFailed,
};

inline const char* ConnectionStateName(ConnectionState s) noexcept {
  switch (s) {
    case ConnectionState::kDisconnected:
      return "Disconnected";
    case ConnectionState::kConnecting:
      return "Connecting";
    case ConnectionState::kConnected:
      return "Connected";
    case ConnectionState::kReconnecting:
      return "Reconnecting";
    case ConnectionState::kPermanentlyFailed:
      return "PermanentlyFailed";
    default:
      return "Unknown";
  }
}

/// @brief Every user toggle, owned by the Session, copied into snapshots.
struct SessionConfig {
  bool paused = false;
  bool show_hex = false;
  bool echo = false;
  bool auto_reconnect = true;
  LineEnding line_ending = LineEnding::kLf;
  FilterConfig filter;
};

/// @brief Pending reconnect bookkeeping. All zero outside Reconnecting.
struct ReconnectAttempt {
  uint32_t attempt = 0U;
  uint32_t delay_ms = 0U;
  uint64_t start_ms = 0U;
};

struct SessionSnapshot {
  ConnectionState state = ConnectionState::kDisconnected;
  SessionConfig config;
  Statistics stats;
  uint64_t uptime_s = 0U;
  double rx_rate = 0.0;  ///< bytes/s
  double tx_rate = 0.0;  ///< bytes/s
  uint32_t attempt = 0U;  ///< Reconnect ordinal; 0 after success or reset.
  ReconnectAttempt reconnect;
  uint64_t remaining_ms = 0U;
  uint32_t remaining_s = 0U;  ///< Countdown, rounded up.
  FixedString<SCON_PORT_PATH_MAX> port_path;
  uint32_t baud_rate = 0U;
  uint64_t stale_events = 0U;
};

// ============================================================================
// SinkEvent
// ============================================================================

enum class SinkKind : uint8_t { kMessage = 0, kHex, kStateChange, kStatsTick };

enum class Severity : uint8_t { kInfo = 0, kSuccess, kWarning, kError };

enum class Origin : uint8_t { kInbound = 0, kOutbound, kSystem };

struct SinkEvent {
  SinkKind kind = SinkKind::kMessage;
  Severity severity = Severity::kInfo;
  Origin origin = Origin::kSystem;
  uint64_t timestamp_ms = 0U;  ///< Wall clock, ms since epoch.
  const char* text = nullptr;  ///< Not null-terminated; see text_len.
  uint32_t text_len = 0U;
  const uint8_t* data = nullptr;  ///< kHex: the raw chunk.
  uint32_t data_len = 0U;
  ConnectionState state = ConnectionState::kDisconnected;     ///< kStateChange
  ConnectionState previous = ConnectionState::kDisconnected;  ///< kStateChange
  const SessionSnapshot* snapshot = nullptr;                  ///< kStatsTick
};

using SinkFn = void (*)(const SinkEvent& event, void* ctx);

inline const char* SeverityName(Severity s) noexcept {
  switch (s) {
    case Severity::kSuccess:
      return "success";
    case Severity::kWarning:
      return "warning";
    case Severity::kError:
      return "error";
    case Severity::kInfo:
    default:
      return "info";
  }
}

}  // namespace scon

#endif  // SCON_SINK_EVENT_HPP_
