/**
 * @file console_sink.hpp
 * @brief Plain-terminal rendering of the Session event feed.
 *
 * Messages are printed as "[hh:mm:ss.mmm] text", colored by severity.
 * On a terminal the last status line stays pinned below the output and is
 * redrawn on every stats tick; otherwise status is printed only on request.
 */

#ifndef SCON_EXAMPLES_CONSOLE_SINK_HPP_
#define SCON_EXAMPLES_CONSOLE_SINK_HPP_

#include "scon/session.hpp"
#include "scon/sink_event.hpp"

#include <cstdint>
#include <cstdio>
#include <ctime>

#include <unistd.h>

namespace console {

// ============================================================================
// ANSI Colors
// ============================================================================

static constexpr const char* kReset = "\x1b[0m";
static constexpr const char* kGray = "\x1b[90m";
static constexpr const char* kRed = "\x1b[31m";
static constexpr const char* kGreen = "\x1b[32m";
static constexpr const char* kYellow = "\x1b[33m";
static constexpr const char* kBlue = "\x1b[34m";
static constexpr const char* kCyan = "\x1b[36m";
static constexpr const char* kClearLine = "\r\x1b[2K";

inline void FormatClock(uint64_t epoch_ms, char* buf, size_t size) {
  const auto sec = static_cast<time_t>(epoch_ms / 1000U);
  struct tm tm_buf;
  ::localtime_r(&sec, &tm_buf);
  (void)std::snprintf(buf, size, "%02d:%02d:%02d.%03u", tm_buf.tm_hour,
                      tm_buf.tm_min, tm_buf.tm_sec,
                      static_cast<unsigned>(epoch_ms % 1000U));
}

/// "512 B", "1.5 KB", "2.0 MB"
inline void FormatBytes(uint64_t bytes, char* buf, size_t size) {
  if (bytes < 1024U) {
    (void)std::snprintf(buf, size, "%llu B",
                        static_cast<unsigned long long>(bytes));
  } else if (bytes < 1024U * 1024U) {
    (void)std::snprintf(buf, size, "%.1f KB",
                        static_cast<double>(bytes) / 1024.0);
  } else {
    (void)std::snprintf(buf, size, "%.1f MB",
                        static_cast<double>(bytes) / (1024.0 * 1024.0));
  }
}

// ============================================================================
// ConsoleSink
// ============================================================================

class ConsoleSink final {
 public:
  explicit ConsoleSink(FILE* out) noexcept
      : out_(out), tty_(::isatty(::fileno(out)) == 1) {}

  ConsoleSink(const ConsoleSink&) = delete;
  ConsoleSink& operator=(const ConsoleSink&) = delete;

  /// @brief scon::SinkFn trampoline.
  static void OnEvent(const scon::SinkEvent& ev, void* ctx) {
    static_cast<ConsoleSink*>(ctx)->Handle(ev);
  }

  /// @brief Print one status line now (":s").
  void PrintStatus(const scon::SessionSnapshot& snap) {
    char line[kStatusMax];
    FormatStatus(snap, line, sizeof(line));
    ClearStatus();
    (void)std::fprintf(out_, "%s\n", line);
    RedrawStatus();
  }

  /// @brief Plain line outside the event feed (help text, banners).
  void PrintLine(const char* color, const char* text) {
    ClearStatus();
    (void)std::fprintf(out_, "%s%s%s\n", Color(color), text, Color(kReset));
    RedrawStatus();
  }

  /// @brief Drop the pinned status line before the program exits.
  void Finish() {
    ClearStatus();
    status_[0] = '\0';
    (void)std::fflush(out_);
  }

 private:
  static constexpr uint32_t kStatusMax = 256U;

  void Handle(const scon::SinkEvent& ev) {
    switch (ev.kind) {
      case scon::SinkKind::kMessage:
        PrintMessage(ev);
        break;
      case scon::SinkKind::kHex:
        PrintTimestamped(ev.timestamp_ms, kCyan, "HEX: ", ev.text,
                         ev.text_len);
        break;
      case scon::SinkKind::kStateChange:
        // Announced by Session notices; the status line shows the state.
        break;
      case scon::SinkKind::kStatsTick:
        if (tty_ && ev.snapshot != nullptr) {
          FormatStatus(*ev.snapshot, status_, sizeof(status_));
          RedrawStatus();
        }
        break;
    }
  }

  void PrintMessage(const scon::SinkEvent& ev) {
    if (ev.origin == scon::Origin::kInbound) {
      PrintTimestamped(ev.timestamp_ms, kGreen, "\xE2\x86\x90 ", ev.text,
                       ev.text_len);
      return;
    }
    if (ev.origin == scon::Origin::kOutbound) {
      PrintTimestamped(ev.timestamp_ms, kBlue, "", ev.text, ev.text_len);
      return;
    }
    const char* color = kReset;
    switch (ev.severity) {
      case scon::Severity::kSuccess:
        color = kGreen;
        break;
      case scon::Severity::kWarning:
        color = kYellow;
        break;
      case scon::Severity::kError:
        color = kRed;
        break;
      case scon::Severity::kInfo:
        color = kCyan;
        break;
    }
    PrintTimestamped(ev.timestamp_ms, color, "", ev.text, ev.text_len);
  }

  void PrintTimestamped(uint64_t epoch_ms, const char* color,
                        const char* prefix, const char* text, uint32_t len) {
    char ts[16];
    FormatClock(epoch_ms, ts, sizeof(ts));
    ClearStatus();
    (void)std::fprintf(out_, "%s[%s]%s %s%s%.*s%s\n", Color(kGray), ts,
                       Color(kReset), Color(color), prefix,
                       static_cast<int>(len), (text != nullptr) ? text : "",
                       Color(kReset));
    RedrawStatus();
  }

  static void FormatStatus(const scon::SessionSnapshot& s, char* buf,
                           size_t size) {
    char rx[24];
    char tx[24];
    FormatBytes(s.stats.bytes_received, rx, sizeof(rx));
    FormatBytes(s.stats.bytes_sent, tx, sizeof(tx));

    char state[48];
    if (s.state == scon::ConnectionState::kReconnecting) {
      (void)std::snprintf(state, sizeof(state), "Reconnecting #%u (%us)",
                          s.reconnect.attempt, s.remaining_s);
    } else {
      (void)std::snprintf(state, sizeof(state), "%s",
                          scon::ConnectionStateName(s.state));
    }

    const uint64_t up = s.uptime_s;
    (void)std::snprintf(
        buf, size,
        "%s@%u | %s | RX %s (%.1f B/s) TX %s (%.1f B/s) | %llu msgs | "
        "%02llu:%02llu:%02llu | %s%s%s%s%s",
        s.port_path.c_str(), s.baud_rate, state, rx, s.rx_rate, tx, s.tx_rate,
        static_cast<unsigned long long>(s.stats.messages_received),
        static_cast<unsigned long long>(up / 3600U),
        static_cast<unsigned long long>((up % 3600U) / 60U),
        static_cast<unsigned long long>(up % 60U),
        scon::LineEndingName(s.config.line_ending),
        s.config.auto_reconnect ? " auto" : "",
        s.config.paused ? " paused" : "", s.config.show_hex ? " hex" : "",
        s.config.echo ? " echo" : "");
  }

  void ClearStatus() {
    if (tty_ && status_[0] != '\0') {
      (void)std::fputs(kClearLine, out_);
    }
  }

  void RedrawStatus() {
    if (tty_ && status_[0] != '\0') {
      (void)std::fprintf(out_, "%s%s%s%s", kClearLine, kGray, status_, kReset);
    }
    (void)std::fflush(out_);
  }

  const char* Color(const char* code) const { return tty_ ? code : ""; }

  FILE* out_;
  bool tty_;
  char status_[kStatusMax] = {};
};

}  // namespace console

#endif  // SCON_EXAMPLES_CONSOLE_SINK_HPP_
