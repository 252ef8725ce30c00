/**
 * @file command_keys.hpp
 * @brief Line-mode keyboard commands of the monitor.
 *
 *   :q quit   :p pause   :h hex   :e echo   :l line ending
 *   :r auto-reconnect    :R force reconnect  :f <text> filter
 *   :s status            :? help
 *
 * Any other line is sent to the port with the current line ending.
 */

#ifndef SCON_EXAMPLES_COMMAND_KEYS_HPP_
#define SCON_EXAMPLES_COMMAND_KEYS_HPP_

#include "console_sink.hpp"

#include "scon/log.hpp"
#include "scon/session.hpp"

#include <cstring>

namespace console {

enum class KeyResult : uint8_t { kContinue = 0, kQuit };

inline void PrintHelp(ConsoleSink& sink) {
  static constexpr const char* kHelp[] = {
      "Commands:",
      "  :q          quit",
      "  :p          pause / resume output",
      "  :h          toggle hex view",
      "  :e          toggle echo of sent data",
      "  :l          cycle line ending (LF -> CR -> CRLF)",
      "  :r          toggle auto-reconnect",
      "  :R          reconnect now",
      "  :f <text>   filter lines (empty clears)",
      "  :s          show status",
      "  :?          this help",
      "Anything else is sent to the port.",
  };
  for (const char* line : kHelp) {
    sink.PrintLine(kCyan, line);
  }
}

/**
 * @brief Run one input line against @p session.
 * @param line  Without the trailing newline.
 */
inline KeyResult HandleLine(scon::Session& session, ConsoleSink& sink,
                            const char* line) {
  if (line[0] != ':' || line[1] == '\0') {
    if (line[0] == '\0') {
      return KeyResult::kContinue;
    }
    auto r = session.Send(line);
    if (!r.has_value()) {
      SCON_LOG_DEBUG("Console", "send rejected: %s",
                     scon::SessionErrorName(r.get_error()));
    }
    return KeyResult::kContinue;
  }

  const char cmd = line[1];
  const char* arg = line + 2;
  if (cmd == 'f') {
    while (*arg == ' ') {
      ++arg;
    }
    session.SetFilter(arg);
    return KeyResult::kContinue;
  }
  if (*arg != '\0') {
    sink.PrintLine(kRed, "Unknown command, :? for help");
    return KeyResult::kContinue;
  }

  switch (cmd) {
    case 'q':
      return KeyResult::kQuit;
    case 'p':
      session.TogglePause();
      break;
    case 'h':
      session.ToggleHex();
      break;
    case 'e':
      session.ToggleEcho();
      break;
    case 'l':
      session.CycleLineEnding();
      break;
    case 'r':
      session.ToggleAutoReconnect();
      break;
    case 'R':
      session.ForceReconnect();
      break;
    case 's':
      sink.PrintStatus(session.GetSnapshot());
      break;
    case '?':
      PrintHelp(sink);
      break;
    default:
      sink.PrintLine(kRed, "Unknown command, :? for help");
      break;
  }
  return KeyResult::kContinue;
}

}  // namespace console

#endif  // SCON_EXAMPLES_COMMAND_KEYS_HPP_
