/**
 * @file console_options.hpp
 * @brief Console options: config file sections and command-line flags
 *        mapped onto SessionOptions.
 *
 * Both sources land in one ConfigStore. Flags are written with Set() after
 * the file is loaded, so the command line always wins; ApplyConfig() then
 * maps the merged store in a single pass.
 *
 * @code
 *   scon::ConsoleConfig cfg;
 *   scon::ConsoleOptions opts;
 *   const char* path = scon::FindConfigArg(argc, argv);
 *   if (path != nullptr) (void)scon::LoadConfig(cfg, path);
 *   auto r = scon::ParseArgs(argc, argv, cfg, opts);
 *   if (r.has_value()) r = scon::ApplyConfig(cfg, opts);
 * @endcode
 */

#ifndef SCON_CONSOLE_OPTIONS_HPP_
#define SCON_CONSOLE_OPTIONS_HPP_

#include "scon/config.hpp"
#include "scon/line_ending.hpp"
#include "scon/log.hpp"
#include "scon/platform.hpp"
#include "scon/serial_port.hpp"
#include "scon/session.hpp"
#include "scon/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace scon {

enum class ConsoleCommand : uint8_t {
  kNone = 0,
  kHelp,
  kList,
  kMonitor,
  kWrite,
};

enum class ArgError : uint8_t {
  kNoCommand = 0,
  kUnknownCommand,
  kUnknownOption,
  kMissingValue,
  kMissingPort,
  kMissingData,
  kTooManyArgs,
};

inline const char* ArgErrorName(ArgError e) noexcept {
  switch (e) {
    case ArgError::kNoCommand:
      return "no command given";
    case ArgError::kUnknownCommand:
      return "unknown command";
    case ArgError::kUnknownOption:
      return "unknown option";
    case ArgError::kMissingValue:
      return "option requires a value";
    case ArgError::kMissingPort:
      return "missing <port>";
    case ArgError::kMissingData:
      return "missing <data>";
    case ArgError::kTooManyArgs:
      return "too many arguments";
    default:
      return "unknown";
  }
}

struct ConsoleOptions {
  ConsoleCommand command = ConsoleCommand::kNone;
  SessionOptions session;
  log::Level log_level = log::Level::kWarn;
  bool append_newline = false;     ///< write: add the line ending to data.
  const char* write_data = nullptr;  ///< write: points into argv.
  const char* bad_token = nullptr;   ///< Offending token after a failure.

  ConsoleOptions() noexcept { session.port.baud_rate = 9600U; }
};

// ============================================================================
// Value Parsers
// ============================================================================

inline optional<Parity> ParseParity(const char* s) noexcept {
  if (detail::StrCaseEqual(s, "none") || detail::StrCaseEqual(s, "n")) {
    return Parity::kNone;
  }
  if (detail::StrCaseEqual(s, "odd") || detail::StrCaseEqual(s, "o")) {
    return Parity::kOdd;
  }
  if (detail::StrCaseEqual(s, "even") || detail::StrCaseEqual(s, "e")) {
    return Parity::kEven;
  }
  return {};
}

inline optional<FlowControl> ParseFlowControl(const char* s) noexcept {
  if (detail::StrCaseEqual(s, "none")) {
    return FlowControl::kNone;
  }
  if (detail::StrCaseEqual(s, "hw") || detail::StrCaseEqual(s, "hardware") ||
      detail::StrCaseEqual(s, "rtscts")) {
    return FlowControl::kHardware;
  }
  if (detail::StrCaseEqual(s, "sw") || detail::StrCaseEqual(s, "software") ||
      detail::StrCaseEqual(s, "xonxoff")) {
    return FlowControl::kSoftware;
  }
  return {};
}

// ============================================================================
// ApplyConfig
// ============================================================================

namespace detail {

inline bool ReadBool(const ConfigStore& cfg, const char* section,
                     const char* key, bool& out) noexcept {
  if (!cfg.HasKey(section, key)) {
    return true;
  }
  const optional<bool> v = cfg.FindBool(section, key);
  if (!v.has_value()) {
    SCON_LOG_WARN("Config", "[%s] %s: expected a boolean, got '%s'", section,
                  key, cfg.GetString(section, key));
    return false;
  }
  out = v.value();
  return true;
}

inline bool ReadUint(const ConfigStore& cfg, const char* section,
                     const char* key, uint32_t& out) noexcept {
  if (!cfg.HasKey(section, key)) {
    return true;
  }
  const char* raw = cfg.GetString(section, key);
  char* end = nullptr;
  const long long v = std::strtoll(raw, &end, 10);
  if (end == raw || *end != '\0' || v < 0 || v > 0xFFFFFFFFLL) {
    SCON_LOG_WARN("Config", "[%s] %s: expected an unsigned integer, got '%s'",
                  section, key, raw);
    return false;
  }
  out = static_cast<uint32_t>(v);
  return true;
}

}  // namespace detail

/**
 * @brief Map [serial] [session] [backoff] [log] onto @p opts.
 *
 * Keys that are absent leave the current value alone. The first malformed
 * value stops the mapping with kParseError.
 */
inline expected<void, ConfigError> ApplyConfig(const ConfigStore& cfg,
                                               ConsoleOptions& opts) {
  SessionOptions& s = opts.session;
  bool ok = true;

  // [serial]
  if (cfg.HasKey("serial", "port")) {
    s.port.path.assign(TruncateToCapacity, cfg.GetString("serial", "port"));
  }
  ok = ok && detail::ReadUint(cfg, "serial", "baud", s.port.baud_rate);
  uint32_t bits = s.port.data_bits;
  ok = ok && detail::ReadUint(cfg, "serial", "data_bits", bits);
  if (ok && (bits < 5U || bits > 8U)) {
    SCON_LOG_WARN("Config", "[serial] data_bits must be 5..8, got %u", bits);
    ok = false;
  }
  s.port.data_bits = static_cast<uint8_t>(bits);
  uint32_t stop = s.port.stop_bits;
  ok = ok && detail::ReadUint(cfg, "serial", "stop_bits", stop);
  if (ok && stop != 1U && stop != 2U) {
    SCON_LOG_WARN("Config", "[serial] stop_bits must be 1 or 2, got %u", stop);
    ok = false;
  }
  s.port.stop_bits = static_cast<uint8_t>(stop);
  if (ok && cfg.HasKey("serial", "parity")) {
    const auto p = ParseParity(cfg.GetString("serial", "parity"));
    ok = p.has_value();
    s.port.parity = p.value_or(s.port.parity);
  }
  if (ok && cfg.HasKey("serial", "flow_control")) {
    const auto f = ParseFlowControl(cfg.GetString("serial", "flow_control"));
    ok = f.has_value();
    s.port.flow_control = f.value_or(s.port.flow_control);
  }

  // [session]
  SessionConfig& init = s.initial;
  ok = ok && detail::ReadBool(cfg, "session", "auto_reconnect",
                              init.auto_reconnect);
  ok = ok && detail::ReadBool(cfg, "session", "echo", init.echo);
  ok = ok && detail::ReadBool(cfg, "session", "hex", init.show_hex);
  ok = ok && detail::ReadBool(cfg, "session", "pause", init.paused);
  if (ok && cfg.HasKey("session", "line_ending")) {
    const auto le = ParseLineEnding(cfg.GetString("session", "line_ending"));
    ok = le.has_value();
    init.line_ending = le.value_or(init.line_ending);
  }
  if (ok && cfg.HasKey("session", "filter")) {
    const char* text = cfg.GetString("session", "filter");
    ok = MessageFilter::Fits(text);
    if (ok) {
      init.filter.text.assign(TruncateToCapacity, text);
      init.filter.enabled = !init.filter.text.empty();
    } else {
      SCON_LOG_WARN("Config", "[session] filter: longer than %u characters",
                    static_cast<unsigned>(SCON_FILTER_MAX_LEN));
    }
  }
  ok = ok && detail::ReadUint(cfg, "session", "connect_timeout_ms",
                              s.connect_timeout_ms);
  ok = ok && detail::ReadUint(cfg, "session", "stats_interval_ms",
                              s.stats_interval_ms);

  // [backoff]
  ok = ok && detail::ReadUint(cfg, "backoff", "base_delay_ms",
                              s.backoff.base_delay_ms);
  ok = ok && detail::ReadUint(cfg, "backoff", "cap_exponent",
                              s.backoff.cap_exponent);
  ok = ok && detail::ReadUint(cfg, "backoff", "max_delay_ms",
                              s.backoff.max_delay_ms);

  // [log]
  if (ok && cfg.HasKey("log", "level")) {
    const char* name = cfg.GetString("log", "level");
    // Two fallbacks tell an unknown name apart from a real level.
    const log::Level a = log::ParseLevel(name, log::Level::kDebug);
    const log::Level b = log::ParseLevel(name, log::Level::kOff);
    ok = (a == b);
    if (ok) {
      opts.log_level = a;
    }
  }

  if (!ok) {
    SCON_LOG_WARN("Config", "invalid configuration value");
    return expected<void, ConfigError>::error(ConfigError::kParseError);
  }
  return expected<void, ConfigError>::success();
}

/**
 * @brief Load @p path into @p cfg. A missing or malformed file is logged
 *        and reported; the caller decides whether that is fatal.
 */
template <typename... Backends>
inline expected<void, ConfigError> LoadConfig(Config<Backends...>& cfg,
                                              const char* path) {
  auto r = cfg.LoadFile(path);
  if (!r.has_value()) {
    SCON_LOG_WARN("Config", "Cannot load '%s' (error %u)", path,
                  static_cast<unsigned>(r.get_error()));
    return r;
  }
  SCON_LOG_INFO("Config", "Loaded configuration from '%s'", path);
  return r;
}

inline const char* FindConfigArg(int argc, char* argv[]) {
  for (int i = 1; i < argc - 1; ++i) {
    if (std::strcmp(argv[i], "--config") == 0) {
      return argv[i + 1];
    }
  }
  return nullptr;
}

// ============================================================================
// ParseArgs
// ============================================================================

namespace detail {

struct FlagMap {
  const char* long_name;
  const char* short_name;  ///< nullptr if none.
  const char* section;
  const char* key;
  const char* fixed;  ///< Value for switches; nullptr = takes an argument.
};

static constexpr FlagMap kFlags[] = {
    {"--baud", "-b", "serial", "baud", nullptr},
    {"--data-bits", nullptr, "serial", "data_bits", nullptr},
    {"--stop-bits", nullptr, "serial", "stop_bits", nullptr},
    {"--parity", nullptr, "serial", "parity", nullptr},
    {"--flow", nullptr, "serial", "flow_control", nullptr},
    {"--line-ending", nullptr, "session", "line_ending", nullptr},
    {"--filter", nullptr, "session", "filter", nullptr},
    {"--connect-timeout", nullptr, "session", "connect_timeout_ms", nullptr},
    {"--stats-interval", nullptr, "session", "stats_interval_ms", nullptr},
    {"--hex", "-x", "session", "hex", "true"},
    {"--echo", "-e", "session", "echo", "true"},
    {"--no-reconnect", nullptr, "session", "auto_reconnect", "false"},
    {"--log-level", "-v", "log", "level", nullptr},
};

inline const FlagMap* FindFlag(const char* arg) noexcept {
  for (const FlagMap& f : kFlags) {
    if (std::strcmp(arg, f.long_name) == 0 ||
        (f.short_name != nullptr && std::strcmp(arg, f.short_name) == 0)) {
      return &f;
    }
  }
  return nullptr;
}

inline ConsoleCommand ParseCommand(const char* word) noexcept {
  if (std::strcmp(word, "list") == 0 || std::strcmp(word, "ls") == 0) {
    return ConsoleCommand::kList;
  }
  if (std::strcmp(word, "monitor") == 0 || std::strcmp(word, "mon") == 0 ||
      std::strcmp(word, "m") == 0 || std::strcmp(word, "read") == 0 ||
      std::strcmp(word, "r") == 0) {
    return ConsoleCommand::kMonitor;
  }
  if (std::strcmp(word, "write") == 0 || std::strcmp(word, "w") == 0) {
    return ConsoleCommand::kWrite;
  }
  if (std::strcmp(word, "help") == 0) {
    return ConsoleCommand::kHelp;
  }
  return ConsoleCommand::kNone;
}

}  // namespace detail

/**
 * @brief Parse `[options] <command> [<port> [<data>]]`.
 *
 * Option values are stored into @p cfg (overriding the config file); the
 * command word and its positionals go to @p opts. On failure
 * opts.bad_token names the offending argument.
 */
inline expected<void, ArgError> ParseArgs(int argc, char* argv[],
                                          ConfigStore& cfg,
                                          ConsoleOptions& opts) {
  const char* positional[3] = {nullptr, nullptr, nullptr};
  uint32_t npos = 0U;

  auto fail = [&opts](ArgError e, const char* token) {
    opts.bad_token = token;
    return expected<void, ArgError>::error(e);
  };

  for (int i = 1; i < argc; ++i) {
    const char* arg = argv[i];
    if (std::strcmp(arg, "--config") == 0) {
      if (i + 1 >= argc) {
        return fail(ArgError::kMissingValue, arg);
      }
      ++i;  // consumed by FindConfigArg
      continue;
    }
    if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
      opts.command = ConsoleCommand::kHelp;
      return expected<void, ArgError>::success();
    }
    if (std::strcmp(arg, "-n") == 0 || std::strcmp(arg, "--newline") == 0) {
      opts.append_newline = true;
      continue;
    }
    if (arg[0] == '-' && arg[1] != '\0') {
      const detail::FlagMap* flag = detail::FindFlag(arg);
      if (flag == nullptr) {
        return fail(ArgError::kUnknownOption, arg);
      }
      const char* value = flag->fixed;
      if (value == nullptr) {
        if (i + 1 >= argc) {
          return fail(ArgError::kMissingValue, arg);
        }
        value = argv[++i];
      }
      if (!cfg.Set(flag->section, flag->key, value)) {
        return fail(ArgError::kTooManyArgs, arg);
      }
      continue;
    }
    if (npos == 3U) {
      return fail(ArgError::kTooManyArgs, arg);
    }
    positional[npos++] = arg;
  }

  if (npos == 0U) {
    return fail(ArgError::kNoCommand, nullptr);
  }
  opts.command = detail::ParseCommand(positional[0]);
  switch (opts.command) {
    case ConsoleCommand::kNone:
      return fail(ArgError::kUnknownCommand, positional[0]);
    case ConsoleCommand::kHelp:
    case ConsoleCommand::kList:
      if (npos > 1U) {
        return fail(ArgError::kTooManyArgs, positional[1]);
      }
      break;
    case ConsoleCommand::kMonitor:
      if (npos > 2U) {
        return fail(ArgError::kTooManyArgs, positional[2]);
      }
      break;
    case ConsoleCommand::kWrite:
      if (npos < 2U) {
        return fail(ArgError::kMissingPort, positional[0]);
      }
      if (npos < 3U) {
        return fail(ArgError::kMissingData, positional[1]);
      }
      opts.write_data = positional[2];
      break;
  }

  if (opts.command == ConsoleCommand::kMonitor ||
      opts.command == ConsoleCommand::kWrite) {
    if (npos >= 2U) {
      (void)cfg.Set("serial", "port", positional[1]);
    } else if (!cfg.HasKey("serial", "port")) {
      return fail(ArgError::kMissingPort, positional[0]);
    }
  }
  return expected<void, ArgError>::success();
}

inline void PrintUsage(FILE* out, const char* prog) {
  (void)std::fprintf(
      out,
      "Usage: %s [options] <command>\n"
      "\n"
      "Commands:\n"
      "  list | ls                  List available serial ports\n"
      "  monitor | read <port>      Resilient console (auto-reconnect)\n"
      "  write <port> <data>        Write data to the port and exit\n"
      "\n"
      "Options:\n"
      "  --config <file>            Load settings (ini/json/yaml)\n"
      "  -b, --baud <rate>          Baud rate (default 9600)\n"
      "  --data-bits <5..8>         Data bits (default 8)\n"
      "  --stop-bits <1|2>          Stop bits (default 1)\n"
      "  --parity <none|odd|even>   Parity (default none)\n"
      "  --flow <none|hw|sw>        Flow control (default none)\n"
      "  --line-ending <LF|CR|CRLF> Line ending for sends (default LF)\n"
      "  --filter <text>            Show only lines containing text\n"
      "  --connect-timeout <ms>     Open timeout (default 5000)\n"
      "  --stats-interval <ms>      Status line period, 0 = off\n"
      "  -x, --hex                  Start with hex view on\n"
      "  -e, --echo                 Start with echo on\n"
      "  --no-reconnect             Start with auto-reconnect off\n"
      "  -n, --newline              write: append the line ending\n"
      "  -v, --log-level <level>    debug|info|warn|error|off\n"
      "  -h, --help                 Show this help\n",
      prog);
}

}  // namespace scon

#endif  // SCON_CONSOLE_OPTIONS_HPP_
