/**
 * @file main.cpp
 * @brief scon: resilient serial console.
 *
 *   scon list
 *   scon [options] monitor <port>      (alias: read)
 *   scon [options] write <port> <data>
 *
 * The monitor keeps the port open across unplug/replug cycles with
 * exponential backoff. Input lines are sent to the port unless they are
 * ':' commands (see command_keys.hpp).
 */

#include "command_keys.hpp"
#include "console_sink.hpp"

#include "scon/config.hpp"
#include "scon/console_options.hpp"
#include "scon/event_loop.hpp"
#include "scon/line_framer.hpp"
#include "scon/log.hpp"
#include "scon/port_list.hpp"
#include "scon/posix_serial_port.hpp"
#include "scon/session.hpp"
#include "scon/shutdown.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>

#include <unistd.h>

static constexpr int kExitOk = 0;
static constexpr int kExitFailure = 1;
static constexpr int kExitUsage = 2;

// ============================================================================
// list
// ============================================================================

static int RunList() {
  scon::PortInfo ports[SCON_PORT_LIST_MAX];
  const uint32_t count = scon::ListPorts(ports, SCON_PORT_LIST_MAX);
  if (count == 0U) {
    std::printf("No serial ports found\n");
    return kExitOk;
  }
  std::printf("Found %u serial port(s):\n\n", count);
  for (uint32_t i = 0U; i < count; ++i) {
    if (ports[i].alias.empty()) {
      std::printf("%3u. %s\n", i + 1U, ports[i].path.c_str());
    } else {
      std::printf("%3u. %s  (%s)\n", i + 1U, ports[i].path.c_str(),
                  ports[i].alias.c_str());
    }
  }
  return kExitOk;
}

// ============================================================================
// write
// ============================================================================

struct OpenResult {
  bool done = false;
  bool ok = false;
  scon::PortFault fault;
};

static void OnWriteOpen(void* ctx, uint32_t /*tag*/,
                        const scon::PortFault* fault) {
  auto* r = static_cast<OpenResult*>(ctx);
  r->done = true;
  r->ok = (fault == nullptr);
  if (fault != nullptr) {
    r->fault = *fault;
  }
}

static int RunWrite(const scon::ConsoleOptions& opts) {
  scon::EventLoop loop;
  if (!loop.IsValid()) {
    std::fprintf(stderr, "Cannot create event loop: %s\n",
                 std::strerror(errno));
    return kExitFailure;
  }
  scon::PosixSerialPort port(loop);
  OpenResult result;
  scon::PortListener listener;
  listener.on_open = &OnWriteOpen;
  listener.ctx = &result;
  port.Subscribe(listener);
  port.Open(opts.session.port);
  if (!result.done || !result.ok) {
    std::fprintf(stderr, "%s\n", result.fault.message.c_str());
    return kExitFailure;
  }

  const char* data = opts.write_data;
  const auto data_len = static_cast<uint32_t>(std::strlen(data));
  const scon::LineEnding eol = opts.session.initial.line_ending;
  const uint32_t eol_len =
      opts.append_newline ? scon::LineEndingSize(eol) : 0U;
  if (data_len + eol_len > SCON_SESSION_MAX_SEND) {
    std::fprintf(stderr, "Data too long: %u bytes (limit %u)\n",
                 data_len + eol_len,
                 static_cast<unsigned>(SCON_SESSION_MAX_SEND));
    port.Unsubscribe();
    port.Close();
    return kExitFailure;
  }
  uint8_t frame[SCON_SESSION_MAX_SEND];
  std::memcpy(frame, data, data_len);
  if (eol_len > 0U) {
    std::memcpy(frame + data_len, scon::LineEndingBytes(eol), eol_len);
  }

  auto written = port.Write(frame, data_len + eol_len);
  port.Unsubscribe();
  port.Close();
  if (!written.has_value()) {
    std::fprintf(stderr, "Write failed: %s\n",
                 written.get_error().message.c_str());
    return kExitFailure;
  }
  std::printf("Wrote %u bytes to %s\n", written.value(),
              opts.session.port.path.c_str());
  return kExitOk;
}

// ============================================================================
// monitor
// ============================================================================

struct MonitorApp {
  scon::EventLoop* loop = nullptr;
  scon::Session* session = nullptr;
  console::ConsoleSink* sink = nullptr;
  scon::ShutdownManager* shutdown = nullptr;
  scon::LineFramer input;
};

static void OnQuit(int signo, void* ctx) {
  auto* app = static_cast<MonitorApp*>(ctx);
  SCON_LOG_DEBUG("Console", "quit (signal %d)", signo);
  app->session->Shutdown();
  app->loop->Stop();
}

static void OnInputLine(const char* line, uint32_t len, void* ctx) {
  auto* app = static_cast<MonitorApp*>(ctx);
  if (app->shutdown->IsShutdownRequested()) {
    return;
  }
  char buf[SCON_SESSION_MAX_SEND];
  const uint32_t n = (len < sizeof(buf) - 1U)
                         ? len
                         : static_cast<uint32_t>(sizeof(buf) - 1U);
  std::memcpy(buf, line, n);
  buf[n] = '\0';
  if (console::HandleLine(*app->session, *app->sink, buf) ==
      console::KeyResult::kQuit) {
    app->shutdown->Quit();
  }
}

static void OnStdin(int32_t fd, uint8_t /*events*/, void* ctx) {
  auto* app = static_cast<MonitorApp*>(ctx);
  uint8_t buf[512];
  const ssize_t n = ::read(fd, buf, sizeof(buf));
  if (n > 0) {
    (void)app->input.Feed(buf, static_cast<uint32_t>(n), &OnInputLine, app);
    return;
  }
  if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
    return;
  }
  // EOF: keep monitoring, stop reading.
  (void)app->input.Flush(&OnInputLine, app);
  (void)app->loop->Unwatch(fd);
  SCON_LOG_DEBUG("Console", "stdin closed");
}

static int RunMonitor(const scon::ConsoleOptions& opts) {
  scon::EventLoop loop;
  if (!loop.IsValid()) {
    std::fprintf(stderr, "Cannot create event loop: %s\n",
                 std::strerror(errno));
    return kExitFailure;
  }
  scon::PosixPortFactory factory(loop);
  console::ConsoleSink sink(stdout);
  scon::Session session(loop, factory, opts.session,
                        &console::ConsoleSink::OnEvent, &sink);
  scon::ShutdownManager shutdown(loop);
  if (!shutdown.IsValid()) {
    std::fprintf(stderr, "Cannot set up signal handling\n");
    return kExitFailure;
  }

  MonitorApp app;
  app.loop = &loop;
  app.session = &session;
  app.sink = &sink;
  app.shutdown = &shutdown;

  if (!shutdown.Register(&OnQuit, &app).has_value() ||
      !shutdown.InstallSignalHandlers().has_value()) {
    std::fprintf(stderr, "Cannot install signal handlers\n");
    return kExitFailure;
  }
  if (!loop.Watch(STDIN_FILENO, static_cast<uint8_t>(scon::IoEvent::kReadable),
                  &OnStdin, &app)
           .has_value()) {
    SCON_LOG_WARN("Console", "stdin not watchable, running receive-only");
  }

  char banner[160];
  (void)std::snprintf(banner, sizeof(banner),
                      "Monitoring %s at %u baud. Type :? for help, Ctrl+C "
                      "to quit.",
                      opts.session.port.path.c_str(),
                      opts.session.port.baud_rate);
  sink.PrintLine(console::kCyan, banner);

  session.Start();
  auto r = loop.Run();
  session.Shutdown();
  sink.Finish();
  if (!r.has_value()) {
    std::fprintf(stderr, "Event loop failed (error %u)\n",
                 static_cast<unsigned>(r.get_error()));
    return kExitFailure;
  }
  return kExitOk;
}

// ============================================================================
// main
// ============================================================================

int main(int argc, char* argv[]) {
  scon::log::Init(scon::log::Level::kWarn);

  scon::ConsoleConfig cfg;
  scon::ConsoleOptions opts;

  const char* config_path = scon::FindConfigArg(argc, argv);
  if (config_path != nullptr &&
      !scon::LoadConfig(cfg, config_path).has_value()) {
    std::fprintf(stderr, "Cannot load config '%s'\n", config_path);
    return kExitUsage;
  }

  auto parsed = scon::ParseArgs(argc, argv, cfg, opts);
  if (!parsed.has_value()) {
    std::fprintf(stderr, "%s%s%s\n\n", scon::ArgErrorName(parsed.get_error()),
                 (opts.bad_token != nullptr) ? ": " : "",
                 (opts.bad_token != nullptr) ? opts.bad_token : "");
    scon::PrintUsage(stderr, argv[0]);
    return kExitUsage;
  }
  if (opts.command == scon::ConsoleCommand::kHelp) {
    scon::PrintUsage(stdout, argv[0]);
    return kExitOk;
  }
  if (!scon::ApplyConfig(cfg, opts).has_value()) {
    std::fprintf(stderr, "Invalid option value (see log above)\n");
    return kExitUsage;
  }
  scon::log::SetLevel(opts.log_level);

  int rc = kExitOk;
  switch (opts.command) {
    case scon::ConsoleCommand::kList:
      rc = RunList();
      break;
    case scon::ConsoleCommand::kWrite:
      rc = RunWrite(opts);
      break;
    case scon::ConsoleCommand::kMonitor:
      rc = RunMonitor(opts);
      break;
    default:
      scon::PrintUsage(stderr, argv[0]);
      rc = kExitUsage;
      break;
  }
  scon::log::Shutdown();
  return rc;
}
