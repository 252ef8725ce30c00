/**
 * @file test_session.cpp
 * @brief Tests for session.hpp driven by a virtual clock and a fake port.
 */

#include "scon/session.hpp"

#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cerrno>
#include <memory>
#include <string>
#include <vector>

using scon::ConnectionState;
using scon_test::FakeFactory;
using scon_test::ManualScheduler;
using scon_test::OpenScript;
using scon_test::PortRecord;
using scon_test::RecordingSink;

namespace {

const char kEioMsg[] = "Cannot open /dev/ttyFAKE0: Input/output error";
const char kEaccesMsg[] = "Cannot open /dev/ttyFAKE0: Permission denied";

scon::SessionOptions DefaultOptions() {
  scon::SessionOptions opts;
  opts.port.path.assign(scon::TruncateToCapacity, "/dev/ttyFAKE0");
  opts.stats_interval_ms = 0U;
  return opts;
}

struct Harness {
  explicit Harness(const scon::SessionOptions& opts = DefaultOptions()) {
    session.reset(new scon::Session(sched, factory, opts, &RecordingSink::Fn,
                                    &sink));
  }

  scon::Session& S() { return *session; }

  ManualScheduler sched;
  FakeFactory factory;
  RecordingSink sink;
  std::unique_ptr<scon::Session> session;  // destroyed first
};

}  // namespace

// ============================================================================
// Connecting
// ============================================================================

TEST_CASE("session - Start connects and announces", "[session]") {
  Harness h;
  REQUIRE(h.S().State() == ConnectionState::kDisconnected);

  h.S().Start();

  REQUIRE(h.S().State() == ConnectionState::kConnected);
  REQUIRE(h.sink.States() == std::vector<ConnectionState>{
                                 ConnectionState::kConnecting,
                                 ConnectionState::kConnected});
  const auto* ev = h.sink.FindMessage("Connected to /dev/ttyFAKE0 at 115200 baud");
  REQUIRE(ev != nullptr);
  REQUIRE(ev->severity == scon::Severity::kSuccess);
  REQUIRE(ev->origin == scon::Origin::kSystem);
  REQUIRE(ev->timestamp_ms == ManualScheduler::kWallEpochMs + h.sched.NowMs());
  REQUIRE(h.factory.Created() == 1U);
  REQUIRE(h.S().HasHandle());
  // Connect timeout disarmed once open completed.
  REQUIRE(h.sched.ActiveTimers() == 0U);
}

TEST_CASE("session - Start twice opens one handle", "[session]") {
  Harness h;
  h.S().Start();
  h.S().Start();
  REQUIRE(h.factory.Created() == 1U);
  REQUIRE(h.S().State() == ConnectionState::kConnected);
}

TEST_CASE("session - deferred open completes later", "[session]") {
  Harness h;
  h.factory.Script(OpenScript::Defer());
  h.S().Start();
  REQUIRE(h.S().State() == ConnectionState::kConnecting);
  REQUIRE(h.sched.ActiveTimers() == 1U);

  h.sched.AdvanceMs(1200);
  h.factory.Last().CompleteOpen();

  REQUIRE(h.S().State() == ConnectionState::kConnected);
  REQUIRE(h.sched.ActiveTimers() == 0U);
}

TEST_CASE("session - connect timeout schedules a retry", "[session]") {
  Harness h;
  h.factory.Script(OpenScript::Defer());
  h.S().Start();

  h.sched.AdvanceMs(4999);
  REQUIRE(h.S().State() == ConnectionState::kConnecting);
  h.sched.AdvanceMs(1);

  REQUIRE(h.S().State() == ConnectionState::kReconnecting);
  REQUIRE(h.sink.HasMessage("Connect timeout after 5000 ms"));
  const scon::SessionSnapshot snap = h.S().GetSnapshot();
  REQUIRE(snap.reconnect.attempt == 1U);
  REQUIRE(snap.reconnect.delay_ms == 1000U);

  PortRecord& first = h.factory.At(0);
  REQUIRE(first.unsubscribe_calls == 1U);
  REQUIRE(!h.S().HasHandle());

  // The abandoned handle finishing its open late is ignored.
  first.captured.on_open(first.captured.ctx, first.captured.tag, nullptr);
  REQUIRE(h.S().StaleEvents() == 1U);
  REQUIRE(h.S().State() == ConnectionState::kReconnecting);
}

TEST_CASE("session - error while connecting counts as open failure",
          "[session]") {
  Harness h;
  h.factory.Script(OpenScript::Defer());
  h.S().Start();
  h.factory.Last().EmitError(EIO, "Input/output error");

  REQUIRE(h.S().State() == ConnectionState::kReconnecting);
  REQUIRE(h.sink.HasMessage(
      "Open failed: Input/output error. Reconnect attempt #1 starting in 1s..."));
}

TEST_CASE("session - missing handle from factory is transient", "[session]") {
  Harness h;
  h.factory.fail_create = true;
  h.S().Start();
  REQUIRE(h.S().State() == ConnectionState::kReconnecting);
  REQUIRE(h.sink.HasMessage("no port handle available"));

  h.factory.fail_create = false;
  h.sched.AdvanceMs(1000);
  REQUIRE(h.S().State() == ConnectionState::kConnected);
}

// ============================================================================
// Failure classification and backoff
// ============================================================================

TEST_CASE("session - permission denied on first open fails permanently",
          "[session]") {
  Harness h;
  h.factory.Script(OpenScript::Fail(EACCES, kEaccesMsg));
  h.S().Start();

  REQUIRE(h.S().State() == ConnectionState::kPermanentlyFailed);
  REQUIRE(h.sink.States() == std::vector<ConnectionState>{
                                 ConnectionState::kConnecting,
                                 ConnectionState::kPermanentlyFailed});
  REQUIRE(!h.S().Config().auto_reconnect);
  REQUIRE(h.S().Attempt() == 0U);
  REQUIRE(!h.S().HasHandle());
  REQUIRE(h.sched.ActiveTimers() == 0U);
  REQUIRE(h.sink.HasMessage("Permanent error - disabling auto-reconnect"));

  h.sched.AdvanceMs(120000);
  REQUIRE(h.factory.Created() == 1U);
  REQUIRE(h.S().State() == ConnectionState::kPermanentlyFailed);
}

TEST_CASE("session - busy marker in message is permanent", "[session]") {
  Harness h;
  h.factory.Script(OpenScript::Fail(0, "Error: Resource busy, cannot lock port"));
  h.S().Start();
  REQUIRE(h.S().State() == ConnectionState::kPermanentlyFailed);
}

TEST_CASE("session - transient failures back off 1s 2s 4s then connect",
          "[session]") {
  Harness h;
  for (int i = 0; i < 3; ++i) {
    h.factory.Script(OpenScript::Fail(EIO, kEioMsg));
  }
  h.S().Start();

  REQUIRE(h.S().State() == ConnectionState::kReconnecting);
  REQUIRE(h.S().Attempt() == 1U);
  REQUIRE(h.S().GetSnapshot().reconnect.delay_ms == 1000U);
  REQUIRE(h.sink.HasMessage("Reconnect attempt #1 starting in 1s..."));

  h.sched.AdvanceMs(999);
  REQUIRE(h.factory.Created() == 1U);
  h.sched.AdvanceMs(1);
  REQUIRE(h.factory.Created() == 2U);
  REQUIRE(h.S().Attempt() == 2U);
  REQUIRE(h.S().GetSnapshot().reconnect.delay_ms == 2000U);
  REQUIRE(h.sink.HasMessage("Reconnect attempt #2 starting in 2s..."));

  h.sched.AdvanceMs(2000);
  REQUIRE(h.S().Attempt() == 3U);
  REQUIRE(h.S().GetSnapshot().reconnect.delay_ms == 4000U);
  REQUIRE(h.sink.HasMessage("Reconnect attempt #3 starting in 4s..."));

  h.sched.AdvanceMs(4000);
  REQUIRE(h.S().State() == ConnectionState::kConnected);
  REQUIRE(h.S().Attempt() == 0U);
  REQUIRE(h.S().GetSnapshot().reconnect.delay_ms == 0U);
  REQUIRE(h.sink.HasMessage("Reconnected successfully after 3 attempts!"));
  REQUIRE(h.factory.overlapping_creates == 0U);
}

TEST_CASE("session - reconnect countdown in snapshot", "[session]") {
  Harness h;
  h.factory.Script(OpenScript::Fail(EIO, kEioMsg));
  h.factory.Script(OpenScript::Fail(EIO, kEioMsg));
  h.S().Start();

  h.sched.AdvanceMs(250);
  scon::SessionSnapshot snap = h.S().GetSnapshot();
  REQUIRE(snap.state == ConnectionState::kReconnecting);
  REQUIRE(snap.remaining_ms == 750U);
  REQUIRE(snap.remaining_s == 1U);

  h.sched.AdvanceMs(750);  // second attempt fails, 2000 ms delay
  h.sched.AdvanceMs(500);
  snap = h.S().GetSnapshot();
  REQUIRE(snap.reconnect.attempt == 2U);
  REQUIRE(snap.remaining_ms == 1500U);
  REQUIRE(snap.remaining_s == 2U);
}

// ============================================================================
// Link loss
// ============================================================================

TEST_CASE("session - unsolicited close reconnects with backoff", "[session]") {
  Harness h;
  h.S().Start();
  h.factory.Last().EmitClosed();

  REQUIRE(h.S().State() == ConnectionState::kReconnecting);
  const auto* ev = h.sink.FindMessage(
      "Port disconnected. Reconnect attempt #1 starting in 1s...");
  REQUIRE(ev != nullptr);
  REQUIRE(ev->severity == scon::Severity::kWarning);

  h.sched.AdvanceMs(1000);
  REQUIRE(h.S().State() == ConnectionState::kConnected);
  REQUIRE(h.sink.HasMessage("Reconnected successfully after 1 attempt!"));
}

TEST_CASE("session - runtime error is treated as link loss", "[session]") {
  Harness h;
  h.S().Start();
  h.factory.Last().EmitError(EIO, "Input/output error");

  REQUIRE(h.S().State() == ConnectionState::kReconnecting);
  REQUIRE(h.sink.HasMessage("Port error: Input/output error"));
}

TEST_CASE("session - link loss with auto-reconnect off goes idle",
          "[session]") {
  Harness h;
  h.S().Start();
  h.S().SetAutoReconnect(false);
  REQUIRE(h.S().State() == ConnectionState::kConnected);

  h.factory.Last().EmitClosed();
  REQUIRE(h.S().State() == ConnectionState::kDisconnected);
  REQUIRE(h.sink.HasMessage("Port disconnected"));
  REQUIRE(h.sched.ActiveTimers() == 0U);

  h.sched.AdvanceMs(60000);
  REQUIRE(h.factory.Created() == 1U);
}

TEST_CASE("session - partial line is flushed when the link drops",
          "[session]") {
  Harness h;
  h.S().Start();
  h.factory.Last().EmitData("abc");
  REQUIRE(h.sink.Messages(scon::Origin::kInbound).empty());

  h.factory.Last().EmitClosed();
  REQUIRE(h.sink.Messages(scon::Origin::kInbound) ==
          std::vector<std::string>{"abc"});
}

TEST_CASE("session - counters are cumulative across reconnects", "[session]") {
  Harness h;
  h.S().Start();
  h.factory.Last().EmitData("12345");
  h.factory.Last().EmitClosed();
  h.sched.AdvanceMs(1000);
  REQUIRE(h.S().State() == ConnectionState::kConnected);
  h.factory.Last().EmitData("678\n");

  REQUIRE(h.S().Stats().bytes_received == 9U);
  REQUIRE(h.S().Stats().messages_received == 2U);  // "12345" flushed + "678"
}

TEST_CASE("session - at most one open handle across many cycles",
          "[session]") {
  Harness h;
  h.S().Start();
  for (int i = 0; i < 6; ++i) {
    h.factory.Last().EmitClosed();
    REQUIRE(h.factory.OpenHandles() == 0U);
    h.sched.AdvanceMs(1000);
    REQUIRE(h.S().State() == ConnectionState::kConnected);
    REQUIRE(h.factory.OpenHandles() == 1U);
  }
  REQUIRE(h.factory.Created() == 7U);
  REQUIRE(h.factory.overlapping_creates == 0U);
}

// ============================================================================
// Auto-reconnect and ForceReconnect
// ============================================================================

TEST_CASE("session - disabling auto-reconnect cancels the pending retry",
          "[session]") {
  Harness h;
  h.factory.Script(OpenScript::Fail(EIO, kEioMsg));
  h.S().Start();
  REQUIRE(h.S().State() == ConnectionState::kReconnecting);
  REQUIRE(h.sched.ActiveTimers() == 1U);

  h.S().SetAutoReconnect(false);
  REQUIRE(h.S().State() == ConnectionState::kDisconnected);
  REQUIRE(h.sched.ActiveTimers() == 0U);
  REQUIRE(h.S().Attempt() == 0U);
  h.sched.AdvanceMs(10000);
  REQUIRE(h.factory.Created() == 1U);

  h.S().SetAutoReconnect(true);
  REQUIRE(h.S().State() == ConnectionState::kConnected);
  REQUIRE(h.factory.Created() == 2U);
}

TEST_CASE("session - enabling auto-reconnect leaves PermanentlyFailed",
          "[session]") {
  Harness h;
  h.factory.Script(OpenScript::Fail(EACCES, kEaccesMsg));
  h.S().Start();
  REQUIRE(h.S().State() == ConnectionState::kPermanentlyFailed);

  h.S().SetAutoReconnect(true);
  REQUIRE(h.S().State() == ConnectionState::kConnected);
  REQUIRE(h.S().Config().auto_reconnect);
}

TEST_CASE("session - ForceReconnect leaves PermanentlyFailed", "[session]") {
  Harness h;
  h.factory.Script(OpenScript::Fail(EACCES, kEaccesMsg));
  h.S().Start();

  h.S().ForceReconnect();
  REQUIRE(h.sink.HasMessage("Starting reconnection..."));
  REQUIRE(h.S().State() == ConnectionState::kConnected);
  REQUIRE(h.factory.Created() == 2U);
}

TEST_CASE("session - ForceReconnect cancels backoff without stacking",
          "[session]") {
  Harness h;
  h.factory.Script(OpenScript::Fail(EIO, kEioMsg));
  h.S().Start();
  REQUIRE(h.S().Attempt() == 1U);

  h.S().ForceReconnect();
  REQUIRE(h.S().State() == ConnectionState::kConnected);
  REQUIRE(h.S().Attempt() == 0U);
  REQUIRE(h.sched.ActiveTimers() == 0U);
  REQUIRE(h.factory.Created() == 2U);

  h.sched.AdvanceMs(30000);
  REQUIRE(h.factory.Created() == 2U);
}

TEST_CASE("session - ForceReconnect while connected replaces the handle",
          "[session]") {
  Harness h;
  h.S().Start();
  const uint32_t gen = h.S().Generation();

  h.S().ForceReconnect();
  REQUIRE(h.factory.Created() == 2U);
  REQUIRE(h.factory.At(0).unsubscribe_calls == 1U);
  REQUIRE(!h.factory.At(0).open);
  REQUIRE(h.factory.At(1).open);
  REQUIRE(h.S().Generation() > gen);
  REQUIRE(h.S().State() == ConnectionState::kConnected);
  REQUIRE(h.factory.overlapping_creates == 0U);
}

TEST_CASE("session - ForceReconnect before Start starts the session",
          "[session]") {
  Harness h;
  h.S().ForceReconnect();
  REQUIRE(h.S().IsStarted());
  REQUIRE(h.S().State() == ConnectionState::kConnected);
}

TEST_CASE("session - stale events from a replaced handle are dropped",
          "[session]") {
  Harness h;
  h.S().Start();
  PortRecord& old_port = h.factory.At(0);
  old_port.EmitData("a\n");
  h.S().ForceReconnect();

  old_port.EmitStaleData("late\n");
  old_port.EmitStaleClosed();

  REQUIRE(h.S().StaleEvents() == 2U);
  REQUIRE(h.S().State() == ConnectionState::kConnected);
  REQUIRE(h.S().Stats().bytes_received == 2U);
  REQUIRE(h.sink.Messages(scon::Origin::kInbound) ==
          std::vector<std::string>{"a"});
}

// ============================================================================
// Shutdown
// ============================================================================

TEST_CASE("session - Shutdown twice closes once", "[session]") {
  Harness h;
  h.S().Start();
  PortRecord& port = h.factory.Last();

  h.S().Shutdown();
  REQUIRE(h.S().State() == ConnectionState::kDisconnected);
  REQUIRE(port.close_calls == 1U);
  REQUIRE(!port.open);
  const size_t events = h.sink.events.size();

  h.S().Shutdown();
  REQUIRE(port.close_calls == 1U);
  REQUIRE(h.S().State() == ConnectionState::kDisconnected);
  REQUIRE(h.sink.events.size() == events);
}

TEST_CASE("session - Shutdown cancels the pending retry", "[session]") {
  Harness h;
  h.factory.Script(OpenScript::Fail(EIO, kEioMsg));
  h.S().Start();
  h.S().Shutdown();

  REQUIRE(h.S().State() == ConnectionState::kDisconnected);
  REQUIRE(h.sched.ActiveTimers() == 0U);
  h.sched.AdvanceMs(60000);
  REQUIRE(h.factory.Created() == 1U);
}

TEST_CASE("session - Shutdown before Start is a no-op", "[session]") {
  Harness h;
  h.S().Shutdown();
  REQUIRE(h.sink.events.empty());
  REQUIRE(h.factory.Created() == 0U);
}

TEST_CASE("session - destroying a connected session closes the port",
          "[session]") {
  Harness h;
  h.S().Start();
  PortRecord& port = h.factory.Last();
  h.session.reset();
  REQUIRE(!port.open);
  REQUIRE(port.destroyed);
}

// ============================================================================
// Inbound pipeline
// ============================================================================

TEST_CASE("session - bytes received is the sum of chunk lengths",
          "[session]") {
  Harness h;
  h.S().Start();
  PortRecord& port = h.factory.Last();

  port.EmitData("ab");
  port.EmitData("c\nde");
  h.S().SetPause(true);
  port.EmitData("\nf");
  h.S().SetPause(false);
  h.S().SetFilter("zzz");
  port.EmitData("gh");

  REQUIRE(h.S().Stats().bytes_received == 10U);
  REQUIRE(h.S().Stats().messages_received == 2U);
  REQUIRE(h.sink.Messages(scon::Origin::kInbound) ==
          std::vector<std::string>{"abc"});
}

TEST_CASE("session - pause suppresses data events but not errors",
          "[session]") {
  Harness h;
  h.S().Start();
  h.S().SetHex(true);
  h.S().SetPause(true);
  h.sink.Clear();

  h.factory.Last().EmitData("hello\n");
  REQUIRE(h.sink.Count(scon::SinkKind::kHex) == 0U);
  REQUIRE(h.sink.Messages(scon::Origin::kInbound).empty());
  REQUIRE(h.S().Stats().bytes_received == 6U);
  REQUIRE(h.S().Stats().messages_received == 1U);

  h.factory.Last().EmitError(EIO, "Input/output error");
  REQUIRE(h.sink.HasMessage("Port error: Input/output error"));
  REQUIRE(h.sink.Count(scon::SinkKind::kStateChange) == 1U);
  REQUIRE(h.S().State() == ConnectionState::kReconnecting);
}

TEST_CASE("session - filter delivers matching lines only", "[session]") {
  Harness h;
  h.S().Start();
  h.S().SetFilter("temp");
  REQUIRE(h.sink.HasMessage("Filter enabled: \"temp\""));
  REQUIRE(h.S().Config().filter.enabled);

  h.factory.Last().EmitData("Temperature: 23.5C\nStatus OK\n");
  REQUIRE(h.sink.Messages(scon::Origin::kInbound) ==
          std::vector<std::string>{"Temperature: 23.5C"});
  REQUIRE(h.S().Stats().messages_received == 2U);

  h.S().SetFilter("");
  REQUIRE(h.sink.HasMessage("Filter disabled"));
  REQUIRE(!h.S().Config().filter.enabled);
}

TEST_CASE("session - overlong filter is refused and the old one kept",
          "[session]") {
  Harness h;
  h.S().Start();
  h.S().SetFilter("temp");
  h.sink.Clear();

  const std::string too_long = "temp" + std::string(SCON_FILTER_MAX_LEN, 'x');
  h.S().SetFilter(too_long.c_str());
  REQUIRE(h.sink.HasMessage("Filter rejected: longer than 63 characters"));
  REQUIRE(!h.sink.HasMessage("Filter enabled"));
  REQUIRE(h.S().Config().filter.enabled);
  REQUIRE(std::string(h.S().Config().filter.text.c_str()) == "temp");

  h.factory.Last().EmitData("Temperature: 23.5C\nStatus OK\n");
  REQUIRE(h.sink.Messages(scon::Origin::kInbound) ==
          std::vector<std::string>{"Temperature: 23.5C"});
}

TEST_CASE("session - hex view emits each chunk verbatim", "[session]") {
  Harness h;
  h.S().Start();
  h.S().SetHex(true);
  h.factory.Last().EmitData("He\n");

  REQUIRE(h.sink.Count(scon::SinkKind::kHex) == 1U);
  for (const auto& e : h.sink.events) {
    if (e.kind == scon::SinkKind::kHex) {
      REQUIRE(e.text == "48 65 0A");
      REQUIRE(e.data == "He\n");
      REQUIRE(e.origin == scon::Origin::kInbound);
    }
  }
  REQUIRE(h.sink.Messages(scon::Origin::kInbound) ==
          std::vector<std::string>{"He"});
}

// ============================================================================
// Sending
// ============================================================================

TEST_CASE("session - send ping with CRLF writes six bytes", "[session]") {
  Harness h;
  h.S().Start();

  auto r = h.S().Send("ping", scon::LineEnding::kCrLf);
  REQUIRE(r.has_value());
  REQUIRE(r.value() == 6U);
  REQUIRE(h.factory.Last().written == "ping\r\n");
  REQUIRE(h.S().Stats().bytes_sent == 6U);
}

TEST_CASE("session - send uses the configured line ending", "[session]") {
  Harness h;
  h.S().Start();
  REQUIRE(h.S().Send("x").has_value());
  h.S().CycleLineEnding();
  REQUIRE(h.S().Config().line_ending == scon::LineEnding::kCr);
  REQUIRE(h.S().Send("y").has_value());
  REQUIRE(h.factory.Last().written == "x\ny\r");
  REQUIRE(h.S().Stats().bytes_sent == 4U);
}

TEST_CASE("session - send while disconnected is rejected", "[session]") {
  Harness h;
  auto r = h.S().Send("ping");
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == scon::SessionError::kNotConnected);
  REQUIRE(h.sink.HasMessage("Port not connected. Cannot send data."));
  REQUIRE(h.S().Stats().bytes_sent == 0U);
}

TEST_CASE("session - driver write failure keeps the connection", "[session]") {
  Harness h;
  h.S().Start();
  h.factory.Last().fail_writes = true;

  auto r = h.S().Send("ping");
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == scon::SessionError::kWriteFailed);
  REQUIRE(h.S().State() == ConnectionState::kConnected);
  REQUIRE(h.sink.HasMessage("Send failed: Input/output error"));
  REQUIRE(h.S().Stats().bytes_sent == 0U);
}

TEST_CASE("session - oversized payload is rejected", "[session]") {
  Harness h;
  h.S().Start();
  const std::string big(SCON_SESSION_MAX_SEND, 'a');
  auto r = h.S().Send(big.c_str());
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == scon::SessionError::kPayloadTooLarge);
  REQUIRE(h.factory.Last().written.empty());
}

TEST_CASE("session - echo reports sent data", "[session]") {
  Harness h;
  h.S().Start();
  h.S().SetEcho(true);
  REQUIRE(h.S().Send("hi").has_value());

  const uint8_t raw[] = {0x01, 0xAB};
  REQUIRE(h.S().SendRaw(raw, sizeof(raw)).has_value());

  REQUIRE(h.sink.Messages(scon::Origin::kOutbound) ==
          std::vector<std::string>{"\xE2\x86\x92 hi", "\xE2\x86\x92 01 AB"});
  REQUIRE(h.S().Stats().bytes_sent == 5U);
}

// ============================================================================
// Toggles and stats ticks
// ============================================================================

TEST_CASE("session - each toggle emits one notice", "[session]") {
  Harness h;
  h.S().Start();

  struct Case {
    void (scon::Session::*toggle)();
    const char* text;
  };
  const Case cases[] = {
      {&scon::Session::TogglePause, "Logging paused"},
      {&scon::Session::TogglePause, "Logging resumed"},
      {&scon::Session::ToggleHex, "Hex view enabled"},
      {&scon::Session::ToggleEcho, "Echo mode enabled"},
      {&scon::Session::CycleLineEnding, "Line ending changed to CR"},
      {&scon::Session::CycleLineEnding, "Line ending changed to CRLF"},
      {&scon::Session::CycleLineEnding, "Line ending changed to LF"},
      {&scon::Session::ToggleAutoReconnect, "Auto-reconnect disabled"},
      {&scon::Session::ToggleAutoReconnect, "Auto-reconnect enabled"},
  };
  for (const Case& c : cases) {
    h.sink.Clear();
    (h.S().*c.toggle)();
    REQUIRE(h.sink.events.size() == 1U);
    REQUIRE(h.sink.events[0].text == c.text);
    REQUIRE(h.sink.events[0].origin == scon::Origin::kSystem);
  }
  REQUIRE(h.S().State() == ConnectionState::kConnected);
}

TEST_CASE("session - setting the current value is silent", "[session]") {
  Harness h;
  h.S().SetPause(false);
  h.S().SetHex(false);
  h.S().SetEcho(false);
  h.S().SetLineEnding(scon::LineEnding::kLf);
  h.S().SetAutoReconnect(true);
  REQUIRE(h.sink.events.empty());
}

TEST_CASE("session - stats ticks carry a snapshot", "[session]") {
  scon::SessionOptions opts = DefaultOptions();
  opts.stats_interval_ms = 1000U;
  Harness h(opts);
  h.S().Start();
  h.factory.Last().EmitData("0123456789\n");
  h.sink.Clear();

  h.sched.AdvanceMs(1000);
  REQUIRE(h.sink.Count(scon::SinkKind::kStatsTick) == 1U);
  const auto& tick = h.sink.events.back();
  REQUIRE(tick.has_snapshot);
  REQUIRE(tick.snapshot.state == ConnectionState::kConnected);
  REQUIRE(std::string(tick.snapshot.port_path.c_str()) == "/dev/ttyFAKE0");
  REQUIRE(tick.snapshot.baud_rate == 115200U);
  REQUIRE(tick.snapshot.stats.bytes_received == 11U);
  REQUIRE(tick.snapshot.uptime_s == 1U);

  h.sched.AdvanceMs(2000);
  REQUIRE(h.sink.Count(scon::SinkKind::kStatsTick) == 3U);

  h.S().Shutdown();
  h.sched.AdvanceMs(5000);
  REQUIRE(h.sink.Count(scon::SinkKind::kStatsTick) == 3U);
}

TEST_CASE("session - rates divide by whole seconds of uptime", "[session]") {
  Harness h;
  h.S().Start();
  h.factory.Last().EmitData(std::string(100, 'x'));
  REQUIRE(h.S().Send("abcdefghi").has_value());  // 10 bytes with LF

  scon::SessionSnapshot snap = h.S().GetSnapshot();
  REQUIRE(snap.uptime_s == 0U);
  REQUIRE(snap.rx_rate == 100.0);

  h.sched.AdvanceMs(2500);
  snap = h.S().GetSnapshot();
  REQUIRE(snap.uptime_s == 2U);
  REQUIRE(snap.rx_rate == 50.0);
  REQUIRE(snap.tx_rate == 5.0);
}

// ============================================================================
// Re-entrant commands from inside a port callback
// ============================================================================

TEST_CASE("session - Shutdown from a link-loss notice keeps the failing handle",
          "[session]") {
  Harness h;
  h.S().Start();
  PortRecord& rec = h.factory.Last();
  scon::Session* s = h.session.get();
  h.sink.on_event = [s](const scon_test::RecordedEvent& ev) {
    if (ev.text.find("Reconnect attempt") != std::string::npos) {
      s->Shutdown();
    }
  };

  rec.FailLink(EIO, "Input/output error");

  REQUIRE(!rec.destroyed_in_callback);
  REQUIRE(h.S().State() == ConnectionState::kDisconnected);
  REQUIRE(!h.S().HasHandle());
  REQUIRE(h.sched.ActiveTimers() == 0U);

  h.sink.on_event = nullptr;
  h.session.reset();
  REQUIRE(rec.destroyed);
}

TEST_CASE("session - ForceReconnect from a link-loss notice replaces the handle",
          "[session]") {
  Harness h;
  h.S().Start();
  PortRecord& first = h.factory.Last();
  scon::Session* s = h.session.get();
  bool fired = false;
  h.sink.on_event = [s, &fired](const scon_test::RecordedEvent& ev) {
    if (!fired && ev.text.find("Port error") != std::string::npos) {
      fired = true;
      s->ForceReconnect();
    }
  };

  first.FailLink(EIO, "Input/output error");

  REQUIRE(fired);
  REQUIRE(!first.destroyed_in_callback);
  REQUIRE(h.S().State() == ConnectionState::kConnected);
  REQUIRE(h.factory.Created() == 2U);
  REQUIRE(h.factory.OpenHandles() == 1U);
  REQUIRE(h.sched.ActiveTimers() == 0U);

  // The retired handle goes with the next teardown outside a port callback.
  h.sink.on_event = nullptr;
  h.S().ForceReconnect();
  REQUIRE(first.destroyed);
  REQUIRE(h.S().State() == ConnectionState::kConnected);
}

TEST_CASE("session - unschedulable retry from a port callback goes idle",
          "[session]") {
  Harness h;
  h.S().Start();
  PortRecord& rec = h.factory.Last();
  h.sched.fail_once_timers = true;

  rec.FailLink(EIO, "Input/output error");

  REQUIRE(!rec.destroyed_in_callback);
  REQUIRE(h.S().State() == ConnectionState::kDisconnected);
  REQUIRE(!h.S().Config().auto_reconnect);
  REQUIRE(h.sink.HasMessage("Cannot schedule reconnect"));
  REQUIRE(h.factory.OpenHandles() == 0U);
}
