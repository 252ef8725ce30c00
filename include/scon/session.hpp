/**
 * @file session.hpp
 * @brief Serial console session: connection lifecycle, resilient reconnect,
 *        inbound framing and the sink event feed.
 *
 * State graph:
 *
 *   Disconnected --Start/ForceReconnect/auto-reconnect on--> Connecting
 *   Connecting   --open ok--> Connected
 *   Connecting   --open failed/timeout--> Reconnecting | Disconnected
 *                                         | PermanentlyFailed
 *   Connected    --link lost--> Reconnecting | Disconnected
 *   Reconnecting --backoff elapsed--> Connecting
 *   Reconnecting --auto-reconnect off--> Disconnected
 *   PermanentlyFailed --ForceReconnect/auto-reconnect on--> Connecting
 *   any          --Shutdown--> Disconnected
 *
 * Handle replacement is teardown-then-create. Each new handle gets a fresh
 * generation which its listener echoes back as the tag; callbacks carrying
 * any other tag are dropped and counted as stale.
 *
 * All methods must be called from the Scheduler's thread.
 */

#ifndef SCON_SESSION_HPP_
#define SCON_SESSION_HPP_

#include "scon/backoff.hpp"
#include "scon/failure_classifier.hpp"
#include "scon/fsm.hpp"
#include "scon/line_ending.hpp"
#include "scon/line_framer.hpp"
#include "scon/log.hpp"
#include "scon/message_filter.hpp"
#include "scon/platform.hpp"
#include "scon/scheduler.hpp"
#include "scon/serial_port.hpp"
#include "scon/sink_event.hpp"
#include "scon/statistics.hpp"
#include "scon/vocabulary.hpp"

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <memory>
#include <vector>

#ifndef SCON_SESSION_MAX_SEND
#define SCON_SESSION_MAX_SEND 1024U
#endif

#ifndef SCON_HEX_CHUNK_MAX
#define SCON_HEX_CHUNK_MAX 1024U
#endif

#ifndef SCON_NOTICE_MAX
#define SCON_NOTICE_MAX 256U
#endif

namespace scon {

// ============================================================================
// Errors / Options
// ============================================================================

enum class SessionError : uint8_t {
  kNotConnected = 0,
  kWriteFailed,
  kPayloadTooLarge,
};

inline const char* SessionErrorName(SessionError e) noexcept {
  switch (e) {
    case SessionError::kNotConnected:
      return "not connected";
    case SessionError::kWriteFailed:
      return "write failed";
    case SessionError::kPayloadTooLarge:
      return "payload too large";
    default:
      return "unknown";
  }
}

struct SessionOptions {
  PortSettings port;
  BackoffPolicy backoff;
  uint32_t connect_timeout_ms = 5000U;  ///< 0 disables the timeout.
  uint32_t stats_interval_ms = 1000U;   ///< 0 disables stats ticks.
  SessionConfig initial;
};

// ============================================================================
// Session
// ============================================================================

class Session final {
 public:
  Session(Scheduler& scheduler, PortFactory& factory,
          const SessionOptions& options, SinkFn sink, void* sink_ctx);
  ~Session();

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  // --- Lifecycle ---

  /** @brief Begin the first connection attempt and the stats ticker. */
  void Start();

  /** @brief Cancel all timers, close any handle, go Disconnected. Idempotent. */
  void Shutdown();

  // --- Sending ---

  /** @brief Write @p text followed by the configured line ending. */
  expected<uint32_t, SessionError> Send(const char* text);

  /** @brief Write @p text followed by @p ending (one-off override). */
  expected<uint32_t, SessionError> Send(const char* text, LineEnding ending);

  /** @brief Write bytes verbatim, no line ending. */
  expected<uint32_t, SessionError> SendRaw(const uint8_t* data, uint32_t len);

  // --- Toggles ---

  void SetFilter(const char* text);
  void SetPause(bool paused);
  void TogglePause() { SetPause(!config_.paused); }
  void SetHex(bool on);
  void ToggleHex() { SetHex(!config_.show_hex); }
  void SetEcho(bool on);
  void ToggleEcho() { SetEcho(!config_.echo); }
  void SetLineEnding(LineEnding mode);
  void CycleLineEnding() { SetLineEnding(NextLineEnding(config_.line_ending)); }
  void SetAutoReconnect(bool on);
  void ToggleAutoReconnect() { SetAutoReconnect(!config_.auto_reconnect); }

  /** @brief Drop whatever is in flight and open afresh, from any state. */
  void ForceReconnect();

  // --- Query ---

  SessionSnapshot GetSnapshot() const;
  ConnectionState State() const noexcept { return state_; }
  const SessionConfig& Config() const noexcept { return config_; }
  const Statistics& Stats() const noexcept { return stats_.Get(); }
  uint32_t Attempt() const noexcept { return attempt_; }
  uint32_t Generation() const noexcept { return generation_; }
  uint64_t StaleEvents() const noexcept { return stale_events_; }
  bool HasHandle() const noexcept { return port_ != nullptr; }
  bool IsStarted() const noexcept { return started_; }

 private:
  enum EventId : uint32_t {
    kEvtStart = 1,
    kEvtOpenSucceeded,
    kEvtOpenFailed,
    kEvtOpenTimeout,
    kEvtLinkLost,
    kEvtBackoffElapsed,
    kEvtShutdown,
    kEvtAutoReconnectOff,
    kEvtAutoReconnectOn,
    kEvtForceReconnect,
  };

  using Fsm = StateMachine<Session, 5U, 8U>;

  static int32_t Idx(ConnectionState s) noexcept {
    return static_cast<int32_t>(s);
  }

  void Raise(uint32_t id) { (void)fsm_.Dispatch(Event{id}); }

  // State handlers.
  static TransitionResult OnDisconnected(Session& s, const Event& e);
  static TransitionResult OnConnecting(Session& s, const Event& e);
  static TransitionResult OnConnected(Session& s, const Event& e);
  static TransitionResult OnReconnecting(Session& s, const Event& e);
  static TransitionResult OnPermanentlyFailed(Session& s, const Event& e);
  static TransitionResult OnAnyState(Session& s, const Event& e);

  static void EnterDisconnected(Session& s) { s.TeardownHandle(); }
  static void EnterConnecting(Session& s);
  static void ExitConnecting(Session& s);
  static void EnterConnected(Session& s);
  static void ExitConnected(Session& s);
  static void EnterReconnecting(Session& s);
  static void ExitReconnecting(Session& s);
  static void EnterPermanentlyFailed(Session& s) { s.TeardownHandle(); }
  static void OnStateChanged(Session& s, int32_t from, int32_t to);

  TransitionResult HandleOpenFailure();
  TransitionResult HandleLinkLost();
  void PrepareRetry(Severity severity, const char* cause);
  void TeardownHandle();
  void CancelTimer(TimerTaskId& id);

  /// Marks a port callback on the stack; retired handles outlive it.
  class PortCallbackScope final {
   public:
    explicit PortCallbackScope(Session& s) noexcept : s_(s) {
      ++s_.port_callback_depth_;
    }
    ~PortCallbackScope() { --s_.port_callback_depth_; }

    PortCallbackScope(const PortCallbackScope&) = delete;
    PortCallbackScope& operator=(const PortCallbackScope&) = delete;

   private:
    Session& s_;
  };

  // Port listener.
  bool IsCurrent(uint32_t tag, const char* what);
  static void OnPortOpen(void* ctx, uint32_t tag, const PortFault* fault);
  static void OnPortData(void* ctx, uint32_t tag, const uint8_t* data,
                         uint32_t len);
  static void OnPortError(void* ctx, uint32_t tag, const PortFault& fault);
  static void OnPortClosed(void* ctx, uint32_t tag);

  // Timers.
  static void OnConnectTimeout(void* ctx);
  static void OnBackoffElapsed(void* ctx);
  static void OnStatsTick(void* ctx);

  // Inbound pipeline.
  void HandleData(const uint8_t* data, uint32_t len);
  static void OnLine(const char* line, uint32_t len, void* ctx);

  // Sink.
  expected<uint32_t, SessionError> WriteFrame(const uint8_t* frame,
                                              uint32_t frame_len,
                                              const char* echo_text,
                                              uint32_t echo_len);
  void Emit(SinkKind kind, Severity severity, Origin origin, const char* text,
            uint32_t text_len);
  void Notice(Severity severity, const char* fmt, ...) SCON_PRINTF_FMT(3, 4);

  Scheduler& scheduler_;
  PortFactory& factory_;
  SessionOptions options_;
  Backoff backoff_;
  SinkFn sink_;
  void* sink_ctx_;

  Fsm fsm_;
  ConnectionState state_ = ConnectionState::kDisconnected;
  SessionConfig config_;
  MessageFilter filter_;
  StatisticsAggregator stats_;
  LineFramer framer_;

  std::unique_ptr<SerialPort> port_;
  /// Closed handles, freed by the first teardown outside a port callback.
  std::vector<std::unique_ptr<SerialPort>> retired_;
  uint32_t port_callback_depth_ = 0U;
  uint32_t generation_ = 0U;
  uint64_t stale_events_ = 0U;
  PortFault last_fault_;

  uint32_t attempt_ = 0U;
  ReconnectAttempt reconnect_;

  TimerTaskId connect_timer_;
  TimerTaskId backoff_timer_;
  TimerTaskId stats_timer_;
  bool started_ = false;
};

// ============================================================================
// Construction
// ============================================================================

inline Session::Session(Scheduler& scheduler, PortFactory& factory,
                        const SessionOptions& options, SinkFn sink,
                        void* sink_ctx)
    : scheduler_(scheduler),
      factory_(factory),
      options_(options),
      backoff_(options.backoff),
      sink_(sink),
      sink_ctx_(sink_ctx),
      fsm_(*this),
      config_(options.initial),
      stats_(scheduler.NowMs()) {
  filter_.Set(options.initial.filter.text.c_str());
  config_.filter = filter_.Config();

  const int32_t disc = fsm_.AddState(
      {"Disconnected", &Session::OnDisconnected, &Session::EnterDisconnected,
       nullptr});
  const int32_t conn = fsm_.AddState({"Connecting", &Session::OnConnecting,
                                      &Session::EnterConnecting,
                                      &Session::ExitConnecting});
  const int32_t up = fsm_.AddState({"Connected", &Session::OnConnected,
                                    &Session::EnterConnected,
                                    &Session::ExitConnected});
  const int32_t retry = fsm_.AddState(
      {"Reconnecting", &Session::OnReconnecting, &Session::EnterReconnecting,
       &Session::ExitReconnecting});
  const int32_t dead = fsm_.AddState(
      {"PermanentlyFailed", &Session::OnPermanentlyFailed,
       &Session::EnterPermanentlyFailed, nullptr});
  SCON_ASSERT(disc == Idx(ConnectionState::kDisconnected));
  SCON_ASSERT(conn == Idx(ConnectionState::kConnecting));
  SCON_ASSERT(up == Idx(ConnectionState::kConnected));
  SCON_ASSERT(retry == Idx(ConnectionState::kReconnecting));
  SCON_ASSERT(dead == Idx(ConnectionState::kPermanentlyFailed));
  (void)conn;
  (void)up;
  (void)retry;
  (void)dead;

  fsm_.SetInitialState(disc);
  fsm_.SetFallbackHandler(&Session::OnAnyState);
  fsm_.SetTransitionHook(&Session::OnStateChanged);
}

inline Session::~Session() {
  Shutdown();
  CancelTimer(stats_timer_);
}

// ============================================================================
// Lifecycle
// ============================================================================

inline void Session::Start() {
  if (started_) {
    return;
  }
  if (!fsm_.IsStarted()) {
    fsm_.Start();
  }
  started_ = true;
  SCON_LOG_INFO("Session", "start %s @ %u baud", options_.port.path.c_str(),
                options_.port.baud_rate);
  if (options_.stats_interval_ms > 0U) {
    auto r = scheduler_.SchedulePeriodic(options_.stats_interval_ms,
                                         &Session::OnStatsTick, this);
    if (r.has_value()) {
      stats_timer_ = r.value();
    } else {
      SCON_LOG_WARN("Session", "stats ticker not armed (timer error %u)",
                    static_cast<unsigned>(r.get_error()));
    }
  }
  Raise(kEvtStart);
}

inline void Session::Shutdown() {
  if (!started_) {
    return;
  }
  started_ = false;
  CancelTimer(stats_timer_);
  Raise(kEvtShutdown);
  SCON_LOG_INFO("Session", "shutdown");
}

// ============================================================================
// Sending
// ============================================================================

inline expected<uint32_t, SessionError> Session::Send(const char* text) {
  return Send(text, config_.line_ending);
}

inline expected<uint32_t, SessionError> Session::Send(const char* text,
                                                      LineEnding ending) {
  if (text == nullptr) {
    text = "";
  }
  if (state_ != ConnectionState::kConnected || port_ == nullptr) {
    Notice(Severity::kWarning, "Port not connected. Cannot send data.");
    return expected<uint32_t, SessionError>::error(SessionError::kNotConnected);
  }
  const auto text_len = static_cast<uint32_t>(std::strlen(text));
  const uint32_t eol_len = LineEndingSize(ending);
  if (text_len + eol_len > SCON_SESSION_MAX_SEND) {
    Notice(Severity::kError, "Send failed: %u bytes exceeds limit of %u",
           text_len + eol_len, static_cast<unsigned>(SCON_SESSION_MAX_SEND));
    return expected<uint32_t, SessionError>::error(
        SessionError::kPayloadTooLarge);
  }
  uint8_t frame[SCON_SESSION_MAX_SEND];
  std::memcpy(frame, text, text_len);
  std::memcpy(frame + text_len, LineEndingBytes(ending), eol_len);
  return WriteFrame(frame, text_len + eol_len, text, text_len);
}

inline expected<uint32_t, SessionError> Session::SendRaw(const uint8_t* data,
                                                         uint32_t len) {
  if (state_ != ConnectionState::kConnected || port_ == nullptr) {
    Notice(Severity::kWarning, "Port not connected. Cannot send data.");
    return expected<uint32_t, SessionError>::error(SessionError::kNotConnected);
  }
  if (len > SCON_SESSION_MAX_SEND) {
    Notice(Severity::kError, "Send failed: %u bytes exceeds limit of %u", len,
           static_cast<unsigned>(SCON_SESSION_MAX_SEND));
    return expected<uint32_t, SessionError>::error(
        SessionError::kPayloadTooLarge);
  }
  char hex[HexTextCapacity(SCON_SESSION_MAX_SEND)];
  const uint32_t hex_len = FormatHex(data, len, hex, sizeof(hex));
  return WriteFrame(data, len, hex, hex_len);
}

inline expected<uint32_t, SessionError> Session::WriteFrame(
    const uint8_t* frame, uint32_t frame_len, const char* echo_text,
    uint32_t echo_len) {
  auto written = port_->Write(frame, frame_len);
  if (!written.has_value()) {
    const PortFault& f = written.get_error();
    SCON_LOG_WARN("Session", "write of %u bytes failed: %s", frame_len,
                  f.message.c_str());
    Notice(Severity::kError, "Send failed: %s", f.message.c_str());
    return expected<uint32_t, SessionError>::error(SessionError::kWriteFailed);
  }
  stats_.AddSent(written.value());
  if (config_.echo && !config_.paused) {
    char line[SCON_NOTICE_MAX];
    const int n = std::snprintf(line, sizeof(line), "\xE2\x86\x92 %.*s",
                                static_cast<int>(echo_len), echo_text);
    const uint32_t len =
        (n < 0) ? 0U
                : ((static_cast<uint32_t>(n) >= sizeof(line))
                       ? static_cast<uint32_t>(sizeof(line) - 1U)
                       : static_cast<uint32_t>(n));
    Emit(SinkKind::kMessage, Severity::kInfo, Origin::kOutbound, line, len);
  }
  return expected<uint32_t, SessionError>::success(written.value());
}

// ============================================================================
// Toggles
// ============================================================================

inline void Session::SetFilter(const char* text) {
  if (!filter_.Set(text)) {
    Notice(Severity::kWarning,
           "Filter rejected: longer than %u characters, filter unchanged",
           static_cast<unsigned>(SCON_FILTER_MAX_LEN));
    return;
  }
  config_.filter = filter_.Config();
  if (config_.filter.enabled) {
    Notice(Severity::kWarning, "Filter enabled: \"%s\"",
           config_.filter.text.c_str());
  } else {
    Notice(Severity::kWarning, "Filter disabled");
  }
}

inline void Session::SetPause(bool paused) {
  if (config_.paused == paused) {
    return;
  }
  config_.paused = paused;
  Notice(Severity::kWarning, "Logging %s", paused ? "paused" : "resumed");
}

inline void Session::SetHex(bool on) {
  if (config_.show_hex == on) {
    return;
  }
  config_.show_hex = on;
  Notice(Severity::kWarning, "Hex view %s", on ? "enabled" : "disabled");
}

inline void Session::SetEcho(bool on) {
  if (config_.echo == on) {
    return;
  }
  config_.echo = on;
  Notice(Severity::kWarning, "Echo mode %s", on ? "enabled" : "disabled");
}

inline void Session::SetLineEnding(LineEnding mode) {
  if (config_.line_ending == mode) {
    return;
  }
  config_.line_ending = mode;
  Notice(Severity::kWarning, "Line ending changed to %s",
         LineEndingName(mode));
}

inline void Session::SetAutoReconnect(bool on) {
  if (config_.auto_reconnect == on) {
    return;
  }
  config_.auto_reconnect = on;
  Notice(on ? Severity::kSuccess : Severity::kWarning, "Auto-reconnect %s",
         on ? "enabled" : "disabled");
  if (started_) {
    Raise(on ? kEvtAutoReconnectOn : kEvtAutoReconnectOff);
  }
}

inline void Session::ForceReconnect() {
  if (!started_) {
    Start();
    return;
  }
  Notice(Severity::kInfo, "Starting reconnection...");
  Raise(kEvtForceReconnect);
}

// ============================================================================
// Query
// ============================================================================

inline SessionSnapshot Session::GetSnapshot() const {
  const uint64_t now = scheduler_.NowMs();
  SessionSnapshot snap;
  snap.state = state_;
  snap.config = config_;
  snap.stats = stats_.Get();
  snap.uptime_s = stats_.UptimeSeconds(now);
  snap.rx_rate = stats_.RxRate(now);
  snap.tx_rate = stats_.TxRate(now);
  snap.attempt = attempt_;
  snap.reconnect = reconnect_;
  if (state_ == ConnectionState::kReconnecting) {
    snap.remaining_ms =
        Backoff::RemainingMs(reconnect_.delay_ms, reconnect_.start_ms, now);
    snap.remaining_s = Backoff::RemainingSeconds(reconnect_.delay_ms,
                                                 reconnect_.start_ms, now);
  }
  snap.port_path = options_.port.path;
  snap.baud_rate = options_.port.baud_rate;
  snap.stale_events = stale_events_;
  return snap;
}

// ============================================================================
// State Handlers
// ============================================================================

inline TransitionResult Session::OnDisconnected(Session& s, const Event& e) {
  switch (e.id) {
    case kEvtStart:
      return s.fsm_.RequestTransition(Idx(ConnectionState::kConnecting));
    case kEvtAutoReconnectOn:
      s.attempt_ = 0U;
      return s.fsm_.RequestTransition(Idx(ConnectionState::kConnecting));
    case kEvtAutoReconnectOff:
      return TransitionResult::kHandled;
    default:
      return TransitionResult::kUnhandled;
  }
}

inline TransitionResult Session::OnConnecting(Session& s, const Event& e) {
  switch (e.id) {
    case kEvtOpenSucceeded:
      return s.fsm_.RequestTransition(Idx(ConnectionState::kConnected));
    case kEvtOpenFailed:
    case kEvtOpenTimeout:
    case kEvtLinkLost:
      return s.HandleOpenFailure();
    case kEvtAutoReconnectOn:
    case kEvtAutoReconnectOff:
      // Takes effect when this attempt resolves.
      return TransitionResult::kHandled;
    default:
      return TransitionResult::kUnhandled;
  }
}

inline TransitionResult Session::OnConnected(Session& s, const Event& e) {
  switch (e.id) {
    case kEvtLinkLost:
      return s.HandleLinkLost();
    case kEvtAutoReconnectOn:
    case kEvtAutoReconnectOff:
      return TransitionResult::kHandled;
    default:
      return TransitionResult::kUnhandled;
  }
}

inline TransitionResult Session::OnReconnecting(Session& s, const Event& e) {
  switch (e.id) {
    case kEvtBackoffElapsed:
      return s.fsm_.RequestTransition(Idx(ConnectionState::kConnecting));
    case kEvtAutoReconnectOff:
      s.attempt_ = 0U;
      return s.fsm_.RequestTransition(Idx(ConnectionState::kDisconnected));
    case kEvtAutoReconnectOn:
      return TransitionResult::kHandled;
    default:
      return TransitionResult::kUnhandled;
  }
}

inline TransitionResult Session::OnPermanentlyFailed(Session& s,
                                                     const Event& e) {
  switch (e.id) {
    case kEvtAutoReconnectOn:
      s.attempt_ = 0U;
      return s.fsm_.RequestTransition(Idx(ConnectionState::kConnecting));
    case kEvtAutoReconnectOff:
      return TransitionResult::kHandled;
    default:
      return TransitionResult::kUnhandled;
  }
}

inline TransitionResult Session::OnAnyState(Session& s, const Event& e) {
  switch (e.id) {
    case kEvtShutdown:
      s.attempt_ = 0U;
      if (s.state_ == ConnectionState::kDisconnected) {
        s.TeardownHandle();
        return TransitionResult::kHandled;
      }
      return s.fsm_.RequestTransition(Idx(ConnectionState::kDisconnected));
    case kEvtForceReconnect:
      s.attempt_ = 0U;
      return s.fsm_.RequestTransition(Idx(ConnectionState::kConnecting));
    default:
      return TransitionResult::kUnhandled;
  }
}

inline TransitionResult Session::HandleOpenFailure() {
  const FailureClass cls = ClassifyFailure(last_fault_);
  SCON_LOG_WARN("Session", "open %s failed (%s, errno=%d): %s",
                options_.port.path.c_str(), FailureClassName(cls),
                last_fault_.sys_errno, last_fault_.message.c_str());
  if (cls == FailureClass::kPermanent) {
    config_.auto_reconnect = false;
    attempt_ = 0U;
    Notice(Severity::kWarning,
           "Open failed: %s. Permanent error - disabling auto-reconnect",
           last_fault_.message.c_str());
    return fsm_.RequestTransition(Idx(ConnectionState::kPermanentlyFailed));
  }
  if (!config_.auto_reconnect) {
    Notice(Severity::kError, "Open failed: %s", last_fault_.message.c_str());
    return fsm_.RequestTransition(Idx(ConnectionState::kDisconnected));
  }
  char cause[SCON_NOTICE_MAX];
  (void)std::snprintf(cause, sizeof(cause), "Open failed: %s",
                      last_fault_.message.c_str());
  PrepareRetry(Severity::kError, cause);
  return fsm_.RequestTransition(Idx(ConnectionState::kReconnecting));
}

inline TransitionResult Session::HandleLinkLost() {
  char cause[SCON_NOTICE_MAX];
  if (last_fault_.kind == PortFaultKind::kClosed) {
    (void)std::snprintf(cause, sizeof(cause), "Port disconnected");
  } else {
    (void)std::snprintf(cause, sizeof(cause), "Port error: %s",
                        last_fault_.message.c_str());
  }
  SCON_LOG_WARN("Session", "link lost on %s: %s", options_.port.path.c_str(),
                last_fault_.message.c_str());
  if (!config_.auto_reconnect) {
    Notice(Severity::kWarning, "%s", cause);
    return fsm_.RequestTransition(Idx(ConnectionState::kDisconnected));
  }
  PrepareRetry(Severity::kWarning, cause);
  return fsm_.RequestTransition(Idx(ConnectionState::kReconnecting));
}

inline void Session::PrepareRetry(Severity severity, const char* cause) {
  ++attempt_;
  reconnect_.attempt = attempt_;
  reconnect_.delay_ms = backoff_.DelayMs(attempt_);
  reconnect_.start_ms = scheduler_.NowMs();
  SCON_LOG_INFO("Session", "reconnect attempt #%u in %u ms", attempt_,
                reconnect_.delay_ms);
  Notice(severity, "%s. Reconnect attempt #%u starting in %us...", cause,
         attempt_, Backoff::RemainingSeconds(reconnect_.delay_ms, 0U, 0U));
}

// ============================================================================
// Entry / Exit Actions
// ============================================================================

inline void Session::EnterConnecting(Session& s) {
  s.TeardownHandle();
  s.framer_.Reset();

  s.port_ = s.factory_.Create();
  if (s.port_ == nullptr) {
    s.last_fault_ = PortFault::Make(PortFaultKind::kOpenFailed, 0,
                                    "no port handle available");
    s.Raise(kEvtOpenFailed);
    return;
  }
  ++s.generation_;

  PortListener listener;
  listener.on_open = &Session::OnPortOpen;
  listener.on_data = &Session::OnPortData;
  listener.on_error = &Session::OnPortError;
  listener.on_closed = &Session::OnPortClosed;
  listener.ctx = &s;
  listener.tag = s.generation_;
  s.port_->Subscribe(listener);

  if (s.options_.connect_timeout_ms > 0U) {
    auto r = s.scheduler_.ScheduleOnce(s.options_.connect_timeout_ms,
                                       &Session::OnConnectTimeout, &s);
    if (r.has_value()) {
      s.connect_timer_ = r.value();
    } else {
      SCON_LOG_WARN("Session", "connect timeout not armed (timer error %u)",
                    static_cast<unsigned>(r.get_error()));
    }
  }

  SCON_LOG_DEBUG("Session", "opening %s (generation %u, attempt %u)",
                 s.options_.port.path.c_str(), s.generation_, s.attempt_);
  s.port_->Open(s.options_.port);
}

inline void Session::ExitConnecting(Session& s) {
  s.CancelTimer(s.connect_timer_);
}

inline void Session::EnterConnected(Session& s) {
  if (s.attempt_ > 0U) {
    const uint32_t n = s.attempt_;
    s.Notice(Severity::kSuccess, "Reconnected successfully after %u attempt%s!",
             n, (n > 1U) ? "s" : "");
  } else {
    s.Notice(Severity::kSuccess, "Connected to %s at %u baud",
             s.options_.port.path.c_str(), s.options_.port.baud_rate);
  }
  s.attempt_ = 0U;
  s.reconnect_ = ReconnectAttempt{};
}

inline void Session::ExitConnected(Session& s) {
  (void)s.framer_.Flush(&Session::OnLine, &s);
}

inline void Session::EnterReconnecting(Session& s) {
  s.TeardownHandle();
  auto r = s.scheduler_.ScheduleOnce(s.reconnect_.delay_ms,
                                     &Session::OnBackoffElapsed, &s);
  if (r.has_value()) {
    s.backoff_timer_ = r.value();
    return;
  }
  SCON_LOG_ERROR("Session", "backoff timer not armed (timer error %u)",
                 static_cast<unsigned>(r.get_error()));
  s.config_.auto_reconnect = false;
  s.Notice(Severity::kError, "Cannot schedule reconnect - auto-reconnect disabled");
  s.Raise(kEvtAutoReconnectOff);
}

inline void Session::ExitReconnecting(Session& s) {
  s.CancelTimer(s.backoff_timer_);
  s.reconnect_ = ReconnectAttempt{};
}

inline void Session::OnStateChanged(Session& s, int32_t from, int32_t to) {
  const auto prev = static_cast<ConnectionState>(from);
  s.state_ = static_cast<ConnectionState>(to);
  SCON_LOG_INFO("Session", "%s -> %s", ConnectionStateName(prev),
                ConnectionStateName(s.state_));

  Severity sev = Severity::kInfo;
  switch (s.state_) {
    case ConnectionState::kConnected:
      sev = Severity::kSuccess;
      break;
    case ConnectionState::kReconnecting:
      sev = Severity::kWarning;
      break;
    case ConnectionState::kPermanentlyFailed:
      sev = Severity::kError;
      break;
    default:
      break;
  }
  const char* name = ConnectionStateName(s.state_);
  SinkEvent ev;
  ev.kind = SinkKind::kStateChange;
  ev.severity = sev;
  ev.origin = Origin::kSystem;
  ev.timestamp_ms = s.scheduler_.WallClockMs();
  ev.text = name;
  ev.text_len = static_cast<uint32_t>(std::strlen(name));
  ev.state = s.state_;
  ev.previous = prev;
  if (s.sink_ != nullptr) {
    s.sink_(ev, s.sink_ctx_);
  }
}

// ============================================================================
// Handle Management
// ============================================================================

inline void Session::TeardownHandle() {
  if (port_callback_depth_ == 0U) {
    retired_.clear();
  }
  if (port_ == nullptr) {
    return;
  }
  SCON_LOG_DEBUG("Session", "teardown generation %u", generation_);
  port_->Unsubscribe();
  port_->Close();
  // Any retired handle may still be running a callback further up the
  // stack; it is freed once no port callback is active.
  retired_.push_back(std::move(port_));
  ++generation_;
}

inline void Session::CancelTimer(TimerTaskId& id) {
  if (!id.IsValid()) {
    return;
  }
  auto r = scheduler_.Cancel(id);
  if (!r.has_value()) {
    SCON_LOG_DEBUG("Session", "timer %u already gone", id.value());
  }
  id = TimerTaskId();
}

inline bool Session::IsCurrent(uint32_t tag, const char* what) {
  if (port_ != nullptr && tag == generation_) {
    return true;
  }
  ++stale_events_;
  SCON_LOG_DEBUG("Session", "dropped stale %s (tag %u, generation %u)", what,
                 tag, generation_);
  return false;
}

// ============================================================================
// Port Listener
// ============================================================================

inline void Session::OnPortOpen(void* ctx, uint32_t tag,
                                const PortFault* fault) {
  auto* s = static_cast<Session*>(ctx);
  const PortCallbackScope scope(*s);
  if (!s->IsCurrent(tag, "open")) {
    return;
  }
  if (fault != nullptr) {
    s->last_fault_ = *fault;
    s->Raise(kEvtOpenFailed);
  } else {
    s->Raise(kEvtOpenSucceeded);
  }
}

inline void Session::OnPortData(void* ctx, uint32_t tag, const uint8_t* data,
                                uint32_t len) {
  auto* s = static_cast<Session*>(ctx);
  const PortCallbackScope scope(*s);
  if (!s->IsCurrent(tag, "data")) {
    return;
  }
  s->HandleData(data, len);
}

inline void Session::OnPortError(void* ctx, uint32_t tag,
                                 const PortFault& fault) {
  auto* s = static_cast<Session*>(ctx);
  const PortCallbackScope scope(*s);
  if (!s->IsCurrent(tag, "error")) {
    return;
  }
  SCON_LOG_WARN("Port", "%s: %s (errno=%d)", PortFaultKindName(fault.kind),
                fault.message.c_str(), fault.sys_errno);
  s->last_fault_ = fault;
  s->Raise(s->state_ == ConnectionState::kConnecting ? kEvtOpenFailed
                                                     : kEvtLinkLost);
}

inline void Session::OnPortClosed(void* ctx, uint32_t tag) {
  auto* s = static_cast<Session*>(ctx);
  const PortCallbackScope scope(*s);
  if (!s->IsCurrent(tag, "close")) {
    return;
  }
  s->last_fault_ = PortFault::Make(PortFaultKind::kClosed, 0, "Port closed");
  s->Raise(s->state_ == ConnectionState::kConnecting ? kEvtOpenFailed
                                                     : kEvtLinkLost);
}

// ============================================================================
// Timers
// ============================================================================

inline void Session::OnConnectTimeout(void* ctx) {
  auto* s = static_cast<Session*>(ctx);
  s->connect_timer_ = TimerTaskId();
  char msg[64];
  (void)std::snprintf(msg, sizeof(msg), "Connect timeout after %u ms",
                      s->options_.connect_timeout_ms);
  s->last_fault_ = PortFault::Make(PortFaultKind::kConnectTimeout, 0, msg);
  s->Raise(kEvtOpenTimeout);
}

inline void Session::OnBackoffElapsed(void* ctx) {
  auto* s = static_cast<Session*>(ctx);
  s->backoff_timer_ = TimerTaskId();
  s->Raise(kEvtBackoffElapsed);
}

inline void Session::OnStatsTick(void* ctx) {
  auto* s = static_cast<Session*>(ctx);
  if (s->sink_ == nullptr) {
    return;
  }
  const SessionSnapshot snap = s->GetSnapshot();
  SinkEvent ev;
  ev.kind = SinkKind::kStatsTick;
  ev.severity = Severity::kInfo;
  ev.origin = Origin::kSystem;
  ev.timestamp_ms = s->scheduler_.WallClockMs();
  ev.state = snap.state;
  ev.previous = snap.state;
  ev.snapshot = &snap;
  s->sink_(ev, s->sink_ctx_);
}

// ============================================================================
// Inbound Pipeline
// ============================================================================

inline void Session::HandleData(const uint8_t* data, uint32_t len) {
  stats_.AddReceived(len);

  if (config_.show_hex && !config_.paused && sink_ != nullptr) {
    char hex[HexTextCapacity(SCON_HEX_CHUNK_MAX)];
    uint32_t offset = 0U;
    while (offset < len) {
      const uint32_t piece =
          (len - offset > SCON_HEX_CHUNK_MAX) ? SCON_HEX_CHUNK_MAX
                                              : (len - offset);
      const uint32_t hex_len = FormatHex(data + offset, piece, hex, sizeof(hex));
      SinkEvent ev;
      ev.kind = SinkKind::kHex;
      ev.severity = Severity::kInfo;
      ev.origin = Origin::kInbound;
      ev.timestamp_ms = scheduler_.WallClockMs();
      ev.text = hex;
      ev.text_len = hex_len;
      ev.data = data + offset;
      ev.data_len = piece;
      ev.state = state_;
      ev.previous = state_;
      sink_(ev, sink_ctx_);
      offset += piece;
    }
  }

  (void)framer_.Feed(data, len, &Session::OnLine, this);
}

inline void Session::OnLine(const char* line, uint32_t len, void* ctx) {
  auto* s = static_cast<Session*>(ctx);
  s->stats_.AddMessage();
  if (s->config_.paused || !s->filter_.Accepts(line, len)) {
    return;
  }
  s->Emit(SinkKind::kMessage, Severity::kInfo, Origin::kInbound, line, len);
}

// ============================================================================
// Sink
// ============================================================================

inline void Session::Emit(SinkKind kind, Severity severity, Origin origin,
                          const char* text, uint32_t text_len) {
  if (sink_ == nullptr) {
    return;
  }
  SinkEvent ev;
  ev.kind = kind;
  ev.severity = severity;
  ev.origin = origin;
  ev.timestamp_ms = scheduler_.WallClockMs();
  ev.text = text;
  ev.text_len = text_len;
  ev.state = state_;
  ev.previous = state_;
  sink_(ev, sink_ctx_);
}

inline void Session::Notice(Severity severity, const char* fmt, ...) {
  char buf[SCON_NOTICE_MAX];
  va_list args;
  va_start(args, fmt);
  const int n = std::vsnprintf(buf, sizeof(buf), fmt, args);
  va_end(args);
  if (n < 0) {
    return;
  }
  const uint32_t len = (static_cast<uint32_t>(n) >= sizeof(buf))
                           ? static_cast<uint32_t>(sizeof(buf) - 1U)
                           : static_cast<uint32_t>(n);
  Emit(SinkKind::kMessage, severity, Origin::kSystem, buf, len);
}

}  // namespace scon

#endif  // SCON_SESSION_HPP_
