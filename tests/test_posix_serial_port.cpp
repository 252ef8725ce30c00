/**
 * @file test_posix_serial_port.cpp
 * @brief Tests for posix_serial_port.hpp against a pseudo-terminal pair.
 */

#include "scon/failure_classifier.hpp"
#include "scon/posix_serial_port.hpp"
#include "scon/session.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cerrno>
#include <string>

#include <pty.h>
#include <unistd.h>

namespace {

/// openpty() pair; the slave path is what the port opens.
class Pty {
 public:
  Pty() {
    if (::openpty(&master_, &slave_, nullptr, nullptr, nullptr) != 0) {
      master_ = -1;
      slave_ = -1;
      return;
    }
    const char* name = ::ttyname(slave_);
    if (name != nullptr) {
      path_ = name;
    }
  }
  ~Pty() {
    CloseMaster();
    if (slave_ >= 0) {
      ::close(slave_);
    }
  }
  bool Ok() const { return master_ >= 0 && !path_.empty(); }
  int Master() const { return master_; }
  const char* Path() const { return path_.c_str(); }
  void CloseMaster() {
    if (master_ >= 0) {
      ::close(master_);
      master_ = -1;
    }
  }

 private:
  int master_ = -1;
  int slave_ = -1;
  std::string path_;
};

struct Events {
  uint32_t opens = 0U;
  bool open_failed = false;
  scon::PortFault open_fault;
  std::string data;
  uint32_t errors = 0U;
  scon::PortFault last_error;
  uint32_t closes = 0U;
  std::string order;

  static void OnOpen(void* ctx, uint32_t, const scon::PortFault* fault) {
    auto* e = static_cast<Events*>(ctx);
    ++e->opens;
    if (fault != nullptr) {
      e->open_failed = true;
      e->open_fault = *fault;
    }
  }
  static void OnData(void* ctx, uint32_t, const uint8_t* data, uint32_t len) {
    static_cast<Events*>(ctx)->data.append(reinterpret_cast<const char*>(data),
                                           len);
  }
  static void OnError(void* ctx, uint32_t, const scon::PortFault& fault) {
    auto* e = static_cast<Events*>(ctx);
    ++e->errors;
    e->last_error = fault;
    e->order += "E";
  }
  static void OnClosed(void* ctx, uint32_t) {
    auto* e = static_cast<Events*>(ctx);
    ++e->closes;
    e->order += "C";
  }

  scon::PortListener Listener() {
    scon::PortListener l;
    l.on_open = &OnOpen;
    l.on_data = &OnData;
    l.on_error = &OnError;
    l.on_closed = &OnClosed;
    l.ctx = this;
    l.tag = 1U;
    return l;
  }
};

scon::PortSettings SettingsFor(const char* path) {
  scon::PortSettings s;
  s.path.assign(scon::TruncateToCapacity, path);
  s.baud_rate = 115200U;
  return s;
}

}  // namespace

TEST_CASE("PosixSerialPort opens a pty and receives data", "[serial]") {
  Pty pty;
  REQUIRE(pty.Ok());
  scon::EventLoop loop;
  scon::PosixSerialPort port(loop);
  Events ev;
  port.Subscribe(ev.Listener());
  port.Open(SettingsFor(pty.Path()));

  REQUIRE(ev.opens == 1U);
  REQUIRE(!ev.open_failed);
  REQUIRE(port.IsOpen());
  REQUIRE(loop.WatchCount() == 1U);

  REQUIRE(::write(pty.Master(), "hello\n", 6) == 6);
  const uint64_t start = loop.NowMs();
  while (ev.data.size() < 6U && loop.NowMs() - start < 2000U) {
    (void)loop.RunOnce(100);
  }
  REQUIRE(ev.data == "hello\n");
  REQUIRE(port.Stats().bytes_read == 6U);

  port.Close();
  REQUIRE(!port.IsOpen());
  REQUIRE(ev.closes == 1U);
  REQUIRE(loop.WatchCount() == 0U);
}

TEST_CASE("PosixSerialPort writes reach the other end", "[serial]") {
  Pty pty;
  REQUIRE(pty.Ok());
  scon::EventLoop loop;
  scon::PosixSerialPort port(loop);
  Events ev;
  port.Subscribe(ev.Listener());
  port.Open(SettingsFor(pty.Path()));
  REQUIRE(port.IsOpen());

  const uint8_t msg[] = {'A', 'T', '\r', '\n'};
  auto r = port.Write(msg, sizeof(msg));
  REQUIRE(r.has_value());
  REQUIRE(r.value() == 4U);

  char buf[16];
  const ssize_t n = ::read(pty.Master(), buf, sizeof(buf));
  REQUIRE(n == 4);
  REQUIRE(std::string(buf, 4) == "AT\r\n");
  REQUIRE(port.Stats().bytes_written == 4U);
}

TEST_CASE("PosixSerialPort write on a closed port fails", "[serial]") {
  scon::EventLoop loop;
  scon::PosixSerialPort port(loop);
  const uint8_t b = 'x';
  auto r = port.Write(&b, 1U);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error().kind == scon::PortFaultKind::kNotOpen);
}

TEST_CASE("PosixSerialPort second open of a locked device is EBUSY",
          "[serial]") {
  Pty pty;
  REQUIRE(pty.Ok());
  scon::EventLoop loop;
  scon::PosixSerialPort first(loop);
  scon::PosixSerialPort second(loop);
  Events ev1;
  Events ev2;
  first.Subscribe(ev1.Listener());
  second.Subscribe(ev2.Listener());

  first.Open(SettingsFor(pty.Path()));
  REQUIRE(first.IsOpen());
  second.Open(SettingsFor(pty.Path()));
  REQUIRE(!second.IsOpen());
  REQUIRE(ev2.open_failed);
  REQUIRE(ev2.open_fault.kind == scon::PortFaultKind::kOpenFailed);
  REQUIRE(ev2.open_fault.sys_errno == EBUSY);
  REQUIRE(std::string(ev2.open_fault.message.c_str()).find("Cannot lock") == 0U);
}

TEST_CASE("PosixSerialPort missing device reports the errno", "[serial]") {
  scon::EventLoop loop;
  scon::PosixSerialPort port(loop);
  Events ev;
  port.Subscribe(ev.Listener());
  port.Open(SettingsFor("/dev/ttyDOES_NOT_EXIST9"));
  REQUIRE(ev.opens == 1U);
  REQUIRE(ev.open_failed);
  REQUIRE(ev.open_fault.sys_errno == ENOENT);
  REQUIRE(std::string(ev.open_fault.message.c_str()) ==
          "Cannot open /dev/ttyDOES_NOT_EXIST9: No such file or directory");
  REQUIRE(!port.IsOpen());
  REQUIRE(ev.closes == 0U);
}

TEST_CASE("PosixSerialPort hangup reports error then close", "[serial]") {
  Pty pty;
  REQUIRE(pty.Ok());
  scon::EventLoop loop;
  scon::PosixSerialPort port(loop);
  Events ev;
  port.Subscribe(ev.Listener());
  port.Open(SettingsFor(pty.Path()));
  REQUIRE(port.IsOpen());

  pty.CloseMaster();
  const uint64_t start = loop.NowMs();
  while (ev.closes == 0U && loop.NowMs() - start < 2000U) {
    (void)loop.RunOnce(100);
  }
  REQUIRE(ev.order == "EC");
  REQUIRE(!port.IsOpen());
  REQUIRE(loop.WatchCount() == 0U);
}

TEST_CASE("PosixSerialPort unplug faults stay retryable", "[serial]") {
  scon::EventLoop loop;
  {
    scon::PosixSerialPort port(loop);
    Events ev;
    port.Subscribe(ev.Listener());
    port.Open(SettingsFor("/dev/ttyDOES_NOT_EXIST9"));
    REQUIRE(ev.open_failed);
    REQUIRE(ev.open_fault.kind == scon::PortFaultKind::kOpenFailed);
    REQUIRE(scon::ClassifyFailure(ev.open_fault) ==
            scon::FailureClass::kTransient);
  }

  Pty pty;
  REQUIRE(pty.Ok());
  scon::PosixSerialPort port(loop);
  Events ev;
  port.Subscribe(ev.Listener());
  port.Open(SettingsFor(pty.Path()));
  REQUIRE(port.IsOpen());
  pty.CloseMaster();
  const uint64_t start = loop.NowMs();
  while (ev.closes == 0U && loop.NowMs() - start < 2000U) {
    (void)loop.RunOnce(100);
  }
  REQUIRE(ev.errors == 1U);
  REQUIRE(ev.last_error.kind == scon::PortFaultKind::kIoError);
  REQUIRE(scon::ClassifyFailure(ev.last_error) ==
          scon::FailureClass::kTransient);
}

TEST_CASE("PosixSerialPort Unsubscribe silences callbacks", "[serial]") {
  Pty pty;
  REQUIRE(pty.Ok());
  scon::EventLoop loop;
  scon::PosixSerialPort port(loop);
  Events ev;
  port.Subscribe(ev.Listener());
  port.Open(SettingsFor(pty.Path()));
  port.Unsubscribe();
  port.Close();
  REQUIRE(ev.closes == 0U);
}

TEST_CASE("PosixSerialPort BaudToSpeed", "[serial]") {
  speed_t s = 0;
  REQUIRE(scon::PosixSerialPort::BaudToSpeed(9600U, s));
  REQUIRE(s == B9600);
  REQUIRE(scon::PosixSerialPort::BaudToSpeed(115200U, s));
  REQUIRE(s == B115200);
  REQUIRE(!scon::PosixSerialPort::BaudToSpeed(12345U, s));
}

TEST_CASE("PosixPortFactory creates unopened handles", "[serial]") {
  scon::EventLoop loop;
  scon::PosixPortFactory factory(loop);
  auto a = factory.Create();
  auto b = factory.Create();
  REQUIRE(a != nullptr);
  REQUIRE(b != nullptr);
  REQUIRE(a.get() != b.get());
  REQUIRE(!a->IsOpen());
}

namespace {

struct ShutdownOnRetry {
  scon::Session* session = nullptr;
  uint32_t notices = 0U;

  static void Fn(const scon::SinkEvent& ev, void* ctx) {
    auto* self = static_cast<ShutdownOnRetry*>(ctx);
    if (ev.kind != scon::SinkKind::kMessage || ev.text == nullptr) {
      return;
    }
    const std::string text(ev.text, ev.text_len);
    if (text.find("Reconnect attempt") != std::string::npos) {
      ++self->notices;
      self->session->Shutdown();
    }
  }
};

}  // namespace

TEST_CASE("PosixSerialPort hangup survives a Shutdown from the sink",
          "[serial]") {
  Pty pty;
  REQUIRE(pty.Ok());
  scon::EventLoop loop;
  scon::PosixPortFactory factory(loop);
  scon::SessionOptions opts;
  opts.port = SettingsFor(pty.Path());
  opts.stats_interval_ms = 0U;
  ShutdownOnRetry sink;
  scon::Session session(loop, factory, opts, &ShutdownOnRetry::Fn, &sink);
  sink.session = &session;

  session.Start();
  REQUIRE(session.State() == scon::ConnectionState::kConnected);

  pty.CloseMaster();
  const uint64_t start = loop.NowMs();
  while (session.IsStarted() && loop.NowMs() - start < 2000U) {
    (void)loop.RunOnce(100);
  }
  REQUIRE(sink.notices == 1U);
  REQUIRE(session.State() == scon::ConnectionState::kDisconnected);
  REQUIRE(loop.WatchCount() == 0U);
}
