/**
 * @file posix_serial_port.hpp
 * @brief SerialPort over a POSIX tty: termios raw mode, exclusive flock(),
 *        reads driven by the EventLoop.
 *
 * Open() completes synchronously (on_open is invoked before it returns).
 * A hangup or a read error reports on_error, closes the fd, then reports
 * on_closed, unless the listener unsubscribed in between.
 * Unplug and hangup look the same here, so faults are never kDeviceRemoved.
 */

#ifndef SCON_POSIX_SERIAL_PORT_HPP_
#define SCON_POSIX_SERIAL_PORT_HPP_

#include "scon/event_loop.hpp"
#include "scon/log.hpp"
#include "scon/platform.hpp"
#include "scon/serial_port.hpp"
#include "scon/vocabulary.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <memory>

#include <fcntl.h>
#include <sys/file.h>
#include <termios.h>
#include <unistd.h>

#ifndef SCON_PORT_READ_CHUNK
#define SCON_PORT_READ_CHUNK 1024U
#endif

namespace scon {

struct SerialPortStats {
  uint64_t bytes_read = 0U;
  uint64_t bytes_written = 0U;
  uint32_t read_errors = 0U;
  uint32_t write_errors = 0U;
  uint32_t write_retries = 0U;
};

// ============================================================================
// PosixSerialPort
// ============================================================================

class PosixSerialPort final : public SerialPort {
 public:
  explicit PosixSerialPort(EventLoop& loop) noexcept : loop_(loop) {}
  ~PosixSerialPort() override {
    listener_ = PortListener{};
    CloseFd();
  }

  PosixSerialPort(const PosixSerialPort&) = delete;
  PosixSerialPort& operator=(const PosixSerialPort&) = delete;

  void Subscribe(const PortListener& listener) override {
    listener_ = listener;
  }

  void Unsubscribe() override { listener_ = PortListener{}; }

  void Open(const PortSettings& settings) override {
    settings_ = settings;
    if (fd_ >= 0) {
      NotifyOpen(nullptr);
      return;
    }

    const int fd = ::open(settings_.path.c_str(),
                          O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
      FailOpen(PortFaultKind::kOpenFailed, errno, "Cannot open");
      return;
    }
    fd_ = fd;

    if (::flock(fd_, LOCK_EX | LOCK_NB) != 0) {
      const int err = (errno == EWOULDBLOCK) ? EBUSY : errno;
      CloseFd();
      FailOpen(PortFaultKind::kOpenFailed, err, "Cannot lock");
      return;
    }

    const int cfg_err = ConfigurePort();
    if (cfg_err != 0) {
      CloseFd();
      FailOpen(PortFaultKind::kConfigFailed, cfg_err, "Cannot configure");
      return;
    }

    auto watched = loop_.Watch(fd_, static_cast<uint8_t>(IoEvent::kReadable),
                               &PosixSerialPort::OnIo, this);
    if (!watched.has_value()) {
      CloseFd();
      FailOpen(PortFaultKind::kOpenFailed, 0, "Cannot watch");
      return;
    }
    watching_ = true;

    SCON_LOG_INFO("Port", "opened %s @ %u baud (fd=%d)",
                  settings_.path.c_str(), settings_.baud_rate, fd_);
    NotifyOpen(nullptr);
  }

  void Close() override {
    if (fd_ < 0) {
      return;
    }
    CloseFd();
    SCON_LOG_INFO("Port", "closed %s", settings_.path.c_str());
    if (listener_.on_closed != nullptr) {
      listener_.on_closed(listener_.ctx, listener_.tag);
    }
  }

  expected<uint32_t, PortFault> Write(const uint8_t* data,
                                      uint32_t len) override {
    if (fd_ < 0) {
      return expected<uint32_t, PortFault>::error(
          PortFault::Make(PortFaultKind::kNotOpen, 0, "Port not open"));
    }
    uint32_t written = 0U;
    uint32_t retries = 0U;
    while (written < len) {
      const ssize_t n = ::write(fd_, data + written, len - written);
      if (n < 0) {
        const int err = errno;
        if (err == EINTR) {
          continue;
        }
        if ((err == EAGAIN || err == EWOULDBLOCK) &&
            retries < kWriteRetryCount) {
          ++retries;
          ++stats_.write_retries;
          ::usleep(kWriteRetryDelayUs);
          continue;
        }
        ++stats_.write_errors;
        return expected<uint32_t, PortFault>::error(
            PortFault::Make(PortFaultKind::kWriteFailed, err,
                            std::strerror(err)));
      }
      written += static_cast<uint32_t>(n);
    }
    stats_.bytes_written += written;
    return expected<uint32_t, PortFault>::success(written);
  }

  bool IsOpen() const override { return fd_ >= 0; }

  const SerialPortStats& Stats() const noexcept { return stats_; }
  int32_t Fd() const noexcept { return fd_; }

  /// @brief termios speed for @p baud; false for rates the platform lacks.
  static bool BaudToSpeed(uint32_t baud, speed_t& out) noexcept {
    switch (baud) {
      case 1200U:
        out = B1200;
        return true;
      case 2400U:
        out = B2400;
        return true;
      case 4800U:
        out = B4800;
        return true;
      case 9600U:
        out = B9600;
        return true;
      case 19200U:
        out = B19200;
        return true;
      case 38400U:
        out = B38400;
        return true;
      case 57600U:
        out = B57600;
        return true;
      case 115200U:
        out = B115200;
        return true;
      case 230400U:
        out = B230400;
        return true;
#ifdef B460800
      case 460800U:
        out = B460800;
        return true;
#endif
#ifdef B921600
      case 921600U:
        out = B921600;
        return true;
#endif
      default:
        return false;
    }
  }

 private:
  static constexpr uint32_t kWriteRetryCount = 3U;
  static constexpr uint32_t kWriteRetryDelayUs = 1000U;

  /// @return 0 on success, otherwise an errno value.
  int ConfigurePort() noexcept {
    struct termios tio;
    std::memset(&tio, 0, sizeof(tio));
    if (::tcgetattr(fd_, &tio) != 0) {
      return errno;
    }

    // Raw mode
    tio.c_iflag &= static_cast<tcflag_t>(~(IGNBRK | BRKINT | PARMRK | ISTRIP |
                                           INLCR | IGNCR | ICRNL | IXON |
                                           IXOFF | IXANY));
    tio.c_oflag &= static_cast<tcflag_t>(~OPOST);
    tio.c_lflag &=
        static_cast<tcflag_t>(~(ECHO | ECHONL | ICANON | ISIG | IEXTEN));
    tio.c_cflag &= static_cast<tcflag_t>(~(CSIZE | PARENB | PARODD | CSTOPB));
    tio.c_cflag |= static_cast<tcflag_t>(CLOCAL | CREAD);

    switch (settings_.data_bits) {
      case 5U:
        tio.c_cflag |= CS5;
        break;
      case 6U:
        tio.c_cflag |= CS6;
        break;
      case 7U:
        tio.c_cflag |= CS7;
        break;
      case 8U:
      default:
        tio.c_cflag |= CS8;
        break;
    }

    if (settings_.parity == Parity::kOdd) {
      tio.c_cflag |= static_cast<tcflag_t>(PARENB | PARODD);
    } else if (settings_.parity == Parity::kEven) {
      tio.c_cflag |= PARENB;
    }

    if (settings_.stop_bits == 2U) {
      tio.c_cflag |= CSTOPB;
    }

    if (settings_.flow_control == FlowControl::kHardware) {
#ifdef CRTSCTS
      tio.c_cflag |= CRTSCTS;
#endif
    } else if (settings_.flow_control == FlowControl::kSoftware) {
      tio.c_iflag |= static_cast<tcflag_t>(IXON | IXOFF);
    }

    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = 0;

    speed_t speed = B115200;
    if (!BaudToSpeed(settings_.baud_rate, speed)) {
      SCON_LOG_WARN("Port", "unsupported baud %u, using 115200",
                    settings_.baud_rate);
    }
    (void)::cfsetispeed(&tio, speed);
    (void)::cfsetospeed(&tio, speed);

    if (::tcsetattr(fd_, TCSANOW, &tio) != 0) {
      return errno;
    }
    (void)::tcflush(fd_, TCIOFLUSH);
    return 0;
  }

  void CloseFd() noexcept {
    if (fd_ < 0) {
      return;
    }
    if (watching_) {
      (void)loop_.Unwatch(fd_);
      watching_ = false;
    }
    // Closing the descriptor also drops the flock.
    (void)::close(fd_);
    fd_ = -1;
  }

  void NotifyOpen(const PortFault* fault) {
    if (listener_.on_open != nullptr) {
      listener_.on_open(listener_.ctx, listener_.tag, fault);
    }
  }

  void FailOpen(PortFaultKind kind, int err, const char* what) {
    char msg[SCON_PORT_FAULT_MSG_MAX + 1U];
    (void)std::snprintf(msg, sizeof(msg), "%s %s: %s", what,
                        settings_.path.c_str(),
                        (err != 0) ? std::strerror(err) : "failed");
    SCON_LOG_WARN("Port", "%s (errno=%d)", msg, err);
    const PortFault fault = PortFault::Make(kind, err, msg);
    NotifyOpen(&fault);
  }

  /// Reports the failure, then closes; the listener may unsubscribe first.
  void FailLink(int err, const char* message) {
    ++stats_.read_errors;
    const PortFault fault = PortFault::Make(PortFaultKind::kIoError, err,
                                            message);
    SCON_LOG_WARN("Port", "%s: %s (errno=%d)", settings_.path.c_str(), message,
                  err);
    if (listener_.on_error != nullptr) {
      listener_.on_error(listener_.ctx, listener_.tag, fault);
    }
    Close();
  }

  static void OnIo(int32_t /*fd*/, uint8_t events, void* ctx) {
    static_cast<PosixSerialPort*>(ctx)->HandleIo(events);
  }

  void HandleIo(uint8_t events) {
    uint8_t buf[SCON_PORT_READ_CHUNK];
    while (fd_ >= 0) {
      const ssize_t n = ::read(fd_, buf, sizeof(buf));
      if (n > 0) {
        stats_.bytes_read += static_cast<uint64_t>(n);
        if (listener_.on_data != nullptr) {
          listener_.on_data(listener_.ctx, listener_.tag, buf,
                            static_cast<uint32_t>(n));
        }
        continue;
      }
      if (n == 0) {
        // VMIN=0/VTIME=0: nothing more buffered right now.
        break;
      }
      const int err = errno;
      if (err == EINTR) {
        continue;
      }
      if (err == EAGAIN || err == EWOULDBLOCK) {
        break;
      }
      FailLink(err, std::strerror(err));
      return;
    }
    if (fd_ >= 0 &&
        (HasEvent(events, IoEvent::kHangup) || HasEvent(events, IoEvent::kError))) {
      FailLink(EIO, "Port hung up");
    }
  }

  EventLoop& loop_;
  PortSettings settings_;
  PortListener listener_;
  SerialPortStats stats_;
  int32_t fd_ = -1;
  bool watching_ = false;
};

// ============================================================================
// PosixPortFactory
// ============================================================================

class PosixPortFactory final : public PortFactory {
 public:
  explicit PosixPortFactory(EventLoop& loop) noexcept : loop_(loop) {}

  std::unique_ptr<SerialPort> Create() override {
    return std::unique_ptr<SerialPort>(new PosixSerialPort(loop_));
  }

 private:
  EventLoop& loop_;
};

}  // namespace scon

#endif  // SCON_POSIX_SERIAL_PORT_HPP_
