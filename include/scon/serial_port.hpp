/**
 * @file serial_port.hpp
 * @brief Transport Port contract consumed by the Session.
 *
 * A SerialPort is one connection attempt's handle. It reports completion and
 * traffic through a PortListener whose tag is echoed on every callback so the
 * owner can recognise events coming from a handle it already replaced.
 *
 * Contract:
 *   - Subscribe() before Open(); at most one listener per handle.
 *   - Open() reports through on_open(), either synchronously from inside
 *     Open() or later from the event loop.
 *   - After Unsubscribe() the handle emits nothing, even while closing.
 *   - Close() is idempotent.
 */

#ifndef SCON_SERIAL_PORT_HPP_
#define SCON_SERIAL_PORT_HPP_

#include "scon/vocabulary.hpp"

#include <cstdint>
#include <memory>

#ifndef SCON_PORT_PATH_MAX
#define SCON_PORT_PATH_MAX 63U
#endif

#ifndef SCON_PORT_FAULT_MSG_MAX
#define SCON_PORT_FAULT_MSG_MAX 127U
#endif

namespace scon {

// ============================================================================
// Faults
// ============================================================================

enum class PortFaultKind : uint8_t {
  kOpenFailed = 0,
  kConfigFailed,
  kConnectTimeout,
  kIoError,
  kWriteFailed,
  kClosed,
  kDeviceRemoved,  ///< Driver-detected explicit removal; never retried.
  kNotOpen,
};

inline const char* PortFaultKindName(PortFaultKind kind) noexcept {
  switch (kind) {
    case PortFaultKind::kOpenFailed:
      return "open failed";
    case PortFaultKind::kConfigFailed:
      return "config failed";
    case PortFaultKind::kConnectTimeout:
      return "connect timeout";
    case PortFaultKind::kIoError:
      return "I/O error";
    case PortFaultKind::kWriteFailed:
      return "write failed";
    case PortFaultKind::kClosed:
      return "closed";
    case PortFaultKind::kDeviceRemoved:
      return "device removed";
    case PortFaultKind::kNotOpen:
      return "not open";
    default:
      return "unknown";
  }
}

struct PortFault {
  PortFaultKind kind = PortFaultKind::kIoError;
  int sys_errno = 0;  ///< 0 when the fault has no OS error behind it.
  FixedString<SCON_PORT_FAULT_MSG_MAX> message;

  static PortFault Make(PortFaultKind kind, int err, const char* msg) noexcept {
    PortFault f;
    f.kind = kind;
    f.sys_errno = err;
    f.message.assign(TruncateToCapacity, msg);
    return f;
  }
};

// ============================================================================
// Settings
// ============================================================================

enum class Parity : uint8_t { kNone = 0, kOdd = 1, kEven = 2 };
enum class FlowControl : uint8_t { kNone = 0, kHardware = 1, kSoftware = 2 };

struct PortSettings {
  FixedString<SCON_PORT_PATH_MAX> path;
  uint32_t baud_rate = 115200U;
  uint8_t data_bits = 8U;  ///< 5, 6, 7, 8
  uint8_t stop_bits = 1U;  ///< 1, 2
  Parity parity = Parity::kNone;
  FlowControl flow_control = FlowControl::kNone;
};

// ============================================================================
// Listener
// ============================================================================

/// @brief Open completion. @p fault is nullptr on success.
using PortOpenFn = void (*)(void* ctx, uint32_t tag, const PortFault* fault);
using PortDataFn = void (*)(void* ctx, uint32_t tag, const uint8_t* data,
                            uint32_t len);
using PortErrorFn = void (*)(void* ctx, uint32_t tag, const PortFault& fault);
using PortClosedFn = void (*)(void* ctx, uint32_t tag);

struct PortListener {
  PortOpenFn on_open = nullptr;
  PortDataFn on_data = nullptr;
  PortErrorFn on_error = nullptr;
  PortClosedFn on_closed = nullptr;
  void* ctx = nullptr;
  uint32_t tag = 0U;
};

// ============================================================================
// SerialPort / PortFactory
// ============================================================================

class SerialPort {
 public:
  virtual ~SerialPort() = default;

  virtual void Subscribe(const PortListener& listener) = 0;
  virtual void Unsubscribe() = 0;

  virtual void Open(const PortSettings& settings) = 0;
  virtual void Close() = 0;

  virtual expected<uint32_t, PortFault> Write(const uint8_t* data,
                                              uint32_t len) = 0;

  virtual bool IsOpen() const = 0;
};

class PortFactory {
 public:
  virtual ~PortFactory() = default;

  /// @brief One new, unopened handle per connection attempt.
  virtual std::unique_ptr<SerialPort> Create() = 0;
};

}  // namespace scon

#endif  // SCON_SERIAL_PORT_HPP_
