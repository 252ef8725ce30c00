/**
 * @file failure_classifier.hpp
 * @brief Splits open failures into transient (retry) and permanent (give up).
 *
 * Permanent: permission denied, exclusive lock held by another process,
 * device explicitly removed. Everything else, including timeouts and a
 * missing device node, is retried.
 *
 * kDeviceRemoved comes only from drivers that can tell an explicit removal
 * from an unplug. PosixSerialPort cannot, so it never reports it.
 */

#ifndef SCON_FAILURE_CLASSIFIER_HPP_
#define SCON_FAILURE_CLASSIFIER_HPP_

#include "scon/serial_port.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>

namespace scon {

enum class FailureClass : uint8_t { kTransient = 0, kPermanent = 1 };

namespace detail {

static constexpr const char* kPermanentMarkers[] = {
    "Access denied", "Permission denied", "EACCES",
    "EPERM",         "Resource busy",     "EBUSY",
};

}  // namespace detail

inline bool IsPermanentErrno(int err) noexcept {
  return err == EACCES || err == EPERM || err == EBUSY;
}

inline FailureClass ClassifyFailure(const PortFault& fault) noexcept {
  if (fault.kind == PortFaultKind::kDeviceRemoved) {
    return FailureClass::kPermanent;
  }
  if (IsPermanentErrno(fault.sys_errno)) {
    return FailureClass::kPermanent;
  }
  for (const char* marker : detail::kPermanentMarkers) {
    if (std::strstr(fault.message.c_str(), marker) != nullptr) {
      return FailureClass::kPermanent;
    }
  }
  return FailureClass::kTransient;
}

inline const char* FailureClassName(FailureClass c) noexcept {
  return (c == FailureClass::kPermanent) ? "permanent" : "transient";
}

}  // namespace scon

#endif  // SCON_FAILURE_CLASSIFIER_HPP_
