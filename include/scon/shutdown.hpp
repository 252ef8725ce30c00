/**
 * @file shutdown.hpp
 * @brief SIGINT/SIGTERM delivered to the EventLoop as an ordinary fd event.
 *
 * The signal handler only writes one byte to a pipe. The EventLoop watches
 * the read end and runs the registered callbacks (LIFO) on its own thread,
 * so callbacks may freely touch the Session.
 */

#ifndef SCON_SHUTDOWN_HPP_
#define SCON_SHUTDOWN_HPP_

#include "scon/event_loop.hpp"
#include "scon/log.hpp"
#include "scon/platform.hpp"
#include "scon/vocabulary.hpp"

#include <atomic>
#include <csignal>
#include <cstdint>
#include <fcntl.h>
#include <unistd.h>

namespace scon {

enum class ShutdownError : uint8_t {
  kCallbacksFull = 0,
  kPipeCreationFailed,
  kSignalInstallFailed,
  kAlreadyInstantiated,
  kWatchFailed,
};

/// @brief Cleanup callback. @p signo is 0 for a manual Quit().
using ShutdownFn = void (*)(int signo, void* ctx);

class ShutdownManager;

namespace detail {

/// Exactly one ShutdownManager may be active per process.
inline ShutdownManager*& GetShutdownInstance() {
  static ShutdownManager* ptr = nullptr;
  return ptr;
}

}  // namespace detail

// ============================================================================
// ShutdownManager
// ============================================================================

/**
 * Usage:
 * @code
 *   scon::ShutdownManager mgr(loop);
 *   mgr.Register(OnQuit, &session);
 *   mgr.InstallSignalHandlers();
 *   loop.Run();
 * @endcode
 */
class ShutdownManager final {
 public:
  explicit ShutdownManager(EventLoop& loop) noexcept : loop_(loop) {
    pipe_fd_[0] = -1;
    pipe_fd_[1] = -1;
    if (detail::GetShutdownInstance() != nullptr) {
      return;
    }
    if (::pipe(pipe_fd_) != 0) {
      pipe_fd_[0] = -1;
      pipe_fd_[1] = -1;
      return;
    }
    (void)::fcntl(pipe_fd_[0], F_SETFL, O_NONBLOCK);
    (void)::fcntl(pipe_fd_[1], F_SETFL, O_NONBLOCK);
    if (!loop_.Watch(pipe_fd_[0], static_cast<uint8_t>(IoEvent::kReadable),
                     &ShutdownManager::OnWake, this)
             .has_value()) {
      SCON_LOG_ERROR("Shutdown", "cannot watch wakeup pipe");
      ClosePipe();
      return;
    }
    detail::GetShutdownInstance() = this;
    valid_ = true;
  }

  ~ShutdownManager() {
    if (valid_) {
      (void)loop_.Unwatch(pipe_fd_[0]);
    }
    ClosePipe();
    if (detail::GetShutdownInstance() == this) {
      detail::GetShutdownInstance() = nullptr;
    }
  }

  ShutdownManager(const ShutdownManager&) = delete;
  ShutdownManager& operator=(const ShutdownManager&) = delete;

  bool IsValid() const noexcept { return valid_; }

  expected<void, ShutdownError> Register(ShutdownFn fn, void* ctx) noexcept {
    if (!valid_) {
      return expected<void, ShutdownError>::error(
          ShutdownError::kAlreadyInstantiated);
    }
    if (fn == nullptr || callback_count_ >= kMaxCallbacks) {
      return expected<void, ShutdownError>::error(ShutdownError::kCallbacksFull);
    }
    callbacks_[callback_count_].fn = fn;
    callbacks_[callback_count_].ctx = ctx;
    ++callback_count_;
    return expected<void, ShutdownError>::success();
  }

  expected<void, ShutdownError> InstallSignalHandlers() noexcept {
    if (!valid_) {
      return expected<void, ShutdownError>::error(
          ShutdownError::kAlreadyInstantiated);
    }
    struct sigaction sa;
    sa.sa_handler = &ShutdownManager::SignalHandler;
    ::sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    if (::sigaction(SIGINT, &sa, nullptr) != 0 ||
        ::sigaction(SIGTERM, &sa, nullptr) != 0) {
      return expected<void, ShutdownError>::error(
          ShutdownError::kSignalInstallFailed);
    }
    return expected<void, ShutdownError>::success();
  }

  /// @brief Request shutdown as if a signal arrived. Callbacks run on the
  ///        next loop round.
  void Quit(int signo = 0) noexcept { Wake(signo); }

  bool IsShutdownRequested() const noexcept { return requested_.load(); }

 private:
  static constexpr uint32_t kMaxCallbacks = 8U;

  struct Callback {
    ShutdownFn fn = nullptr;
    void* ctx = nullptr;
  };

  void Wake(int signo) noexcept {
    bool expected_val = false;
    if (requested_.compare_exchange_strong(expected_val, true)) {
      signo_.store(signo, std::memory_order_relaxed);
      if (pipe_fd_[1] >= 0) {
        const uint8_t byte = 1U;
        (void)::write(pipe_fd_[1], &byte, 1);
      }
    }
  }

  /// Async-signal-safe: atomics and write(2) only.
  static void SignalHandler(int signo) {
    ShutdownManager* self = detail::GetShutdownInstance();
    if (self != nullptr) {
      self->Wake(signo);
    }
  }

  static void OnWake(int32_t fd, uint8_t /*events*/, void* ctx) {
    auto* self = static_cast<ShutdownManager*>(ctx);
    uint8_t buf[16];
    while (::read(fd, buf, sizeof(buf)) > 0) {
    }
    if (self->ran_) {
      return;
    }
    self->ran_ = true;
    const int signo = self->signo_.load(std::memory_order_relaxed);
    SCON_LOG_INFO("Shutdown", "shutdown requested (signal %d)", signo);
    for (uint32_t i = self->callback_count_; i > 0U; --i) {
      self->callbacks_[i - 1U].fn(signo, self->callbacks_[i - 1U].ctx);
    }
  }

  void ClosePipe() noexcept {
    for (int& fd : pipe_fd_) {
      if (fd >= 0) {
        (void)::close(fd);
        fd = -1;
      }
    }
  }

  EventLoop& loop_;
  Callback callbacks_[kMaxCallbacks];
  uint32_t callback_count_ = 0U;
  std::atomic<bool> requested_{false};
  std::atomic<int> signo_{0};
  int pipe_fd_[2];
  bool valid_ = false;
  bool ran_ = false;
};

}  // namespace scon

#endif  // SCON_SHUTDOWN_HPP_
