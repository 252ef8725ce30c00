/**
 * @file event_loop.hpp
 * @brief Single-threaded event loop: fd readiness (epoll on Linux, kqueue on
 *        macOS), cancellable timers and posted tasks.
 *
 * Everything runs on the thread that calls Run()/RunOnce(). Handlers must not
 * block. Fixed-capacity tables, no heap.
 *
 * Typical usage:
 *
 *   scon::EventLoop loop;
 *   loop.Watch(fd, static_cast<uint8_t>(scon::IoEvent::kReadable), OnFd, ctx);
 *   loop.ScheduleOnce(1000U, OnTimer, ctx);
 *   loop.Run();  // until Stop()
 */

#ifndef SCON_EVENT_LOOP_HPP_
#define SCON_EVENT_LOOP_HPP_

#include "scon/log.hpp"
#include "scon/platform.hpp"
#include "scon/scheduler.hpp"
#include "scon/vocabulary.hpp"

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <unistd.h>

#if defined(SCON_PLATFORM_LINUX)
#include <sys/epoll.h>
#elif defined(SCON_PLATFORM_MACOS)
#include <sys/event.h>
#include <sys/time.h>
#endif

#ifndef SCON_LOOP_MAX_WATCHES
#define SCON_LOOP_MAX_WATCHES 16U
#endif

#ifndef SCON_LOOP_MAX_POSTED
#define SCON_LOOP_MAX_POSTED 32U
#endif

#ifndef SCON_LOOP_MAX_EVENTS
#define SCON_LOOP_MAX_EVENTS 32U
#endif

namespace scon {

// ============================================================================
// Error / Event Types
// ============================================================================

enum class PollerError : uint8_t {
  kCreateFailed,
  kAddFailed,
  kRemoveFailed,
  kWaitFailed,
  kSlotsFull,
  kNotFound,
};

enum class IoEvent : uint8_t {
  kReadable = 0x01,
  kWritable = 0x02,
  kError = 0x04,
  kHangup = 0x08
};

inline constexpr uint8_t operator|(IoEvent a, IoEvent b) {
  return static_cast<uint8_t>(a) | static_cast<uint8_t>(b);
}

inline constexpr bool HasEvent(uint8_t events, IoEvent e) {
  return (events & static_cast<uint8_t>(e)) != 0U;
}

/// @brief fd readiness callback. @p events is a bitmask of IoEvent.
using IoHandlerFn = void (*)(int32_t fd, uint8_t events, void* ctx);

// ============================================================================
// EventLoop
// ============================================================================

class EventLoop final : public Scheduler {
 public:
  EventLoop() noexcept;
  ~EventLoop() override;

  EventLoop(const EventLoop&) = delete;
  EventLoop& operator=(const EventLoop&) = delete;
  EventLoop(EventLoop&&) = delete;
  EventLoop& operator=(EventLoop&&) = delete;

  bool IsValid() const noexcept { return poller_fd_ >= 0; }

  // --------------------------------------------------------------------------
  // fd watches
  // --------------------------------------------------------------------------

  /** @brief Start delivering readiness of @p fd to @p fn. One watch per fd. */
  expected<void, PollerError> Watch(int32_t fd, uint8_t events, IoHandlerFn fn,
                                    void* ctx);

  /** @brief Stop watching @p fd. Safe from inside a handler. */
  expected<void, PollerError> Unwatch(int32_t fd);

  // --------------------------------------------------------------------------
  // Posted tasks
  // --------------------------------------------------------------------------

  /** @brief Run @p fn on the next dispatch round, in FIFO order. */
  expected<void, PollerError> Post(TimerTaskFn fn, void* ctx);

  // --------------------------------------------------------------------------
  // Scheduler
  // --------------------------------------------------------------------------

  uint64_t NowMs() const override {
    const auto dur = std::chrono::steady_clock::now().time_since_epoch();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(dur).count());
  }

  uint64_t WallClockMs() const override {
    const auto dur = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(dur).count());
  }

  expected<TimerTaskId, TimerError> ScheduleOnce(uint32_t delay_ms,
                                                 TimerTaskFn fn,
                                                 void* ctx) override {
    return timers_.Add(NowMs(), delay_ms, 0U, fn, ctx);
  }

  expected<TimerTaskId, TimerError> SchedulePeriodic(uint32_t period_ms,
                                                     TimerTaskFn fn,
                                                     void* ctx) override {
    if (period_ms == 0U) {
      return expected<TimerTaskId, TimerError>::error(
          TimerError::kInvalidPeriod);
    }
    return timers_.Add(NowMs(), period_ms, period_ms, fn, ctx);
  }

  expected<void, TimerError> Cancel(TimerTaskId id) override {
    return timers_.Cancel(id);
  }

  // --------------------------------------------------------------------------
  // Dispatch
  // --------------------------------------------------------------------------

  /**
   * @brief One round: posted tasks, then fd readiness, then due timers.
   * @param max_wait_ms  Upper bound on blocking, -1 for "until something
   *                     happens".
   * @return Number of callbacks invoked.
   */
  expected<uint32_t, PollerError> RunOnce(int32_t max_wait_ms = -1);

  /** @brief Dispatch until Stop(). */
  expected<void, PollerError> Run();

  void Stop() noexcept { running_ = false; }
  bool IsRunning() const noexcept { return running_; }

  uint32_t WatchCount() const noexcept;
  uint32_t TimerCount() const noexcept { return timers_.ActiveCount(); }

 private:
  struct WatchSlot {
    IoHandlerFn fn = nullptr;
    void* ctx = nullptr;
    int32_t fd = -1;
    bool active = false;
  };

  struct PostedTask {
    TimerTaskFn fn = nullptr;
    void* ctx = nullptr;
  };

  struct Ready {
    int32_t fd;
    uint8_t events;
  };

  WatchSlot* FindWatch(int32_t fd) noexcept {
    for (uint32_t i = 0U; i < SCON_LOOP_MAX_WATCHES; ++i) {
      if (watches_[i].active && watches_[i].fd == fd) {
        return &watches_[i];
      }
    }
    return nullptr;
  }

  uint32_t RunPosted();
  int32_t ComputeTimeout(int32_t max_wait_ms) const;
  expected<uint32_t, PollerError> PollOnce(int32_t timeout_ms, Ready* out);
  bool AddFd(int32_t fd, uint8_t events);
  void RemoveFd(int32_t fd);

  int32_t poller_fd_;
  bool running_ = false;
  WatchSlot watches_[SCON_LOOP_MAX_WATCHES];
  PostedTask posted_[SCON_LOOP_MAX_POSTED];
  uint32_t posted_head_ = 0U;
  uint32_t posted_count_ = 0U;
  TimerTable<SCON_MAX_TIMERS> timers_;
};

// ============================================================================
// Inline Implementation
// ============================================================================

#if defined(SCON_PLATFORM_LINUX)

inline EventLoop::EventLoop() noexcept
    : poller_fd_(::epoll_create1(EPOLL_CLOEXEC)) {
  if (poller_fd_ < 0) {
    SCON_LOG_ERROR("Loop", "epoll_create1 failed");
  }
}

inline bool EventLoop::AddFd(int32_t fd, uint8_t events) {
  struct epoll_event ev {};
  if (HasEvent(events, IoEvent::kReadable)) {
    ev.events |= EPOLLIN;
  }
  if (HasEvent(events, IoEvent::kWritable)) {
    ev.events |= EPOLLOUT;
  }
  ev.data.fd = fd;
  return ::epoll_ctl(poller_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
}

inline void EventLoop::RemoveFd(int32_t fd) {
  // The fd may already be closed, in which case the kernel dropped it.
  (void)::epoll_ctl(poller_fd_, EPOLL_CTL_DEL, fd, nullptr);
}

inline expected<uint32_t, PollerError> EventLoop::PollOnce(int32_t timeout_ms,
                                                           Ready* out) {
  struct epoll_event raw[SCON_LOOP_MAX_EVENTS];
  const int32_t n = ::epoll_wait(poller_fd_, raw,
                                 static_cast<int32_t>(SCON_LOOP_MAX_EVENTS),
                                 timeout_ms);
  if (n < 0) {
    if (errno == EINTR) {
      return expected<uint32_t, PollerError>::success(0U);
    }
    return expected<uint32_t, PollerError>::error(PollerError::kWaitFailed);
  }
  const auto count = static_cast<uint32_t>(n);
  for (uint32_t i = 0U; i < count; ++i) {
    uint8_t ev = 0U;
    if ((raw[i].events & EPOLLIN) != 0U) {
      ev |= static_cast<uint8_t>(IoEvent::kReadable);
    }
    if ((raw[i].events & EPOLLOUT) != 0U) {
      ev |= static_cast<uint8_t>(IoEvent::kWritable);
    }
    if ((raw[i].events & EPOLLERR) != 0U) {
      ev |= static_cast<uint8_t>(IoEvent::kError);
    }
    if ((raw[i].events & EPOLLHUP) != 0U) {
      ev |= static_cast<uint8_t>(IoEvent::kHangup);
    }
    out[i].fd = raw[i].data.fd;
    out[i].events = ev;
  }
  return expected<uint32_t, PollerError>::success(count);
}

#elif defined(SCON_PLATFORM_MACOS)

inline EventLoop::EventLoop() noexcept : poller_fd_(::kqueue()) {
  if (poller_fd_ < 0) {
    SCON_LOG_ERROR("Loop", "kqueue failed");
  }
}

inline bool EventLoop::AddFd(int32_t fd, uint8_t events) {
  struct kevent changes[2];
  int32_t nchanges = 0;
  if (HasEvent(events, IoEvent::kReadable)) {
    EV_SET(&changes[nchanges], fd, EVFILT_READ, EV_ADD | EV_ENABLE, 0, 0,
           nullptr);
    ++nchanges;
  }
  if (HasEvent(events, IoEvent::kWritable)) {
    EV_SET(&changes[nchanges], fd, EVFILT_WRITE, EV_ADD | EV_ENABLE, 0, 0,
           nullptr);
    ++nchanges;
  }
  if (nchanges == 0) {
    return false;
  }
  struct timespec ts = {0, 0};
  return ::kevent(poller_fd_, changes, nchanges, nullptr, 0, &ts) >= 0;
}

inline void EventLoop::RemoveFd(int32_t fd) {
  struct kevent changes[2];
  EV_SET(&changes[0], fd, EVFILT_READ, EV_DELETE, 0, 0, nullptr);
  EV_SET(&changes[1], fd, EVFILT_WRITE, EV_DELETE, 0, 0, nullptr);
  struct timespec ts = {0, 0};
  // Filters that were never registered report errors; nothing to undo.
  (void)::kevent(poller_fd_, changes, 2, nullptr, 0, &ts);
}

inline expected<uint32_t, PollerError> EventLoop::PollOnce(int32_t timeout_ms,
                                                           Ready* out) {
  struct kevent raw[SCON_LOOP_MAX_EVENTS];
  struct timespec ts;
  struct timespec* ts_ptr = nullptr;
  if (timeout_ms >= 0) {
    ts.tv_sec = timeout_ms / 1000;
    ts.tv_nsec = (timeout_ms % 1000) * 1000000L;
    ts_ptr = &ts;
  }
  const int32_t n = ::kevent(poller_fd_, nullptr, 0, raw,
                             static_cast<int32_t>(SCON_LOOP_MAX_EVENTS), ts_ptr);
  if (n < 0) {
    if (errno == EINTR) {
      return expected<uint32_t, PollerError>::success(0U);
    }
    return expected<uint32_t, PollerError>::error(PollerError::kWaitFailed);
  }
  // Merge per-filter events for the same fd.
  uint32_t count = 0U;
  for (int32_t i = 0; i < n; ++i) {
    const auto fd = static_cast<int32_t>(raw[i].ident);
    uint8_t ev = 0U;
    if (raw[i].filter == EVFILT_READ) {
      ev |= static_cast<uint8_t>(IoEvent::kReadable);
    }
    if (raw[i].filter == EVFILT_WRITE) {
      ev |= static_cast<uint8_t>(IoEvent::kWritable);
    }
    if ((raw[i].flags & EV_ERROR) != 0U) {
      ev |= static_cast<uint8_t>(IoEvent::kError);
    }
    if ((raw[i].flags & EV_EOF) != 0U) {
      ev |= static_cast<uint8_t>(IoEvent::kHangup);
    }
    bool merged = false;
    for (uint32_t j = 0U; j < count; ++j) {
      if (out[j].fd == fd) {
        out[j].events |= ev;
        merged = true;
        break;
      }
    }
    if (!merged) {
      out[count].fd = fd;
      out[count].events = ev;
      ++count;
    }
  }
  return expected<uint32_t, PollerError>::success(count);
}

#endif

inline EventLoop::~EventLoop() {
  if (poller_fd_ >= 0) {
    ::close(poller_fd_);
  }
}

inline expected<void, PollerError> EventLoop::Watch(int32_t fd, uint8_t events,
                                                    IoHandlerFn fn, void* ctx) {
  if (poller_fd_ < 0) {
    return expected<void, PollerError>::error(PollerError::kCreateFailed);
  }
  if (FindWatch(fd) != nullptr) {
    return expected<void, PollerError>::error(PollerError::kAddFailed);
  }
  for (uint32_t i = 0U; i < SCON_LOOP_MAX_WATCHES; ++i) {
    WatchSlot& w = watches_[i];
    if (w.active) {
      continue;
    }
    if (!AddFd(fd, events)) {
      SCON_LOG_WARN("Loop", "watch fd=%d failed: errno=%d", fd, errno);
      return expected<void, PollerError>::error(PollerError::kAddFailed);
    }
    w.fn = fn;
    w.ctx = ctx;
    w.fd = fd;
    w.active = true;
    return expected<void, PollerError>::success();
  }
  return expected<void, PollerError>::error(PollerError::kSlotsFull);
}

inline expected<void, PollerError> EventLoop::Unwatch(int32_t fd) {
  WatchSlot* w = FindWatch(fd);
  if (w == nullptr) {
    return expected<void, PollerError>::error(PollerError::kNotFound);
  }
  RemoveFd(fd);
  w->active = false;
  w->fd = -1;
  return expected<void, PollerError>::success();
}

inline expected<void, PollerError> EventLoop::Post(TimerTaskFn fn, void* ctx) {
  if (posted_count_ == SCON_LOOP_MAX_POSTED) {
    return expected<void, PollerError>::error(PollerError::kSlotsFull);
  }
  const uint32_t tail = (posted_head_ + posted_count_) % SCON_LOOP_MAX_POSTED;
  posted_[tail].fn = fn;
  posted_[tail].ctx = ctx;
  ++posted_count_;
  return expected<void, PollerError>::success();
}

inline uint32_t EventLoop::RunPosted() {
  // Tasks posted by these tasks wait for the next round.
  const uint32_t n = posted_count_;
  for (uint32_t i = 0U; i < n; ++i) {
    const PostedTask task = posted_[posted_head_];
    posted_head_ = (posted_head_ + 1U) % SCON_LOOP_MAX_POSTED;
    --posted_count_;
    task.fn(task.ctx);
  }
  return n;
}

inline int32_t EventLoop::ComputeTimeout(int32_t max_wait_ms) const {
  if (posted_count_ > 0U) {
    return 0;
  }
  const optional<uint64_t> deadline = timers_.NextDeadline();
  if (!deadline.has_value()) {
    return max_wait_ms;
  }
  const uint64_t now = NowMs();
  const uint64_t wait =
      (deadline.value() > now) ? (deadline.value() - now) : 0U;
  if (max_wait_ms >= 0 && wait > static_cast<uint64_t>(max_wait_ms)) {
    return max_wait_ms;
  }
  return (wait > 0x7FFFFFFFU) ? 0x7FFFFFFF : static_cast<int32_t>(wait);
}

inline expected<uint32_t, PollerError> EventLoop::RunOnce(int32_t max_wait_ms) {
  if (poller_fd_ < 0) {
    return expected<uint32_t, PollerError>::error(PollerError::kCreateFailed);
  }
  uint32_t invoked = RunPosted();

  Ready ready[SCON_LOOP_MAX_EVENTS];
  auto polled = PollOnce(ComputeTimeout(max_wait_ms), ready);
  if (!polled.has_value()) {
    SCON_LOG_ERROR("Loop", "poll failed: errno=%d", errno);
    return expected<uint32_t, PollerError>::error(polled.get_error());
  }
  for (uint32_t i = 0U; i < polled.value(); ++i) {
    // Looked up per event: an earlier handler may have unwatched this fd.
    WatchSlot* w = FindWatch(ready[i].fd);
    if (w != nullptr) {
      w->fn(ready[i].fd, ready[i].events, w->ctx);
      ++invoked;
    }
  }

  invoked += timers_.FireDue(NowMs());
  return expected<uint32_t, PollerError>::success(invoked);
}

inline expected<void, PollerError> EventLoop::Run() {
  running_ = true;
  while (running_) {
    auto r = RunOnce(-1);
    if (!r.has_value()) {
      running_ = false;
      return expected<void, PollerError>::error(r.get_error());
    }
  }
  // Drain work posted by whoever stopped us.
  (void)RunPosted();
  return expected<void, PollerError>::success();
}

inline uint32_t EventLoop::WatchCount() const noexcept {
  uint32_t count = 0U;
  for (uint32_t i = 0U; i < SCON_LOOP_MAX_WATCHES; ++i) {
    if (watches_[i].active) {
      ++count;
    }
  }
  return count;
}

}  // namespace scon

#endif  // SCON_EVENT_LOOP_HPP_
