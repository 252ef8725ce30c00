/**
 * @file scheduler.hpp
 * @brief Clock and cancellable-timer interface the Session runs on.
 *
 * The production implementation is EventLoop (event_loop.hpp); tests drive
 * the same interface from a virtual clock. Both keep their timers in a
 * TimerTable: a fixed slot array, no heap.
 */

#ifndef SCON_SCHEDULER_HPP_
#define SCON_SCHEDULER_HPP_

#include "scon/platform.hpp"
#include "scon/vocabulary.hpp"

#include <cstdint>

#ifndef SCON_MAX_TIMERS
#define SCON_MAX_TIMERS 16U
#endif

namespace scon {

/**
 * @brief Plain function pointer invoked when a timer fires.
 * @param ctx  User-supplied opaque context pointer (may be nullptr).
 */
using TimerTaskFn = void (*)(void* ctx);

// ============================================================================
// Scheduler
// ============================================================================

class Scheduler {
 public:
  virtual ~Scheduler() = default;

  /// @brief Monotonic milliseconds. Only differences are meaningful.
  virtual uint64_t NowMs() const = 0;

  /// @brief Milliseconds since the Unix epoch, for event timestamps.
  virtual uint64_t WallClockMs() const = 0;

  /// @brief Fire @p fn once after @p delay_ms (0 = next dispatch round).
  virtual expected<TimerTaskId, TimerError> ScheduleOnce(uint32_t delay_ms,
                                                         TimerTaskFn fn,
                                                         void* ctx) = 0;

  /// @brief Fire @p fn every @p period_ms (must be > 0).
  virtual expected<TimerTaskId, TimerError> SchedulePeriodic(
      uint32_t period_ms, TimerTaskFn fn, void* ctx) = 0;

  /// @brief Cancel a pending timer. kNotRunning if it already fired or
  ///        never existed.
  virtual expected<void, TimerError> Cancel(TimerTaskId id) = 0;
};

// ============================================================================
// TimerTable
// ============================================================================

/**
 * @brief Deadline-ordered timer slots shared by the Scheduler implementations.
 *
 * Callbacks may add or cancel timers (including themselves). A timer added
 * while FireDue() runs never fires in that same pass.
 */
template <uint32_t MaxTimers = SCON_MAX_TIMERS>
class TimerTable final {
 public:
  expected<TimerTaskId, TimerError> Add(uint64_t now_ms, uint32_t delay_ms,
                                        uint32_t period_ms, TimerTaskFn fn,
                                        void* ctx) noexcept {
    if (fn == nullptr) {
      return expected<TimerTaskId, TimerError>::error(
          TimerError::kInvalidPeriod);
    }
    for (uint32_t i = 0U; i < MaxTimers; ++i) {
      if (!slots_[i].active) {
        slots_[i].fn = fn;
        slots_[i].ctx = ctx;
        slots_[i].period_ms = period_ms;
        slots_[i].next_fire_ms = now_ms + delay_ms;
        slots_[i].id = next_id_++;
        if (next_id_ == 0U) {
          next_id_ = 1U;
        }
        slots_[i].active = true;
        return expected<TimerTaskId, TimerError>::success(
            TimerTaskId(slots_[i].id));
      }
    }
    return expected<TimerTaskId, TimerError>::error(TimerError::kSlotsFull);
  }

  expected<void, TimerError> Cancel(TimerTaskId id) noexcept {
    for (uint32_t i = 0U; i < MaxTimers; ++i) {
      if (slots_[i].active && slots_[i].id == id.value()) {
        slots_[i].active = false;
        return expected<void, TimerError>::success();
      }
    }
    return expected<void, TimerError>::error(TimerError::kNotRunning);
  }

  /// @brief Earliest pending deadline, empty when no timer is active.
  optional<uint64_t> NextDeadline() const noexcept {
    optional<uint64_t> best;
    for (uint32_t i = 0U; i < MaxTimers; ++i) {
      if (slots_[i].active &&
          (!best.has_value() || slots_[i].next_fire_ms < best.value())) {
        best = slots_[i].next_fire_ms;
      }
    }
    return best;
  }

  /**
   * @brief Fire every timer due at @p now_ms, earliest deadline first.
   * @return Number of callbacks invoked.
   */
  uint32_t FireDue(uint64_t now_ms) {
    const uint32_t id_limit = next_id_;
    uint32_t fired = 0U;
    for (;;) {
      TaskSlot* due = nullptr;
      for (uint32_t i = 0U; i < MaxTimers; ++i) {
        TaskSlot& s = slots_[i];
        if (!s.active || s.next_fire_ms > now_ms || !IsOlder(s.id, id_limit)) {
          continue;
        }
        if (due == nullptr || s.next_fire_ms < due->next_fire_ms) {
          due = &s;
        }
      }
      if (due == nullptr) {
        break;
      }
      TimerTaskFn fn = due->fn;
      void* ctx = due->ctx;
      if (due->period_ms == 0U) {
        due->active = false;
      } else {
        due->next_fire_ms += due->period_ms;
        // Skip missed periods.
        while (due->next_fire_ms <= now_ms) {
          due->next_fire_ms += due->period_ms;
        }
      }
      fn(ctx);
      ++fired;
    }
    return fired;
  }

  uint32_t ActiveCount() const noexcept {
    uint32_t count = 0U;
    for (uint32_t i = 0U; i < MaxTimers; ++i) {
      if (slots_[i].active) {
        ++count;
      }
    }
    return count;
  }

  bool IsActive(TimerTaskId id) const noexcept {
    for (uint32_t i = 0U; i < MaxTimers; ++i) {
      if (slots_[i].active && slots_[i].id == id.value()) {
        return true;
      }
    }
    return false;
  }

 private:
  struct TaskSlot {
    TimerTaskFn fn = nullptr;
    void* ctx = nullptr;
    uint64_t next_fire_ms = 0U;
    uint32_t period_ms = 0U;  ///< 0 = one-shot.
    uint32_t id = 0U;
    bool active = false;
  };

  /// Wrap-safe "id was issued before limit".
  static bool IsOlder(uint32_t id, uint32_t limit) noexcept {
    return static_cast<int32_t>(id - limit) < 0;
  }

  TaskSlot slots_[MaxTimers];
  uint32_t next_id_ = 1U;
};

}  // namespace scon

#endif  // SCON_SCHEDULER_HPP_
