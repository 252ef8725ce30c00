/**
 * @file fsm.hpp
 * @brief Flat table-driven state machine with run-to-completion dispatch.
 *
 * - Zero heap allocation: states and the pending-event queue are fixed arrays
 * - Function pointers (not std::function), typed user context
 * - A fallback handler sees events the current state leaves unhandled
 * - A transition hook observes every change of state
 *
 * Transition order: on_exit(source), current = target, hook(source, target),
 * on_entry(target). A self-transition runs on_exit and on_entry without the
 * hook.
 *
 * Events dispatched while the machine is busy (from an entry action, a hook,
 * or a callback they trigger) are queued and handled once the current event
 * completes.
 */

#ifndef SCON_FSM_HPP_
#define SCON_FSM_HPP_

#include "scon/log.hpp"
#include "scon/platform.hpp"

#include <cstdint>

namespace scon {

// ============================================================================
// Event / TransitionResult / StateConfig
// ============================================================================

struct Event {
  uint32_t id;
};

enum class TransitionResult : uint8_t {
  kHandled,    ///< Event consumed by current state.
  kUnhandled,  ///< Offer to the fallback handler.
  kTransition  ///< Transition requested via RequestTransition().
};

template <typename Context>
struct StateConfig {
  using HandlerFn = TransitionResult (*)(Context& ctx, const Event& event);
  using EntryFn = void (*)(Context& ctx);
  using ExitFn = void (*)(Context& ctx);

  const char* name;   ///< Static lifetime.
  HandlerFn handler;
  EntryFn on_entry;   ///< nullptr if none.
  ExitFn on_exit;     ///< nullptr if none.
};

// ============================================================================
// StateMachine
// ============================================================================

/**
 * @tparam Context    User context (must outlive the state machine).
 * @tparam MaxStates  State table capacity.
 * @tparam QueueDepth Events that may wait while one is being processed.
 */
template <typename Context, uint32_t MaxStates = 8U, uint32_t QueueDepth = 8U>
class StateMachine final {
 public:
  static constexpr int32_t kNoState = -1;

  using HandlerFn = typename StateConfig<Context>::HandlerFn;
  using HookFn = void (*)(Context& ctx, int32_t from, int32_t to);

  explicit StateMachine(Context& ctx) noexcept : ctx_(ctx) {}

  StateMachine(const StateMachine&) = delete;
  StateMachine& operator=(const StateMachine&) = delete;

  // --- Build Phase ---

  /** @return Index of the new state, or kNoState if the table is full. */
  int32_t AddState(const StateConfig<Context>& config) noexcept {
    SCON_ASSERT(!started_);
    if (state_count_ >= MaxStates) {
      return kNoState;
    }
    states_[state_count_] = config;
    return static_cast<int32_t>(state_count_++);
  }

  void SetInitialState(int32_t state_index) noexcept {
    SCON_ASSERT(!started_);
    SCON_ASSERT(state_index >= 0 &&
                static_cast<uint32_t>(state_index) < state_count_);
    initial_state_ = state_index;
  }

  void SetFallbackHandler(HandlerFn fn) noexcept { fallback_ = fn; }
  void SetTransitionHook(HookFn fn) noexcept { hook_ = fn; }

  /** @brief Enter the initial state (no hook), then drain queued events. */
  void Start() noexcept {
    SCON_ASSERT(!started_);
    SCON_ASSERT(initial_state_ >= 0);
    started_ = true;
    current_state_ = initial_state_;
    busy_ = true;
    if (states_[current_state_].on_entry != nullptr) {
      states_[current_state_].on_entry(ctx_);
    }
    Drain();
  }

  // --- Runtime ---

  /**
   * @brief Process @p event to completion, or queue it if the machine is
   *        already processing one.
   * @return false if the queue was full and the event was dropped.
   */
  bool Dispatch(const Event& event) noexcept {
    SCON_ASSERT(started_);
    if (busy_) {
      if (queue_count_ == QueueDepth) {
        SCON_LOG_ERROR("Fsm", "event queue full, dropped event %u", event.id);
        return false;
      }
      queue_[(queue_head_ + queue_count_) % QueueDepth] = event;
      ++queue_count_;
      return true;
    }
    busy_ = true;
    Process(event);
    Drain();
    return true;
  }

  /** @brief Call from a handler and return its result. */
  TransitionResult RequestTransition(int32_t target) noexcept {
    SCON_ASSERT(target >= 0 && static_cast<uint32_t>(target) < state_count_);
    pending_target_ = target;
    return TransitionResult::kTransition;
  }

  // --- Query ---

  int32_t CurrentState() const noexcept { return current_state_; }

  const char* CurrentStateName() const noexcept {
    return StateName(current_state_);
  }

  const char* StateName(int32_t index) const noexcept {
    if (index < 0 || static_cast<uint32_t>(index) >= state_count_) {
      return "";
    }
    return states_[index].name;
  }

  bool IsInState(int32_t state_index) const noexcept {
    return current_state_ == state_index;
  }

  bool IsStarted() const noexcept { return started_; }
  uint32_t StateCount() const noexcept { return state_count_; }
  uint32_t PendingEvents() const noexcept { return queue_count_; }

 private:
  void Drain() noexcept {
    while (queue_count_ > 0U) {
      const Event next = queue_[queue_head_];
      queue_head_ = (queue_head_ + 1U) % QueueDepth;
      --queue_count_;
      Process(next);
    }
    busy_ = false;
  }

  void Process(const Event& event) noexcept {
    const auto& sc = states_[current_state_];
    TransitionResult result = TransitionResult::kUnhandled;
    if (sc.handler != nullptr) {
      result = sc.handler(ctx_, event);
    }
    if (result == TransitionResult::kUnhandled && fallback_ != nullptr) {
      result = fallback_(ctx_, event);
    }
    if (result == TransitionResult::kTransition) {
      SCON_ASSERT(pending_target_ >= 0);
      const int32_t target = pending_target_;
      pending_target_ = kNoState;
      TransitionTo(target);
    } else if (result == TransitionResult::kUnhandled) {
      SCON_LOG_DEBUG("Fsm", "event %u ignored in state %s", event.id,
                     sc.name);
    }
  }

  void TransitionTo(int32_t target) noexcept {
    const int32_t source = current_state_;
    if (states_[source].on_exit != nullptr) {
      states_[source].on_exit(ctx_);
    }
    current_state_ = target;
    if (source != target && hook_ != nullptr) {
      hook_(ctx_, source, target);
    }
    if (states_[target].on_entry != nullptr) {
      states_[target].on_entry(ctx_);
    }
  }

  Context& ctx_;
  int32_t current_state_ = kNoState;
  int32_t initial_state_ = kNoState;
  int32_t pending_target_ = kNoState;
  uint32_t state_count_ = 0U;
  bool started_ = false;
  bool busy_ = false;
  HandlerFn fallback_ = nullptr;
  HookFn hook_ = nullptr;
  StateConfig<Context> states_[MaxStates] = {};
  Event queue_[QueueDepth] = {};
  uint32_t queue_head_ = 0U;
  uint32_t queue_count_ = 0U;
};

}  // namespace scon

#endif  // SCON_FSM_HPP_
