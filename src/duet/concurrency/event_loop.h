// Copyright 2025 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

/**
 * @file
 * @brief
 *   Single-threaded cooperative scheduling primitives for Duet.
 *
 * Every call session runs on one `EventLoop`. Document store notifications,
 * transport events and timers are all delivered as tasks on that loop, so
 * no negotiation state is ever touched by two threads. `Timer` is the one
 * arm/cancel primitive used for every debounce, backoff and retry, and
 * `SerialQueue` funnels everything a call session does into a strict FIFO.
 */

#ifndef DUET_CONCURRENCY_EVENT_LOOP_H_
#define DUET_CONCURRENCY_EVENT_LOOP_H_

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <utility>

#include <absl/base/nullability.h>
#include <absl/functional/any_invocable.h>
#include <absl/time/time.h>

namespace duet {

using TimerId = uint64_t;
inline constexpr TimerId kInvalidTimerId = 0;

/**
 * An event loop executing tasks one at a time on a single thread.
 *
 * `Post()` may be called from any thread; native libraries use it to hand
 * their callbacks over to the loop. All other methods must be called from
 * the loop thread.
 *
 * @headerfile duet/concurrency/event_loop.h
 */
class EventLoop {
 public:
  virtual ~EventLoop() = default;

  /** Schedules `task` to run on the loop as soon as possible. Thread-safe. */
  virtual void Post(absl::AnyInvocable<void()> task) = 0;

  /**
   * Schedules `task` to run once `delay` has elapsed.
   *
   * @return
   *   An id that can be passed to `CancelTimer()`. Never `kInvalidTimerId`.
   */
  virtual TimerId PostAfter(absl::Duration delay,
                            absl::AnyInvocable<void()> task) = 0;

  /** Cancels a task scheduled with `PostAfter()`. Unknown ids are ignored. */
  virtual void CancelTimer(TimerId id) = 0;

  [[nodiscard]] virtual absl::Time Now() const = 0;
};

/**
 * A cancellable one-shot timer bound to an event loop.
 *
 * Re-arming an armed timer cancels the previous deadline. Destroying the
 * timer cancels it, so callbacks may safely capture the timer's owner.
 */
class Timer {
 public:
  explicit Timer(EventLoop* absl_nonnull loop) : loop_(loop) {}

  // This class is not copyable or movable.
  Timer(const Timer&) = delete;
  Timer& operator=(const Timer&) = delete;

  ~Timer() { Cancel(); }

  void Arm(absl::Duration delay, absl::AnyInvocable<void()> callback);

  /** Arms the timer unless it is already armed. Returns true if armed now. */
  bool ArmIfIdle(absl::Duration delay, absl::AnyInvocable<void()> callback);

  void Cancel();

  [[nodiscard]] bool armed() const { return id_ != kInvalidTimerId; }

  /** Deadline of the armed timer, or `absl::InfinitePast()` if idle. */
  [[nodiscard]] absl::Time deadline() const {
    return armed() ? deadline_ : absl::InfinitePast();
  }

 private:
  EventLoop* absl_nonnull const loop_;
  TimerId id_ = kInvalidTimerId;
  absl::Time deadline_ = absl::InfinitePast();
};

/**
 * A single-consumer FIFO inbox processed one task at a time.
 *
 * Tasks enqueued while another task runs are appended, never executed
 * reentrantly. After `Close()`, pending and future tasks are dropped.
 */
class SerialQueue {
 public:
  explicit SerialQueue(EventLoop* absl_nonnull loop);

  // This class is not copyable or movable.
  SerialQueue(const SerialQueue&) = delete;
  SerialQueue& operator=(const SerialQueue&) = delete;

  ~SerialQueue();

  void Enqueue(absl::AnyInvocable<void()> task);

  void Close();

  [[nodiscard]] size_t pending() const { return tasks_.size(); }

  [[nodiscard]] bool closed() const { return closed_; }

 private:
  void Drain();

  EventLoop* absl_nonnull const loop_;
  std::deque<absl::AnyInvocable<void()>> tasks_;
  bool draining_ = false;
  bool scheduled_ = false;
  bool closed_ = false;
  std::shared_ptr<int> lifetime_ = std::make_shared<int>(0);
};

/**
 * Wraps `fn` so that invoking the result is a no-op once the object owning
 * `lifetime` has been destroyed.
 */
template <typename Fn>
auto BindToLifetime(std::weak_ptr<int> lifetime, Fn fn) {
  return [lifetime = std::move(lifetime),
          fn = std::move(fn)](auto&&... args) mutable {
    if (lifetime.expired()) {
      return;
    }
    fn(std::forward<decltype(args)>(args)...);
  };
}

}  // namespace duet

#endif  // DUET_CONCURRENCY_EVENT_LOOP_H_
