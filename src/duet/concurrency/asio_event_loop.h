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

#ifndef DUET_CONCURRENCY_ASIO_EVENT_LOOP_H_
#define DUET_CONCURRENCY_ASIO_EVENT_LOOP_H_

#define BOOST_ASIO_NO_DEPRECATED

#include <memory>

#include <absl/container/flat_hash_map.h>
#include <absl/functional/any_invocable.h>
#include <absl/time/time.h>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "duet/concurrency/event_loop.h"

namespace duet {

/**
 * An `EventLoop` backed by a Boost.Asio `io_context` driven by one thread.
 *
 * @headerfile duet/concurrency/asio_event_loop.h
 */
class AsioEventLoop final : public EventLoop {
 public:
  AsioEventLoop();

  // This class is not copyable or movable.
  AsioEventLoop(const AsioEventLoop&) = delete;
  AsioEventLoop& operator=(const AsioEventLoop&) = delete;

  ~AsioEventLoop() override;

  void Post(absl::AnyInvocable<void()> task) override;

  TimerId PostAfter(absl::Duration delay,
                    absl::AnyInvocable<void()> task) override;

  void CancelTimer(TimerId id) override;

  [[nodiscard]] absl::Time Now() const override { return absl::Now(); }

  /** Runs the loop on the calling thread until `Stop()` is called. */
  void Run();

  /** Runs the loop on the calling thread for at most `duration`. */
  void RunFor(absl::Duration duration);

  /** Stops the loop. Thread-safe. */
  void Stop();

 private:
  struct PendingTimer {
    std::unique_ptr<boost::asio::steady_timer> timer;
    absl::AnyInvocable<void()> task;
  };

  void Fire(TimerId id);

  boost::asio::io_context io_context_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type>
      work_guard_;
  absl::flat_hash_map<TimerId, PendingTimer> timers_;
  TimerId next_timer_id_ = 1;
};

}  // namespace duet

#endif  // DUET_CONCURRENCY_ASIO_EVENT_LOOP_H_
