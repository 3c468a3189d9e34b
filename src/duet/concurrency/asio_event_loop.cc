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

#include "duet/concurrency/asio_event_loop.h"

#include <chrono>
#include <utility>

#include <absl/log/log.h>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/system/error_code.hpp>

namespace duet {

AsioEventLoop::AsioEventLoop() : work_guard_(io_context_.get_executor()) {}

AsioEventLoop::~AsioEventLoop() {
  Stop();
  for (auto& [id, pending] : timers_) {
    pending.timer->cancel();
  }
  timers_.clear();
}

void AsioEventLoop::Post(absl::AnyInvocable<void()> task) {
  boost::asio::post(io_context_,
                    [task = std::move(task)]() mutable { std::move(task)(); });
}

TimerId AsioEventLoop::PostAfter(absl::Duration delay,
                                 absl::AnyInvocable<void()> task) {
  const TimerId id = next_timer_id_++;
  auto timer = std::make_unique<boost::asio::steady_timer>(io_context_);
  timer->expires_after(absl::ToChronoNanoseconds(delay));
  timer->async_wait([this, id](const boost::system::error_code& error) {
    if (error == boost::asio::error::operation_aborted) {
      return;
    }
    if (error) {
      LOG(ERROR) << "AsioEventLoop timer " << id
                 << " failed: " << error.message();
    }
    Fire(id);
  });
  timers_.emplace(id, PendingTimer{std::move(timer), std::move(task)});
  return id;
}

void AsioEventLoop::CancelTimer(TimerId id) {
  const auto it = timers_.find(id);
  if (it == timers_.end()) {
    return;
  }
  it->second.timer->cancel();
  timers_.erase(it);
}

void AsioEventLoop::Run() {
  io_context_.restart();
  io_context_.run();
}

void AsioEventLoop::RunFor(absl::Duration duration) {
  io_context_.restart();
  io_context_.run_for(absl::ToChronoMilliseconds(duration));
}

void AsioEventLoop::Stop() {
  io_context_.stop();
}

void AsioEventLoop::Fire(TimerId id) {
  const auto it = timers_.find(id);
  if (it == timers_.end()) {
    return;
  }
  absl::AnyInvocable<void()> task = std::move(it->second.task);
  timers_.erase(it);
  std::move(task)();
}

}  // namespace duet
