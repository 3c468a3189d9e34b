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

#include "duet/concurrency/event_loop.h"

#include <absl/log/check.h>

namespace duet {

void Timer::Arm(absl::Duration delay, absl::AnyInvocable<void()> callback) {
  Cancel();
  deadline_ = loop_->Now() + delay;
  id_ = loop_->PostAfter(
      delay, [this, callback = std::move(callback)]() mutable {
        id_ = kInvalidTimerId;
        // The callback may re-arm this timer, so it is moved out first.
        absl::AnyInvocable<void()> fire = std::move(callback);
        std::move(fire)();
      });
  DCHECK_NE(id_, kInvalidTimerId);
}

bool Timer::ArmIfIdle(absl::Duration delay,
                      absl::AnyInvocable<void()> callback) {
  if (armed()) {
    return false;
  }
  Arm(delay, std::move(callback));
  return true;
}

void Timer::Cancel() {
  if (id_ == kInvalidTimerId) {
    return;
  }
  loop_->CancelTimer(id_);
  id_ = kInvalidTimerId;
}

SerialQueue::SerialQueue(EventLoop* loop) : loop_(loop) {}

SerialQueue::~SerialQueue() {
  closed_ = true;
  tasks_.clear();
}

void SerialQueue::Enqueue(absl::AnyInvocable<void()> task) {
  if (closed_) {
    return;
  }
  tasks_.push_back(std::move(task));
  if (draining_ || scheduled_) {
    return;
  }
  scheduled_ = true;
  loop_->Post(BindToLifetime(lifetime_, [this]() { Drain(); }));
}

void SerialQueue::Close() {
  closed_ = true;
  tasks_.clear();
}

void SerialQueue::Drain() {
  scheduled_ = false;
  draining_ = true;
  while (!tasks_.empty() && !closed_) {
    absl::AnyInvocable<void()> task = std::move(tasks_.front());
    tasks_.pop_front();
    std::move(task)();
  }
  draining_ = false;
}

}  // namespace duet
