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

#include "duet/testing/manual_event_loop.h"

#include <algorithm>
#include <utility>

#include <absl/log/check.h>

namespace duet::testing {

namespace {
// Guards tests against tasks that keep re-posting themselves.
constexpr size_t kMaxTasksPerRun = 1'000'000;
}  // namespace

void ManualEventLoop::Post(absl::AnyInvocable<void()> task) {
  absl::MutexLock lock(&mu_);
  ready_.push_back(std::move(task));
}

TimerId ManualEventLoop::PostAfter(absl::Duration delay,
                                   absl::AnyInvocable<void()> task) {
  absl::MutexLock lock(&mu_);
  const TimerId id = next_timer_id_++;
  const absl::Time deadline = now_ + std::max(delay, absl::ZeroDuration());
  timers_.emplace(TimerKey{deadline, id}, std::move(task));
  deadlines_[id] = deadline;
  return id;
}

void ManualEventLoop::CancelTimer(TimerId id) {
  absl::MutexLock lock(&mu_);
  const auto it = deadlines_.find(id);
  if (it == deadlines_.end()) {
    return;
  }
  timers_.erase(TimerKey{it->second, id});
  deadlines_.erase(it);
}

absl::Time ManualEventLoop::Now() const {
  absl::MutexLock lock(&mu_);
  return now_;
}

bool ManualEventLoop::RunOne() {
  absl::AnyInvocable<void()> task;
  {
    absl::MutexLock lock(&mu_);
    if (!ready_.empty()) {
      task = std::move(ready_.front());
      ready_.pop_front();
    } else if (!timers_.empty() && timers_.begin()->first.first <= now_) {
      auto node = timers_.extract(timers_.begin());
      deadlines_.erase(node.key().second);
      task = std::move(node.mapped());
    } else {
      return false;
    }
  }
  std::move(task)();
  return true;
}

size_t ManualEventLoop::RunUntilIdle() {
  size_t ran = 0;
  while (RunOne()) {
    ++ran;
    CHECK_LT(ran, kMaxTasksPerRun) << "The event loop never became idle.";
  }
  return ran;
}

void ManualEventLoop::AdvanceBy(absl::Duration duration) {
  absl::Time target;
  {
    absl::MutexLock lock(&mu_);
    target = now_ + duration;
  }
  RunUntilIdle();
  while (true) {
    {
      absl::MutexLock lock(&mu_);
      if (timers_.empty() || timers_.begin()->first.first > target) {
        now_ = target;
        break;
      }
      now_ = std::max(now_, timers_.begin()->first.first);
    }
    RunUntilIdle();
  }
  RunUntilIdle();
}

size_t ManualEventLoop::pending_timers() const {
  absl::MutexLock lock(&mu_);
  return timers_.size();
}

}  // namespace duet::testing
