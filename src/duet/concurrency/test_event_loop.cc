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

#include <functional>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/status_matchers.h>
#include <absl/time/time.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "duet/concurrency/completion_group.h"
#include "duet/concurrency/event_loop.h"
#include "duet/testing/manual_event_loop.h"

#define EXPECT_OK(expression) EXPECT_THAT(expression, ::absl_testing::IsOk())

namespace {

using ::absl_testing::StatusIs;
using ::duet::testing::ManualEventLoop;
using ::testing::ElementsAre;
using ::testing::IsEmpty;

TEST(TimerTest, FiresOnceAtDeadline) {
  ManualEventLoop loop;
  duet::Timer timer(&loop);
  int fired = 0;
  timer.Arm(absl::Seconds(2), [&fired]() { ++fired; });
  EXPECT_TRUE(timer.armed());

  loop.AdvanceBy(absl::Milliseconds(1999));
  EXPECT_EQ(fired, 0);
  loop.AdvanceBy(absl::Milliseconds(1));
  EXPECT_EQ(fired, 1);
  EXPECT_FALSE(timer.armed());

  loop.AdvanceBy(absl::Seconds(10));
  EXPECT_EQ(fired, 1);
}

TEST(TimerTest, RearmingReplacesTheDeadline) {
  ManualEventLoop loop;
  duet::Timer timer(&loop);
  std::vector<std::string> fired;
  timer.Arm(absl::Seconds(1), [&fired]() { fired.push_back("first"); });
  loop.AdvanceBy(absl::Milliseconds(500));
  timer.Arm(absl::Seconds(1), [&fired]() { fired.push_back("second"); });

  loop.AdvanceBy(absl::Milliseconds(700));
  EXPECT_THAT(fired, IsEmpty());
  loop.AdvanceBy(absl::Milliseconds(300));
  EXPECT_THAT(fired, ElementsAre("second"));
}

TEST(TimerTest, ArmIfIdleKeepsTheEarlierDeadline) {
  ManualEventLoop loop;
  duet::Timer timer(&loop);
  int fired = 0;
  EXPECT_TRUE(timer.ArmIfIdle(absl::Seconds(1), [&fired]() { ++fired; }));
  EXPECT_FALSE(timer.ArmIfIdle(absl::Seconds(5), [&fired]() { fired += 10; }));
  loop.AdvanceBy(absl::Seconds(6));
  EXPECT_EQ(fired, 1);
}

TEST(TimerTest, DestructionCancels) {
  ManualEventLoop loop;
  int fired = 0;
  {
    duet::Timer timer(&loop);
    timer.Arm(absl::Seconds(1), [&fired]() { ++fired; });
  }
  EXPECT_EQ(loop.pending_timers(), 0u);
  loop.AdvanceBy(absl::Seconds(2));
  EXPECT_EQ(fired, 0);
}

TEST(TimerTest, CallbackMayRearm) {
  ManualEventLoop loop;
  duet::Timer timer(&loop);
  int fired = 0;
  std::function<void()> tick = [&]() {
    ++fired;
    if (fired < 3) {
      timer.Arm(absl::Seconds(1), tick);
    }
  };
  timer.Arm(absl::Seconds(1), tick);
  loop.AdvanceBy(absl::Seconds(10));
  EXPECT_EQ(fired, 3);
}

TEST(SerialQueueTest, RunsTasksInOrderWithoutReentrancy) {
  ManualEventLoop loop;
  duet::SerialQueue queue(&loop);
  std::vector<std::string> trace;

  queue.Enqueue([&]() {
    trace.push_back("a-begin");
    queue.Enqueue([&]() { trace.push_back("c"); });
    trace.push_back("a-end");
  });
  queue.Enqueue([&]() { trace.push_back("b"); });
  EXPECT_THAT(trace, IsEmpty());

  loop.RunUntilIdle();
  EXPECT_THAT(trace, ElementsAre("a-begin", "a-end", "b", "c"));
}

TEST(SerialQueueTest, CloseDropsPendingTasks) {
  ManualEventLoop loop;
  duet::SerialQueue queue(&loop);
  int ran = 0;
  queue.Enqueue([&ran]() { ++ran; });
  queue.Close();
  queue.Enqueue([&ran]() { ++ran; });
  loop.RunUntilIdle();
  EXPECT_EQ(ran, 0);
  EXPECT_TRUE(queue.closed());
}

TEST(CompletionGroupTest, ReportsFirstErrorAfterAllComplete) {
  absl::Status result = absl::UnknownError("not called");
  int calls = 0;
  auto group = duet::CompletionGroup::Create([&](absl::Status status) {
    result = std::move(status);
    ++calls;
  });
  duet::StatusCallback first = group->Add();
  duet::StatusCallback second = group->Add();
  duet::StatusCallback third = group->Add();
  group->Seal();

  std::move(second)(absl::InternalError("second"));
  std::move(first)(absl::OkStatus());
  EXPECT_EQ(calls, 0);
  std::move(third)(absl::UnavailableError("third"));
  EXPECT_EQ(calls, 1);
  EXPECT_THAT(result, StatusIs(absl::StatusCode::kInternal));
}

TEST(CompletionGroupTest, IgnoresNotFoundForIdempotentDeletes) {
  absl::Status result = absl::UnknownError("not called");
  auto group = duet::CompletionGroup::Create(
      [&](absl::Status status) { result = std::move(status); });
  group->Add()(absl::NotFoundError("already gone"));
  group->Seal();
  EXPECT_OK(result);
}

TEST(CompletionGroupTest, EmptyGroupCompletesOnSeal) {
  bool done = false;
  auto group = duet::CompletionGroup::Create([&](absl::Status status) {
    EXPECT_OK(status);
    done = true;
  });
  EXPECT_FALSE(done);
  group->Seal();
  EXPECT_TRUE(done);
}

}  // namespace
