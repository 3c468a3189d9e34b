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

#include "duet/concurrency/completion_group.h"

#include <utility>

#include <absl/log/check.h>

namespace duet {

std::shared_ptr<CompletionGroup> CompletionGroup::Create(
    StatusCallback done, bool ignore_not_found) {
  return std::shared_ptr<CompletionGroup>(
      new CompletionGroup(std::move(done), ignore_not_found));
}

CompletionGroup::CompletionGroup(StatusCallback done, bool ignore_not_found)
    : done_(std::move(done)), ignore_not_found_(ignore_not_found) {}

StatusCallback CompletionGroup::Add() {
  CHECK(!sealed_) << "CompletionGroup::Add() called after Seal()";
  ++pending_;
  return [self = shared_from_this()](absl::Status status) {
    self->Done(std::move(status));
  };
}

void CompletionGroup::Seal() {
  sealed_ = true;
  MaybeFinish();
}

void CompletionGroup::Done(absl::Status status) {
  CHECK_GT(pending_, 0) << "CompletionGroup callback invoked too many times";
  --pending_;
  if (ignore_not_found_ && absl::IsNotFound(status)) {
    status = absl::OkStatus();
  }
  if (status_.ok()) {
    status_ = std::move(status);
  }
  MaybeFinish();
}

void CompletionGroup::MaybeFinish() {
  if (!sealed_ || pending_ > 0 || finished_) {
    return;
  }
  finished_ = true;
  if (done_) {
    StatusCallback done = std::move(done_);
    std::move(done)(status_);
  }
}

}  // namespace duet
