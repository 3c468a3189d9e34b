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

#ifndef DUET_CONCURRENCY_COMPLETION_GROUP_H_
#define DUET_CONCURRENCY_COMPLETION_GROUP_H_

#include <memory>

#include <absl/functional/any_invocable.h>
#include <absl/status/status.h>

namespace duet {

using StatusCallback = absl::AnyInvocable<void(absl::Status)>;

/**
 * Callback-based counterpart of a wait group: fans out a number of
 * asynchronous operations and invokes one completion once all of them have
 * reported back.
 *
 * Usage:
 * @code
 *   auto group = CompletionGroup::Create(std::move(done));
 *   for (const auto& path : paths) {
 *     store->Delete(path, group->Add());
 *   }
 *   group->Seal();
 * @endcode
 *
 * The completion receives the first non-OK status reported, or OK.
 * `NotFound` errors are ignored when `ignore_not_found` is set, which suits
 * idempotent deletions.
 */
class CompletionGroup : public std::enable_shared_from_this<CompletionGroup> {
 public:
  static std::shared_ptr<CompletionGroup> Create(StatusCallback done,
                                                 bool ignore_not_found = true);

  // This class is not copyable or movable.
  CompletionGroup(const CompletionGroup&) = delete;
  CompletionGroup& operator=(const CompletionGroup&) = delete;

  /** Registers one pending operation and returns its completion callback. */
  StatusCallback Add();

  /** Declares that no more operations will be added. */
  void Seal();

 private:
  CompletionGroup(StatusCallback done, bool ignore_not_found);

  void Done(absl::Status status);
  void MaybeFinish();

  StatusCallback done_;
  const bool ignore_not_found_;
  int pending_ = 0;
  bool sealed_ = false;
  bool finished_ = false;
  absl::Status status_;
};

}  // namespace duet

#endif  // DUET_CONCURRENCY_COMPLETION_GROUP_H_
