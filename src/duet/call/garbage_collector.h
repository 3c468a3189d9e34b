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

#ifndef DUET_CALL_GARBAGE_COLLECTOR_H_
#define DUET_CALL_GARBAGE_COLLECTOR_H_

#include <cstdint>

#include <absl/base/nullability.h>

#include "duet/concurrency/completion_group.h"

namespace duet::call {

class CallSession;

/**
 * Bounds the storage a room uses: superseded revision subtrees, legacy
 * candidate collections and side-channel descriptions are deleted when a
 * new offer supersedes them, and everything is deleted once the last
 * participant leaves.
 *
 * @headerfile duet/call/garbage_collector.h
 */
class GarbageCollector {
 public:
  explicit GarbageCollector(CallSession* absl_nonnull session);

  /// Purges the room if a stored description exceeds the size limit.
  void GuardOversized(StatusCallback done);

  /// Deletes all artifacts of revisions other than `keep`.
  void PurgeSuperseded(int64_t keep, StatusCallback done);

  /// Deletes the session document and every artifact under it except
  /// presence records.
  void PurgeRoom(StatusCallback done);

  /// Leaves the presence registry, then purges the room if no active
  /// participant remains, or superseded artifacts otherwise.
  void OnLeave(StatusCallback done);

 private:
  void PurgeDescriptions(int64_t keep, StatusCallback done);

  CallSession* absl_nonnull const session_;
};

}  // namespace duet::call

#endif  // DUET_CALL_GARBAGE_COLLECTOR_H_
