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

#ifndef DUET_CALL_RENEGOTIATION_SCHEDULER_H_
#define DUET_CALL_RENEGOTIATION_SCHEDULER_H_

#include <string>
#include <string_view>
#include <vector>

#include <absl/base/nullability.h>
#include <absl/container/flat_hash_map.h>

#include "duet/concurrency/event_loop.h"
#include "duet/presence/presence_record.h"

namespace duet::call {

class CallSession;

struct TriggerOptions {
  /// Only the offerer may act on this trigger.
  bool require_offerer = false;
  /// The next offer is created on a fresh transport.
  bool replace_transport = false;
  bool ice_restart = false;
};

/// Coalesced triggers handed to one negotiation cycle.
struct RenegotiationBatch {
  std::vector<std::string> reasons;
  bool replace_transport = false;
  bool ice_restart = false;
};

/**
 * Coalesces renegotiation triggers into one debounced negotiation.
 *
 * A fire while a negotiation is in flight, or while signalling is not
 * stable, is deferred until the session reports it is stable again. A
 * non-offerer either promotes itself, when no remote offerer is present, or
 * asks the offerer through its presence record.
 *
 * @headerfile duet/call/renegotiation_scheduler.h
 */
class RenegotiationScheduler {
 public:
  explicit RenegotiationScheduler(CallSession* absl_nonnull session);

  // This class is not copyable or movable.
  RenegotiationScheduler(const RenegotiationScheduler&) = delete;
  RenegotiationScheduler& operator=(const RenegotiationScheduler&) = delete;

  void Request(std::string_view reason, TriggerOptions options = {});

  /// Called when signalling returns to stable.
  void OnSignalingStable();

  /// Called when the negotiation latch is released.
  void OnNegotiationFinished();

  /// Turns unseen renegotiation requests of other participants into
  /// triggers, if this endpoint is the offerer.
  void OnPresenceRecord(const presence::PresenceRecord& record);

  /// Drops pending reasons and cancels the debounce.
  void Cancel();

  [[nodiscard]] const std::vector<std::string>& pending_reasons() const {
    return reasons_;
  }
  [[nodiscard]] bool awaiting_stable() const { return awaiting_stable_; }
  [[nodiscard]] bool armed() const { return timer_.armed(); }

 private:
  void Fire();
  void RetryIfAwaiting();
  RenegotiationBatch TakeBatch();

  CallSession* absl_nonnull const session_;
  Timer timer_;

  // Insertion-ordered, without duplicates.
  std::vector<std::string> reasons_;
  bool require_offerer_ = false;
  bool replace_transport_ = false;
  bool ice_restart_ = false;
  bool awaiting_stable_ = false;

  absl::flat_hash_map<std::string, std::string> seen_requests_;
};

}  // namespace duet::call

#endif  // DUET_CALL_RENEGOTIATION_SCHEDULER_H_
