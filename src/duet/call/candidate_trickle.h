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

#ifndef DUET_CALL_CANDIDATE_TRICKLE_H_
#define DUET_CALL_CANDIDATE_TRICKLE_H_

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>

#include <absl/base/nullability.h>
#include <absl/container/flat_hash_set.h>

#include "duet/concurrency/event_loop.h"
#include "duet/net/media_transport.h"
#include "duet/signalling/candidate_ledger.h"
#include "duet/signalling/room_paths.h"
#include "duet/store/document_store.h"

namespace duet::call {

class CallSession;

/**
 * Publishes local connectivity candidates into the active revision and
 * applies the remote party's candidates to the transport.
 *
 * Remote candidates are applied only if they carry the active revision and
 * come from the current remote party, at most once per structural key, and
 * never before the remote description. Candidates that arrive early are
 * queued and flushed in arrival order once the description is set.
 *
 * @headerfile duet/call/candidate_trickle.h
 */
class CandidateTrickle {
 public:
  explicit CandidateTrickle(CallSession* absl_nonnull session);

  // This class is not copyable or movable.
  CandidateTrickle(const CandidateTrickle&) = delete;
  CandidateTrickle& operator=(const CandidateTrickle&) = delete;

  /// Tags local candidates from now on with `revision` and appends them to
  /// the `side` sequence.
  void BeginLocal(int64_t revision, signalling::Side side);

  /// Subscribes to the remote `side` sequence of `revision`, accepting
  /// records written by `author` only. Drops everything queued before.
  void BindRemote(int64_t revision, signalling::Side side,
                  std::string author);

  void OnLocalCandidate(const net::IceCandidate& candidate);
  void OnRemoteCandidate(const signalling::CandidateRecord& record);

  /// Starts flushing queued candidates into the transport.
  void OnRemoteDescriptionSet();

  /// Forgets all revision state, e.g. when the transport is replaced.
  void Reset();

  [[nodiscard]] size_t queued() const { return queue_.size(); }
  [[nodiscard]] size_t applied() const { return applied_; }
  [[nodiscard]] size_t dropped_stale() const { return dropped_stale_; }
  [[nodiscard]] size_t duplicates() const { return duplicates_; }
  [[nodiscard]] size_t dropped_local() const { return dropped_local_; }

 private:
  struct Pending {
    signalling::CandidateRecord record;
    bool retried = false;
  };

  void Enqueue(Pending pending);
  void FlushNext();
  void Apply(Pending pending);

  CallSession* absl_nonnull const session_;

  int64_t local_revision_ = 0;
  signalling::Side local_side_ = signalling::Side::kOffer;

  int64_t remote_revision_ = 0;
  std::string remote_author_;
  bool remote_ready_ = false;
  std::unique_ptr<store::Subscription> remote_subscription_;

  std::deque<Pending> queue_;
  // Dedup keys of candidates handed to the transport, and of queued ones.
  absl::flat_hash_set<std::string> applied_keys_;
  absl::flat_hash_set<std::string> queued_keys_;
  bool flushing_ = false;
  Timer flush_timer_;

  size_t applied_ = 0;
  size_t dropped_stale_ = 0;
  size_t duplicates_ = 0;
  size_t dropped_local_ = 0;
};

}  // namespace duet::call

#endif  // DUET_CALL_CANDIDATE_TRICKLE_H_
