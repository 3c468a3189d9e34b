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

#ifndef DUET_SIGNALLING_CANDIDATE_LEDGER_H_
#define DUET_SIGNALLING_CANDIDATE_LEDGER_H_

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <absl/base/nullability.h>
#include <absl/status/statusor.h>
#include <absl/time/time.h>
#include <boost/json/object.hpp>

#include "duet/concurrency/completion_group.h"
#include "duet/concurrency/event_loop.h"
#include "duet/signalling/room_paths.h"
#include "duet/store/document_store.h"

namespace duet::signalling {

struct CandidateRecord {
  std::string candidate;
  std::string sdp_mid;
  int sdp_mline_index = 0;
  int64_t revision = 0;
  std::string author;
  int64_t seq = 0;
  absl::Time created_at = absl::UnixEpoch();

  [[nodiscard]] boost::json::object ToJson() const;
  static absl::StatusOr<CandidateRecord> FromJson(
      const boost::json::object& object);

  /// Structural identity: `revision|sdpMid|sdpMLineIndex|candidate`.
  [[nodiscard]] std::string DedupKey() const;
};

using CandidateListener = std::function<void(const CandidateRecord&)>;

/**
 * Revision-scoped storage of trickled connectivity candidates.
 *
 * Every negotiation generation owns a subtree with one ordered candidate
 * sequence per side, so a candidate can never be mistaken for one of a
 * different generation. Superseded subtrees are purged wholesale.
 *
 * @headerfile duet/signalling/candidate_ledger.h
 */
class CandidateLedger {
 public:
  CandidateLedger(store::DocumentStore* absl_nonnull store, RoomPaths paths,
                  std::string uid);

  /// Writes the revision marker document.
  void EnsureRevision(int64_t revision, StatusCallback done);

  /// Appends `record` to the `side` sequence of `record.revision`. Assigns
  /// `seq`, `author` and `created_at`.
  void Append(Side side, CandidateRecord record, absl::Time now,
              StatusCallback done);

  /// Delivers every record of the `side` sequence of `revision`, existing
  /// ones first, in append order.
  std::unique_ptr<store::Subscription> Watch(int64_t revision, Side side,
                                             CandidateListener listener);

  /// Deletes both candidate sequences of `revision`, then its marker.
  void PurgeRevision(int64_t revision, StatusCallback done);

  /// Purges every revision subtree except `keep` (0 keeps none). Revisions
  /// listed in `known` are purged even if their marker is already gone.
  void PurgeAllExcept(int64_t keep, std::vector<int64_t> known,
                      StatusCallback done);

  /// Deletes the non-revisioned candidate collections of older clients.
  void PurgeLegacy(StatusCallback done);

 private:
  void DeleteCollection(std::string collection, StatusCallback done);

  store::DocumentStore* absl_nonnull const store_;
  const RoomPaths paths_;
  const std::string uid_;
  const std::string writer_tag_;
  int64_t next_seq_ = 0;
  std::shared_ptr<int> lifetime_ = std::make_shared<int>(0);
};

}  // namespace duet::signalling

#endif  // DUET_SIGNALLING_CANDIDATE_LEDGER_H_
