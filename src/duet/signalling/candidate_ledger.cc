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

#include "duet/signalling/candidate_ledger.h"

#include <algorithm>
#include <utility>

#include <absl/log/log.h>
#include <absl/status/status.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>

#include "duet/store/json_util.h"
#include "duet/util/random.h"
#include "duet/util/status_macros.h"

namespace duet::signalling {

boost::json::object CandidateRecord::ToJson() const {
  boost::json::object object;
  object["candidate"] = candidate;
  object["sdpMid"] = sdp_mid;
  object["sdpMLineIndex"] = sdp_mline_index;
  object["revision"] = revision;
  object["author"] = author;
  object["seq"] = seq;
  object["createdAt"] = store::TimeToJson(created_at);
  return object;
}

absl::StatusOr<CandidateRecord> CandidateRecord::FromJson(
    const boost::json::object& object) {
  CandidateRecord record;
  ASSIGN_OR_RETURN(record.candidate,
                   store::RequireString(object, "candidate"));
  record.sdp_mid = store::GetString(object, "sdpMid");
  record.sdp_mline_index =
      static_cast<int>(store::GetInt64(object, "sdpMLineIndex"));
  record.revision = store::GetInt64(object, "revision");
  record.author = store::GetString(object, "author");
  record.seq = store::GetInt64(object, "seq");
  record.created_at = store::GetTime(object, "createdAt");
  return record;
}

std::string CandidateRecord::DedupKey() const {
  return absl::StrCat(revision, "|", sdp_mid, "|", sdp_mline_index, "|",
                      candidate);
}

CandidateLedger::CandidateLedger(store::DocumentStore* store, RoomPaths paths,
                                 std::string uid)
    : store_(store),
      paths_(std::move(paths)),
      uid_(std::move(uid)),
      writer_tag_(GenerateShortId("w")) {}

void CandidateLedger::EnsureRevision(int64_t revision, StatusCallback done) {
  boost::json::object marker;
  marker["revision"] = revision;
  marker["createdBy"] = uid_;
  store_->Set(paths_.revision(revision), std::move(marker), std::move(done));
}

void CandidateLedger::Append(Side side, CandidateRecord record, absl::Time now,
                             StatusCallback done) {
  record.seq = next_seq_++;
  record.author = uid_;
  record.created_at = now;
  // Ids sort by sequence; the writer tag keeps a re-answering client from
  // overwriting the records of its previous transport.
  const std::string path =
      absl::StrCat(paths_.candidates(record.revision, side), "/",
                   RoomPaths::CandidateId(record.seq), "-", writer_tag_);
  store_->Set(path, record.ToJson(), std::move(done));
}

std::unique_ptr<store::Subscription> CandidateLedger::Watch(
    int64_t revision, Side side, CandidateListener listener) {
  return store_->WatchCollection(
      paths_.candidates(revision, side),
      [revision, listener = std::move(listener)](
          const std::vector<store::DocumentChange>& changes) {
        for (const auto& change : changes) {
          if (change.type != store::ChangeType::kAdded) {
            continue;
          }
          absl::StatusOr<CandidateRecord> record =
              CandidateRecord::FromJson(change.data);
          if (!record.ok()) {
            LOG(WARNING) << "Skipping malformed candidate " << change.id
                         << " of revision " << revision << ": "
                         << record.status();
            continue;
          }
          listener(*record);
        }
      });
}

void CandidateLedger::PurgeRevision(int64_t revision, StatusCallback done) {
  auto group = CompletionGroup::Create(BindToLifetime(
      lifetime_,
      [this, revision, done = std::move(done)](absl::Status status) mutable {
        if (!status.ok()) {
          // The marker stays so that a later purge can find the leftovers.
          std::move(done)(std::move(status));
          return;
        }
        store_->Delete(paths_.revision(revision), std::move(done));
      }));
  DeleteCollection(paths_.candidates(revision, Side::kOffer), group->Add());
  DeleteCollection(paths_.candidates(revision, Side::kAnswer), group->Add());
  group->Seal();
}

void CandidateLedger::PurgeAllExcept(int64_t keep, std::vector<int64_t> known,
                                     StatusCallback done) {
  store_->List(
      paths_.revisions(),
      BindToLifetime(lifetime_, [this, keep, known = std::move(known),
                                 done = std::move(done)](
                                    absl::StatusOr<std::vector<
                                        store::DocumentSnapshot>>
                                        markers) mutable {
        if (!markers.ok()) {
          std::move(done)(markers.status());
          return;
        }
        std::vector<int64_t> revisions = std::move(known);
        for (const auto& marker : *markers) {
          int64_t revision = 0;
          if (absl::SimpleAtoi(marker.id, &revision)) {
            revisions.push_back(revision);
          }
        }
        std::sort(revisions.begin(), revisions.end());
        revisions.erase(std::unique(revisions.begin(), revisions.end()),
                        revisions.end());

        auto group = CompletionGroup::Create(std::move(done));
        for (const int64_t revision : revisions) {
          if (revision != keep) {
            PurgeRevision(revision, group->Add());
          }
        }
        group->Seal();
      }));
}

void CandidateLedger::PurgeLegacy(StatusCallback done) {
  auto group = CompletionGroup::Create(std::move(done));
  DeleteCollection(paths_.legacy_candidates(Side::kOffer), group->Add());
  DeleteCollection(paths_.legacy_candidates(Side::kAnswer), group->Add());
  group->Seal();
}

void CandidateLedger::DeleteCollection(std::string collection,
                                       StatusCallback done) {
  store_->List(
      collection,
      BindToLifetime(lifetime_, [this, done = std::move(done)](
                                    absl::StatusOr<std::vector<
                                        store::DocumentSnapshot>>
                                        documents) mutable {
        if (!documents.ok()) {
          std::move(done)(documents.status());
          return;
        }
        auto group = CompletionGroup::Create(std::move(done));
        for (const auto& document : *documents) {
          store_->Delete(document.path, group->Add());
        }
        group->Seal();
      }));
}

}  // namespace duet::signalling
