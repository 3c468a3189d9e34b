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

#include "duet/call/garbage_collector.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>

#include "duet/call/call_session.h"
#include "duet/signalling/session_document.h"
#include "duet/store/json_util.h"

namespace duet::call {

namespace {

constexpr std::string_view kSource = "gc";

std::vector<int64_t> ToVector(const absl::flat_hash_set<int64_t>& revisions) {
  return {revisions.begin(), revisions.end()};
}

}  // namespace

GarbageCollector::GarbageCollector(CallSession* session) : session_(session) {}

void GarbageCollector::GuardOversized(StatusCallback done) {
  CallSession& session = *session_;
  session.store_->Get(
      session.paths_.session(),
      session.Bind([this, done = std::move(done)](
                       absl::StatusOr<std::optional<store::Document>>
                           data) mutable {
        if (!data.ok()) {
          std::move(done)(data.status());
          return;
        }
        if (!data->has_value()) {
          std::move(done)(absl::OkStatus());
          return;
        }
        size_t largest = 0;
        absl::StatusOr<signalling::SessionDocument> document =
            signalling::SessionDocument::FromJson(**data);
        if (document.ok()) {
          largest = document->LargestDescriptionBytes();
        } else {
          largest = store::SerializedSize(**data);
        }
        const size_t limit = session_->config_.max_stored_description_bytes;
        if (largest <= limit) {
          std::move(done)(absl::OkStatus());
          return;
        }
        session_->Log(Severity::kWarning, kSource,
                      absl::StrFormat("A stored description is %d bytes "
                                      "(limit %d); purging the room.",
                                      largest, limit));
        PurgeRoom(std::move(done));
      }));
}

void GarbageCollector::PurgeSuperseded(int64_t keep, StatusCallback done) {
  CallSession& session = *session_;
  auto group = CompletionGroup::Create(session.Bind(
      [this, keep, done = std::move(done)](absl::Status status) mutable {
        if (status.ok()) {
          absl::flat_hash_set<int64_t>& touched =
              session_->state_.touched_revisions;
          const bool had_keep = touched.contains(keep);
          touched.clear();
          if (had_keep) {
            touched.insert(keep);
          }
        }
        std::move(done)(std::move(status));
      }));
  session.ledger_.PurgeAllExcept(keep, ToVector(session.state_.touched_revisions),
                                 group->Add());
  session.ledger_.PurgeLegacy(group->Add());
  PurgeDescriptions(keep, group->Add());
  group->Seal();
}

void GarbageCollector::PurgeRoom(StatusCallback done) {
  CallSession& session = *session_;
  session.Log(Severity::kInfo, kSource, "Purging all room artifacts.");
  auto group = CompletionGroup::Create(session.Bind(
      [this, done = std::move(done)](absl::Status status) mutable {
        if (!status.ok()) {
          std::move(done)(std::move(status));
          return;
        }
        session_->state_.touched_revisions.clear();
        session_->store_->Delete(session_->paths_.session(), std::move(done));
      }));
  session.ledger_.PurgeAllExcept(0, ToVector(session.state_.touched_revisions),
                                 group->Add());
  session.ledger_.PurgeLegacy(group->Add());
  PurgeDescriptions(0, group->Add());
  group->Seal();
}

void GarbageCollector::OnLeave(StatusCallback done) {
  CallSession& session = *session_;
  session.presence_.Leave(session.Bind([this, done = std::move(done)](
                                           absl::Status status) mutable {
    if (!status.ok()) {
      session_->Log(Severity::kWarning, kSource,
                    absl::StrCat("Could not withdraw the presence record: ",
                                 status.ToString()));
    }
    session_->store_->List(
        session_->paths_.participants(),
        session_->Bind([this, done = std::move(done)](
                           absl::StatusOr<std::vector<store::DocumentSnapshot>>
                               records) mutable {
          if (!records.ok()) {
            std::move(done)(records.status());
            return;
          }
          int active = 0;
          for (const store::DocumentSnapshot& record : *records) {
            if (record.id != session_->uid_ &&
                store::GetString(record.data, "status", "active") ==
                    "active") {
              ++active;
            }
          }
          if (active == 0) {
            session_->Log(Severity::kInfo, kSource,
                          "Last participant left the room.");
            PurgeRoom(std::move(done));
            return;
          }
          session_->store_->Get(
              session_->paths_.session(),
              session_->Bind([this, done = std::move(done)](
                                 absl::StatusOr<std::optional<store::Document>>
                                     data) mutable {
                if (!data.ok()) {
                  std::move(done)(data.status());
                  return;
                }
                int64_t keep = 0;
                if (data->has_value()) {
                  absl::StatusOr<signalling::SessionDocument> document =
                      signalling::SessionDocument::FromJson(**data);
                  if (document.ok()) {
                    keep = document->offer_revision();
                  }
                }
                if (keep == 0) {
                  std::move(done)(absl::OkStatus());
                  return;
                }
                PurgeSuperseded(keep, std::move(done));
              }));
        }));
  }));
}

void GarbageCollector::PurgeDescriptions(int64_t keep, StatusCallback done) {
  CallSession& session = *session_;
  session.store_->List(
      session.paths_.descriptions(),
      [store = session.store_, keep, done = std::move(done)](
          absl::StatusOr<std::vector<store::DocumentSnapshot>>
              descriptions) mutable {
        if (!descriptions.ok()) {
          std::move(done)(descriptions.status());
          return;
        }
        const std::string suffix = absl::StrCat("-", keep);
        auto group = CompletionGroup::Create(std::move(done));
        for (const store::DocumentSnapshot& description : *descriptions) {
          if (keep != 0 && absl::EndsWith(description.id, suffix)) {
            continue;
          }
          store->Delete(description.path, group->Add());
        }
        group->Seal();
      });
}

}  // namespace duet::call
