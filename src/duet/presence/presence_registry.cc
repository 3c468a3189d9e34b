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

#include "duet/presence/presence_registry.h"

#include <algorithm>
#include <utility>

#include <absl/log/log.h>
#include <absl/status/status.h>

#include "duet/store/json_util.h"
#include "duet/util/random.h"

namespace duet::presence {

PresenceRegistry::PresenceRegistry(EventLoop* loop,
                                   store::DocumentStore* store,
                                   signalling::RoomPaths paths,
                                   std::string uid, std::string display_name,
                                   PresenceConfig config)
    : loop_(loop),
      store_(store),
      paths_(std::move(paths)),
      uid_(std::move(uid)),
      display_name_(std::move(display_name)),
      config_(config),
      media_timer_(loop),
      speaking_timer_(loop),
      heartbeat_timer_(loop),
      sweep_timer_(loop) {}

PresenceRegistry::~PresenceRegistry() { roster_subscription_.reset(); }

void PresenceRegistry::SetCallbacks(PresenceCallbacks callbacks) {
  callbacks_ = std::move(callbacks);
}

void PresenceRegistry::Join(MediaState media, std::string stream_id,
                            StatusCallback done) {
  const absl::Time now = loop_->Now();
  media_ = media;
  removed_reported_ = false;

  PresenceRecord record;
  record.uid = uid_;
  record.display_name = display_name_;
  record.media = media;
  record.status = PresenceStatus::kActive;
  record.stream_id = std::move(stream_id);
  record.joined_at = now;
  record.last_heartbeat = now;

  store_->Set(
      paths_.participant(uid_), record.ToJson(),
      BindToLifetime(lifetime_, [this, done = std::move(done)](
                                    absl::Status status) mutable {
        if (!status.ok()) {
          std::move(done)(std::move(status));
          return;
        }
        joined_ = true;
        roster_subscription_ = store_->WatchCollection(
            paths_.participants(),
            BindToLifetime(lifetime_,
                           [this](const std::vector<store::DocumentChange>&
                                      changes) {
                             OnParticipantChanges(changes);
                           }));
        heartbeat_timer_.Arm(config_.heartbeat_interval,
                             [this]() { Heartbeat(); });
        sweep_timer_.Arm(config_.stale_sweep_interval,
                         [this]() { SweepStale(); });
        std::move(done)(absl::OkStatus());
      }));
}

void PresenceRegistry::UpdateMedia(MediaState media) {
  if (media == media_ && !media_timer_.armed()) {
    return;
  }
  media_ = media;
  media_timer_.Arm(config_.update_debounce, [this]() { FlushMedia(); });
}

void PresenceRegistry::FlushMedia() {
  boost::json::object fields;
  fields["hasAudio"] = media_.has_audio;
  fields["hasVideo"] = media_.has_video;
  fields["screenSharing"] = media_.screen_sharing;
  fields["lastHeartbeat"] = store::TimeToJson(loop_->Now());
  WriteOwnFields(std::move(fields), "UpdateMedia");
}

void PresenceRegistry::SetSpeaking(bool speaking) {
  if (!joined_) {
    return;
  }
  const absl::Duration since_last = loop_->Now() - last_speaking_update_;
  if (since_last >= config_.speaking_update_interval) {
    WriteSpeaking(speaking);
    return;
  }
  pending_speaking_ = speaking;
  speaking_timer_.ArmIfIdle(config_.speaking_update_interval - since_last,
                            [this]() {
                              if (pending_speaking_.has_value()) {
                                const bool pending = *pending_speaking_;
                                pending_speaking_.reset();
                                WriteSpeaking(pending);
                              }
                            });
}

void PresenceRegistry::WriteSpeaking(bool speaking) {
  last_speaking_update_ = loop_->Now();
  boost::json::object fields;
  fields["speaking"] = speaking;
  WriteOwnFields(std::move(fields), "SetSpeaking");
}

void PresenceRegistry::RequestRenegotiation(std::string_view reason,
                                            bool ice_restart,
                                            StatusCallback done) {
  boost::json::object request;
  request["id"] = GenerateShortId("req");
  request["reason"] = reason;
  request["iceRestart"] = ice_restart;
  request["requestedAt"] = store::TimeToJson(loop_->Now());
  boost::json::object fields;
  fields["renegotiationRequest"] = std::move(request);
  WriteOwnFields(std::move(fields), "RequestRenegotiation", std::move(done));
}

void PresenceRegistry::Leave(StatusCallback done) {
  joined_ = false;
  roster_loaded_ = false;
  media_timer_.Cancel();
  speaking_timer_.Cancel();
  pending_speaking_.reset();
  heartbeat_timer_.Cancel();
  sweep_timer_.Cancel();
  roster_subscription_.reset();
  participants_.clear();

  const std::string path = paths_.participant(uid_);
  store_->Delete(path, [store = store_, path, done = std::move(done)](
                           absl::Status status) mutable {
    if (status.ok()) {
      std::move(done)(absl::OkStatus());
      return;
    }
    LOG(WARNING) << "Could not delete presence record " << path << " ("
                 << status << "), marking it left instead.";
    boost::json::object fields;
    fields["status"] = PresenceStatusName(PresenceStatus::kLeft);
    store->Update(path, std::move(fields), std::move(done));
  });
}

void PresenceRegistry::Kick(std::string_view uid, StatusCallback done) {
  if (uid == uid_) {
    std::move(done)(
        absl::InvalidArgumentError("A participant cannot kick itself."));
    return;
  }
  boost::json::object fields;
  fields["status"] = PresenceStatusName(PresenceStatus::kRemoved);
  store_->Update(paths_.participant(uid), std::move(fields), std::move(done));
}

std::vector<PresenceRecord> PresenceRegistry::ActiveParticipants() const {
  std::vector<PresenceRecord> roster;
  roster.reserve(participants_.size());
  for (const auto& [uid, record] : participants_) {
    roster.push_back(record);
  }
  std::sort(roster.begin(), roster.end(),
            [](const PresenceRecord& a, const PresenceRecord& b) {
              if (a.joined_at != b.joined_at) {
                return a.joined_at < b.joined_at;
              }
              return a.uid < b.uid;
            });
  return roster;
}

const PresenceRecord* PresenceRegistry::Find(std::string_view uid) const {
  const auto it = participants_.find(uid);
  return it == participants_.end() ? nullptr : &it->second;
}

void PresenceRegistry::OnParticipantChanges(
    const std::vector<store::DocumentChange>& changes) {
  if (!joined_) {
    return;
  }
  roster_loaded_ = true;
  bool removed_now = false;

  for (const auto& change : changes) {
    absl::StatusOr<PresenceRecord> record =
        PresenceRecord::FromJson(change.data);
    if (!record.ok()) {
      LOG(WARNING) << "Ignoring malformed presence record " << change.id
                   << ": " << record.status();
      continue;
    }
    const bool known = participants_.contains(record->uid);

    if (record->uid == uid_ && record->status == PresenceStatus::kRemoved &&
        !removed_reported_) {
      removed_reported_ = true;
      removed_now = true;
    }

    if (change.type == store::ChangeType::kRemoved ||
        record->status != PresenceStatus::kActive) {
      if (known) {
        participants_.erase(record->uid);
        if (callbacks_.on_left) {
          callbacks_.on_left(record->uid);
        }
      }
      continue;
    }

    const std::string uid = record->uid;
    participants_.insert_or_assign(uid, *std::move(record));
    const PresenceRecord& stored = participants_.at(uid);
    if (!known) {
      if (callbacks_.on_joined) {
        callbacks_.on_joined(stored);
      }
    } else if (callbacks_.on_updated) {
      callbacks_.on_updated(stored);
    }
  }

  if (callbacks_.on_roster) {
    callbacks_.on_roster(ActiveParticipants());
  }
  if (removed_now && callbacks_.on_removed) {
    callbacks_.on_removed();
  }
}

void PresenceRegistry::Heartbeat() {
  boost::json::object fields;
  fields["lastHeartbeat"] = store::TimeToJson(loop_->Now());
  WriteOwnFields(std::move(fields), "Heartbeat");
  heartbeat_timer_.Arm(config_.heartbeat_interval, [this]() { Heartbeat(); });
}

void PresenceRegistry::SweepStale() {
  const absl::Time cutoff = loop_->Now() - config_.stale_threshold;
  for (const auto& [uid, record] : participants_) {
    if (uid == uid_ || record.last_heartbeat >= cutoff) {
      continue;
    }
    LOG(INFO) << "Marking stale participant " << uid << " as left.";
    boost::json::object fields;
    fields["status"] = PresenceStatusName(PresenceStatus::kLeft);
    store_->Update(paths_.participant(uid), std::move(fields),
                   BindToLifetime(lifetime_, [this](absl::Status status) {
                     if (!status.ok() && !absl::IsNotFound(status)) {
                       ReportError(status, "SweepStale");
                     }
                   }));
  }
  sweep_timer_.Arm(config_.stale_sweep_interval, [this]() { SweepStale(); });
}

void PresenceRegistry::WriteOwnFields(boost::json::object fields,
                                      std::string_view operation,
                                      StatusCallback done) {
  if (!joined_) {
    if (done) {
      std::move(done)(absl::FailedPreconditionError(
          "Presence record is not joined to the room."));
    }
    return;
  }
  store_->Update(
      paths_.participant(uid_), std::move(fields),
      BindToLifetime(lifetime_, [this, operation = std::string(operation),
                                 done = std::move(done)](
                                    absl::Status status) mutable {
        if (!status.ok()) {
          ReportError(status, operation);
        }
        if (done) {
          std::move(done)(std::move(status));
        }
      }));
}

void PresenceRegistry::ReportError(const absl::Status& status,
                                   std::string_view operation) {
  LOG(WARNING) << "Presence " << operation << " failed: " << status;
  if (callbacks_.on_error) {
    callbacks_.on_error(status, std::string(operation));
  }
}

}  // namespace duet::presence
