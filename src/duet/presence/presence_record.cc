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

#include "duet/presence/presence_record.h"

#include <absl/status/status.h>
#include <absl/strings/str_cat.h>

#include "duet/store/json_util.h"
#include "duet/util/status_macros.h"

namespace duet::presence {

std::string_view PresenceStatusName(PresenceStatus status) {
  switch (status) {
    case PresenceStatus::kActive:
      return "active";
    case PresenceStatus::kLeft:
      return "left";
    case PresenceStatus::kRemoved:
      return "removed";
  }
  return "unknown";
}

absl::StatusOr<PresenceStatus> ParsePresenceStatus(std::string_view name) {
  if (name == "active") {
    return PresenceStatus::kActive;
  }
  if (name == "left") {
    return PresenceStatus::kLeft;
  }
  if (name == "removed") {
    return PresenceStatus::kRemoved;
  }
  return absl::InvalidArgumentError(
      absl::StrCat("Unknown presence status: ", name));
}

boost::json::object PresenceRecord::ToJson() const {
  boost::json::object object;
  object["uid"] = uid;
  object["displayName"] = display_name;
  object["hasAudio"] = media.has_audio;
  object["hasVideo"] = media.has_video;
  object["screenSharing"] = media.screen_sharing;
  object["speaking"] = speaking;
  object["status"] = PresenceStatusName(status);
  object["streamId"] = stream_id;
  object["joinedAt"] = store::TimeToJson(joined_at);
  object["lastHeartbeat"] = store::TimeToJson(last_heartbeat);
  if (renegotiation_request) {
    boost::json::object request;
    request["id"] = renegotiation_request->id;
    request["reason"] = renegotiation_request->reason;
    request["iceRestart"] = renegotiation_request->ice_restart;
    request["requestedAt"] =
        store::TimeToJson(renegotiation_request->requested_at);
    object["renegotiationRequest"] = std::move(request);
  }
  return object;
}

absl::StatusOr<PresenceRecord> PresenceRecord::FromJson(
    const boost::json::object& object) {
  PresenceRecord record;
  ASSIGN_OR_RETURN(record.uid, store::RequireString(object, "uid"));
  record.display_name = store::GetString(object, "displayName", "Member");
  record.media.has_audio = store::GetBool(object, "hasAudio");
  record.media.has_video = store::GetBool(object, "hasVideo");
  record.media.screen_sharing = store::GetBool(object, "screenSharing");
  record.speaking = store::GetBool(object, "speaking");
  ASSIGN_OR_RETURN(record.status,
                   ParsePresenceStatus(store::GetString(object, "status",
                                                        "active")));
  record.stream_id = store::GetString(object, "streamId");
  record.joined_at = store::GetTime(object, "joinedAt");
  record.last_heartbeat = store::GetTime(object, "lastHeartbeat");
  if (const boost::json::object* request =
          store::GetObject(object, "renegotiationRequest")) {
    RenegotiationRequest parsed;
    parsed.id = store::GetString(*request, "id");
    parsed.reason = store::GetString(*request, "reason");
    parsed.ice_restart = store::GetBool(*request, "iceRestart");
    parsed.requested_at = store::GetTime(*request, "requestedAt");
    if (!parsed.id.empty()) {
      record.renegotiation_request = std::move(parsed);
    }
  }
  return record;
}

}  // namespace duet::presence
