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

#ifndef DUET_PRESENCE_PRESENCE_RECORD_H_
#define DUET_PRESENCE_PRESENCE_RECORD_H_

#include <optional>
#include <string>
#include <string_view>

#include <absl/status/statusor.h>
#include <absl/time/time.h>
#include <boost/json/object.hpp>

namespace duet::presence {

enum class PresenceStatus { kActive, kLeft, kRemoved };

std::string_view PresenceStatusName(PresenceStatus status);
absl::StatusOr<PresenceStatus> ParsePresenceStatus(std::string_view name);

/// Local media a participant publishes.
struct MediaState {
  bool has_audio = false;
  bool has_video = false;
  bool screen_sharing = false;

  bool operator==(const MediaState& other) const = default;
};

/// Asks the current offerer to renegotiate on behalf of a non-offerer.
struct RenegotiationRequest {
  std::string id;
  std::string reason;
  /// The requester restarted connectivity and needs fresh ICE credentials.
  bool ice_restart = false;
  absl::Time requested_at = absl::UnixEpoch();
};

struct PresenceRecord {
  std::string uid;
  std::string display_name;
  MediaState media;
  bool speaking = false;
  PresenceStatus status = PresenceStatus::kActive;
  /// Correlates a transport-level media stream with this participant.
  std::string stream_id;
  absl::Time joined_at = absl::UnixEpoch();
  absl::Time last_heartbeat = absl::UnixEpoch();
  std::optional<RenegotiationRequest> renegotiation_request;

  [[nodiscard]] boost::json::object ToJson() const;
  static absl::StatusOr<PresenceRecord> FromJson(
      const boost::json::object& object);
};

}  // namespace duet::presence

#endif  // DUET_PRESENCE_PRESENCE_RECORD_H_
