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

#ifndef DUET_PRESENCE_PRESENCE_REGISTRY_H_
#define DUET_PRESENCE_PRESENCE_REGISTRY_H_

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/base/nullability.h>
#include <absl/container/flat_hash_map.h>
#include <absl/status/status.h>
#include <absl/time/time.h>

#include "duet/concurrency/completion_group.h"
#include "duet/concurrency/event_loop.h"
#include "duet/presence/presence_record.h"
#include "duet/signalling/room_paths.h"
#include "duet/store/document_store.h"

namespace duet::presence {

struct PresenceConfig {
  absl::Duration update_debounce = absl::Milliseconds(300);
  absl::Duration speaking_update_interval = absl::Milliseconds(200);
  absl::Duration heartbeat_interval = absl::Seconds(10);
  absl::Duration stale_sweep_interval = absl::Seconds(15);
  absl::Duration stale_threshold = absl::Seconds(30);
};

struct PresenceCallbacks {
  std::function<void(const PresenceRecord&)> on_joined;
  std::function<void(const PresenceRecord&)> on_updated;
  std::function<void(const std::string& uid)> on_left;
  /// Active participants, self included, ordered by join time.
  std::function<void(const std::vector<PresenceRecord>&)> on_roster;
  /// Invoked once when another participant marks our record `removed`.
  std::function<void()> on_removed;
  std::function<void(const absl::Status&, const std::string& operation)>
      on_error;
};

/**
 * Maintains the local participant's presence record in a room and a live
 * view of everyone else's.
 *
 * Records are single-writer: each participant only writes its own, except
 * for the stale sweep and kicks, which only ever downgrade `status`.
 *
 * @headerfile duet/presence/presence_registry.h
 */
class PresenceRegistry {
 public:
  PresenceRegistry(EventLoop* absl_nonnull loop,
                   store::DocumentStore* absl_nonnull store,
                   signalling::RoomPaths paths, std::string uid,
                   std::string display_name, PresenceConfig config = {});

  // This class is not copyable or movable.
  PresenceRegistry(const PresenceRegistry&) = delete;
  PresenceRegistry& operator=(const PresenceRegistry&) = delete;

  ~PresenceRegistry();

  void SetCallbacks(PresenceCallbacks callbacks);

  /**
   * Upserts the local record with `status=active`, then starts the roster
   * subscription, the heartbeat and the stale sweep.
   */
  void Join(MediaState media, std::string stream_id, StatusCallback done);

  /// Debounced write of the local media flags.
  void UpdateMedia(MediaState media);

  /// Rate-limited write of the speaking flag. At most one update is pending.
  void SetSpeaking(bool speaking);

  /// Publishes a renegotiation request for the current offerer to act on.
  /// `ice_restart` asks for an offer with fresh ICE credentials.
  void RequestRenegotiation(std::string_view reason, bool ice_restart,
                            StatusCallback done);

  /**
   * Stops all timers and the subscription, then deletes the local record,
   * falling back to marking it `left` if the deletion fails.
   */
  void Leave(StatusCallback done);

  /// Marks another participant's record `removed`.
  void Kick(std::string_view uid, StatusCallback done);

  [[nodiscard]] bool joined() const { return joined_; }
  [[nodiscard]] bool roster_loaded() const { return roster_loaded_; }
  [[nodiscard]] const std::string& uid() const { return uid_; }
  [[nodiscard]] const MediaState& media() const { return media_; }

  [[nodiscard]] std::vector<PresenceRecord> ActiveParticipants() const;
  [[nodiscard]] size_t active_count() const { return participants_.size(); }
  [[nodiscard]] const PresenceRecord* absl_nullable Find(
      std::string_view uid) const;

 private:
  void OnParticipantChanges(const std::vector<store::DocumentChange>& changes);

  void FlushMedia();
  void WriteSpeaking(bool speaking);
  void Heartbeat();
  void SweepStale();

  void WriteOwnFields(boost::json::object fields, std::string_view operation,
                      StatusCallback done = nullptr);
  void ReportError(const absl::Status& status, std::string_view operation);

  EventLoop* absl_nonnull const loop_;
  store::DocumentStore* absl_nonnull const store_;
  const signalling::RoomPaths paths_;
  const std::string uid_;
  const std::string display_name_;
  const PresenceConfig config_;

  PresenceCallbacks callbacks_;

  bool joined_ = false;
  bool roster_loaded_ = false;
  bool removed_reported_ = false;
  MediaState media_;
  absl::flat_hash_map<std::string, PresenceRecord> participants_;
  std::unique_ptr<store::Subscription> roster_subscription_;

  Timer media_timer_;
  Timer speaking_timer_;
  std::optional<bool> pending_speaking_;
  absl::Time last_speaking_update_ = absl::InfinitePast();
  Timer heartbeat_timer_;
  Timer sweep_timer_;

  std::shared_ptr<int> lifetime_ = std::make_shared<int>(0);
};

}  // namespace duet::presence

#endif  // DUET_PRESENCE_PRESENCE_REGISTRY_H_
