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

#ifndef DUET_CALL_CONFIG_H_
#define DUET_CALL_CONFIG_H_

#include <cstddef>

#include <absl/time/time.h>

#include "duet/presence/presence_registry.h"

namespace duet::call {

/// Upper bound on answer publication attempts before self-promotion.
inline constexpr int kMaxAnswerAttempts = 3;

/// Stored offers or answers above this size are purged before joining.
inline constexpr size_t kMaxStoredDescriptionBytes = 256 * 1024;

/// Timings, thresholds and limits of one call session.
struct CallConfig {
  int max_answer_attempts = kMaxAnswerAttempts;

  /// Whether SDP payloads are also written to `descriptions/`. Disabled
  /// for the rest of the session on the first permission failure.
  bool side_channel_enabled = true;
  size_t max_stored_description_bytes = kMaxStoredDescriptionBytes;

  absl::Duration renegotiation_debounce = absl::Milliseconds(250);
  absl::Duration candidate_flush_spacing = absl::Milliseconds(10);

  absl::Duration min_restart_spacing = absl::Seconds(5);
  absl::Duration restart_cooldown_after_connect = absl::Seconds(1);
  absl::Duration disconnected_reconnect_delay = absl::Seconds(5);
  absl::Duration failed_reconnect_delay = absl::Seconds(1);

  int relay_only_threshold = 2;
  int fallback_relay_threshold = 3;
  absl::Duration error_window = absl::Seconds(60);

  absl::Duration health_check_interval = absl::Seconds(3);
  int health_check_miss_threshold = 3;

  absl::Duration reconnect_base_delay = absl::Seconds(2);
  double reconnect_multiplier_cap = 8.0;
  int max_reconnect_attempts = 3;
  /// From this many attempts on, the session document is deleted and
  /// recreated as part of the reconnect.
  int hard_reset_after_attempts = 2;

  presence::PresenceConfig presence;

  size_t diagnostic_capacity = 200;
};

}  // namespace duet::call

#endif  // DUET_CALL_CONFIG_H_
