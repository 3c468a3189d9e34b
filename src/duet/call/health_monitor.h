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

#ifndef DUET_CALL_HEALTH_MONITOR_H_
#define DUET_CALL_HEALTH_MONITOR_H_

#include <deque>
#include <string>
#include <string_view>

#include <absl/base/nullability.h>
#include <absl/status/statusor.h>
#include <absl/time/time.h>

#include "duet/concurrency/event_loop.h"
#include "duet/net/media_transport.h"

namespace duet::call {

class CallSession;

enum class ConnectionQuality { kUnknown, kExcellent, kGood, kPoor };

std::string_view ConnectionQualityName(ConnectionQuality quality);

/// Classifies link quality from packet loss, round trip time and jitter.
ConnectionQuality ClassifyQuality(const net::TransportStats& stats);

/// What the UI shows about the link to the remote party.
struct ConnectionIndicator {
  net::ConnectionState state = net::ConnectionState::kNew;
  ConnectionQuality quality = ConnectionQuality::kUnknown;
  net::TransportStats stats;
};

/// Exponential reconnect delays: `base * min(1.5^attempt, cap)`.
class ReconnectBackoff {
 public:
  ReconnectBackoff(absl::Duration base, double multiplier_cap)
      : base_(base), multiplier_cap_(multiplier_cap) {}

  [[nodiscard]] absl::Duration NextDelay() const;

  void RecordAttempt() { ++attempt_; }
  void Reset() { attempt_ = 0; }

  [[nodiscard]] int attempt() const { return attempt_; }

 private:
  const absl::Duration base_;
  const double multiplier_cap_;
  int attempt_ = 0;
};

/**
 * Watches the transport's connection state and statistics and drives
 * recovery: in-place connectivity restarts first, relay escalation after
 * repeated errors, and full reconnects with exponential backoff last.
 *
 * @headerfile duet/call/health_monitor.h
 */
class HealthMonitor {
 public:
  explicit HealthMonitor(CallSession* absl_nonnull session);

  // This class is not copyable or movable.
  HealthMonitor(const HealthMonitor&) = delete;
  HealthMonitor& operator=(const HealthMonitor&) = delete;

  void OnConnectionState(net::ConnectionState state);
  void OnCandidateError(const net::CandidateError& error);

  /// A reconnect attempt could not even rejoin the room.
  void OnRejoinFailed(const absl::Status& status);

  /// Cancels timers tied to the current transport. Keeps the backoff and
  /// escalation state, which span reconnects.
  void Suspend();

  /// Cancels everything and forgets all state. Used on leave.
  void Stop();

  /// Options for the next transport, reflecting relay escalation.
  [[nodiscard]] net::TransportOptions transport_options() const;

  [[nodiscard]] int reconnect_attempts() const { return backoff_.attempt(); }
  [[nodiscard]] bool relay_only() const { return relay_only_; }
  [[nodiscard]] bool fallback_relay() const { return fallback_relay_; }
  [[nodiscard]] bool terminal() const { return terminal_; }
  [[nodiscard]] bool reconnect_pending() const {
    return reconnect_timer_.armed();
  }
  [[nodiscard]] int restarts() const { return restarts_; }
  [[nodiscard]] ConnectionQuality quality() const { return quality_; }

 private:
  void RecordConnectivityError(std::string_view cause);
  // `link_stalled` marks recovery asked for by the health check. The
  // transport still reports itself connected in that case.
  void ScheduleRestart(std::string_view cause, bool link_stalled = false);
  void Restart(bool link_stalled);
  void ScheduleReconnect(std::string_view cause, absl::Duration min_delay,
                         bool link_stalled = false);
  void Reconnect(std::string cause, bool link_stalled);
  void CheckHealth();
  void OnStats(absl::StatusOr<net::TransportStats> stats);

  CallSession* absl_nonnull const session_;

  ReconnectBackoff backoff_;
  Timer restart_timer_;
  Timer reconnect_timer_;
  Timer health_timer_;

  std::deque<absl::Time> error_times_;
  bool relay_only_ = false;
  bool fallback_relay_ = false;
  bool terminal_ = false;

  absl::Time last_connected_at_ = absl::InfinitePast();
  absl::Time last_restart_at_ = absl::InfinitePast();
  int restarts_ = 0;
  int missed_checks_ = 0;
  ConnectionQuality quality_ = ConnectionQuality::kUnknown;
};

}  // namespace duet::call

#endif  // DUET_CALL_HEALTH_MONITOR_H_
