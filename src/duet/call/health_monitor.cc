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

#include "duet/call/health_monitor.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include <absl/status/status.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>

#include "duet/call/call_session.h"

namespace duet::call {

namespace {

constexpr std::string_view kSource = "health";

constexpr double kPoorLoss = 0.10;
constexpr double kGoodLoss = 0.03;
constexpr absl::Duration kPoorRoundTrip = absl::Milliseconds(300);
constexpr absl::Duration kGoodRoundTrip = absl::Milliseconds(150);
constexpr absl::Duration kPoorJitter = absl::Milliseconds(50);
constexpr absl::Duration kGoodJitter = absl::Milliseconds(20);

}  // namespace

std::string_view ConnectionQualityName(ConnectionQuality quality) {
  switch (quality) {
    case ConnectionQuality::kUnknown:
      return "unknown";
    case ConnectionQuality::kExcellent:
      return "excellent";
    case ConnectionQuality::kGood:
      return "good";
    case ConnectionQuality::kPoor:
      return "poor";
  }
  return "unknown";
}

ConnectionQuality ClassifyQuality(const net::TransportStats& stats) {
  if (!stats.packet_loss && !stats.round_trip_time && !stats.jitter) {
    return ConnectionQuality::kUnknown;
  }
  const double loss = stats.packet_loss.value_or(0.0);
  const absl::Duration rtt =
      stats.round_trip_time.value_or(absl::ZeroDuration());
  const absl::Duration jitter = stats.jitter.value_or(absl::ZeroDuration());

  if (loss > kPoorLoss || rtt > kPoorRoundTrip || jitter > kPoorJitter) {
    return ConnectionQuality::kPoor;
  }
  if (loss > kGoodLoss || rtt > kGoodRoundTrip || jitter > kGoodJitter) {
    return ConnectionQuality::kGood;
  }
  return ConnectionQuality::kExcellent;
}

absl::Duration ReconnectBackoff::NextDelay() const {
  const double multiplier =
      std::min(std::pow(1.5, static_cast<double>(attempt_)), multiplier_cap_);
  return base_ * multiplier;
}

HealthMonitor::HealthMonitor(CallSession* session)
    : session_(session),
      backoff_(session->config_.reconnect_base_delay,
               session->config_.reconnect_multiplier_cap),
      restart_timer_(session->loop_),
      reconnect_timer_(session->loop_),
      health_timer_(session->loop_) {}

void HealthMonitor::OnConnectionState(net::ConnectionState state) {
  const CallConfig& config = session_->config_;
  switch (state) {
    case net::ConnectionState::kConnected:
      last_connected_at_ = session_->loop_->Now();
      restart_timer_.Cancel();
      if (reconnect_timer_.armed()) {
        session_->Log(Severity::kInfo, kSource,
                      "Connection recovered; cancelling the reconnect.");
      }
      reconnect_timer_.Cancel();
      backoff_.Reset();
      missed_checks_ = 0;
      if (!health_timer_.armed()) {
        health_timer_.Arm(config.health_check_interval,
                          session_->Bind([this]() { CheckHealth(); }));
      }
      break;
    case net::ConnectionState::kDisconnected:
      health_timer_.Cancel();
      missed_checks_ = 0;
      ScheduleRestart("connection disconnected");
      ScheduleReconnect("connection disconnected",
                        config.disconnected_reconnect_delay);
      break;
    case net::ConnectionState::kFailed:
      health_timer_.Cancel();
      RecordConnectivityError("connection failed");
      ScheduleReconnect("connection failed", config.failed_reconnect_delay);
      break;
    default:
      break;
  }
  ConnectionIndicator indicator;
  indicator.state = state;
  indicator.quality = quality_;
  session_->PublishIndicator(indicator);
}

void HealthMonitor::OnCandidateError(const net::CandidateError& error) {
  session_->Log(Severity::kWarning, kSource,
                absl::StrFormat("Candidate error %d from %s: %s",
                                error.error_code, error.url, error.error_text));
  RecordConnectivityError("candidate error");
}

void HealthMonitor::OnRejoinFailed(const absl::Status& status) {
  session_->Log(Severity::kWarning, kSource,
                absl::StrCat("Rejoin failed: ", status.ToString()));
  ScheduleReconnect("rejoin failed", session_->config_.failed_reconnect_delay);
}

void HealthMonitor::Suspend() {
  restart_timer_.Cancel();
  reconnect_timer_.Cancel();
  health_timer_.Cancel();
  missed_checks_ = 0;
}

void HealthMonitor::Stop() {
  Suspend();
  backoff_.Reset();
  error_times_.clear();
  relay_only_ = false;
  fallback_relay_ = false;
  terminal_ = false;
  last_connected_at_ = absl::InfinitePast();
  last_restart_at_ = absl::InfinitePast();
  restarts_ = 0;
  quality_ = ConnectionQuality::kUnknown;
}

net::TransportOptions HealthMonitor::transport_options() const {
  net::TransportOptions options;
  options.policy = relay_only_ ? net::TransportPolicy::kRelayOnly
                               : net::TransportPolicy::kAll;
  options.use_fallback_relay = fallback_relay_;
  return options;
}

void HealthMonitor::RecordConnectivityError(std::string_view cause) {
  const CallConfig& config = session_->config_;
  const absl::Time now = session_->loop_->Now();
  error_times_.push_back(now);
  while (!error_times_.empty() &&
         error_times_.front() < now - config.error_window) {
    error_times_.pop_front();
  }
  const int errors = static_cast<int>(error_times_.size());

  if (!relay_only_ && errors >= config.relay_only_threshold) {
    relay_only_ = true;
    session_->Log(Severity::kWarning, kSource,
                  absl::StrFormat("%d connectivity errors (last: %s); new "
                                  "transports will use relays only.",
                                  errors, cause));
  }
  if (!fallback_relay_ && errors >= config.fallback_relay_threshold) {
    fallback_relay_ = true;
    session_->Log(Severity::kWarning, kSource,
                  absl::StrFormat("%d connectivity errors; adding the "
                                  "fallback relay server.",
                                  errors));
  }
}

void HealthMonitor::ScheduleRestart(std::string_view cause,
                                    bool link_stalled) {
  const CallConfig& config = session_->config_;
  const absl::Time now = session_->loop_->Now();
  if (now - last_connected_at_ < config.restart_cooldown_after_connect) {
    session_->Log(Severity::kInfo, kSource,
                  absl::StrCat("Not restarting connectivity right after "
                               "connecting (",
                               cause, ")."));
    return;
  }
  if (restart_timer_.armed()) {
    return;
  }
  const absl::Duration delay =
      std::max(absl::ZeroDuration(),
               last_restart_at_ + config.min_restart_spacing - now);
  restart_timer_.Arm(delay, session_->Bind([this, link_stalled]() {
    Restart(link_stalled);
  }));
}

void HealthMonitor::Restart(bool link_stalled) {
  net::MediaTransport* transport = session_->transport_.get();
  if (transport == nullptr ||
      (!link_stalled &&
       transport->connection_state() == net::ConnectionState::kConnected)) {
    return;
  }
  last_restart_at_ = session_->loop_->Now();
  ++restarts_;

  const absl::Status status = transport->RestartIce();
  if (status.ok()) {
    session_->Log(Severity::kInfo, kSource,
                  "Restarted connectivity checks in place.");
    TriggerOptions options;
    options.require_offerer = true;
    options.ice_restart = true;
    session_->scheduler_.Request("ice-restart", options);
    return;
  }
  session_->Log(Severity::kInfo, kSource,
                absl::StrCat("In-place restart unavailable (",
                             status.ToString(), "); reconnecting instead."));
  ScheduleReconnect("restart unavailable",
                    session_->config_.disconnected_reconnect_delay,
                    link_stalled);
}

void HealthMonitor::ScheduleReconnect(std::string_view cause,
                                      absl::Duration min_delay,
                                      bool link_stalled) {
  if (terminal_ || reconnect_timer_.armed()) {
    return;
  }
  const CallConfig& config = session_->config_;
  if (backoff_.attempt() >= config.max_reconnect_attempts) {
    terminal_ = true;
    session_->RaiseTerminalError(absl::UnavailableError(
        absl::StrFormat("Connection lost after %d reconnect attempts (%s).",
                        backoff_.attempt(), cause)));
    return;
  }
  const absl::Duration delay = std::max(min_delay, backoff_.NextDelay());
  session_->Log(Severity::kInfo, kSource,
                absl::StrCat("Reconnecting in ", absl::FormatDuration(delay),
                             " (", cause, ")."));
  reconnect_timer_.Arm(
      delay, session_->Bind([this, cause = std::string(cause),
                             link_stalled]() mutable {
        Reconnect(std::move(cause), link_stalled);
      }));
}

void HealthMonitor::Reconnect(std::string cause, bool link_stalled) {
  net::MediaTransport* transport = session_->transport_.get();
  if (!link_stalled && transport != nullptr &&
      transport->connection_state() == net::ConnectionState::kConnected) {
    return;
  }
  backoff_.RecordAttempt();
  const bool hard_reset =
      backoff_.attempt() >= session_->config_.hard_reset_after_attempts;
  session_->FullReconnect(hard_reset, cause);
}

void HealthMonitor::CheckHealth() {
  net::MediaTransport* transport = session_->transport_.get();
  if (transport == nullptr ||
      transport->connection_state() != net::ConnectionState::kConnected) {
    return;
  }
  transport->GetStats(session_->BindToEpoch(
      [this](absl::StatusOr<net::TransportStats> stats) {
        OnStats(std::move(stats));
      }));
  health_timer_.Arm(session_->config_.health_check_interval,
                    session_->Bind([this]() { CheckHealth(); }));
}

void HealthMonitor::OnStats(absl::StatusOr<net::TransportStats> stats) {
  if (!stats.ok()) {
    ++missed_checks_;
    session_->Log(Severity::kWarning, kSource,
                  absl::StrCat("Could not read transport statistics: ",
                               stats.status().ToString()));
  } else if (!stats->has_succeeded_pair) {
    ++missed_checks_;
  } else {
    missed_checks_ = 0;
    quality_ = ClassifyQuality(*stats);
    ConnectionIndicator indicator;
    indicator.state = session_->connection_state();
    indicator.quality = quality_;
    indicator.stats = *std::move(stats);
    session_->PublishIndicator(indicator);
  }

  if (missed_checks_ >= session_->config_.health_check_miss_threshold) {
    missed_checks_ = 0;
    session_->Log(Severity::kWarning, kSource,
                  "No working candidate pair; restarting connectivity.");
    ScheduleRestart("health check", /*link_stalled=*/true);
  }
}

}  // namespace duet::call
