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

#ifndef DUET_CALL_CALL_SESSION_H_
#define DUET_CALL_CALL_SESSION_H_

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <absl/base/nullability.h>
#include <absl/status/status.h>

#include "duet/call/candidate_trickle.h"
#include "duet/call/config.h"
#include "duet/call/diagnostics.h"
#include "duet/call/garbage_collector.h"
#include "duet/call/health_monitor.h"
#include "duet/call/media_source.h"
#include "duet/call/negotiation_state.h"
#include "duet/call/renegotiation_scheduler.h"
#include "duet/call/role_arbitrator.h"
#include "duet/concurrency/completion_group.h"
#include "duet/concurrency/event_loop.h"
#include "duet/net/media_transport.h"
#include "duet/presence/presence_registry.h"
#include "duet/signalling/candidate_ledger.h"
#include "duet/signalling/room_paths.h"
#include "duet/store/document_store.h"

/**
 * @file
 * @brief
 *   The handle owning everything one endpoint needs to take part in a call.
 */

namespace duet::call {

struct JoinOptions {
  bool microphone = true;
  bool camera = false;
};

/// Sinks for the state the UI presents.
struct CallObservers {
  std::function<void(std::string_view status)> on_status;
  std::function<void(const std::vector<presence::PresenceRecord>&)> on_roster;
  std::function<void(const ConnectionIndicator&)> on_indicator;
  std::function<void(const net::RemoteTrack&)> on_remote_track;
  std::function<void(const absl::Status&)> on_error;
};

enum class CallPhase { kIdle, kJoining, kJoined, kReconnecting, kLeaving };

std::string_view CallPhaseName(CallPhase phase);

/**
 * One endpoint's participation in a two-party call.
 *
 * Every event the session reacts to, whether a document change, a
 * transport event or the completion of an asynchronous operation, is
 * funnelled through one serial inbox and handled to completion before the
 * next. Completions tied to a transport are dropped once that transport
 * has been replaced.
 *
 * All methods must be called on the event loop thread.
 *
 * @headerfile duet/call/call_session.h
 */
class CallSession {
 public:
  CallSession(EventLoop* absl_nonnull loop,
              store::DocumentStore* absl_nonnull store,
              net::TransportFactory* absl_nonnull transports,
              MediaSource* absl_nullable media, std::string_view room,
              std::string uid, std::string display_name,
              CallConfig config = {});

  // This class is not copyable or movable.
  CallSession(const CallSession&) = delete;
  CallSession& operator=(const CallSession&) = delete;

  ~CallSession();

  void SetObservers(CallObservers observers);

  /**
   * Joins the room: acquires the requested devices, publishes presence and
   * takes the offerer or answerer role. A device that cannot be acquired is
   * reported through `on_error` and left disabled; the join proceeds.
   */
  void Join(JoinOptions options, StatusCallback done);

  /// Leaves the room and cleans up after itself, deleting every room
  /// artifact if nobody else is left.
  void Leave(StatusCallback done);

  absl::Status SetMicrophoneEnabled(bool enabled);
  absl::Status SetCameraEnabled(bool enabled);
  absl::Status SetScreenSharing(bool enabled);
  void SetSpeaking(bool speaking);
  void Kick(std::string_view uid, StatusCallback done);

  [[nodiscard]] CallPhase phase() const { return phase_; }
  [[nodiscard]] Role role() const { return state_.role; }
  [[nodiscard]] const NegotiationState& negotiation() const { return state_; }
  [[nodiscard]] const std::string& status() const { return status_; }
  [[nodiscard]] const std::string& uid() const { return uid_; }
  [[nodiscard]] const net::LocalMedia& media() const { return media_; }
  [[nodiscard]] const DiagnosticLog& diagnostics() const {
    return diagnostics_;
  }
  [[nodiscard]] const HealthMonitor& health() const { return health_; }
  [[nodiscard]] const CandidateTrickle& trickle() const { return trickle_; }
  [[nodiscard]] const RenegotiationScheduler& scheduler() const {
    return scheduler_;
  }
  [[nodiscard]] std::vector<presence::PresenceRecord> roster() const {
    return presence_.ActiveParticipants();
  }
  [[nodiscard]] net::ConnectionState connection_state() const;
  [[nodiscard]] net::MediaTransport* absl_nullable transport() const {
    return transport_.get();
  }

  /// Requests a renegotiation, e.g. after a track was added.
  void RequestRenegotiation(std::string_view reason,
                            TriggerOptions options = {});

 private:
  friend class CandidateTrickle;
  friend class GarbageCollector;
  friend class HealthMonitor;
  friend class RenegotiationScheduler;
  friend class RoleArbitrator;

  // Wraps a one-shot callback so that it runs through the inbox, and not
  // at all once the session is gone.
  template <typename Fn>
  auto Bind(Fn fn);

  // As Bind(), but also dropped once the current transport is replaced.
  template <typename Fn>
  auto BindToEpoch(Fn fn);

  // As Bind(), for listeners invoked any number of times.
  template <typename Fn>
  auto BindRepeating(Fn fn);

  void StartJoin(StatusCallback done);
  void ContinueJoin(StatusCallback done);
  void OnRosterLoaded();

  absl::Status CreateTransport();
  absl::Status ReplaceTransport(std::string_view reason);
  void CloseTransport();
  void InstallPresenceCallbacks();
  void WatchSessionDocument();
  void OnSessionDocumentChanged(const std::optional<store::Document>& data);

  void FullReconnect(bool hard_reset, std::string_view cause);
  void Rejoin();
  void TearDownConnection();
  void RaiseTerminalError(const absl::Status& status);

  absl::Status SetDevice(net::MediaKind kind, bool enabled,
                         std::string_view on_reason,
                         std::string_view off_reason);

  void ReleaseMedia();

  bool HasActiveRemoteOfferer() const;

  void SetStatus(std::string_view status);
  void PublishIndicator(const ConnectionIndicator& indicator);
  void ReportError(const absl::Status& status);
  void Log(Severity severity, std::string_view source,
           std::string_view message);

  EventLoop* absl_nonnull const loop_;
  store::DocumentStore* absl_nonnull const store_;
  net::TransportFactory* absl_nonnull const transports_;
  MediaSource* absl_nullable const media_source_;
  const signalling::RoomPaths paths_;
  const std::string uid_;
  const std::string display_name_;
  const CallConfig config_;

  CallObservers observers_;
  DiagnosticLog diagnostics_;
  std::string status_;
  CallPhase phase_ = CallPhase::kIdle;

  net::LocalMedia media_;
  bool side_channel_enabled_;
  NegotiationState state_;

  std::unique_ptr<net::MediaTransport> transport_;
  uint64_t connection_epoch_ = 0;

  presence::PresenceRegistry presence_;
  signalling::CandidateLedger ledger_;
  std::unique_ptr<store::Subscription> session_subscription_;
  bool awaiting_roster_ = false;
  StatusCallback join_done_;

  RoleArbitrator arbitrator_;
  RenegotiationScheduler scheduler_;
  CandidateTrickle trickle_;
  HealthMonitor health_;
  GarbageCollector gc_;

  SerialQueue inbox_;
  std::shared_ptr<int> lifetime_ = std::make_shared<int>(0);
};

template <typename Fn>
auto CallSession::Bind(Fn fn) {
  return [this, lifetime = std::weak_ptr<int>(lifetime_),
          fn = std::move(fn)]<typename... Args>(Args&&... args) mutable {
    if (lifetime.expired()) {
      return;
    }
    inbox_.Enqueue([lifetime, fn = std::move(fn),
                    ... args = std::forward<Args>(args)]() mutable {
      if (!lifetime.expired()) {
        fn(std::move(args)...);
      }
    });
  };
}

template <typename Fn>
auto CallSession::BindToEpoch(Fn fn) {
  return Bind([this, epoch = connection_epoch_,
               fn = std::move(fn)]<typename... Args>(Args&&... args) mutable {
    if (epoch != connection_epoch_) {
      return;
    }
    fn(std::forward<Args>(args)...);
  });
}

template <typename Fn>
auto CallSession::BindRepeating(Fn fn) {
  auto shared = std::make_shared<Fn>(std::move(fn));
  return [this, lifetime = std::weak_ptr<int>(lifetime_),
          shared]<typename... Args>(Args&&... args) {
    if (lifetime.expired()) {
      return;
    }
    inbox_.Enqueue(
        [lifetime, shared,
         ... args = std::decay_t<Args>(std::forward<Args>(args))]() mutable {
          if (!lifetime.expired()) {
            (*shared)(args...);
          }
        });
  };
}

}  // namespace duet::call

#endif  // DUET_CALL_CALL_SESSION_H_
