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

#include "duet/call/call_session.h"

#include <utility>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>

#include "duet/signalling/session_document.h"

namespace duet::call {

namespace {
constexpr std::string_view kSource = "session";
constexpr std::string_view kTransportSource = "transport";
}  // namespace

std::string_view CallPhaseName(CallPhase phase) {
  switch (phase) {
    case CallPhase::kIdle:
      return "idle";
    case CallPhase::kJoining:
      return "joining";
    case CallPhase::kJoined:
      return "joined";
    case CallPhase::kReconnecting:
      return "reconnecting";
    case CallPhase::kLeaving:
      return "leaving";
  }
  return "unknown";
}

CallSession::CallSession(EventLoop* loop, store::DocumentStore* store,
                         net::TransportFactory* transports, MediaSource* media,
                         std::string_view room, std::string uid,
                         std::string display_name, CallConfig config)
    : loop_(loop),
      store_(store),
      transports_(transports),
      media_source_(media),
      paths_(room),
      uid_(std::move(uid)),
      display_name_(std::move(display_name)),
      config_(std::move(config)),
      diagnostics_(config_.diagnostic_capacity),
      side_channel_enabled_(config_.side_channel_enabled),
      presence_(loop, store, paths_, uid_, display_name_, config_.presence),
      ledger_(store, paths_, uid_),
      arbitrator_(this),
      scheduler_(this),
      trickle_(this),
      health_(this),
      gc_(this),
      inbox_(loop) {
  InstallPresenceCallbacks();
}

CallSession::~CallSession() {
  lifetime_.reset();
  inbox_.Close();
  session_subscription_.reset();
  if (transport_ != nullptr) {
    transport_->Close();
    transport_.reset();
  }
}

void CallSession::SetObservers(CallObservers observers) {
  observers_ = std::move(observers);
}

void CallSession::Join(JoinOptions options, StatusCallback done) {
  if (phase_ != CallPhase::kIdle) {
    std::move(done)(absl::FailedPreconditionError(
        absl::StrCat("Cannot join while ", CallPhaseName(phase_), ".")));
    return;
  }
  phase_ = CallPhase::kJoining;
  health_.Stop();
  state_.ResetForRejoin();
  side_channel_enabled_ = config_.side_channel_enabled;

  const auto acquire = [this](net::MediaKind kind) {
    if (media_source_ == nullptr) {
      return true;
    }
    if (absl::Status status = media_source_->Acquire(kind); !status.ok()) {
      Log(Severity::kWarning, "media",
          absl::StrCat("Could not acquire ", net::MediaKindName(kind), ": ",
                       status.ToString()));
      ReportError(status);
      return false;
    }
    return true;
  };
  media_ = {};
  media_.audio = options.microphone && acquire(net::MediaKind::kAudio);
  media_.video = options.camera && acquire(net::MediaKind::kVideo);

  StartJoin([this, done = std::move(done)](absl::Status status) mutable {
    if (!status.ok() && phase_ == CallPhase::kJoining) {
      phase_ = CallPhase::kIdle;
      TearDownConnection();
      ReleaseMedia();
      SetStatus("Could not join");
      ReportError(status);
    }
    std::move(done)(std::move(status));
  });
}

void CallSession::StartJoin(StatusCallback done) {
  if (phase_ == CallPhase::kJoining) {
    SetStatus("Joining");
  }
  gc_.GuardOversized(
      Bind([this, done = std::move(done)](absl::Status status) mutable {
        if (!status.ok()) {
          Log(Severity::kWarning, "gc",
              absl::StrCat("Could not check stored descriptions: ",
                           status.ToString()));
        }
        ContinueJoin(std::move(done));
      }));
}

void CallSession::ContinueJoin(StatusCallback done) {
  if (phase_ != CallPhase::kJoining && phase_ != CallPhase::kReconnecting) {
    std::move(done)(absl::CancelledError("The join was cancelled."));
    return;
  }
  if (absl::Status status = CreateTransport(); !status.ok()) {
    std::move(done)(std::move(status));
    return;
  }
  presence_.Join(
      presence::MediaState{media_.audio, media_.video, media_.screen},
      transport_->local_stream_id(),
      Bind([this, done = std::move(done)](absl::Status status) mutable {
        if (phase_ != CallPhase::kJoining &&
            phase_ != CallPhase::kReconnecting) {
          std::move(done)(absl::CancelledError("The join was cancelled."));
          return;
        }
        if (!status.ok()) {
          CloseTransport();
          std::move(done)(std::move(status));
          return;
        }
        join_done_ = std::move(done);
        awaiting_roster_ = true;
        WatchSessionDocument();
        if (presence_.roster_loaded()) {
          OnRosterLoaded();
        }
      }));
}

void CallSession::OnRosterLoaded() {
  awaiting_roster_ = false;
  phase_ = CallPhase::kJoined;
  Log(Severity::kInfo, kSource,
      absl::StrFormat("Joined room %s with %d participants.", paths_.room(),
                      presence_.active_count()));
  arbitrator_.Start();
  if (join_done_) {
    StatusCallback done = std::move(join_done_);
    join_done_ = nullptr;
    std::move(done)(absl::OkStatus());
  }
}

void CallSession::Leave(StatusCallback done) {
  if (phase_ == CallPhase::kIdle || phase_ == CallPhase::kLeaving) {
    std::move(done)(absl::FailedPreconditionError("Not in a call."));
    return;
  }
  phase_ = CallPhase::kLeaving;
  SetStatus("Leaving");
  scheduler_.Cancel();
  health_.Stop();
  TearDownConnection();
  ReleaseMedia();
  awaiting_roster_ = false;
  if (join_done_) {
    StatusCallback pending = std::move(join_done_);
    join_done_ = nullptr;
    std::move(pending)(absl::CancelledError("Left before the join completed."));
  }

  gc_.OnLeave(Bind([this, done = std::move(done)](absl::Status status) mutable {
    phase_ = CallPhase::kIdle;
    state_.ResetForRejoin();
    if (!status.ok()) {
      Log(Severity::kWarning, "gc",
          absl::StrCat("Room cleanup incomplete: ", status.ToString()));
    }
    SetStatus("Left");
    std::move(done)(std::move(status));
  }));
}

absl::Status CallSession::SetMicrophoneEnabled(bool enabled) {
  return SetDevice(net::MediaKind::kAudio, enabled, "mic-on", "mic-off");
}

absl::Status CallSession::SetCameraEnabled(bool enabled) {
  return SetDevice(net::MediaKind::kVideo, enabled, "camera-on", "camera-off");
}

absl::Status CallSession::SetScreenSharing(bool enabled) {
  return SetDevice(net::MediaKind::kScreen, enabled, "share-start",
                   "share-stop");
}

void CallSession::SetSpeaking(bool speaking) { presence_.SetSpeaking(speaking); }

void CallSession::Kick(std::string_view uid, StatusCallback done) {
  presence_.Kick(uid, std::move(done));
}

void CallSession::RequestRenegotiation(std::string_view reason,
                                       TriggerOptions options) {
  scheduler_.Request(reason, options);
}

net::ConnectionState CallSession::connection_state() const {
  return transport_ != nullptr ? transport_->connection_state()
                               : net::ConnectionState::kClosed;
}

absl::Status CallSession::CreateTransport() {
  const net::TransportOptions options = health_.transport_options();
  absl::StatusOr<std::unique_ptr<net::MediaTransport>> transport =
      transports_->Create(options);
  if (!transport.ok()) {
    Log(Severity::kError, kTransportSource,
        absl::StrCat("Could not create a transport: ",
                     transport.status().ToString()));
    return transport.status();
  }
  transport_ = *std::move(transport);
  const uint64_t epoch = ++connection_epoch_;

  net::TransportEvents events;
  events.on_signaling_state =
      BindRepeating([this, epoch](net::SignalingState state) {
        if (epoch != connection_epoch_) {
          return;
        }
        Log(Severity::kInfo, kTransportSource,
            absl::StrCat("Signalling state ",
                         net::SignalingStateName(state)));
        if (state == net::SignalingState::kStable) {
          scheduler_.OnSignalingStable();
        }
      });
  events.on_connection_state =
      BindRepeating([this, epoch](net::ConnectionState state) {
        if (epoch != connection_epoch_) {
          return;
        }
        Log(Severity::kInfo, kTransportSource,
            absl::StrCat("Connection state ",
                         net::ConnectionStateName(state)));
        switch (state) {
          case net::ConnectionState::kConnecting:
            SetStatus("Connecting");
            break;
          case net::ConnectionState::kConnected:
            SetStatus("Connected");
            break;
          case net::ConnectionState::kDisconnected:
            SetStatus("Connection interrupted");
            break;
          case net::ConnectionState::kFailed:
            SetStatus("Connection failed");
            break;
          default:
            break;
        }
        health_.OnConnectionState(state);
      });
  events.on_ice_state = BindRepeating([this, epoch](net::IceState state) {
    if (epoch == connection_epoch_) {
      Log(Severity::kInfo, kTransportSource,
          absl::StrCat("ICE state ", net::IceStateName(state)));
    }
  });
  events.on_local_candidate =
      BindRepeating([this, epoch](const net::IceCandidate& candidate) {
        if (epoch == connection_epoch_) {
          trickle_.OnLocalCandidate(candidate);
        }
      });
  events.on_track = BindRepeating([this, epoch](const net::RemoteTrack& track) {
    if (epoch == connection_epoch_ && observers_.on_remote_track) {
      observers_.on_remote_track(track);
    }
  });
  events.on_candidate_error =
      BindRepeating([this, epoch](const net::CandidateError& error) {
        if (epoch == connection_epoch_) {
          health_.OnCandidateError(error);
        }
      });
  transport_->SetEvents(std::move(events));
  transport_->SetLocalMedia(media_);

  Log(Severity::kInfo, kTransportSource,
      absl::StrCat("Created a transport",
                   options.policy == net::TransportPolicy::kRelayOnly
                       ? " restricted to relays"
                       : "",
                   options.use_fallback_relay ? " with the fallback relay" : "",
                   "."));
  return absl::OkStatus();
}

absl::Status CallSession::ReplaceTransport(std::string_view reason) {
  Log(Severity::kInfo, kTransportSource,
      absl::StrCat("Replacing the transport: ", reason));
  trickle_.Reset();
  CloseTransport();
  return CreateTransport();
}

void CallSession::CloseTransport() {
  if (transport_ != nullptr) {
    transport_->Close();
    transport_.reset();
  }
  ++connection_epoch_;
}

void CallSession::InstallPresenceCallbacks() {
  presence::PresenceCallbacks callbacks;
  callbacks.on_joined =
      BindRepeating([this](const presence::PresenceRecord& record) {
        if (record.uid != uid_) {
          Log(Severity::kInfo, "presence",
              absl::StrCat(record.display_name, " joined."));
        }
        scheduler_.OnPresenceRecord(record);
      });
  callbacks.on_updated =
      BindRepeating([this](const presence::PresenceRecord& record) {
        scheduler_.OnPresenceRecord(record);
      });
  callbacks.on_left = BindRepeating([this](const std::string& uid) {
    Log(Severity::kInfo, "presence", absl::StrCat(uid, " left."));
    arbitrator_.OnParticipantLeft(uid);
  });
  callbacks.on_roster = BindRepeating(
      [this](const std::vector<presence::PresenceRecord>& roster) {
        if (observers_.on_roster) {
          observers_.on_roster(roster);
        }
        if (awaiting_roster_) {
          OnRosterLoaded();
        }
      });
  callbacks.on_removed = BindRepeating([this]() {
    Log(Severity::kWarning, "presence",
        "Removed from the call by another participant.");
    Leave(Bind([this](absl::Status status) {
      SetStatus("Removed from the call");
      if (!status.ok()) {
        ReportError(status);
      }
    }));
  });
  callbacks.on_error = BindRepeating(
      [this](const absl::Status& status, const std::string& operation) {
        Log(Severity::kWarning, "presence",
            absl::StrCat(operation, " failed: ", status.ToString()));
      });
  presence_.SetCallbacks(std::move(callbacks));
}

void CallSession::WatchSessionDocument() {
  session_subscription_ = store_->Watch(
      paths_.session(),
      BindRepeating([this](const std::optional<store::Document>& data) {
        OnSessionDocumentChanged(data);
      }));
}

void CallSession::OnSessionDocumentChanged(
    const std::optional<store::Document>& data) {
  if (phase_ != CallPhase::kJoined || session_subscription_ == nullptr) {
    return;
  }
  if (!data.has_value()) {
    arbitrator_.OnSessionDocument(std::nullopt);
    return;
  }
  absl::StatusOr<signalling::SessionDocument> document =
      signalling::SessionDocument::FromJson(*data);
  if (!document.ok()) {
    Log(Severity::kWarning, kSource,
        absl::StrCat("Ignoring a malformed session document: ",
                     document.status().ToString()));
    return;
  }
  arbitrator_.OnSessionDocument(*std::move(document));
}

void CallSession::FullReconnect(bool hard_reset, std::string_view cause) {
  if (phase_ != CallPhase::kJoined && phase_ != CallPhase::kReconnecting) {
    return;
  }
  phase_ = CallPhase::kReconnecting;
  SetStatus(absl::StrFormat("Reconnecting (attempt %d of %d)",
                            health_.reconnect_attempts(),
                            config_.max_reconnect_attempts));
  Log(Severity::kWarning, kSource,
      absl::StrCat("Reconnecting after ", cause,
                   hard_reset ? "; resetting the session" : "", "."));

  scheduler_.Cancel();
  health_.Suspend();
  TearDownConnection();
  awaiting_roster_ = false;
  join_done_ = nullptr;

  presence_.Leave(Bind([this, hard_reset](absl::Status status) {
    if (phase_ != CallPhase::kReconnecting) {
      return;
    }
    if (!status.ok()) {
      Log(Severity::kWarning, "presence",
          absl::StrCat("Could not withdraw presence before rejoining: ",
                       status.ToString()));
    }
    if (!hard_reset) {
      Rejoin();
      return;
    }
    gc_.PurgeRoom(Bind([this](absl::Status status) {
      if (phase_ != CallPhase::kReconnecting) {
        return;
      }
      if (!status.ok()) {
        Log(Severity::kWarning, "gc",
            absl::StrCat("Session reset incomplete: ", status.ToString()));
      }
      Rejoin();
    }));
  }));
}

void CallSession::Rejoin() {
  StartJoin([this](absl::Status status) {
    if (status.ok() || phase_ != CallPhase::kReconnecting) {
      return;
    }
    health_.OnRejoinFailed(status);
  });
}

void CallSession::TearDownConnection() {
  session_subscription_.reset();
  trickle_.Reset();
  CloseTransport();
  state_.ResetForRejoin();
}

void CallSession::RaiseTerminalError(const absl::Status& status) {
  scheduler_.Cancel();
  CloseTransport();
  SetStatus("Connection lost");
  ReportError(status);
}

absl::Status CallSession::SetDevice(net::MediaKind kind, bool enabled,
                                    std::string_view on_reason,
                                    std::string_view off_reason) {
  if (phase_ == CallPhase::kIdle || phase_ == CallPhase::kLeaving) {
    return absl::FailedPreconditionError("Not in a call.");
  }
  bool* flag = nullptr;
  switch (kind) {
    case net::MediaKind::kAudio:
      flag = &media_.audio;
      break;
    case net::MediaKind::kVideo:
      flag = &media_.video;
      break;
    case net::MediaKind::kScreen:
      flag = &media_.screen;
      break;
  }
  if (*flag == enabled) {
    return absl::OkStatus();
  }
  if (media_source_ != nullptr) {
    if (enabled) {
      if (absl::Status status = media_source_->Acquire(kind); !status.ok()) {
        Log(Severity::kWarning, "media",
            absl::StrCat("Could not acquire ", net::MediaKindName(kind), ": ",
                         status.ToString()));
        ReportError(status);
        return status;
      }
    } else {
      media_source_->Release(kind);
    }
  }
  *flag = enabled;
  if (transport_ != nullptr) {
    transport_->SetLocalMedia(media_);
  }
  presence_.UpdateMedia(
      presence::MediaState{media_.audio, media_.video, media_.screen});
  TriggerOptions options;
  options.require_offerer = true;
  scheduler_.Request(enabled ? on_reason : off_reason, options);
  return absl::OkStatus();
}

void CallSession::ReleaseMedia() {
  if (media_source_ != nullptr) {
    if (media_.audio) {
      media_source_->Release(net::MediaKind::kAudio);
    }
    if (media_.video) {
      media_source_->Release(net::MediaKind::kVideo);
    }
    if (media_.screen) {
      media_source_->Release(net::MediaKind::kScreen);
    }
  }
  media_ = {};
}

bool CallSession::HasActiveRemoteOfferer() const {
  return state_.role == Role::kAnswerer && !state_.remote_uid.empty() &&
         presence_.Find(state_.remote_uid) != nullptr;
}

void CallSession::SetStatus(std::string_view status) {
  if (status_ == status) {
    return;
  }
  status_ = std::string(status);
  if (observers_.on_status) {
    observers_.on_status(status_);
  }
}

void CallSession::PublishIndicator(const ConnectionIndicator& indicator) {
  if (observers_.on_indicator) {
    observers_.on_indicator(indicator);
  }
}

void CallSession::ReportError(const absl::Status& status) {
  Log(Severity::kError, kSource, status.ToString());
  if (observers_.on_error) {
    observers_.on_error(status);
  }
}

void CallSession::Log(Severity severity, std::string_view source,
                      std::string_view message) {
  diagnostics_.Record(loop_->Now(), severity, source, message);
}

}  // namespace duet::call
