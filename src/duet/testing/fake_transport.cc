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

#include "duet/testing/fake_transport.h"

#include <algorithm>
#include <utility>

#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>

namespace duet::testing {

namespace {
constexpr int kCandidatesPerDescription = 2;
}  // namespace

FakeTransport::FakeTransport(EventLoop* loop, std::string name, int id,
                             net::TransportOptions options)
    : loop_(loop), name_(std::move(name)), id_(id), options_(options) {}

FakeTransport::~FakeTransport() {
  if (on_destroy) {
    on_destroy(this);
  }
}

void FakeTransport::SetEvents(net::TransportEvents events) {
  events_ = std::move(events);
}

void FakeTransport::Defer(absl::AnyInvocable<void()> task) {
  loop_->Post(BindToLifetime(lifetime_, std::move(task)));
}

absl::Status FakeTransport::TakeFailure(Operation operation) {
  if (closed_) {
    return absl::FailedPreconditionError("The transport is closed.");
  }
  const auto it = failures_.find(operation);
  if (it == failures_.end()) {
    return absl::OkStatus();
  }
  absl::Status status = it->second.first;
  if (--it->second.second <= 0) {
    failures_.erase(it);
  }
  return status;
}

void FakeTransport::FailNext(Operation operation, absl::Status status,
                             int times) {
  failures_[operation] = {std::move(status), times};
}

void FakeTransport::RejectCandidate(std::string prefix, absl::Status status,
                                    int times) {
  rejections_.push_back({std::move(prefix), std::move(status), times});
}

std::string FakeTransport::MakeSdp(std::string_view kind) const {
  std::string sdp = absl::StrFormat("v=0\r\no=%s %d %d IN IP4 127.0.0.1\r\n"
                                    "s=%s\r\n",
                                    name_, id_, generation_, kind);
  if (media_.audio) {
    absl::StrAppend(&sdp, "m=audio 9 UDP/TLS/RTP/SAVPF 111\r\n");
  }
  if (media_.video || media_.screen) {
    absl::StrAppend(&sdp, "m=video 9 UDP/TLS/RTP/SAVPF 96\r\n");
  }
  absl::StrAppend(&sdp, "m=application 9 UDP/DTLS/SCTP webrtc-datachannel\r\n");
  if (sdp_padding_ > 0) {
    absl::StrAppend(&sdp, "a=x-padding:", std::string(sdp_padding_, 'x'),
                    "\r\n");
  }
  return sdp;
}

void FakeTransport::CreateOffer(bool ice_restart,
                                net::DescriptionCallback done) {
  absl::Status status = TakeFailure(Operation::kCreateOffer);
  if (status.ok() &&
      signaling_state_ == net::SignalingState::kHaveRemoteOffer) {
    status = absl::FailedPreconditionError(
        "Cannot create an offer with a pending remote offer.");
  }
  if (!status.ok()) {
    Defer([done = std::move(done), status]() mutable {
      std::move(done)(status);
    });
    return;
  }
  ++generation_;
  std::string sdp = MakeSdp(ice_restart ? "offer ice-restart" : "offer");
  Defer([done = std::move(done), sdp = std::move(sdp)]() mutable {
    std::move(done)(net::Description{net::SdpType::kOffer, std::move(sdp)});
  });
}

void FakeTransport::CreateAnswer(net::DescriptionCallback done) {
  absl::Status status = TakeFailure(Operation::kCreateAnswer);
  if (status.ok() &&
      signaling_state_ != net::SignalingState::kHaveRemoteOffer) {
    status = absl::FailedPreconditionError(
        "Cannot create an answer without a remote offer.");
  }
  if (!status.ok()) {
    Defer([done = std::move(done), status]() mutable {
      std::move(done)(status);
    });
    return;
  }
  ++generation_;
  Defer([done = std::move(done), sdp = MakeSdp("answer")]() mutable {
    std::move(done)(net::Description{net::SdpType::kAnswer, std::move(sdp)});
  });
}

void FakeTransport::SetLocalDescription(net::Description description,
                                        StatusCallback done) {
  absl::Status status = TakeFailure(Operation::kSetLocalDescription);
  if (status.ok()) {
    if (description.type == net::SdpType::kOffer) {
      if (signaling_state_ == net::SignalingState::kHaveRemoteOffer) {
        status = absl::FailedPreconditionError(
            "Cannot apply a local offer in have-remote-offer.");
      }
    } else if (signaling_state_ != net::SignalingState::kHaveRemoteOffer) {
      status = absl::FailedPreconditionError(
          "Cannot apply a local answer without a remote offer.");
    }
  }
  if (!status.ok()) {
    Defer([done = std::move(done), status]() mutable {
      std::move(done)(status);
    });
    return;
  }
  const bool offer = description.type == net::SdpType::kOffer;
  local_description_ = std::move(description);
  SetSignalingState(offer ? net::SignalingState::kHaveLocalOffer
                          : net::SignalingState::kStable);
  Defer([done = std::move(done)]() mutable {
    std::move(done)(absl::OkStatus());
  });
  EmitLocalCandidates();
  MaybeConnect();
}

void FakeTransport::SetRemoteDescription(net::Description description,
                                         StatusCallback done) {
  absl::Status status = TakeFailure(Operation::kSetRemoteDescription);
  if (status.ok()) {
    if (description.type == net::SdpType::kOffer) {
      if (signaling_state_ == net::SignalingState::kHaveLocalOffer) {
        status = absl::FailedPreconditionError(
            "Cannot apply a remote offer in have-local-offer.");
      }
    } else if (signaling_state_ != net::SignalingState::kHaveLocalOffer) {
      status = absl::FailedPreconditionError(
          "Cannot apply a remote answer without a local offer.");
    }
  }
  if (!status.ok()) {
    Defer([done = std::move(done), status]() mutable {
      std::move(done)(status);
    });
    return;
  }
  const bool offer = description.type == net::SdpType::kOffer;
  const std::string sdp = description.sdp;
  remote_description_ = std::move(description);
  SetSignalingState(offer ? net::SignalingState::kHaveRemoteOffer
                          : net::SignalingState::kStable);
  Defer([done = std::move(done)]() mutable {
    std::move(done)(absl::OkStatus());
  });
  EmitRemoteTracks(sdp);
  MaybeConnect();
}

void FakeTransport::AddRemoteCandidate(net::IceCandidate candidate,
                                       StatusCallback done) {
  absl::Status status = TakeFailure(Operation::kAddRemoteCandidate);
  if (status.ok() && !remote_description_.has_value()) {
    status = absl::FailedPreconditionError(
        "Cannot add a candidate before the remote description.");
  }
  for (CandidateRejection& rejection : rejections_) {
    if (status.ok() && rejection.remaining > 0 &&
        absl::StartsWith(candidate.candidate, rejection.prefix)) {
      --rejection.remaining;
      status = rejection.status;
    }
  }
  if (status.ok()) {
    added_candidates_.push_back(std::move(candidate));
    MaybeConnect();
  }
  Defer([done = std::move(done), status]() mutable {
    std::move(done)(status);
  });
}

absl::Status FakeTransport::RestartIce() {
  ++restart_calls_;
  return restart_ice_status_;
}

void FakeTransport::GetStats(net::StatsCallback done) {
  absl::StatusOr<net::TransportStats> stats;
  if (stats_.has_value()) {
    stats = *stats_;
  } else {
    net::TransportStats defaults;
    defaults.has_succeeded_pair =
        connection_state_ == net::ConnectionState::kConnected;
    defaults.round_trip_time = absl::Milliseconds(20);
    defaults.packet_loss = 0.0;
    defaults.jitter = absl::Milliseconds(2);
    stats = defaults;
  }
  Defer([done = std::move(done), stats = std::move(stats)]() mutable {
    std::move(done)(std::move(stats));
  });
}

void FakeTransport::SetLocalMedia(const net::LocalMedia& media) {
  media_ = media;
}

void FakeTransport::Close() {
  closed_ = true;
  signaling_state_ = net::SignalingState::kClosed;
  connection_state_ = net::ConnectionState::kClosed;
  events_ = {};
}

std::string FakeTransport::local_stream_id() const {
  return absl::StrCat("stream-", name_);
}

void FakeTransport::Simulate(net::ConnectionState state) {
  connection_state_ = state;
  Defer([this, state]() {
    if (events_.on_connection_state) {
      events_.on_connection_state(state);
    }
  });
}

void FakeTransport::SetSignalingState(net::SignalingState state) {
  signaling_state_ = state;
  Defer([this, state]() {
    if (events_.on_signaling_state) {
      events_.on_signaling_state(state);
    }
  });
}

void FakeTransport::EmitLocalCandidates() {
  for (int i = 0; i < kCandidatesPerDescription; ++i) {
    net::IceCandidate candidate;
    candidate.candidate =
        absl::StrFormat("candidate:%s-%d-%d-%d 1 udp 2122260223 10.0.0.%d "
                        "5000%d typ host",
                        name_, id_, generation_, i, id_ % 250 + 1, i);
    candidate.sdp_mid = "0";
    candidate.sdp_mline_index = 0;
    Defer([this, candidate = std::move(candidate)]() {
      if (events_.on_local_candidate) {
        events_.on_local_candidate(candidate);
      }
    });
  }
}

void FakeTransport::EmitRemoteTracks(const std::string& sdp) {
  std::vector<net::RemoteTrack> tracks;
  if (absl::StrContains(sdp, "m=audio")) {
    tracks.push_back({absl::StrCat("audio-", id_), "remote",
                      net::MediaKind::kAudio});
  }
  if (absl::StrContains(sdp, "m=video")) {
    tracks.push_back({absl::StrCat("video-", id_), "remote",
                      net::MediaKind::kVideo});
  }
  for (net::RemoteTrack& track : tracks) {
    Defer([this, track = std::move(track)]() {
      if (events_.on_track) {
        events_.on_track(track);
      }
    });
  }
}

void FakeTransport::MaybeConnect() {
  if (!auto_connect_ || closed_ ||
      signaling_state_ != net::SignalingState::kStable ||
      !remote_description_.has_value() || added_candidates_.empty()) {
    return;
  }
  if (connection_state_ != net::ConnectionState::kNew &&
      connection_state_ != net::ConnectionState::kConnecting) {
    return;
  }
  if (connection_state_ == net::ConnectionState::kNew) {
    Simulate(net::ConnectionState::kConnecting);
  }
  Simulate(net::ConnectionState::kConnected);
}

FakeTransportFactory::~FakeTransportFactory() {
  for (FakeTransport* transport : live_) {
    transport->on_destroy = nullptr;
  }
}

absl::StatusOr<std::unique_ptr<net::MediaTransport>>
FakeTransportFactory::Create(const net::TransportOptions& options) {
  if (!next_failure_.ok()) {
    absl::Status failure = std::move(next_failure_);
    next_failure_ = absl::OkStatus();
    return failure;
  }
  options_history_.push_back(options);
  auto transport =
      std::make_unique<FakeTransport>(loop_, name_, next_id_++, options);
  transport->set_sdp_padding(sdp_padding_);
  for (ScriptedFailure& failure : scripted_failures_) {
    transport->FailNext(failure.operation, std::move(failure.status),
                        failure.times);
  }
  scripted_failures_.clear();
  live_.push_back(transport.get());
  transport->on_destroy = [this](FakeTransport* destroyed) {
    live_.erase(std::remove(live_.begin(), live_.end(), destroyed),
                live_.end());
  };
  return std::unique_ptr<net::MediaTransport>(std::move(transport));
}

FakeTransport* FakeTransportFactory::latest() const {
  return live_.empty() ? nullptr : live_.back();
}

}  // namespace duet::testing
