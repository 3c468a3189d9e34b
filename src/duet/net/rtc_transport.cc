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

#include "duet/net/rtc_transport.h"

#include <exception>
#include <utility>

#include <absl/log/log.h>
#include <absl/strings/str_format.h>
#include <absl/time/time.h>
#include <rtc/candidate.hpp>
#include <rtc/description.hpp>

#include "duet/util/random.h"

namespace duet::net {

namespace {

SignalingState FromNative(rtc::PeerConnection::SignalingState state) {
  switch (state) {
    case rtc::PeerConnection::SignalingState::Stable:
      return SignalingState::kStable;
    case rtc::PeerConnection::SignalingState::HaveLocalOffer:
    case rtc::PeerConnection::SignalingState::HaveLocalPranswer:
      return SignalingState::kHaveLocalOffer;
    case rtc::PeerConnection::SignalingState::HaveRemoteOffer:
    case rtc::PeerConnection::SignalingState::HaveRemotePranswer:
      return SignalingState::kHaveRemoteOffer;
  }
  return SignalingState::kStable;
}

ConnectionState FromNative(rtc::PeerConnection::State state) {
  switch (state) {
    case rtc::PeerConnection::State::New:
      return ConnectionState::kNew;
    case rtc::PeerConnection::State::Connecting:
      return ConnectionState::kConnecting;
    case rtc::PeerConnection::State::Connected:
      return ConnectionState::kConnected;
    case rtc::PeerConnection::State::Disconnected:
      return ConnectionState::kDisconnected;
    case rtc::PeerConnection::State::Failed:
      return ConnectionState::kFailed;
    case rtc::PeerConnection::State::Closed:
      return ConnectionState::kClosed;
  }
  return ConnectionState::kNew;
}

IceState FromNative(rtc::PeerConnection::IceState state) {
  switch (state) {
    case rtc::PeerConnection::IceState::New:
      return IceState::kNew;
    case rtc::PeerConnection::IceState::Checking:
      return IceState::kChecking;
    case rtc::PeerConnection::IceState::Connected:
      return IceState::kConnected;
    case rtc::PeerConnection::IceState::Completed:
      return IceState::kCompleted;
    case rtc::PeerConnection::IceState::Disconnected:
      return IceState::kDisconnected;
    case rtc::PeerConnection::IceState::Failed:
      return IceState::kFailed;
    case rtc::PeerConnection::IceState::Closed:
      return IceState::kClosed;
  }
  return IceState::kNew;
}

rtc::Description::Type ToNative(SdpType type) {
  return type == SdpType::kOffer ? rtc::Description::Type::Offer
                                 : rtc::Description::Type::Answer;
}

Description FromNative(const rtc::Description& description) {
  Description result;
  result.type = description.type() == rtc::Description::Type::Offer
                    ? SdpType::kOffer
                    : SdpType::kAnswer;
  result.sdp = std::string(description);
  return result;
}

absl::Status NativeError(std::string_view operation,
                         const std::exception& e) {
  return absl::InternalError(
      absl::StrFormat("libdatachannel %s failed: %s", operation, e.what()));
}

uint32_t RandomSsrc() {
  absl::BitGen gen;
  return absl::Uniform<uint32_t>(gen, 1, 0xffffffff);
}

}  // namespace

absl::StatusOr<std::unique_ptr<RtcTransport>> RtcTransport::Create(
    EventLoop* loop, const RtcConfig& config,
    const TransportOptions& options) {
  std::shared_ptr<rtc::PeerConnection> connection;
  try {
    connection = std::make_shared<rtc::PeerConnection>(
        config.BuildLibdatachannelConfig(options));
  } catch (const std::exception& e) {
    return NativeError("PeerConnection construction", e);
  }
  auto transport = std::unique_ptr<RtcTransport>(
      new RtcTransport(loop, std::move(connection)));
  transport->InstallNativeCallbacks();
  return transport;
}

RtcTransport::RtcTransport(EventLoop* loop,
                           std::shared_ptr<rtc::PeerConnection> connection)
    : loop_(loop),
      connection_(std::move(connection)),
      stream_id_(GenerateUUID4()) {}

RtcTransport::~RtcTransport() { Close(); }

void RtcTransport::SetEvents(TransportEvents events) {
  events_ = std::move(events);
}

void RtcTransport::InstallNativeCallbacks() {
  // The weak token is copied here, on the loop thread; native threads only
  // ever read their own copy.
  std::weak_ptr<int> lifetime = lifetime_;
  EventLoop* loop = loop_;

  connection_->onSignalingStateChange(
      [this, loop, lifetime](rtc::PeerConnection::SignalingState native) {
        loop->Post(BindToLifetime(lifetime, [this, native]() {
          signaling_state_ = FromNative(native);
          if (events_.on_signaling_state) {
            events_.on_signaling_state(signaling_state_);
          }
        }));
      });

  connection_->onStateChange(
      [this, loop, lifetime](rtc::PeerConnection::State native) {
        loop->Post(BindToLifetime(lifetime, [this, native]() {
          connection_state_ = FromNative(native);
          if (events_.on_connection_state) {
            events_.on_connection_state(connection_state_);
          }
        }));
      });

  connection_->onIceStateChange(
      [this, loop, lifetime](rtc::PeerConnection::IceState native) {
        loop->Post(BindToLifetime(lifetime, [this, native]() {
          if (events_.on_ice_state) {
            events_.on_ice_state(FromNative(native));
          }
        }));
      });

  connection_->onLocalCandidate(
      [this, loop, lifetime](const rtc::Candidate& native) {
        IceCandidate candidate;
        candidate.candidate = native.candidate();
        candidate.sdp_mid = native.mid();
        loop->Post(BindToLifetime(lifetime, [this, candidate]() {
          if (events_.on_local_candidate) {
            events_.on_local_candidate(candidate);
          }
        }));
      });

  connection_->onTrack(
      [this, loop, lifetime](std::shared_ptr<rtc::Track> track) {
        loop->Post(BindToLifetime(lifetime, [this, track]() {
          RemoteTrack remote;
          remote.track_id = track->mid();
          remote.stream_id = track->mid();
          remote.kind = track->description().type() == "video"
                            ? MediaKind::kVideo
                            : MediaKind::kAudio;
          remote_tracks_.push_back(track);
          if (events_.on_track) {
            events_.on_track(remote);
          }
        }));
      });
}

void RtcTransport::Complete(absl::AnyInvocable<void()> task) {
  loop_->Post(BindToLifetime(lifetime_, std::move(task)));
}

void RtcTransport::CreateOffer(bool ice_restart, DescriptionCallback done) {
  if (ice_restart) {
    LOG(INFO) << "ICE restart offers are generated as regular offers.";
  }
  absl::StatusOr<Description> result;
  try {
    result = FromNative(connection_->createOffer());
  } catch (const std::exception& e) {
    result = NativeError("createOffer", e);
  }
  Complete([done = std::move(done), result = std::move(result)]() mutable {
    std::move(done)(std::move(result));
  });
}

void RtcTransport::CreateAnswer(DescriptionCallback done) {
  absl::StatusOr<Description> result;
  try {
    result = FromNative(connection_->createAnswer());
  } catch (const std::exception& e) {
    result = NativeError("createAnswer", e);
  }
  Complete([done = std::move(done), result = std::move(result)]() mutable {
    std::move(done)(std::move(result));
  });
}

void RtcTransport::SetLocalDescription(Description description,
                                       StatusCallback done) {
  absl::Status status;
  try {
    connection_->setLocalDescription(ToNative(description.type));
  } catch (const std::exception& e) {
    status = NativeError("setLocalDescription", e);
  }
  Complete([done = std::move(done), status = std::move(status)]() mutable {
    std::move(done)(std::move(status));
  });
}

void RtcTransport::SetRemoteDescription(Description description,
                                        StatusCallback done) {
  absl::Status status;
  try {
    connection_->setRemoteDescription(
        rtc::Description(description.sdp, ToNative(description.type)));
  } catch (const std::exception& e) {
    status = NativeError("setRemoteDescription", e);
  }
  Complete([this, done = std::move(done),
            status = std::move(status)]() mutable {
    if (status.ok()) {
      has_remote_description_ = true;
    }
    std::move(done)(std::move(status));
  });
}

void RtcTransport::AddRemoteCandidate(IceCandidate candidate,
                                      StatusCallback done) {
  absl::Status status;
  try {
    connection_->addRemoteCandidate(
        rtc::Candidate(candidate.candidate, candidate.sdp_mid));
  } catch (const std::exception& e) {
    status = NativeError("addRemoteCandidate", e);
  }
  Complete([done = std::move(done), status = std::move(status)]() mutable {
    std::move(done)(std::move(status));
  });
}

absl::Status RtcTransport::RestartIce() {
  return absl::UnimplementedError(
      "libdatachannel does not support ICE restarts.");
}

void RtcTransport::GetStats(StatsCallback done) {
  TransportStats stats;
  rtc::Candidate local;
  rtc::Candidate remote;
  stats.has_succeeded_pair =
      connection_->getSelectedCandidatePair(&local, &remote);
  if (const auto rtt = connection_->rtt(); rtt.has_value()) {
    stats.round_trip_time = absl::FromChrono(*rtt);
  }
  stats.bytes_sent = connection_->bytesSent();
  stats.bytes_received = connection_->bytesReceived();
  Complete([done = std::move(done), stats]() mutable {
    std::move(done)(stats);
  });
}

void RtcTransport::SetLocalMedia(const LocalMedia& media) {
  // Tracks cannot be removed from a libdatachannel connection; a disabled
  // track stays negotiated and simply carries no frames.
  try {
    if (media.audio && audio_track_ == nullptr) {
      rtc::Description::Audio audio("audio",
                                    rtc::Description::Direction::SendRecv);
      audio.addOpusCodec(111);
      audio.addSSRC(RandomSsrc(), stream_id_, stream_id_, "audio");
      audio_track_ = connection_->addTrack(std::move(audio));
    }
    if (media.video && video_track_ == nullptr) {
      rtc::Description::Video video("video",
                                    rtc::Description::Direction::SendRecv);
      video.addH264Codec(96);
      video.addSSRC(RandomSsrc(), stream_id_, stream_id_, "video");
      video_track_ = connection_->addTrack(std::move(video));
    }
    if (media.screen && screen_track_ == nullptr) {
      rtc::Description::Video screen("screen",
                                     rtc::Description::Direction::SendOnly);
      screen.addH264Codec(97);
      screen.addSSRC(RandomSsrc(), stream_id_, stream_id_, "screen");
      screen_track_ = connection_->addTrack(std::move(screen));
    }
  } catch (const std::exception& e) {
    LOG(ERROR) << NativeError("addTrack", e);
    return;
  }
  media_ = media;
}

void RtcTransport::Close() {
  if (closed_) {
    return;
  }
  closed_ = true;
  signaling_state_ = SignalingState::kClosed;
  connection_state_ = ConnectionState::kClosed;
  connection_->resetCallbacks();
  connection_->close();
  remote_tracks_.clear();
}

RtcTransportFactory::RtcTransportFactory(EventLoop* loop, RtcConfig config)
    : loop_(loop), config_(std::move(config)) {}

absl::StatusOr<std::unique_ptr<MediaTransport>> RtcTransportFactory::Create(
    const TransportOptions& options) {
  absl::StatusOr<std::unique_ptr<RtcTransport>> transport =
      RtcTransport::Create(loop_, config_, options);
  if (!transport.ok()) {
    return transport.status();
  }
  return std::unique_ptr<MediaTransport>(*std::move(transport));
}

}  // namespace duet::net
