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

#ifndef DUET_NET_RTC_TRANSPORT_H_
#define DUET_NET_RTC_TRANSPORT_H_

#include <memory>
#include <string>
#include <vector>

#include <absl/base/nullability.h>
#include <absl/functional/any_invocable.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <rtc/peerconnection.hpp>
#include <rtc/track.hpp>

#include "duet/concurrency/event_loop.h"
#include "duet/net/media_transport.h"
#include "duet/net/rtc_config.h"

namespace duet::net {

/**
 * MediaTransport on top of a libdatachannel peer connection.
 *
 * libdatachannel invokes its callbacks on internal threads; they are
 * re-posted to the event loop, where the cached signalling and connection
 * states are updated before handlers run. libdatachannel cannot restart ICE
 * in place, so `RestartIce()` reports `Unimplemented` and recovery goes
 * straight to a full reconnect.
 *
 * @headerfile duet/net/rtc_transport.h
 */
class RtcTransport final : public MediaTransport {
 public:
  static absl::StatusOr<std::unique_ptr<RtcTransport>> Create(
      EventLoop* absl_nonnull loop, const RtcConfig& config,
      const TransportOptions& options);

  // This class is not copyable or movable.
  RtcTransport(const RtcTransport&) = delete;
  RtcTransport& operator=(const RtcTransport&) = delete;

  ~RtcTransport() override;

  void SetEvents(TransportEvents events) override;

  void CreateOffer(bool ice_restart, DescriptionCallback done) override;
  void CreateAnswer(DescriptionCallback done) override;
  void SetLocalDescription(Description description,
                           StatusCallback done) override;
  void SetRemoteDescription(Description description,
                            StatusCallback done) override;
  void AddRemoteCandidate(IceCandidate candidate,
                          StatusCallback done) override;

  absl::Status RestartIce() override;

  void GetStats(StatsCallback done) override;

  void SetLocalMedia(const LocalMedia& media) override;

  void Close() override;

  [[nodiscard]] SignalingState signaling_state() const override {
    return signaling_state_;
  }
  [[nodiscard]] ConnectionState connection_state() const override {
    return connection_state_;
  }
  [[nodiscard]] bool has_remote_description() const override {
    return has_remote_description_;
  }
  [[nodiscard]] std::string local_stream_id() const override {
    return stream_id_;
  }

 private:
  RtcTransport(EventLoop* absl_nonnull loop,
               std::shared_ptr<rtc::PeerConnection> connection);

  void InstallNativeCallbacks();

  // Runs `task` on the loop unless this transport is gone by then.
  void Complete(absl::AnyInvocable<void()> task);

  EventLoop* absl_nonnull const loop_;
  std::shared_ptr<rtc::PeerConnection> connection_;
  TransportEvents events_;
  const std::string stream_id_;

  LocalMedia media_;
  std::shared_ptr<rtc::Track> audio_track_;
  std::shared_ptr<rtc::Track> video_track_;
  std::shared_ptr<rtc::Track> screen_track_;
  std::vector<std::shared_ptr<rtc::Track>> remote_tracks_;

  SignalingState signaling_state_ = SignalingState::kStable;
  ConnectionState connection_state_ = ConnectionState::kNew;
  bool has_remote_description_ = false;
  bool closed_ = false;

  std::shared_ptr<int> lifetime_ = std::make_shared<int>(0);
};

class RtcTransportFactory final : public TransportFactory {
 public:
  RtcTransportFactory(EventLoop* absl_nonnull loop, RtcConfig config);

  absl::StatusOr<std::unique_ptr<MediaTransport>> Create(
      const TransportOptions& options) override;

 private:
  EventLoop* absl_nonnull const loop_;
  const RtcConfig config_;
};

}  // namespace duet::net

#endif  // DUET_NET_RTC_TRANSPORT_H_
