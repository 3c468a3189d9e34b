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

#ifndef DUET_NET_MEDIA_TRANSPORT_H_
#define DUET_NET_MEDIA_TRANSPORT_H_

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <absl/functional/any_invocable.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/time/time.h>

#include "duet/concurrency/completion_group.h"

/**
 * @file
 * @brief
 *   The peer-to-peer media transport consumed by call sessions.
 *
 * The transport is treated as an opaque asynchronous service: every
 * operation completes through a callback, and every event is delivered on
 * the event loop the transport was created for.
 */

namespace duet::net {

enum class SignalingState {
  kStable,
  kHaveLocalOffer,
  kHaveRemoteOffer,
  kClosed,
};

enum class ConnectionState {
  kNew,
  kConnecting,
  kConnected,
  kDisconnected,
  kFailed,
  kClosed,
};

enum class IceState {
  kNew,
  kChecking,
  kConnected,
  kCompleted,
  kDisconnected,
  kFailed,
  kClosed,
};

enum class TransportPolicy { kAll, kRelayOnly };

enum class MediaKind { kAudio, kVideo, kScreen };

std::string_view SignalingStateName(SignalingState state);
std::string_view ConnectionStateName(ConnectionState state);
std::string_view IceStateName(IceState state);
std::string_view MediaKindName(MediaKind kind);

enum class SdpType { kOffer, kAnswer };

struct Description {
  SdpType type = SdpType::kOffer;
  std::string sdp;
};

struct IceCandidate {
  std::string candidate;
  std::string sdp_mid;
  int sdp_mline_index = 0;
};

struct RemoteTrack {
  std::string track_id;
  std::string stream_id;
  MediaKind kind = MediaKind::kAudio;
};

struct CandidateError {
  std::string url;
  int error_code = 0;
  std::string error_text;
};

/// Local tracks the transport should send.
struct LocalMedia {
  bool audio = false;
  bool video = false;
  bool screen = false;

  bool operator==(const LocalMedia& other) const = default;
};

struct TransportStats {
  /// Whether a candidate pair has succeeded and carries traffic.
  bool has_succeeded_pair = false;
  std::optional<absl::Duration> round_trip_time;
  /// Fraction of inbound packets lost, in [0, 1].
  std::optional<double> packet_loss;
  std::optional<absl::Duration> jitter;
  uint64_t bytes_sent = 0;
  uint64_t bytes_received = 0;
};

struct TransportEvents {
  std::function<void(SignalingState)> on_signaling_state;
  std::function<void(ConnectionState)> on_connection_state;
  std::function<void(IceState)> on_ice_state;
  std::function<void(const IceCandidate&)> on_local_candidate;
  std::function<void(const RemoteTrack&)> on_track;
  std::function<void(const CandidateError&)> on_candidate_error;
};

using DescriptionCallback =
    absl::AnyInvocable<void(absl::StatusOr<Description>)>;
using StatsCallback = absl::AnyInvocable<void(absl::StatusOr<TransportStats>)>;

/**
 * A standards-based peer-to-peer audio/video connection.
 *
 * @headerfile duet/net/media_transport.h
 */
class MediaTransport {
 public:
  virtual ~MediaTransport() = default;

  /// Replaces the event handlers. Handlers run on the event loop.
  virtual void SetEvents(TransportEvents events) = 0;

  virtual void CreateOffer(bool ice_restart, DescriptionCallback done) = 0;
  virtual void CreateAnswer(DescriptionCallback done) = 0;
  virtual void SetLocalDescription(Description description,
                                   StatusCallback done) = 0;
  virtual void SetRemoteDescription(Description description,
                                    StatusCallback done) = 0;
  virtual void AddRemoteCandidate(IceCandidate candidate,
                                  StatusCallback done) = 0;

  /**
   * Restarts connectivity checks in place. Returns `Unimplemented` if the
   * transport cannot restart without a full reconnect.
   */
  virtual absl::Status RestartIce() = 0;

  virtual void GetStats(StatsCallback done) = 0;

  virtual void SetLocalMedia(const LocalMedia& media) = 0;

  /// Closes the connection. No events are delivered afterwards.
  virtual void Close() = 0;

  [[nodiscard]] virtual SignalingState signaling_state() const = 0;
  [[nodiscard]] virtual ConnectionState connection_state() const = 0;
  [[nodiscard]] virtual bool has_remote_description() const = 0;

  /// Id of the local media stream, published in the presence record.
  [[nodiscard]] virtual std::string local_stream_id() const = 0;
};

struct TransportOptions {
  TransportPolicy policy = TransportPolicy::kAll;
  /// Adds the configured fallback relay server to the server list.
  bool use_fallback_relay = false;
};

class TransportFactory {
 public:
  virtual ~TransportFactory() = default;

  virtual absl::StatusOr<std::unique_ptr<MediaTransport>> Create(
      const TransportOptions& options) = 0;
};

}  // namespace duet::net

#endif  // DUET_NET_MEDIA_TRANSPORT_H_
