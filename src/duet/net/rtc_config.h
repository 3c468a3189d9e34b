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

#ifndef DUET_NET_RTC_CONFIG_H_
#define DUET_NET_RTC_CONFIG_H_

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/base/nullability.h>
#include <absl/status/statusor.h>
#include <rtc/configuration.hpp>

#include "duet/net/media_transport.h"

namespace duet::net {

/// A TURN relay, written as `[user[:password]@]host[:port]`.
struct TurnServer {
  static absl::StatusOr<TurnServer> FromString(std::string_view url);

  bool operator==(const TurnServer& other) const;

  std::string hostname;
  uint16_t port = 3478;
  std::string username;
  std::string password;
};

bool AbslParseFlag(std::string_view text, TurnServer* absl_nonnull server,
                   std::string* absl_nonnull error);
std::string AbslUnparseFlag(const TurnServer& server);

bool AbslParseFlag(std::string_view text,
                   std::vector<TurnServer>* absl_nonnull servers,
                   std::string* absl_nonnull error);
std::string AbslUnparseFlag(const std::vector<TurnServer>& servers);

struct RtcConfig {
  /// Builds the native configuration for one transport. `options` selects
  /// the relay-only policy and whether the fallback relay is appended.
  [[nodiscard]] rtc::Configuration BuildLibdatachannelConfig(
      const TransportOptions& options = {}) const;

  std::vector<std::string> stun_servers = {
      "stun:stun.l.google.com:19302",
  };
  std::vector<TurnServer> turn_servers;

  /// Relay used only after repeated connectivity failures.
  std::optional<TurnServer> fallback_turn_server;

  bool enable_ice_udp_mux = false;
  uint16_t port_range_begin = 1024;
  uint16_t port_range_end = 65535;
};

}  // namespace duet::net

#endif  // DUET_NET_RTC_CONFIG_H_
