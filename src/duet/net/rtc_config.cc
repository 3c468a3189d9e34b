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

#include "duet/net/rtc_config.h"

#include <utility>

#include <absl/status/status.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_format.h>
#include <absl/strings/str_join.h>
#include <absl/strings/str_split.h>

namespace duet::net {

absl::StatusOr<TurnServer> TurnServer::FromString(std::string_view url) {
  std::string_view credentials;
  std::string_view address = url;
  if (const size_t at = url.rfind('@'); at != std::string_view::npos) {
    credentials = url.substr(0, at);
    address = url.substr(at + 1);
  }
  if (address.empty()) {
    return absl::InvalidArgumentError(
        absl::StrFormat("TURN server '%s' has no hostname", url));
  }

  TurnServer server;
  if (const size_t colon = address.rfind(':');
      colon == std::string_view::npos) {
    server.hostname = std::string(address);
  } else {
    server.hostname = std::string(address.substr(0, colon));
    if (!absl::SimpleAtoi(address.substr(colon + 1), &server.port)) {
      return absl::InvalidArgumentError(
          absl::StrFormat("TURN server '%s' has an invalid port", url));
    }
  }
  if (server.hostname.empty()) {
    return absl::InvalidArgumentError(
        absl::StrFormat("TURN server '%s' has no hostname", url));
  }

  if (const size_t colon = credentials.find(':');
      colon == std::string_view::npos) {
    server.username = std::string(credentials);
  } else {
    server.username = std::string(credentials.substr(0, colon));
    server.password = std::string(credentials.substr(colon + 1));
  }
  return server;
}

bool TurnServer::operator==(const TurnServer& other) const {
  return hostname == other.hostname && port == other.port &&
         username == other.username && password == other.password;
}

bool AbslParseFlag(std::string_view text, TurnServer* server,
                   std::string* error) {
  absl::StatusOr<TurnServer> result = TurnServer::FromString(text);
  if (!result.ok()) {
    *error = result.status().message();
    return false;
  }
  *server = *std::move(result);
  return true;
}

std::string AbslUnparseFlag(const TurnServer& server) {
  if (server.username.empty()) {
    return absl::StrFormat("%s:%d", server.hostname, server.port);
  }
  return absl::StrFormat("%s:%s@%s:%d", server.username, server.password,
                         server.hostname, server.port);
}

bool AbslParseFlag(std::string_view text, std::vector<TurnServer>* servers,
                   std::string* error) {
  servers->clear();
  if (text.empty()) {
    return true;
  }
  for (std::string_view part : absl::StrSplit(text, ',')) {
    TurnServer server;
    if (!AbslParseFlag(part, &server, error)) {
      return false;
    }
    servers->push_back(std::move(server));
  }
  return true;
}

std::string AbslUnparseFlag(const std::vector<TurnServer>& servers) {
  return absl::StrJoin(servers, ",",
                       [](std::string* out, const TurnServer& server) {
                         out->append(AbslUnparseFlag(server));
                       });
}

rtc::Configuration RtcConfig::BuildLibdatachannelConfig(
    const TransportOptions& options) const {
  rtc::Configuration config;
  config.enableIceUdpMux = enable_ice_udp_mux;
  config.portRangeBegin = port_range_begin;
  config.portRangeEnd = port_range_end;
  // Offers and answers are driven explicitly by the call session.
  config.disableAutoNegotiation = true;
  config.iceTransportPolicy = options.policy == TransportPolicy::kRelayOnly
                                  ? rtc::TransportPolicy::Relay
                                  : rtc::TransportPolicy::All;

  for (const auto& server : stun_servers) {
    config.iceServers.emplace_back(server);
  }
  for (const auto& server : turn_servers) {
    config.iceServers.emplace_back(server.hostname, server.port,
                                   server.username, server.password);
  }
  if (options.use_fallback_relay && fallback_turn_server.has_value()) {
    config.iceServers.emplace_back(
        fallback_turn_server->hostname, fallback_turn_server->port,
        fallback_turn_server->username, fallback_turn_server->password);
  }
  return config;
}

}  // namespace duet::net
