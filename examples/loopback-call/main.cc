#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <absl/debugging/failure_signal_handler.h>
#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/log/initialize.h>
#include <absl/log/log.h>
#include <absl/status/status.h>
#include <absl/time/time.h>

#include "duet/call/call_session.h"
#include "duet/concurrency/asio_event_loop.h"
#include "duet/net/rtc_config.h"
#include "duet/net/rtc_transport.h"
#include "duet/store/in_memory_store.h"

ABSL_FLAG(std::string, room, "loopback", "Room both endpoints join.");

ABSL_FLAG(std::vector<std::string>, stun_servers,
          {"stun:stun.l.google.com:19302"},
          "STUN server URLs, comma-separated.");

ABSL_FLAG(
    std::vector<duet::net::TurnServer>, turn_servers, {},
    "List of TURN servers to use. Format: "
    "username1:password1@hostname1:port1,username2:password2@hostname2:port2");

ABSL_FLAG(std::string, fallback_turn_server, "",
          "Relay appended only after repeated connectivity failures, in the "
          "same format as --turn_servers.");

ABSL_FLAG(absl::Duration, duration, absl::Seconds(20),
          "How long to keep the call up before both endpoints leave.");

namespace {

duet::call::CallObservers MakeObservers(std::string_view name) {
  const std::string tag(name);
  duet::call::CallObservers observers;
  observers.on_status = [tag](std::string_view status) {
    LOG(INFO) << tag << ": " << status;
  };
  observers.on_indicator = [tag](const duet::call::ConnectionIndicator& indicator) {
    LOG(INFO) << tag << ": quality "
              << duet::call::ConnectionQualityName(indicator.quality);
  };
  observers.on_remote_track = [tag](const duet::net::RemoteTrack& track) {
    LOG(INFO) << tag << ": remote "
              << duet::net::MediaKindName(track.kind) << " track "
              << track.track_id;
  };
  observers.on_error = [tag](const absl::Status& status) {
    LOG(WARNING) << tag << ": " << status;
  };
  return observers;
}

void LogOutcome(std::string_view name, std::string_view what,
                const absl::Status& status) {
  if (status.ok()) {
    LOG(INFO) << name << " " << what << " the room.";
  } else {
    LOG(ERROR) << name << " could not " << what << ": " << status;
  }
}

}  // namespace

int main(int argc, char** argv) {
  absl::InstallFailureSignalHandler({});
  absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();

  duet::net::RtcConfig rtc_config;
  rtc_config.stun_servers = absl::GetFlag(FLAGS_stun_servers);
  rtc_config.turn_servers = absl::GetFlag(FLAGS_turn_servers);
  if (const std::string fallback = absl::GetFlag(FLAGS_fallback_turn_server);
      !fallback.empty()) {
    auto server = duet::net::TurnServer::FromString(fallback);
    if (!server.ok()) {
      LOG(ERROR) << "Invalid --fallback_turn_server: " << server.status();
      return 1;
    }
    rtc_config.fallback_turn_server = *std::move(server);
  }

  duet::AsioEventLoop loop;
  duet::store::InMemoryDocumentStore store(&loop);
  duet::net::RtcTransportFactory transports(&loop, rtc_config);

  const std::string room = absl::GetFlag(FLAGS_room);
  auto alice = std::make_unique<duet::call::CallSession>(
      &loop, &store, &transports, /*media=*/nullptr, room, "alice", "Alice");
  auto bob = std::make_unique<duet::call::CallSession>(
      &loop, &store, &transports, /*media=*/nullptr, room, "bob", "Bob");
  alice->SetObservers(MakeObservers("alice"));
  bob->SetObservers(MakeObservers("bob"));

  loop.Post([&]() {
    alice->Join({.microphone = false}, [&](absl::Status status) {
      LogOutcome("alice", "joined", status);
      bob->Join({.microphone = false}, [](absl::Status status) {
        LogOutcome("bob", "joined", status);
      });
    });
  });
  loop.RunFor(absl::GetFlag(FLAGS_duration));

  int left = 0;
  loop.Post([&]() {
    for (duet::call::CallSession* session : {alice.get(), bob.get()}) {
      session->Leave([&, uid = session->uid()](absl::Status status) {
        LogOutcome(uid, "left", status);
        if (++left == 2) {
          loop.Stop();
        }
      });
    }
  });
  loop.RunFor(absl::Seconds(5));

  bob.reset();
  alice.reset();
  return 0;
}
