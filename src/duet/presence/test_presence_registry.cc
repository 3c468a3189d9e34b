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

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/status_matchers.h>
#include <absl/time/time.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "duet/presence/presence_record.h"
#include "duet/presence/presence_registry.h"
#include "duet/signalling/room_paths.h"
#include "duet/store/in_memory_store.h"
#include "duet/store/json_util.h"
#include "duet/testing/manual_event_loop.h"

#define EXPECT_OK(expression) EXPECT_THAT(expression, ::absl_testing::IsOk())

namespace {

using ::absl_testing::StatusIs;
using ::duet::presence::MediaState;
using ::duet::presence::PresenceCallbacks;
using ::duet::presence::PresenceRecord;
using ::duet::presence::PresenceRegistry;
using ::duet::presence::PresenceStatus;
using ::duet::signalling::RoomPaths;
using ::duet::store::InMemoryDocumentStore;
using ::duet::testing::ManualEventLoop;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::UnorderedElementsAre;

class PresenceRegistryTest : public ::testing::Test {
 protected:
  void Join(PresenceRegistry& registry, MediaState media = {}) {
    registry.Join(media, registry.uid() + "-stream",
                  [](absl::Status status) { EXPECT_OK(status); });
    loop_.RunUntilIdle();
  }

  PresenceRecord Stored(const std::string& uid) {
    std::optional<duet::store::Document> document =
        store_.Peek(paths_.participant(uid));
    EXPECT_TRUE(document.has_value()) << uid;
    absl::StatusOr<PresenceRecord> record =
        PresenceRecord::FromJson(document.value_or(duet::store::Document{}));
    EXPECT_OK(record.status());
    return record.value_or(PresenceRecord{});
  }

  static std::vector<std::string> Uids(
      const std::vector<PresenceRecord>& roster) {
    std::vector<std::string> uids;
    for (const auto& record : roster) {
      uids.push_back(record.uid);
    }
    return uids;
  }

  ManualEventLoop loop_;
  InMemoryDocumentStore store_{&loop_};
  RoomPaths paths_{"room"};
  PresenceRegistry alice_{&loop_, &store_, paths_, "alice", "Alice"};
  PresenceRegistry bob_{&loop_, &store_, paths_, "bob", "Bob"};
};

TEST_F(PresenceRegistryTest, JoinPublishesActiveRecord) {
  Join(alice_, MediaState{.has_audio = true});

  const PresenceRecord record = Stored("alice");
  EXPECT_EQ(record.status, PresenceStatus::kActive);
  EXPECT_EQ(record.display_name, "Alice");
  EXPECT_EQ(record.stream_id, "alice-stream");
  EXPECT_TRUE(record.media.has_audio);
  EXPECT_EQ(record.joined_at, loop_.Now());
  EXPECT_TRUE(alice_.roster_loaded());
  EXPECT_EQ(alice_.active_count(), 1);
}

TEST_F(PresenceRegistryTest, RosterIsOrderedByJoinTime) {
  std::vector<std::string> joined;
  std::vector<std::string> roster;
  PresenceCallbacks callbacks;
  callbacks.on_joined = [&joined](const PresenceRecord& record) {
    joined.push_back(record.uid);
  };
  callbacks.on_roster = [&roster](const std::vector<PresenceRecord>& records) {
    roster = Uids(records);
  };
  alice_.SetCallbacks(std::move(callbacks));

  Join(bob_);
  loop_.AdvanceBy(absl::Seconds(1));
  Join(alice_);

  EXPECT_THAT(joined, UnorderedElementsAre("bob", "alice"));
  EXPECT_THAT(roster, ElementsAre("bob", "alice"));
}

TEST_F(PresenceRegistryTest, LeaveRemovesRecordAndNotifiesOthers) {
  std::vector<std::string> left;
  PresenceCallbacks callbacks;
  callbacks.on_left = [&left](const std::string& uid) { left.push_back(uid); };
  alice_.SetCallbacks(std::move(callbacks));
  Join(alice_);
  Join(bob_);

  absl::Status status = absl::UnknownError("pending");
  bob_.Leave([&status](absl::Status s) { status = s; });
  loop_.RunUntilIdle();

  EXPECT_OK(status);
  EXPECT_FALSE(store_.Peek(paths_.participant("bob")).has_value());
  EXPECT_THAT(left, ElementsAre("bob"));
  EXPECT_EQ(alice_.Find("bob"), nullptr);
}

TEST_F(PresenceRegistryTest, LeaveFallsBackToMarkingLeft) {
  Join(alice_);
  Join(bob_);
  store_.FailNext(paths_.participant("bob"), duet::store::kRemove,
                  absl::UnavailableError("offline"));

  absl::Status status = absl::UnknownError("pending");
  bob_.Leave([&status](absl::Status s) { status = s; });
  loop_.RunUntilIdle();

  EXPECT_OK(status);
  EXPECT_EQ(Stored("bob").status, PresenceStatus::kLeft);
  EXPECT_EQ(alice_.Find("bob"), nullptr);
}

TEST_F(PresenceRegistryTest, MediaUpdatesAreDebounced) {
  Join(alice_);
  const size_t writes = store_.write_count();

  alice_.UpdateMedia(MediaState{.has_audio = true});
  alice_.UpdateMedia(MediaState{.has_audio = true, .has_video = true});
  loop_.RunUntilIdle();
  EXPECT_EQ(store_.write_count(), writes);

  loop_.AdvanceBy(absl::Milliseconds(300));
  EXPECT_EQ(store_.write_count(), writes + 1);
  EXPECT_TRUE(Stored("alice").media.has_video);
}

TEST_F(PresenceRegistryTest, SpeakingUpdatesAreRateLimited) {
  Join(alice_);
  const size_t writes = store_.write_count();

  alice_.SetSpeaking(true);
  loop_.RunUntilIdle();
  alice_.SetSpeaking(false);
  alice_.SetSpeaking(true);
  loop_.RunUntilIdle();
  EXPECT_EQ(store_.write_count(), writes + 1);

  loop_.AdvanceBy(absl::Milliseconds(200));
  EXPECT_EQ(store_.write_count(), writes + 2);
  EXPECT_TRUE(Stored("alice").speaking);
}

TEST_F(PresenceRegistryTest, StaleParticipantsAreSweptAsLeft) {
  std::vector<std::string> left;
  PresenceCallbacks callbacks;
  callbacks.on_left = [&left](const std::string& uid) { left.push_back(uid); };
  alice_.SetCallbacks(std::move(callbacks));
  Join(alice_);
  Join(bob_);

  auto carol = std::make_unique<PresenceRegistry>(&loop_, &store_, paths_,
                                                  "carol", "Carol");
  Join(*carol);
  // Carol's client disappears without leaving.
  carol.reset();

  loop_.AdvanceBy(absl::Seconds(46));
  EXPECT_EQ(Stored("carol").status, PresenceStatus::kLeft);
  EXPECT_THAT(left, ElementsAre("carol"));
  EXPECT_EQ(Stored("bob").status, PresenceStatus::kActive);
  EXPECT_EQ(Stored("alice").status, PresenceStatus::kActive);
}

TEST_F(PresenceRegistryTest, KickedParticipantIsToldOnce) {
  int removed = 0;
  PresenceCallbacks callbacks;
  callbacks.on_removed = [&removed]() { ++removed; };
  bob_.SetCallbacks(std::move(callbacks));
  Join(alice_);
  Join(bob_);

  alice_.Kick("bob", [](absl::Status status) { EXPECT_OK(status); });
  loop_.RunUntilIdle();
  EXPECT_EQ(removed, 1);
  EXPECT_EQ(alice_.Find("bob"), nullptr);

  absl::Status self_kick;
  alice_.Kick("alice", [&self_kick](absl::Status s) { self_kick = s; });
  EXPECT_THAT(self_kick, StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST_F(PresenceRegistryTest, WritesBeforeJoinAreRejected) {
  absl::Status status;
  alice_.RequestRenegotiation("test", /*ice_restart=*/false,
                              [&status](absl::Status s) { status = s; });
  EXPECT_THAT(status, StatusIs(absl::StatusCode::kFailedPrecondition));
  EXPECT_THAT(store_.Paths(paths_.participants()), IsEmpty());
}

TEST_F(PresenceRegistryTest, RenegotiationRequestsCarryFreshIds) {
  std::vector<std::string> ids;
  std::vector<bool> ice_restarts;
  PresenceCallbacks callbacks;
  callbacks.on_updated = [&ids, &ice_restarts](const PresenceRecord& record) {
    if (record.renegotiation_request) {
      ids.push_back(record.renegotiation_request->id);
      ice_restarts.push_back(record.renegotiation_request->ice_restart);
    }
  };
  alice_.SetCallbacks(std::move(callbacks));
  Join(alice_);
  Join(bob_);

  bob_.RequestRenegotiation("mic-on", /*ice_restart=*/false,
                            [](absl::Status s) { EXPECT_OK(s); });
  loop_.RunUntilIdle();
  bob_.RequestRenegotiation("ice-restart", /*ice_restart=*/true,
                            [](absl::Status s) { EXPECT_OK(s); });
  loop_.RunUntilIdle();

  ASSERT_EQ(ids.size(), 2);
  EXPECT_NE(ids[0], ids[1]);
  EXPECT_THAT(ice_restarts, ElementsAre(false, true));
}

}  // namespace
