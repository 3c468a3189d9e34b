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

#include <string>
#include <vector>

#include <absl/functional/any_invocable.h>
#include <absl/status/status.h>
#include <absl/status/status_matchers.h>
#include <absl/strings/str_cat.h>
#include <boost/json/object.hpp>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "duet/signalling/candidate_ledger.h"
#include "duet/signalling/room_paths.h"
#include "duet/store/in_memory_store.h"
#include "duet/testing/manual_event_loop.h"

#define EXPECT_OK(expression) EXPECT_THAT(expression, ::absl_testing::IsOk())

namespace {

using ::duet::signalling::CandidateLedger;
using ::duet::signalling::CandidateRecord;
using ::duet::signalling::RoomPaths;
using ::duet::signalling::Side;
using ::duet::store::InMemoryDocumentStore;
using ::duet::testing::ManualEventLoop;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::SizeIs;

CandidateRecord Candidate(int64_t revision, std::string candidate) {
  CandidateRecord record;
  record.candidate = std::move(candidate);
  record.sdp_mid = "0";
  record.revision = revision;
  return record;
}

class CandidateLedgerTest : public ::testing::Test {
 protected:
  void Append(CandidateLedger& ledger, Side side, CandidateRecord record) {
    ledger.Append(side, std::move(record), loop_.Now(),
                  [](absl::Status status) { EXPECT_OK(status); });
    loop_.RunUntilIdle();
  }

  absl::Status Run(absl::AnyInvocable<void(duet::StatusCallback)> operation) {
    absl::Status result = absl::UnknownError("pending");
    std::move(operation)([&result](absl::Status status) { result = status; });
    loop_.RunUntilIdle();
    return result;
  }

  ManualEventLoop loop_;
  InMemoryDocumentStore store_{&loop_};
  RoomPaths paths_{"room"};
  CandidateLedger alice_{&store_, paths_, "alice"};
  CandidateLedger bob_{&store_, paths_, "bob"};
};

TEST_F(CandidateLedgerTest, WatchDeliversRecordsInAppendOrder) {
  for (int i = 0; i < 12; ++i) {
    Append(alice_, Side::kOffer, Candidate(1, absl::StrCat("c", i)));
  }
  std::vector<CandidateRecord> seen;
  auto subscription = bob_.Watch(
      1, Side::kOffer,
      [&seen](const CandidateRecord& record) { seen.push_back(record); });
  loop_.RunUntilIdle();

  ASSERT_THAT(seen, SizeIs(12));
  for (int i = 0; i < 12; ++i) {
    EXPECT_EQ(seen[i].candidate, absl::StrCat("c", i));
    EXPECT_EQ(seen[i].seq, i);
    EXPECT_EQ(seen[i].author, "alice");
    EXPECT_EQ(seen[i].revision, 1);
  }
}

TEST_F(CandidateLedgerTest, RevisionsAndSidesAreSeparate) {
  std::vector<std::string> seen;
  auto subscription = bob_.Watch(
      2, Side::kOffer,
      [&seen](const CandidateRecord& record) { seen.push_back(record.candidate); });
  loop_.RunUntilIdle();

  Append(alice_, Side::kOffer, Candidate(1, "old"));
  Append(alice_, Side::kAnswer, Candidate(2, "other-side"));
  Append(alice_, Side::kOffer, Candidate(2, "current"));
  EXPECT_THAT(seen, ElementsAre("current"));
}

TEST_F(CandidateLedgerTest, WritersNeverOverwriteEachOther) {
  CandidateLedger alice_again(&store_, paths_, "alice");
  Append(alice_, Side::kAnswer, Candidate(3, "first-transport"));
  Append(alice_again, Side::kAnswer, Candidate(3, "second-transport"));
  EXPECT_THAT(store_.Paths(paths_.candidates(3, Side::kAnswer)), SizeIs(2));
}

TEST_F(CandidateLedgerTest, DedupKeyIgnoresAuthorAndSequence) {
  CandidateRecord a = Candidate(1, "candidate:1");
  CandidateRecord b = a;
  b.author = "someone";
  b.seq = 42;
  EXPECT_EQ(a.DedupKey(), b.DedupKey());
  b.revision = 2;
  EXPECT_NE(a.DedupKey(), b.DedupKey());
}

TEST_F(CandidateLedgerTest, PurgeAllExceptKeepsOneRevision) {
  for (int64_t revision : {1, 2, 3}) {
    EXPECT_OK(Run([&](duet::StatusCallback done) {
      alice_.EnsureRevision(revision, std::move(done));
    }));
    Append(alice_, Side::kOffer, Candidate(revision, "o"));
    Append(bob_, Side::kAnswer, Candidate(revision, "a"));
  }
  // Revision 4 has candidates but its marker write was lost.
  Append(alice_, Side::kOffer, Candidate(4, "orphan"));

  EXPECT_OK(Run([&](duet::StatusCallback done) {
    alice_.PurgeAllExcept(3, {4}, std::move(done));
  }));

  for (int64_t revision : {1, 2, 4}) {
    EXPECT_THAT(store_.Paths(paths_.revision(revision)), IsEmpty())
        << "revision " << revision;
  }
  EXPECT_THAT(store_.Paths(paths_.revision(3)), SizeIs(3));
}

TEST_F(CandidateLedgerTest, PurgeRevisionKeepsMarkerOnFailure) {
  EXPECT_OK(Run([&](duet::StatusCallback done) {
    alice_.EnsureRevision(1, std::move(done));
  }));
  Append(alice_, Side::kOffer, Candidate(1, "o"));
  store_.FailNext(paths_.candidates(1, Side::kOffer), duet::store::kRemove,
                  absl::UnavailableError("flaky"));

  EXPECT_FALSE(Run([&](duet::StatusCallback done) {
                 alice_.PurgeRevision(1, std::move(done));
               }).ok());
  EXPECT_TRUE(store_.Peek(paths_.revision(1)).has_value());

  EXPECT_OK(Run([&](duet::StatusCallback done) {
    alice_.PurgeRevision(1, std::move(done));
  }));
  EXPECT_THAT(store_.Paths(paths_.revision(1)), IsEmpty());
}

TEST_F(CandidateLedgerTest, PurgeLegacyDeletesFlatCollections) {
  boost::json::object legacy;
  legacy["candidate"] = "candidate:legacy";
  store_.Set(paths_.legacy_candidates(Side::kOffer) + "/x", legacy,
             [](absl::Status status) { EXPECT_OK(status); });
  store_.Set(paths_.legacy_candidates(Side::kAnswer) + "/y", legacy,
             [](absl::Status status) { EXPECT_OK(status); });
  loop_.RunUntilIdle();

  EXPECT_OK(Run([&](duet::StatusCallback done) {
    alice_.PurgeLegacy(std::move(done));
  }));
  EXPECT_THAT(store_.Paths(paths_.legacy_candidates(Side::kOffer)), IsEmpty());
  EXPECT_THAT(store_.Paths(paths_.legacy_candidates(Side::kAnswer)),
              IsEmpty());
}

}  // namespace
