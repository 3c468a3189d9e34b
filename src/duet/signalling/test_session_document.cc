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

#include <absl/status/status.h>
#include <absl/status/status_matchers.h>
#include <absl/time/time.h>
#include <boost/json/object.hpp>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "duet/signalling/room_paths.h"
#include "duet/signalling/session_document.h"
#include "duet/store/json_util.h"

#define EXPECT_OK(expression) EXPECT_THAT(expression, ::absl_testing::IsOk())
#define ASSERT_OK(expression) ASSERT_THAT(expression, ::absl_testing::IsOk())

namespace {

using ::absl_testing::StatusIs;
using ::duet::signalling::MakeOfferUpdate;
using ::duet::signalling::RoomPaths;
using ::duet::signalling::SessionDescription;
using ::duet::signalling::SessionDocument;
using ::duet::signalling::Side;

SessionDescription Description(Side side, int64_t revision,
                               std::string author) {
  SessionDescription description;
  description.type = side;
  description.sdp = "v=0\r\n";
  description.revision = revision;
  description.updated_at = absl::FromUnixMillis(1700000000123);
  description.updated_by = std::move(author);
  return description;
}

TEST(RoomPathsTest, LaysOutRevisionScopedArtifacts) {
  const RoomPaths paths("room-1");
  EXPECT_EQ(paths.session(), "calls/room-1");
  EXPECT_EQ(paths.description(Side::kOffer, 3),
            "calls/room-1/descriptions/offer-3");
  EXPECT_EQ(paths.revision(3), "calls/room-1/revisions/3");
  EXPECT_EQ(paths.candidates(3, Side::kAnswer),
            "calls/room-1/revisions/3/answerCandidates");
  EXPECT_EQ(paths.legacy_candidates(Side::kOffer),
            "calls/room-1/offerCandidates");
  EXPECT_EQ(paths.participant("alice"), "calls/room-1/participants/alice");
  EXPECT_LT(RoomPaths::CandidateId(9), RoomPaths::CandidateId(10));
}

TEST(SessionDocumentTest, ParsesWhatItWrites) {
  SessionDocument document;
  document.offer = Description(Side::kOffer, 4, "alice");
  document.answer = Description(Side::kAnswer, 4, "bob");
  document.answer->sdp_ref = "calls/r/descriptions/answer-4";
  document.created_by = "alice";
  document.answerer = "bob";

  absl::StatusOr<SessionDocument> parsed =
      SessionDocument::FromJson(document.ToJson());
  ASSERT_OK(parsed.status());
  ASSERT_TRUE(parsed->offer.has_value());
  EXPECT_EQ(parsed->offer->revision, 4);
  EXPECT_EQ(parsed->offer->updated_at, absl::FromUnixMillis(1700000000123));
  EXPECT_EQ(parsed->answer->sdp_ref, "calls/r/descriptions/answer-4");
  EXPECT_EQ(parsed->answerer, "bob");
  EXPECT_TRUE(parsed->HasMatchingAnswer());
  EXPECT_FALSE(parsed->IsSelfAuthored("alice"));
}

TEST(SessionDocumentTest, AnswerOfOlderRevisionDoesNotMatch) {
  SessionDocument document;
  document.offer = Description(Side::kOffer, 5, "alice");
  document.answer = Description(Side::kAnswer, 4, "bob");
  EXPECT_FALSE(document.HasMatchingAnswer());
}

TEST(SessionDocumentTest, DetectsSelfAuthoredState) {
  SessionDocument document;
  document.offer = Description(Side::kOffer, 2, "alice");
  document.answer = Description(Side::kAnswer, 2, "alice");
  EXPECT_TRUE(document.IsSelfAuthored("alice"));
  EXPECT_FALSE(document.IsSelfAuthored("bob"));
}

TEST(SessionDocumentTest, RejectsDescriptionsWithoutPayloadOrRevision) {
  boost::json::object no_payload = Description(Side::kOffer, 1, "a").ToJson();
  no_payload["sdp"] = "";
  EXPECT_THAT(SessionDescription::FromJson(no_payload),
              StatusIs(absl::StatusCode::kInvalidArgument));

  boost::json::object no_revision =
      Description(Side::kOffer, 1, "a").ToJson();
  no_revision["revision"] = 0;
  EXPECT_THAT(SessionDescription::FromJson(no_revision),
              StatusIs(absl::StatusCode::kInvalidArgument));

  boost::json::object bad_type = Description(Side::kOffer, 1, "a").ToJson();
  bad_type["type"] = "pranswer";
  EXPECT_THAT(SessionDescription::FromJson(bad_type),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(SessionDocumentTest, OfferUpdateClearsAnswerAndBindsAnswerer) {
  const boost::json::object bound =
      MakeOfferUpdate(Description(Side::kOffer, 6, "alice"), "bob");
  EXPECT_TRUE(bound.at("answer").is_null());
  EXPECT_EQ(duet::store::GetString(bound, "answerer"), "bob");

  const boost::json::object unbound =
      MakeOfferUpdate(Description(Side::kOffer, 6, "alice"), "");
  EXPECT_TRUE(unbound.at("answerer").is_null());
}

TEST(SessionDocumentTest, MeasuresLargestDescription) {
  SessionDocument document;
  document.offer = Description(Side::kOffer, 1, "alice");
  document.offer->sdp = std::string(1000, 'o');
  document.answer = Description(Side::kAnswer, 1, "bob");
  EXPECT_GT(document.LargestDescriptionBytes(), 1000u);
  EXPECT_LT(document.LargestDescriptionBytes(), 1200u);
}

}  // namespace
