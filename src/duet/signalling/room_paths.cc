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

#include "duet/signalling/room_paths.h"

#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>

namespace duet::signalling {

std::string_view SideName(Side side) {
  return side == Side::kOffer ? "offer" : "answer";
}

RoomPaths::RoomPaths(std::string_view room)
    : room_(room), session_(absl::StrCat("calls/", room)) {}

std::string RoomPaths::descriptions() const {
  return absl::StrCat(session_, "/descriptions");
}

std::string RoomPaths::description(Side side, int64_t revision) const {
  return absl::StrCat(descriptions(), "/", SideName(side), "-", revision);
}

std::string RoomPaths::revisions() const {
  return absl::StrCat(session_, "/revisions");
}

std::string RoomPaths::revision(int64_t revision) const {
  return absl::StrCat(revisions(), "/", revision);
}

std::string RoomPaths::candidates(int64_t revision, Side side) const {
  return absl::StrCat(this->revision(revision), "/", SideName(side),
                      "Candidates");
}

std::string RoomPaths::candidate(int64_t revision, Side side,
                                 int64_t seq) const {
  return absl::StrCat(candidates(revision, side), "/", CandidateId(seq));
}

std::string RoomPaths::legacy_candidates(Side side) const {
  return absl::StrCat(session_, "/", SideName(side), "Candidates");
}

std::string RoomPaths::participants() const {
  return absl::StrCat(session_, "/participants");
}

std::string RoomPaths::participant(std::string_view uid) const {
  return absl::StrCat(participants(), "/", uid);
}

std::string RoomPaths::CandidateId(int64_t seq) {
  return absl::StrFormat("%010d", seq);
}

}  // namespace duet::signalling
