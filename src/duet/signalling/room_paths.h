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

#ifndef DUET_SIGNALLING_ROOM_PATHS_H_
#define DUET_SIGNALLING_ROOM_PATHS_H_

#include <cstdint>
#include <string>
#include <string_view>

namespace duet::signalling {

/// Which half of an offer/answer exchange a record belongs to.
enum class Side { kOffer, kAnswer };

std::string_view SideName(Side side);

inline Side Opposite(Side side) {
  return side == Side::kOffer ? Side::kAnswer : Side::kOffer;
}

/**
 * Document store layout of one room.
 *
 * @code
 *   calls/{room}                                     session document
 *   calls/{room}/descriptions/{offer|answer}-{rev}   side-channel SDP
 *   calls/{room}/revisions/{rev}                     revision marker
 *   calls/{room}/revisions/{rev}/offerCandidates/{seq}
 *   calls/{room}/revisions/{rev}/answerCandidates/{seq}
 *   calls/{room}/offerCandidates/{id}                legacy, purge only
 *   calls/{room}/participants/{uid}                  presence
 * @endcode
 *
 * @headerfile duet/signalling/room_paths.h
 */
class RoomPaths {
 public:
  explicit RoomPaths(std::string_view room);

  [[nodiscard]] const std::string& room() const { return room_; }

  [[nodiscard]] const std::string& session() const { return session_; }

  [[nodiscard]] std::string descriptions() const;
  [[nodiscard]] std::string description(Side side, int64_t revision) const;

  [[nodiscard]] std::string revisions() const;
  [[nodiscard]] std::string revision(int64_t revision) const;
  [[nodiscard]] std::string candidates(int64_t revision, Side side) const;
  [[nodiscard]] std::string candidate(int64_t revision, Side side,
                                      int64_t seq) const;

  [[nodiscard]] std::string legacy_candidates(Side side) const;

  [[nodiscard]] std::string participants() const;
  [[nodiscard]] std::string participant(std::string_view uid) const;

  /// Zero-padded so that lexicographic id order equals append order.
  static std::string CandidateId(int64_t seq);

 private:
  std::string room_;
  std::string session_;
};

}  // namespace duet::signalling

#endif  // DUET_SIGNALLING_ROOM_PATHS_H_
