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

#ifndef DUET_SIGNALLING_SESSION_DOCUMENT_H_
#define DUET_SIGNALLING_SESSION_DOCUMENT_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <absl/status/statusor.h>
#include <absl/time/time.h>
#include <boost/json/object.hpp>

#include "duet/signalling/room_paths.h"

/**
 * @file
 * @brief
 *   The shared record through which two endpoints exchange offer and answer.
 *
 * There is exactly one session document per room. Its offer revision
 * strictly increases across renegotiations, and an answer is only valid if
 * its revision equals the revision of the offer it sits next to.
 */

namespace duet::signalling {

/// SDP payloads up to this size are always embedded in the session document.
inline constexpr size_t kMaxInlineSdpBytes = 32 * 1024;

struct SessionDescription {
  Side type = Side::kOffer;
  /// May be empty when the payload only lives in the side channel.
  std::string sdp;
  int64_t revision = 0;
  absl::Time updated_at = absl::UnixEpoch();
  std::string updated_by;
  /// Path of the side-channel copy, if one was written.
  std::string sdp_ref;

  [[nodiscard]] boost::json::object ToJson() const;
  static absl::StatusOr<SessionDescription> FromJson(
      const boost::json::object& object);

  [[nodiscard]] bool has_inline_sdp() const { return !sdp.empty(); }
};

struct SessionDocument {
  std::optional<SessionDescription> offer;
  std::optional<SessionDescription> answer;
  absl::Time created_at = absl::UnixEpoch();
  std::string created_by;
  /// Uid bound to the answer slot of the current offer, if any.
  std::string answerer;

  [[nodiscard]] boost::json::object ToJson() const;
  static absl::StatusOr<SessionDocument> FromJson(
      const boost::json::object& object);

  /// Revision of the current offer, or 0 if there is none.
  [[nodiscard]] int64_t offer_revision() const {
    return offer ? offer->revision : 0;
  }

  /// True iff an answer exists whose revision equals the offer revision.
  [[nodiscard]] bool HasMatchingAnswer() const;

  /// True if both offer and answer were written by `uid`.
  [[nodiscard]] bool IsSelfAuthored(std::string_view uid) const;

  /// Serialized size of the larger of the stored offer and answer.
  [[nodiscard]] size_t LargestDescriptionBytes() const;
};

/// Builds the session document fields that publish a fresh offer. The
/// answer is cleared; the answer slot stays bound to `answerer`, or is
/// freed if it is empty.
boost::json::object MakeOfferUpdate(const SessionDescription& offer,
                                    std::string_view answerer);

}  // namespace duet::signalling

#endif  // DUET_SIGNALLING_SESSION_DOCUMENT_H_
