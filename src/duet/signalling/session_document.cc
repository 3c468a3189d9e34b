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

#include "duet/signalling/session_document.h"

#include <algorithm>
#include <utility>

#include <absl/status/status.h>
#include <absl/strings/str_cat.h>
#include <boost/json/value.hpp>

#include "duet/store/json_util.h"
#include "duet/util/status_macros.h"

namespace duet::signalling {

boost::json::object SessionDescription::ToJson() const {
  boost::json::object object;
  object["type"] = SideName(type);
  object["sdp"] = sdp;
  object["revision"] = revision;
  object["updatedAt"] = store::TimeToJson(updated_at);
  object["updatedBy"] = updated_by;
  if (!sdp_ref.empty()) {
    object["sdpRef"] = sdp_ref;
  }
  return object;
}

absl::StatusOr<SessionDescription> SessionDescription::FromJson(
    const boost::json::object& object) {
  SessionDescription description;
  ASSIGN_OR_RETURN(const std::string type, store::RequireString(object, "type"));
  if (type == "offer") {
    description.type = Side::kOffer;
  } else if (type == "answer") {
    description.type = Side::kAnswer;
  } else {
    return absl::InvalidArgumentError(
        absl::StrCat("Unknown session description type: ", type));
  }
  description.sdp = store::GetString(object, "sdp");
  description.sdp_ref = store::GetString(object, "sdpRef");
  if (description.sdp.empty() && description.sdp_ref.empty()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Session ", type, " carries neither sdp nor sdpRef"));
  }
  description.revision = store::GetInt64(object, "revision");
  if (description.revision <= 0) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Session ", type, " has invalid revision ", description.revision));
  }
  description.updated_at = store::GetTime(object, "updatedAt");
  description.updated_by = store::GetString(object, "updatedBy");
  return description;
}

boost::json::object SessionDocument::ToJson() const {
  boost::json::object object;
  if (offer) {
    object["offer"] = offer->ToJson();
  }
  if (answer) {
    object["answer"] = answer->ToJson();
  }
  object["createdAt"] = store::TimeToJson(created_at);
  object["createdBy"] = created_by;
  if (!answerer.empty()) {
    object["answerer"] = answerer;
  }
  return object;
}

absl::StatusOr<SessionDocument> SessionDocument::FromJson(
    const boost::json::object& object) {
  SessionDocument document;
  if (const boost::json::object* offer = store::GetObject(object, "offer")) {
    ASSIGN_OR_RETURN(document.offer, SessionDescription::FromJson(*offer));
  }
  if (const boost::json::object* answer = store::GetObject(object, "answer")) {
    ASSIGN_OR_RETURN(document.answer, SessionDescription::FromJson(*answer));
  }
  document.created_at = store::GetTime(object, "createdAt");
  document.created_by = store::GetString(object, "createdBy");
  document.answerer = store::GetString(object, "answerer");
  return document;
}

bool SessionDocument::HasMatchingAnswer() const {
  return offer.has_value() && answer.has_value() &&
         answer->revision == offer->revision;
}

bool SessionDocument::IsSelfAuthored(std::string_view uid) const {
  return offer.has_value() && answer.has_value() &&
         offer->updated_by == uid && answer->updated_by == uid;
}

size_t SessionDocument::LargestDescriptionBytes() const {
  size_t largest = 0;
  if (offer) {
    largest = std::max(largest, store::SerializedSize(offer->ToJson()));
  }
  if (answer) {
    largest = std::max(largest, store::SerializedSize(answer->ToJson()));
  }
  return largest;
}

boost::json::object MakeOfferUpdate(const SessionDescription& offer,
                                    std::string_view answerer) {
  boost::json::object update;
  update["offer"] = offer.ToJson();
  update["answer"] = nullptr;
  if (answerer.empty()) {
    update["answerer"] = nullptr;
  } else {
    update["answerer"] = answerer;
  }
  return update;
}

}  // namespace duet::signalling
