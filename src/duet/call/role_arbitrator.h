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

#ifndef DUET_CALL_ROLE_ARBITRATOR_H_
#define DUET_CALL_ROLE_ARBITRATOR_H_

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <absl/base/nullability.h>
#include <absl/functional/any_invocable.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "duet/call/renegotiation_scheduler.h"
#include "duet/net/media_transport.h"
#include "duet/signalling/session_document.h"

namespace duet::call {

class CallSession;

/**
 * Decides whether this endpoint offers or answers, and runs the
 * offer/answer exchange through the session document.
 *
 * Offers are published with a transactional write that yields to any
 * offer of equal or higher revision from another endpoint, in which case
 * this endpoint answers that offer instead. Answers are published with a
 * write guarded on the offer revision they answer; rejected answers are
 * retried against the current offer a bounded number of times, after which
 * the endpoint promotes itself to offerer.
 *
 * @headerfile duet/call/role_arbitrator.h
 */
class RoleArbitrator {
 public:
  explicit RoleArbitrator(CallSession* absl_nonnull session);

  // This class is not copyable or movable.
  RoleArbitrator(const RoleArbitrator&) = delete;
  RoleArbitrator& operator=(const RoleArbitrator&) = delete;

  /// Reads the session document and takes a role.
  void Start();

  /// Handles a change of the session document. `nullopt` means deleted.
  void OnSessionDocument(std::optional<signalling::SessionDocument> document);

  void OnParticipantLeft(const std::string& uid);

  /// Creates and publishes a new offer revision.
  void PublishOffer(RenegotiationBatch batch);

  /// Becomes offerer on a fresh transport, superseding the current offer.
  void Promote(std::string_view reason);

 private:
  using SdpCallback = absl::AnyInvocable<void(absl::StatusOr<std::string>)>;
  using PreparedCallback =
      absl::AnyInvocable<void(signalling::SessionDescription)>;

  void Arbitrate(std::optional<signalling::SessionDocument> document);

  void CommitOffer(signalling::SessionDescription offer);
  void OnOfferCommitted(int64_t revision, absl::Status status);

  void AttemptAnswer(signalling::SessionDocument document);
  void CommitAnswer(signalling::SessionDescription answer);
  void FailAnswerAttempt(const absl::Status& status);
  void AwaitRevision();

  void ApplyAnswer(const signalling::SessionDocument& document);

  void EnterObserverMode(std::string_view reason);

  // Fetches the side-channel copy of a description, falling back to the
  // inline copy.
  void ResolveSdp(const signalling::SessionDescription& description,
                  SdpCallback done);

  // Writes the side-channel copy if enabled and builds the description to
  // embed in the session document.
  void PrepareDescription(signalling::Side side, int64_t revision,
                          std::string sdp, PreparedCallback done);

  void DisableSideChannel(const absl::Status& cause);

  void ShowConnecting();
  void FinishNegotiation();
  void AbortNegotiation(std::string_view step, const absl::Status& status);

  CallSession* absl_nonnull const session_;
  int publish_failures_ = 0;
};

}  // namespace duet::call

#endif  // DUET_CALL_ROLE_ARBITRATOR_H_
