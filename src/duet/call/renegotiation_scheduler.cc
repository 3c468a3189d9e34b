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

#include "duet/call/renegotiation_scheduler.h"

#include <algorithm>
#include <utility>

#include <absl/status/status.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "duet/call/call_session.h"

namespace duet::call {

namespace {
constexpr std::string_view kSource = "scheduler";
}  // namespace

RenegotiationScheduler::RenegotiationScheduler(CallSession* session)
    : session_(session), timer_(session->loop_) {}

void RenegotiationScheduler::Request(std::string_view reason,
                                     TriggerOptions options) {
  if (std::find(reasons_.begin(), reasons_.end(), reason) == reasons_.end()) {
    reasons_.emplace_back(reason);
  }
  require_offerer_ |= options.require_offerer;
  replace_transport_ |= options.replace_transport;
  ice_restart_ |= options.ice_restart;
  session_->Log(Severity::kInfo, kSource,
                absl::StrCat("Renegotiation requested: ", reason));
  timer_.Arm(session_->config_.renegotiation_debounce,
             session_->Bind([this]() { Fire(); }));
}

void RenegotiationScheduler::OnSignalingStable() { RetryIfAwaiting(); }

void RenegotiationScheduler::OnNegotiationFinished() { RetryIfAwaiting(); }

void RenegotiationScheduler::OnPresenceRecord(
    const presence::PresenceRecord& record) {
  if (record.uid == session_->uid_ || !record.renegotiation_request) {
    return;
  }
  std::string& seen = seen_requests_[record.uid];
  if (seen == record.renegotiation_request->id) {
    return;
  }
  seen = record.renegotiation_request->id;
  if (session_->state_.role != Role::kOfferer) {
    return;
  }
  TriggerOptions options;
  options.ice_restart = record.renegotiation_request->ice_restart;
  Request(absl::StrCat("remote-request:", record.renegotiation_request->reason),
          options);
}

void RenegotiationScheduler::Cancel() {
  timer_.Cancel();
  reasons_.clear();
  require_offerer_ = false;
  replace_transport_ = false;
  ice_restart_ = false;
  awaiting_stable_ = false;
}

void RenegotiationScheduler::RetryIfAwaiting() {
  if (!awaiting_stable_) {
    return;
  }
  awaiting_stable_ = false;
  if (!reasons_.empty() && !timer_.armed()) {
    Fire();
  }
}

RenegotiationBatch RenegotiationScheduler::TakeBatch() {
  RenegotiationBatch batch;
  batch.reasons = std::move(reasons_);
  batch.replace_transport = replace_transport_;
  batch.ice_restart = ice_restart_;
  reasons_.clear();
  require_offerer_ = false;
  replace_transport_ = false;
  ice_restart_ = false;
  return batch;
}

void RenegotiationScheduler::Fire() {
  if (reasons_.empty()) {
    return;
  }
  CallSession& session = *session_;
  const NegotiationState& state = session.state_;

  if (session.phase_ != CallPhase::kJoined || state.role == Role::kNone) {
    awaiting_stable_ = true;
    return;
  }
  if (state.role == Role::kObserver) {
    session.Log(Severity::kInfo, kSource,
                absl::StrCat("Observer drops renegotiation: ",
                             absl::StrJoin(reasons_, ", ")));
    Cancel();
    return;
  }
  net::MediaTransport* transport = session.transport_.get();
  if (state.negotiating || transport == nullptr ||
      transport->signaling_state() != net::SignalingState::kStable) {
    session.Log(Severity::kInfo, kSource,
                "Negotiation in flight; deferring until stable.");
    awaiting_stable_ = true;
    return;
  }

  const bool require_offerer = require_offerer_;
  RenegotiationBatch batch = TakeBatch();
  const bool ice_restart = batch.ice_restart;
  const std::string reasons = absl::StrJoin(batch.reasons, ",");

  if (state.role == Role::kOfferer) {
    session.arbitrator_.PublishOffer(std::move(batch));
    return;
  }
  if (!require_offerer) {
    session.Log(Severity::kInfo, kSource,
                absl::StrCat("Answerer drops renegotiation: ", reasons));
    return;
  }
  if (!session.HasActiveRemoteOfferer()) {
    session.arbitrator_.Promote(reasons);
    return;
  }
  session.presence_.RequestRenegotiation(
      reasons, ice_restart, session.Bind([this](absl::Status status) {
        if (!status.ok()) {
          session_->Log(Severity::kWarning, kSource,
                        absl::StrCat("Could not ask the offerer to "
                                     "renegotiate: ",
                                     status.ToString()));
        }
      }));
}

}  // namespace duet::call
