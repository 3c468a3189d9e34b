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

#include "duet/call/candidate_trickle.h"

#include <string_view>
#include <utility>

#include <absl/status/status.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>

#include "duet/call/call_session.h"

namespace duet::call {

namespace {
constexpr std::string_view kSource = "trickle";
}  // namespace

CandidateTrickle::CandidateTrickle(CallSession* session)
    : session_(session), flush_timer_(session->loop_) {}

void CandidateTrickle::BeginLocal(int64_t revision, signalling::Side side) {
  local_revision_ = revision;
  local_side_ = side;
}

void CandidateTrickle::BindRemote(int64_t revision, signalling::Side side,
                                  std::string author) {
  remote_subscription_.reset();
  queue_.clear();
  queued_keys_.clear();
  flush_timer_.Cancel();
  flushing_ = false;
  remote_ready_ = false;
  if (revision != remote_revision_) {
    applied_keys_.clear();
  }
  remote_revision_ = revision;
  remote_author_ = std::move(author);

  remote_subscription_ = session_->ledger_.Watch(
      revision, side,
      session_->BindRepeating([this](const signalling::CandidateRecord& record) {
        OnRemoteCandidate(record);
      }));
}

void CandidateTrickle::OnLocalCandidate(const net::IceCandidate& candidate) {
  if (local_revision_ == 0) {
    ++dropped_local_;
    session_->Log(Severity::kInfo, kSource,
                  "Dropping a local candidate gathered outside any revision.");
    return;
  }
  signalling::CandidateRecord record;
  record.candidate = candidate.candidate;
  record.sdp_mid = candidate.sdp_mid;
  record.sdp_mline_index = candidate.sdp_mline_index;
  record.revision = local_revision_;

  session_->ledger_.Append(
      local_side_, std::move(record), session_->loop_->Now(),
      session_->Bind([this, revision = local_revision_](absl::Status status) {
        if (!status.ok()) {
          session_->Log(
              Severity::kWarning, kSource,
              absl::StrFormat("Could not publish a candidate of revision %d: %s",
                              revision, status.ToString()));
        }
      }));
}

void CandidateTrickle::OnRemoteCandidate(
    const signalling::CandidateRecord& record) {
  if (record.revision != remote_revision_ ||
      record.revision != session_->state_.active_revision) {
    ++dropped_stale_;
    session_->Log(
        Severity::kInfo, kSource,
        absl::StrFormat("Dropping a candidate of revision %d; active is %d.",
                        record.revision, session_->state_.active_revision));
    return;
  }
  if (!remote_author_.empty() && record.author != remote_author_) {
    ++dropped_stale_;
    session_->Log(Severity::kInfo, kSource,
                  absl::StrCat("Dropping a candidate written by ",
                               record.author, " instead of ", remote_author_,
                               "."));
    return;
  }
  std::string key = record.DedupKey();
  if (applied_keys_.contains(key) || queued_keys_.contains(key)) {
    ++duplicates_;
    return;
  }

  net::MediaTransport* transport = session_->transport_.get();
  if (!remote_ready_ || flushing_ || !queue_.empty() || transport == nullptr ||
      !transport->has_remote_description()) {
    queued_keys_.insert(std::move(key));
    Enqueue(Pending{record});
    return;
  }
  Apply(Pending{record});
}

void CandidateTrickle::OnRemoteDescriptionSet() {
  remote_ready_ = true;
  if (flushing_ || queue_.empty()) {
    return;
  }
  session_->Log(Severity::kInfo, kSource,
                absl::StrFormat("Flushing %d queued candidates of revision %d.",
                                queue_.size(), remote_revision_));
  flushing_ = true;
  FlushNext();
}

void CandidateTrickle::Reset() {
  remote_subscription_.reset();
  queue_.clear();
  queued_keys_.clear();
  applied_keys_.clear();
  flush_timer_.Cancel();
  flushing_ = false;
  remote_ready_ = false;
  local_revision_ = 0;
  remote_revision_ = 0;
  remote_author_.clear();
}

void CandidateTrickle::Enqueue(Pending pending) {
  queue_.push_back(std::move(pending));
}

void CandidateTrickle::FlushNext() {
  if (queue_.empty() || !remote_ready_ || session_->transport_ == nullptr) {
    flushing_ = false;
    return;
  }
  Pending next = std::move(queue_.front());
  queue_.pop_front();
  queued_keys_.erase(next.record.DedupKey());
  Apply(std::move(next));

  if (queue_.empty()) {
    flushing_ = false;
    return;
  }
  flush_timer_.Arm(session_->config_.candidate_flush_spacing,
                   session_->Bind([this]() { FlushNext(); }));
}

void CandidateTrickle::Apply(Pending pending) {
  applied_keys_.insert(pending.record.DedupKey());
  net::IceCandidate candidate;
  candidate.candidate = pending.record.candidate;
  candidate.sdp_mid = pending.record.sdp_mid;
  candidate.sdp_mline_index = pending.record.sdp_mline_index;

  session_->transport_->AddRemoteCandidate(
      std::move(candidate),
      session_->BindToEpoch([this, pending = std::move(pending)](
                                absl::Status status) mutable {
        if (pending.record.revision != remote_revision_) {
          return;
        }
        if (status.ok()) {
          ++applied_;
          return;
        }
        if (!pending.retried) {
          pending.retried = true;
          session_->Log(Severity::kInfo, kSource,
                        absl::StrCat("Re-queueing a candidate after a failure: ",
                                     status.ToString()));
          Enqueue(std::move(pending));
          if (!flushing_) {
            flushing_ = true;
            flush_timer_.Arm(session_->config_.candidate_flush_spacing,
                             session_->Bind([this]() { FlushNext(); }));
          }
          return;
        }
        session_->Log(Severity::kWarning, kSource,
                      absl::StrCat("Dropping a candidate that failed twice: ",
                                   status.ToString()));
      }));
}

}  // namespace duet::call
