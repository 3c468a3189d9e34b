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

#ifndef DUET_CALL_NEGOTIATION_STATE_H_
#define DUET_CALL_NEGOTIATION_STATE_H_

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <absl/container/flat_hash_set.h>

#include "duet/signalling/session_document.h"

namespace duet::call {

enum class Role {
  kNone,
  kOfferer,
  kAnswerer,
  /// Joined a room whose answer slot belongs to someone else.
  kObserver,
};

std::string_view RoleName(Role role);

/// Progress of the answerer through one offer.
enum class AnswerState {
  kIdle,
  kAttemptingAnswer,
  /// The guarded write was rejected; waiting for the current offer.
  kAwaitingRevision,
  /// Attempts exhausted; the endpoint promotes itself to offerer.
  kFailed,
};

std::string_view AnswerStateName(AnswerState state);

/// The local projection of a room's negotiation. Never persisted.
struct NegotiationState {
  Role role = Role::kNone;

  /// Revision all local and remote candidates are scoped to.
  int64_t active_revision = 0;
  int64_t last_offer_revision = 0;
  int64_t last_answer_revision = 0;
  /// Highest offer revision ever observed in this room. Survives
  /// reconnects so that revisions keep increasing after a hard reset.
  int64_t highest_seen_revision = 0;

  /// Uid of the endpoint on the other side of the active revision.
  std::string remote_uid;

  /// Held from offer or answer creation until publication completes.
  bool negotiating = false;
  bool needs_promotion = false;

  AnswerState answer_state = AnswerState::kIdle;
  int answer_attempts = 0;

  /// Identity (`author@updatedAt`) of the answer applied to the active
  /// revision, if any.
  std::string applied_answer;

  /// Revisions whose artifacts this client may have written.
  absl::flat_hash_set<int64_t> touched_revisions;

  /// Session document update that arrived while negotiating.
  std::optional<std::optional<signalling::SessionDocument>> deferred_document;

  /// Clears everything tied to a connection; keeps revision history.
  void ResetForRejoin() {
    role = Role::kNone;
    active_revision = 0;
    last_answer_revision = 0;
    remote_uid.clear();
    negotiating = false;
    needs_promotion = false;
    answer_state = AnswerState::kIdle;
    answer_attempts = 0;
    applied_answer.clear();
    deferred_document.reset();
  }
};

}  // namespace duet::call

#endif  // DUET_CALL_NEGOTIATION_STATE_H_
