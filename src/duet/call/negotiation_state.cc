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

#include "duet/call/negotiation_state.h"

namespace duet::call {

std::string_view RoleName(Role role) {
  switch (role) {
    case Role::kNone:
      return "none";
    case Role::kOfferer:
      return "offerer";
    case Role::kAnswerer:
      return "answerer";
    case Role::kObserver:
      return "observer";
  }
  return "unknown";
}

std::string_view AnswerStateName(AnswerState state) {
  switch (state) {
    case AnswerState::kIdle:
      return "idle";
    case AnswerState::kAttemptingAnswer:
      return "attempting-answer";
    case AnswerState::kAwaitingRevision:
      return "awaiting-revision";
    case AnswerState::kFailed:
      return "failed";
  }
  return "unknown";
}

}  // namespace duet::call
