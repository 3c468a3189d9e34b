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

#include "duet/call/diagnostics.h"

#include <absl/log/log.h>
#include <absl/strings/match.h>

namespace duet::call {

void DiagnosticLog::Record(absl::Time now, Severity severity,
                           std::string_view source, std::string_view message) {
  switch (severity) {
    case Severity::kInfo:
      LOG(INFO) << "[" << source << "] " << message;
      break;
    case Severity::kWarning:
      LOG(WARNING) << "[" << source << "] " << message;
      break;
    case Severity::kError:
      LOG(ERROR) << "[" << source << "] " << message;
      break;
  }

  if (capacity_ == 0) {
    return;
  }
  if (events_.size() == capacity_) {
    events_.pop_front();
  }
  events_.push_back(DiagnosticEvent{
      .id = next_id_++,
      .timestamp = now,
      .severity = severity,
      .source = std::string(source),
      .message = std::string(message),
  });
}

std::vector<DiagnosticEvent> DiagnosticLog::Events() const {
  return {events_.begin(), events_.end()};
}

size_t DiagnosticLog::Count(std::string_view source,
                            std::string_view needle) const {
  size_t count = 0;
  for (const auto& event : events_) {
    if (event.source == source && absl::StrContains(event.message, needle)) {
      ++count;
    }
  }
  return count;
}

}  // namespace duet::call
