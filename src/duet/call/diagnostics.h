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

#ifndef DUET_CALL_DIAGNOSTICS_H_
#define DUET_CALL_DIAGNOSTICS_H_

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <vector>

#include <absl/time/time.h>

namespace duet::call {

enum class Severity { kInfo, kWarning, kError };

struct DiagnosticEvent {
  uint64_t id = 0;
  absl::Time timestamp;
  Severity severity = Severity::kInfo;
  /// Subsystem that recorded the event, e.g. "arbitrator".
  std::string source;
  std::string message;
};

/**
 * Bounded in-memory record of the recoverable failures and decisions of a
 * call. Every entry is mirrored to the process log.
 *
 * @headerfile duet/call/diagnostics.h
 */
class DiagnosticLog {
 public:
  explicit DiagnosticLog(size_t capacity = 200) : capacity_(capacity) {}

  void Record(absl::Time now, Severity severity, std::string_view source,
              std::string_view message);

  [[nodiscard]] std::vector<DiagnosticEvent> Events() const;

  /// Events from `source` whose message contains `needle`.
  [[nodiscard]] size_t Count(std::string_view source,
                             std::string_view needle = "") const;

  [[nodiscard]] size_t size() const { return events_.size(); }

  void Clear() { events_.clear(); }

 private:
  const size_t capacity_;
  std::deque<DiagnosticEvent> events_;
  uint64_t next_id_ = 1;
};

}  // namespace duet::call

#endif  // DUET_CALL_DIAGNOSTICS_H_
