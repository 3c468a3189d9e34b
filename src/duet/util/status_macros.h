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

#ifndef DUET_UTIL_STATUS_MACROS_H_
#define DUET_UTIL_STATUS_MACROS_H_

#include <utility>

#include <absl/base/optimization.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>

#define DUET_STATUS_MACROS_CONCAT_INNER_(x, y) x##y
#define DUET_STATUS_MACROS_CONCAT_(x, y) DUET_STATUS_MACROS_CONCAT_INNER_(x, y)

// Evaluates an expression producing an absl::Status and returns it from the
// enclosing function if it is not OK.
#define RETURN_IF_ERROR(expr)                                   \
  do {                                                          \
    if (absl::Status _duet_status = (expr);                     \
        ABSL_PREDICT_FALSE(!_duet_status.ok())) {               \
      return _duet_status;                                      \
    }                                                           \
  } while (false)

// Evaluates an expression producing an absl::StatusOr<T>. On error, returns
// the status from the enclosing function; otherwise moves the value into lhs.
#define ASSIGN_OR_RETURN(lhs, rexpr)                                       \
  DUET_ASSIGN_OR_RETURN_IMPL_(                                             \
      DUET_STATUS_MACROS_CONCAT_(_duet_statusor_, __LINE__), lhs, rexpr)

#define DUET_ASSIGN_OR_RETURN_IMPL_(statusor, lhs, rexpr) \
  auto statusor = (rexpr);                                \
  if (ABSL_PREDICT_FALSE(!statusor.ok())) {               \
    return std::move(statusor).status();                  \
  }                                                       \
  lhs = *std::move(statusor)

#endif  // DUET_UTIL_STATUS_MACROS_H_
