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

#ifndef DUET_STORE_JSON_UTIL_H_
#define DUET_STORE_JSON_UTIL_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <absl/status/statusor.h>
#include <absl/time/time.h>
#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

namespace duet::store {

// Field accessors for loosely typed documents. Missing or mistyped fields
// yield the fallback rather than an error: documents written by other
// clients may predate a field.

std::string GetString(const boost::json::object& object, std::string_view key,
                      std::string_view fallback = "");

int64_t GetInt64(const boost::json::object& object, std::string_view key,
                 int64_t fallback = 0);

bool GetBool(const boost::json::object& object, std::string_view key,
             bool fallback = false);

/** Reads a millisecond Unix timestamp. */
absl::Time GetTime(const boost::json::object& object, std::string_view key,
                   absl::Time fallback = absl::UnixEpoch());

const boost::json::object* GetObject(const boost::json::object& object,
                                     std::string_view key);

/** Checks that a required string field is present and non-empty. */
absl::StatusOr<std::string> RequireString(const boost::json::object& object,
                                          std::string_view key);

boost::json::value TimeToJson(absl::Time time);

/** Size of the compact serialized form, used for storage limits. */
size_t SerializedSize(const boost::json::value& value);

}  // namespace duet::store

#endif  // DUET_STORE_JSON_UTIL_H_
