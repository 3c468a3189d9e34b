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

#include "duet/store/json_util.h"

#include <absl/status/status.h>
#include <absl/strings/str_cat.h>
#include <boost/json/serialize.hpp>

namespace duet::store {

std::string GetString(const boost::json::object& object, std::string_view key,
                      std::string_view fallback) {
  const boost::json::value* value = object.if_contains(key);
  if (value == nullptr || !value->is_string()) {
    return std::string(fallback);
  }
  return std::string(value->get_string());
}

int64_t GetInt64(const boost::json::object& object, std::string_view key,
                 int64_t fallback) {
  const boost::json::value* value = object.if_contains(key);
  if (value == nullptr) {
    return fallback;
  }
  if (value->is_int64()) {
    return value->get_int64();
  }
  if (value->is_uint64()) {
    return static_cast<int64_t>(value->get_uint64());
  }
  if (value->is_double()) {
    return static_cast<int64_t>(value->get_double());
  }
  return fallback;
}

bool GetBool(const boost::json::object& object, std::string_view key,
             bool fallback) {
  const boost::json::value* value = object.if_contains(key);
  if (value == nullptr || !value->is_bool()) {
    return fallback;
  }
  return value->get_bool();
}

absl::Time GetTime(const boost::json::object& object, std::string_view key,
                   absl::Time fallback) {
  const boost::json::value* value = object.if_contains(key);
  if (value == nullptr || !(value->is_int64() || value->is_uint64())) {
    return fallback;
  }
  return absl::FromUnixMillis(GetInt64(object, key));
}

const boost::json::object* GetObject(const boost::json::object& object,
                                     std::string_view key) {
  const boost::json::value* value = object.if_contains(key);
  if (value == nullptr || !value->is_object()) {
    return nullptr;
  }
  return &value->get_object();
}

absl::StatusOr<std::string> RequireString(const boost::json::object& object,
                                          std::string_view key) {
  std::string value = GetString(object, key);
  if (value.empty()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Missing required field '", key,
                     "' in document: ", boost::json::serialize(object)));
  }
  return value;
}

boost::json::value TimeToJson(absl::Time time) {
  return boost::json::value(absl::ToUnixMillis(time));
}

size_t SerializedSize(const boost::json::value& value) {
  return boost::json::serialize(value).size();
}

}  // namespace duet::store
