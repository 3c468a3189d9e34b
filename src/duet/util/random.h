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

#ifndef DUET_UTIL_RANDOM_H_
#define DUET_UTIL_RANDOM_H_

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include <absl/random/random.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>

namespace duet {

/// @private
inline std::string GenerateUUID4() {
  absl::BitGen gen;

  std::array<uint8_t, 16> bytes{};
  for (auto& byte : bytes) {
    byte = static_cast<uint8_t>(absl::Uniform<int>(gen, 0, 256));
  }

  // Version 4, variant 10xx.
  bytes[6] = (bytes[6] & 0x0f) | 0x40;
  bytes[8] = (bytes[8] & 0x3f) | 0x80;

  std::string uuid;
  uuid.reserve(36);
  for (size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      uuid.push_back('-');
    }
    absl::StrAppendFormat(&uuid, "%02x", bytes[i]);
  }
  return uuid;
}

/// Returns a short random identifier with the given prefix, e.g. `req-3f9a1c`.
inline std::string GenerateShortId(std::string_view prefix) {
  absl::BitGen gen;
  return absl::StrFormat("%s-%06x", prefix,
                         absl::Uniform<uint32_t>(gen, 0, 1u << 24));
}

}  // namespace duet

#endif  // DUET_UTIL_RANDOM_H_
