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

#ifndef DUET_TESTING_FAKE_MEDIA_SOURCE_H_
#define DUET_TESTING_FAKE_MEDIA_SOURCE_H_

#include <absl/container/flat_hash_map.h>
#include <absl/container/flat_hash_set.h>
#include <absl/status/status.h>
#include <absl/strings/str_cat.h>

#include "duet/call/media_source.h"
#include "duet/net/media_transport.h"

namespace duet::testing {

/// A media source whose devices can be denied per kind.
class FakeMediaSource final : public call::MediaSource {
 public:
  absl::Status Acquire(net::MediaKind kind) override {
    if (denied_.contains(kind)) {
      return absl::PermissionDeniedError(absl::StrCat(
          "Access to the ", net::MediaKindName(kind), " device was denied."));
    }
    ++acquired_[kind];
    return absl::OkStatus();
  }

  void Release(net::MediaKind kind) override { --acquired_[kind]; }

  void Deny(net::MediaKind kind) { denied_.insert(kind); }
  void Allow(net::MediaKind kind) { denied_.erase(kind); }

  /// Number of unreleased acquisitions of `kind`.
  [[nodiscard]] int held(net::MediaKind kind) const {
    const auto it = acquired_.find(kind);
    return it == acquired_.end() ? 0 : it->second;
  }

 private:
  absl::flat_hash_set<net::MediaKind> denied_;
  absl::flat_hash_map<net::MediaKind, int> acquired_;
};

}  // namespace duet::testing

#endif  // DUET_TESTING_FAKE_MEDIA_SOURCE_H_
