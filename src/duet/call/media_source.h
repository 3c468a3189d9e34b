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

#ifndef DUET_CALL_MEDIA_SOURCE_H_
#define DUET_CALL_MEDIA_SOURCE_H_

#include <absl/status/status.h>

#include "duet/net/media_transport.h"

namespace duet::call {

/**
 * Local capture devices. Acquisition failures are surfaced to the user and
 * roll back the intent that requested the device.
 *
 * @headerfile duet/call/media_source.h
 */
class MediaSource {
 public:
  virtual ~MediaSource() = default;

  virtual absl::Status Acquire(net::MediaKind kind) = 0;
  virtual void Release(net::MediaKind kind) = 0;
};

}  // namespace duet::call

#endif  // DUET_CALL_MEDIA_SOURCE_H_
