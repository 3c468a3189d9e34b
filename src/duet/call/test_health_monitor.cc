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

#include <absl/time/time.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "duet/call/health_monitor.h"
#include "duet/net/media_transport.h"

namespace {

using ::duet::call::ClassifyQuality;
using ::duet::call::ConnectionQuality;
using ::duet::call::ReconnectBackoff;
using ::duet::net::TransportStats;

TEST(ReconnectBackoffTest, GrowsByHalfAndCaps) {
  ReconnectBackoff backoff(absl::Seconds(2), 8.0);
  EXPECT_EQ(backoff.NextDelay(), absl::Seconds(2));
  backoff.RecordAttempt();
  EXPECT_EQ(backoff.NextDelay(), absl::Seconds(3));
  backoff.RecordAttempt();
  EXPECT_EQ(backoff.NextDelay(), absl::Milliseconds(4500));
  for (int i = 0; i < 10; ++i) {
    backoff.RecordAttempt();
  }
  EXPECT_EQ(backoff.NextDelay(), absl::Seconds(16));

  backoff.Reset();
  EXPECT_EQ(backoff.attempt(), 0);
  EXPECT_EQ(backoff.NextDelay(), absl::Seconds(2));
}

TEST(ClassifyQualityTest, UnknownWithoutMetrics) {
  TransportStats stats;
  stats.has_succeeded_pair = true;
  EXPECT_EQ(ClassifyQuality(stats), ConnectionQuality::kUnknown);
}

TEST(ClassifyQualityTest, ExcellentOnCleanLink) {
  TransportStats stats;
  stats.packet_loss = 0.01;
  stats.round_trip_time = absl::Milliseconds(40);
  stats.jitter = absl::Milliseconds(5);
  EXPECT_EQ(ClassifyQuality(stats), ConnectionQuality::kExcellent);
}

TEST(ClassifyQualityTest, AnySingleMetricDegradesTheLink) {
  TransportStats lossy;
  lossy.packet_loss = 0.05;
  EXPECT_EQ(ClassifyQuality(lossy), ConnectionQuality::kGood);
  lossy.packet_loss = 0.2;
  EXPECT_EQ(ClassifyQuality(lossy), ConnectionQuality::kPoor);

  TransportStats slow;
  slow.round_trip_time = absl::Milliseconds(200);
  EXPECT_EQ(ClassifyQuality(slow), ConnectionQuality::kGood);
  slow.round_trip_time = absl::Milliseconds(400);
  EXPECT_EQ(ClassifyQuality(slow), ConnectionQuality::kPoor);

  TransportStats jittery;
  jittery.jitter = absl::Milliseconds(30);
  EXPECT_EQ(ClassifyQuality(jittery), ConnectionQuality::kGood);
  jittery.jitter = absl::Milliseconds(80);
  EXPECT_EQ(ClassifyQuality(jittery), ConnectionQuality::kPoor);
}

}  // namespace
