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

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/status_matchers.h>
#include <absl/status/statusor.h>
#include <boost/json/object.hpp>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "duet/store/in_memory_store.h"
#include "duet/store/json_util.h"
#include "duet/testing/manual_event_loop.h"

#define EXPECT_OK(expression) EXPECT_THAT(expression, ::absl_testing::IsOk())
#define ASSERT_OK(expression) ASSERT_THAT(expression, ::absl_testing::IsOk())

namespace {

using ::absl_testing::StatusIs;
using ::duet::store::ChangeType;
using ::duet::store::Document;
using ::duet::store::DocumentChange;
using ::duet::store::InMemoryDocumentStore;
using ::duet::testing::ManualEventLoop;
using ::testing::ElementsAre;
using ::testing::Eq;
using ::testing::Pair;

Document Doc(std::string_view key, std::string_view value) {
  Document document;
  document[key] = value;
  return document;
}

class InMemoryStoreTest : public ::testing::Test {
 protected:
  absl::Status SetSync(std::string_view path, Document data) {
    absl::Status result = absl::UnknownError("pending");
    store_.Set(path, std::move(data),
               [&result](absl::Status status) { result = status; });
    loop_.RunUntilIdle();
    return result;
  }

  absl::StatusOr<std::optional<Document>> GetSync(std::string_view path) {
    absl::StatusOr<std::optional<Document>> result =
        absl::UnknownError("pending");
    store_.Get(path, [&result](absl::StatusOr<std::optional<Document>> data) {
      result = std::move(data);
    });
    loop_.RunUntilIdle();
    return result;
  }

  ManualEventLoop loop_;
  InMemoryDocumentStore store_{&loop_};
};

TEST_F(InMemoryStoreTest, CompletionsAreNeverInline) {
  bool done = false;
  store_.Set("calls/a", Doc("k", "v"), [&done](absl::Status) { done = true; });
  EXPECT_FALSE(done);
  loop_.RunUntilIdle();
  EXPECT_TRUE(done);
}

TEST_F(InMemoryStoreTest, SetGetAndDelete) {
  EXPECT_OK(SetSync("calls/a", Doc("k", "v")));
  absl::StatusOr<std::optional<Document>> read = GetSync("calls/a");
  ASSERT_OK(read.status());
  ASSERT_TRUE(read->has_value());
  EXPECT_EQ(duet::store::GetString(**read, "k"), "v");

  absl::Status deleted = absl::UnknownError("pending");
  store_.Delete("calls/a", [&deleted](absl::Status s) { deleted = s; });
  store_.Delete("calls/missing", [](absl::Status s) { EXPECT_OK(s); });
  loop_.RunUntilIdle();
  EXPECT_OK(deleted);
  EXPECT_EQ(store_.Peek("calls/a"), std::nullopt);
}

TEST_F(InMemoryStoreTest, UpdateMergesAndRemovesNullFields) {
  Document initial;
  initial["keep"] = "yes";
  initial["drop"] = "soon";
  EXPECT_OK(SetSync("calls/a", initial));

  Document fields;
  fields["drop"] = nullptr;
  fields["added"] = 7;
  absl::Status updated = absl::UnknownError("pending");
  store_.Update("calls/a", fields, [&updated](absl::Status s) { updated = s; });
  loop_.RunUntilIdle();
  EXPECT_OK(updated);

  const std::optional<Document> stored = store_.Peek("calls/a");
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(duet::store::GetString(*stored, "keep"), "yes");
  EXPECT_FALSE(stored->contains("drop"));
  EXPECT_EQ(duet::store::GetInt64(*stored, "added"), 7);
}

TEST_F(InMemoryStoreTest, UpdateOfMissingDocumentIsNotFound) {
  absl::Status updated;
  store_.Update("calls/none", Doc("k", "v"),
                [&updated](absl::Status s) { updated = s; });
  loop_.RunUntilIdle();
  EXPECT_THAT(updated, StatusIs(absl::StatusCode::kNotFound));
}

TEST_F(InMemoryStoreTest, ListReturnsDirectChildrenInIdOrder) {
  EXPECT_OK(SetSync("calls/r/c/2", Doc("n", "2")));
  EXPECT_OK(SetSync("calls/r/c/1", Doc("n", "1")));
  EXPECT_OK(SetSync("calls/r/c/1/nested/x", Doc("n", "x")));
  EXPECT_OK(SetSync("calls/r/other/1", Doc("n", "o")));

  std::vector<std::string> ids;
  store_.List("calls/r/c",
              [&ids](absl::StatusOr<std::vector<duet::store::DocumentSnapshot>>
                         snapshots) {
                ASSERT_OK(snapshots.status());
                for (const auto& snapshot : *snapshots) {
                  ids.push_back(snapshot.id);
                }
              });
  loop_.RunUntilIdle();
  EXPECT_THAT(ids, ElementsAre("1", "2"));
}

TEST_F(InMemoryStoreTest, TransactionCommitsOnlyWhenBodySucceeds) {
  EXPECT_OK(SetSync("calls/a", Doc("owner", "alice")));

  absl::Status aborted;
  store_.RunTransaction(
      [](duet::store::Transaction& txn) -> absl::Status {
        txn.Set("calls/a", Doc("owner", "bob"));
        return absl::AbortedError("lost the race");
      },
      [&aborted](absl::Status s) { aborted = s; });
  loop_.RunUntilIdle();
  EXPECT_THAT(aborted, StatusIs(absl::StatusCode::kAborted));
  EXPECT_EQ(duet::store::GetString(*store_.Peek("calls/a"), "owner"), "alice");

  absl::Status committed;
  store_.RunTransaction(
      [](duet::store::Transaction& txn) -> absl::Status {
        absl::StatusOr<std::optional<Document>> current = txn.Get("calls/a");
        if (!current.ok()) {
          return current.status();
        }
        txn.Set("calls/b", **current);
        txn.Delete("calls/a");
        return absl::OkStatus();
      },
      [&committed](absl::Status s) { committed = s; });
  loop_.RunUntilIdle();
  EXPECT_OK(committed);
  EXPECT_EQ(store_.Peek("calls/a"), std::nullopt);
  EXPECT_EQ(duet::store::GetString(*store_.Peek("calls/b"), "owner"), "alice");
}

TEST_F(InMemoryStoreTest, WatchDeliversInitialStateAndChanges) {
  std::vector<std::optional<std::string>> seen;
  auto subscription = store_.Watch(
      "calls/a", [&seen](const std::optional<Document>& data) {
        seen.push_back(data ? std::optional<std::string>(
                                  duet::store::GetString(*data, "k"))
                            : std::nullopt);
      });
  loop_.RunUntilIdle();
  EXPECT_OK(SetSync("calls/a", Doc("k", "1")));
  store_.Delete("calls/a", [](absl::Status) {});
  loop_.RunUntilIdle();

  EXPECT_THAT(seen, ElementsAre(std::nullopt, std::optional<std::string>("1"),
                                std::nullopt));

  subscription.reset();
  EXPECT_OK(SetSync("calls/a", Doc("k", "2")));
  EXPECT_EQ(seen.size(), 3u);
}

TEST_F(InMemoryStoreTest, CollectionWatchReportsChangeTypes) {
  EXPECT_OK(SetSync("calls/r/p/alice", Doc("k", "1")));
  std::vector<std::pair<ChangeType, std::string>> seen;
  auto subscription = store_.WatchCollection(
      "calls/r/p", [&seen](const std::vector<DocumentChange>& changes) {
        for (const auto& change : changes) {
          seen.emplace_back(change.type, change.id);
        }
      });
  loop_.RunUntilIdle();
  EXPECT_OK(SetSync("calls/r/p/bob", Doc("k", "1")));
  EXPECT_OK(SetSync("calls/r/p/alice", Doc("k", "2")));
  store_.Delete("calls/r/p/bob", [](absl::Status) {});
  EXPECT_OK(SetSync("calls/r/p/bob/deeper/x", Doc("k", "1")));

  EXPECT_THAT(seen, ElementsAre(Pair(ChangeType::kAdded, "alice"),
                                Pair(ChangeType::kAdded, "bob"),
                                Pair(ChangeType::kModified, "alice"),
                                Pair(ChangeType::kRemoved, "bob")));
}

TEST_F(InMemoryStoreTest, AccessRulesDenyByPrefix) {
  store_.DenyAccess("calls/r/descriptions", duet::store::kWrite);
  EXPECT_THAT(SetSync("calls/r/descriptions/offer-1", Doc("sdp", "x")),
              StatusIs(absl::StatusCode::kPermissionDenied));
  EXPECT_OK(SetSync("calls/r", Doc("k", "v")));
  EXPECT_OK(GetSync("calls/r/descriptions/offer-1").status());

  store_.ClearAccessRules();
  EXPECT_OK(SetSync("calls/r/descriptions/offer-1", Doc("sdp", "x")));
}

TEST_F(InMemoryStoreTest, TransactionReadsRespectAccessRules) {
  EXPECT_OK(SetSync("calls/r/participants/bob", Doc("status", "active")));
  store_.DenyAccess("calls/r/participants", duet::store::kRead);

  absl::Status result;
  store_.RunTransaction(
      [](duet::store::Transaction& txn) -> absl::Status {
        absl::StatusOr<std::optional<Document>> holder =
            txn.Get("calls/r/participants/bob");
        if (!holder.ok()) {
          return holder.status();
        }
        txn.Set("calls/r", Doc("answerer", "carol"));
        return absl::OkStatus();
      },
      [&result](absl::Status s) { result = s; });
  loop_.RunUntilIdle();

  EXPECT_THAT(result, StatusIs(absl::StatusCode::kPermissionDenied));
  EXPECT_EQ(store_.Peek("calls/r"), std::nullopt);
}

TEST_F(InMemoryStoreTest, InjectedFailureAppliesOnce) {
  store_.FailNext("calls/", duet::store::kWrite,
                  absl::UnavailableError("flaky"));
  EXPECT_THAT(SetSync("calls/a", Doc("k", "v")),
              StatusIs(absl::StatusCode::kUnavailable));
  EXPECT_OK(SetSync("calls/a", Doc("k", "v")));
  EXPECT_THAT(store_.Paths("calls/"), ElementsAre("calls/a"));
  EXPECT_THAT(store_.write_count(), Eq(1u));
}

}  // namespace
