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

#ifndef DUET_STORE_IN_MEMORY_STORE_H_
#define DUET_STORE_IN_MEMORY_STORE_H_

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/base/nullability.h>
#include <absl/base/thread_annotations.h>
#include <absl/status/status.h>
#include <absl/synchronization/mutex.h>

#include "duet/concurrency/event_loop.h"
#include "duet/store/document_store.h"

namespace duet::store {

enum Operation : uint8_t {
  kRead = 1 << 0,
  kWrite = 1 << 1,
  kRemove = 1 << 2,
};

/**
 * A process-local realtime document store.
 *
 * Several clients sharing one instance observe each other's writes through
 * their subscriptions, which makes it a complete signalling channel for
 * endpoints living in one process. Access rules can deny operations under a
 * path prefix, and one-shot failures can be injected, to exercise the
 * degraded paths of its clients.
 *
 * @headerfile duet/store/in_memory_store.h
 */
class InMemoryDocumentStore final : public DocumentStore {
 public:
  explicit InMemoryDocumentStore(EventLoop* absl_nonnull loop);

  // This class is not copyable or movable.
  InMemoryDocumentStore(const InMemoryDocumentStore&) = delete;
  InMemoryDocumentStore& operator=(const InMemoryDocumentStore&) = delete;

  ~InMemoryDocumentStore() override;

  void Get(std::string_view path, GetCallback done) override;
  void Set(std::string_view path, Document data, StatusCallback done) override;
  void Update(std::string_view path, Document fields,
              StatusCallback done) override;
  void Delete(std::string_view path, StatusCallback done) override;
  void List(std::string_view collection, ListCallback done) override;
  void RunTransaction(TransactionBody body, StatusCallback done) override;

  std::unique_ptr<Subscription> Watch(std::string_view path,
                                      DocumentListener listener) override;
  std::unique_ptr<Subscription> WatchCollection(
      std::string_view collection, CollectionListener listener) override;

  /** Denies `operations` (a mask of `Operation`) under `path_prefix`. */
  void DenyAccess(std::string_view path_prefix, uint8_t operations);
  void ClearAccessRules();

  /** Makes the next matching operation under `path_prefix` fail. */
  void FailNext(std::string_view path_prefix, Operation operation,
                absl::Status status);

  /** Synchronous inspection, for tests and tooling. */
  [[nodiscard]] std::optional<Document> Peek(std::string_view path) const;
  [[nodiscard]] std::vector<std::string> Paths(
      std::string_view prefix = "") const;
  [[nodiscard]] size_t write_count() const;

 private:
  struct Watcher;
  class WatcherSubscription;
  class StagedTransaction;

  struct Write {
    std::string path;
    std::optional<Document> data;  // nullopt deletes
  };

  struct AccessRule {
    std::string prefix;
    uint8_t operations;
  };

  struct InjectedFailure {
    std::string prefix;
    Operation operation;
    absl::Status status;
  };

  absl::Status CheckAccess(std::string_view path, Operation operation)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);

  // Applies writes atomically and schedules the resulting notifications.
  void CommitLocked(std::vector<Write> writes)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);

  std::vector<DocumentSnapshot> ListLocked(std::string_view collection) const
      ABSL_SHARED_LOCKS_REQUIRED(mu_);

  void Deliver(absl::AnyInvocable<void()> task);

  EventLoop* absl_nonnull const loop_;

  mutable absl::Mutex mu_;
  std::map<std::string, Document, std::less<>> documents_ ABSL_GUARDED_BY(mu_);
  std::vector<std::shared_ptr<Watcher>> watchers_ ABSL_GUARDED_BY(mu_);
  std::vector<AccessRule> access_rules_ ABSL_GUARDED_BY(mu_);
  std::vector<InjectedFailure> injected_failures_ ABSL_GUARDED_BY(mu_);
  size_t write_count_ ABSL_GUARDED_BY(mu_) = 0;
};

}  // namespace duet::store

#endif  // DUET_STORE_IN_MEMORY_STORE_H_
