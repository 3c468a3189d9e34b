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

#include "duet/store/in_memory_store.h"

#include <atomic>
#include <utility>

#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>

#include "duet/util/status_macros.h"

namespace duet::store {

struct InMemoryDocumentStore::Watcher {
  bool is_collection = false;
  std::string path;
  DocumentListener on_document;
  CollectionListener on_collection;
  std::atomic<bool> active{true};
};

class InMemoryDocumentStore::WatcherSubscription final : public Subscription {
 public:
  explicit WatcherSubscription(std::shared_ptr<Watcher> watcher)
      : watcher_(std::move(watcher)) {}

  ~WatcherSubscription() override { watcher_->active = false; }

 private:
  std::shared_ptr<Watcher> watcher_;
};

class InMemoryDocumentStore::StagedTransaction final : public Transaction {
 public:
  explicit StagedTransaction(InMemoryDocumentStore* absl_nonnull store)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(store->mu_)
      : store_(store) {}

  absl::StatusOr<std::optional<Document>> Get(std::string_view path) override
      ABSL_NO_THREAD_SAFETY_ANALYSIS {
    RETURN_IF_ERROR(store_->CheckAccess(path, kRead));
    if (const std::optional<Document>* staged = FindStaged(path)) {
      return *staged;
    }
    const auto it = store_->documents_.find(path);
    if (it == store_->documents_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  void Set(std::string_view path, Document data) override
      ABSL_NO_THREAD_SAFETY_ANALYSIS {
    Record(path, kWrite);
    writes_.push_back(Write{std::string(path), std::move(data)});
  }

  void Update(std::string_view path, Document fields) override
      ABSL_NO_THREAD_SAFETY_ANALYSIS {
    Record(path, kWrite);
    absl::StatusOr<std::optional<Document>> current = Get(path);
    if (!current.ok() || !current->has_value()) {
      if (error_.ok()) {
        error_ = current.ok()
                     ? absl::NotFoundError(absl::StrCat(
                           "Cannot update missing document ", path))
                     : current.status();
      }
      return;
    }
    Document merged = **std::move(current);
    for (auto& [key, value] : fields) {
      if (value.is_null()) {
        merged.erase(key);
      } else {
        merged[key] = std::move(value);
      }
    }
    writes_.push_back(Write{std::string(path), std::move(merged)});
  }

  void Delete(std::string_view path) override ABSL_NO_THREAD_SAFETY_ANALYSIS {
    Record(path, kRemove);
    writes_.push_back(Write{std::string(path), std::nullopt});
  }

  [[nodiscard]] const absl::Status& error() const { return error_; }

  std::vector<Write> TakeWrites() { return std::move(writes_); }

 private:
  void Record(std::string_view path, Operation operation)
      ABSL_NO_THREAD_SAFETY_ANALYSIS {
    if (absl::Status status = store_->CheckAccess(path, operation);
        !status.ok() && error_.ok()) {
      error_ = std::move(status);
    }
  }

  const std::optional<Document>* FindStaged(std::string_view path) const {
    for (auto it = writes_.rbegin(); it != writes_.rend(); ++it) {
      if (it->path == path) {
        return &it->data;
      }
    }
    return nullptr;
  }

  InMemoryDocumentStore* absl_nonnull const store_;
  std::vector<Write> writes_;
  absl::Status error_;
};

InMemoryDocumentStore::InMemoryDocumentStore(EventLoop* loop) : loop_(loop) {}

InMemoryDocumentStore::~InMemoryDocumentStore() {
  absl::MutexLock lock(&mu_);
  for (const auto& watcher : watchers_) {
    watcher->active = false;
  }
  watchers_.clear();
}

void InMemoryDocumentStore::Get(std::string_view path, GetCallback done) {
  absl::StatusOr<std::optional<Document>> result;
  {
    absl::MutexLock lock(&mu_);
    if (absl::Status status = CheckAccess(path, kRead); !status.ok()) {
      result = std::move(status);
    } else if (const auto it = documents_.find(path);
               it == documents_.end()) {
      result = std::nullopt;
    } else {
      result = it->second;
    }
  }
  Deliver([done = std::move(done), result = std::move(result)]() mutable {
    std::move(done)(std::move(result));
  });
}

void InMemoryDocumentStore::Set(std::string_view path, Document data,
                                StatusCallback done) {
  absl::Status status;
  {
    absl::MutexLock lock(&mu_);
    status = CheckAccess(path, kWrite);
    if (status.ok()) {
      std::vector<Write> writes;
      writes.push_back(Write{std::string(path), std::move(data)});
      CommitLocked(std::move(writes));
    }
  }
  Deliver([done = std::move(done), status = std::move(status)]() mutable {
    std::move(done)(std::move(status));
  });
}

void InMemoryDocumentStore::Update(std::string_view path, Document fields,
                                   StatusCallback done) {
  RunTransaction(
      [path = std::string(path), fields = std::move(fields)](
          Transaction& transaction) mutable {
        transaction.Update(path, std::move(fields));
        return absl::OkStatus();
      },
      std::move(done));
}

void InMemoryDocumentStore::Delete(std::string_view path,
                                   StatusCallback done) {
  absl::Status status;
  {
    absl::MutexLock lock(&mu_);
    status = CheckAccess(path, kRemove);
    if (status.ok()) {
      std::vector<Write> writes;
      writes.push_back(Write{std::string(path), std::nullopt});
      CommitLocked(std::move(writes));
    }
  }
  Deliver([done = std::move(done), status = std::move(status)]() mutable {
    std::move(done)(std::move(status));
  });
}

void InMemoryDocumentStore::List(std::string_view collection,
                                 ListCallback done) {
  absl::StatusOr<std::vector<DocumentSnapshot>> result;
  {
    absl::MutexLock lock(&mu_);
    if (absl::Status status = CheckAccess(collection, kRead); !status.ok()) {
      result = std::move(status);
    } else {
      result = ListLocked(collection);
    }
  }
  Deliver([done = std::move(done), result = std::move(result)]() mutable {
    std::move(done)(std::move(result));
  });
}

void InMemoryDocumentStore::RunTransaction(TransactionBody body,
                                           StatusCallback done) {
  absl::Status status;
  {
    absl::MutexLock lock(&mu_);
    StagedTransaction transaction(this);
    status = std::move(body)(transaction);
    if (status.ok()) {
      status = transaction.error();
    }
    if (status.ok()) {
      CommitLocked(transaction.TakeWrites());
    }
  }
  Deliver([done = std::move(done), status = std::move(status)]() mutable {
    std::move(done)(std::move(status));
  });
}

std::unique_ptr<Subscription> InMemoryDocumentStore::Watch(
    std::string_view path, DocumentListener listener) {
  auto watcher = std::make_shared<Watcher>();
  watcher->path = std::string(path);
  watcher->on_document = std::move(listener);

  std::optional<Document> current;
  {
    absl::MutexLock lock(&mu_);
    if (const auto it = documents_.find(path); it != documents_.end()) {
      current = it->second;
    }
    watchers_.push_back(watcher);
  }
  Deliver([watcher, current = std::move(current)]() {
    if (watcher->active) {
      watcher->on_document(current);
    }
  });
  return std::make_unique<WatcherSubscription>(std::move(watcher));
}

std::unique_ptr<Subscription> InMemoryDocumentStore::WatchCollection(
    std::string_view collection, CollectionListener listener) {
  auto watcher = std::make_shared<Watcher>();
  watcher->is_collection = true;
  watcher->path = std::string(collection);
  watcher->on_collection = std::move(listener);

  std::vector<DocumentChange> initial;
  {
    absl::MutexLock lock(&mu_);
    for (auto& snapshot : ListLocked(collection)) {
      initial.push_back(DocumentChange{ChangeType::kAdded,
                                       std::move(snapshot.id),
                                       std::move(snapshot.data)});
    }
    watchers_.push_back(watcher);
  }
  Deliver([watcher, initial = std::move(initial)]() {
    if (watcher->active) {
      watcher->on_collection(initial);
    }
  });
  return std::make_unique<WatcherSubscription>(std::move(watcher));
}

void InMemoryDocumentStore::DenyAccess(std::string_view path_prefix,
                                       uint8_t operations) {
  absl::MutexLock lock(&mu_);
  access_rules_.push_back(AccessRule{std::string(path_prefix), operations});
}

void InMemoryDocumentStore::ClearAccessRules() {
  absl::MutexLock lock(&mu_);
  access_rules_.clear();
}

void InMemoryDocumentStore::FailNext(std::string_view path_prefix,
                                     Operation operation,
                                     absl::Status status) {
  absl::MutexLock lock(&mu_);
  injected_failures_.push_back(
      InjectedFailure{std::string(path_prefix), operation, std::move(status)});
}

std::optional<Document> InMemoryDocumentStore::Peek(
    std::string_view path) const {
  absl::MutexLock lock(&mu_);
  const auto it = documents_.find(path);
  if (it == documents_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<std::string> InMemoryDocumentStore::Paths(
    std::string_view prefix) const {
  absl::MutexLock lock(&mu_);
  std::vector<std::string> paths;
  for (const auto& [path, document] : documents_) {
    if (absl::StartsWith(path, prefix)) {
      paths.push_back(path);
    }
  }
  return paths;
}

size_t InMemoryDocumentStore::write_count() const {
  absl::MutexLock lock(&mu_);
  return write_count_;
}

absl::Status InMemoryDocumentStore::CheckAccess(std::string_view path,
                                                Operation operation) {
  for (auto it = injected_failures_.begin(); it != injected_failures_.end();
       ++it) {
    if (it->operation == operation && absl::StartsWith(path, it->prefix)) {
      absl::Status status = std::move(it->status);
      injected_failures_.erase(it);
      return status;
    }
  }
  for (const auto& rule : access_rules_) {
    if ((rule.operations & operation) != 0 &&
        absl::StartsWith(path, rule.prefix)) {
      return absl::PermissionDeniedError(
          absl::StrCat("Access denied to ", path));
    }
  }
  return absl::OkStatus();
}

void InMemoryDocumentStore::CommitLocked(std::vector<Write> writes) {
  std::erase_if(watchers_, [](const std::shared_ptr<Watcher>& watcher) {
    return !watcher->active;
  });

  for (auto& write : writes) {
    std::optional<Document> previous;
    if (const auto it = documents_.find(write.path); it != documents_.end()) {
      previous = it->second;
    }
    if (!write.data.has_value() && !previous.has_value()) {
      continue;
    }

    if (write.data.has_value()) {
      documents_.insert_or_assign(write.path, *write.data);
    } else {
      documents_.erase(write.path);
    }
    ++write_count_;

    const std::string_view parent = ParentPath(write.path);
    for (const auto& watcher : watchers_) {
      if (!watcher->is_collection && watcher->path == write.path) {
        Deliver([watcher, current = write.data]() {
          if (watcher->active) {
            watcher->on_document(current);
          }
        });
        continue;
      }
      if (watcher->is_collection && watcher->path == parent) {
        DocumentChange change;
        change.id = std::string(LastSegment(write.path));
        if (write.data.has_value()) {
          change.type = previous.has_value() ? ChangeType::kModified
                                             : ChangeType::kAdded;
          change.data = *write.data;
        } else {
          change.type = ChangeType::kRemoved;
          change.data = *previous;
        }
        Deliver([watcher, changes = std::vector<DocumentChange>{
                              std::move(change)}]() {
          if (watcher->active) {
            watcher->on_collection(changes);
          }
        });
      }
    }
  }
}

std::vector<DocumentSnapshot> InMemoryDocumentStore::ListLocked(
    std::string_view collection) const {
  std::vector<DocumentSnapshot> snapshots;
  const std::string prefix = absl::StrCat(collection, "/");
  for (auto it = documents_.lower_bound(prefix);
       it != documents_.end() && absl::StartsWith(it->first, prefix); ++it) {
    const std::string_view rest =
        std::string_view(it->first).substr(prefix.size());
    if (rest.empty() || rest.find('/') != std::string_view::npos) {
      continue;
    }
    snapshots.push_back(
        DocumentSnapshot{it->first, std::string(rest), it->second});
  }
  return snapshots;
}

void InMemoryDocumentStore::Deliver(absl::AnyInvocable<void()> task) {
  loop_->Post(std::move(task));
}

}  // namespace duet::store
