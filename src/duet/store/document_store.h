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

#ifndef DUET_STORE_DOCUMENT_STORE_H_
#define DUET_STORE_DOCUMENT_STORE_H_

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/functional/any_invocable.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <boost/json/object.hpp>

#include "duet/concurrency/completion_group.h"

/**
 * @file
 * @brief
 *   The realtime shared document store used as the signalling channel.
 *
 * Documents live at slash-separated paths that alternate collection and
 * document ids, e.g. `calls/room-1/participants/alice`. Deleting a document
 * never deletes documents nested below it.
 */

namespace duet::store {

using Document = boost::json::object;

enum class ChangeType { kAdded, kModified, kRemoved };

struct DocumentChange {
  ChangeType type;
  std::string id;
  /// The document after the change, or before it for `kRemoved`.
  Document data;
};

struct DocumentSnapshot {
  std::string path;
  std::string id;
  Document data;
};

using GetCallback =
    absl::AnyInvocable<void(absl::StatusOr<std::optional<Document>>)>;
using ListCallback =
    absl::AnyInvocable<void(absl::StatusOr<std::vector<DocumentSnapshot>>)>;

// void(document or nullopt if absent)
using DocumentListener = std::function<void(const std::optional<Document>&)>;
// void(changes since the previous notification)
using CollectionListener =
    std::function<void(const std::vector<DocumentChange>&)>;

/**
 * A read-check-write transaction. Reads observe committed state; writes are
 * staged and committed atomically only if the transaction body returns OK.
 */
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual absl::StatusOr<std::optional<Document>> Get(
      std::string_view path) = 0;
  virtual void Set(std::string_view path, Document data) = 0;
  virtual void Update(std::string_view path, Document fields) = 0;
  virtual void Delete(std::string_view path) = 0;
};

using TransactionBody = absl::AnyInvocable<absl::Status(Transaction&)>;

/** A live subscription. Destroying it stops further notifications. */
class Subscription {
 public:
  virtual ~Subscription() = default;
};

/**
 * Asynchronous document store interface.
 *
 * Every completion callback and listener is invoked on the event loop the
 * store was created with, never inline from the call that started the
 * operation.
 *
 * @headerfile duet/store/document_store.h
 */
class DocumentStore {
 public:
  virtual ~DocumentStore() = default;

  /** Reads a document; delivers `std::nullopt` if it does not exist. */
  virtual void Get(std::string_view path, GetCallback done) = 0;

  /** Creates or fully replaces a document. */
  virtual void Set(std::string_view path, Document data,
                   StatusCallback done) = 0;

  /**
   * Merges top-level fields into an existing document. A field set to
   * `null` is removed. Fails with `NotFound` if the document is absent.
   */
  virtual void Update(std::string_view path, Document fields,
                      StatusCallback done) = 0;

  /** Deletes a document. Deleting an absent document succeeds. */
  virtual void Delete(std::string_view path, StatusCallback done) = 0;

  /** Lists the documents directly inside a collection, ordered by id. */
  virtual void List(std::string_view collection, ListCallback done) = 0;

  virtual void RunTransaction(TransactionBody body, StatusCallback done) = 0;

  /**
   * Subscribes to a single document. The listener is first invoked with the
   * current state, then after every change.
   */
  virtual std::unique_ptr<Subscription> Watch(std::string_view path,
                                              DocumentListener listener) = 0;

  /**
   * Subscribes to a collection. The listener is first invoked with one
   * `kAdded` change per existing document (possibly none), then with the
   * changes of every subsequent write.
   */
  virtual std::unique_ptr<Subscription> WatchCollection(
      std::string_view collection, CollectionListener listener) = 0;
};

/** Returns the collection path containing `path`, or "" for a root id. */
std::string_view ParentPath(std::string_view path);

/** Returns the last segment of `path`. */
std::string_view LastSegment(std::string_view path);

}  // namespace duet::store

#endif  // DUET_STORE_DOCUMENT_STORE_H_
