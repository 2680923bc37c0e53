/**
 * Copyright 2023 KUMAZAKI Hiroki
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef STRUCTSY_TRANSACTION_CONTEXT_HPP
#define STRUCTSY_TRANSACTION_CONTEXT_HPP

#include <memory>
#include <string_view>

#include "database/read_context.hpp"

namespace structsy {
class Snapshot;

// The writer. Dropping it without Commit() rolls it back.
class TransactionContext : public ReadContext {
 public:
  TransactionContext(SchemaRegistry* registry, size_t max_sort_buffer,
                     std::shared_ptr<Transaction> txn);
  TransactionContext(TransactionContext&&) = default;
  TransactionContext& operator=(TransactionContext&&) = delete;
  ~TransactionContext() override;

  StatusOr<Rid> Insert(std::string_view type_name, const Record& record);
  Status Update(const Rid& rid, const Record& record);
  Status Delete(const Rid& rid);

  // A transaction with a failed statement is rolled back instead and
  // reports kAborted.
  Status Commit();
  Status Rollback();
  [[nodiscard]] bool IsOpen() const;

  template <typename T>
  StatusOr<Ref<T>> Insert(const T& value) {
    ASSIGN_OR_RETURN(Rid, rid, Insert(Persistent<T>::Descriptor().Name(),
                                      Persistent<T>::ToRecord(value)));
    return Ref<T>(rid);
  }
  template <typename T>
  Status Update(const Ref<T>& ref, const T& value) {
    return Update(ref.rid, Persistent<T>::ToRecord(value));
  }
  template <typename T>
  Status Delete(const Ref<T>& ref) {
    return Delete(ref.rid);
  }

  Transaction& GetTransaction() { return *writer_; }

 private:
  std::shared_ptr<Transaction> writer_;
};

// A read-only view of the last commit at creation.
class SnapshotContext : public ReadContext {
 public:
  SnapshotContext(SchemaRegistry* registry, size_t max_sort_buffer,
                  std::shared_ptr<const Snapshot> snapshot);
  SnapshotContext(SnapshotContext&&) = default;
  SnapshotContext& operator=(SnapshotContext&&) = default;
  ~SnapshotContext() override = default;
};

}  // namespace structsy

#endif  // STRUCTSY_TRANSACTION_CONTEXT_HPP
