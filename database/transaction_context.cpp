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

#include "database/transaction_context.hpp"

#include "common/log_message.hpp"
#include "database/schema_registry.hpp"
#include "table/table.hpp"
#include "transaction/snapshot.hpp"
#include "transaction/transaction.hpp"

namespace structsy {

TransactionContext::TransactionContext(SchemaRegistry* registry,
                                       size_t max_sort_buffer,
                                       std::shared_ptr<Transaction> txn)
    : ReadContext(registry, max_sort_buffer, txn, txn), writer_(txn) {}

TransactionContext::~TransactionContext() {
  // Result sets may still hold the transaction, so it can not wait for
  // the last reference.
  if (writer_ && !writer_->IsFinished()) {
    writer_->Release();
  }
}

StatusOr<Rid> TransactionContext::Insert(std::string_view type_name,
                                         const Record& record) {
  RETURN_IF_FAIL(CheckOpen());
  ASSIGN_OR_RETURN(std::shared_ptr<Table>, table,
                   registry_->GetTable(type_name));
  return table->Insert(*writer_, record);
}

Status TransactionContext::Update(const Rid& rid, const Record& record) {
  RETURN_IF_FAIL(CheckOpen());
  ASSIGN_OR_RETURN(std::shared_ptr<Table>, table, TableOf(rid));
  return table->Update(*writer_, rid, record);
}

Status TransactionContext::Delete(const Rid& rid) {
  RETURN_IF_FAIL(CheckOpen());
  ASSIGN_OR_RETURN(std::shared_ptr<Table>, table, TableOf(rid));
  return table->Delete(*writer_, rid);
}

Status TransactionContext::Commit() {
  Status s = CheckOpen();
  if (s == Status::kAborted) {
    writer_->Abort();
    return s;
  }
  RETURN_IF_FAIL(s);
  return writer_->PreCommit();
}

Status TransactionContext::Rollback() {
  if (!writer_ || writer_->IsFinished()) {
    return Status::kTransactionClosed;
  }
  writer_->Abort();
  return Status::kSuccess;
}

bool TransactionContext::IsOpen() const {
  return writer_ && !writer_->IsFinished();
}

SnapshotContext::SnapshotContext(SchemaRegistry* registry,
                                 size_t max_sort_buffer,
                                 std::shared_ptr<const Snapshot> snapshot)
    : ReadContext(registry, max_sort_buffer, std::move(snapshot), nullptr) {}

}  // namespace structsy
