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

#include "database/schema_registry.hpp"

#include <mutex>
#include <ostream>
#include <utility>

#include "common/log_message.hpp"
#include "database/page_storage.hpp"
#include "page/page.hpp"
#include "transaction/snapshot.hpp"
#include "transaction/transaction.hpp"

namespace structsy {
namespace {

std::shared_ptr<const StructDescriptor> SystemDescriptor() {
  StructDescriptor desc("structsy.schema",
                        {FieldDescriptor("name", FieldType(FieldKind::kString)),
                         FieldDescriptor("entry", FieldType(FieldKind::kBytes))});
  desc.SetTypeID(kSystemTypeId);
  return std::make_shared<const StructDescriptor>(std::move(desc));
}

bool Mentions(const FieldType& type, std::string_view name) {
  switch (type.Kind()) {
    case FieldKind::kRef:
    case FieldKind::kEmbedded:
      return type.TypeName() == name;
    case FieldKind::kOption:
    case FieldKind::kVec:
      return Mentions(type.Element(), name);
    default:
      return false;
  }
}

StatusOr<std::vector<Rid>> RidsOf(const Transaction& txn, const Table& table) {
  std::vector<Rid> rids;
  Iterator it = table.BeginFullScan(txn);
  for (; it.IsValid(); ++it) {
    rids.push_back(it.Position());
  }
  RETURN_IF_FAIL(it.GetStatus());
  return rids;
}

Status DeleteAll(Transaction& txn, Table& table) {
  ASSIGN_OR_RETURN(std::vector<Rid>, rids, RidsOf(txn, table));
  for (const Rid& rid : rids) {
    RETURN_IF_FAIL(table.Delete(txn, rid));
  }
  LOG(DEBUG) << "deleted " << rids.size() << " " << table.Descriptor().Name()
             << " records";
  return Status::kSuccess;
}

Status RewriteAll(
    Transaction& txn, const Table& previous, Table& next,
    const std::function<StatusOr<Record>(const Record&)>& convert) {
  ASSIGN_OR_RETURN(std::vector<Rid>, rids, RidsOf(txn, previous));
  for (const Rid& rid : rids) {
    ASSIGN_OR_RETURN(Record, before, previous.Read(txn, rid));
    ASSIGN_OR_RETURN(Record, after, convert(before));
    RETURN_IF_FAIL(next.Adopt(txn, previous, rid, after));
  }
  LOG(DEBUG) << "rewrote " << rids.size() << " "
             << previous.Descriptor().Name() << " records as "
             << next.Descriptor().Name();
  return Status::kSuccess;
}

}  // namespace

SchemaRegistry::SchemaRegistry(PageStorage* storage)
    : storage_(storage),
      system_(SystemDescriptor(), {}, &storage->Segments(), this) {}

Status SchemaRegistry::Load() {
  std::shared_ptr<Snapshot> snapshot = storage_->TakeSnapshot();
  std::unique_lock lk(latch_);
  persisted_.clear();
  Iterator it = system_.BeginFullScan(*snapshot);
  for (; it.IsValid(); ++it) {
    StatusOr<Entry> entry = Decode<Entry>(it->Get(1).AsString());
    if (!entry.HasValue()) {
      LOG(ERROR) << "undecodable schema record at " << it.Position();
      return Status::kBackingStoreError;
    }
    const std::string name = entry.Value().desc.Name();
    persisted_.emplace(name, entry.MoveValue());
  }
  RETURN_IF_FAIL(it.GetStatus());
  LOG(INFO) << persisted_.size() << " schemas found in " << storage_->Path();
  return Status::kSuccess;
}

StatusOr<SchemaRegistry::Entry> SchemaRegistry::Create(
    Transaction& txn, const StructDescriptor& desc) {
  Entry entry;
  entry.desc = desc;
  {
    ASSIGN_OR_RETURN(Page*, header, txn.GetPageForWrite(0));
    entry.type_id = header->body.header_page.IssueTypeID();
  }
  entry.desc.SetTypeID(entry.type_id);
  RETURN_IF_FAIL(CreateIndexes(txn, entry));
  ASSIGN_OR_RETURN(
      Rid, rid,
      system_.Insert(txn, Record({Value(desc.Name()),
                                  Value::Bytes(Encode(entry))})));
  ASSIGN_OR_RETURN(Page*, header, txn.GetPageForWrite(0));
  if (header->body.header_page.SchemaRoot() == 0) {
    header->body.header_page.SetSchemaRoot(rid.page_id);
  }
  return entry;
}

Status SchemaRegistry::CreateIndexes(Transaction& txn, Entry& entry) {
  const StructDescriptor& desc = entry.desc;
  for (slot_t i = 0; i < desc.FieldCount(); ++i) {
    const FieldDescriptor& field = desc.GetField(i);
    if (!field.IsIndexed()) {
      continue;
    }
    ASSIGN_OR_RETURN(Index, idx, Index::Create(txn, field.index.name,
                                               field.index.mode, i));
    entry.indexes.push_back(std::move(idx));
  }
  return Status::kSuccess;
}

StatusOr<Rid> SchemaRegistry::SystemRecordOf(const Transaction& txn,
                                             std::string_view name) const {
  Iterator it = system_.BeginFullScan(txn);
  for (; it.IsValid(); ++it) {
    if (it->Get(0).AsString() == name) {
      return it.Position();
    }
  }
  RETURN_IF_FAIL(it.GetStatus());
  LOG(ERROR) << "no schema record for " << name;
  return Status::kBackingStoreError;
}

const SchemaRegistry::Entry* SchemaRegistry::MentionedBy(
    std::string_view name) const {
  for (const auto& [other, entry] : persisted_) {
    if (other == name) {
      continue;
    }
    for (const auto& field : entry.desc.Fields()) {
      if (Mentions(field.type, name)) {
        return &entry;
      }
    }
  }
  return nullptr;
}

std::shared_ptr<Table> SchemaRegistry::TableOf(const Entry& entry) const {
  StructDescriptor desc = entry.desc;
  desc.SetTypeID(entry.type_id);
  return std::make_shared<Table>(
      std::make_shared<const StructDescriptor>(std::move(desc)),
      entry.indexes, &storage_->Segments(), this);
}

type_id_t SchemaRegistry::Install(const Entry& entry) {
  std::shared_ptr<Table> table = TableOf(entry);
  defined_[entry.desc.Name()] = table;
  by_type_[entry.type_id] = table;
  return entry.type_id;
}

StatusOr<type_id_t> SchemaRegistry::Define(const StructDescriptor& desc) {
  RETURN_IF_FAIL(desc.Validate(*this));
  ASSIGN_OR_RETURN(std::shared_ptr<Transaction>, txn, storage_->Begin());
  const uint64_t hash = desc.StructuralHash();
  {
    std::unique_lock lk(latch_);
    auto defined = defined_.find(desc.Name());
    if (defined != defined_.end()) {
      txn->Abort();
      if (defined->second->Descriptor().StructuralHash() != hash) {
        LOG(WARN) << desc.Name() << " is already defined differently as "
                  << defined->second->Descriptor();
        return Status::kStructAlreadyDefined;
      }
      return defined->second->TypeID();
    }
    auto persisted = persisted_.find(desc.Name());
    if (persisted != persisted_.end()) {
      txn->Abort();
      if (persisted->second.desc.StructuralHash() != hash) {
        LOG(WARN) << desc.Name() << " is stored as "
                  << persisted->second.desc << ", can not migrate to "
                  << desc;
        return Status::kMigrationNotSupported;
      }
      return Install(persisted->second);
    }
  }
  StatusOr<Entry> entry = Create(*txn, desc);
  if (!entry.HasValue()) {
    LOG(ERROR) << "failed to define " << desc.Name() << ": "
               << entry.GetStatus();
    txn->Abort();
    return entry.GetStatus();
  }
  Status s = txn->PreCommit();
  if (s != Status::kSuccess) {
    LOG(ERROR) << "failed to commit the schema of " << desc.Name() << ": "
               << s;
    return s;
  }
  std::unique_lock lk(latch_);
  persisted_[desc.Name()] = entry.Value();
  LOG(INFO) << "defined " << desc << " as type " << entry.Value().type_id;
  return Install(entry.Value());
}

Status SchemaRegistry::Undefine(std::string_view name) {
  ASSIGN_OR_RETURN(std::shared_ptr<Transaction>, txn, storage_->Begin());
  std::shared_ptr<Table> table;
  {
    std::shared_lock lk(latch_);
    auto persisted = persisted_.find(name);
    if (persisted == persisted_.end()) {
      txn->Abort();
      LOG(WARN) << "struct " << name << " is not defined";
      return Status::kStructNotDefined;
    }
    if (const Entry* user = MentionedBy(name); user != nullptr) {
      txn->Abort();
      LOG(WARN) << "can not undefine " << name << ", "
                << user->desc.Name() << " refers to it";
      return Status::kMigrationNotSupported;
    }
    auto defined = defined_.find(name);
    table = defined != defined_.end() ? defined->second
                                      : TableOf(persisted->second);
  }
  Status s = DeleteAll(*txn, *table);
  if (s == Status::kSuccess) {
    StatusOr<Rid> rid = SystemRecordOf(*txn, name);
    s = rid.HasValue() ? system_.Delete(*txn, rid.Value()) : rid.GetStatus();
  }
  if (s != Status::kSuccess) {
    LOG(ERROR) << "failed to undefine " << name << ": " << s;
    txn->Abort();
    return s;
  }
  s = txn->PreCommit();
  if (s != Status::kSuccess) {
    LOG(ERROR) << "failed to commit the removal of " << name << ": " << s;
    return s;
  }
  std::unique_lock lk(latch_);
  by_type_.erase(table->TypeID());
  if (auto it = defined_.find(name); it != defined_.end()) {
    defined_.erase(it);
  }
  persisted_.erase(persisted_.find(name));
  LOG(INFO) << "undefined " << name;
  return Status::kSuccess;
}

Status SchemaRegistry::Migrate(
    std::string_view from, const StructDescriptor& to,
    const std::function<StatusOr<Record>(const Record&)>& convert) {
  RETURN_IF_FAIL(to.Validate(*this));
  ASSIGN_OR_RETURN(std::shared_ptr<Transaction>, txn, storage_->Begin());
  Entry entry;
  std::shared_ptr<Table> previous;
  {
    std::shared_lock lk(latch_);
    auto persisted = persisted_.find(from);
    if (persisted == persisted_.end()) {
      txn->Abort();
      LOG(INFO) << "no " << from << " to migrate";
      return Status::kSuccess;
    }
    if (to.Name() != from && persisted_.find(to.Name()) != persisted_.end()) {
      txn->Abort();
      LOG(WARN) << "can not migrate " << from << ", " << to.Name()
                << " is already stored";
      return Status::kStructAlreadyDefined;
    }
    if (const Entry* user = MentionedBy(from); user != nullptr) {
      txn->Abort();
      LOG(WARN) << "can not migrate " << from << ", " << user->desc.Name()
                << " refers to it";
      return Status::kMigrationNotSupported;
    }
    auto defined = defined_.find(from);
    previous = defined != defined_.end() ? defined->second
                                         : TableOf(persisted->second);
    entry.type_id = persisted->second.type_id;
  }
  entry.desc = to;
  entry.desc.SetTypeID(entry.type_id);
  Status s = CreateIndexes(*txn, entry);
  if (s == Status::kSuccess) {
    std::shared_ptr<Table> next = TableOf(entry);
    s = RewriteAll(*txn, *previous, *next, convert);
  }
  if (s == Status::kSuccess) {
    StatusOr<Rid> rid = SystemRecordOf(*txn, from);
    s = rid.HasValue()
            ? system_.Update(*txn, rid.Value(),
                             Record({Value(to.Name()),
                                     Value::Bytes(Encode(entry))}))
            : rid.GetStatus();
  }
  if (s != Status::kSuccess) {
    LOG(ERROR) << "failed to migrate " << from << " to " << to.Name() << ": "
               << s;
    txn->Abort();
    return s;
  }
  s = txn->PreCommit();
  if (s != Status::kSuccess) {
    LOG(ERROR) << "failed to commit the migration of " << from << ": " << s;
    return s;
  }
  std::unique_lock lk(latch_);
  if (auto it = defined_.find(from); it != defined_.end()) {
    defined_.erase(it);
  }
  persisted_.erase(persisted_.find(from));
  persisted_[to.Name()] = entry;
  Install(entry);
  LOG(INFO) << "migrated " << from << " to " << to << " as type "
            << entry.type_id;
  return Status::kSuccess;
}

StatusOr<std::shared_ptr<const StructDescriptor>>
SchemaRegistry::ResolveStruct(std::string_view name) const {
  std::shared_lock lk(latch_);
  auto it = defined_.find(name);
  if (it == defined_.end()) {
    return Status::kStructNotDefined;
  }
  return it->second->DescriptorPtr();
}

StatusOr<std::shared_ptr<Table>> SchemaRegistry::GetTable(
    std::string_view name) const {
  std::shared_lock lk(latch_);
  auto it = defined_.find(name);
  if (it == defined_.end()) {
    LOG(WARN) << "struct " << name << " is not defined";
    return Status::kStructNotDefined;
  }
  return it->second;
}

StatusOr<std::shared_ptr<Table>> SchemaRegistry::TableByTypeID(
    type_id_t type_id) const {
  std::shared_lock lk(latch_);
  auto it = by_type_.find(type_id);
  if (it == by_type_.end()) {
    return Status::kInvalidId;
  }
  return it->second;
}

bool SchemaRegistry::IsDefined(std::string_view name) const {
  std::shared_lock lk(latch_);
  return defined_.find(name) != defined_.end();
}

std::vector<std::string> SchemaRegistry::ListDefined() const {
  std::shared_lock lk(latch_);
  std::vector<std::string> ret;
  ret.reserve(defined_.size());
  for (const auto& [name, table] : defined_) {
    ret.push_back(name);
  }
  return ret;
}

void SchemaRegistry::Dump(std::ostream& o) const {
  std::shared_lock lk(latch_);
  for (const auto& [name, entry] : persisted_) {
    o << entry.type_id << ": " << entry.desc
      << (defined_.find(name) != defined_.end() ? " (defined)" : "") << "\n";
  }
}

}  // namespace structsy
