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

#ifndef STRUCTSY_SCHEMA_REGISTRY_HPP
#define STRUCTSY_SCHEMA_REGISTRY_HPP

#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "common/status_or.hpp"
#include "index/index.hpp"
#include "table/table.hpp"
#include "type/struct_descriptor.hpp"

namespace structsy {
class PageStorage;

// Every struct ever defined in the file, and the ones defined in this open.
// Persisted as records of the system type, one per struct.
class SchemaRegistry : public SchemaResolver {
 public:
  explicit SchemaRegistry(PageStorage* storage);
  SchemaRegistry(const SchemaRegistry&) = delete;
  SchemaRegistry& operator=(const SchemaRegistry&) = delete;
  ~SchemaRegistry() override = default;

  // Reads the persisted schemas.
  Status Load();

  // Makes |desc| usable in this open. Takes the writer, so the calling
  // thread must not hold an open transaction.
  StatusOr<type_id_t> Define(const StructDescriptor& desc);

  // Drops the struct called |name| with all its records and index entries,
  // whether or not it is defined in this open. kStructNotDefined when the
  // file holds no such struct, kMigrationNotSupported while another stored
  // struct refers to or embeds it. Takes the writer.
  Status Undefine(std::string_view name);

  // Rewrites every record of |from| as a record of |to| through |convert|,
  // then stores |to| in place of |from|. Rids and the type id are kept, and
  // |to| is defined in this open afterwards. A file without |from| is left
  // untouched. Takes the writer.
  Status Migrate(std::string_view from, const StructDescriptor& to,
                 const std::function<StatusOr<Record>(const Record&)>& convert);

  // Only structs defined in this open resolve.
  [[nodiscard]] StatusOr<std::shared_ptr<const StructDescriptor>>
  ResolveStruct(std::string_view name) const override;
  [[nodiscard]] StatusOr<std::shared_ptr<Table>> GetTable(
      std::string_view name) const;
  // kInvalidId when no struct defined in this open has |type_id|.
  [[nodiscard]] StatusOr<std::shared_ptr<Table>> TableByTypeID(
      type_id_t type_id) const;
  [[nodiscard]] bool IsDefined(std::string_view name) const;
  [[nodiscard]] std::vector<std::string> ListDefined() const;

  void Dump(std::ostream& o) const;

 private:
  struct Entry {
    type_id_t type_id = 0;
    StructDescriptor desc;
    std::vector<Index> indexes;

    friend Encoder& operator<<(Encoder& e, const Entry& entry) {
      e << entry.type_id << entry.desc << entry.indexes;
      return e;
    }
    friend Decoder& operator>>(Decoder& d, Entry& entry) {
      d >> entry.type_id >> entry.desc >> entry.indexes;
      return d;
    }
  };

  StatusOr<Entry> Create(Transaction& txn, const StructDescriptor& desc);
  // One index per indexed field of |entry.desc|.
  Status CreateIndexes(Transaction& txn, Entry& entry);
  StatusOr<Rid> SystemRecordOf(const Transaction& txn,
                               std::string_view name) const;
  // Precondition: latch_ is held.
  [[nodiscard]] const Entry* MentionedBy(std::string_view name) const;
  [[nodiscard]] std::shared_ptr<Table> TableOf(const Entry& entry) const;
  // Precondition: latch_ is held exclusively.
  type_id_t Install(const Entry& entry);

  PageStorage* const storage_;
  Table system_;

  mutable std::shared_mutex latch_;
  std::map<std::string, Entry, std::less<>> persisted_;
  std::map<std::string, std::shared_ptr<Table>, std::less<>> defined_;
  std::unordered_map<type_id_t, std::shared_ptr<Table>> by_type_;
};

}  // namespace structsy

#endif  // STRUCTSY_SCHEMA_REGISTRY_HPP
