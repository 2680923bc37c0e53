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

#ifndef STRUCTSY_STORE_HPP
#define STRUCTSY_STORE_HPP

#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "common/options.hpp"
#include "common/status_or.hpp"
#include "database/page_storage.hpp"
#include "database/persistent.hpp"
#include "database/result_set.hpp"
#include "database/schema_registry.hpp"
#include "database/transaction_context.hpp"
#include "query/query.hpp"

namespace structsy {

// One open store file. Shareable across threads; every context it hands
// out must be dropped before the store is.
class Store {
 public:
  Store(const Store&) = delete;
  Store& operator=(const Store&) = delete;
  ~Store();

  // kIOError when the file can not be opened or is locked by another
  // handle, kBackingStoreError when it is not a store.
  static StatusOr<std::unique_ptr<Store>> Open(std::string_view path,
                                               const Options& options = {});
  // A store in a fresh temporary file, removed when the store is dropped.
  static StatusOr<std::unique_ptr<Store>> OpenMemory(Options options = {});

  // Waits for the writer; do not call while holding a TransactionContext
  // on the same thread.
  StatusOr<type_id_t> Define(const StructDescriptor& desc);
  template <typename T>
  StatusOr<type_id_t> Define() {
    return Define(Persistent<T>::Descriptor());
  }

  // Drops the struct with all its records. Waits for the writer.
  Status Undefine(std::string_view name) { return registry_.Undefine(name); }
  template <typename T>
  Status Undefine() {
    return Undefine(Persistent<T>::Descriptor().Name());
  }

  // Rewrites every stored |from| record through |convert| as a record of
  // |to|, keeping its Rid. Succeeds without work when nothing was stored as
  // |from|. Waits for the writer.
  Status Migrate(std::string_view from, const StructDescriptor& to,
                 const std::function<StatusOr<Record>(const Record&)>& convert) {
    return registry_.Migrate(from, to, convert);
  }
  template <typename S, typename D>
  Status Migrate(const std::function<D(S)>& convert) {
    return Migrate(Persistent<S>::Descriptor().Name(),
                   Persistent<D>::Descriptor(),
                   [&convert](const Record& rec) -> StatusOr<Record> {
                     ASSIGN_OR_RETURN(S, source, Persistent<S>::FromRecord(rec));
                     return Persistent<D>::ToRecord(convert(std::move(source)));
                   });
  }

  [[nodiscard]] bool IsDefined(std::string_view name) const {
    return registry_.IsDefined(name);
  }
  template <typename T>
  [[nodiscard]] bool IsDefined() const {
    return IsDefined(Persistent<T>::Descriptor().Name());
  }
  [[nodiscard]] std::vector<std::string> ListDefined() const {
    return registry_.ListDefined();
  }
  [[nodiscard]] StatusOr<std::shared_ptr<Table>> GetTable(
      std::string_view name) const {
    return registry_.GetTable(name);
  }

  // Waits until no other transaction is open. kNeedsRecovery after a
  // failed commit, kLockPoisoned after an exception escaped a writer.
  StatusOr<TransactionContext> Begin();
  SnapshotContext Snapshot();

  // Runs |query| over a fresh snapshot.
  StatusOr<ResultSet> Execute(const Query& query);
  template <typename T>
  StatusOr<TypedResultSet<T>> Execute(const Query& query) {
    return Snapshot().Execute<T>(query);
  }

  [[nodiscard]] const Options& GetOptions() const { return options_; }
  PageStorage& Storage() { return storage_; }
  void Dump(std::ostream& o) const { registry_.Dump(o); }

 private:
  Store(std::string_view path, const Options& options);

  const Options options_;
  // Removed with the store.
  bool temporary_ = false;
  PageStorage storage_;
  SchemaRegistry registry_;
};

}  // namespace structsy

#endif  // STRUCTSY_STORE_HPP
