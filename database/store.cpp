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

#include "database/store.hpp"

#include <cstdio>
#include <filesystem>
#include <utility>

#include "common/log_message.hpp"
#include "common/random_string.hpp"

namespace structsy {

Store::Store(std::string_view path, const Options& options)
    : options_(options), storage_(path, options), registry_(&storage_) {}

StatusOr<std::unique_ptr<Store>> Store::Open(std::string_view path,
                                             const Options& options) {
  SetLogThreshold(options.log_level);
  std::unique_ptr<Store> store(new Store(path, options));
  RETURN_IF_FAIL(store->storage_.Open());
  RETURN_IF_FAIL(store->registry_.Load());
  return std::move(store);
}

Store::~Store() {
  if (temporary_) {
    // The open handles keep the pages readable until the members go.
    std::remove(storage_.Path().c_str());
    std::remove((storage_.Path() + ".wal").c_str());
  }
}

StatusOr<std::unique_ptr<Store>> Store::OpenMemory(Options options) {
  std::error_code ec;
  const std::filesystem::path dir = std::filesystem::temp_directory_path(ec);
  if (ec) {
    LOG(ERROR) << "no temporary directory: " << ec.message();
    return Status::kIOError;
  }
  options.create_if_missing = true;
  options.sync_on_commit = false;
  const std::string path = (dir / RandomStorePath("structsy-memory")).string();
  StatusOr<std::unique_ptr<Store>> store = Open(path, options);
  if (!store.HasValue()) {
    std::remove(path.c_str());
    std::remove((path + ".wal").c_str());
    return store.GetStatus();
  }
  store.Value()->temporary_ = true;
  LOG(DEBUG) << "memory store at " << path;
  return store;
}

StatusOr<type_id_t> Store::Define(const StructDescriptor& desc) {
  return registry_.Define(desc);
}

StatusOr<TransactionContext> Store::Begin() {
  StatusOr<std::shared_ptr<Transaction>> txn = storage_.Begin();
  if (!txn.HasValue()) {
    LOG(WARN) << "can not begin a transaction on " << storage_.Path() << ": "
              << txn.GetStatus();
    return txn.GetStatus();
  }
  return TransactionContext(&registry_, options_.max_sort_buffer,
                            txn.MoveValue());
}

SnapshotContext Store::Snapshot() {
  return {&registry_, options_.max_sort_buffer, storage_.TakeSnapshot()};
}

StatusOr<ResultSet> Store::Execute(const Query& query) {
  return Snapshot().Execute(query);
}

}  // namespace structsy
