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

#include "database/read_context.hpp"

#include "common/log_message.hpp"
#include "database/schema_registry.hpp"
#include "page/page_source.hpp"
#include "plan/optimizer.hpp"
#include "plan/plan.hpp"
#include "table/table.hpp"
#include "transaction/transaction.hpp"

namespace structsy {

ReadContext::ReadContext(SchemaRegistry* registry, size_t max_sort_buffer,
                         std::shared_ptr<const PageSource> source,
                         std::shared_ptr<const Transaction> txn)
    : registry_(registry),
      max_sort_buffer_(max_sort_buffer),
      source_(std::move(source)),
      txn_(std::move(txn)) {}

Status ReadContext::CheckOpen() const {
  if (!source_) {
    return Status::kTransactionClosed;
  }
  if (txn_) {
    return txn_->CheckUsable();
  }
  return Status::kSuccess;
}

StatusOr<std::shared_ptr<Table>> ReadContext::TableOf(const Rid& rid) const {
  StatusOr<std::shared_ptr<Table>> table = registry_->TableByTypeID(rid.type_id);
  if (!table.HasValue()) {
    LOG(WARN) << rid << " does not belong to a defined struct";
  }
  return table;
}

ExecContext ReadContext::MakeExecContext() const {
  ExecContext ctx;
  ctx.src = source_.get();
  ctx.filter_ctx.resolver = registry_;
  const SchemaRegistry* registry = registry_;
  const PageSource* src = source_.get();
  ctx.filter_ctx.deref = [registry, src](const Rid& rid) -> StatusOr<Record> {
    ASSIGN_OR_RETURN(std::shared_ptr<Table>, table,
                     registry->TableByTypeID(rid.type_id));
    return table->Read(*src, rid);
  };
  return ctx;
}

StatusOr<Record> ReadContext::Read(const Rid& rid) const {
  RETURN_IF_FAIL(CheckOpen());
  ASSIGN_OR_RETURN(std::shared_ptr<Table>, table, TableOf(rid));
  return table->Read(*source_, rid);
}

StatusOr<ResultSet> ReadContext::Execute(const Query& query) const {
  RETURN_IF_FAIL(CheckOpen());
  ASSIGN_OR_RETURN(std::shared_ptr<Table>, table,
                   registry_->GetTable(query.TypeName()));
  ASSIGN_OR_RETURN(Plan, plan,
                   Optimizer::Optimize(query, *table, max_sort_buffer_));
  return ResultSet(plan->EmitExecutor(MakeExecContext()), source_, txn_);
}

StatusOr<ResultSet> ReadContext::Scan(std::string_view type_name) const {
  return Execute(Query(type_name));
}

StatusOr<size_t> ReadContext::Count(const Query& query) const {
  ASSIGN_OR_RETURN(ResultSet, rs, Execute(query));
  size_t count = 0;
  Record rec;
  for (;;) {
    ASSIGN_OR_RETURN(bool, found, rs.Next(&rec));
    if (!found) {
      break;
    }
    ++count;
  }
  return count;
}

StatusOr<ResultSet> ReadContext::FindBy(std::string_view type_name,
                                        std::string_view field,
                                        const Value& value) const {
  return Execute(Query(type_name).Where(Eq(field, value)));
}

StatusOr<ResultSet> ReadContext::FindRange(std::string_view type_name,
                                           std::string_view field,
                                           std::optional<ValueBound> lower,
                                           std::optional<ValueBound> upper,
                                           bool ascending) const {
  return Execute(Query(type_name)
                     .Where(Range(field, std::move(lower), std::move(upper)))
                     .OrderBy(field, ascending));
}

}  // namespace structsy
