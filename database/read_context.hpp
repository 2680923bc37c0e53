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

#ifndef STRUCTSY_READ_CONTEXT_HPP
#define STRUCTSY_READ_CONTEXT_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>

#include "common/status_or.hpp"
#include "database/persistent.hpp"
#include "database/result_set.hpp"
#include "query/filter.hpp"
#include "query/query.hpp"
#include "type/record.hpp"
#include "type/rid.hpp"

namespace structsy {
class PageSource;
class SchemaRegistry;
class Table;
class Transaction;
struct ExecContext;

// Reads and queries through one page view: a read snapshot, or the writer
// transaction with its own changes.
class ReadContext {
 public:
  ReadContext(const ReadContext&) = delete;
  ReadContext& operator=(const ReadContext&) = delete;
  ReadContext(ReadContext&&) = default;
  ReadContext& operator=(ReadContext&&) = default;
  virtual ~ReadContext() = default;

  // kNotExists for a deleted record, kInvalidId for a Rid that never
  // addressed a record of a defined type.
  [[nodiscard]] StatusOr<Record> Read(const Rid& rid) const;
  [[nodiscard]] StatusOr<ResultSet> Execute(const Query& query) const;
  // Every live record of |type_name|, in segment order.
  [[nodiscard]] StatusOr<ResultSet> Scan(std::string_view type_name) const;
  [[nodiscard]] StatusOr<size_t> Count(const Query& query) const;
  [[nodiscard]] StatusOr<ResultSet> FindBy(std::string_view type_name,
                                           std::string_view field,
                                           const Value& value) const;
  // Records whose |field| lies between the bounds, ordered by it.
  [[nodiscard]] StatusOr<ResultSet> FindRange(
      std::string_view type_name, std::string_view field,
      std::optional<ValueBound> lower, std::optional<ValueBound> upper,
      bool ascending = true) const;

  template <typename T>
  [[nodiscard]] StatusOr<T> Read(const Ref<T>& ref) const {
    ASSIGN_OR_RETURN(Record, rec, Read(ref.rid));
    return Persistent<T>::FromRecord(rec);
  }
  template <typename T>
  [[nodiscard]] StatusOr<TypedResultSet<T>> Execute(const Query& query) const {
    ASSIGN_OR_RETURN(ResultSet, rs, Execute(query));
    return TypedResultSet<T>(std::move(rs));
  }
  // Runs |query| with the shape of P and decodes the narrowed records.
  template <typename P>
  [[nodiscard]] StatusOr<TypedResultSet<P, Projection<P>>> ExecuteProjected(
      Query query) const {
    query.Project(Projection<P>::Shape());
    ASSIGN_OR_RETURN(ResultSet, rs, Execute(query));
    return TypedResultSet<P, Projection<P>>(std::move(rs));
  }
  template <typename T>
  [[nodiscard]] StatusOr<TypedResultSet<T>> Scan() const {
    ASSIGN_OR_RETURN(ResultSet, rs, Scan(Persistent<T>::Descriptor().Name()));
    return TypedResultSet<T>(std::move(rs));
  }
  template <typename T>
  [[nodiscard]] StatusOr<TypedResultSet<T>> FindBy(std::string_view field,
                                                   const Value& value) const {
    ASSIGN_OR_RETURN(ResultSet, rs,
                     FindBy(Persistent<T>::Descriptor().Name(), field, value));
    return TypedResultSet<T>(std::move(rs));
  }
  template <typename T>
  [[nodiscard]] StatusOr<TypedResultSet<T>> FindRange(
      std::string_view field, std::optional<ValueBound> lower,
      std::optional<ValueBound> upper, bool ascending = true) const {
    ASSIGN_OR_RETURN(ResultSet, rs,
                     FindRange(Persistent<T>::Descriptor().Name(), field,
                               std::move(lower), std::move(upper), ascending));
    return TypedResultSet<T>(std::move(rs));
  }

 protected:
  ReadContext(SchemaRegistry* registry, size_t max_sort_buffer,
              std::shared_ptr<const PageSource> source,
              std::shared_ptr<const Transaction> txn);

  // kTransactionClosed or kAborted for a finished or failed transaction.
  [[nodiscard]] Status CheckOpen() const;
  [[nodiscard]] StatusOr<std::shared_ptr<Table>> TableOf(const Rid& rid) const;

  SchemaRegistry* registry_;
  size_t max_sort_buffer_;
  std::shared_ptr<const PageSource> source_;
  std::shared_ptr<const Transaction> txn_;

 private:
  [[nodiscard]] ExecContext MakeExecContext() const;
};

}  // namespace structsy

#endif  // STRUCTSY_READ_CONTEXT_HPP
