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

#ifndef STRUCTSY_RESULT_SET_HPP
#define STRUCTSY_RESULT_SET_HPP

#include <memory>
#include <ostream>
#include <utility>
#include <vector>

#include "common/status_or.hpp"
#include "executor/executor_base.hpp"
#include "type/record.hpp"
#include "type/rid.hpp"

namespace structsy {
class PageSource;
class Transaction;

// Lazy output of one query. Keeps the page view it reads alive; when that
// view is a transaction, reading after the transaction ended fails with
// kTransactionClosed.
class ResultSet {
 public:
  ResultSet(Executor exec, std::shared_ptr<const PageSource> source,
            std::shared_ptr<const Transaction> txn)
      : exec_(std::move(exec)),
        source_(std::move(source)),
        txn_(std::move(txn)) {}

  // False once exhausted. |rid| may be nullptr.
  StatusOr<bool> Next(Record* dst, Rid* rid = nullptr);

  // Drains the rest.
  StatusOr<std::vector<Record>> ToVector();
  StatusOr<std::vector<std::pair<Rid, Record>>> ToVectorWithRid();

  friend std::ostream& operator<<(std::ostream& o, const ResultSet& rs) {
    rs.exec_->Dump(o, 0);
    return o;
  }

 private:
  Executor exec_;
  std::shared_ptr<const PageSource> source_;
  std::shared_ptr<const Transaction> txn_;
  bool done_ = false;
};

}  // namespace structsy

#endif  // STRUCTSY_RESULT_SET_HPP
