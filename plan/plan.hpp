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

#ifndef STRUCTSY_PLAN_HPP
#define STRUCTSY_PLAN_HPP

#include <cstddef>
#include <memory>
#include <ostream>
#include <sstream>
#include <string>

#include "executor/executor_base.hpp"
#include "query/filter.hpp"

namespace structsy {
class PageSource;
class Table;

// What executors need at run time: the page view to read through and the
// way to follow references.
struct ExecContext {
  const PageSource* src = nullptr;
  FilterContext filter_ctx;
};

class PlanBase {
 public:
  PlanBase() = default;
  PlanBase(const PlanBase&) = delete;
  PlanBase& operator=(const PlanBase&) = delete;
  PlanBase(PlanBase&&) = delete;
  PlanBase& operator=(PlanBase&&) = delete;
  virtual ~PlanBase() = default;

  [[nodiscard]] virtual Executor EmitExecutor(const ExecContext& ctx) const = 0;

  [[nodiscard]] virtual const Table& ScanSource() const = 0;

  virtual void Dump(std::ostream& o, int indent) const = 0;
  [[nodiscard]] std::string ToString() const {
    std::stringstream ss;
    Dump(ss, 0);
    return ss.str();
  }
};

typedef std::shared_ptr<PlanBase> Plan;

inline std::ostream& operator<<(std::ostream& o, const Plan& p) {
  if (p) {
    p->Dump(o, 0);
  } else {
    o << "(null plan)";
  }
  return o;
}

}  // namespace structsy

#endif  // STRUCTSY_PLAN_HPP
