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

#ifndef STRUCTSY_QUERY_HPP
#define STRUCTSY_QUERY_HPP

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "query/filter.hpp"

namespace structsy {

struct Ordering {
  // Field name, or a dotted path through embedded structs.
  std::string path;
  bool ascending = true;
};

// Which records of a type to read, in what order, and how many.
class Query {
 public:
  explicit Query(std::string_view type_name) : type_name_(type_name) {}

  // Adds a condition. All conditions must hold.
  Query& Where(Filter filter) {
    conditions_.push_back(std::move(filter));
    return *this;
  }
  Query& OrderBy(std::string_view path, bool ascending = true) {
    orderings_.push_back({std::string(path), ascending});
    return *this;
  }
  Query& Limit(size_t limit) {
    limit_ = limit;
    return *this;
  }
  // Yields records holding only |fields|, in that order.
  Query& Project(std::vector<std::string> fields) {
    projection_ = std::move(fields);
    return *this;
  }

  [[nodiscard]] const std::string& TypeName() const { return type_name_; }
  [[nodiscard]] const std::vector<Filter>& Conditions() const {
    return conditions_;
  }
  // Conditions with nested ANDs flattened into one list.
  [[nodiscard]] std::vector<Filter> TopLevelConditions() const;
  [[nodiscard]] const std::vector<Ordering>& Orderings() const {
    return orderings_;
  }
  [[nodiscard]] const std::optional<size_t>& GetLimit() const {
    return limit_;
  }
  [[nodiscard]] const std::optional<std::vector<std::string>>& Projection()
      const {
    return projection_;
  }

  friend std::ostream& operator<<(std::ostream& o, const Query& q);

 private:
  std::string type_name_;
  std::vector<Filter> conditions_;
  std::vector<Ordering> orderings_;
  std::optional<size_t> limit_;
  std::optional<std::vector<std::string>> projection_;
};

}  // namespace structsy

#endif  // STRUCTSY_QUERY_HPP
