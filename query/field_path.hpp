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

#ifndef STRUCTSY_FIELD_PATH_HPP
#define STRUCTSY_FIELD_PATH_HPP

#include <string>
#include <string_view>
#include <vector>

#include "common/status_or.hpp"
#include "type/record.hpp"
#include "type/struct_descriptor.hpp"

namespace structsy {

// A dotted path like "address.city" resolved to field positions. Every
// step but the last goes through an Embedded (or optional Embedded) field.
struct FieldPath {
  static StatusOr<FieldPath> Resolve(const StructDescriptor& desc,
                                     std::string_view path,
                                     const SchemaResolver& resolver);

  // The value at the path. Null when an optional step is absent.
  [[nodiscard]] Value Extract(const Record& record) const;
  [[nodiscard]] bool IsTopLevel() const { return indices.size() == 1; }

  std::string path;
  std::vector<size_t> indices;
  // Type of the last field.
  FieldType type;
};

}  // namespace structsy

#endif  // STRUCTSY_FIELD_PATH_HPP
