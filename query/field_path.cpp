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

#include "query/field_path.hpp"

#include "common/log_message.hpp"

namespace structsy {

StatusOr<FieldPath> FieldPath::Resolve(const StructDescriptor& desc,
                                       std::string_view path,
                                       const SchemaResolver& resolver) {
  FieldPath ret;
  ret.path = std::string(path);
  const StructDescriptor* current = &desc;
  std::shared_ptr<const StructDescriptor> holder;
  std::string_view rest = path;
  for (;;) {
    const size_t dot = rest.find('.');
    const std::string_view name = rest.substr(0, dot);
    const int idx = current->FieldIndex(name);
    if (idx < 0) {
      LOG(WARN) << current->Name() << " has no field " << name << " for "
                << path;
      return Status::kInvalidArgument;
    }
    ret.indices.push_back(idx);
    ret.type = current->GetField(idx).type;
    if (dot == std::string_view::npos) {
      return ret;
    }
    const FieldType& step = ret.type.IsOption() ? ret.type.Element() : ret.type;
    if (step.Kind() != FieldKind::kEmbedded) {
      LOG(WARN) << name << " in " << path << " is not an embedded struct";
      return Status::kInvalidArgument;
    }
    ASSIGN_OR_RETURN(std::shared_ptr<const StructDescriptor>, next,
                     resolver.ResolveStruct(step.TypeName()));
    holder = std::move(next);
    current = holder.get();
    rest = rest.substr(dot + 1);
  }
}

Value FieldPath::Extract(const Record& record) const {
  Value current = record.Get(indices[0]);
  for (size_t i = 1; i < indices.size(); ++i) {
    if (current.IsNull()) {
      return current;
    }
    Value next = current.Elements()[indices[i]];
    current = std::move(next);
  }
  return current;
}

}  // namespace structsy
