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

#ifndef STRUCTSY_STRUCT_DESCRIPTOR_HPP
#define STRUCTSY_STRUCT_DESCRIPTOR_HPP

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "common/constants.hpp"
#include "common/decoder.hpp"
#include "common/encoder.hpp"
#include "common/status_or.hpp"
#include "type/field_type.hpp"

namespace structsy {

enum class IndexMode : uint8_t {
  kNone,
  // Many records per key, kept in insertion order.
  kCluster,
  // At most one live record per key.
  kExclusive,
};

std::string_view ToString(IndexMode mode);

struct IndexDeclaration {
  IndexMode mode = IndexMode::kNone;
  // Defaults to the field name.
  std::string name;

  bool operator==(const IndexDeclaration& rhs) const = default;
};

struct FieldDescriptor {
  FieldDescriptor() = default;
  FieldDescriptor(std::string_view field_name, FieldType field_type,
                  IndexMode mode = IndexMode::kNone,
                  std::string_view index_name = "")
      : name(field_name), type(std::move(field_type)), index{mode, ""} {
    if (mode != IndexMode::kNone) {
      index.name = index_name.empty() ? name : std::string(index_name);
    }
  }

  [[nodiscard]] bool IsIndexed() const {
    return index.mode != IndexMode::kNone;
  }

  bool operator==(const FieldDescriptor& rhs) const = default;

  std::string name;
  FieldType type;
  IndexDeclaration index;
};

class StructDescriptor;

// Looks up descriptors of other structs by name, for Ref and Embedded.
class SchemaResolver {
 public:
  virtual ~SchemaResolver() = default;
  // kStructNotDefined when |name| is unknown.
  [[nodiscard]] virtual StatusOr<std::shared_ptr<const StructDescriptor>>
  ResolveStruct(std::string_view name) const = 0;
};

class StructDescriptor {
 public:
  StructDescriptor() = default;
  StructDescriptor(std::string_view name, std::vector<FieldDescriptor> fields);

  [[nodiscard]] const std::string& Name() const { return name_; }
  [[nodiscard]] size_t FieldCount() const { return fields_.size(); }
  [[nodiscard]] const FieldDescriptor& GetField(size_t idx) const {
    return fields_[idx];
  }
  [[nodiscard]] const std::vector<FieldDescriptor>& Fields() const {
    return fields_;
  }
  // -1 when no field is called |name|.
  [[nodiscard]] int FieldIndex(std::string_view name) const;

  // Assigned by the registry on first define.
  [[nodiscard]] type_id_t TypeID() const { return type_id_; }
  void SetTypeID(type_id_t type_id) { type_id_ = type_id; }

  // FNV-1a over the canonical encoding of the name and the fields.
  [[nodiscard]] uint64_t StructuralHash() const;

  // Checks names and index declarations. Embedded and referenced structs
  // must be resolvable through |resolver|.
  [[nodiscard]] Status Validate(const SchemaResolver& resolver) const;

  bool operator==(const StructDescriptor& rhs) const {
    return name_ == rhs.name_ && fields_ == rhs.fields_;
  }

  friend std::ostream& operator<<(std::ostream& o, const StructDescriptor& s);
  friend Encoder& operator<<(Encoder& e, const StructDescriptor& s);
  friend Decoder& operator>>(Decoder& d, StructDescriptor& s);

 private:
  std::string name_;
  std::vector<FieldDescriptor> fields_;
  type_id_t type_id_ = 0;
};

}  // namespace structsy

#endif  // STRUCTSY_STRUCT_DESCRIPTOR_HPP
