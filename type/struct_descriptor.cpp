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

#include "type/struct_descriptor.hpp"

#include <set>
#include <sstream>

#include "common/checksum.hpp"
#include "common/log_message.hpp"

namespace structsy {

std::string_view ToString(IndexMode mode) {
  switch (mode) {
    case IndexMode::kNone:
      return "none";
    case IndexMode::kCluster:
      return "cluster";
    case IndexMode::kExclusive:
      return "exclusive";
  }
  return "?";
}

StructDescriptor::StructDescriptor(std::string_view name,
                                   std::vector<FieldDescriptor> fields)
    : name_(name), fields_(std::move(fields)) {}

int StructDescriptor::FieldIndex(std::string_view name) const {
  for (size_t i = 0; i < fields_.size(); ++i) {
    if (fields_[i].name == name) {
      return static_cast<int>(i);
    }
  }
  return -1;
}

uint64_t StructDescriptor::StructuralHash() const {
  return Fnv1a(Encode(*this));
}

namespace {

Status CheckReferences(const FieldType& type, const SchemaResolver& resolver,
                       std::string_view owner) {
  switch (type.Kind()) {
    case FieldKind::kEmbedded:
      if (type.TypeName() == owner) {
        LOG(WARN) << owner << " embeds itself";
        return Status::kInvalidArgument;
      }
      [[fallthrough]];
    case FieldKind::kRef:
      if (type.TypeName() == owner) {
        // Self references are fine; the type is being defined.
        return Status::kSuccess;
      }
      if (!resolver.ResolveStruct(type.TypeName()).HasValue()) {
        LOG(WARN) << owner << " refers to undefined struct "
                  << type.TypeName();
        return Status::kStructNotDefined;
      }
      return Status::kSuccess;
    case FieldKind::kOption:
    case FieldKind::kVec:
      return CheckReferences(type.Element(), resolver, owner);
    default:
      return Status::kSuccess;
  }
}

}  // namespace

Status StructDescriptor::Validate(const SchemaResolver& resolver) const {
  if (name_.empty()) {
    LOG(WARN) << "struct without a name";
    return Status::kInvalidArgument;
  }
  std::set<std::string_view> field_names;
  std::set<std::string_view> index_names;
  for (const auto& field : fields_) {
    if (field.name.empty() || !field_names.insert(field.name).second) {
      LOG(WARN) << name_ << " has an empty or duplicated field name '"
                << field.name << "'";
      return Status::kInvalidArgument;
    }
    if (field.IsIndexed()) {
      if (!field.type.IsIndexable()) {
        LOG(WARN) << name_ << "." << field.name << " of type " << field.type
                  << " cannot be indexed";
        return Status::kInvalidArgument;
      }
      if (field.index.name.empty() ||
          !index_names.insert(field.index.name).second) {
        LOG(WARN) << name_ << " declares index '" << field.index.name
                  << "' twice";
        return Status::kInvalidArgument;
      }
    }
    RETURN_IF_FAIL(CheckReferences(field.type, resolver, name_));
  }
  return Status::kSuccess;
}

std::ostream& operator<<(std::ostream& o, const StructDescriptor& s) {
  o << s.name_ << "{";
  for (size_t i = 0; i < s.fields_.size(); ++i) {
    if (0 < i) {
      o << ", ";
    }
    const FieldDescriptor& f = s.fields_[i];
    o << f.name << ": " << f.type;
    if (f.IsIndexed()) {
      o << "[" << ToString(f.index.mode) << " " << f.index.name << "]";
    }
  }
  o << "}";
  return o;
}

Encoder& operator<<(Encoder& e, const StructDescriptor& s) {
  e << s.name_ << static_cast<uint32_t>(s.fields_.size());
  for (const auto& f : s.fields_) {
    e << f.name << f.type << static_cast<uint8_t>(f.index.mode)
      << f.index.name;
  }
  return e;
}

Decoder& operator>>(Decoder& d, StructDescriptor& s) {
  uint32_t count = 0;
  d >> s.name_ >> count;
  s.fields_.clear();
  for (uint32_t i = 0; i < count && d.IsValid(); ++i) {
    FieldDescriptor f;
    uint8_t mode = 0;
    d >> f.name >> f.type >> mode >> f.index.name;
    if (static_cast<uint8_t>(IndexMode::kExclusive) < mode) {
      d.Fail();
      break;
    }
    f.index.mode = static_cast<IndexMode>(mode);
    s.fields_.push_back(std::move(f));
  }
  return d;
}

}  // namespace structsy
