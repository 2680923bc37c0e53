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

#include "type/field_type.hpp"

namespace structsy {

namespace {

// Option<Option<Vec<...>>> nests at most this deep on disk.
constexpr int kMaxNesting = 8;

Decoder& DecodeFieldType(Decoder& d, FieldType& t, int depth);

}  // namespace

std::string_view ToString(FieldKind kind) {
  switch (kind) {
    case FieldKind::kU8:
      return "u8";
    case FieldKind::kU16:
      return "u16";
    case FieldKind::kU32:
      return "u32";
    case FieldKind::kU64:
      return "u64";
    case FieldKind::kU128:
      return "u128";
    case FieldKind::kI8:
      return "i8";
    case FieldKind::kI16:
      return "i16";
    case FieldKind::kI32:
      return "i32";
    case FieldKind::kI64:
      return "i64";
    case FieldKind::kI128:
      return "i128";
    case FieldKind::kF32:
      return "f32";
    case FieldKind::kF64:
      return "f64";
    case FieldKind::kBool:
      return "bool";
    case FieldKind::kString:
      return "string";
    case FieldKind::kBytes:
      return "bytes";
    case FieldKind::kRef:
      return "Ref";
    case FieldKind::kEmbedded:
      return "Embedded";
    case FieldKind::kOption:
      return "Option";
    case FieldKind::kVec:
      return "Vec";
  }
  return "?";
}

FieldType FieldType::Ref(std::string_view type_name) {
  FieldType ret(FieldKind::kRef);
  ret.type_name_ = type_name;
  return ret;
}

FieldType FieldType::Embedded(std::string_view type_name) {
  FieldType ret(FieldKind::kEmbedded);
  ret.type_name_ = type_name;
  return ret;
}

FieldType FieldType::Option(const FieldType& element) {
  FieldType ret(FieldKind::kOption);
  ret.element_ = std::make_shared<const FieldType>(element);
  return ret;
}

FieldType FieldType::Vec(const FieldType& element) {
  FieldType ret(FieldKind::kVec);
  ret.element_ = std::make_shared<const FieldType>(element);
  return ret;
}

bool FieldType::IsIndexable() const {
  if (IsScalar()) {
    return true;
  }
  return (IsOption() || IsVec()) && Element().IsScalar();
}

size_t FieldType::IntegerWidth() const {
  switch (kind_) {
    case FieldKind::kU8:
    case FieldKind::kI8:
      return 1;
    case FieldKind::kU16:
    case FieldKind::kI16:
      return 2;
    case FieldKind::kU32:
    case FieldKind::kI32:
      return 4;
    case FieldKind::kU64:
    case FieldKind::kI64:
      return 8;
    case FieldKind::kU128:
    case FieldKind::kI128:
      return 16;
    default:
      return 0;
  }
}

std::string FieldType::ToString() const {
  switch (kind_) {
    case FieldKind::kRef:
    case FieldKind::kEmbedded:
      return std::string(structsy::ToString(kind_)) + "<" + type_name_ + ">";
    case FieldKind::kOption:
    case FieldKind::kVec:
      return std::string(structsy::ToString(kind_)) + "<" +
             element_->ToString() + ">";
    default:
      return std::string(structsy::ToString(kind_));
  }
}

bool FieldType::operator==(const FieldType& rhs) const {
  if (kind_ != rhs.kind_ || type_name_ != rhs.type_name_) {
    return false;
  }
  if (element_ == nullptr || rhs.element_ == nullptr) {
    return element_ == rhs.element_;
  }
  return *element_ == *rhs.element_;
}

Encoder& operator<<(Encoder& e, const FieldType& t) {
  e << static_cast<uint8_t>(t.kind_);
  switch (t.kind_) {
    case FieldKind::kRef:
    case FieldKind::kEmbedded:
      e << t.type_name_;
      break;
    case FieldKind::kOption:
    case FieldKind::kVec:
      e << *t.element_;
      break;
    default:
      break;
  }
  return e;
}

namespace {

Decoder& DecodeFieldType(Decoder& d, FieldType& t, int depth) {
  uint8_t kind = 0;
  d >> kind;
  if (static_cast<uint8_t>(FieldKind::kVec) < kind || kMaxNesting < depth) {
    d.Fail();
    return d;
  }
  switch (static_cast<FieldKind>(kind)) {
    case FieldKind::kRef:
    case FieldKind::kEmbedded: {
      std::string name;
      d >> name;
      t = static_cast<FieldKind>(kind) == FieldKind::kRef
              ? FieldType::Ref(name)
              : FieldType::Embedded(name);
      break;
    }
    case FieldKind::kOption:
    case FieldKind::kVec: {
      FieldType element;
      DecodeFieldType(d, element, depth + 1);
      t = static_cast<FieldKind>(kind) == FieldKind::kOption
              ? FieldType::Option(element)
              : FieldType::Vec(element);
      break;
    }
    default:
      t = FieldType(static_cast<FieldKind>(kind));
      break;
  }
  return d;
}

}  // namespace

Decoder& operator>>(Decoder& d, FieldType& t) {
  return DecodeFieldType(d, t, 0);
}

}  // namespace structsy
