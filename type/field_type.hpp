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

#ifndef STRUCTSY_FIELD_TYPE_HPP
#define STRUCTSY_FIELD_TYPE_HPP

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>

#include "common/decoder.hpp"
#include "common/encoder.hpp"

namespace structsy {

enum class FieldKind : uint8_t {
  kU8,
  kU16,
  kU32,
  kU64,
  kU128,
  kI8,
  kI16,
  kI32,
  kI64,
  kI128,
  kF32,
  kF64,
  kBool,
  kString,
  kBytes,
  kRef,
  kEmbedded,
  kOption,
  kVec,
};

std::string_view ToString(FieldKind kind);

// Semantic type of one field. Ref and Embedded name the struct they point
// at; Option and Vec wrap an element type.
class FieldType {
 public:
  FieldType() = default;
  explicit FieldType(FieldKind kind) : kind_(kind) {}

  static FieldType Ref(std::string_view type_name);
  static FieldType Embedded(std::string_view type_name);
  static FieldType Option(const FieldType& element);
  static FieldType Vec(const FieldType& element);

  [[nodiscard]] FieldKind Kind() const { return kind_; }
  [[nodiscard]] const std::string& TypeName() const { return type_name_; }
  // Precondition: Option or Vec.
  [[nodiscard]] const FieldType& Element() const { return *element_; }

  [[nodiscard]] bool IsUnsigned() const {
    return FieldKind::kU8 <= kind_ && kind_ <= FieldKind::kU128;
  }
  [[nodiscard]] bool IsSigned() const {
    return FieldKind::kI8 <= kind_ && kind_ <= FieldKind::kI128;
  }
  [[nodiscard]] bool IsInteger() const { return IsUnsigned() || IsSigned(); }
  [[nodiscard]] bool IsFloat() const {
    return kind_ == FieldKind::kF32 || kind_ == FieldKind::kF64;
  }
  // Types with a key encoding.
  [[nodiscard]] bool IsScalar() const {
    return kind_ <= FieldKind::kRef && kind_ != FieldKind::kEmbedded;
  }
  [[nodiscard]] bool IsOption() const { return kind_ == FieldKind::kOption; }
  [[nodiscard]] bool IsVec() const { return kind_ == FieldKind::kVec; }
  // Scalars, and Option or Vec of a scalar.
  [[nodiscard]] bool IsIndexable() const;
  // The type an index on this field is keyed by.
  [[nodiscard]] const FieldType& KeyType() const {
    return IsOption() || IsVec() ? Element() : *this;
  }
  // Bytes of an integer on disk.
  [[nodiscard]] size_t IntegerWidth() const;

  [[nodiscard]] std::string ToString() const;

  bool operator==(const FieldType& rhs) const;
  bool operator!=(const FieldType& rhs) const { return !operator==(rhs); }

  friend std::ostream& operator<<(std::ostream& o, const FieldType& t) {
    o << t.ToString();
    return o;
  }
  friend Encoder& operator<<(Encoder& e, const FieldType& t);
  friend Decoder& operator>>(Decoder& d, FieldType& t);

 private:
  FieldKind kind_ = FieldKind::kBool;
  std::string type_name_;
  std::shared_ptr<const FieldType> element_;
};

}  // namespace structsy

#endif  // STRUCTSY_FIELD_TYPE_HPP
