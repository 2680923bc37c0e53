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

#ifndef STRUCTSY_VALUE_HPP
#define STRUCTSY_VALUE_HPP

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "type/rid.hpp"

namespace structsy {

struct Record;

enum class ValueKind : uint8_t {
  kNull,
  kInteger,
  kUnsigned,
  kFloat,
  kBool,
  kString,
  kBytes,
  kRid,
  kRecord,
  kList,
};

std::string_view ToString(ValueKind kind);

// A dynamically typed field value. Integers keep full 128-bit range so
// every declared width fits.
class Value {
 public:
  Value() = default;
  explicit Value(int32_t v) : kind_(ValueKind::kInteger) { scalar_.i = v; }
  explicit Value(int64_t v) : kind_(ValueKind::kInteger) { scalar_.i = v; }
  explicit Value(uint32_t v) : kind_(ValueKind::kUnsigned) { scalar_.u = v; }
  explicit Value(uint64_t v) : kind_(ValueKind::kUnsigned) { scalar_.u = v; }
  explicit Value(double v) : kind_(ValueKind::kFloat) { scalar_.f = v; }
  explicit Value(bool v) : kind_(ValueKind::kBool) { scalar_.b = v; }
  explicit Value(const char* v) : kind_(ValueKind::kString), str_(v) {}
  explicit Value(std::string v) : kind_(ValueKind::kString), str_(std::move(v)) {}
  explicit Value(const Rid& rid) : kind_(ValueKind::kRid), rid_(rid) {}
  explicit Value(Record record);

  static Value Integer(__int128 v);
  static Value Unsigned(unsigned __int128 v);
  static Value Bytes(std::string v);
  static Value List(std::vector<Value> elements);

  [[nodiscard]] ValueKind Kind() const { return kind_; }
  [[nodiscard]] bool IsNull() const { return kind_ == ValueKind::kNull; }
  [[nodiscard]] bool IsNumeric() const {
    return kind_ == ValueKind::kInteger || kind_ == ValueKind::kUnsigned ||
           kind_ == ValueKind::kFloat;
  }

  [[nodiscard]] __int128 AsInteger() const { return scalar_.i; }
  [[nodiscard]] unsigned __int128 AsUnsigned() const { return scalar_.u; }
  [[nodiscard]] double AsFloat() const { return scalar_.f; }
  [[nodiscard]] bool AsBool() const { return scalar_.b; }
  // String or bytes.
  [[nodiscard]] const std::string& AsString() const { return str_; }
  [[nodiscard]] const Rid& AsRid() const { return rid_; }
  // Fields of an embedded record, or elements of a list.
  [[nodiscard]] const std::vector<Value>& Elements() const {
    return elements_;
  }
  std::vector<Value>& MutableElements() { return elements_; }
  [[nodiscard]] Record AsRecord() const;

  // Numeric view for comparisons across integer and float kinds.
  [[nodiscard]] long double AsLongDouble() const;

  // Three-way comparison. Values of unrelated kinds order by kind; nulls
  // sort last.
  [[nodiscard]] int Compare(const Value& rhs) const;

  bool operator==(const Value& rhs) const { return Compare(rhs) == 0; }
  bool operator!=(const Value& rhs) const { return Compare(rhs) != 0; }
  bool operator<(const Value& rhs) const { return Compare(rhs) < 0; }

  [[nodiscard]] std::string AsDebugString() const;
  friend std::ostream& operator<<(std::ostream& o, const Value& v);

 private:
  ValueKind kind_ = ValueKind::kNull;
  union {
    __int128 i;
    unsigned __int128 u;
    double f;
    bool b;
  } scalar_{0};
  std::string str_;
  Rid rid_;
  std::vector<Value> elements_;
};

std::string Int128ToString(__int128 v);
std::string Uint128ToString(unsigned __int128 v);

}  // namespace structsy

#endif  // STRUCTSY_VALUE_HPP
