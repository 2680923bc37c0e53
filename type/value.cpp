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

#include "type/value.hpp"

#include <algorithm>
#include <cmath>

#include "common/debug.hpp"
#include "type/record.hpp"

namespace structsy {

std::string_view ToString(ValueKind kind) {
  switch (kind) {
    case ValueKind::kNull:
      return "Null";
    case ValueKind::kInteger:
      return "Integer";
    case ValueKind::kUnsigned:
      return "Unsigned";
    case ValueKind::kFloat:
      return "Float";
    case ValueKind::kBool:
      return "Bool";
    case ValueKind::kString:
      return "String";
    case ValueKind::kBytes:
      return "Bytes";
    case ValueKind::kRid:
      return "Rid";
    case ValueKind::kRecord:
      return "Record";
    case ValueKind::kList:
      return "List";
  }
  return "?";
}

Value::Value(Record record)
    : kind_(ValueKind::kRecord), elements_(std::move(record.values)) {}

Value Value::Integer(__int128 v) {
  Value ret;
  ret.kind_ = ValueKind::kInteger;
  ret.scalar_.i = v;
  return ret;
}

Value Value::Unsigned(unsigned __int128 v) {
  Value ret;
  ret.kind_ = ValueKind::kUnsigned;
  ret.scalar_.u = v;
  return ret;
}

Value Value::Bytes(std::string v) {
  Value ret;
  ret.kind_ = ValueKind::kBytes;
  ret.str_ = std::move(v);
  return ret;
}

Value Value::List(std::vector<Value> elements) {
  Value ret;
  ret.kind_ = ValueKind::kList;
  ret.elements_ = std::move(elements);
  return ret;
}

Record Value::AsRecord() const { return Record(elements_); }

long double Value::AsLongDouble() const {
  switch (kind_) {
    case ValueKind::kInteger:
      return static_cast<long double>(scalar_.i);
    case ValueKind::kUnsigned:
      return static_cast<long double>(scalar_.u);
    case ValueKind::kFloat:
      return scalar_.f;
    default:
      return 0;
  }
}

namespace {

template <typename T>
int ThreeWay(const T& a, const T& b) {
  if (a < b) {
    return -1;
  }
  if (b < a) {
    return 1;
  }
  return 0;
}

int CompareNumeric(const Value& a, const Value& b) {
  if (a.Kind() == b.Kind()) {
    switch (a.Kind()) {
      case ValueKind::kInteger:
        return ThreeWay(a.AsInteger(), b.AsInteger());
      case ValueKind::kUnsigned:
        return ThreeWay(a.AsUnsigned(), b.AsUnsigned());
      default:
        break;
    }
  }
  if (a.Kind() != ValueKind::kFloat && b.Kind() != ValueKind::kFloat) {
    // One signed, one unsigned.
    const bool a_negative =
        a.Kind() == ValueKind::kInteger && a.AsInteger() < 0;
    const bool b_negative =
        b.Kind() == ValueKind::kInteger && b.AsInteger() < 0;
    if (a_negative != b_negative) {
      return a_negative ? -1 : 1;
    }
    if (a_negative) {
      return ThreeWay(a.AsInteger(), b.AsInteger());
    }
    const auto ua = a.Kind() == ValueKind::kInteger
                        ? static_cast<unsigned __int128>(a.AsInteger())
                        : a.AsUnsigned();
    const auto ub = b.Kind() == ValueKind::kInteger
                        ? static_cast<unsigned __int128>(b.AsInteger())
                        : b.AsUnsigned();
    return ThreeWay(ua, ub);
  }
  const long double x = a.AsLongDouble();
  const long double y = b.AsLongDouble();
  // NaN sorts after every number and equals itself.
  if (std::isnan(x) || std::isnan(y)) {
    return ThreeWay(std::isnan(x), std::isnan(y));
  }
  return ThreeWay(x, y);
}

}  // namespace

int Value::Compare(const Value& rhs) const {
  if (IsNumeric() && rhs.IsNumeric()) {
    return CompareNumeric(*this, rhs);
  }
  if (kind_ != rhs.kind_) {
    if (IsNull() || rhs.IsNull()) {
      return IsNull() ? 1 : -1;
    }
    // Strings and bytes share one order.
    const bool textual = (kind_ == ValueKind::kString ||
                          kind_ == ValueKind::kBytes) &&
                         (rhs.kind_ == ValueKind::kString ||
                          rhs.kind_ == ValueKind::kBytes);
    if (!textual) {
      return ThreeWay(kind_, rhs.kind_);
    }
  }
  switch (kind_) {
    case ValueKind::kNull:
      return 0;
    case ValueKind::kBool:
      return ThreeWay(scalar_.b, rhs.scalar_.b);
    case ValueKind::kString:
    case ValueKind::kBytes:
      return str_.compare(rhs.str_) < 0 ? -1 : (str_ == rhs.str_ ? 0 : 1);
    case ValueKind::kRid:
      return ThreeWay(rid_, rhs.rid_);
    case ValueKind::kRecord:
    case ValueKind::kList: {
      const size_t common = std::min(elements_.size(), rhs.elements_.size());
      for (size_t i = 0; i < common; ++i) {
        const int cmp = elements_[i].Compare(rhs.elements_[i]);
        if (cmp != 0) {
          return cmp;
        }
      }
      return ThreeWay(elements_.size(), rhs.elements_.size());
    }
    default:
      return 0;
  }
}

std::string Int128ToString(__int128 v) {
  if (v < 0) {
    return "-" + Uint128ToString(-static_cast<unsigned __int128>(v));
  }
  return Uint128ToString(static_cast<unsigned __int128>(v));
}

std::string Uint128ToString(unsigned __int128 v) {
  if (v == 0) {
    return "0";
  }
  std::string ret;
  while (0 < v) {
    ret.push_back(static_cast<char>('0' + static_cast<int>(v % 10)));
    v /= 10;
  }
  std::reverse(ret.begin(), ret.end());
  return ret;
}

std::string Value::AsDebugString() const {
  switch (kind_) {
    case ValueKind::kNull:
      return "null";
    case ValueKind::kInteger:
      return Int128ToString(scalar_.i);
    case ValueKind::kUnsigned:
      return Uint128ToString(scalar_.u);
    case ValueKind::kFloat:
      return std::to_string(scalar_.f);
    case ValueKind::kBool:
      return scalar_.b ? "true" : "false";
    case ValueKind::kString:
      return "\"" + str_ + "\"";
    case ValueKind::kBytes:
      return Hex(str_);
    case ValueKind::kRid:
      return rid_.ToString();
    case ValueKind::kRecord:
    case ValueKind::kList: {
      std::string ret = kind_ == ValueKind::kRecord ? "{" : "[";
      for (size_t i = 0; i < elements_.size(); ++i) {
        if (0 < i) {
          ret += ", ";
        }
        ret += elements_[i].AsDebugString();
      }
      ret += kind_ == ValueKind::kRecord ? "}" : "]";
      return ret;
    }
  }
  return "?";
}

std::ostream& operator<<(std::ostream& o, const Value& v) {
  o << v.AsDebugString();
  return o;
}

}  // namespace structsy
