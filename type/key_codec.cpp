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

#include "type/key_codec.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>

#include "common/serdes.hpp"

namespace structsy {

namespace {

constexpr size_t kGroupSize = 8;
constexpr char kMoreGroups = kGroupSize + 1;

void AppendBigEndian(std::string* dst, unsigned __int128 v, size_t width) {
  for (size_t i = 0; i < width; ++i) {
    dst->push_back(static_cast<char>(v >> (8 * (width - 1 - i))));
  }
}

bool EncodeInteger(const FieldType& type, const Value& value,
                   std::string* dst) {
  const size_t width = type.IntegerWidth();
  const size_t bits = width * 8;
  unsigned __int128 raw = 0;
  if (value.Kind() == ValueKind::kInteger) {
    const __int128 v = value.AsInteger();
    if (type.IsUnsigned()) {
      if (v < 0 ||
          (bits < 128 && static_cast<unsigned __int128>(v) >> bits != 0)) {
        return false;
      }
    } else if (bits < 128) {
      const __int128 limit = static_cast<__int128>(1) << (bits - 1);
      if (v < -limit || limit <= v) {
        return false;
      }
    }
    raw = static_cast<unsigned __int128>(v);
  } else if (value.Kind() == ValueKind::kUnsigned) {
    raw = value.AsUnsigned();
    const size_t usable = type.IsUnsigned() ? bits : bits - 1;
    if (usable < 128 && raw >> usable != 0) {
      return false;
    }
  } else {
    return false;
  }
  if (type.IsSigned()) {
    // Flip the sign bit so negatives sort first.
    raw ^= static_cast<unsigned __int128>(1) << (bits - 1);
  }
  AppendBigEndian(dst, raw, width);
  return true;
}

void EncodeDouble(double d, std::string* dst) {
  if (std::isnan(d)) {
    d = std::numeric_limits<double>::quiet_NaN();
  } else if (d == 0.0) {
    d = 0.0;
  }
  uint64_t bits = 0;
  memcpy(&bits, &d, sizeof(bits));
  if (std::isnan(d)) {
    bits = 0x7ff8000000000000ULL;
  }
  bits = (bits >> 63) != 0 ? ~bits : bits | (1ULL << 63);
  AppendBigEndian64(dst, bits);
}

void EncodeFloat(float f, std::string* dst) {
  if (std::isnan(f)) {
    f = std::numeric_limits<float>::quiet_NaN();
  } else if (f == 0.0F) {
    f = 0.0F;
  }
  uint32_t bits = 0;
  memcpy(&bits, &f, sizeof(bits));
  if (std::isnan(f)) {
    bits = 0x7fc00000U;
  }
  bits = (bits >> 31) != 0 ? ~bits : bits | (1U << 31);
  AppendBigEndian32(dst, bits);
}

void EncodeBytes(std::string_view bytes, std::string* dst) {
  while (true) {
    const size_t len = std::min(kGroupSize, bytes.size());
    dst->append(bytes.data(), len);
    dst->append(kGroupSize - len, '\0');
    if (kGroupSize < bytes.size()) {
      dst->push_back(kMoreGroups);
      bytes.remove_prefix(kGroupSize);
    } else {
      dst->push_back(static_cast<char>(len));
      break;
    }
  }
}

}  // namespace

StatusOr<std::string> EncodeKey(const FieldType& key_type, const Value& value) {
  std::string ret;
  switch (key_type.Kind()) {
    case FieldKind::kF32:
      if (!value.IsNumeric()) {
        return Status::kInvalidArgument;
      }
      EncodeFloat(static_cast<float>(value.AsLongDouble()), &ret);
      break;
    case FieldKind::kF64:
      if (!value.IsNumeric()) {
        return Status::kInvalidArgument;
      }
      EncodeDouble(static_cast<double>(value.AsLongDouble()), &ret);
      break;
    case FieldKind::kBool:
      if (value.Kind() != ValueKind::kBool) {
        return Status::kInvalidArgument;
      }
      ret.push_back(value.AsBool() ? 1 : 0);
      break;
    case FieldKind::kString:
      if (value.Kind() != ValueKind::kString) {
        return Status::kInvalidArgument;
      }
      EncodeBytes(value.AsString(), &ret);
      break;
    case FieldKind::kBytes:
      if (value.Kind() != ValueKind::kBytes &&
          value.Kind() != ValueKind::kString) {
        return Status::kInvalidArgument;
      }
      EncodeBytes(value.AsString(), &ret);
      break;
    case FieldKind::kRef: {
      if (value.Kind() != ValueKind::kRid) {
        return Status::kInvalidArgument;
      }
      const Rid& rid = value.AsRid();
      AppendBigEndian32(&ret, rid.type_id);
      AppendBigEndian64(&ret, rid.page_id);
      AppendBigEndian16(&ret, rid.slot);
      AppendBigEndian32(&ret, rid.generation);
      break;
    }
    case FieldKind::kEmbedded:
    case FieldKind::kOption:
    case FieldKind::kVec:
      return Status::kInvalidArgument;
    default:
      if (!EncodeInteger(key_type, value, &ret)) {
        return Status::kInvalidArgument;
      }
      break;
  }
  return ret;
}

bool IsExactKey(const FieldType& key_type, const Value& value) {
  switch (key_type.Kind()) {
    case FieldKind::kF32: {
      const float narrowed = static_cast<float>(value.AsLongDouble());
      return Value(static_cast<double>(narrowed)).Compare(value) == 0;
    }
    case FieldKind::kF64: {
      const double narrowed = static_cast<double>(value.AsLongDouble());
      return Value(narrowed).Compare(value) == 0;
    }
    default:
      return true;
  }
}

StatusOr<std::vector<std::string>> IndexKeysOf(const FieldType& field_type,
                                               const Value& value) {
  std::vector<std::string> keys;
  if (field_type.IsOption()) {
    if (!value.IsNull()) {
      ASSIGN_OR_RETURN(std::string, key,
                       EncodeKey(field_type.Element(), value));
      keys.push_back(std::move(key));
    }
    return keys;
  }
  if (field_type.IsVec()) {
    for (const Value& elm : value.Elements()) {
      ASSIGN_OR_RETURN(std::string, key, EncodeKey(field_type.Element(), elm));
      keys.push_back(std::move(key));
    }
    std::sort(keys.begin(), keys.end());
    keys.erase(std::unique(keys.begin(), keys.end()), keys.end());
    return keys;
  }
  ASSIGN_OR_RETURN(std::string, key, EncodeKey(field_type, value));
  keys.push_back(std::move(key));
  return keys;
}

std::string PrefixSuccessor(std::string_view prefix) {
  std::string ret(prefix);
  while (!ret.empty()) {
    auto last = static_cast<unsigned char>(ret.back());
    if (last != 0xff) {
      ret.back() = static_cast<char>(last + 1);
      return ret;
    }
    ret.pop_back();
  }
  return ret;
}

}  // namespace structsy
