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

#include "type/record_codec.hpp"

#include <cstring>
#include <limits>
#include <sstream>

#include "common/decoder.hpp"
#include "common/encoder.hpp"
#include "common/log_message.hpp"

namespace structsy {

namespace {

// Embedded records nest at most this deep.
constexpr int kMaxDepth = 32;

bool FitsInteger(const FieldType& type, const Value& value) {
  const size_t bits = type.IntegerWidth() * 8;
  if (value.Kind() == ValueKind::kInteger) {
    const __int128 v = value.AsInteger();
    if (type.IsUnsigned()) {
      return 0 <= v && (bits == 128 || static_cast<unsigned __int128>(v) >>
                                           bits == 0);
    }
    if (bits == 128) {
      return true;
    }
    const __int128 limit = static_cast<__int128>(1) << (bits - 1);
    return -limit <= v && v < limit;
  }
  if (value.Kind() == ValueKind::kUnsigned) {
    const unsigned __int128 v = value.AsUnsigned();
    if (type.IsUnsigned()) {
      return bits == 128 || v >> bits == 0;
    }
    return v >> (bits - 1) == 0;
  }
  return false;
}

void WriteInteger(Encoder& enc, const FieldType& type, const Value& value) {
  const unsigned __int128 raw =
      value.Kind() == ValueKind::kInteger
          ? static_cast<unsigned __int128>(value.AsInteger())
          : value.AsUnsigned();
  switch (type.IntegerWidth()) {
    case 1:
      enc << static_cast<uint8_t>(raw);
      break;
    case 2:
      enc << static_cast<uint16_t>(raw);
      break;
    case 4:
      enc << static_cast<uint32_t>(raw);
      break;
    case 8:
      enc << static_cast<uint64_t>(raw);
      break;
    default:
      enc << static_cast<uint64_t>(raw) << static_cast<uint64_t>(raw >> 64);
      break;
  }
}

Value ReadInteger(Decoder& dec, const FieldType& type) {
  switch (type.Kind()) {
    case FieldKind::kU8: {
      uint8_t v = 0;
      dec >> v;
      return Value::Unsigned(v);
    }
    case FieldKind::kU16: {
      uint16_t v = 0;
      dec >> v;
      return Value::Unsigned(v);
    }
    case FieldKind::kU32: {
      uint32_t v = 0;
      dec >> v;
      return Value::Unsigned(v);
    }
    case FieldKind::kU64: {
      uint64_t v = 0;
      dec >> v;
      return Value::Unsigned(v);
    }
    case FieldKind::kI8: {
      int8_t v = 0;
      dec >> v;
      return Value::Integer(v);
    }
    case FieldKind::kI16: {
      int16_t v = 0;
      dec >> v;
      return Value::Integer(v);
    }
    case FieldKind::kI32: {
      int32_t v = 0;
      dec >> v;
      return Value::Integer(v);
    }
    case FieldKind::kI64: {
      int64_t v = 0;
      dec >> v;
      return Value::Integer(v);
    }
    default: {
      uint64_t low = 0;
      uint64_t high = 0;
      dec >> low >> high;
      const unsigned __int128 raw =
          (static_cast<unsigned __int128>(high) << 64) | low;
      if (type.Kind() == FieldKind::kU128) {
        return Value::Unsigned(raw);
      }
      return Value::Integer(static_cast<__int128>(raw));
    }
  }
}

Status CheckValueAt(const FieldType& type, const Value& value,
                    const SchemaResolver& resolver, int depth);

Status CheckRecord(const StructDescriptor& desc, const Value& value,
                   const SchemaResolver& resolver, int depth) {
  if (kMaxDepth < depth) {
    return Status::kInvalidArgument;
  }
  const std::vector<Value>& fields = value.Elements();
  if (fields.size() != desc.FieldCount()) {
    LOG(WARN) << desc.Name() << " expects " << desc.FieldCount()
              << " fields, got " << fields.size();
    return Status::kInvalidArgument;
  }
  for (size_t i = 0; i < fields.size(); ++i) {
    Status s = CheckValueAt(desc.GetField(i).type, fields[i], resolver, depth);
    if (s != Status::kSuccess) {
      LOG(WARN) << desc.Name() << "." << desc.GetField(i).name << " of type "
                << desc.GetField(i).type << " cannot hold " << fields[i];
      return s;
    }
  }
  return Status::kSuccess;
}

Status CheckValueAt(const FieldType& type, const Value& value,
                    const SchemaResolver& resolver, int depth) {
  switch (type.Kind()) {
    case FieldKind::kF32:
    case FieldKind::kF64:
      return value.IsNumeric() ? Status::kSuccess : Status::kInvalidArgument;
    case FieldKind::kBool:
      return value.Kind() == ValueKind::kBool ? Status::kSuccess
                                              : Status::kInvalidArgument;
    case FieldKind::kString:
      if (value.Kind() != ValueKind::kString ||
          !IsValidUtf8(value.AsString()) ||
          std::numeric_limits<uint32_t>::max() < value.AsString().size()) {
        return Status::kInvalidArgument;
      }
      return Status::kSuccess;
    case FieldKind::kBytes:
      return value.Kind() == ValueKind::kBytes ||
                     value.Kind() == ValueKind::kString
                 ? Status::kSuccess
                 : Status::kInvalidArgument;
    case FieldKind::kRef: {
      if (value.Kind() != ValueKind::kRid) {
        return Status::kInvalidArgument;
      }
      ASSIGN_OR_RETURN(std::shared_ptr<const StructDescriptor>, target,
                       resolver.ResolveStruct(type.TypeName()));
      return value.AsRid().type_id == target->TypeID()
                 ? Status::kSuccess
                 : Status::kInvalidArgument;
    }
    case FieldKind::kEmbedded: {
      if (value.Kind() != ValueKind::kRecord) {
        return Status::kInvalidArgument;
      }
      ASSIGN_OR_RETURN(std::shared_ptr<const StructDescriptor>, inner,
                       resolver.ResolveStruct(type.TypeName()));
      return CheckRecord(*inner, value, resolver, depth + 1);
    }
    case FieldKind::kOption:
      if (value.IsNull()) {
        return Status::kSuccess;
      }
      return CheckValueAt(type.Element(), value, resolver, depth);
    case FieldKind::kVec:
      if (value.Kind() != ValueKind::kList ||
          std::numeric_limits<uint32_t>::max() < value.Elements().size()) {
        return Status::kInvalidArgument;
      }
      for (const Value& elm : value.Elements()) {
        RETURN_IF_FAIL(CheckValueAt(type.Element(), elm, resolver, depth));
      }
      return Status::kSuccess;
    default:
      return FitsInteger(type, value) ? Status::kSuccess
                                      : Status::kInvalidArgument;
  }
}

Status WriteValue(Encoder& enc, const FieldType& type, const Value& value,
                  const SchemaResolver& resolver) {
  switch (type.Kind()) {
    case FieldKind::kF32:
      enc << static_cast<float>(value.AsLongDouble());
      break;
    case FieldKind::kF64:
      enc << static_cast<double>(value.AsLongDouble());
      break;
    case FieldKind::kBool:
      enc << value.AsBool();
      break;
    case FieldKind::kString:
    case FieldKind::kBytes:
      enc << std::string_view(value.AsString());
      break;
    case FieldKind::kRef:
      enc << value.AsRid();
      break;
    case FieldKind::kEmbedded: {
      ASSIGN_OR_RETURN(std::shared_ptr<const StructDescriptor>, inner,
                       resolver.ResolveStruct(type.TypeName()));
      for (size_t i = 0; i < inner->FieldCount(); ++i) {
        RETURN_IF_FAIL(WriteValue(enc, inner->GetField(i).type,
                                  value.Elements()[i], resolver));
      }
      break;
    }
    case FieldKind::kOption:
      if (value.IsNull()) {
        enc << static_cast<uint8_t>(0);
      } else {
        enc << static_cast<uint8_t>(1);
        RETURN_IF_FAIL(WriteValue(enc, type.Element(), value, resolver));
      }
      break;
    case FieldKind::kVec:
      enc << static_cast<uint32_t>(value.Elements().size());
      for (const Value& elm : value.Elements()) {
        RETURN_IF_FAIL(WriteValue(enc, type.Element(), elm, resolver));
      }
      break;
    default:
      WriteInteger(enc, type, value);
      break;
  }
  return Status::kSuccess;
}

StatusOr<Value> ReadValue(Decoder& dec, const FieldType& type,
                          const SchemaResolver& resolver, int depth) {
  if (kMaxDepth < depth) {
    return Status::kBackingStoreError;
  }
  Value ret;
  switch (type.Kind()) {
    case FieldKind::kF32: {
      float f = 0;
      dec >> f;
      ret = Value(static_cast<double>(f));
      break;
    }
    case FieldKind::kF64: {
      double d = 0;
      dec >> d;
      ret = Value(d);
      break;
    }
    case FieldKind::kBool: {
      bool b = false;
      dec >> b;
      ret = Value(b);
      break;
    }
    case FieldKind::kString: {
      std::string str;
      dec >> str;
      if (dec.IsValid() && !IsValidUtf8(str)) {
        LOG(ERROR) << "stored string is not UTF-8";
        return Status::kBackingStoreError;
      }
      ret = Value(std::move(str));
      break;
    }
    case FieldKind::kBytes: {
      std::string bytes;
      dec >> bytes;
      ret = Value::Bytes(std::move(bytes));
      break;
    }
    case FieldKind::kRef: {
      Rid rid;
      dec >> rid;
      ret = Value(rid);
      break;
    }
    case FieldKind::kEmbedded: {
      StatusOr<std::shared_ptr<const StructDescriptor>> inner =
          resolver.ResolveStruct(type.TypeName());
      if (!inner.HasValue()) {
        return inner.GetStatus();
      }
      Record rec;
      rec.values.reserve(inner.Value()->FieldCount());
      for (const auto& field : inner.Value()->Fields()) {
        ASSIGN_OR_RETURN(Value, v, ReadValue(dec, field.type, resolver,
                                             depth + 1));
        rec.values.push_back(std::move(v));
      }
      ret = Value(std::move(rec));
      break;
    }
    case FieldKind::kOption: {
      uint8_t tag = 0;
      dec >> tag;
      if (1 < tag) {
        return Status::kBackingStoreError;
      }
      if (tag == 1) {
        return ReadValue(dec, type.Element(), resolver, depth);
      }
      break;
    }
    case FieldKind::kVec: {
      uint32_t count = 0;
      dec >> count;
      std::vector<Value> elements;
      for (uint32_t i = 0; i < count && dec.IsValid(); ++i) {
        ASSIGN_OR_RETURN(Value, v,
                         ReadValue(dec, type.Element(), resolver, depth));
        elements.push_back(std::move(v));
      }
      ret = Value::List(std::move(elements));
      break;
    }
    default:
      ret = ReadInteger(dec, type);
      break;
  }
  if (!dec.IsValid()) {
    return Status::kBackingStoreError;
  }
  return ret;
}

}  // namespace

bool IsValidUtf8(std::string_view str) {
  size_t i = 0;
  while (i < str.size()) {
    const auto c = static_cast<unsigned char>(str[i]);
    size_t extra = 0;
    uint32_t cp = 0;
    if (c < 0x80) {
      ++i;
      continue;
    }
    if ((c & 0xE0) == 0xC0) {
      extra = 1;
      cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      extra = 2;
      cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      extra = 3;
      cp = c & 0x07;
    } else {
      return false;
    }
    if (str.size() <= i + extra) {
      return false;
    }
    for (size_t j = 1; j <= extra; ++j) {
      const auto cc = static_cast<unsigned char>(str[i + j]);
      if ((cc & 0xC0) != 0x80) {
        return false;
      }
      cp = (cp << 6) | (cc & 0x3F);
    }
    // Overlong forms, surrogates and values past U+10FFFF.
    static constexpr uint32_t kMinForLength[] = {0, 0x80, 0x800, 0x10000};
    if (cp < kMinForLength[extra] || (0xD800 <= cp && cp <= 0xDFFF) ||
        0x10FFFF < cp) {
      return false;
    }
    i += extra + 1;
  }
  return true;
}

Status CheckValue(const FieldType& type, const Value& value,
                  const SchemaResolver& resolver) {
  return CheckValueAt(type, value, resolver, 0);
}

StatusOr<std::string> EncodeRecord(const StructDescriptor& desc,
                                   const Record& record,
                                   const SchemaResolver& resolver) {
  if (record.Size() != desc.FieldCount()) {
    LOG(WARN) << desc.Name() << " expects " << desc.FieldCount()
              << " fields, got " << record.Size();
    return Status::kInvalidArgument;
  }
  for (size_t i = 0; i < record.Size(); ++i) {
    Status s = CheckValueAt(desc.GetField(i).type, record.values[i], resolver,
                            0);
    if (s != Status::kSuccess) {
      LOG(WARN) << desc.Name() << "." << desc.GetField(i).name << " of type "
                << desc.GetField(i).type << " cannot hold "
                << record.values[i];
      return s == Status::kStructNotDefined ? s : Status::kInvalidArgument;
    }
  }
  std::stringstream ss;
  Encoder enc(ss);
  for (size_t i = 0; i < record.Size(); ++i) {
    RETURN_IF_FAIL(
        WriteValue(enc, desc.GetField(i).type, record.values[i], resolver));
  }
  return ss.str();
}

StatusOr<Record> DecodeRecord(const StructDescriptor& desc,
                              std::string_view bytes,
                              const SchemaResolver& resolver) {
  std::string buffer(bytes);
  std::stringstream ss(buffer);
  Decoder dec(ss);
  Record ret;
  ret.values.reserve(desc.FieldCount());
  for (const auto& field : desc.Fields()) {
    StatusOr<Value> v = ReadValue(dec, field.type, resolver, 0);
    if (!v.HasValue()) {
      LOG(ERROR) << "failed to decode " << desc.Name() << "." << field.name;
      return v.GetStatus() == Status::kStructNotDefined
                 ? Status::kStructNotDefined
                 : Status::kBackingStoreError;
    }
    ret.values.push_back(v.MoveValue());
  }
  if (!dec.AtEnd()) {
    LOG(ERROR) << "trailing bytes after " << desc.Name();
    return Status::kBackingStoreError;
  }
  return ret;
}

}  // namespace structsy
