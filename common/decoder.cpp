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

#include "common/decoder.hpp"

namespace structsy {

namespace {

constexpr uint32_t kMaxDecodeLength = 1U << 26;

template <typename T>
void ReadFixed(std::istream* is, T* value) {
  is->read(reinterpret_cast<char*>(value), sizeof(T));
}

}  // anonymous namespace

Decoder& Decoder::operator>>(std::string& str) {
  uint32_t size = 0;
  ReadFixed(is_, &size);
  if (!IsValid() || kMaxDecodeLength < size) {
    Fail();
    return *this;
  }
  str.resize(size);
  is_->read(str.data(), size);
  return *this;
}

Decoder& Decoder::operator>>(uint8_t& u8) {
  ReadFixed(is_, &u8);
  return *this;
}

Decoder& Decoder::operator>>(uint16_t& u16) {
  ReadFixed(is_, &u16);
  return *this;
}

Decoder& Decoder::operator>>(uint32_t& u32) {
  ReadFixed(is_, &u32);
  return *this;
}

Decoder& Decoder::operator>>(uint64_t& u64) {
  ReadFixed(is_, &u64);
  return *this;
}

Decoder& Decoder::operator>>(int8_t& i8) {
  ReadFixed(is_, &i8);
  return *this;
}

Decoder& Decoder::operator>>(int16_t& i16) {
  ReadFixed(is_, &i16);
  return *this;
}

Decoder& Decoder::operator>>(int32_t& i32) {
  ReadFixed(is_, &i32);
  return *this;
}

Decoder& Decoder::operator>>(int64_t& i64) {
  ReadFixed(is_, &i64);
  return *this;
}

Decoder& Decoder::operator>>(float& f) {
  ReadFixed(is_, &f);
  return *this;
}

Decoder& Decoder::operator>>(double& d) {
  ReadFixed(is_, &d);
  return *this;
}

Decoder& Decoder::operator>>(bool& v) {
  uint8_t raw = 0;
  ReadFixed(is_, &raw);
  if (1 < raw) {
    Fail();
  }
  v = raw == 1;
  return *this;
}

Decoder& Decoder::ReadRaw(size_t length, std::string* out) {
  if (kMaxDecodeLength < length) {
    Fail();
    return *this;
  }
  out->resize(length);
  is_->read(out->data(), static_cast<std::streamsize>(length));
  return *this;
}

bool Decoder::AtEnd() const {
  return is_->peek() == std::char_traits<char>::eof();
}

}  // namespace structsy
