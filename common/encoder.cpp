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

#include "common/encoder.hpp"

#include <cassert>
#include <limits>

namespace structsy {

namespace {

template <typename T>
void WriteFixed(std::ostream* os, T value) {
  os->write(reinterpret_cast<const char*>(&value), sizeof(value));
}

}  // anonymous namespace

Encoder& Encoder::operator<<(std::string_view sv) {
  assert(sv.size() <= std::numeric_limits<uint32_t>::max());
  WriteFixed(os_, static_cast<uint32_t>(sv.size()));
  os_->write(sv.data(), static_cast<std::streamsize>(sv.size()));
  return *this;
}

Encoder& Encoder::operator<<(uint8_t u8) {
  WriteFixed(os_, u8);
  return *this;
}

Encoder& Encoder::operator<<(uint16_t u16) {
  WriteFixed(os_, u16);
  return *this;
}

Encoder& Encoder::operator<<(uint32_t u32) {
  WriteFixed(os_, u32);
  return *this;
}

Encoder& Encoder::operator<<(uint64_t u64) {
  WriteFixed(os_, u64);
  return *this;
}

Encoder& Encoder::operator<<(int8_t i8) {
  WriteFixed(os_, i8);
  return *this;
}

Encoder& Encoder::operator<<(int16_t i16) {
  WriteFixed(os_, i16);
  return *this;
}

Encoder& Encoder::operator<<(int32_t i32) {
  WriteFixed(os_, i32);
  return *this;
}

Encoder& Encoder::operator<<(int64_t i64) {
  WriteFixed(os_, i64);
  return *this;
}

Encoder& Encoder::operator<<(float f) {
  WriteFixed(os_, f);
  return *this;
}

Encoder& Encoder::operator<<(double d) {
  WriteFixed(os_, d);
  return *this;
}

Encoder& Encoder::operator<<(bool v) {
  WriteFixed(os_, static_cast<uint8_t>(v ? 1 : 0));
  return *this;
}

Encoder& Encoder::WriteRaw(std::string_view bytes) {
  os_->write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  return *this;
}

}  // namespace structsy
