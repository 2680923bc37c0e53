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

#ifndef STRUCTSY_ENCODER_HPP
#define STRUCTSY_ENCODER_HPP

#include <bit>
#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "common/constants.hpp"

namespace structsy {

static_assert(std::endian::native == std::endian::little,
              "on-disk format is little-endian");

// Writes the canonical little-endian format. Strings carry a u32 length.
class Encoder {
 public:
  explicit Encoder(std::ostream& os) : os_(&os) {}
  Encoder& operator<<(std::string_view sv);
  Encoder& operator<<(const char* str) { return *this << std::string_view(str); }
  Encoder& operator<<(uint8_t u8);
  Encoder& operator<<(uint16_t u16);
  Encoder& operator<<(uint32_t u32);
  Encoder& operator<<(uint64_t u64);
  Encoder& operator<<(int8_t i8);
  Encoder& operator<<(int16_t i16);
  Encoder& operator<<(int32_t i32);
  Encoder& operator<<(int64_t i64);
  Encoder& operator<<(float f);
  Encoder& operator<<(double d);
  Encoder& operator<<(bool v);

  // Appends bytes without a length prefix.
  Encoder& WriteRaw(std::string_view bytes);

  template <typename T>
  Encoder& operator<<(const std::vector<T>& vec) {
    *this << static_cast<uint32_t>(vec.size());
    for (const auto& elm : vec) {
      *this << elm;
    }
    return *this;
  }

  template <typename T, typename U>
  Encoder& operator<<(const std::pair<T, U>& p) {
    *this << p.first << p.second;
    return *this;
  }

 private:
  std::ostream* os_;
};

template <typename T>
std::string Encode(const T& src) {
  std::stringstream ss;
  Encoder enc(ss);
  enc << src;
  return ss.str();
}

}  // namespace structsy

#endif  // STRUCTSY_ENCODER_HPP
